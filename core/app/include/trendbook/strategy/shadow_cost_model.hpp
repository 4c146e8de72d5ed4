#pragma once

#include "trendbook/domain/instrument_spec.hpp"
#include "trendbook/time/date.hpp"

namespace trendbook {

// -----------------------------------------------------------------------------
// IShadowCostModel: cost rates applied to a trader's shadow equity
// -----------------------------------------------------------------------------
//
// @brief  The trader tracks a normalized shadow equity (start 1.0) that it
//         compounds by returns and charges by rate. This interface supplies
//         those rates as fractions of notional.
//
// @details
// entryCostRate(position, date): fee, plus sell-side tax when the opening leg
//   is a sell (position == -1).
// exitCostRate(position, date):  fee, plus sell-side tax when the closing leg
//   is a sell (position == +1).
// shortBorrowDaily():            borrow charge per bar while short.
//
// When the portfolio ledger is authoritative the engine installs the zero
// model; the trader's equity is then a pure signal-quality measure.
// -----------------------------------------------------------------------------
class IShadowCostModel {
 public:
  virtual ~IShadowCostModel() = default;

  virtual double entryCostRate(int position, Date date) const = 0;
  virtual double exitCostRate(int position, Date date) const = 0;
  virtual double shortBorrowDaily() const = 0;
};

// No costs.
class ZeroShadowCostModel final : public IShadowCostModel {
 public:
  double entryCostRate(int, Date) const override { return 0.0; }
  double exitCostRate(int, Date) const override { return 0.0; }
  double shortBorrowDaily() const override { return 0.0; }
};

// -----------------------------------------------------------------------------
// SpecShadowCostModel: rates derived from an InstrumentSpec
// -----------------------------------------------------------------------------
// Fee and tax models are evaluated at unit notional; borrow is the annual
// rate spread over `trading_days_per_year` bars.
// -----------------------------------------------------------------------------
class SpecShadowCostModel final : public IShadowCostModel {
 public:
  SpecShadowCostModel(domain::InstrumentSpec spec, int trading_days_per_year);

  double entryCostRate(int position, Date date) const override;
  double exitCostRate(int position, Date date) const override;
  double shortBorrowDaily() const override;

 private:
  domain::InstrumentSpec spec_;
  int trading_days_per_year_;
};

}  // namespace trendbook
