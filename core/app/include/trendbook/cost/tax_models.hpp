#pragma once

#include "trendbook/cost/i_tax_model.hpp"

#include <map>

namespace trendbook {

// -----------------------------------------------------------------------------
// SellSideTaxModel: sell-only transaction tax with a yearly rate schedule
// -----------------------------------------------------------------------------
//
// @brief  tax = |notional| * rate(year(date)) on Sell trades, 0 on Buy.
//
// @details
// rate_by_year maps a calendar year to its rate. Years absent from the map
// use default_rate. Securities transaction taxes change by statute at the
// start of a year, so a year granularity is enough.
//
// @throws std::invalid_argument  from the constructor on a negative or
//                                non-finite rate.
// -----------------------------------------------------------------------------
class SellSideTaxModel final : public ITaxModel {
 public:
  SellSideTaxModel(std::map<int, double> rate_by_year, double default_rate);

  // ---------------------------------------------------------------------------
  // krxTransactionTax
  // ---------------------------------------------------------------------------
  // @brief  Korean securities transaction tax preset: `rate_2024` during
  //         2024, `rate_2025` in 2025 and for every other year.
  // ---------------------------------------------------------------------------
  static SellSideTaxModel krxTransactionTax(double rate_2024 = 0.0018,
                                            double rate_2025 = 0.0015);

  double tax(Date date, domain::Side side, double notional) const override;

  double rateFor(int year) const;
  double defaultRate() const { return default_rate_; }

 private:
  std::map<int, double> rate_by_year_;
  double default_rate_;
};

// No tax.
class ZeroTaxModel final : public ITaxModel {
 public:
  double tax(Date, domain::Side, double) const override { return 0.0; }
};

}  // namespace trendbook
