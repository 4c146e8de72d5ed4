#pragma once

#include "trendbook/cost/i_margin_model.hpp"

namespace trendbook {

// -----------------------------------------------------------------------------
// SimpleMarginModel: flat rate on notional, asymmetric long/short
// -----------------------------------------------------------------------------
//
// @brief  quantity >= 0 → long_rate * |notional|
//         quantity <  0 → short_initial_rate * |notional|
//
// @details
// short_maintenance_rate is carried for reporting only; the ledger checks
// every trade against the initial requirement.
//
// A non-finite quantity, price, or multiplier requires no margin. Such a
// position cannot be valued, and the ledger rejects the price before it ever
// reaches here.
// -----------------------------------------------------------------------------
class SimpleMarginModel final : public IMarginModel {
 public:
  explicit SimpleMarginModel(double long_rate = 0.0,
                             double short_initial_rate = 0.5,
                             double short_maintenance_rate = 0.3);

  double margin(double quantity, double price,
                double multiplier) const override;

  double longRate() const { return long_rate_; }
  double shortInitialRate() const { return short_initial_rate_; }
  double shortMaintenanceRate() const { return short_maintenance_rate_; }

 private:
  double long_rate_;
  double short_initial_rate_;
  double short_maintenance_rate_;
};

// No margin requirement.
class ZeroMarginModel final : public IMarginModel {
 public:
  double margin(double, double, double) const override { return 0.0; }
};

}  // namespace trendbook
