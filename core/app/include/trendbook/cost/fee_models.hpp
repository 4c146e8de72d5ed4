#pragma once

#include "trendbook/cost/i_fee_model.hpp"

namespace trendbook {

// -----------------------------------------------------------------------------
// RateFeeModel: proportional commission plus slippage
// -----------------------------------------------------------------------------
//
// @brief  fee = |notional| * (commission_rate + slippage_rate)
//
// @throws std::invalid_argument  from the constructor if either rate is
//                                negative or non-finite.
// -----------------------------------------------------------------------------
class RateFeeModel final : public IFeeModel {
 public:
  explicit RateFeeModel(double commission_rate, double slippage_rate = 0.0);

  double fee(double notional) const override;

  double commissionRate() const { return commission_rate_; }
  double slippageRate() const { return slippage_rate_; }

 private:
  double commission_rate_;
  double slippage_rate_;
};

// No fees.
class ZeroFeeModel final : public IFeeModel {
 public:
  double fee(double) const override { return 0.0; }
};

}  // namespace trendbook
