#include "trendbook/cost/fee_models.hpp"

#include "rate_check.hpp"

#include <cmath>

namespace trendbook {

RateFeeModel::RateFeeModel(double commission_rate, double slippage_rate)
    : commission_rate_(detail::checkedRate(commission_rate, "commission")),
      slippage_rate_(detail::checkedRate(slippage_rate, "slippage")) {}

double RateFeeModel::fee(double notional) const {
  return std::abs(notional) * (commission_rate_ + slippage_rate_);
}

}  // namespace trendbook
