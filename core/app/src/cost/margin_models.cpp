#include "trendbook/cost/margin_models.hpp"

#include "rate_check.hpp"

#include <cmath>

namespace trendbook {

SimpleMarginModel::SimpleMarginModel(double long_rate,
                                     double short_initial_rate,
                                     double short_maintenance_rate)
    : long_rate_(detail::checkedRate(long_rate, "long margin")),
      short_initial_rate_(
          detail::checkedRate(short_initial_rate, "short initial margin")),
      short_maintenance_rate_(detail::checkedRate(
          short_maintenance_rate, "short maintenance margin")) {}

double SimpleMarginModel::margin(double quantity, double price,
                                 double multiplier) const {
  if (!std::isfinite(quantity) || !std::isfinite(price) ||
      !std::isfinite(multiplier)) {
    return 0.0;
  }
  const double notional_abs = std::abs(quantity * price * multiplier);
  return (quantity >= 0.0) ? notional_abs * long_rate_
                           : notional_abs * short_initial_rate_;
}

}  // namespace trendbook
