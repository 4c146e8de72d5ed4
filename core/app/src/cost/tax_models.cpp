#include "trendbook/cost/tax_models.hpp"

#include "rate_check.hpp"

#include <cmath>
#include <utility>

namespace trendbook {

SellSideTaxModel::SellSideTaxModel(std::map<int, double> rate_by_year,
                                   double default_rate)
    : rate_by_year_(std::move(rate_by_year)),
      default_rate_(detail::checkedRate(default_rate, "default tax rate")) {
  for (const auto& entry : rate_by_year_) {
    detail::checkedRate(entry.second, "tax rate");
  }
}

SellSideTaxModel SellSideTaxModel::krxTransactionTax(double rate_2024,
                                                     double rate_2025) {
  return SellSideTaxModel({{2024, rate_2024}, {2025, rate_2025}}, rate_2025);
}

double SellSideTaxModel::rateFor(int year) const {
  auto it = rate_by_year_.find(year);
  return (it != rate_by_year_.end()) ? it->second : default_rate_;
}

double SellSideTaxModel::tax(Date date, domain::Side side,
                             double notional) const {
  if (side != domain::Side::Sell) {
    return 0.0;
  }
  return std::abs(notional) * rateFor(year_of(date));
}

}  // namespace trendbook
