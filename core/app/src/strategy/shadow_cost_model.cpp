#include "trendbook/strategy/shadow_cost_model.hpp"

#include <stdexcept>
#include <utility>

namespace trendbook {

SpecShadowCostModel::SpecShadowCostModel(domain::InstrumentSpec spec,
                                         int trading_days_per_year)
    : spec_(std::move(spec)), trading_days_per_year_(trading_days_per_year) {
  if (trading_days_per_year_ <= 0) {
    throw std::invalid_argument(
        "SpecShadowCostModel: trading_days_per_year must be positive");
  }
}

double SpecShadowCostModel::entryCostRate(int position, Date date) const {
  double rate = spec_.fee(1.0);
  if (position < 0) {
    rate += spec_.tax(date, domain::Side::Sell, 1.0);
  }
  return rate;
}

double SpecShadowCostModel::exitCostRate(int position, Date date) const {
  double rate = spec_.fee(1.0);
  if (position > 0) {
    rate += spec_.tax(date, domain::Side::Sell, 1.0);
  }
  return rate;
}

double SpecShadowCostModel::shortBorrowDaily() const {
  return spec_.borrowRateAnnual() / static_cast<double>(trading_days_per_year_);
}

}  // namespace trendbook
