#include "trendbook/config/backtest_config.hpp"

#include <cmath>
#include <stdexcept>

namespace trendbook {

void BacktestConfig::validate() const {
  if (end_date < start_date) {
    throw std::invalid_argument("BacktestConfig: end_date " +
                                format_date(end_date) +
                                " is before start_date " +
                                format_date(start_date));
  }
  if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
    throw std::invalid_argument(
        "BacktestConfig: initial_capital must be positive");
  }
  if (trading_days_per_year <= 0) {
    throw std::invalid_argument(
        "BacktestConfig: trading_days_per_year must be positive");
  }
  if (downsize_max_iter < 0) {
    throw std::invalid_argument(
        "BacktestConfig: downsize_max_iter must be >= 0");
  }
  if (!std::isfinite(downsize_factor) || downsize_factor <= 0.0 ||
      downsize_factor >= 1.0) {
    throw std::invalid_argument(
        "BacktestConfig: downsize_factor must be in (0, 1)");
  }
}

const char* to_string(ValuationMode mode) {
  return mode == ValuationMode::Close ? "close" : "next_open";
}

const char* to_string(EntrySizingPolicy policy) {
  switch (policy) {
    case EntrySizingPolicy::Compound:
      return "compound";
    case EntrySizingPolicy::FractionOnly:
      return "fraction_only";
    case EntrySizingPolicy::DownsizeOnly:
      return "downsize_only";
  }
  return "compound";
}

ValuationMode parseValuationMode(const std::string& name) {
  if (name == "close") {
    return ValuationMode::Close;
  }
  if (name == "next_open") {
    return ValuationMode::NextOpen;
  }
  throw std::invalid_argument("unknown valuation_mode '" + name + "'");
}

EntrySizingPolicy parseEntrySizingPolicy(const std::string& name) {
  if (name == "compound") {
    return EntrySizingPolicy::Compound;
  }
  if (name == "fraction_only") {
    return EntrySizingPolicy::FractionOnly;
  }
  if (name == "downsize_only") {
    return EntrySizingPolicy::DownsizeOnly;
  }
  throw std::invalid_argument("unknown entry_sizing_policy '" + name + "'");
}

}  // namespace trendbook
