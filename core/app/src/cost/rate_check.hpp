#pragma once

#include <cmath>
#include <stdexcept>
#include <string>

namespace trendbook {
namespace detail {

// Rejects negative or non-finite cost rates at model construction.
inline double checkedRate(double rate, const char* what) {
  if (!std::isfinite(rate) || rate < 0.0) {
    throw std::invalid_argument(std::string(what) +
                                " must be a finite non-negative rate, got " +
                                std::to_string(rate));
  }
  return rate;
}

}  // namespace detail
}  // namespace trendbook
