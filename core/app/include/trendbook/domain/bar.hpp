#pragma once

#include "trendbook/time/date.hpp"

#include <limits>

namespace trendbook {
namespace domain {

// -----------------------------------------------------------------------------
// IndicatorValues: precomputed indicators attached to one bar
// -----------------------------------------------------------------------------
//
// @brief  Values computed upstream from data up to and including the bar
//         they are attached to. NaN means "not available yet".
//
// @details
// The trader never reads the indicators of the bar it is trading on; it
// reads the previous bar's values through PrevBarContext.
//
// long_term_trend is the sign of the long-term moving average's slope:
// +1 rising, -1 falling, 0 flat or unknown.
// -----------------------------------------------------------------------------
struct IndicatorValues {
  double sma_week{std::numeric_limits<double>::quiet_NaN()};
  double sma_fast{std::numeric_limits<double>::quiet_NaN()};
  double sma_slow{std::numeric_limits<double>::quiet_NaN()};
  double sma_long_term{std::numeric_limits<double>::quiet_NaN()};
  double atr{std::numeric_limits<double>::quiet_NaN()};
  int long_term_trend{0};
  double macd_line{std::numeric_limits<double>::quiet_NaN()};
  double macd_signal{std::numeric_limits<double>::quiet_NaN()};
  double macd_hist{std::numeric_limits<double>::quiet_NaN()};
};

// -----------------------------------------------------------------------------
// Bar: one daily OHLC row plus its indicators
// -----------------------------------------------------------------------------
struct Bar {
  Date date{0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  IndicatorValues indicators;
};

// -----------------------------------------------------------------------------
// PrevBarContext: what a step at index t is allowed to know about t-1
// -----------------------------------------------------------------------------
struct PrevBarContext {
  bool valid{false};
  double close_prev{std::numeric_limits<double>::quiet_NaN()};
  IndicatorValues indicators;
};

}  // namespace domain
}  // namespace trendbook
