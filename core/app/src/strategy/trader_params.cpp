#include "trendbook/strategy/trader_params.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace trendbook {

namespace {

double nonNegative(double value, double fallback) {
  if (!std::isfinite(value)) {
    return fallback;
  }
  return std::max(0.0, value);
}

double unitInterval(double value, double fallback) {
  if (!std::isfinite(value)) {
    return fallback;
  }
  return std::min(1.0, std::max(0.0, value));
}

}  // namespace

TraderParams TraderParams::normalized() const {
  TraderParams out(*this);

  out.spread_enter_pct = nonNegative(spread_enter_pct, 0.003);
  out.spread_exit_pct = nonNegative(spread_exit_pct, 0.001);
  out.atr_enter_k = nonNegative(atr_enter_k, 0.35);
  out.atr_exit_k = nonNegative(atr_exit_k, 0.10);

  out.confirm_days = std::max(1, confirm_days);
  out.min_hold_days = std::max(0, min_hold_days);
  out.cooldown_days = std::max(0, cooldown_days);

  out.long_daily_stop = nonNegative(long_daily_stop, 0.05);
  out.long_trail_stop = nonNegative(long_trail_stop, 0.10);
  out.short_daily_stop = nonNegative(short_daily_stop, 0.03);
  out.short_trail_stop = nonNegative(short_trail_stop, 0.10);

  out.macd_size_min = unitInterval(macd_size_min, 0.25);
  out.macd_size_max = unitInterval(macd_size_max, 1.0);
  if (out.macd_size_min > out.macd_size_max) {
    std::swap(out.macd_size_min, out.macd_size_max);
  }
  if (!std::isfinite(macd_size_atr_k) || macd_size_atr_k <= 0.0) {
    out.macd_size_atr_k = 0.5;
  }
  return out;
}

}  // namespace trendbook
