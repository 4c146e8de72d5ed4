#include "trendbook/strategy/signal_trader.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace trendbook {

namespace {

constexpr std::size_t kMinHistoryBars = 2;
constexpr double kInf = std::numeric_limits<double>::infinity();

bool finite3(double a, double b, double c) {
  return std::isfinite(a) && std::isfinite(b) && std::isfinite(c);
}

bool validPrice(double px) { return std::isfinite(px) && px > 0.0; }

int signOf(double value) {
  return (value > 0.0) ? 1 : ((value < 0.0) ? -1 : 0);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
SignalTrader::SignalTrader(std::string trader_id,
                           std::shared_ptr<const IBarFeed> feed,
                           TraderParams params,
                           std::shared_ptr<const IShadowCostModel> costs)
    : trader_id_(std::move(trader_id)),
      feed_(std::move(feed)),
      params_(params.normalized()),
      costs_(std::move(costs)),
      hist_max_(-kInf),
      hist_min_(kInf),
      window_start_(std::numeric_limits<Date>::min()),
      window_end_(std::numeric_limits<Date>::max()) {
  if (!feed_) {
    throw std::invalid_argument("SignalTrader " + trader_id_ +
                                ": feed must not be null");
  }
  if (!costs_) {
    costs_ = std::make_shared<ZeroShadowCostModel>();
  }
}

void SignalTrader::resetForRun(double initial_equity) {
  position_ = 0;
  desired_position_ = 0;
  position_fraction_ = 1.0;
  equity_ = initial_equity;
  clearEntry();
  cooldown_until_.reset();
  trade_log_.clear();
  stop_log_.clear();
  curve_.clear();
}

void SignalTrader::setLoggingWindow(Date start, Date end) {
  window_start_ = start;
  window_end_ = end;
}

// -----------------------------------------------------------------------------
// step: one bar of the state machine
// -----------------------------------------------------------------------------
void SignalTrader::step(std::size_t t) {
  if (t < kMinHistoryBars || t + 1 >= feed_->size()) {
    return;
  }

  const domain::Bar& bar = feed_->bar(t);
  const Date date = bar.date;
  const double open = bar.open;

  if (!validPrice(open)) {
    finishStep(date);
    return;
  }

  // --- 1) Borrow charge while short -----------------------------------------
  if (position_ == -1) {
    equity_ *= 1.0 - position_fraction_ * costs_->shortBorrowDaily();
  }

  // --- 2) Extrema for the trailing stop -------------------------------------
  if (position_ != 0) {
    updateExtrema(open, bar.close);
  }

  // --- 3) Regulatory short deadline -----------------------------------------
  if (position_ == -1 && entry_date_ &&
      params_.short_cover.due(*entry_date_, date, feed_->bar(t + 1).date)) {
    exitPosition(t, date, open, "FORCED_COVER_MAXHOLD");
    finishStep(date);
    return;
  }

  // --- 4) Intraday stop -------------------------------------------------------
  const StopCheck stop = checkStop(bar);
  if (stop.hit) {
    if (params_.log_stops) {
      stop_log_.append(domain::StopLogEntry{date, stop.type, stop.price,
                                            stop.hist_ref, open});
    }
    exitPosition(t, date, stop.price, "STOP:" + stop.type);
    finishStep(date);
    return;
  }

  // --- 5) Target from yesterday's indicators ----------------------------------
  const domain::PrevBarContext ctx = feed_->prevContext(t);
  const int target = ctx.valid ? decideTarget(t, ctx) : 0;

  // --- 6) Apply target at today's open ---------------------------------------
  if (target != position_) {
    if (position_ != 0) {
      exitPosition(t, date, open, "SignalExit");
    }
    if (target != 0) {
      enterPosition(t, date, open, target, ctx);
    }
  }

  // --- 7) Open(t) → Open(t+1) -------------------------------------------------
  if (position_ != 0) {
    const double r =
        static_cast<double>(position_) * (feed_->bar(t + 1).open / open - 1.0);
    if (std::isfinite(r)) {
      equity_ *= 1.0 + position_fraction_ * r;
    }
  }

  finishStep(date);
}

// -----------------------------------------------------------------------------
// decideTarget: MA stack + separation + confirmation, with optional filters
// -----------------------------------------------------------------------------
int SignalTrader::decideTarget(std::size_t t,
                               const domain::PrevBarContext& ctx) const {
  if (position_ == 0 && cooldown_until_ && t <= *cooldown_until_) {
    return 0;
  }

  const domain::IndicatorValues& ind = ctx.indicators;
  const double week = ind.sma_week;
  const double fast = ind.sma_fast;
  const double slow = ind.sma_slow;
  const double atr = ind.atr;

  if (!finite3(week, fast, slow)) {
    return 0;
  }

  const bool long_stack = week > fast && fast > slow;
  const bool short_stack = slow > fast && fast > week;

  // Separation between the week and fast averages.
  const double sep_long = week - fast;
  const double sep_short = fast - week;
  bool enter_long_ok = false;
  bool exit_long_ok = false;
  bool enter_short_ok = false;
  bool exit_short_ok = false;
  if (params_.use_atr_filter && std::isfinite(atr) && atr > 0.0) {
    enter_long_ok = sep_long >= params_.atr_enter_k * atr;
    exit_long_ok = sep_long <= params_.atr_exit_k * atr;
    enter_short_ok = sep_short >= params_.atr_enter_k * atr;
    exit_short_ok = sep_short <= params_.atr_exit_k * atr;
  } else {
    const double den =
        std::max(std::abs(fast), std::numeric_limits<double>::min());
    enter_long_ok = sep_long / den >= params_.spread_enter_pct;
    exit_long_ok = sep_long / den <= params_.spread_exit_pct;
    enter_short_ok = sep_short / den >= params_.spread_enter_pct;
    exit_short_ok = sep_short / den <= params_.spread_exit_pct;
  }

  const bool trend_long_ok =
      !params_.use_long_trend_filter || ind.long_term_trend == 1;
  const bool trend_short_ok =
      !params_.use_short_trend_filter || ind.long_term_trend == -1;

  bool macd_bull = false;
  bool macd_bear = false;
  macdState(ind, macd_bull, macd_bear);
  const bool macd_long_ok = !params_.use_macd_regime_filter || macd_bull;
  const bool macd_short_ok = !params_.use_macd_regime_filter || macd_bear;

  const bool long_conf = confirmStack(t - 1, params_.confirm_days, true);
  const bool short_conf = confirmStack(t - 1, params_.confirm_days, false);

  // Previous close against the reference average.
  const double close_prev = ctx.close_prev;
  const double ref_ma =
      (params_.prev_close_filter_ref == PrevCloseRef::Week) ? week : fast;
  const bool prev_close_usable = params_.use_prev_close_filter &&
                                 std::isfinite(close_prev) &&
                                 std::isfinite(ref_ma);
  const bool prev_close_long_ok = !prev_close_usable || close_prev >= ref_ma;
  const bool prev_close_short_ok = !prev_close_usable || close_prev <= ref_ma;

  const bool long_entry = long_stack && enter_long_ok && trend_long_ok &&
                          macd_long_ok && long_conf && prev_close_long_ok;
  const bool short_entry = short_stack && enter_short_ok && trend_short_ok &&
                           macd_short_ok && short_conf &&
                           params_.enable_short && prev_close_short_ok;

  // --- Exits -----------------------------------------------------------------
  const bool long_exit_cross = fast > week;
  const bool short_exit_cross = week > fast;

  std::size_t held = 0;
  if (position_ != 0 && entry_index_ && t >= *entry_index_) {
    held = t - *entry_index_;
  }
  const bool can_exit =
      held >= static_cast<std::size_t>(params_.min_hold_days);

  const bool macd_exit_long = params_.use_macd_exit && can_exit && macd_bear;
  const bool macd_exit_short = params_.use_macd_exit && can_exit && macd_bull;
  const bool prev_close_exit_long =
      prev_close_usable && can_exit && close_prev < ref_ma;
  const bool prev_close_exit_short =
      prev_close_usable && can_exit && close_prev > ref_ma;

  if (position_ == 0) {
    if (long_entry) {
      return 1;
    }
    return short_entry ? -1 : 0;
  }
  if (position_ == 1) {
    const bool close_out = can_exit && (long_exit_cross || exit_long_ok ||
                                   macd_exit_long || prev_close_exit_long);
    return close_out ? 0 : 1;
  }
  const bool close_out = can_exit && (short_exit_cross || exit_short_ok ||
                                 macd_exit_short || prev_close_exit_short);
  return close_out ? 0 : -1;
}

void SignalTrader::macdState(const domain::IndicatorValues& ind, bool& bull,
                             bool& bear) const {
  bull = false;
  bear = false;
  if (params_.macd_signal_mode == MacdSignalMode::Cross) {
    if (std::isfinite(ind.macd_line) && std::isfinite(ind.macd_signal)) {
      bull = ind.macd_line > ind.macd_signal;
      bear = ind.macd_line < ind.macd_signal;
    }
    return;
  }
  if (std::isfinite(ind.macd_hist)) {
    bull = ind.macd_hist > 0.0;
    bear = ind.macd_hist < 0.0;
  }
}

// -----------------------------------------------------------------------------
// confirmStack: `days` consecutive stacked bars ending at `last`
// -----------------------------------------------------------------------------
bool SignalTrader::confirmStack(std::size_t last, int days,
                                bool is_long) const {
  const std::size_t n = static_cast<std::size_t>(days);
  if (last + 1 < n) {
    return false;
  }
  for (std::size_t i = last + 1 - n; i <= last; ++i) {
    const domain::IndicatorValues& ind = feed_->bar(i).indicators;
    const double w = ind.sma_week;
    const double f = ind.sma_fast;
    const double s = ind.sma_slow;
    if (!finite3(w, f, s)) {
      return false;
    }
    const bool stacked = is_long ? (w > f && f > s) : (s > f && f > w);
    if (!stacked) {
      return false;
    }
  }
  return true;
}

void SignalTrader::updateExtrema(double open, double close) {
  if (position_ == 1) {
    hist_max_ = std::max(hist_max_, std::max(open, close));
  } else if (position_ == -1) {
    hist_min_ = std::min(hist_min_, std::min(open, close));
  }
}

// -----------------------------------------------------------------------------
// checkStop: active stop is the tighter of daily and trailing
// -----------------------------------------------------------------------------
SignalTrader::StopCheck SignalTrader::checkStop(const domain::Bar& bar) const {
  StopCheck out;
  if (position_ == 1) {
    const double daily_px = bar.open * (1.0 - params_.long_daily_stop);
    const double trail_px = hist_max_ * (1.0 - params_.long_trail_stop);
    const double px = std::max(daily_px, trail_px);
    if (bar.low <= px) {
      out.hit = true;
      out.price = px;
      if (daily_px >= trail_px) {
        out.type = "LongDaily";
        out.hist_ref = daily_px;
      } else {
        out.type = "LongTrail";
        out.hist_ref = hist_max_;
      }
    }
  } else if (position_ == -1) {
    const double daily_px = bar.open * (1.0 + params_.short_daily_stop);
    const double trail_px = hist_min_ * (1.0 + params_.short_trail_stop);
    const double px = std::min(daily_px, trail_px);
    if (bar.high >= px) {
      out.hit = true;
      out.price = px;
      if (daily_px <= trail_px) {
        out.type = "ShortDaily";
        out.hist_ref = daily_px;
      } else {
        out.type = "ShortTrail";
        out.hist_ref = hist_min_;
      }
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// computeEntryFraction: optional MACD-strength sizing
// -----------------------------------------------------------------------------
double SignalTrader::computeEntryFraction(
    const domain::PrevBarContext& ctx) const {
  if (!params_.use_macd_size_scaling) {
    return 1.0;
  }
  const domain::IndicatorValues& ind = ctx.indicators;
  if (!std::isfinite(ind.macd_hist)) {
    return 1.0;
  }

  double strength = 0.0;
  if (std::isfinite(ind.atr) && ind.atr > 0.0) {
    strength = std::abs(ind.macd_hist) / ind.atr;
  } else {
    double den = std::numeric_limits<double>::min();
    if (std::isfinite(ind.macd_line)) {
      den = std::max(den, std::abs(ind.macd_line));
    }
    if (std::isfinite(ind.macd_signal)) {
      den = std::max(den, std::abs(ind.macd_signal));
    }
    strength = std::abs(ind.macd_hist) / den;
  }

  const double x = std::min(1.0, strength / params_.macd_size_atr_k);
  const double frac =
      params_.macd_size_min + x * (params_.macd_size_max - params_.macd_size_min);
  return std::max(0.0, std::min(1.0, frac));
}

void SignalTrader::enterPosition(std::size_t t, Date date, double price,
                                 int target,
                                 const domain::PrevBarContext& ctx) {
  const double eq_before = equity_;
  const int before = position_;

  position_fraction_ = computeEntryFraction(ctx);
  equity_ *= 1.0 - costs_->entryCostRate(target, date) * position_fraction_;

  position_ = target;
  entry_price_ = price;
  entry_date_ = date;
  entry_index_ = t;
  if (position_ == 1) {
    hist_max_ = price;
    hist_min_ = kInf;
  } else {
    hist_min_ = price;
    hist_max_ = -kInf;
  }

  if (params_.log_trades && !external_accounting_) {
    trade_log_.append(domain::TraderTradeEntry{date, "ENTER", price, before,
                                               position_, "SignalEntry",
                                               eq_before, equity_,
                                               position_fraction_});
  }
}

void SignalTrader::exitPosition(std::size_t t, Date date, double price,
                                const std::string& reason) {
  const double eq_before = equity_;
  const int before = position_;

  equity_ *= 1.0 - costs_->exitCostRate(position_, date) * position_fraction_;

  position_ = 0;
  position_fraction_ = 1.0;
  clearEntry();
  cooldown_until_ = t + static_cast<std::size_t>(params_.cooldown_days);

  if (params_.log_trades && !external_accounting_) {
    trade_log_.append(domain::TraderTradeEntry{date, "EXIT", price, before, 0,
                                               reason, eq_before, equity_,
                                               position_fraction_});
  }
}

void SignalTrader::clearEntry() {
  entry_price_.reset();
  entry_date_.reset();
  entry_index_.reset();
  hist_max_ = -kInf;
  hist_min_ = kInf;
}

void SignalTrader::finishStep(Date date) {
  desired_position_ = position_;
  if (params_.log_curves && date >= window_start_ && date <= window_end_) {
    curve_.append(domain::TraderCurvePoint{date, equity_, position_});
  }
}

// -----------------------------------------------------------------------------
// onPortfolioFill: ledger-confirmed fill, logged for parity checks
// -----------------------------------------------------------------------------
void SignalTrader::onPortfolioFill(Date date, const std::string& action,
                                   double price, int position_before,
                                   int position_after,
                                   const std::string& reason) {
  if (!params_.log_trades) {
    return;
  }
  trade_log_.append(domain::TraderTradeEntry{date, action, price,
                                             position_before, position_after,
                                             reason, equity_, equity_,
                                             position_fraction_});
}

// -----------------------------------------------------------------------------
// reconcile: ledger sign is authoritative
// -----------------------------------------------------------------------------
void SignalTrader::reconcile(int executed_sign, std::size_t t) {
  executed_sign = signOf(static_cast<double>(executed_sign));
  desired_position_ = executed_sign;
  if (executed_sign == position_) {
    return;
  }

  position_ = executed_sign;
  if (executed_sign == 0) {
    position_fraction_ = 1.0;
    clearEntry();
    return;
  }

  // Holding a position the trader did not choose: anchor it here.
  const domain::Bar& bar = feed_->bar(t);
  entry_price_ = bar.open;
  entry_date_ = bar.date;
  entry_index_ = t;
  hist_max_ = (executed_sign == 1) ? bar.open : -kInf;
  hist_min_ = (executed_sign == -1) ? bar.open : kInf;
}

void SignalTrader::flushLogs() const {
  trade_log_.flush();
  stop_log_.flush();
  curve_.flush();
}

TraderSummary SignalTrader::summary() const {
  TraderSummary out;
  out.trader_id = trader_id_;
  out.symbol = feed_->symbol();
  out.final_equity = equity_;
  out.position = position_;
  out.trade_count = trade_log_.size();
  out.stop_count = stop_log_.size();
  return out;
}

}  // namespace trendbook
