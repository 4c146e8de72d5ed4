#pragma once

#include "trendbook/domain/bar.hpp"
#include "trendbook/domain/instrument_spec.hpp"
#include "trendbook/domain/log_entries.hpp"
#include "trendbook/feed/bar_feed.hpp"
#include "trendbook/log/log_buffer.hpp"
#include "trendbook/strategy/shadow_cost_model.hpp"
#include "trendbook/strategy/trader_params.hpp"
#include "trendbook/time/date.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trendbook {

// -----------------------------------------------------------------------------
// TraderSummary: end-of-run snapshot of one trader
// -----------------------------------------------------------------------------
struct TraderSummary {
  std::string trader_id;
  std::string symbol;
  double final_equity{1.0};
  int position{0};
  std::size_t trade_count{0};
  std::size_t stop_count{0};
};

// -----------------------------------------------------------------------------
// SignalTrader: per-instrument moving-average trend state machine
// -----------------------------------------------------------------------------
//
// @brief  Walks one instrument's bar feed and decides, each bar, whether to
//         be long (+1), flat (0), or short (-1). Tracks a normalized shadow
//         equity that compounds its own open-to-open returns.
//
// @details
// Each step(t) runs, in order:
//   1. daily borrow charge while short
//   2. extrema update while holding (max for long, min for short)
//   3. forced cover when the short deadline is due
//   4. intraday daily/trailing stop
//   5. target decision from bar t-1 indicators
//   6. exit and/or entry at today's open
//   7. open(t) → open(t+1) mark-to-market, scaled by the entry fraction
//   8. curve sample when inside the logging window
// Steps 3 and 4 end the bar early; no re-entry happens on the same bar.
//
// Intent vs. truth:
//   desiredPosition() is the sign the trader chose on its last step. When a
//   portfolio ledger is authoritative, the engine calls reconcile() with the
//   ledger's executed sign after every step, and position() then reports
//   that executed sign. The next step starts from it.
//
// External accounting:
//   When enabled, entries and exits decided by the trader are not logged by
//   the trader; onPortfolioFill() logs the fills the ledger actually made.
//
// Error model:
//   Never throws during a run. Missing history or indicators force a flat
//   target; invalid prices skip the bar.
//
// Ownership:
//   Owned by BacktestEngine via std::unique_ptr. Shares the feed and cost
//   model through shared_ptr<const>.
// -----------------------------------------------------------------------------
class SignalTrader {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  trader_id  Identifier written into logs (e.g. "TR01").
  // @param  feed       Bar feed for the traded instrument. Must be non-null.
  // @param  params     Hyperparameters; normalized on construction.
  // @param  costs      Shadow cost rates. Null selects ZeroShadowCostModel.
  //
  // @throws std::invalid_argument  if feed is null.
  // -------------------------------------------------------------------------
  SignalTrader(std::string trader_id, std::shared_ptr<const IBarFeed> feed,
               TraderParams params,
               std::shared_ptr<const IShadowCostModel> costs = nullptr);

  SignalTrader(const SignalTrader&) = delete;
  SignalTrader& operator=(const SignalTrader&) = delete;
  SignalTrader(SignalTrader&&) = delete;
  SignalTrader& operator=(SignalTrader&&) = delete;

  // Clears position, bookkeeping, and logs; sets shadow equity.
  void resetForRun(double initial_equity = 1.0);

  // Curve samples are recorded only for dates in [start, end].
  void setLoggingWindow(Date start, Date end);

  void enableExternalAccounting(bool enabled) { external_accounting_ = enabled; }
  bool externalAccounting() const { return external_accounting_; }

  // -------------------------------------------------------------------------
  // step
  // -------------------------------------------------------------------------
  // @brief  Advances the state machine by bar `t` of the feed.
  //
  // @details
  // No-op unless t >= 2 (two bars of history) and t + 1 < size() (the
  // mark-to-market needs tomorrow's open).
  // -------------------------------------------------------------------------
  void step(std::size_t t);

  // -------------------------------------------------------------------------
  // onPortfolioFill
  // -------------------------------------------------------------------------
  // @brief  Records a fill the portfolio ledger executed for this trader.
  //
  // @param  action  ENTER, EXIT, FLIP, or REBALANCE.
  // -------------------------------------------------------------------------
  void onPortfolioFill(Date date, const std::string& action, double price,
                       int position_before, int position_after,
                       const std::string& reason);

  // -------------------------------------------------------------------------
  // reconcile
  // -------------------------------------------------------------------------
  // @brief  Overwrites the working position with the ledger's executed sign.
  //
  // @param  executed_sign  Sign of the ledger quantity after execution.
  // @param  t              Feed index of the bar just executed.
  //
  // @details
  // The executed sign also becomes the standing desired position, so a bar
  // on which step() is a no-op does not replay a refused intent.
  // Flat clears entry bookkeeping. A non-flat sign the trader did not
  // intend (rejected exit or flip) re-anchors entry bookkeeping at bar t.
  // -------------------------------------------------------------------------
  void reconcile(int executed_sign, std::size_t t);

  // --- State accessors -------------------------------------------------------
  int desiredPosition() const { return desired_position_; }
  int position() const { return position_; }
  double positionFraction() const { return position_fraction_; }
  double equity() const { return equity_; }
  std::optional<Date> entryDate() const { return entry_date_; }
  std::optional<std::size_t> entryIndex() const { return entry_index_; }
  std::optional<double> entryPrice() const { return entry_price_; }

  const std::string& traderId() const { return trader_id_; }
  const std::string& symbol() const { return feed_->symbol(); }
  const IBarFeed& feed() const { return *feed_; }
  const TraderParams& params() const { return params_; }

  // --- Logs (flushed on read) -----------------------------------------------
  const std::vector<domain::TraderTradeEntry>& tradeLog() const {
    return trade_log_.entries();
  }
  const std::vector<domain::StopLogEntry>& stopLog() const {
    return stop_log_.entries();
  }
  const std::vector<domain::TraderCurvePoint>& curve() const {
    return curve_.entries();
  }
  void flushLogs() const;

  TraderSummary summary() const;

 private:
  struct StopCheck {
    bool hit{false};
    std::string type;
    double price{0.0};
    double hist_ref{0.0};
  };

  int decideTarget(std::size_t t, const domain::PrevBarContext& ctx) const;
  void macdState(const domain::IndicatorValues& ind, bool& bull,
                 bool& bear) const;
  bool confirmStack(std::size_t last, int days, bool is_long) const;
  void updateExtrema(double open, double close);
  StopCheck checkStop(const domain::Bar& bar) const;
  double computeEntryFraction(const domain::PrevBarContext& ctx) const;
  void enterPosition(std::size_t t, Date date, double price, int target,
                     const domain::PrevBarContext& ctx);
  void exitPosition(std::size_t t, Date date, double price,
                    const std::string& reason);
  void clearEntry();
  void finishStep(Date date);

  std::string trader_id_;
  std::shared_ptr<const IBarFeed> feed_;
  TraderParams params_;
  std::shared_ptr<const IShadowCostModel> costs_;

  // --- Position state --------------------------------------------------------
  int position_{0};
  int desired_position_{0};
  double position_fraction_{1.0};
  double equity_{1.0};
  std::optional<double> entry_price_;
  std::optional<Date> entry_date_;
  std::optional<std::size_t> entry_index_;
  std::optional<std::size_t> cooldown_until_;
  double hist_max_;
  double hist_min_;

  bool external_accounting_{false};
  Date window_start_;
  Date window_end_;

  LogBuffer<domain::TraderTradeEntry> trade_log_{10};
  LogBuffer<domain::StopLogEntry> stop_log_{10};
  LogBuffer<domain::TraderCurvePoint> curve_{30};
};

}  // namespace trendbook
