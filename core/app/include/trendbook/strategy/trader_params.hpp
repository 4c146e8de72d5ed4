#pragma once

#include "trendbook/domain/instrument_spec.hpp"

namespace trendbook {

// How the MACD regime is read from the previous bar.
enum class MacdSignalMode {
  Hist,   // histogram > 0 bull, < 0 bear
  Cross   // line above / below signal
};

// Moving average the previous close is compared against.
enum class PrevCloseRef {
  Fast,
  Week
};

// -----------------------------------------------------------------------------
// TraderParams: hyperparameters of one SignalTrader
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct. Defaults are the production settings; call
//         normalized() before use to clamp out-of-range values.
//
// @details
// Separation thresholds:
//   With use_atr_filter and a positive ATR, the week/fast separation is
//   compared in ATR units (atr_enter_k, atr_exit_k). Otherwise it is compared
//   as a fraction of the fast average (spread_enter_pct, spread_exit_pct).
//
// Stops are fractions of price (0.05 = 5%).
//
// short_cover is copied from the InstrumentSpec by the engine so the trader
// self-enforces the same deadline the engine enforces.
// -----------------------------------------------------------------------------
struct TraderParams {
  // --- Entry / exit separation ---------------------------------------------
  double spread_enter_pct{0.003};
  double spread_exit_pct{0.001};
  bool use_atr_filter{true};
  double atr_enter_k{0.35};
  double atr_exit_k{0.10};

  // --- Timing ----------------------------------------------------------------
  int confirm_days{2};
  int min_hold_days{3};
  int cooldown_days{0};

  // --- Trend filters -----------------------------------------------------------
  bool use_long_trend_filter{true};
  bool use_short_trend_filter{false};

  // --- Stops -------------------------------------------------------------------
  double long_daily_stop{0.05};
  double long_trail_stop{0.10};
  double short_daily_stop{0.03};
  double short_trail_stop{0.10};

  bool enable_short{true};

  // --- MACD assist -------------------------------------------------------------
  MacdSignalMode macd_signal_mode{MacdSignalMode::Hist};
  bool use_macd_regime_filter{false};
  bool use_macd_exit{false};
  bool use_macd_size_scaling{false};
  double macd_size_min{0.25};
  double macd_size_max{1.0};
  double macd_size_atr_k{0.5};

  // --- Previous-close filter ---------------------------------------------------
  bool use_prev_close_filter{false};
  PrevCloseRef prev_close_filter_ref{PrevCloseRef::Fast};

  // --- Logging -----------------------------------------------------------------
  bool log_curves{true};
  bool log_trades{true};
  bool log_stops{true};

  domain::ShortCoverRule short_cover;

  // Copy with every field clamped to its valid range.
  TraderParams normalized() const;
};

}  // namespace trendbook
