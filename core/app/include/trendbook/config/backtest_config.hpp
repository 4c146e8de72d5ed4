#pragma once

#include "trendbook/time/date.hpp"

#include <limits>
#include <string>

namespace trendbook {

// Price used for the end-of-day equity sample.
enum class ValuationMode {
  Close,     // same-day close
  NextOpen   // next grid date's open; close on the final date
};

// -----------------------------------------------------------------------------
// EntrySizingPolicy
// -----------------------------------------------------------------------------
// How the trader's entry fraction and the engine's rejection downsizing
// combine on a fresh entry from flat.
//   Compound:     target scaled by the fraction, then downsized on rejection
//   FractionOnly: target scaled by the fraction, a rejection is final
//   DownsizeOnly: fraction ignored, downsized on rejection
// -----------------------------------------------------------------------------
enum class EntrySizingPolicy {
  Compound,
  FractionOnly,
  DownsizeOnly
};

// -----------------------------------------------------------------------------
// BacktestConfig: run settings for BacktestEngine
// -----------------------------------------------------------------------------
//
// @details
// The default window is unbounded; the grid then spans every date all
// instruments share.
// -----------------------------------------------------------------------------
struct BacktestConfig {
  Date start_date{std::numeric_limits<Date>::min()};
  Date end_date{std::numeric_limits<Date>::max()};
  double initial_capital{1e9};
  int trading_days_per_year{252};
  bool use_dynamic_sizing{true};        // Equity basis: MTM vs initial
  bool rebalance_while_holding{false};  // Resize an unchanged direction
  ValuationMode valuation_mode{ValuationMode::Close};
  bool use_entry_position_frac{true};
  bool reset_traders_each_run{true};
  int downsize_max_iter{12};
  double downsize_factor{0.98};
  EntrySizingPolicy entry_sizing_policy{EntrySizingPolicy::Compound};
  bool trader_shadow_costs{false};      // Charge spec costs to shadow equity
  bool verbose{false};

  // @throws std::invalid_argument  on an inverted window or out-of-range
  //                                numeric setting.
  void validate() const;
};

// -----------------------------------------------------------------------------
// AccountingTesterOptions
// -----------------------------------------------------------------------------
struct AccountingTesterOptions {
  int equity_check_samples{10};
  double rel_tol{1e-8};
  double abs_tol{1e-6};
  bool fail_fast{false};  // Stop at the first error
};

const char* to_string(ValuationMode mode);
const char* to_string(EntrySizingPolicy policy);

// @throws std::invalid_argument  on an unknown name.
ValuationMode parseValuationMode(const std::string& name);
EntrySizingPolicy parseEntrySizingPolicy(const std::string& name);

}  // namespace trendbook
