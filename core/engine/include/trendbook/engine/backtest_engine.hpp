#pragma once

#include "trendbook/config/backtest_config.hpp"
#include "trendbook/domain/instrument_spec.hpp"
#include "trendbook/domain/log_entries.hpp"
#include "trendbook/feed/bar_feed.hpp"
#include "trendbook/ledger/portfolio_ledger.hpp"
#include "trendbook/log/log_buffer.hpp"
#include "trendbook/strategy/signal_trader.hpp"
#include "trendbook/strategy/trader_params.hpp"
#include "trendbook/time/date.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trendbook {

// -----------------------------------------------------------------------------
// RunInfo: counters and grid bounds of the last run
// -----------------------------------------------------------------------------
struct RunInfo {
  std::size_t executed_trades{0};   // Ledger quantity changed
  std::size_t signal_trades{0};     // Target differed from holding
  std::size_t rejected_orders{0};   // Refused after downsizing
  std::size_t zero_qty_signals{0};  // Non-flat intent sized to zero units
  std::size_t grid_size{0};
  std::optional<Date> first_date;
  std::optional<Date> last_date;
  std::vector<std::string> excluded_symbols;
};

// -----------------------------------------------------------------------------
// BacktestEngine: shared-cash, multi-instrument orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Owns the PortfolioLedger and one SignalTrader per instrument, and
//         marches them over the common date grid.
//
// @details
// Per grid date:
//   1. step every trader (read-only with respect to the ledger)
//   2. for each instrument, in add order:
//        a. read the trader's desired sign; force flat when the short
//           deadline is due
//        b. size a target quantity (keep the holding when the direction is
//           unchanged and rebalancing is off)
//        c. execute through the ledger, shrinking |Q| by downsize_factor on
//           rejection up to downsize_max_iter retries
//        d. notify the trader of the fill or log a rejection, then
//           reconcile the trader to the ledger's executed sign
//   3. charge borrow at the close, then sample equity at the valuation price
//
// Sizing for a non-flat target:
//   basis    = dynamic ? ledger equity at today's opens : initial capital
//   notional = max_notional_frac * basis (* entry fraction on fresh entries,
//              per EntrySizingPolicy)
//   units    = floor(notional / (open * multiplier))
//
// Error model:
//   Configuration problems (no instruments, inverted window, no common
//   dates, duplicate symbols) throw before the first date is processed.
//   Ledger rejections never abort the run.
//
// Thread model:
//   Single-threaded. run() is synchronous and deterministic.
//
// Ownership:
//   Owns the ledger and the traders via std::unique_ptr. Shares feeds.
// -----------------------------------------------------------------------------
class BacktestEngine {
 public:
  // @throws std::invalid_argument  if config.validate() fails.
  explicit BacktestEngine(BacktestConfig config);

  ~BacktestEngine();

  BacktestEngine(const BacktestEngine&) = delete;
  BacktestEngine& operator=(const BacktestEngine&) = delete;
  BacktestEngine(BacktestEngine&&) = delete;
  BacktestEngine& operator=(BacktestEngine&&) = delete;

  // -------------------------------------------------------------------------
  // addInstrument
  // -------------------------------------------------------------------------
  // @brief  Registers an instrument and creates its trader.
  //
  // @param  feed    Bar feed; its symbol must match spec.symbol().
  // @param  spec    Trading rules. A blank trader id becomes "TR%02d" in
  //                 add order.
  // @param  params  Trader hyperparameters. The short-cover rule of `spec`
  //                 is copied in.
  // @return The trader id in effect.
  //
  // @throws std::invalid_argument  on a null feed, a symbol mismatch, or a
  //                                duplicate symbol.
  // -------------------------------------------------------------------------
  const std::string& addInstrument(std::shared_ptr<const IBarFeed> feed,
                                   domain::InstrumentSpec spec,
                                   TraderParams params = TraderParams{});

  // -------------------------------------------------------------------------
  // run
  // -------------------------------------------------------------------------
  // @brief  Resets the ledger (and traders, if configured) and simulates
  //         every common date in the window.
  //
  // @throws std::invalid_argument  if no instrument was added.
  // @throws std::runtime_error     if no date is shared by every instrument
  //                                with data in the window.
  // -------------------------------------------------------------------------
  const RunInfo& run();

  // --- Accessors -------------------------------------------------------------
  const BacktestConfig& config() const { return config_; }
  const PortfolioLedger& ledger() const { return *ledger_; }
  const domain::SpecMap& specs() const { return specs_; }
  const std::vector<Date>& grid() const { return grid_; }
  const RunInfo& lastRunInfo() const { return info_; }
  const std::vector<domain::RejectionLogEntry>& rejectionLog() const {
    return rejection_log_.entries();
  }

  // Symbols in add order.
  std::vector<std::string> symbols() const;

  // Trader for `symbol`, or nullptr.
  const SignalTrader* trader(const std::string& symbol) const;

  // True if `symbol` took part in the last run.
  bool isActive(const std::string& symbol) const;

  // Close prices of active instruments at grid index k.
  domain::PriceMap closePrices(std::size_t k) const;

  // Open prices of active instruments at grid index k.
  domain::PriceMap openPrices(std::size_t k) const;

  // Prices used for the equity sample at grid index k.
  domain::PriceMap valuationPrices(std::size_t k) const;

 private:
  struct Slot {
    std::string symbol;
    std::shared_ptr<const IBarFeed> feed;
    std::unique_ptr<SignalTrader> trader;
    std::vector<std::size_t> feed_index;  // Per grid date
    std::optional<Date> short_since;       // Ledger date the short opened
    bool active{false};
  };

  struct DownsizeResult {
    bool ok{false};
    double final_qty{0.0};
    int downsizes{0};  // Shrinks applied before the last attempt
  };

  enum class PriceField { Open, Close };

  void buildGrid();
  domain::PriceMap pricesAt(std::size_t k, PriceField field) const;
  void processInstrument(Slot& slot, std::size_t k,
                         const domain::PriceMap& opens);
  DownsizeResult executeWithDownsizing(const domain::InstrumentSpec& spec,
                                       Date date, double current_qty,
                                       double target_qty, double price,
                                       const std::string& reason);
  const Slot* findSlot(const std::string& symbol) const;

  BacktestConfig config_;
  std::unique_ptr<PortfolioLedger> ledger_;
  std::vector<Slot> slots_;
  domain::SpecMap specs_;
  std::vector<Date> grid_;
  RunInfo info_;
  LogBuffer<domain::RejectionLogEntry> rejection_log_{10};
};

}  // namespace trendbook
