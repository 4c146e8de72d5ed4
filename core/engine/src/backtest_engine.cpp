#include "trendbook/engine/backtest_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace trendbook {

namespace {

int signOf(double value) {
  return (value > 0.0) ? 1 : ((value < 0.0) ? -1 : 0);
}

bool validPrice(double px) { return std::isfinite(px) && px > 0.0; }

// Label of a position change, as recorded in trader and ledger logs.
const char* actionFor(int before, int after) {
  if (before == 0 && after != 0) {
    return "ENTER";
  }
  if (after == 0) {
    return "EXIT";
  }
  if (before != after) {
    return "FLIP";
  }
  return "REBALANCE";
}

std::string traderIdFor(std::size_t ordinal) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "TR%02zu", ordinal);
  return std::string(buf);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / Destructor
// -----------------------------------------------------------------------------
BacktestEngine::BacktestEngine(BacktestConfig config)
    : config_(std::move(config)) {
  config_.validate();
  ledger_ = std::make_unique<PortfolioLedger>(config_.initial_capital);
}

BacktestEngine::~BacktestEngine() = default;

// -----------------------------------------------------------------------------
// addInstrument: register spec, build trader
// -----------------------------------------------------------------------------
const std::string& BacktestEngine::addInstrument(
    std::shared_ptr<const IBarFeed> feed, domain::InstrumentSpec spec,
    TraderParams params) {
  if (!feed) {
    throw std::invalid_argument("BacktestEngine: feed for " + spec.symbol() +
                                " is null");
  }
  if (feed->symbol() != spec.symbol()) {
    throw std::invalid_argument("BacktestEngine: feed symbol " +
                                feed->symbol() + " does not match spec " +
                                spec.symbol());
  }
  if (specs_.count(spec.symbol()) != 0) {
    throw std::invalid_argument("BacktestEngine: duplicate instrument " +
                                spec.symbol());
  }

  if (spec.traderId().empty()) {
    spec = spec.withTraderId(traderIdFor(slots_.size() + 1));
  }

  params.short_cover = spec.shortCoverRule();
  std::shared_ptr<const IShadowCostModel> costs;
  if (config_.trader_shadow_costs) {
    costs = std::make_shared<SpecShadowCostModel>(
        spec, config_.trading_days_per_year);
  }

  Slot slot;
  slot.symbol = spec.symbol();
  slot.feed = feed;
  slot.trader = std::make_unique<SignalTrader>(spec.traderId(), feed, params,
                                               std::move(costs));
  slot.trader->enableExternalAccounting(true);

  const std::string symbol = spec.symbol();
  specs_.emplace(symbol, std::move(spec));
  slots_.push_back(std::move(slot));
  return specs_.at(symbol).traderId();
}

// -----------------------------------------------------------------------------
// buildGrid: intersection of in-window dates across instruments
// -----------------------------------------------------------------------------
void BacktestEngine::buildGrid() {
  grid_.clear();
  info_.excluded_symbols.clear();

  std::vector<std::vector<Date>> in_window(slots_.size());
  bool have_any = false;

  for (std::size_t i = 0; i < slots_.size(); ++i) {
    Slot& slot = slots_[i];
    slot.active = false;
    slot.feed_index.clear();
    slot.short_since.reset();
    for (std::size_t j = 0; j < slot.feed->size(); ++j) {
      const Date d = slot.feed->bar(j).date;
      if (d >= config_.start_date && d <= config_.end_date) {
        in_window[i].push_back(d);
      }
    }
    if (in_window[i].empty()) {
      std::cerr << "[BacktestEngine] WARNING: " << slot.symbol
                << " has no data inside the window. Excluded.\n";
      info_.excluded_symbols.push_back(slot.symbol);
      continue;
    }

    slot.active = true;
    if (!have_any) {
      grid_ = in_window[i];
      have_any = true;
      continue;
    }
    std::vector<Date> merged;
    std::set_intersection(grid_.begin(), grid_.end(), in_window[i].begin(),
                          in_window[i].end(), std::back_inserter(merged));
    grid_.swap(merged);
  }

  if (!have_any) {
    throw std::runtime_error(
        "BacktestEngine: no instrument has data inside the window");
  }
  if (grid_.empty()) {
    throw std::runtime_error(
        "BacktestEngine: instruments share no dates inside the window");
  }

  for (std::size_t i = 0; i < slots_.size(); ++i) {
    Slot& slot = slots_[i];
    if (!slot.active) {
      continue;
    }
    if (in_window[i].size() > grid_.size()) {
      std::cerr << "[BacktestEngine] WARNING: " << slot.symbol << " truncated "
                << "from " << in_window[i].size() << " to " << grid_.size()
                << " common dates.\n";
    }
    slot.feed_index.reserve(grid_.size());
    for (Date d : grid_) {
      // Every grid date came from this feed, so the lookup cannot miss.
      slot.feed_index.push_back(*slot.feed->indexOf(d));
    }
  }
}

// -----------------------------------------------------------------------------
// run: the date loop
// -----------------------------------------------------------------------------
const RunInfo& BacktestEngine::run() {
  if (slots_.empty()) {
    throw std::invalid_argument("BacktestEngine: no instruments added");
  }

  info_ = RunInfo{};
  buildGrid();

  ledger_->reset(config_.initial_capital);
  rejection_log_.clear();

  for (Slot& slot : slots_) {
    if (config_.reset_traders_each_run) {
      slot.trader->resetForRun(1.0);
    }
    slot.trader->setLoggingWindow(grid_.front(), grid_.back());
  }

  info_.grid_size = grid_.size();
  info_.first_date = grid_.front();
  info_.last_date = grid_.back();

  if (config_.verbose) {
    std::cout << "[BacktestEngine] run: " << slots_.size() << " instruments, "
              << grid_.size() << " dates " << format_date(grid_.front())
              << ".." << format_date(grid_.back()) << "\n";
  }

  // Seed last-known prices so the first margin checks can value positions.
  ledger_->updateLastPrices(closePrices(0));

  for (std::size_t k = 0; k < grid_.size(); ++k) {
    const Date date = grid_[k];
    const domain::PriceMap opens = openPrices(k);
    const domain::PriceMap closes = closePrices(k);

    // --- Signals -------------------------------------------------------------
    for (Slot& slot : slots_) {
      if (slot.active) {
        slot.trader->step(slot.feed_index[k]);
      }
    }

    // --- Execution, serialized in add order ----------------------------------
    for (Slot& slot : slots_) {
      if (slot.active) {
        processInstrument(slot, k, opens);
      }
    }

    // --- End of day ------------------------------------------------------------
    ledger_->applyBorrowCost(date, closes, specs_,
                             config_.trading_days_per_year);
    ledger_->appendEquityCurve(date, valuationPrices(k), specs_);
  }

  ledger_->flushLogs();
  rejection_log_.flush();
  for (const Slot& slot : slots_) {
    slot.trader->flushLogs();
  }

  if (config_.verbose) {
    std::cout << "[BacktestEngine] done: executed=" << info_.executed_trades
              << " signals=" << info_.signal_trades
              << " rejected=" << info_.rejected_orders
              << " zero_qty=" << info_.zero_qty_signals
              << " final_equity=" << ledger_->equityCurve().back().equity
              << "\n";
  }
  return info_;
}

// -----------------------------------------------------------------------------
// processInstrument: intent → target → ledger → reconcile
// -----------------------------------------------------------------------------
void BacktestEngine::processInstrument(Slot& slot, std::size_t k,
                                       const domain::PriceMap& opens) {
  const Date date = grid_[k];
  const std::size_t t = slot.feed_index[k];
  const domain::InstrumentSpec& spec = specs_.at(slot.symbol);
  SignalTrader& trader = *slot.trader;

  const double cur_qty = ledger_->quantity(slot.symbol);
  const int cur_sign = signOf(cur_qty);

  auto open_it = opens.find(slot.symbol);
  if (open_it == opens.end() || !validPrice(open_it->second)) {
    trader.reconcile(cur_sign, t);
    return;
  }
  const double px = open_it->second;

  // --- Desired sign; an expired short is covered whatever the trader wants --
  int desired = trader.desiredPosition();
  std::string fill_reason = "FILL";
  bool forced = false;
  if (cur_sign < 0 && slot.short_since) {
    const std::optional<Date> next =
        (k + 1 < grid_.size()) ? std::optional<Date>(grid_[k + 1])
                               : std::nullopt;
    if (spec.shortCoverDue(*slot.short_since, date, next)) {
      desired = 0;
      forced = true;
      fill_reason = "FORCED_COVER_MAXHOLD";
    }
  }

  // --- Target quantity --------------------------------------------------------
  double target_qty = 0.0;
  if (desired != 0 && cur_sign == desired &&
      !config_.rebalance_while_holding) {
    target_qty = cur_qty;
  } else if (desired != 0) {
    const double basis = config_.use_dynamic_sizing
                             ? ledger_->computeEquity(opens, specs_)
                             : config_.initial_capital;
    double max_notional = spec.maxNotionalFrac() * basis;
    const bool fresh_entry = (cur_sign == 0);
    if (fresh_entry && config_.use_entry_position_frac &&
        config_.entry_sizing_policy != EntrySizingPolicy::DownsizeOnly) {
      max_notional *= trader.positionFraction();
    }
    double units = std::floor(max_notional / (px * spec.multiplier()));
    if (!std::isfinite(units) || units < 0.0) {
      units = 0.0;
    }
    target_qty = static_cast<double>(desired) * units;
    if (units == 0.0) {
      ++info_.zero_qty_signals;
    }
  }

  if (target_qty == cur_qty) {
    trader.reconcile(cur_sign, t);
    return;
  }
  ++info_.signal_trades;

  // --- Execute with downsizing -----------------------------------------------
  const DownsizeResult result =
      executeWithDownsizing(spec, date, cur_qty, target_qty, px,
                            forced ? fill_reason
                                   : std::string(actionFor(cur_sign, desired)));

  if (result.ok) {
    const double after_qty = ledger_->quantity(slot.symbol);
    const int after_sign = signOf(after_qty);
    if (after_qty != cur_qty) {
      ++info_.executed_trades;
      if (after_sign < 0 && cur_sign >= 0) {
        slot.short_since = date;
      } else if (after_sign >= 0) {
        slot.short_since.reset();
      }
      trader.onPortfolioFill(date, actionFor(cur_sign, after_sign), px,
                             cur_sign, after_sign, fill_reason);
    }
    trader.reconcile(after_sign, t);
    return;
  }

  ++info_.rejected_orders;
  domain::RejectionLogEntry row;
  row.time = date;
  row.symbol = slot.symbol;
  row.trader_id = spec.traderId();
  row.desired_position = desired;
  row.current_qty = cur_qty;
  row.requested_qty = target_qty;
  row.final_qty = result.final_qty;
  row.price = px;
  row.iterations = result.downsizes;
  rejection_log_.append(std::move(row));

  if (config_.verbose) {
    std::cerr << "[BacktestEngine] WARNING: " << format_date(date) << " "
              << slot.symbol << " order " << cur_qty << " -> " << target_qty
              << " rejected after " << result.downsizes << " downsizes.\n";
  }
  trader.reconcile(cur_sign, t);
}

// -----------------------------------------------------------------------------
// executeWithDownsizing: shrink |Q| until the ledger accepts
// -----------------------------------------------------------------------------
BacktestEngine::DownsizeResult BacktestEngine::executeWithDownsizing(
    const domain::InstrumentSpec& spec, Date date, double current_qty,
    double target_qty, double price, const std::string& reason) {
  DownsizeResult result;
  result.final_qty = target_qty;

  if (target_qty < 0.0 && !spec.allowShort()) {
    return result;
  }

  const int max_retries =
      (config_.entry_sizing_policy == EntrySizingPolicy::FractionOnly &&
       current_qty == 0.0)
          ? 0
          : config_.downsize_max_iter;
  double tq = target_qty;
  for (int retry = 0;; ++retry) {
    result.final_qty = tq;
    result.downsizes = retry;
    const TradeOutcome outcome = ledger_->setTargetQuantity(
        date, spec.symbol(), tq, price, spec, specs_, spec.traderId(), reason);
    if (accepted(outcome)) {
      result.ok = true;
      return result;
    }
    if (tq == 0.0 || retry >= max_retries) {
      return result;
    }
    const double shrunk = std::floor(std::abs(tq) * config_.downsize_factor);
    tq = (shrunk < 1.0) ? 0.0 : std::copysign(shrunk, tq);
  }
}

// -----------------------------------------------------------------------------
// Price maps
// -----------------------------------------------------------------------------
domain::PriceMap BacktestEngine::pricesAt(std::size_t k,
                                          PriceField field) const {
  domain::PriceMap out;
  for (const Slot& slot : slots_) {
    if (!slot.active || k >= slot.feed_index.size()) {
      continue;
    }
    const domain::Bar& bar = slot.feed->bar(slot.feed_index[k]);
    out[slot.symbol] = (field == PriceField::Open) ? bar.open : bar.close;
  }
  return out;
}

domain::PriceMap BacktestEngine::closePrices(std::size_t k) const {
  return pricesAt(k, PriceField::Close);
}

domain::PriceMap BacktestEngine::openPrices(std::size_t k) const {
  return pricesAt(k, PriceField::Open);
}

domain::PriceMap BacktestEngine::valuationPrices(std::size_t k) const {
  if (config_.valuation_mode == ValuationMode::NextOpen &&
      k + 1 < grid_.size()) {
    return openPrices(k + 1);
  }
  return closePrices(k);
}

// -----------------------------------------------------------------------------
// Lookup
// -----------------------------------------------------------------------------
std::vector<std::string> BacktestEngine::symbols() const {
  std::vector<std::string> out;
  out.reserve(slots_.size());
  for (const Slot& slot : slots_) {
    out.push_back(slot.symbol);
  }
  return out;
}

const BacktestEngine::Slot* BacktestEngine::findSlot(
    const std::string& symbol) const {
  for (const Slot& slot : slots_) {
    if (slot.symbol == symbol) {
      return &slot;
    }
  }
  return nullptr;
}

const SignalTrader* BacktestEngine::trader(const std::string& symbol) const {
  const Slot* slot = findSlot(symbol);
  return slot ? slot->trader.get() : nullptr;
}

bool BacktestEngine::isActive(const std::string& symbol) const {
  const Slot* slot = findSlot(symbol);
  return slot && slot->active;
}

}  // namespace trendbook
