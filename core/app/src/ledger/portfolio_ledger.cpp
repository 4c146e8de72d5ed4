#include "trendbook/ledger/portfolio_ledger.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace trendbook {

namespace {

constexpr double kQtyEpsilon = 1e-12;
constexpr double kCashTolerance = 1e-9;

bool validPrice(double px) { return std::isfinite(px) && px > 0.0; }

const domain::InstrumentSpec* findSpec(const domain::SpecMap& specs,
                                       const std::string& symbol) {
  auto it = specs.find(symbol);
  return (it != specs.end()) ? &it->second : nullptr;
}

double multiplierOf(const domain::InstrumentSpec* spec) {
  return spec ? spec->multiplier() : 1.0;
}

}  // namespace

const char* to_string(TradeOutcome outcome) {
  switch (outcome) {
    case TradeOutcome::Executed:
      return "EXECUTED";
    case TradeOutcome::NoOp:
      return "NOOP";
    case TradeOutcome::RejectedInvalidPrice:
      return "REJECTED_INVALID_PRICE";
    case TradeOutcome::RejectedShortNotAllowed:
      return "REJECTED_SHORT_NOT_ALLOWED";
    case TradeOutcome::RejectedInsufficientCash:
      return "REJECTED_INSUFFICIENT_CASH";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// Constructor / reset
// -----------------------------------------------------------------------------
PortfolioLedger::PortfolioLedger(double initial_capital)
    : initial_capital_(initial_capital), cash_(initial_capital) {
  if (!std::isfinite(initial_capital)) {
    throw std::invalid_argument(
        "PortfolioLedger: initial capital must be finite");
  }
}

void PortfolioLedger::reset(double initial_capital) {
  if (!std::isfinite(initial_capital)) {
    throw std::invalid_argument(
        "PortfolioLedger: initial capital must be finite");
  }
  initial_capital_ = initial_capital;
  cash_ = initial_capital;
  reserved_margin_ = 0.0;
  positions_.clear();
  last_prices_.clear();
  totals_ = CostTotals{};
  costs_by_trader_.clear();
  trade_log_.clear();
  borrow_log_.clear();
  equity_curve_.clear();
}

// -----------------------------------------------------------------------------
// Position access
// -----------------------------------------------------------------------------
domain::Position& PortfolioLedger::positionRef(const std::string& symbol) {
  domain::Position& pos = positions_[symbol];
  if (pos.symbol.empty()) {
    pos.symbol = symbol;
  }
  return pos;
}

const domain::Position& PortfolioLedger::getPosition(
    const std::string& symbol) {
  return positionRef(symbol);
}

const domain::Position* PortfolioLedger::findPosition(
    const std::string& symbol) const {
  auto it = positions_.find(symbol);
  return (it != positions_.end()) ? &it->second : nullptr;
}

double PortfolioLedger::quantity(const std::string& symbol) const {
  const domain::Position* pos = findPosition(symbol);
  return pos ? pos->quantity : 0.0;
}

std::optional<double> PortfolioLedger::markPrice(
    const std::string& symbol, const domain::Position& pos,
    const domain::PriceMap& prices) const {
  auto it = prices.find(symbol);
  if (it != prices.end() && validPrice(it->second)) {
    return it->second;
  }
  auto last = last_prices_.find(symbol);
  if (last != last_prices_.end() && validPrice(last->second)) {
    return last->second;
  }
  return pos.average_price;
}

// -----------------------------------------------------------------------------
// setTargetQuantity: trade the difference
// -----------------------------------------------------------------------------
TradeOutcome PortfolioLedger::setTargetQuantity(
    Date time, const std::string& symbol, double target_qty, double price,
    const domain::InstrumentSpec& spec, const domain::SpecMap& all_specs,
    const std::string& trader_id, const std::string& reason) {
  const double delta = target_qty - quantity(symbol);
  if (std::abs(delta) < kQtyEpsilon) {
    return TradeOutcome::NoOp;
  }
  return executeTrade(time, symbol, delta, price, spec, all_specs, trader_id,
                      reason);
}

// -----------------------------------------------------------------------------
// executeTrade: validate, margin-check, commit
// -----------------------------------------------------------------------------
TradeOutcome PortfolioLedger::executeTrade(
    Date time, const std::string& symbol, double qty_delta, double price,
    const domain::InstrumentSpec& spec, const domain::SpecMap& all_specs,
    const std::string& trader_id, const std::string& reason) {
  if (!validPrice(price)) {
    return TradeOutcome::RejectedInvalidPrice;
  }
  if (!std::isfinite(qty_delta) || std::abs(qty_delta) < kQtyEpsilon) {
    return TradeOutcome::NoOp;
  }

  const domain::Position* held_pos = findPosition(symbol);
  const double multiplier = spec.multiplier();
  const domain::TradeProjection next = domain::projectTrade(
      held_pos ? *held_pos : domain::Position{}, qty_delta, price, multiplier);

  if (next.quantity < 0.0 && !spec.allowShort()) {
    return TradeOutcome::RejectedShortNotAllowed;
  }

  // --- Costs and projected cash ---------------------------------------------
  const domain::Side side =
      (qty_delta > 0.0) ? domain::Side::Buy : domain::Side::Sell;
  const double cash_leg = qty_delta * price * multiplier;
  const double notional_abs = std::abs(cash_leg);
  const double fee = spec.fee(notional_abs);
  const double tax = spec.tax(time, side, notional_abs);
  const double new_cash = cash_ - cash_leg - fee - tax;

  // --- Margin across the whole book with the projected quantity -------------
  double margin = spec.margin(next.quantity, price);
  for (const auto& [sym, held] : positions_) {
    if (sym == symbol || held.quantity == 0.0) {
      continue;
    }
    const domain::InstrumentSpec* s = findSpec(all_specs, sym);
    if (!s) {
      continue;
    }
    const std::optional<double> px = markPrice(sym, held, last_prices_);
    if (!px) {
      continue;
    }
    margin += s->margin(held.quantity, *px);
  }

  if (new_cash - margin < -kCashTolerance) {
    return TradeOutcome::RejectedInsufficientCash;
  }

  // --- Commit ------------------------------------------------------------------
  domain::Position& pos = positionRef(symbol);
  domain::applyTrade(pos, qty_delta, price, multiplier);
  cash_ = new_cash;

  const std::string& tid = trader_id.empty() ? spec.traderId() : trader_id;
  totals_.fees += fee;
  totals_.taxes += tax;
  CostTotals& by_trader = costs_by_trader_[tid];
  by_trader.fees += fee;
  by_trader.taxes += tax;

  last_prices_[symbol] = price;

  domain::TradeLogEntry row;
  row.time = time;
  row.symbol = symbol;
  row.trader_id = tid;
  row.side = side;
  row.qty_delta = qty_delta;
  row.qty_after = pos.quantity;
  row.price = price;
  row.notional = notional_abs;
  row.fee = fee;
  row.tax = tax;
  row.reason = reason;
  trade_log_.append(std::move(row));

  return TradeOutcome::Executed;
}

// -----------------------------------------------------------------------------
// applyBorrowCost: one day of financing on every open short
// -----------------------------------------------------------------------------
double PortfolioLedger::applyBorrowCost(Date date,
                                        const domain::PriceMap& prices,
                                        const domain::SpecMap& specs,
                                        int trading_days_per_year) {
  if (trading_days_per_year <= 0) {
    throw std::invalid_argument(
        "PortfolioLedger: trading_days_per_year must be positive");
  }

  double total = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    if (pos.quantity >= 0.0) {
      continue;
    }
    const domain::InstrumentSpec* spec = findSpec(specs, symbol);
    if (!spec || spec->borrowRateAnnual() <= 0.0) {
      continue;
    }
    const std::optional<double> px = markPrice(symbol, pos, prices);
    if (!px || !validPrice(*px)) {
      continue;
    }

    const double cost = std::abs(pos.quantity * *px * spec->multiplier()) *
                        spec->borrowRateAnnual() /
                        static_cast<double>(trading_days_per_year);

    borrow_log_.append(
        domain::BorrowLogEntry{date, symbol, spec->traderId(), cost});
    costs_by_trader_[spec->traderId()].borrow += cost;
    total += cost;
  }

  if (total > 0.0) {
    cash_ -= total;
    totals_.borrow += total;
  }
  return total;
}

// -----------------------------------------------------------------------------
// Valuation
// -----------------------------------------------------------------------------
void PortfolioLedger::updateLastPrices(const domain::PriceMap& prices) {
  for (const auto& [symbol, px] : prices) {
    if (validPrice(px)) {
      last_prices_[symbol] = px;
    }
  }
}

double PortfolioLedger::computeEquity(const domain::PriceMap& prices,
                                      const domain::SpecMap& specs) const {
  double net = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    if (pos.quantity == 0.0) {
      continue;
    }
    const std::optional<double> px = markPrice(symbol, pos, prices);
    if (!px) {
      continue;
    }
    net += pos.quantity * *px * multiplierOf(findSpec(specs, symbol));
  }
  return cash_ + net;
}

double PortfolioLedger::requiredMargin(const domain::PriceMap& prices,
                                       const domain::SpecMap& specs) const {
  double margin = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    if (pos.quantity == 0.0) {
      continue;
    }
    const domain::InstrumentSpec* spec = findSpec(specs, symbol);
    const std::optional<double> px = markPrice(symbol, pos, prices);
    if (!spec || !px) {
      continue;
    }
    margin += spec->margin(pos.quantity, *px);
  }
  return margin;
}

domain::EquitySample PortfolioLedger::appendEquityCurve(
    Date date, const domain::PriceMap& prices, const domain::SpecMap& specs) {
  updateLastPrices(prices);
  reserved_margin_ = requiredMargin(last_prices_, specs);

  double gross = 0.0;
  double net = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    if (pos.quantity == 0.0) {
      continue;
    }
    const std::optional<double> px = markPrice(symbol, pos, last_prices_);
    if (!px) {
      continue;
    }
    const double notional =
        pos.quantity * *px * multiplierOf(findSpec(specs, symbol));
    gross += std::abs(notional);
    net += notional;
  }

  domain::EquitySample sample;
  sample.time = date;
  sample.equity = cash_ + net;
  sample.cash = cash_;
  sample.reserved_margin = reserved_margin_;
  sample.gross_exposure = gross;
  sample.net_exposure = net;
  equity_curve_.append(sample);
  return sample;
}

// -----------------------------------------------------------------------------
// summarize: realized / unrealized / costs, optionally per trader
// -----------------------------------------------------------------------------
LedgerSummary PortfolioLedger::summarize(const domain::PriceMap& prices,
                                         const domain::SpecMap& specs,
                                         const std::string& trader_filter)
    const {
  LedgerSummary out;
  out.cash = cash_;
  out.reserved_margin = reserved_margin_;
  out.available_cash = availableCash();
  out.equity = computeEquity(prices, specs);

  for (const auto& [symbol, pos] : positions_) {
    const domain::InstrumentSpec* spec = findSpec(specs, symbol);
    const std::string trader_id = spec ? spec->traderId() : std::string();
    if (!trader_filter.empty() && trader_id != trader_filter) {
      continue;
    }

    PositionReport row;
    row.symbol = symbol;
    row.trader_id = trader_id;
    row.quantity = pos.quantity;
    row.average_price = pos.average_price;
    row.realized_pnl = pos.realized_pnl;

    const std::optional<double> px = markPrice(symbol, pos, prices);
    if (px) {
      const double mult = multiplierOf(spec);
      row.mark_price = *px;
      row.market_value = pos.quantity * *px * mult;
      if (pos.quantity != 0.0 && pos.average_price) {
        row.unrealized_pnl = (*px - *pos.average_price) * pos.quantity * mult;
      }
    }

    out.realized_pnl += row.realized_pnl;
    out.unrealized_pnl += row.unrealized_pnl;
    out.positions.push_back(std::move(row));
  }

  if (trader_filter.empty()) {
    out.costs = totals_;
  } else {
    auto it = costs_by_trader_.find(trader_filter);
    if (it != costs_by_trader_.end()) {
      out.costs = it->second;
    }
  }
  out.contribution_pnl =
      out.realized_pnl + out.unrealized_pnl - out.costs.total();
  return out;
}

void PortfolioLedger::flushLogs() const {
  trade_log_.flush();
  borrow_log_.flush();
  equity_curve_.flush();
}

}  // namespace trendbook
