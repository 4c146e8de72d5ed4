#pragma once

#include <optional>
#include <string>

namespace trendbook {
namespace domain {

// -----------------------------------------------------------------------------
// Position: per-symbol holding inside the portfolio ledger
// -----------------------------------------------------------------------------
//
// @brief  Tracks the signed quantity, weighted average cost, and realized
//         PnL for a single instrument.
//
// @details
// Sign convention for quantity:
//   positive → long, negative → short, zero → flat.
//
// average_price is empty exactly when quantity == 0. It is updated when the
// position increases in the same direction, unchanged on a partial close,
// cleared on a full close, and reset to the trade price on a reversal.
//
// realized_pnl is in currency units (contract multiplier applied) and
// accumulates the closed portions of every trade:
//   closed_qty * (price - average_price) * sign(quantity) * multiplier
//
// Ownership:
//   PortfolioLedger owns every Position and mutates it only through
//   applyTrade(). Callers outside the ledger see const references or copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;                   // Instrument identifier
  double quantity{0.0};                 // Signed: +long, -short, 0=flat
  std::optional<double> average_price;  // Empty iff quantity == 0
  double realized_pnl{0.0};             // Cumulative realized PnL

  bool isFlat() const { return quantity == 0.0; }
};

// -----------------------------------------------------------------------------
// TradeProjection: result of applying a trade without committing it
// -----------------------------------------------------------------------------
struct TradeProjection {
  double quantity{0.0};
  std::optional<double> average_price;
  double realized_delta{0.0};
};

// -------------------------------------------------------------------------
// projectTrade
// -------------------------------------------------------------------------
// @brief  Computes the state `pos` would have after a signed trade of
//         `qty_delta` units at `price`, without mutating it.
//
// @param  pos         Current position.
// @param  qty_delta   Signed trade quantity (+buy, -sell).
// @param  price       Execution price.
// @param  multiplier  Contract multiplier applied to realized PnL.
// @return TradeProjection  New quantity, new average, realized PnL delta.
//
// @details
// Weighted-average-cost rules:
//   flat             → quantity = delta, average = price
//   same direction   → average = (q*avg + delta*price) / (q + delta)
//   partial close    → realize |delta|, average unchanged
//   full close       → realize |q|, average cleared
//   reversal         → realize |q|, residual opens at price
// -------------------------------------------------------------------------
TradeProjection projectTrade(const Position& pos, double qty_delta,
                             double price, double multiplier);

// -------------------------------------------------------------------------
// applyTrade
// -------------------------------------------------------------------------
// @brief  Commits projectTrade() into `pos` and returns the realized PnL
//         produced by this trade.
// -------------------------------------------------------------------------
double applyTrade(Position& pos, double qty_delta, double price,
                  double multiplier);

}  // namespace domain
}  // namespace trendbook
