#include "trendbook/domain/position.hpp"

#include <cmath>

namespace trendbook {
namespace domain {

// -----------------------------------------------------------------------------
// projectTrade: weighted-average-cost math (pure)
// -----------------------------------------------------------------------------
TradeProjection projectTrade(const Position& pos, double qty_delta,
                             double price, double multiplier) {
  TradeProjection out;
  out.quantity = pos.quantity;
  out.average_price = pos.average_price;

  if (qty_delta == 0.0) {
    return out;
  }

  const double current_qty = pos.quantity;

  // --- Flat: fresh open at the trade price ----------------------------------
  if (current_qty == 0.0 || !pos.average_price) {
    out.quantity = qty_delta;
    out.average_price = price;
    return out;
  }

  const double avg = *pos.average_price;
  const bool same_direction = (current_qty > 0.0 && qty_delta > 0.0) ||
                              (current_qty < 0.0 && qty_delta < 0.0);

  if (same_direction) {
    // Both terms share a sign, so the sum is never zero.
    const double new_total = current_qty + qty_delta;
    out.average_price = (current_qty * avg + qty_delta * price) / new_total;
    out.quantity = new_total;
    return out;
  }

  const double abs_current = std::abs(current_qty);
  const double abs_fill = std::abs(qty_delta);
  const double direction_sign = (current_qty > 0.0) ? 1.0 : -1.0;

  if (abs_fill <= abs_current) {
    // --- Partial or full close, no reversal -------------------------------
    out.realized_delta =
        abs_fill * (price - avg) * direction_sign * multiplier;
    out.quantity = current_qty + qty_delta;
    if (out.quantity == 0.0) {
      out.average_price.reset();
    }
    return out;
  }

  // --- Reversal: close everything, open the residual at price ---------------
  out.realized_delta =
      abs_current * (price - avg) * direction_sign * multiplier;
  const double new_direction_sign = (qty_delta > 0.0) ? 1.0 : -1.0;
  out.quantity = new_direction_sign * (abs_fill - abs_current);
  out.average_price = price;
  return out;
}

// -----------------------------------------------------------------------------
// applyTrade: commit a projection into the position
// -----------------------------------------------------------------------------
double applyTrade(Position& pos, double qty_delta, double price,
                  double multiplier) {
  const TradeProjection next = projectTrade(pos, qty_delta, price, multiplier);
  pos.quantity = next.quantity;
  pos.average_price = next.average_price;
  pos.realized_pnl += next.realized_delta;
  return next.realized_delta;
}

}  // namespace domain
}  // namespace trendbook
