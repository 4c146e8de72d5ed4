#pragma once

namespace trendbook {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Direction of a single ledger trade. A positive quantity delta is a Buy, a
// negative one is a Sell. Only the Sell leg is taxable.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell
};

inline const char* to_string(Side side) {
  return side == Side::Buy ? "BUY" : "SELL";
}

}  // namespace domain
}  // namespace trendbook
