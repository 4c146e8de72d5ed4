#pragma once

#include "trendbook/domain/side.hpp"
#include "trendbook/time/date.hpp"

#include <string>

namespace trendbook {
namespace domain {

// -----------------------------------------------------------------------------
// Log rows
// -----------------------------------------------------------------------------
//
// @brief  Immutable records appended by the ledger, the engine, and the
//         traders. They are the only inputs the AccountingTester replays.
//
// @details
// All rows are plain value types. Once appended to a LogBuffer they are never
// modified; readers get const references after a flush.
// -----------------------------------------------------------------------------

// Portfolio ledger: one executed trade.
struct TradeLogEntry {
  Date time{0};
  std::string symbol;
  std::string trader_id;
  std::string action{"TRADE"};
  Side side{Side::Buy};
  double qty_delta{0.0};   // Signed
  double qty_after{0.0};
  double price{0.0};
  double notional{0.0};    // |qty_delta * price * multiplier|
  double fee{0.0};
  double tax{0.0};
  std::string reason;

  // Cash leg excluding costs: +notional for a buy, -notional for a sell.
  double signedNotional() const {
    return side == Side::Buy ? notional : -notional;
  }
};

// Portfolio ledger: daily borrow charge for one open short.
struct BorrowLogEntry {
  Date time{0};
  std::string symbol;
  std::string trader_id;
  double cost{0.0};
};

// Portfolio ledger: one equity-curve sample.
struct EquitySample {
  Date time{0};
  double equity{0.0};
  double cash{0.0};
  double reserved_margin{0.0};
  double gross_exposure{0.0};
  double net_exposure{0.0};
};

// Engine: an order the ledger refused even after downsizing.
struct RejectionLogEntry {
  Date time{0};
  std::string symbol;
  std::string trader_id;
  int desired_position{0};
  double current_qty{0.0};
  double requested_qty{0.0};  // Target before downsizing
  double final_qty{0.0};      // Last quantity attempted
  double price{0.0};
  int iterations{0};          // Downsizing steps taken
  std::string note{"REJECT"};
};

// Trader: an entry, exit, flip, or rebalance as seen by the trader.
struct TraderTradeEntry {
  Date time{0};
  std::string action;
  double price{0.0};
  int position_before{0};
  int position_after{0};
  std::string reason;
  double equity_before{0.0};
  double equity_after{0.0};
  double position_fraction{1.0};
};

// Trader: a triggered intraday stop.
struct StopLogEntry {
  Date time{0};
  std::string stop_type;
  double stop_price{0.0};
  double hist_ref{0.0};
  double open_price{0.0};
};

// Trader: one shadow-equity / position-sign sample.
struct TraderCurvePoint {
  Date time{0};
  double equity{0.0};
  int position{0};
};

}  // namespace domain
}  // namespace trendbook
