#include "trendbook/io/json_export.hpp"

#include "trendbook/domain/side.hpp"
#include "trendbook/time/date.hpp"

namespace trendbook {
namespace domain {

void to_json(nlohmann::json& j, const TradeLogEntry& row) {
  j = nlohmann::json{{"time", format_date(row.time)},
                     {"symbol", row.symbol},
                     {"trader_id", row.trader_id},
                     {"action", row.action},
                     {"side", to_string(row.side)},
                     {"qty_delta", row.qty_delta},
                     {"qty_after", row.qty_after},
                     {"price", row.price},
                     {"notional", row.notional},
                     {"fee", row.fee},
                     {"tax", row.tax},
                     {"reason", row.reason}};
}

void to_json(nlohmann::json& j, const BorrowLogEntry& row) {
  j = nlohmann::json{{"time", format_date(row.time)},
                     {"symbol", row.symbol},
                     {"trader_id", row.trader_id},
                     {"cost", row.cost}};
}

void to_json(nlohmann::json& j, const EquitySample& row) {
  j = nlohmann::json{{"time", format_date(row.time)},
                     {"equity", row.equity},
                     {"cash", row.cash},
                     {"reserved_margin", row.reserved_margin},
                     {"gross_exposure", row.gross_exposure},
                     {"net_exposure", row.net_exposure}};
}

void to_json(nlohmann::json& j, const RejectionLogEntry& row) {
  j = nlohmann::json{{"time", format_date(row.time)},
                     {"symbol", row.symbol},
                     {"trader_id", row.trader_id},
                     {"desired_position", row.desired_position},
                     {"current_qty", row.current_qty},
                     {"requested_qty", row.requested_qty},
                     {"final_qty", row.final_qty},
                     {"price", row.price},
                     {"iterations", row.iterations},
                     {"note", row.note}};
}

void to_json(nlohmann::json& j, const TraderTradeEntry& row) {
  j = nlohmann::json{{"time", format_date(row.time)},
                     {"action", row.action},
                     {"price", row.price},
                     {"position_before", row.position_before},
                     {"position_after", row.position_after},
                     {"reason", row.reason},
                     {"equity_before", row.equity_before},
                     {"equity_after", row.equity_after},
                     {"position_fraction", row.position_fraction}};
}

void to_json(nlohmann::json& j, const StopLogEntry& row) {
  j = nlohmann::json{{"time", format_date(row.time)},
                     {"stop_type", row.stop_type},
                     {"stop_price", row.stop_price},
                     {"hist_ref", row.hist_ref},
                     {"open_price", row.open_price}};
}

void to_json(nlohmann::json& j, const TraderCurvePoint& row) {
  j = nlohmann::json{{"time", format_date(row.time)},
                     {"equity", row.equity},
                     {"position", row.position}};
}

}  // namespace domain

void to_json(nlohmann::json& j, const CostTotals& costs) {
  j = nlohmann::json{{"fees", costs.fees},
                     {"taxes", costs.taxes},
                     {"borrow", costs.borrow},
                     {"total", costs.total()}};
}

void to_json(nlohmann::json& j, const PositionReport& row) {
  j = nlohmann::json{{"symbol", row.symbol},
                     {"trader_id", row.trader_id},
                     {"quantity", row.quantity},
                     {"average_price", nullptr},
                     {"mark_price", row.mark_price},
                     {"market_value", row.market_value},
                     {"realized_pnl", row.realized_pnl},
                     {"unrealized_pnl", row.unrealized_pnl}};
  if (row.average_price) {
    j["average_price"] = *row.average_price;
  }
}

void to_json(nlohmann::json& j, const LedgerSummary& summary) {
  j = nlohmann::json{{"equity", summary.equity},
                     {"cash", summary.cash},
                     {"reserved_margin", summary.reserved_margin},
                     {"available_cash", summary.available_cash},
                     {"positions", summary.positions},
                     {"costs", summary.costs},
                     {"realized_pnl", summary.realized_pnl},
                     {"unrealized_pnl", summary.unrealized_pnl},
                     {"contribution_pnl", summary.contribution_pnl}};
}

}  // namespace trendbook
