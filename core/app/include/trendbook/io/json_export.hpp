#pragma once

#include "trendbook/domain/log_entries.hpp"
#include "trendbook/ledger/portfolio_ledger.hpp"

#include <nlohmann/json.hpp>

// -----------------------------------------------------------------------------
// JSON renderings of logs and ledger snapshots
// -----------------------------------------------------------------------------
// nlohmann::json picks these up through ADL, so `nlohmann::json j = row;`
// and `nlohmann::json j = ledger.tradeLog();` both work. Dates are rendered
// as "YYYY-MM-DD"; an absent average price is null.
// -----------------------------------------------------------------------------

namespace trendbook {
namespace domain {

void to_json(nlohmann::json& j, const TradeLogEntry& row);
void to_json(nlohmann::json& j, const BorrowLogEntry& row);
void to_json(nlohmann::json& j, const EquitySample& row);
void to_json(nlohmann::json& j, const RejectionLogEntry& row);
void to_json(nlohmann::json& j, const TraderTradeEntry& row);
void to_json(nlohmann::json& j, const StopLogEntry& row);
void to_json(nlohmann::json& j, const TraderCurvePoint& row);

}  // namespace domain

void to_json(nlohmann::json& j, const CostTotals& costs);
void to_json(nlohmann::json& j, const PositionReport& row);
void to_json(nlohmann::json& j, const LedgerSummary& summary);

}  // namespace trendbook
