#pragma once

#include "trendbook/engine/accounting_tester.hpp"
#include "trendbook/engine/backtest_engine.hpp"

#include <nlohmann/json.hpp>

namespace trendbook {

void to_json(nlohmann::json& j, const RunInfo& info);
void to_json(nlohmann::json& j, const AccountingIssue& issue);
void to_json(nlohmann::json& j, const SymbolAuditSummary& row);
void to_json(nlohmann::json& j, const AccountingReport& report);
void to_json(nlohmann::json& j, const TraderSummary& summary);

// -----------------------------------------------------------------------------
// exportRun
// -----------------------------------------------------------------------------
// @brief  Renders a finished run as one document: run info, ledger summary
//         at the final closes, portfolio logs, and per-trader logs keyed by
//         symbol.
// -----------------------------------------------------------------------------
nlohmann::json exportRun(const BacktestEngine& engine);

}  // namespace trendbook
