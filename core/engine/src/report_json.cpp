#include "trendbook/engine/report_json.hpp"

#include "trendbook/io/json_export.hpp"
#include "trendbook/time/date.hpp"

namespace trendbook {

namespace {

nlohmann::json optionalDate(const std::optional<Date>& date) {
  return date ? nlohmann::json(format_date(*date)) : nlohmann::json(nullptr);
}

}  // namespace

void to_json(nlohmann::json& j, const RunInfo& info) {
  j = nlohmann::json{{"executed_trades", info.executed_trades},
                     {"signal_trades", info.signal_trades},
                     {"rejected_orders", info.rejected_orders},
                     {"zero_qty_signals", info.zero_qty_signals},
                     {"grid_size", info.grid_size},
                     {"first_date", optionalDate(info.first_date)},
                     {"last_date", optionalDate(info.last_date)},
                     {"excluded_symbols", info.excluded_symbols}};
}

void to_json(nlohmann::json& j, const AccountingIssue& issue) {
  j = nlohmann::json{{"severity", to_string(issue.severity)},
                     {"code", issue.code},
                     {"symbol", issue.symbol},
                     {"date", optionalDate(issue.date)},
                     {"message", issue.message}};
}

void to_json(nlohmann::json& j, const SymbolAuditSummary& row) {
  j = nlohmann::json{{"symbol", row.symbol},
                     {"trader_trades", row.trader_trades},
                     {"portfolio_trades", row.portfolio_trades},
                     {"rejected", row.rejected},
                     {"missing_in_portfolio", row.missing_in_portfolio},
                     {"missing_in_trader", row.missing_in_trader},
                     {"final_pos_match", row.final_pos_match}};
}

void to_json(nlohmann::json& j, const AccountingReport& report) {
  j = nlohmann::json{{"pass", report.pass},
                     {"equity_ok", report.equity_ok},
                     {"costs_ok", report.costs_ok},
                     {"errors", report.errorCount()},
                     {"warnings", report.warningCount()},
                     {"issues", report.issues},
                     {"per_symbol", report.per_symbol}};
}

void to_json(nlohmann::json& j, const TraderSummary& summary) {
  j = nlohmann::json{{"trader_id", summary.trader_id},
                     {"symbol", summary.symbol},
                     {"final_equity", summary.final_equity},
                     {"position", summary.position},
                     {"trade_count", summary.trade_count},
                     {"stop_count", summary.stop_count}};
}

nlohmann::json exportRun(const BacktestEngine& engine) {
  const PortfolioLedger& ledger = engine.ledger();
  const domain::PriceMap closes =
      engine.grid().empty() ? domain::PriceMap{}
                            : engine.closePrices(engine.grid().size() - 1);

  nlohmann::json traders = nlohmann::json::object();
  for (const std::string& symbol : engine.symbols()) {
    const SignalTrader* trader = engine.trader(symbol);
    if (!trader) {
      continue;
    }
    traders[symbol] = nlohmann::json{{"summary", trader->summary()},
                                     {"trades", trader->tradeLog()},
                                     {"stops", trader->stopLog()},
                                     {"curve", trader->curve()}};
  }

  return nlohmann::json{
      {"run", engine.lastRunInfo()},
      {"summary", ledger.summarize(closes, engine.specs())},
      {"trades", ledger.tradeLog()},
      {"borrow", ledger.borrowLog()},
      {"rejections", engine.rejectionLog()},
      {"equity_curve", ledger.equityCurve()},
      {"traders", traders}};
}

}  // namespace trendbook
