#pragma once

#include "trendbook/config/backtest_config.hpp"
#include "trendbook/domain/instrument_spec.hpp"
#include "trendbook/domain/log_entries.hpp"
#include "trendbook/ledger/portfolio_ledger.hpp"
#include "trendbook/time/date.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trendbook {

class BacktestEngine;

enum class IssueSeverity { Error, Warning };

const char* to_string(IssueSeverity severity);

// One finding. symbol is "(PORTFOLIO)" for book-level checks.
struct AccountingIssue {
  IssueSeverity severity{IssueSeverity::Error};
  std::string code;
  std::string symbol;
  std::optional<Date> date;
  std::string message;
};

struct SymbolAuditSummary {
  std::string symbol;
  std::size_t trader_trades{0};
  std::size_t portfolio_trades{0};
  std::size_t rejected{0};
  std::size_t missing_in_portfolio{0};
  std::size_t missing_in_trader{0};
  bool final_pos_match{true};
};

struct AccountingReport {
  bool pass{false};
  bool equity_ok{true};
  bool costs_ok{true};
  std::vector<AccountingIssue> issues;
  std::vector<SymbolAuditSummary> per_symbol;

  std::size_t errorCount() const;
  std::size_t warningCount() const;
  bool hasIssue(const std::string& code) const;
};

// -----------------------------------------------------------------------------
// AuditInput: flushed logs and final state of one finished run
// -----------------------------------------------------------------------------
// Collected from a BacktestEngine by collectAuditInput(); a plain copy so
// the checks never touch live engine state.
// -----------------------------------------------------------------------------
struct AuditInput {
  double initial_capital{0.0};
  std::vector<std::string> symbols;  // Engine add order
  domain::SpecMap specs;
  std::vector<domain::TradeLogEntry> trades;
  std::vector<domain::BorrowLogEntry> borrows;
  std::vector<domain::RejectionLogEntry> rejections;
  std::vector<domain::EquitySample> equity_curve;
  CostTotals cost_totals;
  std::map<std::string, CostTotals> costs_by_trader;
  std::map<std::string, double> final_quantities;
  domain::PriceMap last_prices;
  std::map<std::string, std::vector<domain::TraderTradeEntry>> trader_trades;
  std::map<std::string, int> trader_positions;
  std::map<Date, domain::PriceMap> valuation_prices;  // Per grid date
};

AuditInput collectAuditInput(const BacktestEngine& engine);

// -----------------------------------------------------------------------------
// AccountingTester: post-run cross-check of trader and ledger logs
// -----------------------------------------------------------------------------
//
// @brief  Replays the logs of a finished BacktestEngine run and reports
//         every inconsistency as a typed issue.
//
// @details
// Checks, in order:
//   1. Per instrument: every trader fill date has a same-day ledger trade
//      (a same-day rejection downgrades the miss to a warning); every
//      ledger trade date has a trader fill (warning); final signs agree.
//   2. Equity curve: non-empty, strictly increasing dates, finite values,
//      equity == cash + net exposure on every row, and on evenly spaced
//      sample rows equity rebuilt from initial capital, trade rows, and
//      borrow rows, marked at the engine's valuation prices.
//   3. Costs: fee/tax/borrow row sums match ledger totals; per-trader
//      attribution matches (warning).
//   4. No short outlives its instrument's enforced cover deadline.
// The report passes iff no Error was raised.
//
// Thread model:
//   Read-only on the engine. Call after run() returns.
// -----------------------------------------------------------------------------
class AccountingTester {
 public:
  explicit AccountingTester(
      AccountingTesterOptions options = AccountingTesterOptions{});

  AccountingReport verify(const BacktestEngine& engine) const;
  AccountingReport verify(const AuditInput& input) const;

  // Prints the verdict, per-symbol summary, and up to `max_issues` issues.
  static void printReport(const AccountingReport& report,
                          std::size_t max_issues = 30);

  const AccountingTesterOptions& options() const { return options_; }

 private:
  // Each check returns false when fail_fast should stop the run.
  bool checkSymbols(const AuditInput& in, AccountingReport& report) const;
  bool checkEquityCurve(const AuditInput& in, AccountingReport& report) const;
  bool checkCosts(const AuditInput& in, AccountingReport& report) const;
  bool checkShortHold(const AuditInput& in, AccountingReport& report) const;

  double reconstructEquity(const AuditInput& in, Date date) const;

  bool addIssue(AccountingReport& report, IssueSeverity severity,
                const std::string& code, const std::string& symbol,
                std::optional<Date> date, const std::string& message) const;

  AccountingTesterOptions options_;
};

}  // namespace trendbook
