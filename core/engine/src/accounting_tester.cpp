#include "trendbook/engine/accounting_tester.hpp"

#include "trendbook/engine/backtest_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <map>
#include <set>

namespace trendbook {

namespace {

const char* const kPortfolio = "(PORTFOLIO)";

bool isFillAction(const std::string& action) {
  return action == "ENTER" || action == "EXIT" || action == "FLIP" ||
         action == "REBALANCE" || action == "TRADE";
}

int signOf(double value) {
  return (value > 0.0) ? 1 : ((value < 0.0) ? -1 : 0);
}

bool validPrice(double px) { return std::isfinite(px) && px > 0.0; }

std::string formatNumber(const char* fmt, double a, double b) {
  char buf[128];
  std::snprintf(buf, sizeof(buf), fmt, a, b);
  return std::string(buf);
}

}  // namespace

const char* to_string(IssueSeverity severity) {
  return severity == IssueSeverity::Error ? "ERROR" : "WARNING";
}

// -----------------------------------------------------------------------------
// AccountingReport helpers
// -----------------------------------------------------------------------------
std::size_t AccountingReport::errorCount() const {
  return static_cast<std::size_t>(
      std::count_if(issues.begin(), issues.end(), [](const auto& i) {
        return i.severity == IssueSeverity::Error;
      }));
}

std::size_t AccountingReport::warningCount() const {
  return issues.size() - errorCount();
}

bool AccountingReport::hasIssue(const std::string& code) const {
  return std::any_of(issues.begin(), issues.end(),
                     [&code](const auto& i) { return i.code == code; });
}

// -----------------------------------------------------------------------------
// collectAuditInput: copy the flushed logs out of a finished run
// -----------------------------------------------------------------------------
AuditInput collectAuditInput(const BacktestEngine& engine) {
  const PortfolioLedger& ledger = engine.ledger();

  AuditInput in;
  in.initial_capital = ledger.initialCapital();
  in.symbols = engine.symbols();
  in.specs = engine.specs();
  in.trades = ledger.tradeLog();
  in.borrows = ledger.borrowLog();
  in.rejections = engine.rejectionLog();
  in.equity_curve = ledger.equityCurve();
  in.cost_totals = ledger.costTotals();
  in.costs_by_trader = ledger.costsByTrader();
  in.last_prices = ledger.lastPrices();
  for (const auto& [symbol, pos] : ledger.positions()) {
    in.final_quantities[symbol] = pos.quantity;
  }
  for (const std::string& symbol : in.symbols) {
    const SignalTrader* trader = engine.trader(symbol);
    if (trader) {
      in.trader_trades[symbol] = trader->tradeLog();
      in.trader_positions[symbol] = trader->position();
    }
  }
  const std::vector<Date>& grid = engine.grid();
  for (std::size_t k = 0; k < grid.size(); ++k) {
    in.valuation_prices[grid[k]] = engine.valuationPrices(k);
  }
  return in;
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
AccountingTester::AccountingTester(AccountingTesterOptions options)
    : options_(options) {}

bool AccountingTester::addIssue(AccountingReport& report,
                                IssueSeverity severity,
                                const std::string& code,
                                const std::string& symbol,
                                std::optional<Date> date,
                                const std::string& message) const {
  report.issues.push_back(
      AccountingIssue{severity, code, symbol, date, message});
  return !(options_.fail_fast && severity == IssueSeverity::Error);
}

// -----------------------------------------------------------------------------
// verify
// -----------------------------------------------------------------------------
AccountingReport AccountingTester::verify(const BacktestEngine& engine) const {
  return verify(collectAuditInput(engine));
}

AccountingReport AccountingTester::verify(const AuditInput& input) const {
  AccountingReport report;

  // Each check returns false once fail_fast has recorded an error.
  if (checkSymbols(input, report) && checkEquityCurve(input, report) &&
      checkCosts(input, report)) {
    checkShortHold(input, report);
  }

  report.pass = report.errorCount() == 0;

  std::cout << "[AccountingTester] " << (report.pass ? "PASS" : "FAIL")
            << " errors=" << report.errorCount()
            << " warnings=" << report.warningCount() << "\n";
  return report;
}

// -----------------------------------------------------------------------------
// checkSymbols: trader fills vs ledger trades, final sign
// -----------------------------------------------------------------------------
bool AccountingTester::checkSymbols(const AuditInput& in,
                                    AccountingReport& report) const {
  for (const std::string& symbol : in.symbols) {
    auto trader_log = in.trader_trades.find(symbol);
    if (trader_log == in.trader_trades.end()) {
      continue;
    }

    std::set<Date> trader_dates;
    std::set<Date> ledger_dates;
    std::set<Date> reject_dates;

    SymbolAuditSummary row;
    row.symbol = symbol;
    for (const auto& t : trader_log->second) {
      if (isFillAction(t.action)) {
        ++row.trader_trades;
        trader_dates.insert(t.time);
      }
    }
    for (const auto& t : in.trades) {
      if (t.symbol == symbol) {
        ++row.portfolio_trades;
        ledger_dates.insert(t.time);
      }
    }
    for (const auto& r : in.rejections) {
      if (r.symbol == symbol) {
        ++row.rejected;
        reject_dates.insert(r.time);
      }
    }

    bool keep_going = true;
    for (Date d : trader_dates) {
      if (ledger_dates.count(d) != 0) {
        continue;
      }
      if (reject_dates.count(d) != 0) {
        addIssue(report, IssueSeverity::Warning,
                 "TraderActionWithoutPortfolioTrade", symbol, d,
                 "engine rejected the order (see rejection log)");
        continue;
      }
      ++row.missing_in_portfolio;
      keep_going = addIssue(report, IssueSeverity::Error,
                            "TraderActionWithoutPortfolioTrade", symbol, d,
                            "no corresponding portfolio trade");
      if (!keep_going) {
        break;
      }
    }
    if (!keep_going) {
      report.per_symbol.push_back(row);
      return false;
    }

    for (Date d : ledger_dates) {
      if (trader_dates.count(d) == 0) {
        ++row.missing_in_trader;
        addIssue(report, IssueSeverity::Warning,
                 "PortfolioTradeWithoutTraderAction", symbol, d,
                 "portfolio executed but the trader logged no fill that day");
      }
    }

    auto qty = in.final_quantities.find(symbol);
    auto pos = in.trader_positions.find(symbol);
    const int ledger_sign =
        signOf(qty != in.final_quantities.end() ? qty->second : 0.0);
    const int trader_sign =
        (pos != in.trader_positions.end()) ? pos->second : 0;
    if (ledger_sign != trader_sign) {
      row.final_pos_match = false;
      keep_going = addIssue(report, IssueSeverity::Error, "FinalPosMismatch",
                            symbol, std::nullopt,
                            "portfolio=" + std::to_string(ledger_sign) +
                                " trader=" + std::to_string(trader_sign));
    }
    report.per_symbol.push_back(row);
    if (!keep_going) {
      return false;
    }
  }
  return true;
}

// -----------------------------------------------------------------------------
// checkEquityCurve: shape, identity, and sampled reconstruction
// -----------------------------------------------------------------------------
bool AccountingTester::checkEquityCurve(const AuditInput& in,
                                        AccountingReport& report) const {
  const auto& curve = in.equity_curve;
  if (curve.empty()) {
    report.equity_ok = false;
    return addIssue(report, IssueSeverity::Error, "EquityCurveEmpty",
                    kPortfolio, std::nullopt, "equity curve is empty");
  }

  for (std::size_t i = 1; i < curve.size(); ++i) {
    if (curve[i].time <= curve[i - 1].time) {
      report.equity_ok = false;
      if (!addIssue(report, IssueSeverity::Error, "EquityCurveNonMonotonic",
                    kPortfolio, curve[i].time,
                    "equity curve dates are not strictly increasing")) {
        return false;
      }
      break;
    }
  }

  for (const auto& s : curve) {
    if (!std::isfinite(s.equity) || !std::isfinite(s.cash)) {
      report.equity_ok = false;
      if (!addIssue(report, IssueSeverity::Error, "EquityCurveBadValues",
                    kPortfolio, s.time, "equity or cash is not finite")) {
        return false;
      }
      break;
    }
  }

  for (const auto& s : curve) {
    const double err = std::abs(s.equity - (s.cash + s.net_exposure));
    const double tol = std::max(
        options_.abs_tol, options_.rel_tol * std::max(1.0, std::abs(s.equity)));
    if (err > tol) {
      report.equity_ok = false;
      if (!addIssue(report, IssueSeverity::Error, "EquityIdentityMismatch",
                    kPortfolio, s.time,
                    formatNumber("equity=%.10g cash+net=%.10g", s.equity,
                                 s.cash + s.net_exposure))) {
        return false;
      }
    }
  }

  // --- Sampled reconstruction -------------------------------------------------
  const std::size_t m = curve.size();
  const std::size_t ns = std::max<std::size_t>(
      2, std::min<std::size_t>(
             m, static_cast<std::size_t>(
                    std::max(0, options_.equity_check_samples))));
  std::set<std::size_t> rows;
  for (std::size_t i = 0; i < ns; ++i) {
    const double pos = (ns == 1) ? 0.0
                                 : static_cast<double>(i) *
                                       static_cast<double>(m - 1) /
                                       static_cast<double>(ns - 1);
    rows.insert(std::min(m - 1, static_cast<std::size_t>(std::lround(pos))));
  }

  for (std::size_t k : rows) {
    const Date d = curve[k].time;
    const double rebuilt = reconstructEquity(in, d);
    const double err = std::abs(curve[k].equity - rebuilt);
    const double tol =
        std::max(options_.abs_tol,
                 options_.rel_tol * std::max(1.0, std::abs(curve[k].equity)));
    if (err > tol) {
      report.equity_ok = false;
      if (!addIssue(report, IssueSeverity::Error, "EquityMismatch",
                    kPortfolio, d,
                    formatNumber("curve=%.10g recompute=%.10g",
                                 curve[k].equity, rebuilt))) {
        return false;
      }
    }
  }
  return true;
}

// -----------------------------------------------------------------------------
// reconstructEquity: initial capital + trade and borrow rows up to `date`
// -----------------------------------------------------------------------------
double AccountingTester::reconstructEquity(const AuditInput& in,
                                           Date date) const {
  const domain::SpecMap& specs = in.specs;

  auto multiplierOf = [&specs](const std::string& symbol) {
    auto it = specs.find(symbol);
    return (it != specs.end()) ? it->second.multiplier() : 1.0;
  };

  double cash = in.initial_capital;
  std::map<std::string, double> qty;
  for (const auto& t : in.trades) {
    if (t.time > date) {
      continue;
    }
    cash -= t.qty_delta * t.price * multiplierOf(t.symbol) + t.fee + t.tax;
    qty[t.symbol] += t.qty_delta;
  }
  for (const auto& b : in.borrows) {
    if (b.time <= date) {
      cash -= b.cost;
    }
  }

  static const domain::PriceMap kNoPrices;
  auto vp = in.valuation_prices.find(date);
  const domain::PriceMap& prices =
      (vp != in.valuation_prices.end()) ? vp->second : kNoPrices;
  const domain::PriceMap& last = in.last_prices;

  double equity = cash;
  for (const auto& [symbol, q] : qty) {
    if (q == 0.0) {
      continue;
    }
    double px = 0.0;
    auto it = prices.find(symbol);
    if (it != prices.end() && validPrice(it->second)) {
      px = it->second;
    } else {
      auto lt = last.find(symbol);
      if (lt == last.end() || !validPrice(lt->second)) {
        continue;
      }
      px = lt->second;
    }
    equity += q * px * multiplierOf(symbol);
  }
  return equity;
}

// -----------------------------------------------------------------------------
// checkCosts: row sums against running totals
// -----------------------------------------------------------------------------
bool AccountingTester::checkCosts(const AuditInput& in,
                                  AccountingReport& report) const {
  CostTotals rows;
  std::map<std::string, CostTotals> by_trader;
  for (const auto& t : in.trades) {
    rows.fees += t.fee;
    rows.taxes += t.tax;
    by_trader[t.trader_id].fees += t.fee;
    by_trader[t.trader_id].taxes += t.tax;
  }
  for (const auto& b : in.borrows) {
    rows.borrow += b.cost;
    by_trader[b.trader_id].borrow += b.cost;
  }

  auto mismatch = [this](double sum, double total) {
    const double tol = std::max(options_.abs_tol, std::abs(total) * 1e-9);
    return std::abs(sum - total) > tol;
  };

  const CostTotals& totals = in.cost_totals;
  const struct {
    const char* code;
    double sum;
    double total;
  } checks[] = {
      {"FeeTotalMismatch", rows.fees, totals.fees},
      {"TaxTotalMismatch", rows.taxes, totals.taxes},
      {"BorrowTotalMismatch", rows.borrow, totals.borrow},
  };
  for (const auto& c : checks) {
    if (mismatch(c.sum, c.total)) {
      report.costs_ok = false;
      if (!addIssue(report, IssueSeverity::Error, c.code, kPortfolio,
                    std::nullopt,
                    formatNumber("log sum=%.10g ledger total=%.10g", c.sum,
                                 c.total))) {
        return false;
      }
    }
  }

  std::set<std::string> trader_ids;
  for (const auto& [tid, unused] : by_trader) {
    trader_ids.insert(tid);
  }
  for (const auto& [tid, unused] : in.costs_by_trader) {
    trader_ids.insert(tid);
  }
  for (const std::string& tid : trader_ids) {
    CostTotals logged;
    CostTotals booked;
    auto lt = by_trader.find(tid);
    if (lt != by_trader.end()) {
      logged = lt->second;
    }
    auto bt = in.costs_by_trader.find(tid);
    if (bt != in.costs_by_trader.end()) {
      booked = bt->second;
    }
    if (mismatch(logged.total(), booked.total())) {
      addIssue(report, IssueSeverity::Warning, "TraderCostMismatch", tid,
               std::nullopt,
               formatNumber("log sum=%.10g attributed=%.10g", logged.total(),
                            booked.total()));
    }
  }
  return true;
}

// -----------------------------------------------------------------------------
// checkShortHold: enforced short deadlines over the executed trade rows
// -----------------------------------------------------------------------------
bool AccountingTester::checkShortHold(const AuditInput& in,
                                      AccountingReport& report) const {
  const auto& curve = in.equity_curve;

  for (const auto& [symbol, spec] : in.specs) {
    const domain::ShortCoverRule& rule = spec.shortCoverRule();
    if (!rule.active()) {
      continue;
    }

    double q = 0.0;
    std::optional<Date> short_since;
    auto check = [&](Date end) {
      const double held = static_cast<double>(end - *short_since);
      if (held <= rule.max_days) {
        return true;
      }
      return addIssue(report, IssueSeverity::Error, "ShortHoldExceeded",
                      symbol, end,
                      "short opened " + format_date(*short_since) +
                          " held " + std::to_string(end - *short_since) +
                          " days");
    };

    for (const auto& t : in.trades) {
      if (t.symbol != symbol) {
        continue;
      }
      const double before = q;
      q += t.qty_delta;
      if (before >= 0.0 && q < 0.0) {
        short_since = t.time;
      } else if (before < 0.0 && q >= 0.0) {
        if (short_since && !check(t.time)) {
          return false;
        }
        short_since.reset();
      }
    }
    if (short_since && !curve.empty() && !check(curve.back().time)) {
      return false;
    }
  }
  return true;
}

// -----------------------------------------------------------------------------
// printReport
// -----------------------------------------------------------------------------
void AccountingTester::printReport(const AccountingReport& report,
                                   std::size_t max_issues) {
  std::cout << "[AccountingTester] " << (report.pass ? "PASS" : "FAIL")
            << "\n";
  for (const auto& s : report.per_symbol) {
    std::cout << "[AccountingTester] " << s.symbol
              << " trader_trades=" << s.trader_trades
              << " portfolio_trades=" << s.portfolio_trades
              << " rejected=" << s.rejected
              << " missing_pf=" << s.missing_in_portfolio
              << " missing_tr=" << s.missing_in_trader
              << " final_pos_match=" << s.final_pos_match << "\n";
  }
  const std::size_t n = std::min(max_issues, report.issues.size());
  for (std::size_t i = 0; i < n; ++i) {
    const AccountingIssue& issue = report.issues[i];
    std::cout << "[AccountingTester] " << to_string(issue.severity) << " "
              << issue.code << " " << issue.symbol << " "
              << (issue.date ? format_date(*issue.date) : std::string("-"))
              << " " << issue.message << "\n";
  }
}

}  // namespace trendbook
