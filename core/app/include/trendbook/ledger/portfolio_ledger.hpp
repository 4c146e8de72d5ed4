#pragma once

#include "trendbook/domain/instrument_spec.hpp"
#include "trendbook/domain/log_entries.hpp"
#include "trendbook/domain/position.hpp"
#include "trendbook/log/log_buffer.hpp"
#include "trendbook/time/date.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trendbook {

// -----------------------------------------------------------------------------
// TradeOutcome
// -----------------------------------------------------------------------------
// Result of a ledger order. Rejections leave the ledger untouched.
// -----------------------------------------------------------------------------
enum class TradeOutcome {
  Executed,                   // Position, cash, and logs updated
  NoOp,                       // Delta below epsilon; nothing to do
  RejectedInvalidPrice,       // Price non-finite or <= 0
  RejectedShortNotAllowed,    // Result would be short on a long-only spec
  RejectedInsufficientCash    // Cash after trade below total margin
};

inline bool accepted(TradeOutcome outcome) {
  return outcome == TradeOutcome::Executed || outcome == TradeOutcome::NoOp;
}

const char* to_string(TradeOutcome outcome);

// Cumulative costs for the whole book or one trader.
struct CostTotals {
  double fees{0.0};
  double taxes{0.0};
  double borrow{0.0};

  double total() const { return fees + taxes + borrow; }
};

// -----------------------------------------------------------------------------
// PositionReport / LedgerSummary: valuation snapshot for reporting
// -----------------------------------------------------------------------------
struct PositionReport {
  std::string symbol;
  std::string trader_id;
  double quantity{0.0};
  std::optional<double> average_price;
  double mark_price{0.0};
  double market_value{0.0};
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
};

struct LedgerSummary {
  double equity{0.0};
  double cash{0.0};
  double reserved_margin{0.0};
  double available_cash{0.0};
  std::vector<PositionReport> positions;
  CostTotals costs;
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
  double contribution_pnl{0.0};  // realized + unrealized - costs
};

// -----------------------------------------------------------------------------
// PortfolioLedger: shared cash account for every instrument
// -----------------------------------------------------------------------------
//
// @brief  Sole owner of cash, positions, cumulative costs, and the
//         portfolio logs. Executes trades under short and margin checks,
//         accrues borrow cost, and samples equity.
//
// @details
// Trade execution (executeTrade):
//   1. Reject a non-finite or non-positive price.
//   2. Project the position with projectTrade(); reject a resulting short
//      when the InstrumentSpec disallows shorting.
//   3. fee = spec.fee(|notional|), tax = spec.tax(date, side, |notional|),
//      new_cash = cash - delta * price * multiplier - fee - tax.
//   4. Margin = Σ spec_i.margin(q_i, px_i) over every held position with the
//      projected quantity substituted for this symbol, priced at last-known
//      prices (this symbol at the trade price, average price as fallback).
//      Reject when new_cash - margin < -1e-9.
//   5. Commit: position, cash, fee/tax totals, per-trader costs, last price,
//      trade-log row.
//
// Accounting identity, holding for every equity sample:
//   equity == cash + Σ(quantity_i * lastPrice_i * multiplier_i)
//
// Positions are kept in a std::map so every sum iterates symbols in the
// same order; repeated runs produce bit-identical floating-point results.
//
// Thread model:
//   Single-threaded. Mutated only from BacktestEngine's sequential
//   per-date, per-instrument loop.
//
// Ownership:
//   Owned by BacktestEngine via std::unique_ptr.
// -----------------------------------------------------------------------------
class PortfolioLedger {
 public:
  explicit PortfolioLedger(double initial_capital);

  PortfolioLedger(const PortfolioLedger&) = delete;
  PortfolioLedger& operator=(const PortfolioLedger&) = delete;
  PortfolioLedger(PortfolioLedger&&) = delete;
  PortfolioLedger& operator=(PortfolioLedger&&) = delete;

  // Clears positions, prices, costs, and logs; sets cash.
  void reset(double initial_capital);

  // Existing position or a newly created flat one.
  const domain::Position& getPosition(const std::string& symbol);

  // Existing position or nullptr. Never creates.
  const domain::Position* findPosition(const std::string& symbol) const;

  // Signed quantity held, 0 when the symbol was never traded.
  double quantity(const std::string& symbol) const;

  const std::map<std::string, domain::Position>& positions() const {
    return positions_;
  }

  // -------------------------------------------------------------------------
  // setTargetQuantity
  // -------------------------------------------------------------------------
  // @brief  Trades the difference between `target_qty` and the current
  //         quantity.
  //
  // @return NoOp when |target - current| < 1e-12, else executeTrade().
  // -------------------------------------------------------------------------
  TradeOutcome setTargetQuantity(Date time, const std::string& symbol,
                                 double target_qty, double price,
                                 const domain::InstrumentSpec& spec,
                                 const domain::SpecMap& all_specs,
                                 const std::string& trader_id,
                                 const std::string& reason = "TARGET");

  // -------------------------------------------------------------------------
  // executeTrade
  // -------------------------------------------------------------------------
  // @brief  Executes a signed quantity delta at `price`. See class comment.
  //
  // @param  trader_id  Written into the trade row; blank uses the InstrumentSpec's.
  // -------------------------------------------------------------------------
  TradeOutcome executeTrade(Date time, const std::string& symbol,
                            double qty_delta, double price,
                            const domain::InstrumentSpec& spec,
                            const domain::SpecMap& all_specs,
                            const std::string& trader_id,
                            const std::string& reason = "TARGET");

  // -------------------------------------------------------------------------
  // applyBorrowCost
  // -------------------------------------------------------------------------
  // @brief  Charges one day of borrow on every open short.
  //
  // @return Total cost debited from cash.
  //
  // @details
  // cost = |q * px * multiplier| * borrow_rate_annual / trading_days_per_year
  // px comes from `prices`, else the last-known price, else the average.
  // One borrow-log row per charged short.
  //
  // @throws std::invalid_argument  if trading_days_per_year <= 0.
  // -------------------------------------------------------------------------
  double applyBorrowCost(Date date, const domain::PriceMap& prices,
                         const domain::SpecMap& specs,
                         int trading_days_per_year);

  // -------------------------------------------------------------------------
  // appendEquityCurve
  // -------------------------------------------------------------------------
  // @brief  Refreshes last-known prices from `prices`, recomputes reserved
  //         margin, and appends one equity sample.
  //
  // @return The appended sample.
  // -------------------------------------------------------------------------
  domain::EquitySample appendEquityCurve(Date date,
                                         const domain::PriceMap& prices,
                                         const domain::SpecMap& specs);

  // cash + Σ q * px * multiplier, px from `prices` then last-known then avg.
  double computeEquity(const domain::PriceMap& prices,
                       const domain::SpecMap& specs) const;

  // Σ margin over held positions at the same price resolution.
  double requiredMargin(const domain::PriceMap& prices,
                        const domain::SpecMap& specs) const;

  // Copies every finite, positive price into the last-known price map.
  void updateLastPrices(const domain::PriceMap& prices);

  // Valuation snapshot, optionally restricted to one trader's symbols.
  LedgerSummary summarize(const domain::PriceMap& prices,
                          const domain::SpecMap& specs,
                          const std::string& trader_filter = "") const;

  // --- Accessors -------------------------------------------------------------
  double cash() const { return cash_; }
  double initialCapital() const { return initial_capital_; }
  double reservedMargin() const { return reserved_margin_; }
  double availableCash() const { return cash_ - reserved_margin_; }
  double feesPaid() const { return totals_.fees; }
  double taxesPaid() const { return totals_.taxes; }
  double borrowPaid() const { return totals_.borrow; }
  const CostTotals& costTotals() const { return totals_; }
  const std::map<std::string, CostTotals>& costsByTrader() const {
    return costs_by_trader_;
  }
  const domain::PriceMap& lastPrices() const { return last_prices_; }

  // --- Logs (flushed on read) -----------------------------------------------
  const std::vector<domain::TradeLogEntry>& tradeLog() const {
    return trade_log_.entries();
  }
  const std::vector<domain::BorrowLogEntry>& borrowLog() const {
    return borrow_log_.entries();
  }
  const std::vector<domain::EquitySample>& equityCurve() const {
    return equity_curve_.entries();
  }
  void flushLogs() const;

 private:
  domain::Position& positionRef(const std::string& symbol);

  // Price used to value `symbol`: prices, last-known, then average.
  std::optional<double> markPrice(const std::string& symbol,
                                  const domain::Position& pos,
                                  const domain::PriceMap& prices) const;

  double initial_capital_;
  double cash_;
  double reserved_margin_{0.0};
  std::map<std::string, domain::Position> positions_;
  domain::PriceMap last_prices_;
  CostTotals totals_;
  std::map<std::string, CostTotals> costs_by_trader_;

  LogBuffer<domain::TradeLogEntry> trade_log_{10};
  LogBuffer<domain::BorrowLogEntry> borrow_log_{30};
  LogBuffer<domain::EquitySample> equity_curve_{30};
};

}  // namespace trendbook
