#include "trendbook/config/config_loader.hpp"

#include "trendbook/cost/fee_models.hpp"
#include "trendbook/cost/margin_models.hpp"
#include "trendbook/cost/tax_models.hpp"
#include "trendbook/time/date.hpp"

#include <fstream>
#include <map>
#include <memory>
#include <stdexcept>
#include <utility>

namespace trendbook {

namespace {

using nlohmann::json;

// Overwrites `out` only when `key` is present and not null.
template <typename T>
void readOptional(const json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

void requireObject(const json& j, const char* section) {
  if (!j.is_object()) {
    throw std::invalid_argument(std::string("config: section '") + section +
                                "' must be a JSON object");
  }
}

std::string lowered(std::string s) {
  for (char& c : s) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return s;
}

// -----------------------------------------------------------------------------
// Cost models
// -----------------------------------------------------------------------------
std::shared_ptr<const IFeeModel> loadFeeModel(const json& j) {
  requireObject(j, "fee");
  double commission = 0.0;
  double slippage = 0.0;
  readOptional(j, "commission", commission);
  readOptional(j, "slippage", slippage);
  return std::make_shared<RateFeeModel>(commission, slippage);
}

std::shared_ptr<const ITaxModel> loadTaxModel(const json& j) {
  requireObject(j, "tax");
  std::string kind = "sell_side";
  readOptional(j, "kind", kind);
  kind = lowered(kind);

  if (kind == "none") {
    return std::make_shared<ZeroTaxModel>();
  }
  if (kind == "krx_stt") {
    return std::make_shared<SellSideTaxModel>(
        SellSideTaxModel::krxTransactionTax());
  }
  if (kind != "sell_side") {
    throw std::invalid_argument("config: unknown tax kind '" + kind + "'");
  }

  double default_rate = 0.0;
  readOptional(j, "default_rate", default_rate);
  std::map<int, double> by_year;
  auto it = j.find("by_year");
  if (it != j.end() && !it->is_null()) {
    requireObject(*it, "tax.by_year");
    for (auto entry = it->begin(); entry != it->end(); ++entry) {
      int year = 0;
      try {
        year = std::stoi(entry.key());
      } catch (const std::exception&) {
        throw std::invalid_argument("config: tax.by_year key '" +
                                    entry.key() + "' is not a year");
      }
      by_year[year] = entry.value().get<double>();
    }
  }
  return std::make_shared<SellSideTaxModel>(std::move(by_year), default_rate);
}

std::shared_ptr<const IMarginModel> loadMarginModel(const json& j) {
  requireObject(j, "margin");
  double long_rate = 0.0;
  double short_initial = 0.5;
  double short_maintenance = 0.3;
  readOptional(j, "long_rate", long_rate);
  readOptional(j, "short_initial", short_initial);
  readOptional(j, "short_maintenance", short_maintenance);
  return std::make_shared<SimpleMarginModel>(long_rate, short_initial,
                                             short_maintenance);
}

Date readDate(const json& j, const char* key, Date fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return parse_date(it->get<std::string>());
}

}  // namespace

// -----------------------------------------------------------------------------
// loadInstrumentSpec
// -----------------------------------------------------------------------------
domain::InstrumentSpec loadInstrumentSpec(const json& j) {
  try {
    requireObject(j, "instruments[]");
    domain::InstrumentSpecParams p;
    p.symbol = j.at("symbol").get<std::string>();
    readOptional(j, "name", p.name);
    readOptional(j, "asset_type", p.asset_type);
    readOptional(j, "currency", p.currency);
    readOptional(j, "trader_id", p.trader_id);
    readOptional(j, "multiplier", p.multiplier);
    readOptional(j, "allow_short", p.allow_short);
    readOptional(j, "max_notional_frac", p.max_notional_frac);
    readOptional(j, "borrow_rate_annual", p.borrow_rate_annual);

    auto enforce = j.find("enforce_short_max_hold");
    if (enforce != j.end() && !enforce->is_null()) {
      p.enforce_short_max_hold = enforce->get<bool>();
    }
    auto days = j.find("short_max_hold_days");
    if (days != j.end() && !days->is_null()) {
      p.short_max_hold_days = days->get<double>();
    }

    if (j.contains("fee")) {
      p.fee_model = loadFeeModel(j.at("fee"));
    }
    if (j.contains("tax")) {
      p.tax_model = loadTaxModel(j.at("tax"));
    }
    if (j.contains("margin")) {
      p.margin_model = loadMarginModel(j.at("margin"));
    }
    return domain::InstrumentSpec(std::move(p));
  } catch (const json::exception& e) {
    throw std::invalid_argument(std::string("config: instruments: ") +
                                e.what());
  }
}

std::vector<domain::InstrumentSpec> loadInstrumentSpecs(const json& j) {
  if (!j.is_array()) {
    throw std::invalid_argument(
        "config: section 'instruments' must be a JSON array");
  }
  std::vector<domain::InstrumentSpec> out;
  out.reserve(j.size());
  for (const json& item : j) {
    out.push_back(loadInstrumentSpec(item));
  }
  return out;
}

// -----------------------------------------------------------------------------
// loadTraderParams
// -----------------------------------------------------------------------------
TraderParams loadTraderParams(const json& j) {
  TraderParams p;
  try {
    requireObject(j, "trader");
    readOptional(j, "spread_enter_pct", p.spread_enter_pct);
    readOptional(j, "spread_exit_pct", p.spread_exit_pct);
    readOptional(j, "use_atr_filter", p.use_atr_filter);
    readOptional(j, "atr_enter_k", p.atr_enter_k);
    readOptional(j, "atr_exit_k", p.atr_exit_k);
    readOptional(j, "confirm_days", p.confirm_days);
    readOptional(j, "min_hold_days", p.min_hold_days);
    readOptional(j, "cooldown_days", p.cooldown_days);
    readOptional(j, "use_long_trend_filter", p.use_long_trend_filter);
    readOptional(j, "use_short_trend_filter", p.use_short_trend_filter);
    readOptional(j, "long_daily_stop", p.long_daily_stop);
    readOptional(j, "long_trail_stop", p.long_trail_stop);
    readOptional(j, "short_daily_stop", p.short_daily_stop);
    readOptional(j, "short_trail_stop", p.short_trail_stop);
    readOptional(j, "enable_short", p.enable_short);
    readOptional(j, "use_macd_regime_filter", p.use_macd_regime_filter);
    readOptional(j, "use_macd_exit", p.use_macd_exit);
    readOptional(j, "use_macd_size_scaling", p.use_macd_size_scaling);
    readOptional(j, "macd_size_min", p.macd_size_min);
    readOptional(j, "macd_size_max", p.macd_size_max);
    readOptional(j, "macd_size_atr_k", p.macd_size_atr_k);
    readOptional(j, "use_prev_close_filter", p.use_prev_close_filter);
    readOptional(j, "log_curves", p.log_curves);
    readOptional(j, "log_trades", p.log_trades);
    readOptional(j, "log_stops", p.log_stops);

    std::string mode;
    readOptional(j, "macd_signal_mode", mode);
    if (!mode.empty()) {
      mode = lowered(mode);
      if (mode == "hist") {
        p.macd_signal_mode = MacdSignalMode::Hist;
      } else if (mode == "cross") {
        p.macd_signal_mode = MacdSignalMode::Cross;
      } else {
        throw std::invalid_argument("config: unknown macd_signal_mode '" +
                                    mode + "'");
      }
    }

    std::string ref;
    readOptional(j, "prev_close_filter_ref", ref);
    if (!ref.empty()) {
      ref = lowered(ref);
      if (ref == "fast") {
        p.prev_close_filter_ref = PrevCloseRef::Fast;
      } else if (ref == "week") {
        p.prev_close_filter_ref = PrevCloseRef::Week;
      } else {
        throw std::invalid_argument("config: unknown prev_close_filter_ref '" +
                                    ref + "'");
      }
    }
  } catch (const json::exception& e) {
    throw std::invalid_argument(std::string("config: trader: ") + e.what());
  }
  return p.normalized();
}

// -----------------------------------------------------------------------------
// loadBacktestConfig
// -----------------------------------------------------------------------------
BacktestConfig loadBacktestConfig(const json& j) {
  BacktestConfig c;
  try {
    requireObject(j, "backtest");
    c.start_date = readDate(j, "start_date", c.start_date);
    c.end_date = readDate(j, "end_date", c.end_date);
    readOptional(j, "initial_capital", c.initial_capital);
    readOptional(j, "trading_days", c.trading_days_per_year);
    readOptional(j, "use_dynamic_sizing", c.use_dynamic_sizing);
    readOptional(j, "rebalance_while_holding", c.rebalance_while_holding);
    readOptional(j, "use_entry_position_frac", c.use_entry_position_frac);
    readOptional(j, "reset_traders_each_run", c.reset_traders_each_run);
    readOptional(j, "downsize_max_iter", c.downsize_max_iter);
    readOptional(j, "downsize_factor", c.downsize_factor);
    readOptional(j, "trader_shadow_costs", c.trader_shadow_costs);
    readOptional(j, "verbose", c.verbose);

    std::string mode;
    readOptional(j, "valuation_mode", mode);
    if (!mode.empty()) {
      c.valuation_mode = parseValuationMode(mode);
    }
    std::string policy;
    readOptional(j, "entry_sizing_policy", policy);
    if (!policy.empty()) {
      c.entry_sizing_policy = parseEntrySizingPolicy(policy);
    }
  } catch (const json::exception& e) {
    throw std::invalid_argument(std::string("config: backtest: ") + e.what());
  }
  c.validate();
  return c;
}

// -----------------------------------------------------------------------------
// loadTesterOptions
// -----------------------------------------------------------------------------
AccountingTesterOptions loadTesterOptions(const json& j) {
  AccountingTesterOptions o;
  try {
    requireObject(j, "tester");
    readOptional(j, "equity_check_samples", o.equity_check_samples);
    readOptional(j, "rel_tol", o.rel_tol);
    readOptional(j, "abs_tol", o.abs_tol);
    readOptional(j, "fail_fast", o.fail_fast);
  } catch (const json::exception& e) {
    throw std::invalid_argument(std::string("config: tester: ") + e.what());
  }
  if (o.equity_check_samples < 0 || !(o.rel_tol >= 0.0) ||
      !(o.abs_tol >= 0.0)) {
    throw std::invalid_argument(
        "config: tester: samples and tolerances must be non-negative");
  }
  return o;
}

// -----------------------------------------------------------------------------
// loadRunConfiguration
// -----------------------------------------------------------------------------
RunConfiguration loadRunConfiguration(const json& j) {
  requireObject(j, "(root)");
  if (!j.contains("instruments")) {
    throw std::invalid_argument("config: missing section 'instruments'");
  }

  RunConfiguration out;
  out.instruments = loadInstrumentSpecs(j.at("instruments"));
  if (j.contains("trader")) {
    out.trader = loadTraderParams(j.at("trader"));
  }
  if (j.contains("backtest")) {
    out.backtest = loadBacktestConfig(j.at("backtest"));
  }
  if (j.contains("tester")) {
    out.tester = loadTesterOptions(j.at("tester"));
  }
  return out;
}

RunConfiguration loadRunConfigurationFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("config: cannot open " + path);
  }
  json doc;
  try {
    doc = json::parse(in);
  } catch (const json::exception& e) {
    throw std::invalid_argument("config: " + path + ": " + e.what());
  }
  return loadRunConfiguration(doc);
}

}  // namespace trendbook
