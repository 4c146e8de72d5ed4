#pragma once

#include "trendbook/config/backtest_config.hpp"
#include "trendbook/domain/instrument_spec.hpp"
#include "trendbook/strategy/trader_params.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace trendbook {

// -----------------------------------------------------------------------------
// RunConfiguration: everything one JSON config document describes
// -----------------------------------------------------------------------------
struct RunConfiguration {
  std::vector<domain::InstrumentSpec> instruments;
  TraderParams trader;
  BacktestConfig backtest;
  AccountingTesterOptions tester;
};

// -----------------------------------------------------------------------------
// Config loading
// -----------------------------------------------------------------------------
//
// @brief  Builds run settings from nlohmann::json documents.
//
// @details
// Every section is optional except "instruments" in loadRunConfiguration().
// Absent keys keep their defaults. Dates are "YYYY-MM-DD" strings.
//
// Instrument example:
//   {
//     "symbol": "005930", "asset_type": "KRX_EQUITY", "allow_short": true,
//     "fee": {"commission": 0.00015, "slippage": 0.0005},
//     "tax": {"kind": "krx_stt"},
//     "margin": {"long_rate": 0.0, "short_initial": 0.5}
//   }
// tax.kind is "none", "sell_side" (default_rate and by_year {"2024": r}),
// or "krx_stt" (the Korean securities transaction tax schedule).
//
// @throws std::invalid_argument  naming the section, on a JSON type error,
//                                a missing required key, or a value the
//                                target type rejects.
// -----------------------------------------------------------------------------
domain::InstrumentSpec loadInstrumentSpec(const nlohmann::json& json);
std::vector<domain::InstrumentSpec> loadInstrumentSpecs(
    const nlohmann::json& json);
TraderParams loadTraderParams(const nlohmann::json& json);
BacktestConfig loadBacktestConfig(const nlohmann::json& json);
AccountingTesterOptions loadTesterOptions(const nlohmann::json& json);

RunConfiguration loadRunConfiguration(const nlohmann::json& json);

// Parses `path` and forwards to loadRunConfiguration().
// @throws std::runtime_error  if the file cannot be opened.
RunConfiguration loadRunConfigurationFile(const std::string& path);

}  // namespace trendbook
