// =============================================================================
// signal_trader_test.cpp
// =============================================================================
// Unit tests for trendbook::SignalTrader.
//
// Validates:
//   - step() is a no-op without two bars of history or tomorrow's open
//   - Long entry at the open, open-to-open shadow equity, signal exit
//   - Daily stop exit with a stop-log row and early end of the bar
//   - enable_short gates short entries
//   - Forced cover on the short deadline
//   - min_hold_days delays signal exits; cooldown delays re-entry
//   - Shadow cost rates charge entry, exit, and daily borrow
//   - reconcile() adopts the ledger's sign and re-anchors entry bookkeeping
//   - External accounting: only ledger-confirmed fills are logged
//   - Trailing stops on both sides and the short daily stop
//   - MACD regime filter (histogram and cross modes) and MACD exits
//   - MACD strength sizing of the entry fraction
//   - Previous-close entry and exit filters against the fast or week average
//   - Separation in raw percent, and the ATR-less fallback to it
//   - Long and short long-term trend filters
// =============================================================================

#include "test_bars.hpp"

#include "trendbook/strategy/signal_trader.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>
#include <limits>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

using trendbook::SignalTrader;
using trendbook::TraderParams;
using trendbook_test::Regime;
using trendbook_test::day;
using trendbook_test::makeBar;
using trendbook_test::makeFeed;
using trendbook_test::regimes;

namespace {

// Fixed rates so shadow-equity arithmetic is easy to check by hand.
class FixedShadowCosts final : public trendbook::IShadowCostModel {
 public:
  double entryCostRate(int, trendbook::Date) const override { return 0.01; }
  double exitCostRate(int, trendbook::Date) const override { return 0.02; }
  double shortBorrowDaily() const override { return 0.001; }
};

void runAll(SignalTrader& trader) {
  for (std::size_t t = 0; t < trader.feed().size(); ++t) {
    trader.step(t);
  }
}

// Flat 100 feed of Long bars; bar `stop_bar` trades down to `low`.
std::shared_ptr<trendbook::VectorBarFeed> longFeedWithDip(std::size_t n,
                                                          std::size_t stop_bar,
                                                          double low) {
  std::vector<trendbook::domain::Bar> bars;
  for (std::size_t i = 0; i < n; ++i) {
    bars.push_back(
        makeBar(day(static_cast<int>(i)), 100.0, 100.0, Regime::Long));
  }
  bars[stop_bar].low = low;
  return std::make_shared<trendbook::VectorBarFeed>("AAA", std::move(bars));
}

// `n` bars of one regime at a fixed open and close.
std::vector<trendbook::domain::Bar> flatBars(std::size_t n, Regime regime,
                                             double open = 100.0,
                                             double close = 100.0) {
  std::vector<trendbook::domain::Bar> bars;
  for (std::size_t i = 0; i < n; ++i) {
    bars.push_back(makeBar(day(static_cast<int>(i)), open, close, regime));
  }
  return bars;
}

std::shared_ptr<trendbook::VectorBarFeed> feedOf(
    std::vector<trendbook::domain::Bar> bars) {
  return std::make_shared<trendbook::VectorBarFeed>("AAA", std::move(bars));
}

void setMacd(std::vector<trendbook::domain::Bar>& bars, double line,
             double signal, double hist) {
  for (auto& bar : bars) {
    bar.indicators.macd_line = line;
    bar.indicators.macd_signal = signal;
    bar.indicators.macd_hist = hist;
  }
}

}  // namespace

class SignalTraderTestFixture : public ::testing::Test {
 protected:
  std::unique_ptr<SignalTrader> makeTrader(
      std::shared_ptr<const trendbook::IBarFeed> feed,
      TraderParams params = {},
      std::shared_ptr<const trendbook::IShadowCostModel> costs = nullptr) {
    return std::make_unique<SignalTrader>("TR01", std::move(feed), params,
                                          std::move(costs));
  }
};

// -----------------------------------------------------------------------------
// 1. Null feed throws; out-of-range steps do nothing.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, ConstructionAndNoOpBounds) {
  EXPECT_THROW(SignalTrader("TR01", nullptr, TraderParams{}),
               std::invalid_argument);

  auto trader = makeTrader(makeFeed("AAA", regimes(4, Regime::Long)));
  trader->step(0);
  trader->step(1);
  trader->step(3);  // Last bar: no tomorrow open
  trader->step(99);

  EXPECT_EQ(trader->position(), 0);
  EXPECT_TRUE(trader->curve().empty());
  EXPECT_TRUE(trader->tradeLog().empty());
}

// -----------------------------------------------------------------------------
// 2. Long entry at bar 2, open-to-open equity, exit on missing indicators.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, LongEntryCompoundsAndExitsOnSignal) {
  auto trader = makeTrader(makeFeed(
      "AAA", regimes(5, Regime::Long, 3), 100.0,
      {100.0, 100.0, 100.0, 110.0, 110.0, 110.0, 110.0, 110.0}));

  trader->step(2);
  EXPECT_EQ(trader->position(), 1);
  EXPECT_EQ(trader->desiredPosition(), 1);
  EXPECT_EQ(*trader->entryDate(), day(2));
  EXPECT_DOUBLE_EQ(*trader->entryPrice(), 100.0);
  EXPECT_NEAR(trader->equity(), 1.1, 1e-12);

  for (std::size_t t = 3; t < 8; ++t) {
    trader->step(t);
  }

  EXPECT_EQ(trader->position(), 0);
  EXPECT_NEAR(trader->equity(), 1.1, 1e-12);
  const auto& log = trader->tradeLog();
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[0].action, "ENTER");
  EXPECT_EQ(log[0].reason, "SignalEntry");
  EXPECT_EQ(log[1].action, "EXIT");
  EXPECT_EQ(log[1].reason, "SignalExit");
  EXPECT_EQ(log[1].time, day(6));
  EXPECT_DOUBLE_EQ(log[1].price, 110.0);
  EXPECT_EQ(trader->curve().size(), 5u);
}

// -----------------------------------------------------------------------------
// 3. Daily long stop: exit at open * (1 - 5%), stop logged, no same-bar
//    re-entry.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, LongDailyStop) {
  auto trader = makeTrader(longFeedWithDip(8, 3, 90.0));

  trader->step(2);
  trader->step(3);

  EXPECT_EQ(trader->position(), 0);
  ASSERT_EQ(trader->stopLog().size(), 1u);
  const auto& stop = trader->stopLog().front();
  EXPECT_EQ(stop.time, day(3));
  EXPECT_EQ(stop.stop_type, "LongDaily");
  EXPECT_DOUBLE_EQ(stop.stop_price, 95.0);
  EXPECT_DOUBLE_EQ(stop.open_price, 100.0);

  const auto& log = trader->tradeLog();
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[1].reason, "STOP:LongDaily");
  EXPECT_DOUBLE_EQ(log[1].price, 95.0);
  EXPECT_EQ(trader->summary().stop_count, 1u);
}

// -----------------------------------------------------------------------------
// 4. Cooldown after an exit blocks entries through t_exit + cooldown_days.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, CooldownDelaysReentry) {
  auto no_cooldown = makeTrader(longFeedWithDip(10, 3, 90.0));
  runAll(*no_cooldown);
  ASSERT_GE(no_cooldown->tradeLog().size(), 3u);
  EXPECT_EQ(no_cooldown->tradeLog()[2].time, day(4));

  TraderParams params;
  params.cooldown_days = 2;
  auto cooled = makeTrader(longFeedWithDip(10, 3, 90.0), params);
  runAll(*cooled);
  ASSERT_GE(cooled->tradeLog().size(), 3u);
  EXPECT_EQ(cooled->tradeLog()[2].action, "ENTER");
  EXPECT_EQ(cooled->tradeLog()[2].time, day(6));
}

// -----------------------------------------------------------------------------
// 5. Short entries only when enabled.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, EnableShortGatesShortEntries) {
  auto shorting = makeTrader(makeFeed("AAA", regimes(6, Regime::Short)));
  shorting->step(2);
  EXPECT_EQ(shorting->position(), -1);

  TraderParams params;
  params.enable_short = false;
  auto long_only = makeTrader(makeFeed("AAA", regimes(6, Regime::Short)),
                              params);
  runAll(*long_only);
  EXPECT_EQ(long_only->position(), 0);
  EXPECT_TRUE(long_only->tradeLog().empty());
}

// -----------------------------------------------------------------------------
// 6. Short deadline of 3 days: entered day 2, covered day 5 at the open.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, ForcedCoverOnShortDeadline) {
  TraderParams params;
  params.short_cover.enforce = true;
  params.short_cover.max_days = 3.0;
  auto trader = makeTrader(makeFeed("AAA", regimes(10, Regime::Short)), params);

  for (std::size_t t = 2; t <= 5; ++t) {
    trader->step(t);
  }

  EXPECT_EQ(trader->position(), 0);
  const auto& log = trader->tradeLog();
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[1].time, day(5));
  EXPECT_EQ(log[1].reason, "FORCED_COVER_MAXHOLD");
  EXPECT_EQ(log[1].position_before, -1);

  // The regime still says short; the trader re-enters on the next bar.
  trader->step(6);
  EXPECT_EQ(trader->position(), -1);
}

// -----------------------------------------------------------------------------
// 7. min_hold_days: a fading stack exits only after three bars held.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, MinHoldDelaysSignalExit) {
  auto trader = makeTrader(makeFeed(
      "AAA", {Regime::Long, Regime::Long, Regime::Fade, Regime::Fade,
              Regime::Fade, Regime::Fade, Regime::Fade, Regime::Fade}));

  runAll(*trader);

  const auto& log = trader->tradeLog();
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[0].time, day(2));
  EXPECT_EQ(log[1].time, day(5));
  EXPECT_EQ(log[1].reason, "SignalExit");
  EXPECT_EQ(trader->position(), 0);
}

// -----------------------------------------------------------------------------
// 8. Shadow costs: entry 1%, exit 2%, borrow 0.1% per bar while short.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, ShadowCostsOnShortRoundTrip) {
  auto trader = makeTrader(makeFeed("AAA", regimes(5, Regime::Short, 3)),
                           TraderParams{},
                           std::make_shared<FixedShadowCosts>());

  runAll(*trader);

  // Entry on bar 2, borrow on bars 3..6, exit on bar 6.
  const double expected = 0.99 * std::pow(0.999, 4) * 0.98;
  EXPECT_NEAR(trader->equity(), expected, 1e-12);
  EXPECT_EQ(trader->position(), 0);
}

// -----------------------------------------------------------------------------
// 9. reconcile(): flat clears entry; an unintended sign re-anchors at bar t.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, ReconcileAdoptsExecutedSign) {
  auto trader = makeTrader(makeFeed(
      "AAA", regimes(8, Regime::None), 100.0,
      {100.0, 101.0, 102.0, 103.0, 104.0, 105.0, 106.0, 107.0}));

  trader->step(2);
  trader->reconcile(-1, 3);
  EXPECT_EQ(trader->position(), -1);
  EXPECT_EQ(trader->desiredPosition(), -1);
  EXPECT_EQ(*trader->entryDate(), day(3));
  EXPECT_EQ(*trader->entryIndex(), 3u);
  EXPECT_DOUBLE_EQ(*trader->entryPrice(), 103.0);

  trader->reconcile(0, 4);
  EXPECT_EQ(trader->position(), 0);
  EXPECT_EQ(trader->desiredPosition(), 0);
  EXPECT_FALSE(trader->entryDate().has_value());
  EXPECT_DOUBLE_EQ(trader->positionFraction(), 1.0);
}

// -----------------------------------------------------------------------------
// 10. A refused entry: reconcile(0) after the trader went long.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, ReconcileUndoesRefusedEntry) {
  auto trader = makeTrader(makeFeed("AAA", regimes(8, Regime::Long)));

  trader->step(2);
  ASSERT_EQ(trader->position(), 1);
  trader->reconcile(0, 2);

  EXPECT_EQ(trader->position(), 0);
  EXPECT_FALSE(trader->entryIndex().has_value());

  // The stack is still long, so the next bar asks again.
  trader->step(3);
  EXPECT_EQ(trader->desiredPosition(), 1);
}

// -----------------------------------------------------------------------------
// 11. External accounting: decisions are silent, fills are logged.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, ExternalAccountingLogsFillsOnly) {
  auto trader = makeTrader(makeFeed("AAA", regimes(8, Regime::Long)));
  trader->enableExternalAccounting(true);

  trader->step(2);
  EXPECT_TRUE(trader->tradeLog().empty());

  trader->onPortfolioFill(day(2), "ENTER", 100.0, 0, 1, "FILL");
  const auto& log = trader->tradeLog();
  ASSERT_EQ(log.size(), 1u);
  EXPECT_EQ(log[0].action, "ENTER");
  EXPECT_EQ(log[0].reason, "FILL");
  EXPECT_EQ(log[0].position_after, 1);
}

// -----------------------------------------------------------------------------
// 12. Curve samples respect the logging window; resetForRun clears state.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, LoggingWindowAndReset) {
  auto trader = makeTrader(makeFeed("AAA", regimes(8, Regime::Long)));
  trader->setLoggingWindow(day(3), day(4));

  runAll(*trader);
  ASSERT_EQ(trader->curve().size(), 2u);
  EXPECT_EQ(trader->curve().front().time, day(3));
  EXPECT_EQ(trader->curve().back().time, day(4));

  trader->resetForRun(2.0);
  EXPECT_DOUBLE_EQ(trader->equity(), 2.0);
  EXPECT_EQ(trader->position(), 0);
  EXPECT_TRUE(trader->curve().empty());
  EXPECT_TRUE(trader->tradeLog().empty());
}

// -----------------------------------------------------------------------------
// 13. normalized() clamps out-of-range hyperparameters.
// -----------------------------------------------------------------------------
TEST(TraderParamsTest, NormalizedClampsValues) {
  TraderParams raw;
  raw.confirm_days = 0;
  raw.min_hold_days = -4;
  raw.long_daily_stop = -0.2;
  raw.macd_size_min = 0.9;
  raw.macd_size_max = 0.3;
  raw.macd_size_atr_k = 0.0;

  const TraderParams p = raw.normalized();
  EXPECT_EQ(p.confirm_days, 1);
  EXPECT_EQ(p.min_hold_days, 0);
  EXPECT_DOUBLE_EQ(p.long_daily_stop, 0.0);
  EXPECT_DOUBLE_EQ(p.macd_size_min, 0.3);
  EXPECT_DOUBLE_EQ(p.macd_size_max, 0.9);
  EXPECT_DOUBLE_EQ(p.macd_size_atr_k, 0.5);
}

// -----------------------------------------------------------------------------
// 14. Long trailing stop: peak 120, open 112, low 107 crosses 120 * 0.9
//     while the daily stop (112 * 0.95) is looser.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, LongTrailingStop) {
  const std::vector<double> opens{100.0, 100.0, 100.0, 110.0, 120.0,
                                  112.0, 112.0, 112.0, 112.0};
  std::vector<trendbook::domain::Bar> bars;
  for (std::size_t i = 0; i < opens.size(); ++i) {
    bars.push_back(makeBar(day(static_cast<int>(i)), opens[i], opens[i],
                           Regime::Long));
  }
  bars[5].low = 107.0;
  auto trader = makeTrader(feedOf(std::move(bars)));

  for (std::size_t t = 2; t <= 5; ++t) {
    trader->step(t);
  }

  EXPECT_EQ(trader->position(), 0);
  ASSERT_EQ(trader->stopLog().size(), 1u);
  const auto& stop = trader->stopLog().front();
  EXPECT_EQ(stop.time, day(5));
  EXPECT_EQ(stop.stop_type, "LongTrail");
  EXPECT_NEAR(stop.stop_price, 108.0, 1e-9);
  EXPECT_DOUBLE_EQ(stop.hist_ref, 120.0);
  EXPECT_DOUBLE_EQ(stop.open_price, 112.0);
  ASSERT_EQ(trader->tradeLog().size(), 2u);
  EXPECT_EQ(trader->tradeLog()[1].reason, "STOP:LongTrail");
}

// -----------------------------------------------------------------------------
// 15. Short stops: daily at open * 1.03, trailing at trough * 1.10 once the
//     trough is far enough below the open.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, ShortDailyAndTrailingStops) {
  auto daily_bars = flatBars(8, Regime::Short);
  daily_bars[3].high = 103.5;
  auto daily = makeTrader(feedOf(std::move(daily_bars)));
  daily->step(2);
  ASSERT_EQ(daily->position(), -1);
  daily->step(3);

  EXPECT_EQ(daily->position(), 0);
  ASSERT_EQ(daily->stopLog().size(), 1u);
  EXPECT_EQ(daily->stopLog().front().stop_type, "ShortDaily");
  ASSERT_EQ(daily->tradeLog().size(), 2u);
  EXPECT_NEAR(daily->stopLog().front().stop_price, 103.0, 1e-9);
  EXPECT_EQ(daily->tradeLog()[1].reason, "STOP:ShortDaily");

  const std::vector<double> opens{100.0, 100.0, 100.0, 90.0,
                                  98.0,  98.0,  98.0,  98.0};
  std::vector<trendbook::domain::Bar> trail_bars;
  for (std::size_t i = 0; i < opens.size(); ++i) {
    trail_bars.push_back(makeBar(day(static_cast<int>(i)), opens[i], opens[i],
                                 Regime::Short));
  }
  trail_bars[4].high = 99.5;
  auto trail = makeTrader(feedOf(std::move(trail_bars)));
  for (std::size_t t = 2; t <= 4; ++t) {
    trail->step(t);
  }

  EXPECT_EQ(trail->position(), 0);
  ASSERT_EQ(trail->stopLog().size(), 1u);
  const auto& stop = trail->stopLog().front();
  EXPECT_EQ(stop.time, day(4));
  EXPECT_EQ(stop.stop_type, "ShortTrail");
  EXPECT_NEAR(stop.stop_price, 99.0, 1e-9);
  EXPECT_DOUBLE_EQ(stop.hist_ref, 90.0);
}

// -----------------------------------------------------------------------------
// 16. MACD regime filter: entries need a bullish previous bar, read from the
//     histogram or from line vs signal.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, MacdRegimeFilterGatesEntries) {
  TraderParams params;
  params.use_macd_regime_filter = true;

  auto no_macd = makeTrader(makeFeed("AAA", regimes(6, Regime::Long)), params);
  runAll(*no_macd);
  EXPECT_TRUE(no_macd->tradeLog().empty());

  auto bull_bars = flatBars(6, Regime::Long);
  setMacd(bull_bars, 1.0, 0.5, 0.5);
  auto bull = makeTrader(feedOf(std::move(bull_bars)), params);
  bull->step(2);
  EXPECT_EQ(bull->position(), 1);

  params.macd_signal_mode = trendbook::MacdSignalMode::Cross;
  auto bear_bars = flatBars(6, Regime::Long);
  setMacd(bear_bars, 1.0, 2.0, 0.5);  // Histogram says bull, cross says bear
  auto crossed_down = makeTrader(feedOf(std::move(bear_bars)), params);
  runAll(*crossed_down);
  EXPECT_TRUE(crossed_down->tradeLog().empty());

  auto up_bars = flatBars(6, Regime::Long);
  setMacd(up_bars, 2.0, 1.0, -0.5);
  auto crossed_up = makeTrader(feedOf(std::move(up_bars)), params);
  crossed_up->step(2);
  EXPECT_EQ(crossed_up->position(), 1);
}

// -----------------------------------------------------------------------------
// 17. use_macd_exit: a bearish histogram closes a long once min_hold allows.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, MacdExitClosesLong) {
  auto makeBars = [] {
    auto bars = flatBars(9, Regime::Long);
    for (std::size_t i = 0; i < bars.size(); ++i) {
      bars[i].indicators.macd_hist = (i < 4) ? 0.5 : -0.5;
    }
    return bars;
  };

  auto holding = makeTrader(feedOf(makeBars()));
  runAll(*holding);
  EXPECT_EQ(holding->position(), 1);
  EXPECT_EQ(holding->tradeLog().size(), 1u);

  TraderParams params;
  params.use_macd_exit = true;
  auto trader = makeTrader(feedOf(makeBars()), params);
  runAll(*trader);

  const auto& log = trader->tradeLog();
  ASSERT_GE(log.size(), 2u);
  EXPECT_EQ(log[0].time, day(2));
  EXPECT_EQ(log[1].action, "EXIT");
  EXPECT_EQ(log[1].time, day(5));
  EXPECT_EQ(log[1].reason, "SignalExit");
}

// -----------------------------------------------------------------------------
// 18. MACD strength sizing: fraction = min + x * (max - min),
//     x = min(1, |hist| / ATR / k), with |line| or |signal| standing in for
//     a missing ATR.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, MacdStrengthScalesEntryFraction) {
  TraderParams params;
  params.use_macd_size_scaling = true;

  auto entryFraction = [this](std::vector<trendbook::domain::Bar> bars,
                              const TraderParams& p) {
    auto trader = makeTrader(feedOf(std::move(bars)), p,
                             std::make_shared<FixedShadowCosts>());
    trader->step(2);
    EXPECT_EQ(trader->position(), 1);
    return trader->positionFraction();
  };

  // |hist| / ATR = 0.2, x = 0.4, 0.25 + 0.4 * 0.75.
  auto weak = flatBars(6, Regime::Long);
  setMacd(weak, 0.6, 0.4, 0.2);
  auto trader = makeTrader(feedOf(weak), params,
                           std::make_shared<FixedShadowCosts>());
  trader->step(2);
  EXPECT_NEAR(trader->positionFraction(), 0.55, 1e-12);
  EXPECT_NEAR(trader->tradeLog()[0].position_fraction, 0.55, 1e-12);
  EXPECT_NEAR(trader->equity(), 1.0 - 0.01 * 0.55, 1e-12);

  auto strong = flatBars(6, Regime::Long);
  setMacd(strong, 3.0, 1.0, 2.0);
  EXPECT_DOUBLE_EQ(entryFraction(strong, params), 1.0);

  // No ATR: strength = |hist| / max(|line|, |signal|) = 0.25, x = 0.5.
  auto no_atr = flatBars(6, Regime::Long);
  setMacd(no_atr, 0.4, 0.3, 0.1);
  for (auto& bar : no_atr) {
    bar.indicators.atr = std::numeric_limits<double>::quiet_NaN();
  }
  EXPECT_NEAR(entryFraction(no_atr, params), 0.625, 1e-12);

  EXPECT_DOUBLE_EQ(entryFraction(flatBars(6, Regime::Long), params), 1.0);
  EXPECT_DOUBLE_EQ(entryFraction(weak, TraderParams{}), 1.0);
}

// -----------------------------------------------------------------------------
// 19. Previous-close filter: closes of 102.5 sit above the fast average (102)
//     but below the week average (103); 97.5 mirrors that for shorts.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, PrevCloseFilterGatesEntries) {
  TraderParams fast_ref;
  fast_ref.use_prev_close_filter = true;
  fast_ref.prev_close_filter_ref = trendbook::PrevCloseRef::Fast;
  TraderParams week_ref = fast_ref;
  week_ref.prev_close_filter_ref = trendbook::PrevCloseRef::Week;

  auto long_fast =
      makeTrader(feedOf(flatBars(6, Regime::Long, 100.0, 102.5)), fast_ref);
  long_fast->step(2);
  EXPECT_EQ(long_fast->position(), 1);

  auto long_week =
      makeTrader(feedOf(flatBars(6, Regime::Long, 100.0, 102.5)), week_ref);
  runAll(*long_week);
  EXPECT_TRUE(long_week->tradeLog().empty());

  auto short_fast =
      makeTrader(feedOf(flatBars(6, Regime::Short, 100.0, 97.5)), fast_ref);
  short_fast->step(2);
  EXPECT_EQ(short_fast->position(), -1);

  auto short_week =
      makeTrader(feedOf(flatBars(6, Regime::Short, 100.0, 97.5)), week_ref);
  runAll(*short_week);
  EXPECT_TRUE(short_week->tradeLog().empty());
}

// -----------------------------------------------------------------------------
// 20. Previous-close exit: a close below the fast average closes the long on
//     the next bar once min_hold allows, and blocks re-entry.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, PrevCloseFilterExitsLong) {
  auto bars = flatBars(10, Regime::Long, 100.0, 102.5);
  for (std::size_t i = 5; i < bars.size(); ++i) {
    bars[i] = makeBar(day(static_cast<int>(i)), 100.0, 101.0, Regime::Long);
  }
  TraderParams params;
  params.use_prev_close_filter = true;
  auto trader = makeTrader(feedOf(std::move(bars)), params);

  runAll(*trader);

  const auto& log = trader->tradeLog();
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[0].time, day(2));
  EXPECT_EQ(log[1].time, day(6));
  EXPECT_EQ(log[1].reason, "SignalExit");
  EXPECT_EQ(trader->position(), 0);
}

// -----------------------------------------------------------------------------
// 21. Separation in raw percent of the fast average: 1 / 102 ~ 0.98%.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, PercentSeparationThresholds) {
  TraderParams wide;
  wide.use_atr_filter = false;
  wide.spread_enter_pct = 0.02;
  auto blocked = makeTrader(makeFeed("AAA", regimes(8, Regime::Long)), wide);
  runAll(*blocked);
  EXPECT_TRUE(blocked->tradeLog().empty());

  TraderParams narrow;
  narrow.use_atr_filter = false;
  narrow.spread_enter_pct = 0.005;
  narrow.spread_exit_pct = 0.01;
  auto trader = makeTrader(makeFeed("AAA", regimes(8, Regime::Long)), narrow);
  runAll(*trader);
  const auto& log = trader->tradeLog();
  ASSERT_GE(log.size(), 2u);
  EXPECT_EQ(log[0].time, day(2));
  EXPECT_EQ(log[1].time, day(5));  // Separation already under the exit band
  EXPECT_EQ(log[1].reason, "SignalExit");

  // ATR filter on but no ATR: the percent thresholds apply.
  TraderParams atr_wide = wide;
  atr_wide.use_atr_filter = true;
  auto with_atr =
      makeTrader(makeFeed("AAA", regimes(8, Regime::Long)), atr_wide);
  with_atr->step(2);
  EXPECT_EQ(with_atr->position(), 1);

  auto no_atr_bars = flatBars(8, Regime::Long);
  for (auto& bar : no_atr_bars) {
    bar.indicators.atr = std::numeric_limits<double>::quiet_NaN();
  }
  auto no_atr = makeTrader(feedOf(std::move(no_atr_bars)), atr_wide);
  runAll(*no_atr);
  EXPECT_TRUE(no_atr->tradeLog().empty());
}

// -----------------------------------------------------------------------------
// 22. Long-term trend filters: long entries need trend +1 unless disabled;
//     short entries need trend -1 only when enabled.
// -----------------------------------------------------------------------------
TEST_F(SignalTraderTestFixture, LongTermTrendFilters) {
  auto trendless = [](Regime regime) {
    auto bars = flatBars(6, regime);
    for (auto& bar : bars) {
      bar.indicators.long_term_trend = 0;
    }
    return bars;
  };

  auto long_filtered = makeTrader(feedOf(trendless(Regime::Long)));
  runAll(*long_filtered);
  EXPECT_TRUE(long_filtered->tradeLog().empty());

  TraderParams no_long_filter;
  no_long_filter.use_long_trend_filter = false;
  auto long_free =
      makeTrader(feedOf(trendless(Regime::Long)), no_long_filter);
  long_free->step(2);
  EXPECT_EQ(long_free->position(), 1);

  auto short_free = makeTrader(feedOf(trendless(Regime::Short)));
  short_free->step(2);
  EXPECT_EQ(short_free->position(), -1);

  TraderParams short_filter;
  short_filter.use_short_trend_filter = true;
  auto short_filtered =
      makeTrader(feedOf(trendless(Regime::Short)), short_filter);
  runAll(*short_filtered);
  EXPECT_TRUE(short_filtered->tradeLog().empty());

  auto short_trending = makeTrader(
      makeFeed("AAA", regimes(6, Regime::Short)), short_filter);
  short_trending->step(2);
  EXPECT_EQ(short_trending->position(), -1);
}
