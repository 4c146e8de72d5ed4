// =============================================================================
// instrument_spec_test.cpp
// =============================================================================
// Unit tests for trendbook::domain::InstrumentSpec and ShortCoverRule.
//
// Validates:
//   - Construction rejects an empty symbol and NaN numerics
//   - Clamping of multiplier, sizing cap, and borrow rate
//   - KRX market default (90-day short deadline) and explicit overrides
//   - Non-positive deadline means "no deadline"
//   - Missing cost models fall back to zero-cost variants
//   - ShortCoverRule::due() including the next-date overshoot clause
// =============================================================================

#include "trendbook/cost/fee_models.hpp"
#include "trendbook/cost/margin_models.hpp"
#include "trendbook/domain/instrument_spec.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>

using trendbook::domain::InstrumentSpec;
using trendbook::domain::InstrumentSpecParams;
using trendbook::domain::ShortCoverRule;
using trendbook::domain::Side;
using trendbook::make_date;

class InstrumentSpecTestFixture : public ::testing::Test {
 protected:
  InstrumentSpecParams params() const {
    InstrumentSpecParams p;
    p.symbol = "AAA";
    return p;
  }
};

// -----------------------------------------------------------------------------
// 1. Defaults.
// -----------------------------------------------------------------------------
TEST_F(InstrumentSpecTestFixture, Defaults) {
  InstrumentSpec spec(params());

  EXPECT_EQ(spec.symbol(), "AAA");
  EXPECT_EQ(spec.name(), "AAA");
  EXPECT_DOUBLE_EQ(spec.multiplier(), 1.0);
  EXPECT_TRUE(spec.allowShort());
  EXPECT_DOUBLE_EQ(spec.maxNotionalFrac(), 1.0);
  EXPECT_DOUBLE_EQ(spec.borrowRateAnnual(), 0.04);
  EXPECT_FALSE(spec.enforceShortMaxHold());
  EXPECT_FALSE(spec.shortCoverRule().active());
  EXPECT_DOUBLE_EQ(spec.fee(1e6), 0.0);
  EXPECT_DOUBLE_EQ(spec.tax(make_date(2024, 1, 2), Side::Sell, 1e6), 0.0);
  EXPECT_DOUBLE_EQ(spec.margin(-10.0, 100.0), 0.0);
}

// -----------------------------------------------------------------------------
// 2. Invalid input.
// -----------------------------------------------------------------------------
TEST_F(InstrumentSpecTestFixture, RejectsEmptySymbolAndNaN) {
  InstrumentSpecParams p = params();
  p.symbol.clear();
  EXPECT_THROW(InstrumentSpec{p}, std::invalid_argument);

  p = params();
  p.multiplier = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(InstrumentSpec{p}, std::invalid_argument);

  p = params();
  p.borrow_rate_annual = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(InstrumentSpec{p}, std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 3. Clamping.
// -----------------------------------------------------------------------------
TEST_F(InstrumentSpecTestFixture, ClampsNumericFields) {
  InstrumentSpecParams p = params();
  p.multiplier = -5.0;
  p.max_notional_frac = -0.5;
  p.borrow_rate_annual = -0.01;
  InstrumentSpec spec(p);

  EXPECT_GT(spec.multiplier(), 0.0);
  EXPECT_DOUBLE_EQ(spec.maxNotionalFrac(), 0.0);
  EXPECT_DOUBLE_EQ(spec.borrowRateAnnual(), 0.0);
}

// -----------------------------------------------------------------------------
// 4. KRX default deadline and explicit overrides.
// -----------------------------------------------------------------------------
TEST_F(InstrumentSpecTestFixture, KrxDefaultAndOverrides) {
  InstrumentSpecParams p = params();
  p.asset_type = "KRX_EQUITY";
  InstrumentSpec krx(p);
  EXPECT_TRUE(krx.enforceShortMaxHold());
  EXPECT_DOUBLE_EQ(krx.shortMaxHoldDays(), 90.0);

  p.short_max_hold_days = 60.0;
  EXPECT_DOUBLE_EQ(InstrumentSpec(p).shortMaxHoldDays(), 60.0);

  p.enforce_short_max_hold = false;
  EXPECT_FALSE(InstrumentSpec(p).shortCoverRule().active());

  InstrumentSpecParams q = params();
  q.enforce_short_max_hold = true;
  q.short_max_hold_days = 0.0;
  InstrumentSpec no_deadline(q);
  EXPECT_TRUE(no_deadline.enforceShortMaxHold());
  EXPECT_TRUE(std::isinf(no_deadline.shortMaxHoldDays()));
  EXPECT_FALSE(no_deadline.shortCoverRule().active());
}

// -----------------------------------------------------------------------------
// 5. Cost delegation uses the instrument's multiplier.
// -----------------------------------------------------------------------------
TEST_F(InstrumentSpecTestFixture, DelegatesToCostModels) {
  InstrumentSpecParams p = params();
  p.multiplier = 10.0;
  p.fee_model = std::make_shared<trendbook::RateFeeModel>(0.001);
  p.margin_model = std::make_shared<trendbook::SimpleMarginModel>(0.0, 0.5);
  InstrumentSpec spec(p);

  EXPECT_DOUBLE_EQ(spec.fee(1000.0), 1.0);
  EXPECT_DOUBLE_EQ(spec.margin(-2.0, 100.0), 1000.0);
  EXPECT_DOUBLE_EQ(spec.margin(2.0, 100.0), 0.0);
}

// -----------------------------------------------------------------------------
// 6. ShortCoverRule: deadline reached, or the next date would overshoot it.
// -----------------------------------------------------------------------------
TEST(ShortCoverRuleTest, DueOnDeadlineOrOvershoot) {
  ShortCoverRule rule;
  rule.enforce = true;
  rule.max_days = 90.0;

  const auto entry = make_date(2024, 1, 2);
  EXPECT_FALSE(rule.due(entry, entry + 80, entry + 81));
  EXPECT_TRUE(rule.due(entry, entry + 90, entry + 91));
  EXPECT_TRUE(rule.due(entry, entry + 95, std::nullopt));

  // Friday at day 88, next trading day Monday at day 91.
  EXPECT_TRUE(rule.due(entry, entry + 88, entry + 91));
  EXPECT_FALSE(rule.due(entry, entry + 88, entry + 90));
  EXPECT_FALSE(rule.due(entry, entry + 88, std::nullopt));

  rule.enforce = false;
  EXPECT_FALSE(rule.due(entry, entry + 500, entry + 501));
}

// -----------------------------------------------------------------------------
// 7. withTraderId copies everything else.
// -----------------------------------------------------------------------------
TEST_F(InstrumentSpecTestFixture, WithTraderId) {
  InstrumentSpecParams p = params();
  p.multiplier = 5.0;
  InstrumentSpec spec(p);
  InstrumentSpec named = spec.withTraderId("TR07");

  EXPECT_EQ(named.traderId(), "TR07");
  EXPECT_EQ(spec.traderId(), "");
  EXPECT_DOUBLE_EQ(named.multiplier(), 5.0);
  EXPECT_EQ(named.symbol(), "AAA");
}
