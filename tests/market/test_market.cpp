#include <gtest/gtest.h>
#include "flash/market.hpp"
#include "flash/constants.hpp"
#include "flash/crypto.hpp"

#include <cmath>
#include <limits>
#include <span>
#include <string>
#include <utility>
#include <vector>

using namespace flash;
using namespace flash::market;
using namespace flash::constants;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static MarketSpec yes_no(double seconds = 30.0) {
    return MarketSpec{
        .title       = "M1",
        .category    = "test",
        .time_left_s = seconds,
        .outcomes    = {"Yes", "No"},
    };
}

static Market open_market(double seconds = 30.0, TimestampMs now = 1'000) {
    auto m = Market::create(7, yes_no(seconds), now);
    EXPECT_TRUE(m.has_value());
    return std::move(m).value();
}

static crypto::Digest some_digest() {
    crypto::Digest d{};
    d.fill(0xAB);
    return d;
}

// ─── leverage_ceiling_for ────────────────────────────────────────────────────

TEST(Market_Ceiling, DurationTiers) {
    EXPECT_EQ(leverage_ceiling_for(1.0), 500.0);
    EXPECT_EQ(leverage_ceiling_for(60.0), 500.0);
    EXPECT_EQ(leverage_ceiling_for(60.5), 250.0);
    EXPECT_EQ(leverage_ceiling_for(600.0), 250.0);
    EXPECT_EQ(leverage_ceiling_for(1'800.0), 150.0);
    EXPECT_EQ(leverage_ceiling_for(3'600.0), 100.0);
    EXPECT_EQ(leverage_ceiling_for(3'601.0), 75.0);
    EXPECT_EQ(leverage_ceiling_for(FLASH_HORIZON_S), 75.0);
}

TEST(Market_Ceiling, TighterWindowNeverLower) {
    double prev = leverage_ceiling_for(FLASH_HORIZON_S);
    for (double s = FLASH_HORIZON_S; s >= 0.0; s -= 30.0) {
        const double c = leverage_ceiling_for(s);
        EXPECT_GE(c, prev);
        prev = c;
    }
}

// ─── create ──────────────────────────────────────────────────────────────────

TEST(Market_Create, UniformInitialPrices) {
    auto m = Market::create(1, MarketSpec{
        .title       = "Next goal",
        .time_left_s = 120.0,
        .outcomes    = {"Home", "Away", "None", "Own goal"},
    }, 0);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->status(), MarketStatus::Open);
    EXPECT_EQ(m->outcome_count(), 4u);
    for (const auto& o : m->outcomes()) {
        EXPECT_DOUBLE_EQ(o.probability, 0.25);
        EXPECT_DOUBLE_EQ(o.odds, 4.0);
        EXPECT_EQ(o.backers, 0u);
    }
    EXPECT_NEAR(m->probabilities().sum(), 1.0, PROBABILITY_EPSILON);
    EXPECT_EQ(m->leverage_ceiling(), 250.0);
}

TEST(Market_Create, TauFollowsTimeLeft) {
    const Market m = open_market(30.0);
    EXPECT_NEAR(m.tau().value, 5e-5, 1e-15);
}

TEST(Market_Create, OutcomeLiquiditySplitsBook) {
    const Market m = open_market();
    EXPECT_DOUBLE_EQ(m.liquidity(), DEFAULT_LIQUIDITY);
    EXPECT_DOUBLE_EQ(m.outcome_liquidity(), DEFAULT_LIQUIDITY / 2.0);
}

TEST(Market_Create, AllocatingOperationsMayThrow) {
    // These build containers and error text; bad_alloc must reach the caller.
    EXPECT_FALSE(noexcept(Market::create(1, std::declval<MarketSpec>(), 0)));
    EXPECT_FALSE(noexcept(std::declval<Market&>().record_fill(0, 1.0)));
    EXPECT_FALSE(noexcept(std::declval<Market&>().apply_probabilities(
        std::declval<std::span<const double>>())));
    EXPECT_TRUE(noexcept(std::declval<const Market&>().tau()));
}

TEST(Market_Create, RejectsEmptyTitle) {
    auto spec  = yes_no();
    spec.title = "";
    EXPECT_EQ(Market::create(1, spec, 0).code(), ErrorCode::InvalidMarketSpec);
}

TEST(Market_Create, RejectsNonFlashWindow) {
    for (double s : {0.0, -1.0, FLASH_HORIZON_S + 1.0,
                     std::numeric_limits<double>::infinity(),
                     std::numeric_limits<double>::quiet_NaN()}) {
        EXPECT_EQ(Market::create(1, yes_no(s), 0).code(), ErrorCode::InvalidMarketSpec)
            << "time_left=" << s;
    }
}

TEST(Market_Create, RejectsOutcomeCount) {
    auto one = yes_no();
    one.outcomes = {"Only"};
    EXPECT_EQ(Market::create(1, one, 0).code(), ErrorCode::InvalidMarketSpec);

    auto eleven = yes_no();
    eleven.outcomes.clear();
    for (int i = 0; i < 11; ++i) eleven.outcomes.push_back("o" + std::to_string(i));
    EXPECT_EQ(Market::create(1, eleven, 0).code(), ErrorCode::InvalidMarketSpec);
}

TEST(Market_Create, RejectsDuplicateOrEmptyOutcome) {
    auto dup = yes_no();
    dup.outcomes = {"Yes", "Yes"};
    EXPECT_EQ(Market::create(1, dup, 0).code(), ErrorCode::InvalidMarketSpec);

    auto empty = yes_no();
    empty.outcomes = {"Yes", ""};
    EXPECT_EQ(Market::create(1, empty, 0).code(), ErrorCode::InvalidMarketSpec);
}

TEST(Market_Create, RejectsNegativeLiquidity) {
    auto spec = yes_no();
    spec.liquidity = -5.0;
    EXPECT_EQ(Market::create(1, spec, 0).code(), ErrorCode::InvalidMarketSpec);
}

// ─── Time ────────────────────────────────────────────────────────────────────

TEST(Market_Time, SyncClockCountsDown) {
    Market m = open_market(30.0, 1'000);
    EXPECT_FALSE(m.sync_clock(11'000));
    EXPECT_NEAR(m.time_left(), 20.0, 1e-12);
    EXPECT_EQ(m.status(), MarketStatus::Open);
}

TEST(Market_Time, SyncClockExpires) {
    Market m = open_market(30.0, 1'000);
    EXPECT_TRUE(m.sync_clock(40'000));
    EXPECT_EQ(m.time_left(), 0.0);
    EXPECT_EQ(m.status(), MarketStatus::Resolving);
    // Stamped when the 30 s ran out, not when the clock was next read.
    ASSERT_TRUE(m.resolving_at().has_value());
    EXPECT_EQ(*m.resolving_at(), 31'000);
    EXPECT_FALSE(m.accepts_trades());
}

TEST(Market_Time, SyncClockExpiryAfterPartialCountdown) {
    Market m = open_market(30.0, 1'000);
    EXPECT_FALSE(m.sync_clock(21'000));
    EXPECT_TRUE(m.sync_clock(100'000));
    EXPECT_EQ(*m.resolving_at(), 31'000);
}

TEST(Market_Time, FeedCannotExtend) {
    Market m = open_market(30.0);
    EXPECT_FALSE(m.apply_time_left(10.0, 1'000));
    EXPECT_FALSE(m.apply_time_left(25.0, 1'000));
    EXPECT_DOUBLE_EQ(m.time_left(), 10.0);
}

TEST(Market_Time, FeedNegativeClampsToZero) {
    Market m = open_market(30.0);
    EXPECT_TRUE(m.apply_time_left(-3.0, 2'000));
    EXPECT_EQ(m.time_left(), 0.0);
    EXPECT_EQ(m.status(), MarketStatus::Resolving);
}

TEST(Market_Time, CeilingRisesAsWindowTightens) {
    Market m = open_market(1'200.0);
    EXPECT_EQ(m.leverage_ceiling(), 150.0);
    m.apply_time_left(45.0, 1'000);
    EXPECT_EQ(m.leverage_ceiling(), 500.0);
}

TEST(Market_Time, ConcludeEarly) {
    Market m = open_market(30.0);
    ASSERT_TRUE(m.conclude(5'000).has_value());
    EXPECT_EQ(m.status(), MarketStatus::Resolving);
    EXPECT_GT(m.time_left(), 0.0);
    EXPECT_FALSE(m.accepts_trades());
    EXPECT_EQ(m.conclude(6'000).code(), ErrorCode::MarketNotOpen);
}

// ─── Prices ──────────────────────────────────────────────────────────────────

TEST(Market_Prices, FeedRenormalises) {
    Market m = open_market();
    const std::vector<double> implied = {0.6, 0.6};
    ASSERT_TRUE(m.apply_probabilities(implied).has_value());
    EXPECT_DOUBLE_EQ(m.outcomes()[0].probability, 0.5);
    EXPECT_NEAR(m.probabilities().sum(), 1.0, PROBABILITY_EPSILON);
}

TEST(Market_Prices, FeedZeroFloored) {
    Market m = open_market();
    const std::vector<double> implied = {1.0, 0.0};
    ASSERT_TRUE(m.apply_probabilities(implied).has_value());
    EXPECT_GT(m.outcomes()[1].probability, 0.0);
    EXPECT_TRUE(std::isfinite(m.outcomes()[1].odds));
    EXPECT_NEAR(m.probabilities().sum(), 1.0, PROBABILITY_EPSILON);
}

TEST(Market_Prices, FeedMismatchRejected) {
    Market m = open_market();
    const std::vector<double> three = {0.2, 0.3, 0.5};
    EXPECT_EQ(m.apply_probabilities(three).code(), ErrorCode::FeedMismatch);
    const std::vector<double> negative = {1.2, -0.2};
    EXPECT_EQ(m.apply_probabilities(negative).code(), ErrorCode::FeedMismatch);
    EXPECT_DOUBLE_EQ(m.outcomes()[0].probability, 0.5);
}

TEST(Market_Prices, FillMovesPriceTowardOutcome) {
    Market m = open_market();
    ASSERT_TRUE(m.record_fill(0, 99.975492).has_value());
    EXPECT_NEAR(m.outcomes()[0].probability, 0.5049493, 1e-6);
    EXPECT_NEAR(m.outcomes()[0].odds, 1.9803969, 1e-6);
    EXPECT_NEAR(m.outcomes()[1].odds, 2.0199951, 1e-6);
    EXPECT_NEAR(m.probabilities().sum(), 1.0, PROBABILITY_EPSILON);
    EXPECT_NEAR(m.volume(), 99.975492, 1e-9);
    EXPECT_EQ(m.outcomes()[0].backers, 1u);
}

TEST(Market_Prices, FillRejectedAfterExpiry) {
    Market m = open_market();
    m.apply_time_left(0.0, 1'000);
    EXPECT_EQ(m.record_fill(0, 10.0).code(), ErrorCode::MarketNotOpen);
}

TEST(Market_Prices, FillBadOutcome) {
    Market m = open_market();
    EXPECT_EQ(m.record_fill(2, 10.0).code(), ErrorCode::InvalidOutcome);
}

TEST(Market_Prices, RollupNeverTouchesOutcomes) {
    Market m = open_market();
    m.add_rollup(250.0);
    m.add_rollup(-10.0);
    EXPECT_DOUBLE_EQ(m.rollup_volume(), 250.0);
    EXPECT_DOUBLE_EQ(m.volume(), 0.0);
    EXPECT_DOUBLE_EQ(m.outcomes()[0].probability, 0.5);
}

// ─── Resolution transitions ──────────────────────────────────────────────────

TEST(Market_Finalize, OpenMarketRefused) {
    Market m = open_market();
    EXPECT_EQ(m.finalize(0, some_digest(), 2'000).code(), ErrorCode::MarketNotResolving);
}

TEST(Market_Finalize, OnceOnly) {
    Market m = open_market();
    m.apply_time_left(0.0, 2'000);
    ASSERT_TRUE(m.finalize(1, some_digest(), 3'000).has_value());
    EXPECT_EQ(m.status(), MarketStatus::Resolved);
    ASSERT_TRUE(m.winning_outcome().has_value());
    EXPECT_EQ(*m.winning_outcome(), 1u);

    EXPECT_EQ(m.finalize(0, some_digest(), 4'000).code(), ErrorCode::AlreadyResolved);
    EXPECT_EQ(*m.winning_outcome(), 1u);
}

TEST(Market_Finalize, BadOutcomeIndex) {
    Market m = open_market();
    m.apply_time_left(0.0, 2'000);
    EXPECT_EQ(m.finalize(5, some_digest(), 3'000).code(), ErrorCode::InvalidOutcome);
    EXPECT_EQ(m.status(), MarketStatus::Resolving);
}

TEST(Market_Finalize, DisputedThenGovernance) {
    Market m = open_market();
    m.apply_time_left(0.0, 2'000);
    ASSERT_TRUE(m.mark_disputed(12'000).has_value());
    EXPECT_EQ(m.status(), MarketStatus::Disputed);
    EXPECT_EQ(m.mark_disputed(13'000).code(), ErrorCode::MarketNotResolving);
    ASSERT_TRUE(m.finalize(0, some_digest(), 20'000).has_value());
    EXPECT_EQ(m.status(), MarketStatus::Resolved);
}

TEST(Market_Finalize, RecordCarriesProofHash) {
    Market m = open_market();
    m.apply_time_left(0.0, 2'000);
    ASSERT_TRUE(m.finalize(0, some_digest(), 3'000).has_value());
    const MarketRecord r = m.record();
    ASSERT_TRUE(r.proof_hash.has_value());
    EXPECT_EQ(r.proof_hash->size(), 64u);
    EXPECT_EQ(r.proof_hash->substr(0, 4), "abab");
    EXPECT_EQ(r.status, MarketStatus::Resolved);
    EXPECT_EQ(r.time_left, 0.0);
    EXPECT_FALSE(r.parent_id.has_value());
}

TEST(Market_Reclaim, AfterDisputeWindowOnly) {
    Market m = open_market();
    m.apply_time_left(0.0, 2'000);
    EXPECT_FALSE(m.reclaimable(1'000'000));
    ASSERT_TRUE(m.finalize(0, some_digest(), 3'000).has_value());
    EXPECT_FALSE(m.reclaimable(3'000 + DISPUTE_WINDOW_MS - 1));
    EXPECT_TRUE(m.reclaimable(3'000 + DISPUTE_WINDOW_MS));
}
