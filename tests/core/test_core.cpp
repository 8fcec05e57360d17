// tests/core/test_core.cpp
// Tests for search_stats, cancel_token, the random helpers and the log
// threshold.

#include <qosroute/core/cancel_token.h>
#include <qosroute/core/log.h>
#include <qosroute/core/random.h>
#include <qosroute/core/search_stats.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace qosroute;

// =========================================================================
// search_stats
// =========================================================================

TEST(SearchStats, AdditionIsFieldwise) {
    search_stats a{.iterations = 2, .candidates_total = 10, .candidates_evaluated = 8,
                   .candidates_rejected = 2, .moves_accepted = 4};
    search_stats b{.iterations = 3, .candidates_total = 5, .candidates_evaluated = 2,
                   .improvements = 1, .restarts = 1, .successful_episodes = 2};
    auto const c = a + b;
    EXPECT_EQ(c.iterations, 5u);
    EXPECT_EQ(c.candidates_total, 15u);
    EXPECT_EQ(c.candidates_evaluated, 10u);
    EXPECT_EQ(c.candidates_rejected, 2u);
    EXPECT_EQ(c.moves_accepted, 4u);
    EXPECT_EQ(c.improvements, 1u);
    EXPECT_EQ(c.restarts, 1u);
    EXPECT_EQ(c.successful_episodes, 2u);

    a += b;
    EXPECT_EQ(a, c);
}

TEST(SearchStats, DerivedRates) {
    search_stats const empty{};
    EXPECT_DOUBLE_EQ(empty.acceptance_rate(), 0.0);
    EXPECT_DOUBLE_EQ(empty.rejection_rate(), 0.0);
    EXPECT_DOUBLE_EQ(empty.success_rate(), 0.0);

    search_stats const s{.iterations = 4, .candidates_total = 10,
                         .candidates_evaluated = 8, .candidates_rejected = 5,
                         .moves_accepted = 2, .successful_episodes = 3};
    EXPECT_DOUBLE_EQ(s.acceptance_rate(), 0.25);
    EXPECT_DOUBLE_EQ(s.rejection_rate(), 0.5);
    EXPECT_DOUBLE_EQ(s.success_rate(), 0.75);
}

static_assert((search_stats{.iterations = 1} + search_stats{.iterations = 2}).iterations == 3);

// =========================================================================
// cancel_token
// =========================================================================

TEST(CancelToken, RequestAndReset) {
    cancel_token token;
    EXPECT_FALSE(token.cancelled());
    EXPECT_FALSE(is_cancelled(&token));
    token.request_cancel();
    EXPECT_TRUE(is_cancelled(&token));
    token.reset();
    EXPECT_FALSE(is_cancelled(&token));
    EXPECT_FALSE(is_cancelled(nullptr));
}

// =========================================================================
// random
// =========================================================================

TEST(Random, SeededEnginesAgree) {
    auto a = make_engine(123);
    auto b = make_engine(123);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(uniform_index(a, 0, 1000), uniform_index(b, 0, 1000));
    }
}

TEST(Random, DrawsStayInRange) {
    auto rng = make_engine(5);
    for (int i = 0; i < 1000; ++i) {
        auto const u = uniform01(rng);
        EXPECT_GE(u, 0.0);
        EXPECT_LT(u, 1.0);
        auto const r = uniform_real(rng, -0.1, 0.1);
        EXPECT_GE(r, -0.1);
        EXPECT_LT(r, 0.1);
        auto const k = uniform_index(rng, 3, 5);
        EXPECT_GE(k, 3u);
        EXPECT_LE(k, 5u);
    }
}

TEST(Random, PickFromEmptyThrows) {
    auto rng = make_engine(6);
    std::vector<int> const none;
    EXPECT_THROW((void)pick(rng, none), std::invalid_argument);
    std::vector<int> const one{7};
    EXPECT_EQ(pick(rng, one), 7);
}

// =========================================================================
// log
// =========================================================================

TEST(Log, ThresholdFiltersLevels) {
    auto const saved = get_log_level();

    set_log_level(log_level::info);
    EXPECT_FALSE(log_enabled(log_level::debug));
    EXPECT_TRUE(log_enabled(log_level::info));
    EXPECT_TRUE(log_enabled(log_level::error));
    EXPECT_FALSE(log_enabled(log_level::off));

    set_log_level(log_level::off);
    EXPECT_FALSE(log_enabled(log_level::error));

    set_log_level(log_level::trace);
    EXPECT_TRUE(log_enabled(log_level::trace));
    testing::internal::CaptureStderr();
    log_info(log_category::dispatch, "route {} -> {}", 3, 7);
    auto const out = testing::internal::GetCapturedStderr();
    EXPECT_EQ(out, "[info] dispatch | route 3 -> 7\n");

    set_log_level(saved);
}

TEST(Log, DefaultThresholdIsWarning) {
    EXPECT_EQ(get_log_level(), log_level::warning);
    EXPECT_EQ(to_string(log_level::warning), "warning");
    EXPECT_EQ(to_string(log_category::annealing), "annealing");
}

TEST(Log, OneCategoryPerSolverAndDispatch) {
    EXPECT_EQ(to_string(static_cast<log_category>(0)), "genetic");
    EXPECT_EQ(to_string(log_category::swarm), "swarm");
    EXPECT_EQ(to_string(log_category::qlearning), "qlearning");
    EXPECT_EQ(to_string(log_category::dispatch), "dispatch");
    EXPECT_EQ(to_string(static_cast<log_category>(5)), "unknown");
}
