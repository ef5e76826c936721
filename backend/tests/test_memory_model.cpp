#include "TestSupport.hpp"
#include "../src/core/MemoryModel.hpp"
#include "../src/core/Parameters.hpp"
#include "../src/core/StateMachine.hpp"
#include "../src/core/Errors.hpp"

static std::vector<double> defaults() {
    return ModelParameters::defaults().w;
}

static CardMemoryState reviewedCard(double stability, double difficulty, int elapsed) {
    CardMemoryState c;
    c.state = CardState::Review;
    c.stability = stability;
    c.difficulty = difficulty;
    c.elapsed_days = elapsed;
    c.reps = 3;
    return c;
}

// ---------------------------------------------------------------------------
// Difficulty
// ---------------------------------------------------------------------------

void test_initial_difficulty_default_weights() {
    ASSERT_NEAR(MemoryModel::initialDifficulty(6.4133, 0.8334), 3.9131, 1e-4);
}

void test_initial_difficulty_is_clamped() {
    ASSERT_NEAR(MemoryModel::initialDifficulty(1.0, 2.0), 1.0, 1e-12);
    ASSERT_NEAR(MemoryModel::initialDifficulty(20.0, 0.5), 10.0, 1e-12);
}

void test_next_difficulty_stays_in_bounds() {
    auto w = defaults();
    const Rating ratings[] = { Rating::Again, Rating::Hard, Rating::Good, Rating::Easy };
    const double inputs[] = { -5.0, 1.0, 3.9131, 5.5, 10.0, 42.0 };

    for (Rating r : ratings) {
        for (double d : inputs) {
            double next = MemoryModel::nextDifficulty(d, r, w);
            ASSERT_GE(next, 1.0);
            ASSERT_LE(next, 10.0);
        }
    }
}

void test_next_difficulty_good_on_initial_is_fixed_point() {
    auto w = defaults();
    double d0 = MemoryModel::initialDifficulty(w[4], w[5]);
    ASSERT_NEAR(MemoryModel::nextDifficulty(d0, Rating::Good, w), d0, 1e-12);
}

// ---------------------------------------------------------------------------
// Stability
// ---------------------------------------------------------------------------

void test_initial_stability_per_rating() {
    auto w = defaults();
    ASSERT_NEAR(MemoryModel::initialStability(Rating::Again, w), 0.212, 1e-12);
    ASSERT_NEAR(MemoryModel::initialStability(Rating::Hard, w), 1.2931, 1e-12);
    ASSERT_NEAR(MemoryModel::initialStability(Rating::Good, w), 2.3065, 1e-12);
    ASSERT_NEAR(MemoryModel::initialStability(Rating::Easy, w), 8.2956, 1e-12);
}

void test_initial_stability_floor() {
    auto w = defaults();
    w[0] = 0.01;
    ASSERT_NEAR(MemoryModel::initialStability(Rating::Again, w), 0.1, 1e-12);
}

void test_forget_stability_has_floor() {
    auto w = defaults();
    auto card = reviewedCard(0.0, 5.0, 0);
    ASSERT_GE(MemoryModel::forgetStability(card, w), 0.01);

    auto mature = reviewedCard(50.0, 5.0, 40);
    double s = MemoryModel::forgetStability(mature, w);
    ASSERT_GE(s, 0.01);
    ASSERT_LT(s, 50.0);
}

void test_recall_stability_grows() {
    auto w = defaults();
    auto card = reviewedCard(10.0, 5.0, 10);
    double s = MemoryModel::recallStability(card, Rating::Good, w, { false, false });
    ASSERT_GT(s, 10.0);
}

void test_short_term_extension_only_in_window() {
    auto w = defaults();
    auto recent = reviewedCard(10.0, 5.0, 2);
    double with = MemoryModel::recallStability(recent, Rating::Good, w, { true, false });
    double without = MemoryModel::recallStability(recent, Rating::Good, w, { false, false });
    ASSERT_GT(with, without);

    auto later = reviewedCard(10.0, 5.0, 10);
    double a = MemoryModel::recallStability(later, Rating::Good, w, { true, false });
    double b = MemoryModel::recallStability(later, Rating::Good, w, { false, false });
    ASSERT_NEAR(a, b, 1e-12);
}

void test_long_term_extension_after_threshold() {
    auto w = defaults();
    auto old_card = reviewedCard(40.0, 5.0, 45);
    double with = MemoryModel::recallStability(old_card, Rating::Good, w, { false, true });
    double without = MemoryModel::recallStability(old_card, Rating::Good, w, { false, false });
    ASSERT_GT(with, without);

    auto young = reviewedCard(40.0, 5.0, 29);
    double a = MemoryModel::recallStability(young, Rating::Good, w, { false, true });
    double b = MemoryModel::recallStability(young, Rating::Good, w, { false, false });
    ASSERT_NEAR(a, b, 1e-12);
}

void test_retrievability() {
    ASSERT_NEAR(MemoryModel::retrievability(0, 5.0), 1.0, 1e-12);
    ASSERT_NEAR(MemoryModel::retrievability(5, 5.0), std::exp(-1.0), 1e-12);
    ASSERT_NEAR(MemoryModel::retrievability(5, 0.0), 1.0, 1e-12);
}

// ---------------------------------------------------------------------------
// Intervals and fuzz
// ---------------------------------------------------------------------------

void test_interval_default_retention() {
    ASSERT_EQ(MemoryModel::nextIntervalDays(2.3065, 0.9, 365), 2);
    ASSERT_EQ(MemoryModel::nextIntervalDays(10.0, 0.9, 365), 10);
}

void test_interval_bounds() {
    ASSERT_EQ(MemoryModel::nextIntervalDays(0.01, 0.9, 365), 1);
    ASSERT_EQ(MemoryModel::nextIntervalDays(5000.0, 0.9, 365), 365);
    ASSERT_EQ(MemoryModel::nextIntervalDays(5000.0, 0.9, 1825), 1825);

    for (double s = 0.01; s < 3000.0; s *= 1.7) {
        int days = MemoryModel::nextIntervalDays(s, 0.85, 200);
        ASSERT_GE(days, 1);
        ASSERT_LE(days, 200);
    }
}

void test_interval_retention_is_clamped() {
    // 0.3 behaves like 0.5: ln(0.5) / ln(0.9) = 6.579
    ASSERT_EQ(MemoryModel::nextIntervalDays(10.0, 0.3, 365), MemoryModel::nextIntervalDays(10.0, 0.5, 365));
    ASSERT_EQ(MemoryModel::nextIntervalDays(10.0, 0.5, 365), 66);
    ASSERT_EQ(MemoryModel::nextIntervalDays(10.0, 0.8, 365), 21);
}

void test_fuzz_range() {
    ASSERT_NEAR(MemoryModel::fuzzRange(2.0), 0.0, 1e-12);
    ASSERT_NEAR(MemoryModel::fuzzRange(10.0), 0.5, 1e-12);
    ASSERT_NEAR(MemoryModel::fuzzRange(100.0), 1.0, 1e-12);
}

// ---------------------------------------------------------------------------
// FSRS6 factors
// ---------------------------------------------------------------------------

void test_short_term_factor_nudges() {
    auto w = defaults();
    ASSERT_NEAR(MemoryModel::nextShortTermFactor(std::nullopt, 1, Rating::Good, w), 1.0 + w[17], 1e-12);
    ASSERT_NEAR(MemoryModel::nextShortTermFactor(1.0, 1, Rating::Again, w), 0.5, 1e-12);
    ASSERT_NEAR(MemoryModel::nextShortTermFactor(1.2, 10, Rating::Again, w), 1.2, 1e-12);
    ASSERT_NEAR(MemoryModel::nextShortTermFactor(1.9, 0, Rating::Easy, w), 2.0, 1e-12);
}

void test_long_term_factor_nudges() {
    auto w = defaults();
    ASSERT_NEAR(MemoryModel::nextLongTermFactor(1.0, 31, Rating::Good, w), 1.0 + w[19], 1e-12);
    ASSERT_NEAR(MemoryModel::nextLongTermFactor(1.0, 31, Rating::Hard, w), 1.0 - w[19], 1e-12);
    ASSERT_NEAR(MemoryModel::nextLongTermFactor(1.0, 5, Rating::Good, w), 1.0, 1e-12);
}

// ---------------------------------------------------------------------------
// Transition table
// ---------------------------------------------------------------------------

void test_transition_table_again_is_lapse() {
    const CardState states[] = { CardState::New, CardState::Learning, CardState::Review, CardState::Relearning };
    for (CardState s : states) {
        const auto& t = StateMachine::transitionFor(s, Rating::Again);
        ASSERT_TRUE(t.counts_lapse);
        ASSERT_FALSE(t.schedules_interval);
    }
}

void test_transition_table_targets() {
    using StateMachine::transitionFor;
    ASSERT_TRUE(transitionFor(CardState::New, Rating::Again).next == CardState::Learning);
    ASSERT_TRUE(transitionFor(CardState::New, Rating::Hard).next == CardState::Learning);
    ASSERT_TRUE(transitionFor(CardState::New, Rating::Good).next == CardState::Review);
    ASSERT_TRUE(transitionFor(CardState::Review, Rating::Again).next == CardState::Relearning);
    ASSERT_TRUE(transitionFor(CardState::Relearning, Rating::Good).next == CardState::Review);
    ASSERT_NEAR(transitionFor(CardState::Review, Rating::Hard).interval_scale, 0.85, 1e-12);
    ASSERT_NEAR(transitionFor(CardState::Review, Rating::Easy).interval_scale, 1.15, 1e-12);
    ASSERT_NEAR(transitionFor(CardState::New, Rating::Easy).interval_scale, 1.0, 1e-12);
}

void test_transition_rejects_bad_rating() {
    ASSERT_THROWS(StateMachine::transitionFor(CardState::Review, static_cast<Rating>(7)), ParameterError);
}

void test_next_due_without_fuzz() {
    std::mt19937 rng(1);
    std::time_t t = 1700000000;
    ASSERT_EQ(StateMachine::nextDue(t, 4, false, rng), t + 4 * SECONDS_PER_DAY);
    ASSERT_EQ(StateMachine::nextDue(t, 0, true, rng), t);
}

void test_next_due_fuzz_within_one_day() {
    std::mt19937 rng(7);
    std::time_t t = 1700000000;
    for (int i = 0; i < 200; ++i) {
        std::time_t due = StateMachine::nextDue(t, 120, true, rng);
        std::time_t base = t + 120 * SECONDS_PER_DAY;
        ASSERT_LE(std::llabs(static_cast<long long>(due - base)), static_cast<long long>(SECONDS_PER_DAY));
    }
}

int main() {
    quietLogs();
    std::cout << "MemoryModel tests\n";

    RUN_TEST(initial_difficulty_default_weights);
    RUN_TEST(initial_difficulty_is_clamped);
    RUN_TEST(next_difficulty_stays_in_bounds);
    RUN_TEST(next_difficulty_good_on_initial_is_fixed_point);
    RUN_TEST(initial_stability_per_rating);
    RUN_TEST(initial_stability_floor);
    RUN_TEST(forget_stability_has_floor);
    RUN_TEST(recall_stability_grows);
    RUN_TEST(short_term_extension_only_in_window);
    RUN_TEST(long_term_extension_after_threshold);
    RUN_TEST(retrievability);
    RUN_TEST(interval_default_retention);
    RUN_TEST(interval_bounds);
    RUN_TEST(interval_retention_is_clamped);
    RUN_TEST(fuzz_range);
    RUN_TEST(short_term_factor_nudges);
    RUN_TEST(long_term_factor_nudges);
    RUN_TEST(transition_table_again_is_lapse);
    RUN_TEST(transition_table_targets);
    RUN_TEST(transition_rejects_bad_rating);
    RUN_TEST(next_due_without_fuzz);
    RUN_TEST(next_due_fuzz_within_one_day);

    return testSummary("MemoryModel");
}
