#include "TestSupport.hpp"
#include "../src/personalization/PersonalizationEngine.hpp"
#include "../src/core/Parameters.hpp"
#include <cstdio>

// Five minutes past a UTC hour, so short bursts stay inside one local hour
static constexpr std::time_t BASE = 1699999500;

static ReviewLogEntry entry(Rating rating, int elapsed, std::time_t when) {
    ReviewLogEntry e;
    e.rating = rating;
    e.state = CardState::Review;
    e.stability = 5.0;
    e.difficulty = 5.0;
    e.elapsed_days = elapsed;
    e.scheduled_days = 3;
    e.review = when;
    return e;
}

static ReviewHistory burst(std::size_t n, Rating rating, int elapsed, std::time_t spacing = 5) {
    ReviewHistory h;
    for (std::size_t i = 0; i < n; ++i) {
        h.push_back(entry(rating, elapsed, BASE + static_cast<std::time_t>(i) * spacing));
    }
    return h;
}

static CardMemoryState reviewedCard(double stability, double difficulty) {
    CardMemoryState c;
    c.state = CardState::Review;
    c.stability = stability;
    c.difficulty = difficulty;
    c.reps = 3;
    c.last_review = BASE;
    return c;
}

// ---------------------------------------------------------------------------
// Learning pattern
// ---------------------------------------------------------------------------

void test_empty_history_pattern() {
    PersonalizationEngine engine;
    auto pattern = engine.analyzeLearningPattern();

    ASSERT_EQ(pattern.optimal_study_time, "19:00");
    ASSERT_NEAR(pattern.average_session_length, 20.0, 1e-12);
    ASSERT_NEAR(pattern.preferred_difficulty, 5.0, 1e-12);
    ASSERT_EQ(std::string(toString(pattern.retention_trend)), "stable");
    ASSERT_NEAR(pattern.consistency_score, 0.5, 1e-12);
}

void test_optimal_study_time_is_busiest_hour() {
    PersonalizationEngine engine;
    engine.setHistory(burst(12, Rating::Good, 2));

    char expected[8];
    std::snprintf(expected, sizeof(expected), "%02d:00", hourOfDay(BASE));
    ASSERT_EQ(engine.analyzeLearningPattern().optimal_study_time, std::string(expected));
}

void test_session_length() {
    PersonalizationEngine engine;
    auto history = burst(10, Rating::Good, 2, 60);
    engine.setHistory(history);
    ASSERT_NEAR(engine.analyzeLearningPattern().average_session_length, 9.0, 1e-9);

    // A review two hours later opens a second, single-review session
    history.push_back(entry(Rating::Good, 2, BASE + 9 * 60 + 2 * 3600));
    engine.setHistory(history);
    ASSERT_NEAR(engine.analyzeLearningPattern().average_session_length, 4.5, 1e-9);
}

void test_preferred_difficulty_is_mean_rating() {
    ReviewHistory h = {
        entry(Rating::Again, 1, BASE),
        entry(Rating::Hard, 1, BASE + 5),
        entry(Rating::Good, 1, BASE + 10),
        entry(Rating::Easy, 1, BASE + 15),
    };
    PersonalizationEngine engine;
    engine.setHistory(h);
    ASSERT_NEAR(engine.analyzeLearningPattern().preferred_difficulty, 2.5, 1e-12);
}

void test_retention_trend() {
    auto improving = burst(10, Rating::Again, 2);
    auto good = burst(10, Rating::Good, 2);
    improving.insert(improving.end(), good.begin(), good.end());

    PersonalizationEngine engine;
    engine.setHistory(improving);
    ASSERT_TRUE(engine.analyzeLearningPattern().retention_trend == RetentionTrend::Improving);

    auto declining = burst(10, Rating::Good, 2);
    auto bad = burst(10, Rating::Again, 2);
    declining.insert(declining.end(), bad.begin(), bad.end());
    engine.setHistory(declining);
    ASSERT_TRUE(engine.profile().retention_trend == RetentionTrend::Declining);

    // Below 20 entries the trend is not measured
    engine.setHistory(burst(19, Rating::Good, 2));
    ASSERT_TRUE(engine.profile().retention_trend == RetentionTrend::Stable);
}

void test_consistency_score() {
    PersonalizationEngine engine;
    engine.setHistory(burst(9, Rating::Good, 2));
    ASSERT_NEAR(engine.profile().consistency_score, 0.5, 1e-12);

    engine.setHistory(burst(15, Rating::Good, 2));
    ASSERT_NEAR(engine.profile().consistency_score, 1.0, 1e-12);

    // One review every two hours around the clock
    engine.setHistory(burst(12, Rating::Good, 2, 2 * 3600));
    ASSERT_LT(engine.profile().consistency_score, 0.6);
}

// ---------------------------------------------------------------------------
// Weights
// ---------------------------------------------------------------------------

void test_no_adjustment_below_fifty_reviews() {
    PersonalizationEngine engine;
    engine.setHistory(burst(49, Rating::Good, 1));

    ASSERT_FALSE(engine.personalizedWeights().has_value());
    ASSERT_TRUE(engine.effectiveWeights() == ModelParameters::defaults().w);
}

void test_adjustment_with_enough_history() {
    PersonalizationEngine engine;
    engine.setHistory(burst(60, Rating::Good, 1));

    ASSERT_TRUE(engine.personalizedWeights().has_value());
    const auto& w = *engine.personalizedWeights();
    const auto& base = ParameterDefaults::weights();

    // Accurate, short intervals, strong short-term memory, no long-term data
    ASSERT_NEAR(w[6], base[6] * 1.1, 1e-12);
    ASSERT_NEAR(w[0], base[0] * 0.95, 1e-12);
    ASSERT_NEAR(w[1], base[1] * 0.97, 1e-12);
    ASSERT_NEAR(w[17], base[17] * 1.02, 1e-12);
    ASSERT_NEAR(w[18], base[18] * 1.01, 1e-12);
    ASSERT_NEAR(w[19], base[19], 1e-12);
    ASSERT_NEAR(w[20], base[20], 1e-12);
    ASSERT_NEAR(w[10], base[10], 1e-12);

    ASSERT_TRUE(engine.profile().interval_preference == IntervalPreference::Shorter);
    ASSERT_NEAR(engine.profile().recent_accuracy, 1.0, 1e-12);
}

void test_adjustment_for_long_intervals() {
    PersonalizationEngine engine;
    engine.setHistory(burst(60, Rating::Again, 40));

    const auto adj = engine.weightAdjustments();
    ASSERT_NEAR(adj[6], -0.1, 1e-12);
    ASSERT_NEAR(adj[0], 0.05, 1e-12);
    ASSERT_NEAR(adj[1], 0.03, 1e-12);
    ASSERT_NEAR(adj[19], 0.0, 1e-12);
    ASSERT_TRUE(engine.profile().interval_preference == IntervalPreference::Longer);
    ASSERT_NEAR(engine.profile().long_term_stability, 0.0, 1e-12);
}

void test_custom_base_weights() {
    std::vector<double> base(PARAMETER_COUNT, 1.0);
    PersonalizationEngine engine(base);
    engine.setHistory(burst(60, Rating::Good, 1));
    ASSERT_NEAR((*engine.personalizedWeights())[6], 1.1, 1e-12);
}

// ---------------------------------------------------------------------------
// Memory curve
// ---------------------------------------------------------------------------

void test_curve_without_days_is_empty() {
    PersonalizationEngine engine;
    ASSERT_TRUE(engine.generateMemoryCurve({ reviewedCard(10, 5) }, 0, 80).empty());
}

void test_default_curve_without_reviewed_cards() {
    PersonalizationEngine engine;
    CardMemoryState fresh;
    auto curve = engine.generateMemoryCurve({ fresh }, 30, 80);

    ASSERT_EQ(curve.size(), static_cast<std::size_t>(30));
    ASSERT_EQ(curve[0].day, 1);
    ASSERT_NEAR(curve[0].fsrs_predicted, 85.0 * std::exp(-1.0 / 12.0), 1e-9);
    ASSERT_NEAR(curve[0].actual_predicted, 88.0 * std::exp(-1.0 / 14.0), 1e-9);
    ASSERT_NEAR(curve[29].fsrs_predicted, std::max(5.0, 85.0 * std::exp(-30.0 / 12.0)), 1e-9);
}

void test_curve_from_cards() {
    PersonalizationEngine engine;
    auto curve = engine.generateMemoryCurve({ reviewedCard(10, 5) }, 60, 80);
    ASSERT_EQ(curve.size(), static_cast<std::size_t>(60));

    // 10 * 0.8 (performance) * 0.9 (difficulty) * 1.0 (no history)
    ASSERT_NEAR(curve[0].fsrs_predicted, 100.0 * std::exp(-0.1), 1e-9);
    ASSERT_NEAR(curve[0].actual_predicted, 100.0 * std::exp(-1.0 / 7.2), 1e-9);
    ASSERT_NEAR(curve[0].confidence_interval.lower, 100.0 * std::exp(-1.0 / 7.2) - 5.5, 1e-9);
    ASSERT_NEAR(curve[0].confidence_interval.upper, 100.0 * std::exp(-1.0 / 7.2) + 5.5, 1e-9);

    for (const auto& p : curve) {
        ASSERT_GE(p.fsrs_predicted, 5.0);
        ASSERT_LE(p.fsrs_predicted, 100.0);
        ASSERT_GE(p.actual_predicted, 8.0);
        ASSERT_LE(p.actual_predicted, 100.0);
        ASSERT_GE(p.confidence_interval.lower, 0.0);
        ASSERT_LE(p.confidence_interval.upper, 100.0);
        ASSERT_LE(p.confidence_interval.lower, p.confidence_interval.upper);
    }
}

void test_curve_session_accuracy_floor() {
    PersonalizationEngine engine;
    auto low = engine.generateMemoryCurve({ reviewedCard(10, 5) }, 3, 10);
    auto floor = engine.generateMemoryCurve({ reviewedCard(10, 5) }, 3, 40);
    ASSERT_NEAR(low[2].actual_predicted, floor[2].actual_predicted, 1e-12);
}

// ---------------------------------------------------------------------------
// Insights
// ---------------------------------------------------------------------------

void test_default_insights() {
    PersonalizationEngine engine;
    auto insights = engine.generatePersonalizedInsights({}, 0);

    ASSERT_EQ(insights.size(), static_cast<std::size_t>(2));
    ASSERT_TRUE(insights[0].type == InsightType::Schedule);
    ASSERT_TRUE(insights[0].priority == InsightPriority::Medium);
    ASSERT_TRUE(insights[1].type == InsightType::Method);
    ASSERT_TRUE(insights[1].priority == InsightPriority::Low);
}

void test_low_accuracy_insight_comes_first() {
    PersonalizationEngine engine;
    engine.setHistory(burst(30, Rating::Again, 2));
    auto insights = engine.generatePersonalizedInsights({ reviewedCard(5, 9), reviewedCard(5, 8.5) }, 20);

    ASSERT_EQ(insights.size(), static_cast<std::size_t>(2));
    ASSERT_TRUE(insights[0].type == InsightType::Performance);
    ASSERT_TRUE(insights[0].priority == InsightPriority::High);
    ASSERT_NEAR(insights[0].confidence, 0.85, 1e-12);
    ASSERT_TRUE(insights[1].type == InsightType::Difficulty);
}

void test_response_time_insight_needs_measurements() {
    PersonalizationEngine engine;
    auto history = burst(30, Rating::Good, 2);
    engine.setHistory(history);

    for (const auto& i : engine.generatePersonalizedInsights({}, 90)) {
        ASSERT_FALSE(i.type == InsightType::Method);
    }

    for (auto& e : history) e.response_time_ms = 20000.0;
    engine.setHistory(history);
    auto insights = engine.generatePersonalizedInsights({}, 90);

    ASSERT_EQ(insights.size(), static_cast<std::size_t>(2));
    ASSERT_TRUE(insights[0].type == InsightType::Performance);
    ASSERT_TRUE(insights[0].priority == InsightPriority::Medium);
    ASSERT_TRUE(insights[1].type == InsightType::Method);
    ASSERT_TRUE(insights[1].priority == InsightPriority::Low);
}

void test_irregular_schedule_insight() {
    PersonalizationEngine engine;
    auto history = burst(12, Rating::Good, 2, 2 * 3600);
    history[0].rating = Rating::Again;
    history[1].rating = Rating::Again;
    engine.setHistory(history);

    auto insights = engine.generatePersonalizedInsights({}, 80);
    ASSERT_EQ(insights.size(), static_cast<std::size_t>(1));
    ASSERT_TRUE(insights[0].type == InsightType::Schedule);
    ASSERT_NEAR(insights[0].confidence, 0.75, 1e-12);
}

int main() {
    quietLogs();
    std::cout << "PersonalizationEngine tests\n";

    RUN_TEST(empty_history_pattern);
    RUN_TEST(optimal_study_time_is_busiest_hour);
    RUN_TEST(session_length);
    RUN_TEST(preferred_difficulty_is_mean_rating);
    RUN_TEST(retention_trend);
    RUN_TEST(consistency_score);
    RUN_TEST(no_adjustment_below_fifty_reviews);
    RUN_TEST(adjustment_with_enough_history);
    RUN_TEST(adjustment_for_long_intervals);
    RUN_TEST(custom_base_weights);
    RUN_TEST(curve_without_days_is_empty);
    RUN_TEST(default_curve_without_reviewed_cards);
    RUN_TEST(curve_from_cards);
    RUN_TEST(curve_session_accuracy_floor);
    RUN_TEST(default_insights);
    RUN_TEST(low_accuracy_insight_comes_first);
    RUN_TEST(response_time_insight_needs_measurements);
    RUN_TEST(irregular_schedule_insight);

    return testSummary("PersonalizationEngine");
}
