#include "PersonalizationEngine.hpp"
#include "../core/Parameters.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <iterator>
#include <numeric>
#include <sstream>

static constexpr double SESSION_GAP_SECONDS = 30 * 60;
static constexpr double DEFAULT_SESSION_MINUTES = 20.0;
static constexpr double RESPONSE_TIME_THRESHOLD_MS = 15000.0;

static double accuracyOf(const ReviewHistory& reviews) {
    if (reviews.empty()) return 0.0;
    auto correct = std::count_if(reviews.begin(), reviews.end(),
        [](const ReviewLogEntry& r) { return isRecall(r.rating); });
    return static_cast<double>(correct) / reviews.size();
}

static double variance(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double sq = 0.0;
    for (double v : values) sq += (v - mean) * (v - mean);
    return sq / values.size();
}

static std::string percent(double ratio) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
    return oss.str();
}

int hourOfDay(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm.tm_hour;
}

PersonalizationEngine::PersonalizationEngine()
    : PersonalizationEngine(ModelParameters::defaults().w)
{
}

PersonalizationEngine::PersonalizationEngine(std::vector<double> weights)
    : base_weights(std::move(weights))
{
}

void PersonalizationEngine::setHistory(ReviewHistory history) {
    user_history = std::move(history);
    recompute();
}

void PersonalizationEngine::recompute() {
    current_profile = PersonalizationProfile{};
    current_profile.recent_accuracy = recentAccuracy();
    current_profile.interval_preference = intervalPreference();
    current_profile.short_term_performance = shortTermPerformance();
    current_profile.long_term_stability = longTermStability();
    current_profile.consistency_score = consistencyScore();

    auto pattern = analyzeLearningPattern();
    current_profile.optimal_study_time = pattern.optimal_study_time;
    current_profile.preferred_difficulty = pattern.preferred_difficulty;
    current_profile.retention_trend = pattern.retention_trend;

    if (user_history.size() < MIN_HISTORY_FOR_WEIGHTS) {
        // Not enough data, stay on the base weights
        personalized_weights.reset();
        spdlog::info("Personalization: {} reviews, weight adjustment disabled (< {})",
            user_history.size(), MIN_HISTORY_FOR_WEIGHTS);
        return;
    }

    auto adjustments = weightAdjustments();
    std::vector<double> adjusted(base_weights.size());
    for (std::size_t i = 0; i < base_weights.size(); ++i) {
        double adj = i < adjustments.size() ? adjustments[i] : 0.0;
        adjusted[i] = base_weights[i] * (1.0 + adj);
    }
    personalized_weights = std::move(adjusted);

    spdlog::info("Personalization: {} reviews, accuracy={:.3f}, interval_preference={}, trend={}",
        user_history.size(), current_profile.recent_accuracy,
        toString(current_profile.interval_preference), toString(current_profile.retention_trend));
}

std::vector<double> PersonalizationEngine::effectiveWeights() const {
    return personalized_weights ? *personalized_weights : base_weights;
}

/* -------------------------
   Weight adjustment
   -------------------------
   Small relative nudges, each driven by one slice of the history:
    - w6        difficulty sensitivity, from the last 100 reviews
    - w0, w1    initial stability, from the average elapsed interval
    - w17, w18  short-term memory, from reviews within 3 days
    - w19, w20  long-term stability, from reviews after 30+ days
*/
std::vector<double> PersonalizationEngine::weightAdjustments() const {
    std::vector<double> adj(PARAMETER_COUNT, 0.0);
    if (user_history.empty()) return adj;

    double accuracy = recentAccuracy();
    if (accuracy > 0.9) adj[6] = 0.1;
    else if (accuracy < 0.7) adj[6] = -0.1;

    switch (intervalPreference()) {
    case IntervalPreference::Shorter:
        adj[0] = -0.05;
        adj[1] = -0.03;
        break;
    case IntervalPreference::Longer:
        adj[0] = 0.05;
        adj[1] = 0.03;
        break;
    case IntervalPreference::Normal:
        break;
    }

    if (shortTermPerformance() > 0.85) {
        adj[17] = 0.02;
        adj[18] = 0.01;
    }

    if (longTermStability() > 0.8) {
        adj[19] = 0.015;
        adj[20] = 0.01;
    }

    return adj;
}

double PersonalizationEngine::recentAccuracy() const {
    if (user_history.empty()) return 0.8;
    std::size_t n = std::min(user_history.size(), RECENT_WINDOW);
    ReviewHistory recent(user_history.end() - n, user_history.end());
    return accuracyOf(recent);
}

IntervalPreference PersonalizationEngine::intervalPreference() const {
    if (user_history.empty()) return IntervalPreference::Normal;

    double total = 0.0;
    for (const auto& r : user_history) total += r.elapsed_days;
    double avg = total / user_history.size();

    if (avg < 5) return IntervalPreference::Shorter;
    if (avg > 15) return IntervalPreference::Longer;
    return IntervalPreference::Normal;
}

double PersonalizationEngine::shortTermPerformance() const {
    ReviewHistory subset;
    std::copy_if(user_history.begin(), user_history.end(), std::back_inserter(subset),
        [](const ReviewLogEntry& r) { return r.elapsed_days <= 3; });
    return subset.empty() ? 0.8 : accuracyOf(subset);
}

double PersonalizationEngine::longTermStability() const {
    ReviewHistory subset;
    std::copy_if(user_history.begin(), user_history.end(), std::back_inserter(subset),
        [](const ReviewLogEntry& r) { return r.elapsed_days >= 30; });
    return subset.empty() ? 0.75 : accuracyOf(subset);
}

// How tightly reviews cluster around one hour of the day
double PersonalizationEngine::consistencyScore() const {
    if (user_history.size() < 10) return 0.5;

    std::vector<double> hours;
    hours.reserve(user_history.size());
    for (const auto& r : user_history) hours.push_back(hourOfDay(r.review));

    return std::max(0.0, 1.0 - variance(hours) / 24.0);
}

double PersonalizationEngine::personalFactor() const {
    if (user_history.size() < 20) return 1.0;
    return 0.8 + recentAccuracy() * 0.3 + consistencyScore() * 0.2;
}

RetentionTrend PersonalizationEngine::retentionTrend() const {
    if (user_history.size() < 20) return RetentionTrend::Stable;

    std::size_t half = user_history.size() / 2;
    ReviewHistory earlier(user_history.begin(), user_history.begin() + half);
    ReviewHistory recent(user_history.end() - half, user_history.end());

    double difference = accuracyOf(recent) - accuracyOf(earlier);
    if (difference > 0.05) return RetentionTrend::Improving;
    if (difference < -0.05) return RetentionTrend::Declining;
    return RetentionTrend::Stable;
}

// Consecutive reviews less than 30 minutes apart form one session
std::vector<double> PersonalizationEngine::sessionLengths() const {
    std::vector<double> sessions;
    if (user_history.empty()) return { DEFAULT_SESSION_MINUTES };

    std::time_t start = user_history.front().review;
    std::time_t end = start;
    for (std::size_t i = 1; i < user_history.size(); ++i) {
        std::time_t t = user_history[i].review;
        if (std::difftime(t, end) > SESSION_GAP_SECONDS) {
            sessions.push_back(std::difftime(end, start) / 60.0);
            start = t;
        }
        end = t;
    }
    sessions.push_back(std::difftime(end, start) / 60.0);
    return sessions;
}

/* -------------------------
   Memory curve
   -------------------------
   fsrs_predicted uses the mean stability as-is. actual_predicted scales it by
   session performance, card difficulty and the learner's personal factor.
*/
std::vector<MemoryCurvePoint> PersonalizationEngine::generateMemoryCurve(
    const std::vector<CardMemoryState>& cards, int days, double session_accuracy) const {
    if (days <= 0) return {};

    std::vector<const CardMemoryState*> usable;
    for (const auto& c : cards) {
        if (c.reps > 0 || c.last_review) usable.push_back(&c);
    }
    if (usable.empty()) {
        return defaultCurve(days);
    }

    double stability_sum = 0.0;
    double difficulty_sum = 0.0;
    for (const auto* c : usable) {
        stability_sum += c->stability > 0 ? c->stability : 1.0;
        difficulty_sum += c->difficulty > 0 ? c->difficulty : 5.0;
    }
    double avg_stability = stability_sum / usable.size();
    double avg_difficulty = difficulty_sum / usable.size();

    double accuracy = session_accuracy > 0 ? session_accuracy : 80.0;
    double performance_multiplier = std::max(accuracy / 100.0, 0.4);
    double difficulty_factor = std::max(10.0 - avg_difficulty, 1.0) / 10.0;
    double adjusted_stability = avg_stability * performance_multiplier *
        (0.8 + difficulty_factor * 0.2) * personalFactor();

    std::vector<MemoryCurvePoint> curve;
    curve.reserve(days);
    for (int day = 1; day <= days; ++day) {
        double fsrs = std::exp(-day / avg_stability) * 100.0;
        double actual = std::exp(-day / adjusted_stability) * 100.0;
        double uncertainty = std::min(20.0, 5.0 + day * 0.5);

        MemoryCurvePoint p;
        p.day = day;
        p.fsrs_predicted = std::clamp(fsrs, 5.0, 100.0);
        p.actual_predicted = std::clamp(actual, 8.0, 100.0);
        p.retention_gap = actual - fsrs;
        p.confidence_interval = { std::max(0.0, actual - uncertainty), std::min(100.0, actual + uncertainty) };
        curve.push_back(p);
    }
    return curve;
}

std::vector<MemoryCurvePoint> PersonalizationEngine::defaultCurve(int days) const {
    std::vector<MemoryCurvePoint> curve;
    curve.reserve(days);
    for (int day = 1; day <= days; ++day) {
        double fsrs = 85.0 * std::exp(-day / 12.0);
        double actual = 88.0 * std::exp(-day / 14.0);

        MemoryCurvePoint p;
        p.day = day;
        p.fsrs_predicted = std::max(5.0, fsrs);
        p.actual_predicted = std::max(8.0, actual);
        p.retention_gap = actual - fsrs;
        p.confidence_interval = { std::max(0.0, actual - 10.0), std::min(100.0, actual + 10.0) };
        curve.push_back(p);
    }
    return curve;
}

LearningPattern PersonalizationEngine::analyzeLearningPattern() const {
    LearningPattern pattern;
    if (user_history.empty()) {
        pattern.optimal_study_time = "19:00";
        pattern.average_session_length = DEFAULT_SESSION_MINUTES;
        pattern.preferred_difficulty = 5.0;
        pattern.retention_trend = RetentionTrend::Stable;
        pattern.consistency_score = 0.5;
        return pattern;
    }

    std::vector<int> hour_counts(24, 0);
    for (const auto& r : user_history) hour_counts[hourOfDay(r.review)]++;
    auto optimal_hour = std::distance(hour_counts.begin(),
        std::max_element(hour_counts.begin(), hour_counts.end()));

    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:00", static_cast<int>(optimal_hour));
    pattern.optimal_study_time = buf;

    auto sessions = sessionLengths();
    double avg_session = std::accumulate(sessions.begin(), sessions.end(), 0.0) / sessions.size();
    // Bursts of a single review have zero length
    pattern.average_session_length = avg_session > 0 ? avg_session : DEFAULT_SESSION_MINUTES;

    double rating_sum = 0.0;
    for (const auto& r : user_history) rating_sum += static_cast<int>(r.rating);
    pattern.preferred_difficulty = rating_sum / user_history.size();

    pattern.retention_trend = retentionTrend();
    pattern.consistency_score = consistencyScore();
    return pattern;
}

/* -------------------------
   Insights
   -------------------------
   Each rule yields at most one insight; result is ordered high -> low.
*/
std::vector<PersonalizedInsight> PersonalizationEngine::generatePersonalizedInsights(
    const std::vector<CardMemoryState>& cards, double /*session_accuracy*/) const {
    if (user_history.empty()) {
        return defaultInsights();
    }

    std::vector<PersonalizedInsight> insights;
    if (auto i = performanceInsight()) insights.push_back(*i);
    if (auto i = scheduleInsight()) insights.push_back(*i);
    if (auto i = difficultyInsight(cards)) insights.push_back(*i);
    if (auto i = responseTimeInsight()) insights.push_back(*i);

    std::stable_sort(insights.begin(), insights.end(),
        [](const PersonalizedInsight& a, const PersonalizedInsight& b) {
            return static_cast<int>(a.priority) > static_cast<int>(b.priority);
        });

    spdlog::debug("Generated {} personalized insights", insights.size());
    return insights;
}

std::optional<PersonalizedInsight> PersonalizationEngine::performanceInsight() const {
    double accuracy = recentAccuracy();

    if (accuracy < 0.7) {
        return PersonalizedInsight{
            InsightType::Performance, InsightPriority::High,
            "Retention needs attention",
            "Recent accuracy is " + percent(accuracy) + "; consider adjusting your study strategy",
            true, "15-20% better retention", 0.85 };
    }
    if (accuracy > 0.9) {
        return PersonalizedInsight{
            InsightType::Performance, InsightPriority::Medium,
            "Excellent performance",
            "Accuracy reached " + percent(accuracy) + "; you can take on harder material",
            true, "20% higher study efficiency", 0.9 };
    }
    return std::nullopt;
}

std::optional<PersonalizedInsight> PersonalizationEngine::scheduleInsight() const {
    auto pattern = analyzeLearningPattern();
    if (pattern.consistency_score >= 0.6) return std::nullopt;

    return PersonalizedInsight{
        InsightType::Schedule, InsightPriority::Medium,
        "Build a regular study time",
        "Your review times vary a lot; try studying around " + pattern.optimal_study_time + " every day",
        true, "25% better memory consolidation", 0.75 };
}

std::optional<PersonalizedInsight> PersonalizationEngine::difficultyInsight(
    const std::vector<CardMemoryState>& cards) const {
    if (cards.empty()) return std::nullopt;

    double sum = 0.0;
    for (const auto& c : cards) sum += c.difficulty > 0 ? c.difficulty : 5.0;
    if (sum / cards.size() <= 7.0) return std::nullopt;

    return PersonalizedInsight{
        InsightType::Difficulty, InsightPriority::Medium,
        "Material is difficult",
        "The average card difficulty is high; consider lowering your daily load",
        true, "Less strain, better consistency", 0.8 };
}

// Only reviews whose host captured an answer latency take part
std::optional<PersonalizedInsight> PersonalizationEngine::responseTimeInsight() const {
    double total = 0.0;
    std::size_t measured = 0;
    for (const auto& r : user_history) {
        if (r.response_time_ms) {
            total += *r.response_time_ms;
            measured++;
        }
    }
    if (measured == 0 || total / measured <= RESPONSE_TIME_THRESHOLD_MS) return std::nullopt;

    return PersonalizedInsight{
        InsightType::Method, InsightPriority::Low,
        "Speed up recall",
        "Average answer time is long; practice quick active recall",
        true, "30% faster responses", 0.7 };
}

std::vector<PersonalizedInsight> PersonalizationEngine::defaultInsights() const {
    return {
        { InsightType::Schedule, InsightPriority::Medium,
          "Build a study habit",
          "Review at a fixed time every day to improve retention",
          true, "20% better retention", 0.8 },
        { InsightType::Method, InsightPriority::Low,
          "Try active recall",
          "Try to recall the answer before revealing it",
          true, "15% higher study efficiency", 0.7 }
    };
}

const char* toString(IntervalPreference p) {
    switch (p) {
    case IntervalPreference::Shorter: return "shorter";
    case IntervalPreference::Normal: return "normal";
    case IntervalPreference::Longer: return "longer";
    }
    return "normal";
}

const char* toString(RetentionTrend t) {
    switch (t) {
    case RetentionTrend::Improving: return "improving";
    case RetentionTrend::Stable: return "stable";
    case RetentionTrend::Declining: return "declining";
    }
    return "stable";
}

const char* toString(InsightType t) {
    switch (t) {
    case InsightType::Performance: return "performance";
    case InsightType::Schedule: return "schedule";
    case InsightType::Difficulty: return "difficulty";
    case InsightType::Method: return "method";
    case InsightType::Focus: return "focus";
    }
    return "performance";
}

const char* toString(InsightPriority p) {
    switch (p) {
    case InsightPriority::High: return "high";
    case InsightPriority::Medium: return "medium";
    case InsightPriority::Low: return "low";
    }
    return "low";
}
