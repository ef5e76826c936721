#pragma once
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "../core/Card.hpp"

enum class IntervalPreference { Shorter, Normal, Longer };
enum class RetentionTrend { Improving, Stable, Declining };
enum class InsightType { Performance, Schedule, Difficulty, Method, Focus };
enum class InsightPriority { Low = 1, Medium = 2, High = 3 };

// Everything derived from the review history in one pass
struct PersonalizationProfile {
    double recent_accuracy = 0.8;
    IntervalPreference interval_preference = IntervalPreference::Normal;
    double short_term_performance = 0.8;
    double long_term_stability = 0.75;
    double consistency_score = 0.5;
    std::string optimal_study_time = "19:00";
    double preferred_difficulty = 5.0;
    RetentionTrend retention_trend = RetentionTrend::Stable;
};

struct ConfidenceInterval {
    double lower = 0.0;
    double upper = 0.0;
};

struct MemoryCurvePoint {
    int day = 0;
    double fsrs_predicted = 0.0;     // percent, generic model
    double actual_predicted = 0.0;   // percent, personalized
    double retention_gap = 0.0;
    ConfidenceInterval confidence_interval;
};

struct PersonalizedInsight {
    InsightType type = InsightType::Performance;
    InsightPriority priority = InsightPriority::Medium;
    std::string title;
    std::string description;
    bool actionable = true;
    std::string expected_improvement;
    double confidence = 0.0;         // 0..1
};

struct LearningPattern {
    std::string optimal_study_time;  // "HH:00"
    double average_session_length = 20.0; // minutes
    double preferred_difficulty = 5.0;
    RetentionTrend retention_trend = RetentionTrend::Stable;
    double consistency_score = 0.5;
};

/*
  Adapts the generic model to one learner.
  setHistory() recomputes everything; there is no incremental update and no
  staleness check, so callers re-submit the history after it changes.
  Weight adjustments switch on at 50 reviews.
*/
class PersonalizationEngine {
public:
    static constexpr std::size_t MIN_HISTORY_FOR_WEIGHTS = 50;
    static constexpr std::size_t RECENT_WINDOW = 100;

    PersonalizationEngine();
    explicit PersonalizationEngine(std::vector<double> base_weights);

    void setHistory(ReviewHistory history);
    const ReviewHistory& history() const { return user_history; }

    const PersonalizationProfile& profile() const { return current_profile; }

    // Set only when the history is long enough
    const std::optional<std::vector<double>>& personalizedWeights() const { return personalized_weights; }
    std::vector<double> effectiveWeights() const;

    // Relative adjustment per weight index, applied as w * (1 + adj)
    std::vector<double> weightAdjustments() const;

    std::vector<MemoryCurvePoint> generateMemoryCurve(const std::vector<CardMemoryState>& cards,
                                                      int days, double session_accuracy) const;

    LearningPattern analyzeLearningPattern() const;

    std::vector<PersonalizedInsight> generatePersonalizedInsights(const std::vector<CardMemoryState>& cards,
                                                                  double session_accuracy) const;

private:
    void recompute();

    double recentAccuracy() const;
    IntervalPreference intervalPreference() const;
    double shortTermPerformance() const;
    double longTermStability() const;
    double consistencyScore() const;
    double personalFactor() const;
    RetentionTrend retentionTrend() const;
    std::vector<double> sessionLengths() const;

    std::vector<MemoryCurvePoint> defaultCurve(int days) const;
    std::vector<PersonalizedInsight> defaultInsights() const;

    std::optional<PersonalizedInsight> performanceInsight() const;
    std::optional<PersonalizedInsight> scheduleInsight() const;
    std::optional<PersonalizedInsight> difficultyInsight(const std::vector<CardMemoryState>& cards) const;
    std::optional<PersonalizedInsight> responseTimeInsight() const;

    std::vector<double> base_weights;
    ReviewHistory user_history;
    PersonalizationProfile current_profile;
    std::optional<std::vector<double>> personalized_weights;
};

const char* toString(IntervalPreference p);
const char* toString(RetentionTrend t);
const char* toString(InsightType t);
const char* toString(InsightPriority p);

// Local-time hour of day, 0..23
int hourOfDay(std::time_t t);
