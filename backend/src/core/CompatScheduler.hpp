#pragma once
#include <ctime>
#include <optional>
#include <vector>
#include "Card.hpp"
#include "Scheduler.hpp"

// Card shape used by older callers: no version tag, no FSRS6 factors
struct LegacyCard {
    std::time_t due = 0;
    double stability = 0.0;
    double difficulty = 0.0;
    int elapsed_days = 0;
    int scheduled_days = 0;
    int reps = 0;
    int lapses = 0;
    CardState state = CardState::New;
    std::optional<std::time_t> last_review;
    double retrievability = 1.0;
};

struct LegacyParameters {
    std::vector<double> w;
    double request_retention = ParameterDefaults::REQUEST_RETENTION;
    int maximum_interval = ParameterDefaults::MAXIMUM_INTERVAL;
    bool enable_fuzz = ParameterDefaults::ENABLE_FUZZ;
};

struct LegacyReviewResult {
    LegacyCard card;
    ReviewLogEntry log;
};

/*
  Backwards-compatible front for Scheduler. Both FSRS6 extensions are always
  on; a legacy card carries no factor state, so every review starts them at 1.0.
*/
class CompatScheduler {
public:
    explicit CompatScheduler(const ParameterOverrides& overrides = {});
    CompatScheduler(const ParameterOverrides& overrides, std::mt19937 rng);

    LegacyCard createCard(std::optional<std::time_t> now = std::nullopt);
    LegacyReviewResult review(const LegacyCard& card, Rating rating,
                              std::optional<std::time_t> review_time = std::nullopt);

    LegacyParameters getParameters() const;
    RepairReport updateParameters(const ParameterOverrides& overrides);

    VersionInfo getVersionInfo() const { return core.getVersionInfo(); }
    PerformanceMetrics getPerformanceMetrics() const { return core.getPerformanceMetrics(); }

    // exp(-(elapsed + futureDays) / stability); 0 for a card without stability
    double predictMemoryState(const LegacyCard& card, double future_days) const;

    // Coarse 0..1 progress from stability and rep count
    double calculateProgress(const LegacyCard& card) const;

    // Minutes for a session, at 30 seconds per card
    int getRecommendedStudyTime(int total_cards, int target_cards) const;

    Scheduler& scheduler() { return core; }

    static CardMemoryState toCore(const LegacyCard& card);
    static LegacyCard fromCore(const CardMemoryState& card);

private:
    static ParameterOverrides withExtensions(ParameterOverrides overrides);

    Scheduler core;
};
