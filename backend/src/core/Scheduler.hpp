#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "Card.hpp"
#include "Parameters.hpp"

struct VersionInfo {
    std::string version;
    std::string algorithm_name;
    int parameter_count = 0;
    std::string compatibility_level;
};

// Observability only; nothing here feeds back into scheduling
struct PerformanceMetrics {
    std::string algorithm_version;
    double execution_time_ms = 0.0;   // rolling average of createCard/review
    int total_reviews = 0;
    double average_accuracy = 0.0;    // share of Good/Easy ratings
};

struct SchedulerState {
    int total_reviews = 0;
    double average_accuracy = 0.0;
    std::vector<double> current_weights;
};

struct ReviewResult {
    CardMemoryState card;
    ReviewLogEntry log;
};

/*
  FSRS 6.1.1 scheduler.
   - createCard() / review() are the only operations that produce card state
   - Parameters are validated and silently repaired by ParameterStore
   - Fuzz draws from an owned std::mt19937; pass one in (or reseed) for reproducible due dates
  Not thread-safe: one writer per instance.
*/
class Scheduler {
public:
    explicit Scheduler(const ParameterOverrides& overrides = {});
    Scheduler(const ParameterOverrides& overrides, std::mt19937 rng);

    VersionInfo getVersionInfo() const;

    CardMemoryState createCard(std::optional<std::time_t> now = std::nullopt);

    // Throws VersionError, ParameterError or ComputationError
    ReviewResult review(const CardMemoryState& card, Rating rating,
                        std::optional<std::time_t> review_time = std::nullopt);
    ReviewResult review(const CardMemoryState& card, int rating,
                        std::optional<std::time_t> review_time = std::nullopt);

    ModelParameters getParameters() const;
    RepairReport updateParameters(const ParameterOverrides& overrides);

    SchedulerState getState() const;
    PerformanceMetrics getPerformanceMetrics() const;

    void seedRandom(std::uint32_t seed);

    // Whole days between two instants, order-insensitive
    static int elapsedDaysBetween(std::time_t from, std::time_t to);

private:
    void validateCard(const CardMemoryState& card) const;
    void validateRating(Rating rating) const;
    void recordReview(Rating rating);
    void recordTiming(double ms);

    ParameterStore store;
    std::mt19937 rng;

    // Running counters
    int total_reviews = 0;
    double average_accuracy = 0.0;
    double execution_time_ms = 0.0;
};
