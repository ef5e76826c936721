#pragma once
#include <map>
#include <optional>
#include <vector>
#include "../core/Card.hpp"

struct CheckpointMetrics {
    double prediction_accuracy = 0.0;
    double retention_rate = 0.0;
    std::size_t review_count = 0;
};

struct WeightCheckpoint {
    std::vector<double> weights;
    CheckpointMetrics metrics;
    std::size_t review_count = 0;
};

struct BacktrackStatistics {
    std::size_t total_checkpoints = 0;
    std::size_t oldest_checkpoint = 0;
    std::size_t newest_checkpoint = 0;
    double average_accuracy = 0.0;
    double average_retention = 0.0;
};

/*
  Keeps a short trail of fitted weights with the performance measured when they
  were saved, and points back to an older set when performance drops.
*/
class WeightBacktracker {
public:
    static constexpr std::size_t MAX_CHECKPOINTS = 5;
    static constexpr double PERFORMANCE_THRESHOLD = 0.1;
    static constexpr std::size_t MEASURE_WINDOW = 50;

    // Keyed by review count; the lowest key is evicted past MAX_CHECKPOINTS
    void createCheckpoint(std::size_t review_count, const std::vector<double>& weights,
                          const CheckpointMetrics& metrics);

    std::optional<std::vector<double>> detectAndBacktrack(const CheckpointMetrics& current) const;

    // old * decay + current * (1 - decay), element-wise
    static std::vector<double> blend(const std::vector<double>& old_weights,
                                     const std::vector<double>& current_weights, double decay);

    static double adaptiveDecayFactor(const CheckpointMetrics& old_metrics, const CheckpointMetrics& current);

    // 0.7 * accuracy + 0.3 * retention
    static double stabilityScore(const CheckpointMetrics& metrics);

    // Accuracy and retention over the last MEASURE_WINDOW reviews
    static CheckpointMetrics measure(const ReviewHistory& history);

    std::vector<WeightCheckpoint> checkpoints() const;
    BacktrackStatistics statistics() const;
    void clear();

private:
    std::optional<WeightCheckpoint> mostStableCheckpoint(const CheckpointMetrics& current) const;

    std::map<std::size_t, WeightCheckpoint> history_checkpoints;
};
