#include "WeightBacktracker.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <spdlog/spdlog.h>

void WeightBacktracker::createCheckpoint(std::size_t review_count, const std::vector<double>& weights,
                                         const CheckpointMetrics& metrics) {
    history_checkpoints[review_count] = WeightCheckpoint{ weights, metrics, review_count };

    spdlog::info("Checkpoint #{} created: accuracy={:.3f}, retention={:.3f}",
        review_count, metrics.prediction_accuracy, metrics.retention_rate);

    if (history_checkpoints.size() > MAX_CHECKPOINTS) {
        auto oldest = history_checkpoints.begin();
        spdlog::debug("Checkpoint #{} evicted", oldest->first);
        history_checkpoints.erase(oldest);
    }
}

std::optional<std::vector<double>> WeightBacktracker::detectAndBacktrack(const CheckpointMetrics& current) const {
    if (history_checkpoints.size() < 2) {
        spdlog::debug("Backtracking skipped: {} checkpoint(s)", history_checkpoints.size());
        return std::nullopt;
    }

    // Second newest
    const auto& previous = std::next(history_checkpoints.rbegin())->second;

    double drop = previous.metrics.prediction_accuracy - current.prediction_accuracy;
    if (drop > PERFORMANCE_THRESHOLD) {
        spdlog::warn("Prediction accuracy dropped by {:.1f}%, backtracking to checkpoint #{}",
            drop * 100.0, previous.review_count);
        return previous.weights;
    }

    auto stable = mostStableCheckpoint(current);
    if (stable && stable->review_count != previous.review_count) {
        spdlog::info("Backtracking to more stable checkpoint #{}", stable->review_count);
        return stable->weights;
    }

    return std::nullopt;
}

std::optional<WeightCheckpoint> WeightBacktracker::mostStableCheckpoint(const CheckpointMetrics& current) const {
    if (history_checkpoints.empty()) return std::nullopt;

    auto best = std::max_element(history_checkpoints.begin(), history_checkpoints.end(),
        [](const auto& a, const auto& b) {
            return stabilityScore(a.second.metrics) < stabilityScore(b.second.metrics);
        });

    if (stabilityScore(best->second.metrics) > stabilityScore(current) + PERFORMANCE_THRESHOLD) {
        return best->second;
    }
    return std::nullopt;
}

std::vector<double> WeightBacktracker::blend(const std::vector<double>& old_weights,
                                             const std::vector<double>& current_weights, double decay) {
    std::vector<double> blended(old_weights.size());
    for (std::size_t i = 0; i < old_weights.size(); ++i) {
        double current = i < current_weights.size() ? current_weights[i] : old_weights[i];
        blended[i] = old_weights[i] * decay + current * (1.0 - decay);
    }
    return blended;
}

double WeightBacktracker::adaptiveDecayFactor(const CheckpointMetrics& old_metrics,
                                              const CheckpointMetrics& current) {
    double drop = stabilityScore(old_metrics) - stabilityScore(current);

    // The larger the drop, the more the old weights count
    if (drop > 0.2) return 0.9;
    if (drop > 0.15) return 0.8;
    if (drop > 0.1) return 0.7;
    return 0.5;
}

double WeightBacktracker::stabilityScore(const CheckpointMetrics& metrics) {
    return metrics.prediction_accuracy * 0.7 + metrics.retention_rate * 0.3;
}

CheckpointMetrics WeightBacktracker::measure(const ReviewHistory& history) {
    CheckpointMetrics metrics;
    metrics.review_count = history.size();
    if (history.empty()) return metrics;

    std::size_t n = std::min(history.size(), MEASURE_WINDOW);
    std::size_t correct = 0;
    std::size_t remembered = 0;

    for (auto it = history.end() - n; it != history.end(); ++it) {
        double stability = it->stability > 0 ? it->stability : 1.0;
        bool predicted = std::exp(-it->elapsed_days / stability) > 0.5;
        bool actual = isRecall(it->rating);
        if (predicted == actual) correct++;
        if (actual) remembered++;
    }

    metrics.prediction_accuracy = static_cast<double>(correct) / n;
    metrics.retention_rate = static_cast<double>(remembered) / n;
    return metrics;
}

std::vector<WeightCheckpoint> WeightBacktracker::checkpoints() const {
    std::vector<WeightCheckpoint> result;
    result.reserve(history_checkpoints.size());
    for (const auto& [count, checkpoint] : history_checkpoints) {
        result.push_back(checkpoint);
    }
    return result;
}

BacktrackStatistics WeightBacktracker::statistics() const {
    BacktrackStatistics stats;
    if (history_checkpoints.empty()) return stats;

    double accuracy = 0.0;
    double retention = 0.0;
    for (const auto& [count, checkpoint] : history_checkpoints) {
        accuracy += checkpoint.metrics.prediction_accuracy;
        retention += checkpoint.metrics.retention_rate;
    }

    stats.total_checkpoints = history_checkpoints.size();
    stats.oldest_checkpoint = history_checkpoints.begin()->first;
    stats.newest_checkpoint = history_checkpoints.rbegin()->first;
    stats.average_accuracy = accuracy / history_checkpoints.size();
    stats.average_retention = retention / history_checkpoints.size();
    return stats;
}

void WeightBacktracker::clear() {
    history_checkpoints.clear();
    spdlog::info("All checkpoints cleared");
}
