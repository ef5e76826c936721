#include "WeightOptimizer.hpp"
#include "../core/Errors.hpp"
#include "../core/Parameters.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

static const std::size_t CRITICAL_INDICES[] = { 0, 1, 2, 3, 17, 18, 19, 20 };

static double outcome(const ReviewLogEntry& entry) {
    return isRecall(entry.rating) ? 1.0 : 0.0;
}

static std::vector<double> defaultWeights() {
    const auto& w = ParameterDefaults::weights();
    return std::vector<double>(w.begin(), w.end());
}

double WeightOptimizer::predictRetention(const ReviewLogEntry& entry, const std::vector<double>& w) {
    double stability = entry.stability > 0 ? entry.stability : 1.0;
    double retention = std::exp(-entry.elapsed_days / stability);
    double short_term = w.size() > 17 ? w[17] : 0.0;
    return std::clamp(retention * (1.0 + short_term * 0.1), 0.0, 1.0);
}

double WeightOptimizer::loss(const ReviewHistory& history, const std::vector<double>& w) {
    if (history.empty()) return 0.0;

    double total = 0.0;
    for (const auto& entry : history) {
        double diff = predictRetention(entry, w) - outcome(entry);
        total += diff * diff;
    }
    return total / history.size();
}

double WeightOptimizer::gradient(const ReviewHistory& history, const std::vector<double>& w, std::size_t index) {
    std::vector<double> plus = w;
    std::vector<double> minus = w;
    plus[index] += EPSILON;
    minus[index] -= EPSILON;

    return -(loss(history, plus) - loss(history, minus)) / (2 * EPSILON);
}

double WeightOptimizer::clampToRange(double value, std::size_t index) {
    if (index >= static_cast<std::size_t>(PARAMETER_COUNT)) return value;
    const auto& range = ParameterDefaults::ranges()[index];
    return std::clamp(value, range.min, range.max);
}

BaselineMetrics WeightOptimizer::collectBaseline(const ReviewHistory& history) const {
    if (history.size() < MIN_DATA_POINTS) {
        throw ParameterError("At least " + std::to_string(MIN_DATA_POINTS) +
            " reviews are required to collect a baseline", "history", std::to_string(history.size()));
    }

    const auto defaults = defaultWeights();
    std::size_t correct = 0;
    std::size_t remembered = 0;
    double interval_sum = 0.0;
    std::size_t interval_count = 0;

    for (const auto& entry : history) {
        double actual = outcome(entry);
        if (std::round(predictRetention(entry, defaults)) == actual) correct++;
        if (actual > 0) remembered++;
        if (entry.scheduled_days > 0) {
            interval_sum += entry.scheduled_days;
            interval_count++;
        }
    }

    BaselineMetrics baseline;
    baseline.accuracy = static_cast<double>(correct) / history.size();
    baseline.avg_interval = interval_count > 0 ? interval_sum / interval_count : 0.0;
    baseline.retention_rate = static_cast<double>(remembered) / history.size();

    spdlog::info("Baseline collected over {} reviews: accuracy={:.3f}, avg_interval={:.2f}d, retention={:.3f}",
        history.size(), baseline.accuracy, baseline.avg_interval, baseline.retention_rate);
    return baseline;
}

std::vector<double> WeightOptimizer::optimizePhase1(const ReviewHistory& history) const {
    const auto current = defaultWeights();
    auto optimized = current;

    for (std::size_t idx : CRITICAL_INDICES) {
        double g = gradient(history, optimized, idx);
        optimized[idx] = clampToRange(optimized[idx] + LEARNING_RATE * g, idx);
    }

    double old_loss = loss(history, current);
    double new_loss = loss(history, optimized);
    double improvement = old_loss > 0 ? (old_loss - new_loss) / old_loss : 0.0;

    if (improvement > MIN_IMPROVEMENT) {
        spdlog::info("Phase 1 accepted: loss {:.4f} -> {:.4f} ({:.1f}% better)",
            old_loss, new_loss, improvement * 100.0);
        return optimized;
    }

    spdlog::info("Phase 1 rejected: improvement {:.1f}% below threshold, keeping default weights",
        improvement * 100.0);
    return current;
}

std::vector<double> WeightOptimizer::optimizePhase2(const ReviewHistory& history,
                                                    const std::vector<double>& start) const {
    const double rate = LEARNING_RATE * 0.8;

    std::vector<double> weights = start;
    std::vector<double> best = start;
    double best_loss = loss(history, weights);
    int no_improvement = 0;

    for (int iteration = 0; iteration < MAX_ITERATIONS; ++iteration) {
        std::vector<double> gradients(weights.size());
        for (std::size_t i = 0; i < weights.size(); ++i) {
            gradients[i] = gradient(history, weights, i);
        }
        for (std::size_t i = 0; i < weights.size(); ++i) {
            weights[i] = clampToRange(weights[i] + rate * gradients[i], i);
        }

        double current_loss = loss(history, weights);
        if (current_loss < best_loss) {
            best_loss = current_loss;
            best = weights;
            no_improvement = 0;
            spdlog::debug("Phase 2 iteration {}: loss {:.4f}", iteration + 1, current_loss);
        }
        else {
            no_improvement++;
        }

        if (no_improvement >= EARLY_STOPPING_PATIENCE) {
            spdlog::debug("Phase 2 stopped early at iteration {}", iteration + 1);
            break;
        }
    }

    spdlog::info("Phase 2 finished: best loss {:.4f}", best_loss);
    return best;
}

/*
  Pipeline
*/

bool OptimizationPipeline::update(const ReviewHistory& history) {
    total_reviews = history.size();

    bool changed = false;
    while (advance(history)) changed = true;
    return changed;
}

bool OptimizationPipeline::advance(const ReviewHistory& history) {
    switch (current_stage) {
    case OptimizationStage::Baseline:
        if (history.size() < PHASE1_MILESTONE) return false;
        baseline_metrics = optimizer.collectBaseline(history);
        current_stage = OptimizationStage::Phase1;
        break;

    case OptimizationStage::Phase1:
        if (history.size() < PHASE2_MILESTONE) return false;
        phase1_weights = optimizer.optimizePhase1(history);
        current_stage = OptimizationStage::Phase2;
        break;

    case OptimizationStage::Phase2: {
        if (history.size() < OPTIMIZED_MILESTONE) return false;
        auto start = phase1_weights ? *phase1_weights : defaultWeights();
        phase2_weights = optimizer.optimizePhase2(history, start);
        current_stage = OptimizationStage::Optimized;
        break;
    }

    case OptimizationStage::Optimized:
        return false;
    }

    spdlog::info("Optimization stage is now {} ({} reviews)", toString(current_stage), history.size());
    return true;
}

OptimizationProgress OptimizationPipeline::progress() const {
    const double n = static_cast<double>(total_reviews);
    OptimizationProgress p;
    p.stage = current_stage;

    switch (current_stage) {
    case OptimizationStage::Baseline:
        p.percent = std::min(n / 50.0, 1.0) * 25.0;
        p.next_milestone = PHASE1_MILESTONE;
        break;
    case OptimizationStage::Phase1:
        p.percent = 25.0 + std::clamp((n - 50.0) / 50.0, 0.0, 1.0) * 25.0;
        p.next_milestone = PHASE2_MILESTONE;
        break;
    case OptimizationStage::Phase2:
        p.percent = 50.0 + std::clamp((n - 100.0) / 100.0, 0.0, 1.0) * 25.0;
        p.next_milestone = OPTIMIZED_MILESTONE;
        break;
    case OptimizationStage::Optimized:
        p.percent = 100.0;
        p.next_milestone = OPTIMIZED_MILESTONE;
        break;
    }
    return p;
}

std::optional<std::vector<double>> OptimizationPipeline::weights() const {
    if (phase2_weights) return phase2_weights;
    return phase1_weights;
}

void OptimizationPipeline::reset() {
    current_stage = OptimizationStage::Baseline;
    total_reviews = 0;
    baseline_metrics.reset();
    phase1_weights.reset();
    phase2_weights.reset();
    spdlog::info("Optimization pipeline reset");
}

const char* toString(OptimizationStage stage) {
    switch (stage) {
    case OptimizationStage::Baseline: return "baseline";
    case OptimizationStage::Phase1: return "phase1";
    case OptimizationStage::Phase2: return "phase2";
    case OptimizationStage::Optimized: return "optimized";
    }
    return "baseline";
}
