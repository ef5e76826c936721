#pragma once
#include <optional>
#include <vector>
#include "../core/Card.hpp"

struct BaselineMetrics {
    double accuracy = 0.0;        // share of reviews where the rounded prediction matched
    double avg_interval = 0.0;    // mean positive scheduled_days
    double retention_rate = 0.0;  // share rated Good or Easy
};

/*
  Numerical weight fitting against a review history.
  The loss is the mean squared error between predicted retention and the
  observed outcome (recalled = 1, forgotten = 0).
*/
class WeightOptimizer {
public:
    static constexpr std::size_t MIN_DATA_POINTS = 50;
    static constexpr double LEARNING_RATE = 0.05;
    static constexpr double EPSILON = 0.01;
    static constexpr double MIN_IMPROVEMENT = 0.05;
    static constexpr int MAX_ITERATIONS = 10;
    static constexpr int EARLY_STOPPING_PATIENCE = 3;

    // Throws ParameterError with fewer than MIN_DATA_POINTS entries
    BaselineMetrics collectBaseline(const ReviewHistory& history) const;

    // One pass over w0-w3 and w17-w20, kept only if the loss drops by more than 5%
    std::vector<double> optimizePhase1(const ReviewHistory& history) const;

    // Up to MAX_ITERATIONS full-vector steps; returns the best weights seen
    std::vector<double> optimizePhase2(const ReviewHistory& history, const std::vector<double>& start) const;

    static double predictRetention(const ReviewLogEntry& entry, const std::vector<double>& w);
    static double loss(const ReviewHistory& history, const std::vector<double>& w);

    // Central difference, negated so it points downhill
    static double gradient(const ReviewHistory& history, const std::vector<double>& w, std::size_t index);

    static double clampToRange(double value, std::size_t index);
};

enum class OptimizationStage { Baseline, Phase1, Phase2, Optimized };

struct OptimizationProgress {
    OptimizationStage stage = OptimizationStage::Baseline;
    double percent = 0.0;         // 0..100
    std::size_t next_milestone = 50;
};

/*
  Drives WeightOptimizer as the history grows:
    Baseline  -> Phase1     at 50 reviews (baseline collected)
    Phase1    -> Phase2     at 100 reviews (critical weights fitted)
    Phase2    -> Optimized  at 200 reviews (full fit)
*/
class OptimizationPipeline {
public:
    static constexpr std::size_t PHASE1_MILESTONE = 50;
    static constexpr std::size_t PHASE2_MILESTONE = 100;
    static constexpr std::size_t OPTIMIZED_MILESTONE = 200;

    // Returns true when the stage changed
    bool update(const ReviewHistory& history);

    OptimizationStage stage() const { return current_stage; }
    OptimizationProgress progress() const;

    const std::optional<BaselineMetrics>& baseline() const { return baseline_metrics; }

    // Latest fitted weights, if any phase produced them
    std::optional<std::vector<double>> weights() const;

    void reset();

private:
    bool advance(const ReviewHistory& history);

    WeightOptimizer optimizer;
    OptimizationStage current_stage = OptimizationStage::Baseline;
    std::size_t total_reviews = 0;
    std::optional<BaselineMetrics> baseline_metrics;
    std::optional<std::vector<double>> phase1_weights;
    std::optional<std::vector<double>> phase2_weights;
};

const char* toString(OptimizationStage stage);
