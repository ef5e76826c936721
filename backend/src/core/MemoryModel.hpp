#pragma once
#include <optional>
#include <vector>
#include "Card.hpp"

/*
  FSRS 6.1.1 memory model as free functions. Nothing here touches scheduler
  state; every input is passed in, so the formulas can be tested in isolation.

   - Retrievability: R(t) = exp(-t / S)
   - Difficulty is mean-reverting towards the initial difficulty, clamped to [1, 10]
   - Stability grows on recall and collapses on lapse
*/
namespace MemoryModel
{
    inline constexpr double MIN_DIFFICULTY = 1.0;
    inline constexpr double MAX_DIFFICULTY = 10.0;
    inline constexpr double MIN_STABILITY = 0.01;
    inline constexpr double MIN_INITIAL_STABILITY = 0.1;
    inline constexpr int SHORT_TERM_WINDOW_DAYS = 3;
    inline constexpr int LONG_TERM_THRESHOLD_DAYS = 30;
    inline constexpr double MIN_FACTOR = 0.5;
    inline constexpr double MAX_FACTOR = 2.0;

    // Extensions that change the recall-stability formula
    struct Extensions {
        bool short_term_memory = true;
        bool long_term_stability = true;
    };

    double initialDifficulty(double w4, double w5);
    double nextDifficulty(double difficulty, Rating rating, const std::vector<double>& w);

    double initialStability(Rating rating, const std::vector<double>& w);
    double forgetStability(const CardMemoryState& card, const std::vector<double>& w);
    double recallStability(const CardMemoryState& card, Rating rating,
                           const std::vector<double>& w, Extensions ext);

    double retrievability(double elapsed_days, double stability);

    int nextIntervalDays(double stability, double request_retention, int maximum_interval);

    // Largest fuzz shift in days for an interval; 0 below 2.5 days
    double fuzzRange(double scheduled_days);

    // Per-review nudge of the optional FSRS6 factors, clamped to [0.5, 2.0]
    double nextShortTermFactor(std::optional<double> current, int elapsed_days,
                               Rating rating, const std::vector<double>& w);
    double nextLongTermFactor(std::optional<double> current, int elapsed_days,
                              Rating rating, const std::vector<double>& w);
}
