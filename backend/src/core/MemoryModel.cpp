#include "MemoryModel.hpp"
#include <algorithm>
#include <cmath>

namespace MemoryModel
{
    static double value(Rating rating) { return static_cast<double>(rating); }

    double initialDifficulty(double w4, double w5) {
        return std::clamp(w4 - 3.0 * w5, MIN_DIFFICULTY, MAX_DIFFICULTY);
    }

    double nextDifficulty(double difficulty, Rating rating, const std::vector<double>& w) {
        double delta = -w[6] * (value(rating) - 3.0);
        double mean_reversion = w[4] * (initialDifficulty(w[4], w[5]) - difficulty);
        return std::clamp(difficulty + delta + mean_reversion, MIN_DIFFICULTY, MAX_DIFFICULTY);
    }

    double initialStability(Rating rating, const std::vector<double>& w) {
        return std::max(w[static_cast<int>(rating) - 1], MIN_INITIAL_STABILITY);
    }

    double forgetStability(const CardMemoryState& card, const std::vector<double>& w) {
        double dr = std::exp(w[11] * (card.difficulty - w[4]));
        double dsf = std::pow(card.stability, w[12]) *
            std::pow(std::max(card.elapsed_days, 1), w[13]);
        return std::max(w[10] * dsf * dr, MIN_STABILITY);
    }

    double recallStability(const CardMemoryState& card, Rating rating,
                           const std::vector<double>& w, Extensions ext) {
        double hard_penalty = rating == Rating::Hard ? w[15] : 1.0;
        double easy_bonus = rating == Rating::Easy ? w[16] : 1.0;

        double R = retrievability(card.elapsed_days, card.stability);
        double success = std::exp(w[8] * (value(rating) - 3.0 + w[9] * (1.0 - R)));

        double stability = card.stability * success * hard_penalty * easy_bonus;

        if (ext.short_term_memory && card.elapsed_days <= SHORT_TERM_WINDOW_DAYS) {
            stability *= 1.0 + w[17] * std::exp(-w[18] * card.elapsed_days);
        }

        if (ext.long_term_stability && card.elapsed_days >= LONG_TERM_THRESHOLD_DAYS) {
            stability *= 1.0 + w[19] * std::log(1.0 + w[20] * card.elapsed_days / 30.0);
        }

        return std::max(stability, MIN_STABILITY);
    }

    double retrievability(double elapsed_days, double stability) {
        if (elapsed_days <= 0 || stability <= 0) return 1.0;
        return std::exp(-elapsed_days / stability);
    }

    int nextIntervalDays(double stability, double request_retention, int maximum_interval) {
        double base = std::max(1.0, std::round(stability));
        double request = std::clamp(request_retention, 0.5, 0.99);

        double scaling = std::log(request) / std::log(0.9);
        double interval = std::max(1.0, std::round(base * std::abs(scaling)));

        return static_cast<int>(std::min(interval, static_cast<double>(std::max(1, maximum_interval))));
    }

    double fuzzRange(double scheduled_days) {
        if (scheduled_days < 2.5) return 0.0;
        return std::min(0.05 * scheduled_days, 1.0);
    }

    static double nudgeFactor(std::optional<double> current, bool in_window, Rating rating, double step) {
        double base = current.value_or(1.0);
        if (!in_window) return base;
        double improvement = isRecall(rating) ? step : -step;
        return std::clamp(base + improvement, MIN_FACTOR, MAX_FACTOR);
    }

    double nextShortTermFactor(std::optional<double> current, int elapsed_days,
                               Rating rating, const std::vector<double>& w) {
        return nudgeFactor(current, elapsed_days <= SHORT_TERM_WINDOW_DAYS, rating, w[17]);
    }

    double nextLongTermFactor(std::optional<double> current, int elapsed_days,
                              Rating rating, const std::vector<double>& w) {
        return nudgeFactor(current, elapsed_days >= LONG_TERM_THRESHOLD_DAYS, rating, w[19]);
    }
}
