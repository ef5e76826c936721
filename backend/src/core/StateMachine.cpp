#include "StateMachine.hpp"
#include "Errors.hpp"
#include "MemoryModel.hpp"
#include <cmath>

namespace StateMachine
{
    using R = StabilityRule;
    using S = CardState;

    // Hard/Easy carry an interval-level penalty/bonus on top of w15/w16
    static constexpr double HARD_INTERVAL_SCALE = 0.85;
    static constexpr double EASY_INTERVAL_SCALE = 1.15;

    //                      Again                               Hard                                          Good                           Easy
    static const Transition TABLE[4][4] = {
        /* New        */ { {S::Learning,   R::Forget, false, 1.0, true}, {S::Learning, R::Initial, true, 1.0, false},               {S::Review, R::Initial, true, 1.0, false}, {S::Review, R::Initial, true, 1.0, false} },
        /* Learning   */ { {S::Relearning, R::Forget, false, 1.0, true}, {S::Review,   R::Recall,  true, HARD_INTERVAL_SCALE, false}, {S::Review, R::Recall,  true, 1.0, false}, {S::Review, R::Recall,  true, EASY_INTERVAL_SCALE, false} },
        /* Review     */ { {S::Relearning, R::Forget, false, 1.0, true}, {S::Review,   R::Recall,  true, HARD_INTERVAL_SCALE, false}, {S::Review, R::Recall,  true, 1.0, false}, {S::Review, R::Recall,  true, EASY_INTERVAL_SCALE, false} },
        /* Relearning */ { {S::Relearning, R::Forget, false, 1.0, true}, {S::Review,   R::Recall,  true, HARD_INTERVAL_SCALE, false}, {S::Review, R::Recall,  true, 1.0, false}, {S::Review, R::Recall,  true, EASY_INTERVAL_SCALE, false} },
    };

    const Transition& transitionFor(CardState from, Rating rating) {
        int row = static_cast<int>(from);
        int col = static_cast<int>(rating) - 1;
        if (row < 0 || row > 3) {
            throw ParameterError("Unknown card state", "state", std::to_string(row));
        }
        if (col < 0 || col > 3) {
            throw ParameterError("Rating must be 1, 2, 3, or 4", "rating", std::to_string(col + 1));
        }
        return TABLE[row][col];
    }

    CardMemoryState apply(const CardMemoryState& card, Rating rating, const ModelParameters& params) {
        const auto& w = params.w;
        const Transition& t = transitionFor(card.state, rating);
        CardMemoryState next = card;

        if (t.counts_lapse) next.lapses += 1;
        next.difficulty = MemoryModel::nextDifficulty(card.difficulty, rating, w);

        switch (t.stability) {
        case R::Forget:
            next.stability = MemoryModel::forgetStability(card, w);
            break;
        case R::Initial:
            next.stability = MemoryModel::initialStability(rating, w);
            break;
        case R::Recall: {
            MemoryModel::Extensions ext{ params.short_term_memory_enabled, params.long_term_stability_enabled };
            next.stability = MemoryModel::recallStability(card, rating, w, ext);
            break;
        }
        }

        next.state = t.next;
        next.scheduled_days = t.schedules_interval
            ? MemoryModel::nextIntervalDays(next.stability * t.interval_scale,
                params.request_retention, params.maximum_interval)
            : 0;

        next.retrievability = MemoryModel::retrievability(next.elapsed_days, next.stability);

        if (params.short_term_memory_enabled) {
            next.short_term_memory_factor = MemoryModel::nextShortTermFactor(
                card.short_term_memory_factor, card.elapsed_days, rating, w);
        }
        if (params.long_term_stability_enabled) {
            next.long_term_stability_factor = MemoryModel::nextLongTermFactor(
                card.long_term_stability_factor, card.elapsed_days, rating, w);
        }

        return next;
    }

    std::time_t nextDue(std::time_t review_time, int scheduled_days, bool fuzz, std::mt19937& rng) {
        std::time_t due = review_time + static_cast<std::time_t>(scheduled_days) * SECONDS_PER_DAY;
        if (!fuzz) return due;

        double range = MemoryModel::fuzzRange(scheduled_days);
        if (range <= 0.0) return due;

        std::uniform_real_distribution<double> dist(-range, range);
        auto shift = static_cast<long>(std::lround(dist(rng)));
        return due + static_cast<std::time_t>(shift) * SECONDS_PER_DAY;
    }
}
