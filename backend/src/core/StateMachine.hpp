#pragma once
#include <ctime>
#include <random>
#include "Card.hpp"
#include "Parameters.hpp"

namespace StateMachine
{
    // Which stability formula a transition applies
    enum class StabilityRule {
        Forget,   // lapse
        Initial,  // first review of a New card
        Recall    // successful review of a seen card
    };

    struct Transition {
        CardState next;
        StabilityRule stability;
        bool schedules_interval;  // false: due immediately (scheduled_days = 0)
        double interval_scale;    // multiplies stability before interval rounding
        bool counts_lapse;
    };

    // Row = prior state, column = rating. Total over both enums.
    const Transition& transitionFor(CardState from, Rating rating);

    /*
      Applies the (state, rating) transition. `card` must already carry this
      review's elapsed_days; its stability and difficulty are the pre-review ones.
      Does not touch due, reps or last_review.
    */
    CardMemoryState apply(const CardMemoryState& card, Rating rating, const ModelParameters& params);

    // review_time + scheduled_days, shifted by fuzz when enabled
    std::time_t nextDue(std::time_t review_time, int scheduled_days, bool fuzz, std::mt19937& rng);
}
