#include "CompatScheduler.hpp"
#include <algorithm>
#include <cmath>

static constexpr double SECONDS_PER_CARD = 30.0;

CompatScheduler::CompatScheduler(const ParameterOverrides& overrides)
    : core(withExtensions(overrides))
{
}

CompatScheduler::CompatScheduler(const ParameterOverrides& overrides, std::mt19937 rng)
    : core(withExtensions(overrides), std::move(rng))
{
}

ParameterOverrides CompatScheduler::withExtensions(ParameterOverrides overrides) {
    overrides.short_term_memory_enabled = true;
    overrides.long_term_stability_enabled = true;
    return overrides;
}

CardMemoryState CompatScheduler::toCore(const LegacyCard& card) {
    CardMemoryState c;
    c.version = ENGINE_VERSION;
    c.due = card.due;
    c.stability = card.stability;
    c.difficulty = card.difficulty;
    c.elapsed_days = card.elapsed_days;
    c.scheduled_days = card.scheduled_days;
    c.reps = card.reps;
    c.lapses = card.lapses;
    c.state = card.state;
    c.last_review = card.last_review;
    c.retrievability = card.retrievability;
    c.short_term_memory_factor = 1.0;
    c.long_term_stability_factor = 1.0;
    return c;
}

LegacyCard CompatScheduler::fromCore(const CardMemoryState& c) {
    LegacyCard card;
    card.due = c.due;
    card.stability = c.stability;
    card.difficulty = c.difficulty;
    card.elapsed_days = c.elapsed_days;
    card.scheduled_days = c.scheduled_days;
    card.reps = c.reps;
    card.lapses = c.lapses;
    card.state = c.state;
    card.last_review = c.last_review;
    card.retrievability = c.retrievability;
    return card;
}

LegacyCard CompatScheduler::createCard(std::optional<std::time_t> now) {
    return fromCore(core.createCard(now));
}

LegacyReviewResult CompatScheduler::review(const LegacyCard& card, Rating rating,
                                           std::optional<std::time_t> review_time) {
    auto result = core.review(toCore(card), rating, review_time);
    return { fromCore(result.card), result.log };
}

LegacyParameters CompatScheduler::getParameters() const {
    auto p = core.getParameters();
    return { p.w, p.request_retention, p.maximum_interval, p.enable_fuzz };
}

RepairReport CompatScheduler::updateParameters(const ParameterOverrides& overrides) {
    return core.updateParameters(overrides);
}

double CompatScheduler::predictMemoryState(const LegacyCard& card, double future_days) const {
    if (card.stability <= 0) return 0.0;
    return std::exp(-(card.elapsed_days + future_days) / card.stability);
}

double CompatScheduler::calculateProgress(const LegacyCard& card) const {
    if (card.state == CardState::New) return 0.0;
    if (card.state == CardState::Review && card.stability > 100) return 1.0;

    double stability_progress = std::min(card.stability / 100.0, 1.0);
    double reps_progress = std::min(card.reps / 10.0, 1.0);
    return (stability_progress + reps_progress) / 2.0;
}

int CompatScheduler::getRecommendedStudyTime(int total_cards, int target_cards) const {
    int effective = std::max(0, std::min(total_cards, target_cards));
    return static_cast<int>(std::ceil(effective * SECONDS_PER_CARD / 60.0));
}
