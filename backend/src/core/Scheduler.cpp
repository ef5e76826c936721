#include "Scheduler.hpp"
#include "Errors.hpp"
#include "MemoryModel.hpp"
#include "StateMachine.hpp"
#include "../utils/random.hpp"
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <sstream>

using Clock = std::chrono::steady_clock;

static double millisSince(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

Scheduler::Scheduler(const ParameterOverrides& overrides)
    : Scheduler(overrides, Random::makeEngine())
{
}

Scheduler::Scheduler(const ParameterOverrides& overrides, std::mt19937 engine)
    : store(overrides),
    rng(std::move(engine))
{
    spdlog::info("Scheduler ({} {}) initialized: retention={}, max_interval={}d, fuzz={}, short_term={}, long_term={}",
        ALGORITHM_NAME, ENGINE_VERSION,
        store.current().request_retention, store.current().maximum_interval,
        store.current().enable_fuzz, store.current().short_term_memory_enabled,
        store.current().long_term_stability_enabled);
}

VersionInfo Scheduler::getVersionInfo() const {
    return { ENGINE_VERSION, ALGORITHM_NAME, PARAMETER_COUNT, "standard" };
}

/*
  Public API:
    - createCard(now?)
    - review(card, rating, reviewTime?)
*/

CardMemoryState Scheduler::createCard(std::optional<std::time_t> now) {
    auto start = Clock::now();
    const auto& p = store.current();

    CardMemoryState card;
    card.version = ENGINE_VERSION;
    card.due = now.value_or(std::time(nullptr));
    card.stability = 0.0;
    card.difficulty = MemoryModel::initialDifficulty(p.w[4], p.w[5]);
    card.state = CardState::New;
    card.retrievability = 1.0;
    if (p.short_term_memory_enabled) card.short_term_memory_factor = 1.0;
    if (p.long_term_stability_enabled) card.long_term_stability_factor = 1.0;

    recordTiming(millisSince(start));
    spdlog::debug("Created card: difficulty={:.4f} due={}", card.difficulty, formatTimestamp(card.due));
    return card;
}

ReviewResult Scheduler::review(const CardMemoryState& card, int rating,
                               std::optional<std::time_t> review_time) {
    return review(card, ratingFromInt(rating), review_time);
}

ReviewResult Scheduler::review(const CardMemoryState& card, Rating rating,
                               std::optional<std::time_t> review_time) {
    auto start = Clock::now();

    validateCard(card);
    validateRating(rating);

    const std::time_t now = review_time.value_or(std::time(nullptr));

    try {
        int elapsed = 0;
        if (card.last_review) {
            if (now < *card.last_review) {
                spdlog::warn("Review time {} precedes last review {}; using absolute distance",
                    formatTimestamp(now), formatTimestamp(*card.last_review));
            }
            elapsed = elapsedDaysBetween(*card.last_review, now);
        }

        CardMemoryState working = card;
        working.last_review = now;
        working.elapsed_days = elapsed;
        working.reps = card.reps + 1;

        const auto& p = store.current();
        CardMemoryState updated = StateMachine::apply(working, rating, p);
        updated.due = StateMachine::nextDue(now, updated.scheduled_days, p.enable_fuzz, rng);

        ReviewLogEntry log;
        log.rating = rating;
        log.state = card.state;
        log.due = card.due;
        log.stability = card.stability;
        log.difficulty = card.difficulty;
        log.elapsed_days = elapsed;
        log.last_elapsed_days = card.elapsed_days;
        log.scheduled_days = updated.scheduled_days;
        log.review = now;

        recordReview(rating);
        recordTiming(millisSince(start));

        spdlog::debug("Review {} | {} -> {} | S {:.4f} -> {:.4f} | D {:.4f} -> {:.4f} | elapsed={}d interval={}d",
            toString(rating), toString(card.state), toString(updated.state),
            card.stability, updated.stability, card.difficulty, updated.difficulty,
            elapsed, updated.scheduled_days);

        return { updated, log };
    }
    catch (const SchedulerError&) {
        throw;
    }
    catch (const std::exception& e) {
        std::ostringstream ctx;
        ctx << card.describe() << " rating=" << static_cast<int>(rating)
            << " time=" << formatTimestamp(now);
        spdlog::error("Review failed: {} ({})", e.what(), ctx.str());
        throw ComputationError(std::string("Failed to review card: ") + e.what(), "review", ctx.str());
    }
}

int Scheduler::elapsedDaysBetween(std::time_t from, std::time_t to) {
    long long diff = std::llabs(static_cast<long long>(to) - static_cast<long long>(from));
    return static_cast<int>(diff / SECONDS_PER_DAY);
}

ModelParameters Scheduler::getParameters() const {
    return store.current();
}

RepairReport Scheduler::updateParameters(const ParameterOverrides& overrides) {
    return store.update(overrides);
}

SchedulerState Scheduler::getState() const {
    return { total_reviews, average_accuracy, store.current().w };
}

PerformanceMetrics Scheduler::getPerformanceMetrics() const {
    return { ENGINE_VERSION, execution_time_ms, total_reviews, average_accuracy };
}

void Scheduler::seedRandom(std::uint32_t seed) {
    rng.seed(seed);
}

void Scheduler::validateCard(const CardMemoryState& card) const {
    if (card.version != ENGINE_VERSION) {
        spdlog::error("Card version mismatch: expected {}, got '{}'", ENGINE_VERSION, card.version);
        throw VersionError(
            "Card version mismatch: expected " + std::string(ENGINE_VERSION) + ", got " + card.version,
            ENGINE_VERSION, card.version);
    }

    if (!std::isfinite(card.stability) || card.stability < 0) {
        spdlog::error("Rejecting card with stability {}", card.stability);
        throw ParameterError("Card stability must be a finite, non-negative number",
            "stability", std::to_string(card.stability));
    }

    // A New card has not been scored yet; anything else must carry a real difficulty
    bool difficulty_ok = std::isfinite(card.difficulty) &&
        (card.state == CardState::New ||
         (card.difficulty >= MemoryModel::MIN_DIFFICULTY && card.difficulty <= MemoryModel::MAX_DIFFICULTY));
    if (!difficulty_ok) {
        spdlog::error("Rejecting {} card with difficulty {}", toString(card.state), card.difficulty);
        throw ParameterError("Card difficulty must be within [1, 10]",
            "difficulty", std::to_string(card.difficulty));
    }
}

void Scheduler::validateRating(Rating rating) const {
    int value = static_cast<int>(rating);
    if (!isValidRating(value)) {
        throw ParameterError("Rating must be 1, 2, 3, or 4", "rating", std::to_string(value));
    }
}

void Scheduler::recordReview(Rating rating) {
    total_reviews++;
    double correct = isRecall(rating) ? 1.0 : 0.0;
    average_accuracy = (average_accuracy * (total_reviews - 1) + correct) / total_reviews;
}

void Scheduler::recordTiming(double ms) {
    execution_time_ms = (execution_time_ms + ms) / 2.0;
}
