#include "Card.hpp"
#include "Errors.hpp"
#include <iomanip>
#include <sstream>

bool isValidRating(int value) {
    return value >= static_cast<int>(Rating::Again) && value <= static_cast<int>(Rating::Easy);
}

Rating ratingFromInt(int value) {
    if (!isValidRating(value)) {
        throw ParameterError("Rating must be 1, 2, 3, or 4", "rating", std::to_string(value));
    }
    return static_cast<Rating>(value);
}

bool isRecall(Rating rating) {
    return static_cast<int>(rating) >= static_cast<int>(Rating::Good);
}

const char* toString(Rating rating) {
    switch (rating) {
    case Rating::Again: return "Again";
    case Rating::Hard: return "Hard";
    case Rating::Good: return "Good";
    case Rating::Easy: return "Easy";
    }
    return "Invalid";
}

const char* toString(CardState state) {
    switch (state) {
    case CardState::New: return "New";
    case CardState::Learning: return "Learning";
    case CardState::Review: return "Review";
    case CardState::Relearning: return "Relearning";
    }
    return "Invalid";
}

// UTC, ISO-8601 style
std::string formatTimestamp(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string CardMemoryState::describe() const {
    std::ostringstream oss;
    oss << "card{v=" << version
        << " state=" << toString(state)
        << " due=" << formatTimestamp(due)
        << " S=" << stability
        << " D=" << difficulty
        << " elapsed=" << elapsed_days
        << " scheduled=" << scheduled_days
        << " reps=" << reps
        << " lapses=" << lapses
        << " last_review=" << (last_review ? formatTimestamp(*last_review) : std::string("none"))
        << " R=" << retrievability
        << "}";
    return oss.str();
}
