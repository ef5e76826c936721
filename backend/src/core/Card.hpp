#pragma once
#include <string>
#include <ctime>
#include <optional>
#include <vector>

// Version stamped on every card produced by this engine
inline constexpr const char* ENGINE_VERSION = "6.1.1";
inline constexpr const char* ALGORITHM_NAME = "FSRS6";
inline constexpr int PARAMETER_COUNT = 21;
inline constexpr std::time_t SECONDS_PER_DAY = 24 * 60 * 60;

enum class Rating {
    Again = 1,
    Hard = 2,
    Good = 3,
    Easy = 4
};

enum class CardState {
    New = 0,
    Learning = 1,
    Review = 2,
    Relearning = 3
};

// Scheduling state of one learning item. Content lives with the host.
struct CardMemoryState {
    std::string version = ENGINE_VERSION;
    std::time_t due = 0;
    double stability = 0.0;       // days until retrievability decays to ~90%
    double difficulty = 0.0;      // [1..10]
    int elapsed_days = 0;         // days between the last two reviews
    int scheduled_days = 0;       // interval assigned at the last review
    int reps = 0;
    int lapses = 0;
    CardState state = CardState::New;
    std::optional<std::time_t> last_review;
    double retrievability = 1.0;

    // Present only when the matching extension is enabled
    std::optional<double> short_term_memory_factor;
    std::optional<double> long_term_stability_factor;

    // One-line dump used in logs and error contexts
    std::string describe() const;
};

// Immutable record of one review call. Pre-review values except where noted.
struct ReviewLogEntry {
    Rating rating = Rating::Good;
    CardState state = CardState::New;
    std::time_t due = 0;
    double stability = 0.0;
    double difficulty = 0.0;
    int elapsed_days = 0;         // days since the previous review of this card
    int last_elapsed_days = 0;    // the card's elapsed_days before this review
    int scheduled_days = 0;       // interval assigned by this review
    std::time_t review = 0;       // when the review happened

    // Filled in by hosts that measure answer latency; never synthesized here
    std::optional<double> response_time_ms;
};

using ReviewHistory = std::vector<ReviewLogEntry>;

bool isValidRating(int value);
Rating ratingFromInt(int value); // throws ParameterError outside 1..4
bool isRecall(Rating rating);    // Good or Easy

const char* toString(Rating rating);
const char* toString(CardState state);
std::string formatTimestamp(std::time_t t);
