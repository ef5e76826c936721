#pragma once
#include <array>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "Card.hpp"

struct WeightRange {
    double min;
    double max;
};

namespace ParameterDefaults
{
    inline constexpr double REQUEST_RETENTION = 0.9;
    inline constexpr double MIN_REQUEST_RETENTION = 0.5;
    inline constexpr double MAX_REQUEST_RETENTION = 0.99;
    inline constexpr int MAXIMUM_INTERVAL = 365;      // one year, user adjustable
    inline constexpr int MAX_MAXIMUM_INTERVAL = 1825; // five years
    inline constexpr bool ENABLE_FUZZ = true;
    inline constexpr bool SHORT_TERM_MEMORY_ENABLED = true;
    inline constexpr bool LONG_TERM_STABILITY_ENABLED = true;

    const std::array<double, PARAMETER_COUNT>& weights();
    const std::array<WeightRange, PARAMETER_COUNT>& ranges();
}

/*
  Model configuration. w[0..3] initial stability per rating, w[4..7] difficulty,
  w[8..16] stability after recall/lapse, w[17..18] short-term memory,
  w[19..20] long-term stability.
*/
struct ModelParameters {
    std::vector<double> w;
    double request_retention = ParameterDefaults::REQUEST_RETENTION;
    int maximum_interval = ParameterDefaults::MAXIMUM_INTERVAL;
    bool enable_fuzz = ParameterDefaults::ENABLE_FUZZ;
    bool short_term_memory_enabled = ParameterDefaults::SHORT_TERM_MEMORY_ENABLED;
    bool long_term_stability_enabled = ParameterDefaults::LONG_TERM_STABILITY_ENABLED;

    static ModelParameters defaults();
};

// Partial update; unset fields keep their current value
struct ParameterOverrides {
    std::optional<std::vector<double>> w;
    std::optional<double> request_retention;
    std::optional<int> maximum_interval;
    std::optional<bool> enable_fuzz;
    std::optional<bool> short_term_memory_enabled;
    std::optional<bool> long_term_stability_enabled;
};

// Names of the fields validate() had to reset to defaults
struct RepairReport {
    std::vector<std::string> repaired;
    bool clean() const { return repaired.empty(); }
};

class ParameterStore {
public:
    explicit ParameterStore(const ParameterOverrides& overrides = {});

    // Defaults merged with overrides, then validated
    RepairReport initialize(const ParameterOverrides& overrides);

    // Never throws. Out-of-range values are replaced by their defaults.
    RepairReport validate();

    RepairReport update(const ParameterOverrides& overrides);

    const ModelParameters& current() const { return params; }

    static bool weightInRange(std::size_t index, double value);

private:
    static void merge(ModelParameters& target, const ParameterOverrides& overrides);

    ModelParameters params;
};

// "key:value" lines, e.g. "w17:0.6\nrequestRetention:0.85". Bad lines are skipped.
ParameterOverrides parseOverrides(const std::string& text);
std::string serializeParameters(const ModelParameters& params);
