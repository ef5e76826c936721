#include "Parameters.hpp"
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace ParameterDefaults
{
    const std::array<double, PARAMETER_COUNT>& weights() {
        static const std::array<double, PARAMETER_COUNT> Default = {
            0.212, 1.2931, 2.3065, 8.2956, 6.4133, 0.8334, 3.0194, 0.001, 1.8722,
            0.1666, 0.796, 1.4835, 0.0614, 0.2629, 1.6483, 0.6014, 1.8729,
            0.5425, 0.0912, 0.0658, 0.1542
        };
        return Default;
    }

    const std::array<WeightRange, PARAMETER_COUNT>& ranges() {
        static const std::array<WeightRange, PARAMETER_COUNT> Ranges = { {
            {0.1, 2.0},   // w0  initial stability: Again
            {0.5, 3.0},   // w1  initial stability: Hard
            {1.0, 5.0},   // w2  initial stability: Good
            {3.0, 15.0},  // w3  initial stability: Easy
            {3.0, 10.0},  // w4  initial difficulty
            {0.5, 2.0},   // w5
            {0.5, 5.0},   // w6  difficulty step
            {0.0, 0.5},   // w7
            {0.5, 3.0},   // w8  recall growth
            {0.0, 1.0},   // w9
            {0.5, 2.0},   // w10 forget stability
            {0.5, 3.0},   // w11
            {0.0, 2.0},   // w12
            {0.0, 1.0},   // w13
            {0.0, 2.0},   // w14
            {0.5, 1.5},   // w15 hard penalty
            {1.0, 3.0},   // w16 easy bonus
            {0.0, 1.0},   // w17 short-term memory
            {0.0, 0.5},   // w18
            {0.0, 0.5},   // w19 long-term stability
            {0.0, 0.5}    // w20
        } };
        return Ranges;
    }
}

ModelParameters ModelParameters::defaults() {
    ModelParameters p;
    const auto& w = ParameterDefaults::weights();
    p.w.assign(w.begin(), w.end());
    return p;
}

ParameterStore::ParameterStore(const ParameterOverrides& overrides) {
    initialize(overrides);
}

RepairReport ParameterStore::initialize(const ParameterOverrides& overrides) {
    params = ModelParameters::defaults();
    merge(params, overrides);
    auto report = validate();
    spdlog::info("ParameterStore initialized (retention={}, max_interval={}, fuzz={}, repaired={})",
        params.request_retention, params.maximum_interval, params.enable_fuzz, report.repaired.size());
    return report;
}

bool ParameterStore::weightInRange(std::size_t index, double value) {
    if (index >= PARAMETER_COUNT || std::isnan(value)) return false;
    const auto& range = ParameterDefaults::ranges()[index];
    return value >= range.min && value <= range.max;
}

RepairReport ParameterStore::validate() {
    RepairReport report;
    const auto& defaults = ParameterDefaults::weights();

    if (params.w.size() != PARAMETER_COUNT) {
        spdlog::warn("Parameter count mismatch: expected {}, got {}. Using default weights.",
            PARAMETER_COUNT, params.w.size());
        params.w.assign(defaults.begin(), defaults.end());
        report.repaired.push_back("w");
    }

    for (std::size_t i = 0; i < params.w.size(); ++i) {
        if (!weightInRange(i, params.w[i])) {
            const auto& range = ParameterDefaults::ranges()[i];
            spdlog::warn("Weight w{} ({}) outside [{}, {}]. Using default {}.",
                i, params.w[i], range.min, range.max, defaults[i]);
            params.w[i] = defaults[i];
            report.repaired.push_back("w" + std::to_string(i));
        }
    }

    if (std::isnan(params.request_retention) ||
        params.request_retention < ParameterDefaults::MIN_REQUEST_RETENTION ||
        params.request_retention > ParameterDefaults::MAX_REQUEST_RETENTION) {
        spdlog::warn("Invalid request retention {}. Using default {}.",
            params.request_retention, ParameterDefaults::REQUEST_RETENTION);
        params.request_retention = ParameterDefaults::REQUEST_RETENTION;
        report.repaired.push_back("requestRetention");
    }

    if (params.maximum_interval < 1 || params.maximum_interval > ParameterDefaults::MAX_MAXIMUM_INTERVAL) {
        spdlog::warn("Invalid maximum interval {}. Using default {}.",
            params.maximum_interval, ParameterDefaults::MAXIMUM_INTERVAL);
        params.maximum_interval = ParameterDefaults::MAXIMUM_INTERVAL;
        report.repaired.push_back("maximumInterval");
    }

    return report;
}

RepairReport ParameterStore::update(const ParameterOverrides& overrides) {
    merge(params, overrides);
    auto report = validate();
    spdlog::info("Parameters updated (repaired={})", report.repaired.size());
    return report;
}

void ParameterStore::merge(ModelParameters& target, const ParameterOverrides& o) {
    if (o.w) target.w = *o.w;
    if (o.request_retention) target.request_retention = *o.request_retention;
    if (o.maximum_interval) target.maximum_interval = *o.maximum_interval;
    if (o.enable_fuzz) target.enable_fuzz = *o.enable_fuzz;
    if (o.short_term_memory_enabled) target.short_term_memory_enabled = *o.short_term_memory_enabled;
    if (o.long_term_stability_enabled) target.long_term_stability_enabled = *o.long_term_stability_enabled;
}

/* -------------------------
   Text form
   -------------------------
   One "key:value" per line, same layout the host uses for its settings blob.
   Weight keys are w0..w20; a weight key seeds the vector from the defaults
   so a single line can override a single weight.
*/
static std::string trim(const std::string& s) {
    std::string t = s;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}

// Whole-string conversions; trailing characters are an error
static double parseDouble(const std::string& v) {
    std::size_t pos = 0;
    double d = std::stod(v, &pos);
    if (pos != v.size()) throw std::invalid_argument("trailing characters in '" + v + "'");
    return d;
}

static int parseInt(const std::string& v) {
    std::size_t pos = 0;
    int i = std::stoi(v, &pos);
    if (pos != v.size()) throw std::invalid_argument("trailing characters in '" + v + "'");
    return i;
}

static std::size_t parseIndex(const std::string& v) {
    std::size_t pos = 0;
    std::size_t i = std::stoul(v, &pos);
    if (pos != v.size()) throw std::invalid_argument("trailing characters in '" + v + "'");
    return i;
}

static std::optional<bool> parseBool(const std::string& v) {
    if (v == "true" || v == "1") return true;
    if (v == "false" || v == "0") return false;
    return std::nullopt;
}

ParameterOverrides parseOverrides(const std::string& text) {
    ParameterOverrides out;
    std::istringstream iss(text);
    std::string line;

    while (std::getline(iss, line)) {
        auto pos = line.find(':');
        if (pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        if (key.empty() || val.empty()) continue;

        try {
            if (key.size() > 1 && key[0] == 'w' && std::isdigit((unsigned char)key[1])) {
                std::size_t index = parseIndex(key.substr(1));
                if (index >= PARAMETER_COUNT) {
                    spdlog::warn("Ignoring override '{}': no such weight", key);
                    continue;
                }
                double value = parseDouble(val);
                if (!out.w) {
                    const auto& d = ParameterDefaults::weights();
                    out.w = std::vector<double>(d.begin(), d.end());
                }
                (*out.w)[index] = value;
            }
            else if (key == "requestRetention") {
                out.request_retention = parseDouble(val);
            }
            else if (key == "maximumInterval") {
                out.maximum_interval = parseInt(val);
            }
            else if (key == "enableFuzz" || key == "shortTermMemoryEnabled" || key == "longTermStabilityEnabled") {
                auto b = parseBool(val);
                if (!b) {
                    spdlog::warn("Ignoring override '{}': '{}' is not a boolean", key, val);
                    continue;
                }
                if (key == "enableFuzz") out.enable_fuzz = b;
                else if (key == "shortTermMemoryEnabled") out.short_term_memory_enabled = b;
                else out.long_term_stability_enabled = b;
            }
            else {
                spdlog::warn("Ignoring unknown override key '{}'", key);
            }
        }
        catch (const std::exception& e) {
            spdlog::warn("Ignoring override line '{}': {}", line, e.what());
            continue;
        }
    }
    return out;
}

std::string serializeParameters(const ModelParameters& p) {
    std::ostringstream oss;
    oss.precision(17);
    for (std::size_t i = 0; i < p.w.size(); ++i) {
        oss << "w" << i << ":" << p.w[i] << "\n";
    }
    oss << "requestRetention:" << p.request_retention << "\n"
        << "maximumInterval:" << p.maximum_interval << "\n"
        << "enableFuzz:" << (p.enable_fuzz ? "true" : "false") << "\n"
        << "shortTermMemoryEnabled:" << (p.short_term_memory_enabled ? "true" : "false") << "\n"
        << "longTermStabilityEnabled:" << (p.long_term_stability_enabled ? "true" : "false") << "\n";
    return oss.str();
}
