#pragma once
#include <stdexcept>
#include <string>
#include <utility>

// Base of every error the engine raises. `code` is a stable machine-readable tag.
class SchedulerError : public std::runtime_error {
public:
    SchedulerError(const std::string& message, std::string code)
        : std::runtime_error(message), code_(std::move(code)) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

// Malformed input that cannot be auto-repaired (e.g. a rating outside 1..4).
class ParameterError : public SchedulerError {
public:
    ParameterError(const std::string& message, std::string parameter, std::string value)
        : SchedulerError(message, "PARAMETER_ERROR"),
        parameter_(std::move(parameter)),
        value_(std::move(value)) {}

    const std::string& parameter() const { return parameter_; }
    const std::string& value() const { return value_; }

private:
    std::string parameter_;
    std::string value_;
};

// Card produced by an incompatible engine version.
class VersionError : public SchedulerError {
public:
    VersionError(const std::string& message, std::string expected, std::string actual)
        : SchedulerError(message, "VERSION_MISMATCH"),
        expected_(std::move(expected)),
        actual_(std::move(actual)) {}

    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

// Unexpected failure inside a computation. Carries the failing operation and
// a textual dump of the input that triggered it.
class ComputationError : public SchedulerError {
public:
    ComputationError(const std::string& message, std::string operation, std::string input)
        : SchedulerError(message, "COMPUTATION_ERROR"),
        operation_(std::move(operation)),
        input_(std::move(input)) {}

    const std::string& operation() const { return operation_; }
    const std::string& input() const { return input_; }

private:
    std::string operation_;
    std::string input_;
};
