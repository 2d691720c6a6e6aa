#pragma once
#ifndef ECORISK_AI_ERRORS_H
#define ECORISK_AI_ERRORS_H

#include <stdexcept>
#include <string>

namespace ecorisk {
namespace ai {

// Too few snapshots for windowing, training or forecasting
class InsufficientDataError : public std::runtime_error {
public:
    explicit InsufficientDataError(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed request shape or out-of-range argument
class InvalidInputError : public std::runtime_error {
public:
    explicit InvalidInputError(const std::string& msg) : std::runtime_error(msg) {}
};

// Scaling or classifier evaluation failed. Recovered by the heuristic path.
class InferenceFailure : public std::runtime_error {
public:
    explicit InferenceFailure(const std::string& msg) : std::runtime_error(msg) {}
};

// Fitting the classifier failed. Reported as a failed TrainingReport.
class TrainingFailure : public std::runtime_error {
public:
    explicit TrainingFailure(const std::string& msg) : std::runtime_error(msg) {}
};

// Stored artifact unreadable or could not be written
class ModelStoreError : public std::runtime_error {
public:
    explicit ModelStoreError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace ai
} // namespace ecorisk

#endif // ECORISK_AI_ERRORS_H
