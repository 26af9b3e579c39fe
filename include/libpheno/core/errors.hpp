#pragma once

#include <stdexcept>
#include <string>

namespace pheno {

// Unknown model or optimizer method, malformed parameter ranges, bounds
// mismatch. Never retried.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

// A model evaluator rejected the parameter vector or the driver data.
class EvaluationError : public std::runtime_error {
public:
    explicit EvaluationError(const std::string& what) : std::runtime_error(what) {}
};

// No usable (non-missing) measured value left after exclusion.
class InsufficientDataError : public std::runtime_error {
public:
    explicit InsufficientDataError(const std::string& what) : std::runtime_error(what) {}
};

// An optimizer backend produced a parameter vector outside its bounds.
class ConstraintViolationError : public std::runtime_error {
public:
    explicit ConstraintViolationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace pheno
