#ifndef PROFORMA_ERRORS_HPP
#define PROFORMA_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace proforma {

// Bad scenario inputs, detected before any projection runs
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Malformed JSON/CSV payload or missing required field
class ConfigParseError : public ValidationError {
public:
    explicit ConfigParseError(const std::string& message)
        : ValidationError(message) {}
};

// Base for numeric failures that must never be defaulted to zero
class NumericError : public std::runtime_error {
public:
    explicit NumericError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConvergenceError : public NumericError {
public:
    explicit ConvergenceError(const std::string& message)
        : NumericError(message) {}
};

// Empty series, or cash flows that never change sign
class DegenerateCashFlowError : public NumericError {
public:
    explicit DegenerateCashFlowError(const std::string& message)
        : NumericError(message) {}
};

class DivideByZeroError : public NumericError {
public:
    explicit DivideByZeroError(const std::string& message)
        : NumericError(message) {}
};

class RateCurveRangeError : public NumericError {
public:
    explicit RateCurveRangeError(const std::string& message)
        : NumericError(message) {}
};

// Broken internal state (negative loan balance, negative tier cash).
// Fatal for the run; never converted into a response.
class InvariantViolation : public std::runtime_error {
public:
    explicit InvariantViolation(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace proforma

#endif // PROFORMA_ERRORS_HPP
