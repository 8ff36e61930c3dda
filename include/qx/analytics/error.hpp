// QX Analytics - Errors
// Fail-fast domain errors raised by every calculation module

#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace qx::analytics {

// Closed set of error kinds. Solver non-convergence is not an error:
// it is reported through SolverResult::converged.
enum class ErrorKind : uint8_t {
    InvalidInput = 0,  // Caller supplied values outside the function's domain
    Undefined = 1      // Inputs are valid but the result is mathematically undefined
};

inline constexpr const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidInput: return "invalid_input";
        case ErrorKind::Undefined: return "undefined";
    }
    return "unknown";
}

class AnalyticsError : public std::runtime_error {
public:
    AnalyticsError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidInputError : public AnalyticsError {
public:
    explicit InvalidInputError(const std::string& msg)
        : AnalyticsError(ErrorKind::InvalidInput, msg) {}
};

class UndefinedError : public AnalyticsError {
public:
    explicit UndefinedError(const std::string& msg)
        : AnalyticsError(ErrorKind::Undefined, msg) {}
};

namespace detail {

inline void require(bool condition, const std::string& msg) {
    if (!condition) throw InvalidInputError(msg);
}

inline void require_positive(double value, const char* name) {
    if (!(value > 0.0)) {
        throw InvalidInputError(std::string(name) + " must be positive, got " +
                                std::to_string(value));
    }
}

inline void require_finite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw InvalidInputError(std::string(name) + " must be finite");
    }
}

// Open interval (0, 1): confidence levels, discount rates
inline void require_unit_interval(double value, const char* name) {
    if (!(value > 0.0 && value < 1.0)) {
        throw InvalidInputError(std::string(name) + " must be in (0, 1), got " +
                                std::to_string(value));
    }
}

template <typename Container>
inline void require_non_empty(const Container& c, const char* name) {
    if (c.empty()) throw InvalidInputError(std::string(name) + " must not be empty");
}

inline void require_same_size(size_t a, size_t b, const char* what) {
    if (a != b) {
        throw InvalidInputError(std::string(what) + ": length mismatch (" +
                                std::to_string(a) + " vs " + std::to_string(b) + ")");
    }
}

}  // namespace detail

}  // namespace qx::analytics
