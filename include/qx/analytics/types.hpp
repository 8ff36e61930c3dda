// QX Analytics - Core Types
// Plain value types shared by every module

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace qx::analytics {

using Vector = std::vector<double>;
using Matrix = std::vector<Vector>;

// Option right
enum class OptionType : uint8_t {
    Call = 0,
    Put = 1
};

inline constexpr const char* to_string(OptionType t) noexcept {
    return t == OptionType::Call ? "call" : "put";
}

inline std::optional<OptionType> option_type_from_string(std::string_view s) noexcept {
    if (s == "call" || s == "c") return OptionType::Call;
    if (s == "put" || s == "p") return OptionType::Put;
    return std::nullopt;
}

// Exercise policy for lattice pricing
enum class ExerciseStyle : uint8_t {
    European = 0,
    American = 1
};

inline constexpr const char* to_string(ExerciseStyle s) noexcept {
    return s == ExerciseStyle::European ? "european" : "american";
}

inline std::optional<ExerciseStyle> exercise_style_from_string(std::string_view s) noexcept {
    if (s == "european") return ExerciseStyle::European;
    if (s == "american") return ExerciseStyle::American;
    return std::nullopt;
}

// Outcome of an iterative root-finder. When converged is false the value
// is the solver's last estimate, not a solution.
struct SolverResult {
    double value = 0.0;
    bool converged = false;
    int iterations = 0;
};

}  // namespace qx::analytics
