// QX Analytics - Shared Numerics
// Normal distribution approximations and sample statistics

#pragma once

#include <qx/analytics/types.hpp>
#include <cmath>

namespace qx::analytics::math {

// =============================================================================
// Constants
// =============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double SQRT_2PI = 2.506628274631000502;
constexpr double SQRT_2 = 1.41421356237309504880;

// Below this magnitude a rate or pivot is treated as zero
constexpr double EPSILON = 1e-10;

// =============================================================================
// Standard Normal Distribution
// =============================================================================

// Standard normal CDF (Abramowitz & Stegun 7.1.26, |error| < 1.5e-7)
inline double norm_cdf(double x) noexcept {
    constexpr double a1 = 0.254829592;
    constexpr double a2 = -0.284496736;
    constexpr double a3 = 1.421413741;
    constexpr double a4 = -1.453152027;
    constexpr double a5 = 1.061405429;
    constexpr double p = 0.3275911;

    int sign = (x < 0) ? -1 : 1;
    x = std::abs(x) / SQRT_2;

    double t = 1.0 / (1.0 + p * x);
    double y = 1.0 - (((((a5 * t + a4) * t) + a3) * t + a2) * t + a1) * t * std::exp(-x * x);

    return 0.5 * (1.0 + sign * y);
}

// Standard normal PDF
inline double norm_pdf(double x) noexcept {
    return std::exp(-0.5 * x * x) / SQRT_2PI;
}

// =============================================================================
// Sample Statistics
// =============================================================================

double sum(const Vector& values) noexcept;

// Arithmetic mean; throws InvalidInputError on an empty series
double mean(const Vector& values);

// Sample variance with n-1 denominator; 0 for a single observation
double sample_variance(const Vector& values);

double sample_std_dev(const Vector& values);

}  // namespace qx::analytics::math
