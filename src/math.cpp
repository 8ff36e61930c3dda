// QX Analytics - Shared Numerics Implementation

#include <qx/analytics/math.hpp>
#include <qx/analytics/error.hpp>
#include <numeric>

namespace qx::analytics::math {

double sum(const Vector& values) noexcept {
    return std::accumulate(values.begin(), values.end(), 0.0);
}

double mean(const Vector& values) {
    detail::require_non_empty(values, "values");
    return sum(values) / values.size();
}

double sample_variance(const Vector& values) {
    detail::require_non_empty(values, "values");
    if (values.size() == 1) return 0.0;

    double m = mean(values);
    double variance = 0.0;
    for (double v : values) {
        double diff = v - m;
        variance += diff * diff;
    }
    return variance / (values.size() - 1);
}

double sample_std_dev(const Vector& values) {
    return std::sqrt(sample_variance(values));
}

}  // namespace qx::analytics::math
