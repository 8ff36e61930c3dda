// QX Analytics - Option Pricing Implementation

#include <qx/analytics/options.hpp>
#include <qx/analytics/error.hpp>
#include <qx/analytics/log.hpp>
#include <qx/analytics/math.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace qx::analytics::options {

namespace {

void validate_contract(double S, double K, double T, double sigma) {
    detail::require_positive(S, "spot");
    detail::require_positive(K, "strike");
    detail::require_positive(T, "time to expiry");
    detail::require_positive(sigma, "volatility");
}

double intrinsic(double spot, double K, OptionType type) noexcept {
    return type == OptionType::Call ? std::max(spot - K, 0.0) : std::max(K - spot, 0.0);
}

}  // namespace

// =============================================================================
// Black-Scholes
// =============================================================================

double d1(double S, double K, double T, double r, double sigma) {
    validate_contract(S, K, T, sigma);
    return (std::log(S / K) + (r + 0.5 * sigma * sigma) * T) / (sigma * std::sqrt(T));
}

double d2(double S, double K, double T, double r, double sigma) {
    return d1(S, K, T, r, sigma) - sigma * std::sqrt(T);
}

double black_scholes(
    double S, double K, double T, double r, double sigma, OptionType type) {
    double d_1 = d1(S, K, T, r, sigma);
    double d_2 = d_1 - sigma * std::sqrt(T);
    double discount = std::exp(-r * T);

    if (type == OptionType::Call) {
        return S * math::norm_cdf(d_1) - K * discount * math::norm_cdf(d_2);
    }
    return K * discount * math::norm_cdf(-d_2) - S * math::norm_cdf(-d_1);
}

// =============================================================================
// Binomial Lattice
// =============================================================================

double binomial_tree(
    double S, double K, double T, double r, double sigma,
    int steps, OptionType type, ExerciseStyle style) {
    validate_contract(S, K, T, sigma);
    if (steps <= 0) {
        throw InvalidInputError("lattice steps must be positive, got " + std::to_string(steps));
    }

    const double dt = T / steps;
    const double u = std::exp(sigma * std::sqrt(dt));
    const double d = 1.0 / u;
    const double p = (std::exp(r * dt) - d) / (u - d);
    const double discount = std::exp(-r * dt);
    const bool early_exercise = (style == ExerciseStyle::American);

    // Node i at level j has seen j-i up moves and i down moves: S * u^(j-2i)
    std::vector<double> values(steps + 1);
    for (int i = 0; i <= steps; ++i) {
        values[i] = intrinsic(S * std::pow(u, steps - 2 * i), K, type);
    }

    for (int j = steps - 1; j >= 0; --j) {
        for (int i = 0; i <= j; ++i) {
            double continuation = discount * (p * values[i] + (1.0 - p) * values[i + 1]);
            if (early_exercise) {
                double exercise = intrinsic(S * std::pow(u, j - 2 * i), K, type);
                values[i] = std::max(continuation, exercise);
            } else {
                values[i] = continuation;
            }
        }
    }

    return values[0];
}

double american_option(
    double S, double K, double T, double r, double sigma, int steps, OptionType type) {
    return binomial_tree(S, K, T, r, sigma, steps, type, ExerciseStyle::American);
}

double european_option(
    double S, double K, double T, double r, double sigma, int steps, OptionType type) {
    return binomial_tree(S, K, T, r, sigma, steps, type, ExerciseStyle::European);
}

// =============================================================================
// Greeks
// =============================================================================

double delta(double S, double K, double T, double r, double sigma, OptionType type) {
    double cdf_d1 = math::norm_cdf(d1(S, K, T, r, sigma));
    return type == OptionType::Call ? cdf_d1 : cdf_d1 - 1.0;
}

double gamma(double S, double K, double T, double r, double sigma) {
    double d_1 = d1(S, K, T, r, sigma);
    return math::norm_pdf(d_1) / (S * sigma * std::sqrt(T));
}

double theta(double S, double K, double T, double r, double sigma, OptionType type) {
    double d_1 = d1(S, K, T, r, sigma);
    double sqrt_T = std::sqrt(T);
    double d_2 = d_1 - sigma * sqrt_T;
    double decay = -S * math::norm_pdf(d_1) * sigma / (2.0 * sqrt_T);
    double carry = r * K * std::exp(-r * T);

    double annual = (type == OptionType::Call)
        ? decay - carry * math::norm_cdf(d_2)
        : decay + carry * math::norm_cdf(-d_2);
    return annual / 365.0;
}

double vega(double S, double K, double T, double r, double sigma) {
    double d_1 = d1(S, K, T, r, sigma);
    return S * math::norm_pdf(d_1) * std::sqrt(T) / 100.0;
}

double rho(double S, double K, double T, double r, double sigma, OptionType type) {
    double d_2 = d2(S, K, T, r, sigma);
    double pv_strike_T = K * T * std::exp(-r * T);

    if (type == OptionType::Call) {
        return pv_strike_T * math::norm_cdf(d_2) / 100.0;
    }
    return -pv_strike_T * math::norm_cdf(-d_2) / 100.0;
}

Greeks greeks(double S, double K, double T, double r, double sigma, OptionType type) {
    Greeks g;
    g.delta = delta(S, K, T, r, sigma, type);
    g.gamma = gamma(S, K, T, r, sigma);
    g.theta = theta(S, K, T, r, sigma, type);
    g.vega = vega(S, K, T, r, sigma);
    g.rho = rho(S, K, T, r, sigma, type);
    return g;
}

// =============================================================================
// Implied Volatility
// =============================================================================

SolverResult implied_volatility(
    double market_price, double S, double K, double T, double r,
    OptionType type, const ImpliedVolSettings& settings) {
    detail::require_positive(market_price, "market price");
    detail::require_positive(settings.lower, "volatility lower bound");
    detail::require(settings.upper > settings.lower,
                    "volatility upper bound must exceed lower bound");
    detail::require_positive(settings.tolerance, "tolerance");
    detail::require(settings.max_iterations > 0, "max_iterations must be positive");
    validate_contract(S, K, T, settings.lower);

    double low = settings.lower;
    double high = settings.upper;
    double mid = 0.5 * (low + high);

    for (int i = 0; i < settings.max_iterations; ++i) {
        mid = 0.5 * (low + high);
        double diff = black_scholes(S, K, T, r, mid, type) - market_price;

        if (std::abs(diff) < settings.tolerance) {
            return {mid, true, i + 1};
        }

        // Price is increasing in sigma
        if (diff > 0) {
            high = mid;
        } else {
            low = mid;
        }
    }

    if (log_enabled(LogLevel::Warn)) {
        log_warn("implied_volatility",
                 "no convergence after " + std::to_string(settings.max_iterations) +
                 " iterations, returning sigma=" + std::to_string(mid));
    }
    return {mid, false, settings.max_iterations};
}

}  // namespace qx::analytics::options
