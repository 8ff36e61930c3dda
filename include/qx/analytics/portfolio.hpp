// QX Analytics - Portfolio Optimization
// Mean-variance metrics, weight constraints and random-search optimizers

#pragma once

#include <qx/analytics/random.hpp>
#include <qx/analytics/types.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace qx::analytics::portfolio {

// Weights must sum to 1 within this tolerance to be feasible
constexpr double WEIGHT_SUM_TOLERANCE = 0.01;

// =============================================================================
// Weight Constraints
// =============================================================================

struct WeightConstraints {
    bool long_only = false;
    std::optional<double> min_weight;   // Applies to every asset
    std::optional<double> max_weight;
    std::optional<Vector> min;          // Per-asset lower bounds
    std::optional<Vector> max;          // Per-asset upper bounds

    WeightConstraints& with_long_only(bool v = true) { long_only = v; return *this; }
    WeightConstraints& with_min_weight(double v) { min_weight = v; return *this; }
    WeightConstraints& with_max_weight(double v) { max_weight = v; return *this; }
    WeightConstraints& with_min(Vector v) { min = std::move(v); return *this; }
    WeightConstraints& with_max(Vector v) { max = std::move(v); return *this; }
};

// True only if the weights sum to 1 (within WEIGHT_SUM_TOLERANCE) and every
// bound holds. A per-asset bound vector of the wrong length never holds.
[[nodiscard]] bool satisfies_constraints(const Vector& weights, const WeightConstraints& c) noexcept;

// Scales weights to sum to 1; zero sum raises UndefinedError
Vector normalize_weights(const Vector& weights);

// Clamps each weight into [lo, hi], then normalizes
Vector clip_weights(const Vector& weights, double lo = 0.0, double hi = 1.0);

// =============================================================================
// Portfolio Metrics
// =============================================================================

double expected_return(const Vector& returns, const Vector& weights);

// w' * cov * w
double variance(const Matrix& covariance, const Vector& weights);

double volatility(const Matrix& covariance, const Vector& weights);

// (R - rf) / sigma, 0 when sigma is 0
double sharpe_ratio(const Vector& returns, const Matrix& covariance, const Vector& weights,
                    double risk_free_rate = 0.0);

// =============================================================================
// Optimizers
// =============================================================================

struct PortfolioResult {
    Vector weights;
    double expected_return = 0.0;
    double variance = 0.0;
    double volatility = 0.0;
    std::optional<double> sharpe_ratio;  // Set by the max-Sharpe search only
};

struct OptimizerSettings {
    int iterations = 10000;
    double step = 0.01;  // Each weight moves by (u - 0.5) * step per trial
};

struct MarkowitzParams {
    Vector returns;      // Expected return per asset; may be empty for min-variance
    Matrix covariance;
    double risk_free_rate = 0.0;
    std::optional<WeightConstraints> constraints;
    OptimizerSettings settings;
};

// Random local search. Each trial perturbs every weight, renormalizes,
// discards constraint violations and keeps the candidate if it improves the
// objective. A stochastic heuristic: results are near-optimal, not exact.
PortfolioResult max_sharpe_portfolio(const MarkowitzParams& params, RandomSource& rng);

PortfolioResult min_variance_portfolio(const MarkowitzParams& params, RandomSource& rng);

// Accepts a candidate only if it is strictly closer to the target return
// and has strictly lower variance than the incumbent.
PortfolioResult target_return_portfolio(const MarkowitzParams& params, double target_return,
                                        RandomSource& rng);

// Accepts a candidate only if its variance is strictly closer to
// target_risk^2 and its expected return is strictly higher.
PortfolioResult target_risk_portfolio(const MarkowitzParams& params, double target_risk,
                                      RandomSource& rng);

// Target return, target risk, or max Sharpe when neither is given.
// Supplying both raises InvalidInputError.
PortfolioResult optimize_portfolio(const MarkowitzParams& params, RandomSource& rng,
                                   std::optional<double> target_return = std::nullopt,
                                   std::optional<double> target_risk = std::nullopt);

// Target-return portfolios at num_portfolios evenly spaced targets between
// the lowest and highest single-asset expected return
std::vector<PortfolioResult> efficient_frontier(const MarkowitzParams& params, RandomSource& rng,
                                                int num_portfolios = 20);

// =============================================================================
// Holdings
// =============================================================================

struct Holding {
    double price = 0.0;
    double quantity = 0.0;

    [[nodiscard]] double value() const noexcept { return price * quantity; }
};

double portfolio_value(const std::vector<Holding>& holdings);

// Market-value weights; all zeros when the book has no value
Vector holding_weights(const std::vector<Holding>& holdings);

// Period return between two valuations of the same book; previous_value
// of 0 raises UndefinedError
double holdings_return(double current_value, double previous_value);

// Sum of returns[i] * weights[i]; weights must sum to 1
double weighted_return(const Vector& returns, const Vector& weights);

}  // namespace qx::analytics::portfolio
