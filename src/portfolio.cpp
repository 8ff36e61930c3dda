// QX Analytics - Portfolio Optimization Implementation

#include <qx/analytics/portfolio.hpp>
#include <qx/analytics/error.hpp>
#include <qx/analytics/log.hpp>
#include <qx/analytics/math.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace qx::analytics::portfolio {

namespace {

void validate_covariance(const Matrix& covariance, size_t n) {
    detail::require_same_size(covariance.size(), n, "covariance matrix vs weights");
    for (const auto& row : covariance) {
        detail::require_same_size(row.size(), n, "covariance matrix must be square");
    }
}

void validate_problem(const MarkowitzParams& p, bool needs_returns) {
    detail::require_non_empty(p.covariance, "covariance matrix");
    const size_t n = p.covariance.size();
    validate_covariance(p.covariance, n);

    if (needs_returns || !p.returns.empty()) {
        detail::require_same_size(p.returns.size(), n, "returns vs covariance matrix");
    }
    detail::require(p.settings.iterations >= 0, "optimizer iterations must be non-negative");
    detail::require_positive(p.settings.step, "optimizer step");
}

// Every asset at its lowest legal weight, then the remainder shared out
// equally among assets with headroom until the caps or a total of 1 is reached.
// Without bounds this is the equal-weight portfolio.
Vector starting_weights(size_t n, const std::optional<WeightConstraints>& constraints) {
    Vector w(n, 1.0 / static_cast<double>(n));
    if (!constraints) {
        return w;
    }

    const auto& c = *constraints;
    if (c.min) detail::require_same_size(c.min->size(), n, "per-asset minimum weights");
    if (c.max) detail::require_same_size(c.max->size(), n, "per-asset maximum weights");

    constexpr double inf = std::numeric_limits<double>::infinity();
    Vector lo(n, -inf);
    Vector hi(n, inf);
    size_t unbounded_below = 0;
    for (size_t i = 0; i < n; ++i) {
        if (c.long_only) lo[i] = 0.0;
        if (c.min_weight) lo[i] = std::max(lo[i], *c.min_weight);
        if (c.min) lo[i] = std::max(lo[i], (*c.min)[i]);
        if (c.max_weight) hi[i] = std::min(hi[i], *c.max_weight);
        if (c.max) hi[i] = std::min(hi[i], (*c.max)[i]);

        if (lo[i] > hi[i]) {
            throw InvalidInputError("weight bounds for asset " + std::to_string(i) + " are empty");
        }
        if (std::isinf(lo[i])) {
            w[i] = std::min(0.0, hi[i]);
            ++unbounded_below;
        } else {
            w[i] = lo[i];
        }
    }

    double remaining = 1.0 - math::sum(w);
    if (remaining < 0.0 && unbounded_below > 0) {
        double share = remaining / static_cast<double>(unbounded_below);
        for (size_t i = 0; i < n; ++i) {
            if (std::isinf(lo[i])) w[i] += share;
        }
        remaining = 0.0;
    }
    if (remaining < -WEIGHT_SUM_TOLERANCE) {
        throw InvalidInputError("minimum weights sum to more than 1");
    }

    // Each pass either places the whole remainder or caps at least one asset
    while (remaining > math::EPSILON) {
        size_t open = 0;
        for (size_t i = 0; i < n; ++i) {
            if (hi[i] - w[i] > math::EPSILON) ++open;
        }
        if (open == 0) {
            break;
        }

        double share = remaining / static_cast<double>(open);
        for (size_t i = 0; i < n; ++i) {
            if (hi[i] - w[i] > math::EPSILON) {
                double add = std::min(share, hi[i] - w[i]);
                w[i] += add;
                remaining -= add;
            }
        }
    }
    if (remaining > WEIGHT_SUM_TOLERANCE) {
        throw InvalidInputError("maximum weights sum to less than 1");
    }

    if (!satisfies_constraints(w, c)) {
        throw InvalidInputError("no feasible starting weights for the given constraints");
    }
    return w;
}

// Perturbs and renormalizes; nullopt when the perturbed weights sum to zero
std::optional<Vector> perturb(const Vector& w, double step, RandomSource& rng) {
    Vector out(w.size());
    double total = 0.0;
    for (size_t i = 0; i < w.size(); ++i) {
        out[i] = w[i] + (rng.next_uniform() - 0.5) * step;
        total += out[i];
    }
    if (std::abs(total) < math::EPSILON) {
        return std::nullopt;
    }
    for (double& x : out) x /= total;
    return out;
}

// Shared search loop. accept(candidate) decides whether the candidate
// replaces the incumbent and updates the objective's own state when it does.
template <typename Accept>
Vector random_search(const MarkowitzParams& p, RandomSource& rng, const char* name,
                     Vector best, Accept accept) {
    int accepted = 0;
    int rejected = 0;

    for (int iter = 0; iter < p.settings.iterations; ++iter) {
        auto candidate = perturb(best, p.settings.step, rng);
        if (!candidate) {
            continue;
        }
        if (p.constraints && !satisfies_constraints(*candidate, *p.constraints)) {
            ++rejected;
            continue;
        }
        if (accept(*candidate)) {
            best = std::move(*candidate);
            ++accepted;
        }
    }

    if (log_enabled(LogLevel::Debug)) {
        log_debug(name, "accepted " + std::to_string(accepted) + " of " +
                  std::to_string(p.settings.iterations) + " trials (" +
                  std::to_string(rejected) + " infeasible)");
    }
    return best;
}

double portfolio_return(const MarkowitzParams& p, const Vector& w) {
    return p.returns.empty() ? 0.0 : expected_return(p.returns, w);
}

PortfolioResult make_result(const MarkowitzParams& p, Vector weights) {
    PortfolioResult result;
    result.expected_return = portfolio_return(p, weights);
    result.variance = variance(p.covariance, weights);
    result.volatility = std::sqrt(std::max(result.variance, 0.0));
    result.weights = std::move(weights);
    return result;
}

}  // namespace

// =============================================================================
// Weight Constraints
// =============================================================================

bool satisfies_constraints(const Vector& weights, const WeightConstraints& c) noexcept {
    double total = 0.0;
    for (double w : weights) total += w;
    if (std::abs(total - 1.0) > WEIGHT_SUM_TOLERANCE) {
        return false;
    }

    if (c.min && c.min->size() != weights.size()) return false;
    if (c.max && c.max->size() != weights.size()) return false;

    for (size_t i = 0; i < weights.size(); ++i) {
        double w = weights[i];
        if (c.long_only && w < 0.0) return false;
        if (c.min_weight && w < *c.min_weight) return false;
        if (c.max_weight && w > *c.max_weight) return false;
        if (c.min && w < (*c.min)[i]) return false;
        if (c.max && w > (*c.max)[i]) return false;
    }
    return true;
}

Vector normalize_weights(const Vector& weights) {
    double total = math::sum(weights);
    if (total == 0.0) {
        throw UndefinedError("cannot normalize weights that sum to zero");
    }

    Vector out(weights.size());
    for (size_t i = 0; i < weights.size(); ++i) {
        out[i] = weights[i] / total;
    }
    return out;
}

Vector clip_weights(const Vector& weights, double lo, double hi) {
    detail::require(lo <= hi, "clip bounds must satisfy lo <= hi");

    Vector clipped(weights.size());
    for (size_t i = 0; i < weights.size(); ++i) {
        clipped[i] = std::clamp(weights[i], lo, hi);
    }
    return normalize_weights(clipped);
}

// =============================================================================
// Portfolio Metrics
// =============================================================================

double expected_return(const Vector& returns, const Vector& weights) {
    detail::require_same_size(returns.size(), weights.size(), "returns vs weights");

    double r = 0.0;
    for (size_t i = 0; i < returns.size(); ++i) {
        r += returns[i] * weights[i];
    }
    return r;
}

double variance(const Matrix& covariance, const Vector& weights) {
    const size_t n = weights.size();
    validate_covariance(covariance, n);

    double v = 0.0;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            v += weights[i] * weights[j] * covariance[i][j];
        }
    }
    return v;
}

double volatility(const Matrix& covariance, const Vector& weights) {
    return std::sqrt(std::max(variance(covariance, weights), 0.0));
}

double sharpe_ratio(const Vector& returns, const Matrix& covariance, const Vector& weights,
                    double risk_free_rate) {
    double r = expected_return(returns, weights);
    double vol = volatility(covariance, weights);
    if (vol == 0.0) {
        return 0.0;
    }
    return (r - risk_free_rate) / vol;
}

// =============================================================================
// Optimizers
// =============================================================================

PortfolioResult max_sharpe_portfolio(const MarkowitzParams& params, RandomSource& rng) {
    validate_problem(params, true);

    Vector start = starting_weights(params.covariance.size(), params.constraints);
    double best_sharpe = sharpe_ratio(params.returns, params.covariance, start,
                                      params.risk_free_rate);

    Vector best = random_search(params, rng, "max_sharpe", std::move(start),
        [&](const Vector& w) {
            double s = sharpe_ratio(params.returns, params.covariance, w, params.risk_free_rate);
            if (s > best_sharpe) {
                best_sharpe = s;
                return true;
            }
            return false;
        });

    PortfolioResult result = make_result(params, std::move(best));
    result.sharpe_ratio = best_sharpe;
    return result;
}

PortfolioResult min_variance_portfolio(const MarkowitzParams& params, RandomSource& rng) {
    validate_problem(params, false);

    Vector start = starting_weights(params.covariance.size(), params.constraints);
    double best_var = variance(params.covariance, start);

    Vector best = random_search(params, rng, "min_variance", std::move(start),
        [&](const Vector& w) {
            double v = variance(params.covariance, w);
            if (v < best_var) {
                best_var = v;
                return true;
            }
            return false;
        });

    return make_result(params, std::move(best));
}

PortfolioResult target_return_portfolio(const MarkowitzParams& params, double target_return,
                                        RandomSource& rng) {
    validate_problem(params, true);
    detail::require_finite(target_return, "target return");

    Vector start = starting_weights(params.covariance.size(), params.constraints);
    double best_gap = std::abs(expected_return(params.returns, start) - target_return);
    double best_var = variance(params.covariance, start);

    Vector best = random_search(params, rng, "target_return", std::move(start),
        [&](const Vector& w) {
            double gap = std::abs(expected_return(params.returns, w) - target_return);
            double v = variance(params.covariance, w);
            if (gap < best_gap && v < best_var) {
                best_gap = gap;
                best_var = v;
                return true;
            }
            return false;
        });

    return make_result(params, std::move(best));
}

PortfolioResult target_risk_portfolio(const MarkowitzParams& params, double target_risk,
                                      RandomSource& rng) {
    validate_problem(params, true);
    detail::require_finite(target_risk, "target risk");
    detail::require(target_risk >= 0.0, "target risk must be non-negative");

    const double target_var = target_risk * target_risk;
    Vector start = starting_weights(params.covariance.size(), params.constraints);
    double best_gap = std::abs(variance(params.covariance, start) - target_var);
    double best_ret = expected_return(params.returns, start);

    Vector best = random_search(params, rng, "target_risk", std::move(start),
        [&](const Vector& w) {
            double gap = std::abs(variance(params.covariance, w) - target_var);
            double r = expected_return(params.returns, w);
            if (gap < best_gap && r > best_ret) {
                best_gap = gap;
                best_ret = r;
                return true;
            }
            return false;
        });

    return make_result(params, std::move(best));
}

PortfolioResult optimize_portfolio(const MarkowitzParams& params, RandomSource& rng,
                                   std::optional<double> target_return,
                                   std::optional<double> target_risk) {
    if (target_return && target_risk) {
        throw InvalidInputError("target return and target risk are mutually exclusive");
    }
    if (target_return) {
        return target_return_portfolio(params, *target_return, rng);
    }
    if (target_risk) {
        return target_risk_portfolio(params, *target_risk, rng);
    }
    return max_sharpe_portfolio(params, rng);
}

std::vector<PortfolioResult> efficient_frontier(const MarkowitzParams& params, RandomSource& rng,
                                                int num_portfolios) {
    if (num_portfolios < 2) {
        throw InvalidInputError("efficient frontier needs at least 2 portfolios, got " +
                                std::to_string(num_portfolios));
    }
    validate_problem(params, true);

    auto [lo_it, hi_it] = std::minmax_element(params.returns.begin(), params.returns.end());
    const double lo = *lo_it;
    const double hi = *hi_it;

    std::vector<PortfolioResult> frontier;
    frontier.reserve(num_portfolios);
    for (int i = 0; i < num_portfolios; ++i) {
        double target = lo + (hi - lo) * i / (num_portfolios - 1);
        frontier.push_back(target_return_portfolio(params, target, rng));
    }
    return frontier;
}

// =============================================================================
// Holdings
// =============================================================================

double portfolio_value(const std::vector<Holding>& holdings) {
    double total = 0.0;
    for (const auto& h : holdings) {
        total += h.value();
    }
    return total;
}

Vector holding_weights(const std::vector<Holding>& holdings) {
    double total = portfolio_value(holdings);
    Vector weights(holdings.size(), 0.0);
    if (total == 0.0) {
        return weights;
    }
    for (size_t i = 0; i < holdings.size(); ++i) {
        weights[i] = holdings[i].value() / total;
    }
    return weights;
}

double holdings_return(double current_value, double previous_value) {
    if (previous_value == 0.0) {
        throw UndefinedError("previous portfolio value must be non-zero");
    }
    return (current_value - previous_value) / previous_value;
}

double weighted_return(const Vector& returns, const Vector& weights) {
    detail::require_non_empty(returns, "returns");
    detail::require_same_size(returns.size(), weights.size(), "returns vs weights");
    if (std::abs(math::sum(weights) - 1.0) > WEIGHT_SUM_TOLERANCE) {
        throw InvalidInputError("weights must sum to 1");
    }
    return expected_return(returns, weights);
}

}  // namespace qx::analytics::portfolio
