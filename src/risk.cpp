// QX Analytics - Risk & Return Metrics Implementation

#include <qx/analytics/risk.hpp>
#include <qx/analytics/error.hpp>
#include <qx/analytics/math.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace qx::analytics::risk {

namespace {

// Sorted copy and the tail cut-off index shared by VaR and CVaR
struct Tail {
    Vector sorted;
    size_t index;
};

Tail historical_tail(const Vector& returns, double confidence) {
    detail::require_non_empty(returns, "returns");
    detail::require_unit_interval(confidence, "confidence");

    Tail t{returns, 0};
    std::sort(t.sorted.begin(), t.sorted.end());
    auto idx = static_cast<size_t>(std::floor((1.0 - confidence) * t.sorted.size()));
    t.index = std::min(idx, t.sorted.size() - 1);
    return t;
}

}  // namespace

// =============================================================================
// Volatility and Risk-Adjusted Ratios
// =============================================================================

double volatility(const Vector& returns) {
    detail::require_non_empty(returns, "returns");
    return math::sample_std_dev(returns);
}

double annualized_volatility(const Vector& returns, double periods_per_year) {
    detail::require_positive(periods_per_year, "periods per year");
    return volatility(returns) * std::sqrt(periods_per_year);
}

double sharpe_ratio(const Vector& returns, double risk_free_rate) {
    double vol = volatility(returns);
    if (vol == 0.0) {
        return 0.0;
    }
    return (math::mean(returns) - risk_free_rate) / vol;
}

double sortino_ratio(const Vector& returns, double risk_free_rate, double target) {
    detail::require_non_empty(returns, "returns");

    double downside = 0.0;
    for (double r : returns) {
        if (r < target) {
            downside += (r - target) * (r - target);
        }
    }
    double downside_dev = std::sqrt(downside / static_cast<double>(returns.size()));
    if (downside_dev == 0.0) {
        return 0.0;
    }
    return (math::mean(returns) - risk_free_rate) / downside_dev;
}

// =============================================================================
// Drawdown
// =============================================================================

Drawdown max_drawdown(const Vector& prices) {
    detail::require_non_empty(prices, "prices");

    Drawdown dd;
    double peak = prices[0];
    size_t peak_idx = 0;

    for (size_t i = 1; i < prices.size(); ++i) {
        if (prices[i] > peak) {
            peak = prices[i];
            peak_idx = i;
            continue;
        }
        if (peak <= 0.0) {
            throw UndefinedError("drawdown is undefined for a non-positive peak price");
        }
        double drop = (peak - prices[i]) / peak;
        if (drop > dd.max_drawdown) {
            dd.max_drawdown = drop;
            dd.peak_index = peak_idx;
            dd.trough_index = i;
        }
    }
    return dd;
}

// =============================================================================
// Value at Risk
// =============================================================================

double value_at_risk(const Vector& returns, double confidence) {
    Tail t = historical_tail(returns, confidence);
    return -t.sorted[t.index];
}

double conditional_value_at_risk(const Vector& returns, double confidence) {
    Tail t = historical_tail(returns, confidence);
    const double var = -t.sorted[t.index];

    double loss = 0.0;
    size_t count = 0;
    for (size_t i = 0; i <= t.index; ++i) {
        if (-t.sorted[i] >= var) {
            loss += -t.sorted[i];
            ++count;
        }
    }
    return count == 0 ? var : loss / static_cast<double>(count);
}

// =============================================================================
// Returns
// =============================================================================

double simple_return(double initial, double final_value) {
    if (initial == 0.0) {
        throw UndefinedError("return is undefined for a zero initial value");
    }
    return (final_value - initial) / initial;
}

Vector returns_from_prices(const Vector& prices) {
    detail::require(prices.size() >= 2, "at least 2 prices are needed for a return series");

    Vector out;
    out.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        out.push_back(simple_return(prices[i - 1], prices[i]));
    }
    return out;
}

double annualized_return(const Vector& returns, double periods) {
    detail::require_non_empty(returns, "returns");
    detail::require_positive(periods, "periods");
    return std::pow(1.0 + math::mean(returns), periods) - 1.0;
}

double cumulative_return(const Vector& returns) noexcept {
    double growth = 1.0;
    for (double r : returns) {
        growth *= 1.0 + r;
    }
    return growth - 1.0;
}

}  // namespace qx::analytics::risk
