// QX Analytics - Risk & Return Metrics
// Volatility, risk-adjusted ratios, drawdown, historical VaR and return math

#pragma once

#include <qx/analytics/types.hpp>
#include <cstddef>

namespace qx::analytics::risk {

// =============================================================================
// Volatility and Risk-Adjusted Ratios
// =============================================================================

// Sample standard deviation of periodic returns; 0 for a single return
double volatility(const Vector& returns);

// volatility * sqrt(periods_per_year)
double annualized_volatility(const Vector& returns, double periods_per_year);

// (mean - rf) / volatility, 0 when volatility is 0
double sharpe_ratio(const Vector& returns, double risk_free_rate = 0.0);

// (mean - rf) / downside deviation below target; 0 when there is no downside
double sortino_ratio(const Vector& returns, double risk_free_rate = 0.0, double target = 0.0);

// =============================================================================
// Drawdown
// =============================================================================

struct Drawdown {
    double max_drawdown = 0.0;  // Fraction of the running peak
    size_t peak_index = 0;
    size_t trough_index = 0;
};

Drawdown max_drawdown(const Vector& prices);

// =============================================================================
// Value at Risk
// =============================================================================

// Historical VaR: -sorted[floor((1 - confidence) * n)], confidence in (0, 1)
double value_at_risk(const Vector& returns, double confidence);

// Mean loss over the tail at or beyond VaR, reported as a positive number
double conditional_value_at_risk(const Vector& returns, double confidence);

// =============================================================================
// Returns
// =============================================================================

// (final - initial) / initial
double simple_return(double initial, double final_value);

// Period-over-period simple returns; n prices give n - 1 returns
Vector returns_from_prices(const Vector& prices);

// (1 + mean)^periods - 1
double annualized_return(const Vector& returns, double periods);

// prod(1 + r) - 1; 0 for no returns
double cumulative_return(const Vector& returns) noexcept;

}  // namespace qx::analytics::risk
