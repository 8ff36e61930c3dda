// QX Analytics - Statistical Factor Models
// Covariance estimation, least-squares regression, CAPM and Fama-French

#pragma once

#include <qx/analytics/types.hpp>

namespace qx::analytics::stats {

// =============================================================================
// Covariance and Correlation
// =============================================================================

// Sample covariance (n - 1 denominator)
double covariance(const Vector& x, const Vector& y);

// Pearson correlation; 0 when either series has no variance
double correlation(const Vector& x, const Vector& y);

// series[i] holds the return history of asset i; all must share one length
Matrix covariance_matrix(const Matrix& series);
Matrix correlation_matrix(const Matrix& series);

// =============================================================================
// Least Squares
// =============================================================================

struct SimpleRegression {
    double intercept = 0.0;
    double slope = 0.0;
    double r_squared = 0.0;
    double standard_error = 0.0;
};

struct MultipleRegression {
    double intercept = 0.0;
    Vector coefficients;  // One per factor, in input order
    double r_squared = 0.0;
    double adjusted_r_squared = 0.0;
};

SimpleRegression simple_linear_regression(const Vector& x, const Vector& y);

// Ordinary least squares of y on an intercept plus factors. factors[j] is
// the j-th regressor observed over the same n periods as y; n >= k + 1.
MultipleRegression multiple_linear_regression(const Vector& y, const Matrix& factors);

// Solves A x = b by Gaussian elimination with partial pivoting.
// A pivot below 1e-10 in magnitude raises UndefinedError.
Vector solve_linear_system(Matrix A, Vector b);

// =============================================================================
// CAPM
// =============================================================================

struct CapmResult {
    double alpha = 0.0;
    double beta = 0.0;
    double r_squared = 0.0;
};

// rf + beta * (Rm - rf)
inline double capm_expected_return(double risk_free_rate, double market_return,
                                   double beta) noexcept {
    return risk_free_rate + beta * (market_return - risk_free_rate);
}

inline double market_risk_premium(double market_return, double risk_free_rate) noexcept {
    return market_return - risk_free_rate;
}

// Slope of stock returns regressed on market returns
double beta(const Vector& stock_returns, const Vector& market_returns);

// Regression of excess stock returns on excess market returns
CapmResult capm_regression(const Vector& stock_returns, const Vector& market_returns,
                           double risk_free_rate = 0.0);

inline double jensen_alpha(double actual_return, double expected_return) noexcept {
    return actual_return - expected_return;
}

double treynor_ratio(double portfolio_return, double risk_free_rate, double beta);

// =============================================================================
// Fama-French
// =============================================================================

struct FamaFrench3Result {
    double alpha = 0.0;
    double beta = 0.0;
    double smb = 0.0;
    double hml = 0.0;
    double r_squared = 0.0;
};

struct FamaFrench5Result {
    double alpha = 0.0;
    double beta = 0.0;
    double smb = 0.0;
    double hml = 0.0;
    double rmw = 0.0;
    double cma = 0.0;
    double r_squared = 0.0;
};

// Needs at least 4 observations
FamaFrench3Result fama_french_3(const Vector& stock, const Vector& market,
                                const Vector& smb, const Vector& hml);

// Needs at least 6 observations
FamaFrench5Result fama_french_5(const Vector& stock, const Vector& market,
                                const Vector& smb, const Vector& hml,
                                const Vector& rmw, const Vector& cma);

}  // namespace qx::analytics::stats
