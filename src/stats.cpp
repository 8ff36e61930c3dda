// QX Analytics - Statistical Factor Models Implementation

#include <qx/analytics/stats.hpp>
#include <qx/analytics/error.hpp>
#include <qx/analytics/math.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace qx::analytics::stats {

namespace {

double clamp_unit(double v) noexcept {
    return std::clamp(v, 0.0, 1.0);
}

void validate_series(const Matrix& series) {
    detail::require_non_empty(series, "return series");
    for (const auto& s : series) {
        detail::require_same_size(s.size(), series.front().size(), "return series");
    }
}

}  // namespace

// =============================================================================
// Covariance and Correlation
// =============================================================================

double covariance(const Vector& x, const Vector& y) {
    detail::require_same_size(x.size(), y.size(), "covariance");
    detail::require_non_empty(x, "series");
    if (x.size() == 1) {
        return 0.0;
    }

    double mx = math::mean(x);
    double my = math::mean(y);
    double acc = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        acc += (x[i] - mx) * (y[i] - my);
    }
    return acc / static_cast<double>(x.size() - 1);
}

double correlation(const Vector& x, const Vector& y) {
    detail::require_same_size(x.size(), y.size(), "correlation");
    detail::require_non_empty(x, "series");

    double mx = math::mean(x);
    double my = math::mean(y);
    double num = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double dx = x[i] - mx;
        double dy = y[i] - my;
        num += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }

    double denom = std::sqrt(sxx * syy);
    return denom == 0.0 ? 0.0 : num / denom;
}

Matrix covariance_matrix(const Matrix& series) {
    validate_series(series);
    const size_t n = series.size();

    Matrix out(n, Vector(n, 0.0));
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i; j < n; ++j) {
            out[i][j] = out[j][i] = covariance(series[i], series[j]);
        }
    }
    return out;
}

Matrix correlation_matrix(const Matrix& series) {
    validate_series(series);
    const size_t n = series.size();

    Matrix out(n, Vector(n, 0.0));
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i; j < n; ++j) {
            out[i][j] = out[j][i] = correlation(series[i], series[j]);
        }
    }
    return out;
}

// =============================================================================
// Least Squares
// =============================================================================

SimpleRegression simple_linear_regression(const Vector& x, const Vector& y) {
    detail::require_same_size(x.size(), y.size(), "regression");
    detail::require(x.size() >= 2, "regression needs at least 2 observations");

    const double n = static_cast<double>(x.size());
    double sx = 0.0, sy = 0.0, sxy = 0.0, sxx = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        sx += x[i];
        sy += y[i];
        sxy += x[i] * y[i];
        sxx += x[i] * x[i];
    }

    double denom = n * sxx - sx * sx;
    if (std::abs(denom) < math::EPSILON) {
        throw UndefinedError("regressor has zero variance");
    }

    SimpleRegression r;
    r.slope = (n * sxy - sx * sy) / denom;
    r.intercept = (sy - r.slope * sx) / n;

    const double my = sy / n;
    double ss_tot = 0.0;
    double ss_res = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double fitted = r.intercept + r.slope * x[i];
        ss_tot += (y[i] - my) * (y[i] - my);
        ss_res += (y[i] - fitted) * (y[i] - fitted);
    }

    r.r_squared = ss_tot == 0.0 ? 0.0 : clamp_unit(1.0 - ss_res / ss_tot);
    r.standard_error = x.size() > 2 ? std::sqrt(ss_res / (n - 2.0)) : 0.0;
    return r;
}

MultipleRegression multiple_linear_regression(const Vector& y, const Matrix& factors) {
    detail::require_non_empty(factors, "factors");
    const size_t n = y.size();
    const size_t k = factors.size();
    for (const auto& f : factors) {
        detail::require_same_size(f.size(), n, "factor vs dependent series");
    }
    if (n < k + 1) {
        throw InvalidInputError("regression on " + std::to_string(k) + " factors needs at least " +
                                std::to_string(k + 1) + " observations, got " +
                                std::to_string(n));
    }

    // Normal equations over the design matrix [1, f_1, ..., f_k]
    const size_t p = k + 1;
    auto design = [&](size_t row, size_t col) {
        return col == 0 ? 1.0 : factors[col - 1][row];
    };

    Matrix xtx(p, Vector(p, 0.0));
    Vector xty(p, 0.0);
    for (size_t row = 0; row < n; ++row) {
        for (size_t i = 0; i < p; ++i) {
            double xi = design(row, i);
            xty[i] += xi * y[row];
            for (size_t j = 0; j < p; ++j) {
                xtx[i][j] += xi * design(row, j);
            }
        }
    }

    Vector beta = solve_linear_system(std::move(xtx), std::move(xty));

    const double my = math::mean(y);
    double ss_tot = 0.0;
    double ss_res = 0.0;
    for (size_t row = 0; row < n; ++row) {
        double fitted = beta[0];
        for (size_t j = 0; j < k; ++j) {
            fitted += beta[j + 1] * factors[j][row];
        }
        ss_tot += (y[row] - my) * (y[row] - my);
        ss_res += (y[row] - fitted) * (y[row] - fitted);
    }

    MultipleRegression r;
    r.intercept = beta[0];
    r.coefficients.assign(beta.begin() + 1, beta.end());

    double r2 = ss_tot == 0.0 ? 0.0 : 1.0 - ss_res / ss_tot;
    r.r_squared = clamp_unit(r2);
    if (n > k + 1) {
        double dof = static_cast<double>(n - k - 1);
        r.adjusted_r_squared = clamp_unit(1.0 - (1.0 - r2) * (static_cast<double>(n) - 1.0) / dof);
    } else {
        // Saturated fit: no residual degrees of freedom
        r.adjusted_r_squared = r.r_squared;
    }
    return r;
}

Vector solve_linear_system(Matrix A, Vector b) {
    const size_t n = A.size();
    detail::require(n > 0, "linear system must not be empty");
    detail::require_same_size(b.size(), n, "linear system right-hand side");
    for (const auto& row : A) {
        detail::require_same_size(row.size(), n, "linear system matrix must be square");
    }

    for (size_t col = 0; col < n; ++col) {
        size_t pivot = col;
        for (size_t row = col + 1; row < n; ++row) {
            if (std::abs(A[row][col]) > std::abs(A[pivot][col])) {
                pivot = row;
            }
        }
        if (std::abs(A[pivot][col]) < math::EPSILON) {
            throw UndefinedError("singular matrix: no usable pivot in column " +
                                 std::to_string(col));
        }
        std::swap(A[col], A[pivot]);
        std::swap(b[col], b[pivot]);

        for (size_t row = col + 1; row < n; ++row) {
            double factor = A[row][col] / A[col][col];
            for (size_t j = col; j < n; ++j) {
                A[row][j] -= factor * A[col][j];
            }
            b[row] -= factor * b[col];
        }
    }

    Vector x(n, 0.0);
    for (size_t i = n; i-- > 0;) {
        double acc = b[i];
        for (size_t j = i + 1; j < n; ++j) {
            acc -= A[i][j] * x[j];
        }
        x[i] = acc / A[i][i];
    }
    return x;
}

// =============================================================================
// CAPM
// =============================================================================

double beta(const Vector& stock_returns, const Vector& market_returns) {
    detail::require_same_size(stock_returns.size(), market_returns.size(), "beta");
    detail::require(stock_returns.size() >= 2, "beta needs at least 2 observations");
    return multiple_linear_regression(stock_returns, {market_returns}).coefficients[0];
}

CapmResult capm_regression(const Vector& stock_returns, const Vector& market_returns,
                           double risk_free_rate) {
    detail::require_same_size(stock_returns.size(), market_returns.size(), "CAPM regression");
    detail::require(stock_returns.size() >= 2, "CAPM regression needs at least 2 observations");

    Vector excess_stock(stock_returns.size());
    Vector excess_market(market_returns.size());
    for (size_t i = 0; i < stock_returns.size(); ++i) {
        excess_stock[i] = stock_returns[i] - risk_free_rate;
        excess_market[i] = market_returns[i] - risk_free_rate;
    }

    MultipleRegression fit = multiple_linear_regression(excess_stock, {excess_market});
    return {fit.intercept, fit.coefficients[0], fit.r_squared};
}

double treynor_ratio(double portfolio_return, double risk_free_rate, double beta) {
    if (beta == 0.0) {
        throw UndefinedError("Treynor ratio is undefined for zero beta");
    }
    return (portfolio_return - risk_free_rate) / beta;
}

// =============================================================================
// Fama-French
// =============================================================================

FamaFrench3Result fama_french_3(const Vector& stock, const Vector& market,
                                const Vector& smb, const Vector& hml) {
    detail::require(stock.size() >= 4, "three-factor model needs at least 4 observations");
    MultipleRegression fit = multiple_linear_regression(stock, {market, smb, hml});

    FamaFrench3Result r;
    r.alpha = fit.intercept;
    r.beta = fit.coefficients[0];
    r.smb = fit.coefficients[1];
    r.hml = fit.coefficients[2];
    r.r_squared = fit.r_squared;
    return r;
}

FamaFrench5Result fama_french_5(const Vector& stock, const Vector& market,
                                const Vector& smb, const Vector& hml,
                                const Vector& rmw, const Vector& cma) {
    detail::require(stock.size() >= 6, "five-factor model needs at least 6 observations");
    MultipleRegression fit = multiple_linear_regression(stock, {market, smb, hml, rmw, cma});

    FamaFrench5Result r;
    r.alpha = fit.intercept;
    r.beta = fit.coefficients[0];
    r.smb = fit.coefficients[1];
    r.hml = fit.coefficients[2];
    r.rmw = fit.coefficients[3];
    r.cma = fit.coefficients[4];
    r.r_squared = fit.r_squared;
    return r;
}

}  // namespace qx::analytics::stats
