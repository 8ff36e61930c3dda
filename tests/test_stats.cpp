// QX Analytics - Statistics Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <qx/analytics/error.hpp>
#include <qx/analytics/stats.hpp>

using namespace qx::analytics;
using namespace qx::analytics::stats;
using Catch::Approx;

namespace {

const Vector MARKET = {0.01, -0.02, 0.03, 0.015, -0.01, 0.02, 0.005, -0.015, 0.025, -0.005};
const Vector SMB = {0.002, 0.004, -0.003, 0.001, 0.005, -0.002, 0.003, -0.001, 0.0, -0.004};
const Vector HML = {-0.001, 0.003, 0.002, -0.004, 0.001, 0.002, -0.002, 0.004, -0.003, 0.0};
const Vector RMW = {0.003, -0.002, 0.001, 0.002, -0.004, 0.0, 0.005, -0.001, 0.002, -0.003};
const Vector CMA = {0.0, 0.001, -0.002, 0.004, 0.002, -0.003, -0.001, 0.003, 0.001, 0.002};

}  // namespace

TEST_CASE("Covariance and correlation", "[stats]") {
    Vector x = {1, 2, 3, 4, 5};

    SECTION("Sample covariance") {
        REQUIRE(covariance(x, {2, 4, 6, 8, 10}) == Approx(5.0));
        REQUIRE(covariance({3.0}, {7.0}) == 0.0);
    }

    SECTION("Perfect correlation") {
        REQUIRE(correlation(x, {2, 4, 6, 8, 10}) == Approx(1.0));
        REQUIRE(correlation(x, {5, 4, 3, 2, 1}) == Approx(-1.0));
    }

    SECTION("Constant series has zero correlation") {
        REQUIRE(correlation(x, {3, 3, 3, 3, 3}) == 0.0);
    }

    SECTION("Matrices are symmetric with variances on the diagonal") {
        Matrix series = {MARKET, SMB, HML};
        Matrix cov = covariance_matrix(series);
        Matrix corr = correlation_matrix(series);
        REQUIRE(cov.size() == 3);
        for (size_t i = 0; i < 3; ++i) {
            REQUIRE(cov[i][i] == Approx(covariance(series[i], series[i])));
            REQUIRE(corr[i][i] == Approx(1.0));
            for (size_t j = 0; j < 3; ++j) {
                REQUIRE(cov[i][j] == cov[j][i]);
                REQUIRE(corr[i][j] >= -1.0 - 1e-12);
                REQUIRE(corr[i][j] <= 1.0 + 1e-12);
            }
        }
    }

    SECTION("Mismatched lengths are rejected") {
        REQUIRE_THROWS_AS(covariance(x, {1, 2}), InvalidInputError);
        REQUIRE_THROWS_AS(covariance_matrix({x, {1, 2}}), InvalidInputError);
        REQUIRE_THROWS_AS(covariance({}, {}), InvalidInputError);
    }
}

TEST_CASE("Simple linear regression", "[stats]") {
    SECTION("Exact line") {
        Vector x = {1, 2, 3, 4, 5};
        Vector y = {3, 5, 7, 9, 11};
        SimpleRegression r = simple_linear_regression(x, y);
        REQUIRE(r.slope == Approx(2.0));
        REQUIRE(r.intercept == Approx(1.0));
        REQUIRE(r.r_squared == Approx(1.0));
        REQUIRE(r.standard_error == Approx(0.0).margin(1e-9));
    }

    SECTION("Noisy data keeps R-squared in range") {
        Vector x = {1, 2, 3, 4, 5, 6};
        Vector y = {2.1, 3.9, 6.2, 7.8, 10.3, 11.9};
        SimpleRegression r = simple_linear_regression(x, y);
        REQUIRE(r.slope == Approx(2.0).margin(0.1));
        REQUIRE(r.r_squared >= 0.0);
        REQUIRE(r.r_squared <= 1.0);
        REQUIRE(r.standard_error > 0.0);
    }

    SECTION("Two points have no standard error") {
        SimpleRegression r = simple_linear_regression({0, 1}, {1, 4});
        REQUIRE(r.slope == Approx(3.0));
        REQUIRE(r.standard_error == 0.0);
    }

    SECTION("Constant regressor is undefined") {
        REQUIRE_THROWS_AS(simple_linear_regression({2, 2, 2}, {1, 2, 3}), UndefinedError);
    }

    SECTION("Too few observations") {
        REQUIRE_THROWS_AS(simple_linear_regression({1}, {1}), InvalidInputError);
    }
}

TEST_CASE("Multiple linear regression", "[stats]") {
    SECTION("Recovers exact coefficients") {
        Vector a = {1, 2, 3, 4, 5};
        Vector b = {2, 1, 4, 3, 6};
        Vector y(5);
        for (size_t i = 0; i < 5; ++i) {
            y[i] = 1.0 + 2.0 * a[i] - 3.0 * b[i];
        }

        MultipleRegression r = multiple_linear_regression(y, {a, b});
        REQUIRE(r.intercept == Approx(1.0).margin(1e-9));
        REQUIRE(r.coefficients.size() == 2);
        REQUIRE(r.coefficients[0] == Approx(2.0));
        REQUIRE(r.coefficients[1] == Approx(-3.0));
        REQUIRE(r.r_squared == Approx(1.0));
        REQUIRE(r.adjusted_r_squared == Approx(1.0));
    }

    SECTION("Saturated fit reports R-squared as adjusted") {
        MultipleRegression r = multiple_linear_regression({1, 3, 2}, {{0, 1, 2}, {1, 0, 1}});
        REQUIRE(r.adjusted_r_squared == r.r_squared);
    }

    SECTION("Needs k + 1 observations") {
        REQUIRE_THROWS_AS(multiple_linear_regression({1, 2}, {{1, 2}, {3, 5}}), InvalidInputError);
    }

    SECTION("Collinear factors are undefined") {
        Vector a = {1, 2, 3, 4, 5};
        Vector twice = {2, 4, 6, 8, 10};
        REQUIRE_THROWS_AS(multiple_linear_regression({1, 3, 2, 5, 4}, {a, twice}), UndefinedError);
    }

    SECTION("Linear solver pivots rows") {
        Vector x = solve_linear_system({{0, 1}, {1, 1}}, {2, 3});
        REQUIRE(x[0] == Approx(1.0));
        REQUIRE(x[1] == Approx(2.0));
        REQUIRE_THROWS_AS(solve_linear_system({{1, 2}, {2, 4}}, {1, 2}), UndefinedError);
        REQUIRE_THROWS_AS(solve_linear_system({{1, 2}}, {1}), InvalidInputError);
    }
}

TEST_CASE("CAPM", "[stats]") {
    Vector stock(MARKET.size());
    for (size_t i = 0; i < MARKET.size(); ++i) {
        stock[i] = 0.001 + 1.5 * MARKET[i];
    }

    SECTION("Expected return and premium") {
        REQUIRE(capm_expected_return(0.02, 0.08, 1.2) == Approx(0.092));
        REQUIRE(market_risk_premium(0.08, 0.02) == Approx(0.06));
        REQUIRE(jensen_alpha(0.1, 0.092) == Approx(0.008));
    }

    SECTION("Beta") {
        REQUIRE(beta(stock, MARKET) == Approx(1.5));
    }

    SECTION("Regression on excess returns") {
        CapmResult r = capm_regression(stock, MARKET, 0.0);
        REQUIRE(r.alpha == Approx(0.001).margin(1e-9));
        REQUIRE(r.beta == Approx(1.5));
        REQUIRE(r.r_squared == Approx(1.0));

        // stock - rf = 0.001 + 0.5 rf + 1.5 (market - rf)
        CapmResult shifted = capm_regression(stock, MARKET, 0.002);
        REQUIRE(shifted.alpha == Approx(0.002).margin(1e-9));
        REQUIRE(shifted.beta == Approx(1.5));
    }

    SECTION("Treynor ratio") {
        REQUIRE(treynor_ratio(0.1, 0.02, 0.8) == Approx(0.1));
        REQUIRE_THROWS_AS(treynor_ratio(0.1, 0.02, 0.0), UndefinedError);
    }
}

TEST_CASE("Fama-French models", "[stats]") {
    SECTION("Three factors") {
        Vector stock(MARKET.size());
        for (size_t i = 0; i < MARKET.size(); ++i) {
            stock[i] = 0.001 + 1.2 * MARKET[i] + 0.5 * SMB[i] - 0.3 * HML[i];
        }

        FamaFrench3Result r = fama_french_3(stock, MARKET, SMB, HML);
        REQUIRE(r.alpha == Approx(0.001).margin(1e-8));
        REQUIRE(r.beta == Approx(1.2).margin(1e-6));
        REQUIRE(r.smb == Approx(0.5).margin(1e-6));
        REQUIRE(r.hml == Approx(-0.3).margin(1e-6));
        REQUIRE(r.r_squared == Approx(1.0));
    }

    SECTION("Five factors") {
        Vector stock(MARKET.size());
        for (size_t i = 0; i < MARKET.size(); ++i) {
            stock[i] = -0.002 + 0.9 * MARKET[i] + 0.2 * SMB[i] + 0.4 * HML[i] +
                       0.3 * RMW[i] - 0.6 * CMA[i];
        }

        FamaFrench5Result r = fama_french_5(stock, MARKET, SMB, HML, RMW, CMA);
        REQUIRE(r.alpha == Approx(-0.002).margin(1e-8));
        REQUIRE(r.beta == Approx(0.9).margin(1e-6));
        REQUIRE(r.smb == Approx(0.2).margin(1e-6));
        REQUIRE(r.hml == Approx(0.4).margin(1e-6));
        REQUIRE(r.rmw == Approx(0.3).margin(1e-6));
        REQUIRE(r.cma == Approx(-0.6).margin(1e-6));
    }

    SECTION("Minimum observation counts") {
        Vector three = {0.01, 0.02, 0.03};
        REQUIRE_THROWS_AS(fama_french_3(three, three, three, three), InvalidInputError);

        Vector five = {0.01, 0.02, 0.03, 0.04, 0.05};
        REQUIRE_THROWS_AS(fama_french_5(five, five, five, five, five, five), InvalidInputError);
    }
}
