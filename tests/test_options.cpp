// QX Analytics - Option Pricing Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <qx/analytics/error.hpp>
#include <qx/analytics/math.hpp>
#include <qx/analytics/options.hpp>
#include <cmath>

using namespace qx::analytics;
using namespace qx::analytics::options;
using Catch::Approx;

TEST_CASE("Normal distribution", "[math]") {
    SECTION("CDF") {
        REQUIRE(math::norm_cdf(0.0) == Approx(0.5).margin(1e-7));
        REQUIRE(math::norm_cdf(1.96) == Approx(0.975).margin(1e-4));
        REQUIRE(math::norm_cdf(-1.96) == Approx(0.025).margin(1e-4));
        REQUIRE(math::norm_cdf(1.3) + math::norm_cdf(-1.3) == Approx(1.0));
    }

    SECTION("PDF") {
        REQUIRE(math::norm_pdf(0.0) == Approx(0.398942).margin(1e-6));
        REQUIRE(math::norm_pdf(1.0) == Approx(math::norm_pdf(-1.0)));
    }

    SECTION("Sample statistics") {
        REQUIRE(math::mean({1, 2, 3, 4}) == Approx(2.5));
        REQUIRE(math::sample_variance({1, 2, 3, 4}) == Approx(5.0 / 3.0));
        REQUIRE(math::sample_variance({7}) == 0.0);
        REQUIRE_THROWS_AS(math::mean({}), InvalidInputError);
    }
}

TEST_CASE("Black-Scholes pricing", "[options]") {
    SECTION("At-the-money call") {
        double price = black_scholes(100, 100, 1.0, 0.05, 0.2, OptionType::Call);
        REQUIRE(price == Approx(10.45).margin(0.01));
    }

    SECTION("In-the-money call") {
        double price = black_scholes(110, 100, 1.0, 0.05, 0.2, OptionType::Call);
        REQUIRE(price == Approx(17.66).margin(0.05));
    }

    SECTION("Out-of-the-money put") {
        double price = black_scholes(110, 100, 1.0, 0.05, 0.2, OptionType::Put);
        REQUIRE(price == Approx(2.79).margin(0.05));
    }

    SECTION("Put-call parity") {
        for (double S : {80.0, 100.0, 125.0}) {
            double call = black_scholes(S, 100, 0.75, 0.03, 0.3, OptionType::Call);
            double put = black_scholes(S, 100, 0.75, 0.03, 0.3, OptionType::Put);
            REQUIRE(call - put == Approx(S - 100 * std::exp(-0.03 * 0.75)).margin(1e-4));
        }
    }

    SECTION("d1 and d2") {
        REQUIRE(d1(100, 100, 1.0, 0.05, 0.2) == Approx(0.35));
        REQUIRE(d2(100, 100, 1.0, 0.05, 0.2) == Approx(0.15));
    }

    SECTION("Non-positive inputs are rejected") {
        REQUIRE_THROWS_AS(black_scholes(0, 100, 1.0, 0.05, 0.2), InvalidInputError);
        REQUIRE_THROWS_AS(black_scholes(100, -1, 1.0, 0.05, 0.2), InvalidInputError);
        REQUIRE_THROWS_AS(black_scholes(100, 100, 0, 0.05, 0.2), InvalidInputError);
        REQUIRE_THROWS_AS(black_scholes(100, 100, 1.0, 0.05, 0), InvalidInputError);
    }

    SECTION("Negative rates are accepted") {
        double price = black_scholes(100, 100, 1.0, -0.01, 0.2);
        REQUIRE(price > 0);
    }
}

TEST_CASE("Binomial lattice", "[options]") {
    SECTION("European lattice converges to Black-Scholes") {
        double bs_call = black_scholes(100, 100, 1.0, 0.05, 0.2, OptionType::Call);
        double bs_put = black_scholes(100, 100, 1.0, 0.05, 0.2, OptionType::Put);
        REQUIRE(european_option(100, 100, 1.0, 0.05, 0.2, 2000, OptionType::Call) ==
                Approx(bs_call).margin(0.01));
        REQUIRE(european_option(100, 100, 1.0, 0.05, 0.2, 2000, OptionType::Put) ==
                Approx(bs_put).margin(0.01));
    }

    SECTION("American put carries an early-exercise premium") {
        double american = american_option(100, 100, 1.0, 0.05, 0.2, 200, OptionType::Put);
        double european = european_option(100, 100, 1.0, 0.05, 0.2, 200, OptionType::Put);
        REQUIRE(american >= european);
        REQUIRE(american - european > 0.1);
    }

    SECTION("American call equals European call without dividends") {
        double american = american_option(100, 95, 0.5, 0.04, 0.25, 300, OptionType::Call);
        double european = european_option(100, 95, 0.5, 0.04, 0.25, 300, OptionType::Call);
        REQUIRE(american == Approx(european).margin(1e-9));
    }

    SECTION("Deep in-the-money American put is worth at least intrinsic") {
        double price = american_option(50, 100, 1.0, 0.05, 0.2, 100, OptionType::Put);
        REQUIRE(price >= 50.0);
    }

    SECTION("Style selects the recursion") {
        REQUIRE(binomial_tree(100, 100, 1.0, 0.05, 0.2, 100, OptionType::Put,
                              ExerciseStyle::European) ==
                european_option(100, 100, 1.0, 0.05, 0.2, 100, OptionType::Put));
        REQUIRE(binomial_tree(100, 100, 1.0, 0.05, 0.2, 100, OptionType::Put) ==
                american_option(100, 100, 1.0, 0.05, 0.2, 100, OptionType::Put));
    }

    SECTION("Steps must be positive") {
        REQUIRE_THROWS_AS(binomial_tree(100, 100, 1.0, 0.05, 0.2, 0), InvalidInputError);
        REQUIRE_THROWS_AS(american_option(100, 100, 1.0, 0.05, 0.2, -5), InvalidInputError);
    }
}

TEST_CASE("Greeks calculation", "[options]") {
    Greeks g = greeks(100, 100, 1.0, 0.05, 0.2, OptionType::Call);

    SECTION("Delta") {
        REQUIRE(g.delta == Approx(0.6368).margin(0.001));
        double put_delta = delta(100, 100, 1.0, 0.05, 0.2, OptionType::Put);
        REQUIRE(put_delta == Approx(g.delta - 1.0));
    }

    SECTION("Gamma") {
        REQUIRE(g.gamma == Approx(0.01876).margin(0.0002));
        REQUIRE(options::gamma(100, 100, 1.0, 0.05, 0.2) == Approx(g.gamma));
    }

    SECTION("Vega per 1% volatility") {
        REQUIRE(g.vega == Approx(0.3752).margin(0.001));
    }

    SECTION("Theta per day") {
        REQUIRE(g.theta == Approx(-0.01757).margin(0.0002));
        double put_theta = theta(100, 100, 1.0, 0.05, 0.2, OptionType::Put);
        // Put theta differs from call theta by r K e^{-rT} / 365
        double carry = 0.05 * 100 * std::exp(-0.05) / 365.0;
        REQUIRE(put_theta - g.theta == Approx(carry).margin(1e-6));
    }

    SECTION("Rho per 1% rate") {
        REQUIRE(g.rho == Approx(0.5323).margin(0.001));
        REQUIRE(rho(100, 100, 1.0, 0.05, 0.2, OptionType::Put) < 0);
    }

    SECTION("Delta agrees with a finite difference of the price") {
        double h = 0.01;
        double fd = (black_scholes(100 + h, 100, 1.0, 0.05, 0.2) -
                     black_scholes(100 - h, 100, 1.0, 0.05, 0.2)) / (2 * h);
        REQUIRE(g.delta == Approx(fd).margin(1e-4));
    }
}

TEST_CASE("Implied volatility", "[options]") {
    SECTION("Recovers the pricing volatility") {
        for (double vol : {0.1, 0.25, 0.6}) {
            double price = black_scholes(100, 100, 0.5, 0.05, vol, OptionType::Call);
            SolverResult iv = implied_volatility(price, 100, 100, 0.5, 0.05, OptionType::Call);
            REQUIRE(iv.converged);
            REQUIRE(iv.value == Approx(vol).margin(1e-4));
            REQUIRE(iv.iterations > 0);
            REQUIRE(iv.iterations <= 100);
        }
    }

    SECTION("Works for puts") {
        double price = black_scholes(100, 110, 1.0, 0.02, 0.35, OptionType::Put);
        SolverResult iv = implied_volatility(price, 100, 110, 1.0, 0.02, OptionType::Put);
        REQUIRE(iv.converged);
        REQUIRE(iv.value == Approx(0.35).margin(1e-4));
    }

    SECTION("Iteration cap returns the last midpoint unconverged") {
        ImpliedVolSettings settings;
        settings.max_iterations = 3;
        double price = black_scholes(100, 100, 1.0, 0.05, 0.3);
        SolverResult iv = implied_volatility(price, 100, 100, 1.0, 0.05, OptionType::Call, settings);
        REQUIRE_FALSE(iv.converged);
        REQUIRE(iv.iterations == 3);
        REQUIRE(iv.value > settings.lower);
        REQUIRE(iv.value < settings.upper);
    }

    SECTION("Unreachable price does not converge") {
        // Above the spot: no volatility in the bracket reaches it
        SolverResult iv = implied_volatility(150, 100, 100, 1.0, 0.05);
        REQUIRE_FALSE(iv.converged);
    }

    SECTION("Non-positive market price is rejected") {
        REQUIRE_THROWS_AS(implied_volatility(0, 100, 100, 1.0, 0.05), InvalidInputError);
        REQUIRE_THROWS_AS(implied_volatility(-1, 100, 100, 1.0, 0.05), InvalidInputError);
    }
}
