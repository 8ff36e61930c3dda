// QX Analytics - Option Pricing
// Black-Scholes closed form, CRR binomial lattice, analytic Greeks, implied volatility

#pragma once

#include <qx/analytics/types.hpp>

namespace qx::analytics::options {

// Parameter conventions for every function below:
//   S: spot, K: strike, T: time to expiry (years), r: risk-free rate
//   (annualized, any real), sigma: volatility (annualized, 0.2 = 20%).
// S, K, T and sigma must be strictly positive; otherwise InvalidInputError.

// =============================================================================
// Black-Scholes
// =============================================================================

struct Greeks {
    double delta = 0.0;
    double gamma = 0.0;
    double theta = 0.0;  // Per calendar day
    double vega = 0.0;   // Per 1% volatility move
    double rho = 0.0;    // Per 1% rate move
};

double black_scholes(
    double S, double K, double T, double r, double sigma,
    OptionType type = OptionType::Call);

// d1 and d2 terms of the Black-Scholes formula
double d1(double S, double K, double T, double r, double sigma);
double d2(double S, double K, double T, double r, double sigma);

// =============================================================================
// Binomial Lattice (Cox-Ross-Rubinstein)
// =============================================================================

constexpr int DEFAULT_LATTICE_STEPS = 100;

// Backward induction over a recombining tree. American style compares
// continuation against intrinsic value at every node; European does not.
double binomial_tree(
    double S, double K, double T, double r, double sigma,
    int steps = DEFAULT_LATTICE_STEPS,
    OptionType type = OptionType::Call,
    ExerciseStyle style = ExerciseStyle::American);

double american_option(
    double S, double K, double T, double r, double sigma,
    int steps = DEFAULT_LATTICE_STEPS,
    OptionType type = OptionType::Call);

double european_option(
    double S, double K, double T, double r, double sigma,
    int steps = DEFAULT_LATTICE_STEPS,
    OptionType type = OptionType::Call);

// =============================================================================
// Greeks (analytic Black-Scholes derivatives)
// =============================================================================

double delta(double S, double K, double T, double r, double sigma,
             OptionType type = OptionType::Call);

double gamma(double S, double K, double T, double r, double sigma);

double theta(double S, double K, double T, double r, double sigma,
             OptionType type = OptionType::Call);

double vega(double S, double K, double T, double r, double sigma);

double rho(double S, double K, double T, double r, double sigma,
           OptionType type = OptionType::Call);

Greeks greeks(double S, double K, double T, double r, double sigma,
              OptionType type = OptionType::Call);

// =============================================================================
// Implied Volatility
// =============================================================================

struct ImpliedVolSettings {
    double lower = 0.001;
    double upper = 5.0;
    double tolerance = 1e-6;
    int max_iterations = 100;
};

// Bisection on sigma in [lower, upper]. If the price is not matched within
// tolerance before max_iterations, the last midpoint is returned with
// converged = false.
SolverResult implied_volatility(
    double market_price, double S, double K, double T, double r,
    OptionType type = OptionType::Call,
    const ImpliedVolSettings& settings = {});

}  // namespace qx::analytics::options
