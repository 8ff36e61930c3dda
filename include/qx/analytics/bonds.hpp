// QX Analytics - Fixed-Income Analytics
// Bond pricing, yield to maturity, duration and convexity

#pragma once

#include <qx/analytics/types.hpp>

namespace qx::analytics::bonds {

// Parameter conventions:
//   face: face value (> 0), coupon_rate: annual coupon rate,
//   yield: annual yield, years: years to maturity (> 0),
//   frequency: coupon payments per year (> 0).
// The period count years * frequency is used unrounded. Pricing uses the
// closed form with that count; duration and convexity place coupons back
// from maturity, one period apart, so the nearest one may be a stub.

constexpr int DEFAULT_FREQUENCY = 2;

// =============================================================================
// Pricing
// =============================================================================

double bond_price(double face, double coupon_rate, double yield, double years,
                  int frequency = DEFAULT_FREQUENCY);

// Analytic dP/dy (per unit of annual yield)
double bond_price_derivative(double face, double coupon_rate, double yield, double years,
                             int frequency = DEFAULT_FREQUENCY);

// Annually compounded zero-coupon bond
double zero_coupon_price(double face, double yield, double years);

double accrued_interest(double face, double coupon_rate, int frequency,
                        double days_since_coupon, double days_in_period);

inline double clean_price(double dirty_price, double accrued) noexcept {
    return dirty_price - accrued;
}

inline double dirty_price(double clean_price, double accrued) noexcept {
    return clean_price + accrued;
}

// Discounts cashflows[k] at period k+1 with rate discount_rate / periods_per_year
double present_value(const Vector& cashflows, double discount_rate, int periods_per_year = 1);

// =============================================================================
// Yields
// =============================================================================

struct YieldSolverSettings {
    double tolerance = 1e-6;
    int max_iterations = 100;
};

// Newton-Raphson from ytm = coupon_rate, clamped to [-1, 1] each step.
// Stops early when |dP/dy| < 1e-10. There is no bracketing fallback: a
// flat or oscillating region returns converged = false with the last iterate.
SolverResult yield_to_maturity(double face, double coupon_rate, double price, double years,
                               int frequency = DEFAULT_FREQUENCY,
                               const YieldSolverSettings& settings = {});

double current_yield(double annual_coupon, double price);

double holding_period_return(double purchase_price, double selling_price, double coupons);

double annualized_holding_period_return(double purchase_price, double selling_price,
                                        double coupons, double holding_years);

// =============================================================================
// Duration
// =============================================================================

// Present-value weighted average time to cashflow, in years
double macaulay_duration(double face, double coupon_rate, double yield, double years,
                         int frequency = DEFAULT_FREQUENCY);

double modified_duration(double face, double coupon_rate, double yield, double years,
                         int frequency = DEFAULT_FREQUENCY);

// -(P(y+dy) - P(y-dy)) / (2 P(y) dy)
double effective_duration(double face, double coupon_rate, double yield, double years,
                          int frequency = DEFAULT_FREQUENCY, double yield_change = 0.01);

// =============================================================================
// Convexity
// =============================================================================

// In years squared
double convexity(double face, double coupon_rate, double yield, double years,
                 int frequency = DEFAULT_FREQUENCY);

// (P(y+dy) + P(y-dy) - 2 P(y)) / (P(y) dy^2)
double effective_convexity(double face, double coupon_rate, double yield, double years,
                           int frequency = DEFAULT_FREQUENCY, double yield_change = 0.01);

// Second-order Taylor estimate of the fractional price change for a yield shift
inline double estimate_price_change(double modified_duration, double convexity,
                                    double yield_change) noexcept {
    return -modified_duration * yield_change +
           0.5 * convexity * yield_change * yield_change;
}

inline double estimate_price(double current_price, double modified_duration,
                             double convexity, double yield_change) noexcept {
    return current_price * (1.0 + estimate_price_change(modified_duration, convexity, yield_change));
}

}  // namespace qx::analytics::bonds
