// QX Analytics - Fixed-Income Analytics Implementation

#include <qx/analytics/bonds.hpp>
#include <qx/analytics/error.hpp>
#include <qx/analytics/log.hpp>
#include <qx/analytics/math.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace qx::analytics::bonds {

namespace {

// Cashflow schedule of a fixed-coupon bullet bond
struct Schedule {
    double face;
    double coupon;          // Per period
    double periods;         // years * frequency, may be fractional
    int frequency;
    double periodic_yield;

    // Coupon dates counted back from maturity; the first one may fall
    // less than a full period from now
    [[nodiscard]] int coupon_count() const noexcept {
        return std::max(1, static_cast<int>(std::ceil(periods - 1e-9)));
    }

    [[nodiscard]] double growth() const noexcept { return 1.0 + periodic_yield; }
};

Schedule make_schedule(double face, double coupon_rate, double yield, double years, int frequency) {
    detail::require_positive(face, "face value");
    detail::require_positive(years, "years to maturity");
    detail::require(frequency > 0,
                    "coupon frequency must be positive, got " + std::to_string(frequency));
    detail::require_finite(coupon_rate, "coupon rate");
    detail::require_finite(yield, "yield");

    Schedule s{face, face * coupon_rate / frequency, years * frequency, frequency,
               yield / frequency};
    if (s.growth() <= 0.0) {
        throw UndefinedError("periodic yield " + std::to_string(s.periodic_yield) +
                             " makes discounting undefined");
    }
    return s;
}

double price_of(const Schedule& s) noexcept {
    const double i = s.periodic_yield;
    const double n = s.periods;

    if (std::abs(i) < math::EPSILON) {
        return s.face + s.coupon * n;
    }

    double v = std::pow(s.growth(), -n);
    return s.coupon * (1.0 - v) / i + s.face * v;
}

// dP/dy: derivative of the closed form with respect to the periodic yield,
// divided by the frequency
double derivative_of(const Schedule& s) noexcept {
    const double i = s.periodic_yield;
    const double n = s.periods;

    if (std::abs(i) < math::EPSILON) {
        return -(s.coupon * n * (n + 1.0) / 2.0 + s.face * n) / s.frequency;
    }

    double v = std::pow(s.growth(), -n);
    double d_coupons = -s.coupon * (1.0 - v) / (i * i) + s.coupon * n * v / (s.growth() * i);
    double d_face = -s.face * n * v / s.growth();
    return (d_coupons + d_face) / s.frequency;
}

struct WeightedPv {
    double pv = 0.0;
    double time_weighted = 0.0;       // Sum of t * PV, t in years
    double convexity_weighted = 0.0;  // Sum of t(t+1) * PV, in years squared
};

WeightedPv weigh_cashflows(const Schedule& s) noexcept {
    WeightedPv w;
    const double f = s.frequency;
    const int count = s.coupon_count();

    for (int j = 0; j < count; ++j) {
        double t = s.periods - j;  // In periods
        double cashflow = j == 0 ? s.face + s.coupon : s.coupon;
        double pv = cashflow * std::pow(s.growth(), -t);
        w.pv += pv;
        w.time_weighted += pv * t / f;
        w.convexity_weighted += pv * t * (t + 1.0) / (f * f);
    }
    return w;
}

void require_positive_pv(double pv) {
    if (!(pv > 0.0)) {
        throw UndefinedError("bond present value is not positive (" + std::to_string(pv) + ")");
    }
}

}  // namespace

// =============================================================================
// Pricing
// =============================================================================

double bond_price(double face, double coupon_rate, double yield, double years, int frequency) {
    return price_of(make_schedule(face, coupon_rate, yield, years, frequency));
}

double bond_price_derivative(double face, double coupon_rate, double yield, double years,
                             int frequency) {
    return derivative_of(make_schedule(face, coupon_rate, yield, years, frequency));
}

double zero_coupon_price(double face, double yield, double years) {
    detail::require_positive(face, "face value");
    detail::require_positive(years, "years to maturity");
    if (1.0 + yield <= 0.0) {
        throw UndefinedError("yield " + std::to_string(yield) + " makes discounting undefined");
    }
    return face / std::pow(1.0 + yield, years);
}

double accrued_interest(double face, double coupon_rate, int frequency,
                        double days_since_coupon, double days_in_period) {
    detail::require_positive(face, "face value");
    detail::require(frequency > 0, "coupon frequency must be positive");
    detail::require_positive(days_in_period, "days in coupon period");
    detail::require(days_since_coupon >= 0.0 && days_since_coupon <= days_in_period,
                    "days since last coupon must be within the coupon period");

    double coupon = face * coupon_rate / frequency;
    return coupon * days_since_coupon / days_in_period;
}

double present_value(const Vector& cashflows, double discount_rate, int periods_per_year) {
    detail::require_non_empty(cashflows, "cashflows");
    detail::require(discount_rate >= 0.0 && discount_rate <= 1.0,
                    "discount rate must be in [0, 1]");
    detail::require(periods_per_year > 0, "periods per year must be positive");

    const double growth = 1.0 + discount_rate / periods_per_year;
    double pv = 0.0;
    double discount = 1.0;
    for (double cf : cashflows) {
        discount /= growth;
        pv += cf * discount;
    }
    return pv;
}

// =============================================================================
// Yields
// =============================================================================

SolverResult yield_to_maturity(double face, double coupon_rate, double price, double years,
                               int frequency, const YieldSolverSettings& settings) {
    detail::require_positive(price, "price");
    detail::require_positive(settings.tolerance, "tolerance");
    detail::require(settings.max_iterations > 0, "max_iterations must be positive");

    Schedule s = make_schedule(face, coupon_rate, coupon_rate, years, frequency);
    double ytm = coupon_rate;

    for (int iter = 0; iter < settings.max_iterations; ++iter) {
        s.periodic_yield = ytm / frequency;
        if (s.growth() <= 0.0) {
            if (log_enabled(LogLevel::Warn)) {
                log_warn("yield_to_maturity", "iterate left the discountable domain at ytm=" +
                         std::to_string(ytm));
            }
            return {ytm, false, iter};
        }

        double error = price_of(s) - price;
        if (std::abs(error) < settings.tolerance) {
            return {ytm, true, iter + 1};
        }

        double slope = derivative_of(s);
        if (std::abs(slope) < math::EPSILON) {
            if (log_enabled(LogLevel::Warn)) {
                log_warn("yield_to_maturity", "flat price/yield curve at ytm=" +
                         std::to_string(ytm));
            }
            return {ytm, false, iter + 1};
        }

        ytm = std::clamp(ytm - error / slope, -1.0, 1.0);
    }

    if (log_enabled(LogLevel::Warn)) {
        log_warn("yield_to_maturity",
                 "no convergence after " + std::to_string(settings.max_iterations) +
                 " iterations, returning ytm=" + std::to_string(ytm));
    }
    return {ytm, false, settings.max_iterations};
}

double current_yield(double annual_coupon, double price) {
    detail::require_positive(price, "price");
    return annual_coupon / price;
}

double holding_period_return(double purchase_price, double selling_price, double coupons) {
    detail::require_positive(purchase_price, "purchase price");
    return (selling_price + coupons - purchase_price) / purchase_price;
}

double annualized_holding_period_return(double purchase_price, double selling_price,
                                        double coupons, double holding_years) {
    detail::require_positive(holding_years, "holding period");
    double hpr = holding_period_return(purchase_price, selling_price, coupons);
    if (1.0 + hpr < 0.0) {
        throw UndefinedError("cannot annualize a holding period return below -100%");
    }
    return std::pow(1.0 + hpr, 1.0 / holding_years) - 1.0;
}

// =============================================================================
// Duration
// =============================================================================

double macaulay_duration(double face, double coupon_rate, double yield, double years,
                         int frequency) {
    WeightedPv w = weigh_cashflows(make_schedule(face, coupon_rate, yield, years, frequency));
    require_positive_pv(w.pv);
    return w.time_weighted / w.pv;
}

double modified_duration(double face, double coupon_rate, double yield, double years,
                         int frequency) {
    Schedule s = make_schedule(face, coupon_rate, yield, years, frequency);
    WeightedPv w = weigh_cashflows(s);
    require_positive_pv(w.pv);
    return (w.time_weighted / w.pv) / s.growth();
}

double effective_duration(double face, double coupon_rate, double yield, double years,
                          int frequency, double yield_change) {
    detail::require_positive(yield_change, "yield change");

    double p0 = bond_price(face, coupon_rate, yield, years, frequency);
    double p_up = bond_price(face, coupon_rate, yield + yield_change, years, frequency);
    double p_down = bond_price(face, coupon_rate, yield - yield_change, years, frequency);
    require_positive_pv(p0);

    return -(p_up - p_down) / (2.0 * p0 * yield_change);
}

// =============================================================================
// Convexity
// =============================================================================

double convexity(double face, double coupon_rate, double yield, double years, int frequency) {
    Schedule s = make_schedule(face, coupon_rate, yield, years, frequency);
    WeightedPv w = weigh_cashflows(s);
    require_positive_pv(w.pv);
    return w.convexity_weighted / (w.pv * s.growth() * s.growth());
}

double effective_convexity(double face, double coupon_rate, double yield, double years,
                           int frequency, double yield_change) {
    detail::require_positive(yield_change, "yield change");

    double p0 = bond_price(face, coupon_rate, yield, years, frequency);
    double p_up = bond_price(face, coupon_rate, yield + yield_change, years, frequency);
    double p_down = bond_price(face, coupon_rate, yield - yield_change, years, frequency);
    require_positive_pv(p0);

    return (p_up + p_down - 2.0 * p0) / (p0 * yield_change * yield_change);
}

}  // namespace qx::analytics::bonds
