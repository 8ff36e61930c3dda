// QX Analytics - Equity Valuation
// Discounted cash flow, dividend discount models and relative multiples

#pragma once

#include <qx/analytics/types.hpp>
#include <optional>

namespace qx::analytics::valuation {

// Discount rates are annual decimals in (0, 1); a growth rate that is not
// below the discount rate raises UndefinedError.

// =============================================================================
// Discounted Cash Flow
// =============================================================================

struct DcfParams {
    Vector free_cash_flows;                    // Forecast FCF for years 1..n
    double discount_rate = 0.0;                // WACC
    double terminal_growth_rate = 0.0;         // Gordon terminal value
    std::optional<double> terminal_multiple;   // Exit-multiple terminal value,
    std::optional<double> terminal_year_fcf;   // used when both are set
};

// Enterprise value: PV of forecast FCF plus PV of the terminal value
double dcf_value(const DcfParams& params);

// EV - debt + cash - minority interest
inline double equity_value(double enterprise_value, double debt, double cash,
                           double minority_interest = 0.0) noexcept {
    return enterprise_value - debt + cash - minority_interest;
}

double value_per_share(double equity_value, double shares_outstanding);

// E/V * Re + D/V * Rd * (1 - tax)
double wacc(double equity_value, double debt_value, double cost_of_equity,
            double cost_of_debt, double tax_rate);

// next_cash_flow / (discount - growth)
double gordon_growth_value(double next_cash_flow, double growth_rate, double discount_rate);

// =============================================================================
// Dividend Discount Models
// =============================================================================

double zero_growth_ddm(double dividend, double discount_rate);

// D0 * (1 + g) / (r - g)
double constant_growth_ddm(double current_dividend, double growth_rate, double discount_rate);

// High growth for high_growth_years, then a Gordon terminal value at stable growth
double two_stage_ddm(double current_dividend, double high_growth_rate, int high_growth_years,
                     double stable_growth_rate, double discount_rate);

// Growth declines linearly from high to stable across the transition years
double three_stage_ddm(double current_dividend, double high_growth_rate, int high_growth_years,
                       int transition_years, double stable_growth_rate, double discount_rate);

double dividend_yield(double dividend, double price);

double payout_ratio(double dividend, double earnings_per_share);

// =============================================================================
// Relative Valuation
// =============================================================================

double pe_ratio(double price, double earnings_per_share);
double value_by_pe(double earnings_per_share, double industry_pe);

double pb_ratio(double price, double book_value_per_share);
double value_by_pb(double book_value_per_share, double industry_pb);

double ps_ratio(double price, double sales_per_share);
double value_by_ps(double sales_per_share, double industry_ps);

double ev_to_ebitda(double enterprise_value, double ebitda);

// Per-share equity value implied by an industry EV/EBITDA multiple
double value_by_ev_ebitda(double ebitda, double industry_multiple, double debt, double cash,
                          double shares_outstanding);

// P/E divided by growth in percent (0.15 -> 15)
double peg_ratio(double pe_ratio, double growth_rate);

inline double enterprise_value(double market_cap, double debt, double cash,
                               double minority_interest = 0.0) noexcept {
    return market_cap + debt - cash + minority_interest;
}

}  // namespace qx::analytics::valuation
