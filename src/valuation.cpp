// QX Analytics - Equity Valuation Implementation

#include <qx/analytics/valuation.hpp>
#include <qx/analytics/error.hpp>
#include <cmath>
#include <string>

namespace qx::analytics::valuation {

namespace {

void require_growth_below(double growth, double discount, const char* what) {
    if (growth >= discount) {
        throw UndefinedError(std::string(what) + " growth rate " + std::to_string(growth) +
                             " must be below the discount rate " + std::to_string(discount));
    }
}

// Zero or negative denominators leave the ratio without meaning
double ratio(double numerator, double denominator, const char* name) {
    if (!(denominator > 0.0)) {
        throw UndefinedError(std::string(name) + " must be positive, got " +
                             std::to_string(denominator));
    }
    return numerator / denominator;
}

double discount_factor(double rate, int years) noexcept {
    return std::pow(1.0 + rate, years);
}

}  // namespace

// =============================================================================
// Discounted Cash Flow
// =============================================================================

double dcf_value(const DcfParams& params) {
    detail::require_non_empty(params.free_cash_flows, "free cash flows");
    detail::require_unit_interval(params.discount_rate, "discount rate");

    const double r = params.discount_rate;
    const int n = static_cast<int>(params.free_cash_flows.size());

    double pv = 0.0;
    for (int i = 0; i < n; ++i) {
        pv += params.free_cash_flows[i] / discount_factor(r, i + 1);
    }

    double terminal = 0.0;
    if (params.terminal_multiple && params.terminal_year_fcf) {
        terminal = *params.terminal_year_fcf * *params.terminal_multiple;
    } else {
        require_growth_below(params.terminal_growth_rate, r, "terminal");
        terminal = params.free_cash_flows.back() * (1.0 + params.terminal_growth_rate) /
                   (r - params.terminal_growth_rate);
    }

    return pv + terminal / discount_factor(r, n);
}

double value_per_share(double equity_value, double shares_outstanding) {
    return ratio(equity_value, shares_outstanding, "shares outstanding");
}

double wacc(double equity_value, double debt_value, double cost_of_equity,
            double cost_of_debt, double tax_rate) {
    double total = equity_value + debt_value;
    if (total == 0.0) {
        throw UndefinedError("WACC is undefined when equity plus debt is zero");
    }
    return equity_value / total * cost_of_equity +
           debt_value / total * cost_of_debt * (1.0 - tax_rate);
}

double gordon_growth_value(double next_cash_flow, double growth_rate, double discount_rate) {
    detail::require_positive(discount_rate, "discount rate");
    require_growth_below(growth_rate, discount_rate, "perpetual");
    return next_cash_flow / (discount_rate - growth_rate);
}

// =============================================================================
// Dividend Discount Models
// =============================================================================

double zero_growth_ddm(double dividend, double discount_rate) {
    detail::require_unit_interval(discount_rate, "discount rate");
    detail::require_positive(dividend, "dividend");
    return dividend / discount_rate;
}

double constant_growth_ddm(double current_dividend, double growth_rate, double discount_rate) {
    detail::require_unit_interval(discount_rate, "discount rate");
    detail::require_positive(current_dividend, "current dividend");
    require_growth_below(growth_rate, discount_rate, "dividend");
    return current_dividend * (1.0 + growth_rate) / (discount_rate - growth_rate);
}

double two_stage_ddm(double current_dividend, double high_growth_rate, int high_growth_years,
                     double stable_growth_rate, double discount_rate) {
    detail::require_unit_interval(discount_rate, "discount rate");
    detail::require_positive(current_dividend, "current dividend");
    detail::require(high_growth_years > 0, "high-growth years must be positive");
    require_growth_below(high_growth_rate, discount_rate, "high-growth stage");
    require_growth_below(stable_growth_rate, discount_rate, "stable stage");

    double pv = 0.0;
    double dividend = current_dividend;
    for (int year = 1; year <= high_growth_years; ++year) {
        dividend *= 1.0 + high_growth_rate;
        pv += dividend / discount_factor(discount_rate, year);
    }

    double terminal = dividend * (1.0 + stable_growth_rate) /
                      (discount_rate - stable_growth_rate);
    return pv + terminal / discount_factor(discount_rate, high_growth_years);
}

double three_stage_ddm(double current_dividend, double high_growth_rate, int high_growth_years,
                       int transition_years, double stable_growth_rate, double discount_rate) {
    detail::require_unit_interval(discount_rate, "discount rate");
    detail::require_positive(current_dividend, "current dividend");
    detail::require(high_growth_years > 0, "high-growth years must be positive");
    detail::require(transition_years > 0, "transition years must be positive");
    require_growth_below(stable_growth_rate, discount_rate, "stable stage");

    double pv = 0.0;
    double dividend = current_dividend;
    for (int year = 1; year <= high_growth_years; ++year) {
        dividend *= 1.0 + high_growth_rate;
        pv += dividend / discount_factor(discount_rate, year);
    }

    const double step = (high_growth_rate - stable_growth_rate) / (transition_years + 1);
    for (int year = 1; year <= transition_years; ++year) {
        dividend *= 1.0 + high_growth_rate - step * year;
        pv += dividend / discount_factor(discount_rate, high_growth_years + year);
    }

    double terminal = dividend * (1.0 + stable_growth_rate) /
                      (discount_rate - stable_growth_rate);
    return pv + terminal / discount_factor(discount_rate, high_growth_years + transition_years);
}

double dividend_yield(double dividend, double price) {
    return ratio(dividend, price, "price");
}

double payout_ratio(double dividend, double earnings_per_share) {
    return ratio(dividend, earnings_per_share, "earnings per share");
}

// =============================================================================
// Relative Valuation
// =============================================================================

double pe_ratio(double price, double earnings_per_share) {
    return ratio(price, earnings_per_share, "earnings per share");
}

double value_by_pe(double earnings_per_share, double industry_pe) {
    detail::require_positive(industry_pe, "industry P/E");
    return earnings_per_share * industry_pe;
}

double pb_ratio(double price, double book_value_per_share) {
    return ratio(price, book_value_per_share, "book value per share");
}

double value_by_pb(double book_value_per_share, double industry_pb) {
    detail::require_positive(industry_pb, "industry P/B");
    return book_value_per_share * industry_pb;
}

double ps_ratio(double price, double sales_per_share) {
    return ratio(price, sales_per_share, "sales per share");
}

double value_by_ps(double sales_per_share, double industry_ps) {
    detail::require_positive(industry_ps, "industry P/S");
    return sales_per_share * industry_ps;
}

double ev_to_ebitda(double enterprise_value, double ebitda) {
    return ratio(enterprise_value, ebitda, "EBITDA");
}

double value_by_ev_ebitda(double ebitda, double industry_multiple, double debt, double cash,
                          double shares_outstanding) {
    detail::require_positive(industry_multiple, "industry EV/EBITDA");
    double ev = ebitda * industry_multiple;
    return value_per_share(equity_value(ev, debt, cash), shares_outstanding);
}

double peg_ratio(double pe_ratio, double growth_rate) {
    return ratio(pe_ratio, growth_rate * 100.0, "growth rate");
}

}  // namespace qx::analytics::valuation
