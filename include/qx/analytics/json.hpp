// QX Analytics - JSON Serialization
// nlohmann::json conversions for settings, inputs and results

#pragma once

#include <qx/analytics/bonds.hpp>
#include <qx/analytics/error.hpp>
#include <qx/analytics/indicators.hpp>
#include <qx/analytics/options.hpp>
#include <qx/analytics/portfolio.hpp>
#include <qx/analytics/risk.hpp>
#include <qx/analytics/stats.hpp>
#include <qx/analytics/types.hpp>
#include <qx/analytics/valuation.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace qx::analytics {

namespace detail {

template <typename T>
inline void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

template <typename T>
inline void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& v) {
    if (j.contains(key) && !j.at(key).is_null()) v = j.at(key).get<T>();
}

}  // namespace detail

// =============================================================================
// Core Types
// =============================================================================

inline void to_json(nlohmann::json& j, OptionType t) {
    j = to_string(t);
}

inline void from_json(const nlohmann::json& j, OptionType& t) {
    auto parsed = option_type_from_string(j.get<std::string>());
    if (!parsed) throw InvalidInputError("unknown option type '" + j.get<std::string>() + "'");
    t = *parsed;
}

inline void to_json(nlohmann::json& j, ExerciseStyle s) {
    j = to_string(s);
}

inline void from_json(const nlohmann::json& j, ExerciseStyle& s) {
    auto parsed = exercise_style_from_string(j.get<std::string>());
    if (!parsed) throw InvalidInputError("unknown exercise style '" + j.get<std::string>() + "'");
    s = *parsed;
}

inline void to_json(nlohmann::json& j, const SolverResult& r) {
    j = nlohmann::json{{"value", r.value}, {"converged", r.converged}, {"iterations", r.iterations}};
}

inline void from_json(const nlohmann::json& j, SolverResult& r) {
    if (j.contains("value")) j.at("value").get_to(r.value);
    if (j.contains("converged")) j.at("converged").get_to(r.converged);
    if (j.contains("iterations")) j.at("iterations").get_to(r.iterations);
}

namespace options {

inline void to_json(nlohmann::json& j, const Greeks& g) {
    j = nlohmann::json{
        {"delta", g.delta},
        {"gamma", g.gamma},
        {"theta", g.theta},
        {"vega", g.vega},
        {"rho", g.rho}
    };
}

inline void to_json(nlohmann::json& j, const ImpliedVolSettings& s) {
    j = nlohmann::json{
        {"lower", s.lower},
        {"upper", s.upper},
        {"tolerance", s.tolerance},
        {"maxIterations", s.max_iterations}
    };
}

inline void from_json(const nlohmann::json& j, ImpliedVolSettings& s) {
    if (j.contains("lower")) j.at("lower").get_to(s.lower);
    if (j.contains("upper")) j.at("upper").get_to(s.upper);
    if (j.contains("tolerance")) j.at("tolerance").get_to(s.tolerance);
    if (j.contains("maxIterations")) j.at("maxIterations").get_to(s.max_iterations);
}

}  // namespace options

namespace bonds {

inline void to_json(nlohmann::json& j, const YieldSolverSettings& s) {
    j = nlohmann::json{{"tolerance", s.tolerance}, {"maxIterations", s.max_iterations}};
}

inline void from_json(const nlohmann::json& j, YieldSolverSettings& s) {
    if (j.contains("tolerance")) j.at("tolerance").get_to(s.tolerance);
    if (j.contains("maxIterations")) j.at("maxIterations").get_to(s.max_iterations);
}

}  // namespace bonds

// =============================================================================
// Portfolio
// =============================================================================

namespace portfolio {

inline void to_json(nlohmann::json& j, const WeightConstraints& c) {
    j = nlohmann::json{{"longOnly", c.long_only}};
    detail::put_optional(j, "minWeight", c.min_weight);
    detail::put_optional(j, "maxWeight", c.max_weight);
    detail::put_optional(j, "min", c.min);
    detail::put_optional(j, "max", c.max);
}

inline void from_json(const nlohmann::json& j, WeightConstraints& c) {
    if (j.contains("longOnly")) j.at("longOnly").get_to(c.long_only);
    detail::get_optional(j, "minWeight", c.min_weight);
    detail::get_optional(j, "maxWeight", c.max_weight);
    detail::get_optional(j, "min", c.min);
    detail::get_optional(j, "max", c.max);
}

inline void to_json(nlohmann::json& j, const PortfolioResult& r) {
    j = nlohmann::json{
        {"weights", r.weights},
        {"expectedReturn", r.expected_return},
        {"variance", r.variance},
        {"volatility", r.volatility}
    };
    detail::put_optional(j, "sharpeRatio", r.sharpe_ratio);
}

inline void to_json(nlohmann::json& j, const OptimizerSettings& s) {
    j = nlohmann::json{{"iterations", s.iterations}, {"step", s.step}};
}

inline void from_json(const nlohmann::json& j, OptimizerSettings& s) {
    if (j.contains("iterations")) j.at("iterations").get_to(s.iterations);
    if (j.contains("step")) j.at("step").get_to(s.step);
}

inline void from_json(const nlohmann::json& j, MarkowitzParams& p) {
    if (j.contains("returns")) j.at("returns").get_to(p.returns);
    if (j.contains("covariance")) j.at("covariance").get_to(p.covariance);
    if (j.contains("riskFreeRate")) j.at("riskFreeRate").get_to(p.risk_free_rate);
    detail::get_optional(j, "constraints", p.constraints);
    if (j.contains("settings")) j.at("settings").get_to(p.settings);
}

inline void to_json(nlohmann::json& j, const Holding& h) {
    j = nlohmann::json{{"price", h.price}, {"quantity", h.quantity}};
}

inline void from_json(const nlohmann::json& j, Holding& h) {
    if (j.contains("price")) j.at("price").get_to(h.price);
    if (j.contains("quantity")) j.at("quantity").get_to(h.quantity);
}

}  // namespace portfolio

// =============================================================================
// Statistics and Risk
// =============================================================================

namespace stats {

inline void to_json(nlohmann::json& j, const SimpleRegression& r) {
    j = nlohmann::json{
        {"intercept", r.intercept},
        {"slope", r.slope},
        {"rSquared", r.r_squared},
        {"standardError", r.standard_error}
    };
}

inline void to_json(nlohmann::json& j, const MultipleRegression& r) {
    j = nlohmann::json{
        {"intercept", r.intercept},
        {"coefficients", r.coefficients},
        {"rSquared", r.r_squared},
        {"adjustedRSquared", r.adjusted_r_squared}
    };
}

inline void to_json(nlohmann::json& j, const CapmResult& r) {
    j = nlohmann::json{{"alpha", r.alpha}, {"beta", r.beta}, {"rSquared", r.r_squared}};
}

inline void to_json(nlohmann::json& j, const FamaFrench3Result& r) {
    j = nlohmann::json{
        {"alpha", r.alpha},
        {"beta", r.beta},
        {"smb", r.smb},
        {"hml", r.hml},
        {"rSquared", r.r_squared}
    };
}

inline void to_json(nlohmann::json& j, const FamaFrench5Result& r) {
    j = nlohmann::json{
        {"alpha", r.alpha},
        {"beta", r.beta},
        {"smb", r.smb},
        {"hml", r.hml},
        {"rmw", r.rmw},
        {"cma", r.cma},
        {"rSquared", r.r_squared}
    };
}

}  // namespace stats

namespace risk {

inline void to_json(nlohmann::json& j, const Drawdown& d) {
    j = nlohmann::json{
        {"maxDrawdown", d.max_drawdown},
        {"peakIndex", d.peak_index},
        {"troughIndex", d.trough_index}
    };
}

}  // namespace risk

// =============================================================================
// Valuation and Indicators
// =============================================================================

namespace valuation {

inline void to_json(nlohmann::json& j, const DcfParams& p) {
    j = nlohmann::json{
        {"freeCashFlows", p.free_cash_flows},
        {"discountRate", p.discount_rate},
        {"terminalGrowthRate", p.terminal_growth_rate}
    };
    detail::put_optional(j, "terminalMultiple", p.terminal_multiple);
    detail::put_optional(j, "terminalYearFcf", p.terminal_year_fcf);
}

inline void from_json(const nlohmann::json& j, DcfParams& p) {
    if (j.contains("freeCashFlows")) j.at("freeCashFlows").get_to(p.free_cash_flows);
    if (j.contains("discountRate")) j.at("discountRate").get_to(p.discount_rate);
    if (j.contains("terminalGrowthRate")) j.at("terminalGrowthRate").get_to(p.terminal_growth_rate);
    detail::get_optional(j, "terminalMultiple", p.terminal_multiple);
    detail::get_optional(j, "terminalYearFcf", p.terminal_year_fcf);
}

}  // namespace valuation

namespace indicators {

inline void to_json(nlohmann::json& j, const Macd& m) {
    j = nlohmann::json{{"macd", m.macd}, {"signal", m.signal}, {"histogram", m.histogram}};
}

inline void to_json(nlohmann::json& j, const Kdj& k) {
    j = nlohmann::json{{"k", k.k}, {"d", k.d}, {"j", k.j}};
}

inline void to_json(nlohmann::json& j, const Bands& b) {
    j = nlohmann::json{{"upper", b.upper}, {"middle", b.middle}, {"lower", b.lower}};
}

}  // namespace indicators

}  // namespace qx::analytics
