// QX Analytics CLI Calculator
//
// Runs one library calculation per invocation. Parameters arrive as a JSON
// object on the command line or in a file; the result is printed as JSON.

#include <qx/analytics/analytics.hpp>
#include <qx/analytics/json.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace qa = qx::analytics;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<uint64_t> seed;
    std::optional<std::string> params_file;
    bool verbose = false;
    bool pretty = false;
    std::string command;
    std::string params_text;
};

// Per-invocation state handed to every command
struct Context {
    qa::Config config;
    qa::RandomSource& rng;
};

//------------------------------------------------------------------------------
// Parameter helpers
//------------------------------------------------------------------------------

double number(const json& p, const char* key) {
    if (!p.contains(key)) {
        throw qa::InvalidInputError(std::string("missing parameter '") + key + "'");
    }
    return p.at(key).get<double>();
}

template <typename T>
T field(const json& p, const char* key) {
    if (!p.contains(key)) {
        throw qa::InvalidInputError(std::string("missing parameter '") + key + "'");
    }
    return p.at(key).get<T>();
}

template <typename T>
std::optional<T> optional_field(const json& p, const char* key) {
    if (!p.contains(key) || p.at(key).is_null()) return std::nullopt;
    return p.at(key).get<T>();
}

qa::OptionType option_type(const json& p) {
    return p.value("type", qa::OptionType::Call);
}

int frequency(const json& p) {
    return p.value("frequency", qa::bonds::DEFAULT_FREQUENCY);
}

qa::portfolio::MarkowitzParams markowitz(const json& p, const Context& ctx) {
    qa::portfolio::MarkowitzParams params;
    params.risk_free_rate = ctx.config.optimizer.risk_free_rate;
    params.settings = ctx.config.optimizer_settings();
    p.get_to(params);
    return params;
}

//------------------------------------------------------------------------------
// Commands
//------------------------------------------------------------------------------

using Command = std::function<json(const json&, Context&)>;

std::map<std::string, Command> make_commands() {
    namespace opt = qa::options;
    namespace bnd = qa::bonds;
    namespace pf = qa::portfolio;
    namespace st = qa::stats;
    namespace rk = qa::risk;
    namespace val = qa::valuation;
    namespace ind = qa::indicators;

    std::map<std::string, Command> cmds;

    // Options
    cmds["black_scholes"] = [](const json& p, Context&) -> json {
        return opt::black_scholes(number(p, "S"), number(p, "K"), number(p, "T"),
                                  number(p, "r"), number(p, "sigma"), option_type(p));
    };
    cmds["binomial"] = [](const json& p, Context& ctx) -> json {
        return opt::binomial_tree(number(p, "S"), number(p, "K"), number(p, "T"),
                                  number(p, "r"), number(p, "sigma"),
                                  p.value("steps", ctx.config.solver.lattice_steps),
                                  option_type(p),
                                  p.value("style", qa::ExerciseStyle::American));
    };
    cmds["greeks"] = [](const json& p, Context&) -> json {
        return opt::greeks(number(p, "S"), number(p, "K"), number(p, "T"),
                           number(p, "r"), number(p, "sigma"), option_type(p));
    };
    cmds["implied_vol"] = [](const json& p, Context& ctx) -> json {
        return opt::implied_volatility(number(p, "marketPrice"), number(p, "S"), number(p, "K"),
                                       number(p, "T"), number(p, "r"), option_type(p),
                                       ctx.config.implied_vol_settings());
    };

    // Bonds
    cmds["bond_price"] = [](const json& p, Context&) -> json {
        return bnd::bond_price(number(p, "face"), number(p, "couponRate"), number(p, "yield"),
                               number(p, "years"), frequency(p));
    };
    cmds["ytm"] = [](const json& p, Context& ctx) -> json {
        return bnd::yield_to_maturity(number(p, "face"), number(p, "couponRate"),
                                      number(p, "price"), number(p, "years"), frequency(p),
                                      ctx.config.yield_settings());
    };
    cmds["duration"] = [](const json& p, Context&) -> json {
        double face = number(p, "face");
        double coupon = number(p, "couponRate");
        double y = number(p, "yield");
        double years = number(p, "years");
        int f = frequency(p);
        return json{
            {"price", bnd::bond_price(face, coupon, y, years, f)},
            {"macaulay", bnd::macaulay_duration(face, coupon, y, years, f)},
            {"modified", bnd::modified_duration(face, coupon, y, years, f)},
            {"effective", bnd::effective_duration(face, coupon, y, years, f)},
            {"convexity", bnd::convexity(face, coupon, y, years, f)},
            {"effectiveConvexity", bnd::effective_convexity(face, coupon, y, years, f)}
        };
    };

    // Portfolio
    cmds["max_sharpe"] = [](const json& p, Context& ctx) -> json {
        return pf::max_sharpe_portfolio(markowitz(p, ctx), ctx.rng);
    };
    cmds["min_variance"] = [](const json& p, Context& ctx) -> json {
        return pf::min_variance_portfolio(markowitz(p, ctx), ctx.rng);
    };
    cmds["optimize"] = [](const json& p, Context& ctx) -> json {
        return pf::optimize_portfolio(markowitz(p, ctx), ctx.rng,
                                      optional_field<double>(p, "targetReturn"),
                                      optional_field<double>(p, "targetRisk"));
    };
    cmds["frontier"] = [](const json& p, Context& ctx) -> json {
        return pf::efficient_frontier(markowitz(p, ctx), ctx.rng,
                                      p.value("numPortfolios", ctx.config.optimizer.frontier_points));
    };

    // Statistics
    cmds["regression"] = [](const json& p, Context&) -> json {
        return st::simple_linear_regression(field<qa::Vector>(p, "x"), field<qa::Vector>(p, "y"));
    };
    cmds["multiple_regression"] = [](const json& p, Context&) -> json {
        return st::multiple_linear_regression(field<qa::Vector>(p, "y"),
                                              field<qa::Matrix>(p, "factors"));
    };
    cmds["covariance_matrix"] = [](const json& p, Context&) -> json {
        return st::covariance_matrix(field<qa::Matrix>(p, "series"));
    };
    cmds["correlation_matrix"] = [](const json& p, Context&) -> json {
        return st::correlation_matrix(field<qa::Matrix>(p, "series"));
    };
    cmds["capm"] = [](const json& p, Context&) -> json {
        return st::capm_regression(field<qa::Vector>(p, "stock"), field<qa::Vector>(p, "market"),
                                   p.value("riskFreeRate", 0.0));
    };
    cmds["fama_french_3"] = [](const json& p, Context&) -> json {
        return st::fama_french_3(field<qa::Vector>(p, "stock"), field<qa::Vector>(p, "market"),
                                 field<qa::Vector>(p, "smb"), field<qa::Vector>(p, "hml"));
    };
    cmds["fama_french_5"] = [](const json& p, Context&) -> json {
        return st::fama_french_5(field<qa::Vector>(p, "stock"), field<qa::Vector>(p, "market"),
                                 field<qa::Vector>(p, "smb"), field<qa::Vector>(p, "hml"),
                                 field<qa::Vector>(p, "rmw"), field<qa::Vector>(p, "cma"));
    };

    // Risk
    cmds["risk"] = [](const json& p, Context&) -> json {
        auto returns = field<qa::Vector>(p, "returns");
        double rf = p.value("riskFreeRate", 0.0);
        double confidence = p.value("confidence", 0.95);
        return json{
            {"volatility", rk::volatility(returns)},
            {"sharpeRatio", rk::sharpe_ratio(returns, rf)},
            {"sortinoRatio", rk::sortino_ratio(returns, rf)},
            {"valueAtRisk", rk::value_at_risk(returns, confidence)},
            {"conditionalValueAtRisk", rk::conditional_value_at_risk(returns, confidence)},
            {"cumulativeReturn", rk::cumulative_return(returns)}
        };
    };
    cmds["drawdown"] = [](const json& p, Context&) -> json {
        return rk::max_drawdown(field<qa::Vector>(p, "prices"));
    };

    // Valuation
    cmds["dcf"] = [](const json& p, Context&) -> json {
        return val::dcf_value(p.get<val::DcfParams>());
    };
    cmds["ddm"] = [](const json& p, Context&) -> json {
        return val::constant_growth_ddm(number(p, "dividend"), number(p, "growthRate"),
                                        number(p, "discountRate"));
    };
    cmds["two_stage_ddm"] = [](const json& p, Context&) -> json {
        return val::two_stage_ddm(number(p, "dividend"), number(p, "highGrowthRate"),
                                  field<int>(p, "highGrowthYears"), number(p, "stableGrowthRate"),
                                  number(p, "discountRate"));
    };

    // Indicators
    cmds["sma"] = [](const json& p, Context&) -> json {
        return ind::sma(field<qa::Vector>(p, "prices"), field<int>(p, "period"));
    };
    cmds["ema"] = [](const json& p, Context&) -> json {
        return ind::ema(field<qa::Vector>(p, "prices"), field<int>(p, "period"));
    };
    cmds["rsi"] = [](const json& p, Context&) -> json {
        return ind::rsi(field<qa::Vector>(p, "prices"), p.value("period", 14));
    };
    cmds["macd"] = [](const json& p, Context&) -> json {
        return ind::macd(field<qa::Vector>(p, "prices"), p.value("fast", 12),
                         p.value("slow", 26), p.value("signal", 9));
    };
    cmds["bollinger"] = [](const json& p, Context&) -> json {
        return ind::bollinger_bands(field<qa::Vector>(p, "prices"), p.value("period", 20),
                                    p.value("multiplier", 2.0));
    };

    return cmds;
}

//------------------------------------------------------------------------------
// Argument parsing
//------------------------------------------------------------------------------

void print_usage(const char* prog, const std::map<std::string, Command>& commands) {
    std::cout << "QX Analytics Calculator\n\n"
              << "Usage: " << prog << " [options] <command> '<json params>'\n"
              << "       " << prog << " [options] -f params.json <command>\n\n"
              << "Options:\n"
              << "  -c, --config <file>  TOML configuration file\n"
              << "  -s, --seed <n>       Seed for the portfolio optimizers\n"
              << "  -f, --file <file>    Read JSON parameters from a file\n"
              << "  -p, --pretty         Indent JSON output\n"
              << "  -v, --verbose        Debug diagnostics on stderr\n"
              << "  -h, --help           Show this help message\n\n"
              << "Commands:\n";
    for (const auto& [name, _] : commands) {
        std::cout << "  " << name << "\n";
    }
    std::cout << "\nExamples:\n"
              << "  " << prog << " black_scholes '{\"S\":100,\"K\":100,\"T\":1,\"r\":0.05,\"sigma\":0.2}'\n"
              << "  " << prog << " -s 42 max_sharpe '{\"returns\":[0.1,0.12],"
                 "\"covariance\":[[0.04,0.01],[0.01,0.09]]}'\n";
}

CliOptions parse_args(int argc, char* argv[], const std::map<std::string, Command>& commands) {
    CliOptions opts;
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next = [&](const char* what) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing " << what << " argument\n";
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0], commands);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            opts.config_path = next("config");
        } else if (arg == "-s" || arg == "--seed") {
            std::string value = next("seed");
            try {
                opts.seed = std::stoull(value);
            } catch (const std::logic_error&) {
                std::cerr << "Invalid seed: " << value << "\n";
                std::exit(1);
            }
        } else if (arg == "-f" || arg == "--file") {
            opts.params_file = next("file");
        } else if (arg == "-p" || arg == "--pretty") {
            opts.pretty = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (positional == 0) {
            opts.command = arg;
            ++positional;
        } else if (positional == 1) {
            opts.params_text = arg;
            ++positional;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            std::exit(1);
        }
    }

    if (opts.command.empty()) {
        print_usage(argv[0], commands);
        std::exit(1);
    }
    return opts;
}

json load_params(const CliOptions& opts) {
    if (opts.params_file) {
        std::ifstream file{*opts.params_file};
        if (!file.is_open()) {
            throw qa::InvalidInputError("Cannot open parameter file: " + *opts.params_file);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return json::parse(buffer.str());
    }
    if (opts.params_text.empty()) {
        return json::object();
    }
    return json::parse(opts.params_text);
}

json error_object(const char* kind, const std::string& message) {
    return json{{"error", {{"kind", kind}, {"message", message}}}};
}

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    const auto commands = make_commands();
    CliOptions opts = parse_args(argc, argv, commands);
    const int indent = opts.pretty ? 2 : -1;

    auto it = commands.find(opts.command);
    if (it == commands.end()) {
        std::cerr << "Unknown command: " << opts.command << " (see --help)\n";
        return 1;
    }

    try {
        qa::Config config = opts.config_path ? qa::Config::from_file(*opts.config_path)
                                             : qa::Config{};
        if (opts.seed) config.set_seed(*opts.seed);
        if (opts.verbose) config.set_log_level("debug");
        config.apply();

        std::unique_ptr<qa::SeededRandom> rng;
        if (config.optimizer.seed) {
            rng = std::make_unique<qa::SeededRandom>(*config.optimizer.seed);
        } else {
            rng = qa::make_entropy_random();
        }
        if (qa::log_enabled(qa::LogLevel::Debug)) {
            qa::log_debug("qx-calc", "command " + opts.command + ", seed " +
                          std::to_string(rng->seed()));
        }

        Context ctx{config, *rng};
        json params = load_params(opts);
        json result = it->second(params, ctx);

        std::cout << json{{"result", result}}.dump(indent) << "\n";
        return 0;
    } catch (const qa::AnalyticsError& e) {
        qa::log_error("qx-calc", e.what());
        std::cout << error_object(qa::to_string(e.kind()), e.what()).dump(indent) << "\n";
        return 2;
    } catch (const json::exception& e) {
        qa::log_error("qx-calc", e.what());
        std::cout << error_object(qa::to_string(qa::ErrorKind::InvalidInput), e.what()).dump(indent)
                  << "\n";
        return 2;
    }
}
