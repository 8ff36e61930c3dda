// QX Analytics - Configuration
// Solver and optimizer defaults, loaded from TOML or built fluently

#pragma once

#include <qx/analytics/bonds.hpp>
#include <qx/analytics/log.hpp>
#include <qx/analytics/options.hpp>
#include <qx/analytics/portfolio.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace qx::analytics {

// General settings
struct GeneralConfig {
    std::string log_level = "info";
};

// Root-finder and lattice settings
struct SolverConfig {
    double iv_lower = 0.001;
    double iv_upper = 5.0;
    double iv_tolerance = 1e-6;
    int iv_max_iterations = 100;
    double ytm_tolerance = 1e-6;
    int ytm_max_iterations = 100;
    int lattice_steps = options::DEFAULT_LATTICE_STEPS;
};

// Random-search optimizer settings
struct OptimizerConfig {
    int iterations = 10000;
    double step = 0.01;
    std::optional<uint64_t> seed;  // Entropy-seeded when unset
    int frontier_points = 20;
    double risk_free_rate = 0.0;
};

// Library configuration
class Config {
public:
    GeneralConfig general;
    SolverConfig solver;
    OptimizerConfig optimizer;

    Config() = default;

    // Load from TOML file
    static Config from_file(std::string_view path);

    // Load from TOML string
    static Config from_toml(std::string_view content);

    // Builder methods
    Config& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& set_seed(uint64_t seed) {
        optimizer.seed = seed;
        return *this;
    }

    Config& set_optimizer_iterations(int iterations) {
        optimizer.iterations = iterations;
        return *this;
    }

    Config& set_optimizer_step(double step) {
        optimizer.step = step;
        return *this;
    }

    Config& set_frontier_points(int points) {
        optimizer.frontier_points = points;
        return *this;
    }

    Config& set_risk_free_rate(double rate) {
        optimizer.risk_free_rate = rate;
        return *this;
    }

    Config& set_lattice_steps(int steps) {
        solver.lattice_steps = steps;
        return *this;
    }

    Config& set_iv_bracket(double lower, double upper) {
        solver.iv_lower = lower;
        solver.iv_upper = upper;
        return *this;
    }

    // Per-module settings
    [[nodiscard]] options::ImpliedVolSettings implied_vol_settings() const;
    [[nodiscard]] bonds::YieldSolverSettings yield_settings() const;
    [[nodiscard]] portfolio::OptimizerSettings optimizer_settings() const;

    // Throws InvalidInputError for an unknown level name
    [[nodiscard]] LogLevel log_level() const;

    // Installs the configured log level process-wide
    void apply() const;
};

}  // namespace qx::analytics
