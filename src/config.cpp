// QX Analytics - Configuration Implementation

#include <qx/analytics/config.hpp>
#include <qx/analytics/error.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace qx::analytics {

// Simple TOML parser (flat sections, scalar values)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drops a trailing "# comment" from an unquoted value
std::string strip_comment(const std::string& s) {
    if (!s.empty() && s[0] == '"') return s;
    auto hash = s.find('#');
    return hash == std::string::npos ? s : trim(s.substr(0, hash));
}

std::string qualified(const std::string& section, const std::string& key) {
    return section.empty() ? key : section + "." + key;
}

[[noreturn]] void bad_value(const std::string& section, const std::string& key,
                            const std::string& value, const char* expected) {
    throw InvalidInputError("config key " + qualified(section, key) + ": expected " +
                            expected + ", got '" + value + "'");
}

int parse_int(const std::string& section, const std::string& key, const std::string& value) {
    size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(value, &pos);
    } catch (const std::logic_error&) {
        bad_value(section, key, value, "an integer");
    }
    if (pos != value.size()) bad_value(section, key, value, "an integer");
    return v;
}

uint64_t parse_uint64(const std::string& section, const std::string& key, const std::string& value) {
    if (value.empty() || value[0] == '-') bad_value(section, key, value, "a non-negative integer");
    size_t pos = 0;
    unsigned long long v = 0;
    try {
        v = std::stoull(value, &pos);
    } catch (const std::logic_error&) {
        bad_value(section, key, value, "a non-negative integer");
    }
    if (pos != value.size()) bad_value(section, key, value, "a non-negative integer");
    return static_cast<uint64_t>(v);
}

double parse_double(const std::string& section, const std::string& key, const std::string& value) {
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &pos);
    } catch (const std::logic_error&) {
        bad_value(section, key, value, "a number");
    }
    if (pos != value.size()) bad_value(section, key, value, "a number");
    return v;
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw InvalidInputError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                section = trim(line.substr(1, end - 1));
            }
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(strip_comment(trim(line.substr(eq + 1))));

        if (section == "general") {
            if (key == "log_level") config.general.log_level = value;
        }
        else if (section == "solver") {
            auto& s = config.solver;
            if (key == "iv_lower") s.iv_lower = parse_double(section, key, value);
            else if (key == "iv_upper") s.iv_upper = parse_double(section, key, value);
            else if (key == "iv_tolerance") s.iv_tolerance = parse_double(section, key, value);
            else if (key == "iv_max_iterations") s.iv_max_iterations = parse_int(section, key, value);
            else if (key == "ytm_tolerance") s.ytm_tolerance = parse_double(section, key, value);
            else if (key == "ytm_max_iterations") s.ytm_max_iterations = parse_int(section, key, value);
            else if (key == "lattice_steps") s.lattice_steps = parse_int(section, key, value);
        }
        else if (section == "optimizer") {
            auto& o = config.optimizer;
            if (key == "iterations") o.iterations = parse_int(section, key, value);
            else if (key == "step") o.step = parse_double(section, key, value);
            else if (key == "seed") o.seed = parse_uint64(section, key, value);
            else if (key == "frontier_points") o.frontier_points = parse_int(section, key, value);
            else if (key == "risk_free_rate") o.risk_free_rate = parse_double(section, key, value);
        }
    }

    return config;
}

options::ImpliedVolSettings Config::implied_vol_settings() const {
    options::ImpliedVolSettings s;
    s.lower = solver.iv_lower;
    s.upper = solver.iv_upper;
    s.tolerance = solver.iv_tolerance;
    s.max_iterations = solver.iv_max_iterations;
    return s;
}

bonds::YieldSolverSettings Config::yield_settings() const {
    bonds::YieldSolverSettings s;
    s.tolerance = solver.ytm_tolerance;
    s.max_iterations = solver.ytm_max_iterations;
    return s;
}

portfolio::OptimizerSettings Config::optimizer_settings() const {
    portfolio::OptimizerSettings s;
    s.iterations = optimizer.iterations;
    s.step = optimizer.step;
    return s;
}

LogLevel Config::log_level() const {
    auto level = parse_log_level(general.log_level);
    if (!level) {
        throw InvalidInputError("unknown log level '" + general.log_level + "'");
    }
    return *level;
}

void Config::apply() const {
    qx::analytics::set_log_level(log_level());
}

}  // namespace qx::analytics
