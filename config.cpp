#include "config.h"

#include <cmath>
#include <fstream>
#include <sstream>

#include "errors.h"

namespace stock_dbn {

namespace {

int parse_int(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used == value.size()) return parsed;
    } catch (const std::logic_error&) {
    }
    throw ConfigError(key + " expects an integer, got '" + value + "'");
}

double parse_double(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        double parsed = std::stod(value, &used);
        if (used == value.size()) return parsed;
    } catch (const std::logic_error&) {
    }
    throw ConfigError(key + " expects a number, got '" + value + "'");
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw ConfigError(key + " expects true or false, got '" + value + "'");
}

}  // namespace

bool Config::is_option(const std::string& key) {
    static const char* const keys[] = {
        "numHiddenStates", "priorStrength", "decay", "forecastHorizon",
        "confidenceMetric", "seed", "randomInit", "momentumEdge",
        "learn", "convergenceTolerance", "signalThreshold",
    };
    for (const char* k : keys) {
        if (key == k) return true;
    }
    return false;
}

void Config::validate() const {
    if (num_hidden_states < 1) {
        throw ConfigError("numHiddenStates must be at least 1");
    }
    if (!(prior_strength > 0.0) || !std::isfinite(prior_strength)) {
        throw ConfigError("priorStrength must be positive");
    }
    if (!(decay > 0.0 && decay <= 1.0)) {
        throw ConfigError("decay must lie in (0, 1]");
    }
    if (forecast_horizon < 0) {
        throw ConfigError("forecastHorizon must be non-negative");
    }
    if (!(convergence_tolerance >= 0.0)) {
        throw ConfigError("convergenceTolerance must be non-negative");
    }
    if (!(signal_threshold >= 0.0 && signal_threshold <= 1.0)) {
        throw ConfigError("signalThreshold must lie in [0, 1]");
    }
}

void Config::apply(const std::string& key, const std::string& value) {
    if (key == "numHiddenStates") num_hidden_states = parse_int(key, value);
    else if (key == "priorStrength") prior_strength = parse_double(key, value);
    else if (key == "decay") decay = parse_double(key, value);
    else if (key == "forecastHorizon") forecast_horizon = parse_int(key, value);
    else if (key == "confidenceMetric") confidence_metric = parse_confidence_metric(value);
    else if (key == "seed") seed = static_cast<unsigned int>(parse_int(key, value));
    else if (key == "randomInit") random_init = parse_bool(key, value);
    else if (key == "momentumEdge") momentum_edge = parse_bool(key, value);
    else if (key == "learn") learn = parse_bool(key, value);
    else if (key == "convergenceTolerance") convergence_tolerance = parse_double(key, value);
    else if (key == "signalThreshold") signal_threshold = parse_double(key, value);
    else throw ConfigError("unknown configuration key '" + key + "'");
}

Config Config::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open configuration file " + path);
    }
    Config config;
    config.load_stream(in, path);
    return config;
}

void Config::load_stream(std::istream& in, const std::string& source) {
    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        std::istringstream fields(line);
        std::string key, value, extra;
        if (!(fields >> key)) continue;
        if (!(fields >> value) || (fields >> extra)) {
            throw ConfigError(source + ":" + std::to_string(line_number) + ": expected 'key value'");
        }
        apply(key, value);
    }
}

std::vector<std::string> Config::apply_flags(const std::vector<std::string>& args) {
    std::vector<std::string> rest;
    for (const std::string& arg : args) {
        if (arg.compare(0, 2, "--") != 0) {
            rest.push_back(arg);
            continue;
        }
        size_t eq = arg.find('=');
        std::string key = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
        std::string value = eq == std::string::npos ? "true" : arg.substr(eq + 1);
        if (is_option(key)) {
            apply(key, value);
        } else {
            rest.push_back(arg);
        }
    }
    return rest;
}

void to_json(nlohmann::json& j, const Config& config) {
    j = nlohmann::json{
        {"numHiddenStates", config.num_hidden_states},
        {"priorStrength", config.prior_strength},
        {"decay", config.decay},
        {"forecastHorizon", config.forecast_horizon},
        {"confidenceMetric", to_string(config.confidence_metric)},
        {"seed", config.seed},
        {"randomInit", config.random_init},
        {"momentumEdge", config.momentum_edge},
        {"learn", config.learn},
        {"convergenceTolerance", config.convergence_tolerance},
        {"signalThreshold", config.signal_threshold},
    };
}

void from_json(const nlohmann::json& j, Config& config) {
    j.at("numHiddenStates").get_to(config.num_hidden_states);
    j.at("priorStrength").get_to(config.prior_strength);
    j.at("decay").get_to(config.decay);
    j.at("forecastHorizon").get_to(config.forecast_horizon);
    config.confidence_metric = parse_confidence_metric(j.at("confidenceMetric").get<std::string>());
    j.at("seed").get_to(config.seed);
    j.at("randomInit").get_to(config.random_init);
    j.at("momentumEdge").get_to(config.momentum_edge);
    j.at("learn").get_to(config.learn);
    j.at("convergenceTolerance").get_to(config.convergence_tolerance);
    j.at("signalThreshold").get_to(config.signal_threshold);
}

}  // namespace stock_dbn
