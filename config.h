#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "predictor.h"

namespace stock_dbn {

struct Config {
    int num_hidden_states = 2;
    double prior_strength = 1.0;
    double decay = 1.0;
    int forecast_horizon = 1;
    ConfidenceMetric confidence_metric = ConfidenceMetric::Margin;
    unsigned int seed = 42;
    bool random_init = true;
    bool momentum_edge = false;
    bool learn = true;
    double convergence_tolerance = 1e-6;
    double signal_threshold = 0.1;

    // Throws ConfigError on the first out-of-range option.
    void validate() const;

    // Sets one option by its external key (numHiddenStates, decay, ...).
    void apply(const std::string& key, const std::string& value);

    // "key value" pairs, one per line, '#' starts a comment.
    static Config load_file(const std::string& path);
    void load_stream(std::istream& in, const std::string& source);

    static bool is_option(const std::string& key);

    // Applies every --key=value flag naming an option and returns the other
    // arguments untouched.
    std::vector<std::string> apply_flags(const std::vector<std::string>& args);
};

void to_json(nlohmann::json& j, const Config& config);
void from_json(const nlohmann::json& j, Config& config);

}  // namespace stock_dbn
