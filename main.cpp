#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "bar_data.h"
#include "cli_options.h"
#include "config.h"
#include "errors.h"
#include "network_artifact.h"
#include "stock_model.h"

using namespace stock_dbn;

namespace {

void print_usage() {
    std::cerr << "usage: stock_dbn run <bars.csv> [--config=file] [--checkpoint=out.json] [--resume=in.json]\n"
                 "                 [--log-level=info] [--<option>=value ...]\n"
                 "       stock_dbn export <artifact.json> [--bars=file] [--config=file] [--<option>=value ...]\n"
                 "options: numHiddenStates priorStrength decay forecastHorizon confidenceMetric seed\n"
                 "         randomInit momentumEdge learn convergenceTolerance signalThreshold\n"
                 "--resume takes the configuration from the checkpoint and rejects --config and options\n";
}

StockModel make_model(const CliOptions& options) {
    if (!options.resume.empty()) {
        return StockModel::restore(load_json(options.resume));
    }
    return StockModel::create(options.config);
}

int run_command(const CliOptions& options) {
    StockModel model = make_model(options);
    std::vector<Observation> observations = label_directions(read_bars(options.path), model.target_node());
    RunSummary summary = model.run(observations);

    for (const PredictionRecord& record : summary.records) {
        std::cout << nlohmann::json(record).dump() << std::endl;
    }
    std::cout << "steps: " << summary.steps << ", forecasts scored: " << summary.scored
              << ", accuracy: " << summary.accuracy() << std::endl;
    if (model.step_count() >= 2) {
        ModelScore score = model.score();
        std::cout << "log-likelihood: " << score.log_likelihood << ", AIC: " << score.aic << ", BIC: " << score.bic
                  << ", HQC: " << score.hqc << ", CAIC: " << score.caic << std::endl;
    }
    if (!options.checkpoint.empty()) {
        save_json(options.checkpoint, model.checkpoint());
    }
    return 0;
}

int export_command(const CliOptions& options) {
    StockModel model = make_model(options);
    if (!options.bars.empty()) {
        model.run(label_directions(read_bars(options.bars), model.target_node()));
    }
    save_json(options.path, model.export_artifact());
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    CliOptions options;
    try {
        if (!parse_cli_options(std::vector<std::string>(argv + 1, argv + argc), options)) {
            print_usage();
            return 2;
        }
    } catch (const ConfigError& e) {
        spdlog::error("configuration error: {}", e.what());
        return 1;
    }

    spdlog::set_level(spdlog::level::from_str(options.log_level));

    try {
        return options.command == "run" ? run_command(options) : export_command(options);
    } catch (const ConfigError& e) {
        spdlog::error("configuration error: {}", e.what());
    } catch (const std::runtime_error& e) {
        spdlog::error("{}", e.what());
    }
    return 1;
}
