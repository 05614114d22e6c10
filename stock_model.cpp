#include "stock_model.h"

#include <iterator>
#include <random>

#include <spdlog/spdlog.h>

#include "network_artifact.h"

namespace stock_dbn {

using nlohmann::json;

NetworkStructure make_stock_structure(const Config& config) {
    config.validate();
    std::vector<std::string> regimes;
    for (int i = 0; i < config.num_hidden_states; ++i) {
        regimes.push_back("s" + std::to_string(i));
    }
    std::vector<Node> nodes{
        {kRegimeNode, regimes, NodeRole::Hidden},
        {kDirectionNode, {"up", "down"}, NodeRole::Observed},
    };
    std::vector<Edge> edges{
        {kRegimeNode, kRegimeNode, SliceRelation::Inter},
        {kRegimeNode, kDirectionNode, SliceRelation::Intra},
    };
    if (config.momentum_edge) {
        edges.push_back({kDirectionNode, kDirectionNode, SliceRelation::Inter});
    }
    return NetworkStructure::build(std::move(nodes), std::move(edges));
}

void to_json(json& j, const PredictionRecord& record) {
    j = json{
        {"timestamp", record.timestamp},
        {"targetStep", record.target_step},
        {"targetTimestamp", record.target_timestamp},
        {"predictedLabel", record.predicted_label},
        {"confidence", record.confidence},
        {"confidenceMetric", to_string(record.confidence_metric)},
        {"probabilityVector", record.probabilities},
        {"signal", record.signal},
    };
    if (record.actual_label) j["actualLabel"] = *record.actual_label;
    if (record.correct) j["correct"] = *record.correct;
}

void from_json(const json& j, PredictionRecord& record) {
    j.at("timestamp").get_to(record.timestamp);
    j.at("targetStep").get_to(record.target_step);
    j.at("targetTimestamp").get_to(record.target_timestamp);
    j.at("predictedLabel").get_to(record.predicted_label);
    j.at("confidence").get_to(record.confidence);
    record.confidence_metric = parse_confidence_metric(j.at("confidenceMetric").get<std::string>());
    j.at("probabilityVector").get_to(record.probabilities);
    j.at("signal").get_to(record.signal);
    if (j.contains("actualLabel")) record.actual_label = j.at("actualLabel").get<std::string>();
    if (j.contains("correct")) record.correct = j.at("correct").get<bool>();
}

StockModel::StockModel(const Config& config, std::shared_ptr<CptStore> cpts, const BeliefState& initial,
                       const std::string& target_node)
    : config(config),
      structure(cpts ? cpts->structure_ptr() : nullptr),
      cpts(cpts),
      inference(cpts),
      learning(cpts, config.decay, config.convergence_tolerance),
      predictor(cpts, config.confidence_metric),
      target(-1),
      belief(std::make_shared<const BeliefState>(initial)),
      log_likelihood(0.0),
      steps(0),
      last_timestamp(0),
      seen_timestamp(false) {
    this->config.validate();
    target = structure->index_of(target_node);
    if (target < 0) {
        throw ConfigError("unknown target node '" + target_node + "'");
    }
    if (initial.size() != structure->size() || !initial.is_normalized()) {
        throw ConfigError("initial belief does not match the network structure");
    }
}

StockModel StockModel::create(const Config& config) {
    config.validate();
    auto structure = std::make_shared<const NetworkStructure>(make_stock_structure(config));
    auto cpts = std::make_shared<CptStore>(structure, config.prior_strength);
    if (config.random_init) {
        // Symmetric rows never separate the regimes, so rows conditioned on a
        // hidden parent start from a seeded random draw.
        std::mt19937 gen(config.seed);
        for (size_t i = 0; i < structure->size(); ++i) {
            for (const ParentRef& ref : structure->parents(static_cast<int>(i))) {
                if (structure->node(ref.node).role == NodeRole::Hidden) {
                    cpts->randomize(static_cast<int>(i), config.prior_strength, gen);
                    break;
                }
            }
        }
    }
    spdlog::info("stock model: {} regimes, prior strength {}, decay {}, horizon {}, confidence {}",
                 config.num_hidden_states, config.prior_strength, config.decay, config.forecast_horizon,
                 to_string(config.confidence_metric));
    return StockModel(config, cpts, BeliefState::uniform(*structure));
}

PredictionRecord StockModel::make_record(const BeliefPtr& current) const {
    BeliefPtr projected = predictor.forecast(current, config.forecast_horizon);
    Classification c = predictor.classify(*projected, target);
    PredictionRecord record;
    record.timestamp = current->timestamp();
    record.target_step = current->step() + config.forecast_horizon;
    record.predicted_label = c.label;
    record.confidence = c.confidence;
    record.confidence_metric = c.metric;
    record.probabilities = c.probabilities;
    record.signal = trading_signal(c, config.signal_threshold);
    return record;
}

void StockModel::resolve(PredictionRecord& record, const Observation& observation) const {
    record.target_timestamp = observation.timestamp;
    const Node& node = structure->node(target);
    auto it = observation.values.find(node.id);
    if (it != observation.values.end() && node.index_of(it->second) >= 0) {
        record.actual_label = it->second;
        record.correct = it->second == record.predicted_label;
    }
}

StepResult StockModel::step(const Observation& observation) {
    StepResult result;
    result.timestamp = observation.timestamp;
    BeliefPtr previous = current_belief();

    if (seen_timestamp && observation.timestamp <= last_timestamp) {
        result.step = previous->step();
        result.belief = previous;
        result.diagnostics.push_back({DiagnosticKind::DataError, "",
                                      "timestamp " + std::to_string(observation.timestamp) +
                                          " does not follow " + std::to_string(last_timestamp)});
        spdlog::warn("DataError: out-of-order timestamp {} after {}, step skipped", observation.timestamp,
                     last_timestamp);
        return result;
    }

    FilterResult filtered = inference.filter(*previous, observation);
    result.diagnostics = std::move(filtered.diagnostics);
    result.log_evidence = filtered.log_evidence;

    if (config.learn) {
        try {
            LearnResult learned = learning.learn(*previous, *filtered.belief, observation);
            result.learned = true;
            result.diagnostics.insert(result.diagnostics.end(), learned.diagnostics.begin(),
                                      learned.diagnostics.end());
        } catch (const DataError& e) {
            result.diagnostics.push_back({DiagnosticKind::DataError, "", e.what()});
            spdlog::warn("DataError at t={}: {}; learning skipped", observation.timestamp, e.what());
        }
    }

    std::atomic_store(&belief, filtered.belief);
    ++steps;
    log_likelihood += filtered.log_evidence;
    last_timestamp = observation.timestamp;
    seen_timestamp = true;
    result.accepted = true;
    result.step = filtered.belief->step();
    result.belief = filtered.belief;

    while (!pending.empty() && pending.front().target_step <= result.step) {
        PredictionRecord record = std::move(pending.front());
        pending.pop_front();
        resolve(record, observation);
        result.resolved.push_back(std::move(record));
    }

    PredictionRecord issued = make_record(filtered.belief);
    if (config.forecast_horizon == 0) {
        resolve(issued, observation);
        result.resolved.push_back(std::move(issued));
    } else {
        pending.push_back(std::move(issued));
    }
    return result;
}

RunSummary StockModel::run(const std::vector<Observation>& observations, const std::atomic<bool>* cancel) {
    RunSummary summary;
    spdlog::info("run started: {} observations", observations.size());
    for (const Observation& observation : observations) {
        if (cancel && cancel->load()) {
            summary.cancelled = true;
            spdlog::info("run cancelled after {} steps", summary.steps);
            break;
        }
        StepResult result = step(observation);
        if (result.accepted) ++summary.steps;
        summary.diagnostics += result.diagnostics.size();
        for (PredictionRecord& record : result.resolved) {
            summary.records.push_back(std::move(record));
        }
    }
    if (!summary.cancelled) {
        for (PredictionRecord& record : finish()) {
            summary.records.push_back(std::move(record));
        }
    }
    for (const PredictionRecord& record : summary.records) {
        if (!record.correct) continue;
        ++summary.scored;
        if (*record.correct) ++summary.hits;
    }
    spdlog::info("run finished: {} steps, accuracy {:.4f} over {} forecasts", summary.steps, summary.accuracy(),
                 summary.scored);
    return summary;
}

std::vector<PredictionRecord> StockModel::finish() {
    std::vector<PredictionRecord> flushed(std::make_move_iterator(pending.begin()),
                                          std::make_move_iterator(pending.end()));
    pending.clear();
    return flushed;
}

ModelScore StockModel::score() const {
    return score_model(log_likelihood, static_cast<int>(cpts->free_parameters()), static_cast<int>(steps));
}

json StockModel::export_artifact() const {
    json artifact = export_network(*cpts);
    artifact["target"] = target_node();
    return artifact;
}

json StockModel::checkpoint() const {
    json pending_records = json::array();
    for (const PredictionRecord& record : pending) {
        pending_records.push_back(record);
    }
    return json{
        {"config", config},
        {"network", export_network(*cpts, true)},
        {"target", target_node()},
        {"belief", belief_to_json(*structure, *current_belief())},
        {"steps", steps},
        {"logLikelihood", log_likelihood},
        {"lastTimestamp", last_timestamp},
        {"seenTimestamp", seen_timestamp},
        {"converged", learning.has_converged()},
        {"pending", pending_records},
    };
}

StockModel StockModel::restore(const json& checkpoint) {
    try {
        Config config = checkpoint.at("config").get<Config>();
        LoadedNetwork loaded = import_network(checkpoint.at("network"));
        BeliefState belief = belief_from_json(*loaded.structure, checkpoint.at("belief"));
        StockModel model(config, loaded.cpts, belief, checkpoint.at("target").get<std::string>());
        checkpoint.at("steps").get_to(model.steps);
        checkpoint.at("logLikelihood").get_to(model.log_likelihood);
        checkpoint.at("lastTimestamp").get_to(model.last_timestamp);
        checkpoint.at("seenTimestamp").get_to(model.seen_timestamp);
        model.learning.restore_converged(checkpoint.at("converged").get<bool>());
        for (const json& record : checkpoint.at("pending")) {
            model.pending.push_back(record.get<PredictionRecord>());
        }
        spdlog::info("restored checkpoint at step {}", model.steps);
        return model;
    } catch (const json::exception& e) {
        throw ConfigError(std::string("malformed checkpoint: ") + e.what());
    }
}

}  // namespace stock_dbn
