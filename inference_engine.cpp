#include "inference_engine.h"

#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace stock_dbn {

InferenceEngine::InferenceEngine(std::shared_ptr<const CptStore> cpts)
    : cpts(std::move(cpts)), state(Phase::Init) {
    if (!this->cpts) {
        throw ConfigError("inference engine needs a CPT store");
    }
}

double InferenceEngine::row_weight(const ConditionalTable& table, const std::vector<int>& config,
                                   int skip, const BeliefState& previous,
                                   const std::vector<std::vector<double>>& current) const {
    const auto& refs = cpts->structure().parents(table.node());
    double weight = 1.0;
    for (size_t p = 0; p < refs.size(); ++p) {
        if (static_cast<int>(p) == skip) continue;
        const std::vector<double>& m = refs[p].relation == SliceRelation::Inter
                                           ? previous.marginal(refs[p].node)
                                           : current[refs[p].node];
        weight *= m[config[p]];
        if (weight == 0.0) break;
    }
    return weight;
}

std::vector<double> InferenceEngine::predictive(int node, const BeliefState& previous,
                                                const std::vector<std::vector<double>>& current) const {
    const ConditionalTable& table = cpts->table(node);
    std::vector<double> result(table.values(), 0.0);
    for (size_t row = 0; row < table.row_count(); ++row) {
        double weight = row_weight(table, table.parent_config(row), -1, previous, current);
        if (weight == 0.0) continue;
        for (size_t k = 0; k < table.values(); ++k) {
            result[k] += weight * table.probability(row, k);
        }
    }
    normalize(result);
    return result;
}

std::vector<double> InferenceEngine::likelihood(int hidden, int observed, int value,
                                                const BeliefState& previous,
                                                const std::vector<std::vector<double>>& current) const {
    const NetworkStructure& net = cpts->structure();
    const auto& refs = net.parents(observed);
    int position = -1;
    for (size_t p = 0; p < refs.size(); ++p) {
        if (refs[p].node == hidden && refs[p].relation == SliceRelation::Intra) {
            position = static_cast<int>(p);
        }
    }
    if (position < 0) {
        return {};
    }
    std::vector<double> result(net.node(hidden).size(), 0.0);
    const ConditionalTable& table = cpts->table(observed);
    for (size_t row = 0; row < table.row_count(); ++row) {
        std::vector<int> config = table.parent_config(row);
        double weight = row_weight(table, config, position, previous, current);
        if (weight == 0.0) continue;
        result[config[position]] += weight * table.probability(row, value);
    }
    return result;
}

std::vector<std::vector<double>> InferenceEngine::propagate(const BeliefState& previous,
                                                            const std::vector<int>& evidence,
                                                            double& log_evidence,
                                                            std::vector<Diagnostic>& diagnostics) const {
    const NetworkStructure& net = cpts->structure();
    if (previous.size() != net.size()) {
        throw ConfigError("belief does not match the network structure");
    }
    const auto& order = net.topological_order();

    // First pass: plain prediction, so likelihoods can read every co-parent.
    std::vector<std::vector<double>> current(net.size());
    for (int node : order) {
        current[node] = evidence[node] >= 0 ? one_hot(net.node(node).size(), evidence[node])
                                            : predictive(node, previous, current);
    }

    // Second pass: condition hidden nodes on evidence from their intra-slice
    // observed children, in topological order so later nodes see updated parents.
    log_evidence = 0.0;
    for (int node : order) {
        const Node& n = net.node(node);
        if (n.role == NodeRole::Observed) {
            if (evidence[node] < 0) {
                current[node] = predictive(node, previous, current);
            }
            continue;
        }
        std::vector<double> prior = predictive(node, previous, current);
        std::vector<double> posterior = prior;
        bool has_evidence = false;
        for (int child : net.children(node)) {
            if (evidence[child] < 0) continue;
            std::vector<double> lik = likelihood(node, child, evidence[child], previous, current);
            if (lik.empty()) continue;
            for (size_t k = 0; k < posterior.size(); ++k) {
                posterior[k] *= lik[k];
            }
            has_evidence = true;
        }
        if (has_evidence) {
            double mass = normalize(posterior);
            if (!(mass > 0.0) || !std::isfinite(mass)) {
                diagnostics.push_back({DiagnosticKind::NumericalWarning, n.id,
                                       "likelihood mass collapsed to zero; using predictive distribution"});
                spdlog::warn("NumericalWarning: evidence impossible for '{}' at step {}, keeping prediction",
                             n.id, previous.step() + 1);
                posterior = prior;
            } else {
                log_evidence += std::log(mass);
            }
        }
        current[node] = std::move(posterior);
    }
    return current;
}

FilterResult InferenceEngine::filter(const BeliefState& previous, const Observation& observation) {
    if (state == Phase::Terminated) {
        throw std::logic_error("filter called on a terminated inference engine");
    }
    state = Phase::Filtering;

    FilterResult result;
    std::vector<int> evidence = resolve_evidence(observation, result.diagnostics);
    auto marginals = propagate(previous, evidence, result.log_evidence, result.diagnostics);
    result.belief = std::make_shared<const BeliefState>(previous.step() + 1, observation.timestamp,
                                                        std::move(marginals));
    spdlog::debug("filtered step {} (t={}), log evidence {:.6f}", result.belief->step(),
                  observation.timestamp, result.log_evidence);
    return result;
}

BeliefPtr InferenceEngine::predict(const BeliefState& previous) const {
    std::vector<int> evidence(cpts->structure().size(), -1);
    double log_evidence = 0.0;
    std::vector<Diagnostic> diagnostics;
    auto marginals = propagate(previous, evidence, log_evidence, diagnostics);
    return std::make_shared<const BeliefState>(previous.step() + 1, previous.timestamp(),
                                               std::move(marginals));
}

std::vector<int> InferenceEngine::resolve_evidence(const Observation& observation,
                                                   std::vector<Diagnostic>& diagnostics) const {
    const NetworkStructure& net = cpts->structure();
    std::vector<int> evidence(net.size(), -1);
    for (const auto& entry : observation.values) {
        if (entry.second.empty() || entry.second == kMissingValue) continue;
        int index = net.index_of(entry.first);
        if (index < 0 || net.node(index).role != NodeRole::Observed) {
            diagnostics.push_back({DiagnosticKind::DataError, entry.first,
                                   "not an observed node; value ignored"});
            spdlog::warn("DataError: '{}' is not an observed node (t={})", entry.first,
                         observation.timestamp);
            continue;
        }
        int value = net.node(index).index_of(entry.second);
        if (value < 0) {
            diagnostics.push_back({DiagnosticKind::DataError, entry.first,
                                   "value '" + entry.second + "' outside domain; treated as missing"});
            spdlog::warn("DataError: value '{}' outside domain of '{}' (t={})", entry.second,
                         entry.first, observation.timestamp);
            continue;
        }
        evidence[index] = value;
    }
    return evidence;
}

std::vector<double> InferenceEngine::infer_node(int node, const std::vector<std::string>& parent_values) const {
    const NetworkStructure& net = cpts->structure();
    const auto& refs = net.parents(node);
    if (parent_values.size() != refs.size()) {
        throw DataError("node '" + net.node(node).id + "' needs " + std::to_string(refs.size()) +
                        " parent values, got " + std::to_string(parent_values.size()));
    }
    std::vector<int> config(refs.size());
    for (size_t p = 0; p < refs.size(); ++p) {
        const Node& parent = net.node(refs[p].node);
        config[p] = parent.index_of(parent_values[p]);
        if (config[p] < 0) {
            throw DataError("value '" + parent_values[p] + "' outside domain of '" + parent.id + "'");
        }
    }
    return cpts->row_probabilities(node, config);
}

}  // namespace stock_dbn
