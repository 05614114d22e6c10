#include "learning_engine.h"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace stock_dbn {

LearningEngine::LearningEngine(std::shared_ptr<CptStore> cpts, double decay, double convergence_tolerance)
    : cpts(std::move(cpts)), gamma(decay), tolerance(convergence_tolerance), converged(false) {
    if (!this->cpts) {
        throw ConfigError("learning engine needs a CPT store");
    }
    if (!(gamma > 0.0 && gamma <= 1.0)) {
        throw ConfigError("decay must lie in (0, 1]");
    }
    if (!(tolerance >= 0.0)) {
        throw ConfigError("convergence tolerance must be non-negative");
    }
}

void LearningEngine::validate(const Observation& observation, std::vector<int>& evidence) const {
    const NetworkStructure& net = cpts->structure();
    evidence.assign(net.size(), -1);
    for (const auto& entry : observation.values) {
        if (entry.second.empty() || entry.second == kMissingValue) continue;
        int index = net.index_of(entry.first);
        if (index < 0 || net.node(index).role != NodeRole::Observed) {
            throw DataError("'" + entry.first + "' is not an observed node");
        }
        int value = net.node(index).index_of(entry.second);
        if (value < 0) {
            throw DataError("value '" + entry.second + "' outside domain of '" + entry.first + "'");
        }
        evidence[index] = value;
    }
}

LearnResult LearningEngine::learn(const BeliefState& previous, const BeliefState& current,
                                  const Observation& observation) {
    const NetworkStructure& net = cpts->structure();
    if (previous.size() != net.size() || current.size() != net.size()) {
        throw ConfigError("belief does not match the network structure");
    }
    std::vector<int> evidence;
    validate(observation, evidence);

    LearnResult result;
    for (size_t i = 0; i < net.size(); ++i) {
        int node = static_cast<int>(i);
        const Node& n = net.node(node);
        std::vector<double> child;
        if (n.role == NodeRole::Hidden) {
            child = current.marginal(node);
        } else if (evidence[node] >= 0) {
            child = one_hot(n.size(), evidence[node]);
        } else {
            continue;
        }

        const ConditionalTable& table = cpts->table(node);
        std::vector<double> before = table.all_probabilities();
        const auto& refs = net.parents(node);

        cpts->decay(node, gamma);
        for (size_t row = 0; row < table.row_count(); ++row) {
            std::vector<int> config = table.parent_config(row);
            double weight = 1.0;
            for (size_t p = 0; p < refs.size() && weight > 0.0; ++p) {
                weight *= previous.marginal(refs[p].node)[config[p]];
            }
            if (weight <= 0.0) continue;
            cpts->add_row_soft_count(node, row, child, weight);
            ++result.rows_updated;
        }

        const std::vector<double>& after = table.all_probabilities();
        for (size_t k = 0; k < after.size(); ++k) {
            result.max_change = std::max(result.max_change, std::abs(after[k] - before[k]));
        }
    }

    spdlog::debug("learned step {}: {} rows, max change {:.3e}", current.step(), result.rows_updated,
                  result.max_change);
    if (result.rows_updated > 0 && result.max_change < tolerance) {
        if (!converged) {
            converged = true;
            result.diagnostics.push_back({DiagnosticKind::ConvergenceWarning, "",
                                          "CPT rows stopped changing materially"});
            spdlog::warn("ConvergenceWarning: max CPT change {:.3e} below {:.3e} at step {}",
                         result.max_change, tolerance, current.step());
        }
    } else {
        converged = false;
    }
    return result;
}

}  // namespace stock_dbn
