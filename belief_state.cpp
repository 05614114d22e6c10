#include "belief_state.h"

#include <cmath>
#include <numeric>

#include "errors.h"

namespace stock_dbn {

BeliefState::BeliefState(long step, long long timestamp, std::vector<std::vector<double>> marginals)
    : step_index(step), time(timestamp), marginals(std::move(marginals)) {}

BeliefState BeliefState::uniform(const NetworkStructure& structure, long long timestamp) {
    std::vector<std::vector<double>> marginals;
    for (const Node& node : structure.all_nodes()) {
        marginals.emplace_back(node.size(), 1.0 / static_cast<double>(node.size()));
    }
    return BeliefState(0, timestamp, std::move(marginals));
}

BeliefState BeliefState::from_prior(const NetworkStructure& structure,
                                    const std::map<std::string, std::vector<double>>& prior,
                                    long long timestamp) {
    BeliefState state = uniform(structure, timestamp);
    for (const auto& entry : prior) {
        int index = structure.index_of(entry.first);
        if (index < 0) {
            throw ConfigError("prior given for unknown node '" + entry.first + "'");
        }
        const std::vector<double>& dist = entry.second;
        if (dist.size() != structure.node(index).size()) {
            throw ConfigError("prior for node '" + entry.first + "' has wrong length");
        }
        double sum = 0.0;
        for (double p : dist) {
            if (!std::isfinite(p) || p < 0.0) {
                throw ConfigError("prior for node '" + entry.first + "' has a negative entry");
            }
            sum += p;
        }
        if (std::abs(sum - 1.0) > 1e-9) {
            throw ConfigError("prior for node '" + entry.first + "' does not sum to 1");
        }
        state.marginals[index] = dist;
    }
    return state;
}

const std::vector<double>& BeliefState::marginal(int node) const {
    if (node < 0 || node >= static_cast<int>(marginals.size())) {
        throw ConfigError("belief has no node " + std::to_string(node));
    }
    return marginals[node];
}

bool BeliefState::is_normalized(double tolerance) const {
    for (const auto& dist : marginals) {
        double sum = 0.0;
        for (double p : dist) {
            if (p < 0.0 || !std::isfinite(p)) return false;
            sum += p;
        }
        if (std::abs(sum - 1.0) > tolerance) return false;
    }
    return true;
}

std::vector<double> one_hot(size_t size, size_t index) {
    std::vector<double> v(size, 0.0);
    v[index] = 1.0;
    return v;
}

double normalize(std::vector<double>& values) {
    double total = std::accumulate(values.begin(), values.end(), 0.0);
    if (total > 0.0) {
        for (double& v : values) {
            v /= total;
        }
    }
    return total;
}

}  // namespace stock_dbn
