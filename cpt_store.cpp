#include "cpt_store.h"

#include <cmath>
#include <numeric>
#include <string>

#include "errors.h"

namespace stock_dbn {

namespace {

void check_non_negative(const std::vector<double>& values, const std::string& what) {
    for (double v : values) {
        if (!std::isfinite(v) || v < 0.0) {
            throw DataError(what + " must be finite and non-negative");
        }
    }
}

}  // namespace

ConditionalTable::ConditionalTable(int child, std::vector<int> parent_nodes, std::vector<int> radices,
                                   size_t num_values)
    : child(child),
      parent_nodes(std::move(parent_nodes)),
      radices(std::move(radices)),
      num_values(num_values) {
    size_t rows = 1;
    for (int radix : this->radices) {
        rows *= static_cast<size_t>(radix);
    }
    counts.assign(rows * num_values, 1.0 / static_cast<double>(num_values));
    probabilities.assign(rows * num_values, 1.0 / static_cast<double>(num_values));
}

size_t ConditionalTable::row_index(const std::vector<int>& parent_config) const {
    if (parent_config.size() != radices.size()) {
        throw ConfigError("parent configuration has " + std::to_string(parent_config.size()) +
                          " entries, table of node " + std::to_string(child) + " expects " +
                          std::to_string(radices.size()));
    }
    size_t index = 0;
    size_t multiplier = 1;
    for (size_t p = 0; p < radices.size(); ++p) {
        if (parent_config[p] < 0 || parent_config[p] >= radices[p]) {
            throw ConfigError("parent value index " + std::to_string(parent_config[p]) +
                              " outside domain of size " + std::to_string(radices[p]));
        }
        index += static_cast<size_t>(parent_config[p]) * multiplier;
        multiplier *= static_cast<size_t>(radices[p]);
    }
    return index;
}

std::vector<int> ConditionalTable::parent_config(size_t row) const {
    std::vector<int> config(radices.size());
    for (size_t p = 0; p < radices.size(); ++p) {
        config[p] = static_cast<int>(row % radices[p]);
        row /= radices[p];
    }
    return config;
}

std::vector<double> ConditionalTable::row_probabilities(size_t row) const {
    auto first = probabilities.begin() + row * num_values;
    return std::vector<double>(first, first + num_values);
}

std::vector<double> ConditionalTable::row_counts(size_t row) const {
    auto first = counts.begin() + row * num_values;
    return std::vector<double>(first, first + num_values);
}

double ConditionalTable::row_mass(size_t row) const {
    auto first = counts.begin() + row * num_values;
    return std::accumulate(first, first + num_values, 0.0);
}

void ConditionalTable::publish_row(size_t row) {
    double total = row_mass(row);
    size_t base = row * num_values;
    for (size_t k = 0; k < num_values; ++k) {
        // A row whose mass decayed to nothing publishes the uniform distribution.
        probabilities[base + k] = total > 0.0 ? counts[base + k] / total
                                              : 1.0 / static_cast<double>(num_values);
    }
}

void ConditionalTable::set_row_counts(size_t row, const std::vector<double>& pseudo_counts) {
    size_t base = row * num_values;
    for (size_t k = 0; k < num_values; ++k) {
        counts[base + k] = pseudo_counts[k];
    }
    publish_row(row);
}

void ConditionalTable::add_row_counts(size_t row, const std::vector<double>& distribution, double weight) {
    size_t base = row * num_values;
    for (size_t k = 0; k < num_values; ++k) {
        counts[base + k] += weight * distribution[k];
    }
    publish_row(row);
}

void ConditionalTable::scale(double factor) {
    for (double& c : counts) {
        c *= factor;
    }
    for (size_t row = 0; row < row_count(); ++row) {
        publish_row(row);
    }
}

CptStore::CptStore(std::shared_ptr<const NetworkStructure> structure, double prior_strength)
    : net(std::move(structure)) {
    if (!net) {
        throw ConfigError("CPT store needs a network structure");
    }
    if (!(prior_strength > 0.0) || !std::isfinite(prior_strength)) {
        throw ConfigError("prior strength must be positive");
    }
    for (size_t i = 0; i < net->size(); ++i) {
        std::vector<int> parent_nodes;
        std::vector<int> radices;
        for (const ParentRef& ref : net->parents(static_cast<int>(i))) {
            parent_nodes.push_back(ref.node);
            radices.push_back(static_cast<int>(net->node(ref.node).size()));
        }
        tables.emplace_back(static_cast<int>(i), std::move(parent_nodes), std::move(radices),
                            net->node(static_cast<int>(i)).size());
        initialize_uniform(static_cast<int>(i), prior_strength);
    }
}

ConditionalTable& CptStore::table_for(int node) {
    net->node(node);
    return tables[node];
}

const ConditionalTable& CptStore::table(int node) const {
    net->node(node);
    return tables[node];
}

void CptStore::initialize(int node, const std::vector<double>& prior_pseudo_counts) {
    ConditionalTable& t = table_for(node);
    if (prior_pseudo_counts.size() != t.values()) {
        throw ConfigError("prior for node '" + net->node(node).id + "' has " +
                          std::to_string(prior_pseudo_counts.size()) + " entries, domain has " +
                          std::to_string(t.values()));
    }
    for (double v : prior_pseudo_counts) {
        if (!std::isfinite(v) || v < 0.0) {
            throw ConfigError("prior pseudo-counts for node '" + net->node(node).id +
                              "' must be finite and non-negative");
        }
    }
    for (size_t row = 0; row < t.row_count(); ++row) {
        t.set_row_counts(row, prior_pseudo_counts);
    }
}

void CptStore::initialize_uniform(int node, double strength) {
    size_t values = table(node).values();
    initialize(node, std::vector<double>(values, strength / static_cast<double>(values)));
}

void CptStore::randomize(int node, double strength, std::mt19937& rng) {
    ConditionalTable& t = table_for(node);
    std::uniform_real_distribution<> dis(0.0, 1.0);
    for (size_t row = 0; row < t.row_count(); ++row) {
        std::vector<double> draw(t.values());
        for (double& d : draw) {
            d = dis(rng);
        }
        double sum = std::accumulate(draw.begin(), draw.end(), 0.0);
        for (double& d : draw) {
            d = sum > 0.0 ? strength * d / sum : strength / static_cast<double>(draw.size());
        }
        t.set_row_counts(row, draw);
    }
}

void CptStore::set_row(int node, const std::vector<int>& parent_config,
                       const std::vector<double>& probabilities, double strength) {
    ConditionalTable& t = table_for(node);
    size_t row = t.row_index(parent_config);
    if (probabilities.size() != t.values()) {
        throw ConfigError("row for node '" + net->node(node).id + "' has wrong length");
    }
    double sum = 0.0;
    for (double p : probabilities) {
        if (!std::isfinite(p) || p < 0.0) {
            throw ConfigError("row for node '" + net->node(node).id + "' has a negative entry");
        }
        sum += p;
    }
    if (std::abs(sum - 1.0) > 1e-9) {
        throw ConfigError("row for node '" + net->node(node).id + "' does not sum to 1");
    }
    if (!(strength > 0.0)) {
        throw ConfigError("row strength must be positive");
    }
    std::vector<double> pseudo_counts(probabilities);
    for (double& c : pseudo_counts) {
        c *= strength;
    }
    t.set_row_counts(row, pseudo_counts);
}

std::vector<double> CptStore::row_probabilities(int node, const std::vector<int>& parent_config) const {
    const ConditionalTable& t = table(node);
    return t.row_probabilities(t.row_index(parent_config));
}

double CptStore::row_mass(int node, const std::vector<int>& parent_config) const {
    const ConditionalTable& t = table(node);
    return t.row_mass(t.row_index(parent_config));
}

void CptStore::add_soft_count(int node, const std::vector<int>& parent_config,
                              const std::vector<double>& child_distribution, double weight) {
    add_row_soft_count(node, table(node).row_index(parent_config), child_distribution, weight);
}

void CptStore::add_row_soft_count(int node, size_t row, const std::vector<double>& child_distribution,
                                  double weight) {
    ConditionalTable& t = table_for(node);
    if (row >= t.row_count()) {
        throw ConfigError("row " + std::to_string(row) + " outside table of node '" +
                          net->node(node).id + "'");
    }
    if (child_distribution.size() != t.values()) {
        throw ConfigError("soft count for node '" + net->node(node).id + "' has wrong length");
    }
    check_non_negative(child_distribution, "soft count distribution");
    if (!std::isfinite(weight) || weight < 0.0) {
        throw DataError("soft count weight must be finite and non-negative");
    }
    t.add_row_counts(row, child_distribution, weight);
}

void CptStore::decay(int node, double gamma) {
    if (!(gamma > 0.0 && gamma <= 1.0)) {
        throw ConfigError("decay must lie in (0, 1]");
    }
    if (gamma == 1.0) return;
    table_for(node).scale(gamma);
}

void CptStore::restore_counts(int node, const std::vector<double>& flat_counts) {
    ConditionalTable& t = table_for(node);
    if (flat_counts.size() != t.row_count() * t.values()) {
        throw ConfigError("pseudo-counts for node '" + net->node(node).id + "' have wrong size");
    }
    for (double v : flat_counts) {
        if (!std::isfinite(v) || v < 0.0) {
            throw ConfigError("pseudo-counts for node '" + net->node(node).id +
                              "' must be finite and non-negative");
        }
    }
    for (size_t row = 0; row < t.row_count(); ++row) {
        auto first = flat_counts.begin() + row * t.values();
        t.set_row_counts(row, std::vector<double>(first, first + t.values()));
    }
}

size_t CptStore::free_parameters() const {
    size_t total = 0;
    for (const ConditionalTable& t : tables) {
        total += t.row_count() * (t.values() - 1);
    }
    return total;
}

}  // namespace stock_dbn
