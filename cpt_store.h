#pragma once

#include <memory>
#include <random>
#include <vector>

#include "network_structure.h"

namespace stock_dbn {

// One conditional table per child node. Rows are indexed by parent configuration
// in mixed radix, first parent least significant. Each row keeps Dirichlet
// pseudo-counts; the published probabilities are the normalized counts,
// recomputed eagerly on every mutation.
class ConditionalTable {
private:
    int child;
    std::vector<int> parent_nodes;
    std::vector<int> radices;
    size_t num_values;
    std::vector<double> counts;
    std::vector<double> probabilities;

    void publish_row(size_t row);

public:
    ConditionalTable(int child, std::vector<int> parent_nodes, std::vector<int> radices,
                     size_t num_values);

    int node() const { return child; }
    const std::vector<int>& parents() const { return parent_nodes; }
    const std::vector<int>& parent_radices() const { return radices; }
    size_t values() const { return num_values; }
    size_t row_count() const { return counts.size() / num_values; }

    // Throws ConfigError when the configuration is outside the parent domain product.
    size_t row_index(const std::vector<int>& parent_config) const;
    std::vector<int> parent_config(size_t row) const;

    double probability(size_t row, size_t value) const {
        return probabilities[row * num_values + value];
    }
    std::vector<double> row_probabilities(size_t row) const;
    std::vector<double> row_counts(size_t row) const;
    double row_mass(size_t row) const;

    void set_row_counts(size_t row, const std::vector<double>& pseudo_counts);
    void add_row_counts(size_t row, const std::vector<double>& distribution, double weight);
    void scale(double factor);

    const std::vector<double>& all_counts() const { return counts; }
    const std::vector<double>& all_probabilities() const { return probabilities; }
};

class CptStore {
private:
    std::shared_ptr<const NetworkStructure> net;
    std::vector<ConditionalTable> tables;

    ConditionalTable& table_for(int node);

public:
    // Every row starts uniform with total mass prior_strength.
    explicit CptStore(std::shared_ptr<const NetworkStructure> structure, double prior_strength = 1.0);

    const NetworkStructure& structure() const { return *net; }
    std::shared_ptr<const NetworkStructure> structure_ptr() const { return net; }
    const ConditionalTable& table(int node) const;

    // Sets every row of node to the same prior pseudo-count vector.
    void initialize(int node, const std::vector<double>& prior_pseudo_counts);
    void initialize_uniform(int node, double strength);
    // Rows drawn uniformly at random then normalized and scaled to strength.
    void randomize(int node, double strength, std::mt19937& rng);
    // Seeds one row with strength * probabilities. Probabilities must form a
    // distribution.
    void set_row(int node, const std::vector<int>& parent_config,
                 const std::vector<double>& probabilities, double strength = 1.0);

    std::vector<double> row_probabilities(int node, const std::vector<int>& parent_config) const;
    double row_mass(int node, const std::vector<int>& parent_config) const;

    // Adds weight * child_distribution to the row's pseudo-counts.
    void add_soft_count(int node, const std::vector<int>& parent_config,
                        const std::vector<double>& child_distribution, double weight);
    void add_row_soft_count(int node, size_t row, const std::vector<double>& child_distribution,
                            double weight);

    // Multiplies every pseudo-count of the node's table by gamma.
    void decay(int node, double gamma);

    void restore_counts(int node, const std::vector<double>& flat_counts);

    // Free parameters over all tables: rows * (values - 1).
    size_t free_parameters() const;
};

}  // namespace stock_dbn
