#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "network_structure.h"

namespace stock_dbn {

// Value used by the data collaborators for a missing observation.
constexpr const char* kMissingValue = "?";

// Observed-node id -> domain value. Absent keys and kMissingValue are missing.
struct Observation {
    long long timestamp = 0;
    std::map<std::string, std::string> values;
};

// Marginal distribution per node at one time step. Hidden nodes carry the
// filtered posterior; observed nodes carry the evidence (one-hot) or, when the
// value was missing, the predicted distribution. Immutable once built.
class BeliefState {
private:
    long step_index;
    long long time;
    std::vector<std::vector<double>> marginals;

public:
    BeliefState(long step, long long timestamp, std::vector<std::vector<double>> marginals);

    // Uniform over every node's domain, step 0.
    static BeliefState uniform(const NetworkStructure& structure, long long timestamp = 0);
    // Uniform except for the supplied node distributions, which must be valid.
    static BeliefState from_prior(const NetworkStructure& structure,
                                  const std::map<std::string, std::vector<double>>& prior,
                                  long long timestamp = 0);

    long step() const { return step_index; }
    long long timestamp() const { return time; }
    size_t size() const { return marginals.size(); }
    const std::vector<double>& marginal(int node) const;
    const std::vector<std::vector<double>>& all_marginals() const { return marginals; }

    bool is_normalized(double tolerance = 1e-9) const;
};

using BeliefPtr = std::shared_ptr<const BeliefState>;

std::vector<double> one_hot(size_t size, size_t index);

// Scales values in place to sum to one and returns the mass before scaling.
double normalize(std::vector<double>& values);

}  // namespace stock_dbn
