#pragma once

#include <memory>
#include <vector>

#include "belief_state.h"
#include "cpt_store.h"
#include "errors.h"

namespace stock_dbn {

struct LearnResult {
    // Largest absolute change of any published probability this step.
    double max_change = 0.0;
    size_t rows_updated = 0;
    std::vector<Diagnostic> diagnostics;
};

// Online Dirichlet update of every CPT from the soft counts of one step.
class LearningEngine {
private:
    std::shared_ptr<CptStore> cpts;
    double gamma;
    double tolerance;
    bool converged;

    void validate(const Observation& observation, std::vector<int>& evidence) const;

public:
    LearningEngine(std::shared_ptr<CptStore> cpts, double decay = 1.0,
                   double convergence_tolerance = 1e-6);

    // Each row is weighted by the product of its parents' marginals in
    // previous, for intra- and inter-slice edges alike. Hidden children add
    // current's marginal, observed children add the one-hot of their present
    // value. Throws
    // DataError before touching any count when the observation names an
    // unknown node or a value outside a domain.
    LearnResult learn(const BeliefState& previous, const BeliefState& current,
                      const Observation& observation);

    double decay() const { return gamma; }
    bool has_converged() const { return converged; }
    void restore_converged(bool latched) { converged = latched; }
};

}  // namespace stock_dbn
