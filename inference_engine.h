#pragma once

#include <memory>
#include <string>
#include <vector>

#include "belief_state.h"
#include "cpt_store.h"
#include "errors.h"

namespace stock_dbn {

struct FilterResult {
    BeliefPtr belief;
    // Sum of log update normalizers over evidence-bearing hidden nodes.
    double log_evidence = 0.0;
    std::vector<Diagnostic> diagnostics;
};

// One-step forward filtering over the per-node marginals of a two-slice network.
class InferenceEngine {
public:
    enum class Phase { Init, Filtering, Terminated };

private:
    std::shared_ptr<const CptStore> cpts;
    Phase state;

    double row_weight(const ConditionalTable& table, const std::vector<int>& config, int skip,
                      const BeliefState& previous,
                      const std::vector<std::vector<double>>& current) const;
    std::vector<double> predictive(int node, const BeliefState& previous,
                                   const std::vector<std::vector<double>>& current) const;
    // Empty when hidden is not an intra-slice parent of observed.
    std::vector<double> likelihood(int hidden, int observed, int value, const BeliefState& previous,
                                   const std::vector<std::vector<double>>& current) const;
    std::vector<std::vector<double>> propagate(const BeliefState& previous,
                                               const std::vector<int>& evidence,
                                               double& log_evidence,
                                               std::vector<Diagnostic>& diagnostics) const;

public:
    explicit InferenceEngine(std::shared_ptr<const CptStore> cpts);

    // Predict through the inter-slice CPTs, then condition on the present
    // observed values. Never throws on bad data: unknown nodes and values
    // outside a domain become DataError diagnostics and count as missing, and a
    // collapsed likelihood falls back to the predictive distribution.
    FilterResult filter(const BeliefState& previous, const Observation& observation);

    // Filtering with no evidence at all.
    BeliefPtr predict(const BeliefState& previous) const;

    // Per-node evidence value index, -1 where missing or invalid.
    std::vector<int> resolve_evidence(const Observation& observation,
                                      std::vector<Diagnostic>& diagnostics) const;

    // CPT row for node given its parents' values, in parent declaration order.
    std::vector<double> infer_node(int node, const std::vector<std::string>& parent_values) const;

    void terminate() { state = Phase::Terminated; }
    Phase phase() const { return state; }
};

}  // namespace stock_dbn
