#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "belief_state.h"
#include "config.h"
#include "cpt_store.h"
#include "errors.h"
#include "inference_engine.h"
#include "learning_engine.h"
#include "model_selection.h"
#include "network_structure.h"
#include "predictor.h"

namespace stock_dbn {

constexpr const char* kRegimeNode = "Regime";
constexpr const char* kDirectionNode = "Direction";

// Regime (hidden, s0..s{n-1}) -> Regime at the next slice, Regime -> Direction
// (observed, up/down) within a slice, and optionally Direction -> Direction at
// the next slice.
NetworkStructure make_stock_structure(const Config& config);

struct PredictionRecord {
    long long timestamp = 0;  // step the forecast was issued at
    long target_step = 0;
    long long target_timestamp = 0;
    std::string predicted_label;
    double confidence = 0.0;
    ConfidenceMetric confidence_metric = ConfidenceMetric::Margin;
    std::vector<double> probabilities;
    std::string signal;
    std::optional<std::string> actual_label;
    std::optional<bool> correct;
};

void to_json(nlohmann::json& j, const PredictionRecord& record);
void from_json(const nlohmann::json& j, PredictionRecord& record);

struct StepResult {
    long step = 0;
    long long timestamp = 0;
    bool accepted = false;
    bool learned = false;
    double log_evidence = 0.0;
    BeliefPtr belief;
    std::vector<Diagnostic> diagnostics;
    std::vector<PredictionRecord> resolved;
};

struct RunSummary {
    std::vector<PredictionRecord> records;
    long steps = 0;
    long scored = 0;
    long hits = 0;
    size_t diagnostics = 0;
    bool cancelled = false;

    double accuracy() const { return scored > 0 ? static_cast<double>(hits) / scored : 0.0; }
};

// Structure, CPTs and the current belief of one run. Independent instances
// share nothing.
class StockModel {
private:
    Config config;
    std::shared_ptr<const NetworkStructure> structure;
    std::shared_ptr<CptStore> cpts;
    InferenceEngine inference;
    LearningEngine learning;
    Predictor predictor;
    int target;
    BeliefPtr belief;
    std::deque<PredictionRecord> pending;
    double log_likelihood;
    long steps;
    long long last_timestamp;
    bool seen_timestamp;

    PredictionRecord make_record(const BeliefPtr& current) const;
    void resolve(PredictionRecord& record, const Observation& observation) const;

public:
    StockModel(const Config& config, std::shared_ptr<CptStore> cpts, const BeliefState& initial,
               const std::string& target_node = kDirectionNode);

    // Stock network with prior pseudo-counts and a uniform initial belief.
    static StockModel create(const Config& config);

    // Filter, learn and forecast one observation. A non-increasing timestamp
    // is rejected with a DataError diagnostic and leaves the model untouched.
    StepResult step(const Observation& observation);

    // Steps through observations, checking cancel between steps. Unresolved
    // forecasts are flushed at the end unless the run was cancelled.
    RunSummary run(const std::vector<Observation>& observations,
                   const std::atomic<bool>* cancel = nullptr);

    // Pending forecasts as records without an actual label.
    std::vector<PredictionRecord> finish();

    // Snapshot that stays valid across later steps.
    BeliefPtr current_belief() const { return std::atomic_load(&belief); }
    BeliefPtr forecast(int horizon) const { return predictor.forecast(current_belief(), horizon); }
    Classification classify(const BeliefState& state) const { return predictor.classify(state, target); }

    ModelScore score() const;

    const Config& settings() const { return config; }
    const NetworkStructure& network() const { return *structure; }
    const CptStore& cpt_store() const { return *cpts; }
    const std::string& target_node() const { return structure->node(target).id; }
    long step_count() const { return steps; }
    double total_log_likelihood() const { return log_likelihood; }
    size_t pending_forecasts() const { return pending.size(); }

    nlohmann::json export_artifact() const;
    nlohmann::json checkpoint() const;
    static StockModel restore(const nlohmann::json& checkpoint);
};

}  // namespace stock_dbn
