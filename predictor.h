#pragma once

#include <memory>
#include <string>
#include <vector>

#include "belief_state.h"
#include "cpt_store.h"
#include "inference_engine.h"

namespace stock_dbn {

enum class ConfidenceMetric { Margin, Entropy };

const char* to_string(ConfidenceMetric metric);
ConfidenceMetric parse_confidence_metric(const std::string& text);

struct Classification {
    std::string label;
    int index = -1;
    double confidence = 0.0;
    ConfidenceMetric metric = ConfidenceMetric::Margin;
    std::vector<double> probabilities;
};

class Predictor {
private:
    std::shared_ptr<const CptStore> cpts;
    InferenceEngine engine;
    ConfidenceMetric confidence_metric;

public:
    Predictor(std::shared_ptr<const CptStore> cpts, ConfidenceMetric metric = ConfidenceMetric::Margin);

    // horizon 0 hands back the same belief. Otherwise the predict step is
    // applied horizon times; observed nodes in the result hold their forecast
    // marginalized through their CPTs.
    BeliefPtr forecast(const BeliefPtr& belief, int horizon) const;

    // Arg-max label of node's marginal, lowest index on ties.
    Classification classify(const BeliefState& belief, int node) const;

    ConfidenceMetric metric() const { return confidence_metric; }
};

// Top minus second-highest probability; 1 for a single-value domain.
double margin_confidence(const std::vector<double>& probabilities);
// 1 - H(p) / log(K); 1 for a single-value domain.
double entropy_confidence(const std::vector<double>& probabilities);

// BUY when label is up_label with confidence >= threshold, SELL for
// down_label, HOLD otherwise.
std::string trading_signal(const Classification& prediction, double threshold,
                           const std::string& up_label = "up",
                           const std::string& down_label = "down");

}  // namespace stock_dbn
