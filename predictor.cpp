#include "predictor.h"

#include <algorithm>
#include <cmath>
#include <functional>

#include "errors.h"

namespace stock_dbn {

const char* to_string(ConfidenceMetric metric) {
    return metric == ConfidenceMetric::Margin ? "margin" : "entropy";
}

ConfidenceMetric parse_confidence_metric(const std::string& text) {
    if (text == "margin") return ConfidenceMetric::Margin;
    if (text == "entropy") return ConfidenceMetric::Entropy;
    throw ConfigError("confidenceMetric must be 'margin' or 'entropy', got '" + text + "'");
}

Predictor::Predictor(std::shared_ptr<const CptStore> cpts, ConfidenceMetric metric)
    : cpts(cpts), engine(cpts), confidence_metric(metric) {}

BeliefPtr Predictor::forecast(const BeliefPtr& belief, int horizon) const {
    if (horizon < 0) {
        throw ConfigError("forecast horizon must be non-negative");
    }
    BeliefPtr projected = belief;
    for (int h = 0; h < horizon; ++h) {
        projected = engine.predict(*projected);
    }
    return projected;
}

Classification Predictor::classify(const BeliefState& belief, int node) const {
    Classification result;
    result.probabilities = belief.marginal(node);
    result.metric = confidence_metric;
    auto top = std::max_element(result.probabilities.begin(), result.probabilities.end());
    result.index = static_cast<int>(top - result.probabilities.begin());
    result.label = cpts->structure().node(node).domain[result.index];
    result.confidence = confidence_metric == ConfidenceMetric::Margin
                            ? margin_confidence(result.probabilities)
                            : entropy_confidence(result.probabilities);
    return result;
}

double margin_confidence(const std::vector<double>& probabilities) {
    if (probabilities.size() < 2) return 1.0;
    std::vector<double> sorted(probabilities);
    std::partial_sort(sorted.begin(), sorted.begin() + 2, sorted.end(), std::greater<double>());
    return sorted[0] - sorted[1];
}

double entropy_confidence(const std::vector<double>& probabilities) {
    if (probabilities.size() < 2) return 1.0;
    double entropy = 0.0;
    for (double p : probabilities) {
        if (p > 0.0) entropy -= p * std::log(p);
    }
    return 1.0 - entropy / std::log(static_cast<double>(probabilities.size()));
}

std::string trading_signal(const Classification& prediction, double threshold,
                           const std::string& up_label, const std::string& down_label) {
    if (prediction.confidence >= threshold) {
        if (prediction.label == up_label) return "BUY";
        if (prediction.label == down_label) return "SELL";
    }
    return "HOLD";
}

}  // namespace stock_dbn
