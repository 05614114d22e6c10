#include "model_selection.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace stock_dbn {

double calculate_aic(double log_likelihood, int num_parameters) {
    return 2 * num_parameters - 2 * log_likelihood;
}

double calculate_bic(double log_likelihood, int num_parameters, int num_observations) {
    return num_parameters * std::log(num_observations) - 2 * log_likelihood;
}

double calculate_hqc(double log_likelihood, int num_parameters, int num_observations) {
    return -2 * log_likelihood + 2 * num_parameters * std::log(std::log(num_observations));
}

double calculate_caic(double log_likelihood, int num_parameters, int num_observations) {
    return -2 * log_likelihood + num_parameters * (std::log(num_observations) + 1);
}

ModelScore score_model(double log_likelihood, int num_parameters, int num_observations) {
    if (num_observations < 2) {
        throw std::invalid_argument("model scoring needs at least 2 observations, got " +
                                    std::to_string(num_observations));
    }
    ModelScore score;
    score.log_likelihood = log_likelihood;
    score.num_parameters = num_parameters;
    score.num_observations = num_observations;
    score.aic = calculate_aic(log_likelihood, num_parameters);
    score.bic = calculate_bic(log_likelihood, num_parameters, num_observations);
    score.hqc = calculate_hqc(log_likelihood, num_parameters, num_observations);
    score.caic = calculate_caic(log_likelihood, num_parameters, num_observations);
    return score;
}

}  // namespace stock_dbn
