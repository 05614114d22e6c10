#pragma once

namespace stock_dbn {

struct ModelScore {
    double log_likelihood = 0.0;
    int num_parameters = 0;
    int num_observations = 0;
    double aic = 0.0;
    double bic = 0.0;
    double hqc = 0.0;
    double caic = 0.0;
};

// Information criteria from the accumulated filtering log evidence.
// num_observations must be at least 2.
ModelScore score_model(double log_likelihood, int num_parameters, int num_observations);

double calculate_aic(double log_likelihood, int num_parameters);
double calculate_bic(double log_likelihood, int num_parameters, int num_observations);
double calculate_hqc(double log_likelihood, int num_parameters, int num_observations);
double calculate_caic(double log_likelihood, int num_parameters, int num_observations);

}  // namespace stock_dbn
