#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <map>
#include <string>
#include <vector>

#include "bar_data.h"
#include "config.h"
#include "errors.h"
#include "stock_model.h"

namespace py = pybind11;
using namespace stock_dbn;

namespace {

std::map<std::string, std::vector<double>> marginals_by_id(const NetworkStructure& net, const BeliefState& belief) {
    std::map<std::string, std::vector<double>> result;
    for (size_t i = 0; i < net.size(); ++i) {
        result[net.node(static_cast<int>(i)).id] = belief.marginal(static_cast<int>(i));
    }
    return result;
}

}  // namespace

PYBIND11_MODULE(stock_dbn_py, m) {
    py::register_exception<ConfigError>(m, "ConfigError");
    py::register_exception<DataError>(m, "DataError");

    py::enum_<ConfidenceMetric>(m, "ConfidenceMetric")
            .value("Margin", ConfidenceMetric::Margin)
            .value("Entropy", ConfidenceMetric::Entropy);

    py::enum_<DiagnosticKind>(m, "DiagnosticKind")
            .value("DataError", DiagnosticKind::DataError)
            .value("NumericalWarning", DiagnosticKind::NumericalWarning)
            .value("ConvergenceWarning", DiagnosticKind::ConvergenceWarning);

    py::class_<Config>(m, "Config")
            .def(py::init<>())
            .def_readwrite("num_hidden_states", &Config::num_hidden_states)
            .def_readwrite("prior_strength", &Config::prior_strength)
            .def_readwrite("decay", &Config::decay)
            .def_readwrite("forecast_horizon", &Config::forecast_horizon)
            .def_readwrite("confidence_metric", &Config::confidence_metric)
            .def_readwrite("seed", &Config::seed)
            .def_readwrite("random_init", &Config::random_init)
            .def_readwrite("momentum_edge", &Config::momentum_edge)
            .def_readwrite("learn", &Config::learn)
            .def_readwrite("convergence_tolerance", &Config::convergence_tolerance)
            .def_readwrite("signal_threshold", &Config::signal_threshold)
            .def("apply", &Config::apply)
            .def("validate", &Config::validate);

    py::class_<Observation>(m, "Observation")
            .def(py::init<>())
            .def(py::init([](long long timestamp, std::map<std::string, std::string> values) {
                return Observation{timestamp, std::move(values)};
            }))
            .def_readwrite("timestamp", &Observation::timestamp)
            .def_readwrite("values", &Observation::values);

    py::class_<Diagnostic>(m, "Diagnostic")
            .def_readonly("kind", &Diagnostic::kind)
            .def_readonly("node", &Diagnostic::node)
            .def_readonly("message", &Diagnostic::message);

    py::class_<PredictionRecord>(m, "PredictionRecord")
            .def_readonly("timestamp", &PredictionRecord::timestamp)
            .def_readonly("target_step", &PredictionRecord::target_step)
            .def_readonly("target_timestamp", &PredictionRecord::target_timestamp)
            .def_readonly("predicted_label", &PredictionRecord::predicted_label)
            .def_readonly("confidence", &PredictionRecord::confidence)
            .def_readonly("confidence_metric", &PredictionRecord::confidence_metric)
            .def_readonly("probabilities", &PredictionRecord::probabilities)
            .def_readonly("signal", &PredictionRecord::signal)
            .def_readonly("actual_label", &PredictionRecord::actual_label)
            .def_readonly("correct", &PredictionRecord::correct);

    py::class_<StepResult>(m, "StepResult")
            .def_readonly("step", &StepResult::step)
            .def_readonly("timestamp", &StepResult::timestamp)
            .def_readonly("accepted", &StepResult::accepted)
            .def_readonly("learned", &StepResult::learned)
            .def_readonly("log_evidence", &StepResult::log_evidence)
            .def_readonly("diagnostics", &StepResult::diagnostics)
            .def_readonly("resolved", &StepResult::resolved);

    py::class_<StockModel>(m, "StockModel")
            .def(py::init(&StockModel::create))
            .def("step", &StockModel::step)
            .def("finish", &StockModel::finish)
            .def("current_belief", [](const StockModel& model) {
                return marginals_by_id(model.network(), *model.current_belief());
            })
            .def("forecast", [](const StockModel& model, int horizon) {
                return marginals_by_id(model.network(), *model.forecast(horizon));
            })
            .def("export_artifact", [](const StockModel& model) { return model.export_artifact().dump(2); })
            .def("checkpoint", [](const StockModel& model) { return model.checkpoint().dump(); })
            .def_static("restore", [](const std::string& text) {
                return StockModel::restore(nlohmann::json::parse(text));
            })
            .def("step_count", &StockModel::step_count)
            .def("total_log_likelihood", &StockModel::total_log_likelihood);

    m.def("load_bars", [](const std::string& path) { return label_directions(read_bars(path)); });
}
