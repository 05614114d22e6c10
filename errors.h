#pragma once

#include <stdexcept>
#include <string>

namespace stock_dbn {

// Invalid topology, configuration or artifact. Fatal at setup.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Observation value outside a node's domain, or an unknown node id.
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& what) : std::runtime_error(what) {}
};

// Non-fatal conditions reported per step instead of thrown.
enum class DiagnosticKind {
    DataError,
    NumericalWarning,
    ConvergenceWarning
};

struct Diagnostic {
    DiagnosticKind kind;
    std::string node;
    std::string message;
};

inline const char* to_string(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::DataError: return "DataError";
        case DiagnosticKind::NumericalWarning: return "NumericalWarning";
        case DiagnosticKind::ConvergenceWarning: return "ConvergenceWarning";
    }
    return "Unknown";
}

}  // namespace stock_dbn
