#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "belief_state.h"
#include "cpt_store.h"
#include "network_structure.h"

namespace stock_dbn {

struct LoadedNetwork {
    std::shared_ptr<const NetworkStructure> structure;
    std::shared_ptr<CptStore> cpts;
};

// Node list, edge list and one CPT block per node with a row per parent
// configuration. Rows carry their pseudo-counts when include_counts is set,
// which makes the import reproduce the probabilities bit for bit.
nlohmann::json export_network(const CptStore& cpts, bool include_counts = true);

// Throws ConfigError on a malformed document or an invalid topology.
LoadedNetwork import_network(const nlohmann::json& artifact);

nlohmann::json belief_to_json(const NetworkStructure& structure, const BeliefState& belief);
BeliefState belief_from_json(const NetworkStructure& structure, const nlohmann::json& j);

void save_json(const std::string& path, const nlohmann::json& document);
nlohmann::json load_json(const std::string& path);

}  // namespace stock_dbn
