#include "network_artifact.h"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "errors.h"

namespace stock_dbn {

using nlohmann::json;

json export_network(const CptStore& cpts, bool include_counts) {
    const NetworkStructure& net = cpts.structure();
    json artifact;

    artifact["nodes"] = json::array();
    for (const Node& node : net.all_nodes()) {
        artifact["nodes"].push_back({{"id", node.id}, {"domain", node.domain}, {"role", to_string(node.role)}});
    }

    artifact["edges"] = json::array();
    for (const Edge& edge : net.all_edges()) {
        artifact["edges"].push_back(
            {{"parent", edge.parent}, {"child", edge.child}, {"relation", to_string(edge.relation)}});
    }

    artifact["cpts"] = json::array();
    for (size_t i = 0; i < net.size(); ++i) {
        const ConditionalTable& table = cpts.table(static_cast<int>(i));
        json block;
        block["node"] = net.node(static_cast<int>(i)).id;
        block["parents"] = json::array();
        for (const ParentRef& ref : net.parents(static_cast<int>(i))) {
            block["parents"].push_back({{"id", net.node(ref.node).id}, {"relation", to_string(ref.relation)}});
        }
        block["rows"] = json::array();
        for (size_t row = 0; row < table.row_count(); ++row) {
            std::vector<int> config = table.parent_config(row);
            std::vector<std::string> labels;
            for (size_t p = 0; p < config.size(); ++p) {
                labels.push_back(net.node(table.parents()[p]).domain[config[p]]);
            }
            json entry{{"parentValues", labels}, {"probabilities", table.row_probabilities(row)}};
            if (include_counts) {
                entry["pseudoCounts"] = table.row_counts(row);
            }
            block["rows"].push_back(std::move(entry));
        }
        artifact["cpts"].push_back(std::move(block));
    }
    return artifact;
}

LoadedNetwork import_network(const json& artifact) {
    try {
        std::vector<Node> nodes;
        for (const json& n : artifact.at("nodes")) {
            nodes.push_back({n.at("id").get<std::string>(), n.at("domain").get<std::vector<std::string>>(),
                             parse_role(n.at("role").get<std::string>())});
        }
        std::vector<Edge> edges;
        for (const json& e : artifact.at("edges")) {
            edges.push_back({e.at("parent").get<std::string>(), e.at("child").get<std::string>(),
                             parse_relation(e.at("relation").get<std::string>())});
        }

        LoadedNetwork loaded;
        loaded.structure = std::make_shared<const NetworkStructure>(
            NetworkStructure::build(std::move(nodes), std::move(edges)));
        loaded.cpts = std::make_shared<CptStore>(loaded.structure);
        const NetworkStructure& net = *loaded.structure;

        for (const json& block : artifact.at("cpts")) {
            int node = net.index_of(block.at("node").get<std::string>());
            if (node < 0) {
                throw ConfigError("CPT block for unknown node '" + block.at("node").get<std::string>() + "'");
            }
            const ConditionalTable& table = loaded.cpts->table(node);
            const auto& refs = net.parents(node);
            for (const json& row : block.at("rows")) {
                auto labels = row.at("parentValues").get<std::vector<std::string>>();
                if (labels.size() != refs.size()) {
                    throw ConfigError("CPT row of '" + net.node(node).id + "' has wrong parent count");
                }
                std::vector<int> config(labels.size());
                for (size_t p = 0; p < labels.size(); ++p) {
                    config[p] = net.node(refs[p].node).index_of(labels[p]);
                    if (config[p] < 0) {
                        throw ConfigError("CPT row of '" + net.node(node).id + "' names unknown value '" +
                                          labels[p] + "'");
                    }
                }
                if (row.contains("pseudoCounts")) {
                    std::vector<double> flat = table.all_counts();
                    auto counts = row.at("pseudoCounts").get<std::vector<double>>();
                    if (counts.size() != table.values()) {
                        throw ConfigError("pseudo-counts of '" + net.node(node).id + "' have wrong length");
                    }
                    size_t base = table.row_index(config) * table.values();
                    std::copy(counts.begin(), counts.end(), flat.begin() + base);
                    loaded.cpts->restore_counts(node, flat);
                } else {
                    loaded.cpts->set_row(node, config, row.at("probabilities").get<std::vector<double>>());
                }
            }
        }
        return loaded;
    } catch (const json::exception& e) {
        throw ConfigError(std::string("malformed network artifact: ") + e.what());
    }
}

json belief_to_json(const NetworkStructure& structure, const BeliefState& belief) {
    json marginals = json::object();
    for (size_t i = 0; i < structure.size(); ++i) {
        marginals[structure.node(static_cast<int>(i)).id] = belief.marginal(static_cast<int>(i));
    }
    return {{"step", belief.step()}, {"timestamp", belief.timestamp()}, {"marginals", marginals}};
}

BeliefState belief_from_json(const NetworkStructure& structure, const json& j) {
    try {
        std::vector<std::vector<double>> marginals(structure.size());
        const json& stored = j.at("marginals");
        for (size_t i = 0; i < structure.size(); ++i) {
            const Node& node = structure.node(static_cast<int>(i));
            marginals[i] = stored.at(node.id).get<std::vector<double>>();
            if (marginals[i].size() != node.size()) {
                throw ConfigError("stored belief for '" + node.id + "' has wrong length");
            }
        }
        BeliefState belief(j.at("step").get<long>(), j.at("timestamp").get<long long>(), std::move(marginals));
        if (!belief.is_normalized()) {
            throw ConfigError("stored belief is not a set of distributions");
        }
        return belief;
    } catch (const json::exception& e) {
        throw ConfigError(std::string("malformed belief state: ") + e.what());
    }
}

void save_json(const std::string& path, const json& document) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("cannot open " + path + " for writing");
    }
    out << document.dump(2) << std::endl;
    spdlog::info("wrote {}", path);
}

json load_json(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    try {
        return json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

}  // namespace stock_dbn
