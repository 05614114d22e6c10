#include "network_structure.h"

#include <algorithm>
#include <deque>
#include <set>
#include <tuple>

#include "errors.h"

namespace stock_dbn {

const char* to_string(NodeRole role) {
    return role == NodeRole::Hidden ? "hidden" : "observed";
}

const char* to_string(SliceRelation relation) {
    return relation == SliceRelation::Intra ? "intra" : "inter";
}

NodeRole parse_role(const std::string& text) {
    if (text == "hidden") return NodeRole::Hidden;
    if (text == "observed") return NodeRole::Observed;
    throw ConfigError("unknown node role '" + text + "'");
}

SliceRelation parse_relation(const std::string& text) {
    if (text == "intra") return SliceRelation::Intra;
    if (text == "inter") return SliceRelation::Inter;
    throw ConfigError("unknown slice relation '" + text + "'");
}

int Node::index_of(const std::string& value) const {
    for (size_t i = 0; i < domain.size(); ++i) {
        if (domain[i] == value) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

NetworkStructure NetworkStructure::build(std::vector<Node> nodes, std::vector<Edge> edges) {
    NetworkStructure net;

    for (size_t i = 0; i < nodes.size(); ++i) {
        const Node& node = nodes[i];
        if (node.id.empty()) {
            throw ConfigError("node " + std::to_string(i) + " has an empty id");
        }
        if (node.domain.empty()) {
            throw ConfigError("node '" + node.id + "' has an empty domain");
        }
        std::set<std::string> seen(node.domain.begin(), node.domain.end());
        if (seen.size() != node.domain.size()) {
            throw ConfigError("node '" + node.id + "' has duplicate domain values");
        }
        if (!net.index_by_id.emplace(node.id, static_cast<int>(i)).second) {
            throw ConfigError("duplicate node id '" + node.id + "'");
        }
    }

    net.parent_refs.resize(nodes.size());
    net.child_lists.resize(nodes.size());
    std::set<std::tuple<int, int, SliceRelation>> seen_edges;
    for (const Edge& edge : edges) {
        auto parent_it = net.index_by_id.find(edge.parent);
        auto child_it = net.index_by_id.find(edge.child);
        if (parent_it == net.index_by_id.end() || child_it == net.index_by_id.end()) {
            throw ConfigError("edge " + edge.parent + " -> " + edge.child +
                              " references an unknown node");
        }
        int parent = parent_it->second;
        int child = child_it->second;
        if (!seen_edges.emplace(parent, child, edge.relation).second) {
            throw ConfigError("duplicate " + std::string(to_string(edge.relation)) +
                              " edge " + edge.parent + " -> " + edge.child);
        }
        net.parent_refs[child].push_back({parent, edge.relation});
        auto& children = net.child_lists[parent];
        if (std::find(children.begin(), children.end(), child) == children.end()) {
            children.push_back(child);
        }
    }

    // Kahn's algorithm over intra-slice edges only; inter-slice edges never form a
    // cycle inside one slice.
    std::vector<int> in_degree(nodes.size(), 0);
    std::vector<std::vector<int>> intra_children(nodes.size());
    for (size_t child = 0; child < nodes.size(); ++child) {
        for (const ParentRef& ref : net.parent_refs[child]) {
            if (ref.relation == SliceRelation::Intra) {
                intra_children[ref.node].push_back(static_cast<int>(child));
                ++in_degree[child];
            }
        }
    }
    std::deque<int> ready;
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (in_degree[i] == 0) ready.push_back(static_cast<int>(i));
    }
    while (!ready.empty()) {
        int current = ready.front();
        ready.pop_front();
        net.order.push_back(current);
        for (int child : intra_children[current]) {
            if (--in_degree[child] == 0) ready.push_back(child);
        }
    }
    if (net.order.size() != nodes.size()) {
        throw ConfigError("intra-slice edges contain a cycle");
    }

    net.nodes = std::move(nodes);
    net.edges = std::move(edges);
    return net;
}

const Node& NetworkStructure::node(int index) const {
    if (index < 0 || index >= static_cast<int>(nodes.size())) {
        throw ConfigError("node index " + std::to_string(index) + " out of range");
    }
    return nodes[index];
}

const Node& NetworkStructure::node(const std::string& id) const {
    int index = index_of(id);
    if (index < 0) {
        throw ConfigError("unknown node '" + id + "'");
    }
    return nodes[index];
}

int NetworkStructure::index_of(const std::string& id) const {
    auto it = index_by_id.find(id);
    return it == index_by_id.end() ? -1 : it->second;
}

std::vector<int> NetworkStructure::hidden_nodes() const {
    std::vector<int> result;
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].role == NodeRole::Hidden) result.push_back(static_cast<int>(i));
    }
    return result;
}

std::vector<int> NetworkStructure::observed_nodes() const {
    std::vector<int> result;
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].role == NodeRole::Observed) result.push_back(static_cast<int>(i));
    }
    return result;
}

const std::vector<ParentRef>& NetworkStructure::parents(int node) const {
    this->node(node);
    return parent_refs[node];
}

const std::vector<int>& NetworkStructure::children(int node) const {
    this->node(node);
    return child_lists[node];
}

std::vector<std::vector<std::pair<std::string, int>>> NetworkStructure::unroll(int slices) const {
    std::vector<std::vector<std::pair<std::string, int>>> result;
    for (int t = 0; t < slices; ++t) {
        std::vector<std::pair<std::string, int>> slice;
        for (const Node& n : nodes) {
            slice.emplace_back(n.id, t);
        }
        result.push_back(std::move(slice));
    }
    return result;
}

}  // namespace stock_dbn
