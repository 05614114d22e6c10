#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace stock_dbn {

enum class NodeRole { Hidden, Observed };

// Intra: parent and child in the same slice. Inter: parent at t-1, child at t.
enum class SliceRelation { Intra, Inter };

const char* to_string(NodeRole role);
const char* to_string(SliceRelation relation);
NodeRole parse_role(const std::string& text);
SliceRelation parse_relation(const std::string& text);

struct Node {
    std::string id;
    std::vector<std::string> domain;
    NodeRole role;

    size_t size() const { return domain.size(); }
    int index_of(const std::string& value) const;
};

struct Edge {
    std::string parent;
    std::string child;
    SliceRelation relation;
};

struct ParentRef {
    int node;
    SliceRelation relation;
};

// Fixed two-slice topology. Built once through build() and read-only afterwards.
class NetworkStructure {
private:
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    std::map<std::string, int> index_by_id;
    std::vector<std::vector<ParentRef>> parent_refs;
    std::vector<std::vector<int>> child_lists;
    std::vector<int> order;

    NetworkStructure() = default;

public:
    // Throws ConfigError on empty or duplicate ids, empty domains, duplicate
    // domain values, dangling or repeated edges and intra-slice cycles.
    static NetworkStructure build(std::vector<Node> nodes, std::vector<Edge> edges);

    size_t size() const { return nodes.size(); }
    const Node& node(int index) const;
    const Node& node(const std::string& id) const;
    int index_of(const std::string& id) const;

    const std::vector<Node>& all_nodes() const { return nodes; }
    const std::vector<Edge>& all_edges() const { return edges; }

    std::vector<int> hidden_nodes() const;
    std::vector<int> observed_nodes() const;

    // Parents in edge declaration order. This order fixes the CPT row layout.
    const std::vector<ParentRef>& parents(int node) const;
    // Distinct children over both intra- and inter-slice edges.
    const std::vector<int>& children(int node) const;

    // Nodes ordered so every intra-slice parent precedes its child.
    const std::vector<int>& topological_order() const { return order; }

    // T slices of (node id, t) pairs.
    std::vector<std::vector<std::pair<std::string, int>>> unroll(int slices) const;
};

}  // namespace stock_dbn
