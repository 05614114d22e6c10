#include "network_structure.h"

#include "errors.h"
#include "test_support.h"

using namespace stock_dbn;

static NetworkStructure market_structure()
{
    return NetworkStructure::build(
        {{"MarketSentiment", {"Bullish", "Bearish"}, NodeRole::Hidden},
         {"PriceMove", {"Increase", "Decrease"}, NodeRole::Observed}},
        {{"MarketSentiment", "PriceMove", SliceRelation::Intra},
         {"PriceMove", "PriceMove", SliceRelation::Inter}});
}

static int test_build_and_queries()
{
    NetworkStructure net = market_structure();
    EXPECT(net.size() == 2, "two nodes");
    EXPECT(net.index_of("PriceMove") == 1, "index of PriceMove");
    EXPECT(net.index_of("Volume") == -1, "unknown id");
    EXPECT(net.hidden_nodes() == std::vector<int>{0}, "hidden nodes");
    EXPECT(net.observed_nodes() == std::vector<int>{1}, "observed nodes");

    const auto& parents = net.parents(1);
    EXPECT(parents.size() == 2, "PriceMove has two parents");
    EXPECT(parents[0].node == 0 && parents[0].relation == SliceRelation::Intra, "intra parent first");
    EXPECT(parents[1].node == 1 && parents[1].relation == SliceRelation::Inter, "inter self parent");
    EXPECT(net.parents(0).empty(), "MarketSentiment is a root");

    EXPECT(net.children(0) == std::vector<int>{1}, "children of MarketSentiment");
    EXPECT(net.children(1) == std::vector<int>{1}, "PriceMove feeds the next slice");

    const auto& order = net.topological_order();
    EXPECT(order.size() == 2 && order[0] == 0 && order[1] == 1, "parent before child");
    EXPECT(net.node("PriceMove").index_of("Decrease") == 1, "domain lookup");
    EXPECT_THROWS(net.node("Volume"), ConfigError, "unknown node lookup");
    return 0;
}

static int test_rejects_invalid_topology()
{
    EXPECT_THROWS(NetworkStructure::build({{"A", {}, NodeRole::Hidden}}, {}), ConfigError, "empty domain");
    EXPECT_THROWS(NetworkStructure::build({{"", {"x"}, NodeRole::Hidden}}, {}), ConfigError, "empty id");
    EXPECT_THROWS(NetworkStructure::build({{"A", {"x", "x"}, NodeRole::Hidden}}, {}), ConfigError,
                  "duplicate domain value");
    EXPECT_THROWS(NetworkStructure::build({{"A", {"x"}, NodeRole::Hidden}, {"A", {"y"}, NodeRole::Observed}}, {}),
                  ConfigError, "duplicate id");
    EXPECT_THROWS(NetworkStructure::build({{"A", {"x"}, NodeRole::Hidden}}, {{"A", "B", SliceRelation::Intra}}),
                  ConfigError, "dangling edge");
    EXPECT_THROWS(NetworkStructure::build({{"A", {"x"}, NodeRole::Hidden}},
                                          {{"A", "A", SliceRelation::Inter}, {"A", "A", SliceRelation::Inter}}),
                  ConfigError, "repeated edge");
    EXPECT_THROWS(NetworkStructure::build({{"A", {"x"}, NodeRole::Hidden}}, {{"A", "A", SliceRelation::Intra}}),
                  ConfigError, "intra self loop");
    EXPECT_THROWS(NetworkStructure::build({{"A", {"x"}, NodeRole::Hidden},
                                           {"B", {"y"}, NodeRole::Hidden},
                                           {"C", {"z"}, NodeRole::Observed}},
                                          {{"A", "B", SliceRelation::Intra},
                                           {"B", "C", SliceRelation::Intra},
                                           {"C", "A", SliceRelation::Intra}}),
                  ConfigError, "intra cycle");
    return 0;
}

static int test_inter_slice_cycles_are_allowed()
{
    NetworkStructure net = NetworkStructure::build(
        {{"A", {"x", "y"}, NodeRole::Hidden}, {"B", {"x", "y"}, NodeRole::Hidden}},
        {{"A", "B", SliceRelation::Intra}, {"B", "A", SliceRelation::Inter}});
    EXPECT(net.topological_order()[0] == 0, "A precedes B inside a slice");
    EXPECT(net.parents(0)[0].relation == SliceRelation::Inter, "B(t-1) -> A(t)");
    return 0;
}

static int test_unroll()
{
    NetworkStructure net = market_structure();
    auto slices = net.unroll(3);
    EXPECT(slices.size() == 3, "three slices");
    EXPECT(slices[2].size() == 2, "every node per slice");
    EXPECT(slices[2][1].first == "PriceMove" && slices[2][1].second == 2, "node and time index");
    EXPECT(net.unroll(0).empty(), "zero slices");
    return 0;
}

static int test_role_and_relation_names()
{
    EXPECT(parse_role(to_string(NodeRole::Observed)) == NodeRole::Observed, "role name");
    EXPECT(parse_relation(to_string(SliceRelation::Inter)) == SliceRelation::Inter, "relation name");
    EXPECT_THROWS(parse_role("latent"), ConfigError, "unknown role");
    EXPECT_THROWS(parse_relation("lag2"), ConfigError, "unknown relation");
    return 0;
}

int main()
{
    if (test_build_and_queries() != 0) return 1;
    if (test_rejects_invalid_topology() != 0) return 1;
    if (test_inter_slice_cycles_are_allowed() != 0) return 1;
    if (test_unroll() != 0) return 1;
    if (test_role_and_relation_names() != 0) return 1;
    return 0;
}
