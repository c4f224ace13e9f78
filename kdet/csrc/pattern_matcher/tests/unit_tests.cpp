// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "gtest/gtest.h"

#include "pattern_matcher/boost_lowering.hpp"
#include "pattern_matcher/pattern_matcher.hpp"
#include "test/common.hpp"

using namespace kdet;
using namespace kdet::graphlib;
using namespace kdet::pattern_matcher;

FusionUnit conv_bn_relu_unit() {
    return FusionUnit{
        "conv_bn_relu",
        {
            {"conv", {"Conv2D", "DepthwiseConv2dNative"}},
            {"bn", {"FusedBatchNormV3"}},
            {"relu", {"Relu", "Relu6"}},
        },
        {{"conv", "bn"}, {"bn", "relu"}},
    };
}

class PatternMatcherTest : public test::GraphTest {
   public:
    // Two conv/bn/relu blocks in sequence, the second with a depthwise conv and relu6
    void create_graph() override {
        Node* input = create_placeholder("input", {1, 8, 8, 3});
        Node* conv0 = add_op("conv0", "Conv2D", {input});
        Node* bn0 = add_op("bn0", "FusedBatchNormV3", {conv0});
        Node* relu0 = add_op("relu0", "Relu", {bn0});
        Node* conv1 = add_op("conv1", "DepthwiseConv2dNative", {relu0});
        Node* bn1 = add_op("bn1", "FusedBatchNormV3", {conv1});
        Node* relu1 = add_op("relu1", "Relu6", {bn1});
        add_op("add", "Add", {relu1, relu0});
    }

    std::vector<std::string> matched_names(const FusionUnit& unit, const SubgraphPatternMatch& match) {
        std::vector<std::string> names;
        for (NodeId id : get_node_ids(unit, match)) names.push_back(graph->node_by_id(id)->name());
        return names;
    }
};

TEST_F(PatternMatcherTest, lowering_keeps_topology) {
    graph_type boost_graph = convert_graph_to_boost_graph(*graph);
    EXPECT_EQ(num_vertices(boost_graph), 8u);
    EXPECT_EQ(num_edges(boost_graph), 8u);

    graph_type pattern_graph = convert_fusion_unit_to_boost_graph(conv_bn_relu_unit());
    EXPECT_EQ(num_vertices(pattern_graph), 3u);
    EXPECT_EQ(num_edges(pattern_graph), 2u);
    EXPECT_EQ(pattern_graph[0].op_types.size(), 2u);
}

TEST_F(PatternMatcherTest, unknown_alias_throws) {
    FusionUnit unit = conv_bn_relu_unit();
    unit.edges.push_back({"relu", "missing"});
    EXPECT_THROW(convert_fusion_unit_to_boost_graph(unit), std::runtime_error);
}

TEST_F(PatternMatcherTest, finds_every_occurrence) {
    FusionUnit unit = conv_bn_relu_unit();
    SubgraphPatternMatchMappings matches = subgraph_pattern_match(unit, *graph);
    ASSERT_EQ(matches.size(), 2u);

    std::vector<std::vector<std::string>> found;
    for (const auto& match : matches) found.push_back(matched_names(unit, match));
    std::sort(found.begin(), found.end());
    EXPECT_EQ(found[0], (std::vector<std::string>{"conv0", "bn0", "relu0"}));
    EXPECT_EQ(found[1], (std::vector<std::string>{"conv1", "bn1", "relu1"}));
}

TEST_F(PatternMatcherTest, occurrences_do_not_overlap) {
    // Wildcard pairs along the chain overlap their neighbours
    FusionUnit unit{"act_pair", {{"a", {"*"}}, {"b", {"*"}}}, {{"a", "b"}}};
    std::unordered_set<NodeId> used;
    SubgraphPatternMatchMappings matches = subgraph_pattern_match(unit, *graph, op_type_equal, used);

    std::unordered_set<NodeId> seen;
    for (const auto& match : matches) {
        for (const auto& [alias, id] : match) {
            EXPECT_TRUE(seen.insert(id).second) << "node matched twice: " << id;
        }
    }
    EXPECT_EQ(seen, used);
    EXPECT_GE(matches.size(), 2u);
}

TEST_F(PatternMatcherTest, used_nodes_are_excluded_from_later_units) {
    std::unordered_set<NodeId> used;
    FusionUnit first = conv_bn_relu_unit();
    EXPECT_EQ(subgraph_pattern_match(first, *graph, op_type_equal, used).size(), 2u);

    FusionUnit second{"bn_relu", {{"bn", {"FusedBatchNormV3"}}, {"relu", {"Relu", "Relu6"}}}, {{"bn", "relu"}}};
    EXPECT_TRUE(subgraph_pattern_match(second, *graph, op_type_equal, used).empty());
    EXPECT_EQ(subgraph_pattern_match(second, *graph).size(), 2u);
}

TEST_F(PatternMatcherTest, custom_type_predicate) {
    FusionUnit unit{"conv_bn", {{"conv", {"conv"}}, {"bn", {"bn"}}}, {{"conv", "bn"}}};
    EXPECT_TRUE(subgraph_pattern_match(unit, *graph).empty());

    auto lowercase_family = [](const std::string& template_type, const std::string& node_type) {
        if (template_type == "conv") return node_type == "Conv2D" or node_type == "DepthwiseConv2dNative";
        if (template_type == "bn") return node_type.rfind("FusedBatchNorm", 0) == 0;
        return false;
    };
    std::unordered_set<NodeId> used;
    EXPECT_EQ(subgraph_pattern_match(unit, *graph, lowercase_family, used).size(), 2u);
}

TEST_F(PatternMatcherTest, extra_edges_are_allowed) {
    // relu0 also feeds add, which is not part of the template
    FusionUnit unit{"relu_dw", {{"relu", {"Relu"}}, {"dw", {"DepthwiseConv2dNative"}}}, {{"relu", "dw"}}};
    EXPECT_EQ(subgraph_pattern_match(unit, *graph).size(), 1u);
}
