// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "fusion/fusion_policy.hpp"
#include "gtest/gtest.h"

using namespace kdet;
using namespace kdet::fusion;

TEST(FusionPolicyTest, defaults_are_restrictive)
{
    FusionPolicy policy;
    EXPECT_EQ(policy.flags().multiple_outbound, MultipleOutboundMode::NoFuse);
    EXPECT_FALSE(policy.flags().require_ready);
    EXPECT_FALSE(policy.is_fusible("Conv2D", "Relu"));
}

TEST(FusionPolicyTest, parse_rule_document)
{
    json rules = json::parse(R"({
        "BF_Conv2D_Relu": {"obey": true},
        "BF_Add_Relu": {"obey": false},
        "BF_Relu": {"obey": true},
        "BF_conv_bn": {"obey": true, "ops": ["Conv2D", "FusedBatchNorm_v3"]},
        "MON": {"obey": 2},
        "RT": {"obey": true},
        "op_aliases": {"Relu6": "Relu"},
        "fusion_units": {
            "se": {"nodes": [{"alias": "pool", "types": "Mean"}, {"alias": "fc", "types": ["MatMul", "Conv2D"]}],
                   "edges": [["pool", "fc"]]},
            "cbr": {"nodes": [{"alias": "conv", "types": "Conv2D"}]}
        }
    })");
    FusionPolicy policy = FusionPolicy::from_json(rules);

    EXPECT_TRUE(policy.is_fusible("Conv2D", "Relu"));
    EXPECT_TRUE(policy.is_fusible("Conv2D", "Relu6"));
    EXPECT_FALSE(policy.is_fusible("Relu", "Conv2D"));
    EXPECT_FALSE(policy.is_fusible("Add", "Relu"));
    EXPECT_TRUE(policy.is_fusible("Relu", "Relu"));
    EXPECT_TRUE(policy.is_fusible("Conv2D", "FusedBatchNorm_v3"));
    EXPECT_EQ(policy.table().size(), 3u);

    EXPECT_EQ(policy.flags().multiple_outbound, MultipleOutboundMode::FuseAll);
    EXPECT_TRUE(policy.flags().require_ready);

    ASSERT_EQ(policy.fusion_units().size(), 2u);
    EXPECT_EQ(policy.fusion_units()[0].name, "cbr");
    const FusionUnit &se = policy.fusion_units()[1];
    EXPECT_EQ(se.name, "se");
    EXPECT_EQ(se.vertices[0].types, (std::vector<std::string>{"Mean"}));
    EXPECT_EQ(se.vertices[1].types, (std::vector<std::string>{"MatMul", "Conv2D"}));
    EXPECT_EQ(se.edges.size(), 1u);
}

TEST(FusionPolicyTest, multiple_outbound_verdicts)
{
    auto mode = [](json obey) { return FusionPolicy::from_json({{"MON", {{"obey", obey}}}}).flags().multiple_outbound; };
    EXPECT_EQ(mode(false), MultipleOutboundMode::NoFuse);
    EXPECT_EQ(mode(true), MultipleOutboundMode::FuseFirst);
    EXPECT_EQ(mode(0), MultipleOutboundMode::NoFuse);
    EXPECT_EQ(mode(1), MultipleOutboundMode::FuseFirst);
    EXPECT_EQ(mode(nullptr), MultipleOutboundMode::NoFuse);
    EXPECT_THROW(mode(3), std::runtime_error);
    EXPECT_THROW(mode("all"), std::runtime_error);
}

TEST(FusionPolicyTest, null_verdicts_keep_defaults)
{
    FusionPolicy policy = FusionPolicy::from_json(json::parse(R"({"BF_A_B": {"obey": null}, "RT": {"obey": null}})"));
    EXPECT_FALSE(policy.is_fusible("A", "B"));
    EXPECT_FALSE(policy.flags().require_ready);
    EXPECT_EQ(policy.table().size(), 0u);
}

TEST(FusionPolicyTest, unknown_keys_are_ignored)
{
    FusionPolicy policy = FusionPolicy::from_json(json::parse(R"({"FN": {"obey": true}, "BF_A_B": {"obey": true}})"));
    EXPECT_TRUE(policy.is_fusible("A", "B"));
}

TEST(FusionPolicyTest, malformed_documents_throw)
{
    std::vector<std::string> documents = {
        R"([])",
        R"({"BF_A_B": true})",
        R"({"BF_A_B": {"verdict": true}})",
        R"({"BF_A_B": {"obey": "yes"}})",
        R"({"BF_A_B_C": {"obey": true}})",
        R"({"BF_": {"obey": true}})",
        R"({"BF_A_": {"obey": true}})",
        R"({"BF_x": {"obey": true, "ops": ["A"]}})",
        R"({"RT": {"obey": 1}})",
        R"({"op_aliases": {"Relu6": 6}})",
        R"({"fusion_units": {"u": {"nodes": []}}})",
        R"({"fusion_units": {"u": {"nodes": [{"alias": "a", "types": []}]}}})",
        R"({"fusion_units": {"u": {"nodes": [{"alias": "a", "types": "A"}], "edges": [["a", "b"]]}}})",
    };
    for (const std::string &document : documents)
        EXPECT_THROW(FusionPolicy::from_json(json::parse(document)), std::runtime_error) << document;
}

TEST(FusionPolicyTest, missing_rule_file_throws)
{
    EXPECT_THROW(FusionPolicy::from_file("/nonexistent/rules.json"), std::runtime_error);
}

TEST(FusionPolicyTest, fusibility_table_is_ordered)
{
    FusibilityTable table;
    table.set_fusible("A", "B");
    EXPECT_TRUE(table.is_fusible("A", "B"));
    EXPECT_FALSE(table.is_fusible("B", "A"));
    table.set_fusible("A", "B", false);
    EXPECT_FALSE(table.is_fusible("A", "B"));
}
