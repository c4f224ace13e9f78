// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "graph_lib/graph.hpp"
#include "graph_lib/node.hpp"
#include "gtest/gtest.h"

namespace kdet::test
{

class GraphTest : public ::testing::Test
{
   public:
    // Override to build the graph under test
    virtual void create_graph() {}

    void SetUp() override
    {
        graph = std::make_unique<graphlib::Graph>(std::string("GraphTest.") + get_current_test_name());
        create_graph();
    }

    static std::string get_current_test_name()
    {
        std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        for (std::string bad_char : std::vector<std::string>{"/"})
            for (std::string::size_type n = name.find(bad_char, 0); n != std::string::npos; n = name.find(bad_char, n))
                name.replace(n, bad_char.size(), "_");
        return name;
    }

    graphlib::Graph *get_graph() { return graph.get(); }

    graphlib::Node *add_op(
        const std::string &name,
        const std::string &op_type,
        const std::vector<graphlib::Node *> &operands = {},
        graphlib::Attrs attrs = {})
    {
        graphlib::Node *node = graph->add_node(name, op_type, std::move(attrs));
        for (graphlib::Node *operand : operands) graph->add_edge(operand, node);
        return node;
    }

    graphlib::Node *create_placeholder(const std::string &name, const graphlib::Shape &shape)
    {
        return add_op(name, "Placeholder", {}, {{"shape", shape.as_vector()}});
    }

    graphlib::Node *create_const(const std::string &name, const graphlib::Shape &tensor_shape)
    {
        return add_op(name, "Const", {}, {{"tensor_shape", tensor_shape.as_vector()}});
    }

    // Const carrying a payload, as consumed by Reshape and Transpose
    graphlib::Node *create_const_payload(const std::string &name, std::vector<std::int64_t> constant)
    {
        std::int64_t rank = (std::int64_t)constant.size();
        return add_op(
            name, "Const", {}, {{"tensor_shape", std::vector<std::int64_t>{rank}}, {"constant", std::move(constant)}});
    }

    // Untyped chain a -> b -> ... in the given op types, named by their position
    std::vector<graphlib::Node *> create_chain(const std::vector<std::string> &op_types, const std::string &prefix = "n")
    {
        std::vector<graphlib::Node *> nodes;
        for (std::size_t i = 0; i < op_types.size(); ++i)
        {
            std::vector<graphlib::Node *> operands;
            if (not nodes.empty())
                operands.push_back(nodes.back());
            nodes.push_back(add_op(prefix + std::to_string(i), op_types[i], operands));
        }
        return nodes;
    }

    std::unique_ptr<graphlib::Graph> graph;
};

}  // namespace kdet::test
