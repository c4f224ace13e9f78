// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "pattern_matcher/boost_lowering.hpp"

#include <unordered_map>

#include "graph_lib/graph.hpp"
#include "utils/assert.hpp"
#include "utils/logger.hpp"

using namespace kdet::graphlib;

namespace kdet::pattern_matcher {

static VertexId add_vertex_to_boost_graph(graph_type& graph, const Node* node) {
    log_trace(LogPatternMatcher, "Node: {}, {}, {}", node->id(), node->op_type(), node->name());
    VertexId vertex_descriptor = add_vertex(
        VertexProperty{
            node->name(),
            {node->op_type()},
            node->id(),
        },
        graph
    );
    return vertex_descriptor;
}

graph_type convert_graph_to_boost_graph(const Graph& graph) {
    graph_type boost_graph;
    std::unordered_map<NodeId, VertexId> node_to_vertex;

    for (Node* node : graph.nodes()) {
        node_to_vertex[node->id()] = add_vertex_to_boost_graph(boost_graph, node);
    }

    for (Node* node : graph.nodes()) {
        for (NodeId user_id : graph.user_ids(node->id())) {
            add_edge(node_to_vertex.at(node->id()), node_to_vertex.at(user_id), boost_graph);
        }
    }
    return boost_graph;
}

graph_type convert_fusion_unit_to_boost_graph(const FusionUnit& unit) {
    graph_type pattern_graph;
    std::unordered_map<std::string, VertexId> alias_to_vertex;

    NodeId position = 0;
    for (const FusionUnitVertex& vertex : unit.vertices) {
        KDET_ASSERT(alias_to_vertex.count(vertex.alias) == 0, "Duplicate alias in fusion unit", unit.name, vertex.alias);
        alias_to_vertex[vertex.alias] = add_vertex(VertexProperty{vertex.alias, vertex.types, position++}, pattern_graph);
    }

    for (const auto& [producer, consumer] : unit.edges) {
        auto producer_it = alias_to_vertex.find(producer);
        auto consumer_it = alias_to_vertex.find(consumer);
        if (producer_it == alias_to_vertex.end() or consumer_it == alias_to_vertex.end()) {
            KDET_THROW("Fusion unit edge references unknown alias", unit.name, producer, consumer);
        }
        add_edge(producer_it->second, consumer_it->second, pattern_graph);
    }
    return pattern_graph;
}

} // namespace kdet::pattern_matcher
