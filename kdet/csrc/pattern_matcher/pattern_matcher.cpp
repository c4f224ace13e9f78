// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "pattern_matcher/pattern_matcher.hpp"
#include "pattern_matcher/boost_lowering.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <string>

#include <boost/graph/vf2_sub_graph_iso.hpp>

#include "graph_lib/graph.hpp"

namespace kdet::pattern_matcher {

bool op_type_equal(const std::string& template_type, const std::string& node_type) {
    return template_type == "*" or template_type == node_type;
}

SubgraphPatternMatchMappings subgraph_pattern_match(
    const FusionUnit& unit,
    const graphlib::Graph& graph,
    const TypePredicate& predicate,
    std::unordered_set<NodeId>& used_nodes) {

    SubgraphPatternMatchMappings matches;
    if (unit.vertices.empty() or unit.vertices.size() > (std::size_t)graph.num_nodes()) {
        return matches;
    }

    graph_type small_graph = convert_fusion_unit_to_boost_graph(unit);
    graph_type large_graph = convert_graph_to_boost_graph(graph);

    auto callback = [&](auto bijection, auto) {
        SubgraphPatternMatch match;
        for (auto v : boost::make_iterator_range(vertices(small_graph))) {
            NodeId matched_id = large_graph[get(bijection, v)].node_id;
            if (used_nodes.count(matched_id) > 0) {
                // overlaps an earlier occurrence, keep searching
                return true;
            }
            match[small_graph[v].name] = matched_id;
        }

        for (const auto& [alias, node_id] : match) {
            used_nodes.insert(node_id);
        }
        log_debug(LogPatternMatcher, "Matched {} occurrence #{}", unit.name, matches.size());
        matches.push_back(std::move(match));
        return true;
    };

    auto vertex_predicate = [&](auto vertex_a, auto vertex_b) {
        const std::string& node_type = large_graph[vertex_b].op_types.front();
        const std::vector<std::string>& accepted = small_graph[vertex_a].op_types;
        return std::any_of(accepted.begin(), accepted.end(), [&](const std::string& template_type) {
            return predicate(template_type, node_type);
        });
    };

    // Monomorphism: template edges are required, extra edges among matched nodes are allowed
    boost::vf2_subgraph_mono(
        small_graph,
        large_graph,
        callback,
        boost::vertex_order_by_mult(small_graph),
        boost::vertices_equivalent(vertex_predicate));

    return matches;
}

SubgraphPatternMatchMappings subgraph_pattern_match(const FusionUnit& unit, const graphlib::Graph& graph) {
    std::unordered_set<NodeId> used_nodes;
    return subgraph_pattern_match(unit, graph, op_type_equal, used_nodes);
}

std::vector<NodeId> get_node_ids(const FusionUnit& unit, const SubgraphPatternMatch& match) {
    std::vector<NodeId> node_ids;
    for (const FusionUnitVertex& vertex : unit.vertices) {
        node_ids.push_back(match.at(vertex.alias));
    }
    return node_ids;
}

} // namespace kdet::pattern_matcher
