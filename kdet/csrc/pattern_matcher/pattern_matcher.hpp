// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "graph_lib/defines.hpp"

#include <functional>
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <boost/graph/graph_utility.hpp>
#include <boost/graph/adjacency_list.hpp>

namespace kdet::graphlib {
    class Graph;
}

namespace kdet::pattern_matcher {

using graphlib::NodeId;

/*
  ____        _          ____  _                   _
 |  _ \  __ _| |_ __ _  / ___|| |_ _ __ _   _  ___| |_ _   _ _ __ ___  ___
 | | | |/ _` | __/ _` | \___ \| __| '__| | | |/ __| __| | | | '__/ _ \/ __|
 | |_| | (_| | || (_| |  ___) | |_| |  | |_| | (__| |_| |_| | | |  __/\__ \
 |____/ \__,_|\__\__,_| |____/ \__|_|   \__,_|\___|\__|\__,_|_|  \___||___/

*/

// One position of a fusion unit template: an alias and the op types it accepts ("*" accepts any)
struct FusionUnitVertex {
    std::string alias;
    std::vector<std::string> types;
};

// Named micro-graph of op-type constraints. `edges` are required producer -> consumer relations
// between aliases; edges not listed are allowed but not required.
struct FusionUnit {
    std::string name;
    std::vector<FusionUnitVertex> vertices;
    std::vector<std::pair<std::string, std::string>> edges;
};

struct VertexProperty {
    // node name, or the alias of a template vertex
    std::string name;
    // graph vertices carry their own op type, template vertices the types they accept
    std::vector<std::string> op_types;
    NodeId node_id;
};

typedef boost::adjacency_list< boost::setS, boost::vecS, boost::bidirectionalS, VertexProperty> graph_type;
typedef boost::graph_traits<graph_type>::vertex_descriptor VertexId;
typedef boost::graph_traits<graph_type>::edge_descriptor EdgeId;

// template alias -> matched node
using SubgraphPatternMatch = std::unordered_map<std::string, NodeId>;
using SubgraphPatternMatchMappings = std::vector<SubgraphPatternMatch>;

// (template type, node type) -> compatible
using TypePredicate = std::function<bool(const std::string&, const std::string&)>;

// Op-type equality, with "*" as a wildcard
bool op_type_equal(const std::string& template_type, const std::string& node_type);

/*
    _    ____ ___
   / \  |  _ \_ _|___
  / _ \ | |_) | |/ __|
 / ___ \|  __/| |\__ \
/_/   \_\_|  |___|___/
*/

// Occurrences of `unit` in `graph` sharing no node with each other or with `used_nodes`. Every node of a
// returned occurrence is added to `used_nodes`, so later calls sharing the set cannot reuse it.
SubgraphPatternMatchMappings subgraph_pattern_match(
    const FusionUnit& unit,
    const graphlib::Graph& graph,
    const TypePredicate& predicate,
    std::unordered_set<NodeId>& used_nodes);

// Convenience overload with a fresh used set and op-type equality
SubgraphPatternMatchMappings subgraph_pattern_match(const FusionUnit& unit, const graphlib::Graph& graph);

// Matched node ids of one occurrence, in the template's vertex order
std::vector<NodeId> get_node_ids(const FusionUnit& unit, const SubgraphPatternMatch& match);

} // namespace kdet::pattern_matcher
