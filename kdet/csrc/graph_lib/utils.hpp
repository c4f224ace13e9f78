// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include "graph_lib/defines.hpp"

namespace kdet
{

namespace graphlib
{
class Graph;
class Node;

// pass through
bool default_node_filter(Node *);

// Returns a deterministic topological order: Kahn's algorithm seeded with the heads in id order, visiting
// users in outbound edge order. Nodes on a cycle are appended in id order so every node is returned once.
std::vector<Node *> topological_sort(
    Graph const &graph, std::function<bool(Node *)> node_filter = default_node_filter);

// Breadth-first walk along outbound edges starting at (and including) `start`, returning at most
// `max_nodes` distinct nodes.
std::vector<Node *> forward_sequence(Graph const &graph, Node const *start, std::size_t max_nodes);

}  // namespace graphlib
}  // namespace kdet
