// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "graph_lib/utils.hpp"

#include <queue>
#include <unordered_map>
#include <unordered_set>

#include "graph_lib/graph.hpp"
#include "graph_lib/node.hpp"
#include "utils/logger.hpp"

namespace kdet
{
namespace graphlib
{

bool default_node_filter(Node *) { return true; }

std::vector<Node *> topological_sort(Graph const &graph, std::function<bool(Node *)> node_filter)
{
    std::vector<Node *> order;
    std::unordered_map<NodeId, std::size_t> pending_operands;
    std::unordered_set<NodeId> visited;
    std::queue<Node *> node_queue;

    std::vector<Node *> nodes = graph.nodes();
    for (Node *node : nodes)
    {
        pending_operands[node->id()] = graph.operand_ids(node->id()).size();
        if (pending_operands[node->id()] == 0)
            node_queue.push(node);
    }

    auto visit = [&](Node *node)
    {
        visited.insert(node->id());
        order.push_back(node);
        for (NodeId user_id : graph.user_ids(node->id()))
        {
            if (visited.count(user_id) > 0)
                continue;
            if (--pending_operands[user_id] == 0)
                node_queue.push(graph.node_by_id(user_id));
        }
    };

    while (not node_queue.empty())
    {
        Node *node = node_queue.front();
        node_queue.pop();
        visit(node);
    }

    if (order.size() != nodes.size())
    {
        log_warning(
            LogGraphLib,
            "Graph {} is not acyclic, {} nodes appended in id order",
            graph.name(),
            nodes.size() - order.size());
        for (Node *node : nodes)
        {
            if (visited.count(node->id()) == 0)
            {
                visited.insert(node->id());
                order.push_back(node);
            }
        }
    }

    std::vector<Node *> result;
    result.reserve(order.size());
    for (Node *node : order)
    {
        if (node_filter(node))
            result.push_back(node);
    }
    return result;
}

std::vector<Node *> forward_sequence(Graph const &graph, Node const *start, std::size_t max_nodes)
{
    std::vector<Node *> result;
    if (max_nodes == 0)
        return result;

    std::unordered_set<NodeId> seen = {start->id()};
    std::queue<NodeId> frontier;
    frontier.push(start->id());
    while (not frontier.empty() and result.size() < max_nodes)
    {
        NodeId id = frontier.front();
        frontier.pop();
        result.push_back(graph.node_by_id(id));
        for (NodeId user_id : graph.user_ids(id))
        {
            if (seen.insert(user_id).second)
                frontier.push(user_id);
        }
    }
    return result;
}

}  // namespace graphlib
}  // namespace kdet
