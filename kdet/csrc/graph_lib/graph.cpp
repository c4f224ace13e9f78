// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "graph_lib/graph.hpp"

#include <algorithm>
#include <unordered_set>

#include "utils/logger.hpp"

namespace kdet
{
namespace graphlib
{

namespace
{
// Replace every occurrence of a member of `from` with `to`, keeping only the first occurrence of `to`
void repoint_and_dedup(std::vector<NodeId> &ids, const std::unordered_set<NodeId> &from, NodeId to)
{
    bool seen_to = false;
    std::vector<NodeId> result;
    result.reserve(ids.size());
    for (NodeId id : ids)
    {
        if (from.count(id) > 0 or id == to)
        {
            if (seen_to)
                continue;
            seen_to = true;
            result.push_back(to);
        }
        else
        {
            result.push_back(id);
        }
    }
    ids = std::move(result);
}
}  // namespace

std::unique_ptr<Graph> Graph::clone() const
{
    auto cloned = std::make_unique<Graph>(name_);
    cloned->nodes_.resize(nodes_.size());
    for (std::size_t i = 0; i < nodes_.size(); ++i)
    {
        if (nodes_[i] != nullptr)
            cloned->nodes_[i] = std::make_unique<Node>(*nodes_[i]);
    }
    cloned->operands_ = operands_;
    cloned->users_ = users_;
    cloned->node_name_to_node_id_ = node_name_to_node_id_;
    cloned->num_live_nodes_ = num_live_nodes_;
    return cloned;
}

void Graph::check_node_id(NodeId id) const
{
    KDET_ASSERT(has_node_with_id(id), "Node not found", id, name_);
}

Node *Graph::node_by_id(NodeId id) const
{
    check_node_id(id);
    return nodes_[id].get();
}

Node *Graph::get_node_by_name(const std::string &name, bool raise_exception) const
{
    auto it = node_name_to_node_id_.find(name);
    if (it == node_name_to_node_id_.end())
    {
        if (raise_exception)
            KDET_THROW("Node not found by name", name);
        return nullptr;
    }
    return nodes_[it->second].get();
}

bool Graph::has_node_with_id(NodeId id) const
{
    return id >= 0 and id < (NodeId)nodes_.size() and nodes_[id] != nullptr;
}

const std::vector<NodeId> &Graph::operand_ids(NodeId node_id) const
{
    check_node_id(node_id);
    return operands_[node_id];
}

const std::vector<NodeId> &Graph::user_ids(NodeId node_id) const
{
    check_node_id(node_id);
    return users_[node_id];
}

std::vector<Node *> Graph::operands(const Node *node) const
{
    std::vector<Node *> result;
    for (NodeId id : operand_ids(node->id())) result.push_back(nodes_[id].get());
    return result;
}

std::vector<Node *> Graph::users(const Node *node) const
{
    std::vector<Node *> result;
    for (NodeId id : user_ids(node->id())) result.push_back(nodes_[id].get());
    return result;
}

bool Graph::has_edge(NodeId producer, NodeId consumer) const
{
    const std::vector<NodeId> &users = user_ids(producer);
    return std::find(users.begin(), users.end(), consumer) != users.end();
}

std::vector<Node *> Graph::nodes() const
{
    std::vector<Node *> result;
    result.reserve(num_live_nodes_);
    for (const auto &node : nodes_)
    {
        if (node != nullptr)
            result.push_back(node.get());
    }
    return result;
}

std::vector<Node *> Graph::heads() const
{
    std::vector<Node *> result;
    for (const auto &node : nodes_)
    {
        if (node != nullptr and operands_[node->id()].empty())
            result.push_back(node.get());
    }
    return result;
}

Node *Graph::add_node(std::unique_ptr<Node> node)
{
    KDET_ASSERT(not has_node_with_name(node->name()), "Node with this name already exists", node->name());
    NodeId id = (NodeId)nodes_.size();
    node->set_id(id);
    node_name_to_node_id_[node->name()] = id;
    nodes_.push_back(std::move(node));
    operands_.emplace_back();
    users_.emplace_back();
    num_live_nodes_++;
    return nodes_.back().get();
}

Node *Graph::add_node(const std::string &name, const std::string &op_type, Attrs attrs)
{
    return add_node(std::make_unique<Node>(name, op_type, std::move(attrs)));
}

void Graph::add_edge(NodeId producer, NodeId consumer)
{
    check_node_id(producer);
    check_node_id(consumer);
    users_[producer].push_back(consumer);
    operands_[consumer].push_back(producer);
}

void Graph::remove_edge(NodeId producer, NodeId consumer)
{
    check_node_id(producer);
    check_node_id(consumer);
    auto &users = users_[producer];
    users.erase(std::remove(users.begin(), users.end(), consumer), users.end());
    auto &operands = operands_[consumer];
    operands.erase(std::remove(operands.begin(), operands.end(), producer), operands.end());
}

std::unique_ptr<Node> Graph::remove_node(NodeId id)
{
    check_node_id(id);
    for (NodeId operand : std::vector<NodeId>(operands_[id])) remove_edge(operand, id);
    for (NodeId user : std::vector<NodeId>(users_[id])) remove_edge(id, user);

    std::unique_ptr<Node> node = std::move(nodes_[id]);
    node_name_to_node_id_.erase(node->name());
    num_live_nodes_--;
    return node;
}

Node *Graph::fuse_nodes(const std::vector<NodeId> &node_ids, const std::string &op_type)
{
    KDET_ASSERT(not node_ids.empty(), "Cannot fuse an empty node set");
    std::unordered_set<NodeId> members(node_ids.begin(), node_ids.end());
    KDET_ASSERT(members.size() == node_ids.size(), "Duplicate node in fuse set");

    std::string fused_name;
    std::vector<std::string> original_names;
    for (NodeId id : node_ids)
    {
        Node *node = node_by_id(id);
        fused_name += (fused_name.empty() ? "" : "+") + node->name();
        const auto &names = node->original_names();
        original_names.insert(original_names.end(), names.begin(), names.end());
    }

    // Boundary edges, in member order
    std::vector<NodeId> producers;
    std::vector<NodeId> consumers;
    const std::vector<Shape> *input_shapes = nullptr;
    const std::vector<Shape> *output_shapes = nullptr;
    for (NodeId id : node_ids)
    {
        Node *node = nodes_[id].get();
        for (NodeId operand : operands_[id])
        {
            if (members.count(operand) > 0)
                continue;
            if (std::find(producers.begin(), producers.end(), operand) == producers.end())
                producers.push_back(operand);
            if (input_shapes == nullptr and node->input_shapes().has_value())
                input_shapes = &*node->input_shapes();
        }
        for (NodeId user : users_[id])
        {
            if (members.count(user) > 0)
                continue;
            if (std::find(consumers.begin(), consumers.end(), user) == consumers.end())
                consumers.push_back(user);
            if (node->output_shapes().has_value())
                output_shapes = &*node->output_shapes();
        }
    }

    auto fused = std::make_unique<Node>(fused_name, op_type);
    fused->set_original_names(std::move(original_names));
    if (input_shapes != nullptr)
        fused->set_input_shapes(*input_shapes);
    if (output_shapes != nullptr)
        fused->set_output_shapes(*output_shapes);
    // A one-member fusion reuses its member's name
    for (NodeId id : node_ids) node_name_to_node_id_.erase(nodes_[id]->name());
    Node *fused_node = add_node(std::move(fused));
    NodeId fused_id = fused_node->id();

    for (NodeId producer : producers)
    {
        repoint_and_dedup(users_[producer], members, fused_id);
        operands_[fused_id].push_back(producer);
    }
    for (NodeId consumer : consumers)
    {
        repoint_and_dedup(operands_[consumer], members, fused_id);
        users_[fused_id].push_back(consumer);
    }

    for (NodeId id : node_ids)
    {
        // Boundary edges were already moved to the fused node
        operands_[id].clear();
        users_[id].clear();
        nodes_[id].reset();
        num_live_nodes_--;
    }

    log_debug(LogGraphLib, "Fused {} nodes into {} ({})", node_ids.size(), fused_name, op_type);
    return fused_node;
}

}  // namespace graphlib
}  // namespace kdet
