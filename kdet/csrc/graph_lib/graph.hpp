// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "graph_lib/defines.hpp"
#include "graph_lib/node.hpp"

namespace kdet
{

namespace graphlib
{

// Directed operator graph. Nodes live in an arena addressed by dense NodeId; a removed node leaves an empty
// slot so ids are never reused. Inbound and outbound lists are ordered and may hold parallel edges.
class Graph
{
   public:
    Graph() = default;
    explicit Graph(std::string name) : name_(std::move(name)) {}
    Graph(const Graph &other) = delete;
    Graph &operator=(const Graph &other) = delete;

    // Deep copy, preserving node ids, names, attributes, shapes and edge order
    std::unique_ptr<Graph> clone() const;

    const std::string &name() const { return name_; }

    // Node-level queries
    Node *node_by_id(NodeId id) const;
    Node *get_node_by_name(const std::string &name, bool raise_exception = true) const;
    bool has_node_with_id(NodeId id) const;
    bool has_node_with_name(const std::string &name) const
    {
        return node_name_to_node_id_.find(name) != node_name_to_node_id_.end();
    }

    const std::vector<NodeId> &operand_ids(NodeId node_id) const;
    const std::vector<NodeId> &user_ids(NodeId node_id) const;
    std::vector<Node *> operands(const Node *node) const;
    std::vector<Node *> users(const Node *node) const;
    int num_operands(const Node *node) const { return (int)operand_ids(node->id()).size(); }
    int num_users(const Node *node) const { return (int)user_ids(node->id()).size(); }
    bool has_edge(NodeId producer, NodeId consumer) const;

    // Graph-level queries
    std::vector<Node *> nodes() const;
    int num_nodes() const { return num_live_nodes_; }
    // Nodes without producers, in id order
    std::vector<Node *> heads() const;

    // Mutation
    Node *add_node(std::unique_ptr<Node> node);
    Node *add_node(const std::string &name, const std::string &op_type, Attrs attrs = {});
    void add_edge(NodeId producer, NodeId consumer);
    void add_edge(const Node *producer, const Node *consumer) { add_edge(producer->id(), consumer->id()); }
    // Removes every edge between producer and consumer
    void remove_edge(NodeId producer, NodeId consumer);
    std::unique_ptr<Node> remove_node(NodeId id);

    // Collapse a set of nodes into one new node of the given op type. Edges crossing the set boundary are
    // re-pointed at the new node in place, internal edges are dropped. Returns the new node.
    Node *fuse_nodes(const std::vector<NodeId> &node_ids, const std::string &op_type);

   private:
    void check_node_id(NodeId id) const;

    std::string name_;
    std::vector<std::unique_ptr<Node>> nodes_;
    std::vector<std::vector<NodeId>> operands_;
    std::vector<std::vector<NodeId>> users_;
    std::unordered_map<std::string, NodeId> node_name_to_node_id_;
    int num_live_nodes_ = 0;
};

}  // namespace graphlib
}  // namespace kdet
