// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace kdet
{
namespace graphlib
{
class Graph;
class Node;
}  // namespace graphlib

namespace fusion
{

// Kernel: nodes expected to run as one fused unit
struct BasicBlock
{
    std::string op_type;
    // Names of the ingested nodes in the block, in absorption order
    std::vector<std::string> nodes;

    bool operator==(const BasicBlock &other) const { return op_type == other.op_type and nodes == other.nodes; }
};

nlohmann::json blocks_to_json(const std::vector<BasicBlock> &blocks);

// Block state of one split run. Nodes are addressed by their position in topological order. Every
// position starts as its own block; fuse(i, j) moves j's block into i's and re-wires the block edges.
class FusionAwareGraph
{
   public:
    explicit FusionAwareGraph(const graphlib::Graph &graph);

    int size() const { return (int)nodes_.size(); }
    const graphlib::Node *node(int i) const { return nodes_.at(i); }

    bool is_fused(int i) const { return fused_.at(i); }
    bool is_ready(int i) const { return ready_.at(i); }
    void mark_ready(int i) { ready_.at(i) = true; }

    // Op type of the node most recently absorbed into the block; the node's own type before any merge
    const std::string &type(int i) const { return types_.at(i); }

    const std::vector<int> &outbounds(int i) const { return outbounds_.at(i); }
    const std::vector<int> &inbounds(int i) const { return inbounds_.at(i); }

    // Root of the block containing `i`. Union-find lookup, compresses the path it walks.
    int block_of(int i) const;
    const std::vector<int> &members(int i) const { return members_.at(i); }

    // Merge j's block into i's. With `preserve`, i keeps its other consumers and gains j's; otherwise i's
    // consumers become j's consumers.
    void fuse(int i, int j, bool preserve = false);

    // One block per unfused position, in position order
    std::vector<BasicBlock> basic_blocks() const;

   private:
    std::string label(int i) const;

    std::vector<const graphlib::Node *> nodes_;
    std::vector<bool> fused_;
    std::vector<bool> ready_;
    mutable std::vector<int> parent_;
    std::vector<std::vector<int>> members_;
    std::vector<std::string> types_;
    std::vector<std::vector<int>> outbounds_;
    std::vector<std::vector<int>> inbounds_;
};

}  // namespace fusion
}  // namespace kdet
