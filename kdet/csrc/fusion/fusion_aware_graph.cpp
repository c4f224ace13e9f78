// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "fusion/fusion_aware_graph.hpp"

#include <algorithm>
#include <unordered_map>

#include "graph_lib/graph.hpp"
#include "graph_lib/utils.hpp"
#include "utils/assert.hpp"
#include "utils/logger.hpp"

namespace kdet::fusion
{

namespace
{
void append_unique(std::vector<int> &ids, int id)
{
    if (std::find(ids.begin(), ids.end(), id) == ids.end())
        ids.push_back(id);
}

void erase(std::vector<int> &ids, int id) { ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end()); }

// Replace `from` with `to` in place, keeping the first occurrence of `to`
void replace_unique(std::vector<int> &ids, int from, int to)
{
    std::vector<int> result;
    for (int id : ids)
    {
        int mapped = (id == from) ? to : id;
        append_unique(result, mapped);
    }
    ids = std::move(result);
}
}  // namespace

nlohmann::json blocks_to_json(const std::vector<BasicBlock> &blocks)
{
    nlohmann::json result = nlohmann::json::array();
    for (const BasicBlock &block : blocks) result.push_back({{"op_type", block.op_type}, {"nodes", block.nodes}});
    return result;
}

FusionAwareGraph::FusionAwareGraph(const graphlib::Graph &graph)
{
    std::unordered_map<graphlib::NodeId, int> position;
    for (graphlib::Node *node : graphlib::topological_sort(graph))
    {
        position[node->id()] = (int)nodes_.size();
        nodes_.push_back(node);
    }

    int n = size();
    fused_.assign(n, false);
    ready_.assign(n, false);
    parent_.resize(n);
    members_.resize(n);
    types_.resize(n);
    outbounds_.resize(n);
    inbounds_.resize(n);

    for (int i = 0; i < n; ++i)
    {
        parent_[i] = i;
        members_[i] = {i};
        types_[i] = nodes_[i]->op_type();
        // Parallel edges are one block edge
        for (graphlib::NodeId user : graph.user_ids(nodes_[i]->id())) append_unique(outbounds_[i], position.at(user));
        for (graphlib::NodeId operand : graph.operand_ids(nodes_[i]->id()))
            append_unique(inbounds_[i], position.at(operand));
    }
}

int FusionAwareGraph::block_of(int i) const
{
    int root = i;
    while (parent_.at(root) != root) root = parent_[root];

    // Path compression
    while (parent_[i] != root)
    {
        int next = parent_[i];
        parent_[i] = root;
        i = next;
    }
    return root;
}

void FusionAwareGraph::fuse(int i, int j, bool preserve)
{
    KDET_ASSERT(i != j, "Cannot fuse a block with itself", i);
    KDET_ASSERT(not fused_.at(i) and not fused_.at(j), "Cannot fuse an already fused block", i, j);

    log_trace(LogFuser, "Fuse {} ({}) <- {} ({}), preserve={}", i, types_[i], j, types_[j], preserve);

    fused_[j] = true;
    parent_[j] = i;
    members_[i].insert(members_[i].end(), members_[j].begin(), members_[j].end());
    members_[j].clear();
    types_[i] = types_[j];

    std::vector<int> j_consumers = outbounds_[j];
    erase(j_consumers, i);

    std::vector<int> previous = outbounds_[i];
    if (preserve)
    {
        erase(outbounds_[i], j);
        for (int consumer : j_consumers) append_unique(outbounds_[i], consumer);
    }
    else
    {
        outbounds_[i] = j_consumers;
        // Consumers i no longer feeds drop their edge from i
        for (int consumer : previous)
        {
            if (consumer != j and std::find(j_consumers.begin(), j_consumers.end(), consumer) == j_consumers.end())
                erase(inbounds_[consumer], i);
        }
    }

    for (int consumer : j_consumers) replace_unique(inbounds_[consumer], j, i);

    erase(inbounds_[j], i);
    for (int producer : inbounds_[j])
    {
        replace_unique(outbounds_[producer], j, i);
        append_unique(inbounds_[i], producer);
    }

    // Edges between the merged blocks are internal now
    erase(outbounds_[i], i);
    erase(inbounds_[i], i);
    erase(inbounds_[i], j);
    outbounds_[j].clear();
    inbounds_[j].clear();
}

std::string FusionAwareGraph::label(int i) const
{
    const std::vector<int> &block = members_[i];
    if (block.size() == 1)
        return nodes_[block[0]]->op_type();

    std::string result;
    for (int member : block) result += (result.empty() ? "" : "+") + nodes_[member]->op_type();
    return result;
}

std::vector<BasicBlock> FusionAwareGraph::basic_blocks() const
{
    std::vector<BasicBlock> blocks;
    for (int i = 0; i < size(); ++i)
    {
        if (fused_[i])
            continue;

        BasicBlock block{label(i), {}};
        for (int member : members_[i])
        {
            const auto &names = nodes_[member]->original_names();
            block.nodes.insert(block.nodes.end(), names.begin(), names.end());
        }
        blocks.push_back(std::move(block));
    }
    return blocks;
}

}  // namespace kdet::fusion
