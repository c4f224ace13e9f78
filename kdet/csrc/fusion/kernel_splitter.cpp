// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "fusion/kernel_splitter.hpp"

#include <unordered_map>
#include <unordered_set>

#include <fmt/format.h>

#include "graph_lib/graph.hpp"
#include "pattern_matcher/pattern_matcher.hpp"
#include "utils/assert.hpp"
#include "utils/env.hpp"
#include "utils/logger.hpp"

namespace kdet::fusion
{

std::vector<BasicBlock> KernelSplitter::split(graphlib::Graph *graph) const
{
    if (env_as<bool>("KDET_DISABLE_PREFUSION"))
        log_info(LogFuser, "Fusion unit pre-fusion disabled");
    else
        preprocess(graph);

    FusionAwareGraph fag(*graph);
    fuse(fag);

    std::vector<BasicBlock> blocks = fag.basic_blocks();
    log_info(LogFuser, "Split {} into {} basic blocks from {} nodes", graph->name(), blocks.size(), fag.size());
    if (env_as<bool>("KDET_DUMP_BLOCKS"))
    {
        for (const BasicBlock &block : blocks)
            log_info(LogFuser, "  {}: {}", block.op_type, fmt::join(block.nodes, ", "));
    }
    return blocks;
}

int KernelSplitter::preprocess(graphlib::Graph *graph) const
{
    std::unordered_set<graphlib::NodeId> used_nodes;
    int num_fused = 0;
    for (const FusionUnit &unit : policy_.fusion_units())
    {
        pattern_matcher::SubgraphPatternMatchMappings matches =
            pattern_matcher::subgraph_pattern_match(unit, *graph, pattern_matcher::op_type_equal, used_nodes);

        for (const pattern_matcher::SubgraphPatternMatch &match : matches)
        {
            graphlib::Node *fused = graph->fuse_nodes(pattern_matcher::get_node_ids(unit, match), unit.name);
            used_nodes.insert(fused->id());
            log_debug(LogFuser, "Pre-fused {} as {}", fused->name(), unit.name);
        }
        num_fused += (int)matches.size();
        if (not matches.empty())
            log_info(LogFuser, "Fusion unit {}: {} occurrences", unit.name, matches.size());
    }
    return num_fused;
}

void KernelSplitter::fuse(FusionAwareGraph &fag) const
{
    log_debug(
        LogFuser,
        "Fusing {} nodes, MON={} RT={}",
        fag.size(),
        static_cast<int>(policy_.flags().multiple_outbound),
        policy_.flags().require_ready);

    // A successful fusion keeps the cursor on the grown block
    for (int i = 0; i < fag.size();)
    {
        if (not fuse_from(fag, i))
            ++i;
    }
}

bool KernelSplitter::fuse_from(FusionAwareGraph &fag, int i) const
{
    if (fag.is_fused(i))
        return false;

    fag.mark_ready(i);
    if (fag.outbounds(i).empty())
        return false;

    const RuleFlags &flags = policy_.flags();
    if (flags.multiple_outbound == MultipleOutboundMode::NoFuse and fag.outbounds(i).size() > 1)
        return false;

    bool preserve = flags.multiple_outbound != MultipleOutboundMode::NoFuse;
    // Every consumer is tested against the block as it was when the scan began
    std::string source_type = fag.type(i);
    std::vector<int> consumers = fag.outbounds(i);

    bool fused = false;
    for (int j : consumers)
    {
        if (fag.is_fused(j))
            continue;
        if (not policy_.is_fusible(source_type, fag.type(j)))
            continue;
        if (flags.require_ready and not fag.is_ready(j))
            continue;

        log_trace(LogFuser, "{} ({}) absorbs {} ({})", i, source_type, j, fag.type(j));
        fag.fuse(i, j, preserve);
        fag.mark_ready(j);
        fused = true;
        if (flags.multiple_outbound != MultipleOutboundMode::FuseAll)
            break;
    }
    return fused;
}

std::unique_ptr<graphlib::Graph> collapse_blocks(const graphlib::Graph &graph, const std::vector<BasicBlock> &blocks)
{
    auto collapsed = std::make_unique<graphlib::Graph>(graph.name());

    std::unordered_map<std::string, graphlib::Node *> block_of_name;
    for (const BasicBlock &block : blocks)
    {
        KDET_ASSERT(not block.nodes.empty(), "Empty basic block", block.op_type);
        std::string name;
        for (const std::string &node : block.nodes) name += (name.empty() ? "" : "+") + node;

        auto node = std::make_unique<graphlib::Node>(name, block.op_type);
        node->set_original_names(block.nodes);
        graphlib::Node *added = collapsed->add_node(std::move(node));
        for (const std::string &node_name : block.nodes)
        {
            bool inserted = block_of_name.emplace(node_name, added).second;
            KDET_ASSERT(inserted, "Node belongs to more than one block", node_name);
        }
    }

    auto block_of = [&block_of_name](const graphlib::Node *node)
    {
        auto it = block_of_name.find(node->original_names().front());
        KDET_ASSERT(it != block_of_name.end(), "Node is not covered by any block", node->name());
        return it->second;
    };

    for (graphlib::Node *node : graph.nodes())
    {
        graphlib::Node *producer = block_of(node);
        for (graphlib::Node *user : graph.users(node))
        {
            graphlib::Node *consumer = block_of(user);
            if (producer != consumer and not collapsed->has_edge(producer->id(), consumer->id()))
                collapsed->add_edge(producer, consumer);
        }
    }
    return collapsed;
}

}  // namespace kdet::fusion
