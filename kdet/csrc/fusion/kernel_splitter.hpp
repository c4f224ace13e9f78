// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <memory>
#include <vector>

#include "fusion/fusion_aware_graph.hpp"
#include "fusion/fusion_policy.hpp"

namespace kdet
{
namespace graphlib
{
class Graph;
}

namespace fusion
{

// Partitions a graph into basic blocks under a fusion policy.
//
// split() first collapses every fusion-unit occurrence into one node named after its unit, then walks the
// nodes in topological order and greedily merges each block with its fusible consumers. After a successful
// merge the cursor stays put so the grown block is examined again.
//
// KDET_DISABLE_PREFUSION=1 skips the collapse step, KDET_DUMP_BLOCKS=1 logs every emitted block.
class KernelSplitter
{
   public:
    explicit KernelSplitter(const FusionPolicy &policy) : policy_(policy) {}

    // Mutates `graph` through preprocess()
    std::vector<BasicBlock> split(graphlib::Graph *graph) const;

    // Returns the number of fusion-unit occurrences collapsed
    int preprocess(graphlib::Graph *graph) const;

    // Main loop alone, on an already prepared block state
    void fuse(FusionAwareGraph &fag) const;

   private:
    bool fuse_from(FusionAwareGraph &fag, int i) const;

    const FusionPolicy &policy_;
};

// Kernel-level graph: one node per block, labelled with the block's op type. Edges between blocks are kept
// once, edges inside a block are dropped.
std::unique_ptr<graphlib::Graph> collapse_blocks(const graphlib::Graph &graph, const std::vector<BasicBlock> &blocks);

}  // namespace fusion
}  // namespace kdet
