// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>

#include "shape_inference/inference_report.hpp"
#include "shape_inference/shape_rules.hpp"

namespace kdet
{
namespace graphlib
{
class Graph;
}

namespace shape_inference
{

// Nodes a pack/strided-slice may look past when searching for the reshape that fixes its shape
constexpr std::size_t kDefaultPatchHops = 4;

// Annotates every node with input/output shapes.
//
// Pass 1 visits nodes in topological order and dispatches on the op kind. Pass 2 revisits the ops whose
// shape is only known to a downstream reshape. Per-node failures never throw, they are collected in the
// returned report and the node keeps whatever shapes it had.
class ShapeInference
{
   public:
    // KDET_PATCH_HOPS overrides the default hop bound
    ShapeInference();
    explicit ShapeInference(std::size_t patch_hops) : patch_hops_(patch_hops) {}

    InferenceReport run(graphlib::Graph *graph) const;

    std::size_t patch_hops() const { return patch_hops_; }

   private:
    std::size_t patch_hops_;
};

}  // namespace shape_inference
}  // namespace kdet
