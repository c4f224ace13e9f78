// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "graph_lib/shape.hpp"
#include "shape_inference/inference_report.hpp"
#include "shape_inference/op_kind.hpp"

namespace kdet
{
namespace graphlib
{
class Graph;
class Node;
}  // namespace graphlib

namespace shape_inference
{
using graphlib::Dim;
using graphlib::Shape;

struct ShapeRuleResult
{
    std::vector<Shape> input_shapes;
    std::vector<Shape> output_shapes;
};

// Everything a rule may look at. Rules read predecessors through `graph` and may write derived attributes
// back onto `node`.
struct ShapeRuleContext
{
    const graphlib::Graph &graph;
    graphlib::Node *node;
    InferenceReport &report;
    std::size_t patch_hops;

    void malformed(const std::string &message) const;
    void mismatch(const std::string &message) const;
};

// A rule returns std::nullopt when it could not produce shapes; the reason is recorded in the report.
using ShapeRule = std::optional<ShapeRuleResult> (*)(ShapeRuleContext &);

// Returns nullptr for OpKind::Unsupported
ShapeRule get_shape_rule(OpKind kind);

struct PaddedOutput
{
    Dim height;
    Dim width;
    // top, bottom, left, right
    std::vector<Dim> pads;
};

// Output spatial size and padding of a windowed op over an NHWC input. `padding` is "SAME" or "VALID";
// anything else, or a non-positive stride, yields std::nullopt.
std::optional<PaddedOutput> compute_padded_output(
    const Shape &input, Dim kernel_h, Dim kernel_w, Dim stride_h, Dim stride_w, const std::string &padding);

// Effective extent of a dilated kernel
inline Dim dilated_kernel_extent(Dim kernel, Dim dilation) { return dilation * (kernel - 1) + 1; }

// Looks up to `hops` nodes downstream of `node` for a reshape that recorded its input shape, and takes that
// shape as both input and output. Falls back to [0, 0, 0, 0].
ShapeRuleResult shape_from_downstream_reshape(const graphlib::Graph &graph, const graphlib::Node *node, std::size_t hops);

// Rule families
std::optional<ShapeRuleResult> propagate_shape(ShapeRuleContext &ctx);
std::optional<ShapeRuleResult> identity_shape(ShapeRuleContext &ctx);
std::optional<ShapeRuleResult> broadcast_shape(ShapeRuleContext &ctx);
std::optional<ShapeRuleResult> conv_shape(ShapeRuleContext &ctx);
std::optional<ShapeRuleResult> depthwise_conv_shape(ShapeRuleContext &ctx);
std::optional<ShapeRuleResult> pool_shape(ShapeRuleContext &ctx);
std::optional<ShapeRuleResult> matmul_shape(ShapeRuleContext &ctx);
std::optional<ShapeRuleResult> reduce_shape(ShapeRuleContext &ctx);
std::optional<ShapeRuleResult> reshape_shape(ShapeRuleContext &ctx);
std::optional<ShapeRuleResult> concat_shape(ShapeRuleContext &ctx);
std::optional<ShapeRuleResult> split_shape(ShapeRuleContext &ctx);
std::optional<ShapeRuleResult> transpose_shape(ShapeRuleContext &ctx);
std::optional<ShapeRuleResult> const_shape(ShapeRuleContext &ctx);
std::optional<ShapeRuleResult> placeholder_shape(ShapeRuleContext &ctx);
std::optional<ShapeRuleResult> patched_shape(ShapeRuleContext &ctx);

}  // namespace shape_inference
}  // namespace kdet
