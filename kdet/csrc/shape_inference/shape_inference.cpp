// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "shape_inference/shape_inference.hpp"

#include "graph_lib/graph.hpp"
#include "graph_lib/utils.hpp"
#include "utils/env.hpp"
#include "utils/logger.hpp"

namespace kdet::shape_inference
{
using graphlib::Node;

namespace
{
void apply(Node *node, ShapeRuleResult result)
{
    node->set_input_shapes(std::move(result.input_shapes));
    node->set_output_shapes(std::move(result.output_shapes));
}

std::string shapes_to_string(const std::optional<std::vector<Shape>> &shapes)
{
    if (not shapes)
        return "None";
    std::string result = "[";
    for (const Shape &shape : *shapes) result += (result.size() > 1 ? ", " : "") + shape.as_string();
    return result + "]";
}
}  // namespace

ShapeInference::ShapeInference() : patch_hops_(env_as<std::size_t>("KDET_PATCH_HOPS", kDefaultPatchHops)) {}

InferenceReport ShapeInference::run(graphlib::Graph *graph) const
{
    InferenceReport report;
    std::vector<Node *> order = graphlib::topological_sort(*graph);

    // Pass 1
    for (Node *node : order)
    {
        OpKind kind = op_kind_from_string(node->op_type());
        ShapeRule rule = get_shape_rule(kind);
        if (rule == nullptr)
        {
            log_error(LogShapeInference, "{} not supported yet ({})", node->op_type(), node->name());
            report.add(node->name(), DiagnosticKind::Unsupported, node->op_type() + " not supported");
            continue;
        }

        ShapeRuleContext ctx{*graph, node, report, patch_hops_};
        if (std::optional<ShapeRuleResult> result = rule(ctx))
            apply(node, std::move(*result));

        log_debug(
            LogShapeInference,
            "{}: input {} output {}",
            node->name(),
            shapes_to_string(node->input_shapes()),
            shapes_to_string(node->output_shapes()));
    }

    // Pass 2: downstream reshapes now carry their input shapes
    for (Node *node : order)
    {
        if (not is_patched_op(op_kind_from_string(node->op_type())))
            continue;
        apply(node, shape_from_downstream_reshape(*graph, node, patch_hops_));
        log_debug(
            LogShapeInference, "Second pass: {} output {}", node->name(), shapes_to_string(node->output_shapes()));
    }

    std::vector<std::string> unresolved;
    for (Node *node : order)
    {
        if (not node->has_output_shape())
            unresolved.push_back(node->name());
    }
    report.set_unresolved_nodes(std::move(unresolved));

    log_info(
        LogShapeInference,
        "Shape inference on {}: {} nodes, {} diagnostics, {} unresolved",
        graph->name(),
        order.size(),
        report.diagnostics().size(),
        report.unresolved_nodes().size());
    return report;
}

}  // namespace kdet::shape_inference
