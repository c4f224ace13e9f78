// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "shape_inference/shape_rules.hpp"

#include <algorithm>
#include <set>

#include "graph_lib/graph.hpp"
#include "graph_lib/utils.hpp"
#include "utils/logger.hpp"

namespace kdet::shape_inference
{
using graphlib::Graph;
using graphlib::Node;

void ShapeRuleContext::malformed(const std::string &message) const
{
    log_warning(LogShapeInference, "Failed to get shape of {}: {}", node->name(), message);
    report.add(node->name(), DiagnosticKind::MalformedTopology, message);
}

void ShapeRuleContext::mismatch(const std::string &message) const
{
    log_warning(LogShapeInference, "Shape mismatch at {}: {}", node->name(), message);
    report.add(node->name(), DiagnosticKind::ShapeMismatch, message);
}

namespace
{
using IntList = std::vector<std::int64_t>;

Dim ceil_div(Dim a, Dim b) { return (a + b - 1) / b; }

std::optional<Shape> operand_shape(ShapeRuleContext &ctx, const Node *operand)
{
    if (operand->has_output_shape())
        return operand->output_shape(0);
    ctx.malformed(fmt::format("predecessor {} has no output shape", operand->name()));
    return std::nullopt;
}

std::optional<Shape> first_operand_shape(ShapeRuleContext &ctx)
{
    std::vector<Node *> operands = ctx.graph.operands(ctx.node);
    if (operands.empty())
    {
        ctx.malformed("no predecessor");
        return std::nullopt;
    }
    return operand_shape(ctx, operands[0]);
}

// Scalar attributes are sometimes stored as one-element lists
std::optional<std::int64_t> first_int_attr(const Node *node, const std::string &name)
{
    if (node->has_attr_as<std::int64_t>(name))
        return node->get_attr_as<std::int64_t>(name);
    if (node->has_attr_as<IntList>(name) and not node->get_attr_as<IntList>(name).empty())
        return node->get_attr_as<IntList>(name)[0];
    return std::nullopt;
}

std::optional<IntList> int_list_attr(const Node *node, const std::string &name)
{
    if (node->has_attr_as<IntList>(name))
        return node->get_attr_as<IntList>(name);
    if (node->has_attr_as<std::int64_t>(name))
        return IntList{node->get_attr_as<std::int64_t>(name)};
    return std::nullopt;
}

// (h, w) of a strides/dilations/ksize attribute. Full NHWC lists must be 1 on the batch and channel axes;
// two-element lists are already spatial.
std::optional<std::pair<Dim, Dim>> spatial_attr(
    ShapeRuleContext &ctx, const std::string &name, std::optional<std::pair<Dim, Dim>> fallback = std::nullopt)
{
    std::optional<IntList> values = int_list_attr(ctx.node, name);
    if (not values)
    {
        if (not fallback)
            ctx.malformed(fmt::format("missing attribute {}", name));
        return fallback;
    }
    if (values->size() == 4)
    {
        if ((*values)[graphlib::N] != 1 or (*values)[graphlib::C] != 1)
        {
            ctx.malformed(fmt::format("invalid {} {}", name, Shape(*values).as_string()));
            return std::nullopt;
        }
        return std::make_pair((*values)[graphlib::H], (*values)[graphlib::W]);
    }
    if (values->size() == 2)
        return std::make_pair((*values)[0], (*values)[1]);

    ctx.malformed(fmt::format("unexpected rank of {}", name));
    return std::nullopt;
}

std::optional<std::string> padding_attr(ShapeRuleContext &ctx)
{
    if (not ctx.node->has_attr_as<std::string>("padding"))
    {
        ctx.malformed("missing attribute padding");
        return std::nullopt;
    }
    return ctx.node->get_attr_as<std::string>("padding");
}

std::optional<Shape> tensor_shape_of(const Node *node, const std::string &attr_name)
{
    if (node->has_attr_as<IntList>(attr_name))
        return Shape(node->get_attr_as<IntList>(attr_name));
    return std::nullopt;
}

struct WeightedOperands
{
    const Node *weight;
    const Node *input;
};

// A weight is a Const predecessor, or a Const feeding an Identity predecessor. Identity predecessors are
// never the data input.
std::optional<WeightedOperands> find_weight_and_input(ShapeRuleContext &ctx)
{
    std::vector<const Node *> weights;
    std::vector<const Node *> inputs;
    for (Node *operand : ctx.graph.operands(ctx.node))
    {
        OpKind kind = op_kind_from_string(operand->op_type());
        if (kind == OpKind::Const)
        {
            weights.push_back(operand);
        }
        else if (kind == OpKind::Identity)
        {
            for (Node *source : ctx.graph.operands(operand))
            {
                if (op_kind_from_string(source->op_type()) == OpKind::Const)
                    weights.push_back(source);
            }
        }
        else
        {
            inputs.push_back(operand);
        }
    }

    if (weights.size() != 1)
    {
        ctx.malformed(fmt::format("expected exactly one weight, found {}", weights.size()));
        return std::nullopt;
    }
    if (inputs.size() != 1)
    {
        ctx.malformed(fmt::format("expected exactly one data input, found {}", inputs.size()));
        return std::nullopt;
    }
    return WeightedOperands{weights[0], inputs[0]};
}

// Target payload of a shape-carrying predecessor: a Const's constant, or [1] followed by a Pack's flattened
// constant
std::optional<IntList> constant_payload(const Node *source, OpKind kind)
{
    IntList payload;
    if (kind == OpKind::Pack)
        payload.push_back(1);

    if (source->has_attr_as<IntList>("constant"))
    {
        const IntList &values = source->get_attr_as<IntList>("constant");
        payload.insert(payload.end(), values.begin(), values.end());
    }
    else if (source->has_attr_as<std::int64_t>("constant"))
    {
        payload.push_back(source->get_attr_as<std::int64_t>("constant"));
    }
    else if (kind == OpKind::Pack and source->has_attr_as<std::vector<IntList>>("constant"))
    {
        for (const IntList &values : source->get_attr_as<std::vector<IntList>>("constant"))
            payload.insert(payload.end(), values.begin(), values.end());
    }
    else
    {
        return std::nullopt;
    }
    return payload;
}

struct PayloadInputs
{
    std::optional<IntList> payload;
    std::optional<Shape> input;
};

// Splits the predecessors of a Reshape/Transpose into the shape payload (Const or Pack) and the data input
std::optional<PayloadInputs> scan_payload_inputs(ShapeRuleContext &ctx)
{
    PayloadInputs result;
    for (Node *operand : ctx.graph.operands(ctx.node))
    {
        OpKind kind = op_kind_from_string(operand->op_type());
        if (kind == OpKind::Const or kind == OpKind::Pack)
        {
            result.payload = constant_payload(operand, kind);
            if (not result.payload)
            {
                ctx.malformed(fmt::format("{} {} carries no constant", operand->op_type(), operand->name()));
                return std::nullopt;
            }
            log_trace(LogShapeInference, "Fetched payload {} from {}", Shape(*result.payload).as_string(), operand->name());
        }
        else
        {
            result.input = operand_shape(ctx, operand);
            if (not result.input)
                return std::nullopt;
        }
    }
    return result;
}

std::optional<ShapeRuleResult> windowed_result(
    ShapeRuleContext &ctx,
    const Shape &input,
    Dim kernel_h,
    Dim kernel_w,
    std::pair<Dim, Dim> strides,
    const std::string &padding,
    Dim channels)
{
    std::optional<PaddedOutput> padded =
        compute_padded_output(input, kernel_h, kernel_w, strides.first, strides.second, padding);
    if (not padded)
    {
        ctx.malformed(fmt::format("unexpected padding {} or strides", padding));
        return std::nullopt;
    }

    ctx.node->set_attr("strides", IntList{strides.first, strides.second});
    ctx.node->set_attr("pads", padded->pads);
    return ShapeRuleResult{{input}, {Shape{input[graphlib::N], padded->height, padded->width, channels}}};
}

std::optional<ShapeRuleResult> conv_shape_impl(ShapeRuleContext &ctx, bool depthwise)
{
    std::optional<WeightedOperands> operands = find_weight_and_input(ctx);
    if (not operands)
        return std::nullopt;

    std::optional<Shape> weight_shape = tensor_shape_of(operands->weight, "tensor_shape");
    if (not weight_shape or weight_shape->size() != 4)
    {
        ctx.malformed(fmt::format("failed to parse weight shape of {}", operands->weight->name()));
        return std::nullopt;
    }

    std::optional<Shape> input = operand_shape(ctx, operands->input);
    if (not input)
        return std::nullopt;
    if (input->size() != 4)
    {
        ctx.malformed(fmt::format("expected NHWC input, got {}", input->as_string()));
        return std::nullopt;
    }

    auto strides = spatial_attr(ctx, "strides");
    if (not strides)
        return std::nullopt;
    auto dilations = spatial_attr(ctx, "dilations", std::make_pair(Dim(1), Dim(1)));
    if (not dilations)
        return std::nullopt;
    auto padding = padding_attr(ctx);
    if (not padding)
        return std::nullopt;

    const Shape &weight = *weight_shape;
    Dim extent_h = dilated_kernel_extent(weight[0], dilations->first);
    Dim extent_w = dilated_kernel_extent(weight[1], dilations->second);
    Dim channels = depthwise ? weight[2] : weight[3];

    auto result = windowed_result(ctx, *input, extent_h, extent_w, *strides, *padding, channels);
    if (result)
    {
        ctx.node->set_attr("kernel_shape", IntList{weight[0], weight[1]});
        ctx.node->set_attr("dilations", IntList{dilations->first, dilations->second});
        ctx.node->set_attr("weight_shape", weight.as_vector());
    }
    return result;
}
}  // namespace

std::optional<PaddedOutput> compute_padded_output(
    const Shape &input, Dim kernel_h, Dim kernel_w, Dim stride_h, Dim stride_w, const std::string &padding)
{
    if (stride_h <= 0 or stride_w <= 0 or input.size() != 4)
        return std::nullopt;

    Dim in_h = input[graphlib::H];
    Dim in_w = input[graphlib::W];
    if (padding == "SAME")
    {
        Dim out_h = ceil_div(in_h, stride_h);
        Dim out_w = ceil_div(in_w, stride_w);
        Dim pad_h = std::max<Dim>((out_h - 1) * stride_h + kernel_h - in_h, 0);
        Dim pad_w = std::max<Dim>((out_w - 1) * stride_w + kernel_w - in_w, 0);
        return PaddedOutput{out_h, out_w, {pad_h / 2, pad_h - pad_h / 2, pad_w / 2, pad_w - pad_w / 2}};
    }
    if (padding == "VALID")
    {
        Dim out_h = std::max<Dim>(ceil_div(in_h - kernel_h + 1, stride_h), 0);
        Dim out_w = std::max<Dim>(ceil_div(in_w - kernel_w + 1, stride_w), 0);
        return PaddedOutput{out_h, out_w, {0, 0, 0, 0}};
    }
    return std::nullopt;
}

ShapeRuleResult shape_from_downstream_reshape(const Graph &graph, const Node *node, std::size_t hops)
{
    for (Node *candidate : graphlib::forward_sequence(graph, node, hops + 1))
    {
        if (op_kind_from_string(candidate->op_type()) != OpKind::Reshape)
            continue;
        const auto &recorded = candidate->input_shapes();
        if (recorded.has_value() and not recorded->empty())
        {
            log_trace(LogShapeInference, "{} takes shape from downstream {}", node->name(), candidate->name());
            return ShapeRuleResult{*recorded, *recorded};
        }
    }
    return ShapeRuleResult{{Shape::zeros(4)}, {Shape::zeros(4)}};
}

std::optional<ShapeRuleResult> propagate_shape(ShapeRuleContext &ctx)
{
    std::optional<Shape> input = first_operand_shape(ctx);
    if (not input)
        return std::nullopt;
    return ShapeRuleResult{{*input}, {*input}};
}

std::optional<ShapeRuleResult> identity_shape(ShapeRuleContext &ctx)
{
    std::optional<Shape> input = first_operand_shape(ctx);
    if (not input)
        return std::nullopt;
    return ShapeRuleResult{{}, {*input}};
}

std::optional<ShapeRuleResult> broadcast_shape(ShapeRuleContext &ctx)
{
    std::vector<Node *> operands = ctx.graph.operands(ctx.node);
    if (operands.size() < 2)
    {
        log_warning(LogShapeInference, "Invalid input op num for broadcast op {}", ctx.node->name());
        if (operands.empty())
        {
            ctx.malformed("no predecessor");
            return std::nullopt;
        }
    }

    std::vector<Shape> inputs;
    Shape target;
    bool have_target = false;
    for (Node *operand : operands)
    {
        std::optional<Shape> shape = operand_shape(ctx, operand);
        if (not shape)
            return std::nullopt;
        inputs.push_back(*shape);

        if (not have_target or shape->size() > target.size())
        {
            target = *shape;
            have_target = true;
        }
        else if (shape->size() == target.size())
        {
            for (int i = 0; i < (int)target.size(); ++i) target[i] = std::max(target[i], (*shape)[i]);
        }
    }
    return ShapeRuleResult{inputs, {target}};
}

std::optional<ShapeRuleResult> conv_shape(ShapeRuleContext &ctx) { return conv_shape_impl(ctx, false); }

std::optional<ShapeRuleResult> depthwise_conv_shape(ShapeRuleContext &ctx) { return conv_shape_impl(ctx, true); }

std::optional<ShapeRuleResult> pool_shape(ShapeRuleContext &ctx)
{
    if (ctx.graph.num_operands(ctx.node) != 1)
    {
        ctx.malformed("expected exactly one predecessor");
        return std::nullopt;
    }
    std::optional<Shape> input = first_operand_shape(ctx);
    if (not input)
        return std::nullopt;
    if (input->size() != 4)
    {
        ctx.malformed(fmt::format("expected NHWC input, got {}", input->as_string()));
        return std::nullopt;
    }

    auto ksize = spatial_attr(ctx, "ksize");
    if (not ksize)
        return std::nullopt;
    auto strides = spatial_attr(ctx, "strides");
    if (not strides)
        return std::nullopt;
    auto padding = padding_attr(ctx);
    if (not padding)
        return std::nullopt;

    auto result = windowed_result(ctx, *input, ksize->first, ksize->second, *strides, *padding, (*input)[graphlib::C]);
    if (result)
        ctx.node->set_attr("ksize", IntList{ksize->first, ksize->second});
    return result;
}

std::optional<ShapeRuleResult> matmul_shape(ShapeRuleContext &ctx)
{
    std::optional<WeightedOperands> operands = find_weight_and_input(ctx);
    if (not operands)
        return std::nullopt;

    std::optional<Shape> weight = tensor_shape_of(operands->weight, "tensor_shape");
    if (not weight or weight->size() != 2)
    {
        ctx.malformed(fmt::format("failed to parse weight shape of {}", operands->weight->name()));
        return std::nullopt;
    }

    std::optional<Shape> input = operand_shape(ctx, operands->input);
    if (not input)
        return std::nullopt;
    if (input->size() < 2)
    {
        ctx.malformed(fmt::format("expected a [batch, features] input, got {}", input->as_string()));
        return std::nullopt;
    }

    if ((*weight)[0] != (*input)[1])
    {
        ctx.mismatch(fmt::format("weight {} does not match input {}", weight->as_string(), input->as_string()));
        return std::nullopt;
    }

    Shape output = *input;
    output[1] = (*weight)[1];
    return ShapeRuleResult{{*input}, {output}};
}

std::optional<ShapeRuleResult> reduce_shape(ShapeRuleContext &ctx)
{
    std::optional<Shape> input = first_operand_shape(ctx);
    if (not input)
        return std::nullopt;

    // Global pooling carries no explicit axes and reduces the spatial ones
    IntList axes = int_list_attr(ctx.node, "reduction_indices").value_or(IntList{graphlib::H, graphlib::W});

    std::set<int> positive_axes;
    for (std::int64_t axis : axes)
    {
        if (not input->index_in_bounds((int)axis))
        {
            ctx.malformed(fmt::format("reduction axis {} out of range for {}", axis, input->as_string()));
            return std::nullopt;
        }
        positive_axes.insert(input->positive_index((int)axis));
    }

    Shape output = input->remove_dims(std::vector<int>(positive_axes.begin(), positive_axes.end()));
    return ShapeRuleResult{{*input}, {output}};
}

std::optional<ShapeRuleResult> reshape_shape(ShapeRuleContext &ctx)
{
    std::optional<Shape> input;
    std::optional<IntList> target;
    if (ctx.node->has_attr_as<IntList>("shape"))
    {
        input = first_operand_shape(ctx);
        if (not input)
            return std::nullopt;
        target = ctx.node->get_attr_as<IntList>("shape");
    }
    else
    {
        std::optional<PayloadInputs> scanned = scan_payload_inputs(ctx);
        if (not scanned)
            return std::nullopt;
        input = scanned->input;
        target = scanned->payload;
    }

    if (not input or not target)
    {
        ctx.malformed(not input ? "no data input" : "no target shape");
        return std::nullopt;
    }

    Shape output(*target);
    std::optional<Dim> input_volume = input->volume();
    std::optional<Dim> output_volume = output.volume();
    if (not input_volume or not output_volume)
        ctx.mismatch(fmt::format("volume of {} or {} overflows", input->as_string(), output.as_string()));
    else if (*input_volume != *output_volume)
        ctx.mismatch(fmt::format("input {} and output {} differ in volume", input->as_string(), output.as_string()));
    return ShapeRuleResult{{*input}, {output}};
}

std::optional<ShapeRuleResult> concat_shape(ShapeRuleContext &ctx)
{
    std::vector<Shape> inputs;
    for (Node *operand : ctx.graph.operands(ctx.node))
    {
        std::optional<Shape> shape = operand_shape(ctx, operand);
        if (not shape)
            return std::nullopt;
        // Scalar axis operands
        if (not shape->empty())
            inputs.push_back(*shape);
    }
    if (inputs.empty())
    {
        ctx.malformed("no non-scalar input");
        return std::nullopt;
    }

    std::optional<std::int64_t> axis = first_int_attr(ctx.node, "axis");
    if (not axis or not inputs[0].index_in_bounds((int)*axis))
    {
        ctx.malformed("missing or out of range axis");
        return std::nullopt;
    }

    Shape output = inputs[0];
    for (std::size_t i = 1; i < inputs.size(); ++i)
    {
        if (inputs[i].size() != output.size())
        {
            ctx.malformed(fmt::format("rank of {} differs from {}", inputs[i].as_string(), output.as_string()));
            return std::nullopt;
        }
        output[(int)*axis] += inputs[i][(int)*axis];
    }
    return ShapeRuleResult{inputs, {output}};
}

std::optional<ShapeRuleResult> split_shape(ShapeRuleContext &ctx)
{
    std::optional<Shape> input;
    for (Node *operand : ctx.graph.operands(ctx.node))
    {
        OpKind kind = op_kind_from_string(operand->op_type());
        if (kind == OpKind::Const or kind == OpKind::Pack)
            continue;
        input = operand_shape(ctx, operand);
        if (not input)
            return std::nullopt;
    }
    if (not input)
    {
        ctx.malformed("no data input");
        return std::nullopt;
    }

    std::optional<std::int64_t> split_dim = first_int_attr(ctx.node, "split_dim");
    if (not split_dim or not input->index_in_bounds((int)*split_dim))
    {
        ctx.malformed("missing or out of range split_dim");
        return std::nullopt;
    }

    int consumers = ctx.graph.num_users(ctx.node);
    if (consumers == 0)
    {
        ctx.malformed("split has no consumers");
        return std::nullopt;
    }

    Shape output = *input;
    output[(int)*split_dim] = output[(int)*split_dim] / consumers;
    log_trace(LogShapeInference, "Split {} along {} into {}", ctx.node->name(), *split_dim, consumers);
    return ShapeRuleResult{{*input}, std::vector<Shape>(consumers, output)};
}

std::optional<ShapeRuleResult> transpose_shape(ShapeRuleContext &ctx)
{
    std::optional<PayloadInputs> scanned = scan_payload_inputs(ctx);
    if (not scanned)
        return std::nullopt;
    if (not scanned->input or not scanned->payload)
    {
        ctx.malformed(not scanned->input ? "no data input" : "no permutation");
        return std::nullopt;
    }

    const Shape &input = *scanned->input;
    if (scanned->payload->size() != input.size())
    {
        ctx.malformed(fmt::format(
            "permutation of length {} does not match rank of {}", scanned->payload->size(), input.as_string()));
        return std::nullopt;
    }

    // Negative axes count from the back
    std::vector<std::int64_t> perm;
    std::vector<bool> seen(input.size(), false);
    for (std::int64_t index : *scanned->payload)
    {
        if (not input.index_in_bounds((int)index))
        {
            ctx.malformed(fmt::format("permutation index {} out of range for {}", index, input.as_string()));
            return std::nullopt;
        }
        int axis = input.positive_index((int)index);
        if (seen[axis])
        {
            ctx.malformed(fmt::format("axis {} repeated in permutation", axis));
            return std::nullopt;
        }
        seen[axis] = true;
        perm.push_back(axis);
    }
    return ShapeRuleResult{{input}, {input.permute(perm)}};
}

std::optional<ShapeRuleResult> const_shape(ShapeRuleContext &ctx)
{
    std::optional<Shape> shape = tensor_shape_of(ctx.node, "tensor_shape");
    if (not shape)
    {
        ctx.malformed("missing attribute tensor_shape");
        return std::nullopt;
    }
    return ShapeRuleResult{{}, {*shape}};
}

std::optional<ShapeRuleResult> placeholder_shape(ShapeRuleContext &ctx)
{
    std::optional<Shape> shape = tensor_shape_of(ctx.node, "shape");
    if (not shape)
    {
        ctx.malformed("missing attribute shape");
        return std::nullopt;
    }
    return ShapeRuleResult{{}, {*shape}};
}

std::optional<ShapeRuleResult> patched_shape(ShapeRuleContext &ctx)
{
    return shape_from_downstream_reshape(ctx.graph, ctx.node, ctx.patch_hops);
}

ShapeRule get_shape_rule(OpKind kind)
{
    switch (kind)
    {
        case OpKind::Relu:
        case OpKind::Relu6:
        case OpKind::LeakyReLU:
        case OpKind::Sigmoid:
        case OpKind::Tanh:
        case OpKind::FusedBatchNorm:
        case OpKind::BiasAdd: return propagate_shape;
        case OpKind::Identity: return identity_shape;
        case OpKind::Add:
        case OpKind::AddV2:
        case OpKind::Mul: return broadcast_shape;
        case OpKind::Conv2D: return conv_shape;
        case OpKind::DepthwiseConv2dNative: return depthwise_conv_shape;
        case OpKind::AvgPool:
        case OpKind::MaxPool:
        case OpKind::AveragePooling2D:
        case OpKind::MaxPooling2D: return pool_shape;
        case OpKind::MatMul: return matmul_shape;
        case OpKind::Mean:
        case OpKind::GlobalAveragePooling2D:
        case OpKind::GlobalMaxPooling2D: return reduce_shape;
        case OpKind::Reshape: return reshape_shape;
        case OpKind::Concat:
        case OpKind::ConcatV2:
        case OpKind::Concatenate: return concat_shape;
        case OpKind::Split: return split_shape;
        case OpKind::Transpose: return transpose_shape;
        case OpKind::Const: return const_shape;
        case OpKind::Placeholder: return placeholder_shape;
        case OpKind::Pack:
        case OpKind::Packed:
        case OpKind::StridedSlice: return patched_shape;
        case OpKind::Unsupported: return nullptr;
    }
    return nullptr;
}

}  // namespace kdet::shape_inference
