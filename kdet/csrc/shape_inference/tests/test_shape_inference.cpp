// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include <cstdlib>

#include "graph_lib/graph.hpp"
#include "gtest/gtest.h"
#include "shape_inference/shape_inference.hpp"
#include "test/common.hpp"

using namespace kdet;
using namespace kdet::graphlib;
using namespace kdet::shape_inference;

using IntList = std::vector<std::int64_t>;

class ShapeInferenceTest : public test::GraphTest
{
   public:
    InferenceReport infer() { return ShapeInference(kDefaultPatchHops).run(graph.get()); }

    static Attrs conv_attrs(IntList strides, std::string padding, IntList dilations = {1, 1, 1, 1})
    {
        return {{"strides", strides}, {"padding", padding}, {"dilations", dilations}};
    }

    static Attrs pool_attrs(IntList ksize, IntList strides, std::string padding)
    {
        return {{"ksize", ksize}, {"strides", strides}, {"padding", padding}};
    }
};

TEST(PaddingTest, same_padding_covers_input)
{
    for (Dim input : {7, 8, 224})
    {
        for (Dim kernel : {1, 3, 5})
        {
            for (Dim stride : {1, 2, 3})
            {
                auto padded = compute_padded_output(Shape{1, input, input, 3}, kernel, kernel, stride, stride, "SAME");
                ASSERT_TRUE(padded.has_value());
                Dim expected = (input + stride - 1) / stride;
                EXPECT_EQ(padded->height, expected);
                EXPECT_EQ(padded->width, expected);

                Dim total = std::max<Dim>((expected - 1) * stride + kernel - input, 0);
                EXPECT_EQ(padded->pads[0], total / 2);
                EXPECT_EQ(padded->pads[1], total - total / 2);
                EXPECT_EQ(padded->pads[0] + padded->pads[1], total);
            }
        }
    }
}

TEST(PaddingTest, valid_padding_uses_each_spatial_axis)
{
    auto padded = compute_padded_output(Shape{1, 10, 7, 3}, 3, 3, 2, 1, "VALID");
    ASSERT_TRUE(padded.has_value());
    EXPECT_EQ(padded->height, 4);
    EXPECT_EQ(padded->width, 5);
    EXPECT_EQ(padded->pads, (std::vector<Dim>{0, 0, 0, 0}));

    EXPECT_FALSE(compute_padded_output(Shape{1, 10, 7, 3}, 3, 3, 1, 1, "EXPLICIT").has_value());
    EXPECT_FALSE(compute_padded_output(Shape{1, 10, 7, 3}, 3, 3, 0, 1, "SAME").has_value());
}

TEST(OpKindTest, vocabulary)
{
    EXPECT_EQ(op_kind_from_string("FusedBatchNormV3"), OpKind::FusedBatchNorm);
    EXPECT_EQ(op_kind_from_string("DepthwiseConv2dNative"), OpKind::DepthwiseConv2dNative);
    EXPECT_EQ(op_kind_from_string("Softmax"), OpKind::Unsupported);
    EXPECT_TRUE(get_shape_rule(OpKind::Unsupported) == nullptr);
    EXPECT_TRUE(is_patched_op(OpKind::StridedSlice));
}

TEST_F(ShapeInferenceTest, propagation_family)
{
    Node *input = create_placeholder("input", {1, 8, 8, 16});
    Node *bn = add_op("bn", "FusedBatchNormV3", {input, create_const("gamma", {16})});
    Node *bias = add_op("bias", "BiasAdd", {bn, create_const("b", {16})});
    Node *relu = add_op("relu", "Relu6", {bias});
    Node *sigmoid = add_op("sigmoid", "Sigmoid", {relu});

    InferenceReport report = infer();
    EXPECT_TRUE(report.clean());
    for (Node *node : {bn, bias, relu, sigmoid}) EXPECT_EQ(node->output_shape(), Shape({1, 8, 8, 16}));
}

TEST_F(ShapeInferenceTest, broadcast_takes_highest_rank_and_max)
{
    Node *a = create_placeholder("a", {1, 1, 8, 16});
    Node *b = create_placeholder("b", {1, 4, 1, 16});
    Node *c = create_const("c", {16});
    Node *add = add_op("add", "AddV2", {a, b});
    Node *mul = add_op("mul", "Mul", {c, add});
    Node *single = add_op("single", "Add", {a});

    infer();
    EXPECT_EQ(add->output_shape(), Shape({1, 4, 8, 16}));
    EXPECT_EQ(mul->output_shape(), Shape({1, 4, 8, 16}));
    EXPECT_EQ(mul->input_shapes()->size(), 2u);
    EXPECT_EQ(single->output_shape(), Shape({1, 1, 8, 16}));
}

TEST_F(ShapeInferenceTest, conv_same_padding)
{
    Node *input = create_placeholder("input", {1, 224, 224, 3});
    Node *weight = create_const("weight", {3, 3, 3, 32});
    Node *read = add_op("weight/read", "Identity", {weight});
    Node *conv = add_op("conv", "Conv2D", {input, read}, conv_attrs({1, 2, 2, 1}, "SAME"));

    InferenceReport report = infer();
    EXPECT_TRUE(report.clean());
    EXPECT_EQ(conv->output_shape(), Shape({1, 112, 112, 32}));
    EXPECT_EQ(*conv->input_shapes(), (std::vector<Shape>{Shape{1, 224, 224, 3}}));
    EXPECT_EQ(conv->get_attr_as<IntList>("strides"), (IntList{2, 2}));
    EXPECT_EQ(conv->get_attr_as<IntList>("dilations"), (IntList{1, 1}));
    EXPECT_EQ(conv->get_attr_as<IntList>("kernel_shape"), (IntList{3, 3}));
    EXPECT_EQ(conv->get_attr_as<IntList>("weight_shape"), (IntList{3, 3, 3, 32}));
    EXPECT_EQ(conv->get_attr_as<IntList>("pads"), (IntList{0, 1, 0, 1}));
    EXPECT_EQ(read->output_shape(), Shape({3, 3, 3, 32}));
    EXPECT_TRUE(read->input_shapes()->empty());
}

TEST_F(ShapeInferenceTest, dilated_conv_uses_kernel_extent)
{
    Node *input = create_placeholder("input", {1, 32, 32, 8});
    Node *weight = create_const("weight", {3, 3, 8, 8});
    Node *conv = add_op("conv", "Conv2D", {input, weight}, conv_attrs({1, 1, 1, 1}, "VALID", {1, 2, 2, 1}));

    infer();
    // extent = 2 * (3 - 1) + 1 = 5
    EXPECT_EQ(conv->output_shape(), Shape({1, 28, 28, 8}));
}

TEST_F(ShapeInferenceTest, depthwise_conv_takes_input_channels)
{
    Node *input = create_placeholder("input", {1, 56, 56, 64});
    Node *weight = create_const("weight", {3, 3, 64, 1});
    Node *conv = add_op("dw", "DepthwiseConv2dNative", {input, weight}, conv_attrs({1, 1, 1, 1}, "SAME"));

    infer();
    EXPECT_EQ(conv->output_shape(), Shape({1, 56, 56, 64}));
}

TEST_F(ShapeInferenceTest, pooling_keeps_channels)
{
    Node *input = create_placeholder("input", {1, 112, 112, 64});
    Node *max_pool = add_op("max", "MaxPool", {input}, pool_attrs({1, 3, 3, 1}, {1, 2, 2, 1}, "SAME"));
    Node *avg_pool = add_op("avg", "AvgPool", {input}, pool_attrs({1, 2, 2, 1}, {1, 2, 2, 1}, "VALID"));

    infer();
    EXPECT_EQ(max_pool->output_shape(), Shape({1, 56, 56, 64}));
    EXPECT_EQ(max_pool->get_attr_as<IntList>("ksize"), (IntList{3, 3}));
    EXPECT_EQ(avg_pool->output_shape(), Shape({1, 56, 56, 64}));
}

TEST_F(ShapeInferenceTest, invalid_batch_stride_is_rejected)
{
    Node *input = create_placeholder("input", {1, 8, 8, 3});
    Node *weight = create_const("weight", {3, 3, 3, 4});
    Node *conv = add_op("conv", "Conv2D", {input, weight}, conv_attrs({2, 1, 1, 1}, "SAME"));
    Node *relu = add_op("relu", "Relu", {conv});

    InferenceReport report = infer();
    EXPECT_FALSE(conv->has_output_shape());
    EXPECT_TRUE(report.has_diagnostic("conv", DiagnosticKind::MalformedTopology));
    // The consumer fails in turn, but the pass keeps going
    EXPECT_TRUE(report.has_diagnostic("relu", DiagnosticKind::MalformedTopology));
    EXPECT_EQ(report.unresolved_nodes(), (std::vector<std::string>{"conv", "relu"}));
    (void)relu;
}

TEST_F(ShapeInferenceTest, ambiguous_weight_is_malformed)
{
    Node *input = create_placeholder("input", {1, 8, 8, 3});
    Node *conv = add_op(
        "conv",
        "Conv2D",
        {input, create_const("w0", {3, 3, 3, 4}), create_const("w1", {3, 3, 3, 4})},
        conv_attrs({1, 1, 1, 1}, "SAME"));

    InferenceReport report = infer();
    EXPECT_FALSE(conv->has_output_shape());
    EXPECT_EQ(report.count(DiagnosticKind::MalformedTopology), 1u);
}

TEST_F(ShapeInferenceTest, matmul)
{
    Node *input = create_placeholder("input", {1, 1024});
    Node *fc = add_op("fc", "MatMul", {input, create_const("w", {1024, 10})});
    Node *bad = add_op("bad", "MatMul", {input, create_const("w_bad", {512, 10})});

    InferenceReport report = infer();
    EXPECT_EQ(fc->output_shape(), Shape({1, 10}));
    EXPECT_FALSE(bad->has_output_shape());
    EXPECT_TRUE(report.has_diagnostic("bad", DiagnosticKind::ShapeMismatch));
}

TEST_F(ShapeInferenceTest, reduce_removes_axes)
{
    Node *input = create_placeholder("input", {1, 7, 7, 1280});
    Node *mean = add_op("mean", "Mean", {input}, {{"reduction_indices", IntList{2, 1}}});
    Node *gap = add_op("gap", "GlobalAveragePooling2D", {input});

    infer();
    EXPECT_EQ(mean->output_shape(), Shape({1, 1280}));
    EXPECT_EQ(gap->output_shape(), Shape({1, 1280}));
    EXPECT_EQ(input->output_shape(), Shape({1, 7, 7, 1280}));
}

TEST_F(ShapeInferenceTest, reshape_sources)
{
    Node *input = create_placeholder("input", {1, 7, 7, 64});
    Node *by_attr = add_op("by_attr", "Reshape", {input}, {{"shape", IntList{1, 3136}}});
    Node *by_const = add_op("by_const", "Reshape", {input, create_const_payload("target", {1, 49, 64})});
    Node *pack = add_op("pack", "Pack", {}, {{"constant", std::vector<IntList>{{49}, {64}}}});
    Node *by_pack = add_op("by_pack", "Reshape", {input, pack});
    Node *bad = add_op("bad", "Reshape", {input}, {{"shape", IntList{1, 100}}});

    InferenceReport report = infer();
    EXPECT_EQ(by_attr->output_shape(), Shape({1, 3136}));
    EXPECT_EQ(by_const->output_shape(), Shape({1, 49, 64}));
    EXPECT_EQ(by_pack->output_shape(), Shape({1, 49, 64}));
    // Mismatch is reported but the declared shape is still used
    EXPECT_EQ(bad->output_shape(), Shape({1, 100}));
    EXPECT_TRUE(report.has_diagnostic("bad", DiagnosticKind::ShapeMismatch));
}

TEST_F(ShapeInferenceTest, concat_sums_axis)
{
    Node *a = create_placeholder("a", {1, 8, 8, 16});
    Node *b = create_placeholder("b", {1, 8, 8, 32});
    Node *axis = create_const("axis", {});
    Node *concat = add_op("concat", "ConcatV2", {a, b, axis}, {{"axis", IntList{3}}});

    infer();
    EXPECT_EQ(concat->output_shape(), Shape({1, 8, 8, 48}));
    EXPECT_EQ(concat->input_shapes()->size(), 2u);
}

TEST_F(ShapeInferenceTest, split_divides_by_consumers)
{
    Node *input = create_placeholder("input", {1, 8, 8, 99});
    Node *dim = create_const("dim", {});
    Node *split = add_op("split", "Split", {dim, input}, {{"split_dim", IntList{3}}});
    for (int i = 0; i < 4; ++i) add_op("use" + std::to_string(i), "Relu", {split});

    infer();
    ASSERT_EQ(split->output_shapes()->size(), 4u);
    for (const Shape &shape : *split->output_shapes()) EXPECT_EQ(shape, Shape({1, 8, 8, 24}));
    EXPECT_EQ(graph->get_node_by_name("use3")->output_shape(), Shape({1, 8, 8, 24}));
}

TEST_F(ShapeInferenceTest, transpose_permutes)
{
    Node *input = create_placeholder("input", {1, 8, 4, 2});
    Node *transpose = add_op("transpose", "Transpose", {input, create_const_payload("perm", {0, 3, 1, 2})});

    infer();
    EXPECT_EQ(transpose->output_shape(), Shape({1, 2, 8, 4}));
}

TEST_F(ShapeInferenceTest, transpose_negative_axes_count_from_back)
{
    Node *input = create_placeholder("input", {1, 8, 4, 2});
    Node *transpose = add_op("transpose", "Transpose", {input, create_const_payload("perm", {0, -1, 1, 2})});

    InferenceReport report;
    EXPECT_NO_THROW(report = infer());
    EXPECT_EQ(transpose->output_shape(), Shape({1, 2, 8, 4}));
    EXPECT_EQ(report.count(DiagnosticKind::MalformedTopology), 0u);
}

TEST_F(ShapeInferenceTest, bad_permutation_is_malformed)
{
    Node *input = create_placeholder("input", {1, 8, 4, 2});
    Node *short_perm = add_op("short_perm", "Transpose", {input, create_const_payload("p0", {0, 1})});
    Node *repeated = add_op("repeated", "Transpose", {input, create_const_payload("p1", {0, 0, 1, 2})});
    Node *aliased = add_op("aliased", "Transpose", {input, create_const_payload("p2", {3, -1, 1, 2})});
    Node *out_of_range = add_op("out_of_range", "Transpose", {input, create_const_payload("p3", {0, 1, 2, -5})});

    InferenceReport report;
    EXPECT_NO_THROW(report = infer());
    for (Node *node : {short_perm, repeated, aliased, out_of_range})
    {
        EXPECT_FALSE(node->has_output_shape());
        EXPECT_TRUE(report.has_diagnostic(node->name(), DiagnosticKind::MalformedTopology));
    }
}

TEST_F(ShapeInferenceTest, reshape_volume_overflow_is_mismatch)
{
    Dim huge = Dim(1) << 40;
    Node *input = create_placeholder("input", {huge, huge, 4});
    Node *reshape = add_op("reshape", "Reshape", {input}, {{"shape", IntList{huge, 4, huge}}});

    InferenceReport report;
    EXPECT_NO_THROW(report = infer());
    EXPECT_EQ(reshape->output_shape(), Shape({huge, 4, huge}));
    EXPECT_TRUE(report.has_diagnostic("reshape", DiagnosticKind::ShapeMismatch));
}

TEST_F(ShapeInferenceTest, unsupported_op_continues)
{
    Node *input = create_placeholder("input", {1, 10});
    Node *softmax = add_op("softmax", "Softmax", {input});
    Node *other = add_op("other", "Relu", {input});

    InferenceReport report = infer();
    EXPECT_FALSE(softmax->has_output_shape());
    EXPECT_TRUE(report.has_diagnostic("softmax", DiagnosticKind::Unsupported));
    EXPECT_EQ(other->output_shape(), Shape({1, 10}));
}

TEST_F(ShapeInferenceTest, strided_slice_patched_from_downstream_reshape)
{
    Node *input = create_placeholder("input", {1, 4, 4, 8});
    Node *slice = add_op("slice", "StridedSlice", {input});
    Node *pack = add_op("pack", "Pack", {slice}, {{"constant", std::vector<IntList>{{16}, {8}}}});
    Node *reshape = add_op("reshape", "Reshape", {input, pack});

    infer();
    ASSERT_TRUE(reshape->input_shapes().has_value());
    EXPECT_EQ(*slice->output_shapes(), *reshape->input_shapes());
    EXPECT_EQ(*slice->input_shapes(), *reshape->input_shapes());
    EXPECT_EQ(*pack->output_shapes(), *reshape->input_shapes());
}

TEST_F(ShapeInferenceTest, patch_falls_back_to_zeros_beyond_hop_bound)
{
    Node *input = create_placeholder("input", {1, 2, 2, 1});
    std::vector<Node *> chain = {add_op("slice", "StridedSlice", {input})};
    for (int i = 0; i < 4; ++i) chain.push_back(add_op("relu" + std::to_string(i), "Relu", {chain.back()}));
    Node *reshape = add_op("reshape", "Reshape", {input, chain.back()}, {{"shape", IntList{1, 4}}});

    infer();
    EXPECT_EQ(reshape->input_shapes()->at(0), Shape({1, 2, 2, 1}));
    EXPECT_EQ(*chain[0]->output_shapes(), (std::vector<Shape>{Shape{0, 0, 0, 0}}));
    EXPECT_EQ(*chain[0]->input_shapes(), (std::vector<Shape>{Shape{0, 0, 0, 0}}));

    // One more hop reaches the reshape
    ShapeInference(5).run(graph.get());
    EXPECT_EQ(chain[0]->output_shape(), Shape({1, 2, 2, 1}));
}

TEST_F(ShapeInferenceTest, patch_hops_from_environment)
{
    setenv("KDET_PATCH_HOPS", "2", 1);
    EXPECT_EQ(ShapeInference().patch_hops(), 2u);
    unsetenv("KDET_PATCH_HOPS");
    EXPECT_EQ(ShapeInference().patch_hops(), kDefaultPatchHops);
}
