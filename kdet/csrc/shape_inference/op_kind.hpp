// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ostream>
#include <string>

namespace kdet::shape_inference
{

// Operator families known to shape inference, in converter (TensorFlow/Keras) spelling
enum class OpKind
{
    // Propagation
    Relu,
    Relu6,
    LeakyReLU,
    Sigmoid,
    Tanh,
    FusedBatchNorm,
    BiasAdd,
    Identity,
    // Elementwise broadcast
    Add,
    AddV2,
    Mul,
    // Windowed
    Conv2D,
    DepthwiseConv2dNative,
    AvgPool,
    MaxPool,
    AveragePooling2D,
    MaxPooling2D,
    MatMul,
    // Reduce
    Mean,
    GlobalAveragePooling2D,
    GlobalMaxPooling2D,
    // Layout
    Reshape,
    Concat,
    ConcatV2,
    Concatenate,
    Split,
    Transpose,
    // Sources
    Const,
    Placeholder,
    // Shaped from a downstream reshape
    Pack,
    Packed,
    StridedSlice,

    Unsupported,
};

OpKind op_kind_from_string(const std::string &op_type);
std::string op_kind_to_string(OpKind kind);

// Ops whose shape is only recoverable from a downstream reshape
inline bool is_patched_op(OpKind kind)
{
    return kind == OpKind::Pack or kind == OpKind::Packed or kind == OpKind::StridedSlice;
}

inline std::ostream &operator<<(std::ostream &os, OpKind kind) { return os << op_kind_to_string(kind); }

}  // namespace kdet::shape_inference
