// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "shape_inference/op_kind.hpp"

#include <unordered_map>

namespace kdet::shape_inference
{

namespace
{
const std::unordered_map<std::string, OpKind> &op_kind_map()
{
    static const std::unordered_map<std::string, OpKind> map = {
        {"Relu", OpKind::Relu},
        {"Relu6", OpKind::Relu6},
        {"LeakyReLU", OpKind::LeakyReLU},
        {"Sigmoid", OpKind::Sigmoid},
        {"Tanh", OpKind::Tanh},
        {"FusedBatchNorm", OpKind::FusedBatchNorm},
        {"BiasAdd", OpKind::BiasAdd},
        {"Identity", OpKind::Identity},
        {"Add", OpKind::Add},
        {"AddV2", OpKind::AddV2},
        {"Mul", OpKind::Mul},
        {"Conv2D", OpKind::Conv2D},
        {"DepthwiseConv2dNative", OpKind::DepthwiseConv2dNative},
        {"AvgPool", OpKind::AvgPool},
        {"MaxPool", OpKind::MaxPool},
        {"AveragePooling2D", OpKind::AveragePooling2D},
        {"MaxPooling2D", OpKind::MaxPooling2D},
        {"MatMul", OpKind::MatMul},
        {"Mean", OpKind::Mean},
        {"GlobalAveragePooling2D", OpKind::GlobalAveragePooling2D},
        {"GlobalMaxPooling2D", OpKind::GlobalMaxPooling2D},
        {"Reshape", OpKind::Reshape},
        {"Concat", OpKind::Concat},
        {"ConcatV2", OpKind::ConcatV2},
        {"Concatenate", OpKind::Concatenate},
        {"Split", OpKind::Split},
        {"Transpose", OpKind::Transpose},
        {"Const", OpKind::Const},
        {"Placeholder", OpKind::Placeholder},
        {"Pack", OpKind::Pack},
        {"Packed", OpKind::Packed},
        {"StridedSlice", OpKind::StridedSlice},
    };
    return map;
}
}  // namespace

OpKind op_kind_from_string(const std::string &op_type)
{
    // FusedBatchNorm, FusedBatchNormV2, FusedBatchNormV3, ...
    if (op_type.rfind("FusedBatchNorm", 0) == 0)
        return OpKind::FusedBatchNorm;

    auto it = op_kind_map().find(op_type);
    return it == op_kind_map().end() ? OpKind::Unsupported : it->second;
}

std::string op_kind_to_string(OpKind kind)
{
    if (kind == OpKind::Unsupported)
        return "Unsupported";
    for (const auto &[name, k] : op_kind_map())
    {
        if (k == kind)
            return name;
    }
    return "Unsupported";
}

}  // namespace kdet::shape_inference
