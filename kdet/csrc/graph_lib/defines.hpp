// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <cstdint>

namespace kdet {

namespace graphlib {

// Dimension Index, NHWC layout
constexpr int N = 0;
constexpr int H = 1;
constexpr int W = 2;
constexpr int C = 3;

using NodeId = std::int64_t;
using Dim = std::int64_t;

}  // namespace graphlib
}  // namespace kdet
