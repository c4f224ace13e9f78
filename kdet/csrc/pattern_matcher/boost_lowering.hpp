// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "pattern_matcher/pattern_matcher.hpp"

namespace kdet::pattern_matcher {

// Live nodes in id order, one vertex each. Parallel edges collapse into one.
graph_type convert_graph_to_boost_graph(const graphlib::Graph& graph);

// Template vertices in declaration order. Throws on an edge naming an unknown alias.
graph_type convert_fusion_unit_to_boost_graph(const FusionUnit& unit);

} // namespace kdet::pattern_matcher
