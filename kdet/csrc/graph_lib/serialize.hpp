// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "graph_lib/node.hpp"

namespace kdet::graphlib
{
using json = nlohmann::json;
class Graph;

// Structural IR produced by the graph converter:
//   {name: {"attr": {"name", "type", "attr": {...}, "input_shape"?, "output_shape"?},
//           "inbounds": [...], "outbounds": [...]}}
std::unique_ptr<Graph> graph_from_json(const json& graph_json, const std::string& graph_name = "graph");
std::unique_ptr<Graph> load_graph_from_file(const std::string& filename);

json graph_to_json(const Graph& graph);
void save_graph_to_file(const std::string& filename, const Graph& graph);

bool attr_from_json(const json& value, Attr& attr);
json attr_to_json(const Attr& attr);

}  // namespace kdet::graphlib
