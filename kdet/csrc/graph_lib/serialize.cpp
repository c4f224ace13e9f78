// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "graph_lib/serialize.hpp"

#include <algorithm>
#include <fstream>

#include "graph_lib/graph.hpp"
#include "utils/logger.hpp"

namespace kdet::graphlib
{

namespace
{
bool all_of_type(const json& array, json::value_t type)
{
    for (const json& item : array)
    {
        if (item.type() != type)
            return false;
    }
    return true;
}

bool is_integer(const json& value) { return value.is_number_integer(); }

std::vector<Shape> shapes_from_json(const json& value, const std::string& node_name)
{
    if (not value.is_array())
        KDET_THROW("Shape list must be an array", node_name);

    std::vector<Shape> shapes;
    for (const json& shape : value)
    {
        // A bare list of ints is a single shape
        if (is_integer(shape))
            return {value.get<Shape>()};
        shapes.push_back(shape.get<Shape>());
    }
    return shapes;
}

json shapes_to_json(const std::vector<Shape>& shapes)
{
    json result = json::array();
    for (const Shape& shape : shapes) result.push_back(shape);
    return result;
}

std::vector<std::string> names_from_json(const json& node_json, const char* key, const std::string& node_name)
{
    if (not node_json.contains(key))
        return {};
    const json& names = node_json.at(key);
    if (not names.is_array() or not all_of_type(names, json::value_t::string))
        KDET_THROW("Edge list must be an array of node names", node_name, key);
    return names.get<std::vector<std::string>>();
}
}  // namespace

bool attr_from_json(const json& value, Attr& attr)
{
    if (value.is_boolean())
        attr = value.get<bool>();
    else if (value.is_number_integer())
        attr = value.get<std::int64_t>();
    else if (value.is_number_float())
        attr = value.get<double>();
    else if (value.is_string())
        attr = value.get<std::string>();
    else if (value.is_array())
    {
        bool ints = true, numbers = true, strings = true, nested_ints = true;
        for (const json& item : value)
        {
            ints &= item.is_number_integer();
            numbers &= item.is_number();
            strings &= item.is_string();
            nested_ints &= item.is_array() and std::all_of(item.begin(), item.end(), is_integer);
        }

        if (ints)
            attr = value.get<std::vector<std::int64_t>>();
        else if (numbers)
            attr = value.get<std::vector<double>>();
        else if (strings)
            attr = value.get<std::vector<std::string>>();
        else if (nested_ints)
            attr = value.get<std::vector<std::vector<std::int64_t>>>();
        else
            return false;
    }
    else
    {
        return false;
    }
    return true;
}

json attr_to_json(const Attr& attr)
{
    return std::visit([](const auto& value) { return json(value); }, attr);
}

std::unique_ptr<Graph> graph_from_json(const json& graph_json, const std::string& graph_name)
{
    if (not graph_json.is_object())
        KDET_THROW("Graph document must be an object keyed by node name");

    auto graph = std::make_unique<Graph>(graph_name);

    for (const auto& [name, node_json] : graph_json.items())
    {
        if (not node_json.is_object() or not node_json.contains("attr"))
            KDET_THROW("Node entry must be an object with an 'attr' section", name);
        const json& node_attr = node_json.at("attr");
        if (not node_attr.contains("type") or not node_attr.at("type").is_string())
            KDET_THROW("Node has no op type", name);

        Attrs attrs;
        if (node_attr.contains("attr"))
        {
            for (const auto& [attr_name, value] : node_attr.at("attr").items())
            {
                Attr attr;
                if (attr_from_json(value, attr))
                    attrs[attr_name] = std::move(attr);
                else
                    log_warning(LogGraphLib, "Dropping attribute {} of {}: unsupported value type", attr_name, name);
            }
        }

        // The converter stores a Const's payload beside its attributes
        if (node_attr.contains("constant"))
        {
            Attr constant;
            if (attr_from_json(node_attr.at("constant"), constant))
                attrs["constant"] = std::move(constant);
            else
                log_warning(LogGraphLib, "Dropping constant of {}: unsupported value type", name);
        }

        Node* node = graph->add_node(name, node_attr.at("type").get<std::string>(), std::move(attrs));
        if (node_attr.contains("input_shape"))
            node->set_input_shapes(shapes_from_json(node_attr.at("input_shape"), name));
        if (node_attr.contains("output_shape"))
            node->set_output_shapes(shapes_from_json(node_attr.at("output_shape"), name));
    }

    // Inbound order is authoritative. Outbounds only contribute edges the consumer did not list.
    for (const auto& [name, node_json] : graph_json.items())
    {
        Node* node = graph->get_node_by_name(name);
        for (const std::string& producer : names_from_json(node_json, "inbounds", name))
        {
            if (not graph->has_node_with_name(producer))
                KDET_THROW("Inbound references unknown node", name, producer);
            graph->add_edge(graph->get_node_by_name(producer), node);
        }
    }
    for (const auto& [name, node_json] : graph_json.items())
    {
        Node* node = graph->get_node_by_name(name);
        for (const std::string& consumer : names_from_json(node_json, "outbounds", name))
        {
            if (not graph->has_node_with_name(consumer))
                KDET_THROW("Outbound references unknown node", name, consumer);
            Node* user = graph->get_node_by_name(consumer);
            if (not graph->has_edge(node->id(), user->id()))
                graph->add_edge(node, user);
        }
    }

    log_debug(LogGraphLib, "Loaded graph {} with {} nodes", graph_name, graph->num_nodes());
    return graph;
}

std::unique_ptr<Graph> load_graph_from_file(const std::string& filename)
{
    std::ifstream ifile{filename};
    if (not ifile.is_open())
        KDET_THROW("Unable to open graph file", filename);

    json graph_json;
    try
    {
        ifile >> graph_json;
    }
    catch (const json::parse_error& e)
    {
        KDET_THROW("Unable to parse graph file", filename, e.what());
    }
    return graph_from_json(graph_json, filename);
}

json graph_to_json(const Graph& graph)
{
    json result = json::object();
    for (Node* node : graph.nodes())
    {
        json node_attr = {{"name", node->name()}, {"type", node->op_type()}, {"attr", json::object()}};
        for (const auto& [attr_name, value] : node->attrs())
        {
            if (attr_name == "constant")
                node_attr["constant"] = attr_to_json(value);
            else
                node_attr["attr"][attr_name] = attr_to_json(value);
        }
        if (node->input_shapes().has_value())
            node_attr["input_shape"] = shapes_to_json(*node->input_shapes());
        if (node->output_shapes().has_value())
            node_attr["output_shape"] = shapes_to_json(*node->output_shapes());
        if (node->original_names().size() > 1)
            node_attr["fused_nodes"] = node->original_names();

        json inbounds = json::array();
        for (Node* operand : graph.operands(node)) inbounds.push_back(operand->name());
        json outbounds = json::array();
        for (Node* user : graph.users(node)) outbounds.push_back(user->name());

        result[node->name()] = {{"attr", node_attr}, {"inbounds", inbounds}, {"outbounds", outbounds}};
    }
    return result;
}

void save_graph_to_file(const std::string& filename, const Graph& graph)
{
    std::ofstream ofile{filename};
    if (not ofile.is_open())
        KDET_THROW("Unable to open file for writing", filename);
    ofile << graph_to_json(graph).dump(2);
}

}  // namespace kdet::graphlib
