// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "graph_lib/defines.hpp"
#include "graph_lib/shape.hpp"
#include "utils/assert.hpp"

namespace kdet {

namespace graphlib {

// Op-specific parameter, as produced by the graph converter
using Attr = std::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    std::vector<std::int64_t>,
    std::vector<double>,
    std::vector<std::string>,
    std::vector<std::vector<std::int64_t>>>;
using Attrs = std::map<std::string, Attr>;

std::string attr_as_string(const Attr& attr);
std::ostream& operator<<(std::ostream& out, const Attr& attr);

// Graph node: one operator of the input model, or a group of them collapsed by template pre-fusion.
class Node {
   private:
    std::string name_;
    NodeId unique_id_ = -1;
    std::string op_type_;
    Attrs attrs_;

    // Unset until shape inference produced a result for this node
    std::optional<std::vector<Shape>> input_shapes_;
    std::optional<std::vector<Shape>> output_shapes_;

    // Names of the ingested nodes this node stands for
    std::vector<std::string> original_names_;

   public:
    Node(std::string name, std::string op_type, Attrs attrs = {}) :
        name_(name), op_type_(std::move(op_type)), attrs_(std::move(attrs)), original_names_{name}
    {
    }

    NodeId id() const { return unique_id_; }
    void set_id(NodeId node_id) { unique_id_ = node_id; }
    const std::string& name() const { return name_; }

    const std::string& op_type() const { return op_type_; }
    void set_op_type(const std::string& op_type) { op_type_ = op_type; }

    const Attrs& attrs() const { return attrs_; }
    bool has_attr(const std::string& name) const { return attrs_.find(name) != attrs_.end(); }
    const Attr& get_attr(const std::string& name) const;
    void set_attr(const std::string& name, Attr attr) { attrs_[name] = std::move(attr); }

    template <typename T>
    bool has_attr_as(const std::string& name) const
    {
        auto it = attrs_.find(name);
        return it != attrs_.end() and std::holds_alternative<T>(it->second);
    }

    template <typename T>
    const T& get_attr_as(const std::string& name) const
    {
        const Attr& attr = get_attr(name);
        KDET_ASSERT(std::holds_alternative<T>(attr), "Attribute has unexpected type", name_, name);
        return std::get<T>(attr);
    }

    const std::optional<std::vector<Shape>>& input_shapes() const { return input_shapes_; }
    const std::optional<std::vector<Shape>>& output_shapes() const { return output_shapes_; }
    void set_input_shapes(std::vector<Shape> shapes) { input_shapes_ = std::move(shapes); }
    void set_output_shapes(std::vector<Shape> shapes) { output_shapes_ = std::move(shapes); }
    void clear_shapes();

    // True once the node has at least one output shape recorded
    bool has_output_shape() const { return output_shapes_.has_value() and not output_shapes_->empty(); }
    const Shape& output_shape(std::size_t index = 0) const;

    const std::vector<std::string>& original_names() const { return original_names_; }
    void set_original_names(std::vector<std::string> names) { original_names_ = std::move(names); }
};

std::ostream& operator<<(std::ostream& out, const Node& node);

}  // namespace graphlib
}  // namespace kdet
