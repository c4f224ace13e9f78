// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "graph_lib/node.hpp"

#include <sstream>

namespace kdet {
namespace graphlib {

namespace {
template <typename T>
void print_list(std::ostream& out, const std::vector<T>& values)
{
    out << "[";
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (i > 0)
            out << ", ";
        out << values[i];
    }
    out << "]";
}
}  // namespace

std::ostream& operator<<(std::ostream& out, const Attr& attr)
{
    std::visit(
        [&out](const auto& value)
        {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::vector<std::vector<std::int64_t>>>)
            {
                out << "[";
                for (std::size_t i = 0; i < value.size(); ++i)
                {
                    if (i > 0)
                        out << ", ";
                    print_list(out, value[i]);
                }
                out << "]";
            }
            else if constexpr (
                std::is_same_v<T, std::vector<std::int64_t>> or std::is_same_v<T, std::vector<double>> or
                std::is_same_v<T, std::vector<std::string>>)
            {
                print_list(out, value);
            }
            else if constexpr (std::is_same_v<T, bool>)
            {
                out << (value ? "true" : "false");
            }
            else
            {
                out << value;
            }
        },
        attr);
    return out;
}

std::string attr_as_string(const Attr& attr)
{
    std::stringstream ss;
    ss << attr;
    return ss.str();
}

const Attr& Node::get_attr(const std::string& name) const
{
    auto it = attrs_.find(name);
    KDET_ASSERT(it != attrs_.end(), "Node has no such attribute", name_, name);
    return it->second;
}

void Node::clear_shapes()
{
    input_shapes_.reset();
    output_shapes_.reset();
}

const Shape& Node::output_shape(std::size_t index) const
{
    KDET_ASSERT(output_shapes_.has_value() and index < output_shapes_->size(), "Node has no output shape", name_, index);
    return (*output_shapes_)[index];
}

std::ostream& operator<<(std::ostream& out, const Node& node)
{
    out << "Node{" << node.name() << ", id=" << node.id() << ", type=" << node.op_type() << "}";
    return out;
}

}  // namespace graphlib
}  // namespace kdet
