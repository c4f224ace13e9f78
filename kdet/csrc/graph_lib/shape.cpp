// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#include "graph_lib/shape.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include "utils/assert.hpp"

namespace kdet {
namespace graphlib {

Dim& Shape::operator[](int i)
{
    KDET_ASSERT(index_in_bounds(i), "Shape index out of bounds", i, as_string());
    return dims_[positive_index(i)];
}

Dim const& Shape::operator[](int i) const
{
    KDET_ASSERT(index_in_bounds(i), "Shape index out of bounds", i, as_string());
    return dims_[positive_index(i)];
}

std::optional<Dim> Shape::volume() const
{
    Dim v = 1;
    for (Dim d : dims_)
    {
        if (__builtin_mul_overflow(v, std::abs(d), &v))
            return std::nullopt;
    }
    return v;
}

std::string Shape::as_string() const
{
    std::stringstream ss;
    ss << *this;
    return ss.str();
}

Shape Shape::remove_dims(std::vector<int> indices) const
{
    std::sort(indices.begin(), indices.end());
    std::vector<Dim> dims = dims_;

    // Each removal shifts the remaining indices down by one
    int removed = 0;
    for (int index : indices)
    {
        int shifted = index - removed;
        KDET_ASSERT(shifted >= 0 and shifted < (int)dims.size(), "Reduce index out of bounds", index, as_string());
        dims.erase(dims.begin() + shifted);
        removed++;
    }
    return Shape(std::move(dims));
}

Shape Shape::permute(const std::vector<Dim>& perm) const
{
    std::vector<Dim> dims;
    dims.reserve(perm.size());
    for (Dim p : perm)
    {
        KDET_ASSERT(p >= 0 and p < (Dim)size(), "Permutation index out of bounds", p, as_string());
        dims.push_back(dims_[p]);
    }
    return Shape(std::move(dims));
}

std::ostream& operator<<(std::ostream& out, const Shape& s)
{
    out << "[";
    for (std::size_t i = 0; i < s.size(); ++i)
    {
        if (i > 0)
            out << ", ";
        out << s[(int)i];
    }
    out << "]";
    return out;
}

void to_json(nlohmann::json& j, const Shape& s) { j = s.as_vector(); }

void from_json(const nlohmann::json& j, Shape& s) { s = Shape(j.get<std::vector<Dim>>()); }

}  // namespace graphlib
}  // namespace kdet
