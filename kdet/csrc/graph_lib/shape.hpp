// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "graph_lib/defines.hpp"

namespace kdet {

namespace graphlib {

// Ordered tensor dimensions. Declared reshape targets may hold -1, hence the signed type.
class Shape {
private:
    std::vector<Dim> dims_;

public:
    Shape() = default;
    Shape(std::initializer_list<Dim> dims) : dims_(dims) {}
    explicit Shape(std::vector<Dim> dims) : dims_(std::move(dims)) {}

    static Shape create(std::vector<Dim> dims) { return Shape(std::move(dims)); }
    // Placeholder used when a shape cannot be recovered
    static Shape zeros(std::size_t rank) { return Shape(std::vector<Dim>(rank, 0)); }

    std::vector<Dim>::iterator begin() { return dims_.begin(); }
    std::vector<Dim>::iterator end() { return dims_.end(); }
    std::vector<Dim>::const_iterator begin() const { return dims_.begin(); }
    std::vector<Dim>::const_iterator end() const { return dims_.end(); }

    Dim& operator[](int i);
    Dim const& operator[](int i) const;

    bool operator==(const Shape& other) const { return dims_ == other.dims_; }
    bool operator!=(const Shape& other) const { return not(*this == other); }

    bool empty() const { return dims_.empty(); }
    std::size_t size() const { return dims_.size(); }
    int positive_index(int index) const { return (index < 0) ? (index + (int)size()) : index; }
    bool index_in_bounds(int index) const { return positive_index(index) >= 0 and positive_index(index) < (int)size(); }

    // Absolute product of all dims, 1 for a scalar, nullopt when it overflows Dim
    std::optional<Dim> volume() const;

    const std::vector<Dim>& as_vector() const { return dims_; }
    std::string as_string() const;

    // Copy with the dims at the given (non-negative, unique) indices removed
    Shape remove_dims(std::vector<int> indices) const;
    Shape permute(const std::vector<Dim>& perm) const;
};

std::ostream& operator<<(std::ostream& out, const Shape& s);

void to_json(nlohmann::json& j, const Shape& s);
void from_json(const nlohmann::json& j, Shape& s);

} // namespace graphlib
} // namespace kdet
