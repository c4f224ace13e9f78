// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace kdet
{
inline void hash_combine(std::size_t& seed, std::size_t value)
{
    seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

// Hash of (producer, consumer) op type pairs
struct StringPairHash
{
    std::size_t operator()(const std::pair<std::string, std::string>& pair) const
    {
        std::size_t seed = 0;
        hash_combine(seed, std::hash<std::string>{}(pair.first));
        hash_combine(seed, std::hash<std::string>{}(pair.second));
        return seed;
    }
};
}  // namespace kdet
