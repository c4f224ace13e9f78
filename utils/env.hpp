// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace kdet
{

// Converts the text of an environment variable. Booleans are integers, "0" being false.
template <typename T>
inline T env_cast(std::string const &value)
{
    if constexpr (std::is_same_v<T, std::string>)
        return value;
    else if constexpr (std::is_same_v<T, bool>)
        return std::strtoll(value.c_str(), nullptr, 10) != 0;
    else if constexpr (std::is_integral_v<T> and std::is_unsigned_v<T>)
        return static_cast<T>(std::strtoull(value.c_str(), nullptr, 10));
    else if constexpr (std::is_integral_v<T>)
        return static_cast<T>(std::strtoll(value.c_str(), nullptr, 10));
    else
        static_assert(sizeof(T) == 0, "No environment conversion for this type");
}

template <typename T>
inline std::optional<T> env_as_optional(char const *env_var)
{
    char const *value = std::getenv(env_var);
    if (value == nullptr)
        return std::nullopt;
    return env_cast<T>(value);
}

template <typename T>
inline T env_as(char const *env_var, T default_value = T{})
{
    return env_as_optional<T>(env_var).value_or(default_value);
}

// KDET_FOO=a,b,c; empty when the variable is unset
template <typename T>
inline std::vector<T> env_as_vector(char const *env_var, std::string const &delimiter = ",")
{
    std::vector<T> values;
    std::optional<std::string> value = env_as_optional<std::string>(env_var);
    if (not value)
        return values;

    std::string::size_type start = 0;
    for (auto end = value->find(delimiter); end != std::string::npos; end = value->find(delimiter, start))
    {
        values.push_back(env_cast<T>(value->substr(start, end - start)));
        start = end + delimiter.size();
    }
    values.push_back(env_cast<T>(value->substr(start)));
    return values;
}

}  // namespace kdet
