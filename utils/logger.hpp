// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "fmt/chrono.h"
#include "fmt/color.h"
#include "fmt/core.h"
#include "fmt/ostream.h"
#include "fmt/ranges.h"
#include "utils/env.hpp"

namespace kdet
{

#define KDET_LOG_TYPES \
    X(Always)          \
    X(Test)            \
    X(GraphLib)        \
    X(ShapeInference)  \
    X(PatternMatcher)  \
    X(FusionPolicy)    \
    X(Fuser)           \
    X(RuleTester)

enum LogType : std::uint32_t
{
// clang-format off
#define X(a) Log ## a,
    KDET_LOG_TYPES
#undef X
    LogType_Count,
    // clang-format on
};
static_assert(LogType_Count < 64, "Exceeded number of log types");

// Process-wide log sink configured from the environment:
//   LOGGER_LEVEL  minimum level (TRACE, DEBUG, INFO, WARNING, ERROR), INFO by default
//   LOGGER_TYPES  comma separated LogType names without the "Log" prefix, or "All"
//   LOGGER_FILE   write to this file instead of stdout
#pragma GCC visibility push(hidden)
class Logger
{
   public:
    enum class Level : int
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
    };

    static Logger &get()
    {
        static Logger logger;
        return logger;
    }

    bool enabled(Level level, LogType type) const
    {
        return level >= min_level_ and (type_mask_ & (std::uint64_t(1) << type)) != 0;
    }
    bool trace_enabled() const { return min_level_ <= Level::Trace; }
    bool debug_enabled() const { return min_level_ <= Level::Debug; }

    template <typename... Args>
    void log(Level level, LogType type, char const *format, Args &&...args)
    {
        if (not enabled(level, type))
            return;

        const LevelStyle &style = kLevelStyles[static_cast<int>(level)];
        fmt::print(
            *out_,
            "{} | {} | {} - ",
            fmt::format(fmt::fg(fmt::terminal_color::green), "{:%F %T}", std::chrono::system_clock::now()),
            fmt::format(fmt::fg(style.color) | fmt::emphasis::bold, "{:8}", style.name),
            fmt::format(fmt::fg(fmt::terminal_color::cyan), "{:15}", kTypeNames[type]));
        fmt::print(*out_, fmt::runtime(format), std::forward<Args>(args)...);
        *out_ << std::endl;
    }

   private:
    struct LevelStyle
    {
        char const *name;
        fmt::color color;
    };

    static constexpr std::array<LevelStyle, 5> kLevelStyles = {{
        {"TRACE", fmt::color::cornflower_blue},
        {"DEBUG", fmt::color::cornflower_blue},
        {"INFO", fmt::color::orange_red},
        {"WARNING", fmt::color::orange},
        {"ERROR", fmt::color::red},
    }};

    static constexpr std::array<char const *, LogType_Count> kTypeNames = {
    // clang-format off
#define X(a) #a,
        KDET_LOG_TYPES
#undef X
        // clang-format on
    };

    Logger()
    {
        if (auto level = env_as_optional<std::string>("LOGGER_LEVEL"))
            min_level_ = parse_level(*level, min_level_);

        std::vector<std::string> types = env_as_vector<std::string>("LOGGER_TYPES");
        if (not types.empty() and std::find(types.begin(), types.end(), "All") == types.end())
        {
            type_mask_ = std::uint64_t(1) << LogAlways;
            for (std::size_t i = 0; i < kTypeNames.size(); ++i)
            {
                if (std::find(types.begin(), types.end(), kTypeNames[i]) != types.end())
                    type_mask_ |= std::uint64_t(1) << i;
            }
        }

        if (auto file = env_as_optional<std::string>("LOGGER_FILE"))
        {
            file_.open(*file);
            if (file_.is_open())
                out_ = &file_;
        }
    }

    static Level parse_level(std::string name, Level fallback)
    {
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::toupper(c); });
        for (std::size_t i = 0; i < kLevelStyles.size(); ++i)
        {
            if (name == kLevelStyles[i].name)
                return static_cast<Level>(i);
        }
        return fallback;
    }

    std::ofstream file_;
    std::ostream *out_ = &std::cout;
    std::uint64_t type_mask_ = ~std::uint64_t(0);
    Level min_level_ = Level::Info;
};
#pragma GCC visibility pop

#ifdef DEBUG
#define log_trace(log_type, format, ...)       \
    if (::kdet::Logger::get().trace_enabled()) \
    ::kdet::Logger::get().log(                 \
        ::kdet::Logger::Level::Trace, log_type, "{}:{} - " format, __FILE__, __LINE__, ##__VA_ARGS__)

#define log_debug(log_type, ...)               \
    if (::kdet::Logger::get().debug_enabled()) \
    ::kdet::Logger::get().log(::kdet::Logger::Level::Debug, log_type, __VA_ARGS__)
#else
template <typename... Args>
static void log_debug(Args &&...)
{
}
template <typename... Args>
static void log_trace(Args &&...)
{
}
#endif

template <typename... Args>
static void log_info(LogType type, char const *format, Args &&...args)
{
    Logger::get().log(Logger::Level::Info, type, format, std::forward<Args>(args)...);
}

template <typename... Args>
static void log_warning(LogType type, char const *format, Args &&...args)
{
    Logger::get().log(Logger::Level::Warning, type, format, std::forward<Args>(args)...);
}

template <typename... Args>
static void log_error(LogType type, char const *format, Args &&...args)
{
    Logger::get().log(Logger::Level::Error, type, format, std::forward<Args>(args)...);
}

#undef KDET_LOG_TYPES

}  // namespace kdet
