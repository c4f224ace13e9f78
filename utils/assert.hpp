// SPDX-FileCopyrightText: © 2024 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cxxabi.h>
#include <execinfo.h>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "utils/env.hpp"

namespace kdet::assert
{

// "binary(_ZN4kdet...+0x1f) [0x...]" -> "kdet::..."; frames without a mangled symbol are returned as is
inline std::string demangle_frame(const char *frame)
{
    char symbol[256] = {0};
    if (std::sscanf(frame, "%*[^(]%*[^_]%255[^)+]", symbol) != 1)
        return frame;

    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(symbol, nullptr, nullptr, &status), &std::free);
    return (status == 0 and demangled) ? std::string(demangled.get()) : std::string(frame);
}

// Call stack of the caller, innermost `skip` frames dropped
inline std::vector<std::string> backtrace(int max_frames, int skip)
{
    std::vector<void *> addresses(max_frames);
    int num_frames = ::backtrace(addresses.data(), max_frames);
    std::unique_ptr<char *, decltype(&std::free)> symbols(
        backtrace_symbols(addresses.data(), num_frames), &std::free);

    std::vector<std::string> frames;
    if (not symbols)
        return frames;
    for (int i = skip; i < num_frames; ++i) frames.push_back(demangle_frame(symbols.get()[i]));
    return frames;
}

inline void append_info(std::ostream &) {}

template <typename T, typename... Ts>
void append_info(std::ostream &os, T const &value, Ts const &...rest)
{
    os << "  " << value << '\n';
    append_info(os, rest...);
}

// Builds the failure report and throws it, or aborts under KDET_ASSERT_ABORT=1
template <typename... Ts>
[[noreturn]] void fail(char const *file, int line, char const *kind, char const *condition, Ts const &...info)
{
    std::ostringstream report;
    report << kind << " @ " << file << ":" << line << ": " << condition << '\n';
    if constexpr (sizeof...(info) > 0)
    {
        report << "info:\n";
        append_info(report, info...);
    }
    report << "backtrace:\n";
    for (const std::string &frame : backtrace(64, 2)) report << " --- " << frame << '\n';

    if (env_as<bool>("KDET_ASSERT_ABORT"))
    {
        std::fputs(report.str().c_str(), stderr);
        std::abort();
    }
    throw std::runtime_error(report.str());
}

}  // namespace kdet::assert

#define KDET_ASSERT(condition, ...)                                                                    \
    __builtin_expect(not(condition), 0)                                                                \
        ? ::kdet::assert::fail(__FILE__, __LINE__, "KDET_ASSERT", #condition, ##__VA_ARGS__) : void()
#define KDET_THROW(...) ::kdet::assert::fail(__FILE__, __LINE__, "KDET_THROW", "kdet::exception", ##__VA_ARGS__)
