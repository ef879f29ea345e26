// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief Lightweight stderr diagnostics, compiled in when DIFFIT_VERBOSE_LOG is set.

#pragma once

#include <diffit/diffit_config.h>

#include <iostream>
#include <source_location>
#include <string_view>

namespace diffit {

namespace detail {

inline void log_event(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DIFFIT_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_path_event(
    std::string_view func,
    std::string_view path,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DIFFIT_VERBOSE_LOG
    std::cerr << "[" << func << "] path '" << path << "' " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)path;
    (void)message;
    (void)loc;
#endif
}

inline void log_fallback(
    std::string_view strategy,
    std::string_view path,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DIFFIT_VERBOSE_LOG
    std::cerr << "[" << strategy << "] path '" << path << "' falls back to replace: "
              << reason << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)strategy;
    (void)path;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

} // namespace diffit
