// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file logging.h
/// @brief Diagnostic output helpers.
///
/// Messages are written to stderr as one line:
///   [Component] message (called from file:line)
/// and compile to nothing when RECORD_DELTA_VERBOSE_LOG is 0.

#pragma once

#include <record_delta/record_delta_config.h>

#include <iostream>
#include <new>
#include <source_location>
#include <string>
#include <string_view>

namespace record_delta {
namespace detail {

inline void log_message(
    std::string_view component,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if RECORD_DELTA_VERBOSE_LOG
    std::cerr << "[" << component << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)component;
    (void)message;
    (void)loc;
#endif
}

inline void log_record_error(
    std::string_view component,
    std::string_view record,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if RECORD_DELTA_VERBOSE_LOG
    try {
        std::string message = "record '";
        message += record;
        message += "' ";
        message += reason;
        log_message(component, message, loc);
    } catch (const std::bad_alloc&) {
        log_message(component, reason, loc);
    }
#else
    (void)component;
    (void)record;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail
} // namespace record_delta
