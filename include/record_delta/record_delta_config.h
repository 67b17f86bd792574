// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file record_delta_config.h
/// @brief Centralized configuration for record_delta and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by record_delta:
///   - immer: persistent maps and boxes backing record map fields
///   - lager: store integration (lager_adapters.h)
///
/// It MUST be included before any immer header so that every translation unit
/// agrees on the memory policy of RecordMap. All record_delta public headers
/// include it first.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(RECORD_DELTA_CONFIGURED)
#error "immer headers were included before record_delta/record_delta_config.h. " \
       "Please include record_delta headers before any direct immer includes."
#endif

#define RECORD_DELTA_CONFIGURED 1

// ============================================================
// Thread Safety
// ============================================================

/// @brief Memory policy of RecordMap storage
///
/// 1 (default): immer::default_memory_policy, atomic reference counts.
///              Values produced by merge() share storage with their base and
///              may be read from several threads at once.
/// 0:           unsafe free-list heap and non-atomic reference counts.
///              Only valid when every value stays on one thread.
#ifndef RECORD_DELTA_THREAD_SAFE
#define RECORD_DELTA_THREAD_SAFE 1
#endif

// ============================================================
// Verbose Logging
// ============================================================

/// @brief Diagnostic output to stderr (schema validation, adapters)
///
/// Enabled in debug builds, disabled when NDEBUG is defined.
///   #define RECORD_DELTA_VERBOSE_LOG 0   // force off
///   #define RECORD_DELTA_VERBOSE_LOG 1   // force on
#ifndef RECORD_DELTA_VERBOSE_LOG
#  if defined(NDEBUG)
#    define RECORD_DELTA_VERBOSE_LOG 0
#  else
#    define RECORD_DELTA_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Immer Settings
// ============================================================

/// @brief Disable tagged node assertions (smaller nodes)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

/// @brief Don't throw on invalid state (use assertions instead)
#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

#if !RECORD_DELTA_THREAD_SAFE && !defined(IMMER_NO_THREAD_SAFETY)
#define IMMER_NO_THREAD_SAFETY 1
#endif

// ============================================================
// Lager Library Configuration
// ============================================================

/// @brief Disable store dependency SFINAE checks (faster compilation)
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef RECORD_DELTA_CONFIG_VERBOSE
#if RECORD_DELTA_THREAD_SAFE
#pragma message("record_delta: Thread safety ENABLED (atomic refcounts)")
#else
#pragma message("record_delta: Thread safety DISABLED (optimized for single-thread)")
#endif

#if RECORD_DELTA_VERBOSE_LOG
#pragma message("record_delta: Verbose logging ENABLED")
#endif
#endif // RECORD_DELTA_CONFIG_VERBOSE
