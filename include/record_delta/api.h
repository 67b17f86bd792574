// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Symbol visibility for the compiled part of record_delta.
///
/// The engines are header-only templates; only Schema, SchemaError and the
/// change-list printers live in the library binary and carry RECORD_DELTA_API.
///
/// CMake sets RECORD_DELTA_SHARED on consumers of a shared build and
/// RECORD_DELTA_EXPORTS while compiling the library itself. A static build
/// defines neither.

#pragma once

#if defined(_WIN32)
#  define RECORD_DELTA_SYMBOL_EXPORT __declspec(dllexport)
#  define RECORD_DELTA_SYMBOL_IMPORT __declspec(dllimport)
#elif defined(__GNUC__)
#  define RECORD_DELTA_SYMBOL_EXPORT __attribute__((visibility("default")))
#  define RECORD_DELTA_SYMBOL_IMPORT
#else
#  define RECORD_DELTA_SYMBOL_EXPORT
#  define RECORD_DELTA_SYMBOL_IMPORT
#endif

#if !defined(RECORD_DELTA_SHARED)
#  define RECORD_DELTA_API
#elif defined(RECORD_DELTA_EXPORTS)
#  define RECORD_DELTA_API RECORD_DELTA_SYMBOL_EXPORT
#else
#  define RECORD_DELTA_API RECORD_DELTA_SYMBOL_IMPORT
#endif
