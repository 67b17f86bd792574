// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for type constraints in record_delta.
///
/// This file provides concepts for compile-time type checking, enabling:
/// - Better error messages when a record is described incorrectly
/// - Classification of record members (scalar / nested record / map)
/// - Documentation of type requirements
///
/// @note Requires C++20 or later.

#pragma once

#include <record_delta/record_delta_config.h>

#include <immer/box.hpp>
#include <immer/map.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <type_traits>

namespace record_delta {

// ============================================================
// Record Concepts
// ============================================================

/// Tag used to find a record's descriptor through argument-dependent lookup.
/// RECORD_DELTA_RECORD(Type, ...) defines record_delta_describe(record_tag<Type>)
/// in the namespace of Type.
template <typename T>
struct record_tag {
    using type = T;
};

/// Concept for types described with RECORD_DELTA_RECORD / RECORD_DELTA_ROOT.
/// Records must be default constructible: the zero-valued record stands in for
/// map keys that are missing on one side of a diff or merge.
template <typename T>
concept Record = std::is_class_v<T> &&
                 std::default_initializable<T> &&
                 std::copyable<T> &&
                 requires { record_delta_describe(record_tag<T>{}); };

// ============================================================
// Member Concepts
// ============================================================

/// Concept for scalar members: compared with ==, replaced wholesale
template <typename T>
concept Scalar = std::equality_comparable<T> && std::copyable<T>;

/// Concept for keys of record maps (hashed by immer::map)
template <typename K>
concept MapKey = std::equality_comparable<K> && std::copyable<K> && requires(const K& k) {
    { std::hash<K>{}(k) } -> std::convertible_to<std::size_t>;
};

// ============================================================
// Record Map Detection
// ============================================================

namespace detail {

template <typename M>
struct map_traits : std::false_type {};

template <typename K, typename V, typename Hash, typename Equal, typename MemoryPolicy, auto B>
struct map_traits<immer::map<K, immer::box<V, MemoryPolicy>, Hash, Equal, MemoryPolicy, B>> : std::true_type {
    using key_type = K;
    using record_type = V;
};

} // namespace detail

/// Concept for map members: an immer::map from a key to boxed records
template <typename M>
concept RecordMapType = detail::map_traits<M>::value &&
                        MapKey<typename detail::map_traits<M>::key_type> &&
                        Record<typename detail::map_traits<M>::record_type>;

template <RecordMapType M>
using map_key_t = typename detail::map_traits<M>::key_type;

template <RecordMapType M>
using map_record_t = typename detail::map_traits<M>::record_type;

} // namespace record_delta
