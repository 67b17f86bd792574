// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file record.h
/// @brief Compile-time description of record types.
///
/// A record is a plain aggregate whose members are listed once with the
/// RECORD_DELTA_RECORD macro. The kind of each member is derived from its type:
///
/// | Member type             | Kind          | Delta slot                     |
/// |-------------------------|---------------|--------------------------------|
/// | RecordMap<K, V>         | Map           | DeltaMap<K, V>                 |
/// | another record type     | Record        | std::optional<Delta<V>>        |
/// | anything else (==)      | Scalar        | std::optional<V>               |
///
/// Example:
/// @code
///   namespace game {
///   struct Stats {
///       int32_t level = 0;
///       double experience = 0.0;
///   };
///   RECORD_DELTA_RECORD(Stats,
///       RECORD_DELTA_FIELD(Stats, level),
///       RECORD_DELTA_FIELD(Stats, experience))
///
///   struct Player {
///       std::string name;
///       Stats stats;
///       record_delta::RecordMap<std::string, Stats> skills;
///   };
///   RECORD_DELTA_ROOT(Player,
///       RECORD_DELTA_FIELD(Player, name),
///       RECORD_DELTA_FIELD(Player, stats),
///       RECORD_DELTA_FIELD(Player, skills))
///   } // namespace game
/// @endcode
///
/// The macros must appear in the namespace of the record, after its
/// definition and after the descriptors of the records it contains.

#pragma once

#include <record_delta/record_delta_config.h>
#include <record_delta/concepts.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>

#include <array>
#include <cstddef>
#include <functional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace record_delta {

// ============================================================
// Storage Types
// ============================================================

#if RECORD_DELTA_THREAD_SAFE
using memory_policy = immer::default_memory_policy;
#else
using memory_policy = immer::memory_policy<immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
                                           immer::unsafe_refcount_policy, immer::no_lock_policy>;
#endif

/// Immutable, reference counted holder of a record stored in a RecordMap.
/// Two maps that share a box share the record; identity is observable with
/// shares_storage().
template <typename V>
using RecordBox = immer::box<V, memory_policy>;

/// Map member type: key -> boxed record
template <typename K, typename V>
using RecordMap = immer::map<K, RecordBox<V>, std::hash<K>, std::equal_to<K>, memory_policy>;

/// True when two maps share the same root node (O(1)).
/// Two empty maps always share the canonical empty root.
template <typename K, typename V>
[[nodiscard]] bool shares_storage(const RecordMap<K, V>& a, const RecordMap<K, V>& b) noexcept {
    return a.impl().root == b.impl().root && a.size() == b.size();
}

/// True when two boxes hold the very same record object
template <typename V>
[[nodiscard]] bool shares_storage(const RecordBox<V>& a, const RecordBox<V>& b) noexcept {
    return &a.get() == &b.get();
}

// ============================================================
// Field Descriptors
// ============================================================

enum class FieldKind { Scalar, Record, Map };

namespace detail {

template <typename>
struct member_pointer_traits;

template <typename C, typename T>
struct member_pointer_traits<T C::*> {
    using owner_type = C;
    using value_type = T;
};

} // namespace detail

/// Descriptor of one record member, identified by its member pointer
template <auto Member>
struct Field {
    using owner_type = typename detail::member_pointer_traits<decltype(Member)>::owner_type;
    using value_type = typename detail::member_pointer_traits<decltype(Member)>::value_type;

    static constexpr auto member = Member;

    std::string_view name;

    [[nodiscard]] static constexpr const value_type& get(const owner_type& owner) noexcept {
        return owner.*Member;
    }

    [[nodiscard]] static constexpr value_type& get(owner_type& owner) noexcept {
        return owner.*Member;
    }
};

namespace detail {

template <typename V>
consteval FieldKind classify() {
    if constexpr (RecordMapType<V>) {
        return FieldKind::Map;
    } else if constexpr (Record<V>) {
        return FieldKind::Record;
    } else {
        static_assert(Scalar<V>, "record_delta: scalar members must be copyable and equality comparable");
        return FieldKind::Scalar;
    }
}

} // namespace detail

/// Kind of a Field, computed lazily so that nested records may be described
/// after the record that contains them is declared.
template <typename F>
inline constexpr FieldKind field_kind_v = detail::classify<typename F::value_type>();

// ============================================================
// Record Descriptor
// ============================================================

template <typename T, typename... Fields>
struct RecordDescriptor {
    using record_type = T;
    using fields_type = std::tuple<Fields...>;

    std::string_view name;
    bool is_root = false;
    fields_type fields;
};

template <typename T, typename... Fields>
[[nodiscard]] constexpr RecordDescriptor<T, Fields...> make_descriptor(std::string_view name, bool is_root,
                                                                       Fields... fields) noexcept {
    static_assert((std::is_same_v<typename Fields::owner_type, T> && ...),
                  "record_delta: every field must be a member of the described record");
    return RecordDescriptor<T, Fields...>{name, is_root, std::tuple<Fields...>{fields...}};
}

/// Descriptor of record T
template <Record T>
[[nodiscard]] constexpr auto describe() noexcept {
    return record_delta_describe(record_tag<T>{});
}

template <Record T>
using fields_t = typename decltype(describe<T>())::fields_type;

template <Record T>
inline constexpr std::size_t field_count_v = std::tuple_size_v<fields_t<T>>;

namespace detail {

template <typename T>
inline constexpr bool is_root_v = describe<T>().is_root;

template <typename F, typename Tuple>
struct field_index;

template <typename F, typename... Fs>
struct field_index<F, std::tuple<Fs...>> {
    static constexpr std::size_t value = [] {
        constexpr std::array<bool, sizeof...(Fs)> matches{std::is_same_v<F, Fs>...};
        for (std::size_t i = 0; i < matches.size(); ++i) {
            if (matches[i])
                return i;
        }
        return matches.size();
    }();
};

} // namespace detail

/// Concept for the record marked with RECORD_DELTA_ROOT. Only root records
/// expose the public diff()/merge() entry points.
template <typename T>
concept RootRecord = Record<T> && detail::is_root_v<T>;

/// Position of member pointer Member in the descriptor of T
template <Record T, auto Member>
inline constexpr std::size_t field_index_v = [] {
    constexpr std::size_t index = detail::field_index<Field<Member>, fields_t<T>>::value;
    static_assert(index < field_count_v<T>, "record_delta: member is not listed in the record descriptor");
    return index;
}();

/// Invoke fn(field, std::integral_constant<std::size_t, I>) for every field of T,
/// in declaration order.
template <Record T, typename Fn>
constexpr void for_each_field(Fn&& fn) {
    constexpr auto fields = describe<T>().fields;
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        (fn(std::get<I>(fields), std::integral_constant<std::size_t, I>{}), ...);
    }(std::make_index_sequence<field_count_v<T>>{});
}

} // namespace record_delta

// ============================================================
// Description Macros
// ============================================================

/// Describe one member of Type
#define RECORD_DELTA_FIELD(Type, member) \
    ::record_delta::Field<&Type::member>{#member}

/// Describe a record type. Use in the namespace of Type.
#define RECORD_DELTA_RECORD(Type, ...)                                                    \
    [[maybe_unused]] constexpr auto record_delta_describe(::record_delta::record_tag<Type>) noexcept { \
        return ::record_delta::make_descriptor<Type>(#Type, false __VA_OPT__(,) __VA_ARGS__); \
    }

/// Describe the root record type (the one exposing diff()/merge())
#define RECORD_DELTA_ROOT(Type, ...)                                                      \
    [[maybe_unused]] constexpr auto record_delta_describe(::record_delta::record_tag<Type>) noexcept { \
        return ::record_delta::make_descriptor<Type>(#Type, true __VA_OPT__(,) __VA_ARGS__); \
    }
