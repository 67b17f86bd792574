// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file copy.h
/// @brief Copy engine: fully independent deep copy of a record value.
///
/// Unlike merge(), which shares every untouched map and box with its base,
/// copy() rebuilds every map member from scratch and boxes a recursive copy of
/// every stored record. Use it before handing a value to code that must not
/// share storage with the original (another thread, another allocator, ...).
///
/// @note Empty maps are the exception: all empty immer maps share one
///       canonical empty root, so shares_storage() is true for them.

#pragma once

#include <record_delta/record_delta_config.h>
#include <record_delta/record.h>

#include <type_traits>
#include <utility>

namespace record_delta {

template <Record T>
[[nodiscard]] T copy(const T& value)
{
    T result = value;

    for_each_field<T>([&](const auto& field, auto) {
        using F = std::remove_cvref_t<decltype(field)>;

        if constexpr (field_kind_v<F> == FieldKind::Record) {
            F::get(result) = copy(F::get(value));
        } else if constexpr (field_kind_v<F> == FieldKind::Map) {
            using map_type = typename F::value_type;
            auto fresh = map_type{}.transient();
            for (const auto& entry : F::get(value)) {
                fresh.set(entry.first, typename map_type::mapped_type{copy(entry.second.get())});
            }
            F::get(result) = std::move(fresh).persistent();
        }
    });

    return result;
}

} // namespace record_delta
