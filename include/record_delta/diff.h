// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff.h
/// @brief Diff engine: minimal delta between two values of a record type.
///
/// diff(old, new) returns std::nullopt when nothing changed, at every nesting
/// level, so "did anything change" is a single has_value() test.
///
/// Per member:
///   - Scalar: slot = new value when old != new
///   - Record: slot = diff(old.member, new.member) (may be absent)
///   - Map:    every key of new is diffed against its old record, or against
///             the zero-valued record when the key is new; only non-empty
///             results are kept, except that a new key equal to the zero-valued
///             record gets an explicit-empty delta. Keys only present in old get
///             the removal marker.

#pragma once

#include <record_delta/record_delta_config.h>
#include <record_delta/delta.h>
#include <record_delta/record.h>

#include <optional>
#include <type_traits>
#include <utility>

namespace record_delta {

namespace detail {

template <Record T>
[[nodiscard]] std::optional<Delta<T>> diff_record(const T& old_value, const T& new_value);

template <typename M>
void diff_map(const M& old_map, const M& new_map, DeltaMap<map_key_t<M>, map_record_t<M>>& out)
{
    using record_type = map_record_t<M>;

    // Maps sharing a root are identical - O(1)
    if (shares_storage(old_map, new_map)) {
        return;
    }

    for (const auto& entry : new_map) {
        const auto& key = entry.first;
        const auto& new_box = entry.second;

        if (const auto* old_box = old_map.find(key)) {
            // Same box, same record
            if (shares_storage(*old_box, new_box)) {
                continue;
            }
            if (auto sub = diff_record(old_box->get(), new_box.get())) {
                out.set(key, std::move(*sub));
            }
        } else if (auto sub = diff_record(record_type{}, new_box.get())) {
            out.set(key, std::move(*sub));
        } else {
            // New key holding the zero-valued record: nothing differs, but the
            // key itself must still be created by merge()
            out.touch(key);
        }
    }

    for (const auto& entry : old_map) {
        if (new_map.count(entry.first) == 0) {
            out.remove(entry.first);
        }
    }
}

template <Record T>
std::optional<Delta<T>> diff_record(const T& old_value, const T& new_value)
{
    Delta<T> delta;

    for_each_field<T>([&](const auto& field, auto index) {
        using F = std::remove_cvref_t<decltype(field)>;
        auto& slot = delta.template slot<decltype(index)::value>();
        const auto& old_member = F::get(old_value);
        const auto& new_member = F::get(new_value);

        if constexpr (field_kind_v<F> == FieldKind::Scalar) {
            if (!(old_member == new_member)) {
                slot = new_member;
            }
        } else if constexpr (field_kind_v<F> == FieldKind::Record) {
            slot = diff_record(old_member, new_member);
        } else {
            diff_map(old_member, new_member, slot);
        }
    });

    if (delta.empty()) {
        return std::nullopt;
    }
    return delta;
}

template <Record T>
[[nodiscard]] bool equal_record(const T& a, const T& b);

template <typename M>
[[nodiscard]] bool equal_map(const M& a, const M& b)
{
    if (shares_storage(a, b)) {
        return true;
    }
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& entry : a) {
        const auto* other = b.find(entry.first);
        if (other == nullptr) {
            return false;
        }
        if (!shares_storage(entry.second, *other) && !equal_record(entry.second.get(), other->get())) {
            return false;
        }
    }
    return true;
}

template <Record T>
bool equal_record(const T& a, const T& b)
{
    bool same = true;
    for_each_field<T>([&](const auto& field, auto) {
        using F = std::remove_cvref_t<decltype(field)>;
        if (!same) {
            return;
        }
        if constexpr (field_kind_v<F> == FieldKind::Scalar) {
            same = F::get(a) == F::get(b);
        } else if constexpr (field_kind_v<F> == FieldKind::Record) {
            same = equal_record(F::get(a), F::get(b));
        } else {
            same = equal_map(F::get(a), F::get(b));
        }
    });
    return same;
}

} // namespace detail

// ============================================================
// Public API
// ============================================================

/// Delta turning old_value into new_value, or std::nullopt when they are equal.
/// Only the root record exposes diff(); nested records are diffed through it.
template <RootRecord T>
[[nodiscard]] std::optional<Delta<T>> diff(const T& old_value, const T& new_value)
{
    return detail::diff_record(old_value, new_value);
}

/// True when diff(old_value, new_value) would produce a delta
template <Record T>
[[nodiscard]] bool has_changes(const T& old_value, const T& new_value)
{
    return detail::diff_record(old_value, new_value).has_value();
}

/// Structural equality: scalars with ==, nested records recursively, maps by
/// key set and per-key record (shared boxes compare equal without descending).
template <Record T>
[[nodiscard]] bool equal(const T& a, const T& b)
{
    return detail::equal_record(a, b);
}

} // namespace record_delta
