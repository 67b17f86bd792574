// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file merge.h
/// @brief Merge engine: apply a delta to a base value.
///
/// The base is taken by value and never observably mutated: map members are
/// copy-on-write. A map is only cloned (through an immer transient) when the
/// first key that really needs a write is found; every other entry keeps
/// pointing at the base's boxes, and untouched maps keep the base's storage.
///
/// merge_changed() also reports whether anything was modified, which lets the
/// caller know which sub-structures may still alias the base.

#pragma once

#include <record_delta/record_delta_config.h>
#include <record_delta/delta.h>
#include <record_delta/record.h>

#include <optional>
#include <type_traits>
#include <utility>

namespace record_delta {

/// Result of merge_changed()
template <Record T>
struct MergeResult {
    T value;
    bool changed = false;
};

template <Record T>
[[nodiscard]] MergeResult<T> merge_changed(T base, const Delta<T>* delta);

namespace detail {

template <typename M>
void merge_map(M& target, const DeltaMap<map_key_t<M>, map_record_t<M>>& delta, bool& changed)
{
    using record_type = map_record_t<M>;
    using transient_type = typename M::transient_type;

    if (delta.empty()) {
        return;
    }

    std::optional<transient_type> writable;
    auto copy_on_write = [&]() -> transient_type& {
        if (!writable) {
            writable.emplace(target.transient());
        }
        return *writable;
    };

    for (const auto& [key, entry] : delta) {
        // target itself is untouched until the end, lookups see the base entries
        const auto* current = target.find(key);

        if (!entry.has_value()) {
            if (current != nullptr) {
                copy_on_write().erase(key);
                changed = true;
            }
            continue;
        }

        // A mentioned key that is missing from the base is created even when its
        // delta is empty
        auto merged = merge_changed(current != nullptr ? current->get() : record_type{}, &*entry);
        if (merged.changed || current == nullptr) {
            copy_on_write().set(key, typename M::mapped_type{std::move(merged.value)});
            changed = true;
        }
    }

    if (writable) {
        target = std::move(*writable).persistent();
    }
}

} // namespace detail

/// Apply delta to base. A null delta returns base untouched with changed == false.
///
/// - Scalar slots overwrite the member when present and different.
/// - Nested records are always merged recursively (an absent sub-delta passes
///   straight through) and the member is moved through the recursive call.
/// - Map slots are applied with copy-on-write; an empty DeltaMap leaves the
///   member alone. A removal marker for a missing key is a no-op; any other
///   entry for a missing key inserts the key (an explicit-empty delta inserts
///   the zero-valued record).
template <Record T>
MergeResult<T> merge_changed(T base, const Delta<T>* delta)
{
    if (delta == nullptr) {
        return {std::move(base), false};
    }

    bool changed = false;

    for_each_field<T>([&](const auto& field, auto index) {
        using F = std::remove_cvref_t<decltype(field)>;
        const auto& slot = delta->template slot<decltype(index)::value>();
        auto& member = F::get(base);

        if constexpr (field_kind_v<F> == FieldKind::Scalar) {
            if (slot.has_value() && !(*slot == member)) {
                member = *slot;
                changed = true;
            }
        } else if constexpr (field_kind_v<F> == FieldKind::Record) {
            auto merged = merge_changed(std::move(member), slot.has_value() ? &*slot : nullptr);
            member = std::move(merged.value);
            changed = changed || merged.changed;
        } else {
            detail::merge_map(member, slot, changed);
        }
    });

    return {std::move(base), changed};
}

template <Record T>
[[nodiscard]] MergeResult<T> merge_changed(T base, const Delta<T>& delta)
{
    return merge_changed(std::move(base), &delta);
}

template <Record T>
[[nodiscard]] MergeResult<T> merge_changed(T base, const std::optional<Delta<T>>& delta)
{
    return merge_changed(std::move(base), delta.has_value() ? &*delta : nullptr);
}

// ============================================================
// Root entry points
// ============================================================

/// Apply delta to base and return the merged value. base is not modified.
template <RootRecord T>
[[nodiscard]] T merge(T base, const Delta<T>& delta)
{
    return merge_changed(std::move(base), &delta).value;
}

/// Same as above; an absent delta returns base unchanged.
template <RootRecord T>
[[nodiscard]] T merge(T base, const std::optional<Delta<T>>& delta)
{
    return merge_changed(std::move(base), delta).value;
}

} // namespace record_delta
