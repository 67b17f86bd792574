// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file change_list.h
/// @brief Flat listing of the changes carried by a Delta.
///
/// collect_changes() walks a delta and produces one ChangeEntry per leaf:
///   - Set:    a scalar member receives a new value
///   - Remove: a map key carries the removal marker
///   - Touch:  a map key carries an explicit-empty delta
///
/// Paths are made of member names and map keys, e.g. /items/sword/count.
/// Map keys are visited in key order (or in the order of their textual form
/// when the key type has no ordering) so the listing is stable regardless of
/// hash order.
///
/// Example:
/// @code
///   auto changes = collect_changes(diff(before, after));
///   print_changes(changes);
///   //   SET    /items/sword/count = 3
///   //   REMOVE /items/shield
/// @endcode

#pragma once

#include <record_delta/record_delta_config.h>
#include <record_delta/api.h>
#include <record_delta/delta.h>
#include <record_delta/record.h>

#include <algorithm>
#include <concepts>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace record_delta {

using Path = std::vector<std::string>;

struct ChangeEntry {
    enum class Type { Set, Remove, Touch };

    Type type = Type::Set;
    Path path;
    std::string value; ///< Textual new value (Set only, empty when not streamable)

    bool operator==(const ChangeEntry&) const = default;
};

[[nodiscard]] RECORD_DELTA_API std::string_view to_string(ChangeEntry::Type type) noexcept;

/// "/a/b/c"; the empty path is "/"
[[nodiscard]] RECORD_DELTA_API std::string path_to_string(const Path& path);

/// One line per entry, "  (no changes)" for an empty list
RECORD_DELTA_API void print_changes(const std::vector<ChangeEntry>& changes, std::ostream& out = std::cout);

namespace detail {

template <typename V>
[[nodiscard]] std::string to_text(const V& value) {
    if constexpr (std::is_same_v<V, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_same_v<V, std::string>) {
        return value;
    } else if constexpr (requires(std::ostream& os) { os << value; }) {
        std::ostringstream out;
        out << value;
        return out.str();
    } else {
        return {};
    }
}

template <Record T>
void collect_delta(const Delta<T>& delta, Path& path, std::vector<ChangeEntry>& out);

template <typename K, typename V>
void collect_delta_map(const DeltaMap<K, V>& delta, Path& path, std::vector<ChangeEntry>& out)
{
    struct Entry {
        const K* key;
        std::string text;
        const typename DeltaMap<K, V>::mapped_type* value;
    };

    std::vector<Entry> entries;
    entries.reserve(delta.size());
    for (const auto& [key, entry] : delta) {
        entries.push_back(Entry{&key, to_text(key), &entry});
    }
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        if constexpr (std::totally_ordered<K>) {
            return *a.key < *b.key;
        } else {
            return a.text < b.text;
        }
    });

    for (const auto& [key, text, entry] : entries) {
        path.push_back(text);
        if (!entry->has_value()) {
            out.push_back(ChangeEntry{ChangeEntry::Type::Remove, path, {}});
        } else if ((*entry)->empty()) {
            out.push_back(ChangeEntry{ChangeEntry::Type::Touch, path, {}});
        } else {
            collect_delta(**entry, path, out);
        }
        path.pop_back();
    }
}

template <Record T>
void collect_delta(const Delta<T>& delta, Path& path, std::vector<ChangeEntry>& out)
{
    for_each_field<T>([&](const auto& field, auto index) {
        using F = std::remove_cvref_t<decltype(field)>;
        const auto& slot = delta.template slot<decltype(index)::value>();

        path.push_back(std::string{field.name});
        if constexpr (field_kind_v<F> == FieldKind::Scalar) {
            if (slot.has_value()) {
                out.push_back(ChangeEntry{ChangeEntry::Type::Set, path, to_text(*slot)});
            }
        } else if constexpr (field_kind_v<F> == FieldKind::Record) {
            if (slot.has_value()) {
                collect_delta(*slot, path, out);
            }
        } else {
            collect_delta_map(slot, path, out);
        }
        path.pop_back();
    });
}

} // namespace detail

template <Record T>
[[nodiscard]] std::vector<ChangeEntry> collect_changes(const Delta<T>& delta)
{
    std::vector<ChangeEntry> out;
    Path path;
    detail::collect_delta(delta, path, out);
    return out;
}

template <Record T>
[[nodiscard]] std::vector<ChangeEntry> collect_changes(const std::optional<Delta<T>>& delta)
{
    if (!delta.has_value()) {
        return {};
    }
    return collect_changes(*delta);
}

} // namespace record_delta
