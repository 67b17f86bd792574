// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file delta.h
/// @brief Delta types mirroring record types.
///
/// Delta<T> holds one slot per member of T, in declaration order:
///   - scalar member of type V      -> std::optional<V>        (absent = unchanged)
///   - nested record R              -> std::optional<Delta<R>> (absent = unchanged subtree)
///   - RecordMap<K, V>              -> DeltaMap<K, V>
///
/// DeltaMap distinguishes four states per key:
///   - key not present in the DeltaMap     -> unchanged
///   - std::nullopt                         -> key removed
///   - empty Delta<V>                       -> key exists, nothing changed (explicit-empty)
///   - non-empty Delta<V>                   -> key's record changed
///
/// Deltas are short-lived: produced by diff(), consumed by merge().

#pragma once

#include <record_delta/record_delta_config.h>
#include <record_delta/record.h>

#include <tsl/robin_map.h>

#include <cstddef>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace record_delta {

template <Record T>
class Delta;

template <MapKey K, Record V>
class DeltaMap;

namespace detail {

template <typename F, FieldKind Kind = field_kind_v<F>>
struct slot_of;

template <typename F>
struct slot_of<F, FieldKind::Scalar> {
    using type = std::optional<typename F::value_type>;
};

template <typename F>
struct slot_of<F, FieldKind::Record> {
    using type = std::optional<Delta<typename F::value_type>>;
};

template <typename F>
struct slot_of<F, FieldKind::Map> {
    using type = DeltaMap<map_key_t<typename F::value_type>, map_record_t<typename F::value_type>>;
};

template <typename Tuple>
struct slots_of;

template <typename... Fs>
struct slots_of<std::tuple<Fs...>> {
    using type = std::tuple<typename slot_of<Fs>::type...>;
};

template <Record T>
using slots_t = typename slots_of<fields_t<T>>::type;

} // namespace detail

// ============================================================
// DeltaMap - per-key deltas of a RecordMap member
// ============================================================

template <MapKey K, Record V>
class DeltaMap {
public:
    using key_type = K;
    using record_type = V;
    using delta_type = Delta<V>;
    /// std::nullopt marks a removed key
    using mapped_type = std::optional<Delta<V>>;
    using storage_type = tsl::robin_map<K, mapped_type>;
    using const_iterator = typename storage_type::const_iterator;

    DeltaMap() = default;

    /// Record a change for key (replaces any previous entry).
    /// The returned reference is valid only until the next set(), touch() or
    /// remove() on this map: insertion may rehash or displace entries.
    Delta<V>& set(const K& key, Delta<V> delta) {
        auto it = entries_.insert_or_assign(key, mapped_type{std::move(delta)}).first;
        return *it.value();
    }

    /// Mark key as removed
    void remove(const K& key) {
        entries_.insert_or_assign(key, mapped_type{});
    }

    /// Record an explicit-empty delta for key: the key is mentioned but
    /// none of its fields change. Returns the delta so it can be filled in;
    /// like set(), the reference does not survive the next insertion.
    Delta<V>& touch(const K& key) {
        return set(key, Delta<V>{});
    }

    /// Entry for key, or nullptr when the key is not mentioned
    [[nodiscard]] const mapped_type* find(const K& key) const {
        auto it = entries_.find(key);
        return it == entries_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool contains(const K& key) const { return entries_.find(key) != entries_.end(); }

    /// True when key carries the removal marker
    [[nodiscard]] bool is_removed(const K& key) const {
        const auto* entry = find(key);
        return entry != nullptr && !entry->has_value();
    }

    void erase(const K& key) { entries_.erase(key); }
    void clear() noexcept { entries_.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    friend bool operator==(const DeltaMap& a, const DeltaMap& b) { return a.entries_ == b.entries_; }

private:
    storage_type entries_;
};

// ============================================================
// Delta - change set of one record value
// ============================================================

template <Record T>
class Delta {
public:
    using record_type = T;
    using slots_type = detail::slots_t<T>;

    Delta() = default;

    /// Slot of member Member, e.g. delta.get<&Player::name>()
    template <auto Member>
    [[nodiscard]] auto& get() noexcept {
        return std::get<field_index_v<T, Member>>(slots_);
    }

    template <auto Member>
    [[nodiscard]] const auto& get() const noexcept {
        return std::get<field_index_v<T, Member>>(slots_);
    }

    /// Assign the slot of member Member
    template <auto Member, typename U>
    Delta& set(U&& value) {
        get<Member>() = std::forward<U>(value);
        return *this;
    }

    /// Slot by declaration index
    template <std::size_t I>
    [[nodiscard]] auto& slot() noexcept {
        return std::get<I>(slots_);
    }

    template <std::size_t I>
    [[nodiscard]] const auto& slot() const noexcept {
        return std::get<I>(slots_);
    }

    [[nodiscard]] slots_type& slots() noexcept { return slots_; }
    [[nodiscard]] const slots_type& slots() const noexcept { return slots_; }

    /// True when no slot carries a change. Nested deltas count as empty when
    /// they are absent or empty themselves; a DeltaMap is empty only when it
    /// mentions no key at all.
    [[nodiscard]] bool empty() const {
        return std::apply([](const auto&... s) { return (slot_empty(s) && ...); }, slots_);
    }

    bool operator==(const Delta&) const = default;

private:
    template <typename V>
    static bool slot_empty(const std::optional<V>& s) {
        return !s.has_value();
    }

    template <typename R>
    static bool slot_empty(const std::optional<Delta<R>>& s) {
        return !s.has_value() || s->empty();
    }

    template <typename K, typename V>
    static bool slot_empty(const DeltaMap<K, V>& s) {
        return s.empty();
    }

    slots_type slots_{};
};

/// True when d is absent or carries no change
template <Record T>
[[nodiscard]] bool is_empty(const std::optional<Delta<T>>& d) {
    return !d.has_value() || d->empty();
}

} // namespace record_delta
