// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file schema.h
/// @brief Runtime Schema Model and its validation.
///
/// A Schema is an ordered list of record declarations, each with an ordered
/// list of members tagged Scalar, Record or Map. It can be assembled by hand
/// (e.g. by a loader reading a schema file) or derived from compile-time
/// descriptors with schema_of<T>().
///
/// validate() is the only fallible step of the library. It throws SchemaError
/// for:
///   - two records with the same name
///   - two members with the same name in one record
///   - a Record/Map member naming an unknown record
///   - a Map member without key type, or keyed by a record type
///   - more than one root record
///   - a cycle through Record or Map member references

#pragma once

#include <record_delta/record_delta_config.h>
#include <record_delta/api.h>
#include <record_delta/record.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_set>
#include <utility>
#include <vector>

namespace record_delta {

// ============================================================
// Declarations
// ============================================================

enum class MemberKind { Scalar, Record, Map };

struct MemberDecl {
    MemberKind kind = MemberKind::Scalar;
    std::string name;
    std::string type;     ///< Scalar type name, or record name for Record/Map
    std::string key_type; ///< Map key type (Map only)

    bool operator==(const MemberDecl&) const = default;
};

struct RecordDecl {
    std::string name;
    std::vector<MemberDecl> members;
    bool is_root = false;

    [[nodiscard]] const MemberDecl* find_member(std::string_view member) const noexcept {
        for (const auto& m : members) {
            if (m.name == member)
                return &m;
        }
        return nullptr;
    }

    bool operator==(const RecordDecl&) const = default;
};

// ============================================================
// SchemaError
// ============================================================

class RECORD_DELTA_API SchemaError : public std::runtime_error {
public:
    enum class Kind {
        DuplicateRecord,
        DuplicateMember,
        UnknownRecord,
        InvalidKeyType,
        MultipleRoots,
        Cycle,
    };

    SchemaError(Kind kind, std::string record, std::string member, const std::string& message);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& record() const noexcept { return record_; }
    [[nodiscard]] const std::string& member() const noexcept { return member_; }

private:
    Kind kind_;
    std::string record_;
    std::string member_;
};

[[nodiscard]] RECORD_DELTA_API std::string_view to_string(MemberKind kind) noexcept;
[[nodiscard]] RECORD_DELTA_API std::string_view to_string(SchemaError::Kind kind) noexcept;

// ============================================================
// Schema
// ============================================================

class RECORD_DELTA_API Schema {
public:
    Schema() = default;
    explicit Schema(std::vector<RecordDecl> records);

    /// Append a declaration. Not validated until validate() is called.
    Schema& add(RecordDecl decl);

    [[nodiscard]] const RecordDecl* find(std::string_view name) const noexcept;

    /// The record marked as root, or nullptr
    [[nodiscard]] const RecordDecl* root() const noexcept;

    [[nodiscard]] const std::vector<RecordDecl>& records() const noexcept { return records_; }
    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }

    /// Throws SchemaError on the first problem found
    void validate() const;

    /// Human readable listing, one record per block
    [[nodiscard]] std::string to_string() const;

private:
    void check_names() const;
    void check_references() const;
    void check_cycles() const;

    std::vector<RecordDecl> records_;
};

// ============================================================
// Schema from compile-time descriptors
// ============================================================

namespace detail {

template <typename V>
[[nodiscard]] std::string scalar_type_name() {
    if constexpr (std::is_same_v<V, bool>) return "bool";
    else if constexpr (std::is_same_v<V, int8_t>) return "int8";
    else if constexpr (std::is_same_v<V, int16_t>) return "int16";
    else if constexpr (std::is_same_v<V, int32_t>) return "int32";
    else if constexpr (std::is_same_v<V, int64_t>) return "int64";
    else if constexpr (std::is_same_v<V, uint8_t>) return "uint8";
    else if constexpr (std::is_same_v<V, uint16_t>) return "uint16";
    else if constexpr (std::is_same_v<V, uint32_t>) return "uint32";
    else if constexpr (std::is_same_v<V, uint64_t>) return "uint64";
    else if constexpr (std::is_same_v<V, float>) return "float";
    else if constexpr (std::is_same_v<V, double>) return "double";
    else if constexpr (std::is_same_v<V, std::string>) return "string";
    else return typeid(V).name();
}

/// Records are visited once per C++ type. Two distinct types described with
/// the same name are both added, so validate() reports DuplicateRecord.
template <Record T>
void collect_records(Schema& schema, std::unordered_set<std::type_index>& visited)
{
    if (!visited.insert(std::type_index{typeid(T)}).second) {
        return;
    }

    constexpr auto desc = describe<T>();

    RecordDecl decl;
    decl.name = std::string{desc.name};
    decl.is_root = desc.is_root;

    for_each_field<T>([&](const auto& field, auto) {
        using F = std::remove_cvref_t<decltype(field)>;
        using V = typename F::value_type;
        MemberDecl member;
        member.name = std::string{field.name};
        if constexpr (field_kind_v<F> == FieldKind::Scalar) {
            member.kind = MemberKind::Scalar;
            member.type = scalar_type_name<V>();
        } else if constexpr (field_kind_v<F> == FieldKind::Record) {
            member.kind = MemberKind::Record;
            member.type = std::string{describe<V>().name};
        } else {
            member.kind = MemberKind::Map;
            member.type = std::string{describe<map_record_t<V>>().name};
            member.key_type = scalar_type_name<map_key_t<V>>();
        }
        decl.members.push_back(std::move(member));
    });

    schema.add(std::move(decl));

    // Dependencies follow their first user
    for_each_field<T>([&](const auto& field, auto) {
        using F = std::remove_cvref_t<decltype(field)>;
        using V = typename F::value_type;
        if constexpr (field_kind_v<F> == FieldKind::Record) {
            collect_records<V>(schema, visited);
        } else if constexpr (field_kind_v<F> == FieldKind::Map) {
            collect_records<map_record_t<V>>(schema, visited);
        }
    });
}

} // namespace detail

/// Schema Model of T and every record reachable from it
template <Record T>
[[nodiscard]] Schema schema_of()
{
    Schema schema;
    std::unordered_set<std::type_index> visited;
    detail::collect_records<T>(schema, visited);
    return schema;
}

/// schema_of<T>() followed by validate()
template <Record T>
[[nodiscard]] Schema validated_schema_of()
{
    auto schema = schema_of<T>();
    schema.validate();
    return schema;
}

} // namespace record_delta
