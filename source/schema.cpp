// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// schema.cpp - Schema Model validation and printing

#include <record_delta/schema.h>
#include <record_delta/logging.h>

#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace record_delta {

// ============================================================
// SchemaError
// ============================================================

SchemaError::SchemaError(Kind kind, std::string record, std::string member, const std::string& message)
    : std::runtime_error(message), kind_(kind), record_(std::move(record)), member_(std::move(member))
{
}

std::string_view to_string(MemberKind kind) noexcept
{
    switch (kind) {
        case MemberKind::Scalar: return "scalar";
        case MemberKind::Record: return "record";
        case MemberKind::Map:    return "map";
    }
    return "unknown";
}

std::string_view to_string(SchemaError::Kind kind) noexcept
{
    switch (kind) {
        case SchemaError::Kind::DuplicateRecord: return "duplicate record";
        case SchemaError::Kind::DuplicateMember: return "duplicate member";
        case SchemaError::Kind::UnknownRecord:   return "unknown record";
        case SchemaError::Kind::InvalidKeyType:  return "invalid key type";
        case SchemaError::Kind::MultipleRoots:   return "multiple roots";
        case SchemaError::Kind::Cycle:           return "cycle";
    }
    return "unknown";
}

namespace {

[[noreturn]] void fail(SchemaError::Kind kind, const std::string& record, const std::string& member,
                       const std::string& reason)
{
    detail::log_record_error("Schema", record, reason);

    std::string message = "schema error (";
    message += to_string(kind);
    message += "): record '" + record + "'";
    if (!member.empty()) {
        message += ", member '" + member + "'";
    }
    message += ": " + reason;
    throw SchemaError(kind, record, member, message);
}

} // namespace

// ============================================================
// Schema
// ============================================================

Schema::Schema(std::vector<RecordDecl> records)
    : records_(std::move(records))
{
}

Schema& Schema::add(RecordDecl decl)
{
    records_.push_back(std::move(decl));
    return *this;
}

const RecordDecl* Schema::find(std::string_view name) const noexcept
{
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const RecordDecl& r) { return r.name == name; });
    return it == records_.end() ? nullptr : &*it;
}

const RecordDecl* Schema::root() const noexcept
{
    auto it = std::find_if(records_.begin(), records_.end(),
                           [](const RecordDecl& r) { return r.is_root; });
    return it == records_.end() ? nullptr : &*it;
}

void Schema::validate() const
{
    check_names();
    check_references();
    check_cycles();
}

void Schema::check_names() const
{
    std::unordered_set<std::string> record_names;
    const RecordDecl* first_root = nullptr;

    for (const auto& record : records_) {
        if (!record_names.insert(record.name).second) {
            fail(SchemaError::Kind::DuplicateRecord, record.name, {}, "is declared more than once");
        }

        if (record.is_root) {
            if (first_root != nullptr) {
                fail(SchemaError::Kind::MultipleRoots, record.name, {},
                     "is marked as root, but '" + first_root->name + "' already is");
            }
            first_root = &record;
        }

        std::unordered_set<std::string> member_names;
        for (const auto& member : record.members) {
            if (!member_names.insert(member.name).second) {
                fail(SchemaError::Kind::DuplicateMember, record.name, member.name, "member is declared more than once");
            }
        }
    }
}

void Schema::check_references() const
{
    for (const auto& record : records_) {
        for (const auto& member : record.members) {
            if (member.kind == MemberKind::Scalar) {
                continue;
            }
            if (find(member.type) == nullptr) {
                fail(SchemaError::Kind::UnknownRecord, record.name, member.name,
                     "references unknown record '" + member.type + "'");
            }
            if (member.kind == MemberKind::Map) {
                if (member.key_type.empty()) {
                    fail(SchemaError::Kind::InvalidKeyType, record.name, member.name, "map member has no key type");
                }
                if (find(member.key_type) != nullptr) {
                    fail(SchemaError::Kind::InvalidKeyType, record.name, member.name,
                         "map key '" + member.key_type + "' is a record, keys must be scalar");
                }
            }
        }
    }
}

void Schema::check_cycles() const
{
    enum class Mark { Unvisited, InProgress, Done };

    std::unordered_map<std::string, Mark> marks;
    for (const auto& record : records_) {
        marks.emplace(record.name, Mark::Unvisited);
    }

    std::vector<std::string> stack;

    // Depth-first walk over Record/Map references; references are known to
    // resolve because check_references() ran first.
    auto visit = [&](auto& self, const RecordDecl& record) -> void {
        marks[record.name] = Mark::InProgress;
        stack.push_back(record.name);

        for (const auto& member : record.members) {
            if (member.kind == MemberKind::Scalar) {
                continue;
            }
            const RecordDecl* target = find(member.type);
            switch (marks[target->name]) {
                case Mark::InProgress: {
                    std::string path;
                    auto from = std::find(stack.begin(), stack.end(), target->name);
                    for (auto it = from; it != stack.end(); ++it) {
                        path += *it + " -> ";
                    }
                    path += target->name;
                    fail(SchemaError::Kind::Cycle, record.name, member.name, "takes part in a cycle: " + path);
                }
                case Mark::Unvisited:
                    self(self, *target);
                    break;
                case Mark::Done:
                    break;
            }
        }

        stack.pop_back();
        marks[record.name] = Mark::Done;
    };

    for (const auto& record : records_) {
        if (marks[record.name] == Mark::Unvisited) {
            visit(visit, record);
        }
    }
}

std::string Schema::to_string() const
{
    std::ostringstream out;
    for (const auto& record : records_) {
        out << "record " << record.name;
        if (record.is_root) {
            out << " (root)";
        }
        out << "\n";
        for (const auto& member : record.members) {
            out << "  " << record_delta::to_string(member.kind) << " " << member.name << ": ";
            if (member.kind == MemberKind::Map) {
                out << member.key_type << " -> ";
            }
            out << member.type << "\n";
        }
    }
    return out.str();
}

} // namespace record_delta
