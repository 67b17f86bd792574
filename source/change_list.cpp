// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// change_list.cpp - ChangeEntry printing

#include <record_delta/change_list.h>

namespace record_delta {

std::string_view to_string(ChangeEntry::Type type) noexcept
{
    switch (type) {
        case ChangeEntry::Type::Set:    return "SET   ";
        case ChangeEntry::Type::Remove: return "REMOVE";
        case ChangeEntry::Type::Touch:  return "TOUCH ";
    }
    return "?     ";
}

std::string path_to_string(const Path& path)
{
    if (path.empty()) {
        return "/";
    }
    std::string result;
    for (const auto& segment : path) {
        result += '/';
        result += segment;
    }
    return result;
}

void print_changes(const std::vector<ChangeEntry>& changes, std::ostream& out)
{
    if (changes.empty()) {
        out << "  (no changes)\n";
        return;
    }
    for (const auto& c : changes) {
        out << "  " << to_string(c.type) << " " << path_to_string(c.path);
        if (c.type == ChangeEntry::Type::Set && !c.value.empty()) {
            out << " = " << c.value;
        }
        out << "\n";
    }
}

} // namespace record_delta
