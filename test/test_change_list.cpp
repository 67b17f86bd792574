// test_change_list.cpp - Tests for the flat change listing
// Module 6: collect_changes, path_to_string, print_changes

#include <catch2/catch_all.hpp>
#include <record_delta/change_list.h>
#include <record_delta/diff.h>

#include "test_records.h"

#include <sstream>
#include <string>
#include <vector>

using namespace record_delta;
using namespace fixtures;

// ============================================================
// path_to_string
// ============================================================

TEST_CASE("path_to_string", "[change_list][path]") {
    REQUIRE(path_to_string({}) == "/");
    REQUIRE(path_to_string({"gold"}) == "/gold");
    REQUIRE(path_to_string({"items", "sword", "count"}) == "/items/sword/count");
}

// ============================================================
// collect_changes
// ============================================================

TEST_CASE("collect_changes of an absent delta", "[change_list]") {
    auto inv = make_inventory();
    REQUIRE(collect_changes(diff(inv, inv)).empty());
    REQUIRE(collect_changes(Delta<Inventory>{}).empty());
}

TEST_CASE("collect_changes reports scalar and nested paths", "[change_list]") {
    auto old_inv = make_inventory();
    auto new_inv = old_inv;
    new_inv.gold = 80;
    new_inv.profile.stats.level = 8;
    new_inv.profile.title = "Warden";

    auto changes = collect_changes(diff(old_inv, new_inv));

    REQUIRE(changes.size() == 3);
    REQUIRE(changes[0] == ChangeEntry{ChangeEntry::Type::Set, {"gold"}, "80"});
    REQUIRE(changes[1] == ChangeEntry{ChangeEntry::Type::Set, {"profile", "title"}, "Warden"});
    REQUIRE(changes[2] == ChangeEntry{ChangeEntry::Type::Set, {"profile", "stats", "level"}, "8"});
}

TEST_CASE("collect_changes reports map entries in key order", "[change_list][map]") {
    auto old_inv = make_inventory();
    auto new_inv = old_inv;

    auto sword = new_inv.items.at("sword").get();
    sword.equipped = false;
    new_inv.items = new_inv.items
        .set("sword", boxed(sword))
        .erase("arrows")
        .set("bandage", boxed(Item{}));

    auto changes = collect_changes(diff(old_inv, new_inv));

    REQUIRE(changes.size() == 3);
    REQUIRE(changes[0] == ChangeEntry{ChangeEntry::Type::Remove, {"items", "arrows"}, {}});
    REQUIRE(changes[1] == ChangeEntry{ChangeEntry::Type::Touch, {"items", "bandage"}, {}});
    REQUIRE(changes[2] == ChangeEntry{ChangeEntry::Type::Set, {"items", "sword", "equipped"}, "false"});
}

TEST_CASE("collect_changes orders integer keys numerically", "[change_list][map]") {
    Delta<Inventory> d;
    d.get<&Inventory::snapshots>().touch(12).set<&Stats::experience>(2.5);
    d.get<&Inventory::snapshots>().remove(3);
    d.get<&Inventory::snapshots>().touch(100);

    auto changes = collect_changes(d);

    REQUIRE(changes.size() == 3);
    REQUIRE(changes[0] == ChangeEntry{ChangeEntry::Type::Remove, {"snapshots", "3"}, {}});
    REQUIRE(changes[1] == ChangeEntry{ChangeEntry::Type::Set, {"snapshots", "12", "experience"}, "2.5"});
    REQUIRE(changes[2] == ChangeEntry{ChangeEntry::Type::Touch, {"snapshots", "100"}, {}});
}

// ============================================================
// print_changes
// ============================================================

TEST_CASE("print_changes output", "[change_list][print]") {
    std::ostringstream out;

    SECTION("empty list") {
        print_changes({}, out);
        REQUIRE(out.str() == "  (no changes)\n");
    }

    SECTION("one line per entry") {
        std::vector<ChangeEntry> changes{
            {ChangeEntry::Type::Set, {"items", "sword", "count"}, "3"},
            {ChangeEntry::Type::Remove, {"items", "shield"}, {}},
            {ChangeEntry::Type::Touch, {"snapshots", "2"}, {}},
        };
        print_changes(changes, out);
        REQUIRE(out.str() ==
                "  SET    /items/sword/count = 3\n"
                "  REMOVE /items/shield\n"
                "  TOUCH  /snapshots/2\n");
    }
}
