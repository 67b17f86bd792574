// test_merge.cpp - Tests for the merge engine
// Module 3: merge_changed, merge, copy-on-write behaviour

#include <catch2/catch_all.hpp>
#include <record_delta/diff.h>
#include <record_delta/merge.h>

#include "test_records.h"

#include <optional>
#include <string>

using namespace record_delta;
using namespace fixtures;

// ============================================================
// Absent and Redundant Deltas
// ============================================================

TEST_CASE("merge with an absent delta", "[merge]") {
    auto base = make_inventory();

    SECTION("merge_changed reports no change") {
        auto result = merge_changed(base, std::optional<Delta<Inventory>>{});
        REQUIRE_FALSE(result.changed);
        REQUIRE(result.value == base);
        REQUIRE(shares_storage(result.value.items, base.items));
    }

    SECTION("merge returns base") {
        auto merged = merge(base, std::optional<Delta<Inventory>>{});
        REQUIRE(merged == base);
        REQUIRE(shares_storage(merged.profile.skills, base.profile.skills));
    }

    SECTION("null pointer") {
        auto result = merge_changed(base.profile, static_cast<const Delta<Profile>*>(nullptr));
        REQUIRE_FALSE(result.changed);
        REQUIRE(result.value == base.profile);
    }
}

TEST_CASE("merge with an empty delta reports no change", "[merge]") {
    auto base = make_inventory();

    auto result = merge_changed(base, Delta<Inventory>{});
    REQUIRE_FALSE(result.changed);
    REQUIRE(shares_storage(result.value.items, base.items));
}

TEST_CASE("scalar equal to the base value is a no-op", "[merge][scalar]") {
    auto base = make_inventory();

    Delta<Inventory> d;
    d.set<&Inventory::gold>(base.gold);

    auto result = merge_changed(base, d);
    REQUIRE_FALSE(result.changed);
    REQUIRE(result.value == base);
}

TEST_CASE("redundant map entry does not clone the map", "[merge][map]") {
    auto base = make_inventory();

    Delta<Inventory> d;
    d.get<&Inventory::items>().touch("arrows").set<&Item::count>(40);

    auto result = merge_changed(base, d);
    REQUIRE_FALSE(result.changed);
    REQUIRE(shares_storage(result.value.items, base.items));
}

// ============================================================
// Applying Changes
// ============================================================

TEST_CASE("merge never mutates the base", "[merge]") {
    const auto base = make_inventory();
    const auto snapshot = make_inventory();

    Delta<Inventory> d;
    d.set<&Inventory::owner>(std::string{"Bob"});
    d.get<&Inventory::items>().remove("potion");
    d.get<&Inventory::items>().touch("arrows").set<&Item::count>(10);

    auto merged = merge(base, d);

    REQUIRE(merged.owner == "Bob");
    REQUIRE(merged.items.count("potion") == 0);
    REQUIRE(merged.items.at("arrows").get().count == 10);
    REQUIRE(base == snapshot);
}

TEST_CASE("merge nested record", "[merge][nested]") {
    auto base = make_inventory();

    Delta<Stats> stats;
    stats.set<&Stats::experience>(1400.0);
    Delta<Profile> profile;
    profile.set<&Profile::stats>(stats);
    Delta<Inventory> d;
    d.set<&Inventory::profile>(profile);

    auto result = merge_changed(base, d);
    REQUIRE(result.changed);
    REQUIRE(result.value.profile.stats.experience == 1400.0);
    REQUIRE(result.value.profile.stats.level == base.profile.stats.level);
    REQUIRE(result.value.profile.title == base.profile.title);
}

TEST_CASE("unchanged nested subtree keeps its storage", "[merge][nested]") {
    auto base = make_inventory();
    auto target = base;
    target.gold = 300;
    target.items = target.items.erase("map");

    auto d = diff(base, target);
    REQUIRE(d.has_value());
    REQUIRE_FALSE(d->get<&Inventory::profile>().has_value());

    auto merged = merge(base, d);
    REQUIRE(merged == target);
    REQUIRE(shares_storage(merged.profile.skills, base.profile.skills));
    REQUIRE(shares_storage(merged.snapshots, base.snapshots));
}

TEST_CASE("copy-on-write leaves other keys identity-equal", "[merge][map]") {
    auto base = make_inventory();

    Delta<Inventory> d;
    d.get<&Inventory::items>().touch("potion").set<&Item::count>(1);

    auto merged = merge(base, d);

    REQUIRE_FALSE(shares_storage(merged.items, base.items));
    REQUIRE_FALSE(shares_storage(*merged.items.find("potion"), *base.items.find("potion")));
    REQUIRE(merged.items.at("potion").get().count == 1);
    REQUIRE(base.items.at("potion").get().count == 3);

    for (const auto* key : {"sword", "arrows", "map"}) {
        INFO("key: " << key);
        REQUIRE(shares_storage(*merged.items.find(key), *base.items.find(key)));
    }
}

TEST_CASE("merge map removal marker", "[merge][map]") {
    auto base = make_inventory();

    SECTION("present key is erased") {
        Delta<Inventory> d;
        d.get<&Inventory::items>().remove("sword");

        auto result = merge_changed(base, d);
        REQUIRE(result.changed);
        REQUIRE(result.value.items.size() == 3);
        REQUIRE(result.value.items.find("sword") == nullptr);
    }

    SECTION("missing key is ignored") {
        Delta<Inventory> d;
        d.get<&Inventory::items>().remove("shield");

        auto result = merge_changed(base, d);
        REQUIRE_FALSE(result.changed);
        REQUIRE(shares_storage(result.value.items, base.items));
    }
}

TEST_CASE("merge into a missing map key starts from the zero value", "[merge][map]") {
    Inventory base;

    SECTION("changed fields are applied over the zero-valued record") {
        Delta<Inventory> d;
        d.get<&Inventory::items>().touch("rope").set<&Item::count>(2);

        auto merged = merge(base, d);
        REQUIRE(merged.items.size() == 1);
        REQUIRE(merged.items.at("rope").get() == make_item("", 2));
    }

    SECTION("explicit-empty delta inserts the zero-valued record") {
        Delta<Inventory> d;
        d.get<&Inventory::snapshots>().touch(4);

        auto result = merge_changed(base, d);
        REQUIRE(result.changed);
        REQUIRE(result.value.snapshots.size() == 1);
        REQUIRE(result.value.snapshots.at(4).get() == Stats{});
    }
}

TEST_CASE("merge map key addition example", "[merge][map]") {
    Inventory old_inv;
    Inventory new_inv;
    new_inv.items = new_inv.items.set("a", boxed(make_item("Axe", 1, true)));

    auto d = diff(old_inv, new_inv);
    REQUIRE(d.has_value());

    auto merged = merge(old_inv, d);
    REQUIRE(merged == new_inv);
    REQUIRE(old_inv.items.empty());
}

TEST_CASE("merge nested map inside a map entry", "[merge][map][nested]") {
    auto base = make_inventory();

    Delta<Inventory> d;
    auto& sword = d.get<&Inventory::items>().touch("sword");
    sword.get<&Item::enchantments>().touch("flame").set<&Enchantment::power>(5);

    auto merged = merge(base, d);
    REQUIRE(merged.items.at("sword").get().enchantments.at("flame").get() == Enchantment{"fire", 5});
    REQUIRE(base.items.at("sword").get().enchantments.at("flame").get().power == 4);
    REQUIRE(shares_storage(*merged.items.find("arrows"), *base.items.find("arrows")));
}
