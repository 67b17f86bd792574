// test_properties.cpp - Algebraic laws of diff / merge / copy over generated values

#include <catch2/catch_all.hpp>
#include <record_delta/copy.h>
#include <record_delta/diff.h>
#include <record_delta/merge.h>

#include "test_records.h"

#include <array>
#include <cstddef>
#include <optional>
#include <random>
#include <string>

using namespace record_delta;
using namespace fixtures;

namespace {

// Values are drawn from small sets so that generated pairs often share keys
// and field values.
class InventoryGenerator {
public:
    explicit InventoryGenerator(std::mt19937::result_type seed)
        : rng_(seed)
    {
    }

    Inventory next() {
        Inventory inv;
        inv.owner = pick(owners_);
        inv.gold = static_cast<int64_t>(below(3)) * 50;
        inv.profile.title = pick(titles_);
        inv.profile.stats = stats();

        for (std::size_t i = 0, n = below(3); i < n; ++i) {
            inv.profile.skills = inv.profile.skills.set(pick(skills_), boxed(stats()));
        }
        for (std::size_t i = 0, n = below(4); i < n; ++i) {
            inv.items = inv.items.set(pick(item_keys_), boxed(item()));
        }
        for (std::size_t i = 0, n = below(3); i < n; ++i) {
            inv.snapshots = inv.snapshots.set(static_cast<int32_t>(below(3)), boxed(stats()));
        }
        return inv;
    }

private:
    std::size_t below(std::size_t n) {
        return std::uniform_int_distribution<std::size_t>{0, n - 1}(rng_);
    }

    template <std::size_t N>
    std::string pick(const std::array<const char*, N>& values) {
        return values[below(N)];
    }

    Stats stats() {
        // Level 0 and experience 0.0 make the zero-valued record reachable
        return Stats{static_cast<int32_t>(below(2)), below(2) == 0 ? 0.0 : 12.5};
    }

    Item item() {
        Item it;
        it.label = pick(labels_);
        it.count = static_cast<int32_t>(below(3));
        it.equipped = below(2) == 1;
        for (std::size_t i = 0, n = below(2); i < n; ++i) {
            it.enchantments = it.enchantments.set(pick(elements_),
                                                  boxed(Enchantment{pick(elements_), static_cast<int32_t>(below(2))}));
        }
        return it;
    }

    std::mt19937 rng_;
    std::array<const char*, 3> owners_{"", "Alice", "Bob"};
    std::array<const char*, 2> titles_{"", "Ranger"};
    std::array<const char*, 3> skills_{"archery", "tracking", "stealth"};
    std::array<const char*, 4> item_keys_{"sword", "arrows", "potion", "map"};
    std::array<const char*, 2> labels_{"", "Thing"};
    std::array<const char*, 2> elements_{"fire", "ice"};
};

} // namespace

TEST_CASE("round trip over generated values", "[properties][round_trip]") {
    InventoryGenerator gen{20240611};

    for (int i = 0; i < 300; ++i) {
        const auto old_value = gen.next();
        const auto new_value = gen.next();
        INFO("iteration " << i);

        auto d = diff(old_value, new_value);
        auto merged = merge(old_value, d);
        REQUIRE(merged == new_value);
        REQUIRE(d.has_value() == !(old_value == new_value));
    }
}

TEST_CASE("round trip from the zero value", "[properties][round_trip]") {
    InventoryGenerator gen{7};

    for (int i = 0; i < 100; ++i) {
        const auto value = gen.next();
        INFO("iteration " << i);

        REQUIRE(merge(Inventory{}, diff(Inventory{}, value)) == value);
        REQUIRE(merge(value, diff(value, Inventory{})) == Inventory{});
    }
}

TEST_CASE("no-op diff and no-op merge", "[properties]") {
    InventoryGenerator gen{42};

    for (int i = 0; i < 100; ++i) {
        const auto value = gen.next();
        INFO("iteration " << i);

        REQUIRE_FALSE(diff(value, value).has_value());
        REQUIRE_FALSE(diff(value, copy(value)).has_value());

        auto result = merge_changed(value, std::optional<Delta<Inventory>>{});
        REQUIRE_FALSE(result.changed);
        REQUIRE(result.value == value);
    }
}

TEST_CASE("merge leaves its base untouched", "[properties]") {
    InventoryGenerator gen{99};

    for (int i = 0; i < 100; ++i) {
        const auto base = gen.next();
        const auto before = copy(base);
        const auto target = gen.next();
        INFO("iteration " << i);

        auto merged = merge(base, diff(base, target));
        REQUIRE(merged == target);
        REQUIRE(base == before);
    }
}
