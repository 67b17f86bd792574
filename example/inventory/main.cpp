// main.cpp
// Inventory Example - Diff, merge and copy over nested records
//
// This example walks through the library on a small game inventory:
//
// Step 1: Describe the record types and print their schema
// Step 2: Diff two versions of an inventory and list the changes
// Step 3: Merge the delta back and check the copy-on-write sharing
// Step 4: Deep copy for independent storage
// Step 5: A lager store driven by deltas, with undo built from reverse deltas

#include <record_delta/record_delta.h>
#include <record_delta/lager_adapters.h>

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using namespace record_delta;

// ============================================================
// Record Types
// ============================================================

namespace game {

struct Stats
{
    int32_t level = 0;
    double experience = 0.0;

    bool operator==(const Stats&) const = default;
};
RECORD_DELTA_RECORD(Stats,
    RECORD_DELTA_FIELD(Stats, level),
    RECORD_DELTA_FIELD(Stats, experience))

struct Item
{
    std::string label;
    int32_t count = 0;
    bool equipped = false;

    bool operator==(const Item&) const = default;
};
RECORD_DELTA_RECORD(Item,
    RECORD_DELTA_FIELD(Item, label),
    RECORD_DELTA_FIELD(Item, count),
    RECORD_DELTA_FIELD(Item, equipped))

struct Character
{
    std::string name;
    int64_t gold = 0;
    Stats stats;
    RecordMap<std::string, Item> items;

    bool operator==(const Character&) const = default;
};
RECORD_DELTA_ROOT(Character,
    RECORD_DELTA_FIELD(Character, name),
    RECORD_DELTA_FIELD(Character, gold),
    RECORD_DELTA_FIELD(Character, stats),
    RECORD_DELTA_FIELD(Character, items))

} // namespace game

using game::Character;
using game::Item;

// ============================================================
// Helpers
// ============================================================

Item make_item(std::string label, int32_t count)
{
    Item item;
    item.label = std::move(label);
    item.count = count;
    return item;
}

Character create_initial_character()
{
    Character c;
    c.name = "Alice";
    c.gold = 120;
    c.stats = game::Stats{7, 1250.5};
    c.items = c.items
        .set("sword", RecordBox<Item>{make_item("Sword", 1)})
        .set("arrows", RecordBox<Item>{make_item("Arrows", 40)})
        .set("potion", RecordBox<Item>{make_item("Potion", 3)});
    return c;
}

void print_character(const Character& c)
{
    std::cout << "  " << c.name << " (level " << c.stats.level << ", " << c.gold << " gold)\n";
    for (const auto& [key, item] : c.items) {
        std::cout << "    " << key << ": " << item->label << " x" << item->count
                  << (item->equipped ? " [equipped]" : "") << "\n";
    }
}

const char* yes_no(bool value)
{
    return value ? "yes" : "no";
}

// ============================================================
// Main Application
// ============================================================

int main()
{
    std::cout << "=== Inventory Example ===\n\n";

    // --------------------------------------------------------
    // Step 1: schema
    // --------------------------------------------------------
    std::cout << "--- Step 1: Schema ---\n";
    try {
        auto schema = validated_schema_of<Character>();
        std::cout << schema.to_string() << "\n";
    } catch (const SchemaError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    // --------------------------------------------------------
    // Step 2: diff
    // --------------------------------------------------------
    std::cout << "--- Step 2: Diff ---\n";
    auto before = create_initial_character();

    auto after = before;
    after.gold = 95;
    after.stats.level = 8;
    auto sword = after.items.at("sword").get();
    sword.equipped = true;
    after.items = after.items
        .set("sword", RecordBox<Item>{sword})
        .erase("potion")
        .set("rope", RecordBox<Item>{make_item("Rope", 1)});

    auto delta = diff(before, after);
    print_changes(collect_changes(delta));
    std::cout << "  diff(before, before) is absent: " << yes_no(!diff(before, before).has_value()) << "\n\n";

    // --------------------------------------------------------
    // Step 3: merge
    // --------------------------------------------------------
    std::cout << "--- Step 3: Merge ---\n";
    auto merged = merge(before, delta);
    print_character(merged);
    std::cout << "  merge(before, diff(before, after)) == after: " << yes_no(merged == after) << "\n";
    std::cout << "  'arrows' still shared with before: "
              << yes_no(shares_storage(*merged.items.find("arrows"), *before.items.find("arrows"))) << "\n";
    std::cout << "  before left untouched: " << yes_no(before == create_initial_character()) << "\n\n";

    // --------------------------------------------------------
    // Step 4: copy
    // --------------------------------------------------------
    std::cout << "--- Step 4: Copy ---\n";
    auto independent = copy(merged);
    std::cout << "  copy == original: " << yes_no(independent == merged) << "\n";
    std::cout << "  items storage shared: " << yes_no(shares_storage(independent.items, merged.items)) << "\n\n";

    // --------------------------------------------------------
    // Step 5: lager store
    // --------------------------------------------------------
    std::cout << "--- Step 5: Store ---\n";

    // Each reported delta is inverted into an undo entry
    std::vector<Delta<Character>> undo_stack;

    auto store = lager::make_store<ApplyDelta<Character>>(
        create_initial_character(),
        lager::with_manual_event_loop{},
        lager::with_reducer(delta_reducer<Character>()),
        delta_middleware<Character>([&](const Delta<Character>& d) {
            std::cout << "  store changed:\n";
            print_changes(collect_changes(d));
        }));

    auto apply = [&](const Character& target) {
        if (auto forward = diff(store.get(), target)) {
            if (auto backward = diff(target, store.get())) {
                undo_stack.push_back(std::move(*backward));
            }
            store.dispatch(ApplyDelta<Character>{std::move(*forward)});
        }
    };

    apply(after);

    auto richer = store.get();
    richer.gold += 1000;
    apply(richer);

    // Dispatching an equal value produces no delta and no report
    apply(store.get());

    while (!undo_stack.empty()) {
        std::cout << "  undo\n";
        store.dispatch(ApplyDelta<Character>{undo_stack.back()});
        undo_stack.pop_back();
    }

    const auto& last = store.get();
    print_character(last);
    std::cout << "  back to the initial state: " << yes_no(last == create_initial_character()) << "\n";

    return 0;
}
