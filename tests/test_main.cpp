#include "battle.hpp"
#include "dialogue.hpp"
#include "entity.hpp"
#include "game.hpp"
#include "inventory.hpp"
#include "items.hpp"
#include "level.hpp"
#include "mapgen.hpp"
#include "npc.hpp"
#include "rng.hpp"
#include "script.hpp"
#include "settings.hpp"
#include "world.hpp"

#include <cstdint>
#include <deque>
#include <iostream>
#include <queue>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

bool logContains(const World& w, const std::string& text) {
    for (const Message& m : w.log) {
        if (m.text.find(text) != std::string::npos) return true;
    }
    return false;
}

// Open 24x16 rooms with a fixed door at (20, 8), no chests, every NPC parked
// off-map, already in free roam.
World openWorld() {
    World w = makeWorld(7, 24, 16);
    for (Level& lvl : w.levels) {
        lvl.map = Map(24, 16, TileType::Wall);
        for (int y = 1; y < 15; ++y) {
            for (int x = 1; x < 23; ++x) lvl.map.set(x, y, TileType::Floor);
        }
        lvl.chests.clear();
        lvl.spawn = {2, 2};
        lvl.door = {20, 8};
        lvl.map.set(lvl.door, TileType::Door);
    }
    for (Npc& n : w.npcs) n.present = false;
    w.player = Player(Vec2i{2, 2});
    w.current = 0;
    w.phase = PlayingPhase{};
    return w;
}

void placeNpc(World& w, NpcId id, Vec2i p) {
    Npc* n = w.npc(id);
    if (!n) return;
    n->present = true;
    n->pos = p;
}

int logCount(const World& w, const std::string& text) {
    int n = 0;
    for (const Message& m : w.log) {
        if (m.text.find(text) != std::string::npos) ++n;
    }
    return n;
}

// Room 2 with the wolf directly below the player, battle already started.
Game wolfAmbush(World w) {
    w.current = 1;
    w.player.pos = {5, 5};
    placeNpc(w, NpcId::Wolf, {5, 6});
    Game g(std::move(w));
    g.applyAction(Action::simple(ActionKind::Interact), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    return g;
}

void test_rng_reproducible() {
    RNG a(123u);
    RNG b(123u);
    for (int i = 0; i < 100; ++i) {
        expect(a.nextU64() == b.nextU64(), "RNG sequence differs for equal seeds at " + std::to_string(i));
    }

    RNG c(124u);
    RNG d(123u);
    expect(c.nextU64() != d.nextU64(), "Adjacent seeds should give different streams");

    expect(deriveSeed(42, "CHESTS"_tag) != deriveSeed(42, "NPCS"_tag), "Sub-seed tags must separate streams");
    expect(deriveSeed(42, "BATTLE"_tag) == deriveSeed(42, "BATTLE"_tag), "deriveSeed is pure");

    RNG r(9u);
    for (int i = 0; i < 1000; ++i) {
        const int v = r.range(-3, 7);
        expect(v >= -3 && v <= 7, "RNG range() out of bounds");
    }
    expect(r.range(5, 5) == 5, "Degenerate range returns lo");
    expect(!r.chance(0.0), "chance(0) never succeeds");
    expect(r.chance(1.0), "chance(1) always succeeds");
}

void test_generation_deterministic() {
    const Level a = makeLevel(42, 0, 80, 45);
    const Level b = makeLevel(42, 0, 80, 45);

    expect(a.map.tiles == b.map.tiles, "Same seed must give identical tiles");
    expect(a.door == b.door, "Same seed must give the same door");
    expect(a.spawn == b.spawn, "Same seed must give the same spawn");
    expect(a.chests.size() == b.chests.size(), "Same seed must give the same chest count");
    for (size_t i = 0; i < a.chests.size() && i < b.chests.size(); ++i) {
        expect(a.chests[i].pos == b.chests[i].pos, "Chest positions must match");
    }

    const Level other = makeLevel(43, 0, 80, 45);
    expect(other.map.tiles != a.map.tiles, "Different seeds should give different maps");

    const Level room2 = makeLevel(42, 1, 80, 45);
    expect(room2.seed == levelSeedFor(42, 1), "Room 2 uses the strided level seed");
    expect(room2.map.tiles != a.map.tiles, "Room 2 differs from room 1");
}

void test_scenario_a_generation_rules() {
    const Level lvl = makeLevel(42, 0, 80, 45);

    expect(!lvl.rooms.empty(), "Seed 42 places at least one room");
    expect(lvl.map.countTiles(TileType::Door) == 1, "Exactly one door tile");
    expect(lvl.hasDoor() && lvl.map.at(lvl.door) == TileType::Door, "Door position holds the door tile");

    const std::optional<Vec2i> first = lvl.map.findFirstFloor();
    expect(first.has_value() && *first == lvl.spawn, "Spawn is the first floor tile in scan order");
    expect(lvl.map.at(lvl.spawn) == TileType::Floor, "Spawn stays floor");
    expect(lvl.door != lvl.spawn, "Door never replaces the spawn");

    expect(lvl.chests.size() <= static_cast<size_t>(CHEST_SCATTER_MAX), "At most three scattered chests");
    expect(lvl.map.countTiles(TileType::Chest) == static_cast<int>(lvl.chests.size()),
           "Every chest has a chest tile");
    for (const Chest& c : lvl.chests) {
        expect(c.pos != lvl.spawn && c.pos != lvl.door, "Chests avoid spawn and door");
        expect(c.hasLoot(), "Scattered chests carry loot");
    }
}

void test_level_reachability() {
    for (uint64_t seed : {1ull, 42ull, 1337ull, 987654321ull}) {
        const Level lvl = makeLevel(seed, 0, 80, 45);
        const Map& m = lvl.map;

        std::vector<uint8_t> seen(static_cast<size_t>(m.width * m.height), 0);
        auto idx = [&](Vec2i p) { return static_cast<size_t>(p.y * m.width + p.x); };

        // Same moves the player has: any of the 8 neighbours that is walkable.
        std::queue<Vec2i> q;
        q.push(lvl.spawn);
        seen[idx(lvl.spawn)] = 1;
        while (!q.empty()) {
            const Vec2i p = q.front();
            q.pop();
            for (const auto& d : kNeighbourOrder) {
                const Vec2i n{p.x + d[0], p.y + d[1]};
                if (!m.isWalkable(n) || seen[idx(n)]) continue;
                seen[idx(n)] = 1;
                q.push(n);
            }
        }

        bool allReached = true;
        for (int y = 0; y < m.height; ++y) {
            for (int x = 0; x < m.width; ++x) {
                if (m.isWalkable({x, y}) && !seen[idx({x, y})]) allReached = false;
            }
        }
        expect(allReached, "Every walkable tile is reachable from spawn (seed " + std::to_string(seed) + ")");

        // The door is used from a neighbouring tile, never stepped on.
        bool doorUsable = false;
        for (const auto& d : kNeighbourOrder) {
            const Vec2i n{lvl.door.x + d[0], lvl.door.y + d[1]};
            if (m.inBounds(n) && seen[idx(n)]) doorUsable = true;
        }
        expect(lvl.hasDoor() && !m.isWalkable(lvl.door), "Door blocks movement");
        expect(doorUsable, "Door can be reached from spawn (seed " + std::to_string(seed) + ")");
    }
}

void test_small_map_is_raised() {
    const Level lvl = makeLevel(5, 0, 4, 4);
    expect(lvl.map.width == MIN_MAP_W && lvl.map.height == MIN_MAP_H, "Tiny dimensions are raised to the minimum");
    expect(lvl.map.at(lvl.spawn) == TileType::Floor, "Raised map still has a floor spawn");
}

void test_npc_roster_placement() {
    const World w = makeWorld(42);
    expect(static_cast<int>(w.npcs.size()) == NPC_COUNT, "Roster holds every NPC");

    for (const Npc& n : w.npcs) {
        expect(n.level == npcDef(n.id).level, n.name + " placed in its own room");
        expect(n.present, n.name + " found a tile");
        const Level& lvl = w.levels[static_cast<size_t>(n.level)];
        expect(lvl.map.at(n.pos) == TileType::Floor, n.name + " stands on floor");
        expect(n.pos != lvl.spawn && n.pos != lvl.door, n.name + " avoids spawn and door");
        for (const Npc& o : w.npcs) {
            if (o.id == n.id || o.level != n.level) continue;
            expect(o.pos != n.pos, "NPCs never share a tile");
        }
    }

    expect(w.player.pos == w.levels[0].spawn, "Player starts on room 1 spawn");
    expect(w.phaseKind() == PhaseKind::Title, "New worlds start on the title screen");
    expect(logContains(w, "SEED: 42"), "Welcome log names the seed");
}

void test_log_capacity() {
    World w = openWorld();
    const uint64_t before = w.logTotal;
    for (int i = 0; i < 10; ++i) w.pushLog("LINE " + std::to_string(i));
    expect(static_cast<int>(w.log.size()) == LOG_CAPACITY, "Log keeps the newest lines only");
    expect(w.log.back().text == "LINE 9", "Newest line is last");
    expect(w.log.front().text == "LINE 4", "Oldest lines are evicted first");
    expect(w.logTotal == before + 10, "logTotal counts evicted lines too");
}

void test_inventory_cursor_invariants() {
    Inventory inv;
    expect(inv.activeCursor() == 0, "Empty inventory cursor is 0");

    inv.setTab(InvTab::Consumables);
    inv.moveCursor(1);
    expect(inv.activeCursor() == 0, "Moving in an empty tab keeps cursor 0");

    for (int i = 0; i < 3; ++i) inv.addConsumable(makeConsumable(ConsumableKind::Apple));
    inv.moveCursor(-1);
    expect(inv.activeCursor() == 2, "Cursor wraps to the last row");
    inv.moveCursor(1);
    expect(inv.activeCursor() == 0, "Cursor wraps to the first row");

    inv.moveCursor(-1);
    const std::optional<Consumable> taken = inv.takeSelectedConsumable();
    expect(taken.has_value(), "Selected consumable can be taken");
    expect(inv.activeCursor() == 1, "Cursor clamps after removing the last row");

    while (inv.takeSelectedConsumable()) {}
    expect(inv.activeCursor() == 0, "Cursor returns to 0 once the list empties");

    for (int i = 0; i < CONSUMABLE_SOFT_CAP; ++i) {
        expect(inv.addConsumable(makeConsumable(ConsumableKind::Apple)), "Consumables fit under the cap");
    }
    expect(!inv.addConsumable(makeConsumable(ConsumableKind::Apple)), "Soft cap refuses the eleventh item");

    inv.cycleTab();
    expect(inv.tab == InvTab::Backpack, "Consumables -> Backpack");
    inv.cycleTab();
    expect(inv.tab == InvTab::Weapons, "Backpack -> Weapons");
    expect(inv.tabLength(InvTab::Weapons) == 0, "Weapons tab lists filled slots only");
}

void test_inventory_cursor_random_walk() {
    Player p(Vec2i{1, 1});
    RNG rng(2024u);
    const GearKind gear[] = {GearKind::WoodenSword, GearKind::WoodenShield, GearKind::IronSword,
                             GearKind::LeatherBuckler};

    auto cursorsValid = [](const Inventory& inv) {
        for (int i = 0; i < INV_TAB_COUNT; ++i) {
            const InvTab t = static_cast<InvTab>(i);
            const int len = inv.tabLength(t);
            const int c = inv.cursor(t);
            if (len == 0 ? c != 0 : (c < 0 || c >= len)) return false;
        }
        return true;
    };

    bool ok = true;
    int failedAt = -1;
    for (int step = 0; step < 3000 && ok; ++step) {
        Inventory& inv = p.inv;
        switch (rng.range(0, 8)) {
            case 0: inv.addConsumable(makeConsumable(ConsumableKind::Apple)); break;
            case 1: inv.addToBackpack(makeEquipment(gear[rng.range(0, 3)])); break;
            case 2: inv.moveCursor(rng.chance(0.5) ? 1 : -1); break;
            case 3: inv.cycleTab(); break;
            case 4: inv.takeSelectedConsumable(); break;
            case 5: p.equipFromBackpack(inv.cursor(InvTab::Backpack)); break;
            case 6: {
                const std::optional<EquipSlot> slot = inv.weaponsRowSlot(inv.cursor(InvTab::Weapons));
                if (slot) p.unequip(*slot);
                break;
            }
            case 7: inv.setTab(static_cast<InvTab>(rng.range(0, INV_TAB_COUNT - 1))); break;
            default: inv.takeBackpackItem(inv.cursor(InvTab::Backpack)); break;
        }
        if (!cursorsValid(inv)) {
            ok = false;
            failedAt = step;
        }
    }
    expect(ok, "Cursors stay inside their lists (broke at step " + std::to_string(failedAt) + ")");
    expect(static_cast<int>(p.inv.consumables.size()) <= CONSUMABLE_SOFT_CAP, "Soft cap holds throughout");
}

void test_equip_hp_rules() {
    Player p(Vec2i{1, 1});
    expect(p.hp == PLAYER_START_HP && p.hpMax == PLAYER_START_HP, "Player starts at full HP");

    p.equip(makeEquipment(GearKind::WoodenShield));
    expect(p.hpMax == PLAYER_START_HP + 5, "Shield raises max HP");
    expect(p.hp == PLAYER_START_HP, "Equipping never heals");
    expect(p.defense(0) == PLAYER_BASE_DEF + 2, "Shield adds defense");

    p.hp = p.hpMax;
    const std::optional<Equipment> removed = p.unequip(EquipSlot::Shield);
    expect(removed.has_value(), "Equipped shield can be removed");
    expect(p.hpMax == PLAYER_START_HP && p.hp == PLAYER_START_HP, "Unequip clamps HP down to the new max");
    expect(p.inv.backpack.size() == 1, "Unequipped gear goes to the backpack");

    p.equip(makeEquipment(GearKind::WoodenSword));
    p.equip(makeEquipment(GearKind::IronSword));
    expect(p.inv.sword && p.inv.sword->name == "IRON SWORD", "Newer sword replaces the old one");
    expect(p.inv.backpack.size() == 2, "Replaced sword goes to the backpack");
    expect(p.attack(0) == PLAYER_BASE_ATK + 6, "Attack reflects the equipped sword only");

    const std::optional<Equipment> back = p.equipFromBackpack(1);
    expect(back && back->name == "WOODEN SWORD", "Equip from backpack returns the item");
    expect(p.attack(0) == PLAYER_BASE_ATK + 3, "Swapped sword changes attack");
    expect(!p.equipFromBackpack(99).has_value(), "Out-of-range backpack index is refused");
}

void test_scenario_c_bitter_root_buff() {
    Player p(Vec2i{1, 1});
    p.hp = 10;

    Consumable root;
    root.name = "BITTER ROOT";
    root.heal = -2;
    root.defBonus = 5;

    const uint64_t t0 = 5000;
    const ConsumeResult r = p.consume(root, t0);
    expect(p.hp == 8 && p.hpMax == 30, "Negative heal lowers HP to 8/30");
    expect(r.hpChange == -2 && r.buffApplied, "Consume reports HP change and buff");
    expect(p.defense(t0) == PLAYER_BASE_DEF + 5, "Defense buff active immediately");
    expect(p.defense(t0 + 29999) == PLAYER_BASE_DEF + 5, "Buff still active just before 30 s");
    expect(p.defense(t0 + 31000) == PLAYER_BASE_DEF, "Buff inactive after 31 s");

    expect(p.purgeBuffs(t0 + 1000) == 0, "Active buffs are not purged");
    expect(p.purgeBuffs(t0 + 31000) == 1, "Expired buff is purged");
    expect(p.buffs.empty(), "Buff list empty after purge");

    p.hp = 1;
    p.consume(root, t0);
    expect(p.hp == 1, "Negative heal never drops HP below 1");

    p.hp = 28;
    p.consume(makeConsumable(ConsumableKind::HealingPotion), t0);
    expect(p.hp == p.hpMax, "Healing clamps at max HP");
}

void test_buff_expiry_through_controller() {
    World w = openWorld();
    w.player.inv.addConsumable(makeConsumable(ConsumableKind::FireTonic));
    Game g(std::move(w));

    g.applyAction(Action::simple(ActionKind::ToggleInventory), 0);
    g.applyAction(Action::simple(ActionKind::ToggleInvTab), 0);
    expect(g.world().player.inv.tab == InvTab::Consumables, "Tab cycles to consumables");
    g.applyAction(Action::simple(ActionKind::UseConsumable), 1000);
    expect(g.world().player.attack(1000) == PLAYER_BASE_ATK + 4, "Fire tonic grants +4 attack");
    expect(g.world().player.inv.consumables.empty(), "Used consumable leaves the inventory");

    g.applyAction(Action::none(), 20000);
    expect(!logContains(g.world(), "A BUFF WEARS OFF."), "No expiry before 30 s");
    g.applyAction(Action::none(), 31001);
    expect(logContains(g.world(), "A BUFF WEARS OFF."), "Expiry is logged");
    expect(g.world().player.buffs.empty(), "Expired buff removed");

    g.applyAction(Action::simple(ActionKind::UseConsumable), 32000);
    expect(logContains(g.world(), "NO CONSUMABLES TO USE."), "Empty consumables tab reports it");
}

void test_title_intro_flow() {
    Game g(11, 40, 30);
    expect(g.phase() == PhaseKind::Title, "Game starts at the title");

    const Vec2i start = g.world().player.pos;
    g.applyAction(Action::move(1, 0), 0);
    expect(g.world().player.pos == start && g.phase() == PhaseKind::Title, "Title ignores movement");

    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    expect(g.phase() == PhaseKind::Intro, "Confirm leaves the title");
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    expect(g.phase() == PhaseKind::Playing, "Confirm leaves the intro");

    expect(!g.applyAction(Action::quit(), 0), "Quit stops the controller");
    expect(g.applyAction(Action::none(), 0), "None keeps running");
}

void test_overlay_toggles() {
    Game g(openWorld());

    g.applyAction(Action::simple(ActionKind::ToggleInventory), 0);
    expect(g.world().inventoryOpen, "Inventory opens");
    g.applyAction(Action::move(1, 0), 0);
    expect(g.world().player.pos == Vec2i{2, 2}, "Moves are ignored while the inventory is open");
    g.applyAction(Action::simple(ActionKind::ToggleInventory), 0);
    expect(!g.world().inventoryOpen, "Second toggle closes the inventory");

    g.applyAction(Action::simple(ActionKind::ToggleStats), 0);
    g.applyAction(Action::simple(ActionKind::ToggleStats), 0);
    expect(!g.world().statsOpen, "Stats toggle is its own inverse");

    g.applyAction(Action::simple(ActionKind::ToggleInvTab), 0);
    expect(g.world().player.inv.tab == InvTab::Weapons, "Tab does nothing with the inventory closed");

    g.applyAction(Action::simple(ActionKind::ToggleInventory), 0);
    for (int i = 0; i < INV_TAB_COUNT; ++i) g.applyAction(Action::simple(ActionKind::ToggleInvTab), 0);
    expect(g.world().player.inv.tab == InvTab::Weapons, "Cycling every tab returns to the first");
    g.applyAction(Action::simple(ActionKind::ToggleInventory), 0);

    g.applyAction(Action::move(1, 1), 0);
    expect(g.world().player.pos == Vec2i{3, 3}, "Diagonal move with overlays closed");

    g.applyAction(Action::move(0, -1), 0);
    g.applyAction(Action::move(0, -1), 0);
    g.applyAction(Action::move(0, -1), 0);
    expect(g.world().player.pos == Vec2i{3, 1}, "Walls stop movement");

    g.applyAction(Action::simple(ActionKind::Interact), 0);
    expect(logContains(g.world(), "NOTHING NEARBY."), "Interact with nothing around");
}

void test_scenario_d_door_gate() {
    World w = openWorld();
    w.player.pos = {19, 8};
    w.player.equip(makeEquipment(GearKind::WoodenSword));
    Game g(std::move(w));

    g.applyAction(Action::move(1, 0), 0);
    expect(g.world().player.pos == Vec2i{19, 8}, "Doors are never walked through");

    g.applyAction(Action::simple(ActionKind::Interact), 0);
    expect(g.world().current == 0, "Door stays shut without a shield");
    expect(logContains(g.world(), "YOU NEED A SWORD AND A SHIELD"), "Blocked door logs a hint");

    World w2 = g.world();
    w2.player.equip(makeEquipment(GearKind::WoodenShield));
    Game g2(std::move(w2));
    g2.applyAction(Action::simple(ActionKind::Interact), 0);
    expect(g2.world().current == 1, "Sword and shield open the door");

    const Level& room2 = g2.world().levels[1];
    const Vec2i p = g2.world().player.pos;
    expect(chebyshev(p, room2.door) == 1, "Player arrives next to room 2's door");
    expect(room2.map.at(p) == TileType::Floor, "Arrival tile is floor");
    expect(p == Vec2i{19, 7}, "Arrival uses the first free neighbour in scan order");

    g2.applyAction(Action::simple(ActionKind::Interact), 0);
    expect(g2.world().current == 0, "The door leads back to room 1");
}

void test_dialogue_paging_primitives() {
    DialogueSession s;
    s.pages = {"A", "B", "C"};
    expect(advanceDialogue(s) == AdvanceResult::NextPage && s.page == 1, "Advance to page 2");
    expect(advanceDialogue(s) == AdvanceResult::NextPage && s.page == 2, "Advance to page 3");
    expect(advanceDialogue(s) == AdvanceResult::Closed, "Advancing past the end closes");

    DialogueSession c;
    c.pages = {"Q0", "Q1"};
    PendingChoice pc;
    pc.kind = ChoiceKind::YesNo;
    pc.page = 1;
    c.choice = pc;
    expect(!c.awaitingChoice(), "Choice not pending before its page");
    expect(advanceDialogue(c) == AdvanceResult::NextPage, "Advance to the choice page");
    expect(c.awaitingChoice(), "Choice pending on its page");
    expect(advanceDialogue(c) == AdvanceResult::Blocked && c.page == 1, "Confirm cannot skip a choice");

    rewriteRemainingPages(c, {"R0", "R1"});
    expect(c.pages.size() == 4 && c.page == 2 && c.currentPage() == "R0", "Replacement pages follow the current one");

    expect(parseChoice(ChoiceKind::YesNo, 'Y') == ChoiceAnswer::Yes, "Choices are case-insensitive");
    expect(parseChoice(ChoiceKind::YesNo, 'n') == ChoiceAnswer::No, "n means no");
    expect(!parseChoice(ChoiceKind::YesNo, 'x').has_value(), "Unknown answers are ignored");
    expect(parseChoice(ChoiceKind::StarterGear, 'H') == ChoiceAnswer::Shield, "H picks the shield");
    expect(parseChoice(ChoiceKind::ChestLoot, 'd') == ChoiceAnswer::Discard, "D leaves chest loot");
}

void test_elder_starter_gear() {
    World w = openWorld();
    placeNpc(w, NpcId::Elder, {3, 2});
    Game g(std::move(w));

    g.applyAction(Action::simple(ActionKind::Interact), 0);
    expect(g.phase() == PhaseKind::Dialogue, "Talking to the elder opens dialogue");

    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    const DialogueSession* d = g.world().dialogue();
    expect(d && d->page == 2 && d->awaitingChoice(), "Elder asks for a choice on page 3");

    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    d = g.world().dialogue();
    expect(d && d->page == 2, "Confirm does not skip the elder's choice");

    g.applyAction(Action::choose('q'), 0);
    expect(!g.world().player.inv.shield && !g.world().player.inv.sword, "Invalid answer grants nothing");

    g.applyAction(Action::choose('h'), 0);
    expect(g.world().player.inv.shield.has_value(), "H equips the wooden shield");
    expect(g.world().npc(NpcId::Elder)->questDone, "Elder's quest flag is set");
    d = g.world().dialogue();
    expect(d && d->page == 3, "Dialogue resumes after the choice");

    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    expect(g.phase() == PhaseKind::Playing, "Elder dialogue closes into free roam");

    g.applyAction(Action::simple(ActionKind::Interact), 0);
    d = g.world().dialogue();
    expect(d && !d->choice && d->pages.front().find("WITHOUT BLADE AND SHIELD") != std::string::npos,
           "Elder repeats a reminder once the gear is handed out");
}

void test_hermit_quest_reward() {
    World w = openWorld();
    w.player.equip(makeEquipment(GearKind::WoodenSword));
    placeNpc(w, NpcId::Hermit, {2, 3});
    Game g(std::move(w));

    g.applyAction(Action::simple(ActionKind::Interact), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    g.applyAction(Action::choose('n'), 0);
    expect(!g.world().npc(NpcId::Hermit)->questDone, "Declining leaves the quest open");
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    expect(g.phase() == PhaseKind::Playing, "Declined dialogue closes");

    g.applyAction(Action::simple(ActionKind::Interact), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    g.applyAction(Action::choose('Y'), 0);
    expect(g.world().npc(NpcId::Hermit)->questDone, "Accepting sets the quest flag");

    const Inventory& inv = g.world().player.inv;
    expect(inv.backpack.size() == 1 && inv.backpack[0].name == "WOODEN SHIELD",
           "Hermit hands over the missing shield");

    const DialogueSession* d = g.world().dialogue();
    expect(d && d->currentPage() == "TAKE IT. CHECK YOUR BACKPACK.", "Accepted pages follow the question");

    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    expect(g.phase() == PhaseKind::Playing, "Accepted dialogue closes");

    g.applyAction(Action::simple(ActionKind::Interact), 0);
    d = g.world().dialogue();
    expect(d && d->currentPage() == "I ALREADY GAVE YOU WHAT I HAD.", "Hermit only gives once");
    expect(g.world().player.inv.backpack.size() == 1, "No second reward");
}

void test_battle_formulas() {
    expect(damageFor(10) == 12, "floor(10 * 1.2) = 12");
    expect(damageFor(7) == 8, "floor(7 * 1.2) = 8");
    expect(damageFor(0) == 0 && damageFor(-3) == 0, "Damage is never negative");

    expect(deflectChance(0) == 0.0, "No defense, no deflection");
    expect(deflectChance(10) > 0.19 && deflectChance(10) < 0.21, "Defense 10 deflects 20%");
    expect(deflectChance(100) == 1.0, "Deflection clamps at 100%");

    expect(playerActsFirst(5, 5, false), "Ties go to the player");
    expect(!playerActsFirst(9, 5, true), "Penalty hands the enemy the first strike");
    expect(!playerActsFirst(3, 5, false), "Slower player acts second");
}

void test_scenario_b_fight_damage() {
    Player p(Vec2i{1, 1});
    p.baseAtk = 10;
    p.baseDef = 0;
    p.baseSpd = 10;

    BattleSession b;
    b.name = "DUMMY";
    b.hp = 100;
    b.hpMax = 100;
    b.atk = 0;
    b.def = 0;
    b.spd = 0;

    RNG rng(1u);
    std::vector<Message> out;
    expect(resolveFight(p, b, rng, 0, out) == BattleOutcome::Ongoing, "Dummy survives one hit");
    expect(b.hp == 88, "Attack 10 deals 12 damage");
    expect(resolveFight(p, b, rng, 0, out) == BattleOutcome::Ongoing, "Second round");
    expect(b.hp == 76, "Every non-deflected hit deals 12");
    expect(p.hp == PLAYER_START_HP, "A zero-attack enemy does no damage");
}

void test_slower_player_can_die_first() {
    Player p(Vec2i{1, 1});
    p.baseDef = 0;
    p.baseSpd = 1;
    p.hp = 5;

    BattleSession b;
    b.name = "BRUTE";
    b.hp = 10;
    b.hpMax = 10;
    b.atk = 10;
    b.spd = 5;

    RNG rng(2u);
    std::vector<Message> out;
    expect(resolveFight(p, b, rng, 0, out) == BattleOutcome::Defeat, "Faster enemy kills first");
    expect(p.hp == 0, "HP clamps at zero");
    expect(b.hp == 10, "A defeated player never strikes back");
}

void test_run_refused_when_chosen() {
    Player p(Vec2i{1, 1});
    p.baseDef = 0;

    BattleSession b;
    b.name = "WARDEN";
    b.hp = 50;
    b.hpMax = 50;
    b.atk = 1;
    b.playerInitiated = true;

    RNG rng(3u);
    for (int i = 0; i < 20; ++i) {
        std::vector<Message> out;
        const BattleOutcome o = resolveRun(p, b, rng, 0, out);
        expect(o != BattleOutcome::Fled, "Player-initiated fights cannot be fled");
        expect(!out.empty() && out.front().text == "YOU CANNOT FLEE A FIGHT YOU CHOSE!", "Refusal is logged");
    }
}

void test_ambush_victory_and_reward() {
    World w = openWorld();
    w.player.baseAtk = 50;
    w.player.hp = 500;
    w.player.hpMax = 500;
    placeNpc(w, NpcId::SlimeKing, {10, 10});
    w.player.pos = {9, 10};
    Game g(std::move(w));

    g.applyAction(Action::simple(ActionKind::Interact), 0);
    const DialogueSession* d = g.world().dialogue();
    expect(d && d->battleOnClose.has_value(), "Slime king dialogue arms an ambush");

    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    expect(g.phase() == PhaseKind::Battle, "Closing the ambush dialogue starts a battle");
    expect(g.world().battle() && !g.world().battle()->playerInitiated, "Ambushes are not player-initiated");

    for (int i = 0; i < 50 && g.phase() == PhaseKind::Battle; ++i) {
        g.applyAction(Action::battle(1), 0);
    }
    expect(g.phase() == PhaseKind::Dialogue, "Victory shows the post-battle dialogue");

    const Npc* king = g.world().npc(NpcId::SlimeKing);
    expect(king->defeated && !king->present, "Defeated boss leaves the room");

    const Level& lvl = g.world().levels[0];
    expect(lvl.chests.size() == bossRewardChests(NpcId::SlimeKing).size(), "Boss drops its reward chests");
    for (const Chest& c : lvl.chests) {
        expect(lvl.map.at(c.pos) == TileType::Chest, "Reward chest has a chest tile");
        expect(c.pos != g.world().player.pos && c.pos != lvl.door, "Reward avoids player and door");
    }

    const DialogueSession* post = g.world().dialogue();
    expect(post && post->postBattle, "Post-battle dialogue is marked as such");
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    expect(g.phase() == PhaseKind::Playing, "Epilogue closes into free roam");

    g.applyAction(Action::simple(ActionKind::Interact), 0);
    expect(g.phase() == PhaseKind::Playing, "Nothing left to talk to where the boss stood");
}

void test_warden_challenge() {
    World w = openWorld();
    w.current = 1;
    w.player.pos = {5, 5};
    placeNpc(w, NpcId::Warden, {6, 5});
    Game g(std::move(w));

    g.applyAction(Action::simple(ActionKind::Interact), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    g.applyAction(Action::choose('n'), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    expect(g.phase() == PhaseKind::Playing, "Declining the warden starts nothing");

    g.applyAction(Action::simple(ActionKind::Interact), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    g.applyAction(Action::choose('y'), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    expect(g.phase() == PhaseKind::Battle, "Accepting the challenge starts a battle");
    expect(g.world().battle() && g.world().battle()->playerInitiated, "Challenge is player-initiated");

    g.applyAction(Action::battle(3), 0);
    expect(logContains(g.world(), "YOU CANNOT FLEE A FIGHT YOU CHOSE!"), "Running is refused");
    expect(g.phase() == PhaseKind::Battle, "Refused flight keeps the battle going");
}

void test_defeat_reaches_ending() {
    World w = openWorld();
    w.current = 1;
    w.player.pos = {5, 5};
    w.player.baseDef = 0;
    w.player.hp = 1;
    placeNpc(w, NpcId::Wolf, {5, 6});
    Game g(std::move(w));

    g.applyAction(Action::simple(ActionKind::Interact), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    expect(g.phase() == PhaseKind::Battle, "The wolf attacks");

    g.applyAction(Action::battle(1), 0);
    expect(g.phase() == PhaseKind::Ending, "Losing ends the game");
    const auto* end = std::get_if<EndingPhase>(&g.world().phase);
    expect(end && end->cause == "DEFEATED BY THE GAUNT WOLF", "Ending names the winner");

    g.applyAction(Action::move(1, 0), 0);
    expect(g.phase() == PhaseKind::Ending, "The ending ignores further input");
    expect(!g.applyAction(Action::quit(), 0), "Quit still stops the controller");
}

void test_battle_items() {
    World w = openWorld();
    w.current = 1;
    w.player.pos = {5, 5};
    w.player.hp = 10;
    placeNpc(w, NpcId::Wolf, {5, 6});
    Game g(std::move(w));

    g.applyAction(Action::simple(ActionKind::Interact), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);

    g.applyAction(Action::battle(2), 0);
    expect(g.world().inventoryOpen, "Option 2 opens the item list");
    expect(g.world().player.hp == 10, "Opening the item list costs nothing");

    g.applyAction(Action::simple(ActionKind::UseConsumable), 0);
    expect(logContains(g.world(), "NO CONSUMABLES TO USE."), "Empty list is reported");
    expect(g.world().player.hp == 10 && g.world().inventoryOpen, "Using nothing costs no turn");

    g.applyAction(Action::simple(ActionKind::ToggleInventory), 0);
    expect(!g.world().inventoryOpen, "The item list closes again");

    World w2 = g.world();
    w2.player.inv.addConsumable(makeConsumable(ConsumableKind::HoneyCake));
    Game g2(std::move(w2));
    g2.applyAction(Action::simple(ActionKind::ToggleInventory), 0);
    g2.applyAction(Action::simple(ActionKind::UseConsumable), 0);
    expect(g2.world().player.inv.consumables.empty(), "Item consumed in battle");
    expect(!g2.world().inventoryOpen, "Using an item closes the list");
    expect(logContains(g2.world(), "YOU USE THE HONEY CAKE"), "Item use is logged");
    expect(logContains(g2.world(), "GAUNT WOLF"), "The enemy answers the item use");
}

void test_penalty_lasts_one_turn() {
    World w = openWorld();
    w.player.baseSpd = 20;
    w.player.baseDef = 0;
    w.player.hp = 500;
    w.player.hpMax = 500;
    Game g = wolfAmbush(std::move(w));
    expect(g.phase() == PhaseKind::Battle, "The wolf attacks");

    const int hp0 = g.world().player.hp;
    g.applyAction(Action::battle(1, true), 0);
    expect(logContains(g.world(), "YOU HESITATED! THE GAUNT WOLF STRIKES FIRST."), "Slow decision is logged");

    const std::deque<Message>& lines = g.world().log;
    bool enemyFirst = false;
    for (size_t i = 0; i + 1 < lines.size(); ++i) {
        if (lines[i].text.find("YOU HESITATED") != std::string::npos) {
            enemyFirst = lines[i + 1].text == "THE GAUNT WOLF HITS YOU FOR 6.";
        }
    }
    expect(enemyFirst, "A faster player still lets the enemy strike first under the penalty");
    expect(g.world().player.hp == hp0 - 6, "The enemy's hit lands exactly once");
    expect(g.world().battle() && !g.world().battle()->penalty, "Penalty is cleared after the turn");

    g.applyAction(Action::battle(1), 0);
    const std::deque<Message>& after = g.world().log;
    expect(after.size() >= 2, "Second turn logs both strikes");
    if (after.size() >= 2) {
        const std::string& first = after[after.size() - 2].text;
        expect(first.find("YOU HIT THE GAUNT WOLF") != std::string::npos ||
                   first.find("DEFLECTS YOUR BLOW") != std::string::npos,
               "Without the penalty the faster player acts first");
        expect(after.back().text == "THE GAUNT WOLF HITS YOU FOR 6.", "The enemy answers second");
    }
    expect(logCount(g.world(), "YOU HESITATED") == 1, "No hesitation on the second turn");
}

void test_flee_success() {
    World w = openWorld();
    w.player.baseDef = 0;
    w.player.hp = 500;
    w.player.hpMax = 500;
    Game g = wolfAmbush(std::move(w));
    expect(g.phase() == PhaseKind::Battle && !g.world().battle()->playerInitiated, "Ambush can be fled");

    for (int i = 0; i < 60 && g.phase() == PhaseKind::Battle; ++i) {
        g.applyAction(Action::battle(3), 0);
    }
    expect(g.phase() == PhaseKind::Playing, "A successful escape returns to free roam");
    expect(g.world().battle() == nullptr, "Battle session is gone");
    expect(logContains(g.world(), "YOU ESCAPE FROM THE GAUNT WOLF."), "Escape is logged");

    const Npc* wolf = g.world().npc(NpcId::Wolf);
    expect(wolf->present && !wolf->defeated, "The wolf stays after an escape");
    expect(wolf->pos == Vec2i{5, 6}, "The wolf keeps its tile");
}

void test_warden_victory_chests() {
    World w = openWorld();
    w.current = 1;
    w.player.pos = {5, 5};
    w.player.baseAtk = 50;
    w.player.baseSpd = 20;
    w.player.hp = 500;
    w.player.hpMax = 500;
    placeNpc(w, NpcId::Warden, {6, 5});
    Game g(std::move(w));

    g.applyAction(Action::simple(ActionKind::Interact), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    g.applyAction(Action::choose('y'), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    expect(g.phase() == PhaseKind::Battle, "Challenge accepted");

    for (int i = 0; i < 50 && g.phase() == PhaseKind::Battle; ++i) {
        g.applyAction(Action::battle(1), 0);
    }
    expect(g.phase() == PhaseKind::Dialogue, "Victory shows the warden's last words");

    const Npc* warden = g.world().npc(NpcId::Warden);
    expect(warden->defeated && !warden->present, "The warden leaves the grove");

    const Level& room2 = g.world().levels[1];
    expect(room2.chests.size() == 2, "The warden drops two chests");
    if (room2.chests.size() == 2) {
        expect(room2.chests[0].pos == Vec2i{6, 5}, "First chest on the warden's own tile");
        expect(room2.chests[1].pos == Vec2i{5, 4}, "Second chest on the first free neighbour");
        for (const Chest& c : room2.chests) {
            expect(room2.map.at(c.pos) == TileType::Chest, "Reward chests have chest tiles");
        }
    }

    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    expect(g.phase() == PhaseKind::Playing, "Beating the warden does not end the game");

    g.applyAction(Action::move(1, 0), 0);
    expect(g.world().player.inv.sword && g.world().player.inv.sword->name == "THORN BLADE",
           "The thorn blade equips into the empty sword slot");
    const DialogueSession* d = g.world().dialogue();
    expect(d && d->title == "CHEST", "The chest's consumable asks what to do");
}

void test_wolf_victory_keeps_wolf() {
    World w = openWorld();
    w.player.baseAtk = 50;
    w.player.baseSpd = 20;
    w.player.hp = 500;
    w.player.hpMax = 500;
    Game g = wolfAmbush(std::move(w));

    for (int i = 0; i < 50 && g.phase() == PhaseKind::Battle; ++i) {
        g.applyAction(Action::battle(1), 0);
    }
    const DialogueSession* post = g.world().dialogue();
    expect(post && post->postBattle, "Post-battle dialogue after beating the wolf");
    expect(post && post->currentPage() == "THE WOLF LIMPS AWAY TO LICK ITS WOUNDS.", "Wolf epilogue shown");

    const Npc* wolf = g.world().npc(NpcId::Wolf);
    expect(wolf->defeated && wolf->present, "The wolf is not a boss and stays");
    expect(wolf->pos == Vec2i{5, 6}, "The wolf keeps its tile");
    expect(g.world().levels[1].chests.empty(), "The wolf drops nothing");

    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    expect(g.phase() == PhaseKind::Playing, "Epilogue closes into free roam");

    g.applyAction(Action::simple(ActionKind::Interact), 0);
    const DialogueSession* d = g.world().dialogue();
    expect(d && d->currentPage() == "THE WOLF WHIMPERS AND KEEPS ITS DISTANCE.", "Beaten wolf has new lines");
    expect(d && !d->battleOnClose, "A beaten wolf does not attack again");

    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    expect(g.phase() == PhaseKind::Playing, "Talking to the beaten wolf starts nothing");
}

void test_chest_loot_prompt() {
    World w = openWorld();
    Chest c;
    c.pos = {3, 2};
    c.consumable = makeConsumable(ConsumableKind::Apple);
    w.levels[0].addChest(c);

    Chest gear;
    gear.pos = {2, 3};
    gear.equipment = makeEquipment(GearKind::IronSword);
    w.levels[0].addChest(gear);

    Game g(std::move(w));

    g.applyAction(Action::move(1, 0), 0);
    expect(g.world().player.pos == Vec2i{3, 2}, "Chests are walkable");
    expect(g.world().levels[0].map.at(3, 2) == TileType::Floor, "An opened chest becomes floor");
    const DialogueSession* d = g.world().dialogue();
    expect(d && d->title == "CHEST", "Consumable loot asks what to do");

    g.applyAction(Action::simple(ActionKind::Confirm), 0);
    g.applyAction(Action::choose('t'), 0);
    expect(g.phase() == PhaseKind::Playing, "Answering closes the prompt");
    expect(g.world().player.inv.consumables.size() == 1, "Take stores the consumable");

    g.applyAction(Action::move(-1, 1), 0);
    expect(g.world().player.inv.sword && g.world().player.inv.sword->name == "IRON SWORD",
           "Gear auto-equips into an empty slot");
    expect(g.phase() == PhaseKind::Playing, "Gear-only chests need no prompt");
}

void test_chest_loot_answers() {
    World w = openWorld();
    w.player.hp = 10;
    for (int i = 0; i < CONSUMABLE_SOFT_CAP; ++i) w.player.inv.addConsumable(makeConsumable(ConsumableKind::Apple));

    const ConsumableKind loot[] = {ConsumableKind::HoneyCake, ConsumableKind::Apple, ConsumableKind::HealingPotion};
    for (int i = 0; i < 3; ++i) {
        Chest c;
        c.pos = {3 + i, 2};
        c.consumable = makeConsumable(loot[i]);
        w.levels[0].addChest(c);
    }
    Game g(std::move(w));

    auto openNext = [&g](char answer) {
        g.applyAction(Action::move(1, 0), 0);
        g.applyAction(Action::simple(ActionKind::Confirm), 0);
        g.applyAction(Action::choose(answer), 0);
    };

    openNext('u');
    expect(g.phase() == PhaseKind::Playing, "Use closes the prompt");
    expect(g.world().player.hp == 18, "Using the honey cake heals at once");
    expect(logContains(g.world(), "YOU USE THE HONEY CAKE"), "Immediate use is logged");
    expect(static_cast<int>(g.world().player.inv.consumables.size()) == CONSUMABLE_SOFT_CAP,
           "Using chest loot never touches the pack");

    openNext('D');
    expect(g.phase() == PhaseKind::Playing, "Discard closes the prompt");
    expect(logContains(g.world(), "YOU LEAVE THE APPLE BEHIND."), "Discard is logged");
    expect(static_cast<int>(g.world().player.inv.consumables.size()) == CONSUMABLE_SOFT_CAP, "Discard adds nothing");

    openNext('t');
    expect(g.phase() == PhaseKind::Playing, "Take with a full pack still closes the prompt");
    expect(logContains(g.world(), "YOUR PACK IS FULL. YOU LEAVE THE HEALING POTION BEHIND."), "Full pack is reported");
    expect(static_cast<int>(g.world().player.inv.consumables.size()) == CONSUMABLE_SOFT_CAP,
           "Nothing is added past the soft cap");
    expect(g.world().levels[0].map.at(5, 2) == TileType::Floor, "The chest is spent either way");
}

void test_settings_parse() {
    std::istringstream in(
        "# comment\n"
        "seed = 12345\n"
        "map_width = 10   ; below the minimum\n"
        "map_height = 50\n"
        "battle_penalty_ms = 99999\n"
        "step_ms = abc\n"
        "vsync = off\n"
        "unknown_key = 1\n"
        "bind_up = w, up\n");
    const Settings s = parseSettings(in);

    expect(s.seed == 12345u, "Seed parsed");
    expect(s.mapWidth == 24, "Width clamped up");
    expect(s.mapHeight == 50, "Height read as-is");
    expect(s.battlePenaltyMs == 60000, "Penalty clamped down");
    expect(s.stepMs == 100, "Unparsable value keeps the default");
    expect(!s.vsync, "Boolean parsed");

    expect(clampMapWidth(10000) == MAP_WIDTH_MAX && clampMapWidth(3) == MAP_WIDTH_MIN, "Width range matches settings");
    expect(clampMapHeight(500) == MAP_HEIGHT_MAX && clampMapHeight(0) == MAP_HEIGHT_MIN, "Height range matches settings");
    expect(clampMapWidth(100) == 100, "In-range width kept");

    const Settings missing = loadSettings("this/file/does/not/exist.ini");
    expect(missing.mapWidth == 80 && missing.mapHeight == 45, "Missing file gives defaults");
}

void test_script_parse_and_run() {
    std::istringstream good(
        "# walk in\n"
        "confirm\n"
        "wait 500\n"
        "CONFIRM   # case-insensitive\n"
        "move 1 0\n"
        "battle 1 penalty\n"
        "choice y\n"
        "quit\n"
        "confirm\n");
    std::vector<ScriptStep> steps;
    std::string err;
    expect(parseScript(good, steps, &err), "Valid script parses: " + err);
    expect(steps.size() == 8, "Comment and blank lines are skipped");
    expect(steps[1].kind == ScriptStepKind::Wait && steps[1].waitMs == 500, "wait parsed");
    expect(steps[4].action.kind == ActionKind::BattleOption && steps[4].action.penalty, "battle flag parsed");
    expect(formatAction(steps[4].action) == "battle 1 penalty", "formatAction round-trips battle");
    expect(steps[3].line == 5, "Steps remember their source line");

    std::istringstream bad("confirm\nmove 2 0\n");
    std::vector<ScriptStep> badSteps;
    std::string badErr;
    expect(!parseScript(bad, badSteps, &badErr), "Out-of-range move is rejected");
    expect(badErr.rfind("line 2:", 0) == 0, "Error names the line");

    Game g(3, 40, 30);
    const ScriptRunResult r = runScript(g, steps, 100);
    expect(r.quit, "Quit stops the script");
    expect(r.actionsApplied == 6, "Actions up to and including quit are applied");
    expect(r.endMs == 1100, "Clock advances per action and wait");
    expect(g.phase() != PhaseKind::Title && g.phase() != PhaseKind::Intro, "Two confirms leave title and intro");
}

} // namespace

int main() {
    std::cout << "Running Sunny Days tests...\n";

    test_rng_reproducible();
    test_generation_deterministic();
    test_scenario_a_generation_rules();
    test_level_reachability();
    test_small_map_is_raised();
    test_npc_roster_placement();
    test_log_capacity();

    test_inventory_cursor_invariants();
    test_inventory_cursor_random_walk();
    test_equip_hp_rules();
    test_scenario_c_bitter_root_buff();
    test_buff_expiry_through_controller();

    test_title_intro_flow();
    test_overlay_toggles();
    test_scenario_d_door_gate();

    test_dialogue_paging_primitives();
    test_elder_starter_gear();
    test_hermit_quest_reward();

    test_battle_formulas();
    test_scenario_b_fight_damage();
    test_slower_player_can_die_first();
    test_run_refused_when_chosen();
    test_ambush_victory_and_reward();
    test_warden_challenge();
    test_defeat_reaches_ending();
    test_battle_items();
    test_penalty_lasts_one_turn();
    test_flee_success();
    test_warden_victory_chests();
    test_wolf_victory_keeps_wolf();

    test_chest_loot_prompt();
    test_chest_loot_answers();

    test_settings_parse();
    test_script_parse_and_run();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
