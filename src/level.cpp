#include "level.hpp"

#include <algorithm>
#include <utility>

namespace {

struct LootTable {
    std::vector<ConsumableKind> consumables;
    std::vector<GearKind> gear;
};

const LootTable& lootTableFor(int depth) {
    static const LootTable room1{
        {ConsumableKind::Apple, ConsumableKind::HoneyCake, ConsumableKind::BitterRoot},
        {GearKind::TravelerKnife, GearKind::LeatherBuckler},
    };
    static const LootTable room2{
        {ConsumableKind::HoneyCake, ConsumableKind::HealingPotion, ConsumableKind::FireTonic, ConsumableKind::BitterRoot},
        {GearKind::TravelerKnife, GearKind::LeatherBuckler},
    };
    return depth <= 0 ? room1 : room2;
}

} // namespace

Chest* Level::chestAt(Vec2i p) {
    for (Chest& c : chests) {
        if (!c.opened && c.pos == p) return &c;
    }
    return nullptr;
}

const Chest* Level::chestAt(Vec2i p) const {
    for (const Chest& c : chests) {
        if (!c.opened && c.pos == p) return &c;
    }
    return nullptr;
}

bool Level::addChest(Chest c) {
    if (!map.inBounds(c.pos) || map.at(c.pos) != TileType::Floor) return false;
    map.set(c.pos, TileType::Chest);
    c.opened = false;
    chests.push_back(std::move(c));
    return true;
}

uint64_t levelSeedFor(uint64_t baseSeed, int depth) {
    return baseSeed + static_cast<uint64_t>(depth) * LEVEL_SEED_STRIDE;
}

bool containsPos(const std::vector<Vec2i>& list, Vec2i p) {
    return std::find(list.begin(), list.end(), p) != list.end();
}

std::optional<Vec2i> pickUniformFloor(const Map& m, const std::vector<Vec2i>& exclude, RNG& rng) {
    std::vector<Vec2i> candidates;
    for (const Vec2i& p : m.tilesOfType(TileType::Floor)) {
        if (!containsPos(exclude, p)) candidates.push_back(p);
    }
    if (candidates.empty()) return std::nullopt;
    return candidates[rng.index(candidates.size())];
}

std::optional<Vec2i> scatterFloor(const Map& m, const std::vector<Vec2i>& exclude, RNG& rng, int attempts) {
    if (m.width <= 0 || m.height <= 0) return std::nullopt;
    for (int i = 0; i < attempts; ++i) {
        const Vec2i p{rng.range(0, m.width - 1), rng.range(0, m.height - 1)};
        if (m.at(p) != TileType::Floor) continue;
        if (containsPos(exclude, p)) continue;
        return p;
    }
    return pickUniformFloor(m, exclude, rng);
}

std::optional<Vec2i> placeRandomDoor(Map& m, Vec2i spawn, RNG& rng) {
    const std::optional<Vec2i> door = pickUniformFloor(m, {spawn}, rng);
    if (!door) return std::nullopt;
    m.set(*door, TileType::Door);
    return door;
}

Chest rollChestLoot(int depth, RNG& rng) {
    const LootTable& t = lootTableFor(depth);
    Chest c;

    const int roll = rng.range(0, 99);
    const bool wantConsumable = roll < 65 || roll >= 85;
    const bool wantGear = roll >= 65;

    if (wantConsumable && !t.consumables.empty()) {
        c.consumable = makeConsumable(t.consumables[rng.index(t.consumables.size())]);
    }
    if (wantGear && !t.gear.empty()) {
        c.equipment = makeEquipment(t.gear[rng.index(t.gear.size())]);
    }
    return c;
}

void scatterChests(Level& lvl, RNG& rng, int count) {
    std::vector<Vec2i> exclude{lvl.spawn, lvl.door};
    for (const Chest& c : lvl.chests) exclude.push_back(c.pos);

    for (int i = 0; i < count; ++i) {
        const std::optional<Vec2i> p = scatterFloor(lvl.map, exclude, rng);
        if (!p) break;

        Chest c = rollChestLoot(lvl.depth, rng);
        c.pos = *p;
        if (lvl.addChest(std::move(c))) exclude.push_back(*p);
    }
}

Level makeLevel(uint64_t baseSeed, int depth, int width, int height) {
    width = std::max(width, MIN_MAP_W);
    height = std::max(height, MIN_MAP_H);

    Level lvl;
    lvl.depth = depth;
    lvl.seed = levelSeedFor(baseSeed, depth);
    lvl.map = generateRoomsAndCorridors(width, height, lvl.seed, &lvl.rooms);

    if (const std::optional<Vec2i> first = lvl.map.findFirstFloor()) {
        lvl.spawn = *first;
    } else {
        lvl.spawn = {1, 1};
        lvl.map.set(lvl.spawn, TileType::Floor);
    }

    RNG doorRng(lvl.seed ^ DOOR_SEED_SALT);
    if (const std::optional<Vec2i> door = placeRandomDoor(lvl.map, lvl.spawn, doorRng)) {
        lvl.door = *door;
    }

    RNG chestRng(deriveSeed(lvl.seed, "CHESTS"_tag));
    scatterChests(lvl, chestRng, CHEST_SCATTER_MAX);

    return lvl;
}
