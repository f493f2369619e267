#pragma once
#include "common.hpp"
#include "items.hpp"
#include "map.hpp"
#include "mapgen.hpp"
#include "rng.hpp"

#include <cstdint>
#include <optional>
#include <vector>

// Smallest dimensions makeLevel() accepts; smaller requests are raised.
// At this size the first room attempt always fits, so every level has at
// least one 7x7 room of floor.
inline constexpr int MIN_MAP_W = 24;
inline constexpr int MIN_MAP_H = 16;

inline constexpr int LEVEL_COUNT = 2;
inline constexpr int CHEST_SCATTER_MAX = 3;
inline constexpr int SCATTER_ATTEMPTS = 200;
inline constexpr uint64_t LEVEL_SEED_STRIDE = 9973;
inline constexpr uint64_t DOOR_SEED_SALT = 0xD00D;

struct Chest {
    Vec2i pos{0, 0};
    std::optional<Consumable> consumable;
    std::optional<Equipment> equipment;
    bool opened = false;

    bool hasLoot() const { return consumable.has_value() || equipment.has_value(); }
};

struct Level {
    int depth = 0;
    uint64_t seed = 0;
    Map map;
    Vec2i spawn{-1, -1};
    Vec2i door{-1, -1};
    std::vector<Room> rooms;
    std::vector<Chest> chests;

    bool hasDoor() const { return map.inBounds(door); }

    // Unopened chest at `p`, or nullptr.
    Chest* chestAt(Vec2i p);
    const Chest* chestAt(Vec2i p) const;

    // Places a fresh chest (tile becomes Chest). Fails if `p` is not Floor.
    bool addChest(Chest c);
};

// Sub-seed of one level: base + depth * stride (wrapping).
uint64_t levelSeedFor(uint64_t baseSeed, int depth);

// Generates a complete level: geometry, spawn, door, scattered chests.
Level makeLevel(uint64_t baseSeed, int depth, int width, int height);

bool containsPos(const std::vector<Vec2i>& list, Vec2i p);

// Uniform pick among Floor tiles not in `exclude`. Empty if none qualifies.
std::optional<Vec2i> pickUniformFloor(const Map& m, const std::vector<Vec2i>& exclude, RNG& rng);

// Rejection-samples random coordinates for a Floor tile not in `exclude`,
// then falls back to pickUniformFloor().
std::optional<Vec2i> scatterFloor(const Map& m, const std::vector<Vec2i>& exclude, RNG& rng,
                                  int attempts = SCATTER_ATTEMPTS);

// Converts one uniformly chosen Floor tile (never `spawn`) into the Door.
std::optional<Vec2i> placeRandomDoor(Map& m, Vec2i spawn, RNG& rng);

// Rolls a scattered chest's contents from the depth's loot table.
Chest rollChestLoot(int depth, RNG& rng);

// Scatters up to `count` loot chests on free Floor tiles (not spawn/door/other chests).
void scatterChests(Level& lvl, RNG& rng, int count = CHEST_SCATTER_MAX);
