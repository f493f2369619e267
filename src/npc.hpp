#pragma once
#include "common.hpp"
#include "level.hpp"
#include "rng.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class NpcId : uint8_t {
    Elder = 0,
    Hermit,
    SlimeKing,
    Wolf,
    Warden,
};

inline constexpr int NPC_COUNT = static_cast<int>(NpcId::Warden) + 1;

struct EnemyStats {
    int hp = 0;
    int atk = 0;
    int def = 0;
    int spd = 0;
};

// How a boss's reward chests are positioned after its defeat.
enum class RewardPlacement : uint8_t {
    None = 0,
    // Random Floor tile near the boss's last position.
    Scattered,
    // Boss tile first, then its neighbours in the fixed scan order.
    Controlled,
};

struct NpcDef {
    NpcId id;
    const char* name;
    int level;
    char symbol;

    bool hostile = false;
    // Bosses leave the world when defeated and drop reward chests.
    bool boss = false;
    EnemyStats enemy;

    RewardPlacement rewardPlacement = RewardPlacement::None;
};

const NpcDef& npcDef(NpcId id);

struct Npc {
    NpcId id = NpcId::Elder;
    std::string name;
    int level = 0;
    Vec2i pos{-1, -1};
    char symbol = '?';

    // False once a boss is removed, or if no tile could be found at creation.
    bool present = true;

    // One-way flags. Never cleared once set.
    bool questDone = false;
    bool defeated = false;
};

// NPC spacing used by placement (Chebyshev distance).
inline constexpr int NPC_SPACING = 5;
inline constexpr int NPC_SPACING_RELAXED = 2;

// Chebyshev radius for scattered boss rewards.
inline constexpr int REWARD_SCATTER_RADIUS = 3;

// Picks a free Floor tile for an NPC: spaced `spacing` from every tile in
// `spacedFrom`, then relaxed spacing, then any free Floor tile.
std::optional<Vec2i> pickNpcTile(const Map& m, const std::vector<Vec2i>& occupied,
                                 const std::vector<Vec2i>& spacedFrom, RNG& rng);

// Builds and places the fixed roster on the given levels.
std::vector<Npc> makeNpcRoster(const std::array<Level, LEVEL_COUNT>& levels);

// Rewards dropped by a defeated boss (one chest per entry).
std::vector<Chest> bossRewardChests(NpcId id);
