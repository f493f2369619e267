#pragma once
#include "battle.hpp"
#include "common.hpp"
#include "dialogue.hpp"
#include "entity.hpp"
#include "level.hpp"
#include "message.hpp"
#include "npc.hpp"
#include "rng.hpp"

#include <array>
#include <cstdint>
#include <deque>
#include <string>
#include <variant>
#include <vector>

inline constexpr int LOG_CAPACITY = 6;

inline constexpr int DEFAULT_MAP_W = 80;
inline constexpr int DEFAULT_MAP_H = 45;

// Game phases. Each phase carries only the data valid while it is active, so
// a battle or dialogue phase can never exist without its session.
struct TitlePhase {};
struct IntroPhase {};
struct PlayingPhase {};
struct DialoguePhase {
    DialogueSession session;
};
struct BattlePhase {
    BattleSession session;
};
struct EndingPhase {
    // e.g. "DEFEATED BY THE SLIME KING"
    std::string cause;
};

using Phase = std::variant<TitlePhase, IntroPhase, PlayingPhase, DialoguePhase, BattlePhase, EndingPhase>;

// Matches the variant's alternative order.
enum class PhaseKind : uint8_t {
    Title = 0,
    Intro,
    Playing,
    Dialogue,
    Battle,
    Ending,
};

inline PhaseKind phaseKindOf(const Phase& p) {
    return static_cast<PhaseKind>(p.index());
}

const char* phaseName(PhaseKind k);

struct World {
    uint64_t seed = 0;

    std::array<Level, LEVEL_COUNT> levels;
    // 0 = Room 1, 1 = Room 2
    int current = 0;

    Player player;
    std::vector<Npc> npcs;

    // Newest last, at most LOG_CAPACITY entries.
    std::deque<Message> log;
    // Every line ever pushed, evicted ones included.
    uint64_t logTotal = 0;

    Phase phase = TitlePhase{};

    bool inventoryOpen = false;
    bool statsOpen = false;

    // Independent streams so battle luck never shifts reward placement.
    RNG battleRng;
    RNG rewardRng;

    void pushLog(const std::string& text, MessageKind kind = MessageKind::Info);

    Level& currentLevel() { return levels[static_cast<size_t>(current)]; }
    const Level& currentLevel() const { return levels[static_cast<size_t>(current)]; }

    PhaseKind phaseKind() const { return phaseKindOf(phase); }

    // Active session, or nullptr when the phase has none.
    DialogueSession* dialogue();
    const DialogueSession* dialogue() const;
    BattleSession* battle();
    const BattleSession* battle() const;

    Npc* npc(NpcId id);
    const Npc* npc(NpcId id) const;

    // Present NPC standing on `p` in the current level, or nullptr.
    Npc* npcAt(Vec2i p);
    const Npc* npcAt(Vec2i p) const;
    // Same as npcAt() for an arbitrary level.
    const Npc* npcAt(int level, Vec2i p) const;
};

// Generates both levels, places the roster and the player, and writes the
// welcome lines. Dimensions below MIN_MAP_W x MIN_MAP_H are raised.
World makeWorld(uint64_t seed, int width = DEFAULT_MAP_W, int height = DEFAULT_MAP_H);
