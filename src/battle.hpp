#pragma once

#include "entity.hpp"
#include "message.hpp"
#include "npc.hpp"
#include "rng.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Turn-based combat against a single enemy.
//
// The resolvers below are pure rules: they mutate the player and the session,
// draw from the battle RNG and append log lines to `out`. Phase changes
// (post-battle dialogue, reward chests, ending) belong to the controller.

struct BattleSession {
    NpcId enemy = NpcId::SlimeKing;
    std::string name;

    int hp = 0;
    int hpMax = 0;
    int atk = 0;
    int def = 0;
    int spd = 0;

    // One-turn override: the enemy acts first regardless of speed.
    bool penalty = false;
    // Fights the player asked for cannot be fled.
    bool playerInitiated = false;

    bool enemyDown() const { return hp <= 0; }
};

enum class BattleOutcome : uint8_t {
    Ongoing = 0,
    Victory,
    Defeat,
    Fled,
};

BattleSession makeBattleSession(const Npc& npc, bool playerInitiated);

// floor(attack * 1.2), never negative.
int damageFor(int attack);

// (defense / 10) * 0.2, clamped to [0, 1].
double deflectChance(int defense);
bool rollDeflect(int defense, RNG& rng);

bool playerActsFirst(int playerSpeed, int enemySpeed, bool penalty);

// Option 1: both sides attack in initiative order.
BattleOutcome resolveFight(Player& p, BattleSession& b, RNG& rng, uint64_t nowMs, std::vector<Message>& out);

// Option 3: flee attempt. Refused for player-initiated fights.
BattleOutcome resolveRun(Player& p, BattleSession& b, RNG& rng, uint64_t nowMs, std::vector<Message>& out);

// The enemy's single attack (used after items and failed flights).
BattleOutcome resolveEnemyAttack(Player& p, BattleSession& b, RNG& rng, uint64_t nowMs, std::vector<Message>& out);
