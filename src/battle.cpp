#include "battle.hpp"

#include <algorithm>
#include <sstream>

namespace {

constexpr double FLEE_CHANCE = 0.5;

void playerStrikes(Player& p, BattleSession& b, RNG& rng, uint64_t nowMs, std::vector<Message>& out) {
    if (rollDeflect(b.def, rng)) {
        out.push_back({"THE " + b.name + " DEFLECTS YOUR BLOW.", MessageKind::Combat});
        return;
    }
    const int dmg = damageFor(p.attack(nowMs));
    b.hp = std::max(0, b.hp - dmg);

    std::stringstream ss;
    ss << "YOU HIT THE " << b.name << " FOR " << dmg << ".";
    out.push_back({ss.str(), MessageKind::Combat});
}

void enemyStrikes(Player& p, BattleSession& b, RNG& rng, uint64_t nowMs, std::vector<Message>& out) {
    if (rollDeflect(p.defense(nowMs), rng)) {
        out.push_back({"YOU DEFLECT THE " + b.name + "'S ATTACK.", MessageKind::Combat});
        return;
    }
    const int dmg = damageFor(b.atk);
    p.hp = std::max(0, p.hp - dmg);

    std::stringstream ss;
    ss << "THE " << b.name << " HITS YOU FOR " << dmg << ".";
    out.push_back({ss.str(), MessageKind::Combat});
}

BattleOutcome outcomeOf(const Player& p, const BattleSession& b) {
    if (b.enemyDown()) return BattleOutcome::Victory;
    if (p.isDead()) return BattleOutcome::Defeat;
    return BattleOutcome::Ongoing;
}

} // namespace

BattleSession makeBattleSession(const Npc& npc, bool playerInitiated) {
    const EnemyStats& st = npcDef(npc.id).enemy;

    BattleSession b;
    b.enemy = npc.id;
    b.name = npc.name;
    b.hp = st.hp;
    b.hpMax = st.hp;
    b.atk = st.atk;
    b.def = st.def;
    b.spd = st.spd;
    b.playerInitiated = playerInitiated;
    return b;
}

int damageFor(int attack) {
    // Integer form of floor(attack * 1.2).
    return std::max(0, attack * 12 / 10);
}

double deflectChance(int defense) {
    return std::clamp(static_cast<double>(defense) * 0.02, 0.0, 1.0);
}

bool rollDeflect(int defense, RNG& rng) {
    return rng.chance(deflectChance(defense));
}

bool playerActsFirst(int playerSpeed, int enemySpeed, bool penalty) {
    return !penalty && playerSpeed >= enemySpeed;
}

BattleOutcome resolveFight(Player& p, BattleSession& b, RNG& rng, uint64_t nowMs, std::vector<Message>& out) {
    if (b.penalty) {
        out.push_back({"YOU HESITATED! THE " + b.name + " STRIKES FIRST.", MessageKind::Warning});
    }

    if (playerActsFirst(p.speed(nowMs), b.spd, b.penalty)) {
        playerStrikes(p, b, rng, nowMs, out);
        if (!b.enemyDown()) enemyStrikes(p, b, rng, nowMs, out);
    } else {
        enemyStrikes(p, b, rng, nowMs, out);
        if (!p.isDead()) playerStrikes(p, b, rng, nowMs, out);
    }
    return outcomeOf(p, b);
}

BattleOutcome resolveRun(Player& p, BattleSession& b, RNG& rng, uint64_t nowMs, std::vector<Message>& out) {
    if (b.playerInitiated) {
        out.push_back({"YOU CANNOT FLEE A FIGHT YOU CHOSE!", MessageKind::Warning});
        return resolveEnemyAttack(p, b, rng, nowMs, out);
    }
    if (rng.chance(FLEE_CHANCE)) {
        out.push_back({"YOU ESCAPE FROM THE " + b.name + ".", MessageKind::Info});
        return BattleOutcome::Fled;
    }
    out.push_back({"YOU FAIL TO ESCAPE!", MessageKind::Warning});
    return resolveEnemyAttack(p, b, rng, nowMs, out);
}

BattleOutcome resolveEnemyAttack(Player& p, BattleSession& b, RNG& rng, uint64_t nowMs, std::vector<Message>& out) {
    enemyStrikes(p, b, rng, nowMs, out);
    return outcomeOf(p, b);
}
