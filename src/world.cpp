#include "world.hpp"

#include <sstream>

const char* phaseName(PhaseKind k) {
    switch (k) {
        case PhaseKind::Title:    return "TITLE";
        case PhaseKind::Intro:    return "INTRO";
        case PhaseKind::Playing:  return "PLAYING";
        case PhaseKind::Dialogue: return "DIALOGUE";
        case PhaseKind::Battle:   return "BATTLE";
        case PhaseKind::Ending:   return "ENDING";
        default:                  return "?";
    }
}

void World::pushLog(const std::string& text, MessageKind kind) {
    log.push_back({text, kind});
    ++logTotal;
    while (log.size() > static_cast<size_t>(LOG_CAPACITY)) log.pop_front();
}

DialogueSession* World::dialogue() {
    if (auto* d = std::get_if<DialoguePhase>(&phase)) return &d->session;
    return nullptr;
}

const DialogueSession* World::dialogue() const {
    if (const auto* d = std::get_if<DialoguePhase>(&phase)) return &d->session;
    return nullptr;
}

BattleSession* World::battle() {
    if (auto* b = std::get_if<BattlePhase>(&phase)) return &b->session;
    return nullptr;
}

const BattleSession* World::battle() const {
    if (const auto* b = std::get_if<BattlePhase>(&phase)) return &b->session;
    return nullptr;
}

Npc* World::npc(NpcId id) {
    for (Npc& n : npcs) {
        if (n.id == id) return &n;
    }
    return nullptr;
}

const Npc* World::npc(NpcId id) const {
    for (const Npc& n : npcs) {
        if (n.id == id) return &n;
    }
    return nullptr;
}

Npc* World::npcAt(Vec2i p) {
    for (Npc& n : npcs) {
        if (n.present && n.level == current && n.pos == p) return &n;
    }
    return nullptr;
}

const Npc* World::npcAt(Vec2i p) const {
    return npcAt(current, p);
}

const Npc* World::npcAt(int level, Vec2i p) const {
    for (const Npc& n : npcs) {
        if (n.present && n.level == level && n.pos == p) return &n;
    }
    return nullptr;
}

World makeWorld(uint64_t seed, int width, int height) {
    World w;
    w.seed = seed;
    for (int i = 0; i < LEVEL_COUNT; ++i) {
        w.levels[static_cast<size_t>(i)] = makeLevel(seed, i, width, height);
    }
    w.current = 0;
    w.player = Player(w.levels[0].spawn);
    w.npcs = makeNpcRoster(w.levels);

    w.battleRng = RNG(deriveSeed(seed, "BATTLE"_tag));
    w.rewardRng = RNG(deriveSeed(seed, "REWARDS"_tag));

    std::stringstream ss;
    ss << "SEED: " << seed;
    w.pushLog(ss.str(), MessageKind::System);
    w.pushLog("WELCOME TO SUNNY DAYS.", MessageKind::System);
    w.pushLog("TALK TO THE ELDER BEFORE YOU WANDER OFF.");
    w.pushLog("THE DOOR OPENS ONLY FOR A SWORD AND A SHIELD.");
    w.pushLog("FIND IT TO REACH ROOM 2.");
    return w;
}
