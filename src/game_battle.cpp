#include "game_internal.hpp"

void Game::battleOption(int option, bool penalty, uint64_t nowMs) {
    BattleSession* b = world_.battle();
    if (!b) return;

    std::vector<Message> out;
    BattleOutcome outcome = BattleOutcome::Ongoing;

    switch (option) {
        case 1:
            b->penalty = penalty;
            outcome = resolveFight(world_.player, *b, world_.battleRng, nowMs, out);
            b->penalty = false;
            break;
        case 2:
            // Free until something is actually used.
            world_.inventoryOpen = true;
            world_.player.inv.setTab(InvTab::Consumables);
            return;
        case 3:
            outcome = resolveRun(world_.player, *b, world_.battleRng, nowMs, out);
            break;
        default:
            return;
    }

    pushAll(out);
    finishBattleTurn(outcome);
}

void Game::battleUseItem(uint64_t nowMs) {
    BattleSession* b = world_.battle();
    if (!b) return;

    world_.player.inv.setTab(InvTab::Consumables);
    if (!useSelectedConsumable(nowMs)) return;

    world_.inventoryOpen = false;

    std::vector<Message> out;
    const BattleOutcome outcome = resolveEnemyAttack(world_.player, *b, world_.battleRng, nowMs, out);
    pushAll(out);
    finishBattleTurn(outcome);
}

void Game::finishBattleTurn(BattleOutcome outcome) {
    const BattleSession* b = world_.battle();
    if (!b) return;

    switch (outcome) {
        case BattleOutcome::Ongoing:
            break;

        case BattleOutcome::Fled:
            world_.inventoryOpen = false;
            enterPlaying();
            break;

        case BattleOutcome::Defeat: {
            const std::string name = b->name;
            pushMsg("YOU HAVE FALLEN TO THE " + name + ".", MessageKind::Warning);
            enterEnding("DEFEATED BY THE " + name);
            break;
        }

        case BattleOutcome::Victory:
            onVictory(b->enemy);
            break;
    }
}

void Game::onVictory(NpcId enemy) {
    Npc* n = world_.npc(enemy);
    if (!n) {
        enterPlaying();
        return;
    }

    n->defeated = true;
    pushMsg("YOU DEFEATED THE " + n->name + "!", MessageKind::Success);

    if (npcDef(enemy).boss) {
        n->present = false;
        spawnRewardChests(*n);
    }

    enterDialogue(makePostBattleDialogue(*n));
}

void Game::spawnRewardChests(const Npc& boss) {
    std::vector<Chest> rewards = bossRewardChests(boss.id);
    if (rewards.empty()) return;

    Level& lvl = world_.levels[static_cast<size_t>(boss.level)];

    std::vector<Vec2i> taken;
    if (boss.level == world_.current) taken.push_back(world_.player.pos);
    if (lvl.hasDoor()) taken.push_back(lvl.door);
    for (const Npc& other : world_.npcs) {
        if (other.present && other.level == boss.level) taken.push_back(other.pos);
    }

    const RewardPlacement placement = npcDef(boss.id).rewardPlacement;
    int placed = 0;
    for (Chest& c : rewards) {
        const std::optional<Vec2i> p = rewardTile(lvl, boss.pos, placement, taken);
        if (!p) break;
        c.pos = *p;
        if (!lvl.addChest(c)) continue;
        taken.push_back(*p);
        ++placed;
    }

    if (placed == 1) {
        pushMsg("A CHEST APPEARS WHERE THE " + boss.name + " FELL.", MessageKind::Loot);
    } else if (placed > 1) {
        pushMsg("CHESTS APPEAR WHERE THE " + boss.name + " FELL.", MessageKind::Loot);
    }
}

std::optional<Vec2i> Game::rewardTile(const Level& lvl, Vec2i origin, RewardPlacement placement,
                                      const std::vector<Vec2i>& taken) {
    const Map& m = lvl.map;
    auto freeFloor = [&](Vec2i p) {
        return m.inBounds(p) && m.at(p) == TileType::Floor && !containsPos(taken, p);
    };

    if (placement == RewardPlacement::Controlled) {
        if (freeFloor(origin)) return origin;
        for (const auto& off : kNeighbourOrder) {
            const Vec2i p{origin.x + off[0], origin.y + off[1]};
            if (freeFloor(p)) return p;
        }
    } else if (placement == RewardPlacement::Scattered) {
        RNG& rng = world_.rewardRng;
        for (int i = 0; i < SCATTER_ATTEMPTS; ++i) {
            const Vec2i p{origin.x + rng.range(-REWARD_SCATTER_RADIUS, REWARD_SCATTER_RADIUS),
                          origin.y + rng.range(-REWARD_SCATTER_RADIUS, REWARD_SCATTER_RADIUS)};
            if (freeFloor(p)) return p;
        }
    }

    // Nearest free Floor tile (ties broken by scan order), which is also any
    // free Floor tile when nothing is close.
    std::optional<Vec2i> best;
    int bestDist = 0;
    for (const Vec2i& p : m.tilesOfType(TileType::Floor)) {
        if (containsPos(taken, p)) continue;
        const int d = chebyshev(p, origin);
        if (!best || d < bestDist) {
            best = p;
            bestDist = d;
        }
    }
    return best;
}
