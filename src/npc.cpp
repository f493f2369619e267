#include "npc.hpp"

namespace {

const std::array<NpcDef, NPC_COUNT> kNpcDefs = {{
    // id              name             lvl sym  hostile boss  enemy {hp,atk,def,spd}  rewards
    {NpcId::Elder,     "ELDER MIRA",     0, 'E', false, false, {0, 0, 0, 0},   RewardPlacement::None},
    {NpcId::Hermit,    "HERMIT BRAM",    0, 'H', false, false, {0, 0, 0, 0},   RewardPlacement::None},
    {NpcId::SlimeKing, "SLIME KING",     0, 'S', true,  true,  {20, 3, 1, 3},  RewardPlacement::Scattered},
    {NpcId::Wolf,      "GAUNT WOLF",     1, 'w', true,  false, {26, 5, 2, 8},  RewardPlacement::None},
    {NpcId::Warden,    "THORN WARDEN",   1, 'W', true,  true,  {60, 8, 4, 6},  RewardPlacement::Controlled},
}};

bool spacedEnough(Vec2i p, const std::vector<Vec2i>& from, int spacing) {
    for (const Vec2i& q : from) {
        if (chebyshev(p, q) < spacing) return false;
    }
    return true;
}

std::optional<Vec2i> sampleSpaced(const Map& m, const std::vector<Vec2i>& occupied,
                                  const std::vector<Vec2i>& spacedFrom, int spacing, RNG& rng) {
    for (int i = 0; i < SCATTER_ATTEMPTS; ++i) {
        const Vec2i p{rng.range(0, m.width - 1), rng.range(0, m.height - 1)};
        if (m.at(p) != TileType::Floor) continue;
        if (containsPos(occupied, p)) continue;
        if (!spacedEnough(p, spacedFrom, spacing)) continue;
        return p;
    }
    return std::nullopt;
}

} // namespace

const NpcDef& npcDef(NpcId id) {
    const int i = static_cast<int>(id);
    if (i < 0 || i >= NPC_COUNT) return kNpcDefs[0];
    return kNpcDefs[static_cast<size_t>(i)];
}

std::optional<Vec2i> pickNpcTile(const Map& m, const std::vector<Vec2i>& occupied,
                                 const std::vector<Vec2i>& spacedFrom, RNG& rng) {
    if (m.width <= 0 || m.height <= 0) return std::nullopt;
    if (auto p = sampleSpaced(m, occupied, spacedFrom, NPC_SPACING, rng)) return p;
    if (auto p = sampleSpaced(m, occupied, spacedFrom, NPC_SPACING_RELAXED, rng)) return p;
    return pickUniformFloor(m, occupied, rng);
}

std::vector<Npc> makeNpcRoster(const std::array<Level, LEVEL_COUNT>& levels) {
    std::vector<Npc> roster;
    roster.reserve(NPC_COUNT);

    for (int li = 0; li < LEVEL_COUNT; ++li) {
        const Level& lvl = levels[static_cast<size_t>(li)];
        RNG rng(deriveSeed(lvl.seed, "NPCS"_tag));

        std::vector<Vec2i> occupied{lvl.spawn, lvl.door};
        for (const Chest& c : lvl.chests) occupied.push_back(c.pos);
        std::vector<Vec2i> spacedFrom{lvl.spawn};

        for (const NpcDef& d : kNpcDefs) {
            if (d.level != li) continue;

            Npc n;
            n.id = d.id;
            n.name = d.name;
            n.level = d.level;
            n.symbol = d.symbol;

            if (const std::optional<Vec2i> p = pickNpcTile(lvl.map, occupied, spacedFrom, rng)) {
                n.pos = *p;
                occupied.push_back(*p);
                spacedFrom.push_back(*p);
            } else {
                n.present = false;
            }
            roster.push_back(n);
        }
    }
    return roster;
}

std::vector<Chest> bossRewardChests(NpcId id) {
    std::vector<Chest> out;
    switch (id) {
        case NpcId::SlimeKing: {
            Chest c;
            c.equipment = makeEquipment(GearKind::IronSword);
            c.consumable = makeConsumable(ConsumableKind::Apple);
            out.push_back(c);
            break;
        }
        case NpcId::Warden: {
            Chest blade;
            blade.equipment = makeEquipment(GearKind::ThornBlade);
            blade.consumable = makeConsumable(ConsumableKind::WardenSap);
            out.push_back(blade);

            Chest aegis;
            aegis.equipment = makeEquipment(GearKind::WardenAegis);
            aegis.consumable = makeConsumable(ConsumableKind::HealingPotion);
            out.push_back(aegis);
            break;
        }
        default:
            break;
    }
    return out;
}
