#include "items.hpp"

#include <array>
#include <sstream>
#include <vector>

namespace {

const std::array<GearDef, GEAR_KIND_COUNT> kGearDefs = {{
    // kind                      name                 slot               atk def spd hp
    {GearKind::WoodenSword,    "WOODEN SWORD",      EquipSlot::Sword,   3,  0,  0,  0},
    {GearKind::WoodenShield,   "WOODEN SHIELD",     EquipSlot::Shield,  0,  2,  0,  5},
    {GearKind::TravelerKnife,  "TRAVELER'S KNIFE",  EquipSlot::Sword,   2,  0,  2,  0},
    {GearKind::LeatherBuckler, "LEATHER BUCKLER",   EquipSlot::Shield,  0,  1,  1,  3},
    {GearKind::IronSword,      "IRON SWORD",        EquipSlot::Sword,   6,  0,  1,  0},
    {GearKind::ThornBlade,     "THORN BLADE",       EquipSlot::Sword,   9,  0,  2,  0},
    {GearKind::WardenAegis,    "WARDEN'S AEGIS",    EquipSlot::Shield,  0,  6,  0, 15},
}};

const std::array<ConsumableDef, CONSUMABLE_KIND_COUNT> kConsumableDefs = {{
    // kind                           name              heal atk def
    {ConsumableKind::Apple,         "APPLE",            5,  0,  0},
    {ConsumableKind::HoneyCake,     "HONEY CAKE",       8,  0,  0},
    {ConsumableKind::HealingPotion, "HEALING POTION",  15,  0,  0},
    {ConsumableKind::BitterRoot,    "BITTER ROOT",     -2,  0,  5},
    {ConsumableKind::FireTonic,     "FIRE TONIC",       0,  4,  0},
    {ConsumableKind::WardenSap,     "WARDEN SAP",      10,  3,  3},
}};

void appendMod(std::vector<std::string>& parts, int v, const char* tag) {
    if (v == 0) return;
    std::ostringstream ss;
    if (v > 0) ss << "+";
    ss << v << " " << tag;
    parts.push_back(ss.str());
}

std::string withMods(const std::string& name, const std::vector<std::string>& parts) {
    if (parts.empty()) return name;
    std::string out = name + " (";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += ", ";
        out += parts[i];
    }
    out += ")";
    return out;
}

} // namespace

const GearDef& gearDef(GearKind k) {
    const int i = static_cast<int>(k);
    if (i < 0 || i >= GEAR_KIND_COUNT) return kGearDefs[0];
    return kGearDefs[static_cast<size_t>(i)];
}

const ConsumableDef& consumableDef(ConsumableKind k) {
    const int i = static_cast<int>(k);
    if (i < 0 || i >= CONSUMABLE_KIND_COUNT) return kConsumableDefs[0];
    return kConsumableDefs[static_cast<size_t>(i)];
}

Equipment makeEquipment(GearKind k) {
    const GearDef& d = gearDef(k);
    Equipment e;
    e.name = d.name;
    e.slot = d.slot;
    e.atk = d.atk;
    e.def = d.def;
    e.spd = d.spd;
    e.hp = d.hp;
    return e;
}

Consumable makeConsumable(ConsumableKind k) {
    const ConsumableDef& d = consumableDef(k);
    Consumable c;
    c.name = d.name;
    c.heal = d.heal;
    c.atkBonus = d.atkBonus;
    c.defBonus = d.defBonus;
    return c;
}

std::string describeEquipment(const Equipment& e) {
    std::vector<std::string> parts;
    appendMod(parts, e.atk, "ATK");
    appendMod(parts, e.def, "DEF");
    appendMod(parts, e.spd, "SPD");
    appendMod(parts, e.hp, "HP");
    return withMods(e.name, parts);
}

std::string describeConsumable(const Consumable& c) {
    std::vector<std::string> parts;
    appendMod(parts, c.heal, "HP");
    appendMod(parts, c.atkBonus, "ATK");
    appendMod(parts, c.defBonus, "DEF");
    return withMods(c.name, parts);
}
