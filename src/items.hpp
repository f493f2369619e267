#pragma once
#include <cstdint>
#include <string>

enum class EquipSlot : uint8_t {
    Sword = 0,
    Shield,
};

inline const char* equipSlotName(EquipSlot s) {
    switch (s) {
        case EquipSlot::Sword:  return "SWORD";
        case EquipSlot::Shield: return "SHIELD";
        default:                return "?";
    }
}

struct Equipment {
    std::string name;
    EquipSlot slot = EquipSlot::Sword;
    int atk = 0;
    int def = 0;
    int spd = 0;
    int hp = 0;
};

struct Consumable {
    std::string name;
    int heal = 0;     // may be negative
    int atkBonus = 0; // applied as a timed buff on use
    int defBonus = 0;

    bool grantsBuff() const { return atkBonus != 0 || defBonus != 0; }
};

// Catalog identities. Content is looked up through gearDef()/consumableDef().
enum class GearKind : uint8_t {
    WoodenSword = 0,
    WoodenShield,
    TravelerKnife,
    LeatherBuckler,
    IronSword,
    ThornBlade,
    WardenAegis,
};

inline constexpr int GEAR_KIND_COUNT = static_cast<int>(GearKind::WardenAegis) + 1;

enum class ConsumableKind : uint8_t {
    Apple = 0,
    HoneyCake,
    HealingPotion,
    BitterRoot,
    FireTonic,
    WardenSap,
};

inline constexpr int CONSUMABLE_KIND_COUNT = static_cast<int>(ConsumableKind::WardenSap) + 1;

struct GearDef {
    GearKind kind;
    const char* name;
    EquipSlot slot;
    int atk = 0;
    int def = 0;
    int spd = 0;
    int hp = 0;
};

struct ConsumableDef {
    ConsumableKind kind;
    const char* name;
    int heal = 0;
    int atkBonus = 0;
    int defBonus = 0;
};

const GearDef& gearDef(GearKind k);
const ConsumableDef& consumableDef(ConsumableKind k);

Equipment makeEquipment(GearKind k);
Consumable makeConsumable(ConsumableKind k);

// One-line stat summary used by the inventory overlay and loot messages.
// Examples: "WOODEN SWORD (+3 ATK)", "BITTER ROOT (-2 HP, +5 DEF)"
std::string describeEquipment(const Equipment& e);
std::string describeConsumable(const Consumable& c);
