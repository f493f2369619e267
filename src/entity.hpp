#pragma once
#include "common.hpp"
#include "effects.hpp"
#include "inventory.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

inline constexpr int PLAYER_START_HP = 30;
inline constexpr int PLAYER_BASE_ATK = 4;
inline constexpr int PLAYER_BASE_DEF = 1;
inline constexpr int PLAYER_BASE_SPD = 5;

// What a consumable actually did (for log lines).
struct ConsumeResult {
    int hpChange = 0;
    bool buffApplied = false;
};

struct Player {
    Vec2i pos{0, 0};

    int hp = PLAYER_START_HP;
    int hpMax = PLAYER_START_HP;

    int baseAtk = PLAYER_BASE_ATK;
    int baseDef = PLAYER_BASE_DEF;
    int baseSpd = PLAYER_BASE_SPD;

    Inventory inv;
    std::vector<TempBuff> buffs;

    Player() = default;
    explicit Player(Vec2i p) : pos(p) {}

    // Effective stats: base + equipped gear + buffs active at nowMs.
    int attack(uint64_t nowMs) const;
    int defense(uint64_t nowMs) const;
    int speed(uint64_t nowMs) const;

    bool isDead() const { return hp <= 0; }

    // Puts `item` into its slot. The previous occupant (if any) goes to the backpack.
    // Max HP follows the slot contents; current HP is only ever clamped down.
    void equip(Equipment item);

    // Moves the backpack item at `index` into its slot. Returns the equipped item.
    std::optional<Equipment> equipFromBackpack(int index);

    // Moves the slot item into the backpack. Returns the removed item.
    std::optional<Equipment> unequip(EquipSlot slot);

    // Applies a consumable's effect. Heal is clamped to hpMax; a negative heal
    // never takes HP below 1.
    ConsumeResult consume(const Consumable& c, uint64_t nowMs);

    // Returns how many buffs expired.
    int purgeBuffs(uint64_t nowMs) { return purgeExpiredBuffs(buffs, nowMs); }

private:
    void addGearHp(int delta);
};
