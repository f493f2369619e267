#include "entity.hpp"

#include <algorithm>
#include <utility>

namespace {

int gearBonus(const Inventory& inv, int Equipment::*field) {
    int sum = 0;
    if (inv.sword) sum += (*inv.sword).*field;
    if (inv.shield) sum += (*inv.shield).*field;
    return sum;
}

} // namespace

int Player::attack(uint64_t nowMs) const {
    return baseAtk + gearBonus(inv, &Equipment::atk) + sumActiveBuffs(buffs, nowMs).atk;
}

int Player::defense(uint64_t nowMs) const {
    return baseDef + gearBonus(inv, &Equipment::def) + sumActiveBuffs(buffs, nowMs).def;
}

int Player::speed(uint64_t nowMs) const {
    return baseSpd + gearBonus(inv, &Equipment::spd) + sumActiveBuffs(buffs, nowMs).spd;
}

void Player::addGearHp(int delta) {
    hpMax = std::max(1, hpMax + delta);
    hp = std::min(hp, hpMax);
}

void Player::equip(Equipment item) {
    std::optional<Equipment>& s = inv.slot(item.slot);
    if (s) {
        addGearHp(-s->hp);
        inv.backpack.push_back(std::move(*s));
        s.reset();
    }
    addGearHp(item.hp);
    s = std::move(item);
    inv.clampCursors();
}

std::optional<Equipment> Player::equipFromBackpack(int index) {
    std::optional<Equipment> e = inv.takeBackpackItem(index);
    if (!e) return std::nullopt;
    Equipment copy = *e;
    equip(std::move(*e));
    return copy;
}

std::optional<Equipment> Player::unequip(EquipSlot slot) {
    std::optional<Equipment>& s = inv.slot(slot);
    if (!s) return std::nullopt;
    Equipment removed = std::move(*s);
    s.reset();
    addGearHp(-removed.hp);
    inv.addToBackpack(removed);
    return removed;
}

ConsumeResult Player::consume(const Consumable& c, uint64_t nowMs) {
    ConsumeResult r;
    const int before = hp;
    if (c.heal >= 0) {
        hp = std::min(hpMax, hp + c.heal);
    } else {
        hp = std::max(std::min(hp, 1), hp + c.heal);
    }
    r.hpChange = hp - before;

    if (c.grantsBuff()) {
        TempBuff b;
        b.atk = c.atkBonus;
        b.def = c.defBonus;
        b.expiresAtMs = nowMs + BUFF_DURATION_MS;
        buffs.push_back(b);
        r.buffApplied = true;
    }
    return r;
}
