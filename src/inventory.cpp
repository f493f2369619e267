#include "inventory.hpp"
#include "common.hpp"

#include <cstddef>

int Inventory::tabLength(InvTab t) const {
    switch (t) {
        case InvTab::Weapons:
            return (sword ? 1 : 0) + (shield ? 1 : 0);
        case InvTab::Consumables:
            return static_cast<int>(consumables.size());
        case InvTab::Backpack:
            return static_cast<int>(backpack.size());
        default:
            return 0;
    }
}

std::optional<EquipSlot> Inventory::weaponsRowSlot(int row) const {
    if (row < 0) return std::nullopt;
    if (sword) {
        if (row == 0) return EquipSlot::Sword;
        --row;
    }
    if (shield && row == 0) return EquipSlot::Shield;
    return std::nullopt;
}

void Inventory::moveCursor(int delta) {
    const int len = tabLength(tab);
    int& c = cursor(tab);
    if (len <= 0) {
        c = 0;
        return;
    }
    int idx = c + delta;
    if (idx < 0) idx = len - 1;
    else if (idx >= len) idx = 0;
    c = idx;
}

void Inventory::cycleTab() {
    const int next = (static_cast<int>(tab) + 1) % INV_TAB_COUNT;
    tab = static_cast<InvTab>(next);
    clampCursors();
}

void Inventory::setTab(InvTab t) {
    tab = t;
    clampCursors();
}

void Inventory::clampCursors() {
    for (int i = 0; i < INV_TAB_COUNT; ++i) {
        const InvTab t = static_cast<InvTab>(i);
        const int len = tabLength(t);
        int& c = cursor(t);
        c = (len <= 0) ? 0 : clampi(c, 0, len - 1);
    }
}

bool Inventory::addConsumable(const Consumable& c) {
    if (static_cast<int>(consumables.size()) >= CONSUMABLE_SOFT_CAP) return false;
    consumables.push_back(c);
    clampCursors();
    return true;
}

void Inventory::addToBackpack(const Equipment& e) {
    backpack.push_back(e);
    clampCursors();
}

std::optional<Consumable> Inventory::takeSelectedConsumable() {
    if (consumables.empty()) {
        cursor(InvTab::Consumables) = 0;
        return std::nullopt;
    }
    clampCursors();
    const size_t idx = static_cast<size_t>(cursor(InvTab::Consumables));
    Consumable c = consumables[idx];
    consumables.erase(consumables.begin() + static_cast<std::ptrdiff_t>(idx));
    clampCursors();
    return c;
}

std::optional<Equipment> Inventory::takeBackpackItem(int index) {
    if (index < 0 || index >= static_cast<int>(backpack.size())) return std::nullopt;
    Equipment e = backpack[static_cast<size_t>(index)];
    backpack.erase(backpack.begin() + index);
    clampCursors();
    return e;
}
