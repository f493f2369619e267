#pragma once
#include "items.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

enum class InvTab : uint8_t {
    Weapons = 0,
    Consumables,
    Backpack,
};

inline constexpr int INV_TAB_COUNT = 3;
inline constexpr int CONSUMABLE_SOFT_CAP = 10;

inline const char* invTabName(InvTab t) {
    switch (t) {
        case InvTab::Weapons:     return "WEAPONS";
        case InvTab::Consumables: return "CONSUMABLES";
        case InvTab::Backpack:    return "BACKPACK";
        default:                  return "?";
    }
}

// Player carry state.
//
// Invariant: every cursor indexes inside its own list, or is 0 when that list
// is empty. All mutators re-clamp; readers may rely on it.
struct Inventory {
    std::optional<Equipment> sword;
    std::optional<Equipment> shield;
    std::vector<Consumable> consumables;
    std::vector<Equipment> backpack;

    InvTab tab = InvTab::Weapons;
    std::array<int, INV_TAB_COUNT> cursors{0, 0, 0};

    int& cursor(InvTab t) { return cursors[static_cast<size_t>(t)]; }
    int cursor(InvTab t) const { return cursors[static_cast<size_t>(t)]; }
    int activeCursor() const { return cursor(tab); }

    // Number of rows in a tab. The weapons tab lists filled slots only.
    int tabLength(InvTab t) const;

    // Slot shown at a weapons-tab row (sword first, then shield).
    std::optional<EquipSlot> weaponsRowSlot(int row) const;

    std::optional<Equipment>& slot(EquipSlot s) { return s == EquipSlot::Sword ? sword : shield; }
    const std::optional<Equipment>& slot(EquipSlot s) const { return s == EquipSlot::Sword ? sword : shield; }

    bool hasSwordAndShield() const { return sword.has_value() && shield.has_value(); }

    // Steps the active tab's cursor, wrapping at both ends.
    void moveCursor(int delta);

    // Weapons -> Consumables -> Backpack -> Weapons.
    void cycleTab();
    void setTab(InvTab t);

    void clampCursors();

    // Fails (returns false) at the soft cap.
    bool addConsumable(const Consumable& c);
    void addToBackpack(const Equipment& e);

    // Removes and returns the consumable under the consumables cursor.
    std::optional<Consumable> takeSelectedConsumable();

    std::optional<Equipment> takeBackpackItem(int index);
};
