#include "game_internal.hpp"

void Game::toggleInventory() {
    world_.inventoryOpen = !world_.inventoryOpen;
    if (world_.inventoryOpen) world_.player.inv.clampCursors();
}

void Game::toggleStats() {
    world_.statsOpen = !world_.statsOpen;
}

void Game::toggleInvTab() {
    world_.player.inv.cycleTab();
}

void Game::moveInventoryCursor(int delta) {
    world_.player.inv.moveCursor(delta);
}

void Game::useOnActiveTab(uint64_t nowMs) {
    Player& p = world_.player;
    Inventory& inv = p.inv;

    switch (inv.tab) {
        case InvTab::Consumables:
            useSelectedConsumable(nowMs);
            break;

        case InvTab::Backpack: {
            if (inv.backpack.empty()) {
                pushMsg("YOUR BACKPACK IS EMPTY.");
                break;
            }
            if (const std::optional<Equipment> e = p.equipFromBackpack(inv.activeCursor())) {
                pushMsg("YOU EQUIP THE " + e->name + ".", MessageKind::Success);
            }
            break;
        }

        case InvTab::Weapons: {
            const std::optional<EquipSlot> s = inv.weaponsRowSlot(inv.activeCursor());
            if (!s) {
                pushMsg("NOTHING EQUIPPED.");
                break;
            }
            if (const std::optional<Equipment> e = p.unequip(*s)) {
                pushMsg("YOU PUT THE " + e->name + " IN YOUR BACKPACK.");
            }
            break;
        }

        default:
            break;
    }
}

bool Game::useSelectedConsumable(uint64_t nowMs) {
    std::optional<Consumable> c = world_.player.inv.takeSelectedConsumable();
    if (!c) {
        pushMsg("NO CONSUMABLES TO USE.");
        return false;
    }
    useConsumable(*c, nowMs);
    return true;
}

void Game::useConsumable(const Consumable& c, uint64_t nowMs) {
    const ConsumeResult r = world_.player.consume(c, nowMs);
    pushMsg(consumeMessage(c, r), MessageKind::Success);
}
