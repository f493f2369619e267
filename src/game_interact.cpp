#include "game_internal.hpp"

void Game::tryMove(int dx, int dy) {
    // Overlays freeze the map.
    if (world_.inventoryOpen || world_.statsOpen) return;

    dx = clampi(dx, -1, 1);
    dy = clampi(dy, -1, 1);
    if (dx == 0 && dy == 0) return;

    Level& lvl = world_.currentLevel();
    const Vec2i target{world_.player.pos.x + dx, world_.player.pos.y + dy};
    if (!lvl.map.inBounds(target)) return;

    if (const Npc* n = world_.npcAt(target)) {
        pushMsg("THE " + n->name + " BLOCKS YOUR WAY.");
        return;
    }

    // Doors are triggered with Interact, never walked through.
    if (!lvl.map.isWalkable(target)) return;

    world_.player.pos = target;

    if (lvl.map.at(target) == TileType::Chest) openChest(target);
}

void Game::interact() {
    const Vec2i here = world_.player.pos;

    for (const auto& off : kNeighbourOrder) {
        const Vec2i p{here.x + off[0], here.y + off[1]};
        if (const Npc* n = world_.npcAt(p)) {
            talkTo(*n);
            return;
        }
    }

    const Level& lvl = world_.currentLevel();
    for (const auto& off : kNeighbourOrder) {
        const Vec2i p{here.x + off[0], here.y + off[1]};
        if (lvl.map.inBounds(p) && lvl.map.at(p) == TileType::Door) {
            tryOpenDoor();
            return;
        }
    }

    if (lvl.chestAt(here)) {
        openChest(here);
        return;
    }

    pushMsg("NOTHING NEARBY.");
}

void Game::talkTo(const Npc& n) {
    enterDialogue(openNpcDialogue(n, world_.npcs));
}

void Game::tryOpenDoor() {
    if (!world_.player.inv.hasSwordAndShield()) {
        pushMsg("THE DOOR WILL NOT BUDGE. YOU NEED A SWORD AND A SHIELD.", MessageKind::Warning);
        return;
    }
    switchRoom();
}

void Game::switchRoom() {
    const int next = (world_.current == 0) ? 1 : 0;
    world_.current = next;
    world_.player.pos = arrivalTile(next);

    if (next == 1) {
        pushMsg("YOU STEP THROUGH THE DOOR INTO ROOM 2.", MessageKind::System);
    } else {
        pushMsg("YOU STEP BACK INTO ROOM 1.", MessageKind::System);
    }
}

Vec2i Game::arrivalTile(int level) const {
    const Level& lvl = world_.levels[static_cast<size_t>(level)];
    const Vec2i door = lvl.door;

    for (const auto& off : kNeighbourOrder) {
        const Vec2i p{door.x + off[0], door.y + off[1]};
        if (!lvl.map.inBounds(p)) continue;
        if (lvl.map.at(p) != TileType::Floor) continue;
        if (world_.npcAt(level, p)) continue;
        return p;
    }
    return door;
}

void Game::openChest(Vec2i p) {
    Level& lvl = world_.currentLevel();
    Chest* chest = lvl.chestAt(p);
    if (!chest) return;

    chest->opened = true;
    lvl.map.set(p, TileType::Floor);

    std::optional<Equipment> gear = std::move(chest->equipment);
    std::optional<Consumable> food = std::move(chest->consumable);
    chest->equipment.reset();
    chest->consumable.reset();

    if (!gear && !food) {
        pushMsg("THE CHEST IS EMPTY.");
        return;
    }

    pushMsg("YOU OPEN THE CHEST.", MessageKind::Loot);

    if (gear) {
        Inventory& inv = world_.player.inv;
        const std::string line = describeEquipment(*gear);
        if (!inv.slot(gear->slot)) {
            world_.player.equip(std::move(*gear));
            pushMsg("YOU EQUIP THE " + line + ".", MessageKind::Loot);
        } else {
            inv.addToBackpack(*gear);
            pushMsg("THE " + line + " GOES INTO YOUR BACKPACK.", MessageKind::Loot);
        }
    }

    if (food) {
        enterDialogue(makeChestDialogue(*food));
    }
}
