#include "game_internal.hpp"

bool Game::applyAction(const Action& a, uint64_t nowMs) {
    if (world_.player.purgeBuffs(nowMs) > 0) {
        pushMsg("A BUFF WEARS OFF.", MessageKind::Info);
    }

    if (a.kind == ActionKind::Quit) return false;
    if (a.kind == ActionKind::None) return true;

    switch (world_.phaseKind()) {
        case PhaseKind::Title:    handleTitle(a); break;
        case PhaseKind::Intro:    handleIntro(a); break;
        case PhaseKind::Playing:  handlePlaying(a, nowMs); break;
        case PhaseKind::Dialogue: handleDialogue(a, nowMs); break;
        case PhaseKind::Battle:   handleBattle(a, nowMs); break;
        case PhaseKind::Ending:   break;
        default: break;
    }
    return true;
}

void Game::handleTitle(const Action& a) {
    if (a.kind == ActionKind::Confirm) world_.phase = IntroPhase{};
}

void Game::handleIntro(const Action& a) {
    if (a.kind == ActionKind::Confirm) enterPlaying();
}

void Game::handlePlaying(const Action& a, uint64_t nowMs) {
    switch (a.kind) {
        case ActionKind::Move:
            tryMove(a.dx, a.dy);
            break;
        case ActionKind::ToggleInventory:
            toggleInventory();
            break;
        case ActionKind::ToggleStats:
            toggleStats();
            break;
        case ActionKind::ToggleInvTab:
            if (world_.inventoryOpen) toggleInvTab();
            break;
        case ActionKind::InventoryUp:
            if (world_.inventoryOpen) moveInventoryCursor(-1);
            break;
        case ActionKind::InventoryDown:
            if (world_.inventoryOpen) moveInventoryCursor(1);
            break;
        case ActionKind::UseConsumable:
            if (world_.inventoryOpen) useOnActiveTab(nowMs);
            break;
        case ActionKind::Interact:
            // Overlays take the input focus.
            if (!world_.inventoryOpen && !world_.statsOpen) interact();
            break;
        default:
            break;
    }
}

void Game::handleDialogue(const Action& a, uint64_t nowMs) {
    switch (a.kind) {
        case ActionKind::Confirm:
            confirmDialogue();
            break;
        case ActionKind::Choice:
            chooseDialogue(a.choice, nowMs);
            break;
        default:
            break;
    }
}

void Game::handleBattle(const Action& a, uint64_t nowMs) {
    if (world_.inventoryOpen) {
        switch (a.kind) {
            case ActionKind::ToggleInventory:
                world_.inventoryOpen = false;
                break;
            case ActionKind::InventoryUp:
                moveInventoryCursor(-1);
                break;
            case ActionKind::InventoryDown:
                moveInventoryCursor(1);
                break;
            case ActionKind::UseConsumable:
                battleUseItem(nowMs);
                break;
            default:
                break;
        }
        return;
    }

    switch (a.kind) {
        case ActionKind::BattleOption:
            battleOption(a.option, a.penalty, nowMs);
            break;
        case ActionKind::ToggleInventory:
            battleOption(2, false, nowMs);
            break;
        default:
            break;
    }
}
