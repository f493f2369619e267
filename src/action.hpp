#pragma once
#include "common.hpp"

#include <cstdint>

enum class ActionKind : uint8_t {
    None = 0,

    Move,

    ToggleInventory,
    InventoryUp,
    InventoryDown,
    UseConsumable,
    ToggleStats,
    ToggleInvTab,

    Confirm,     // advance title/intro/dialogue
    Interact,    // talk / open door / open chest

    Choice,        // single-character dialogue answer
    BattleOption,  // 1 = fight, 2 = items, 3 = run

    Quit,
};

// One discrete player input. Only the fields relevant to `kind` are used.
struct Action {
    ActionKind kind = ActionKind::None;

    // Move: each in {-1, 0, 1}
    int dx = 0;
    int dy = 0;

    // Choice
    char choice = 0;

    // BattleOption
    int option = 0;
    // Set by the input loop when the player took too long to pick an option.
    bool penalty = false;

    static Action none() { return Action{}; }

    static Action simple(ActionKind k) {
        Action a;
        a.kind = k;
        return a;
    }

    static Action move(int dx, int dy) {
        Action a;
        a.kind = ActionKind::Move;
        a.dx = sign(dx);
        a.dy = sign(dy);
        return a;
    }

    static Action choose(char c) {
        Action a;
        a.kind = ActionKind::Choice;
        a.choice = c;
        return a;
    }

    static Action battle(int option, bool penalty = false) {
        Action a;
        a.kind = ActionKind::BattleOption;
        a.option = option;
        a.penalty = penalty;
        return a;
    }

    static Action quit() { return simple(ActionKind::Quit); }
};
