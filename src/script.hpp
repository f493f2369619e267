#pragma once

#include "action.hpp"
#include "game.hpp"

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

// ------------------------------------------------------------
// Action scripts (headless runner input)
// ------------------------------------------------------------
//
// Line-based, case-insensitive, '#' starts a comment:
//
//   move <dx> <dy>   | up | down | left | right
//   inventory | stats | tab | inv_up | inv_down | use
//   confirm | interact | choice <c> | battle <1-3> [penalty]
//   wait <ms>
//   quit | none
//
// Each action is applied at the current simulated time, which then advances
// by the step size. `wait` only advances the clock.

enum class ScriptStepKind : uint8_t {
    Action = 0,
    Wait,
};

struct ScriptStep {
    ScriptStepKind kind = ScriptStepKind::Action;
    Action action;
    uint64_t waitMs = 0;
    int line = 0; // 1-based source line
};

// Parses a whole script. On failure `err` names the offending line.
bool parseScript(std::istream& in, std::vector<ScriptStep>& out, std::string* err = nullptr);
bool loadScriptFile(const std::string& path, std::vector<ScriptStep>& out, std::string* err = nullptr);

// Script token for an action (e.g. "move 1 0", "battle 1 penalty").
std::string formatAction(const Action& a);

struct ScriptRunResult {
    uint64_t endMs = 0;
    int actionsApplied = 0;
    bool quit = false;
};

// Feeds the steps into the controller. Stops early on Quit.
// `onStep` (optional) is called after every applied action.
ScriptRunResult runScript(Game& game, const std::vector<ScriptStep>& steps, int stepMs,
                          const std::function<void(const Game&, const ScriptStep&, uint64_t nowMs)>& onStep = {});
