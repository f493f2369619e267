#pragma once

#include "sdl.hpp"

#include "action.hpp"
#include "world.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Configurable keybindings loaded from sunnydays_settings.ini.
//
// The binding format is:
//   bind_<command> = key[, key, ...]
//
// Each key can be:
//   - a single character: w, 1, ?
//   - a named key: up, down, left, right, tab, enter, escape, space, f1, kp_8, ...
// Modifiers can be prefixed with: shift+, ctrl+, alt+  (example: ctrl+q)
//
// Bindings name front-end commands; what a command does depends on the phase
// and on which overlay is open (see commandToAction).

enum class Command : uint8_t {
    Up = 0,
    Down,
    Left,
    Right,
    Confirm,
    Cancel,
    Inventory,
    Stats,
    Tab,
    Interact,
    Use,
    Option1,
    Option2,
    Option3,
    Quit,
};

inline constexpr int COMMAND_COUNT = static_cast<int>(Command::Quit) + 1;

const char* commandName(Command c);

struct KeyChord {
    SDL_Keycode key = SDLK_UNKNOWN;
    Uint16 mods = KMOD_NONE; // only SHIFT/CTRL/ALT bits are used
};

class KeyBinds {
public:
    static KeyBinds defaults();
    void loadOverridesFromIni(const std::string& settingsPath);

    // Resolves a key press. Commands relevant to the current phase win when
    // several commands share a key.
    std::optional<Command> mapKey(const World& w, SDL_Keycode key, Uint16 mods) const;

    // Comma-separated key list, e.g. "w, up, kp_8". A nonzero `maxKeys`
    // keeps only the first bindings (on-screen hints use 1).
    std::string describe(Command c, size_t maxKeys = 0) const;

private:
    std::array<std::vector<KeyChord>, COMMAND_COUNT> binds;

    std::vector<KeyChord>& list(Command c) { return binds[static_cast<size_t>(c)]; }
    const std::vector<KeyChord>& list(Command c) const { return binds[static_cast<size_t>(c)]; }
    bool matches(Command c, SDL_Keycode key, Uint16 mods) const;

    static Uint16 normalizeMods(Uint16 mods);
    static std::optional<Command> parseCommandName(const std::string& bindKey);
    static std::vector<KeyChord> parseChordList(const std::string& value);
    static std::optional<KeyChord> parseChord(const std::string& token);
    static SDL_Keycode parseKeycode(const std::string& keyName);
    static std::string chordToString(const KeyChord& chord);
};

// Turns a command into the controller Action valid for the current phase.
// Battle options come out without the penalty flag; the input loop sets it.
Action commandToAction(const World& w, Command c);
