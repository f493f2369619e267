#include "keybinds.hpp"

#include "common.hpp"

#include <fstream>
#include <initializer_list>
#include <sstream>

namespace {

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur, delim)) out.push_back(cur);
    return out;
}

struct NamedKey {
    const char* name;
    SDL_Keycode key;
};

// First name listed for a key is the one describe() prints.
const NamedKey kNamedKeys[] = {
    {"up", SDLK_UP},
    {"down", SDLK_DOWN},
    {"left", SDLK_LEFT},
    {"right", SDLK_RIGHT},
    {"enter", SDLK_RETURN},
    {"return", SDLK_RETURN},
    {"escape", SDLK_ESCAPE},
    {"esc", SDLK_ESCAPE},
    {"tab", SDLK_TAB},
    {"space", SDLK_SPACE},
    {"backspace", SDLK_BACKSPACE},
    {"comma", SDLK_COMMA},
    {"period", SDLK_PERIOD},
    {"slash", SDLK_SLASH},
    {"kp_enter", SDLK_KP_ENTER},
    {"kp_0", SDLK_KP_0},
    {"kp_1", SDLK_KP_1},
    {"kp_2", SDLK_KP_2},
    {"kp_3", SDLK_KP_3},
    {"kp_4", SDLK_KP_4},
    {"kp_5", SDLK_KP_5},
    {"kp_6", SDLK_KP_6},
    {"kp_7", SDLK_KP_7},
    {"kp_8", SDLK_KP_8},
    {"kp_9", SDLK_KP_9},
};

} // namespace

const char* commandName(Command c) {
    switch (c) {
        case Command::Up:        return "up";
        case Command::Down:      return "down";
        case Command::Left:      return "left";
        case Command::Right:     return "right";
        case Command::Confirm:   return "confirm";
        case Command::Cancel:    return "cancel";
        case Command::Inventory: return "inventory";
        case Command::Stats:     return "stats";
        case Command::Tab:       return "tab";
        case Command::Interact:  return "interact";
        case Command::Use:       return "use";
        case Command::Option1:   return "option1";
        case Command::Option2:   return "option2";
        case Command::Option3:   return "option3";
        case Command::Quit:      return "quit";
        default:                 return "?";
    }
}

Uint16 KeyBinds::normalizeMods(Uint16 mods) {
    Uint16 out = KMOD_NONE;
    if (mods & KMOD_SHIFT) out |= KMOD_SHIFT;
    if (mods & KMOD_CTRL) out |= KMOD_CTRL;
    if (mods & KMOD_ALT) out |= KMOD_ALT;
    return out;
}

SDL_Keycode KeyBinds::parseKeycode(const std::string& keyNameIn) {
    const std::string keyName = toLower(trim(keyNameIn));
    if (keyName.empty()) return SDLK_UNKNOWN;

    // Single character (letters are treated case-insensitively).
    if (keyName.size() == 1) return static_cast<SDL_Keycode>(static_cast<unsigned char>(keyName[0]));

    for (const NamedKey& nk : kNamedKeys) {
        if (keyName == nk.name) return nk.key;
    }

    // Function keys
    if (keyName.size() >= 2 && keyName[0] == 'f') {
        int n = 0;
        for (size_t i = 1; i < keyName.size(); ++i) {
            const char c = keyName[i];
            if (c < '0' || c > '9') {
                n = 0;
                break;
            }
            n = n * 10 + (c - '0');
        }
        if (n >= 1 && n <= 12) return static_cast<SDL_Keycode>(SDLK_F1 + (n - 1));
    }

    // Fallback: SDL's own key names ("Keypad 8", "Left Shift", ...).
    return SDL_GetKeyFromName(keyNameIn.c_str());
}

std::optional<KeyChord> KeyBinds::parseChord(const std::string& tokenIn) {
    const std::string token = trim(tokenIn);
    if (token.empty()) return std::nullopt;

    const std::vector<std::string> parts = split(token, '+');
    if (parts.empty()) return std::nullopt;

    Uint16 mods = KMOD_NONE;
    // All parts except the last are modifiers.
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        const std::string m = toLower(trim(parts[i]));
        if (m == "shift") mods |= KMOD_SHIFT;
        else if (m == "ctrl" || m == "control") mods |= KMOD_CTRL;
        else if (m == "alt") mods |= KMOD_ALT;
        else return std::nullopt;
    }

    const SDL_Keycode key = parseKeycode(parts.back());
    if (key == SDLK_UNKNOWN) return std::nullopt;

    KeyChord chord;
    chord.key = key;
    chord.mods = normalizeMods(mods);
    return chord;
}

std::vector<KeyChord> KeyBinds::parseChordList(const std::string& valueIn) {
    const std::string value = trim(valueIn);
    const std::string vLow = toLower(value);
    if (value.empty() || vLow == "none" || vLow == "unbound") return {};

    std::vector<KeyChord> out;
    for (const std::string& part : split(value, ',')) {
        if (auto chord = parseChord(part)) out.push_back(*chord);
    }
    return out;
}

std::optional<Command> KeyBinds::parseCommandName(const std::string& bindKeyIn) {
    const std::string key = toLower(trim(bindKeyIn));
    if (key.rfind("bind_", 0) != 0) return std::nullopt;
    const std::string name = key.substr(5);

    for (int i = 0; i < COMMAND_COUNT; ++i) {
        const Command c = static_cast<Command>(i);
        if (name == commandName(c)) return c;
    }
    if (name == "inv") return Command::Inventory;
    if (name == "escape") return Command::Cancel;
    return std::nullopt;
}

std::string KeyBinds::chordToString(const KeyChord& chord) {
    std::string out;
    if (chord.mods & KMOD_CTRL) out += "ctrl+";
    if (chord.mods & KMOD_ALT) out += "alt+";
    if (chord.mods & KMOD_SHIFT) out += "shift+";

    for (const NamedKey& nk : kNamedKeys) {
        if (nk.key == chord.key) return out + nk.name;
    }
    if (chord.key >= SDLK_F1 && chord.key <= SDLK_F12) {
        return out + "f" + std::to_string(static_cast<int>(chord.key - SDLK_F1) + 1);
    }
    if (chord.key > 32 && chord.key < 127) {
        return out + std::string(1, static_cast<char>(chord.key));
    }
    return out + toLower(SDL_GetKeyName(chord.key));
}

KeyBinds KeyBinds::defaults() {
    KeyBinds kb;

    auto add = [&kb](Command c, SDL_Keycode key, Uint16 mods = KMOD_NONE) {
        kb.list(c).push_back({key, normalizeMods(mods)});
    };

    add(Command::Up, SDLK_w);
    add(Command::Up, SDLK_UP);
    add(Command::Up, SDLK_KP_8);
    add(Command::Down, SDLK_s);
    add(Command::Down, SDLK_DOWN);
    add(Command::Down, SDLK_KP_2);
    add(Command::Left, SDLK_a);
    add(Command::Left, SDLK_LEFT);
    add(Command::Left, SDLK_KP_4);
    add(Command::Right, SDLK_d);
    add(Command::Right, SDLK_RIGHT);
    add(Command::Right, SDLK_KP_6);

    add(Command::Confirm, SDLK_RETURN);
    add(Command::Confirm, SDLK_SPACE);
    add(Command::Confirm, SDLK_KP_ENTER);
    add(Command::Cancel, SDLK_ESCAPE);
    add(Command::Interact, SDLK_e);
    add(Command::Use, SDLK_u);
    add(Command::Inventory, SDLK_i);
    add(Command::Stats, SDLK_q);
    add(Command::Tab, SDLK_TAB);
    add(Command::Tab, SDLK_t);

    add(Command::Option1, SDLK_1);
    add(Command::Option1, SDLK_KP_1);
    add(Command::Option2, SDLK_2);
    add(Command::Option2, SDLK_KP_2);
    add(Command::Option3, SDLK_3);
    add(Command::Option3, SDLK_KP_3);

    add(Command::Quit, SDLK_q, KMOD_CTRL);
    add(Command::Quit, SDLK_c, KMOD_CTRL);

    return kb;
}

void KeyBinds::loadOverridesFromIni(const std::string& settingsPath) {
    std::ifstream in(settingsPath);
    if (!in) return;

    std::string line;
    while (std::getline(in, line)) {
        const size_t commentPos = line.find_first_of("#;");
        if (commentPos != std::string::npos) line = line.substr(0, commentPos);

        const size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::optional<Command> cmd = parseCommandName(line.substr(0, eq));
        if (!cmd) continue;

        list(*cmd) = parseChordList(line.substr(eq + 1));
    }
}

bool KeyBinds::matches(Command c, SDL_Keycode key, Uint16 mods) const {
    const Uint16 nm = normalizeMods(mods);
    for (const KeyChord& chord : list(c)) {
        if (chord.key == key && chord.mods == nm) return true;
    }
    return false;
}

std::optional<Command> KeyBinds::mapKey(const World& w, SDL_Keycode key, Uint16 mods) const {
    auto firstOf = [&](std::initializer_list<Command> order) -> std::optional<Command> {
        for (Command c : order) {
            if (matches(c, key, mods)) return c;
        }
        return std::nullopt;
    };

    if (matches(Command::Quit, key, mods)) return Command::Quit;

    // Battle options share keypad keys with movement.
    if (w.phaseKind() == PhaseKind::Battle && !w.inventoryOpen) {
        if (auto c = firstOf({Command::Option1, Command::Option2, Command::Option3})) return c;
    }

    // Overlay commands win over movement (users may rebind keys to overlap).
    if (w.inventoryOpen || w.statsOpen) {
        if (auto c = firstOf({Command::Use, Command::Tab, Command::Cancel, Command::Inventory, Command::Stats})) {
            return c;
        }
    }

    return firstOf({
        Command::Confirm,
        Command::Cancel,
        Command::Interact,
        Command::Inventory,
        Command::Stats,
        Command::Tab,
        Command::Use,
        Command::Up,
        Command::Down,
        Command::Left,
        Command::Right,
        Command::Option1,
        Command::Option2,
        Command::Option3,
    });
}

std::string KeyBinds::describe(Command c, size_t maxKeys) const {
    std::string out;
    size_t n = 0;
    for (const KeyChord& chord : list(c)) {
        if (maxKeys != 0 && n == maxKeys) break;
        if (!out.empty()) out += ", ";
        out += chordToString(chord);
        ++n;
    }
    return out.empty() ? "none" : out;
}

Action commandToAction(const World& w, Command c) {
    if (c == Command::Quit) return Action::quit();

    switch (w.phaseKind()) {
        case PhaseKind::Title:
        case PhaseKind::Intro:
        case PhaseKind::Dialogue:
            // Dialogue answers arrive as text input, not as commands.
            if (c == Command::Confirm) return Action::simple(ActionKind::Confirm);
            return Action::none();

        case PhaseKind::Battle:
            if (w.inventoryOpen) {
                switch (c) {
                    case Command::Inventory:
                    case Command::Cancel:  return Action::simple(ActionKind::ToggleInventory);
                    case Command::Up:      return Action::simple(ActionKind::InventoryUp);
                    case Command::Down:    return Action::simple(ActionKind::InventoryDown);
                    case Command::Use:
                    case Command::Confirm: return Action::simple(ActionKind::UseConsumable);
                    default:               return Action::none();
                }
            }
            switch (c) {
                case Command::Option1:   return Action::battle(1);
                case Command::Option2:
                case Command::Inventory: return Action::battle(2);
                case Command::Option3:   return Action::battle(3);
                default:                 return Action::none();
            }

        case PhaseKind::Playing:
            if (w.statsOpen) {
                if (c == Command::Stats || c == Command::Cancel) return Action::simple(ActionKind::ToggleStats);
                return Action::none();
            }
            if (w.inventoryOpen) {
                switch (c) {
                    case Command::Tab:       return Action::simple(ActionKind::ToggleInvTab);
                    case Command::Stats:     return Action::simple(ActionKind::ToggleStats);
                    case Command::Inventory:
                    case Command::Cancel:    return Action::simple(ActionKind::ToggleInventory);
                    case Command::Up:        return Action::simple(ActionKind::InventoryUp);
                    case Command::Down:      return Action::simple(ActionKind::InventoryDown);
                    case Command::Use:
                    case Command::Confirm:   return Action::simple(ActionKind::UseConsumable);
                    default:                 return Action::none();
                }
            }
            switch (c) {
                case Command::Up:        return Action::move(0, -1);
                case Command::Down:      return Action::move(0, 1);
                case Command::Left:      return Action::move(-1, 0);
                case Command::Right:     return Action::move(1, 0);
                case Command::Interact:  return Action::simple(ActionKind::Interact);
                case Command::Inventory: return Action::simple(ActionKind::ToggleInventory);
                case Command::Stats:     return Action::simple(ActionKind::ToggleStats);
                default:                 return Action::none();
            }

        case PhaseKind::Ending:
        default:
            return Action::none();
    }
}
