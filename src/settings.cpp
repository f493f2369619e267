#include "settings.hpp"

#include "common.hpp"

#include <algorithm>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>

namespace {

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    const std::string s = trim(v);
    size_t used = 0;
    try {
        out = std::stoi(s, &used);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
    return used == s.size();
}

bool parseU64(const std::string& v, uint64_t& out) {
    const std::string s = trim(v);
    if (s.empty() || s[0] == '-') return false;
    size_t used = 0;
    try {
        out = std::stoull(s, &used);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
    return used == s.size();
}

void readClamped(const std::string& val, int& field, int lo, int hi) {
    int v = 0;
    if (parseInt(val, v)) field = std::clamp(v, lo, hi);
}

} // namespace

int clampMapWidth(uint64_t w) {
    return static_cast<int>(std::clamp<uint64_t>(w, MAP_WIDTH_MIN, MAP_WIDTH_MAX));
}

int clampMapHeight(uint64_t h) {
    return static_cast<int>(std::clamp<uint64_t>(h, MAP_HEIGHT_MIN, MAP_HEIGHT_MAX));
}

Settings parseSettings(std::istream& in) {
    Settings s;

    std::string line;
    while (std::getline(in, line)) {
        // Strip comments (# or ;)
        const size_t cut = line.find_first_of("#;");
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        const size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = toLower(trim(line.substr(0, eq)));
        const std::string val = trim(line.substr(eq + 1));

        if (key == "seed") {
            uint64_t v = 0;
            if (parseU64(val, v)) s.seed = v;
        } else if (key == "map_width") {
            readClamped(val, s.mapWidth, MAP_WIDTH_MIN, MAP_WIDTH_MAX);
        } else if (key == "map_height") {
            readClamped(val, s.mapHeight, MAP_HEIGHT_MIN, MAP_HEIGHT_MAX);
        } else if (key == "battle_penalty_ms") {
            readClamped(val, s.battlePenaltyMs, 1000, 60000);
        } else if (key == "move_cooldown_ms") {
            readClamped(val, s.moveCooldownMs, 0, 500);
        } else if (key == "step_ms") {
            readClamped(val, s.stepMs, 1, 10000);
        } else if (key == "tile_size") {
            readClamped(val, s.tileSize, 8, 48);
        } else if (key == "hud_width") {
            readClamped(val, s.hudWidth, 200, 600);
        } else if (key == "vsync") {
            bool b = true;
            if (parseBool(val, b)) s.vsync = b;
        }
    }

    return s;
}

Settings loadSettings(const std::string& path) {
    std::ifstream f(path);
    if (!f) return Settings{};
    return parseSettings(f);
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# Sunny Days settings
#
# Lines are: key = value
# Comments start with # or ;
#
# This file is auto-created on first run. Edit it and restart the game.

# World
# seed: 0 picks a random seed every run
seed = 0
# map_width: 24..200, map_height: 16..120
map_width = 80
map_height = 45

# Timing
# battle_penalty_ms: taking longer than this to pick a battle option lets the enemy strike first
battle_penalty_ms = 10000
# move_cooldown_ms: 0..500 (minimum gap between moves while a key is held)
move_cooldown_ms = 90
# step_ms: simulated time per scripted action (headless runner)
step_ms = 100

# Rendering
tile_size = 16
hud_width = 320
# vsync: true/false  (true = lower CPU usage, smoother rendering)
vsync = true

# -----------------------------------------------------------------------------
# Keybindings
#
# Rebind keys by adding entries of the form:
#   bind_<command> = key[, key, ...]
#
# Modifiers: shift, ctrl, alt. Example: ctrl+q
# Set a binding to "none" to disable it.
# Dialogue answers (y/n, s/h, t/u/d) are typed directly and cannot be rebound.
# -----------------------------------------------------------------------------

# Movement
bind_up = w, up, kp_8
bind_down = s, down, kp_2
bind_left = a, left, kp_4
bind_right = d, right, kp_6

# Actions
bind_confirm = enter, space, kp_enter
bind_cancel = escape
bind_interact = e
bind_use = u
bind_inventory = i
bind_stats = q
bind_tab = tab, t

# Battle
bind_option1 = 1, kp_1
bind_option2 = 2, kp_2
bind_option3 = 3, kp_3

# Meta
bind_quit = ctrl+q, ctrl+c
)INI";

    return true;
}
