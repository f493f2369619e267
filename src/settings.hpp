#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>

// Accepted map dimensions (settings file and --width/--height).
inline constexpr int MAP_WIDTH_MIN = 24;
inline constexpr int MAP_WIDTH_MAX = 200;
inline constexpr int MAP_HEIGHT_MIN = 16;
inline constexpr int MAP_HEIGHT_MAX = 120;

// Simple user-editable settings file (INI-ish: key = value).
// The SDL front end creates it in SDL_GetPrefPath on first run; the headless
// runner only reads it when given --config.
struct Settings {
    // World generation. 0 = pick a random seed at startup.
    uint64_t seed = 0;
    int mapWidth = 80;   // 24..200
    int mapHeight = 45;  // 16..120

    // Input loop timing
    // - battlePenaltyMs: a battle option chosen after this long is a slow decision.
    // - moveCooldownMs: minimum gap between two accepted moves from held keys.
    int battlePenaltyMs = 10000; // 1000..60000
    int moveCooldownMs = 90;     // 0..500

    // Headless runner: simulated milliseconds per scripted action.
    int stepMs = 100; // 1..10000

    // Rendering
    int tileSize = 16;  // 8..48
    int hudWidth = 320; // 200..600
    bool vsync = true;
};

// Reads key = value lines. Unknown keys are ignored; unparsable values keep
// their defaults and out-of-range numbers are clamped.
Settings parseSettings(std::istream& in);

int clampMapWidth(uint64_t w);
int clampMapHeight(uint64_t h);

// Loads settings from disk. If the file is missing or invalid, defaults are used.
Settings loadSettings(const std::string& path);

// Writes a commented default settings file (key bindings included).
// Returns true on success.
bool writeDefaultSettings(const std::string& path);
