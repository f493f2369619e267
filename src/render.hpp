#pragma once
#include "sdl.hpp"

#include "game.hpp"
#include "keybinds.hpp"
#include "ui_font.hpp"

#include <array>
#include <cstdint>
#include <string>

// SDL2 front-end renderer. Draws the current room on the left and a HUD
// column (stats, log, overlays) on the right. Everything is flat-colored
// tiles plus the built-in 5x7 font, so no asset files are needed.
class Renderer {
public:
    Renderer(int mapWidth, int mapHeight, int tileSize, int hudWidth, bool vsync);
    ~Renderer();

    bool init();
    void shutdown();

    void render(const Game& game, uint64_t nowMs);

    void toggleFullscreen();

    // On-screen hints name the first key bound to each command.
    void setKeyNames(const KeyBinds& binds);

    // Saves a BMP of the current frame.
    // Returns the full path written, or an empty string on failure.
    std::string saveScreenshotBMP(const std::string& directory, const std::string& prefix = "sunnydays_shot") const;

private:
    int mapW = 0;
    int mapH = 0;
    int tile = 16;
    int hudW = 320;
    int winW = 0;
    int winH = 0;
    bool vsyncEnabled = false;

    bool initialized = false;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;

    std::array<std::string, COMMAND_COUNT> keyNames;
    const std::string& keyName(Command c) const { return keyNames[static_cast<size_t>(c)]; }

    void drawPanel(const SDL_Rect& rect, uint8_t alpha);

    void drawTitle();
    void drawIntro();
    void drawEnding(const Game& game);

    void drawMap(const Game& game);
    void drawHud(const Game& game, uint64_t nowMs);
    void drawLog(const Game& game, int y);

    void drawInventoryOverlay(const Game& game);
    void drawStatsOverlay(const Game& game, uint64_t nowMs);
    void drawDialogueBox(const Game& game);
    void drawBattlePanel(const Game& game, uint64_t nowMs);

    // Centered line of text inside the window.
    void drawCentered(int y, int scale, Color c, const std::string& text);
};
