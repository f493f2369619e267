#include "render.hpp"
#include "version.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

const Color kWhite{240, 240, 240, 255};
const Color kGray{160, 160, 160, 255};
const Color kYellow{255, 230, 120, 255};
const Color kRed{255, 80, 80, 255};
const Color kGreen{120, 255, 120, 255};
const Color kBlue{160, 200, 255, 255};

Color messageColor(MessageKind k) {
    switch (k) {
        case MessageKind::Info:    return kWhite;
        case MessageKind::Combat:  return kRed;
        case MessageKind::Loot:    return kYellow;
        case MessageKind::Warning: return kYellow;
        case MessageKind::Success: return kGreen;
        case MessageKind::System:  return kGray;
        default:                   return kWhite;
    }
}

Color tileColor(TileType t) {
    switch (t) {
        case TileType::Wall:  return Color{58, 62, 74, 255};
        case TileType::Floor: return Color{122, 170, 92, 255};
        case TileType::Door:  return Color{150, 96, 48, 255};
        case TileType::Chest: return Color{122, 170, 92, 255};
        default:              return Color{0, 0, 0, 255};
    }
}

Color npcColor(const Npc& n) {
    const NpcDef& d = npcDef(n.id);
    if (d.boss) return kRed;
    if (d.hostile) return Color{255, 150, 80, 255};
    return kBlue;
}

void fillRect(SDL_Renderer* r, const SDL_Rect& rect, Color c) {
    SDL_SetRenderDrawColor(r, c.r, c.g, c.b, c.a);
    SDL_RenderFillRect(r, &rect);
}

// HP bar with a text label on top.
void drawBar(SDL_Renderer* r, int x, int y, int w, int h, int value, int maxValue, Color fg) {
    const SDL_Rect bg{x, y, w, h};
    fillRect(r, bg, Color{40, 20, 20, 255});
    const int fillW = maxValue > 0 ? std::clamp(value * w / maxValue, 0, w) : 0;
    const SDL_Rect fg0{x, y, fillW, h};
    fillRect(r, fg0, fg);
    SDL_SetRenderDrawColor(r, 0, 0, 0, 255);
    SDL_RenderDrawRect(r, &bg);
}

} // namespace

Renderer::Renderer(int mapWidth, int mapHeight, int tileSize, int hudWidth, bool vsync)
    : mapW(mapWidth), mapH(mapHeight), tile(tileSize), hudW(hudWidth), vsyncEnabled(vsync) {
    winW = mapW * tile + hudW;
    winH = mapH * tile;
}

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init() {
    if (initialized) return true;

    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0"); // nearest-neighbor

    const std::string title = std::string(SUNNYDAYS_APPNAME) + " v" + SUNNYDAYS_VERSION;
    window = SDL_CreateWindow(title.c_str(),
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              winW, winH,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    Uint32 rFlags = SDL_RENDERER_ACCELERATED;
    if (vsyncEnabled) rFlags |= SDL_RENDERER_PRESENTVSYNC;
    renderer = SDL_CreateRenderer(window, -1, rFlags);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window); window = nullptr;
        return false;
    }

    // Fixed virtual resolution; SDL scales the output when the window is resized.
    SDL_RenderSetLogicalSize(renderer, winW, winH);
    SDL_RenderSetIntegerScale(renderer, SDL_TRUE);

    initialized = true;
    return true;
}

void Renderer::setKeyNames(const KeyBinds& binds) {
    for (int i = 0; i < COMMAND_COUNT; ++i) {
        keyNames[static_cast<size_t>(i)] = binds.describe(static_cast<Command>(i), 1);
    }
}

void Renderer::shutdown() {
    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }
    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }
    initialized = false;
}

void Renderer::toggleFullscreen() {
    if (!window) return;
    const Uint32 flags = SDL_GetWindowFlags(window);
    const bool isFs = (flags & SDL_WINDOW_FULLSCREEN_DESKTOP) != 0;
    SDL_SetWindowFullscreen(window, isFs ? 0 : SDL_WINDOW_FULLSCREEN_DESKTOP);
}

void Renderer::drawPanel(const SDL_Rect& rect, uint8_t alpha) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    SDL_Rect shadow{rect.x + 2, rect.y + 2, rect.w, rect.h};
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, static_cast<Uint8>(std::min<int>(alpha, 200) / 2));
    SDL_RenderFillRect(renderer, &shadow);

    SDL_SetRenderDrawColor(renderer, 18, 22, 30, alpha);
    SDL_RenderFillRect(renderer, &rect);

    SDL_SetRenderDrawColor(renderer, 210, 180, 110, static_cast<Uint8>(std::min<int>(alpha + 40, 255)));
    SDL_RenderDrawRect(renderer, &rect);
}

void Renderer::drawCentered(int y, int scale, Color c, const std::string& text) {
    const int w = textWidth5x7(text, scale);
    drawText5x7(renderer, (winW - w) / 2, y, scale, c, text);
}

void Renderer::render(const Game& game, uint64_t nowMs) {
    if (!initialized) return;

    SDL_SetRenderDrawColor(renderer, 8, 10, 14, 255);
    SDL_RenderClear(renderer);

    switch (game.phase()) {
        case PhaseKind::Title:
            drawTitle();
            break;
        case PhaseKind::Intro:
            drawIntro();
            break;
        case PhaseKind::Ending:
            drawEnding(game);
            break;
        case PhaseKind::Playing:
        case PhaseKind::Dialogue:
        case PhaseKind::Battle:
        default:
            drawMap(game);
            drawHud(game, nowMs);
            if (game.phase() == PhaseKind::Battle) drawBattlePanel(game, nowMs);
            if (game.phase() == PhaseKind::Dialogue) drawDialogueBox(game);
            if (game.world().statsOpen) drawStatsOverlay(game, nowMs);
            if (game.world().inventoryOpen) drawInventoryOverlay(game);
            break;
    }

    SDL_RenderPresent(renderer);
}

void Renderer::drawTitle() {
    drawCentered(winH / 3, 6, kYellow, "SUNNY DAYS");
    drawCentered(winH / 3 + 70, 2, kGray, std::string("V") + SUNNYDAYS_VERSION);
    drawCentered(winH * 2 / 3, 2, kWhite, "PRESS " + keyName(Command::Confirm) + " TO BEGIN");
}

void Renderer::drawIntro() {
    static const char* kLines[] = {
        "THE VALLEY HAS BEEN QUIET FOR TOO LONG.",
        "SLIMES CREEP OUT OF THE MARSH AND THE WOLVES GROW BOLD.",
        "TALK TO THE ELDER, ARM YOURSELF, AND FIND THE DOOR.",
        "SOMETHING WAITS IN ROOM 2.",
    };
    int y = winH / 4;
    for (const char* l : kLines) {
        drawCentered(y, 2, kWhite, l);
        y += 28;
    }
    drawCentered(winH * 3 / 4, 2, kGray, "PRESS " + keyName(Command::Confirm));
}

void Renderer::drawEnding(const Game& game) {
    const auto* end = std::get_if<EndingPhase>(&game.world().phase);
    drawCentered(winH / 3, 5, kRed, "THE END");
    if (end) drawCentered(winH / 3 + 60, 2, kWhite, end->cause);
    drawCentered(winH * 2 / 3, 2, kGray, "PRESS " + keyName(Command::Quit) + " TO QUIT");
}

void Renderer::drawMap(const Game& game) {
    const World& w = game.world();
    const Level& lvl = w.currentLevel();

    for (int y = 0; y < lvl.map.height && y < mapH; ++y) {
        for (int x = 0; x < lvl.map.width && x < mapW; ++x) {
            const TileType t = lvl.map.at(x, y);
            const SDL_Rect r{x * tile, y * tile, tile, tile};
            fillRect(renderer, r, tileColor(t));

            if (t == TileType::Chest) {
                const int m = std::max(2, tile / 5);
                const SDL_Rect box{r.x + m, r.y + m, tile - 2 * m, tile - 2 * m};
                fillRect(renderer, box, Color{190, 140, 40, 255});
                SDL_SetRenderDrawColor(renderer, 80, 50, 10, 255);
                SDL_RenderDrawRect(renderer, &box);
            } else if (t == TileType::Door) {
                const SDL_Rect knob{r.x + tile * 2 / 3, r.y + tile / 2, std::max(1, tile / 8), std::max(1, tile / 8)};
                fillRect(renderer, knob, kYellow);
            }
        }
    }

    const int glyphScale = std::max(1, tile / 8);
    const int glyphOff = (tile - 5 * glyphScale) / 2;
    const int glyphOffY = (tile - 7 * glyphScale) / 2;

    for (const Npc& n : w.npcs) {
        if (!n.present || n.level != w.current) continue;
        drawText5x7(renderer, n.pos.x * tile + glyphOff, n.pos.y * tile + glyphOffY, glyphScale,
                    npcColor(n), std::string(1, n.symbol));
    }

    drawText5x7(renderer, w.player.pos.x * tile + glyphOff, w.player.pos.y * tile + glyphOffY, glyphScale,
                kWhite, "@");
}

void Renderer::drawHud(const Game& game, uint64_t nowMs) {
    const World& w = game.world();
    const Player& p = w.player;

    const SDL_Rect hudRect{mapW * tile, 0, hudW, winH};
    drawPanel(hudRect, 230);

    const int x = hudRect.x + 10;
    int y = 10;

    drawText5x7(renderer, x, y, 2, kYellow, "SUNNY DAYS");
    y += 24;

    std::stringstream ss;
    ss << "ROOM " << (w.current + 1) << "  SEED " << w.seed;
    drawText5x7(renderer, x, y, 1, kGray, ss.str());
    y += 14;

    ss.str(std::string());
    ss << "HP " << p.hp << "/" << p.hpMax;
    drawText5x7(renderer, x, y, 2, kWhite, ss.str());
    y += 18;
    drawBar(renderer, x, y, hudW - 20, 8, p.hp, p.hpMax, kGreen);
    y += 16;

    ss.str(std::string());
    ss << "ATK " << p.attack(nowMs) << "  DEF " << p.defense(nowMs) << "  SPD " << p.speed(nowMs);
    drawText5x7(renderer, x, y, 1, kWhite, ss.str());
    y += 12;

    if (!p.buffs.empty()) {
        ss.str(std::string());
        ss << "BUFFS: " << p.buffs.size();
        drawText5x7(renderer, x, y, 1, kGreen, ss.str());
    }
    y += 12;

    drawText5x7(renderer, x, y, 1, kGray,
                std::string("SWORD: ") + (p.inv.sword ? p.inv.sword->name : std::string("-")));
    y += 10;
    drawText5x7(renderer, x, y, 1, kGray,
                std::string("SHIELD: ") + (p.inv.shield ? p.inv.shield->name : std::string("-")));
    y += 18;

    ss.str(std::string());
    ss << keyName(Command::Up) << "/" << keyName(Command::Left) << "/" << keyName(Command::Down) << "/"
       << keyName(Command::Right) << " MOVE  " << keyName(Command::Interact) << " INTERACT";
    drawText5x7(renderer, x, y, 1, kGray, ss.str());
    y += 10;
    ss.str(std::string());
    ss << keyName(Command::Inventory) << " BAG  " << keyName(Command::Stats) << " STATS";
    drawText5x7(renderer, x, y, 1, kGray, ss.str());
    y += 18;

    drawLog(game, y);
}

void Renderer::drawLog(const Game& game, int y) {
    const int x = mapW * tile + 10;
    const int maxW = hudW - 20;
    for (const Message& m : game.world().log) {
        const int lines = drawTextWrapped5x7(renderer, x, y, 1, messageColor(m.kind), m.text, maxW);
        y += lines * 8 + 4;
        if (y > winH - 10) break;
    }
}

void Renderer::drawInventoryOverlay(const Game& game) {
    const Inventory& inv = game.world().player.inv;

    const int panelW = std::min(winW - 40, 420);
    const int panelH = std::min(winH - 40, 300);
    const SDL_Rect rect{(mapW * tile - panelW) / 2, (winH - panelH) / 2, panelW, panelH};
    drawPanel(rect, 235);

    int x = rect.x + 12;
    const int y0 = rect.y + 10;
    for (int i = 0; i < INV_TAB_COUNT; ++i) {
        const InvTab t = static_cast<InvTab>(i);
        const std::string name = invTabName(t);
        drawText5x7(renderer, x, y0, 1, t == inv.tab ? kYellow : kGray, name);
        x += textWidth5x7(name, 1) + 14;
    }

    std::vector<std::string> rows;
    switch (inv.tab) {
        case InvTab::Weapons:
            for (int r = 0; r < inv.tabLength(InvTab::Weapons); ++r) {
                const auto s = inv.weaponsRowSlot(r);
                if (!s) continue;
                rows.push_back(std::string(equipSlotName(*s)) + ": " + describeEquipment(*inv.slot(*s)));
            }
            break;
        case InvTab::Consumables:
            for (const Consumable& c : inv.consumables) rows.push_back(describeConsumable(c));
            break;
        case InvTab::Backpack:
            for (const Equipment& e : inv.backpack) rows.push_back(describeEquipment(e));
            break;
    }

    int y = y0 + 20;
    if (rows.empty()) {
        drawText5x7(renderer, rect.x + 12, y, 1, kGray, "(EMPTY)");
    }
    for (int i = 0; i < static_cast<int>(rows.size()); ++i) {
        const bool sel = i == inv.activeCursor();
        if (sel) {
            const SDL_Rect hl{rect.x + 6, y - 2, rect.w - 12, 11};
            fillRect(renderer, hl, Color{60, 60, 90, 255});
        }
        drawText5x7(renderer, rect.x + 12, y, 1, sel ? kWhite : kGray, rows[static_cast<size_t>(i)]);
        y += 12;
        if (y > rect.y + rect.h - 24) break;
    }

    std::string hint;
    if (game.phase() == PhaseKind::Battle) {
        hint = keyName(Command::Use) + " USE  " + keyName(Command::Inventory) + " CLOSE";
    } else {
        hint = keyName(Command::Tab) + " SWITCH  " + keyName(Command::Use) + " USE/EQUIP  " +
               keyName(Command::Inventory) + " CLOSE";
    }
    drawText5x7(renderer, rect.x + 12, rect.y + rect.h - 14, 1, kGray, hint);
}

void Renderer::drawStatsOverlay(const Game& game, uint64_t nowMs) {
    const Player& p = game.world().player;

    const int panelW = 300;
    const int panelH = 160;
    const SDL_Rect rect{(mapW * tile - panelW) / 2, (winH - panelH) / 2, panelW, panelH};
    drawPanel(rect, 235);

    int y = rect.y + 10;
    const int x = rect.x + 12;
    drawText5x7(renderer, x, y, 2, kYellow, "STATS");
    y += 24;

    const BuffTotals buff = sumActiveBuffs(p.buffs, nowMs);

    std::stringstream ss;
    ss << "HP: " << p.hp << "/" << p.hpMax;
    drawText5x7(renderer, x, y, 1, kWhite, ss.str());
    y += 14;

    auto statLine = [&](const char* name, int total, int bonus) {
        std::stringstream line;
        line << name << ": " << total;
        if (bonus != 0) line << " (BUFF " << (bonus > 0 ? "+" : "") << bonus << ")";
        drawText5x7(renderer, x, y, 1, bonus != 0 ? kGreen : kWhite, line.str());
        y += 14;
    };
    statLine("ATTACK", p.attack(nowMs), buff.atk);
    statLine("DEFENSE", p.defense(nowMs), buff.def);
    statLine("SPEED", p.speed(nowMs), buff.spd);

    y += 6;
    for (const TempBuff& b : p.buffs) {
        if (!b.activeAt(nowMs)) continue;
        const uint64_t left = (b.expiresAtMs - nowMs + 999) / 1000;
        std::stringstream line;
        line << "BUFF";
        if (b.atk) line << " ATK+" << b.atk;
        if (b.def) line << " DEF+" << b.def;
        line << "  " << left << "S";
        drawText5x7(renderer, x, y, 1, kGreen, line.str());
        y += 10;
        if (y > rect.y + rect.h - 10) break;
    }
}

void Renderer::drawDialogueBox(const Game& game) {
    const DialogueSession* d = game.world().dialogue();
    if (!d) return;

    const int panelH = 120;
    const SDL_Rect rect{8, winH - panelH - 8, mapW * tile - 16, panelH};
    drawPanel(rect, 240);

    drawText5x7(renderer, rect.x + 12, rect.y + 10, 2, kYellow, d->title);
    drawTextWrapped5x7(renderer, rect.x + 12, rect.y + 34, 2, kWhite, d->currentPage(), rect.w - 24);

    std::string hint = keyName(Command::Confirm) + ": CONTINUE";
    if (d->awaitingChoice()) hint = "TYPE YOUR ANSWER";
    else if (!d->hasNextPage()) hint = keyName(Command::Confirm) + ": CLOSE";
    std::stringstream ss;
    ss << hint << "   " << (d->page + 1) << "/" << d->pages.size();
    drawText5x7(renderer, rect.x + 12, rect.y + rect.h - 14, 1, kGray, ss.str());
}

void Renderer::drawBattlePanel(const Game& game, uint64_t nowMs) {
    const BattleSession* b = game.world().battle();
    if (!b) return;
    const Player& p = game.world().player;

    const int panelW = std::min(mapW * tile - 40, 520);
    const int panelH = 170;
    const SDL_Rect rect{(mapW * tile - panelW) / 2, 20, panelW, panelH};
    drawPanel(rect, 240);

    const int x = rect.x + 12;
    int y = rect.y + 10;
    drawText5x7(renderer, x, y, 2, kRed, b->name);
    y += 22;

    std::stringstream ss;
    ss << "HP " << b->hp << "/" << b->hpMax << "  ATK " << b->atk << "  DEF " << b->def << "  SPD " << b->spd;
    drawText5x7(renderer, x, y, 1, kWhite, ss.str());
    y += 12;
    drawBar(renderer, x, y, panelW - 24, 8, b->hp, b->hpMax, kRed);
    y += 20;

    ss.str(std::string());
    ss << "YOU  HP " << p.hp << "/" << p.hpMax << "  ATK " << p.attack(nowMs)
       << "  DEF " << p.defense(nowMs) << "  SPD " << p.speed(nowMs);
    drawText5x7(renderer, x, y, 1, kWhite, ss.str());
    y += 12;
    drawBar(renderer, x, y, panelW - 24, 8, p.hp, p.hpMax, kGreen);
    y += 24;

    ss.str(std::string());
    ss << keyName(Command::Option1) << " FIGHT   " << keyName(Command::Option2) << " ITEMS   "
       << keyName(Command::Option3) << " RUN";
    drawText5x7(renderer, x, y, 2, kYellow, ss.str());
    y += 22;
    if (b->playerInitiated) drawText5x7(renderer, x, y, 1, kGray, "YOU CHOSE THIS FIGHT. THERE IS NO RUNNING.");
}

std::string Renderer::saveScreenshotBMP(const std::string& directory, const std::string& prefix) const {
    namespace fs = std::filesystem;
    if (!renderer) return {};

    std::error_code ec;
    if (!directory.empty()) {
        fs::create_directories(fs::path(directory), ec);
    }

    std::time_t t = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    tm = *std::localtime(&t);
#endif

    std::ostringstream name;
    name << prefix << "_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".bmp";
    const fs::path outPath = directory.empty() ? fs::path(name.str()) : fs::path(directory) / name.str();

    int w = 0, h = 0;
    if (SDL_GetRendererOutputSize(renderer, &w, &h) != 0) {
        w = winW;
        h = winH;
    }

    SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormat(0, w, h, 32, SDL_PIXELFORMAT_RGBA32);
    if (!surface) return {};

    if (SDL_RenderReadPixels(renderer, nullptr, surface->format->format, surface->pixels, surface->pitch) != 0 ||
        SDL_SaveBMP(surface, outPath.string().c_str()) != 0) {
        SDL_FreeSurface(surface);
        return {};
    }

    SDL_FreeSurface(surface);
    return outPath.string();
}
