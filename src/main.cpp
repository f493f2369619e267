#include "sdl.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

#include "game.hpp"
#include "keybinds.hpp"
#include "render.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "version.hpp"

static std::optional<uint64_t> parseSeedArg(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--seed" && i + 1 < argc) {
            try {
                return static_cast<uint64_t>(std::stoull(argv[i + 1], nullptr, 0));
            } catch (const std::invalid_argument&) {
                return std::nullopt;
            } catch (const std::out_of_range&) {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static void printUsage(const char* exe) {
    std::cout
        << SUNNYDAYS_APPNAME << " " << SUNNYDAYS_VERSION << "\n"
        << "Usage: " << (exe ? exe : "sunnydays") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           Generate the world from a specific seed\n"
        << "  --config <path>      Use this settings file instead of the per-user one\n"
        << "  --reset-settings     Overwrite settings with fresh defaults\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n";
}

static bool isMoveCommand(Command c) {
    return c == Command::Up || c == Command::Down || c == Command::Left || c == Command::Right;
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "sunnydays");
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << SUNNYDAYS_APPNAME << " " << SUNNYDAYS_VERSION << "\n";
        return 0;
    }

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    const std::optional<std::string> configArg = parseStringArg(argc, argv, "--config");
    const bool resetSettings = hasFlag(argc, argv, "--reset-settings");

    std::filesystem::path settingsPathFs;
    std::filesystem::path screenshotDirFs;
    if (configArg && !configArg->empty()) {
        settingsPathFs = std::filesystem::path(*configArg);
        screenshotDirFs = settingsPathFs.parent_path() / "screenshots";
    } else {
        std::filesystem::path baseDir;
        if (char* p = SDL_GetPrefPath("sunnydays", SUNNYDAYS_APPNAME)) {
            baseDir = std::filesystem::path(p);
            SDL_free(p);
        } else {
            baseDir = std::filesystem::current_path();
        }
        std::error_code ec;
        std::filesystem::create_directories(baseDir, ec);
        settingsPathFs = baseDir / "sunnydays_settings.ini";
        screenshotDirFs = baseDir / "screenshots";
    }

    const std::string settingsPath = settingsPathFs.string();
    const std::string screenshotDir = screenshotDirFs.string();

    if (resetSettings) {
        // Keep the previous file as <file>.bak (overwrite any existing .bak).
        std::error_code ec;
        const std::filesystem::path bak = settingsPathFs.string() + ".bak";
        std::filesystem::remove(bak, ec);
        if (std::filesystem::exists(settingsPathFs)) {
            std::filesystem::rename(settingsPathFs, bak, ec);
        }
        if (!writeDefaultSettings(settingsPath)) {
            std::cerr << "Could not write settings: " << settingsPath << "\n";
        }
    } else if (!std::filesystem::exists(settingsPathFs)) {
        if (!writeDefaultSettings(settingsPath)) {
            std::cerr << "Could not write settings: " << settingsPath << "\n";
        }
    }

    const Settings settings = loadSettings(settingsPath);

    KeyBinds keybinds = KeyBinds::defaults();
    keybinds.loadOverridesFromIni(settingsPath);

    uint64_t seed = settings.seed;
    if (const std::optional<uint64_t> seedArg = parseSeedArg(argc, argv)) {
        seed = *seedArg;
    } else if (seed == 0) {
        seed = splitmix64(SDL_GetPerformanceCounter());
    }

    Game game(seed, settings.mapWidth, settings.mapHeight);

    const Map& m0 = game.world().levels[0].map;
    Renderer renderer(m0.width, m0.height, settings.tileSize, settings.hudWidth, settings.vsync);
    if (!renderer.init()) {
        SDL_Quit();
        return 1;
    }
    renderer.setKeyNames(keybinds);

    bool running = true;
    bool textInputOn = false;
    bool wantScreenshot = false;

    // Battle penalty clock: restarts when a battle begins and after every battle input.
    PhaseKind lastPhase = game.phase();
    uint64_t battleTurnStartMs = 0;
    uint64_t lastMoveMs = 0;

    auto apply = [&](const Action& a, uint64_t nowMs) {
        if (a.kind == ActionKind::None) return;
        if (!game.applyAction(a, nowMs)) {
            running = false;
            return;
        }
        if (game.phase() == PhaseKind::Battle) battleTurnStartMs = nowMs;
    };

    while (running) {
        const uint64_t now = SDL_GetTicks();

        // Dialogue answers come in as text so any keyboard layout works.
        const DialogueSession* d = game.world().dialogue();
        const bool wantText = d && d->awaitingChoice();
        if (wantText && !textInputOn) {
            SDL_StartTextInput();
            textInputOn = true;
        } else if (!wantText && textInputOn) {
            SDL_StopTextInput();
            textInputOn = false;
        }

        SDL_Event ev;
        while (running && SDL_PollEvent(&ev)) {
            switch (ev.type) {
                case SDL_QUIT:
                    running = false;
                    break;

                case SDL_TEXTINPUT:
                    if (textInputOn && ev.text.text[0] != '\0') {
                        apply(Action::choose(ev.text.text[0]), now);
                    }
                    break;

                case SDL_KEYDOWN: {
                    const SDL_Keycode key = ev.key.keysym.sym;
                    const Uint16 mod = ev.key.keysym.mod;

                    if (ev.key.repeat == 0 && key == SDLK_F11) {
                        renderer.toggleFullscreen();
                        break;
                    }
                    if (ev.key.repeat == 0 && key == SDLK_F12) {
                        wantScreenshot = true;
                        break;
                    }

                    const std::optional<Command> cmd = keybinds.mapKey(game.world(), key, mod);
                    if (!cmd) break;

                    // Held keys only repeat movement, throttled by the cooldown.
                    if (isMoveCommand(*cmd)) {
                        if (ev.key.repeat != 0 && now - lastMoveMs < static_cast<uint64_t>(settings.moveCooldownMs)) break;
                    } else if (ev.key.repeat != 0) {
                        break;
                    }

                    Action a = commandToAction(game.world(), *cmd);
                    if (a.kind == ActionKind::BattleOption) {
                        a.penalty = now - battleTurnStartMs >= static_cast<uint64_t>(settings.battlePenaltyMs);
                    }
                    if (a.kind == ActionKind::Move) lastMoveMs = now;
                    apply(a, now);
                    break;
                }

                default:
                    break;
            }
        }

        if (!running) break;

        // Buff expiry is driven by the clock, not by input.
        game.applyAction(Action::none(), now);

        if (game.phase() == PhaseKind::Battle && lastPhase != PhaseKind::Battle) battleTurnStartMs = now;
        lastPhase = game.phase();

        renderer.render(game, now);

        if (wantScreenshot) {
            const std::string outPath = renderer.saveScreenshotBMP(screenshotDir);
            if (outPath.empty()) std::cerr << "SCREENSHOT FAILED.\n";
            else std::cout << "SCREENSHOT SAVED: " << outPath << "\n";
            wantScreenshot = false;
        }

        if (!settings.vsync) SDL_Delay(1);
    }

    if (textInputOn) SDL_StopTextInput();

    renderer.shutdown();
    SDL_Quit();
    return 0;
}
