#include "game.hpp"
#include "script.hpp"
#include "settings.hpp"
#include "version.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [options]\n\n"
        << "Runs an action script against a freshly generated world and prints\n"
        << "the log and a final state summary. Reads the script from stdin when\n"
        << "--script is not given.\n\n"
        << "Options:\n"
        << "  --seed <n>        World seed (default: settings seed, else 0).\n"
        << "  --width <n>       Map width (24..200). Default: 80.\n"
        << "  --height <n>      Map height (16..120). Default: 45.\n"
        << "  --script <path>   Action script to run.\n"
        << "  --config <path>   Settings file (step_ms, seed, map size).\n"
        << "  --dump-map        Print both levels as ASCII before running.\n"
        << "  --version         Print version.\n"
        << "  --help            Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static bool parseU64(const std::string& s, uint64_t& out) {
    if (s.empty() || s.size() > 20) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        const uint64_t d = static_cast<uint64_t>(c - '0');
        if (v > (UINT64_MAX - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

static char tileGlyph(TileType t) {
    switch (t) {
        case TileType::Wall:  return '#';
        case TileType::Floor: return '.';
        case TileType::Door:  return '+';
        case TileType::Chest: return '$';
        default:              return '?';
    }
}

static std::string dumpLevel(const World& w, int level) {
    const Level& lvl = w.levels[static_cast<size_t>(level)];
    std::vector<std::string> rows(static_cast<size_t>(lvl.map.height), std::string());
    for (int y = 0; y < lvl.map.height; ++y) {
        std::string& row = rows[static_cast<size_t>(y)];
        row.reserve(static_cast<size_t>(lvl.map.width));
        for (int x = 0; x < lvl.map.width; ++x) row.push_back(tileGlyph(lvl.map.at(x, y)));
    }
    for (const Npc& n : w.npcs) {
        if (!n.present || n.level != level || !lvl.map.inBounds(n.pos)) continue;
        rows[static_cast<size_t>(n.pos.y)][static_cast<size_t>(n.pos.x)] = n.symbol;
    }
    if (level == w.current && lvl.map.inBounds(w.player.pos)) {
        rows[static_cast<size_t>(w.player.pos.y)][static_cast<size_t>(w.player.pos.x)] = '@';
    }

    std::ostringstream ss;
    ss << "ROOM " << (level + 1) << " (" << lvl.map.width << "x" << lvl.map.height
       << ", " << lvl.rooms.size() << " rooms, door " << lvl.door.x << "," << lvl.door.y << ")\n";
    for (const std::string& r : rows) ss << r << "\n";
    return ss.str();
}

static void printSummary(const World& w, uint64_t nowMs) {
    const Player& p = w.player;
    std::cout << "--- state at " << nowMs << " ms ---\n";
    std::cout << "phase: " << phaseName(w.phaseKind());
    if (const auto* end = std::get_if<EndingPhase>(&w.phase)) std::cout << " (" << end->cause << ")";
    std::cout << "\n";
    std::cout << "room: " << (w.current + 1) << "  pos: " << p.pos.x << "," << p.pos.y << "\n";
    std::cout << "hp: " << p.hp << "/" << p.hpMax
              << "  atk: " << p.attack(nowMs)
              << "  def: " << p.defense(nowMs)
              << "  spd: " << p.speed(nowMs) << "\n";
    std::cout << "sword: " << (p.inv.sword ? describeEquipment(*p.inv.sword) : std::string("-")) << "\n";
    std::cout << "shield: " << (p.inv.shield ? describeEquipment(*p.inv.shield) : std::string("-")) << "\n";
    std::cout << "consumables: " << p.inv.consumables.size()
              << "  backpack: " << p.inv.backpack.size()
              << "  buffs: " << p.buffs.size() << "\n";
    for (const Npc& n : w.npcs) {
        std::cout << "npc " << n.name << ": room " << (n.level + 1);
        if (n.present) std::cout << " at " << n.pos.x << "," << n.pos.y;
        else std::cout << " (gone)";
        if (n.questDone) std::cout << " quest-done";
        if (n.defeated) std::cout << " defeated";
        std::cout << "\n";
    }
    std::cout << "log:\n";
    for (const Message& m : w.log) std::cout << "  " << m.text << "\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string scriptPath;
    std::string configPath;
    bool haveSeed = false;
    uint64_t seed = 0;
    int width = -1;
    int height = -1;
    bool dumpMap = false;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version") {
            std::cout << SUNNYDAYS_APPNAME << " " << SUNNYDAYS_VERSION << "\n";
            return 0;
        } else if (a == "--seed") {
            std::string v;
            if (!argValue(i, argc, argv, v) || !parseU64(v, seed)) {
                std::cerr << "--seed requires an unsigned integer\n";
                return 2;
            }
            haveSeed = true;
        } else if (a == "--width" || a == "--height") {
            std::string v;
            uint64_t n = 0;
            if (!argValue(i, argc, argv, v) || !parseU64(v, n)) {
                std::cerr << a << " requires a positive integer\n";
                return 2;
            }
            if (a == "--width") width = clampMapWidth(n);
            else height = clampMapHeight(n);
        } else if (a == "--script") {
            if (!argValue(i, argc, argv, scriptPath)) {
                std::cerr << "--script requires a path\n";
                return 2;
            }
        } else if (a == "--config") {
            if (!argValue(i, argc, argv, configPath)) {
                std::cerr << "--config requires a path\n";
                return 2;
            }
        } else if (a == "--dump-map") {
            dumpMap = true;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    const Settings settings = configPath.empty() ? Settings{} : loadSettings(configPath);
    if (!haveSeed) seed = settings.seed;
    if (width < 0) width = settings.mapWidth;
    if (height < 0) height = settings.mapHeight;

    std::vector<ScriptStep> steps;
    std::string err;
    const bool parsed = scriptPath.empty() ? parseScript(std::cin, steps, &err)
                                           : loadScriptFile(scriptPath, steps, &err);
    if (!parsed) {
        std::cerr << "Script error: " << err << "\n";
        return 2;
    }

    Game game(seed, width, height);

    if (dumpMap) {
        for (int l = 0; l < LEVEL_COUNT; ++l) std::cout << dumpLevel(game.world(), l) << "\n";
    }

    // Echo every action followed by the log lines it produced.
    uint64_t seen = game.world().logTotal;
    for (const Message& m : game.world().log) std::cout << m.text << "\n";

    const ScriptRunResult r = runScript(game, steps, settings.stepMs,
        [&seen](const Game& g, const ScriptStep& s, uint64_t nowMs) {
            std::cout << "[" << nowMs << "] " << formatAction(s.action) << "\n";
            const World& w = g.world();
            // The log is bounded; lines evicted within one action are lost.
            const size_t fresh = static_cast<size_t>(std::min<uint64_t>(w.logTotal - seen, w.log.size()));
            for (size_t i = w.log.size() - fresh; i < w.log.size(); ++i) {
                std::cout << "  " << w.log[i].text << "\n";
            }
            seen = w.logTotal;
        });

    printSummary(game.world(), r.endMs);
    return 0;
}
