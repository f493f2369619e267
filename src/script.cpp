#include "script.hpp"

#include "common.hpp"

#include <algorithm>
#include <fstream>
#include <istream>
#include <sstream>

namespace {

std::vector<std::string> splitWords(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string w;
    while (iss >> w) out.push_back(w);
    return out;
}

bool parseIntToken(const std::string& s, long long lo, long long hi, long long& out) {
    if (s.empty()) return false;
    size_t i = 0;
    bool neg = false;
    if (s[0] == '-' || s[0] == '+') {
        neg = (s[0] == '-');
        i = 1;
    }
    if (i >= s.size()) return false;

    long long v = 0;
    for (; i < s.size(); ++i) {
        const char c = s[i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
        if (v > 100000000000LL) return false;
    }
    if (neg) v = -v;
    if (v < lo || v > hi) return false;
    out = v;
    return true;
}

std::string lineError(int line, const std::string& what) {
    std::stringstream ss;
    ss << "line " << line << ": " << what;
    return ss.str();
}

// Parses one non-empty, comment-free line.
bool parseLine(const std::vector<std::string>& words, ScriptStep& step, std::string& why) {
    const std::string cmd = toLower(words[0]);
    const size_t argc = words.size() - 1;

    auto noArgs = [&](ActionKind k) {
        if (argc != 0) {
            why = "'" + cmd + "' takes no arguments";
            return false;
        }
        step.action = Action::simple(k);
        return true;
    };

    if (cmd == "move") {
        long long dx = 0;
        long long dy = 0;
        if (argc != 2 || !parseIntToken(words[1], -1, 1, dx) || !parseIntToken(words[2], -1, 1, dy)) {
            why = "usage: move <dx> <dy> with dx, dy in -1..1";
            return false;
        }
        step.action = Action::move(static_cast<int>(dx), static_cast<int>(dy));
        return true;
    }
    if (cmd == "up" || cmd == "down" || cmd == "left" || cmd == "right") {
        if (argc != 0) {
            why = "'" + cmd + "' takes no arguments";
            return false;
        }
        if (cmd == "up") step.action = Action::move(0, -1);
        else if (cmd == "down") step.action = Action::move(0, 1);
        else if (cmd == "left") step.action = Action::move(-1, 0);
        else step.action = Action::move(1, 0);
        return true;
    }

    if (cmd == "inventory") return noArgs(ActionKind::ToggleInventory);
    if (cmd == "stats") return noArgs(ActionKind::ToggleStats);
    if (cmd == "tab") return noArgs(ActionKind::ToggleInvTab);
    if (cmd == "inv_up") return noArgs(ActionKind::InventoryUp);
    if (cmd == "inv_down") return noArgs(ActionKind::InventoryDown);
    if (cmd == "use") return noArgs(ActionKind::UseConsumable);
    if (cmd == "confirm") return noArgs(ActionKind::Confirm);
    if (cmd == "interact") return noArgs(ActionKind::Interact);
    if (cmd == "quit") return noArgs(ActionKind::Quit);
    if (cmd == "none") return noArgs(ActionKind::None);

    if (cmd == "choice") {
        if (argc != 1 || words[1].size() != 1) {
            why = "usage: choice <single character>";
            return false;
        }
        step.action = Action::choose(words[1][0]);
        return true;
    }

    if (cmd == "battle") {
        long long opt = 0;
        if (argc < 1 || argc > 2 || !parseIntToken(words[1], 1, 3, opt)) {
            why = "usage: battle <1-3> [penalty]";
            return false;
        }
        bool penalty = false;
        if (argc == 2) {
            if (toLower(words[2]) != "penalty") {
                why = "unknown battle flag '" + words[2] + "'";
                return false;
            }
            penalty = true;
        }
        step.action = Action::battle(static_cast<int>(opt), penalty);
        return true;
    }

    if (cmd == "wait") {
        long long ms = 0;
        if (argc != 1 || !parseIntToken(words[1], 0, 86400000, ms)) {
            why = "usage: wait <ms>";
            return false;
        }
        step.kind = ScriptStepKind::Wait;
        step.waitMs = static_cast<uint64_t>(ms);
        return true;
    }

    why = "unknown command '" + words[0] + "'";
    return false;
}

} // namespace

bool parseScript(std::istream& in, std::vector<ScriptStep>& out, std::string* err) {
    out.clear();

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;

        const size_t hash = line.find('#');
        if (hash != std::string::npos) line = line.substr(0, hash);

        const std::vector<std::string> words = splitWords(line);
        if (words.empty()) continue;

        ScriptStep step;
        step.line = lineNo;
        std::string why;
        if (!parseLine(words, step, why)) {
            if (err) *err = lineError(lineNo, why);
            return false;
        }
        out.push_back(step);
    }
    return true;
}

bool loadScriptFile(const std::string& path, std::vector<ScriptStep>& out, std::string* err) {
    std::ifstream f(path);
    if (!f) {
        if (err) *err = "Failed to open script: " + path;
        return false;
    }
    return parseScript(f, out, err);
}

std::string formatAction(const Action& a) {
    std::stringstream ss;
    switch (a.kind) {
        case ActionKind::None:            return "none";
        case ActionKind::Move:            ss << "move " << a.dx << " " << a.dy; break;
        case ActionKind::ToggleInventory: return "inventory";
        case ActionKind::InventoryUp:     return "inv_up";
        case ActionKind::InventoryDown:   return "inv_down";
        case ActionKind::UseConsumable:   return "use";
        case ActionKind::ToggleStats:     return "stats";
        case ActionKind::ToggleInvTab:    return "tab";
        case ActionKind::Confirm:         return "confirm";
        case ActionKind::Interact:        return "interact";
        case ActionKind::Choice:          ss << "choice " << a.choice; break;
        case ActionKind::BattleOption:
            ss << "battle " << a.option;
            if (a.penalty) ss << " penalty";
            break;
        case ActionKind::Quit:            return "quit";
        default:                          return "none";
    }
    return ss.str();
}

ScriptRunResult runScript(Game& game, const std::vector<ScriptStep>& steps, int stepMs,
                          const std::function<void(const Game&, const ScriptStep&, uint64_t nowMs)>& onStep) {
    ScriptRunResult r;
    const uint64_t step = static_cast<uint64_t>(std::max(stepMs, 1));

    for (const ScriptStep& s : steps) {
        if (s.kind == ScriptStepKind::Wait) {
            r.endMs += s.waitMs;
            continue;
        }

        const bool keepGoing = game.applyAction(s.action, r.endMs);
        ++r.actionsApplied;
        if (onStep) onStep(game, s, r.endMs);
        r.endMs += step;

        if (!keepGoing) {
            r.quit = true;
            break;
        }
    }
    return r;
}
