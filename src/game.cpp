#include "game_internal.hpp"

#include <utility>

Game::Game(uint64_t seed, int width, int height)
    : world_(makeWorld(seed, width, height)) {}

Game::Game(World w)
    : world_(std::move(w)) {}

void Game::pushMsg(const std::string& s, MessageKind kind) {
    world_.pushLog(s, kind);
}

void Game::pushAll(const std::vector<Message>& msgs) {
    for (const Message& m : msgs) pushMsg(m.text, m.kind);
}

void Game::enterPlaying() {
    world_.phase = PlayingPhase{};
}

void Game::enterDialogue(DialogueSession s) {
    // A session without pages has nothing to show; treat it as closed at once.
    if (s.pages.empty()) {
        enterPlaying();
        return;
    }
    world_.inventoryOpen = false;
    world_.statsOpen = false;
    world_.phase = DialoguePhase{std::move(s)};
}

void Game::enterBattle(BattleSession b) {
    world_.inventoryOpen = false;
    world_.statsOpen = false;

    if (b.playerInitiated) {
        pushMsg("YOU FACE THE " + b.name + "!", MessageKind::Combat);
    } else {
        pushMsg("THE " + b.name + " ATTACKS!", MessageKind::Combat);
    }
    world_.phase = BattlePhase{std::move(b)};
}

void Game::enterEnding(const std::string& cause) {
    world_.inventoryOpen = false;
    world_.statsOpen = false;
    world_.phase = EndingPhase{cause};
}
