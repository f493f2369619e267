#pragma once
#include "action.hpp"
#include "battle.hpp"
#include "common.hpp"
#include "dialogue.hpp"
#include "items.hpp"
#include "message.hpp"
#include "npc.hpp"
#include "world.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// The world controller.
//
// Owns the World exclusively and advances it by exactly one Action per call.
// Renderers and runners read the result through world(). The split game_*.cpp
// files hold the per-phase handlers:
//   game.cpp            construction, log, phase transitions
//   game_loop.cpp       applyAction() dispatch
//   game_interact.cpp   movement, interaction, room switching, chests
//   game_inventory.cpp  overlays and item use
//   game_dialogue.cpp   paging and choices
//   game_battle.cpp     battle options, victory/defeat handling
class Game {
public:
    explicit Game(uint64_t seed, int width = DEFAULT_MAP_W, int height = DEFAULT_MAP_H);
    // Takes over a prepared world as-is (phase included).
    explicit Game(World w);

    // Applies one action at simulated time `nowMs`. Returns false only for Quit.
    bool applyAction(const Action& a, uint64_t nowMs);

    const World& world() const { return world_; }
    PhaseKind phase() const { return world_.phaseKind(); }

private:
    World world_;

    void pushMsg(const std::string& s, MessageKind kind = MessageKind::Info);
    void pushAll(const std::vector<Message>& msgs);

    // Phase transitions (game.cpp)
    void enterPlaying();
    void enterDialogue(DialogueSession s);
    void enterBattle(BattleSession b);
    void enterEnding(const std::string& cause);

    // Dispatch (game_loop.cpp)
    void handleTitle(const Action& a);
    void handleIntro(const Action& a);
    void handlePlaying(const Action& a, uint64_t nowMs);
    void handleDialogue(const Action& a, uint64_t nowMs);
    void handleBattle(const Action& a, uint64_t nowMs);

    // Free roam (game_interact.cpp)
    void tryMove(int dx, int dy);
    void interact();
    void talkTo(const Npc& n);
    void tryOpenDoor();
    void switchRoom();
    Vec2i arrivalTile(int level) const;
    void openChest(Vec2i p);

    // Overlays and items (game_inventory.cpp)
    void toggleInventory();
    void toggleStats();
    void toggleInvTab();
    void moveInventoryCursor(int delta);
    void useOnActiveTab(uint64_t nowMs);
    bool useSelectedConsumable(uint64_t nowMs);
    void useConsumable(const Consumable& c, uint64_t nowMs);

    // Dialogue (game_dialogue.cpp)
    void confirmDialogue();
    void chooseDialogue(char c, uint64_t nowMs);
    void closeDialogue();
    void grantQuestReward(NpcId id);

    // Battle (game_battle.cpp)
    void battleOption(int option, bool penalty, uint64_t nowMs);
    void battleUseItem(uint64_t nowMs);
    void finishBattleTurn(BattleOutcome outcome);
    void onVictory(NpcId enemy);
    void spawnRewardChests(const Npc& boss);
    std::optional<Vec2i> rewardTile(const Level& lvl, Vec2i origin, RewardPlacement placement,
                                    const std::vector<Vec2i>& taken);
};
