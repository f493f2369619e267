#pragma once
#include "items.hpp"
#include "npc.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class ChoiceKind : uint8_t {
    // y/n gating the owner's one-time quest flag
    YesNo = 0,
    // y/n accepting a fight the player starts deliberately
    Challenge,
    // s/h picking one of two starter items
    StarterGear,
    // t/u/d for a consumable found in a chest
    ChestLoot,
};

enum class ChoiceAnswer : uint8_t {
    Yes = 0,
    No,
    Sword,
    Shield,
    Take,
    Use,
    Discard,
};

struct PendingChoice {
    ChoiceKind kind = ChoiceKind::YesNo;
    // Page index the choice is asked on. Confirm cannot move past it.
    int page = 0;
    // StarterGear only: page shown once the choice is made.
    int resumePage = 0;
    // ChestLoot only.
    std::optional<Consumable> loot;
};

struct BattleSetup {
    NpcId enemy = NpcId::SlimeKing;
    bool playerInitiated = false;
};

struct DialogueSession {
    // Empty for chest prompts.
    std::optional<NpcId> npc;
    std::string title;
    std::vector<std::string> pages;
    int page = 0;

    std::optional<PendingChoice> choice;
    std::optional<BattleSetup> battleOnClose;

    // Post-battle epilogue: closing it starts nothing.
    bool postBattle = false;

    const std::string& currentPage() const;
    bool hasNextPage() const { return page + 1 < static_cast<int>(pages.size()); }
    bool awaitingChoice() const { return choice.has_value() && page >= choice->page; }
};

enum class AdvanceResult : uint8_t {
    NextPage = 0,
    // Waiting on a choice; nothing changed.
    Blocked,
    // No pages left; the caller ends the session.
    Closed,
};

AdvanceResult advanceDialogue(DialogueSession& s);

// Drops every page after the current one, appends `replacement` and moves to
// its first page (if any).
void rewriteRemainingPages(DialogueSession& s, const std::vector<std::string>& replacement);

// Case-insensitive. Unrecognized characters give an empty result.
std::optional<ChoiceAnswer> parseChoice(ChoiceKind kind, char c);

// Per-NPC dialogue content.
struct DialogueDef {
    NpcId id = NpcId::Elder;

    // First meeting (flag not yet set, or enemy not yet beaten).
    std::vector<std::string> firstPages;

    std::optional<ChoiceKind> choice;
    int choicePage = 0;
    // StarterGear only: page shown once the choice is made.
    int resumePage = 0;

    std::vector<std::string> acceptedPages;
    std::vector<std::string> declinedPages;

    // After the quest flag is set.
    std::vector<std::string> repeatPages;
    // After the quest flag is set and `linkedEnemy` has been defeated.
    std::optional<NpcId> linkedEnemy;
    std::vector<std::string> resolvedPages;

    // Hostile NPCs: attack as soon as the first meeting closes.
    bool ambush = false;
    // Non-boss enemies that stay around after losing.
    std::vector<std::string> afterVictoryPages;

    std::vector<std::string> postBattlePages;
};

const DialogueDef& dialogueDef(NpcId id);

// Builds the session for talking to `npc`, branching on its flags and, for
// quest givers, on the linked enemy's state in `roster`.
DialogueSession openNpcDialogue(const Npc& npc, const std::vector<Npc>& roster);

DialogueSession makePostBattleDialogue(const Npc& npc);

DialogueSession makeChestDialogue(const Consumable& loot);
