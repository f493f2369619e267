#include "dialogue.hpp"

#include "common.hpp"

#include <array>

namespace {

std::array<DialogueDef, NPC_COUNT> buildDialogueDefs() {
    std::array<DialogueDef, NPC_COUNT> defs{};

    {
        DialogueDef& d = defs[static_cast<size_t>(NpcId::Elder)];
        d.id = NpcId::Elder;
        d.firstPages = {
            "WELCOME, TRAVELER. THESE HALLS HAVE NOT SEEN SUN IN YEARS.",
            "THE OLD DOOR ONLY OPENS FOR ONE WHO CARRIES A SWORD AND A SHIELD.",
            "I CAN SPARE ONE OF THEM. [S] WOODEN SWORD OR [H] WOODEN SHIELD?",
            "USE IT WELL. HERMIT BRAM MAY HAVE THE OTHER PIECE.",
            "BEWARE THE SLIME KING. HE DOES NOT TALK FOR LONG.",
        };
        d.choice = ChoiceKind::StarterGear;
        d.choicePage = 2;
        d.resumePage = 3;
        d.repeatPages = {
            "THE DOOR WILL NOT OPEN WITHOUT BLADE AND SHIELD.",
            "PRESS I TO CHECK WHAT YOU CARRY.",
        };
        d.linkedEnemy = NpcId::SlimeKing;
        d.resolvedPages = {
            "THE SLIME KING IS GONE? THEN THE SUN MAY RETURN AFTER ALL.",
            "THE THORN WARDEN WAITS BEYOND THE DOOR. GO CAREFULLY.",
        };
    }

    {
        DialogueDef& d = defs[static_cast<size_t>(NpcId::Hermit)];
        d.id = NpcId::Hermit;
        d.firstPages = {
            "HMPH. NOBODY VISITS OLD BRAM.",
            "I FOUND SOMETHING IN THE MUD. WANT IT? [Y/N]",
        };
        d.choice = ChoiceKind::YesNo;
        d.choicePage = 1;
        d.acceptedPages = {
            "TAKE IT. CHECK YOUR BACKPACK.",
            "NOW LEAVE ME TO MY MUSHROOMS.",
        };
        d.declinedPages = {
            "SUIT YOURSELF. ASK AGAIN IF YOU CHANGE YOUR MIND.",
        };
        d.repeatPages = {
            "I ALREADY GAVE YOU WHAT I HAD.",
        };
    }

    {
        DialogueDef& d = defs[static_cast<size_t>(NpcId::SlimeKing)];
        d.id = NpcId::SlimeKing;
        d.firstPages = {
            "BLORP! WHO DARES WAKE THE SLIME KING?",
            "THE SLIME KING LUNGES AT YOU!",
        };
        d.ambush = true;
        d.postBattlePages = {
            "THE SLIME KING MELTS INTO A HARMLESS PUDDLE.",
            "SOMETHING GLINTS IN THE MUCK NEARBY.",
        };
    }

    {
        DialogueDef& d = defs[static_cast<size_t>(NpcId::Wolf)];
        d.id = NpcId::Wolf;
        d.firstPages = {
            "THE GAUNT WOLF BARES ITS TEETH.",
            "IT SPRINGS!",
        };
        d.ambush = true;
        d.afterVictoryPages = {
            "THE WOLF WHIMPERS AND KEEPS ITS DISTANCE.",
        };
        d.postBattlePages = {
            "THE WOLF LIMPS AWAY TO LICK ITS WOUNDS.",
        };
    }

    {
        DialogueDef& d = defs[static_cast<size_t>(NpcId::Warden)];
        d.id = NpcId::Warden;
        d.firstPages = {
            "I AM THE THORN WARDEN. NONE PASS THIS GROVE UNTESTED.",
            "WILL YOU FACE ME? [Y/N]",
        };
        d.choice = ChoiceKind::Challenge;
        d.choicePage = 1;
        d.acceptedPages = {
            "THEN DRAW YOUR BLADE. THERE IS NO RUNNING FROM THIS.",
        };
        d.declinedPages = {
            "COME BACK WHEN YOUR ROOTS RUN DEEPER.",
        };
        d.postBattlePages = {
            "THE WARDEN FALLS TO ONE KNEE.",
            "TAKE MY ARMS. YOU HAVE EARNED THEM.",
        };
    }

    return defs;
}

const std::array<DialogueDef, NPC_COUNT>& dialogueDefs() {
    static const std::array<DialogueDef, NPC_COUNT> defs = buildDialogueDefs();
    return defs;
}

bool linkedEnemyDefeated(const DialogueDef& d, const std::vector<Npc>& roster) {
    if (!d.linkedEnemy) return false;
    for (const Npc& n : roster) {
        if (n.id == *d.linkedEnemy) return n.defeated;
    }
    return false;
}

} // namespace

const std::string& DialogueSession::currentPage() const {
    static const std::string empty;
    if (page < 0 || page >= static_cast<int>(pages.size())) return empty;
    return pages[static_cast<size_t>(page)];
}

AdvanceResult advanceDialogue(DialogueSession& s) {
    if (s.awaitingChoice()) return AdvanceResult::Blocked;
    if (s.hasNextPage()) {
        ++s.page;
        return AdvanceResult::NextPage;
    }
    if (s.choice) return AdvanceResult::Blocked;
    return AdvanceResult::Closed;
}

void rewriteRemainingPages(DialogueSession& s, const std::vector<std::string>& replacement) {
    const int keep = clampi(s.page + 1, 0, static_cast<int>(s.pages.size()));
    s.pages.resize(static_cast<size_t>(keep));
    s.pages.insert(s.pages.end(), replacement.begin(), replacement.end());
    if (!replacement.empty()) s.page = keep;
}

std::optional<ChoiceAnswer> parseChoice(ChoiceKind kind, char c) {
    c = toLowerChar(c);
    switch (kind) {
        case ChoiceKind::YesNo:
        case ChoiceKind::Challenge:
            if (c == 'y') return ChoiceAnswer::Yes;
            if (c == 'n') return ChoiceAnswer::No;
            break;
        case ChoiceKind::StarterGear:
            if (c == 's') return ChoiceAnswer::Sword;
            if (c == 'h') return ChoiceAnswer::Shield;
            break;
        case ChoiceKind::ChestLoot:
            if (c == 't') return ChoiceAnswer::Take;
            if (c == 'u') return ChoiceAnswer::Use;
            if (c == 'd') return ChoiceAnswer::Discard;
            break;
    }
    return std::nullopt;
}

const DialogueDef& dialogueDef(NpcId id) {
    const int i = static_cast<int>(id);
    if (i < 0 || i >= NPC_COUNT) return dialogueDefs()[0];
    return dialogueDefs()[static_cast<size_t>(i)];
}

DialogueSession openNpcDialogue(const Npc& npc, const std::vector<Npc>& roster) {
    const DialogueDef& d = dialogueDef(npc.id);

    DialogueSession s;
    s.npc = npc.id;
    s.title = npc.name;

    if (npcDef(npc.id).hostile) {
        if (npc.defeated && !d.afterVictoryPages.empty()) {
            s.pages = d.afterVictoryPages;
            return s;
        }
    } else if (npc.questDone) {
        if (linkedEnemyDefeated(d, roster) && !d.resolvedPages.empty()) {
            s.pages = d.resolvedPages;
        } else {
            s.pages = d.repeatPages;
        }
        return s;
    }

    s.pages = d.firstPages;
    if (d.choice) {
        PendingChoice c;
        c.kind = *d.choice;
        c.page = d.choicePage;
        c.resumePage = d.resumePage;
        s.choice = c;
    }
    if (d.ambush) {
        s.battleOnClose = BattleSetup{npc.id, false};
    }
    return s;
}

DialogueSession makePostBattleDialogue(const Npc& npc) {
    DialogueSession s;
    s.npc = npc.id;
    s.title = npc.name;
    s.pages = dialogueDef(npc.id).postBattlePages;
    if (s.pages.empty()) s.pages.push_back("THE " + npc.name + " IS DEFEATED.");
    s.postBattle = true;
    return s;
}

DialogueSession makeChestDialogue(const Consumable& loot) {
    DialogueSession s;
    s.title = "CHEST";
    s.pages = {
        "INSIDE THE CHEST: " + describeConsumable(loot) + ".",
        "[T] TAKE IT, [U] USE IT NOW, [D] LEAVE IT.",
    };
    PendingChoice c;
    c.kind = ChoiceKind::ChestLoot;
    c.page = 1;
    c.loot = loot;
    s.choice = c;
    return s;
}
