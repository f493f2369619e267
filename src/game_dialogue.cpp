#include "game_internal.hpp"

void Game::confirmDialogue() {
    DialogueSession* s = world_.dialogue();
    if (!s) return;

    if (advanceDialogue(*s) == AdvanceResult::Closed) closeDialogue();
}

void Game::closeDialogue() {
    const DialogueSession* s = world_.dialogue();
    if (!s) return;

    // Post-battle epilogues and chest prompts simply return to the map.
    if (!s->postBattle && s->battleOnClose) {
        const BattleSetup setup = *s->battleOnClose;
        if (const Npc* n = world_.npc(setup.enemy)) {
            enterBattle(makeBattleSession(*n, setup.playerInitiated));
            return;
        }
    }
    enterPlaying();
}

void Game::chooseDialogue(char c, uint64_t nowMs) {
    DialogueSession* s = world_.dialogue();
    if (!s || !s->choice || !s->awaitingChoice()) return;

    const std::optional<ChoiceAnswer> ans = parseChoice(s->choice->kind, c);
    if (!ans) return;

    const PendingChoice choice = *s->choice;
    s->choice.reset();

    switch (choice.kind) {
        case ChoiceKind::YesNo: {
            if (!s->npc) break;
            const DialogueDef& def = dialogueDef(*s->npc);
            if (*ans == ChoiceAnswer::Yes) {
                Npc* owner = world_.npc(*s->npc);
                if (owner && !owner->questDone) {
                    owner->questDone = true;
                    grantQuestReward(owner->id);
                }
                rewriteRemainingPages(*s, def.acceptedPages);
            } else {
                rewriteRemainingPages(*s, def.declinedPages);
            }
            break;
        }

        case ChoiceKind::Challenge: {
            if (!s->npc) break;
            const DialogueDef& def = dialogueDef(*s->npc);
            if (*ans == ChoiceAnswer::Yes) {
                s->battleOnClose = BattleSetup{*s->npc, true};
                rewriteRemainingPages(*s, def.acceptedPages);
            } else {
                s->battleOnClose.reset();
                rewriteRemainingPages(*s, def.declinedPages);
            }
            break;
        }

        case ChoiceKind::StarterGear: {
            const GearKind kind = (*ans == ChoiceAnswer::Sword) ? GearKind::WoodenSword : GearKind::WoodenShield;
            Equipment e = makeEquipment(kind);
            const std::string name = e.name;
            world_.player.equip(std::move(e));
            pushMsg("YOU EQUIP THE " + name + ".", MessageKind::Success);

            if (s->npc) {
                if (Npc* owner = world_.npc(*s->npc)) owner->questDone = true;
            }

            if (choice.resumePage < static_cast<int>(s->pages.size())) {
                s->page = std::max(choice.resumePage, 0);
            } else {
                closeDialogue();
            }
            break;
        }

        case ChoiceKind::ChestLoot: {
            if (choice.loot) {
                const Consumable& loot = *choice.loot;
                switch (*ans) {
                    case ChoiceAnswer::Take:
                        if (world_.player.inv.addConsumable(loot)) {
                            pushMsg("YOU TAKE THE " + loot.name + ".", MessageKind::Loot);
                        } else {
                            pushMsg("YOUR PACK IS FULL. YOU LEAVE THE " + loot.name + " BEHIND.", MessageKind::Warning);
                        }
                        break;
                    case ChoiceAnswer::Use:
                        useConsumable(loot, nowMs);
                        break;
                    default:
                        pushMsg("YOU LEAVE THE " + loot.name + " BEHIND.");
                        break;
                }
            }
            closeDialogue();
            break;
        }
    }
}

void Game::grantQuestReward(NpcId id) {
    if (id != NpcId::Hermit) return;

    Inventory& inv = world_.player.inv;
    auto owns = [&inv](EquipSlot slot) {
        if (inv.slot(slot)) return true;
        for (const Equipment& e : inv.backpack) {
            if (e.slot == slot) return true;
        }
        return false;
    };

    if (!owns(EquipSlot::Sword)) {
        inv.addToBackpack(makeEquipment(GearKind::WoodenSword));
        pushMsg("BRAM HANDS YOU A WOODEN SWORD.", MessageKind::Loot);
    } else if (!owns(EquipSlot::Shield)) {
        inv.addToBackpack(makeEquipment(GearKind::WoodenShield));
        pushMsg("BRAM HANDS YOU A WOODEN SHIELD.", MessageKind::Loot);
    } else if (inv.addConsumable(makeConsumable(ConsumableKind::HealingPotion))) {
        pushMsg("BRAM HANDS YOU A HEALING POTION.", MessageKind::Loot);
    } else {
        pushMsg("YOUR PACK IS FULL. BRAM KEEPS HIS POTION.", MessageKind::Warning);
    }
}
