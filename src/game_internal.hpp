#pragma once

// Internal helpers shared by the split Game translation units (src/game_*.cpp).

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-function"
#endif

#include "game.hpp"

#include <sstream>
#include <string>

namespace {

// "YOU USE THE BITTER ROOT (-2 HP). YOU FEEL TOUGHER."
static std::string consumeMessage(const Consumable& c, const ConsumeResult& r) {
    std::stringstream ss;
    ss << "YOU USE THE " << c.name;
    if (r.hpChange > 0) ss << " (+" << r.hpChange << " HP)";
    else if (r.hpChange < 0) ss << " (" << r.hpChange << " HP)";
    ss << ".";
    if (r.buffApplied) {
        if (c.atkBonus > 0 && c.defBonus > 0) ss << " YOU FEEL MIGHTY.";
        else if (c.atkBonus > 0) ss << " YOU FEEL STRONGER.";
        else ss << " YOU FEEL TOUGHER.";
    }
    return ss.str();
}

} // namespace

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
