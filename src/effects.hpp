#pragma once

#include <algorithm>
#include <cstdint>
#include <vector>

// Timed stat buffs granted by consumables.
//
// Buffs carry an absolute expiry (milliseconds on the caller's clock). They are
// purely additive: effective stats sum every buff still active at `nowMs`.

inline constexpr uint64_t BUFF_DURATION_MS = 30000;

struct TempBuff {
    int atk = 0;
    int def = 0;
    int spd = 0;
    uint64_t expiresAtMs = 0;

    bool activeAt(uint64_t nowMs) const { return nowMs < expiresAtMs; }
};

struct BuffTotals {
    int atk = 0;
    int def = 0;
    int spd = 0;
};

// Removes every buff that has expired at `nowMs`. Returns how many were removed.
inline int purgeExpiredBuffs(std::vector<TempBuff>& buffs, uint64_t nowMs) {
    const size_t before = buffs.size();
    buffs.erase(std::remove_if(buffs.begin(), buffs.end(), [nowMs](const TempBuff& b) {
        return !b.activeAt(nowMs);
    }), buffs.end());
    return static_cast<int>(before - buffs.size());
}

inline BuffTotals sumActiveBuffs(const std::vector<TempBuff>& buffs, uint64_t nowMs) {
    BuffTotals t;
    for (const TempBuff& b : buffs) {
        if (!b.activeAt(nowMs)) continue;
        t.atk += b.atk;
        t.def += b.def;
        t.spd += b.spd;
    }
    return t;
}
