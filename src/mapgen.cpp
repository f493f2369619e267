#include "mapgen.hpp"
#include "rng.hpp"

#include <algorithm>
#include <utility>

namespace {

void carveFloor(Map& m, int x, int y) {
    if (!m.inBounds(x, y)) return;
    m.set(x, y, TileType::Floor);
}

// Existing room grown by the clearance buffer, clamped to the map.
Room buffered(const Room& r, int width, int height) {
    const int x1 = std::max(0, r.x - GEN_ROOM_CLEARANCE);
    const int y1 = std::max(0, r.y - GEN_ROOM_CLEARANCE);
    const int x2 = std::min(width - 1, r.x2() + GEN_ROOM_CLEARANCE);
    const int y2 = std::min(height - 1, r.y2() + GEN_ROOM_CLEARANCE);
    return Room{x1, y1, x2 - x1, y2 - y1};
}

} // namespace

void carveRoom(Map& m, const Room& r) {
    for (int y = r.y; y <= r.y2(); ++y) {
        for (int x = r.x; x <= r.x2(); ++x) {
            carveFloor(m, x, y);
        }
    }
}

void carveHCorridor2(Map& m, int x1, int x2, int y) {
    if (x1 > x2) std::swap(x1, x2);
    for (int x = x1; x <= x2; ++x) {
        carveFloor(m, x, y);
        if (y + 1 < m.height) carveFloor(m, x, y + 1);
    }
}

void carveVCorridor2(Map& m, int y1, int y2, int x) {
    if (y1 > y2) std::swap(y1, y2);
    for (int y = y1; y <= y2; ++y) {
        carveFloor(m, x, y);
        if (x + 1 < m.width) carveFloor(m, x + 1, y);
    }
}

Map generateRoomsAndCorridors(int width, int height, uint64_t seed, std::vector<Room>* outRooms) {
    RNG rng(seed);
    Map m(width, height, TileType::Wall);

    std::vector<Room> rooms;

    for (int attempt = 0; attempt < GEN_MAX_ROOMS; ++attempt) {
        const int w = rng.range(GEN_ROOM_MIN_W, GEN_ROOM_MAX_W);
        const int h = rng.range(GEN_ROOM_MIN_H, GEN_ROOM_MAX_H);

        // Out of space: keep whatever we already placed.
        if (width <= w + 4 || height <= h + 4) break;

        const int x = rng.range(2, width - w - 3);
        const int y = rng.range(2, height - h - 3);
        const Room candidate{x, y, w, h};

        bool ok = true;
        for (const Room& r : rooms) {
            if (candidate.intersects(buffered(r, width, height))) {
                ok = false;
                break;
            }
        }
        if (!ok) continue;

        carveRoom(m, candidate);

        if (!rooms.empty()) {
            const Room& prev = rooms.back();
            const int px = prev.cx();
            const int py = prev.cy();
            const int nx = candidate.cx();
            const int ny = candidate.cy();

            if (rng.chance(0.5)) {
                carveHCorridor2(m, px, nx, py);
                carveVCorridor2(m, py, ny, nx);
            } else {
                carveVCorridor2(m, py, ny, px);
                carveHCorridor2(m, px, nx, ny);
            }
        }

        rooms.push_back(candidate);
    }

    if (outRooms) *outRooms = rooms;
    return m;
}
