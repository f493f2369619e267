#pragma once
#include "map.hpp"

#include <cstdint>
#include <vector>

// Axis-aligned room. Corners are inclusive: the carved area spans
// [x, x2()] x [y, y2()].
struct Room {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    int x2() const { return x + w; }
    int y2() const { return y + h; }
    int cx() const { return (x + x2()) / 2; }
    int cy() const { return (y + y2()) / 2; }

    bool contains(int px, int py) const {
        return px >= x && px <= x2() && py >= y && py <= y2();
    }

    bool intersects(const Room& o) const {
        return x <= o.x2() && x2() >= o.x && y <= o.y2() && y2() >= o.y;
    }
};

// Room placement parameters.
inline constexpr int GEN_MAX_ROOMS = 10;
inline constexpr int GEN_ROOM_MIN_W = 6;
inline constexpr int GEN_ROOM_MAX_W = 12;
inline constexpr int GEN_ROOM_MIN_H = 6;
inline constexpr int GEN_ROOM_MAX_H = 10;
inline constexpr int GEN_ROOM_CLEARANCE = 2;

// Rooms + corridors. Corridors are carved two tiles wide.
// Reproducible: the same (width, height, seed) always yields the same map.
// If outRooms is non-null it receives the accepted rooms in placement order.
Map generateRoomsAndCorridors(int width, int height, uint64_t seed, std::vector<Room>* outRooms = nullptr);

void carveRoom(Map& m, const Room& r);
void carveHCorridor2(Map& m, int x1, int x2, int y);
void carveVCorridor2(Map& m, int y1, int y2, int x);
