#pragma once
#include "common.hpp"

#include <cstdint>
#include <optional>
#include <vector>

enum class TileType : uint8_t {
    Wall = 0,
    Floor,
    // Interaction target: approached and triggered, never walked through.
    Door,
    // Unopened chest. Walkable; stepping on it opens it.
    Chest,
};

class Map {
public:
    int width = 0;
    int height = 0;
    std::vector<TileType> tiles;

    Map() = default;
    Map(int w, int h, TileType fill = TileType::Wall);

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width && y < height;
    }
    bool inBounds(Vec2i p) const { return inBounds(p.x, p.y); }

    TileType at(int x, int y) const { return tiles[static_cast<size_t>(y * width + x)]; }
    TileType at(Vec2i p) const { return at(p.x, p.y); }

    void set(int x, int y, TileType t) { tiles[static_cast<size_t>(y * width + x)] = t; }
    void set(Vec2i p, TileType t) { set(p.x, p.y, t); }

    // Out-of-bounds coordinates are never walkable.
    bool isWalkable(int x, int y) const;
    bool isWalkable(Vec2i p) const { return isWalkable(p.x, p.y); }

    std::optional<Vec2i> findFirstFloor() const;

    // All tiles of the given type in row-major scan order.
    std::vector<Vec2i> tilesOfType(TileType t) const;
    int countTiles(TileType t) const;
};
