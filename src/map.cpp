#include "map.hpp"

Map::Map(int w, int h, TileType fill)
    : width(w < 0 ? 0 : w),
      height(h < 0 ? 0 : h),
      tiles(static_cast<size_t>(width) * static_cast<size_t>(height), fill) {}

bool Map::isWalkable(int x, int y) const {
    if (!inBounds(x, y)) return false;
    const TileType t = at(x, y);
    return t == TileType::Floor || t == TileType::Chest;
}

std::optional<Vec2i> Map::findFirstFloor() const {
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            if (at(x, y) == TileType::Floor) return Vec2i{x, y};
        }
    }
    return std::nullopt;
}

std::vector<Vec2i> Map::tilesOfType(TileType t) const {
    std::vector<Vec2i> out;
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            if (at(x, y) == t) out.push_back({x, y});
        }
    }
    return out;
}

int Map::countTiles(TileType t) const {
    int n = 0;
    for (TileType v : tiles) {
        if (v == t) ++n;
    }
    return n;
}
