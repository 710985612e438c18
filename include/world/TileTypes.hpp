/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TILE_TYPES_HPP
#define TILE_TYPES_HPP

#include <array>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace SentinelEngine {

// Default tile size in pixels (maps may override)
constexpr float DEFAULT_TILE_SIZE = 32.0f;

enum class TileType : uint8_t {
    FLOOR = 0,
    WALL = 1,
    WALL_LOW = 2,     // Half-height wall, can see over
    DOOR = 3,
    DOOR_LOCKED = 4,
    EXIT = 5,
    WATER = 6,
    PIT = 7,
    COVER_FULL = 8,
    COVER_HALF = 9,
    STAIRS_UP = 10,
    STAIRS_DOWN = 11,
    DEBRIS = 12,      // Slows movement
    TERMINAL = 13,
    CONTAINER = 14
};

constexpr int TILE_TYPE_COUNT = 15;

struct TileProperties {
    bool walkable;
    bool blocksSight;
    bool blocksProjectiles;
    int movementCost;   // 0 = impassable, 1 = normal, 2 = slow
    bool interactable;
    int coverValue;     // 0 = none, 1 = half, 2 = full
};

// Indexed by TileType value
inline constexpr std::array<TileProperties, TILE_TYPE_COUNT> TILE_PROPERTIES = {{
    //  walk   sight  proj   cost interact cover
    {true,  false, false, 1, false, 0}, // FLOOR
    {false, true,  true,  0, false, 2}, // WALL
    {false, false, true,  0, false, 1}, // WALL_LOW
    {true,  false, false, 1, true,  0}, // DOOR
    {false, true,  true,  0, true,  2}, // DOOR_LOCKED
    {true,  false, false, 1, true,  0}, // EXIT
    {false, false, false, 0, false, 0}, // WATER
    {false, false, false, 0, false, 0}, // PIT
    {false, false, true,  0, false, 2}, // COVER_FULL
    {false, false, false, 0, false, 1}, // COVER_HALF
    {true,  false, false, 1, true,  0}, // STAIRS_UP
    {true,  false, false, 1, true,  0}, // STAIRS_DOWN
    {true,  false, false, 2, false, 1}, // DEBRIS
    {false, false, false, 0, true,  0}, // TERMINAL
    {false, false, false, 0, true,  0}, // CONTAINER
}};

// Returned for out-of-bounds lookups: behaves like solid wall
inline constexpr TileProperties OUT_OF_BOUNDS_PROPERTIES = {false, true, true, 0, false, 0};

inline constexpr const TileProperties& getTileProperties(TileType type) {
    return TILE_PROPERTIES[static_cast<size_t>(type)];
}

inline std::optional<TileType> tileTypeFromId(int id) {
    if (id < 0 || id >= TILE_TYPE_COUNT) {
        return std::nullopt;
    }
    return static_cast<TileType>(id);
}

struct GridPosition {
    int col{0};
    int row{0};

    bool operator==(const GridPosition& other) const {
        return col == other.col && row == other.row;
    }
    bool operator!=(const GridPosition& other) const { return !(*this == other); }
};

enum class Facing : uint8_t { North, South, East, West };

// Screen-space heading of a facing (0 = east, y grows downward)
inline float facingAngle(Facing facing) {
    switch (facing) {
        case Facing::North: return -1.5707963f;
        case Facing::South: return 1.5707963f;
        case Facing::East: return 0.0f;
        case Facing::West: return 3.14159265f;
    }
    return 0.0f;
}

// Dominant-axis facing for a direction of travel; ties go vertical, zero faces south
inline Facing facingFromDirection(float dx, float dy) {
    if (dx * dx > dy * dy) {
        return dx >= 0.0f ? Facing::East : Facing::West;
    }
    return dy >= 0.0f ? Facing::South : Facing::North;
}

inline const char* facingName(Facing facing) {
    switch (facing) {
        case Facing::North: return "north";
        case Facing::South: return "south";
        case Facing::East: return "east";
        case Facing::West: return "west";
    }
    return "south";
}

inline std::optional<Facing> facingFromName(const std::string& name) {
    if (name == "north") return Facing::North;
    if (name == "south") return Facing::South;
    if (name == "east") return Facing::East;
    if (name == "west") return Facing::West;
    return std::nullopt;
}

// Stream operators for test output
inline std::ostream& operator<<(std::ostream& os, const TileType& type) {
    switch (type) {
        case TileType::FLOOR: return os << "FLOOR";
        case TileType::WALL: return os << "WALL";
        case TileType::WALL_LOW: return os << "WALL_LOW";
        case TileType::DOOR: return os << "DOOR";
        case TileType::DOOR_LOCKED: return os << "DOOR_LOCKED";
        case TileType::EXIT: return os << "EXIT";
        case TileType::WATER: return os << "WATER";
        case TileType::PIT: return os << "PIT";
        case TileType::COVER_FULL: return os << "COVER_FULL";
        case TileType::COVER_HALF: return os << "COVER_HALF";
        case TileType::STAIRS_UP: return os << "STAIRS_UP";
        case TileType::STAIRS_DOWN: return os << "STAIRS_DOWN";
        case TileType::DEBRIS: return os << "DEBRIS";
        case TileType::TERMINAL: return os << "TERMINAL";
        case TileType::CONTAINER: return os << "CONTAINER";
        default: return os << "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream& os, const Facing& facing) {
    return os << facingName(facing);
}

inline std::ostream& operator<<(std::ostream& os, const GridPosition& pos) {
    return os << "(" << pos.col << ", " << pos.row << ")";
}

} // namespace SentinelEngine

#endif // TILE_TYPES_HPP
