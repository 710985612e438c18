/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/MapLoader.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <format>

namespace SentinelEngine {

namespace {
// Largest accepted width or height, in tiles
constexpr int MAX_MAP_SIDE = 4096;
} // namespace

std::optional<LocalMapData> MapLoader::loadFromFile(const std::string& path) {
    m_lastError.clear();

    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        setError(std::format("Failed to read map '{}': {}", path, reader.getLastError()));
        return std::nullopt;
    }

    auto data = buildFromJson(reader.getRoot());
    if (data) {
        WORLD_INFO(std::format("Loaded map '{}' ({}x{}, {} NPCs) from {}",
                               data->id, data->width, data->height, data->npcs.size(), path));
    }
    return data;
}

std::optional<LocalMapData> MapLoader::loadFromString(const std::string& json) {
    m_lastError.clear();

    JsonReader reader;
    if (!reader.parse(json)) {
        setError("Failed to parse map JSON: " + reader.getLastError());
        return std::nullopt;
    }
    return buildFromJson(reader.getRoot());
}

std::optional<LocalMapData> MapLoader::buildFromJson(const JsonValue& root) {
    if (!root.isObject()) {
        setError("Map document must be a JSON object");
        return std::nullopt;
    }

    LocalMapData data;
    data.id = root["id"].tryAsString().value_or("unnamed");
    data.name = root["name"].tryAsString().value_or(data.id);

    if (!root.readNumber("width", data.width) || !root.readNumber("height", data.height)) {
        setError("Map requires integer 'width' and 'height'");
        return std::nullopt;
    }
    if (data.width <= 0 || data.height <= 0 || data.width > MAX_MAP_SIDE || data.height > MAX_MAP_SIDE) {
        setError(std::format("Invalid map dimensions {}x{}", data.width, data.height));
        return std::nullopt;
    }

    root.readNumber("tileSize", data.tileSize);
    if (data.tileSize <= 0.0f) {
        setError(std::format("Invalid tileSize {}", data.tileSize));
        return std::nullopt;
    }

    if (!readTiles(root, data) || !readNPCs(root, data) || !readSpawnPoints(root, data)) {
        return std::nullopt;
    }

    return data;
}

bool MapLoader::readTiles(const JsonValue& root, LocalMapData& data) {
    const JsonArray* rows = root["tiles"].tryAsArray();
    if (!rows) {
        setError("Map requires a 'tiles' array of rows");
        return false;
    }
    if (static_cast<int>(rows->size()) != data.height) {
        setError(std::format("Tile rows ({}) do not match height ({})", rows->size(), data.height));
        return false;
    }

    data.tiles.clear();
    data.tiles.reserve(static_cast<size_t>(data.width) * static_cast<size_t>(data.height));

    for (size_t row = 0; row < rows->size(); ++row) {
        const JsonArray* cells = (*rows)[row].tryAsArray();
        if (!cells || static_cast<int>(cells->size()) != data.width) {
            setError(std::format("Tile row {} must contain exactly {} entries", row, data.width));
            return false;
        }
        for (size_t col = 0; col < cells->size(); ++col) {
            auto id = (*cells)[col].tryAsInt();
            auto type = id ? tileTypeFromId(*id) : std::nullopt;
            if (!type) {
                setError(std::format("Unknown tile id at ({}, {})", col, row));
                return false;
            }
            data.tiles.push_back(*type);
        }
    }
    return true;
}

bool MapLoader::readNPCs(const JsonValue& root, LocalMapData& data) {
    const JsonArray* npcs = root["npcs"].tryAsArray();
    if (!npcs) {
        return true; // Empty maps are allowed
    }

    for (const auto& entry : *npcs) {
        NPCStaticData npc;
        auto id = entry["id"].tryAsString();
        if (!id || id->empty()) {
            setError("NPC entry is missing an 'id'");
            return false;
        }
        npc.id = *id;
        npc.name = entry["name"].tryAsString().value_or(npc.id);
        npc.faction = entry["faction"].tryAsString().value_or("");
        npc.disposition = entry["disposition"].tryAsString().value_or("neutral");

        if (!readGridPosition(entry["position"], npc.spawn, "NPC '" + npc.id + "' position")) {
            return false;
        }

        if (const JsonArray* route = entry["patrolRoute"].tryAsArray()) {
            for (const auto& node : *route) {
                GridPosition pos;
                if (!readGridPosition(node, pos, "NPC '" + npc.id + "' patrol node")) {
                    return false;
                }
                npc.patrolRoute.push_back(pos);
            }
        }

        if (auto facing = entry["facing"].tryAsString()) {
            npc.facing = facingFromName(*facing).value_or(Facing::South);
        }
        npc.fleeOnApproach = entry["fleeOnApproach"].tryAsBool().value_or(false);
        if (auto glance = entry["glanceInterval"].tryAsNumber()) {
            npc.glanceInterval = static_cast<float>(*glance);
        }
        if (auto linger = entry["lingerTimer"].tryAsNumber()) {
            npc.lingerTimer = static_cast<float>(*linger);
        }

        data.npcs.push_back(std::move(npc));
    }
    return true;
}

bool MapLoader::readSpawnPoints(const JsonValue& root, LocalMapData& data) {
    const JsonArray* spawns = root["spawnPoints"].tryAsArray();
    if (!spawns) {
        return true;
    }

    for (const auto& entry : *spawns) {
        SpawnPoint spawn;
        spawn.id = entry["id"].tryAsString().value_or("spawn");
        if (!readGridPosition(entry["position"], spawn.position, "spawn '" + spawn.id + "'")) {
            return false;
        }
        if (auto facing = entry["facing"].tryAsString()) {
            spawn.facing = facingFromName(*facing).value_or(Facing::South);
        }
        spawn.isDefault = entry["isDefault"].tryAsBool().value_or(false);
        data.spawnPoints.push_back(std::move(spawn));
    }
    return true;
}

bool MapLoader::readGridPosition(const JsonValue& value, GridPosition& out, const std::string& context) {
    auto col = value["col"].tryAsInt();
    auto row = value["row"].tryAsInt();
    if (!col || !row) {
        setError(context + " requires integer 'col' and 'row'");
        return false;
    }
    out = GridPosition{*col, *row};
    return true;
}

void MapLoader::setError(const std::string& message) {
    m_lastError = message;
    WORLD_ERROR(message);
}

} // namespace SentinelEngine
