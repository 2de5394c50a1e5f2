#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <glm/vec2.hpp>

namespace game::maps
{
enum class TileCategory : uint8_t
{
    Nature,
    Urban,
    Street,
    Facade,
    Foyer,
    Corridor,
    Room,
    Stairs,
    Basement,
    Crypt
};

enum class FloorType : uint8_t
{
    Wood,
    Cobblestone,
    Tile,
    Stone,
    Grass,
    Dirt,
    Water,
    Ritual
};

// Hex tile as owned by the board subsystem. Axial coordinates (q, r).
struct BoardTile
{
    std::string id;
    glm::ivec2 axial{0, 0};
    TileCategory category = TileCategory::Room;
    std::string name;
    std::string description;
    int zoneLevel = 0; // -2 (deep underground) .. 2 (upper floors)
    FloorType floorType = FloorType::Wood;

    bool explored = false;
    bool searchable = true;
    bool isGate = false;

    std::vector<std::string> itemIds;
    std::optional<std::string> objectId;
    std::optional<std::string> questTileId;

    // Corridors and streets only connect rooms, nothing is placed on them.
    [[nodiscard]] bool IsConnector() const
    {
        return category == TileCategory::Corridor || category == TileCategory::Street;
    }
};

[[nodiscard]] int HexDistance(const glm::ivec2& a, const glm::ivec2& b);
[[nodiscard]] bool IsSearchableCategory(TileCategory category);

[[nodiscard]] const char* TileCategoryToText(TileCategory category);
[[nodiscard]] const char* FloorTypeToText(FloorType floorType);
[[nodiscard]] TileCategory TileCategoryFromText(const std::string& value);
[[nodiscard]] FloorType FloorTypeFromText(const std::string& value);
} // namespace game::maps
