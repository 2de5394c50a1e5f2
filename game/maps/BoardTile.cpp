#include "game/maps/BoardTile.hpp"

#include <cstdlib>

namespace game::maps
{
int HexDistance(const glm::ivec2& a, const glm::ivec2& b)
{
    const glm::ivec2 d = a - b;
    return (std::abs(d.x) + std::abs(d.x + d.y) + std::abs(d.y)) / 2;
}

bool IsSearchableCategory(TileCategory category)
{
    switch (category)
    {
        case TileCategory::Facade:
        case TileCategory::Street:
        case TileCategory::Nature:
        case TileCategory::Corridor:
            return false;
        default:
            return true;
    }
}

const char* TileCategoryToText(TileCategory category)
{
    switch (category)
    {
        case TileCategory::Nature: return "nature";
        case TileCategory::Urban: return "urban";
        case TileCategory::Street: return "street";
        case TileCategory::Facade: return "facade";
        case TileCategory::Foyer: return "foyer";
        case TileCategory::Corridor: return "corridor";
        case TileCategory::Room: return "room";
        case TileCategory::Stairs: return "stairs";
        case TileCategory::Basement: return "basement";
        case TileCategory::Crypt: return "crypt";
        default: return "room";
    }
}

const char* FloorTypeToText(FloorType floorType)
{
    switch (floorType)
    {
        case FloorType::Wood: return "wood";
        case FloorType::Cobblestone: return "cobblestone";
        case FloorType::Tile: return "tile";
        case FloorType::Stone: return "stone";
        case FloorType::Grass: return "grass";
        case FloorType::Dirt: return "dirt";
        case FloorType::Water: return "water";
        case FloorType::Ritual: return "ritual";
        default: return "wood";
    }
}

TileCategory TileCategoryFromText(const std::string& value)
{
    static constexpr TileCategory kAll[] = {
        TileCategory::Nature, TileCategory::Urban, TileCategory::Street, TileCategory::Facade,
        TileCategory::Foyer, TileCategory::Corridor, TileCategory::Room, TileCategory::Stairs,
        TileCategory::Basement, TileCategory::Crypt,
    };
    for (const TileCategory category : kAll)
    {
        if (value == TileCategoryToText(category))
        {
            return category;
        }
    }
    return TileCategory::Room;
}

FloorType FloorTypeFromText(const std::string& value)
{
    static constexpr FloorType kAll[] = {
        FloorType::Wood, FloorType::Cobblestone, FloorType::Tile, FloorType::Stone,
        FloorType::Grass, FloorType::Dirt, FloorType::Water, FloorType::Ritual,
    };
    for (const FloorType floorType : kAll)
    {
        if (value == FloorTypeToText(floorType))
        {
            return floorType;
        }
    }
    return FloorType::Wood;
}
} // namespace game::maps
