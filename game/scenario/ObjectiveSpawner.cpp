#include "game/scenario/ObjectiveSpawner.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <utility>

namespace game::scenario
{
namespace
{
std::string ToLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool ContainsAny(const std::string& text, std::initializer_list<const char*> needles)
{
    return std::any_of(needles.begin(), needles.end(), [&text](const char* needle) {
        return text.find(needle) != std::string::npos;
    });
}

struct KeywordScore
{
    const char* keyword;
    int score;
};

struct KeywordBonus
{
    std::vector<const char*> keywords;
    float bonus;
};

// First match wins.
const std::vector<KeywordBonus>& RoomBonusTable()
{
    static const std::vector<KeywordBonus> kTable = {
        {{"ritual", "altar", "sanctum"}, 0.25F},
        {{"study", "library", "office"}, 0.20F},
        {{"cellar", "basement", "vault"}, 0.15F},
        {{"storage", "cache", "closet"}, 0.10F},
    };
    return kTable;
}

const std::vector<KeywordScore>& ItemRoomTable(QuestItemType type)
{
    static const std::vector<KeywordScore> kKey = {
        {"study", 3}, {"office", 3}, {"bedroom", 2}, {"vault", 2}, {"hall", 1}, {"kitchen", 1},
    };
    static const std::vector<KeywordScore> kClue = {
        {"library", 3}, {"study", 3}, {"archive", 3}, {"office", 2}, {"bedroom", 1},
    };
    static const std::vector<KeywordScore> kCollectible = {
        {"vault", 3}, {"library", 2}, {"crypt", 2}, {"chapel", 2}, {"archive", 2},
    };
    static const std::vector<KeywordScore> kArtifact = {
        {"vault", 3}, {"crypt", 3}, {"altar", 3}, {"sanctum", 3}, {"museum", 2}, {"chapel", 2},
    };
    static const std::vector<KeywordScore> kComponent = {
        {"ritual", 3}, {"altar", 3}, {"cellar", 2}, {"storage", 2}, {"kitchen", 2}, {"greenhouse", 2},
    };
    static const std::vector<KeywordScore> kNone;

    switch (type)
    {
        case QuestItemType::Key: return kKey;
        case QuestItemType::Clue: return kClue;
        case QuestItemType::Collectible: return kCollectible;
        case QuestItemType::Artifact: return kArtifact;
        case QuestItemType::Component: return kComponent;
        default: return kNone;
    }
}

struct QuestTileLookupEntry
{
    const char* keyword;
    QuestTileType type;
    const char* name;
};

// Ordered: "ritual_point" must be tested before "ritual".
const std::vector<QuestTileLookupEntry>& QuestTileLookupTable()
{
    static const std::vector<QuestTileLookupEntry> kTable = {
        {"exit", QuestTileType::Exit, "Exit"},
        {"final_confrontation", QuestTileType::FinalConfrontation, "Final Confrontation"},
        {"confront", QuestTileType::FinalConfrontation, "Final Confrontation"},
        {"ritual_point", QuestTileType::RitualPoint, "Ritual Point"},
        {"ritual", QuestTileType::Altar, "Ritual Altar"},
        {"altar", QuestTileType::Altar, "Ritual Altar"},
        {"sanctum", QuestTileType::BossRoom, "Dark Sanctum"},
        {"boss", QuestTileType::BossRoom, "Dark Sanctum"},
        {"throne", QuestTileType::BossRoom, "Dark Sanctum"},
    };
    return kTable;
}

constexpr const char* kDefaultQuestTileName = "Special Location";

bool IsRequiredObjective(const Scenario& scenario, const std::string& objectiveId)
{
    const ScenarioObjective* objective = scenario.FindObjective(objectiveId);
    return objective == nullptr || objective->IsRequired();
}

constexpr const char* kQuestItemIdPrefix = "quest_item_";

bool HoldsQuestItem(const maps::BoardTile& tile)
{
    return std::any_of(tile.itemIds.begin(), tile.itemIds.end(), [](const std::string& itemId) {
        return itemId.rfind(kQuestItemIdPrefix, 0) == 0;
    });
}

// Searchable room that does not already host a quest tile or quest item.
bool CanHoldQuestItem(const maps::BoardTile& tile)
{
    return tile.searchable && !tile.IsConnector() && !tile.questTileId.has_value() && !HoldsQuestItem(tile);
}

bool IsAllDigits(const std::string& text)
{
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

// Rewrites the first "(n/m)" group in a short description.
std::string RewriteProgressSuffix(const std::string& text, int current, int target)
{
    for (size_t open = text.find('('); open != std::string::npos; open = text.find('(', open + 1))
    {
        const size_t close = text.find(')', open);
        if (close == std::string::npos)
        {
            break;
        }

        const std::string inner = text.substr(open + 1, close - open - 1);
        const size_t slash = inner.find('/');
        if (slash == std::string::npos || !IsAllDigits(inner.substr(0, slash)) || !IsAllDigits(inner.substr(slash + 1)))
        {
            continue;
        }

        return text.substr(0, open + 1) + std::to_string(current) + "/" + std::to_string(target) + text.substr(close);
    }
    return text;
}

maps::BoardTile* FindBoardTile(std::vector<maps::BoardTile>& tiles, const std::string& tileId)
{
    for (auto& tile : tiles)
    {
        if (tile.id == tileId)
        {
            return &tile;
        }
    }
    return nullptr;
}

QuestTile MakeQuestTile(const ScenarioObjective& objective, const QuestTileTypeInfo& info, const Scenario& scenario)
{
    QuestTile questTile;
    questTile.id = "quest_tile_" + objective.id;
    questTile.objectiveId = objective.id;
    questTile.type = info.type;
    questTile.name = info.name;
    questTile.revealed = !objective.isHidden;
    if (objective.revealedBy.has_value())
    {
        questTile.revealCondition = RevealCondition::ObjectiveComplete;
        questTile.revealObjectiveId = objective.revealedBy;
    }

    if (info.type == QuestTileType::FinalConfrontation)
    {
        questTile.bossType = kFallbackBossType;
        for (const auto& event : scenario.doomEvents)
        {
            if (event.type == DoomEventType::SpawnBoss && !event.targetId.empty())
            {
                questTile.bossType = event.targetId;
                break;
            }
        }
    }
    return questTile;
}

struct Materialized
{
    QuestTile questTile;
    TileModification modification;
    std::optional<BossSpawnSignal> bossSpawn;
};

// Marks the stored quest tile spawned and writes it onto `tile`.
Materialized MaterializeQuestTile(QuestTile& stored, maps::BoardTile& tile)
{
    stored.spawned = true;
    stored.revealed = true;
    stored.spawnedOnTileId = tile.id;

    Materialized result;
    result.questTile = stored;
    result.modification = BuildTileModification(stored, tile);
    ApplyTileModification(tile, result.modification);

    if (stored.type == QuestTileType::FinalConfrontation)
    {
        BossSpawnSignal signal;
        signal.bossType = stored.bossType.value_or(kFallbackBossType);
        signal.tileId = tile.id;
        signal.axial = tile.axial;
        signal.message = "The final confrontation awaits in " + tile.name + "!";
        result.bossSpawn = signal;
    }

    std::cout << "[SPAWN] " << stored.name << " materialized on " << tile.name << " (" << tile.id << ")\n";
    return result;
}
} // namespace

// ============================================================================
// ObjectiveSpawnState
// ============================================================================

const QuestItem* ObjectiveSpawnState::FindItem(const std::string& itemId) const
{
    for (const auto& item : questItems)
    {
        if (item.id == itemId)
        {
            return &item;
        }
    }
    return nullptr;
}

QuestItem* ObjectiveSpawnState::FindItem(const std::string& itemId)
{
    return const_cast<QuestItem*>(std::as_const(*this).FindItem(itemId));
}

const QuestTile* ObjectiveSpawnState::FindTile(const std::string& questTileId) const
{
    for (const auto& questTile : questTiles)
    {
        if (questTile.id == questTileId)
        {
            return &questTile;
        }
    }
    return nullptr;
}

QuestTile* ObjectiveSpawnState::FindTile(const std::string& questTileId)
{
    return const_cast<QuestTile*>(std::as_const(*this).FindTile(questTileId));
}

// ============================================================================
// Lookups
// ============================================================================

float GetRoomSpawnBonus(const std::string& roomName)
{
    const std::string name = ToLower(roomName);
    for (const auto& entry : RoomBonusTable())
    {
        for (const char* keyword : entry.keywords)
        {
            if (name.find(keyword) != std::string::npos)
            {
                return entry.bonus;
            }
        }
    }
    return 0.0F;
}

int GetItemRoomScore(QuestItemType type, const std::string& roomName)
{
    const std::string name = ToLower(roomName);
    int best = 0;
    for (const auto& entry : ItemRoomTable(type))
    {
        if (name.find(entry.keyword) != std::string::npos)
        {
            best = std::max(best, entry.score);
        }
    }
    return best;
}

int GetQuestTileLocationScore(QuestTileType type, const maps::BoardTile& tile)
{
    using maps::TileCategory;
    const std::string name = ToLower(tile.name);
    int score = 0;

    switch (type)
    {
        case QuestTileType::Exit:
            switch (tile.category)
            {
                case TileCategory::Foyer:
                case TileCategory::Facade: score += 5; break;
                case TileCategory::Urban: score += 3; break;
                case TileCategory::Street:
                case TileCategory::Nature: score += 2; break;
                case TileCategory::Basement:
                case TileCategory::Crypt: score -= 3; break;
                default: break;
            }
            if (ContainsAny(name, {"entrance", "door", "gate", "exit", "hall", "porch"}))
            {
                score += 2;
            }
            // Exits sit at ground level near where the party came in.
            score += tile.zoneLevel >= 0 ? 1 : tile.zoneLevel;
            break;

        case QuestTileType::Altar:
        case QuestTileType::RitualPoint:
            switch (tile.category)
            {
                case TileCategory::Crypt: score += 5; break;
                case TileCategory::Basement: score += 4; break;
                case TileCategory::Room: score += 1; break;
                case TileCategory::Nature: score += type == QuestTileType::RitualPoint ? 2 : 0; break;
                default: break;
            }
            if (ContainsAny(name, {"ritual", "altar", "chamber", "chapel", "shrine", "circle"}))
            {
                score += 3;
            }
            if (tile.zoneLevel < 0)
            {
                score -= tile.zoneLevel;
            }
            break;

        case QuestTileType::BossRoom:
        case QuestTileType::FinalConfrontation:
            switch (tile.category)
            {
                case TileCategory::Crypt: score += 5; break;
                case TileCategory::Basement: score += 3; break;
                case TileCategory::Room: score += 1; break;
                default: break;
            }
            if (ContainsAny(name, {"sanctum", "throne", "crypt", "chamber", "hall"}))
            {
                score += 3;
            }
            if (tile.zoneLevel < 0)
            {
                score -= tile.zoneLevel * 2;
            }
            break;

        case QuestTileType::NpcLocation:
        default:
            switch (tile.category)
            {
                case TileCategory::Room: score += 2; break;
                case TileCategory::Foyer:
                case TileCategory::Basement:
                case TileCategory::Crypt: score += 1; break;
                default: break;
            }
            if (ContainsAny(name, {"study", "library", "bedroom", "office", "cell", "prison"}))
            {
                score += 2;
            }
            break;
    }

    return score;
}

std::optional<QuestTileTypeInfo> MatchQuestTileType(const std::string& targetId)
{
    const std::string target = ToLower(targetId);
    for (const auto& entry : QuestTileLookupTable())
    {
        if (target.find(entry.keyword) != std::string::npos)
        {
            return QuestTileTypeInfo{entry.type, entry.name};
        }
    }
    return std::nullopt;
}

QuestTileTypeInfo QuestTileTypeFromTargetId(const std::string& targetId)
{
    return MatchQuestTileType(targetId).value_or(QuestTileTypeInfo{QuestTileType::NpcLocation, kDefaultQuestTileName});
}

QuestItemType QuestItemTypeFor(ObjectiveType objectiveType, const std::string& targetId)
{
    const std::string target = ToLower(targetId);
    if (objectiveType == ObjectiveType::FindItem)
    {
        if (target.find("key") != std::string::npos)
        {
            return QuestItemType::Key;
        }
        if (target.find("clue") != std::string::npos)
        {
            return QuestItemType::Clue;
        }
        return QuestItemType::Artifact;
    }

    if (objectiveType == ObjectiveType::Collect)
    {
        if (target.find("clue") != std::string::npos)
        {
            return QuestItemType::Clue;
        }
        if (target.find("component") != std::string::npos)
        {
            return QuestItemType::Component;
        }
        return QuestItemType::Collectible;
    }

    return QuestItemType::Artifact;
}

// ============================================================================
// ObjectiveSpawner
// ============================================================================

ObjectiveSpawner::ObjectiveSpawner(const MissionCatalog& catalog, BalanceConfig config, unsigned int seed)
    : m_catalog(catalog)
    , m_config(std::move(config))
    , m_seed(seed)
    , m_rng(seed)
{
}

float ObjectiveSpawner::RollUnit()
{
    std::uniform_real_distribution<float> dist(0.0F, 1.0F);
    return dist(m_rng);
}

ObjectiveSpawnState ObjectiveSpawner::InitializeObjectiveSpawns(const Scenario& scenario) const
{
    ObjectiveSpawnState state;

    auto addItem = [&](const ScenarioObjective& objective, int index) {
        const std::string targetId = objective.targetId.value_or("quest_item");
        const QuestItemText text = m_catalog.QuestItemTextFor(targetId);

        QuestItem item;
        item.id = kQuestItemIdPrefix + objective.id + "_" + std::to_string(index);
        item.objectiveId = objective.id;
        item.scenarioId = scenario.id;
        item.type = QuestItemTypeFor(objective.type, targetId);
        item.name = text.name;
        item.description = text.description;
        state.questItems.push_back(item);
    };

    for (const auto& objective : scenario.objectives)
    {
        const std::string targetId = objective.targetId.value_or("");
        switch (objective.type)
        {
            case ObjectiveType::FindItem:
                addItem(objective, 0);
                break;

            case ObjectiveType::Collect:
            {
                const int amount = std::max(1, objective.targetAmount.value_or(1));
                for (int i = 0; i < amount; ++i)
                {
                    addItem(objective, i);
                }
                break;
            }

            case ObjectiveType::Escape:
                state.questTiles.push_back(MakeQuestTile(objective, {QuestTileType::Exit, "Exit"}, scenario));
                break;

            case ObjectiveType::FindTile:
                state.questTiles.push_back(MakeQuestTile(objective, QuestTileTypeFromTargetId(targetId), scenario));
                break;

            case ObjectiveType::Ritual:
            case ObjectiveType::Interact:
            {
                std::optional<QuestTileTypeInfo> info = MatchQuestTileType(targetId);
                if (!info.has_value() && objective.type == ObjectiveType::Ritual && targetId.empty())
                {
                    info = QuestTileTypeInfo{QuestTileType::Altar, "Ritual Altar"};
                }
                if (info.has_value())
                {
                    state.questTiles.push_back(MakeQuestTile(objective, *info, scenario));
                }
                break;
            }

            default:
                break;
        }
    }

    std::cout << "[SPAWN] Initialized " << state.questItems.size() << " quest item(s) and "
              << state.questTiles.size() << " quest tile(s) for '" << scenario.title << "'\n";
    return state;
}

namespace
{
struct SpawnCandidate
{
    const QuestItem* item = nullptr;
    int roomScore = 0;
    int unspawnedCount = 0;
};

// Required first, then best fit for this room, then list order.
SpawnCandidate PickSpawnCandidate(const ObjectiveSpawnState& state, const maps::BoardTile& tile, const Scenario& scenario)
{
    std::vector<const QuestItem*> unspawned;
    std::vector<const QuestItem*> required;
    for (const auto& item : state.questItems)
    {
        if (item.spawned || item.collected)
        {
            continue;
        }
        unspawned.push_back(&item);
        if (IsRequiredObjective(scenario, item.objectiveId))
        {
            required.push_back(&item);
        }
    }

    SpawnCandidate candidate;
    candidate.unspawnedCount = static_cast<int>(unspawned.size());
    if (unspawned.empty())
    {
        return candidate;
    }

    const std::vector<const QuestItem*>& pool = required.empty() ? unspawned : required;
    candidate.item = pool.front();
    candidate.roomScore = GetItemRoomScore(candidate.item->type, tile.name);
    for (const QuestItem* item : pool)
    {
        const int score = GetItemRoomScore(item->type, tile.name);
        if (score > candidate.roomScore)
        {
            candidate.item = item;
            candidate.roomScore = score;
        }
    }
    return candidate;
}
} // namespace

AdjustedSpawnConfig ObjectiveSpawner::GetAdjustedSpawnConfig(const ObjectiveSpawnState& state, const Scenario& scenario) const
{
    const SpawnTuning& tuning = m_config.spawn;

    const int requiredPickups = static_cast<int>(std::count_if(state.questItems.begin(), state.questItems.end(), [&scenario](const QuestItem& item) {
        return IsRequiredObjective(scenario, item.objectiveId);
    }));

    AdjustedSpawnConfig adjusted;
    adjusted.pityThreshold = tuning.pityThreshold;
    if (requiredPickups >= tuning.collectionMissionItems)
    {
        adjusted.chanceBoost = tuning.collectionChanceBoost;
        adjusted.pityThreshold = tuning.collectionPityThreshold;
    }
    if (scenario.difficulty == Difficulty::Nightmare)
    {
        adjusted.pityThreshold -= tuning.nightmarePityReduction;
    }
    const int lowest = std::max(1, tuning.minPityThreshold);
    adjusted.pityThreshold = std::clamp(adjusted.pityThreshold, lowest, std::max(lowest, tuning.maxPityThreshold));
    return adjusted;
}

float ObjectiveSpawner::GetSpawnChance(const ObjectiveSpawnState& state, const maps::BoardTile& tile, const Scenario& scenario) const
{
    if (!CanHoldQuestItem(tile))
    {
        return 0.0F;
    }
    const SpawnCandidate candidate = PickSpawnCandidate(state, tile, scenario);
    if (candidate.item == nullptr)
    {
        return 0.0F;
    }

    const SpawnTuning& tuning = m_config.spawn;
    const AdjustedSpawnConfig adjusted = GetAdjustedSpawnConfig(state, scenario);
    const float expectedTiles = static_cast<float>(scenario.startDoom) * tuning.tilesPerDoom;
    const float progress = expectedTiles > 0.0F ? static_cast<float>(state.tilesExplored) / expectedTiles : 1.0F;

    float chance = tuning.earlyChance;
    if (progress >= tuning.earlyGameThreshold)
    {
        const float window = std::max(tuning.scheduleEndProgress - tuning.earlyGameThreshold, 0.01F);
        const float progressInWindow = std::min(1.0F, (progress - tuning.earlyGameThreshold) / window);
        const int targetSpawned = static_cast<int>(std::ceil(progressInWindow * static_cast<float>(state.questItems.size())));
        const int spawned = static_cast<int>(state.questItems.size()) - candidate.unspawnedCount;
        chance = spawned < targetSpawned ? tuning.behindChance : tuning.normalChance;
    }

    chance += adjusted.chanceBoost;
    chance += GetRoomSpawnBonus(tile.name);
    chance += static_cast<float>(candidate.roomScore) * tuning.affinityWeight;
    return std::clamp(chance, 0.0F, std::max(0.0F, tuning.maxChance));
}

std::optional<QuestItem> ObjectiveSpawner::ShouldSpawnQuestItem(
    const ObjectiveSpawnState& state,
    const maps::BoardTile& tile,
    const Scenario& scenario
)
{
    if (!CanHoldQuestItem(tile))
    {
        return std::nullopt;
    }

    const SpawnCandidate candidate = PickSpawnCandidate(state, tile, scenario);
    if (candidate.item == nullptr)
    {
        return std::nullopt;
    }

    const AdjustedSpawnConfig adjusted = GetAdjustedSpawnConfig(state, scenario);
    if (state.tilesSinceLastSpawn >= adjusted.pityThreshold)
    {
        std::cout << "[SPAWN] Pity timer reached (" << state.tilesSinceLastSpawn << " tiles), forcing " << candidate.item->name << "\n";
        return *candidate.item;
    }

    if (RollUnit() < GetSpawnChance(state, tile, scenario))
    {
        return *candidate.item;
    }
    return std::nullopt;
}

TileExploredResult ObjectiveSpawner::OnTileExplored(
    const ObjectiveSpawnState& state,
    maps::BoardTile& tile,
    const Scenario& scenario,
    const std::vector<std::string>& completedObjectiveIds
)
{
    TileExploredResult result;
    result.updatedState = state;
    ObjectiveSpawnState& next = result.updatedState;
    next.tilesExplored += 1;

    const bool hasUnspawned = std::any_of(next.questItems.begin(), next.questItems.end(), [](const QuestItem& item) { return !item.spawned && !item.collected; });
    if (hasUnspawned && CanHoldQuestItem(tile))
    {
        const std::optional<QuestItem> chosen = ShouldSpawnQuestItem(next, tile, scenario);
        QuestItem* stored = chosen.has_value() ? next.FindItem(chosen->id) : nullptr;
        if (stored != nullptr)
        {
            stored->spawned = true;
            stored->spawnedOnTileId = tile.id;
            tile.itemIds.push_back(stored->id);
            next.tilesSinceLastSpawn = 0;
            result.spawnedItem = *stored;
            std::cout << "[SPAWN] " << stored->name << " appeared in " << tile.name << "\n";
        }
        else
        {
            next.tilesSinceLastSpawn += 1;
        }
    }

    for (auto& questTile : next.questTiles)
    {
        if (!questTile.revealed && ShouldRevealQuestTile(questTile, completedObjectiveIds))
        {
            questTile.revealed = true;
            result.revealedQuestTiles.push_back(questTile);
        }
    }

    if (!result.spawnedItem.has_value() && !tile.questTileId.has_value() && !tile.IsConnector())
    {
        for (auto& questTile : next.questTiles)
        {
            if (!questTile.revealed || questTile.spawned)
            {
                continue;
            }
            if (GetQuestTileLocationScore(questTile.type, tile) < m_config.spawn.organicQuestTileScore)
            {
                continue;
            }

            Materialized placed = MaterializeQuestTile(questTile, tile);
            result.spawnedQuestTile = placed.questTile;
            result.tileModification = placed.modification;
            result.bossSpawn = placed.bossSpawn;
            break;
        }
    }

    return result;
}

GuaranteedSpawnCheck ObjectiveSpawner::CheckGuaranteedSpawns(
    const ObjectiveSpawnState& state,
    const Scenario& scenario,
    int currentDoom,
    const std::vector<maps::BoardTile>& tiles,
    const std::vector<std::string>& completedObjectiveIds
) const
{
    GuaranteedSpawnCheck check;

    std::vector<QuestItem> requiredItems;
    for (const auto& item : state.questItems)
    {
        if (!item.spawned && !item.collected && IsRequiredObjective(scenario, item.objectiveId))
        {
            requiredItems.push_back(item);
        }
    }

    std::vector<QuestTile> revealedTiles;
    for (const auto& questTile : state.questTiles)
    {
        if (!questTile.spawned && IsRequiredObjective(scenario, questTile.objectiveId)
            && ShouldRevealQuestTile(questTile, completedObjectiveIds))
        {
            revealedTiles.push_back(questTile);
        }
    }

    if (requiredItems.empty() && revealedTiles.empty())
    {
        return check;
    }

    const GuaranteedSpawnTuning& tuning = m_config.guaranteed;
    if (currentDoom <= tuning.doomCritical)
    {
        check.urgency = SpawnUrgency::Critical;
        check.forcedItems = requiredItems;
        check.forcedTiles = revealedTiles;
        check.warnings.push_back("Doom is critical (" + std::to_string(currentDoom) + "): "
                                 + std::to_string(requiredItems.size() + revealedTiles.size()) + " required objective(s) are manifesting");
    }
    else if (currentDoom <= tuning.doomWarning)
    {
        const float expectedTiles = static_cast<float>(scenario.startDoom) * m_config.spawn.tilesPerDoom;
        const float ratio = expectedTiles > 0.0F ? static_cast<float>(state.tilesExplored) / expectedTiles : 1.0F;
        if (ratio >= tuning.explorationForceRatio)
        {
            check.urgency = SpawnUrgency::Warning;
            if (!requiredItems.empty())
            {
                check.forcedItems.push_back(requiredItems.front());
            }
            check.forcedTiles = revealedTiles;
            check.warnings.push_back("Doom is rising (" + std::to_string(currentDoom) + ") and the map is largely explored");
        }
    }

    if (!check.forcedItems.empty() && std::none_of(tiles.begin(), tiles.end(), [](const maps::BoardTile& tile) { return IsEligibleSpawnTile(tile); }))
    {
        check.warnings.push_back("No explored tile can hold a quest item yet, placement will be deferred");
    }

    return check;
}

GuaranteedSpawnResult ObjectiveSpawner::ExecuteGuaranteedSpawns(
    const ObjectiveSpawnState& state,
    const GuaranteedSpawnCheck& check,
    std::vector<maps::BoardTile>& tiles
) const
{
    GuaranteedSpawnResult result;
    result.updatedState = state;
    ObjectiveSpawnState& next = result.updatedState;

    std::unordered_set<std::string> usedTileIds;
    for (const auto& item : next.questItems)
    {
        if (item.spawnedOnTileId.has_value())
        {
            usedTileIds.insert(*item.spawnedOnTileId);
        }
    }

    for (const auto& forced : check.forcedItems)
    {
        QuestItem* stored = next.FindItem(forced.id);
        if (stored == nullptr || stored->spawned || stored->collected)
        {
            continue;
        }

        const maps::BoardTile* best = FindBestSpawnTile(*stored, tiles, usedTileIds);
        maps::BoardTile* target = best != nullptr ? FindBoardTile(tiles, best->id) : nullptr;
        if (target == nullptr)
        {
            std::cout << "[SPAWN] Deferred " << stored->name << ": no eligible tile\n";
            result.deferredIds.push_back(stored->id);
            continue;
        }

        stored->spawned = true;
        stored->spawnedOnTileId = target->id;
        target->itemIds.push_back(stored->id);
        usedTileIds.insert(target->id);
        next.tilesSinceLastSpawn = 0;
        result.itemPlacements.push_back({*stored, target->id});
        std::cout << "[SPAWN] Guaranteed spawn: " << stored->name << " placed in " << target->name << "\n";
    }

    for (const auto& forced : check.forcedTiles)
    {
        QuestTileSpawnResult placed = SpawnRevealedQuestTileImmediately(next, forced, tiles);
        if (!placed.spawnedQuestTile.has_value())
        {
            const QuestTile* stored = next.FindTile(forced.id);
            if (stored != nullptr && !stored->spawned)
            {
                std::cout << "[SPAWN] Deferred " << stored->name << ": no eligible tile\n";
                result.deferredIds.push_back(stored->id);
            }
            continue;
        }

        next = std::move(placed.updatedState);
        if (placed.tileModification.has_value())
        {
            result.tileModifications.push_back(*placed.tileModification);
        }
        if (placed.bossSpawn.has_value())
        {
            result.bossSpawns.push_back(*placed.bossSpawn);
        }
    }

    return result;
}

// ============================================================================
// Placement
// ============================================================================

bool IsEligibleSpawnTile(const maps::BoardTile& tile)
{
    return tile.explored && CanHoldQuestItem(tile);
}

const maps::BoardTile* FindBestSpawnTile(
    const QuestItem& item,
    const std::vector<maps::BoardTile>& tiles,
    const std::unordered_set<std::string>& usedTileIds
)
{
    const maps::BoardTile* best = nullptr;
    int bestScore = 0;
    for (const auto& tile : tiles)
    {
        if (!IsEligibleSpawnTile(tile) || usedTileIds.contains(tile.id))
        {
            continue;
        }

        const int score = GetItemRoomScore(item.type, tile.name);
        if (best == nullptr || score > bestScore
            || (score == bestScore && std::abs(tile.zoneLevel) < std::abs(best->zoneLevel))
            || (score == bestScore && std::abs(tile.zoneLevel) == std::abs(best->zoneLevel) && tile.id < best->id))
        {
            best = &tile;
            bestScore = score;
        }
    }
    return best;
}

const maps::BoardTile* FindBestQuestTileLocation(const QuestTile& questTile, const std::vector<maps::BoardTile>& tiles)
{
    const maps::BoardTile* best = nullptr;
    int bestScore = 0;
    for (const auto& tile : tiles)
    {
        if (!tile.explored || tile.IsConnector() || tile.questTileId.has_value())
        {
            continue;
        }

        const int score = GetQuestTileLocationScore(questTile.type, tile);
        if (best == nullptr || score > bestScore || (score == bestScore && tile.id < best->id))
        {
            best = &tile;
            bestScore = score;
        }
    }
    return best;
}

QuestTileSpawnResult SpawnRevealedQuestTileImmediately(
    const ObjectiveSpawnState& state,
    const QuestTile& questTile,
    std::vector<maps::BoardTile>& exploredTiles
)
{
    QuestTileSpawnResult result;
    result.updatedState = state;

    QuestTile* stored = result.updatedState.FindTile(questTile.id);
    if (stored == nullptr || stored->spawned)
    {
        return result;
    }

    const maps::BoardTile* best = FindBestQuestTileLocation(*stored, exploredTiles);
    maps::BoardTile* target = best != nullptr ? FindBoardTile(exploredTiles, best->id) : nullptr;
    if (target == nullptr)
    {
        return result;
    }

    Materialized placed = MaterializeQuestTile(*stored, *target);
    result.spawnedQuestTile = placed.questTile;
    result.targetTileId = target->id;
    result.tileModification = placed.modification;
    result.bossSpawn = placed.bossSpawn;
    return result;
}

TileModification BuildTileModification(const QuestTile& questTile, const maps::BoardTile& tile)
{
    TileModification modification;
    modification.tileId = tile.id;
    modification.questTileId = questTile.id;

    switch (questTile.type)
    {
        case QuestTileType::Exit:
            modification.name = "Exit Door";
            modification.description = "The way out! But can you make it in time?";
            modification.isGate = true;
            break;
        case QuestTileType::Altar:
            modification.name = "Ritual Altar";
            modification.description = "An ancient altar for dark rituals. You can perform the ritual here.";
            modification.floorType = maps::FloorType::Ritual;
            break;
        case QuestTileType::RitualPoint:
            modification.name = "Ritual Point";
            modification.description = "Eldritch lines converge on this spot. The seal must be placed here.";
            modification.floorType = maps::FloorType::Ritual;
            break;
        case QuestTileType::BossRoom:
            modification.name = "Dark Sanctum";
            modification.description = "The air is thick with malevolence. Something waits here.";
            break;
        case QuestTileType::FinalConfrontation:
            // Nothing is placed, the boss arrives instead.
            break;
        case QuestTileType::NpcLocation:
        default:
            modification.description = "Someone, or something, is waiting here.";
            break;
    }
    return modification;
}

void ApplyTileModification(maps::BoardTile& tile, const TileModification& modification)
{
    tile.questTileId = modification.questTileId;
    if (modification.name.has_value())
    {
        tile.name = *modification.name;
    }
    if (modification.description.has_value())
    {
        tile.description = *modification.description;
    }
    if (modification.isGate.has_value())
    {
        tile.isGate = *modification.isGate;
    }
    if (modification.floorType.has_value())
    {
        tile.floorType = *modification.floorType;
    }
}

// ============================================================================
// Progress
// ============================================================================

CollectResult CollectQuestItem(const ObjectiveSpawnState& state, const QuestItem& item, const Scenario& scenario)
{
    CollectResult result;
    result.updatedState = state;

    QuestItem* stored = result.updatedState.FindItem(item.id);
    // Only an item lying on the board can be picked up.
    if (stored == nullptr || !stored->spawned || stored->collected)
    {
        return result;
    }

    stored->collected = true;
    result.updatedState.itemsCollected += 1;

    const ScenarioObjective* objective = scenario.FindObjective(item.objectiveId);
    if (objective == nullptr)
    {
        return result;
    }

    const int collectedForObjective = static_cast<int>(std::count_if(
        result.updatedState.questItems.begin(), result.updatedState.questItems.end(),
        [&item](const QuestItem& other) { return other.objectiveId == item.objectiveId && other.collected; }));

    // Only collection objectives count up, everything else completes on pickup.
    const int target = objective->type == ObjectiveType::Collect ? std::max(1, objective->targetAmount.value_or(1)) : 1;
    const int newAmount = std::min(target, std::max(objective->currentAmount + 1, collectedForObjective));

    ScenarioObjective updated = *objective;
    updated.currentAmount = newAmount;
    updated.completed = newAmount >= target;
    updated.shortDescription = RewriteProgressSuffix(objective->shortDescription, newAmount, target);

    result.objectiveCompleted = updated.completed;
    result.updatedObjective = std::move(updated);
    return result;
}

bool ShouldRevealQuestTile(const QuestTile& questTile, const std::vector<std::string>& completedObjectiveIds)
{
    if (questTile.revealed)
    {
        return true;
    }
    if (questTile.revealCondition == RevealCondition::ObjectiveComplete && questTile.revealObjectiveId.has_value())
    {
        return std::find(completedObjectiveIds.begin(), completedObjectiveIds.end(), *questTile.revealObjectiveId)
            != completedObjectiveIds.end();
    }
    return false;
}

bool CanEscape(const ObjectiveSpawnState& state, const glm::ivec2& playerAxial, const std::vector<maps::BoardTile>& tiles)
{
    for (const auto& questTile : state.questTiles)
    {
        if (questTile.type != QuestTileType::Exit || !questTile.spawned)
        {
            continue;
        }
        for (const auto& tile : tiles)
        {
            const bool isExitTile = tile.questTileId == questTile.id || questTile.spawnedOnTileId == tile.id;
            if (isExitTile && tile.axial == playerAxial)
            {
                return true;
            }
        }
    }
    return false;
}

SpawnStatus GetSpawnStatus(const ObjectiveSpawnState& state, const Scenario& scenario)
{
    SpawnStatus status;
    status.totalItems = static_cast<int>(state.questItems.size());
    status.totalTiles = static_cast<int>(state.questTiles.size());

    for (const auto& item : state.questItems)
    {
        status.spawnedItems += item.spawned ? 1 : 0;
        status.collectedItems += item.collected ? 1 : 0;
        if (!item.spawned && !item.collected && IsRequiredObjective(scenario, item.objectiveId))
        {
            status.missingRequired.push_back("Item: " + item.name);
        }
    }

    for (const auto& questTile : state.questTiles)
    {
        status.spawnedTiles += questTile.spawned ? 1 : 0;
        if (!questTile.spawned && IsRequiredObjective(scenario, questTile.objectiveId))
        {
            status.missingRequired.push_back("Location: " + questTile.name);
        }
    }

    return status;
}

std::vector<ObjectiveProgress> GetObjectiveProgress(const ObjectiveSpawnState& state, const Scenario& scenario)
{
    std::vector<ObjectiveProgress> progress;
    progress.reserve(scenario.objectives.size());

    for (const auto& objective : scenario.objectives)
    {
        int related = 0;
        int collected = 0;
        for (const auto& item : state.questItems)
        {
            if (item.objectiveId == objective.id)
            {
                ++related;
                collected += item.collected ? 1 : 0;
            }
        }

        const int total = related > 0 ? related : std::max(1, objective.Target());
        const int current = related > 0 ? collected : objective.currentAmount;

        ObjectiveProgress entry;
        entry.id = objective.id;
        entry.progress = std::to_string(current) + "/" + std::to_string(total);
        entry.completed = objective.completed || current >= total;
        progress.push_back(entry);
    }

    return progress;
}

// ============================================================================
// Text conversion
// ============================================================================

const char* QuestItemTypeToText(QuestItemType type)
{
    switch (type)
    {
        case QuestItemType::Key: return "key";
        case QuestItemType::Clue: return "clue";
        case QuestItemType::Collectible: return "collectible";
        case QuestItemType::Artifact: return "artifact";
        case QuestItemType::Component: return "component";
        default: return "artifact";
    }
}

const char* QuestTileTypeToText(QuestTileType type)
{
    switch (type)
    {
        case QuestTileType::Exit: return "exit";
        case QuestTileType::Altar: return "altar";
        case QuestTileType::RitualPoint: return "ritual_point";
        case QuestTileType::BossRoom: return "boss_room";
        case QuestTileType::FinalConfrontation: return "final_confrontation";
        case QuestTileType::NpcLocation: return "npc_location";
        default: return "npc_location";
    }
}

const char* RevealConditionToText(RevealCondition condition)
{
    switch (condition)
    {
        case RevealCondition::None: return "none";
        case RevealCondition::ObjectiveComplete: return "objective_complete";
        default: return "none";
    }
}

const char* SpawnUrgencyToText(SpawnUrgency urgency)
{
    switch (urgency)
    {
        case SpawnUrgency::None: return "none";
        case SpawnUrgency::Warning: return "warning";
        case SpawnUrgency::Critical: return "critical";
        default: return "none";
    }
}

QuestItemType QuestItemTypeFromText(const std::string& value)
{
    static constexpr QuestItemType kAll[] = {
        QuestItemType::Key, QuestItemType::Clue, QuestItemType::Collectible, QuestItemType::Artifact, QuestItemType::Component,
    };
    for (const QuestItemType type : kAll)
    {
        if (value == QuestItemTypeToText(type))
        {
            return type;
        }
    }
    return QuestItemType::Artifact;
}

QuestTileType QuestTileTypeFromText(const std::string& value)
{
    static constexpr QuestTileType kAll[] = {
        QuestTileType::Exit, QuestTileType::Altar, QuestTileType::RitualPoint,
        QuestTileType::BossRoom, QuestTileType::FinalConfrontation, QuestTileType::NpcLocation,
    };
    for (const QuestTileType type : kAll)
    {
        if (value == QuestTileTypeToText(type))
        {
            return type;
        }
    }
    return QuestTileType::NpcLocation;
}

RevealCondition RevealConditionFromText(const std::string& value)
{
    if (value == "objective_complete")
    {
        return RevealCondition::ObjectiveComplete;
    }
    return RevealCondition::None;
}

SpawnUrgency SpawnUrgencyFromText(const std::string& value)
{
    if (value == "critical")
    {
        return SpawnUrgency::Critical;
    }
    if (value == "warning")
    {
        return SpawnUrgency::Warning;
    }
    return SpawnUrgency::None;
}
} // namespace game::scenario
