#include <doctest/doctest.h>

#include <algorithm>

#include "game/scenario/MissionCatalog.hpp"
#include "game/scenario/ObjectiveSpawner.hpp"
#include "tests/TestFixtures.hpp"

using namespace game::scenario;
using namespace test_fixtures;
using game::maps::BoardTile;
using game::maps::TileCategory;

namespace
{
constexpr unsigned int kSeed = 1234U;

// Spawn rolls never succeed, only the pity timer places items.
BalanceConfig NoLuckConfig()
{
    BalanceConfig config;
    config.spawn.maxChance = 0.0F;
    return config;
}

Scenario MakeKeyEscapeScenario()
{
    Scenario scenario = MakeEscapeScenario();
    scenario.objectives[0].targetId = "iron_key";
    return scenario;
}

Scenario MakeCollectionScenario(int target)
{
    Scenario scenario;
    scenario.id = "collection_test";
    scenario.title = "Pages of the Dread Book";
    scenario.startDoom = 16;
    scenario.victoryType = VictoryType::Collection;
    ScenarioObjective pages = MakeObjective("obj_pages", ObjectiveType::Collect, std::string("necro_page"), target);
    pages.shortDescription = "Gather pages (0/" + std::to_string(target) + ")";
    scenario.objectives.push_back(pages);
    scenario.victoryConditions.push_back({VictoryType::Collection, "Collect", {"obj_pages"}});
    return scenario;
}
} // namespace

TEST_CASE("Room bonuses and item affinities")
{
    CHECK(GetRoomSpawnBonus("Ritual Chamber") == doctest::Approx(0.25F));
    CHECK(GetRoomSpawnBonus("Dusty Study") == doctest::Approx(0.20F));
    CHECK(GetRoomSpawnBonus("Wine Cellar") == doctest::Approx(0.15F));
    CHECK(GetRoomSpawnBonus("Storage Closet") == doctest::Approx(0.10F));
    CHECK(GetRoomSpawnBonus("Overgrown Garden") == doctest::Approx(0.0F));

    CHECK(GetItemRoomScore(QuestItemType::Key, "Study") == 3);
    CHECK(GetItemRoomScore(QuestItemType::Clue, "Old Library") == 3);
    CHECK(GetItemRoomScore(QuestItemType::Component, "Greenhouse") == 2);
    CHECK(GetItemRoomScore(QuestItemType::Key, "Garden") == 0);
}

TEST_CASE("Quest tile location scores favour fitting rooms")
{
    BoardTile foyer = MakeTile(0, 0, TileCategory::Foyer, "Grand Foyer");
    CHECK(GetQuestTileLocationScore(QuestTileType::Exit, foyer) >= 5);

    BoardTile crypt = MakeTile(1, 0, TileCategory::Crypt, "Crypt");
    crypt.zoneLevel = -1;
    CHECK(GetQuestTileLocationScore(QuestTileType::Altar, crypt) >= 5);
    CHECK(GetQuestTileLocationScore(QuestTileType::Exit, crypt) < 0);

    BoardTile sanctum = MakeTile(2, 0, TileCategory::Crypt, "Sanctum");
    sanctum.zoneLevel = -2;
    CHECK(GetQuestTileLocationScore(QuestTileType::BossRoom, sanctum) == 12);

    CHECK(GetQuestTileLocationScore(QuestTileType::NpcLocation, MakeTile(0, 1, TileCategory::Room, "Prison Cell")) == 4);
}

TEST_CASE("Target ids map to quest tile and item types")
{
    CHECK(MatchQuestTileType("exit_door")->type == QuestTileType::Exit);
    CHECK(MatchQuestTileType("ritual_point")->type == QuestTileType::RitualPoint);
    CHECK(MatchQuestTileType("ritual_chamber")->type == QuestTileType::Altar);
    CHECK(MatchQuestTileType("throne_room")->type == QuestTileType::BossRoom);
    CHECK(MatchQuestTileType("final_confrontation")->type == QuestTileType::FinalConfrontation);
    CHECK_FALSE(MatchQuestTileType("npc").has_value());

    const QuestTileTypeInfo fallback = QuestTileTypeFromTargetId("npc");
    CHECK(fallback.type == QuestTileType::NpcLocation);
    CHECK(fallback.name == "Special Location");

    CHECK(QuestItemTypeFor(ObjectiveType::FindItem, "iron_key") == QuestItemType::Key);
    CHECK(QuestItemTypeFor(ObjectiveType::FindItem, "evidence_clue") == QuestItemType::Clue);
    CHECK(QuestItemTypeFor(ObjectiveType::FindItem, "elder_sign") == QuestItemType::Artifact);
    CHECK(QuestItemTypeFor(ObjectiveType::Collect, "ritual_component") == QuestItemType::Component);
    CHECK(QuestItemTypeFor(ObjectiveType::Collect, "necro_page") == QuestItemType::Collectible);
}

TEST_CASE("Initialization creates items and quest tiles per objective")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, DefaultBalanceConfig(), kSeed);

    Scenario scenario = MakeKeyEscapeScenario();
    scenario.objectives.push_back(MakeObjective("obj_pages", ObjectiveType::Collect, std::string("necro_page"), 3));
    scenario.objectives.push_back(MakeObjective("obj_finale", ObjectiveType::FindTile, std::string("final_confrontation")));
    scenario.objectives.push_back(MakeObjective("obj_talk", ObjectiveType::Interact, std::string("npc")));
    scenario.objectives.push_back(MakeObjective("obj_rite", ObjectiveType::Ritual));

    const ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);

    REQUIRE(state.questItems.size() == 4);
    const QuestItem* key = state.FindItem("quest_item_obj_key_0");
    REQUIRE(key != nullptr);
    CHECK(key->type == QuestItemType::Key);
    CHECK(key->name == "Iron Key");
    CHECK_FALSE(key->spawned);
    CHECK(state.FindItem("quest_item_obj_pages_2") != nullptr);
    CHECK(state.FindItem("quest_item_obj_pages_2")->name == "Necronomicon Page");

    REQUIRE(state.questTiles.size() == 3);
    const QuestTile* exit = state.FindTile("quest_tile_obj_escape");
    REQUIRE(exit != nullptr);
    CHECK(exit->type == QuestTileType::Exit);
    CHECK_FALSE(exit->revealed);
    CHECK(exit->revealCondition == RevealCondition::ObjectiveComplete);
    CHECK(exit->revealObjectiveId == std::optional<std::string>("obj_key"));

    const QuestTile* finale = state.FindTile("quest_tile_obj_finale");
    REQUIRE(finale != nullptr);
    CHECK(finale->type == QuestTileType::FinalConfrontation);
    CHECK(finale->bossType == std::optional<std::string>("dark_young"));
    CHECK(finale->revealed);

    CHECK(state.FindTile("quest_tile_obj_talk") == nullptr);
    REQUIRE(state.FindTile("quest_tile_obj_rite") != nullptr);
    CHECK(state.FindTile("quest_tile_obj_rite")->type == QuestTileType::Altar);

    CHECK(state.tilesExplored == 0);
    CHECK(state.tilesSinceLastSpawn == 0);
}

TEST_CASE("Adjusted spawn config for collection missions and nightmare")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, DefaultBalanceConfig(), kSeed);

    Scenario small = MakeKeyEscapeScenario();
    AdjustedSpawnConfig adjusted = spawner.GetAdjustedSpawnConfig(spawner.InitializeObjectiveSpawns(small), small);
    CHECK(adjusted.pityThreshold == 4);
    CHECK(adjusted.chanceBoost == doctest::Approx(0.0F));

    Scenario collection = MakeCollectionScenario(5);
    adjusted = spawner.GetAdjustedSpawnConfig(spawner.InitializeObjectiveSpawns(collection), collection);
    CHECK(adjusted.pityThreshold == 3);
    CHECK(adjusted.chanceBoost == doctest::Approx(0.15F));

    collection.difficulty = Difficulty::Nightmare;
    adjusted = spawner.GetAdjustedSpawnConfig(spawner.InitializeObjectiveSpawns(collection), collection);
    CHECK(adjusted.pityThreshold == 2);
}

TEST_CASE("Crossed pity bounds in a hand-built table resolve to the lower bound")
{
    MissionCatalog catalog;
    BalanceConfig config;
    config.spawn.minPityThreshold = 8;
    config.spawn.maxPityThreshold = 3;
    ObjectiveSpawner spawner(catalog, config, kSeed);

    const Scenario scenario = MakeKeyEscapeScenario();
    CHECK(spawner.GetAdjustedSpawnConfig(spawner.InitializeObjectiveSpawns(scenario), scenario).pityThreshold == 8);
}

TEST_CASE("Spawn chance follows the schedule, room bonus, affinity and cap")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, DefaultBalanceConfig(), kSeed);

    const BoardTile parlor = MakeTile(0, 0, TileCategory::Room, "Parlor");
    const BoardTile study = MakeTile(1, 0, TileCategory::Room, "Study");

    SUBCASE("early game")
    {
        const Scenario scenario = MakeKeyEscapeScenario();
        const ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);
        CHECK(spawner.GetSpawnChance(state, parlor, scenario) == doctest::Approx(0.10F));
        // Study: +0.20 room bonus, key affinity 3 * 0.05.
        CHECK(spawner.GetSpawnChance(state, study, scenario) == doctest::Approx(0.45F));
    }

    SUBCASE("behind schedule, then capped")
    {
        const Scenario scenario = MakeKeyEscapeScenario();
        ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);
        // 9 of 18 expected tiles with nothing placed yet.
        state.tilesExplored = 9;
        CHECK(spawner.GetSpawnChance(state, parlor, scenario) == doctest::Approx(0.50F));
        CHECK(spawner.GetSpawnChance(state, study, scenario) == doctest::Approx(0.80F));
    }

    SUBCASE("on schedule")
    {
        const Scenario scenario = MakeCollectionScenario(2);
        ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);
        // 6 of 24 expected tiles wants one of two items placed.
        state.tilesExplored = 6;
        state.questItems[0].spawned = true;
        CHECK(spawner.GetSpawnChance(state, parlor, scenario) == doctest::Approx(0.25F));
    }

    SUBCASE("collection missions are boosted from the first tile")
    {
        const Scenario scenario = MakeCollectionScenario(5);
        const ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);
        REQUIRE(state.tilesExplored == 0);
        CHECK(spawner.GetSpawnChance(state, parlor, scenario) == doctest::Approx(0.25F));
    }

    SUBCASE("nothing to roll for")
    {
        const Scenario scenario = MakeKeyEscapeScenario();
        ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);
        CHECK(spawner.GetSpawnChance(state, MakeTile(2, 0, TileCategory::Corridor, "Corridor"), scenario) == doctest::Approx(0.0F));
        state.questItems[0].spawned = true;
        CHECK(spawner.GetSpawnChance(state, parlor, scenario) == doctest::Approx(0.0F));
    }
}

TEST_CASE("Items whose objective is missing from the scenario are spawned first")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, NoLuckConfig(), kSeed);

    Scenario scenario = MakeKeyEscapeScenario();
    ScenarioObjective bonus = MakeObjective("obj_bonus", ObjectiveType::FindItem, std::string("spare_key"));
    bonus.isOptional = true;
    scenario.objectives.push_back(bonus);

    ObjectiveSpawnState state;
    state.questItems.push_back(MakeQuestItem("quest_item_obj_bonus_0", "obj_bonus", QuestItemType::Key));
    state.questItems.push_back(MakeQuestItem("quest_item_obj_gone_0", "obj_gone", QuestItemType::Clue));
    state.tilesSinceLastSpawn = 10;

    // The key fits a bedroom better, the orphaned clue still goes first.
    const BoardTile bedroom = MakeTile(0, 0, TileCategory::Room, "Bedroom");
    const std::optional<QuestItem> chosen = spawner.ShouldSpawnQuestItem(state, bedroom, scenario);
    REQUIRE(chosen.has_value());
    CHECK(chosen->id == "quest_item_obj_gone_0");
}

TEST_CASE("Pity timer forces a spawn after enough empty rooms")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, NoLuckConfig(), kSeed);
    const Scenario scenario = MakeKeyEscapeScenario();
    ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);

    for (int i = 0; i < 4; ++i)
    {
        BoardTile room = MakeTile(i, 0, TileCategory::Room, "Parlor");
        TileExploredResult result = spawner.OnTileExplored(state, room, scenario, {});
        CHECK_FALSE(result.spawnedItem.has_value());
        CHECK(room.itemIds.empty());
        state = result.updatedState;
    }
    CHECK(state.tilesSinceLastSpawn == 4);
    CHECK(state.tilesExplored == 4);

    // Corridors never hold items and do not advance the pity counter.
    BoardTile corridor = MakeTile(9, 0, TileCategory::Corridor, "Corridor");
    state = spawner.OnTileExplored(state, corridor, scenario, {}).updatedState;
    CHECK(state.tilesSinceLastSpawn == 4);
    CHECK(state.tilesExplored == 5);

    BoardTile room = MakeTile(5, 0, TileCategory::Room, "Parlor");
    REQUIRE(spawner.ShouldSpawnQuestItem(state, room, scenario).has_value());

    TileExploredResult result = spawner.OnTileExplored(state, room, scenario, {});
    REQUIRE(result.spawnedItem.has_value());
    CHECK(result.spawnedItem->id == "quest_item_obj_key_0");
    CHECK(result.spawnedItem->spawnedOnTileId == std::optional<std::string>(room.id));
    CHECK(room.itemIds == std::vector<std::string>{"quest_item_obj_key_0"});
    CHECK(result.updatedState.tilesSinceLastSpawn == 0);
    CHECK(result.updatedState.FindItem("quest_item_obj_key_0")->spawned);

    // The input state is a value and is not changed.
    CHECK_FALSE(state.FindItem("quest_item_obj_key_0")->spawned);
}

TEST_CASE("Exploring with no unspawned items leaves the pity counter alone")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, NoLuckConfig(), kSeed);
    const Scenario scenario = MakeSurvivalScenario(5, 12);
    ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);
    REQUIRE(state.questItems.empty());

    BoardTile room = MakeTile(0, 0);
    state = spawner.OnTileExplored(state, room, scenario, {}).updatedState;
    CHECK(state.tilesSinceLastSpawn == 0);
    CHECK(state.tilesExplored == 1);
}

TEST_CASE("Completing the trigger reveals the exit and a fitting tile receives it")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, NoLuckConfig(), kSeed);
    const Scenario scenario = MakeKeyEscapeScenario();
    const ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);

    BoardTile parlor = MakeTile(1, 0, TileCategory::Room, "Parlor");
    TileExploredResult before = spawner.OnTileExplored(state, parlor, scenario, {});
    CHECK(before.revealedQuestTiles.empty());
    CHECK_FALSE(before.spawnedQuestTile.has_value());

    BoardTile foyer = MakeTile(0, 0, TileCategory::Foyer, "Grand Entrance Hall");
    TileExploredResult after = spawner.OnTileExplored(before.updatedState, foyer, scenario, {"obj_key"});
    REQUIRE(after.revealedQuestTiles.size() == 1);
    CHECK(after.revealedQuestTiles[0].id == "quest_tile_obj_escape");

    REQUIRE(after.spawnedQuestTile.has_value());
    CHECK(after.spawnedQuestTile->type == QuestTileType::Exit);
    REQUIRE(after.tileModification.has_value());
    CHECK(after.tileModification->isGate == std::optional<bool>(true));
    CHECK(foyer.isGate);
    CHECK(foyer.name == "Exit Door");
    CHECK(foyer.questTileId == std::optional<std::string>("quest_tile_obj_escape"));
    CHECK(after.updatedState.FindTile("quest_tile_obj_escape")->spawned);

    const std::vector<BoardTile> board = {parlor, foyer};
    CHECK(CanEscape(after.updatedState, foyer.axial, board));
    CHECK_FALSE(CanEscape(after.updatedState, parlor.axial, board));
    CHECK_FALSE(CanEscape(before.updatedState, foyer.axial, board));
}

TEST_CASE("Revealed quest tiles can be placed immediately")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, DefaultBalanceConfig(), kSeed);
    Scenario scenario = MakeKeyEscapeScenario();
    scenario.objectives.push_back(MakeObjective("obj_finale", ObjectiveType::FindTile, std::string("final_confrontation")));
    const ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);

    std::vector<BoardTile> tiles = {
        MakeTile(0, 0, TileCategory::Foyer, "Foyer"),
        MakeTile(1, 0, TileCategory::Corridor, "Corridor"),
        MakeTile(2, 0, TileCategory::Crypt, "Throne Crypt"),
    };
    tiles[2].zoneLevel = -1;

    const QuestTile* finale = state.FindTile("quest_tile_obj_finale");
    REQUIRE(finale != nullptr);
    const QuestTileSpawnResult result = SpawnRevealedQuestTileImmediately(state, *finale, tiles);

    REQUIRE(result.spawnedQuestTile.has_value());
    CHECK(result.targetTileId == std::optional<std::string>(tiles[2].id));
    REQUIRE(result.bossSpawn.has_value());
    CHECK(result.bossSpawn->bossType == "dark_young");
    CHECK(result.bossSpawn->axial == tiles[2].axial);
    CHECK(tiles[2].questTileId == std::optional<std::string>("quest_tile_obj_finale"));
    CHECK(tiles[2].name == "Throne Crypt");

    // Already placed: nothing happens the second time.
    const QuestTileSpawnResult again = SpawnRevealedQuestTileImmediately(result.updatedState, *finale, tiles);
    CHECK_FALSE(again.spawnedQuestTile.has_value());
}

TEST_CASE("Immediate placement reports nothing without a usable tile")
{
    QuestTile exit = MakeQuestTile("quest_tile_exit", "obj_escape", QuestTileType::Exit);
    ObjectiveSpawnState state;
    state.questTiles.push_back(exit);

    std::vector<BoardTile> tiles = {MakeTile(0, 0, TileCategory::Street, "Street")};
    const QuestTileSpawnResult result = SpawnRevealedQuestTileImmediately(state, exit, tiles);
    CHECK_FALSE(result.spawnedQuestTile.has_value());
    CHECK_FALSE(result.updatedState.questTiles[0].spawned);
}

TEST_CASE("Best spawn tile prefers affinity, then shallow zones, and skips used tiles")
{
    const QuestItem key = MakeQuestItem("quest_item_key", "obj_key", QuestItemType::Key);

    std::vector<BoardTile> tiles = {
        MakeTile(0, 0, TileCategory::Corridor, "Study Corridor"),
        MakeTile(1, 0, TileCategory::Room, "Kitchen"),
        MakeTile(2, 0, TileCategory::Room, "Study"),
        MakeTile(3, 0, TileCategory::Room, "Office"),
        MakeTile(4, 0, TileCategory::Room, "Locked Study"),
    };
    tiles[2].zoneLevel = 1;
    tiles[4].explored = false;

    const BoardTile* best = FindBestSpawnTile(key, tiles, {});
    REQUIRE(best != nullptr);
    CHECK(best->name == "Office");

    best = FindBestSpawnTile(key, tiles, {tiles[3].id});
    REQUIRE(best != nullptr);
    CHECK(best->name == "Study");

    CHECK(FindBestSpawnTile(key, {tiles[0]}, {}) == nullptr);
    CHECK_FALSE(IsEligibleSpawnTile(tiles[4]));

    // A room already holding a quest item is skipped, ordinary loot is not.
    tiles[3].itemIds.push_back("quest_item_obj_pages_0");
    tiles[2].itemIds.push_back("lantern");
    CHECK_FALSE(IsEligibleSpawnTile(tiles[3]));
    best = FindBestSpawnTile(key, tiles, {});
    REQUIRE(best != nullptr);
    CHECK(best->name == "Study");
}

TEST_CASE("Quest tile locations follow the tile type")
{
    const QuestTile exit = MakeQuestTile("quest_tile_obj_escape", "obj_escape", QuestTileType::Exit);
    const QuestTile sanctum = MakeQuestTile("quest_tile_obj_sanctum", "obj_sanctum", QuestTileType::BossRoom);

    std::vector<BoardTile> tiles = {
        MakeTile(0, 0, TileCategory::Crypt, "Crypt"),
        MakeTile(1, 0, TileCategory::Room, "Parlor"),
        MakeTile(2, 0, TileCategory::Foyer, "Foyer"),
        MakeTile(3, 0, TileCategory::Corridor, "Corridor"),
    };

    const BoardTile* best = FindBestQuestTileLocation(exit, tiles);
    REQUIRE(best != nullptr);
    CHECK(best->name == "Foyer");

    best = FindBestQuestTileLocation(sanctum, tiles);
    REQUIRE(best != nullptr);
    CHECK(best->name == "Crypt");

    // Occupied and unexplored tiles are skipped.
    tiles[2].questTileId = "quest_tile_other";
    tiles[0].explored = false;
    best = FindBestQuestTileLocation(exit, tiles);
    REQUIRE(best != nullptr);
    CHECK(best->name == "Parlor");

    CHECK(FindBestQuestTileLocation(exit, {tiles[3]}) == nullptr);
}

TEST_CASE("Critical doom forces every required spawn")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, DefaultBalanceConfig(), kSeed);
    const Scenario scenario = MakeKeyEscapeScenario();
    const ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);

    std::vector<BoardTile> tiles = {
        MakeTile(0, 0, TileCategory::Foyer, "Foyer"),
        MakeTile(1, 0, TileCategory::Room, "Study"),
    };

    const GuaranteedSpawnCheck check = spawner.CheckGuaranteedSpawns(state, scenario, 3, tiles, {"obj_key"});
    CHECK(check.urgency == SpawnUrgency::Critical);
    REQUIRE(check.forcedItems.size() == 1);
    REQUIRE(check.forcedTiles.size() == 1);
    CHECK_FALSE(check.warnings.empty());

    const GuaranteedSpawnResult result = spawner.ExecuteGuaranteedSpawns(state, check, tiles);
    REQUIRE(result.itemPlacements.size() == 1);
    CHECK(result.itemPlacements[0].tileId == tiles[1].id);
    CHECK(tiles[1].itemIds == std::vector<std::string>{"quest_item_obj_key_0"});
    REQUIRE(result.tileModifications.size() == 1);
    CHECK(result.tileModifications[0].tileId == tiles[0].id);
    CHECK(tiles[0].isGate);
    CHECK(result.deferredIds.empty());

    const SpawnStatus status = GetSpawnStatus(result.updatedState, scenario);
    CHECK(status.spawnedItems == 1);
    CHECK(status.spawnedTiles == 1);
    CHECK(status.missingRequired.empty());
}

TEST_CASE("Hidden quest tiles are not forced before their trigger")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, DefaultBalanceConfig(), kSeed);
    const Scenario scenario = MakeKeyEscapeScenario();
    const ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);

    const GuaranteedSpawnCheck check = spawner.CheckGuaranteedSpawns(state, scenario, 2, {MakeTile(0, 0)}, {});
    CHECK(check.urgency == SpawnUrgency::Critical);
    CHECK(check.forcedItems.size() == 1);
    CHECK(check.forcedTiles.empty());
}

TEST_CASE("Warning urgency depends on how much of the map is explored")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, DefaultBalanceConfig(), kSeed);
    Scenario scenario = MakeCollectionScenario(3);
    ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);
    const std::vector<BoardTile> tiles = {MakeTile(0, 0)};

    // 16 doom * 1.5 = 24 expected tiles.
    state.tilesExplored = 5;
    CHECK(spawner.CheckGuaranteedSpawns(state, scenario, 5, tiles, {}).urgency == SpawnUrgency::None);

    state.tilesExplored = 18;
    const GuaranteedSpawnCheck check = spawner.CheckGuaranteedSpawns(state, scenario, 5, tiles, {});
    CHECK(check.urgency == SpawnUrgency::Warning);
    CHECK(check.forcedItems.size() == 1);

    CHECK(spawner.CheckGuaranteedSpawns(state, scenario, 10, tiles, {}).urgency == SpawnUrgency::None);
}

TEST_CASE("Forced items without an eligible tile are deferred")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, DefaultBalanceConfig(), kSeed);
    const Scenario scenario = MakeKeyEscapeScenario();
    const ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);

    std::vector<BoardTile> tiles = {MakeTile(0, 0, TileCategory::Corridor, "Corridor")};
    const GuaranteedSpawnCheck check = spawner.CheckGuaranteedSpawns(state, scenario, 1, tiles, {});
    REQUIRE(check.urgency == SpawnUrgency::Critical);
    CHECK(check.warnings.size() == 2);

    const GuaranteedSpawnResult result = spawner.ExecuteGuaranteedSpawns(state, check, tiles);
    CHECK(result.itemPlacements.empty());
    CHECK(result.deferredIds == std::vector<std::string>{"quest_item_obj_key_0"});
    CHECK_FALSE(result.updatedState.questItems[0].spawned);
}

TEST_CASE("Collecting counts toward collection objectives")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, DefaultBalanceConfig(), kSeed);
    Scenario scenario = MakeCollectionScenario(2);
    ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);
    REQUIRE(state.questItems.size() == 2);
    for (auto& item : state.questItems)
    {
        item.spawned = true;
    }

    const QuestItem first = state.questItems[0];
    const QuestItem second = state.questItems[1];

    CollectResult result = CollectQuestItem(state, first, scenario);
    REQUIRE(result.updatedObjective.has_value());
    CHECK(result.updatedObjective->currentAmount == 1);
    CHECK(result.updatedObjective->shortDescription == "Gather pages (1/2)");
    CHECK_FALSE(result.objectiveCompleted);
    CHECK(result.updatedState.itemsCollected == 1);
    state = result.updatedState;
    scenario.objectives[0] = *result.updatedObjective;

    // Picking up the same item twice changes nothing.
    CollectResult duplicate = CollectQuestItem(state, first, scenario);
    CHECK_FALSE(duplicate.updatedObjective.has_value());
    CHECK(duplicate.updatedState.itemsCollected == 1);

    result = CollectQuestItem(state, second, scenario);
    REQUIRE(result.updatedObjective.has_value());
    CHECK(result.updatedObjective->currentAmount == 2);
    CHECK(result.updatedObjective->shortDescription == "Gather pages (2/2)");
    CHECK(result.objectiveCompleted);
    CHECK(result.updatedObjective->completed);
}

TEST_CASE("Single items complete their objective on pickup")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, DefaultBalanceConfig(), kSeed);
    const Scenario scenario = MakeKeyEscapeScenario();
    ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);
    state.questItems[0].spawned = true;

    const CollectResult result = CollectQuestItem(state, state.questItems[0], scenario);
    CHECK(result.objectiveCompleted);
    REQUIRE(result.updatedObjective.has_value());
    CHECK(result.updatedObjective->id == "obj_key");
}

TEST_CASE("Items not yet on the board cannot be collected")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, DefaultBalanceConfig(), kSeed);
    const Scenario scenario = MakeKeyEscapeScenario();
    const ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);
    REQUIRE_FALSE(state.questItems[0].spawned);

    const CollectResult result = CollectQuestItem(state, state.questItems[0], scenario);
    CHECK_FALSE(result.updatedObjective.has_value());
    CHECK_FALSE(result.objectiveCompleted);
    CHECK(result.updatedState.itemsCollected == 0);
    CHECK_FALSE(result.updatedState.questItems[0].collected);
}

TEST_CASE("Collected items are never forced or reported missing")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, DefaultBalanceConfig(), kSeed);
    const Scenario scenario = MakeKeyEscapeScenario();
    ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);
    // A save written before placement was tracked can hold this combination.
    state.questItems[0].collected = true;
    state.itemsCollected = 1;

    std::vector<BoardTile> tiles = {MakeTile(0, 0, TileCategory::Room, "Study")};
    const GuaranteedSpawnCheck check = spawner.CheckGuaranteedSpawns(state, scenario, 2, tiles, {});
    CHECK(check.forcedItems.empty());

    GuaranteedSpawnCheck stale;
    stale.urgency = SpawnUrgency::Critical;
    stale.forcedItems.push_back(state.questItems[0]);
    const GuaranteedSpawnResult result = spawner.ExecuteGuaranteedSpawns(state, stale, tiles);
    CHECK(result.itemPlacements.empty());
    CHECK(tiles[0].itemIds.empty());

    const SpawnStatus status = GetSpawnStatus(state, scenario);
    CHECK(std::find(status.missingRequired.begin(), status.missingRequired.end(), "Item: Iron Key") == status.missingRequired.end());
    CHECK(status.collectedItems == 1);

    CHECK(spawner.GetSpawnChance(state, tiles[0], scenario) == doctest::Approx(0.0F));
}

TEST_CASE("Status and progress report missing required pieces")
{
    MissionCatalog catalog;
    ObjectiveSpawner spawner(catalog, DefaultBalanceConfig(), kSeed);
    const Scenario scenario = MakeKeyEscapeScenario();
    const ObjectiveSpawnState state = spawner.InitializeObjectiveSpawns(scenario);

    const SpawnStatus status = GetSpawnStatus(state, scenario);
    CHECK(status.totalItems == 1);
    CHECK(status.totalTiles == 1);
    CHECK(status.spawnedItems == 0);
    CHECK(std::find(status.missingRequired.begin(), status.missingRequired.end(), "Item: Iron Key") != status.missingRequired.end());
    CHECK(std::find(status.missingRequired.begin(), status.missingRequired.end(), "Location: Exit") != status.missingRequired.end());

    const std::vector<ObjectiveProgress> progress = GetObjectiveProgress(state, scenario);
    REQUIRE(progress.size() == 2);
    CHECK(progress[0].id == "obj_key");
    CHECK(progress[0].progress == "0/1");
    CHECK_FALSE(progress[0].completed);
    CHECK(progress[1].progress == "0/1");
}

TEST_CASE("Quest tile reveal conditions")
{
    QuestTile hidden = MakeQuestTile("quest_tile_exit", "obj_escape", QuestTileType::Exit);
    hidden.revealed = false;
    hidden.revealCondition = RevealCondition::ObjectiveComplete;
    hidden.revealObjectiveId = "obj_key";

    CHECK_FALSE(ShouldRevealQuestTile(hidden, {}));
    CHECK_FALSE(ShouldRevealQuestTile(hidden, {"obj_other"}));
    CHECK(ShouldRevealQuestTile(hidden, {"obj_key"}));

    hidden.revealCondition = RevealCondition::None;
    CHECK_FALSE(ShouldRevealQuestTile(hidden, {"obj_key"}));
}

TEST_CASE("Tile modifications per quest tile type")
{
    const BoardTile tile = MakeTile(0, 0, TileCategory::Crypt, "Crypt");

    const TileModification altar = BuildTileModification(MakeQuestTile("a", "o", QuestTileType::Altar), tile);
    CHECK(altar.name == std::optional<std::string>("Ritual Altar"));
    CHECK(altar.floorType == std::optional<game::maps::FloorType>(game::maps::FloorType::Ritual));

    const TileModification boss = BuildTileModification(MakeQuestTile("b", "o", QuestTileType::BossRoom), tile);
    CHECK(boss.name == std::optional<std::string>("Dark Sanctum"));

    const TileModification finale = BuildTileModification(MakeQuestTile("f", "o", QuestTileType::FinalConfrontation), tile);
    CHECK_FALSE(finale.name.has_value());
    CHECK(finale.questTileId == "f");

    BoardTile target = tile;
    ApplyTileModification(target, altar);
    CHECK(target.name == "Ritual Altar");
    CHECK(target.floorType == game::maps::FloorType::Ritual);
    CHECK(target.questTileId == std::optional<std::string>("a"));
}
