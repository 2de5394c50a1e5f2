#include "game/scenario/MissionCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace game::scenario
{
namespace
{
using maps::FloorType;
using maps::TileCategory;

ObjectiveTemplate Objective(const std::string& id, ObjectiveType type, const std::string& description, const std::string& shortDescription)
{
    ObjectiveTemplate objective;
    objective.id = id;
    objective.type = type;
    objective.descriptionTemplate = description;
    objective.shortDescriptionTemplate = shortDescription;
    return objective;
}

std::string ToLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const std::vector<EnemySpawnConfig>& EmptyEnemyPool()
{
    static const std::vector<EnemySpawnConfig> kEmpty;
    return kEmpty;
}
} // namespace

MissionCatalog::MissionCatalog()
{
    InitializeDefaults();
}

void MissionCatalog::InitializeDefaults()
{
    m_missions.clear();

    // === ESCAPE ===
    {
        MissionTemplate mission;
        mission.id = "escape_manor";
        mission.name = "Escape";
        mission.victoryType = VictoryType::Escape;
        mission.tileSet = TileSet::Indoor;
        mission.baseDoom = {16, 14, 12};
        mission.goalTemplate = "Find the {item} and escape from {location}.";
        mission.specialRuleTemplate = "Exit spawns after key is found.";
        mission.victoryDescription = "Escape through the exit with the key";

        ObjectiveTemplate findKey = Objective("find_key", ObjectiveType::FindItem,
            "Search the {location} to find the {item} that unlocks the exit.", "Find the {item}");
        findKey.targetIdOptions = {"iron_key", "silver_key", "cursed_key", "skeleton_key"};
        findKey.rewardInsight = 1;

        ObjectiveTemplate findExit = Objective("find_exit", ObjectiveType::FindTile,
            "Locate the sealed exit door.", "Find the Exit");
        findExit.targetIdOptions = {"exit_door"};
        findExit.isHidden = true;
        findExit.revealedByIndex = 0;

        ObjectiveTemplate escape = Objective("escape", ObjectiveType::Escape,
            "Use the key to unlock the exit and escape.", "Escape");
        escape.targetIdOptions = {"exit_door"};
        escape.isHidden = true;
        escape.revealedByIndex = 1;

        mission.objectiveTemplates = {findKey, findExit, escape};
        RegisterMission(mission);
    }

    // === ASSASSINATION ===
    {
        MissionTemplate mission;
        mission.id = "assassination";
        mission.name = "Assassination";
        mission.victoryType = VictoryType::Assassination;
        mission.tileSet = TileSet::Mixed;
        mission.baseDoom = {14, 12, 10};
        mission.goalTemplate = "Find and kill the {target} before the ritual is complete.";
        mission.specialRuleTemplate = "Boss spawns when found. Enemies are alerted.";
        mission.victoryDescription = "Kill the target";

        ObjectiveTemplate intel = Objective("gather_intel", ObjectiveType::Collect,
            "Gather intelligence about the {target}'s location.", "Gather Intel (0/{count})");
        intel.targetIdOptions = {"intel_clue"};
        intel.targetAmount = AmountRange{2, 3};
        intel.rewardInsight = 1;

        ObjectiveTemplate findTarget = Objective("find_target", ObjectiveType::FindTile,
            "Locate the {target} in their sanctum.", "Find {target}");
        findTarget.targetIdOptions = {"ritual_chamber", "sanctum", "throne_room"};
        findTarget.isHidden = true;
        findTarget.revealedByIndex = 0;

        ObjectiveTemplate killTarget = Objective("kill_target", ObjectiveType::KillBoss,
            "Kill the {target} before they complete their dark work.", "Kill {target}");
        killTarget.targetIdOptions = {"priest", "boss"};
        killTarget.isHidden = true;
        killTarget.revealedByIndex = 1;

        mission.objectiveTemplates = {intel, findTarget, killTarget};
        RegisterMission(mission);
    }

    // === SURVIVAL ===
    {
        MissionTemplate mission;
        mission.id = "survival";
        mission.name = "Siege";
        mission.victoryType = VictoryType::Survival;
        mission.tileSet = TileSet::Mixed;
        mission.baseDoom = {14, 18, 22};
        mission.goalTemplate = "Survive for {rounds} rounds against waves of enemies.";
        mission.specialRuleTemplate = "Enemies spawn in waves. Barricades available.";
        mission.victoryDescription = "Survive the required number of rounds";

        ObjectiveTemplate half = Objective("survive_half", ObjectiveType::Survive,
            "Hold the line for the first {count} rounds.", "Survive {count} Rounds");
        half.targetAmount = AmountRange{5, 5};
        half.rewardInsight = 1;

        ObjectiveTemplate full = Objective("survive_full", ObjectiveType::Survive,
            "Endure the full assault for {total} rounds.", "Survive {total} Rounds");
        full.targetAmount = AmountRange{8, 10};
        full.isHidden = true;
        full.revealedByIndex = 0;

        mission.objectiveTemplates = {half, full};
        RegisterMission(mission);
    }

    // === COLLECTION ===
    {
        MissionTemplate mission;
        mission.id = "collection";
        mission.name = "Relic Hunt";
        mission.victoryType = VictoryType::Collection;
        mission.tileSet = TileSet::Mixed;
        mission.baseDoom = {16, 14, 12};
        mission.goalTemplate = "Collect {count} {items} before the enemy.";
        mission.specialRuleTemplate = "Items spawn at random explored locations.";
        mission.victoryDescription = "Collect all required items";

        ObjectiveTemplate collect = Objective("collect_items", ObjectiveType::Collect,
            "Search for the {count} scattered {items}.", "Collect {items} (0/{count})");
        collect.targetIdOptions = {"necro_page", "artifact_fragment", "seal_piece", "ritual_component"};
        collect.targetAmount = AmountRange{3, 5};
        collect.rewardInsight = 3;

        mission.objectiveTemplates = {collect};
        RegisterMission(mission);
    }

    // === RESCUE ===
    {
        MissionTemplate mission;
        mission.id = "rescue";
        mission.name = "Rescue";
        mission.victoryType = VictoryType::Escape;
        mission.tileSet = TileSet::Indoor;
        mission.baseDoom = {16, 14, 12};
        mission.goalTemplate = "Find {victim} and escort them to safety.";
        mission.specialRuleTemplate = "Victim has limited HP and must survive.";
        mission.victoryDescription = "Escort the victim to safety";
        mission.victimCanDie = true;

        ObjectiveTemplate entrance = Objective("find_entrance", ObjectiveType::FindTile,
            "Find the entrance to where {victim} is held.", "Find Entrance");
        entrance.targetIdOptions = {"catacomb_entrance", "dungeon_entrance", "basement_entrance"};

        ObjectiveTemplate victim = Objective("find_victim", ObjectiveType::FindTile,
            "Locate {victim} in the depths.", "Find {victim}");
        victim.targetIdOptions = {"prison_cell", "ritual_chamber", "holding_area"};
        victim.isHidden = true;
        victim.revealedByIndex = 0;
        victim.rewardInsight = 1;

        ObjectiveTemplate escort = Objective("escort", ObjectiveType::Escape,
            "Lead {victim} safely back to the exit.", "Escort to Safety");
        escort.targetIdOptions = {"exit"};
        escort.isHidden = true;
        escort.revealedByIndex = 1;

        mission.objectiveTemplates = {entrance, victim, escort};
        RegisterMission(mission);
    }

    // === INVESTIGATION ===
    {
        MissionTemplate mission;
        mission.id = "investigation";
        mission.name = "Investigation";
        mission.victoryType = VictoryType::Investigation;
        mission.tileSet = TileSet::Mixed;
        mission.baseDoom = {18, 16, 14};
        mission.goalTemplate = "Uncover the truth about {mystery}.";
        mission.specialRuleTemplate = "Clues reveal the final confrontation.";
        mission.victoryDescription = "Uncover and confront the truth";

        ObjectiveTemplate clues = Objective("gather_clues", ObjectiveType::Collect,
            "Investigate locations to gather clues about {mystery}.", "Gather Clues (0/{count})");
        clues.targetIdOptions = {"evidence_clue"};
        clues.targetAmount = AmountRange{3, 5};
        clues.rewardInsight = 2;

        ObjectiveTemplate confront = Objective("confront_truth", ObjectiveType::Interact,
            "Confront what you have discovered.", "Face the Truth");
        confront.targetIdOptions = {"final_confrontation"};
        confront.isHidden = true;
        confront.revealedByIndex = 0;

        mission.objectiveTemplates = {clues, confront};
        RegisterMission(mission);
    }

    // === COUNTER-RITUAL ===
    {
        MissionTemplate mission;
        mission.id = "ritual";
        mission.name = "Counter-Ritual";
        mission.victoryType = VictoryType::Ritual;
        mission.tileSet = TileSet::Indoor;
        mission.baseDoom = {14, 12, 10};
        mission.goalTemplate = "Perform the banishment ritual at {location}.";
        mission.specialRuleTemplate = "Ritual requires 3 components. Each component attracts enemies.";
        mission.victoryDescription = "Complete the banishment ritual";

        ObjectiveTemplate components = Objective("gather_components", ObjectiveType::Collect,
            "Gather the {count} ritual components needed for the banishment.", "Find Components (0/{count})");
        components.targetIdOptions = {"ritual_component"};
        components.targetAmount = AmountRange{3, 3};
        components.rewardInsight = 1;

        ObjectiveTemplate altar = Objective("find_altar", ObjectiveType::FindTile,
            "Locate the ritual altar where the banishment must be performed.", "Find the Altar");
        altar.targetIdOptions = {"sacrificial_altar", "ritual_altar", "altar_room"};
        altar.isHidden = true;
        altar.revealedByIndex = 0;

        ObjectiveTemplate perform = Objective("perform_ritual", ObjectiveType::Ritual,
            "Perform the banishment ritual.", "Complete Ritual");
        perform.isHidden = true;
        perform.revealedByIndex = 1;

        mission.objectiveTemplates = {components, altar, perform};
        RegisterMission(mission);
    }

    // === SEAL THE GATE ===
    {
        MissionTemplate mission;
        mission.id = "seal_portal";
        mission.name = "Seal the Gate";
        mission.victoryType = VictoryType::Ritual;
        mission.tileSet = TileSet::Mixed;
        mission.baseDoom = {14, 12, 10};
        mission.minimumDifficulty = Difficulty::Hard;
        mission.goalTemplate = "Place Elder Signs at {count} ritual points to seal the portal.";
        mission.specialRuleTemplate = "Each placement triggers enemy spawn.";
        mission.victoryDescription = "Seal the portal with Elder Signs";

        ObjectiveTemplate points = Objective("find_points", ObjectiveType::Explore,
            "Locate the {count} ritual binding points around the portal.", "Find Points (0/{count})");
        points.targetIdOptions = {"ritual_point"};
        points.targetAmount = AmountRange{3, 4};
        points.rewardInsight = 1;

        ObjectiveTemplate signs = Objective("place_signs", ObjectiveType::Interact,
            "Place Elder Signs at all ritual points.", "Place Signs (0/{count})");
        signs.targetIdOptions = {"elder_sign_placement"};
        signs.targetAmount = AmountRange{3, 4};
        signs.isHidden = true;
        signs.revealedByIndex = 0;

        mission.objectiveTemplates = {points, signs};
        RegisterMission(mission);
    }

    // === PURGE ===
    {
        MissionTemplate mission;
        mission.id = "purge";
        mission.name = "Purge";
        mission.victoryType = VictoryType::Assassination;
        mission.tileSet = TileSet::Indoor;
        mission.baseDoom = {16, 14, 12};
        mission.goalTemplate = "Cleanse {location} by destroying all {enemies}.";
        mission.specialRuleTemplate = "All enemies must be eliminated. No reinforcements.";
        mission.victoryDescription = "Eliminate all enemies";

        ObjectiveTemplate kill = Objective("kill_enemies", ObjectiveType::KillEnemy,
            "Destroy all {enemies} infesting {location}.", "Kill {enemies} (0/{count})");
        kill.targetIdOptions = {"ghoul", "cultist", "deepone"};
        kill.targetAmount = AmountRange{5, 8};

        ObjectiveTemplate cleanse = Objective("cleanse_area", ObjectiveType::KillEnemy,
            "Ensure the area is fully cleansed.", "Cleanse Complete");
        cleanse.targetIdOptions = {"any"};
        cleanse.targetAmount = AmountRange{0, 0};
        cleanse.isHidden = true;
        cleanse.revealedByIndex = 0;

        mission.objectiveTemplates = {kill, cleanse};
        RegisterMission(mission);
    }

    RegisterLocations();
    RegisterEnemies();
    RegisterNarrative();
    RegisterThemes();

    std::cout << "MissionCatalog: Registered " << m_missions.size() << " missions, "
              << m_locations.size() << " locations, " << m_bosses.size() << " bosses\n";
}

void MissionCatalog::RegisterMission(const MissionTemplate& mission)
{
    for (auto& existing : m_missions)
    {
        if (existing.id == mission.id)
        {
            std::cout << "MissionCatalog: WARNING - Mission with id '" << mission.id << "' already registered, overwriting\n";
            existing = mission;
            return;
        }
    }
    m_missions.push_back(mission);
}

void MissionCatalog::RegisterLocations()
{
    m_locations = {
        {"Blackwood Manor", TileSet::Indoor, Atmosphere::Creepy},
        {"Arkham Asylum", TileSet::Indoor, Atmosphere::Creepy},
        {"Miskatonic Library", TileSet::Indoor, Atmosphere::Academic},
        {"Abandoned Church", TileSet::Indoor, Atmosphere::Creepy},
        {"The Gilded Hotel", TileSet::Indoor, Atmosphere::Urban},
        {"Derelict Warehouse", TileSet::Indoor, Atmosphere::Industrial},
        {"The Witch House", TileSet::Indoor, Atmosphere::Creepy},
        {"Funeral Parlor", TileSet::Indoor, Atmosphere::Creepy},
        {"Old Hospital", TileSet::Indoor, Atmosphere::Creepy},
        {"Secret Crypt", TileSet::Indoor, Atmosphere::Creepy},

        {"Town Square", TileSet::Outdoor, Atmosphere::Urban},
        {"Old Cemetery", TileSet::Outdoor, Atmosphere::Creepy},
        {"Arkham Harbor", TileSet::Outdoor, Atmosphere::Industrial},
        {"University Campus", TileSet::Outdoor, Atmosphere::Academic},
        {"Industrial Quarter", TileSet::Outdoor, Atmosphere::Industrial},
        {"Blackwood Forest", TileSet::Outdoor, Atmosphere::Wilderness},
        {"Coastal Cliffs", TileSet::Outdoor, Atmosphere::Wilderness},
        {"Train Station", TileSet::Outdoor, Atmosphere::Urban},

        {"Police Station", TileSet::Mixed, Atmosphere::Urban},
        {"Merchant District", TileSet::Mixed, Atmosphere::Urban},
        {"Factory Gate", TileSet::Mixed, Atmosphere::Industrial},
        {"Cemetery Gate", TileSet::Mixed, Atmosphere::Creepy},
        {"Miskatonic Bridge", TileSet::Mixed, Atmosphere::Urban},
    };

    // First match wins; unmatched names fall back to the atmosphere.
    m_locationThemeKeywords = {
        {"manor", ScenarioTheme::Manor}, {"mansion", ScenarioTheme::Manor},
        {"house", ScenarioTheme::Manor}, {"hotel", ScenarioTheme::Manor},
        {"church", ScenarioTheme::Church}, {"chapel", ScenarioTheme::Church},
        {"asylum", ScenarioTheme::Asylum}, {"hospital", ScenarioTheme::Asylum},
        {"warehouse", ScenarioTheme::Warehouse}, {"factory", ScenarioTheme::Warehouse},
        {"industrial", ScenarioTheme::Warehouse},
        {"forest", ScenarioTheme::Forest}, {"woods", ScenarioTheme::Forest}, {"marsh", ScenarioTheme::Forest},
        {"library", ScenarioTheme::Academic}, {"university", ScenarioTheme::Academic},
        {"campus", ScenarioTheme::Academic},
        {"harbor", ScenarioTheme::Coastal}, {"coast", ScenarioTheme::Coastal},
        {"cliff", ScenarioTheme::Coastal}, {"dock", ScenarioTheme::Coastal},
        {"crypt", ScenarioTheme::Underground}, {"cave", ScenarioTheme::Underground},
        {"catacomb", ScenarioTheme::Underground}, {"sewer", ScenarioTheme::Underground},
    };
}

void MissionCatalog::RegisterEnemies()
{
    m_difficultyEnemies[static_cast<std::size_t>(Difficulty::Normal)] = {
        {"cultist", {2, 3}, "Cultists emerge from the shadows!"},
        {"ghoul", {1, 2}, "Hungry ghouls crawl from the darkness!"},
    };
    m_difficultyEnemies[static_cast<std::size_t>(Difficulty::Hard)] = {
        {"cultist", {2, 3}, "Cultists have found you!"},
        {"ghoul", {2, 3}, "A ghoul pack attacks!"},
        {"deepone", {1, 2}, "Deep Ones rise from the depths!"},
    };
    m_difficultyEnemies[static_cast<std::size_t>(Difficulty::Nightmare)] = {
        {"cultist", {3, 4}, "Cultists swarm your position!"},
        {"ghoul", {2, 3}, "A ghoul horde descends!"},
        {"deepone", {2, 3}, "Deep Ones breach the surface!"},
        {"mi-go", {1, 2}, "Mi-Go swoop from the darkness!"},
    };

    m_missionEnemies = {
        {"escape_manor", {{"nightgaunt", {1, 2}, "Nightgaunts glide after you in silence!"},
                          {"hound", {1, 2}, "Something howls from the angles of the room!"}}},
        {"rescue", {{"nightgaunt", {1, 2}, "Nightgaunts swoop down to reclaim their prisoner!"},
                    {"cultist", {2, 3}, "The jailers have noticed the intrusion!"}}},
        {"assassination", {{"cultist", {2, 3}, "The faithful rally to protect their master!"},
                           {"priest", {1, 1}, "A priest begins a warding chant!"}}},
        {"purge", {{"ghoul", {2, 3}, "More ghouls crawl out of the walls!"},
                   {"cultist", {2, 3}, "Cultists pour in from the cellar!"}}},
        {"survival", {{"ghoul", {2, 3}, "Another wave batters the barricades!"},
                      {"cultist", {2, 4}, "Torches gather outside. They are coming in!"}}},
        {"collection", {{"ghoul", {1, 2}, "Scavengers are drawn to the relics!"},
                        {"mi-go", {1, 2}, "Mi-Go descend to claim the fragments!"}}},
        {"investigation", {{"cultist", {1, 3}, "Someone wants this investigation to end!"},
                           {"byakhee", {1, 1}, "A Byakhee shrieks overhead!"}}},
        {"ritual", {{"cultist", {2, 3}, "The cult senses the counter-ritual!"},
                    {"deepone", {1, 2}, "Deep Ones answer the call of the rite!"}}},
        {"seal_portal", {{"byakhee", {1, 2}, "Byakhee pour through the widening rift!"},
                         {"formless_spawn", {1, 1}, "A formless thing oozes out of the portal!"}}},
    };

    m_atmosphereEnemies = {
        {Atmosphere::Creepy, {{"ghoul", {1, 2}, "Ghouls rise from beneath the floorboards!"},
                              {"nightgaunt", {1, 1}, "A nightgaunt unfolds from the dark!"}}},
        {Atmosphere::Urban, {{"cultist", {2, 3}, "Cultists step out of the crowd!"},
                             {"sniper", {1, 1}, "A rifle shot cracks from the rooftops!"}}},
        {Atmosphere::Wilderness, {{"hound", {1, 2}, "Hounds of Tindalos burst from the trees!"},
                                  {"moon_beast", {1, 1}, "A moon-beast lumbers out of the mist!"}}},
        {Atmosphere::Academic, {{"mi-go", {1, 2}, "Mi-Go come for the forbidden research!"},
                                {"formless_spawn", {1, 1}, "Something escapes from the archive vaults!"}}},
        {Atmosphere::Industrial, {{"deepone", {1, 2}, "Deep Ones climb out of the drains!"},
                                  {"cultist", {2, 3}, "Cult labourers drop their tools and attack!"}}},
    };

    m_bosses = {
        {"shoggoth", "Shoggoth", "A Shoggoth emerges! Tekeli-li!", Difficulty::Normal},
        {"dark_young", "Dark Young of Shub-Niggurath", "A Dark Young crashes through!", Difficulty::Hard},
        {"star_spawn", "Star Spawn of Cthulhu", "A Star Spawn descends!", Difficulty::Nightmare},
        {"hunting_horror", "Hunting Horror", "A Hunting Horror blocks the sky!", Difficulty::Nightmare},
    };
}

void MissionCatalog::RegisterNarrative()
{
    m_targetNames = {
        "Dark Priest", "High Cultist", "Warlock Theron", "The Hooded One",
        "Sister of the Sign", "Prophet of Y'golonac", "Keeper of the Gate",
    };
    m_victimNames = {
        "Professor Warren", "Dr. Armitage", "Agent Morrison", "Father Iwanicki",
        "Miss Tillinghast", "Young Thomas", "The Journalist",
    };
    m_mysteryNames = {
        "the Blackwood disappearances", "the Harbor murders", "the missing students",
        "the cult's true purpose", "the source of the nightmares", "the Innsmouth connection",
    };
    m_collectibles = {
        {"necro_page", "Necronomicon Page", "Necronomicon Pages"},
        {"artifact_fragment", "Artifact Fragment", "Artifact Fragments"},
        {"seal_piece", "Seal Piece", "Seal Pieces"},
        {"ritual_component", "Ritual Component", "Ritual Components"},
        {"elder_sign", "Elder Sign", "Elder Signs"},
        {"evidence_clue", "Evidence", "Pieces of Evidence"},
    };

    m_briefingOpenings = {
        "The telegram arrived at midnight, its words trembling in the candlelight.",
        "You knew this day would come. The signs have been mounting for weeks.",
        "Professor Armitage burst through your door, pale as death itself.",
        "The dream woke you again, the same vision of impossible geometry.",
        "The newspaper headline confirms your worst fears.",
        "A knock at the door. A stranger with hollow eyes hands you an envelope.",
        "The stars aligned three nights ago. Since then, nothing has been the same.",
        "You found the journal in the old bookshop. Its final entry is today's date.",
    };
    m_briefingMiddles = {
        {"escape", {"The doors have sealed themselves. The windows show only darkness. Something knows you are here.",
                    "You are trapped. Whatever force brought you here doesn't intend to let you leave.",
                    "Every exit is blocked by forces beyond understanding. Only one key can open the way out."}},
        {"assassination", {"The cult's leader must be stopped before the ritual is complete. There will be no trial, only cold steel.",
                           "They call him the Chosen One. Tonight, you will prove the stars chose wrong.",
                           "The high priest has evaded justice for too long. Tonight, justice finds him."}},
        {"survival", {"Wave after wave of horrors from beyond the veil. There is no escape, only survival.",
                      "Hold the line until dawn. If dawn ever comes.",
                      "They are coming. They will not stop. You must not fall."}},
        {"collection", {"The fragments are scattered across the city. Collect them before the enemy.",
                        "Each piece calls to the others. You can feel them pulling at your mind.",
                        "Pieces of a puzzle that should never have been separated."}},
        {"ritual", {"The banishment must be performed before the alignment completes.",
                    "Three components. One ritual. The fate of reality hangs in the balance.",
                    "The old rites can seal what has been opened. But at what cost?"}},
        {"rescue", {"They took someone important. The catacombs don't give up their prisoners easily.",
                    "Time is running out. Every moment in the darkness costs them more of their sanity.",
                    "Find them. Save them. Try not to join them in eternal imprisonment."}},
        {"investigation", {"The truth is buried beneath layers of lies and madness. Dig deep enough, and you might survive what you find.",
                           "Every clue leads deeper into the conspiracy. Some truths are better left unknown.",
                           "Connect the threads before you become another loose end."}},
    };
    m_briefingClosings[static_cast<std::size_t>(Difficulty::Normal)] = {
        "The investigation begins. May fortune favor the brave.",
        "Steel your nerves. The night is young.",
        "Time is short, but not yet critical. Move carefully.",
    };
    m_briefingClosings[static_cast<std::size_t>(Difficulty::Hard)] = {
        "The clock is ticking. There will be no second chances.",
        "Whatever awaits you down there isn't expecting company. Keep it that way.",
        "Failure is not an option. The cost is too high.",
    };
    m_briefingClosings[static_cast<std::size_t>(Difficulty::Nightmare)] = {
        "Some who enter will not return. Make your peace with that.",
        "The stars themselves conspire against you. Prove them wrong.",
        "This may be a one-way trip. Make it count.",
    };

    m_titleTemplates = {
        {"escape", {"Escape from {location}", "The {location} Trap", "No Exit at {location}", "Prisoner of {location}"}},
        {"assassination", {"The {target} Must Die", "Death to the {target}", "Hunt for the {target}", "Silencing the {target}"}},
        {"survival", {"The Siege of {location}", "Last Stand at {location}", "Night of Terror", "Hold the Line"}},
        {"collection", {"The {item} Hunt", "Scattered {items}", "Race for the {items}", "Gathering the {items}"}},
        {"rescue", {"Save {victim}", "The {victim} Rescue", "Into the Dark for {victim}", "No One Left Behind"}},
        {"ritual", {"The Banishment Rite", "Counter-Ritual", "Breaking the Seal", "The Final Incantation"}},
        {"investigation", {"The {mystery} Case", "Uncovering {mystery}", "The Truth About {mystery}", "Investigating {mystery}"}},
        {"seal_portal", {"Seal the Gate", "Closing the Rift", "The Elder Seal", "Binding the Portal"}},
        {"purge", {"Cleanse {location}", "Purge of {location}", "Extermination at {location}", "The {location} Purge"}},
    };
    m_defaultTitleTemplates = {"The {location} Incident"};

    m_bonusObjectives.clear();
    {
        ObjectiveTemplate journal = Objective("bonus_journal", ObjectiveType::Collect,
            "Find hidden journal pages scattered throughout.", "Find Journals (0/{count})");
        journal.targetIdOptions = {"journal_page"};
        journal.targetAmount = AmountRange{2, 4};
        journal.isOptional = true;
        journal.rewardInsight = 2;
        journal.rewardItemOptions = {"elder_sign", "occult_tome"};
        m_bonusObjectives.push_back(journal);

        ObjectiveTemplate elites = Objective("bonus_kill", ObjectiveType::KillEnemy,
            "Eliminate the elite guards.", "Kill Elites (0/{count})");
        elites.targetIdOptions = {"cultist", "ghoul"};
        elites.targetAmount = AmountRange{3, 5};
        elites.isOptional = true;
        elites.rewardInsight = 1;
        m_bonusObjectives.push_back(elites);

        ObjectiveTemplate artifact = Objective("bonus_artifact", ObjectiveType::FindItem,
            "Recover the lost artifact.", "Find Artifact");
        artifact.targetIdOptions = {"lost_artifact", "cursed_idol", "ancient_relic"};
        artifact.isOptional = true;
        artifact.isHidden = true;
        artifact.rewardItemOptions = {"elder_sign", "ritual_candles", "protective_ward"};
        m_bonusObjectives.push_back(artifact);

        ObjectiveTemplate explore = Objective("bonus_explore", ObjectiveType::Explore,
            "Fully explore the area.", "Explore All (0/{count})");
        explore.targetAmount = AmountRange{6, 10};
        explore.isOptional = true;
        explore.rewardInsight = 2;
        m_bonusObjectives.push_back(explore);
    }

    m_questItemTexts = {
        // Keys
        {"iron_key", {"Iron Key", "A heavy iron key, cold to the touch. It seems to absorb light."}},
        {"silver_key", {"Silver Key", "An ornate silver key with strange symbols etched into the bow."}},
        {"cursed_key", {"Cursed Key", "This key feels wrong. Holding it makes your hands tremble."}},
        {"skeleton_key", {"Skeleton Key", "A master key made from what appears to be actual bone."}},
        {"quest_key", {"Sealed Key", "The key that will unlock the way out. It pulses with faint energy."}},
        // Clues
        {"intel_clue", {"Cultist Note", "A scrap of paper with cryptic writings about the cult's activities."}},
        {"evidence_clue", {"Evidence", "Damning evidence of what has been happening here."}},
        {"investigation_clue", {"Investigation Clue", "A piece of the puzzle falls into place."}},
        {"artifact_clue", {"Ancient Inscription", "Weathered text that hints at the location of something powerful."}},
        // Collectibles
        {"necro_page", {"Necronomicon Page", "A page torn from the dread book. The text writhes before your eyes."}},
        {"artifact_fragment", {"Artifact Fragment", "Part of something greater. It hums with residual power."}},
        {"seal_piece", {"Seal Fragment", "A piece of an ancient seal. Perhaps it can be reassembled."}},
        {"ritual_component", {"Ritual Component", "An ingredient for dark rituals. Handle with care."}},
        {"journal_page", {"Journal Page", "A page from someone's private journal. The handwriting grows more frantic."}},
        // Special
        {"elder_sign", {"Elder Sign", "An ancient symbol of protection against the outer dark."}},
        {"barricade_supply", {"Barricade Supplies", "Boards, nails, and tools. Useful for fortification."}},
        {"occult_item", {"Occult Artifact", "An item of dark power. Its purpose is unclear."}},
    };
}

void MissionCatalog::RegisterThemes()
{
    auto makePrefs = [](std::vector<std::string> preferred,
                        std::vector<std::string> avoid,
                        std::vector<TileCategory> preferredCategories,
                        std::vector<TileCategory> avoidCategories,
                        FloorType floor,
                        TileSet natural)
    {
        ThemeTilePreferences prefs;
        prefs.preferredNames = std::move(preferred);
        prefs.avoidNames = std::move(avoid);
        prefs.preferredCategories = std::move(preferredCategories);
        prefs.avoidCategories = std::move(avoidCategories);
        prefs.floorPreference = floor;
        prefs.naturalTileSet = natural;
        return prefs;
    };

    m_themePreferences = {
        {ScenarioTheme::Manor, makePrefs(
            {"manor", "mansion", "study", "library", "bedroom", "dining", "gallery", "parlor", "foyer", "cellar", "wine"},
            {"sewer", "harbor", "industrial", "factory", "asylum", "cell"},
            {TileCategory::Foyer, TileCategory::Room, TileCategory::Stairs, TileCategory::Basement},
            {TileCategory::Street, TileCategory::Nature},
            FloorType::Wood, TileSet::Indoor)},
        {ScenarioTheme::Church, makePrefs(
            {"church", "chapel", "altar", "crypt", "vestibule", "bell", "sanctum", "tomb"},
            {"kitchen", "bedroom", "factory", "harbor", "sewer"},
            {TileCategory::Foyer, TileCategory::Room, TileCategory::Crypt},
            {TileCategory::Street, TileCategory::Urban},
            FloorType::Stone, TileSet::Indoor)},
        {ScenarioTheme::Asylum, makePrefs(
            {"asylum", "hospital", "cell", "ward", "corridor", "reception", "padded", "dissection", "records"},
            {"manor", "mansion", "forest", "harbor", "wine"},
            {TileCategory::Corridor, TileCategory::Room, TileCategory::Basement},
            {TileCategory::Nature},
            FloorType::Tile, TileSet::Indoor)},
        {ScenarioTheme::Warehouse, makePrefs(
            {"warehouse", "storage", "factory", "industrial", "boiler", "loading", "crate", "dock"},
            {"manor", "mansion", "church", "bedroom", "parlor", "forest"},
            {TileCategory::Room, TileCategory::Urban, TileCategory::Basement},
            {TileCategory::Crypt, TileCategory::Nature},
            FloorType::Stone, TileSet::Indoor)},
        {ScenarioTheme::Forest, makePrefs(
            {"forest", "clearing", "marsh", "path", "grove", "stones", "ruins", "cabin", "hollow"},
            {"asylum", "factory", "warehouse", "hospital", "cell"},
            {TileCategory::Nature},
            {TileCategory::Street, TileCategory::Urban, TileCategory::Corridor},
            FloorType::Dirt, TileSet::Outdoor)},
        {ScenarioTheme::Urban, makePrefs(
            {"street", "alley", "square", "market", "station", "bridge", "plaza", "precinct"},
            {"forest", "marsh", "cave", "crypt", "manor"},
            {TileCategory::Street, TileCategory::Urban, TileCategory::Facade},
            {TileCategory::Nature, TileCategory::Crypt},
            FloorType::Cobblestone, TileSet::Outdoor)},
        {ScenarioTheme::Coastal, makePrefs(
            {"harbor", "dock", "wharf", "lighthouse", "coastal", "cliff", "boat", "pier", "fishmarket"},
            {"forest", "manor", "asylum", "church"},
            {TileCategory::Street, TileCategory::Nature, TileCategory::Urban},
            {TileCategory::Crypt},
            FloorType::Cobblestone, TileSet::Outdoor)},
        {ScenarioTheme::Underground, makePrefs(
            {"crypt", "catacomb", "cave", "tunnel", "sewer", "cellar", "tomb", "pit", "altar", "portal"},
            {"street", "square", "market", "forest", "harbor"},
            {TileCategory::Crypt, TileCategory::Basement, TileCategory::Corridor},
            {TileCategory::Street, TileCategory::Nature, TileCategory::Facade},
            FloorType::Stone, TileSet::Indoor)},
        {ScenarioTheme::Academic, makePrefs(
            {"library", "university", "campus", "study", "laboratory", "lecture", "museum", "archive", "office"},
            {"sewer", "marsh", "harbor", "factory", "asylum"},
            {TileCategory::Room, TileCategory::Foyer, TileCategory::Urban},
            {TileCategory::Crypt},
            FloorType::Wood, TileSet::Mixed)},
    };

    m_defaultThemePreferences = ThemeTilePreferences{};
}

const MissionTemplate* MissionCatalog::GetMission(const std::string& id) const
{
    for (const auto& mission : m_missions)
    {
        if (mission.id == id)
        {
            return &mission;
        }
    }
    return nullptr;
}

std::vector<const MissionTemplate*> MissionCatalog::MissionsForDifficulty(Difficulty difficulty) const
{
    std::vector<const MissionTemplate*> out;
    for (const auto& mission : m_missions)
    {
        if (mission.AllowsDifficulty(difficulty))
        {
            out.push_back(&mission);
        }
    }
    return out;
}

std::vector<const LocationOption*> MissionCatalog::LocationsForTileSet(TileSet tileSet) const
{
    std::vector<const LocationOption*> out;
    for (const auto& location : m_locations)
    {
        if (tileSet == TileSet::Mixed || location.tileSet == tileSet)
        {
            out.push_back(&location);
        }
    }
    return out;
}

ScenarioTheme MissionCatalog::ThemeForLocation(const LocationOption& location) const
{
    const std::string name = ToLower(location.name);
    for (const auto& [keyword, theme] : m_locationThemeKeywords)
    {
        if (name.find(keyword) != std::string::npos)
        {
            return theme;
        }
    }

    switch (location.atmosphere)
    {
        case Atmosphere::Creepy: return ScenarioTheme::Manor;
        case Atmosphere::Urban: return ScenarioTheme::Urban;
        case Atmosphere::Wilderness: return ScenarioTheme::Forest;
        case Atmosphere::Academic: return ScenarioTheme::Academic;
        case Atmosphere::Industrial: return ScenarioTheme::Warehouse;
        default: return ScenarioTheme::Manor;
    }
}

std::vector<ScenarioTheme> MissionCatalog::ThemesForTileSet(TileSet tileSet) const
{
    static constexpr ScenarioTheme kAllThemes[] = {
        ScenarioTheme::Manor, ScenarioTheme::Church, ScenarioTheme::Asylum,
        ScenarioTheme::Warehouse, ScenarioTheme::Forest, ScenarioTheme::Urban,
        ScenarioTheme::Coastal, ScenarioTheme::Underground, ScenarioTheme::Academic,
    };

    std::vector<ScenarioTheme> out;
    for (const ScenarioTheme theme : kAllThemes)
    {
        const TileSet natural = ThemePreferences(theme).naturalTileSet;
        if (tileSet == TileSet::Mixed || natural == tileSet || natural == TileSet::Mixed)
        {
            out.push_back(theme);
        }
    }
    return out;
}

const ThemeTilePreferences& MissionCatalog::ThemePreferences(ScenarioTheme theme) const
{
    const auto it = m_themePreferences.find(theme);
    if (it != m_themePreferences.end())
    {
        return it->second;
    }
    return m_defaultThemePreferences;
}

int MissionCatalog::AtmosphereDoomAdjustment(Atmosphere atmosphere) const
{
    // Outdoor and research-heavy sites need more travel between leads.
    switch (atmosphere)
    {
        case Atmosphere::Wilderness: return 2;
        case Atmosphere::Academic: return 1;
        default: return 0;
    }
}

const std::vector<EnemySpawnConfig>& MissionCatalog::EnemiesForDifficulty(Difficulty difficulty) const
{
    return m_difficultyEnemies[static_cast<std::size_t>(difficulty)];
}

const std::vector<EnemySpawnConfig>& MissionCatalog::EnemiesForMission(const std::string& missionId) const
{
    const auto it = m_missionEnemies.find(missionId);
    return it != m_missionEnemies.end() ? it->second : EmptyEnemyPool();
}

const std::vector<EnemySpawnConfig>& MissionCatalog::EnemiesForAtmosphere(Atmosphere atmosphere) const
{
    const auto it = m_atmosphereEnemies.find(atmosphere);
    return it != m_atmosphereEnemies.end() ? it->second : EmptyEnemyPool();
}

std::vector<const BossConfig*> MissionCatalog::BossesForDifficulty(Difficulty difficulty) const
{
    std::vector<const BossConfig*> out;
    for (const auto& boss : m_bosses)
    {
        if (static_cast<int>(boss.difficulty) <= static_cast<int>(difficulty))
        {
            out.push_back(&boss);
        }
    }
    return out;
}

const BossConfig* MissionCatalog::GetBoss(const std::string& type) const
{
    for (const auto& boss : m_bosses)
    {
        if (boss.type == type)
        {
            return &boss;
        }
    }
    return nullptr;
}

const std::vector<std::string>& MissionCatalog::TitleTemplates(const MissionTemplate& mission) const
{
    auto it = m_titleTemplates.find(mission.id);
    if (it != m_titleTemplates.end())
    {
        return it->second;
    }
    it = m_titleTemplates.find(VictoryTypeToText(mission.victoryType));
    if (it != m_titleTemplates.end())
    {
        return it->second;
    }
    return m_defaultTitleTemplates;
}

const std::vector<std::string>& MissionCatalog::BriefingMiddles(const MissionTemplate& mission) const
{
    auto it = m_briefingMiddles.find(mission.id);
    if (it != m_briefingMiddles.end())
    {
        return it->second;
    }
    it = m_briefingMiddles.find(VictoryTypeToText(mission.victoryType));
    if (it != m_briefingMiddles.end())
    {
        return it->second;
    }
    return m_briefingMiddles.at("escape");
}

const std::vector<std::string>& MissionCatalog::BriefingClosings(Difficulty difficulty) const
{
    return m_briefingClosings[static_cast<std::size_t>(difficulty)];
}

QuestItemText MissionCatalog::QuestItemTextFor(const std::string& targetId) const
{
    const auto it = m_questItemTexts.find(targetId);
    if (it != m_questItemTexts.end())
    {
        return it->second;
    }
    return {"Mysterious Item", "An item of unknown purpose."};
}

int MissionCatalog::DoomOnDeath(Difficulty difficulty) const
{
    switch (difficulty)
    {
        case Difficulty::Normal: return -1;
        case Difficulty::Hard: return -2;
        case Difficulty::Nightmare: return -3;
        default: return -1;
    }
}

int MissionCatalog::DoomOnSurvivorRescue(Difficulty difficulty) const
{
    return difficulty == Difficulty::Nightmare ? 0 : 1;
}
} // namespace game::scenario
