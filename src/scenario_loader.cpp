/**
 * PvP Battle Simulator - Scenario Loader Implementation
 *
 * Parses scenario files using nlohmann/json. Combatant validation errors
 * and unknown move references are reported like JSON errors.
 */

#include "scenario_loader.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace pvpsim {

ScenarioLoader::ScenarioLoader() {}

bool ScenarioLoader::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[ScenarioLoader] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return load(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[ScenarioLoader] JSON parse error: " << e.what() << std::endl;
        return false;
    }
}

bool ScenarioLoader::load_from_string(const std::string& text) {
    try {
        json data = json::parse(text);
        return load(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[ScenarioLoader] JSON parse error: " << e.what() << std::endl;
        return false;
    }
}

bool ScenarioLoader::load(const json& data) {
    try {
        if (!data.contains("moves") || !data["moves"].is_array()) {
            std::cerr << "[ScenarioLoader] No 'moves' array found" << std::endl;
            return false;
        }
        if (!data.contains("combatants") || !data["combatants"].is_array()) {
            std::cerr << "[ScenarioLoader] No 'combatants' array found" << std::endl;
            return false;
        }

        std::unordered_map<MoveID, FastMove> fast_moves;
        std::unordered_map<MoveID, ChargedMove> charged_moves;
        for (const auto& move_json : data["moves"]) {
            parse_move(move_json, fast_moves, charged_moves);
        }

        std::vector<Combatant> combatants;
        for (const auto& combatant_json : data["combatants"]) {
            combatants.push_back(parse_combatant(combatant_json, fast_moves, charged_moves));
        }
        if (combatants.size() != 2) {
            std::cerr << "[ScenarioLoader] Expected 2 combatants, found "
                      << combatants.size() << std::endl;
            return false;
        }

        BattleConfig config;
        uint32_t seed = 0;
        if (data.contains("battle") && data["battle"].is_object()) {
            parse_battle(data["battle"], config, seed);
        }
        config.validate();

        fast_moves_ = std::move(fast_moves);
        charged_moves_ = std::move(charged_moves);
        combatants_ = std::move(combatants);
        config_ = std::move(config);
        seed_ = seed;

        std::cout << "[ScenarioLoader] Loaded " << move_count() << " moves, "
                  << combatants_[0].species_id << " vs " << combatants_[1].species_id
                  << std::endl;
        return true;

    } catch (const json::exception& e) {
        std::cerr << "[ScenarioLoader] JSON error: " << e.what() << std::endl;
        return false;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ScenarioLoader] Invalid scenario: " << e.what() << std::endl;
        return false;
    }
}

// ============================================================================
// PARSE HELPERS
// ============================================================================

PokemonType ScenarioLoader::require_type(const std::string& name) {
    auto type = parse_pokemon_type(name);
    if (!type) {
        throw std::invalid_argument("Unknown type: " + name);
    }
    return *type;
}

void ScenarioLoader::parse_move(const json& move_json,
                                std::unordered_map<MoveID, FastMove>& fast_moves,
                                std::unordered_map<MoveID, ChargedMove>& charged_moves) const {
    MoveID move_id = move_json.at("moveId").get<std::string>();
    std::string name = move_json.value("name", move_id);
    PokemonType type = require_type(move_json.value("type", "normal"));
    int power = move_json.value("power", 0);

    // Moves that generate energy are fast moves
    if (move_json.value("energyGain", 0) > 0) {
        fast_moves[move_id] = FastMove(move_id, name, type, power,
                                       move_json.at("energyGain").get<int>(),
                                       move_json.value("turns", 1));
        return;
    }

    ChargedMove move(move_id, name, type, power, move_json.value("energy", 0));

    if (move_json.contains("buffs") && move_json["buffs"].is_array()) {
        const auto& buffs = move_json["buffs"];
        if (buffs.size() != 2) {
            throw std::invalid_argument("Move " + move_id + " must list two buff multipliers");
        }
        move.buffs = {buffs[0].get<double>(), buffs[1].get<double>()};
        move.buff_chance = move_json.value("buffChance", 1.0);
    }

    std::string target = move_json.value("buffTarget", "self");
    if (target == "self") {
        move.buff_target = BuffTarget::SELF;
    } else if (target == "opponent") {
        move.buff_target = BuffTarget::OPPONENT;
    } else {
        throw std::invalid_argument("Move " + move_id + " has unknown buff target: " + target);
    }

    charged_moves[move_id] = std::move(move);
}

Combatant ScenarioLoader::parse_combatant(
    const json& combatant_json,
    const std::unordered_map<MoveID, FastMove>& fast_moves,
    const std::unordered_map<MoveID, ChargedMove>& charged_moves) const {

    SpeciesID species = combatant_json.at("speciesId").get<std::string>();

    const auto& stats_json = combatant_json.at("baseStats");
    Stats base{stats_json.at("atk").get<double>(),
               stats_json.at("def").get<double>(),
               stats_json.at("hp").get<double>()};

    std::array<PokemonType, 2> types = {PokemonType::NONE, PokemonType::NONE};
    if (combatant_json.contains("types") && combatant_json["types"].is_array()) {
        const auto& types_json = combatant_json["types"];
        for (size_t i = 0; i < types_json.size() && i < 2; i++) {
            types[i] = require_type(types_json[i].get<std::string>());
        }
    }

    MoveID fast_id = combatant_json.at("fastMove").get<std::string>();
    auto fast_it = fast_moves.find(fast_id);
    if (fast_it == fast_moves.end()) {
        throw std::invalid_argument("Combatant " + species + " references unknown fast move " + fast_id);
    }

    std::vector<ChargedMove> charged;
    if (combatant_json.contains("chargedMoves") && combatant_json["chargedMoves"].is_array()) {
        for (const auto& id_json : combatant_json["chargedMoves"]) {
            MoveID charged_id = id_json.get<std::string>();
            auto charged_it = charged_moves.find(charged_id);
            if (charged_it == charged_moves.end()) {
                throw std::invalid_argument("Combatant " + species +
                                            " references unknown charged move " + charged_id);
            }
            charged.push_back(charged_it->second);
        }
    }

    IVs ivs;
    if (combatant_json.contains("ivs") && combatant_json["ivs"].is_array()) {
        const auto& ivs_json = combatant_json["ivs"];
        if (ivs_json.size() != 3) {
            throw std::invalid_argument("Combatant " + species + " must list three IVs");
        }
        ivs = IVs{ivs_json[0].get<int>(), ivs_json[1].get<int>(), ivs_json[2].get<int>()};
    }

    ShadowType shadow = ShadowType::NORMAL;
    if (combatant_json.contains("shadowType")) {
        std::string shadow_name = combatant_json["shadowType"].get<std::string>();
        auto parsed = parse_shadow_type(shadow_name);
        if (!parsed) {
            throw std::invalid_argument("Combatant " + species + " has unknown shadow type " + shadow_name);
        }
        shadow = *parsed;
    }

    Combatant combatant(species, base, types, fast_it->second, std::move(charged),
                        ivs, combatant_json.value("level", 40.0), shadow);

    combatant.name = combatant_json.value("name", species);
    combatant.farm_energy = combatant_json.value("farmEnergy", false);
    combatant.bait_shields = combatant_json.value("baitShields", true);
    combatant.optimize_move_timing = combatant_json.value("optimizeMoveTiming", false);

    return combatant;
}

void ScenarioLoader::parse_battle(const json& battle_json, BattleConfig& config,
                                  uint32_t& seed) const {
    if (battle_json.contains("shields")) {
        const auto& shields = battle_json["shields"];
        if (shields.is_array() && shields.size() == 2) {
            config.shields = {shields[0].get<int>(), shields[1].get<int>()};
        } else {
            int count = shields.get<int>();
            config.shields = {count, count};
        }
    }

    if (battle_json.contains("startingEnergy")) {
        const auto& energy = battle_json["startingEnergy"];
        config.starting_energy = {energy.at(0).get<int>(), energy.at(1).get<int>()};
    }

    config.max_turns = battle_json.value("maxTurns", DEFAULT_MAX_TURNS);
    config.record_timeline = battle_json.value("timeline", false);
    seed = battle_json.value("seed", 0u);

    if (battle_json.contains("modes") && battle_json["modes"].is_array()) {
        const auto& modes = battle_json["modes"];
        for (size_t i = 0; i < modes.size() && i < 2; i++) {
            std::string mode_name = modes[i].get<std::string>();
            auto mode = parse_decision_mode(mode_name);
            if (!mode) {
                throw std::invalid_argument("Unknown decision mode: " + mode_name);
            }
            config.modes[i] = *mode;
        }
    }

    if (battle_json.contains("policy") && battle_json["policy"].is_object()) {
        parse_policy(battle_json["policy"], config.policy);
    }
}

void ScenarioLoader::parse_policy(const json& policy_json, ActionPolicy& policy) const {
    policy.bait_dpe_ratio = policy_json.value("baitDpeRatio", policy.bait_dpe_ratio);
    policy.shield_bait_weight = policy_json.value("shieldBaitWeight", policy.shield_bait_weight);
    policy.farm_completion_weight =
        policy_json.value("farmCompletionWeight", policy.farm_completion_weight);
    policy.farm_completion_margin =
        policy_json.value("farmCompletionMargin", policy.farm_completion_margin);
    policy.deferral_energy_factor =
        policy_json.value("deferralEnergyFactor", policy.deferral_energy_factor);
    policy.self_buff_energy_margin =
        policy_json.value("selfBuffEnergyMargin", policy.self_buff_energy_margin);
    policy.similar_energy_window =
        policy_json.value("similarEnergyWindow", policy.similar_energy_window);
    policy.substantial_health_ratio =
        policy_json.value("substantialHealthRatio", policy.substantial_health_ratio);
    policy.low_health_bait_ratio =
        policy_json.value("lowHealthBaitRatio", policy.low_health_bait_ratio);
    policy.low_health_bait_energy =
        policy_json.value("lowHealthBaitEnergy", policy.low_health_bait_energy);
    policy.max_search_states = policy_json.value("maxSearchStates", policy.max_search_states);
    policy.viable_tolerance = policy_json.value("viableTolerance", policy.viable_tolerance);
}

// ============================================================================
// LOOKUP
// ============================================================================

const FastMove* ScenarioLoader::get_fast_move(const MoveID& move_id) const {
    auto it = fast_moves_.find(move_id);
    if (it == fast_moves_.end()) {
        return nullptr;
    }
    return &it->second;
}

const ChargedMove* ScenarioLoader::get_charged_move(const MoveID& move_id) const {
    auto it = charged_moves_.find(move_id);
    if (it == charged_moves_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool ScenarioLoader::has_move(const MoveID& move_id) const {
    return fast_moves_.count(move_id) > 0 || charged_moves_.count(move_id) > 0;
}

Battle ScenarioLoader::create_battle() const {
    if (combatants_.size() < 2) {
        throw std::invalid_argument("No scenario loaded");
    }
    return Battle(combatants_[0], combatants_[1], config_);
}

} // namespace pvpsim
