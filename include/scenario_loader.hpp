/**
 * PvP Battle Simulator - Scenario Loader
 *
 * Reads a battle scenario from JSON: move templates, two combatants and
 * the battle settings. Moves are listed once and referenced by id.
 */

#pragma once

#include "battle.hpp"
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace pvpsim {

/**
 * ScenarioLoader - move lookup plus one configured matchup.
 *
 * A failed load leaves the previously loaded scenario untouched.
 */
class ScenarioLoader {
public:
    ScenarioLoader();
    ~ScenarioLoader() = default;

    /**
     * Load a scenario from a JSON file.
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Load a scenario from JSON text.
     */
    bool load_from_string(const std::string& text);

    /**
     * Get a move template by ID.
     *
     * Returns nullptr if the move is not found.
     */
    const FastMove* get_fast_move(const MoveID& move_id) const;
    const ChargedMove* get_charged_move(const MoveID& move_id) const;

    bool has_move(const MoveID& move_id) const;

    size_t move_count() const { return fast_moves_.size() + charged_moves_.size(); }

    const std::vector<Combatant>& combatants() const { return combatants_; }
    const BattleConfig& config() const { return config_; }
    uint32_t seed() const { return seed_; }

    /**
     * Build a Battle from the loaded combatants and settings.
     *
     * @throws std::invalid_argument if fewer than two combatants are loaded
     */
    Battle create_battle() const;

private:
    std::unordered_map<MoveID, FastMove> fast_moves_;
    std::unordered_map<MoveID, ChargedMove> charged_moves_;
    std::vector<Combatant> combatants_;
    BattleConfig config_;
    uint32_t seed_ = 0;

    bool load(const nlohmann::json& data);

    // Parse helpers (throw on malformed entries)
    void parse_move(const nlohmann::json& move_json,
                    std::unordered_map<MoveID, FastMove>& fast_moves,
                    std::unordered_map<MoveID, ChargedMove>& charged_moves) const;
    Combatant parse_combatant(const nlohmann::json& combatant_json,
                              const std::unordered_map<MoveID, FastMove>& fast_moves,
                              const std::unordered_map<MoveID, ChargedMove>& charged_moves) const;
    void parse_battle(const nlohmann::json& battle_json, BattleConfig& config, uint32_t& seed) const;
    void parse_policy(const nlohmann::json& policy_json, ActionPolicy& policy) const;

    static PokemonType require_type(const std::string& name);
};

} // namespace pvpsim
