/**
 * PvP Battle Simulator - Combatant
 *
 * A configured battler plus its mutable in-battle state. Owned by exactly
 * one Battle during simulation.
 */

#pragma once

#include "move.hpp"
#include <vector>

namespace pvpsim {

constexpr double MIN_LEVEL = 1.0;
constexpr double MAX_LEVEL = 51.0;
constexpr int MAX_IV = 15;
constexpr size_t MAX_CHARGED_MOVES = 2;

struct Stats {
    double atk = 0.0;
    double def = 0.0;
    double hp = 0.0;
};

struct IVs {
    int atk = 0;
    int def = 0;
    int hp = 0;
};

/**
 * CP multiplier for a level in [1, 51]. Half levels are exact table
 * entries; anything in between is interpolated. Returns 0 out of range.
 */
double cp_multiplier(double level);

/**
 * Combatant - stats, moves, behaviour flags and battle state.
 *
 * Plain data with public fields so decision and damage logic can run
 * against minimal fixtures. The full constructor validates; fixtures
 * built field by field are validated when handed to a Battle.
 */
struct Combatant {
    // ========================================================================
    // CONFIGURATION
    // ========================================================================

    SpeciesID species_id;
    std::string name;
    Stats base_stats;
    std::array<PokemonType, 2> types = {PokemonType::NORMAL, PokemonType::NONE};
    IVs ivs;
    double level = 40.0;
    ShadowType shadow_type = ShadowType::NORMAL;

    FastMove fast_move;
    std::vector<ChargedMove> charged_moves;  // 0-2 entries

    bool farm_energy = false;
    bool bait_shields = true;
    bool optimize_move_timing = false;

    // ========================================================================
    // BATTLE STATE
    // ========================================================================

    int current_hp = 0;
    int energy = 0;
    int shields = 0;
    std::array<int, 2> stat_buffs = {0, 0};  // attack, defense stages
    int cooldown = 0;                        // ms left on the fast move in progress
    SideIndex index = 0;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Combatant() = default;

    /**
     * Build and validate a combatant at full health.
     *
     * @throws std::invalid_argument on any invalid configuration
     */
    Combatant(SpeciesID species, Stats base, std::array<PokemonType, 2> combatant_types,
              FastMove fast, std::vector<ChargedMove> charged,
              IVs combatant_ivs = IVs{}, double combatant_level = 40.0,
              ShadowType shadow = ShadowType::NORMAL);

    /**
     * Check configuration and state invariants.
     *
     * @throws std::invalid_argument describing the first violation
     */
    void validate() const;

    /** Configuration-only subset of validate() (stats, IVs, level, moves). */
    void validate_configuration() const;

    /** Restore full health and clear buffs and cooldown. */
    void reset(int starting_shields = DEFAULT_SHIELDS, int starting_energy = 0);

    // ========================================================================
    // DERIVED STATS
    // ========================================================================

    /** Level-scaled stats including shadow modifiers, without buff stages. */
    Stats calculate_stats() const;

    int max_hp() const;
    int calculate_cp() const;

    double hp_ratio() const;

    bool has_type(PokemonType type) const {
        return type != PokemonType::NONE && (types[0] == type || types[1] == type);
    }

    bool is_fainted() const { return current_hp <= 0; }

    // ========================================================================
    // MOVE QUERIES
    // ========================================================================

    bool can_afford(const ChargedMove& move) const { return energy >= move.energy_cost; }

    /** Index of the cheapest charged move (first on ties), nullopt if none. */
    std::optional<size_t> cheapest_move_index() const;

    /** Index of the most expensive charged move (first on ties), nullopt if none. */
    std::optional<size_t> most_expensive_move_index() const;

    /** Energy + amount, capped at MAX_ENERGY. */
    void gain_energy(int amount);

    /** Apply stage deltas, clamping each stat to [-4, 4]. */
    void apply_stage_delta(int attack_delta, int defense_delta);

    /** Subtract damage, flooring health at 0. */
    void take_damage(int damage);
};

} // namespace pvpsim
