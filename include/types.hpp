/**
 * PvP Battle Simulator - Core Type Definitions
 *
 * This file defines all enums and basic types used throughout the simulator.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

namespace pvpsim {

// ============================================================================
// ENUMS
// ============================================================================

enum class PokemonType : uint8_t {
    NORMAL,
    FIRE,
    WATER,
    ELECTRIC,
    GRASS,
    ICE,
    FIGHTING,
    POISON,
    GROUND,
    FLYING,
    PSYCHIC,
    BUG,
    ROCK,
    GHOST,
    DRAGON,
    DARK,
    STEEL,
    FAIRY,
    NONE  // Absent secondary type
};

constexpr int TYPE_COUNT = 18;

enum class BuffTarget : uint8_t {
    SELF,
    OPPONENT
};

enum class ShadowType : uint8_t {
    NORMAL,
    SHADOW,
    PURIFIED
};

enum class ActionType : uint8_t {
    FAST,
    CHARGED,
    WAIT
};

enum class DecisionMode : uint8_t {
    STRATEGIC,  // Full heuristic policy with lookahead search
    RANDOM      // Uniform choice among legal actions
};

enum class BattleWinner : uint8_t {
    PLAYER_0,
    PLAYER_1,
    DRAW
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using MoveID = std::string;
using SpeciesID = std::string;
using SideIndex = uint8_t;
using Rng = std::mt19937;

// ============================================================================
// CONSTANTS
// ============================================================================

constexpr int MAX_ENERGY = 100;
constexpr int MIN_BUFF_STAGE = -4;
constexpr int MAX_BUFF_STAGE = 4;
constexpr int TURN_DURATION_MS = 500;
constexpr int DEFAULT_SHIELDS = 2;
constexpr int DEFAULT_MAX_TURNS = 480;  // 240 seconds
constexpr int SHIELDED_DAMAGE = 1;
constexpr double STAB_MULTIPLIER = 1.2;
constexpr double SHADOW_ATK_MULTIPLIER = 1.2;
constexpr double SHADOW_DEF_MULTIPLIER = 0.833333;

// ============================================================================
// HELPERS
// ============================================================================

std::string to_string(PokemonType type);
std::string to_string(ActionType type);
std::string to_string(BattleWinner winner);
std::string to_string(DecisionMode mode);

/**
 * Parse a lowercase or uppercase type name ("water", "WATER").
 * Returns nullopt for unknown names. "none" and "" parse to NONE.
 */
std::optional<PokemonType> parse_pokemon_type(const std::string& name);

std::optional<ShadowType> parse_shadow_type(const std::string& name);
std::optional<DecisionMode> parse_decision_mode(const std::string& name);

inline int type_index(PokemonType type) {
    return static_cast<int>(type);
}

} // namespace pvpsim
