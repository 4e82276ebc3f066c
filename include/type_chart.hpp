/**
 * PvP Battle Simulator - Type Effectiveness
 *
 * Static multiplicative type chart. Multipliers for a dual-type defender
 * combine by product; an absent secondary type is neutral.
 */

#pragma once

#include "types.hpp"
#include <array>

namespace pvpsim {

constexpr double SUPER_EFFECTIVE = 1.6;
constexpr double NEUTRAL = 1.0;
constexpr double NOT_VERY_EFFECTIVE = 0.625;
constexpr double DOUBLE_RESIST = 0.390625;

/**
 * Multiplier for a single attacking type against a single defending type.
 * NONE on either side is neutral.
 */
double type_multiplier(PokemonType attacker, PokemonType defender);

/**
 * Multiplier for an attacking type against a defending type pair.
 *
 * @param attacker Type of the incoming move
 * @param primary Defender's first type
 * @param secondary Defender's second type (NONE when absent)
 */
double type_effectiveness(PokemonType attacker, PokemonType primary,
                          PokemonType secondary = PokemonType::NONE);

/**
 * Effectiveness of every attacking type against one defending pair,
 * indexed by type_index().
 */
std::array<double, TYPE_COUNT> all_type_effectiveness(PokemonType primary,
                                                      PokemonType secondary = PokemonType::NONE);

} // namespace pvpsim
