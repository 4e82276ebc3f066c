/**
 * PvP Battle Simulator - Damage Calculator
 *
 * Single-attack damage, stage multipliers and the final battle rating.
 */

#pragma once

#include "combatant.hpp"

namespace pvpsim {

/**
 * Multiplier for a buff stage. Stage is clamped to [-4, 4] first.
 *
 * Positive: max(2, 2 + s) / 2. Negative: 2 / max(2, 2 - s).
 */
double stage_multiplier(int stage);

/** Attack after level, shadow and buff stage scaling. */
double effective_attack(const Combatant& combatant, int attack_stage);
double effective_attack(const Combatant& combatant);

/** Defense after level, shadow and buff stage scaling. */
double effective_defense(const Combatant& combatant, int defense_stage);
double effective_defense(const Combatant& combatant);

/**
 * Raw (unshielded) damage of one attack.
 *
 * floor(0.5 * power * atk / def * effectiveness * stab) + 1
 *
 * Explicit stages let the lookahead evaluate hypothetical buff states.
 */
int calculate_damage(const Combatant& attacker, const Combatant& defender,
                     int power, PokemonType move_type,
                     int attack_stage, int defense_stage);

int calculate_damage(const Combatant& attacker, const Combatant& defender,
                     const FastMove& move);

int calculate_damage(const Combatant& attacker, const Combatant& defender,
                     const ChargedMove& move);

/** Charged move damage with the attacker at a hypothetical attack stage. */
int calculate_damage_at_stage(const Combatant& attacker, const Combatant& defender,
                              const ChargedMove& move, int attack_stage);

/** Damage dealt by a charged move after the shield decision. */
inline int resolve_charged_damage(int raw_damage, bool shielded) {
    return shielded ? SHIELDED_DAMAGE : raw_damage;
}

/** Actual damage per energy against a specific defender. 0 for free moves. */
double damage_per_energy(const Combatant& attacker, const Combatant& defender,
                         const ChargedMove& move);

/**
 * Rating for side 0 in [0, 1000].
 *
 * 500 * (own remaining health fraction + fraction of opponent health removed).
 * Side 1 receives 1000 minus this value.
 */
int battle_rating(int own_hp, int own_max_hp, int opponent_hp, int opponent_max_hp);

} // namespace pvpsim
