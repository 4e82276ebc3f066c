/**
 * PvP Battle Simulator - Damage Calculator Implementation
 */

#include "damage_calculator.hpp"
#include "type_chart.hpp"
#include <algorithm>
#include <cmath>

namespace pvpsim {

double stage_multiplier(int stage) {
    stage = clamp_stage(stage);
    if (stage > 0) {
        return std::max(2, 2 + stage) / 2.0;
    }
    if (stage < 0) {
        return 2.0 / std::max(2, 2 - stage);
    }
    return 1.0;
}

double effective_attack(const Combatant& combatant, int attack_stage) {
    return combatant.calculate_stats().atk * stage_multiplier(attack_stage);
}

double effective_attack(const Combatant& combatant) {
    return effective_attack(combatant, combatant.stat_buffs[0]);
}

double effective_defense(const Combatant& combatant, int defense_stage) {
    return combatant.calculate_stats().def * stage_multiplier(defense_stage);
}

double effective_defense(const Combatant& combatant) {
    return effective_defense(combatant, combatant.stat_buffs[1]);
}

int calculate_damage(const Combatant& attacker, const Combatant& defender,
                     int power, PokemonType move_type,
                     int attack_stage, int defense_stage) {
    double attack = effective_attack(attacker, attack_stage);
    double defense = effective_defense(defender, defense_stage);
    if (defense <= 0.0) {
        return 1;
    }

    double effectiveness = type_effectiveness(move_type, defender.types[0], defender.types[1]);
    double stab = attacker.has_type(move_type) ? STAB_MULTIPLIER : 1.0;

    return static_cast<int>(std::floor(0.5 * power * (attack / defense) * effectiveness * stab)) + 1;
}

int calculate_damage(const Combatant& attacker, const Combatant& defender,
                     const FastMove& move) {
    return calculate_damage(attacker, defender, move.power, move.type,
                            attacker.stat_buffs[0], defender.stat_buffs[1]);
}

int calculate_damage(const Combatant& attacker, const Combatant& defender,
                     const ChargedMove& move) {
    return calculate_damage(attacker, defender, move.power, move.type,
                            attacker.stat_buffs[0], defender.stat_buffs[1]);
}

int calculate_damage_at_stage(const Combatant& attacker, const Combatant& defender,
                              const ChargedMove& move, int attack_stage) {
    return calculate_damage(attacker, defender, move.power, move.type,
                            attack_stage, defender.stat_buffs[1]);
}

double damage_per_energy(const Combatant& attacker, const Combatant& defender,
                         const ChargedMove& move) {
    if (move.energy_cost <= 0) {
        return 0.0;
    }
    return static_cast<double>(calculate_damage(attacker, defender, move)) / move.energy_cost;
}

int battle_rating(int own_hp, int own_max_hp, int opponent_hp, int opponent_max_hp) {
    double own_fraction = own_max_hp > 0 ? static_cast<double>(own_hp) / own_max_hp : 0.0;
    double dealt_fraction = opponent_max_hp > 0
        ? static_cast<double>(opponent_max_hp - opponent_hp) / opponent_max_hp
        : 0.0;

    int rating = static_cast<int>(std::floor(500.0 * (own_fraction + dealt_fraction)));
    return std::clamp(rating, 0, 1000);
}

} // namespace pvpsim
