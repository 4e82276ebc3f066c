/**
 * PvP Battle Simulator - Shield Decision Implementation
 */

#include "shield_logic.hpp"
#include "damage_calculator.hpp"
#include <algorithm>
#include <cmath>

namespace pvpsim {

ShieldDecision would_shield(const Combatant& attacker, const Combatant& defender,
                            const ChargedMove& move, int defender_shields) {
    ShieldDecision decision;

    if (defender_shields <= 0) {
        decision.value = false;
        decision.shield_weight = 0;
        return decision;
    }

    int hp = defender.current_hp;
    int damage = calculate_damage(attacker, defender, move);
    int post_move_hp = hp - damage;

    // Damage the attacker can deal before the defender gets to shield again
    const FastMove& fast = attacker.fast_move;
    int fast_damage = calculate_damage(attacker, defender, fast);
    int leftover_energy = std::max(attacker.energy - move.energy_cost, 0);
    int energy_needed = std::max(move.energy_cost - leftover_energy, 0);
    int gain = std::max(fast.energy_gain, 1);
    int fast_attacks = (energy_needed + gain - 1) / gain + 1;
    int cycle_damage = (fast_attacks * fast_damage + 1) * defender_shields;

    if (post_move_hp <= cycle_damage) {
        decision.value = true;
        decision.shield_weight = 2;
    }

    // Follow-up moves hit harder if this move boosts the attacker for certain
    int attack_stage = attacker.stat_buffs[0];
    if (move.buff_target == BuffTarget::SELF && move.buff_chance >= 1.0) {
        attack_stage = clamp_stage(attack_stage + move.attack_stage_delta());
    }

    double fast_dpt = static_cast<double>(fast_damage) / std::max(fast.turns, 1);

    for (const auto& charged : attacker.charged_moves) {
        int charged_damage = calculate_damage_at_stage(attacker, defender, charged, attack_stage);

        if (charged_damage >= hp / 1.4 && fast_dpt > 1.5) {
            decision.value = true;
            decision.shield_weight = 4;
        }

        if (charged_damage >= hp - cycle_damage) {
            decision.value = true;
            decision.shield_weight = 4;
        }

        if (charged_damage >= hp / 2.0 && fast_dpt > 2.0) {
            decision.shield_weight = 12;
        }
    }

    // Block the first of a chain of attack-lowering nukes when it hurts
    if (move.is_self_attack_debuffing() && hp > 0 &&
        static_cast<double>(damage) / hp > 0.55) {
        decision.value = true;
        decision.shield_weight = std::max(decision.shield_weight, 4);
    }

    if (damage >= hp) {
        decision.value = true;
        decision.shield_weight = std::max(decision.shield_weight, 4);
    }

    return decision;
}

ShieldDecision would_shield(const Combatant& attacker, const Combatant& defender,
                            const ChargedMove& move) {
    return would_shield(attacker, defender, move, defender.shields);
}

} // namespace pvpsim
