/**
 * PvP Battle Simulator - Shield Decision
 *
 * Heuristic deciding whether a defender spends a shield on an incoming
 * charged move. Besides the boolean it reports two weights, used for
 * randomized shielding and as shield probabilities in the lookahead.
 */

#pragma once

#include "combatant.hpp"

namespace pvpsim {

struct ShieldDecision {
    bool value = false;
    int shield_weight = 1;
    int no_shield_weight = 2;

    /** shield_weight / (shield_weight + no_shield_weight), 0 when both are 0. */
    double shield_probability() const {
        int total = shield_weight + no_shield_weight;
        if (total <= 0) return 0.0;
        return static_cast<double>(shield_weight) / total;
    }
};

/**
 * Decide whether `defender` shields `move` thrown by `attacker`.
 *
 * A defender without shields never shields (value false, shield weight 0).
 *
 * @param defender_shields Shields the defender is assumed to hold
 */
ShieldDecision would_shield(const Combatant& attacker, const Combatant& defender,
                            const ChargedMove& move, int defender_shields);

/** Same as above using the defender's current shield count. */
ShieldDecision would_shield(const Combatant& attacker, const Combatant& defender,
                            const ChargedMove& move);

} // namespace pvpsim
