/**
 * PvP Battle Simulator - Move Selection Search
 *
 * Short-horizon lookahead over charged-move sequences. States live in an
 * arena and are processed through a turn-ordered frontier; the search is
 * bounded by a state budget and returns its best line by value.
 *
 * Also hosts the bait/farm, self-debuff deferral and move reordering rules
 * that shape which sequences the search considers and how the result is
 * ordered.
 */

#pragma once

#include "combatant.hpp"
#include <vector>

namespace pvpsim {

/**
 * Tunable behavioural constants for the decision engine.
 */
struct ActionPolicy {
    double bait_dpe_ratio = 1.5;           // costlier/cheaper dpe above this: no baiting
    double shield_bait_weight = 1.3;       // move predicted to draw a shield
    double farm_completion_weight = 1.2;   // most expensive move almost charged
    int farm_completion_margin = 5;
    double deferral_energy_factor = 2.0;   // x most expensive cost, capped at 100
    int self_buff_energy_margin = 10;
    int similar_energy_window = 10;
    double substantial_health_ratio = 0.5;
    double low_health_bait_ratio = 0.25;
    int low_health_bait_energy = 70;
    int max_search_states = 500;
    double viable_tolerance = 0.05;

    /** @throws std::invalid_argument on out-of-range values */
    void validate() const;
};

/**
 * One node of the lookahead. `moves` lists charged move indices thrown so
 * far; `buffs` is the attack stage gained along the way.
 */
struct BattleState {
    int energy = 0;
    int opp_health = 0;
    int turn = 0;
    int opp_shields = 0;
    std::vector<size_t> moves;
    int buffs = 0;
    double chance = 1.0;
};

using StateKey = uint16_t;

constexpr size_t MAX_ARENA_STATES = 4096;

/**
 * Which charged moves are worth working toward from a given energy and
 * shield situation.
 */
struct BaitPlan {
    std::vector<size_t> moves;
    bool build_energy = false;  // nothing in `moves` is affordable: keep farming
    std::string reason;
};

struct SearchResult {
    std::vector<size_t> sequence;  // best line; front is the move to work toward now
    double value = 0.0;            // weight / expected turns to KO
    double expected_turns = 0.0;
    int states_evaluated = 0;

    bool found() const { return !sequence.empty(); }
};

// ============================================================================
// EFFICIENCY
// ============================================================================

/**
 * dpe(costly) / dpe(cheap) using actual damage against the opponent.
 * Returns 0 when the cheaper move deals no damage per energy.
 */
double dpe_ratio(const Combatant& poke, const Combatant& opponent,
                 const ChargedMove& cheap, const ChargedMove& costly);

// ============================================================================
// POLICY RULES
// ============================================================================

/**
 * Bait and farm rules applied to a candidate set at a given energy and
 * opponent shield count.
 *
 * Baiting (cheaper move first) applies when the combatant baits, the
 * opponent holds shields and the cheaper move is not drastically less
 * efficient. A drastically better costlier move, or the farm energy flag,
 * narrows the set to the costliest move.
 */
BaitPlan plan_bait(const Combatant& poke, const Combatant& opponent,
                   const std::vector<size_t>& candidates,
                   int energy, int opp_shields, const ActionPolicy& policy);

/**
 * True when a self-debuffing move should be held back this turn: no shields
 * left, low energy, and the opponent can fire its strongest move unshielded.
 */
bool should_defer_self_debuffing(const Combatant& poke, const Combatant& opponent,
                                 const ChargedMove& move, const ActionPolicy& policy);

/**
 * Multiplicative preference for throwing `move_index` first. A move predicted
 * to draw a shield and a costliest move within reach of its cost are both
 * boosted; the boosts stack.
 */
double bait_weight(const Combatant& poke, const Combatant& opponent, size_t move_index,
                   int energy, int opp_shields, const ActionPolicy& policy);

// ============================================================================
// SEARCH
// ============================================================================

/**
 * Explore charged-move sequences toward knocking out the opponent.
 *
 * @param root_moves Indices allowed as the first move (after deferral)
 * @param rng Used only to pick among several viable first moves
 */
SearchResult search_move_sequence(const Combatant& poke, const Combatant& opponent,
                                  const std::vector<size_t>& root_moves,
                                  const ActionPolicy& policy, Rng& rng);

/**
 * Reorder the distinct moves of a search line.
 *
 * Opponent shieldless: strongest first. Otherwise cheapest first. Self-debuffing moves yield to comparable alternatives while both
 * sides are healthy, and near-equal costs prefer the better dpe.
 *
 * @param candidates Other moves that may be swapped in
 */
std::vector<size_t> reorder_moves(const Combatant& poke, const Combatant& opponent,
                                  const std::vector<size_t>& sequence,
                                  const std::vector<size_t>& candidates,
                                  const ActionPolicy& policy);

} // namespace pvpsim
