/**
 * PvP Battle Simulator - Action Decision Engine
 *
 * Per-turn policy for a READY combatant: lethal and survival checks, move
 * timing, self-debuff deferral and energy stacking around the lookahead
 * search. Every path falls back to the fast move.
 */

#pragma once

#include "move_search.hpp"
#include <limits>

namespace pvpsim {

/**
 * The action a combatant takes this tick.
 */
struct BattleAction {
    ActionType type = ActionType::FAST;
    std::optional<size_t> charged_index;
    std::string reason;  // short tag for traces

    BattleAction() = default;

    BattleAction(ActionType action_type, std::optional<size_t> index, std::string why)
        : type(action_type)
        , charged_index(index)
        , reason(std::move(why))
    {}

    static BattleAction fast(std::string why = "") {
        return BattleAction(ActionType::FAST, std::nullopt, std::move(why));
    }

    static BattleAction charged(size_t index, std::string why = "") {
        return BattleAction(ActionType::CHARGED, index, std::move(why));
    }

    static BattleAction wait(std::string why = "") {
        return BattleAction(ActionType::WAIT, std::nullopt, std::move(why));
    }

    bool is_charged() const { return type == ActionType::CHARGED && charged_index.has_value(); }
};

constexpr int NO_THREAT = std::numeric_limits<int>::max();

// ============================================================================
// BUILDING BLOCKS
// ============================================================================

/** Charged-move priority: higher effective attack goes first. */
bool wins_charged_priority(const Combatant& poke, const Combatant& opponent);

/**
 * Turns until the opponent can knock `poke` out, or NO_THREAT when that
 * cannot happen within poke's next fast move window.
 */
int turns_to_live(const Combatant& poke, const Combatant& opponent);

/**
 * An affordable charged move that knocks the opponent out this turn.
 *
 * Skipped when the fast move alone finishes the opponent. With shields up,
 * only moves predicted to go unshielded count.
 */
std::optional<size_t> find_lethal_move(const Combatant& poke, const Combatant& opponent);

/**
 * Highest-damage affordable move among `candidates`, nullopt if none is
 * affordable. Two back-to-back uses count double when poke has the energy
 * and outranks the opponent's attack.
 */
std::optional<size_t> strongest_affordable_move(const Combatant& poke, const Combatant& opponent,
                                                const std::vector<size_t>& candidates);

/** Delay an affordable charged move by one fast move to line up timing. */
bool should_optimize_timing(const Combatant& poke, const Combatant& opponent, int ttl);

/** Fast move cooldown gap that lets poke act a full turn ahead. */
bool has_timing_advantage(const Combatant& poke, const Combatant& opponent);

/**
 * Keep farming a self-debuffing move up to floor(100 / cost) * cost energy
 * so repeated uses come back to back.
 */
bool should_stack_energy(const Combatant& poke, const Combatant& opponent,
                         const ChargedMove& move);

// ============================================================================
// DECISIONS
// ============================================================================

/**
 * Full strategic decision for a READY combatant.
 */
BattleAction decide_action(const Combatant& poke, const Combatant& opponent,
                           const ActionPolicy& policy, Rng& rng);

/**
 * Uniform choice among the fast move and every affordable charged move.
 */
BattleAction decide_random_action(const Combatant& poke, Rng& rng);

} // namespace pvpsim
