/**
 * PvP Battle Simulator - Action Decision Engine Implementation
 */

#include "action_logic.hpp"
#include "damage_calculator.hpp"
#include "decision.hpp"
#include "shield_logic.hpp"
#include <algorithm>
#include <cmath>
#include <deque>

namespace pvpsim {

namespace {

constexpr int MAX_THREAT_STATES = 64;

struct ThreatState {
    int hp;
    int op_energy;
    int turn;
    int shields;
};

int ticks(int cooldown_ms) {
    return cooldown_ms / TURN_DURATION_MS;
}

} // anonymous namespace

// ============================================================================
// BUILDING BLOCKS
// ============================================================================

bool wins_charged_priority(const Combatant& poke, const Combatant& opponent) {
    return effective_attack(poke) >= effective_attack(opponent);
}

int turns_to_live(const Combatant& poke, const Combatant& opponent) {
    const FastMove& opp_fast = opponent.fast_move;
    int opp_fast_damage = calculate_damage(opponent, poke, opp_fast);
    bool wins_cmp = wins_charged_priority(poke, opponent);
    auto opp_cheapest = opponent.cheapest_move_index();

    std::deque<ThreatState> queue;
    if (opponent.cooldown > 0) {
        queue.push_back({poke.current_hp - opp_fast_damage,
                         std::min(MAX_ENERGY, opponent.energy + opp_fast.energy_gain),
                         ticks(opponent.cooldown), poke.shields});
    } else {
        queue.push_back({poke.current_hp, opponent.energy, 0, poke.shields});
    }

    int ttl = NO_THREAT;
    int window = poke.fast_move.turns + (wins_cmp ? 0 : 1);
    int processed = 0;

    while (!queue.empty() && processed++ < MAX_THREAT_STATES) {
        ThreatState state = queue.front();
        queue.pop_front();

        if (state.hp > opp_fast_damage && state.turn > window) {
            continue;
        }

        if (state.shields > 0) {
            // Opponent baits our shield with its cheapest move
            if (opp_cheapest) {
                const ChargedMove& bait = opponent.charged_moves[*opp_cheapest];
                if (state.op_energy >= bait.energy_cost) {
                    queue.push_front({state.hp - SHIELDED_DAMAGE, state.op_energy - bait.energy_cost,
                                      state.turn + 1, state.shields - 1});
                }
            }
        } else {
            for (const auto& move : opponent.charged_moves) {
                if (state.op_energy < move.energy_cost) continue;
                int damage = calculate_damage(opponent, poke, move);
                if (damage >= state.hp) {
                    int candidate = state.turn;
                    // Striking first buys one more turn when the fast moves line up
                    if (effective_attack(poke) > effective_attack(opponent) &&
                        opp_fast.cooldown() % poke.fast_move.cooldown() == 0) {
                        candidate += 1;
                    }
                    ttl = std::min(ttl, candidate);
                    break;
                }
                queue.push_front({state.hp - damage, state.op_energy - move.energy_cost,
                                  state.turn + 1, state.shields});
            }
        }

        if (state.hp - opp_fast_damage <= 0) {
            ttl = std::min(ttl, state.turn + opp_fast.turns);
            break;
        }
        queue.push_front({state.hp - opp_fast_damage,
                          std::min(MAX_ENERGY, state.op_energy + opp_fast.energy_gain),
                          state.turn + opp_fast.turns, state.shields});
    }

    if (ttl == NO_THREAT) {
        return ttl;
    }

    if (poke.current_hp <= opp_fast_damage * 2 && opp_fast.cooldown() == TURN_DURATION_MS) {
        ttl -= 1;
    }

    // A fast move already in flight lands when its cooldown ends
    if (poke.current_hp <= opp_fast_damage && opponent.cooldown > 0 &&
        opp_fast.cooldown() > TURN_DURATION_MS) {
        ttl = ticks(opponent.cooldown);
        if (opponent.current_hp > calculate_damage(poke, opponent, poke.fast_move)) {
            ttl -= 1;
        }
    }

    return std::max(ttl, 0);
}

std::optional<size_t> find_lethal_move(const Combatant& poke, const Combatant& opponent) {
    if (opponent.current_hp <= calculate_damage(poke, opponent, poke.fast_move)) {
        return std::nullopt;
    }

    std::optional<size_t> best;
    for (size_t i = 0; i < poke.charged_moves.size(); i++) {
        const ChargedMove& move = poke.charged_moves[i];
        if (!poke.can_afford(move)) continue;
        if (calculate_damage(poke, opponent, move) < opponent.current_hp) continue;
        if (opponent.shields > 0 && would_shield(poke, opponent, move).value) continue;

        if (!best) {
            best = i;
            continue;
        }
        const ChargedMove& current = poke.charged_moves[*best];
        bool debuff_better = current.is_self_debuffing() && !move.is_self_debuffing();
        bool same_class = current.is_self_debuffing() == move.is_self_debuffing();
        if (debuff_better || (same_class && move.energy_cost < current.energy_cost)) {
            best = i;
        }
    }
    return best;
}

std::optional<size_t> strongest_affordable_move(const Combatant& poke, const Combatant& opponent,
                                                const std::vector<size_t>& candidates) {
    std::optional<size_t> best;
    int best_damage = -1;
    bool wins_cmp = effective_attack(poke) > effective_attack(opponent);

    for (auto it = candidates.rbegin(); it != candidates.rend(); ++it) {
        size_t n = *it;
        const ChargedMove& move = poke.charged_moves[n];
        if (!poke.can_afford(move)) continue;

        int damage = calculate_damage(poke, opponent, move);
        if (damage > best_damage) {
            best = n;
            best_damage = damage;
        }
        // Two of this move back to back outdamage the alternative
        if (poke.energy >= move.energy_cost * 2 && wins_cmp && damage * 2 > best_damage) {
            best = n;
            best_damage = damage * 2;
        }
    }
    return best;
}

bool has_timing_advantage(const Combatant& poke, const Combatant& opponent) {
    return opponent.fast_move.cooldown() - poke.fast_move.cooldown() > TURN_DURATION_MS;
}

bool should_optimize_timing(const Combatant& poke, const Combatant& opponent, int ttl) {
    if (!poke.optimize_move_timing || poke.charged_moves.empty()) {
        return false;
    }

    int own_cd = poke.fast_move.cooldown();
    int opp_cd = opponent.fast_move.cooldown();

    int target = TURN_DURATION_MS;
    if (own_cd >= 2000) target = 1000;
    if (own_cd >= 1500 && opp_cd == 2500) target = 1000;
    if (own_cd == 1000 && opp_cd == 2000) target = 1000;

    // No gain possible against equal or evenly dividing cooldowns
    if (own_cd == opp_cd || (own_cd > opp_cd && own_cd % opp_cd == 0)) {
        target = 0;
    }
    if (target == 0 || !(opponent.cooldown == 0 || opponent.cooldown > target)) {
        return false;
    }

    int opp_fast_damage = calculate_damage(opponent, poke, opponent.fast_move);
    if (poke.current_hp <= opp_fast_damage) {
        return false;
    }
    int hits_in_window = (own_cd + TURN_DURATION_MS) / opp_cd;
    if (poke.current_hp <= opp_fast_damage * hits_in_window) {
        return false;
    }

    if (poke.energy + poke.fast_move.energy_gain > MAX_ENERGY) {
        return false;
    }

    int first_cost = poke.charged_moves.front().energy_cost;
    int planned_turns = poke.fast_move.turns + (first_cost > 0 ? poke.energy / first_cost : 0);
    if (!wins_charged_priority(poke, opponent)) {
        planned_turns += 1;
    }
    if (planned_turns > ttl) {
        return false;
    }

    if (opponent.shields == 0) {
        for (const auto& move : poke.charged_moves) {
            if (poke.can_afford(move) &&
                calculate_damage(poke, opponent, move) >= opponent.current_hp) {
                return false;
            }
        }
    }

    int gain = std::max(opponent.fast_move.energy_gain, 1);
    int fast_in_window = own_cd / opp_cd;
    for (const auto& move : opponent.charged_moves) {
        int needed = std::max(move.energy_cost - opponent.energy, 0);
        int fast_needed = (needed + gain - 1) / gain;
        int turns_from_move = fast_needed * opponent.fast_move.turns + 1;

        int hit = poke.shields > 0 ? SHIELDED_DAMAGE : calculate_damage(opponent, poke, move);
        int total = hit + opp_fast_damage * fast_in_window;
        if (turns_from_move <= poke.fast_move.turns && total >= poke.current_hp) {
            return false;
        }
    }

    return true;
}

bool should_stack_energy(const Combatant& poke, const Combatant& opponent,
                         const ChargedMove& move) {
    if (!move.is_self_debuffing() || move.energy_cost <= 0) {
        return false;
    }

    int target = (MAX_ENERGY / move.energy_cost) * move.energy_cost;
    if (target <= move.energy_cost || poke.energy >= target) {
        return false;
    }

    if (opponent.shields == 0 && calculate_damage(poke, opponent, move) >= opponent.current_hp) {
        return false;
    }

    int opp_fast_damage = calculate_damage(opponent, poke, opponent.fast_move);
    if (poke.current_hp <= opp_fast_damage * 2 && !has_timing_advantage(poke, opponent)) {
        return false;
    }

    // Farming longer is not an option under an unshielded knockout threat
    if (poke.shields == 0) {
        for (const auto& threat : opponent.charged_moves) {
            if (opponent.energy >= threat.energy_cost &&
                calculate_damage(opponent, poke, threat) >= poke.current_hp) {
                return false;
            }
        }
    }

    return true;
}

// ============================================================================
// DECISIONS
// ============================================================================

BattleAction decide_action(const Combatant& poke, const Combatant& opponent,
                           const ActionPolicy& policy, Rng& rng) {
    if (poke.charged_moves.empty()) {
        return BattleAction::fast("no_charged_moves");
    }

    auto cheapest = poke.cheapest_move_index();
    if (poke.energy < poke.charged_moves[*cheapest].energy_cost) {
        return BattleAction::fast("charging");
    }

    if (auto lethal = find_lethal_move(poke, opponent)) {
        return BattleAction::charged(*lethal, "lethal");
    }

    std::vector<size_t> candidates;
    std::vector<size_t> all_moves;
    for (size_t i = 0; i < poke.charged_moves.size(); i++) {
        all_moves.push_back(i);
        if (!should_defer_self_debuffing(poke, opponent, poke.charged_moves[i], policy)) {
            candidates.push_back(i);
        }
    }
    bool deferred_any = candidates.size() < all_moves.size();

    int ttl = turns_to_live(poke, opponent);
    if (ttl != NO_THREAT) {
        int window_ms = ttl * TURN_DURATION_MS;
        int own_cd = poke.fast_move.cooldown();
        int opp_fast_damage = calculate_damage(opponent, poke, opponent.fast_move);
        bool fainting = window_ms < own_cd ||
                        (window_ms == own_cd && !wins_charged_priority(poke, opponent)) ||
                        (window_ms == own_cd && poke.current_hp <= opp_fast_damage);
        if (fainting) {
            if (auto best = strongest_affordable_move(poke, opponent, candidates)) {
                return BattleAction::charged(*best, "survival");
            }
            if (auto best = strongest_affordable_move(poke, opponent, all_moves)) {
                return BattleAction::charged(*best, "survival");
            }
            return BattleAction::fast("survival_no_energy");
        }
    }

    if (should_optimize_timing(poke, opponent, ttl)) {
        return BattleAction::fast("timing");
    }

    if (candidates.empty()) {
        return BattleAction::fast("deferred");
    }

    BaitPlan plan = plan_bait(poke, opponent, candidates, poke.energy, opponent.shields, policy);
    if (plan.build_energy) {
        return BattleAction::fast(plan.reason == "bait" ? "bait_charging" : "farm");
    }

    SearchResult search = search_move_sequence(poke, opponent, plan.moves, policy, rng);
    if (!search.found()) {
        return BattleAction::fast("search_exhausted");
    }

    // Later moves in the line may be deferred or outside the bait plan
    std::vector<size_t> order = reorder_moves(poke, opponent, search.sequence, plan.moves, policy);
    order.erase(std::remove_if(order.begin(), order.end(), [&](size_t index) {
        return std::find(plan.moves.begin(), plan.moves.end(), index) == plan.moves.end();
    }), order.end());
    if (order.empty()) {
        return BattleAction::fast("search_exhausted");
    }

    size_t choice = order.front();
    const ChargedMove& move = poke.charged_moves[choice];

    if (should_stack_energy(poke, opponent, move)) {
        return BattleAction::fast("stack_energy");
    }

    if (!poke.can_afford(move)) {
        return BattleAction::fast("farm");
    }

    std::string reason = plan.reason == "bait" ? "bait" : "search";
    if (deferred_any) {
        reason += "_deferred";
    }
    return BattleAction::charged(choice, reason);
}

BattleAction decide_random_action(const Combatant& poke, Rng& rng) {
    std::vector<DecisionOption> options;
    options.emplace_back("fast", 1.0);
    for (size_t i = 0; i < poke.charged_moves.size(); i++) {
        if (poke.can_afford(poke.charged_moves[i])) {
            options.emplace_back(poke.charged_moves[i].move_id, 1.0, i);
        }
    }

    const DecisionOption& choice = choose_option(options, rng);
    if (choice.move_index) {
        return BattleAction::charged(*choice.move_index, "random");
    }
    return BattleAction::fast("random");
}

} // namespace pvpsim
