/**
 * PvP Battle Simulator - Move Selection Search Implementation
 */

#include "move_search.hpp"
#include "damage_calculator.hpp"
#include "decision.hpp"
#include "shield_logic.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <stdexcept>

namespace pvpsim {

void ActionPolicy::validate() const {
    if (bait_dpe_ratio <= 0.0 || shield_bait_weight <= 0.0 || farm_completion_weight <= 0.0) {
        throw std::invalid_argument("ActionPolicy ratios and weights must be positive");
    }
    if (farm_completion_margin < 0 || self_buff_energy_margin < 0 || similar_energy_window < 0) {
        throw std::invalid_argument("ActionPolicy energy margins must be non-negative");
    }
    if (deferral_energy_factor < 0.0) {
        throw std::invalid_argument("ActionPolicy deferral factor must be non-negative");
    }
    if (substantial_health_ratio < 0.0 || substantial_health_ratio > 1.0 ||
        low_health_bait_ratio < 0.0 || low_health_bait_ratio > 1.0) {
        throw std::invalid_argument("ActionPolicy health ratios must be within 0-1");
    }
    if (max_search_states < 1) {
        throw std::invalid_argument("ActionPolicy needs a positive search state budget");
    }
    if (viable_tolerance < 0.0 || viable_tolerance >= 1.0) {
        throw std::invalid_argument("ActionPolicy viable tolerance must be within [0, 1)");
    }
}

namespace {

constexpr int STAGE_SLOTS = MAX_BUFF_STAGE - MIN_BUFF_STAGE + 1;
constexpr double CERTAIN = 1.0 - 1e-9;

int stage_slot(int stage) {
    return clamp_stage(stage) - MIN_BUFF_STAGE;
}

/**
 * Damage and shield predictions precomputed once per search.
 */
struct SearchTables {
    std::array<int, STAGE_SLOTS> fast_damage{};
    std::vector<std::array<int, STAGE_SLOTS>> charged_damage;
    std::vector<std::vector<double>> shield_chance;  // [move][opponent shields]
};

SearchTables build_tables(const Combatant& poke, const Combatant& opponent) {
    SearchTables tables;
    const FastMove& fast = poke.fast_move;

    for (int slot = 0; slot < STAGE_SLOTS; slot++) {
        int stage = slot + MIN_BUFF_STAGE;
        tables.fast_damage[slot] = calculate_damage(poke, opponent, fast.power, fast.type,
                                                    stage, opponent.stat_buffs[1]);
    }

    int max_shields = std::max(opponent.shields, 0);
    for (const auto& move : poke.charged_moves) {
        std::array<int, STAGE_SLOTS> damage{};
        for (int slot = 0; slot < STAGE_SLOTS; slot++) {
            damage[slot] = calculate_damage_at_stage(poke, opponent, move, slot + MIN_BUFF_STAGE);
        }
        tables.charged_damage.push_back(damage);

        std::vector<double> chance(max_shields + 1, 0.0);
        for (int s = 1; s <= max_shields; s++) {
            chance[s] = would_shield(poke, opponent, move, s).shield_probability();
        }
        tables.shield_chance.push_back(std::move(chance));
    }
    return tables;
}

struct Edge {
    size_t move;
    double probability;  // conditional on choosing `move`
    StateKey to;
};

struct Branch {
    int buffs;
    double probability;
};

bool dominates(const BattleState& a, const BattleState& b) {
    if (a.moves.empty() || b.moves.empty() || a.moves.front() != b.moves.front()) {
        return false;
    }
    return a.turn <= b.turn && a.opp_health <= b.opp_health && a.energy >= b.energy &&
           a.opp_shields <= b.opp_shields && a.buffs >= b.buffs;
}

double estimated_ko_turn(const BattleState& state, const Combatant& poke,
                         const SearchTables& tables) {
    if (state.opp_health <= 0) {
        return state.turn;
    }
    int damage = std::max(1, tables.fast_damage[stage_slot(poke.stat_buffs[0] + state.buffs)]);
    int fast_moves = (state.opp_health + damage - 1) / damage;
    return state.turn + static_cast<double>(fast_moves) * poke.fast_move.turns;
}

std::vector<size_t> all_move_indices(const Combatant& poke) {
    std::vector<size_t> indices;
    for (size_t i = 0; i < poke.charged_moves.size(); i++) {
        indices.push_back(i);
    }
    return indices;
}

} // anonymous namespace

// ============================================================================
// EFFICIENCY
// ============================================================================

double dpe_ratio(const Combatant& poke, const Combatant& opponent,
                 const ChargedMove& cheap, const ChargedMove& costly) {
    double cheap_dpe = damage_per_energy(poke, opponent, cheap);
    if (cheap_dpe <= 0.0) {
        return 0.0;
    }
    return damage_per_energy(poke, opponent, costly) / cheap_dpe;
}

// ============================================================================
// POLICY RULES
// ============================================================================

BaitPlan plan_bait(const Combatant& poke, const Combatant& opponent,
                   const std::vector<size_t>& candidates,
                   int energy, int opp_shields, const ActionPolicy& policy) {
    BaitPlan plan;
    plan.moves = candidates;

    if (candidates.empty()) {
        plan.build_energy = true;
        plan.reason = "no_moves";
        return plan;
    }

    size_t cheap = candidates.front();
    size_t costly = candidates.front();
    for (size_t index : candidates) {
        const ChargedMove& move = poke.charged_moves[index];
        if (move.energy_cost < poke.charged_moves[cheap].energy_cost) cheap = index;
        if (move.energy_cost > poke.charged_moves[costly].energy_cost) costly = index;
    }
    const ChargedMove& cheap_move = poke.charged_moves[cheap];
    const ChargedMove& costly_move = poke.charged_moves[costly];
    bool distinct = cheap_move.energy_cost < costly_move.energy_cost;

    bool low_health = poke.hp_ratio() < policy.low_health_bait_ratio &&
                      energy < policy.low_health_bait_energy;

    if (distinct && poke.bait_shields && opp_shields > 0 && !low_health) {
        if (dpe_ratio(poke, opponent, cheap_move, costly_move) <= policy.bait_dpe_ratio) {
            plan.moves = {cheap};
            plan.build_energy = energy < cheap_move.energy_cost;
            plan.reason = "bait";
        } else {
            plan.moves = {costly};
            plan.build_energy = energy < costly_move.energy_cost;
            plan.reason = "farm";
        }
        return plan;
    }

    if (distinct && poke.farm_energy) {
        plan.moves = {costly};
        plan.build_energy = energy < costly_move.energy_cost;
        plan.reason = "farm";
        return plan;
    }

    plan.build_energy = std::none_of(candidates.begin(), candidates.end(), [&](size_t index) {
        return energy >= poke.charged_moves[index].energy_cost;
    });
    plan.reason = "open";
    return plan;
}

bool should_defer_self_debuffing(const Combatant& poke, const Combatant& opponent,
                                 const ChargedMove& move, const ActionPolicy& policy) {
    if (!move.is_self_debuffing() || poke.shields > 0) {
        return false;
    }

    auto costliest = poke.most_expensive_move_index();
    if (!costliest) {
        return false;
    }
    int threshold = std::min(MAX_ENERGY, static_cast<int>(std::ceil(
        policy.deferral_energy_factor * poke.charged_moves[*costliest].energy_cost)));
    if (poke.energy >= threshold) {
        return false;
    }

    if (move.is_net_self_buffing() &&
        poke.energy >= move.energy_cost + policy.self_buff_energy_margin) {
        return false;
    }

    const ChargedMove* strongest = nullptr;
    int strongest_damage = -1;
    for (const auto& candidate : opponent.charged_moves) {
        int damage = calculate_damage(opponent, poke, candidate);
        if (damage > strongest_damage) {
            strongest_damage = damage;
            strongest = &candidate;
        }
    }
    if (!strongest || opponent.energy < strongest->energy_cost) {
        return false;
    }

    return !would_shield(opponent, poke, *strongest).value;
}

double bait_weight(const Combatant& poke, const Combatant& opponent, size_t move_index,
                   int energy, int opp_shields, const ActionPolicy& policy) {
    double weight = 1.0;
    auto cheap = poke.cheapest_move_index();
    auto costly = poke.most_expensive_move_index();
    if (!cheap || !costly || move_index >= poke.charged_moves.size()) {
        return weight;
    }

    const ChargedMove& move = poke.charged_moves[move_index];
    bool distinct = poke.charged_moves[*cheap].energy_cost < poke.charged_moves[*costly].energy_cost;
    if (!distinct) {
        return weight;
    }

    if (poke.bait_shields && opp_shields > 0 &&
        would_shield(poke, opponent, move, opp_shields).value) {
        weight *= policy.shield_bait_weight;
    }

    if (move_index == *costly &&
        std::abs(move.energy_cost - energy) <= policy.farm_completion_margin) {
        weight *= policy.farm_completion_weight;
    }

    return weight;
}

// ============================================================================
// SEARCH
// ============================================================================

SearchResult search_move_sequence(const Combatant& poke, const Combatant& opponent,
                                  const std::vector<size_t>& root_moves,
                                  const ActionPolicy& policy, Rng& rng) {
    SearchResult result;
    if (root_moves.empty() || poke.charged_moves.empty()) {
        return result;
    }

    const SearchTables tables = build_tables(poke, opponent);
    const FastMove& fast = poke.fast_move;
    const std::vector<size_t> every_move = all_move_indices(poke);

    std::vector<BattleState> arena;
    std::vector<std::pair<size_t, size_t>> edge_ranges;  // [begin, end) into edges
    std::vector<Edge> edges;
    std::vector<StateKey> expansion_order;

    BattleState root;
    root.energy = poke.energy;
    root.opp_health = opponent.current_hp;
    root.opp_shields = opponent.shields;
    arena.push_back(root);
    edge_ranges.emplace_back(0, 0);

    std::deque<StateKey> frontier = {0};
    std::optional<int> certain_turn;

    // Add a child state reached by `move` with conditional `probability`
    auto link_child = [&](BattleState child, size_t move, double probability) {
        if (child.opp_health > 0) {
            for (StateKey key : frontier) {
                if (dominates(arena[key], child)) {
                    edges.push_back({move, probability, key});
                    return;
                }
            }
        }
        if (arena.size() >= MAX_ARENA_STATES) {
            return;
        }

        StateKey key = static_cast<StateKey>(arena.size());
        if (child.opp_health <= 0 && child.chance >= CERTAIN &&
            (!certain_turn || child.turn < *certain_turn)) {
            certain_turn = child.turn;
        }
        bool terminal = child.opp_health <= 0;
        arena.push_back(std::move(child));
        edge_ranges.emplace_back(0, 0);
        edges.push_back({move, probability, key});

        if (!terminal) {
            int turn = arena[key].turn;
            auto pos = std::upper_bound(frontier.begin(), frontier.end(), turn,
                                        [&](int t, StateKey k) { return t < arena[k].turn; });
            frontier.insert(pos, key);
        }
    };

    while (!frontier.empty() && result.states_evaluated < policy.max_search_states) {
        StateKey key = frontier.front();
        frontier.pop_front();

        if (certain_turn && arena[key].turn >= *certain_turn) {
            frontier.push_front(key);
            break;
        }

        result.states_evaluated++;
        expansion_order.push_back(key);
        const BattleState state = arena[key];
        size_t edge_begin = edges.size();

        std::vector<size_t> allowed = root_moves;
        if (!state.moves.empty()) {
            allowed = plan_bait(poke, opponent, every_move, state.energy,
                                state.opp_shields, policy).moves;
        }

        for (size_t n : allowed) {
            const ChargedMove& move = poke.charged_moves[n];

            int farm_count = 0;
            if (state.energy < move.energy_cost) {
                if (fast.energy_gain <= 0) continue;
                farm_count = (move.energy_cost - state.energy + fast.energy_gain - 1) / fast.energy_gain;
            }

            int slot = stage_slot(poke.stat_buffs[0] + state.buffs);
            int new_energy = std::min(MAX_ENERGY, state.energy + farm_count * fast.energy_gain)
                             - move.energy_cost;
            int fast_total = tables.fast_damage[slot] * farm_count;
            int damage = tables.charged_damage[n][slot];
            int new_turn = state.turn + farm_count * fast.turns + 1;

            std::vector<Branch> buff_branches;
            int stage_delta = move.buff_target == BuffTarget::SELF ? move.attack_stage_delta() : 0;
            if (stage_delta != 0 && move.buff_chance >= 1.0) {
                buff_branches.push_back({state.buffs + stage_delta, 1.0});
            } else if (stage_delta != 0 && move.buff_chance > 0.0) {
                buff_branches.push_back({state.buffs + stage_delta, move.buff_chance});
                buff_branches.push_back({state.buffs, 1.0 - move.buff_chance});
            } else {
                buff_branches.push_back({state.buffs, 1.0});
            }

            double shield_p = 0.0;
            if (state.opp_shields > 0) {
                shield_p = tables.shield_chance[n][std::min<size_t>(state.opp_shields,
                                                  tables.shield_chance[n].size() - 1)];
            }

            for (const Branch& buff : buff_branches) {
                BattleState next;
                next.energy = new_energy;
                next.turn = new_turn;
                next.moves = state.moves;
                next.moves.push_back(n);
                next.buffs = std::clamp(buff.buffs, MIN_BUFF_STAGE - poke.stat_buffs[0],
                                        MAX_BUFF_STAGE - poke.stat_buffs[0]);

                if (shield_p > 0.0) {
                    BattleState shielded = next;
                    shielded.opp_health = state.opp_health - fast_total - SHIELDED_DAMAGE;
                    shielded.opp_shields = state.opp_shields - 1;
                    shielded.chance = state.chance * buff.probability * shield_p;
                    link_child(std::move(shielded), n, buff.probability * shield_p);
                }
                if (shield_p < 1.0) {
                    BattleState open = next;
                    open.opp_health = state.opp_health - fast_total - damage;
                    open.opp_shields = state.opp_shields;
                    open.chance = state.chance * buff.probability * (1.0 - shield_p);
                    link_child(std::move(open), n, buff.probability * (1.0 - shield_p));
                }
            }
        }

        edge_ranges[key] = {edge_begin, edges.size()};
    }

    // ========================================================================
    // BACKWARD PASS: expectation over branches, minimum over move choices
    // ========================================================================

    std::vector<double> value(arena.size(), 0.0);
    std::vector<bool> expanded(arena.size(), false);
    for (StateKey key : expansion_order) {
        expanded[key] = true;
    }
    for (size_t i = 0; i < arena.size(); i++) {
        if (!expanded[i]) {
            value[i] = estimated_ko_turn(arena[i], poke, tables);
        }
    }

    // Expected turns per move choice at a state, nullopt if the move had no children
    auto choice_turns = [&](StateKey key, size_t move) -> std::optional<double> {
        double weighted = 0.0;
        double total = 0.0;
        for (size_t e = edge_ranges[key].first; e < edge_ranges[key].second; e++) {
            if (edges[e].move != move) continue;
            weighted += edges[e].probability * value[edges[e].to];
            total += edges[e].probability;
        }
        if (total <= 0.0) return std::nullopt;
        return weighted / total;
    };

    std::vector<std::optional<size_t>> best_choice(arena.size());
    for (auto it = expansion_order.rbegin(); it != expansion_order.rend(); ++it) {
        StateKey key = *it;
        double best = std::numeric_limits<double>::infinity();
        for (size_t n = 0; n < poke.charged_moves.size(); n++) {
            auto turns = choice_turns(key, n);
            if (turns && *turns < best) {
                best = *turns;
                best_choice[key] = n;
            }
        }
        value[key] = best_choice[key] ? best : estimated_ko_turn(arena[key], poke, tables);
    }

    // ========================================================================
    // ROOT SELECTION
    // ========================================================================

    struct RootOption {
        size_t move;
        double turns;
        double value;
    };
    std::vector<RootOption> options;
    for (size_t n : root_moves) {
        auto turns = choice_turns(0, n);
        if (!turns) continue;
        double weight = bait_weight(poke, opponent, n, poke.energy, opponent.shields, policy);
        options.push_back({n, *turns, weight / std::max(*turns, 1.0)});
    }
    if (options.empty()) {
        return result;
    }

    double best_value = 0.0;
    for (const auto& option : options) {
        best_value = std::max(best_value, option.value);
    }

    std::vector<RootOption> viable;
    for (const auto& option : options) {
        if (option.value < best_value * (1.0 - policy.viable_tolerance)) continue;

        // Equal value: keep the better damage per energy
        bool replaced = false;
        for (auto& kept : viable) {
            if (std::abs(kept.value - option.value) <= 1e-9 * best_value) {
                if (damage_per_energy(poke, opponent, poke.charged_moves[option.move]) >
                    damage_per_energy(poke, opponent, poke.charged_moves[kept.move])) {
                    kept = option;
                }
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            viable.push_back(option);
        }
    }

    std::sort(viable.begin(), viable.end(), [](const RootOption& a, const RootOption& b) {
        return a.value > b.value;
    });

    size_t chosen = 0;
    if (viable.size() > 1) {
        std::vector<DecisionOption> choices;
        for (const auto& option : viable) {
            choices.emplace_back(poke.charged_moves[option.move].move_id, option.value, option.move);
        }
        chosen = choose_option_index(choices, rng);
    }
    const RootOption& pick = viable[chosen];

    // Follow the chosen line, taking the most likely branch at each step
    StateKey node = 0;
    std::optional<size_t> choice = pick.move;
    while (choice) {
        const Edge* next = nullptr;
        for (size_t e = edge_ranges[node].first; e < edge_ranges[node].second; e++) {
            if (edges[e].move == *choice && (!next || edges[e].probability > next->probability)) {
                next = &edges[e];
            }
        }
        if (!next) break;
        node = next->to;
        choice = expanded[node] ? best_choice[node] : std::nullopt;
    }

    result.sequence = arena[node].moves;
    if (result.sequence.empty() || result.sequence.front() != pick.move) {
        result.sequence.insert(result.sequence.begin(), pick.move);
    }
    result.expected_turns = pick.turns;
    result.value = pick.value;
    return result;
}

// ============================================================================
// REORDERING
// ============================================================================

std::vector<size_t> reorder_moves(const Combatant& poke, const Combatant& opponent,
                                  const std::vector<size_t>& sequence,
                                  const std::vector<size_t>& candidates,
                                  const ActionPolicy& policy) {
    std::vector<size_t> order;
    for (size_t index : sequence) {
        if (index < poke.charged_moves.size() &&
            std::find(order.begin(), order.end(), index) == order.end()) {
            order.push_back(index);
        }
    }
    if (order.empty()) {
        return order;
    }

    // A net self buff opens the line
    if (poke.charged_moves[order.front()].is_net_self_buffing()) {
        return order;
    }

    auto damage_of = [&](size_t index) {
        return calculate_damage(poke, opponent, poke.charged_moves[index]);
    };
    auto cost_of = [&](size_t index) {
        return poke.charged_moves[index].energy_cost;
    };
    auto dpe_of = [&](size_t index) {
        return damage_per_energy(poke, opponent, poke.charged_moves[index]);
    };

    bool baiting = opponent.shields > 0 && poke.bait_shields;
    if (opponent.shields > 0) {
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return cost_of(a) < cost_of(b);
        });
    } else {
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return damage_of(a) > damage_of(b);
        });
    }

    std::vector<size_t> pool = order;
    for (size_t index : candidates) {
        if (index < poke.charged_moves.size() &&
            std::find(pool.begin(), pool.end(), index) == pool.end()) {
            pool.push_back(index);
        }
    }

    auto promote = [&](size_t index) {
        order.erase(std::remove(order.begin(), order.end(), index), order.end());
        order.insert(order.begin(), index);
    };

    // Self-debuffing moves wait while neither side is in danger
    size_t front = order.front();
    const ChargedMove& front_move = poke.charged_moves[front];
    bool both_healthy = poke.hp_ratio() > policy.substantial_health_ratio &&
                        opponent.hp_ratio() > policy.substantial_health_ratio;
    bool finishes = opponent.shields == 0 && damage_of(front) >= opponent.current_hp;
    if (front_move.is_self_debuffing() && both_healthy && !finishes) {
        for (size_t index : pool) {
            if (index == front || poke.charged_moves[index].is_self_debuffing()) continue;
            if (std::abs(cost_of(index) - cost_of(front)) <= policy.similar_energy_window) {
                promote(index);
                break;
            }
        }
    }

    // Near-equal cost: prefer the more efficient move
    front = order.front();
    bool front_debuffs = poke.charged_moves[front].is_self_debuffing();
    std::optional<size_t> better;
    for (size_t index : pool) {
        if (index == front) continue;
        if (baiting && cost_of(index) > cost_of(front)) continue;
        if (std::abs(cost_of(index) - cost_of(front)) > policy.similar_energy_window) continue;
        if (poke.charged_moves[index].is_self_debuffing() && !front_debuffs) continue;
        double candidate_dpe = dpe_of(index);
        if (candidate_dpe > dpe_of(front) + 1e-9 &&
            (!better || candidate_dpe > dpe_of(*better))) {
            better = index;
        }
    }
    if (better) {
        promote(*better);
    }

    return order;
}

} // namespace pvpsim
