/**
 * PvP Battle Simulator - Battle State Machine Implementation
 */

#include "battle.hpp"
#include "battle_logger.hpp"
#include "damage_calculator.hpp"
#include "decision.hpp"
#include "shield_logic.hpp"
#include <algorithm>
#include <stdexcept>

namespace pvpsim {

// ============================================================================
// CONFIGURATION
// ============================================================================

void BattleConfig::validate() const {
    for (int count : shields) {
        if (count < 0 || count > DEFAULT_SHIELDS) {
            throw std::invalid_argument("Shield count must be between 0 and 2");
        }
    }
    for (int energy : starting_energy) {
        if (energy < 0 || energy > MAX_ENERGY) {
            throw std::invalid_argument("Starting energy must be between 0 and 100");
        }
    }
    if (max_turns <= 0) {
        throw std::invalid_argument("Maximum turn count must be positive");
    }
    policy.validate();
}

Battle::Battle(Combatant side0, Combatant side1, BattleConfig config)
    : initial_{std::move(side0), std::move(side1)}
    , config_(std::move(config))
{
    initial_[0].validate();
    initial_[1].validate();
    config_.validate();
}

void Battle::set_decision_policy(SideIndex side, DecisionPolicy policy) {
    if (side > 1) {
        throw std::invalid_argument("Side index must be 0 or 1");
    }
    policies_[side] = std::move(policy);
}

// ============================================================================
// DECISIONS
// ============================================================================

BattleAction Battle::decide(SideIndex side, const std::array<Combatant, 2>& sides,
                            Rng& rng) const {
    const Combatant& self = sides[side];
    const Combatant& opponent = sides[1 - side];

    BattleAction action;
    if (policies_[side]) {
        action = policies_[side](self, opponent, rng);
    } else if (config_.modes[side] == DecisionMode::RANDOM) {
        action = decide_random_action(self, rng);
    } else {
        action = decide_action(self, opponent, config_.policy, rng);
    }
    return sanitize(self, std::move(action));
}

BattleAction Battle::sanitize(const Combatant& actor, BattleAction action) const {
    if (action.type != ActionType::CHARGED) {
        return action;
    }
    if (!action.charged_index || *action.charged_index >= actor.charged_moves.size() ||
        !actor.can_afford(actor.charged_moves[*action.charged_index])) {
        return BattleAction::fast("fallback");
    }
    return action;
}

bool Battle::decide_shield(const Combatant& attacker, const Combatant& defender,
                           const ChargedMove& move, Rng& rng) const {
    if (defender.shields <= 0) {
        return false;
    }

    ShieldDecision decision = would_shield(attacker, defender, move);
    if (config_.modes[defender.index] == DecisionMode::RANDOM) {
        std::vector<DecisionOption> options;
        options.emplace_back("shield", decision.shield_weight);
        options.emplace_back("no_shield", decision.no_shield_weight);
        return choose_option_index(options, rng) == 0;
    }
    return decision.value;
}

// ============================================================================
// RESOLUTION
// ============================================================================

void Battle::record(BattleResult& result, int turn, const Combatant& actor,
                    const Combatant& opponent, const BattleAction& action,
                    int damage, bool shielded, bool buff_applied) const {
    if (logger_) {
        logger_->log_action(turn, actor, action, damage, shielded);
    }
    if (!config_.record_timeline) return;

    TimelineEvent event;
    event.turn = turn;
    event.actor = actor.index;
    event.type = action.type;
    if (action.type == ActionType::FAST) {
        event.move_id = actor.fast_move.move_id;
    } else if (action.is_charged()) {
        event.move_id = actor.charged_moves[*action.charged_index].move_id;
    }
    event.damage = damage;
    event.shielded = shielded;
    event.buff_applied = buff_applied;
    event.actor_stages = actor.stat_buffs;
    event.opponent_stages = opponent.stat_buffs;
    event.energy_after = actor.energy;
    result.timeline.push_back(std::move(event));
}

void Battle::resolve_charged(int turn, Combatant& attacker, Combatant& defender,
                             const BattleAction& action, Rng& rng,
                             BattleResult& result) const {
    const ChargedMove& move = attacker.charged_moves[*action.charged_index];

    // The defender decides on the attacker's energy before the cost is paid
    bool shielded = decide_shield(attacker, defender, move, rng);
    if (shielded) {
        defender.shields -= 1;
    }

    attacker.energy -= move.energy_cost;
    int raw_damage = calculate_damage(attacker, defender, move);

    int damage = resolve_charged_damage(raw_damage, shielded);
    defender.take_damage(damage);

    // Buffs land after the damage
    bool buff_applied = false;
    if (move.has_buff() && roll_chance(move.buff_chance, rng)) {
        Combatant& target = move.buff_target == BuffTarget::SELF ? attacker : defender;
        target.apply_stage_delta(move.attack_stage_delta(), move.defense_stage_delta());
        buff_applied = true;
    }

    record(result, turn, attacker, defender, action, damage, shielded, buff_applied);
}

// ============================================================================
// SIMULATION
// ============================================================================

BattleResult Battle::simulate(uint32_t seed) const {
    Rng rng(seed);
    return simulate(rng);
}

BattleResult Battle::simulate(Rng& rng) const {
    std::array<Combatant, 2> sides = initial_;
    for (SideIndex s = 0; s < 2; s++) {
        sides[s].reset(config_.shields[s], config_.starting_energy[s]);
        sides[s].index = s;
    }

    BattleResult result;
    if (logger_) {
        logger_->log_battle_start(sides[0], sides[1]);
    }

    int turn = 0;
    while (turn < config_.max_turns) {
        // All READY sides decide on the start-of-tick state
        std::array<std::optional<BattleAction>, 2> actions;
        for (SideIndex s = 0; s < 2; s++) {
            if (sides[s].cooldown <= 0) {
                actions[s] = decide(s, sides, rng);
            }
        }

        // Charged moves first, in charged-move priority order
        SideIndex first = wins_charged_priority(sides[0], sides[1]) ? 0 : 1;
        for (SideIndex s : {first, static_cast<SideIndex>(1 - first)}) {
            if (!actions[s] || actions[s]->type != ActionType::CHARGED) continue;
            if (sides[s].is_fainted()) continue;
            resolve_charged(turn, sides[s], sides[1 - s], *actions[s], rng, result);
        }

        // Fast moves land simultaneously
        std::array<int, 2> fast_damage = {0, 0};
        std::array<bool, 2> fast_started = {false, false};
        for (SideIndex s = 0; s < 2; s++) {
            if (!actions[s] || actions[s]->type != ActionType::FAST) continue;
            if (sides[s].is_fainted()) continue;
            fast_damage[s] = calculate_damage(sides[s], sides[1 - s], sides[s].fast_move);
            fast_started[s] = true;
        }
        for (SideIndex s = 0; s < 2; s++) {
            if (!fast_started[s]) continue;
            Combatant& actor = sides[s];
            actor.gain_energy(actor.fast_move.energy_gain);
            actor.cooldown = (actor.fast_move.turns - 1) * TURN_DURATION_MS;
            sides[1 - s].take_damage(fast_damage[s]);
        }
        for (SideIndex s = 0; s < 2; s++) {
            if (fast_started[s]) {
                record(result, turn, sides[s], sides[1 - s], *actions[s],
                       fast_damage[s], false, false);
            }
        }

        for (SideIndex s = 0; s < 2; s++) {
            if (!actions[s]) {
                sides[s].cooldown = std::max(0, sides[s].cooldown - TURN_DURATION_MS);
            } else if (actions[s]->type == ActionType::WAIT && !sides[s].is_fainted()) {
                record(result, turn, sides[s], sides[1 - s], *actions[s], 0, false, false);
            }
        }

        if (logger_ && (actions[0] || actions[1])) {
            logger_->log_state(turn, sides[0], sides[1]);
        }

        turn++;
        if (sides[0].is_fainted() || sides[1].is_fainted()) {
            break;
        }
    }

    result.turns = turn;
    result.time_remaining = (config_.max_turns - turn) * (TURN_DURATION_MS / 1000.0);
    for (SideIndex s = 0; s < 2; s++) {
        result.hp[s] = sides[s].current_hp;
        result.shields_remaining[s] = sides[s].shields;
    }

    result.rating[0] = battle_rating(sides[0].current_hp, sides[0].max_hp(),
                                     sides[1].current_hp, sides[1].max_hp());
    result.rating[1] = 1000 - result.rating[0];

    bool fainted0 = sides[0].is_fainted();
    bool fainted1 = sides[1].is_fainted();
    std::string reason = "faint";

    if (fainted0 && fainted1) {
        result.winner = BattleWinner::DRAW;
    } else if (fainted1) {
        result.winner = BattleWinner::PLAYER_0;
    } else if (fainted0) {
        result.winner = BattleWinner::PLAYER_1;
    } else {
        result.timed_out = true;
        reason = "timeout";
        if (result.rating[0] > result.rating[1]) {
            result.winner = BattleWinner::PLAYER_0;
        } else if (result.rating[1] > result.rating[0]) {
            result.winner = BattleWinner::PLAYER_1;
        } else {
            result.winner = BattleWinner::DRAW;
        }
    }

    if (logger_) {
        logger_->log_battle_end(result.winner, reason, result.rating[0], result.rating[1]);
    }

    return result;
}

} // namespace pvpsim
