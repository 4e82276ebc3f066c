/**
 * PvP Battle Simulator - Battle State Machine
 *
 * Runs one battle between two combatants tick by tick until a faint or the
 * turn limit. The only randomness comes from the Rng passed to simulate(),
 * so a given seed always replays the same battle.
 */

#pragma once

#include "action_logic.hpp"
#include <functional>

namespace pvpsim {

class BattleLogger;

struct BattleConfig {
    std::array<int, 2> shields = {DEFAULT_SHIELDS, DEFAULT_SHIELDS};
    std::array<int, 2> starting_energy = {0, 0};
    int max_turns = DEFAULT_MAX_TURNS;
    std::array<DecisionMode, 2> modes = {DecisionMode::STRATEGIC, DecisionMode::STRATEGIC};
    bool record_timeline = false;
    ActionPolicy policy;

    /** @throws std::invalid_argument on out-of-range values */
    void validate() const;
};

/**
 * One resolved action. Stages are the actor's [attack, defense] and the
 * opponent's [attack, defense] after any buff was applied.
 */
struct TimelineEvent {
    int turn = 0;
    SideIndex actor = 0;
    ActionType type = ActionType::FAST;
    MoveID move_id;
    int damage = 0;
    bool shielded = false;
    bool buff_applied = false;
    std::array<int, 2> actor_stages = {0, 0};
    std::array<int, 2> opponent_stages = {0, 0};
    int energy_after = 0;
};

struct BattleResult {
    BattleWinner winner = BattleWinner::DRAW;
    std::array<int, 2> hp = {0, 0};
    std::array<int, 2> rating = {500, 500};
    int turns = 0;
    double time_remaining = 0.0;  // seconds
    std::array<int, 2> shields_remaining = {0, 0};
    bool timed_out = false;
    std::vector<TimelineEvent> timeline;
};

/**
 * Battle - owns pristine copies of both combatants and replays them from
 * the starting position on every simulate() call.
 *
 * Separate Battle instances share nothing and may run on separate threads.
 */
class Battle {
public:
    /** Decision callback for a side: (self, opponent, rng) -> action. */
    using DecisionPolicy =
        std::function<BattleAction(const Combatant&, const Combatant&, Rng&)>;

    /**
     * @throws std::invalid_argument if either combatant or the config is invalid
     */
    Battle(Combatant side0, Combatant side1, BattleConfig config = BattleConfig{});

    // ========================================================================
    // SIMULATION
    // ========================================================================

    BattleResult simulate(Rng& rng) const;

    /** Seeds a fresh std::mt19937 and simulates. */
    BattleResult simulate(uint32_t seed) const;

    // ========================================================================
    // CONFIGURATION
    // ========================================================================

    /** Attach a trace logger (not owned). nullptr detaches. */
    void set_logger(BattleLogger* logger) { logger_ = logger; }

    /**
     * Replace the decision engine for one side. An empty function restores
     * the configured decision mode.
     */
    void set_decision_policy(SideIndex side, DecisionPolicy policy);

    const Combatant& combatant(SideIndex side) const { return initial_[side]; }
    const BattleConfig& config() const { return config_; }

private:
    std::array<Combatant, 2> initial_;
    BattleConfig config_;
    BattleLogger* logger_ = nullptr;
    std::array<DecisionPolicy, 2> policies_;

    BattleAction decide(SideIndex side, const std::array<Combatant, 2>& sides, Rng& rng) const;

    /** Fall back to the fast move for charged choices that cannot be used. */
    BattleAction sanitize(const Combatant& actor, BattleAction action) const;

    bool decide_shield(const Combatant& attacker, const Combatant& defender,
                       const ChargedMove& move, Rng& rng) const;

    void resolve_charged(int turn, Combatant& attacker, Combatant& defender,
                         const BattleAction& action, Rng& rng, BattleResult& result) const;

    void record(BattleResult& result, int turn, const Combatant& actor,
                const Combatant& opponent, const BattleAction& action,
                int damage, bool shielded, bool buff_applied) const;
};

} // namespace pvpsim
