/**
 * PvP Battle Simulator - Battle Trace Logger
 *
 * Linear, tick-by-tick trace of a battle for debugging decisions.
 * Every resolved action is written with the state of both sides and the
 * decision reason that produced it.
 */

#pragma once

#include "action_logic.hpp"
#include <fstream>
#include <string>

namespace pvpsim {

/**
 * BattleLogger - timestamped trace file for one or more battles.
 *
 * Observational only: a battle produces the same result whether or not a
 * logger is attached.
 */
class BattleLogger {
public:
    /**
     * Constructor - creates timestamped log file.
     *
     * @param output_dir Directory for log files (default: traces)
     */
    explicit BattleLogger(const std::string& output_dir = "traces");

    ~BattleLogger();

    BattleLogger(const BattleLogger&) = delete;
    BattleLogger& operator=(const BattleLogger&) = delete;

    /**
     * Log the matchup header: both combatants with stats and movesets.
     */
    void log_battle_start(const Combatant& side0, const Combatant& side1);

    /**
     * Log one resolved action.
     *
     * @param turn Tick the action resolved on
     * @param actor Acting combatant (after the action)
     * @param action Decision that was taken
     * @param damage Damage dealt to the opponent
     * @param shielded Whether the opponent shielded a charged move
     */
    void log_action(int turn, const Combatant& actor, const BattleAction& action,
                    int damage, bool shielded);

    /**
     * Log a snapshot of both sides.
     */
    void log_state(int turn, const Combatant& side0, const Combatant& side1);

    /**
     * Log battle end result.
     *
     * @param winner Winning side, or DRAW
     * @param reason "faint" or "timeout"
     */
    void log_battle_end(BattleWinner winner, const std::string& reason,
                        int rating0, int rating1);

    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }

    void set_enabled(bool enabled) { enabled_ = enabled; }

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    /**
     * Format a combatant line.
     * Format: "P0 Azumarill | HP: 143/189 | Energy: 33 | Shields: 2 | Stages: [+1, 0] | CD: 500ms"
     */
    std::string format_combatant_line(const Combatant& combatant) const;

    std::string format_action_description(const Combatant& actor, const BattleAction& action) const;

    static std::string timestamp_now();
};

} // namespace pvpsim
