/**
 * PvP Battle Simulator - Interactive Console
 *
 * Simple REPL for running scenarios by hand: load a scenario file, run
 * one or many seeded battles, inspect the timeline and query the damage
 * and type tables.
 */

#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <algorithm>
#include <memory>
#include <optional>

#include "pvpsim.hpp"

using namespace pvpsim;

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

std::vector<std::string> split(const std::string& s, char delim = ' ') {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (std::getline(iss, token, delim)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::optional<int> parse_int(const std::string& text) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) return std::nullopt;
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::string side_name(const Combatant& combatant) {
    return combatant.name.empty() ? combatant.species_id : combatant.name;
}

void print_help() {
    std::cout << "\nCommands:" << std::endl;
    std::cout << "  load <path>            Load a scenario JSON file" << std::endl;
    std::cout << "  show | s               Show both combatants" << std::endl;
    std::cout << "  seed <n>               Set the seed for the next run" << std::endl;
    std::cout << "  run | r [count]        Simulate one battle (or count seeds in a row)" << std::endl;
    std::cout << "  timeline | t           Print the timeline of the last single run" << std::endl;
    std::cout << "  mode <side> <mode>     Set decision mode (strategic | random)" << std::endl;
    std::cout << "  shields <n0> <n1>      Set starting shields" << std::endl;
    std::cout << "  trace on|off           Toggle the battle trace file" << std::endl;
    std::cout << "  type <atk> <def> [def2]  Type effectiveness" << std::endl;
    std::cout << "  damage <side> <move>   Damage by side's move (fast | 0 | 1)" << std::endl;
    std::cout << "  help | h | ?           Show this help" << std::endl;
    std::cout << "  quit | exit | q        Exit" << std::endl;
}

void show_combatant(const Combatant& c, const BattleConfig& config, SideIndex side) {
    Stats stats = c.calculate_stats();

    std::cout << "  P" << static_cast<int>(side) << " " << side_name(c)
              << " [" << to_string(c.types[0]);
    if (c.types[1] != PokemonType::NONE) {
        std::cout << "/" << to_string(c.types[1]);
    }
    std::cout << "]  CP " << c.calculate_cp() << "  L" << c.level << std::endl;

    std::cout << std::fixed << std::setprecision(2)
              << "    Atk " << stats.atk << "  Def " << stats.def
              << "  HP " << c.max_hp() << std::endl;
    std::cout.unsetf(std::ios::fixed);

    std::cout << "    Fast: " << c.fast_move.name << " (" << c.fast_move.power << " power, +"
              << c.fast_move.energy_gain << " energy, " << c.fast_move.turns << " turns)" << std::endl;
    for (size_t i = 0; i < c.charged_moves.size(); i++) {
        const auto& move = c.charged_moves[i];
        std::cout << "    [" << i << "] " << move.name << " (" << move.power << " power, "
                  << move.energy_cost << " energy)";
        if (move.has_buff()) {
            std::cout << " buffs " << move.buffs[0] << "/" << move.buffs[1]
                      << (move.buff_target == BuffTarget::SELF ? " self" : " opponent");
        }
        std::cout << std::endl;
    }

    std::cout << "    Shields: " << config.shields[side]
              << "  Mode: " << to_string(config.modes[side]) << std::endl;
}

// ============================================================================
// CONSOLE CLASS
// ============================================================================

class Console {
public:
    ScenarioLoader loader;
    std::optional<Battle> battle;
    std::optional<BattleResult> last_result;
    uint32_t seed = 0;

    // Trace logger, created on demand
    std::unique_ptr<BattleLogger> trace_logger;
    bool trace_enabled = false;
    std::string trace_dir = "traces";

    explicit Console(std::string scenario_path)
        : scenario_path_(std::move(scenario_path)) {}

    void cmd_load(const std::vector<std::string>& args) {
        if (args.size() > 1) {
            scenario_path_ = args[1];
        }
        if (scenario_path_.empty()) {
            std::cout << "Usage: load <path>" << std::endl;
            return;
        }

        if (!loader.load_from_json(scenario_path_)) {
            std::cout << "Failed to load scenario: " << scenario_path_ << std::endl;
            return;
        }

        rebuild_battle(loader.config());
        seed = loader.seed();
        last_result.reset();
        cmd_show();
    }

    void cmd_show() {
        if (!require_battle()) return;

        std::cout << "\n=== Matchup (seed " << seed << ") ===" << std::endl;
        for (SideIndex s = 0; s < 2; s++) {
            show_combatant(battle->combatant(s), battle->config(), s);
        }
        std::cout << "  Max turns: " << battle->config().max_turns << std::endl;
    }

    void cmd_seed(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Seed: " << seed << std::endl;
            return;
        }
        auto value = parse_int(args[1]);
        if (!value || *value < 0) {
            std::cout << "Invalid seed: " << args[1] << std::endl;
            return;
        }
        seed = static_cast<uint32_t>(*value);
    }

    void cmd_run(const std::vector<std::string>& args) {
        if (!require_battle()) return;

        int count = 1;
        if (args.size() > 1) {
            auto value = parse_int(args[1]);
            if (!value || *value < 1) {
                std::cout << "Invalid count: " << args[1] << std::endl;
                return;
            }
            count = *value;
        }

        if (count == 1) {
            BattleResult result = battle->simulate(seed);
            print_result(result);
            last_result = std::move(result);
            return;
        }

        // Batch runs skip the trace file
        BattleLogger* attached = trace_enabled ? trace_logger.get() : nullptr;
        battle->set_logger(nullptr);

        std::array<int, 3> outcomes = {0, 0, 0};
        long rating_total = 0;
        int turns_total = 0;
        for (int i = 0; i < count; i++) {
            BattleResult result = battle->simulate(seed + static_cast<uint32_t>(i));
            outcomes[static_cast<int>(result.winner)]++;
            rating_total += result.rating[0];
            turns_total += result.turns;
        }
        battle->set_logger(attached);

        const Combatant& c0 = battle->combatant(0);
        const Combatant& c1 = battle->combatant(1);
        std::cout << "\n=== " << count << " battles (seeds " << seed << ".."
                  << seed + static_cast<uint32_t>(count - 1) << ") ===" << std::endl;
        std::cout << "  " << side_name(c0) << " wins: " << outcomes[0] << std::endl;
        std::cout << "  " << side_name(c1) << " wins: " << outcomes[1] << std::endl;
        std::cout << "  Draws: " << outcomes[2] << std::endl;
        std::cout << "  Average rating (P0): " << rating_total / count << std::endl;
        std::cout << "  Average turns: " << turns_total / count << std::endl;
    }

    void cmd_timeline() {
        if (!last_result) {
            std::cout << "No battle has been run yet." << std::endl;
            return;
        }
        if (last_result->timeline.empty()) {
            std::cout << "Timeline is empty (enable \"timeline\" in the scenario)." << std::endl;
            return;
        }

        std::cout << "\n+-------------------------------------------------------------+" << std::endl;
        std::cout << "|  TIMELINE (" << last_result->timeline.size() << " events)" << std::endl;
        std::cout << "+-------------------------------------------------------------+" << std::endl;
        for (const auto& event : last_result->timeline) {
            std::cout << "  T" << std::setw(3) << event.turn << "  P" << static_cast<int>(event.actor)
                      << "  " << std::setw(7) << std::left << to_string(event.type) << std::right
                      << " " << event.move_id;
            if (event.type != ActionType::WAIT) {
                std::cout << "  dmg " << event.damage;
            }
            if (event.shielded) std::cout << " (shielded)";
            if (event.buff_applied) std::cout << " (buff)";
            std::cout << "  energy " << event.energy_after << std::endl;
        }
        std::cout << "+-------------------------------------------------------------+" << std::endl;
    }

    void cmd_mode(const std::vector<std::string>& args) {
        if (!require_battle()) return;
        if (args.size() < 3) {
            std::cout << "Usage: mode <side> <strategic|random>" << std::endl;
            return;
        }
        auto side = parse_int(args[1]);
        auto mode = parse_decision_mode(args[2]);
        if (!side || *side < 0 || *side > 1 || !mode) {
            std::cout << "Invalid mode arguments." << std::endl;
            return;
        }

        BattleConfig config = battle->config();
        config.modes[*side] = *mode;
        rebuild_battle(config);
    }

    void cmd_shields(const std::vector<std::string>& args) {
        if (!require_battle()) return;
        if (args.size() < 3) {
            std::cout << "Usage: shields <n0> <n1>" << std::endl;
            return;
        }
        auto s0 = parse_int(args[1]);
        auto s1 = parse_int(args[2]);
        if (!s0 || !s1) {
            std::cout << "Invalid shield counts." << std::endl;
            return;
        }

        BattleConfig config = battle->config();
        config.shields = {*s0, *s1};
        rebuild_battle(config);
    }

    void cmd_trace(const std::vector<std::string>& args) {
        if (args.size() < 2 || (args[1] != "on" && args[1] != "off")) {
            std::cout << "Trace is " << (trace_enabled ? "on" : "off")
                      << ". Usage: trace on|off" << std::endl;
            return;
        }

        trace_enabled = args[1] == "on";
        if (trace_enabled && !trace_logger) {
            trace_logger = std::make_unique<BattleLogger>(trace_dir);
        }
        if (trace_logger) {
            trace_logger->set_enabled(trace_enabled);
        }
        if (battle) {
            battle->set_logger(trace_enabled ? trace_logger.get() : nullptr);
        }
    }

    void cmd_type(const std::vector<std::string>& args) {
        if (args.size() < 3) {
            std::cout << "Usage: type <attacking> <defending> [defending2]" << std::endl;
            return;
        }

        auto attacking = parse_pokemon_type(args[1]);
        auto primary = parse_pokemon_type(args[2]);
        auto secondary = args.size() > 3 ? parse_pokemon_type(args[3])
                                         : std::optional<PokemonType>(PokemonType::NONE);
        if (!attacking || !primary || !secondary ||
            *attacking == PokemonType::NONE || *primary == PokemonType::NONE) {
            std::cout << "Unknown type." << std::endl;
            return;
        }

        std::cout << to_string(*attacking) << " vs " << to_string(*primary);
        if (*secondary != PokemonType::NONE) {
            std::cout << "/" << to_string(*secondary);
        }
        std::cout << ": x" << type_effectiveness(*attacking, *primary, *secondary) << std::endl;
    }

    void cmd_damage(const std::vector<std::string>& args) {
        if (!require_battle()) return;
        if (args.size() < 3) {
            std::cout << "Usage: damage <side> <fast|0|1>" << std::endl;
            return;
        }

        auto side = parse_int(args[1]);
        if (!side || *side < 0 || *side > 1) {
            std::cout << "Invalid side: " << args[1] << std::endl;
            return;
        }

        Combatant attacker = battle->combatant(*side);
        Combatant defender = battle->combatant(1 - *side);
        attacker.reset();
        defender.reset();

        if (args[2] == "fast") {
            std::cout << attacker.fast_move.name << ": "
                      << calculate_damage(attacker, defender, attacker.fast_move)
                      << " / " << defender.max_hp() << std::endl;
            return;
        }

        auto index = parse_int(args[2]);
        if (!index || *index < 0 || static_cast<size_t>(*index) >= attacker.charged_moves.size()) {
            std::cout << "Invalid move: " << args[2] << std::endl;
            return;
        }

        const ChargedMove& move = attacker.charged_moves[*index];
        ShieldDecision shield = would_shield(attacker, defender, move);
        std::cout << move.name << ": " << calculate_damage(attacker, defender, move)
                  << " / " << defender.max_hp()
                  << "  (dpe " << damage_per_energy(attacker, defender, move) << ")"
                  << "  shield: " << (shield.value ? "yes" : "no")
                  << " [" << shield.shield_weight << ":" << shield.no_shield_weight << "]"
                  << std::endl;
    }

    void run() {
        std::cout << "PvP Battle Simulator Console v" << get_version() << std::endl;
        std::cout << "=====================================\n" << std::endl;

        if (!scenario_path_.empty()) {
            cmd_load({"load"});
        }

        std::string line;
        while (true) {
            std::cout << "\n> ";
            if (!std::getline(std::cin, line)) {
                break;
            }

            auto args = split(line);
            if (args.empty()) continue;

            const std::string& cmd = args[0];

            if (cmd == "quit" || cmd == "exit" || cmd == "q") {
                break;
            } else if (cmd == "help" || cmd == "h" || cmd == "?") {
                print_help();
            } else if (cmd == "load") {
                cmd_load(args);
            } else if (cmd == "show" || cmd == "s") {
                cmd_show();
            } else if (cmd == "seed") {
                cmd_seed(args);
            } else if (cmd == "run" || cmd == "r") {
                cmd_run(args);
            } else if (cmd == "timeline" || cmd == "t") {
                cmd_timeline();
            } else if (cmd == "mode") {
                cmd_mode(args);
            } else if (cmd == "shields") {
                cmd_shields(args);
            } else if (cmd == "trace") {
                cmd_trace(args);
            } else if (cmd == "type") {
                cmd_type(args);
            } else if (cmd == "damage") {
                cmd_damage(args);
            } else {
                std::cout << "Unknown command: '" << cmd << "'. Type 'help' for commands." << std::endl;
            }
        }

        std::cout << "Goodbye!" << std::endl;
    }

private:
    std::string scenario_path_;

    bool require_battle() const {
        if (!battle) {
            std::cout << "No scenario loaded. Use 'load <path>'." << std::endl;
            return false;
        }
        return true;
    }

    void rebuild_battle(const BattleConfig& config) {
        const auto& combatants = loader.combatants();
        try {
            battle = Battle(combatants[0], combatants[1], config);
        } catch (const std::invalid_argument& e) {
            std::cout << "Invalid settings: " << e.what() << std::endl;
            return;
        }
        battle->set_logger(trace_enabled ? trace_logger.get() : nullptr);
    }

    void print_result(const BattleResult& result) const {
        const Combatant& c0 = battle->combatant(0);
        const Combatant& c1 = battle->combatant(1);

        std::cout << "\n=== Result (seed " << seed << ") ===" << std::endl;
        if (result.winner == BattleWinner::DRAW) {
            std::cout << "  Draw";
        } else {
            const Combatant& winner = result.winner == BattleWinner::PLAYER_0 ? c0 : c1;
            std::cout << "  Winner: " << side_name(winner);
        }
        std::cout << (result.timed_out ? " (timeout)" : "") << std::endl;

        std::cout << "  " << side_name(c0) << ": HP " << result.hp[0] << "/" << c0.max_hp()
                  << "  shields " << result.shields_remaining[0]
                  << "  rating " << result.rating[0] << std::endl;
        std::cout << "  " << side_name(c1) << ": HP " << result.hp[1] << "/" << c1.max_hp()
                  << "  shields " << result.shields_remaining[1]
                  << "  rating " << result.rating[1] << std::endl;
        std::cout << "  Turns: " << result.turns << "  Time remaining: "
                  << result.time_remaining << "s" << std::endl;
    }
};

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char** argv) {
    Console console(argc > 1 ? argv[1] : "data/scenarios/azumarill_vs_medicham.json");
    console.run();
    return 0;
}
