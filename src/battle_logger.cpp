/**
 * PvP Battle Simulator - Battle Trace Logger Implementation
 */

#include "battle_logger.hpp"
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace pvpsim {

namespace {

std::string fmt_stage(int stage) {
    if (stage > 0) return "+" + std::to_string(stage);
    return std::to_string(stage);
}

} // anonymous namespace

BattleLogger::BattleLogger(const std::string& output_dir) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[Battle Logger] Failed to create directory: " << output_dir
                  << " (" << ec.message() << ")" << std::endl;
        enabled_ = false;
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream filename;
    filename << output_dir << "/battle_trace_"
             << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
    log_path_ = filename.str();

    log_file_.open(log_path_, std::ios::app);
    if (!log_file_.is_open()) {
        std::cerr << "[Battle Logger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "BATTLE TRACE - TICK BY TICK\n";
    log_file_ << "Started: " << timestamp_now() << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[Battle Logger] Logging to: " << log_path_ << std::endl;
}

BattleLogger::~BattleLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string BattleLogger::timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream timestamp;
    timestamp << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return timestamp.str();
}

std::string BattleLogger::format_combatant_line(const Combatant& combatant) const {
    std::ostringstream line;

    line << "P" << static_cast<int>(combatant.index) << " "
         << (combatant.name.empty() ? combatant.species_id : combatant.name)
         << " | HP: " << combatant.current_hp << "/" << combatant.max_hp()
         << " | Energy: " << combatant.energy
         << " | Shields: " << combatant.shields
         << " | Stages: [" << fmt_stage(combatant.stat_buffs[0]) << ", "
         << fmt_stage(combatant.stat_buffs[1]) << "]";

    if (combatant.cooldown > 0) {
        line << " | CD: " << combatant.cooldown << "ms";
    }

    return line.str();
}

std::string BattleLogger::format_action_description(const Combatant& actor,
                                                    const BattleAction& action) const {
    std::ostringstream desc;

    desc << to_string(action.type);

    if (action.type == ActionType::FAST) {
        desc << " - " << actor.fast_move.move_id;
    } else if (action.is_charged() && *action.charged_index < actor.charged_moves.size()) {
        desc << " - " << actor.charged_moves[*action.charged_index].move_id;
    }

    if (!action.reason.empty()) {
        desc << " {" << action.reason << "}";
    }

    return desc.str();
}

void BattleLogger::log_battle_start(const Combatant& side0, const Combatant& side1) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "BATTLE START\n";

    for (const Combatant* side : {&side0, &side1}) {
        log_file_ << format_combatant_line(*side) << "\n";
        log_file_ << "    CP " << side->calculate_cp()
                  << " | Fast: " << side->fast_move.move_id << " | Charged: [";
        for (size_t i = 0; i < side->charged_moves.size(); i++) {
            if (i > 0) log_file_ << ", ";
            log_file_ << side->charged_moves[i].move_id
                      << " (" << side->charged_moves[i].energy_cost << ")";
        }
        log_file_ << "]\n";
    }

    log_file_ << std::string(80, '=') << "\n\n";
    log_file_.flush();
}

void BattleLogger::log_action(int turn, const Combatant& actor, const BattleAction& action,
                              int damage, bool shielded) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "[TURN " << turn << " | P" << static_cast<int>(actor.index) << "] "
              << format_action_description(actor, action);

    if (action.type != ActionType::WAIT) {
        log_file_ << " | damage " << damage;
    }
    if (shielded) {
        log_file_ << " (SHIELDED)";
    }
    log_file_ << "\n";

    log_file_.flush();
}

void BattleLogger::log_state(int turn, const Combatant& side0, const Combatant& side1) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '-') << "\n";
    log_file_ << "[STATE @ TURN " << turn << "]\n";
    log_file_ << format_combatant_line(side0) << "\n";
    log_file_ << format_combatant_line(side1) << "\n";
    log_file_ << std::string(80, '-') << "\n\n";

    log_file_.flush();
}

void BattleLogger::log_battle_end(BattleWinner winner, const std::string& reason,
                                  int rating0, int rating1) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "BATTLE END\n";
    log_file_ << std::string(80, '=') << "\n";

    if (winner == BattleWinner::DRAW) {
        log_file_ << "Result: Draw\n";
    } else {
        log_file_ << "Winner: " << to_string(winner) << "\n";
    }

    log_file_ << "Reason: " << reason << "\n";
    log_file_ << "Ratings: " << rating0 << " / " << rating1 << "\n";
    log_file_ << "Ended: " << timestamp_now() << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    log_file_.flush();
}

} // namespace pvpsim
