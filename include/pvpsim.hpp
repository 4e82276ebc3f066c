/**
 * PvP Battle Simulator - C++ Implementation
 *
 * Turn-based battle simulation with a lookahead decision engine, used as
 * the inner loop of matchup ranking.
 *
 * Include this header to get access to the complete simulator API.
 */

#pragma once

// Core types
#include "types.hpp"

// Data model
#include "type_chart.hpp"
#include "move.hpp"
#include "combatant.hpp"

// Battle mechanics
#include "damage_calculator.hpp"
#include "shield_logic.hpp"

// Decision engine
#include "decision.hpp"
#include "move_search.hpp"
#include "action_logic.hpp"

// Simulation
#include "battle.hpp"
#include "battle_logger.hpp"

// Scenario files
#include "scenario_loader.hpp"

namespace pvpsim {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace pvpsim
