/**
 * PvP Battle Simulator - Python Bindings
 *
 * pybind11 wrapper for the C++ simulator.
 * Lets the Python ranking layer run battles through the native engine.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "pvpsim.hpp"

namespace py = pybind11;

PYBIND11_MODULE(pvpsim_cpp, m) {
    m.doc() = "Turn-based PvP battle simulator with lookahead decision engine";

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<pvpsim::PokemonType>(m, "PokemonType")
        .value("NORMAL", pvpsim::PokemonType::NORMAL)
        .value("FIRE", pvpsim::PokemonType::FIRE)
        .value("WATER", pvpsim::PokemonType::WATER)
        .value("ELECTRIC", pvpsim::PokemonType::ELECTRIC)
        .value("GRASS", pvpsim::PokemonType::GRASS)
        .value("ICE", pvpsim::PokemonType::ICE)
        .value("FIGHTING", pvpsim::PokemonType::FIGHTING)
        .value("POISON", pvpsim::PokemonType::POISON)
        .value("GROUND", pvpsim::PokemonType::GROUND)
        .value("FLYING", pvpsim::PokemonType::FLYING)
        .value("PSYCHIC", pvpsim::PokemonType::PSYCHIC)
        .value("BUG", pvpsim::PokemonType::BUG)
        .value("ROCK", pvpsim::PokemonType::ROCK)
        .value("GHOST", pvpsim::PokemonType::GHOST)
        .value("DRAGON", pvpsim::PokemonType::DRAGON)
        .value("DARK", pvpsim::PokemonType::DARK)
        .value("STEEL", pvpsim::PokemonType::STEEL)
        .value("FAIRY", pvpsim::PokemonType::FAIRY)
        .value("NONE", pvpsim::PokemonType::NONE)
        .export_values();

    py::enum_<pvpsim::BuffTarget>(m, "BuffTarget")
        .value("SELF", pvpsim::BuffTarget::SELF)
        .value("OPPONENT", pvpsim::BuffTarget::OPPONENT);

    py::enum_<pvpsim::ShadowType>(m, "ShadowType")
        .value("NORMAL", pvpsim::ShadowType::NORMAL)
        .value("SHADOW", pvpsim::ShadowType::SHADOW)
        .value("PURIFIED", pvpsim::ShadowType::PURIFIED);

    py::enum_<pvpsim::ActionType>(m, "ActionType")
        .value("FAST", pvpsim::ActionType::FAST)
        .value("CHARGED", pvpsim::ActionType::CHARGED)
        .value("WAIT", pvpsim::ActionType::WAIT);

    py::enum_<pvpsim::DecisionMode>(m, "DecisionMode")
        .value("STRATEGIC", pvpsim::DecisionMode::STRATEGIC)
        .value("RANDOM", pvpsim::DecisionMode::RANDOM);

    py::enum_<pvpsim::BattleWinner>(m, "BattleWinner")
        .value("PLAYER_0", pvpsim::BattleWinner::PLAYER_0)
        .value("PLAYER_1", pvpsim::BattleWinner::PLAYER_1)
        .value("DRAW", pvpsim::BattleWinner::DRAW);

    // ========================================================================
    // MOVES
    // ========================================================================

    py::class_<pvpsim::FastMove>(m, "FastMove")
        .def(py::init<>())
        .def(py::init<pvpsim::MoveID, std::string, pvpsim::PokemonType, int, int, int>(),
             py::arg("move_id"), py::arg("name"), py::arg("type"),
             py::arg("power"), py::arg("energy_gain"), py::arg("turns"))
        .def_readwrite("move_id", &pvpsim::FastMove::move_id)
        .def_readwrite("name", &pvpsim::FastMove::name)
        .def_readwrite("type", &pvpsim::FastMove::type)
        .def_readwrite("power", &pvpsim::FastMove::power)
        .def_readwrite("energy_gain", &pvpsim::FastMove::energy_gain)
        .def_readwrite("turns", &pvpsim::FastMove::turns)
        .def("cooldown", &pvpsim::FastMove::cooldown)
        .def("dps", &pvpsim::FastMove::dps)
        .def("eps", &pvpsim::FastMove::eps);

    py::class_<pvpsim::ChargedMove>(m, "ChargedMove")
        .def(py::init<>())
        .def(py::init<pvpsim::MoveID, std::string, pvpsim::PokemonType, int, int>(),
             py::arg("move_id"), py::arg("name"), py::arg("type"),
             py::arg("power"), py::arg("energy_cost"))
        .def_readwrite("move_id", &pvpsim::ChargedMove::move_id)
        .def_readwrite("name", &pvpsim::ChargedMove::name)
        .def_readwrite("type", &pvpsim::ChargedMove::type)
        .def_readwrite("power", &pvpsim::ChargedMove::power)
        .def_readwrite("energy_cost", &pvpsim::ChargedMove::energy_cost)
        .def_readwrite("buffs", &pvpsim::ChargedMove::buffs)
        .def_readwrite("buff_target", &pvpsim::ChargedMove::buff_target)
        .def_readwrite("buff_chance", &pvpsim::ChargedMove::buff_chance)
        .def("dpe", &pvpsim::ChargedMove::dpe)
        .def("has_buff", &pvpsim::ChargedMove::has_buff)
        .def("is_self_debuffing", &pvpsim::ChargedMove::is_self_debuffing)
        .def("is_self_buffing", &pvpsim::ChargedMove::is_self_buffing);

    // ========================================================================
    // COMBATANT
    // ========================================================================

    py::class_<pvpsim::Stats>(m, "Stats")
        .def(py::init<>())
        .def(py::init([](double atk, double def, double hp) { return pvpsim::Stats{atk, def, hp}; }),
             py::arg("atk"), py::arg("def"), py::arg("hp"))
        .def_readwrite("atk", &pvpsim::Stats::atk)
        .def_readwrite("def_", &pvpsim::Stats::def)
        .def_readwrite("hp", &pvpsim::Stats::hp);

    py::class_<pvpsim::IVs>(m, "IVs")
        .def(py::init<>())
        .def(py::init([](int atk, int def, int hp) { return pvpsim::IVs{atk, def, hp}; }),
             py::arg("atk"), py::arg("def"), py::arg("hp"))
        .def_readwrite("atk", &pvpsim::IVs::atk)
        .def_readwrite("def_", &pvpsim::IVs::def)
        .def_readwrite("hp", &pvpsim::IVs::hp);

    py::class_<pvpsim::Combatant>(m, "Combatant")
        .def(py::init<>())
        .def(py::init<pvpsim::SpeciesID, pvpsim::Stats, std::array<pvpsim::PokemonType, 2>,
                      pvpsim::FastMove, std::vector<pvpsim::ChargedMove>,
                      pvpsim::IVs, double, pvpsim::ShadowType>(),
             py::arg("species_id"), py::arg("base_stats"), py::arg("types"),
             py::arg("fast_move"), py::arg("charged_moves"),
             py::arg("ivs") = pvpsim::IVs{}, py::arg("level") = 40.0,
             py::arg("shadow_type") = pvpsim::ShadowType::NORMAL)
        .def_readwrite("species_id", &pvpsim::Combatant::species_id)
        .def_readwrite("name", &pvpsim::Combatant::name)
        .def_readwrite("base_stats", &pvpsim::Combatant::base_stats)
        .def_readwrite("types", &pvpsim::Combatant::types)
        .def_readwrite("ivs", &pvpsim::Combatant::ivs)
        .def_readwrite("level", &pvpsim::Combatant::level)
        .def_readwrite("shadow_type", &pvpsim::Combatant::shadow_type)
        .def_readwrite("fast_move", &pvpsim::Combatant::fast_move)
        .def_readwrite("charged_moves", &pvpsim::Combatant::charged_moves)
        .def_readwrite("farm_energy", &pvpsim::Combatant::farm_energy)
        .def_readwrite("bait_shields", &pvpsim::Combatant::bait_shields)
        .def_readwrite("optimize_move_timing", &pvpsim::Combatant::optimize_move_timing)
        .def_readwrite("current_hp", &pvpsim::Combatant::current_hp)
        .def_readwrite("energy", &pvpsim::Combatant::energy)
        .def_readwrite("shields", &pvpsim::Combatant::shields)
        .def_readwrite("stat_buffs", &pvpsim::Combatant::stat_buffs)
        .def("validate", &pvpsim::Combatant::validate)
        .def("reset", &pvpsim::Combatant::reset,
             py::arg("starting_shields") = pvpsim::DEFAULT_SHIELDS, py::arg("starting_energy") = 0)
        .def("calculate_stats", &pvpsim::Combatant::calculate_stats)
        .def("max_hp", &pvpsim::Combatant::max_hp)
        .def("calculate_cp", &pvpsim::Combatant::calculate_cp)
        .def("hp_ratio", &pvpsim::Combatant::hp_ratio);

    m.def("cp_multiplier", &pvpsim::cp_multiplier, py::arg("level"));

    // ========================================================================
    // MECHANICS
    // ========================================================================

    m.def("type_effectiveness", &pvpsim::type_effectiveness,
          py::arg("attacking"), py::arg("primary"), py::arg("secondary") = pvpsim::PokemonType::NONE);

    m.def("stage_multiplier", &pvpsim::stage_multiplier, py::arg("stage"));

    m.def("fast_move_damage",
          py::overload_cast<const pvpsim::Combatant&, const pvpsim::Combatant&, const pvpsim::FastMove&>(
              &pvpsim::calculate_damage),
          py::arg("attacker"), py::arg("defender"), py::arg("move"));

    m.def("charged_move_damage",
          py::overload_cast<const pvpsim::Combatant&, const pvpsim::Combatant&, const pvpsim::ChargedMove&>(
              &pvpsim::calculate_damage),
          py::arg("attacker"), py::arg("defender"), py::arg("move"));

    m.def("battle_rating", &pvpsim::battle_rating,
          py::arg("own_hp"), py::arg("own_max_hp"), py::arg("opponent_hp"), py::arg("opponent_max_hp"));

    py::class_<pvpsim::ShieldDecision>(m, "ShieldDecision")
        .def_readonly("value", &pvpsim::ShieldDecision::value)
        .def_readonly("shield_weight", &pvpsim::ShieldDecision::shield_weight)
        .def_readonly("no_shield_weight", &pvpsim::ShieldDecision::no_shield_weight)
        .def("shield_probability", &pvpsim::ShieldDecision::shield_probability);

    m.def("would_shield",
          py::overload_cast<const pvpsim::Combatant&, const pvpsim::Combatant&, const pvpsim::ChargedMove&>(
              &pvpsim::would_shield),
          py::arg("attacker"), py::arg("defender"), py::arg("move"));

    // ========================================================================
    // BATTLE
    // ========================================================================

    py::class_<pvpsim::ActionPolicy>(m, "ActionPolicy")
        .def(py::init<>())
        .def_readwrite("bait_dpe_ratio", &pvpsim::ActionPolicy::bait_dpe_ratio)
        .def_readwrite("shield_bait_weight", &pvpsim::ActionPolicy::shield_bait_weight)
        .def_readwrite("farm_completion_weight", &pvpsim::ActionPolicy::farm_completion_weight)
        .def_readwrite("farm_completion_margin", &pvpsim::ActionPolicy::farm_completion_margin)
        .def_readwrite("deferral_energy_factor", &pvpsim::ActionPolicy::deferral_energy_factor)
        .def_readwrite("self_buff_energy_margin", &pvpsim::ActionPolicy::self_buff_energy_margin)
        .def_readwrite("similar_energy_window", &pvpsim::ActionPolicy::similar_energy_window)
        .def_readwrite("substantial_health_ratio", &pvpsim::ActionPolicy::substantial_health_ratio)
        .def_readwrite("low_health_bait_ratio", &pvpsim::ActionPolicy::low_health_bait_ratio)
        .def_readwrite("low_health_bait_energy", &pvpsim::ActionPolicy::low_health_bait_energy)
        .def_readwrite("max_search_states", &pvpsim::ActionPolicy::max_search_states)
        .def_readwrite("viable_tolerance", &pvpsim::ActionPolicy::viable_tolerance);

    py::class_<pvpsim::BattleConfig>(m, "BattleConfig")
        .def(py::init<>())
        .def_readwrite("shields", &pvpsim::BattleConfig::shields)
        .def_readwrite("starting_energy", &pvpsim::BattleConfig::starting_energy)
        .def_readwrite("max_turns", &pvpsim::BattleConfig::max_turns)
        .def_readwrite("modes", &pvpsim::BattleConfig::modes)
        .def_readwrite("record_timeline", &pvpsim::BattleConfig::record_timeline)
        .def_readwrite("policy", &pvpsim::BattleConfig::policy);

    py::class_<pvpsim::BattleAction>(m, "BattleAction")
        .def_readonly("type", &pvpsim::BattleAction::type)
        .def_readonly("charged_index", &pvpsim::BattleAction::charged_index)
        .def_readonly("reason", &pvpsim::BattleAction::reason)
        // Factory methods
        .def_static("fast", &pvpsim::BattleAction::fast, py::arg("reason") = "")
        .def_static("charged", &pvpsim::BattleAction::charged, py::arg("index"), py::arg("reason") = "")
        .def_static("wait", &pvpsim::BattleAction::wait, py::arg("reason") = "");

    py::class_<pvpsim::TimelineEvent>(m, "TimelineEvent")
        .def_readonly("turn", &pvpsim::TimelineEvent::turn)
        .def_readonly("actor", &pvpsim::TimelineEvent::actor)
        .def_readonly("type", &pvpsim::TimelineEvent::type)
        .def_readonly("move_id", &pvpsim::TimelineEvent::move_id)
        .def_readonly("damage", &pvpsim::TimelineEvent::damage)
        .def_readonly("shielded", &pvpsim::TimelineEvent::shielded)
        .def_readonly("buff_applied", &pvpsim::TimelineEvent::buff_applied)
        .def_readonly("actor_stages", &pvpsim::TimelineEvent::actor_stages)
        .def_readonly("opponent_stages", &pvpsim::TimelineEvent::opponent_stages)
        .def_readonly("energy_after", &pvpsim::TimelineEvent::energy_after);

    py::class_<pvpsim::BattleResult>(m, "BattleResult")
        .def_readonly("winner", &pvpsim::BattleResult::winner)
        .def_readonly("hp", &pvpsim::BattleResult::hp)
        .def_readonly("rating", &pvpsim::BattleResult::rating)
        .def_readonly("turns", &pvpsim::BattleResult::turns)
        .def_readonly("time_remaining", &pvpsim::BattleResult::time_remaining)
        .def_readonly("shields_remaining", &pvpsim::BattleResult::shields_remaining)
        .def_readonly("timed_out", &pvpsim::BattleResult::timed_out)
        .def_readonly("timeline", &pvpsim::BattleResult::timeline);

    py::class_<pvpsim::BattleLogger>(m, "BattleLogger")
        .def(py::init<const std::string&>(), py::arg("output_dir") = "traces")
        .def("get_log_path", &pvpsim::BattleLogger::get_log_path)
        .def("is_enabled", &pvpsim::BattleLogger::is_enabled)
        .def("set_enabled", &pvpsim::BattleLogger::set_enabled);

    py::class_<pvpsim::Battle>(m, "Battle")
        .def(py::init<pvpsim::Combatant, pvpsim::Combatant, pvpsim::BattleConfig>(),
             py::arg("side0"), py::arg("side1"), py::arg("config") = pvpsim::BattleConfig{})
        .def("simulate", py::overload_cast<uint32_t>(&pvpsim::Battle::simulate, py::const_),
             py::arg("seed"))
        .def("set_logger", &pvpsim::Battle::set_logger, py::keep_alive<1, 2>())
        // Python policies receive (self, opponent); the engine's Rng stays internal
        .def("set_decision_policy",
             [](pvpsim::Battle& battle, pvpsim::SideIndex side,
                std::function<pvpsim::BattleAction(const pvpsim::Combatant&,
                                                   const pvpsim::Combatant&)> policy) {
                 if (!policy) {
                     battle.set_decision_policy(side, nullptr);
                     return;
                 }
                 battle.set_decision_policy(side,
                     [policy](const pvpsim::Combatant& self, const pvpsim::Combatant& opponent,
                              pvpsim::Rng&) { return policy(self, opponent); });
             },
             py::arg("side"), py::arg("policy"))
        .def("combatant", &pvpsim::Battle::combatant, py::return_value_policy::reference_internal)
        .def("config", &pvpsim::Battle::config, py::return_value_policy::reference_internal);

    // ========================================================================
    // SCENARIO LOADER
    // ========================================================================

    py::class_<pvpsim::ScenarioLoader>(m, "ScenarioLoader")
        .def(py::init<>())
        .def("load_from_json", &pvpsim::ScenarioLoader::load_from_json)
        .def("load_from_string", &pvpsim::ScenarioLoader::load_from_string)
        .def("get_fast_move", &pvpsim::ScenarioLoader::get_fast_move, py::return_value_policy::reference)
        .def("get_charged_move", &pvpsim::ScenarioLoader::get_charged_move, py::return_value_policy::reference)
        .def("has_move", &pvpsim::ScenarioLoader::has_move)
        .def("move_count", &pvpsim::ScenarioLoader::move_count)
        .def("combatants", &pvpsim::ScenarioLoader::combatants)
        .def("config", &pvpsim::ScenarioLoader::config)
        .def("seed", &pvpsim::ScenarioLoader::seed)
        .def("create_battle", &pvpsim::ScenarioLoader::create_battle);

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = pvpsim::get_version();
    m.attr("__version__") = pvpsim::get_version();
}
