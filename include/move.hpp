/**
 * PvP Battle Simulator - Move Templates
 *
 * Immutable fast and charged move definitions. Shared read-only across
 * battles; combatants hold their own copies.
 */

#pragma once

#include "types.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace pvpsim {

/**
 * Convert a buff multiplier into a stat stage delta.
 *
 * 1.0 maps to 0. Any multiplier away from 1.0 moves at least one stage,
 * so the common 1.25 and 0.8 buffs are +1 and -1.
 */
inline int buff_multiplier_to_stage(double multiplier) {
    if (multiplier > 1.0) {
        return std::max(1, static_cast<int>(std::lround(2.0 * multiplier - 2.0)));
    }
    if (multiplier < 1.0 && multiplier > 0.0) {
        return -std::max(1, static_cast<int>(std::lround(2.0 / multiplier - 2.0)));
    }
    return 0;
}

inline int clamp_stage(int stage) {
    return std::clamp(stage, MIN_BUFF_STAGE, MAX_BUFF_STAGE);
}

/**
 * Fast move template.
 *
 * Damage and energy are granted when the move starts; the move occupies
 * `turns` ticks in total.
 */
struct FastMove {
    MoveID move_id;
    std::string name;
    PokemonType type = PokemonType::NORMAL;
    int power = 0;
    int energy_gain = 0;
    int turns = 1;

    FastMove() = default;

    FastMove(MoveID id, std::string move_name, PokemonType move_type,
             int move_power, int gain, int move_turns)
        : move_id(std::move(id))
        , name(std::move(move_name))
        , type(move_type)
        , power(move_power)
        , energy_gain(gain)
        , turns(move_turns)
    {}

    /** Cooldown in milliseconds. */
    int cooldown() const { return turns * TURN_DURATION_MS; }

    /** Damage per second, 0 when cooldown is 0. */
    double dps() const {
        if (cooldown() == 0) return 0.0;
        return power / (cooldown() / 1000.0);
    }

    /** Energy per second, 0 when cooldown is 0. */
    double eps() const {
        if (cooldown() == 0) return 0.0;
        return energy_gain / (cooldown() / 1000.0);
    }
};

/**
 * Charged move template.
 *
 * buffs[0] scales attack, buffs[1] scales defense of buff_target.
 */
struct ChargedMove {
    MoveID move_id;
    std::string name;
    PokemonType type = PokemonType::NORMAL;
    int power = 0;
    int energy_cost = 0;

    std::array<double, 2> buffs = {1.0, 1.0};
    BuffTarget buff_target = BuffTarget::SELF;
    double buff_chance = 0.0;

    ChargedMove() = default;

    ChargedMove(MoveID id, std::string move_name, PokemonType move_type,
                int move_power, int cost)
        : move_id(std::move(id))
        , name(std::move(move_name))
        , type(move_type)
        , power(move_power)
        , energy_cost(cost)
    {}

    /** Damage per energy, 0 when the move is free. */
    double dpe() const {
        if (energy_cost == 0) return 0.0;
        return static_cast<double>(power) / energy_cost;
    }

    bool has_buff() const {
        return buff_chance > 0.0 && (buffs[0] != 1.0 || buffs[1] != 1.0);
    }

    bool is_self_debuffing() const {
        return buff_chance > 0.0 && buff_target == BuffTarget::SELF &&
               (buffs[0] < 1.0 || buffs[1] < 1.0);
    }

    bool is_self_buffing() const {
        return buff_chance > 0.0 && buff_target == BuffTarget::SELF &&
               (buffs[0] > 1.0 || buffs[1] > 1.0);
    }

    bool is_opponent_debuffing() const {
        return buff_chance > 0.0 && buff_target == BuffTarget::OPPONENT &&
               (buffs[0] < 1.0 || buffs[1] < 1.0);
    }

    /** Lowers the user's own attack (Superpower style). */
    bool is_self_attack_debuffing() const {
        return buff_chance > 0.0 && buff_target == BuffTarget::SELF && buffs[0] < 1.0;
    }

    /** Self buff whose combined multiplier outweighs any drawback. */
    bool is_net_self_buffing() const {
        return is_self_buffing() && buffs[0] * buffs[1] > 1.0;
    }

    int attack_stage_delta() const { return buff_multiplier_to_stage(buffs[0]); }
    int defense_stage_delta() const { return buff_multiplier_to_stage(buffs[1]); }
};

} // namespace pvpsim
