/**
 * PvP Battle Simulator - Type Effectiveness Implementation
 */

#include "type_chart.hpp"

namespace pvpsim {

namespace {

using T = PokemonType;

struct Matchup {
    PokemonType attacker;
    PokemonType defender;
    double multiplier;
};

// Non-neutral entries only
const Matchup MATCHUPS[] = {
    {T::NORMAL, T::ROCK, NOT_VERY_EFFECTIVE}, {T::NORMAL, T::GHOST, DOUBLE_RESIST},
    {T::NORMAL, T::STEEL, NOT_VERY_EFFECTIVE},

    {T::FIGHTING, T::NORMAL, SUPER_EFFECTIVE}, {T::FIGHTING, T::FLYING, NOT_VERY_EFFECTIVE},
    {T::FIGHTING, T::POISON, NOT_VERY_EFFECTIVE}, {T::FIGHTING, T::ROCK, SUPER_EFFECTIVE},
    {T::FIGHTING, T::BUG, NOT_VERY_EFFECTIVE}, {T::FIGHTING, T::GHOST, DOUBLE_RESIST},
    {T::FIGHTING, T::STEEL, SUPER_EFFECTIVE}, {T::FIGHTING, T::PSYCHIC, NOT_VERY_EFFECTIVE},
    {T::FIGHTING, T::ICE, SUPER_EFFECTIVE}, {T::FIGHTING, T::DARK, SUPER_EFFECTIVE},
    {T::FIGHTING, T::FAIRY, NOT_VERY_EFFECTIVE},

    {T::FLYING, T::FIGHTING, SUPER_EFFECTIVE}, {T::FLYING, T::ROCK, NOT_VERY_EFFECTIVE},
    {T::FLYING, T::BUG, SUPER_EFFECTIVE}, {T::FLYING, T::STEEL, NOT_VERY_EFFECTIVE},
    {T::FLYING, T::GRASS, SUPER_EFFECTIVE}, {T::FLYING, T::ELECTRIC, NOT_VERY_EFFECTIVE},

    {T::POISON, T::POISON, NOT_VERY_EFFECTIVE}, {T::POISON, T::GROUND, NOT_VERY_EFFECTIVE},
    {T::POISON, T::ROCK, NOT_VERY_EFFECTIVE}, {T::POISON, T::GHOST, NOT_VERY_EFFECTIVE},
    {T::POISON, T::STEEL, DOUBLE_RESIST}, {T::POISON, T::GRASS, SUPER_EFFECTIVE},
    {T::POISON, T::FAIRY, SUPER_EFFECTIVE},

    {T::GROUND, T::FLYING, DOUBLE_RESIST}, {T::GROUND, T::POISON, SUPER_EFFECTIVE},
    {T::GROUND, T::ROCK, SUPER_EFFECTIVE}, {T::GROUND, T::BUG, NOT_VERY_EFFECTIVE},
    {T::GROUND, T::STEEL, SUPER_EFFECTIVE}, {T::GROUND, T::FIRE, SUPER_EFFECTIVE},
    {T::GROUND, T::GRASS, NOT_VERY_EFFECTIVE}, {T::GROUND, T::ELECTRIC, SUPER_EFFECTIVE},

    {T::ROCK, T::FIGHTING, NOT_VERY_EFFECTIVE}, {T::ROCK, T::FLYING, SUPER_EFFECTIVE},
    {T::ROCK, T::GROUND, NOT_VERY_EFFECTIVE}, {T::ROCK, T::BUG, SUPER_EFFECTIVE},
    {T::ROCK, T::STEEL, NOT_VERY_EFFECTIVE}, {T::ROCK, T::FIRE, SUPER_EFFECTIVE},
    {T::ROCK, T::ICE, SUPER_EFFECTIVE},

    {T::BUG, T::FIGHTING, NOT_VERY_EFFECTIVE}, {T::BUG, T::FLYING, NOT_VERY_EFFECTIVE},
    {T::BUG, T::POISON, NOT_VERY_EFFECTIVE}, {T::BUG, T::GHOST, NOT_VERY_EFFECTIVE},
    {T::BUG, T::STEEL, NOT_VERY_EFFECTIVE}, {T::BUG, T::FIRE, NOT_VERY_EFFECTIVE},
    {T::BUG, T::GRASS, SUPER_EFFECTIVE}, {T::BUG, T::PSYCHIC, SUPER_EFFECTIVE},
    {T::BUG, T::DARK, SUPER_EFFECTIVE}, {T::BUG, T::FAIRY, NOT_VERY_EFFECTIVE},

    {T::GHOST, T::NORMAL, DOUBLE_RESIST}, {T::GHOST, T::GHOST, SUPER_EFFECTIVE},
    {T::GHOST, T::PSYCHIC, SUPER_EFFECTIVE}, {T::GHOST, T::DARK, NOT_VERY_EFFECTIVE},

    {T::STEEL, T::ROCK, SUPER_EFFECTIVE}, {T::STEEL, T::STEEL, NOT_VERY_EFFECTIVE},
    {T::STEEL, T::FIRE, NOT_VERY_EFFECTIVE}, {T::STEEL, T::WATER, NOT_VERY_EFFECTIVE},
    {T::STEEL, T::ELECTRIC, NOT_VERY_EFFECTIVE}, {T::STEEL, T::ICE, SUPER_EFFECTIVE},
    {T::STEEL, T::FAIRY, SUPER_EFFECTIVE},

    {T::FIRE, T::ROCK, NOT_VERY_EFFECTIVE}, {T::FIRE, T::BUG, SUPER_EFFECTIVE},
    {T::FIRE, T::STEEL, SUPER_EFFECTIVE}, {T::FIRE, T::FIRE, NOT_VERY_EFFECTIVE},
    {T::FIRE, T::WATER, NOT_VERY_EFFECTIVE}, {T::FIRE, T::GRASS, SUPER_EFFECTIVE},
    {T::FIRE, T::ICE, SUPER_EFFECTIVE}, {T::FIRE, T::DRAGON, NOT_VERY_EFFECTIVE},

    {T::WATER, T::GROUND, SUPER_EFFECTIVE}, {T::WATER, T::ROCK, SUPER_EFFECTIVE},
    {T::WATER, T::FIRE, SUPER_EFFECTIVE}, {T::WATER, T::WATER, NOT_VERY_EFFECTIVE},
    {T::WATER, T::GRASS, NOT_VERY_EFFECTIVE}, {T::WATER, T::DRAGON, NOT_VERY_EFFECTIVE},

    {T::GRASS, T::FLYING, NOT_VERY_EFFECTIVE}, {T::GRASS, T::POISON, NOT_VERY_EFFECTIVE},
    {T::GRASS, T::GROUND, SUPER_EFFECTIVE}, {T::GRASS, T::ROCK, SUPER_EFFECTIVE},
    {T::GRASS, T::BUG, NOT_VERY_EFFECTIVE}, {T::GRASS, T::STEEL, NOT_VERY_EFFECTIVE},
    {T::GRASS, T::FIRE, NOT_VERY_EFFECTIVE}, {T::GRASS, T::WATER, SUPER_EFFECTIVE},
    {T::GRASS, T::GRASS, NOT_VERY_EFFECTIVE}, {T::GRASS, T::DRAGON, NOT_VERY_EFFECTIVE},

    {T::ELECTRIC, T::FLYING, SUPER_EFFECTIVE}, {T::ELECTRIC, T::GROUND, DOUBLE_RESIST},
    {T::ELECTRIC, T::WATER, SUPER_EFFECTIVE}, {T::ELECTRIC, T::GRASS, NOT_VERY_EFFECTIVE},
    {T::ELECTRIC, T::ELECTRIC, NOT_VERY_EFFECTIVE}, {T::ELECTRIC, T::DRAGON, NOT_VERY_EFFECTIVE},

    {T::PSYCHIC, T::FIGHTING, SUPER_EFFECTIVE}, {T::PSYCHIC, T::POISON, SUPER_EFFECTIVE},
    {T::PSYCHIC, T::STEEL, NOT_VERY_EFFECTIVE}, {T::PSYCHIC, T::PSYCHIC, NOT_VERY_EFFECTIVE},
    {T::PSYCHIC, T::DARK, DOUBLE_RESIST},

    {T::ICE, T::FLYING, SUPER_EFFECTIVE}, {T::ICE, T::GROUND, SUPER_EFFECTIVE},
    {T::ICE, T::STEEL, NOT_VERY_EFFECTIVE}, {T::ICE, T::FIRE, NOT_VERY_EFFECTIVE},
    {T::ICE, T::WATER, NOT_VERY_EFFECTIVE}, {T::ICE, T::GRASS, SUPER_EFFECTIVE},
    {T::ICE, T::ICE, NOT_VERY_EFFECTIVE}, {T::ICE, T::DRAGON, SUPER_EFFECTIVE},

    {T::DRAGON, T::STEEL, NOT_VERY_EFFECTIVE}, {T::DRAGON, T::DRAGON, SUPER_EFFECTIVE},
    {T::DRAGON, T::FAIRY, DOUBLE_RESIST},

    {T::DARK, T::FIGHTING, NOT_VERY_EFFECTIVE}, {T::DARK, T::GHOST, SUPER_EFFECTIVE},
    {T::DARK, T::PSYCHIC, SUPER_EFFECTIVE}, {T::DARK, T::DARK, NOT_VERY_EFFECTIVE},
    {T::DARK, T::FAIRY, NOT_VERY_EFFECTIVE},

    {T::FAIRY, T::FIGHTING, SUPER_EFFECTIVE}, {T::FAIRY, T::POISON, NOT_VERY_EFFECTIVE},
    {T::FAIRY, T::STEEL, NOT_VERY_EFFECTIVE}, {T::FAIRY, T::FIRE, NOT_VERY_EFFECTIVE},
    {T::FAIRY, T::DRAGON, SUPER_EFFECTIVE}, {T::FAIRY, T::DARK, SUPER_EFFECTIVE},
};

using ChartTable = std::array<std::array<double, TYPE_COUNT>, TYPE_COUNT>;

ChartTable build_chart() {
    ChartTable chart;
    for (auto& row : chart) {
        row.fill(NEUTRAL);
    }
    for (const auto& m : MATCHUPS) {
        chart[type_index(m.attacker)][type_index(m.defender)] = m.multiplier;
    }
    return chart;
}

const ChartTable& chart() {
    static const ChartTable table = build_chart();
    return table;
}

} // anonymous namespace

double type_multiplier(PokemonType attacker, PokemonType defender) {
    if (attacker == PokemonType::NONE || defender == PokemonType::NONE) {
        return NEUTRAL;
    }
    return chart()[type_index(attacker)][type_index(defender)];
}

double type_effectiveness(PokemonType attacker, PokemonType primary, PokemonType secondary) {
    return type_multiplier(attacker, primary) * type_multiplier(attacker, secondary);
}

std::array<double, TYPE_COUNT> all_type_effectiveness(PokemonType primary, PokemonType secondary) {
    std::array<double, TYPE_COUNT> result;
    for (int i = 0; i < TYPE_COUNT; i++) {
        result[i] = type_effectiveness(static_cast<PokemonType>(i), primary, secondary);
    }
    return result;
}

} // namespace pvpsim
