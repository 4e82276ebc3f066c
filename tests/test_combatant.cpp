/**
 * Tests for Combatant Stats and State
 */

#include "combatant.hpp"
#include "test_helpers.hpp"

using namespace pvpsim;
using fixtures::near;

// ============================================================================
// CP MULTIPLIER
// ============================================================================

TEST(CpMultiplier, TableValues) {
    TEST_ASSERT_TRUE(near(cp_multiplier(1.0), 0.0939999967813491));
    TEST_ASSERT_TRUE(near(cp_multiplier(40.0), 0.790300011634826));
    TEST_ASSERT_TRUE(near(cp_multiplier(51.0), 0.845300018787384));
}

TEST(CpMultiplier, Interpolates) {
    double between = cp_multiplier(40.25);
    TEST_ASSERT_TRUE(near(between, (cp_multiplier(40.0) + cp_multiplier(40.5)) / 2.0));
}

TEST(CpMultiplier, OutOfRange) {
    TEST_ASSERT_TRUE(cp_multiplier(0.5) == 0.0);
    TEST_ASSERT_TRUE(cp_multiplier(51.5) == 0.0);
}

// ============================================================================
// DERIVED STATS
// ============================================================================

TEST(Combatant, Level40Stats) {
    Combatant azu = fixtures::azumarill();
    TEST_ASSERT_EQ(177, azu.max_hp());
    TEST_ASSERT_EQ(1293, azu.calculate_cp());
    TEST_ASSERT_TRUE(near(azu.calculate_stats().atk, 88.5136, 1e-3));
    TEST_ASSERT_TRUE(near(azu.calculate_stats().def, 120.1256, 1e-3));

    Combatant med = fixtures::medicham();
    TEST_ASSERT_EQ(122, med.max_hp());
    TEST_ASSERT_EQ(1159, med.calculate_cp());
}

TEST(Combatant, IvsAndLevel) {
    Combatant azu("azumarill", Stats{112, 152, 225},
                  {PokemonType::WATER, PokemonType::FAIRY}, fixtures::bubble(),
                  {fixtures::ice_beam()}, IVs{0, 15, 15}, 50.0);
    TEST_ASSERT_EQ(201, azu.max_hp());
    TEST_ASSERT_EQ(1583, azu.calculate_cp());
}

TEST(Combatant, ShadowModifiers) {
    Combatant med = fixtures::medicham();
    med.shadow_type = ShadowType::SHADOW;

    Stats stats = med.calculate_stats();
    TEST_ASSERT_TRUE(near(stats.atk, 121 * cp_multiplier(40.0) * 1.2, 1e-6));
    TEST_ASSERT_TRUE(near(stats.def, 152 * cp_multiplier(40.0) * 0.833333, 1e-6));
    TEST_ASSERT_EQ(122, med.max_hp());
    TEST_ASSERT_EQ(1270, med.calculate_cp());
}

TEST(Combatant, ConstructedAtFullHealth) {
    Combatant azu = fixtures::azumarill();
    TEST_ASSERT_EQ(azu.max_hp(), azu.current_hp);
    TEST_ASSERT_EQ(0, azu.energy);
    TEST_ASSERT_EQ(DEFAULT_SHIELDS, azu.shields);
    TEST_ASSERT_TRUE(near(azu.hp_ratio(), 1.0));
}

// ============================================================================
// VALIDATION
// ============================================================================

TEST(Combatant, RejectsBadIvs) {
    bool threw = false;
    try {
        Combatant bad("azumarill", Stats{112, 152, 225},
                      {PokemonType::WATER, PokemonType::FAIRY}, fixtures::bubble(),
                      {}, IVs{16, 0, 0});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
}

TEST(Combatant, RejectsBadLevel) {
    bool threw = false;
    try {
        Combatant bad("azumarill", Stats{112, 152, 225},
                      {PokemonType::WATER, PokemonType::FAIRY}, fixtures::bubble(),
                      {}, IVs{}, 52.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
}

TEST(Combatant, RejectsThreeChargedMoves) {
    bool threw = false;
    try {
        fixtures::azumarill({fixtures::ice_beam(), fixtures::play_rough(), fixtures::hydro_pump()});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
}

TEST(Combatant, RejectsBadState) {
    Combatant azu = fixtures::azumarill();
    azu.validate();

    azu.stat_buffs[0] = 5;
    bool threw = false;
    try {
        azu.validate();
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);

    azu.stat_buffs[0] = 0;
    azu.energy = 101;
    threw = false;
    try {
        azu.validate();
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
}

// ============================================================================
// STATE UPDATES
// ============================================================================

TEST(Combatant, EnergyCapsAt100) {
    Combatant azu = fixtures::azumarill();
    azu.energy = 95;
    azu.gain_energy(11);
    TEST_ASSERT_EQ(100, azu.energy);
}

TEST(Combatant, DamageFloorsAtZero) {
    Combatant med = fixtures::medicham();
    med.take_damage(40);
    TEST_ASSERT_EQ(82, med.current_hp);
    TEST_ASSERT_FALSE(med.is_fainted());

    med.take_damage(500);
    TEST_ASSERT_EQ(0, med.current_hp);
    TEST_ASSERT_TRUE(med.is_fainted());
}

TEST(Combatant, StagesClamp) {
    Combatant med = fixtures::medicham();
    med.apply_stage_delta(3, -2);
    med.apply_stage_delta(3, -3);
    TEST_ASSERT_EQ(4, med.stat_buffs[0]);
    TEST_ASSERT_EQ(-4, med.stat_buffs[1]);
}

TEST(Combatant, ResetRestoresState) {
    Combatant med = fixtures::medicham();
    med.take_damage(50);
    med.energy = 70;
    med.cooldown = 500;
    med.apply_stage_delta(2, 1);

    med.reset(1, 20);
    TEST_ASSERT_EQ(122, med.current_hp);
    TEST_ASSERT_EQ(20, med.energy);
    TEST_ASSERT_EQ(1, med.shields);
    TEST_ASSERT_EQ(0, med.cooldown);
    TEST_ASSERT_EQ(0, med.stat_buffs[0]);
    TEST_ASSERT_EQ(0, med.stat_buffs[1]);
}

TEST(Combatant, MoveIndexTiesPickFirst) {
    Combatant med = fixtures::medicham({fixtures::superpower(), fixtures::ice_punch()});
    TEST_ASSERT_EQ(0u, *med.cheapest_move_index());
    TEST_ASSERT_EQ(0u, *med.most_expensive_move_index());

    Combatant azu = fixtures::azumarill();
    TEST_ASSERT_EQ(0u, *azu.cheapest_move_index());
    TEST_ASSERT_EQ(1u, *azu.most_expensive_move_index());

    Combatant bare = fixtures::azumarill({});
    TEST_ASSERT_FALSE(bare.cheapest_move_index().has_value());
}
