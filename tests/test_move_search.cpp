/**
 * Tests for Bait Planning, Deferral and Move Sequence Search
 */

#include "move_search.hpp"
#include "test_helpers.hpp"

using namespace pvpsim;

static std::vector<size_t> indices(std::initializer_list<size_t> list) {
    return std::vector<size_t>(list);
}

// ============================================================================
// BAIT PLANNING
// ============================================================================

TEST(BaitPlan, FarmsWhenCostlyMoveIsMuchMoreEfficient) {
    Combatant azu = fixtures::azumarill();  // Ice Beam 34/55, Play Rough 64/60
    Combatant med = fixtures::medicham();
    ActionPolicy policy;

    BaitPlan plan = plan_bait(azu, med, indices({0, 1}), 55, 2, policy);
    TEST_ASSERT_EQ(std::string("farm"), plan.reason);
    TEST_ASSERT_TRUE(plan.moves == indices({1}));
    TEST_ASSERT_TRUE(plan.build_energy);
}

TEST(BaitPlan, BaitsWithCheapMove) {
    Combatant azu = fixtures::azumarill({fixtures::ice_beam(), fixtures::hydro_pump()});
    Combatant med = fixtures::medicham();
    ActionPolicy policy;

    BaitPlan plan = plan_bait(azu, med, indices({0, 1}), 55, 2, policy);
    TEST_ASSERT_EQ(std::string("bait"), plan.reason);
    TEST_ASSERT_TRUE(plan.moves == indices({0}));
    TEST_ASSERT_FALSE(plan.build_energy);

    plan = plan_bait(azu, med, indices({0, 1}), 40, 2, policy);
    TEST_ASSERT_TRUE(plan.build_energy);
}

TEST(BaitPlan, OpenWithoutShields) {
    Combatant azu = fixtures::azumarill({fixtures::ice_beam(), fixtures::hydro_pump()});
    Combatant med = fixtures::medicham();
    ActionPolicy policy;

    BaitPlan plan = plan_bait(azu, med, indices({0, 1}), 55, 0, policy);
    TEST_ASSERT_EQ(std::string("open"), plan.reason);
    TEST_ASSERT_TRUE(plan.moves == indices({0, 1}));
    TEST_ASSERT_FALSE(plan.build_energy);

    plan = plan_bait(azu, med, indices({0, 1}), 40, 0, policy);
    TEST_ASSERT_TRUE(plan.build_energy);
}

TEST(BaitPlan, FarmEnergyFlag) {
    Combatant azu = fixtures::azumarill({fixtures::ice_beam(), fixtures::hydro_pump()});
    azu.farm_energy = true;
    Combatant med = fixtures::medicham();

    BaitPlan plan = plan_bait(azu, med, indices({0, 1}), 55, 0, ActionPolicy{});
    TEST_ASSERT_EQ(std::string("farm"), plan.reason);
    TEST_ASSERT_TRUE(plan.moves == indices({1}));
    TEST_ASSERT_TRUE(plan.build_energy);
}

TEST(BaitPlan, BaitingDisabled) {
    Combatant azu = fixtures::azumarill({fixtures::ice_beam(), fixtures::hydro_pump()});
    azu.bait_shields = false;
    Combatant med = fixtures::medicham();

    BaitPlan plan = plan_bait(azu, med, indices({0, 1}), 55, 2, ActionPolicy{});
    TEST_ASSERT_EQ(std::string("open"), plan.reason);
}

TEST(BaitPlan, NoBaitAtLowHealth) {
    Combatant azu = fixtures::azumarill({fixtures::ice_beam(), fixtures::hydro_pump()});
    azu.current_hp = 40;
    Combatant med = fixtures::medicham();

    BaitPlan plan = plan_bait(azu, med, indices({0, 1}), 55, 2, ActionPolicy{});
    TEST_ASSERT_EQ(std::string("open"), plan.reason);

    // Enough energy for a bait and a follow-up lifts the restriction
    plan = plan_bait(azu, med, indices({0, 1}), 75, 2, ActionPolicy{});
    TEST_ASSERT_EQ(std::string("bait"), plan.reason);
}

TEST(BaitPlan, NoCandidates) {
    Combatant azu = fixtures::azumarill();
    Combatant med = fixtures::medicham();

    BaitPlan plan = plan_bait(azu, med, {}, 100, 2, ActionPolicy{});
    TEST_ASSERT_TRUE(plan.moves.empty());
    TEST_ASSERT_TRUE(plan.build_energy);
}

// ============================================================================
// SELF-DEBUFF DEFERRAL
// ============================================================================

static Combatant deferral_attacker() {
    Combatant med = fixtures::medicham({fixtures::superpower(), fixtures::ice_punch()});
    med.shields = 0;
    med.energy = 45;
    return med;
}

TEST(Deferral, DefersUnderUnshieldedThreat) {
    Combatant med = deferral_attacker();
    Combatant azu = fixtures::azumarill();
    azu.energy = 100;

    TEST_ASSERT_TRUE(should_defer_self_debuffing(med, azu, fixtures::superpower(), ActionPolicy{}));
    TEST_ASSERT_FALSE(should_defer_self_debuffing(med, azu, fixtures::ice_punch(), ActionPolicy{}));
}

TEST(Deferral, ShieldsLeftNoDeferral) {
    Combatant med = deferral_attacker();
    med.shields = 1;
    Combatant azu = fixtures::azumarill();
    azu.energy = 100;

    TEST_ASSERT_FALSE(should_defer_self_debuffing(med, azu, fixtures::superpower(), ActionPolicy{}));
}

TEST(Deferral, OpponentCannotThrow) {
    Combatant med = deferral_attacker();
    Combatant azu = fixtures::azumarill();
    azu.energy = 50;

    TEST_ASSERT_FALSE(should_defer_self_debuffing(med, azu, fixtures::superpower(), ActionPolicy{}));
}

TEST(Deferral, HighEnergyNoDeferral) {
    Combatant med = deferral_attacker();
    med.energy = 80;
    Combatant azu = fixtures::azumarill();
    azu.energy = 100;

    TEST_ASSERT_FALSE(should_defer_self_debuffing(med, azu, fixtures::superpower(), ActionPolicy{}));
}

TEST(Deferral, NetSelfBuffWithMarginNotDeferred) {
    ChargedMove surge("SURGE", "Surge", PokemonType::FIGHTING, 60, 40);
    surge.buffs = {1.5, 0.8};
    surge.buff_target = BuffTarget::SELF;
    surge.buff_chance = 1.0;

    Combatant med = deferral_attacker();
    Combatant azu = fixtures::azumarill();
    azu.energy = 100;

    TEST_ASSERT_TRUE(should_defer_self_debuffing(med, azu, surge, ActionPolicy{}));

    med.energy = 50;
    TEST_ASSERT_FALSE(should_defer_self_debuffing(med, azu, surge, ActionPolicy{}));
}

// ============================================================================
// BAIT WEIGHT
// ============================================================================

TEST(BaitWeight, FarmCompletionBonus) {
    Combatant azu = fixtures::azumarill({fixtures::ice_beam(), fixtures::hydro_pump()});
    Combatant med = fixtures::medicham();
    ActionPolicy policy;

    TEST_ASSERT_NEAR(1.2, bait_weight(azu, med, 1, 73, 0, policy), 1e-9);
    TEST_ASSERT_NEAR(1.0, bait_weight(azu, med, 1, 50, 0, policy), 1e-9);
}

TEST(BaitWeight, ShieldDrawingMove) {
    Combatant azu = fixtures::azumarill({fixtures::ice_beam(), fixtures::hydro_pump()});
    Combatant med = fixtures::medicham();
    ActionPolicy policy;

    // Ice Beam leaves a healthy Medicham well out of reach
    TEST_ASSERT_NEAR(1.0, bait_weight(azu, med, 0, 55, 2, policy), 1e-9);

    med.current_hp = 60;
    TEST_ASSERT_NEAR(1.3, bait_weight(azu, med, 0, 55, 2, policy), 1e-9);
    TEST_ASSERT_NEAR(1.0, bait_weight(azu, med, 0, 55, 0, policy), 1e-9);

    azu.bait_shields = false;
    TEST_ASSERT_NEAR(1.0, bait_weight(azu, med, 0, 55, 2, policy), 1e-9);
}

TEST(BaitWeight, ShieldAndFarmBoostsStack) {
    Combatant azu = fixtures::azumarill({fixtures::ice_beam(), fixtures::hydro_pump()});
    Combatant med = fixtures::medicham();
    med.current_hp = 60;

    TEST_ASSERT_NEAR(1.3 * 1.2, bait_weight(azu, med, 1, 75, 2, ActionPolicy{}), 1e-9);
    TEST_ASSERT_NEAR(1.3, bait_weight(azu, med, 1, 50, 2, ActionPolicy{}), 1e-9);
}

TEST(BaitWeight, EqualCostsAreNeutral) {
    Combatant med = fixtures::medicham({fixtures::superpower(), fixtures::ice_punch()});
    Combatant azu = fixtures::azumarill();
    TEST_ASSERT_NEAR(1.0, bait_weight(med, azu, 0, 40, 2, ActionPolicy{}), 1e-9);
}

// ============================================================================
// SEARCH
// ============================================================================

TEST(MoveSearch, FindsALine) {
    Combatant azu = fixtures::azumarill();
    Combatant med = fixtures::medicham();
    ActionPolicy policy;
    Rng rng(42);

    SearchResult result = search_move_sequence(azu, med, indices({0, 1}), policy, rng);
    TEST_ASSERT_TRUE(result.found());
    TEST_ASSERT_TRUE(result.sequence.front() < 2);
    TEST_ASSERT_TRUE(result.states_evaluated >= 1);
    TEST_ASSERT_TRUE(result.states_evaluated <= policy.max_search_states);
    TEST_ASSERT_TRUE(result.expected_turns > 0.0);
    TEST_ASSERT_TRUE(result.value > 0.0);
}

TEST(MoveSearch, RootRestrictedToGivenMoves) {
    Combatant azu = fixtures::azumarill();
    Combatant med = fixtures::medicham();
    Rng rng(42);

    SearchResult result = search_move_sequence(azu, med, indices({1}), ActionPolicy{}, rng);
    TEST_ASSERT_TRUE(result.found());
    TEST_ASSERT_EQ(1u, result.sequence.front());
}

TEST(MoveSearch, Deterministic) {
    Combatant azu = fixtures::azumarill();
    Combatant med = fixtures::medicham();
    azu.energy = 30;

    Rng first(123);
    Rng second(123);
    SearchResult a = search_move_sequence(azu, med, indices({0, 1}), ActionPolicy{}, first);
    SearchResult b = search_move_sequence(azu, med, indices({0, 1}), ActionPolicy{}, second);
    TEST_ASSERT_TRUE(a.sequence == b.sequence);
    TEST_ASSERT_EQ(a.states_evaluated, b.states_evaluated);
    TEST_ASSERT_TRUE(a.expected_turns == b.expected_turns);
}

TEST(MoveSearch, RespectsStateBudget) {
    Combatant azu = fixtures::azumarill();
    Combatant med = fixtures::medicham();
    ActionPolicy policy;
    policy.max_search_states = 1;
    Rng rng(1);

    SearchResult result = search_move_sequence(azu, med, indices({0, 1}), policy, rng);
    TEST_ASSERT_EQ(1, result.states_evaluated);
    TEST_ASSERT_TRUE(result.found());
}

TEST(MoveSearch, ImmediateKnockout) {
    Combatant azu = fixtures::azumarill();
    azu.energy = 60;
    Combatant med = fixtures::medicham();
    med.current_hp = 1;
    med.shields = 0;
    Rng rng(9);

    SearchResult result = search_move_sequence(azu, med, indices({0, 1}), ActionPolicy{}, rng);
    TEST_ASSERT_TRUE(result.found());
    TEST_ASSERT_TRUE(fixtures::near(result.expected_turns, 1.0));
    // Play Rough also completes the costly move, which weights it higher
    TEST_ASSERT_EQ(1u, result.sequence.front());
}

TEST(MoveSearch, EmptyRoot) {
    Combatant azu = fixtures::azumarill();
    Combatant med = fixtures::medicham();
    Rng rng(1);

    SearchResult result = search_move_sequence(azu, med, {}, ActionPolicy{}, rng);
    TEST_ASSERT_FALSE(result.found());
    TEST_ASSERT_EQ(0, result.states_evaluated);
}

// ============================================================================
// REORDERING
// ============================================================================

TEST(Reorder, HardestHitFirstWithoutShields) {
    Combatant azu = fixtures::azumarill({fixtures::ice_beam(), fixtures::hydro_pump()});
    Combatant med = fixtures::medicham();
    med.shields = 0;

    auto order = reorder_moves(azu, med, indices({0, 1}), indices({0, 1}), ActionPolicy{});
    TEST_ASSERT_TRUE(order == indices({1, 0}));
}

TEST(Reorder, CheapestFirstWhileBaiting) {
    Combatant azu = fixtures::azumarill({fixtures::ice_beam(), fixtures::hydro_pump()});
    Combatant med = fixtures::medicham();
    med.shields = 2;

    auto order = reorder_moves(azu, med, indices({1, 0}), indices({0, 1}), ActionPolicy{});
    TEST_ASSERT_TRUE(order == indices({0, 1}));
}

TEST(Reorder, CheapestFirstAgainstShieldsWithoutBaiting) {
    Combatant azu = fixtures::azumarill({fixtures::ice_beam(), fixtures::hydro_pump()});
    azu.bait_shields = false;
    Combatant med = fixtures::medicham();
    med.shields = 2;

    auto order = reorder_moves(azu, med, indices({1, 0}), indices({0, 1}), ActionPolicy{});
    TEST_ASSERT_TRUE(order == indices({0, 1}));
}

TEST(Reorder, SelfDebuffWaitsWhileHealthy) {
    Combatant med = fixtures::medicham({fixtures::superpower(), fixtures::ice_punch()});
    Combatant azu = fixtures::azumarill();
    azu.shields = 0;

    auto order = reorder_moves(med, azu, indices({0}), indices({0, 1}), ActionPolicy{});
    TEST_ASSERT_TRUE(order == indices({1, 0}));
}

TEST(Reorder, NetSelfBuffStaysFirst) {
    Combatant med = fixtures::medicham();
    Combatant azu = fixtures::azumarill();
    azu.shields = 0;

    auto order = reorder_moves(med, azu, indices({0, 1}), indices({0, 1}), ActionPolicy{});
    TEST_ASSERT_TRUE(order == indices({0, 1}));
}

TEST(Reorder, PrefersEfficientMoveOfSimilarCost) {
    ChargedMove cheaper("CROSS_CHOP", "Cross Chop", PokemonType::FIGHTING, 60, 45);
    ChargedMove pricier("BRICK_BREAK", "Brick Break", PokemonType::FIGHTING, 60, 50);
    Combatant med = fixtures::medicham({cheaper, pricier});
    Combatant azu = fixtures::azumarill();
    azu.shields = 0;

    auto order = reorder_moves(med, azu, indices({1, 0}), indices({0, 1}), ActionPolicy{});
    TEST_ASSERT_TRUE(order == indices({0, 1}));
}

TEST(Reorder, DropsDuplicates) {
    Combatant azu = fixtures::azumarill({fixtures::ice_beam(), fixtures::hydro_pump()});
    Combatant med = fixtures::medicham();
    med.shields = 2;

    auto order = reorder_moves(azu, med, indices({0, 0, 1, 0}), indices({0, 1}), ActionPolicy{});
    TEST_ASSERT_EQ(2u, order.size());
}
