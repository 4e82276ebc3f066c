/**
 * Tests for the Action Decision Engine
 */

#include "action_logic.hpp"
#include "test_helpers.hpp"

using namespace pvpsim;

// ============================================================================
// BUILDING BLOCKS
// ============================================================================

TEST(ActionLogic, ChargedPriorityByAttack) {
    Combatant azu = fixtures::azumarill();
    Combatant med = fixtures::medicham();
    TEST_ASSERT_TRUE(wins_charged_priority(med, azu));
    TEST_ASSERT_FALSE(wins_charged_priority(azu, med));

    // Equal attack favours the asking side
    TEST_ASSERT_TRUE(wins_charged_priority(med, fixtures::medicham()));
}

TEST(ActionLogic, LethalMoveCheapestFirst) {
    Combatant azu = fixtures::azumarill();
    azu.energy = 60;
    Combatant med = fixtures::medicham();
    med.current_hp = 30;
    med.shields = 0;

    auto lethal = find_lethal_move(azu, med);
    TEST_ASSERT_TRUE(lethal.has_value());
    TEST_ASSERT_EQ(0u, *lethal);
}

TEST(ActionLogic, NoLethalWhenShielded) {
    Combatant azu = fixtures::azumarill();
    azu.energy = 60;
    Combatant med = fixtures::medicham();
    med.current_hp = 30;
    med.shields = 1;

    TEST_ASSERT_FALSE(find_lethal_move(azu, med).has_value());
}

TEST(ActionLogic, NoLethalWhenFastMoveFinishes) {
    Combatant azu = fixtures::azumarill();
    azu.energy = 60;
    Combatant med = fixtures::medicham();
    med.current_hp = 3;
    med.shields = 0;

    TEST_ASSERT_FALSE(find_lethal_move(azu, med).has_value());
}

TEST(ActionLogic, LethalAvoidsSelfDebuff) {
    Combatant med = fixtures::medicham({fixtures::superpower(), fixtures::ice_punch()});
    med.energy = 40;
    Combatant azu = fixtures::azumarill();
    azu.current_hp = 12;
    azu.shields = 0;

    auto lethal = find_lethal_move(med, azu);
    TEST_ASSERT_TRUE(lethal.has_value());
    TEST_ASSERT_EQ(1u, *lethal);
}

TEST(ActionLogic, TurnsToLiveNoThreat) {
    Combatant med = fixtures::medicham();
    med.shields = 0;
    Combatant azu = fixtures::azumarill();
    azu.energy = 100;

    TEST_ASSERT_EQ(NO_THREAT, turns_to_live(med, azu));
}

TEST(ActionLogic, TurnsToLiveImmediateThreat) {
    Combatant azu = fixtures::azumarill();
    azu.current_hp = 10;
    azu.shields = 0;
    Combatant med = fixtures::medicham();
    med.energy = 100;

    TEST_ASSERT_EQ(0, turns_to_live(azu, med));
}

TEST(ActionLogic, TurnsToLiveExtraTurnForPriority) {
    // Medicham strikes first and its fast moves line up with a 4-turn Bubble
    Combatant med = fixtures::medicham();
    med.current_hp = 10;
    med.shields = 0;
    Combatant azu = fixtures::azumarill();
    azu.fast_move.turns = 4;
    azu.energy = 100;

    TEST_ASSERT_EQ(1, turns_to_live(med, azu));
}

TEST(ActionLogic, TurnsToLiveNoExtraTurnWithoutPriority) {
    // Aligned cooldowns do not help the side that moves second
    Combatant azu = fixtures::azumarill();
    azu.fast_move.turns = 2;
    azu.current_hp = 10;
    azu.shields = 0;
    Combatant med = fixtures::medicham();
    med.energy = 100;

    TEST_ASSERT_EQ(0, turns_to_live(azu, med));
}

TEST(ActionLogic, StrongestAffordable) {
    Combatant azu = fixtures::azumarill();
    azu.energy = 58;
    Combatant med = fixtures::medicham();

    auto best = strongest_affordable_move(azu, med, {0, 1});
    TEST_ASSERT_TRUE(best.has_value());
    TEST_ASSERT_EQ(0u, *best);

    azu.energy = 60;
    TEST_ASSERT_EQ(1u, *strongest_affordable_move(azu, med, {0, 1}));
    TEST_ASSERT_EQ(0u, *strongest_affordable_move(azu, med, {0}));

    azu.energy = 10;
    TEST_ASSERT_FALSE(strongest_affordable_move(azu, med, {0, 1}).has_value());
}

TEST(ActionLogic, TimingDisabledByFlag) {
    Combatant azu = fixtures::azumarill();
    Combatant med = fixtures::medicham();
    TEST_ASSERT_FALSE(should_optimize_timing(azu, med, NO_THREAT));
}

TEST(ActionLogic, TimingAdvantage) {
    Combatant azu = fixtures::azumarill();
    Combatant med = fixtures::medicham();
    TEST_ASSERT_FALSE(has_timing_advantage(azu, med));
    TEST_ASSERT_FALSE(has_timing_advantage(med, azu));

    Combatant slow = fixtures::azumarill();
    slow.fast_move.turns = 5;
    TEST_ASSERT_TRUE(has_timing_advantage(med, slow));
}

// ============================================================================
// ENERGY STACKING
// ============================================================================

TEST(StackEnergy, StacksSelfDebuffingMove) {
    Combatant med = fixtures::medicham({fixtures::superpower()});
    med.energy = 40;
    Combatant azu = fixtures::azumarill();

    TEST_ASSERT_TRUE(should_stack_energy(med, azu, fixtures::superpower()));

    med.energy = 80;
    TEST_ASSERT_FALSE(should_stack_energy(med, azu, fixtures::superpower()));
}

TEST(StackEnergy, OnlySelfDebuffingMoves) {
    Combatant med = fixtures::medicham({fixtures::ice_punch()});
    med.energy = 40;
    Combatant azu = fixtures::azumarill();

    TEST_ASSERT_FALSE(should_stack_energy(med, azu, fixtures::ice_punch()));
}

TEST(StackEnergy, TakesTheKnockout) {
    Combatant med = fixtures::medicham({fixtures::superpower()});
    med.energy = 40;
    Combatant azu = fixtures::azumarill();
    azu.shields = 0;
    azu.current_hp = 20;

    TEST_ASSERT_FALSE(should_stack_energy(med, azu, fixtures::superpower()));
}

TEST(StackEnergy, NotWhenAboutToFaint) {
    Combatant med = fixtures::medicham({fixtures::superpower()});
    med.energy = 40;
    med.current_hp = 6;
    Combatant azu = fixtures::azumarill();

    TEST_ASSERT_FALSE(should_stack_energy(med, azu, fixtures::superpower()));
}

// ============================================================================
// DECIDE ACTION
// ============================================================================

TEST(DecideAction, NoChargedMoves) {
    Combatant azu = fixtures::azumarill({});
    Combatant med = fixtures::medicham();
    Rng rng(1);

    BattleAction action = decide_action(azu, med, ActionPolicy{}, rng);
    TEST_ASSERT_TRUE(action.type == ActionType::FAST);
    TEST_ASSERT_EQ(std::string("no_charged_moves"), action.reason);
}

TEST(DecideAction, ChargingBelowCheapestCost) {
    Combatant azu = fixtures::azumarill();
    azu.energy = 54;
    Combatant med = fixtures::medicham();
    Rng rng(1);

    BattleAction action = decide_action(azu, med, ActionPolicy{}, rng);
    TEST_ASSERT_TRUE(action.type == ActionType::FAST);
    TEST_ASSERT_EQ(std::string("charging"), action.reason);
}

TEST(DecideAction, ThrowsLethalMove) {
    Combatant azu = fixtures::azumarill();
    azu.energy = 60;
    Combatant med = fixtures::medicham();
    med.current_hp = 30;
    med.shields = 0;
    Rng rng(1);

    BattleAction action = decide_action(azu, med, ActionPolicy{}, rng);
    TEST_ASSERT_TRUE(action.is_charged());
    TEST_ASSERT_EQ(0u, *action.charged_index);
    TEST_ASSERT_EQ(std::string("lethal"), action.reason);
}

TEST(DecideAction, SurvivalThrowsStrongestMove) {
    Combatant azu = fixtures::azumarill();
    azu.energy = 60;
    azu.current_hp = 10;
    azu.shields = 0;
    Combatant med = fixtures::medicham();
    med.energy = 100;
    Rng rng(1);

    BattleAction action = decide_action(azu, med, ActionPolicy{}, rng);
    TEST_ASSERT_TRUE(action.is_charged());
    TEST_ASSERT_EQ(1u, *action.charged_index);
    TEST_ASSERT_EQ(std::string("survival"), action.reason);
}

TEST(DecideAction, DefersSelfDebuffingMove) {
    // No shields, low energy, and the opponent can land Play Rough unshielded
    Combatant med = fixtures::medicham({fixtures::superpower(), fixtures::ice_punch()});
    med.shields = 0;
    med.energy = 45;
    Combatant azu = fixtures::azumarill();
    azu.energy = 100;

    for (uint32_t seed = 0; seed < 20; seed++) {
        Rng rng(seed);
        BattleAction action = decide_action(med, azu, ActionPolicy{}, rng);
        TEST_ASSERT_FALSE(action.is_charged() && *action.charged_index == 0);
        TEST_ASSERT_TRUE(action.is_charged());
        TEST_ASSERT_EQ(1u, *action.charged_index);
        TEST_ASSERT_EQ(std::string("search_deferred"), action.reason);
    }
}

TEST(DecideAction, OnlyDeferredMoveKeepsFarming) {
    Combatant med = fixtures::medicham({fixtures::superpower()});
    med.shields = 0;
    med.energy = 45;
    Combatant azu = fixtures::azumarill();
    azu.energy = 100;
    Rng rng(1);

    BattleAction action = decide_action(med, azu, ActionPolicy{}, rng);
    TEST_ASSERT_TRUE(action.type == ActionType::FAST);
    TEST_ASSERT_EQ(std::string("deferred"), action.reason);
}

TEST(DecideAction, BaitPlanBuildsEnergy) {
    // Play Rough is far more efficient than Ice Beam, so save up for it
    Combatant azu = fixtures::azumarill();
    azu.energy = 55;
    Combatant med = fixtures::medicham();
    Rng rng(1);

    BattleAction action = decide_action(azu, med, ActionPolicy{}, rng);
    TEST_ASSERT_TRUE(action.type == ActionType::FAST);
    TEST_ASSERT_EQ(std::string("farm"), action.reason);
}

TEST(DecideAction, ChosenMoveIsAlwaysAffordable) {
    Combatant azu = fixtures::azumarill();
    Combatant med = fixtures::medicham();

    for (int energy = 0; energy <= 100; energy += 5) {
        azu.energy = energy;
        Rng rng(static_cast<uint32_t>(energy));
        BattleAction action = decide_action(azu, med, ActionPolicy{}, rng);
        if (action.is_charged()) {
            TEST_ASSERT_TRUE(*action.charged_index < azu.charged_moves.size());
            TEST_ASSERT_TRUE(azu.can_afford(azu.charged_moves[*action.charged_index]));
        } else {
            TEST_ASSERT_TRUE(action.type == ActionType::FAST);
        }
    }
}

// ============================================================================
// RANDOM ACTIONS
// ============================================================================

TEST(RandomAction, FastOnlyWithoutEnergy) {
    Combatant azu = fixtures::azumarill();
    Rng rng(3);
    for (int i = 0; i < 50; i++) {
        BattleAction action = decide_random_action(azu, rng);
        TEST_ASSERT_TRUE(action.type == ActionType::FAST);
    }
}

TEST(RandomAction, CoversAffordableMoves) {
    Combatant azu = fixtures::azumarill();
    azu.energy = 100;
    Rng rng(3);

    std::array<int, 3> seen = {0, 0, 0};
    for (int i = 0; i < 300; i++) {
        BattleAction action = decide_random_action(azu, rng);
        if (action.is_charged()) {
            TEST_ASSERT_TRUE(*action.charged_index < 2);
            seen[*action.charged_index + 1]++;
        } else {
            seen[0]++;
        }
    }
    TEST_ASSERT_TRUE(seen[0] > 0);
    TEST_ASSERT_TRUE(seen[1] > 0);
    TEST_ASSERT_TRUE(seen[2] > 0);
}
