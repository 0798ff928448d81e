#include <gtest/gtest.h>

#include "engine/RoundStateMachine.hpp"

using namespace PlanningPoker;

TEST(RoundStateMachineTest, StartsInInit) {
	RoundStateMachine machine;
	EXPECT_EQ(machine.state(), RoundState::Init);
	EXPECT_EQ(machine.round(), 0);
	EXPECT_FALSE(machine.acceptsVotes());
}

TEST(RoundStateMachineTest, RevealOnlyFromVoting) {
	RoundStateMachine machine;
	EXPECT_FALSE(machine.reveal());
	EXPECT_EQ(machine.state(), RoundState::Init);

	ASSERT_TRUE(machine.startRound());
	EXPECT_TRUE(machine.acceptsVotes());
	EXPECT_TRUE(machine.reveal());
	EXPECT_EQ(machine.state(), RoundState::Revealed);

	EXPECT_FALSE(machine.reveal());
	EXPECT_FALSE(machine.acceptsVotes());
}

TEST(RoundStateMachineTest, CannotRestartWhileVoting) {
	RoundStateMachine machine;
	ASSERT_TRUE(machine.startRound());
	EXPECT_FALSE(machine.startRound());
	EXPECT_EQ(machine.round(), 1);
}

TEST(RoundStateMachineTest, CyclesThroughRounds) {
	RoundStateMachine machine;
	for (int i = 1; i <= 3; ++i) {
		ASSERT_TRUE(machine.startRound());
		EXPECT_EQ(machine.round(), i);
		ASSERT_TRUE(machine.reveal());
	}
	EXPECT_EQ(machine.state(), RoundState::Revealed);
}
