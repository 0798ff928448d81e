#pragma once

#include "../shared/Enums.hpp"

namespace PlanningPoker {

	// INIT -> VOTING -> REVEALED -> VOTING -> ...
	// Transitions only change the state; clearing votes is the session's job.
	class RoundStateMachine {
	public:
		RoundStateMachine() = default;

		RoundState state() const { return state_; }
		int round() const { return round_; }

		bool canStartRound() const;
		bool canReveal() const;
		bool acceptsVotes() const;

		bool startRound();
		bool reveal();

	private:
		RoundState state_{ RoundState::Init };
		int round_{ 0 };
	};

}
