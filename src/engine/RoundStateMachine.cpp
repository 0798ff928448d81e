#include "RoundStateMachine.hpp"

using namespace PlanningPoker;

bool RoundStateMachine::canStartRound() const {
	return state_ == RoundState::Init || state_ == RoundState::Revealed;
}

bool RoundStateMachine::canReveal() const {
	return state_ == RoundState::Voting;
}

bool RoundStateMachine::acceptsVotes() const {
	return state_ == RoundState::Voting;
}

bool RoundStateMachine::startRound() {
	if (!canStartRound()) return false;

	state_ = RoundState::Voting;
	++round_;
	return true;
}

bool RoundStateMachine::reveal() {
	if (!canReveal()) return false;

	state_ = RoundState::Revealed;
	return true;
}
