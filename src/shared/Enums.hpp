#pragma once

#include <string>

namespace PlanningPoker {

	enum class RoundState {
		Init,
		Voting,
		Revealed
	};

	enum class EngineError {
		None,
		GameNotFound,
		UnknownDeck,
		UnknownCard,
		UnknownPlayer,
		InvalidState,
		NotAuthorized,
		InvalidRequest,
		NotJoined
	};

	enum class ClientAction {
		Join,
		Leave,
		SubmitVote,
		StartRound,
		Reveal,
		Observe,
		Sync,
		Unknown
	};

	inline const char* toString(RoundState state) {
		switch (state) {
		case RoundState::Init: return "INIT";
		case RoundState::Voting: return "VOTING";
		case RoundState::Revealed: return "REVEALED";
		}
		return "INIT";
	}

	inline const char* toString(EngineError error) {
		switch (error) {
		case EngineError::None: return "NONE";
		case EngineError::GameNotFound: return "GAME_NOT_FOUND";
		case EngineError::UnknownDeck: return "UNKNOWN_DECK";
		case EngineError::UnknownCard: return "UNKNOWN_CARD";
		case EngineError::UnknownPlayer: return "UNKNOWN_PLAYER";
		case EngineError::InvalidState: return "INVALID_STATE";
		case EngineError::NotAuthorized: return "NOT_AUTHORIZED";
		case EngineError::InvalidRequest: return "INVALID_REQUEST";
		case EngineError::NotJoined: return "NOT_JOINED";
		}
		return "NONE";
	}

	inline ClientAction parseClientAction(const std::string& type) {
		if (type == "JOIN") return ClientAction::Join;
		if (type == "LEAVE") return ClientAction::Leave;
		if (type == "SUBMIT_VOTE") return ClientAction::SubmitVote;
		if (type == "START_ROUND") return ClientAction::StartRound;
		if (type == "REVEAL") return ClientAction::Reveal;
		if (type == "OBSERVE") return ClientAction::Observe;
		if (type == "SYNC") return ClientAction::Sync;
		return ClientAction::Unknown;
	}
}
