#pragma once

#include "../shared/DTOs.hpp"
#include <optional>
#include <string>
#include <vector>

namespace PlanningPoker {

	struct ActionResult {
		bool success{ false };
		EngineError error{ EngineError::None };
		std::string message;

		static ActionResult ok() {
			return { .success = true, .error = EngineError::None, .message = {} };
		}

		static ActionResult fail(EngineError error, std::string message) {
			return { .success = false, .error = error, .message = std::move(message) };
		}
	};

	struct JoinResult {
		ActionResult result;
		std::string playerId;
		bool isAdmin{ false };
		bool rejoined{ false };
	};

	struct RevealedVote {
		std::string playerId;
		std::string displayName;
		Card card;
	};

	struct LabelCount {
		std::string label;
		int count{ 0 };
	};

	struct VoteAggregate {
		int voteCount{ 0 };
		int numericCount{ 0 };
		std::optional<double> average;
		std::optional<double> min;
		std::optional<double> max;
		bool consensus{ false };
		std::vector<LabelCount> distribution;
	};

}
