#pragma once

#include "Types.hpp"
#include <vector>

namespace PlanningPoker {

	// Summary of revealed votes. Non-numeric cards count towards voteCount,
	// distribution and consensus but not towards average/min/max.
	VoteAggregate computeAggregate(const std::vector<Card>& votes);

}
