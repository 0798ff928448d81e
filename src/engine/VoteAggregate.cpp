#include "VoteAggregate.hpp"

#include <algorithm>
#include <map>

namespace PlanningPoker {

	VoteAggregate computeAggregate(const std::vector<Card>& votes) {
		VoteAggregate aggregate;
		aggregate.voteCount = static_cast<int>(votes.size());

		double sum = 0.0;
		std::map<std::string, int> counts;

		for (const auto& card : votes) {
			counts[card.label]++;

			if (!card.numeric) continue;

			aggregate.numericCount++;
			sum += card.value;
			aggregate.min = aggregate.min ? std::min(*aggregate.min, card.value) : card.value;
			aggregate.max = aggregate.max ? std::max(*aggregate.max, card.value) : card.value;
		}

		if (aggregate.numericCount > 0) {
			aggregate.average = sum / aggregate.numericCount;
		}

		aggregate.consensus = counts.size() == 1;

		for (const auto& [label, count] : counts) {
			aggregate.distribution.push_back({ .label = label, .count = count });
		}
		std::stable_sort(aggregate.distribution.begin(), aggregate.distribution.end(),
			[](const LabelCount& a, const LabelCount& b) { return a.count > b.count; });

		return aggregate;
	}
}
