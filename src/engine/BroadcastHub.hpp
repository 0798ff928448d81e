#pragma once

#include "PlayerRegistry.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace PlanningPoker {

	struct DeliveryReport {
		uint64_t sequence{ 0 };
		size_t delivered{ 0 };
		std::vector<std::string> failedPlayerIds;
	};

	// Fan-out of one session's messages to the connections attached to its
	// players. Delivery is best-effort: a failing connection is reported back
	// and never stops delivery to the others.
	class BroadcastHub {
	public:
		explicit BroadcastHub(std::string code);

		DeliveryReport broadcast(const std::string& payload, const PlayerRegistry& players);

		static bool sendTo(const std::shared_ptr<ConnectionSink>& connection, const std::string& payload);

		uint64_t broadcastCount() const { return sequence_; }

	private:
		std::string code_;
		uint64_t sequence_{ 0 };
	};

}
