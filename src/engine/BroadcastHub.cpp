#include "BroadcastHub.hpp"
#include "../infra/Logger.hpp"

using namespace PlanningPoker;

BroadcastHub::BroadcastHub(std::string code)
	: code_(std::move(code)) {
}

DeliveryReport BroadcastHub::broadcast(const std::string& payload, const PlayerRegistry& players) {
	DeliveryReport report;
	report.sequence = ++sequence_;

	for (const auto& player : players.players()) {
		if (!player.connection) continue;

		if (sendTo(player.connection, payload)) {
			report.delivered++;
		}
		else {
			report.failedPlayerIds.push_back(player.id);
		}
	}

	Logger::debug("[GAME] '" + code_ + "' broadcast #" + std::to_string(report.sequence)
		+ " to " + std::to_string(report.delivered) + " connection(s): " + payload);

	for (const auto& id : report.failedPlayerIds) {
		Logger::warn("[GAME] '" + code_ + "' send to " + id + " failed, treating as disconnect");
	}

	return report;
}

bool BroadcastHub::sendTo(const std::shared_ptr<ConnectionSink>& connection, const std::string& payload) {
	if (!connection || !connection->isOpen()) return false;
	return connection->send(payload);
}
