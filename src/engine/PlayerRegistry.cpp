#include "PlayerRegistry.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

using namespace PlanningPoker;

std::string PlayerRegistry::generatePlayerId() {
	static thread_local std::mt19937_64 gen(std::random_device{}());
	std::uniform_int_distribution<uint64_t> dis;

	uint64_t hi = dis(gen);
	uint64_t lo = dis(gen);

	// RFC 4122 version 4, variant 10xx
	hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
	lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

	std::ostringstream oss;
	oss << std::hex << std::setfill('0')
		<< std::setw(8) << (hi >> 32) << '-'
		<< std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
		<< std::setw(4) << (hi & 0xFFFF) << '-'
		<< std::setw(4) << (lo >> 48) << '-'
		<< std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
	return oss.str();
}

JoinOutcome PlayerRegistry::join(const std::optional<std::string>& playerId,
	const std::string& displayName,
	std::shared_ptr<ConnectionSink> connection) {

	JoinOutcome outcome;

	if (playerId) {
		if (auto* existing = find(*playerId)) {
			if (existing->connection != connection) {
				outcome.replacedConnection = std::move(existing->connection);
			}
			existing->connection = std::move(connection);
			if (!displayName.empty()) existing->displayName = displayName;

			outcome.player = existing;
			outcome.rejoined = true;
			return outcome;
		}
	}

	bool wasEmpty = players_.empty();

	PlayerInfo player;
	player.id = generatePlayerId();
	while (find(player.id)) {
		player.id = generatePlayerId();
	}
	player.displayName = displayName;
	player.connection = std::move(connection);

	players_.push_back(std::move(player));

	if (wasEmpty) {
		adminId_ = players_.back().id;
		outcome.becameAdmin = true;
	}

	outcome.player = &players_.back();
	return outcome;
}

bool PlayerRegistry::remove(const std::string& playerId) {
	auto it = std::find_if(players_.begin(), players_.end(),
		[&playerId](const PlayerInfo& p) { return p.id == playerId; });
	if (it == players_.end()) return false;

	players_.erase(it);

	if (adminId_ == playerId) electAdmin();

	return true;
}

std::shared_ptr<ConnectionSink> PlayerRegistry::detach(const std::string& playerId) {
	auto* player = find(playerId);
	if (!player) return nullptr;
	return std::move(player->connection);
}

void PlayerRegistry::clear() {
	players_.clear();
	adminId_.clear();
}

void PlayerRegistry::clearVotes() {
	for (auto& p : players_) {
		p.currentVote.reset();
	}
}

PlayerInfo* PlayerRegistry::find(const std::string& playerId) {
	auto it = std::find_if(players_.begin(), players_.end(),
		[&playerId](const PlayerInfo& p) { return p.id == playerId; });
	return it != players_.end() ? &(*it) : nullptr;
}

const PlayerInfo* PlayerRegistry::find(const std::string& playerId) const {
	for (const auto& player : players_) {
		if (player.id == playerId) {
			return &player;
		}
	}
	return nullptr;
}

bool PlayerRegistry::isAdmin(const std::string& playerId) const {
	return !adminId_.empty() && adminId_ == playerId;
}

size_t PlayerRegistry::connectedCount() const {
	return static_cast<size_t>(std::count_if(players_.begin(), players_.end(),
		[](const PlayerInfo& p) { return p.isConnected(); }));
}

void PlayerRegistry::electAdmin() {
	// players_ is kept in join order, so the front is the earliest joiner.
	if (players_.empty()) {
		adminId_.clear();
		return;
	}
	adminId_ = players_.front().id;
}
