#include "GameSession.hpp"
#include "VoteAggregate.hpp"
#include "../infra/Logger.hpp"

#include "crow.h"

using namespace PlanningPoker;

namespace {
	constexpr size_t kMaxDisplayNameLength = 100;

	crow::json::wvalue cardJson(const Card& card) {
		crow::json::wvalue json;
		json["label"] = card.label;
		json["value"] = card.value;
		json["numeric"] = card.numeric;
		return json;
	}

	crow::json::wvalue aggregateJson(const VoteAggregate& aggregate) {
		crow::json::wvalue json;
		json["vote_count"] = aggregate.voteCount;
		json["numeric_count"] = aggregate.numericCount;
		if (aggregate.average) json["average"] = *aggregate.average;
		if (aggregate.min) json["min"] = *aggregate.min;
		if (aggregate.max) json["max"] = *aggregate.max;
		json["consensus"] = aggregate.consensus;

		crow::json::wvalue distribution = crow::json::wvalue::list();
		int index = 0;
		for (const auto& entry : aggregate.distribution) {
			crow::json::wvalue e;
			e["label"] = entry.label;
			e["count"] = entry.count;
			distribution[index++] = std::move(e);
		}
		json["distribution"] = std::move(distribution);
		return json;
	}
}

GameSession::GameSession(std::string code, std::string name, Deck deck, EmptyHook onEmpty)
	: code_(std::move(code)),
	name_(std::move(name)),
	deck_(std::move(deck)),
	hub_(code_),
	onEmpty_(std::move(onEmpty)) {
}

JoinResult GameSession::join(const std::optional<std::string>& playerId,
	const std::string& displayName,
	std::shared_ptr<ConnectionSink> connection) {

	std::lock_guard<std::mutex> lock(mutex_);

	JoinResult join;

	if (closed_) {
		join.result = ActionResult::fail(EngineError::GameNotFound, "No game with code '" + code_ + "' exists");
		return join;
	}

	bool knownPlayer = playerId && players_.find(*playerId) != nullptr;

	if (!knownPlayer && displayName.empty()) {
		join.result = ActionResult::fail(EngineError::InvalidRequest, "A display name is required to join");
		return join;
	}

	if (displayName.size() > kMaxDisplayNameLength) {
		join.result = ActionResult::fail(EngineError::InvalidRequest, "Display name is too long");
		return join;
	}

	auto outcome = players_.join(playerId, displayName, std::move(connection));

	join.result = ActionResult::ok();
	join.playerId = outcome.player->id;
	join.isAdmin = players_.isAdmin(join.playerId);
	join.rejoined = outcome.rejoined;

	if (outcome.rejoined) {
		Logger::log("[GAME] '" + code_ + "' player " + outcome.player->displayName + " (" + join.playerId + ") rejoined");
	}
	else {
		Logger::log("[GAME] '" + code_ + "' player " + outcome.player->displayName + " (" + join.playerId + ") joined");
	}

	if (outcome.becameAdmin) {
		Logger::log("[GAME] '" + code_ + "' registering " + join.playerId + " as admin");
	}

	if (outcome.replacedConnection) {
		outcome.replacedConnection->close("Replaced by a newer connection");
	}

	broadcastLocked();
	return join;
}

ActionResult GameSession::leave(const std::string& playerId) {
	std::lock_guard<std::mutex> lock(mutex_);

	if (closed_) return ActionResult::fail(EngineError::GameNotFound, "No game with code '" + code_ + "' exists");

	bool wasAdmin = players_.isAdmin(playerId);
	if (!players_.remove(playerId)) {
		return ActionResult::fail(EngineError::UnknownPlayer, "Player " + playerId + " is not part of this game");
	}

	Logger::log("[GAME] '" + code_ + "' player " + playerId + " left");

	if (players_.empty()) {
		Logger::log("[GAME] '" + code_ + "' last player left, closing game");
		closeLocked();
		return ActionResult::ok();
	}

	if (wasAdmin) {
		Logger::log("[GAME] '" + code_ + "' admin passed to " + players_.adminId());
	}

	if (players_.connectedCount() == 0) {
		Logger::log("[GAME] '" + code_ + "' no connected player remains, closing game");
		players_.clear();
		closeLocked();
		return ActionResult::ok();
	}

	broadcastLocked();
	return ActionResult::ok();
}

ActionResult GameSession::disconnect(const std::string& playerId, const ConnectionSink* connection) {
	std::lock_guard<std::mutex> lock(mutex_);

	if (closed_) return ActionResult::fail(EngineError::GameNotFound, "No game with code '" + code_ + "' exists");

	auto* player = players_.find(playerId);
	if (!player) {
		return ActionResult::fail(EngineError::UnknownPlayer, "Player " + playerId + " is not part of this game");
	}

	// A stale close from a connection that was already replaced by a rejoin.
	if (connection && player->connection.get() != connection) {
		return ActionResult::ok();
	}

	players_.detach(playerId);
	Logger::log("[GAME] '" + code_ + "' player " + playerId + " disconnected");

	if (players_.connectedCount() == 0) {
		Logger::log("[GAME] '" + code_ + "' every player disconnected, closing game");
		players_.clear();
		closeLocked();
		return ActionResult::ok();
	}

	broadcastLocked();
	return ActionResult::ok();
}

ActionResult GameSession::castVote(const std::string& playerId, const std::string& cardLabel) {
	std::lock_guard<std::mutex> lock(mutex_);

	if (closed_) return ActionResult::fail(EngineError::GameNotFound, "No game with code '" + code_ + "' exists");

	auto* player = players_.find(playerId);
	if (!player) {
		return ActionResult::fail(EngineError::UnknownPlayer, "Player " + playerId + " is not part of this game");
	}

	if (!round_.acceptsVotes()) {
		return ActionResult::fail(EngineError::InvalidState,
			std::string("Votes are not accepted while the round is ") + toString(round_.state()));
	}

	if (player->observing) {
		return ActionResult::fail(EngineError::InvalidState, "Observers cannot vote");
	}

	auto card = deck_.findCard(cardLabel);
	if (!card) {
		return ActionResult::fail(EngineError::UnknownCard,
			"Card '" + cardLabel + "' is not part of deck " + deck_.name);
	}

	player->currentVote = *card;
	Logger::log("[GAME] '" + code_ + "' player " + playerId + " voted");

	broadcastLocked();
	return ActionResult::ok();
}

ActionResult GameSession::castVote(const std::string& playerId, const Card& card) {
	return castVote(playerId, card.label);
}

ActionResult GameSession::startRound(const std::string& playerId, const std::optional<std::string>& ticketUrl) {
	std::lock_guard<std::mutex> lock(mutex_);

	auto check = checkAdminAction(playerId);
	if (!check.success) return check;

	if (!round_.canStartRound()) {
		return ActionResult::fail(EngineError::InvalidState,
			std::string("Cannot start a round while ") + toString(round_.state()));
	}

	players_.clearVotes();
	round_.startRound();
	ticketUrl_ = ticketUrl;

	Logger::log("[GAME] '" + code_ + "' round " + std::to_string(round_.round()) + " started");

	broadcastLocked();
	return ActionResult::ok();
}

ActionResult GameSession::reveal(const std::string& playerId) {
	std::lock_guard<std::mutex> lock(mutex_);

	auto check = checkAdminAction(playerId);
	if (!check.success) return check;

	if (!round_.reveal()) {
		return ActionResult::fail(EngineError::InvalidState,
			std::string("Cannot reveal while ") + toString(round_.state()));
	}

	Logger::log("[GAME] '" + code_ + "' round " + std::to_string(round_.round()) + " revealed");

	broadcastLocked();
	return ActionResult::ok();
}

ActionResult GameSession::toggleObserving(const std::string& playerId) {
	std::lock_guard<std::mutex> lock(mutex_);

	if (closed_) return ActionResult::fail(EngineError::GameNotFound, "No game with code '" + code_ + "' exists");

	auto* player = players_.find(playerId);
	if (!player) {
		return ActionResult::fail(EngineError::UnknownPlayer, "Player " + playerId + " is not part of this game");
	}

	player->observing = !player->observing;
	if (player->observing) player->currentVote.reset();

	Logger::log("[GAME] '" + code_ + "' player " + playerId
		+ (player->observing ? " is now observing" : " stopped observing"));

	broadcastLocked();
	return ActionResult::ok();
}

ActionResult GameSession::sync(const std::string& playerId) {
	std::lock_guard<std::mutex> lock(mutex_);

	if (closed_) return ActionResult::fail(EngineError::GameNotFound, "No game with code '" + code_ + "' exists");

	const auto* player = players_.find(playerId);
	if (!player) {
		return ActionResult::fail(EngineError::UnknownPlayer, "Player " + playerId + " is not part of this game");
	}

	if (!player->connection || BroadcastHub::sendTo(player->connection, snapshotLocked())) {
		return ActionResult::ok();
	}

	Logger::warn("[GAME] '" + code_ + "' sync to " + playerId + " failed, treating as disconnect");
	players_.detach(playerId);

	if (players_.connectedCount() == 0) {
		players_.clear();
		closeLocked();
		return ActionResult::ok();
	}

	broadcastLocked();
	return ActionResult::ok();
}

RoundState GameSession::roundState() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return round_.state();
}

int GameSession::round() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return round_.round();
}

std::string GameSession::adminId() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return players_.adminId();
}

size_t GameSession::playerCount() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return players_.size();
}

size_t GameSession::connectedCount() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return players_.connectedCount();
}

bool GameSession::isClosed() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return closed_;
}

std::optional<PlayerInfo> GameSession::player(const std::string& playerId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto* p = players_.find(playerId);
	if (!p) return std::nullopt;
	return *p;
}

std::vector<RevealedVote> GameSession::revealedVotes() const {
	std::lock_guard<std::mutex> lock(mutex_);

	std::vector<RevealedVote> votes;
	if (round_.state() != RoundState::Revealed) return votes;

	for (const auto& p : players_.players()) {
		if (!p.currentVote) continue;
		votes.push_back({ .playerId = p.id, .displayName = p.displayName, .card = *p.currentVote });
	}
	return votes;
}

GameInfo GameSession::info() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return {
		.code = code_,
		.name = name_,
		.deckId = deck_.id,
		.playerCount = players_.size(),
		.roundState = round_.state()
	};
}

std::string GameSession::snapshot() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return snapshotLocked();
}

ActionResult GameSession::checkAdminAction(const std::string& playerId) const {
	if (closed_) return ActionResult::fail(EngineError::GameNotFound, "No game with code '" + code_ + "' exists");

	if (!players_.find(playerId)) {
		return ActionResult::fail(EngineError::UnknownPlayer, "Player " + playerId + " is not part of this game");
	}

	if (!players_.isAdmin(playerId)) {
		Logger::warn("[GAME] '" + code_ + "' player " + playerId + " sent an admin action but is not admin");
		return ActionResult::fail(EngineError::NotAuthorized, "Only the game admin can do that");
	}

	return ActionResult::ok();
}

std::string GameSession::snapshotLocked() const {
	const bool revealed = round_.state() == RoundState::Revealed;

	crow::json::wvalue state;
	state["type"] = "STATE";
	state["code"] = code_;
	state["name"] = name_;
	state["round_state"] = toString(round_.state());
	state["round"] = round_.round();
	state["admin_id"] = players_.adminId();
	if (ticketUrl_) state["ticket_url"] = *ticketUrl_;

	crow::json::wvalue cardsJson = crow::json::wvalue::list();
	int cardIndex = 0;
	for (const auto& card : deck_.cards) {
		cardsJson[cardIndex++] = cardJson(card);
	}
	state["deck"]["id"] = deck_.id;
	state["deck"]["name"] = deck_.name;
	state["deck"]["cards"] = std::move(cardsJson);

	crow::json::wvalue playersJson = crow::json::wvalue::list();
	std::vector<Card> votes;
	int index = 0;

	for (const auto& player : players_.players()) {
		crow::json::wvalue playerJson;
		playerJson["id"] = player.id;
		playerJson["display_name"] = player.displayName;
		playerJson["is_admin"] = players_.isAdmin(player.id);
		playerJson["is_connected"] = player.isConnected();
		playerJson["is_observing"] = player.observing;
		playerJson["has_voted"] = player.hasVoted();

		// Vote values never leave the server before the reveal.
		if (revealed && player.currentVote) {
			playerJson["card"] = cardJson(*player.currentVote);
			votes.push_back(*player.currentVote);
		}

		playersJson[index++] = std::move(playerJson);
	}
	state["players"] = std::move(playersJson);

	if (revealed) {
		state["aggregate"] = aggregateJson(computeAggregate(votes));
	}

	return state.dump();
}

void GameSession::broadcastLocked() {
	while (true) {
		auto report = hub_.broadcast(snapshotLocked(), players_);
		if (report.failedPlayerIds.empty()) return;

		for (const auto& id : report.failedPlayerIds) {
			if (auto sink = players_.detach(id)) {
				sink->close("Send failed");
			}
		}

		if (players_.connectedCount() == 0) {
			Logger::log("[GAME] '" + code_ + "' no reachable connections left, closing game");
			players_.clear();
			closeLocked();
			return;
		}
	}
}

void GameSession::closeLocked() {
	if (closed_) return;
	closed_ = true;
	if (onEmpty_) onEmpty_(*this);
}
