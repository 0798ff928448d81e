#pragma once

#include "BroadcastHub.hpp"
#include "PlayerRegistry.hpp"
#include "RoundStateMachine.hpp"
#include "Types.hpp"
#include "../shared/DTOs.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace PlanningPoker {

	// One planning poker room. Every public operation takes the session mutex,
	// so operations on one session form a total order, and the snapshot
	// broadcast that follows a mutation is sent before the lock is released.
	class GameSession {
	public:
		using EmptyHook = std::function<void(const GameSession&)>;

		GameSession(std::string code, std::string name, Deck deck, EmptyHook onEmpty = {});
		~GameSession() = default;

		GameSession(const GameSession&) = delete;
		GameSession& operator=(const GameSession&) = delete;

		JoinResult join(const std::optional<std::string>& playerId,
			const std::string& displayName,
			std::shared_ptr<ConnectionSink> connection);
		ActionResult leave(const std::string& playerId);
		ActionResult disconnect(const std::string& playerId, const ConnectionSink* connection);

		ActionResult castVote(const std::string& playerId, const std::string& cardLabel);
		ActionResult castVote(const std::string& playerId, const Card& card);
		ActionResult startRound(const std::string& playerId, const std::optional<std::string>& ticketUrl = std::nullopt);
		ActionResult reveal(const std::string& playerId);
		ActionResult toggleObserving(const std::string& playerId);
		ActionResult sync(const std::string& playerId);

		const std::string& code() const { return code_; }
		const std::string& name() const { return name_; }
		const Deck& deck() const { return deck_; }

		RoundState roundState() const;
		int round() const;
		std::string adminId() const;
		size_t playerCount() const;
		size_t connectedCount() const;
		bool isClosed() const;
		std::optional<PlayerInfo> player(const std::string& playerId) const;
		std::vector<RevealedVote> revealedVotes() const;
		GameInfo info() const;
		std::string snapshot() const;

	private:
		mutable std::mutex mutex_;

		const std::string code_;
		const std::string name_;
		const Deck deck_;

		RoundStateMachine round_;
		PlayerRegistry players_;
		BroadcastHub hub_;
		std::optional<std::string> ticketUrl_;
		bool closed_{ false };
		EmptyHook onEmpty_;

		ActionResult checkAdminAction(const std::string& playerId) const;
		std::string snapshotLocked() const;
		void broadcastLocked();
		void closeLocked();
	};

}
