#pragma once

#include "../shared/DTOs.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace PlanningPoker {

	struct JoinOutcome {
		PlayerInfo* player{ nullptr };
		bool rejoined{ false };
		bool becameAdmin{ false };
		std::shared_ptr<ConnectionSink> replacedConnection;
	};

	// Players of one game in join order. The first player to join becomes
	// admin; when the admin is removed the earliest-joined remaining player
	// takes over. A non-empty registry always has an admin.
	class PlayerRegistry {
	public:
		PlayerRegistry() = default;

		JoinOutcome join(const std::optional<std::string>& playerId,
			const std::string& displayName,
			std::shared_ptr<ConnectionSink> connection);

		// Returns false when the player is unknown.
		bool remove(const std::string& playerId);

		// Detaches the live connection but keeps the player, vote and admin role.
		std::shared_ptr<ConnectionSink> detach(const std::string& playerId);

		void clear();
		void clearVotes();

		PlayerInfo* find(const std::string& playerId);
		const PlayerInfo* find(const std::string& playerId) const;

		const std::vector<PlayerInfo>& players() const { return players_; }
		const std::string& adminId() const { return adminId_; }
		bool isAdmin(const std::string& playerId) const;

		bool empty() const { return players_.empty(); }
		size_t size() const { return players_.size(); }
		size_t connectedCount() const;

		static std::string generatePlayerId();

	private:
		std::vector<PlayerInfo> players_;
		std::string adminId_;

		void electAdmin();
	};

}
