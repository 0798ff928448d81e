#pragma once

#include "crow.h"
#include "GameRegistry.hpp"
#include "../shared/ConnectionSink.hpp"
#include "../engine/Types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace PlanningPoker {

	// Decodes client frames and maps each one to a single GameSession
	// operation. Rejections are answered on the originating connection only.
	// Calls for one connection must not run concurrently.
	class MessageRouter {
	public:
		explicit MessageRouter(std::shared_ptr<GameRegistry> registry);

		void onOpen(const std::shared_ptr<ConnectionSink>& conn);
		void onMessage(const std::shared_ptr<ConnectionSink>& conn, const std::string& data);
		void onClose(const ConnectionSink* conn);

		size_t connectionCount() const;

		static std::string errorMessage(EngineError error, const std::string& message);

		// Scheme check only: http:// or https:// followed by something.
		static bool isHttpUrl(const std::string& url);

	private:
		struct ConnectionContext {
			std::shared_ptr<ConnectionSink> sink;
			std::string code;
			std::string playerId;

			bool joined() const { return !playerId.empty(); }
		};

		std::shared_ptr<GameRegistry> registry_;

		mutable std::mutex mutex_;
		std::unordered_map<const ConnectionSink*, ConnectionContext> connections_;

		std::optional<ConnectionContext> context(const ConnectionSink* conn) const;
		void bind(const ConnectionSink* conn, const std::string& code, const std::string& playerId);
		void unbind(const ConnectionSink* conn);

		void processJoin(const std::shared_ptr<ConnectionSink>& conn, const crow::json::rvalue& msg);
		void processLeave(const std::shared_ptr<ConnectionSink>& conn, GameSession& session, const std::string& playerId);
		ActionResult processSubmitVote(GameSession& session, const std::string& playerId, const crow::json::rvalue& msg);
		ActionResult processStartRound(GameSession& session, const std::string& playerId, const crow::json::rvalue& msg);

		static void reject(const std::shared_ptr<ConnectionSink>& conn, EngineError error, const std::string& message);
		static std::optional<std::string> optionalString(const crow::json::rvalue& msg, const char* key);
	};

}
