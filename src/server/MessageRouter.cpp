#include "MessageRouter.hpp"
#include "../infra/Logger.hpp"

using namespace PlanningPoker;

MessageRouter::MessageRouter(std::shared_ptr<GameRegistry> registry)
	: registry_(std::move(registry)) {
}

std::string MessageRouter::errorMessage(EngineError error, const std::string& message) {
	crow::json::wvalue json;
	json["type"] = "ERROR";
	json["error"] = toString(error);
	json["message"] = message;
	return json.dump();
}

void MessageRouter::reject(const std::shared_ptr<ConnectionSink>& conn, EngineError error, const std::string& message) {
	if (!BroadcastHub::sendTo(conn, errorMessage(error, message))) {
		Logger::debug(std::string("[WS] Could not deliver ") + toString(error) + " to a closed connection");
	}
}

std::optional<std::string> MessageRouter::optionalString(const crow::json::rvalue& msg, const char* key) {
	if (!msg.has(key) || msg[key].t() != crow::json::type::String) return std::nullopt;
	return std::string(msg[key].s());
}

void MessageRouter::onOpen(const std::shared_ptr<ConnectionSink>& conn) {
	std::lock_guard<std::mutex> lock(mutex_);
	connections_[conn.get()] = ConnectionContext{ .sink = conn, .code = {}, .playerId = {} };
}

void MessageRouter::onClose(const ConnectionSink* conn) {
	auto ctx = context(conn);
	unbind(conn);
	{
		std::lock_guard<std::mutex> lock(mutex_);
		connections_.erase(conn);
	}

	if (!ctx || !ctx->joined()) return;

	auto session = registry_->getSession(ctx->code);
	if (!session) return;

	auto result = session->disconnect(ctx->playerId, conn);
	if (!result.success) {
		Logger::debug("[WS] disconnect of " + ctx->playerId + " ignored: " + result.message);
	}
}

size_t MessageRouter::connectionCount() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return connections_.size();
}

std::optional<MessageRouter::ConnectionContext> MessageRouter::context(const ConnectionSink* conn) const {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = connections_.find(conn);
	if (it == connections_.end()) return std::nullopt;
	return it->second;
}

void MessageRouter::bind(const ConnectionSink* conn, const std::string& code, const std::string& playerId) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = connections_.find(conn);
	if (it == connections_.end()) return;
	it->second.code = code;
	it->second.playerId = playerId;
}

void MessageRouter::unbind(const ConnectionSink* conn) {
	bind(conn, {}, {});
}

void MessageRouter::onMessage(const std::shared_ptr<ConnectionSink>& conn, const std::string& data) {
	auto msg = crow::json::load(data);
	if (!msg || msg.t() != crow::json::type::Object || !msg.has("type")
		|| msg["type"].t() != crow::json::type::String) {
		Logger::debug("[WS] Invalid message ignored: " + data);
		reject(conn, EngineError::InvalidRequest, "Invalid JSON");
		return;
	}

	std::string type = msg["type"].s();
	ClientAction action = parseClientAction(type);

	if (action == ClientAction::Unknown) {
		reject(conn, EngineError::InvalidRequest, "Unknown message type " + type);
		return;
	}

	if (action == ClientAction::Join) {
		processJoin(conn, msg);
		return;
	}

	auto ctx = context(conn.get());
	if (!ctx || !ctx->joined()) {
		reject(conn, EngineError::NotJoined, type + " requires joining a game first");
		return;
	}

	auto session = registry_->getSession(ctx->code);
	if (!session) {
		unbind(conn.get());
		reject(conn, EngineError::GameNotFound, "No game with code '" + ctx->code + "' exists");
		return;
	}

	ActionResult result;
	switch (action) {
	case ClientAction::Leave:
		processLeave(conn, *session, ctx->playerId);
		return;
	case ClientAction::SubmitVote:
		result = processSubmitVote(*session, ctx->playerId, msg);
		break;
	case ClientAction::StartRound:
		result = processStartRound(*session, ctx->playerId, msg);
		break;
	case ClientAction::Reveal:
		result = session->reveal(ctx->playerId);
		break;
	case ClientAction::Observe:
		result = session->toggleObserving(ctx->playerId);
		break;
	case ClientAction::Sync:
		result = session->sync(ctx->playerId);
		break;
	default:
		result = ActionResult::fail(EngineError::InvalidRequest, "Unsupported message type " + type);
		break;
	}

	if (!result.success) {
		Logger::debug("[WS] " + type + " from " + ctx->playerId + " rejected: " + result.message);
		if (result.error == EngineError::GameNotFound || result.error == EngineError::UnknownPlayer) {
			unbind(conn.get());
		}
		reject(conn, result.error, result.message);
	}
}

void MessageRouter::processJoin(const std::shared_ptr<ConnectionSink>& conn, const crow::json::rvalue& msg) {
	auto code = optionalString(msg, "code");
	if (!code) {
		reject(conn, EngineError::InvalidRequest, "JOIN requires code");
		return;
	}

	auto ctx = context(conn.get());
	if (!ctx) {
		reject(conn, EngineError::InvalidRequest, "Unknown connection");
		return;
	}
	if (ctx->joined()) {
		reject(conn, EngineError::InvalidRequest, "Connection already joined game '" + ctx->code + "'");
		return;
	}

	auto session = registry_->getSession(*code);
	if (!session) {
		Logger::warn("[WS] Attempt to join missing game '" + *code + "'");
		reject(conn, EngineError::GameNotFound, "No game with code '" + *code + "' exists");
		return;
	}

	auto playerId = optionalString(msg, "playerId");
	if (playerId && playerId->empty()) playerId.reset();
	std::string displayName = optionalString(msg, "displayName").value_or("");

	auto join = session->join(playerId, displayName, conn);
	if (!join.result.success) {
		reject(conn, join.result.error, join.result.message);
		return;
	}

	bind(conn.get(), session->code(), join.playerId);

	crow::json::wvalue reply;
	reply["type"] = "JOINED";
	reply["code"] = session->code();
	reply["playerId"] = join.playerId;
	reply["isAdmin"] = join.isAdmin;
	reply["rejoined"] = join.rejoined;
	if (!BroadcastHub::sendTo(conn, reply.dump())) {
		Logger::debug("[WS] JOINED reply for " + join.playerId + " was not delivered");
	}
}

void MessageRouter::processLeave(const std::shared_ptr<ConnectionSink>& conn, GameSession& session, const std::string& playerId) {
	auto result = session.leave(playerId);
	unbind(conn.get());

	if (!result.success) {
		reject(conn, result.error, result.message);
		return;
	}

	conn->close("Left the game");
}

ActionResult MessageRouter::processSubmitVote(GameSession& session, const std::string& playerId, const crow::json::rvalue& msg) {
	auto card = optionalString(msg, "card");
	if (!card) {
		return ActionResult::fail(EngineError::InvalidRequest, "SUBMIT_VOTE requires a card label");
	}
	return session.castVote(playerId, *card);
}

ActionResult MessageRouter::processStartRound(GameSession& session, const std::string& playerId, const crow::json::rvalue& msg) {
	auto ticketUrl = optionalString(msg, "ticketUrl");
	if (ticketUrl && ticketUrl->empty()) ticketUrl.reset();
	if (ticketUrl && !isHttpUrl(*ticketUrl)) {
		return ActionResult::fail(EngineError::InvalidRequest, "ticketUrl must be an http or https URL");
	}
	return session.startRound(playerId, ticketUrl);
}

bool MessageRouter::isHttpUrl(const std::string& url) {
	for (const std::string_view scheme : { "http://", "https://" }) {
		if (url.size() > scheme.size() && url.starts_with(scheme)) {
			return true;
		}
	}
	return false;
}
