#include "HttpServer.hpp"
#include "../infra/Logger.hpp"

#include <functional>

using namespace PlanningPoker;

namespace {
    constexpr size_t kMaxGameNameLength = 100;

    crow::json::wvalue deckJson(const Deck& deck) {
        crow::json::wvalue json;
        json["id"] = deck.id;
        json["name"] = deck.name;

        crow::json::wvalue cards = crow::json::wvalue::list();
        int index = 0;
        for (const auto& card : deck.cards) {
            crow::json::wvalue c;
            c["label"] = card.label;
            c["value"] = card.value;
            c["numeric"] = card.numeric;
            cards[index++] = std::move(c);
        }
        json["cards"] = std::move(cards);
        return json;
    }
}

HttpServer::HttpServer(
    std::shared_ptr<GameRegistry> registry,
    std::shared_ptr<MessageRouter> router,
    std::shared_ptr<TaskQueue> taskQueue
) : registry(std::move(registry)),
router(std::move(router)),
taskQueue(std::move(taskQueue))
{
    Logger::log("[INIT] HttpServer initialised with " + std::to_string(this->taskQueue->workerCount()) + " worker(s)");
}

HttpServer::~HttpServer() {
    taskQueue->shutdown();
}

void HttpServer::run(uint16_t port) {

    Logger::log("[INIT] HttpServer::run starting on port " + std::to_string(port));

    crow::SimpleApp app;
    app.loglevel(Logger::debugEnabled() ? crow::LogLevel::Debug : crow::LogLevel::Warning);

    CROW_ROUTE(app, "/api/game").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req) {
        Logger::debug("[HTTP] POST /api/game");
        return this->handleCreateGame(req);
            });

    CROW_ROUTE(app, "/api/game/<string>")
        ([this](std::string code) {
        return this->handleGetGame(code);
            });

    CROW_ROUTE(app, "/api/decks")
        ([this]() {
        return this->handleListDecks();
            });

    CROW_ROUTE(app, "/api/decks/<int>")
        ([this](int deckId) {
        return this->handleGetDeck(deckId);
            });

    auto wsOpenHandler = std::bind(&HttpServer::handleWebSocketOpen, this, std::placeholders::_1);
    auto wsCloseHandler = std::bind(&HttpServer::handleWebSocketClose, this,
        std::placeholders::_1, std::placeholders::_2);
    auto wsMessageHandler = std::bind(&HttpServer::handleWebSocketMessage, this,
        std::placeholders::_1, std::placeholders::_2,
        std::placeholders::_3);

    CROW_WEBSOCKET_ROUTE(app, "/ws")
        .onopen(wsOpenHandler)
        .onclose(wsCloseHandler)
        .onmessage(wsMessageHandler);

    app.port(port).multithreaded().run();
}

// HTTP handlers

crow::response HttpServer::handleCreateGame(const crow::request& req) {
    std::optional<int> deckId;
    std::string name;

    if (!req.body.empty()) {
        auto body = crow::json::load(req.body);
        if (!body || body.t() != crow::json::type::Object) {
            return crow::response(400, "Invalid JSON body");
        }

        if (body.has("deck_id") && body["deck_id"].t() != crow::json::type::Null) {
            if (body["deck_id"].t() != crow::json::type::Number) {
                return crow::response(400, "deck_id must be a number");
            }
            deckId = static_cast<int>(body["deck_id"].i());
        }

        if (body.has("name") && body["name"].t() == crow::json::type::String) {
            name = body["name"].s();
        }
    }

    if (name.size() > kMaxGameNameLength) {
        return crow::response(400, "name must be at most 100 characters");
    }

    std::string code = registry->createGame(deckId, name);
    auto session = registry->getSession(code);
    if (!session) {
        return crow::response(500, "Game vanished after creation");
    }

    crow::json::wvalue game;
    game["code"] = session->code();
    game["name"] = session->name();
    game["deck_id"] = session->deck().id;
    return crow::response(game);
}

crow::response HttpServer::handleListDecks() {
    crow::json::wvalue decks = crow::json::wvalue::list();
    int index = 0;
    for (const auto& summary : registry->catalog().listDecks()) {
        crow::json::wvalue d;
        d["id"] = summary.id;
        d["name"] = summary.name;
        d["card_count"] = static_cast<int>(summary.cardCount);
        decks[index++] = std::move(d);
    }
    return crow::response(decks);
}

crow::response HttpServer::handleGetDeck(int deckId) {
    auto deck = registry->catalog().getDeck(deckId);
    if (!deck) {
        return crow::response(404, "No deck exists with ID " + std::to_string(deckId));
    }
    return crow::response(deckJson(*deck));
}

crow::response HttpServer::handleGetGame(const std::string& code) {
    auto session = registry->getSession(code);
    if (!session) {
        return crow::response(404, "No existing game found with code '" + code + "'");
    }

    auto info = session->info();
    crow::json::wvalue game;
    game["code"] = info.code;
    game["name"] = info.name;
    game["deck_id"] = info.deckId;
    game["players"] = static_cast<int>(info.playerCount);
    game["round_state"] = toString(info.roundState);
    return crow::response(game);
}

// WebSocket handlers

void HttpServer::handleWebSocketOpen(crow::websocket::connection& conn) {
    auto sink = std::make_shared<CrowConnectionSink>(&conn);
    {
        std::lock_guard<std::mutex> lock(sinksMutex);
        sinks[&conn] = sink;
    }

    Logger::log("[WS] New connection: " + std::to_string(laneKey(&conn)));

    taskQueue->enqueue(laneKey(&conn), [this, sink]() {
        router->onOpen(sink);
        });
}

void HttpServer::handleWebSocketClose(crow::websocket::connection& conn, const std::string& reason) {
    std::shared_ptr<CrowConnectionSink> sink;
    {
        std::lock_guard<std::mutex> lock(sinksMutex);
        auto it = sinks.find(&conn);
        if (it == sinks.end()) return;
        sink = std::move(it->second);
        sinks.erase(it);
    }

    // Crow frees conn after this handler returns.
    sink->markClosed();

    taskQueue->enqueue(laneKey(&conn), [this, sink]() {
        router->onClose(sink.get());
        });

    Logger::log("[WS] Closed (" + reason + ")");
}

void HttpServer::handleWebSocketMessage(crow::websocket::connection& conn, const std::string& data, bool is_binary) {
    if (is_binary) return;

    auto sink = findSink(&conn);
    if (!sink) return;

    taskQueue->enqueue(laneKey(&conn), [this, sink, data]() {
        router->onMessage(sink, data);
        });
}

std::shared_ptr<CrowConnectionSink> HttpServer::findSink(crow::websocket::connection* conn) {
    std::lock_guard<std::mutex> lock(sinksMutex);
    auto it = sinks.find(conn);
    return it != sinks.end() ? it->second : nullptr;
}

uint64_t HttpServer::laneKey(crow::websocket::connection* conn) {
    return static_cast<uint64_t>(reinterpret_cast<uintptr_t>(conn));
}
