#pragma once

#include <memory>
#include <crow.h>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../infra/TaskQueue.hpp"
#include "CrowConnectionSink.hpp"
#include "GameRegistry.hpp"
#include "MessageRouter.hpp"

namespace PlanningPoker {

    class HttpServer {
    public:
        HttpServer(
            std::shared_ptr<GameRegistry> registry,
            std::shared_ptr<MessageRouter> router,
            std::shared_ptr<TaskQueue> taskQueue
            );
        // Drains the task queue while the handlers' state is still alive.
        ~HttpServer();

        void run(uint16_t port = 8080);
    private:

        // HTTP handlers
        crow::response handleCreateGame(const crow::request& req);
        crow::response handleListDecks();
        crow::response handleGetDeck(int deckId);
        crow::response handleGetGame(const std::string& code);

		// WebSocket handlers
		void handleWebSocketOpen(crow::websocket::connection& conn);
		void handleWebSocketClose(crow::websocket::connection& conn, const std::string& reason);
		void handleWebSocketMessage(crow::websocket::connection& conn, const std::string& data, bool is_binary);

        std::shared_ptr<CrowConnectionSink> findSink(crow::websocket::connection* conn);
        static uint64_t laneKey(crow::websocket::connection* conn);

		// Components
        std::shared_ptr<GameRegistry> registry;
        std::shared_ptr<MessageRouter> router;
        std::shared_ptr<TaskQueue> taskQueue;

        std::mutex sinksMutex;
        std::unordered_map<crow::websocket::connection*, std::shared_ptr<CrowConnectionSink>> sinks;
    };
}
