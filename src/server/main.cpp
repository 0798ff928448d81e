#include "crow.h"
#include <memory>
#include <string>

#include "../engine/DeckCatalog.hpp"
#include "../infra/Logger.hpp"
#include "../infra/TaskQueue.hpp"
#include "../storage/MongoDeckCatalog.hpp"
#include "GameRegistry.hpp"
#include "HttpServer.hpp"
#include "MessageRouter.hpp"
#include "ServerConfig.hpp"

using namespace PlanningPoker;

static std::shared_ptr<const DeckCatalog> loadDeckCatalog(const ServerConfig& config) {
    if (!config.mongoUri.empty()) {
        Logger::log("[INIT] Loading decks from MongoDB database " + config.dbName);
        return std::make_shared<MongoDeckCatalog>(config.mongoUri, config.dbName);
    }

    if (!config.decksFile.empty()) {
        Logger::log("[INIT] Loading decks from " + config.decksFile);
        return std::make_shared<MemoryDeckCatalog>(MemoryDeckCatalog::fromJsonFile(config.decksFile));
    }

    Logger::log("[INIT] Using built-in decks");
    return std::make_shared<MemoryDeckCatalog>(MemoryDeckCatalog::builtIn());
}

int main()
{
    try
    {
        ServerConfig config = ServerConfig::fromEnvironment();
        Logger::setDebugEnabled(config.debugLogging);

        auto catalog = loadDeckCatalog(config);

        auto registry = std::make_shared<GameRegistry>(catalog);

        auto router = std::make_shared<MessageRouter>(registry);

        auto taskQueue = std::make_shared<TaskQueue>(config.workerThreads);

        HttpServer server(registry, router, taskQueue);

        server.run(config.port);

    }
    catch (const std::exception& e) {
        Logger::error(std::string("[FATAL] Main: ") + e.what());
        return -1;
    }

    return 0;
}
