#include "ServerConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace PlanningPoker {

	std::string getEnvVar(const char* key, const char* defaultValue) {
		char* val = std::getenv(key);
		return val ? std::string(val) : std::string(defaultValue);
	}

	namespace {
		long parseNumber(const std::string& key, const std::string& value, long min, long max) {
			size_t consumed = 0;
			long parsed = 0;
			try {
				parsed = std::stol(value, &consumed);
			}
			catch (const std::exception&) {
				throw std::invalid_argument(key + " must be a number, got '" + value + "'");
			}
			if (consumed != value.size() || parsed < min || parsed > max) {
				throw std::invalid_argument(key + " must be between " + std::to_string(min)
					+ " and " + std::to_string(max) + ", got '" + value + "'");
			}
			return parsed;
		}
	}

	ServerConfig ServerConfig::fromLookup(const Lookup& lookup) {
		ServerConfig config;

		if (auto port = lookup("PORT")) {
			config.port = static_cast<uint16_t>(parseNumber("PORT", *port, 1, 65535));
		}
		if (auto workers = lookup("WORKER_THREADS")) {
			config.workerThreads = static_cast<size_t>(parseNumber("WORKER_THREADS", *workers, 1, 256));
		}
		if (auto uri = lookup("MONGO_URI")) config.mongoUri = *uri;
		if (auto db = lookup("DB_NAME"); db && !db->empty()) config.dbName = *db;
		if (auto decks = lookup("DECKS_FILE")) config.decksFile = *decks;

		if (auto level = lookup("LOG_LEVEL")) {
			std::string lowered = *level;
			std::transform(lowered.begin(), lowered.end(), lowered.begin(),
				[](unsigned char c) { return static_cast<char>(std::tolower(c)); });
			config.debugLogging = lowered == "debug";
		}

		return config;
	}

	ServerConfig ServerConfig::fromEnvironment() {
		return fromLookup([](const std::string& key) -> std::optional<std::string> {
			std::string value = getEnvVar(key.c_str());
			if (value.empty()) return std::nullopt;
			return value;
		});
	}
}
