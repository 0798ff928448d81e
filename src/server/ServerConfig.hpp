#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace PlanningPoker {

	std::string getEnvVar(const char* key, const char* defaultValue = "");

	struct ServerConfig {
		uint16_t port{ 8080 };
		size_t workerThreads{ 4 };
		std::string mongoUri;
		std::string dbName{ "PlanningPokerDB" };
		std::string decksFile;
		bool debugLogging{ false };

		using Lookup = std::function<std::optional<std::string>(const std::string&)>;

		// Throws std::invalid_argument on a malformed value.
		static ServerConfig fromLookup(const Lookup& lookup);
		static ServerConfig fromEnvironment();
	};

}
