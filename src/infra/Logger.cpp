#include "Logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <print>
#include <sstream>

namespace PlanningPoker {

	namespace {
		std::mutex logMutex;
		std::atomic<bool> debugOn{ false };

		std::string timestamp() {
			auto now = std::chrono::system_clock::now();
			std::time_t t = std::chrono::system_clock::to_time_t(now);
			auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
				now.time_since_epoch()) % 1000;

			std::tm tm{};
			gmtime_r(&t, &tm);

			std::ostringstream oss;
			oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
				<< '.' << std::setw(3) << std::setfill('0') << ms.count();
			return oss.str();
		}
	}

	void Logger::log(const std::string& message) {
		write(false, message);
	}

	void Logger::debug(const std::string& message) {
		if (!debugOn.load()) return;
		write(false, "[DEBUG] " + message);
	}

	void Logger::warn(const std::string& message) {
		write(true, "[WARN] " + message);
	}

	void Logger::error(const std::string& message) {
		write(true, "[ERROR] " + message);
	}

	void Logger::setDebugEnabled(bool enabled) {
		debugOn.store(enabled);
	}

	bool Logger::debugEnabled() {
		return debugOn.load();
	}

	void Logger::write(bool toStderr, const std::string& message) {
		std::lock_guard<std::mutex> lock(logMutex);
		std::FILE* out = toStderr ? stderr : stdout;
		std::println(out, "{} {}", timestamp(), message);
		std::fflush(out);
	}
}
