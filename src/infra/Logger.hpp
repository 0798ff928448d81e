#pragma once

#include <string>

namespace PlanningPoker {

	class Logger {
	public:
		static void log(const std::string& message);
		static void debug(const std::string& message);
		static void warn(const std::string& message);
		static void error(const std::string& message);

		static void setDebugEnabled(bool enabled);
		static bool debugEnabled();

	private:
		static void write(bool toStderr, const std::string& message);
	};

}
