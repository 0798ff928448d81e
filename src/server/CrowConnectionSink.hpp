#pragma once

#include "crow.h"
#include "../shared/ConnectionSink.hpp"
#include <mutex>
#include <string>

namespace PlanningPoker {

	// ConnectionSink over a Crow websocket connection. Crow frees the
	// connection once its close handler returns, so the handler must call
	// markClosed() first; every later send() is refused.
	class CrowConnectionSink : public ConnectionSink {
	public:
		explicit CrowConnectionSink(crow::websocket::connection* conn);

		bool send(const std::string& payload) override;
		void close(const std::string& reason) override;
		bool isOpen() const override;

		void markClosed();

	private:
		mutable std::mutex mutex_;
		crow::websocket::connection* conn_;
		bool open_{ true };
	};

}
