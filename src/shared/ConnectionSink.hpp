#pragma once

#include <string>

namespace PlanningPoker {

	// Outbound half of a client connection. send() must not throw; a false
	// return means the frame could not be delivered and the connection is gone.
	class ConnectionSink {
	public:
		virtual ~ConnectionSink() = default;

		virtual bool send(const std::string& payload) = 0;
		virtual void close(const std::string& reason) = 0;
		virtual bool isOpen() const = 0;
	};

}
