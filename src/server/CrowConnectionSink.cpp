#include "CrowConnectionSink.hpp"
#include "../infra/Logger.hpp"

using namespace PlanningPoker;

CrowConnectionSink::CrowConnectionSink(crow::websocket::connection* conn)
	: conn_(conn) {
}

bool CrowConnectionSink::send(const std::string& payload) {
	std::lock_guard<std::mutex> lock(mutex_);
	if (!open_ || !conn_) return false;

	try {
		conn_->send_text(payload);
		return true;
	}
	catch (const std::exception& e) {
		Logger::warn(std::string("[WS] send_text failed: ") + e.what());
		open_ = false;
		return false;
	}
}

void CrowConnectionSink::close(const std::string& reason) {
	std::lock_guard<std::mutex> lock(mutex_);
	if (!open_ || !conn_) return;

	open_ = false;
	conn_->close(reason);
}

bool CrowConnectionSink::isOpen() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return open_;
}

void CrowConnectionSink::markClosed() {
	std::lock_guard<std::mutex> lock(mutex_);
	open_ = false;
	conn_ = nullptr;
}
