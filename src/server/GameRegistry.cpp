#include "GameRegistry.hpp"
#include "../infra/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <stdexcept>

using namespace PlanningPoker;

namespace {
	constexpr int kMaxCodeAttempts = 1000;
}

GameRegistry::GameRegistry(std::shared_ptr<const DeckCatalog> catalog, CodeGenerator codeGenerator)
	: catalog_(std::move(catalog)),
	codeGenerator_(std::move(codeGenerator)) {

	if (!catalog_) {
		throw std::invalid_argument("GameRegistry requires a deck catalog");
	}
	if (!codeGenerator_) {
		codeGenerator_ = []() { return randomCode(); };
	}
}

std::string GameRegistry::randomCode(size_t length) {
	static const char alphanum[] =
		"abcdefghijklmnopqrstuvwxyz"
		"0123456789";

	static thread_local std::mt19937 gen(std::random_device{}());
	std::uniform_int_distribution<> dis(0, sizeof(alphanum) - 2);

	std::string code;
	for (size_t i = 0; i < length; ++i) {
		code += alphanum[dis(gen)];
	}
	return code;
}

std::string GameRegistry::normalizeCode(const std::string& code) {
	std::string normalized = code;
	std::transform(normalized.begin(), normalized.end(), normalized.begin(),
		[](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return normalized;
}

bool GameRegistry::isValidCode(const std::string& code) {
	if (code.size() < 4 || code.size() > 10) return false;
	return std::all_of(code.begin(), code.end(), [](unsigned char c) {
		return std::isdigit(c) || (std::isalpha(c) && std::islower(c));
	});
}

std::string GameRegistry::generateCode() const {
	for (int attempt = 0; attempt < kMaxCodeAttempts; ++attempt) {
		std::string code = normalizeCode(codeGenerator_());
		if (isValidCode(code) && sessions_.find(code) == sessions_.end()) {
			return code;
		}
	}
	throw std::runtime_error("Unable to generate a unique game code");
}

std::string GameRegistry::createGame(std::optional<int> deckId, const std::string& name) {
	std::optional<Deck> deck;
	if (deckId) {
		deck = catalog_->getDeck(*deckId);
		if (!deck) {
			Logger::warn("[LOBBY] Unknown deck " + std::to_string(*deckId) + ", falling back to the default deck");
		}
	}
	if (!deck) {
		deck = catalog_->defaultDeck();
	}

	std::lock_guard<std::mutex> lock(mutex_);

	std::string code = generateCode();
	std::string gameName = name.empty() ? "Game " + code : name;
	int resolvedDeckId = deck->id;

	auto session = std::make_shared<GameSession>(code, gameName, std::move(*deck),
		[this, code](const GameSession& s) { removeSessionInstance(code, &s); });

	sessions_.emplace(code, std::move(session));

	Logger::log("[LOBBY] New game '" + gameName + "' created with deck " + std::to_string(resolvedDeckId)
		+ " and code '" + code + "'");
	return code;
}

std::shared_ptr<GameSession> GameRegistry::getSession(const std::string& code) const {
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = sessions_.find(normalizeCode(code));
	if (it != sessions_.end()) return it->second;

	return nullptr;
}

bool GameRegistry::sessionExists(const std::string& code) const {
	std::lock_guard<std::mutex> lock(mutex_);
	return sessions_.find(normalizeCode(code)) != sessions_.end();
}

void GameRegistry::removeSession(const std::string& code) {
	std::lock_guard<std::mutex> lock(mutex_);
	if (sessions_.erase(normalizeCode(code)) > 0) {
		Logger::log("[LOBBY] Game '" + normalizeCode(code) + "' removed");
	}
}

void GameRegistry::removeSessionInstance(const std::string& code, const GameSession* session) {
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = sessions_.find(code);
	if (it == sessions_.end() || it->second.get() != session) return;

	sessions_.erase(it);
	Logger::log("[LOBBY] Game '" + code + "' is empty, removed");
}

size_t GameRegistry::sessionCount() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return sessions_.size();
}

std::vector<std::string> GameRegistry::listCodes() const {
	std::lock_guard<std::mutex> lock(mutex_);

	std::vector<std::string> codes;
	codes.reserve(sessions_.size());
	for (const auto& [code, session] : sessions_) {
		codes.push_back(code);
	}
	std::sort(codes.begin(), codes.end());
	return codes;
}
