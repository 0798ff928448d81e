#pragma once

#include "../engine/DeckCatalog.hpp"
#include "../engine/GameSession.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace PlanningPoker {

	// Owns every live game, keyed by its lower-case code. Constructed once in
	// main and handed to the request handlers; it must outlive the sessions'
	// users since sessions call back into it when they empty.
	class GameRegistry {
	public:
		using CodeGenerator = std::function<std::string()>;

		explicit GameRegistry(std::shared_ptr<const DeckCatalog> catalog, CodeGenerator codeGenerator = {});
		~GameRegistry() = default;

		GameRegistry(const GameRegistry&) = delete;
		GameRegistry& operator=(const GameRegistry&) = delete;

		std::string createGame(std::optional<int> deckId = std::nullopt, const std::string& name = "");

		// nullptr when no live game has this code.
		std::shared_ptr<GameSession> getSession(const std::string& code) const;
		bool sessionExists(const std::string& code) const;

		void removeSession(const std::string& code);

		size_t sessionCount() const;
		std::vector<std::string> listCodes() const;

		const DeckCatalog& catalog() const { return *catalog_; }

		static std::string normalizeCode(const std::string& code);
		static bool isValidCode(const std::string& code);
		static std::string randomCode(size_t length = 4);

	private:
		mutable std::mutex mutex_;
		std::unordered_map<std::string, std::shared_ptr<GameSession>> sessions_;
		std::shared_ptr<const DeckCatalog> catalog_;
		CodeGenerator codeGenerator_;

		std::string generateCode() const;
		void removeSessionInstance(const std::string& code, const GameSession* session);
	};

}
