#pragma once

#include "../shared/DTOs.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace PlanningPoker {

	// Read-only source of decks. getDeck() returns nullopt for an unknown id;
	// whether to fall back or reject is up to the caller.
	class DeckCatalog {
	public:
		virtual ~DeckCatalog() = default;

		virtual std::optional<Deck> getDeck(int deckId) const = 0;
		virtual Deck defaultDeck() const = 0;
		virtual std::vector<DeckSummary> listDecks() const = 0;
	};

	class MemoryDeckCatalog : public DeckCatalog {
	public:
		explicit MemoryDeckCatalog(std::vector<Deck> decks);

		static MemoryDeckCatalog builtIn();
		static MemoryDeckCatalog fromJson(const std::string& json);
		static MemoryDeckCatalog fromJsonFile(const std::string& path);

		std::optional<Deck> getDeck(int deckId) const override;
		Deck defaultDeck() const override;
		std::vector<DeckSummary> listDecks() const override;

	private:
		std::map<int, Deck> decks_;
	};

}
