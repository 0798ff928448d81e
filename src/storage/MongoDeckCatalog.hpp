#pragma once

#include "../engine/DeckCatalog.hpp"
#include <memory>
#include <string>

namespace PlanningPoker {

	// Deck catalog backed by the "decks" collection. Every deck is read once
	// at construction; lookups afterwards never touch the database.
	class MongoDeckCatalog : public DeckCatalog {
	public:
		explicit MongoDeckCatalog(const std::string& connectionUri, const std::string& dbName);
		~MongoDeckCatalog() override;

		std::optional<Deck> getDeck(int deckId) const override;
		Deck defaultDeck() const override;
		std::vector<DeckSummary> listDecks() const override;

	private:
		class Impl;
		std::unique_ptr<Impl> pImpl;
	};
}
