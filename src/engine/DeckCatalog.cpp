#include "DeckCatalog.hpp"

#include "crow.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace PlanningPoker;

MemoryDeckCatalog::MemoryDeckCatalog(std::vector<Deck> decks) {
	for (auto& deck : decks) {
		if (deck.cards.empty()) {
			throw std::invalid_argument("Deck " + std::to_string(deck.id) + " has no cards");
		}
		if (!decks_.emplace(deck.id, std::move(deck)).second) {
			throw std::invalid_argument("Duplicate deck id " + std::to_string(deck.id));
		}
	}

	if (decks_.empty()) {
		throw std::invalid_argument("Deck catalog is empty");
	}
}

MemoryDeckCatalog MemoryDeckCatalog::builtIn() {
	Deck fibonacci{
		.id = 1,
		.name = "Fibonacci",
		.cards = {
			{ "1/2", 0.5 },
			{ "1", 1 },
			{ "2", 2 },
			{ "3", 3 },
			{ "5", 5 },
			{ "8", 8 },
			{ "13", 13 },
			{ "21", 21 },
			{ "?", 0, false }
		}
	};

	Deck tshirt{
		.id = 2,
		.name = "T-Shirt",
		.cards = {
			{ "XS", 1 },
			{ "S", 2 },
			{ "M", 3 },
			{ "L", 5 },
			{ "XL", 8 },
			{ "?", 0, false }
		}
	};

	return MemoryDeckCatalog({ fibonacci, tshirt });
}

MemoryDeckCatalog MemoryDeckCatalog::fromJson(const std::string& json) {
	auto doc = crow::json::load(json);
	if (!doc || doc.t() != crow::json::type::List) {
		throw std::runtime_error("Deck definitions must be a JSON list");
	}

	std::vector<Deck> decks;
	for (const auto& entry : doc) {
		if (!entry.has("id") || !entry.has("name") || !entry.has("cards")) {
			throw std::runtime_error("Deck definition requires id, name and cards");
		}

		Deck deck;
		deck.id = static_cast<int>(entry["id"].i());
		deck.name = entry["name"].s();

		for (const auto& c : entry["cards"]) {
			if (!c.has("label") || !c.has("value")) {
				throw std::runtime_error("Card in deck " + deck.name + " requires label and value");
			}
			Card card;
			card.label = c["label"].s();
			card.value = c["value"].d();
			card.numeric = c.has("numeric") ? c["numeric"].b() : true;
			deck.cards.push_back(card);
		}

		decks.push_back(std::move(deck));
	}

	return MemoryDeckCatalog(std::move(decks));
}

MemoryDeckCatalog MemoryDeckCatalog::fromJsonFile(const std::string& path) {
	std::ifstream in(path);
	if (!in) {
		throw std::runtime_error("Cannot open deck file " + path);
	}
	std::ostringstream buffer;
	buffer << in.rdbuf();
	return fromJson(buffer.str());
}

std::optional<Deck> MemoryDeckCatalog::getDeck(int deckId) const {
	auto it = decks_.find(deckId);
	if (it == decks_.end()) return std::nullopt;
	return it->second;
}

Deck MemoryDeckCatalog::defaultDeck() const {
	return decks_.begin()->second;
}

std::vector<DeckSummary> MemoryDeckCatalog::listDecks() const {
	std::vector<DeckSummary> summaries;
	summaries.reserve(decks_.size());
	for (const auto& [id, deck] : decks_) {
		summaries.push_back(deck.summary());
	}
	return summaries;
}
