#include "MongoDeckCatalog.hpp"
#include "../infra/Logger.hpp"

#include <bsoncxx/types.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/uri.hpp>
#include <bsoncxx/builder/stream/document.hpp>

#include <stdexcept>

using namespace PlanningPoker;
using namespace bsoncxx::builder::stream;

static mongocxx::instance instance{};

namespace {

	double numberOf(const bsoncxx::document::element& el) {
		switch (el.type()) {
		case bsoncxx::type::k_double: return el.get_double().value;
		case bsoncxx::type::k_int32: return el.get_int32().value;
		case bsoncxx::type::k_int64: return static_cast<double>(el.get_int64().value);
		default:
			throw std::runtime_error("Expected a number in deck document");
		}
	}

	Deck deckFromDocument(const bsoncxx::document::view& view) {
		if (!view["id"] || !view["name"] || !view["cards"]
			|| view["cards"].type() != bsoncxx::type::k_array) {
			throw std::runtime_error("Deck document requires id, name and cards");
		}

		Deck deck;
		deck.id = static_cast<int>(numberOf(view["id"]));
		deck.name = std::string(view["name"].get_string().value);

		for (const auto& el : view["cards"].get_array().value) {
			auto doc = el.get_document().view();
			if (!doc["label"] || !doc["value"]) {
				throw std::runtime_error("Card in deck " + deck.name + " requires label and value");
			}

			Card card;
			card.label = std::string(doc["label"].get_string().value);
			card.value = numberOf(doc["value"]);
			if (doc["numeric"] && doc["numeric"].type() == bsoncxx::type::k_bool) {
				card.numeric = doc["numeric"].get_bool().value;
			}
			deck.cards.push_back(card);
		}

		return deck;
	}
}

class MongoDeckCatalog::Impl {
public:
	std::unique_ptr<MemoryDeckCatalog> decks;

	Impl(const std::string& uriString, const std::string& dbName) {
		mongocxx::uri uri{ uriString };
		mongocxx::pool pool{ uri };

		auto conn = pool.acquire();
		auto db = (*conn)[dbName];
		auto collection = db["decks"];

		std::vector<Deck> loaded;
		auto cursor = collection.find(document{} << finalize);
		for (auto&& doc : cursor) {
			loaded.push_back(deckFromDocument(doc));
		}

		Logger::log("[MONGO] Loaded " + std::to_string(loaded.size()) + " deck(s) from " + dbName + ".decks");

		decks = std::make_unique<MemoryDeckCatalog>(std::move(loaded));
	}
};

MongoDeckCatalog::MongoDeckCatalog(const std::string& connectionUri, const std::string& dbName)
	: pImpl(std::make_unique<Impl>(connectionUri, dbName)) {
}

MongoDeckCatalog::~MongoDeckCatalog() = default;

std::optional<Deck> MongoDeckCatalog::getDeck(int deckId) const {
	return pImpl->decks->getDeck(deckId);
}

Deck MongoDeckCatalog::defaultDeck() const {
	return pImpl->decks->defaultDeck();
}

std::vector<DeckSummary> MongoDeckCatalog::listDecks() const {
	return pImpl->decks->listDecks();
}
