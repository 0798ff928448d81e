#pragma once

#include "Enums.hpp"
#include "ConnectionSink.hpp"
#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace PlanningPoker {

	struct Card {
		std::string label;
		double value{ 0.0 };
		bool numeric{ true };

		bool operator==(const Card& other) const {
			return label == other.label;
		}
	};

	struct DeckSummary {
		int id{ 0 };
		std::string name;
		size_t cardCount{ 0 };
	};

	struct Deck {
		int id{ 0 };
		std::string name;
		std::vector<Card> cards;

		std::optional<Card> findCard(const std::string& label) const {
			auto it = std::find_if(cards.begin(), cards.end(),
				[&label](const Card& c) { return c.label == label; });
			if (it == cards.end()) return std::nullopt;
			return *it;
		}

		bool contains(const Card& card) const {
			return findCard(card.label).has_value();
		}

		DeckSummary summary() const {
			return { .id = id, .name = name, .cardCount = cards.size() };
		}
	};

	struct PlayerInfo {
		std::string id;
		std::string displayName;

		std::optional<Card> currentVote;
		bool observing{ false };

		std::shared_ptr<ConnectionSink> connection;

		bool isConnected() const {
			return connection && connection->isOpen();
		}

		bool hasVoted() const {
			return currentVote.has_value();
		}
	};

	struct GameInfo {
		std::string code;
		std::string name;
		int deckId{ 0 };
		size_t playerCount{ 0 };
		RoundState roundState{ RoundState::Init };
	};

}
