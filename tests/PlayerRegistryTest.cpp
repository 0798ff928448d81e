#include <gtest/gtest.h>

#include "FakeConnection.hpp"
#include "engine/PlayerRegistry.hpp"

#include <random>
#include <regex>

using namespace PlanningPoker;
using PlanningPoker::Testing::FakeConnection;

TEST(PlayerRegistryTest, FirstJoinerBecomesAdmin) {
	PlayerRegistry registry;

	auto first = registry.join(std::nullopt, "Ada", std::make_shared<FakeConnection>());
	ASSERT_NE(first.player, nullptr);
	EXPECT_TRUE(first.becameAdmin);
	std::string adaId = first.player->id;

	auto second = registry.join(std::nullopt, "Bob", std::make_shared<FakeConnection>());
	EXPECT_FALSE(second.becameAdmin);
	EXPECT_EQ(registry.adminId(), adaId);
	EXPECT_EQ(registry.size(), 2u);
}

TEST(PlayerRegistryTest, GeneratedIdsAreUuids) {
	std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
	for (int i = 0; i < 50; ++i) {
		EXPECT_TRUE(std::regex_match(PlayerRegistry::generatePlayerId(), uuid));
	}
}

TEST(PlayerRegistryTest, UnknownIdGetsFreshIdentity) {
	PlayerRegistry registry;

	auto joined = registry.join(std::string("not-a-player"), "Ada", nullptr);
	EXPECT_FALSE(joined.rejoined);
	EXPECT_NE(joined.player->id, "not-a-player");
}

TEST(PlayerRegistryTest, RejoinKeepsVoteAndReplacesConnection) {
	PlayerRegistry registry;
	auto oldConn = std::make_shared<FakeConnection>();

	auto joined = registry.join(std::nullopt, "Ada", oldConn);
	std::string id = joined.player->id;
	joined.player->currentVote = Card{ "5", 5 };

	auto newConn = std::make_shared<FakeConnection>();
	auto rejoined = registry.join(id, "", newConn);

	EXPECT_TRUE(rejoined.rejoined);
	EXPECT_EQ(rejoined.player->id, id);
	EXPECT_EQ(rejoined.player->displayName, "Ada");
	ASSERT_TRUE(rejoined.player->currentVote.has_value());
	EXPECT_EQ(rejoined.player->currentVote->label, "5");
	EXPECT_EQ(rejoined.replacedConnection, oldConn);
	EXPECT_EQ(rejoined.player->connection, newConn);
	EXPECT_EQ(registry.size(), 1u);
	EXPECT_TRUE(registry.isAdmin(id));
}

TEST(PlayerRegistryTest, AdminSuccessionPicksEarliestJoined) {
	PlayerRegistry registry;
	std::string a = registry.join(std::nullopt, "A", nullptr).player->id;
	std::string b = registry.join(std::nullopt, "B", nullptr).player->id;
	std::string c = registry.join(std::nullopt, "C", nullptr).player->id;

	EXPECT_TRUE(registry.remove(b));
	EXPECT_EQ(registry.adminId(), a);

	EXPECT_TRUE(registry.remove(a));
	EXPECT_EQ(registry.adminId(), c);

	EXPECT_TRUE(registry.remove(c));
	EXPECT_TRUE(registry.empty());
	EXPECT_TRUE(registry.adminId().empty());
}

TEST(PlayerRegistryTest, RemoveUnknownPlayerFails) {
	PlayerRegistry registry;
	registry.join(std::nullopt, "A", nullptr);
	EXPECT_FALSE(registry.remove("ghost"));
	EXPECT_EQ(registry.size(), 1u);
}

TEST(PlayerRegistryTest, DetachKeepsPlayerAndAdmin) {
	PlayerRegistry registry;
	auto conn = std::make_shared<FakeConnection>();
	std::string a = registry.join(std::nullopt, "A", conn).player->id;
	EXPECT_EQ(registry.connectedCount(), 1u);

	auto detached = registry.detach(a);
	EXPECT_EQ(detached, conn);
	EXPECT_EQ(registry.connectedCount(), 0u);
	EXPECT_TRUE(registry.isAdmin(a));
	EXPECT_NE(registry.find(a), nullptr);
}

TEST(PlayerRegistryTest, ClearVotesResetsEveryPlayer) {
	PlayerRegistry registry;
	auto* a = registry.join(std::nullopt, "A", nullptr).player;
	a->currentVote = Card{ "1", 1 };
	auto* b = registry.join(std::nullopt, "B", nullptr).player;
	b->currentVote = Card{ "2", 2 };

	registry.clearVotes();
	for (const auto& p : registry.players()) {
		EXPECT_FALSE(p.hasVoted());
	}
}

TEST(PlayerRegistryTest, RandomJoinLeaveKeepsExactlyOneAdmin) {
	PlayerRegistry registry;
	std::vector<std::string> present;
	std::mt19937 gen(1234);

	for (int step = 0; step < 500; ++step) {
		bool doJoin = present.empty() || gen() % 3 != 0;
		if (doJoin) {
			present.push_back(registry.join(std::nullopt, "p" + std::to_string(step), nullptr).player->id);
		}
		else {
			size_t idx = gen() % present.size();
			ASSERT_TRUE(registry.remove(present[idx]));
			present.erase(present.begin() + static_cast<long>(idx));
		}

		if (present.empty()) {
			EXPECT_TRUE(registry.adminId().empty());
		}
		else {
			ASSERT_NE(registry.find(registry.adminId()), nullptr);
			int admins = 0;
			for (const auto& p : registry.players()) {
				if (registry.isAdmin(p.id)) admins++;
			}
			EXPECT_EQ(admins, 1);
		}
	}
}
