#include <gtest/gtest.h>

#include "FakeConnection.hpp"
#include "engine/DeckCatalog.hpp"
#include "engine/GameSession.hpp"

#include <thread>
#include <vector>

using namespace PlanningPoker;
using PlanningPoker::Testing::FakeConnection;

namespace {

	class GameSessionTest : public ::testing::Test {
	protected:
		void SetUp() override {
			session = std::make_unique<GameSession>("ab12", "Sprint 42",
				MemoryDeckCatalog::builtIn().defaultDeck(),
				[this](const GameSession&) { emptied++; });
		}

		std::string joinPlayer(const std::string& name, std::shared_ptr<FakeConnection> conn) {
			auto join = session->join(std::nullopt, name, std::move(conn));
			EXPECT_TRUE(join.result.success) << join.result.message;
			return join.playerId;
		}

		const crow::json::rvalue* findPlayer(const crow::json::rvalue& state, const std::string& id) {
			for (const auto& p : state["players"]) {
				if (std::string(p["id"].s()) == id) return &p;
			}
			return nullptr;
		}

		std::unique_ptr<GameSession> session;
		int emptied{ 0 };
	};

}

TEST_F(GameSessionTest, FirstJoinerIsAdminInInit) {
	auto conn = std::make_shared<FakeConnection>();
	auto join = session->join(std::nullopt, "P1", conn);

	ASSERT_TRUE(join.result.success);
	EXPECT_TRUE(join.isAdmin);
	EXPECT_EQ(session->adminId(), join.playerId);
	EXPECT_EQ(session->roundState(), RoundState::Init);

	auto state = conn->lastJson();
	ASSERT_TRUE(state);
	EXPECT_EQ(std::string(state["type"].s()), "STATE");
	EXPECT_EQ(std::string(state["round_state"].s()), "INIT");
	EXPECT_EQ(std::string(state["admin_id"].s()), join.playerId);
	EXPECT_EQ(std::string(state["deck"]["name"].s()), "Fibonacci");
	EXPECT_FALSE(state.has("aggregate"));
}

TEST_F(GameSessionTest, EmptyDisplayNameIsRejected) {
	auto join = session->join(std::nullopt, "", std::make_shared<FakeConnection>());
	EXPECT_FALSE(join.result.success);
	EXPECT_EQ(join.result.error, EngineError::InvalidRequest);
	EXPECT_EQ(session->playerCount(), 0u);
}

TEST_F(GameSessionTest, FullRoundScenario) {
	auto c1 = std::make_shared<FakeConnection>();
	auto c2 = std::make_shared<FakeConnection>();

	std::string p1 = joinPlayer("P1", c1);
	ASSERT_TRUE(session->startRound(p1).success);
	EXPECT_EQ(session->roundState(), RoundState::Voting);

	// P2 joins mid-vote and sees P1 has not voted.
	std::string p2 = joinPlayer("P2", c2);
	{
		auto state = c2->lastJson();
		EXPECT_EQ(std::string(state["round_state"].s()), "VOTING");
		auto* p1State = findPlayer(state, p1);
		ASSERT_NE(p1State, nullptr);
		EXPECT_FALSE((*p1State)["has_voted"].b());
		EXPECT_FALSE(p1State->has("card"));
	}

	// P1 votes; everyone sees has_voted but not the value.
	ASSERT_TRUE(session->castVote(p1, Card{ "3", 3.0 }).success);
	for (const auto& conn : { c1, c2 }) {
		auto state = conn->lastJson();
		auto* p1State = findPlayer(state, p1);
		ASSERT_NE(p1State, nullptr);
		EXPECT_TRUE((*p1State)["has_voted"].b());
		EXPECT_FALSE(p1State->has("card"));
		EXPECT_FALSE(state.has("aggregate"));
	}

	// Reveal: P1's card is visible, P2 did not vote and is excluded from the average.
	ASSERT_TRUE(session->reveal(p1).success);
	{
		auto state = c2->lastJson();
		EXPECT_EQ(std::string(state["round_state"].s()), "REVEALED");
		auto* p1State = findPlayer(state, p1);
		ASSERT_NE(p1State, nullptr);
		ASSERT_TRUE(p1State->has("card"));
		EXPECT_DOUBLE_EQ((*p1State)["card"]["value"].d(), 3.0);

		auto* p2State = findPlayer(state, p2);
		ASSERT_NE(p2State, nullptr);
		EXPECT_FALSE((*p2State)["has_voted"].b());
		EXPECT_FALSE(p2State->has("card"));

		ASSERT_TRUE(state.has("aggregate"));
		EXPECT_EQ(state["aggregate"]["vote_count"].i(), 1);
		EXPECT_EQ(state["aggregate"]["numeric_count"].i(), 1);
		EXPECT_DOUBLE_EQ(state["aggregate"]["average"].d(), 3.0);
		EXPECT_TRUE(state["aggregate"]["consensus"].b());
	}

	auto revealed = session->revealedVotes();
	ASSERT_EQ(revealed.size(), 1u);
	EXPECT_EQ(revealed[0].playerId, p1);
	EXPECT_EQ(revealed[0].displayName, "P1");

	// Admin leaves; P2 takes over and the game survives.
	ASSERT_TRUE(session->leave(p1).success);
	EXPECT_FALSE(session->isClosed());
	EXPECT_EQ(session->adminId(), p2);
	EXPECT_EQ(emptied, 0);

	// Last player leaves; the game closes.
	ASSERT_TRUE(session->leave(p2).success);
	EXPECT_TRUE(session->isClosed());
	EXPECT_EQ(emptied, 1);
}

TEST_F(GameSessionTest, VotingSnapshotsNeverContainCards) {
	auto c1 = std::make_shared<FakeConnection>();
	auto c2 = std::make_shared<FakeConnection>();
	std::string p1 = joinPlayer("P1", c1);
	std::string p2 = joinPlayer("P2", c2);

	ASSERT_TRUE(session->startRound(p1).success);
	ASSERT_TRUE(session->castVote(p1, "8").success);
	ASSERT_TRUE(session->castVote(p2, "13").success);
	ASSERT_TRUE(session->castVote(p2, "21").success);
	ASSERT_TRUE(session->sync(p2).success);

	for (const auto& conn : { c1, c2 }) {
		for (const auto& raw : conn->messages()) {
			auto state = crow::json::load(raw);
			ASSERT_TRUE(state);
			if (std::string(state["round_state"].s()) != "VOTING") continue;
			for (const auto& p : state["players"]) {
				EXPECT_FALSE(p.has("card")) << raw;
			}
			EXPECT_FALSE(state.has("aggregate")) << raw;
		}
	}
}

TEST_F(GameSessionTest, LastWriteWinsWhileVoting) {
	std::string p1 = joinPlayer("P1", std::make_shared<FakeConnection>());
	ASSERT_TRUE(session->startRound(p1).success);
	ASSERT_TRUE(session->castVote(p1, "2").success);
	ASSERT_TRUE(session->castVote(p1, "13").success);

	auto player = session->player(p1);
	ASSERT_TRUE(player.has_value());
	EXPECT_EQ(player->currentVote->label, "13");
}

TEST_F(GameSessionTest, VoteOutsideVotingFailsWithoutMutation) {
	std::string p1 = joinPlayer("P1", std::make_shared<FakeConnection>());

	auto result = session->castVote(p1, "3");
	EXPECT_EQ(result.error, EngineError::InvalidState);
	EXPECT_FALSE(session->player(p1)->hasVoted());

	ASSERT_TRUE(session->startRound(p1).success);
	ASSERT_TRUE(session->castVote(p1, "5").success);
	ASSERT_TRUE(session->reveal(p1).success);

	result = session->castVote(p1, "8");
	EXPECT_EQ(result.error, EngineError::InvalidState);
	EXPECT_EQ(session->player(p1)->currentVote->label, "5");
}

TEST_F(GameSessionTest, UnknownCardIsRejected) {
	std::string p1 = joinPlayer("P1", std::make_shared<FakeConnection>());
	ASSERT_TRUE(session->startRound(p1).success);
	ASSERT_TRUE(session->castVote(p1, "5").success);

	auto result = session->castVote(p1, Card{ "XL", 8 });
	EXPECT_FALSE(result.success);
	EXPECT_EQ(result.error, EngineError::UnknownCard);
	EXPECT_EQ(session->player(p1)->currentVote->label, "5");
	EXPECT_EQ(session->roundState(), RoundState::Voting);
}

TEST_F(GameSessionTest, UnknownPlayerCannotVote) {
	std::string p1 = joinPlayer("P1", std::make_shared<FakeConnection>());
	ASSERT_TRUE(session->startRound(p1).success);
	EXPECT_EQ(session->castVote("ghost", "5").error, EngineError::UnknownPlayer);
}

TEST_F(GameSessionTest, OnlyAdminControlsTheRound) {
	std::string p1 = joinPlayer("P1", std::make_shared<FakeConnection>());
	std::string p2 = joinPlayer("P2", std::make_shared<FakeConnection>());

	EXPECT_EQ(session->startRound(p2).error, EngineError::NotAuthorized);
	EXPECT_EQ(session->roundState(), RoundState::Init);

	ASSERT_TRUE(session->startRound(p1).success);
	EXPECT_EQ(session->reveal(p2).error, EngineError::NotAuthorized);
	EXPECT_EQ(session->roundState(), RoundState::Voting);

	EXPECT_EQ(session->startRound(p1).error, EngineError::InvalidState);
	EXPECT_EQ(session->startRound("ghost").error, EngineError::UnknownPlayer);
}

TEST_F(GameSessionTest, StartRoundClearsEveryVote) {
	std::string p1 = joinPlayer("P1", std::make_shared<FakeConnection>());
	std::string p2 = joinPlayer("P2", std::make_shared<FakeConnection>());

	ASSERT_TRUE(session->startRound(p1, std::string("https://tracker.example/T-1")).success);
	ASSERT_TRUE(session->castVote(p1, "3").success);
	ASSERT_TRUE(session->castVote(p2, "?").success);
	ASSERT_TRUE(session->reveal(p1).success);

	ASSERT_TRUE(session->startRound(p1).success);
	EXPECT_EQ(session->round(), 2);
	EXPECT_FALSE(session->player(p1)->hasVoted());
	EXPECT_FALSE(session->player(p2)->hasVoted());

	auto state = crow::json::load(session->snapshot());
	EXPECT_FALSE(state.has("ticket_url"));
}

TEST_F(GameSessionTest, TicketUrlIsShownForTheRound) {
	auto conn = std::make_shared<FakeConnection>();
	std::string p1 = joinPlayer("P1", conn);
	ASSERT_TRUE(session->startRound(p1, std::string("https://tracker.example/T-1")).success);

	auto state = conn->lastJson();
	ASSERT_TRUE(state.has("ticket_url"));
	EXPECT_EQ(std::string(state["ticket_url"].s()), "https://tracker.example/T-1");
}

TEST_F(GameSessionTest, RejoinPreservesVoteAndAdmin) {
	auto first = std::make_shared<FakeConnection>();
	std::string p1 = joinPlayer("P1", first);
	joinPlayer("P2", std::make_shared<FakeConnection>());
	ASSERT_TRUE(session->startRound(p1).success);
	ASSERT_TRUE(session->castVote(p1, "8").success);

	ASSERT_TRUE(session->disconnect(p1, first.get()).success);
	EXPECT_EQ(session->adminId(), p1);
	EXPECT_FALSE(session->player(p1)->isConnected());

	auto second = std::make_shared<FakeConnection>();
	auto rejoin = session->join(p1, "", second);
	ASSERT_TRUE(rejoin.result.success);
	EXPECT_TRUE(rejoin.rejoined);
	EXPECT_TRUE(rejoin.isAdmin);
	EXPECT_EQ(rejoin.playerId, p1);
	EXPECT_EQ(session->player(p1)->currentVote->label, "8");
	EXPECT_EQ(session->playerCount(), 2u);
	EXPECT_EQ(session->roundState(), RoundState::Voting);
}

TEST_F(GameSessionTest, RejoinClosesOlderConnection) {
	auto first = std::make_shared<FakeConnection>();
	std::string p1 = joinPlayer("P1", first);

	auto second = std::make_shared<FakeConnection>();
	ASSERT_TRUE(session->join(p1, "P1", second).result.success);
	EXPECT_FALSE(first->isOpen());

	// The stale close of the first connection leaves the new one attached.
	ASSERT_TRUE(session->disconnect(p1, first.get()).success);
	EXPECT_TRUE(session->player(p1)->isConnected());
	EXPECT_FALSE(session->isClosed());
}

TEST_F(GameSessionTest, LastDisconnectClosesTheGame) {
	auto c1 = std::make_shared<FakeConnection>();
	auto c2 = std::make_shared<FakeConnection>();
	std::string p1 = joinPlayer("P1", c1);
	std::string p2 = joinPlayer("P2", c2);

	ASSERT_TRUE(session->disconnect(p1, c1.get()).success);
	EXPECT_FALSE(session->isClosed());
	EXPECT_EQ(session->adminId(), p1);

	ASSERT_TRUE(session->disconnect(p2, c2.get()).success);
	EXPECT_TRUE(session->isClosed());
	EXPECT_EQ(session->playerCount(), 0u);
	EXPECT_EQ(emptied, 1);

	auto late = session->join(std::nullopt, "Late", std::make_shared<FakeConnection>());
	EXPECT_EQ(late.result.error, EngineError::GameNotFound);
}

TEST_F(GameSessionTest, LeaveClosesGameWhenNobodyElseIsConnected) {
	auto c1 = std::make_shared<FakeConnection>();
	auto c2 = std::make_shared<FakeConnection>();
	std::string p1 = joinPlayer("P1", c1);
	std::string p2 = joinPlayer("P2", c2);

	c2->close("network");
	ASSERT_TRUE(session->disconnect(p2, c2.get()).success);
	EXPECT_FALSE(session->isClosed());

	ASSERT_TRUE(session->leave(p1).success);
	EXPECT_TRUE(session->isClosed());
	EXPECT_EQ(session->playerCount(), 0u);
	EXPECT_EQ(session->connectedCount(), 0u);
	EXPECT_EQ(emptied, 1);
}

TEST_F(GameSessionTest, SendFailureIsTreatedAsDisconnect) {
	auto healthy = std::make_shared<FakeConnection>();
	auto broken = std::make_shared<FakeConnection>();
	std::string p1 = joinPlayer("P1", healthy);
	std::string p2 = joinPlayer("P2", broken);

	broken->failSends(true);
	EXPECT_TRUE(session->startRound(p1).success);

	EXPECT_FALSE(session->player(p2)->isConnected());
	EXPECT_EQ(session->playerCount(), 2u);

	auto state = healthy->lastJson();
	auto* p2State = findPlayer(state, p2);
	ASSERT_NE(p2State, nullptr);
	EXPECT_FALSE((*p2State)["is_connected"].b());
	EXPECT_EQ(std::string(state["round_state"].s()), "VOTING");
}

TEST_F(GameSessionTest, ObserversCannotVote) {
	auto conn = std::make_shared<FakeConnection>();
	std::string p1 = joinPlayer("P1", conn);
	ASSERT_TRUE(session->startRound(p1).success);
	ASSERT_TRUE(session->castVote(p1, "5").success);

	ASSERT_TRUE(session->toggleObserving(p1).success);
	EXPECT_TRUE(session->player(p1)->observing);
	EXPECT_FALSE(session->player(p1)->hasVoted());
	EXPECT_EQ(session->castVote(p1, "5").error, EngineError::InvalidState);

	auto state = conn->lastJson();
	auto* p1State = findPlayer(state, p1);
	ASSERT_NE(p1State, nullptr);
	EXPECT_TRUE((*p1State)["is_observing"].b());

	ASSERT_TRUE(session->toggleObserving(p1).success);
	EXPECT_TRUE(session->castVote(p1, "5").success);
}

TEST_F(GameSessionTest, SyncOnlyReachesTheRequester) {
	auto c1 = std::make_shared<FakeConnection>();
	auto c2 = std::make_shared<FakeConnection>();
	std::string p1 = joinPlayer("P1", c1);
	joinPlayer("P2", c2);

	size_t before = c2->messageCount();
	ASSERT_TRUE(session->sync(p1).success);
	EXPECT_EQ(c2->messageCount(), before);
	EXPECT_EQ(std::string(c1->lastJson()["type"].s()), "STATE");
}

TEST_F(GameSessionTest, LeaveUnknownPlayerFails) {
	joinPlayer("P1", std::make_shared<FakeConnection>());
	EXPECT_EQ(session->leave("ghost").error, EngineError::UnknownPlayer);
	EXPECT_EQ(session->playerCount(), 1u);
}

TEST_F(GameSessionTest, ConcurrentActionsReachEveryConnectionInOneOrder) {
	auto adminConn = std::make_shared<FakeConnection>();
	std::string admin = joinPlayer("Admin", adminConn);
	ASSERT_TRUE(session->startRound(admin).success);

	constexpr int kThreads = 6;
	constexpr int kIterations = 40;
	const char* labels[] = { "1", "2", "3", "5", "8" };

	std::vector<std::shared_ptr<FakeConnection>> conns;
	for (int i = 0; i < kThreads; ++i) {
		conns.push_back(std::make_shared<FakeConnection>());
	}

	std::vector<std::thread> threads;
	for (int t = 0; t < kThreads; ++t) {
		threads.emplace_back([this, t, &conns, &labels]() {
			auto join = session->join(std::nullopt, "P" + std::to_string(t), conns[t]);
			ASSERT_TRUE(join.result.success);
			for (int i = 0; i < kIterations; ++i) {
				if (i % 5 == 4) {
					EXPECT_TRUE(session->toggleObserving(join.playerId).success);
					EXPECT_TRUE(session->toggleObserving(join.playerId).success);
				}
				else {
					EXPECT_TRUE(session->castVote(join.playerId, labels[(t + i) % 5]).success);
				}
			}
		});
	}
	for (auto& thread : threads) thread.join();

	// The admin connection saw every broadcast; each other connection must
	// have seen exactly the tail of that sequence starting at its own join.
	auto reference = adminConn->messages();
	for (int t = 0; t < kThreads; ++t) {
		auto seen = conns[t]->messages();
		ASSERT_FALSE(seen.empty());
		ASSERT_LE(seen.size(), reference.size());
		auto offset = reference.size() - seen.size();
		for (size_t i = 0; i < seen.size(); ++i) {
			ASSERT_EQ(seen[i], reference[offset + i]) << "connection " << t << " message " << i;
		}
	}

	auto last = crow::json::load(reference.back());
	ASSERT_TRUE(last);
	EXPECT_EQ(last["players"].size(), static_cast<size_t>(kThreads + 1));
	for (const auto& p : last["players"]) {
		EXPECT_FALSE(p.has("card"));
	}
}
