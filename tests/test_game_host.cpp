#include <catch2/catch.hpp>

#include <memory>
#include <string>

#include "FakeNetworkSession.hpp"
#include "controller/AiController.hpp"
#include "core/MatchRegistry.hpp"
#include "matchmaking/MatchmakingQueue.hpp"
#include "network/GameHost.hpp"
#include "pool/ServerPool.hpp"

using namespace caro;
using namespace caro::net;

namespace {

template <typename T>
std::size_t countOf(const FakeNetworkSession& session)
{
    std::size_t n = 0;
    for (const auto& msg : session.sentMessages) {
        if (std::holds_alternative<T>(msg.payload)) {
            ++n;
        }
    }
    return n;
}

struct HostFixture {
    ServerConfig config;
    core::InMemoryPlayerRepository players;
    core::InMemoryMatchArchive archive;
    core::MatchRegistry registry{players, archive};
    matchmaking::InMemoryQueueStore primary;
    matchmaking::InMemoryQueueStore fallback;
    matchmaking::MatchmakingQueue queue{config.queue, primary, fallback, registry, 7u};
    pool::ServerPool pool{config.pool};
    controller::AiController ai{core::Difficulty::Medium, 1u};
    GameHost host{config, players, registry, queue, pool, ai};

    HostFixture()
    {
        pool.registerServer(config.workerId, config.workerAddress, config.workerCapacity,
                            config.workerRegion, core::Clock::now());
    }

    std::shared_ptr<FakeNetworkSession> connect(const std::string& username)
    {
        auto session = std::make_shared<FakeNetworkSession>();
        host.addClient(session);
        if (!username.empty()) {
            session->injectIncoming(Message{MessageKind::Hello, Hello{username}});
        }
        return session;
    }
};

} // namespace

TEST_CASE("GameHost: Hello binds a player and answers Welcome", "[network][host]")
{
    HostFixture f;
    auto alice = f.connect("alice");

    const auto* welcome = alice->lastOf<Welcome>();
    REQUIRE(welcome != nullptr);
    CHECK(welcome->playerId == 1u);
    CHECK(welcome->username == "alice");
    CHECK(welcome->rating == 1200);
    CHECK(welcome->rank == 1);
    CHECK(f.players.find(1).has_value());

    // Same name on a fresh connection is the same account.
    auto again = f.connect("alice");
    REQUIRE(again->lastOf<Welcome>() != nullptr);
    CHECK(again->lastOf<Welcome>()->playerId == 1u);
    CHECK(f.players.size() == 1u);

    auto anonymous = f.connect("");
    anonymous->injectIncoming(Message{MessageKind::Hello, Hello{""}});
    CHECK(anonymous->lastOf<ErrorMessage>() != nullptr);
    CHECK(f.host.clientCount() == 3u);
}

TEST_CASE("GameHost: requests before Hello are refused", "[network][host]")
{
    HostFixture f;
    auto stranger = f.connect("");
    stranger->injectIncoming(Message{MessageKind::CreateGame, CreateGame{}});
    stranger->injectIncoming(Message{MessageKind::JoinQueue, JoinQueue{}});

    REQUIRE(countOf<ErrorMessage>(*stranger) == 2u);
    CHECK(stranger->lastOf<ErrorMessage>()->description == "Say HELLO first");
    CHECK(f.registry.activeCount() == 0u);
}

TEST_CASE("GameHost: ai game answers each move with the computer's move", "[network][host]")
{
    HostFixture f;
    auto alice = f.connect("alice");
    alice->injectIncoming(Message{MessageKind::CreateGame,
                                  CreateGame{core::MatchMode::Ai, core::Difficulty::Easy}});

    const auto* created = alice->lastOf<GameCreated>();
    REQUIRE(created != nullptr);
    CHECK(created->mode == core::MatchMode::Ai);
    CHECK(created->yourSymbol == core::Symbol::X);
    CHECK(created->opponent == "AI (easy)");
    CHECK(created->serverId == "local-1");
    const MatchId id = created->matchId;
    CHECK(f.pool.serverFor(std::to_string(id)) == std::optional<std::string>("local-1"));

    alice->injectIncoming(Message{MessageKind::MakeMove, MakeMove{id, 7, 7}});
    REQUIRE(countOf<MoveBroadcast>(*alice) == 2u);
    const auto* reply = alice->lastOf<MoveBroadcast>();
    CHECK(reply->move.symbol == core::Symbol::O);
    CHECK(reply->move.sequence == 2u);
    CHECK(reply->nextTurn == core::Symbol::X);
    CHECK(f.registry.get(id)->moves().size() == 2u);

    alice->injectIncoming(Message{MessageKind::MakeMove, MakeMove{id, 7, 7}});
    CHECK(alice->lastOf<ErrorMessage>() != nullptr);
    CHECK(f.registry.get(id)->moves().size() == 2u);
}

TEST_CASE("GameHost: local games are not offered over the network", "[network][host]")
{
    HostFixture f;
    auto alice = f.connect("alice");
    alice->injectIncoming(Message{MessageKind::CreateGame,
                                  CreateGame{core::MatchMode::Local, core::Difficulty::Medium}});
    CHECK(alice->lastOf<GameCreated>() == nullptr);
    CHECK(alice->lastOf<ErrorMessage>() != nullptr);
}

TEST_CASE("GameHost: no free worker means no game", "[network][host]")
{
    HostFixture f;
    f.pool.unregister(f.config.workerId);
    auto alice = f.connect("alice");
    alice->injectIncoming(Message{MessageKind::CreateGame, CreateGame{}});

    const auto* error = alice->lastOf<ErrorMessage>();
    REQUIRE(error != nullptr);
    CHECK(error->description.rfind("No servers available", 0) == 0);
    CHECK(f.registry.activeCount() == 0u);
}

TEST_CASE("GameHost: hosted online game, join, moves and disconnect", "[network][host]")
{
    HostFixture f;
    auto alice = f.connect("alice");
    auto bob = f.connect("bob");

    alice->injectIncoming(Message{MessageKind::CreateGame,
                                  CreateGame{core::MatchMode::Online, core::Difficulty::Medium}});
    const auto* waiting = alice->lastOf<GameCreated>();
    REQUIRE(waiting != nullptr);
    CHECK(waiting->opponent.empty());
    const MatchId id = waiting->matchId;

    bob->injectIncoming(Message{MessageKind::JoinGame, JoinGame{id}});
    const auto* bobSide = bob->lastOf<GameCreated>();
    REQUIRE(bobSide != nullptr);
    CHECK(bobSide->yourSymbol == core::Symbol::O);
    CHECK(bobSide->opponent == "alice");
    CHECK(alice->lastOf<GameCreated>()->opponent == "bob");

    alice->injectIncoming(Message{MessageKind::MakeMove, MakeMove{id, 7, 7}});
    REQUIRE(bob->lastOf<MoveBroadcast>() != nullptr);
    CHECK(bob->lastOf<MoveBroadcast>()->move.symbol == core::Symbol::X);

    // Out of turn.
    alice->injectIncoming(Message{MessageKind::MakeMove, MakeMove{id, 0, 0}});
    CHECK(alice->lastOf<ErrorMessage>() != nullptr);

    bob->simulateDisconnect();
    const auto* gone = alice->lastOf<PlayerDisconnected>();
    REQUIRE(gone != nullptr);
    CHECK(gone->matchId == id);
    CHECK(gone->playerId == 2u);
    CHECK(gone->result == core::MatchResult::WinX);
    CHECK(gone->opponentConnected);
    REQUIRE(gone->eloChanges.size() == 2u);
    CHECK(gone->eloChanges[0].newElo == 1216);
    CHECK(gone->eloChanges[1].newElo == 1184);

    CHECK(f.registry.find(id) == nullptr);
    REQUIRE(f.archive.load(id).has_value());
    CHECK(f.archive.load(id)->status == core::MatchStatus::Completed);
    CHECK_FALSE(f.pool.serverFor(std::to_string(id)).has_value());
    CHECK(f.host.clientCount() == 1u);
    CHECK(f.players.find(1)->wins == 1);
}

TEST_CASE("GameHost: forfeit is announced to both players", "[network][host]")
{
    HostFixture f;
    auto alice = f.connect("alice");
    auto bob = f.connect("bob");
    alice->injectIncoming(Message{MessageKind::CreateGame,
                                  CreateGame{core::MatchMode::Online, core::Difficulty::Medium}});
    const MatchId id = alice->lastOf<GameCreated>()->matchId;
    bob->injectIncoming(Message{MessageKind::JoinGame, JoinGame{id}});

    alice->injectIncoming(Message{MessageKind::Forfeit, Forfeit{id}});
    for (const auto& side : {alice, bob}) {
        const auto* over = side->lastOf<GameOver>();
        REQUIRE(over != nullptr);
        CHECK(over->reason == "forfeit");
        CHECK(over->result == core::MatchResult::WinO);
        CHECK(over->eloChanges.size() == 2u);
    }
    CHECK(f.registry.activeCount() == 0u);

    // The match is gone; a late move is an error.
    bob->injectIncoming(Message{MessageKind::MakeMove, MakeMove{id, 1, 1}});
    CHECK(bob->lastOf<ErrorMessage>() != nullptr);
}

TEST_CASE("GameHost: leaving a waiting game abandons it", "[network][host]")
{
    HostFixture f;
    auto alice = f.connect("alice");
    alice->injectIncoming(Message{MessageKind::CreateGame,
                                  CreateGame{core::MatchMode::Online, core::Difficulty::Medium}});
    const MatchId id = alice->lastOf<GameCreated>()->matchId;

    alice->injectIncoming(Message{MessageKind::LeaveGame, LeaveGame{id}});
    REQUIRE(alice->lastOf<Ack>() != nullptr);
    CHECK(alice->lastOf<Ack>()->what == "left match " + std::to_string(id));
    REQUIRE(f.archive.load(id).has_value());
    CHECK(f.archive.load(id)->status == core::MatchStatus::Abandoned);
}

TEST_CASE("GameHost: leaving a running game hands the win to the other side", "[network][host]")
{
    HostFixture f;
    auto alice = f.connect("alice");
    auto bob = f.connect("bob");
    alice->injectIncoming(Message{MessageKind::CreateGame,
                                  CreateGame{core::MatchMode::Online, core::Difficulty::Medium}});
    const MatchId id = alice->lastOf<GameCreated>()->matchId;
    bob->injectIncoming(Message{MessageKind::JoinGame, JoinGame{id}});
    alice->injectIncoming(Message{MessageKind::MakeMove, MakeMove{id, 7, 7}});

    bob->injectIncoming(Message{MessageKind::LeaveGame, LeaveGame{id}});
    REQUIRE(bob->lastOf<Ack>() != nullptr);
    CHECK(bob->lastOf<Ack>()->what == "left match " + std::to_string(id));

    const auto* gone = alice->lastOf<PlayerDisconnected>();
    REQUIRE(gone != nullptr);
    CHECK(gone->playerId == 2u);
    CHECK(gone->result == core::MatchResult::WinX);
    CHECK(gone->opponentConnected);
    CHECK(gone->eloChanges.size() == 2u);
    CHECK(bob->lastOf<PlayerDisconnected>() == nullptr);
}

TEST_CASE("GameHost: leaving just after the winning move is acknowledged", "[network][host]")
{
    HostFixture f;
    auto alice = f.connect("alice");
    auto bob = f.connect("bob");
    alice->injectIncoming(Message{MessageKind::CreateGame,
                                  CreateGame{core::MatchMode::Online, core::Difficulty::Medium}});
    const MatchId id = alice->lastOf<GameCreated>()->matchId;
    bob->injectIncoming(Message{MessageKind::JoinGame, JoinGame{id}});

    for (int c = 0; c < 4; ++c) {
        alice->injectIncoming(Message{MessageKind::MakeMove, MakeMove{id, 7, c}});
        bob->injectIncoming(Message{MessageKind::MakeMove, MakeMove{id, 0, c * 2}});
    }
    alice->injectIncoming(Message{MessageKind::MakeMove, MakeMove{id, 7, 4}});
    REQUIRE(bob->lastOf<MoveBroadcast>() != nullptr);
    REQUIRE(bob->lastOf<MoveBroadcast>()->gameOver);
    REQUIRE(f.registry.find(id) == nullptr);

    bob->injectIncoming(Message{MessageKind::LeaveGame, LeaveGame{id}});
    CHECK(countOf<ErrorMessage>(*bob) == 0u);
    REQUIRE(bob->lastOf<Ack>() != nullptr);
    CHECK(bob->lastOf<Ack>()->what == "left match " + std::to_string(id));
    CHECK(alice->lastOf<PlayerDisconnected>() == nullptr);

    REQUIRE(f.archive.load(id).has_value());
    CHECK(f.archive.load(id)->result == core::MatchResult::WinX);
    CHECK(f.players.find(2)->losses == 1);

    // Outsiders and unknown ids still get errors.
    auto carol = f.connect("carol");
    carol->injectIncoming(Message{MessageKind::LeaveGame, LeaveGame{id}});
    CHECK(countOf<ErrorMessage>(*carol) == 1u);
    carol->injectIncoming(Message{MessageKind::LeaveGame, LeaveGame{999}});
    REQUIRE(countOf<ErrorMessage>(*carol) == 2u);
    CHECK(carol->lastOf<ErrorMessage>()->description == "Match 999 not found");
}

TEST_CASE("GameHost: a reconnect keeps the player's running game", "[network][host]")
{
    HostFixture f;
    auto alice = f.connect("alice");
    auto bob = f.connect("bob");
    alice->injectIncoming(Message{MessageKind::CreateGame,
                                  CreateGame{core::MatchMode::Online, core::Difficulty::Medium}});
    const MatchId id = alice->lastOf<GameCreated>()->matchId;
    bob->injectIncoming(Message{MessageKind::JoinGame, JoinGame{id}});
    alice->injectIncoming(Message{MessageKind::MakeMove, MakeMove{id, 7, 7}});

    auto aliceAgain = f.connect("alice");
    REQUIRE(aliceAgain->lastOf<Welcome>() != nullptr);

    // The stale connection goes away after the new one took over.
    alice->simulateDisconnect();
    REQUIRE(f.registry.find(id) != nullptr);
    CHECK(f.registry.find(id)->status() == core::MatchStatus::InProgress);
    CHECK(bob->lastOf<PlayerDisconnected>() == nullptr);

    bob->injectIncoming(Message{MessageKind::MakeMove, MakeMove{id, 0, 0}});
    REQUIRE(aliceAgain->lastOf<MoveBroadcast>() != nullptr);
    CHECK(aliceAgain->lastOf<MoveBroadcast>()->move.symbol == core::Symbol::O);

    aliceAgain->injectIncoming(Message{MessageKind::MakeMove, MakeMove{id, 7, 8}});
    CHECK(countOf<ErrorMessage>(*aliceAgain) == 0u);

    // Losing the live connection still forfeits.
    aliceAgain->simulateDisconnect();
    const auto* gone = bob->lastOf<PlayerDisconnected>();
    REQUIRE(gone != nullptr);
    CHECK(gone->playerId == 1u);
    CHECK(gone->result == core::MatchResult::WinO);
    CHECK(f.registry.find(id) == nullptr);
}

TEST_CASE("GameHost: queue pairs two players and notifies the waiting one", "[network][host]")
{
    HostFixture f;
    auto alice = f.connect("alice");
    auto bob = f.connect("bob");

    alice->injectIncoming(Message{MessageKind::JoinQueue, JoinQueue{}});
    const auto* searching = alice->lastOf<QueueStatus>();
    REQUIRE(searching != nullptr);
    CHECK(searching->state == "searching");
    CHECK(searching->queueSize == 1u);

    bob->injectIncoming(Message{MessageKind::JoinQueue, JoinQueue{}});
    const auto* bobStatus = bob->lastOf<QueueStatus>();
    REQUIRE(bobStatus != nullptr);
    REQUIRE(bobStatus->state == "matched");
    CHECK(bobStatus->opponent == "alice");

    const auto* aliceStatus = alice->lastOf<QueueStatus>();
    REQUIRE(aliceStatus->state == "matched");
    CHECK(aliceStatus->matchId == bobStatus->matchId);
    CHECK(aliceStatus->opponent == "bob");
    CHECK(aliceStatus->yourSymbol == core::opponentOf(bobStatus->yourSymbol));

    const MatchId id = bobStatus->matchId;
    CHECK(f.pool.serverFor(std::to_string(id)).has_value());

    auto& first = bobStatus->yourSymbol == core::Symbol::X ? bob : alice;
    auto& second = bobStatus->yourSymbol == core::Symbol::X ? alice : bob;
    first->injectIncoming(Message{MessageKind::MakeMove, MakeMove{id, 7, 7}});
    REQUIRE(second->lastOf<MoveBroadcast>() != nullptr);
    CHECK(second->lastOf<MoveBroadcast>()->nextTurn == core::Symbol::O);
}

TEST_CASE("GameHost: leaving the queue", "[network][host]")
{
    HostFixture f;
    auto alice = f.connect("alice");
    alice->injectIncoming(Message{MessageKind::LeaveQueue, LeaveQueue{}});
    CHECK(alice->lastOf<Ack>()->what == "not in queue");

    alice->injectIncoming(Message{MessageKind::JoinQueue, JoinQueue{}});
    alice->injectIncoming(Message{MessageKind::QueueStatusRequest, QueueStatusRequest{}});
    CHECK(alice->lastOf<QueueStatus>()->state == "searching");

    alice->injectIncoming(Message{MessageKind::LeaveQueue, LeaveQueue{}});
    CHECK(alice->lastOf<Ack>()->what == "left queue");

    alice->injectIncoming(Message{MessageKind::QueueStatusRequest, QueueStatusRequest{}});
    CHECK(alice->lastOf<QueueStatus>()->state == "not_in_queue");
}

TEST_CASE("GameHost: pool administration", "[network][host][pool]")
{
    HostFixture f;
    auto worker = f.connect("");

    worker->injectIncoming(Message{MessageKind::RegisterServer,
                                   RegisterServer{"w2", "10.0.0.2:5000", 10, "eu"}});
    CHECK(worker->lastOf<Ack>()->what == "registered w2");

    ServerHeartbeat hb;
    hb.serverId = "w2";
    hb.cpuPercent = 30.0;
    worker->injectIncoming(Message{MessageKind::ServerHeartbeat, hb});
    CHECK(worker->lastOf<Ack>()->what == "heartbeat w2");
    CHECK(f.pool.server("w2", core::Clock::now())->metrics.cpuPercent == 30.0);

    hb.serverId = "ghost";
    worker->injectIncoming(Message{MessageKind::ServerHeartbeat, hb});
    CHECK(countOf<ErrorMessage>(*worker) == 1u);

    worker->injectIncoming(Message{MessageKind::PoolStatsRequest, PoolStatsRequest{}});
    const auto* stats = worker->lastOf<PoolStatsReply>();
    REQUIRE(stats != nullptr);
    CHECK(stats->totalServers == 2u);
    CHECK(stats->totalCapacity == 110);
    CHECK(stats->regions.size() == 2u);

    worker->injectIncoming(Message{MessageKind::UnregisterServer, UnregisterServer{"w2"}});
    CHECK(worker->lastOf<Ack>()->what == "unregistered w2");
    worker->injectIncoming(Message{MessageKind::UnregisterServer, UnregisterServer{"w2"}});
    CHECK(countOf<ErrorMessage>(*worker) == 2u);

    worker->injectIncoming(Message{MessageKind::RegisterServer,
                                   RegisterServer{"bad", "x", 0, "eu"}});
    CHECK(countOf<ErrorMessage>(*worker) == 3u);
}

TEST_CASE("GameHost: poll drives live connections", "[network][host]")
{
    HostFixture f;
    auto alice = f.connect("alice");
    auto bob = f.connect("bob");
    bob->simulateDisconnect();

    f.host.poll();
    f.host.poll();
    CHECK(alice->pollCount == 2);
    CHECK(bob->pollCount == 0);
    CHECK(f.host.clientCount() == 1u);
    CHECK_FALSE(f.host.playerOf(2).has_value());
    CHECK(f.host.playerOf(1) == std::optional<PlayerId>(1));
}
