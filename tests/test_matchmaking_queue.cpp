#include <catch2/catch.hpp>

#include <atomic>
#include <map>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "core/Errors.hpp"
#include "core/MatchRegistry.hpp"
#include "matchmaking/MatchmakingQueue.hpp"

using namespace caro;
using namespace caro::matchmaking;
using namespace std::chrono_literals;

namespace {

// Pool whose backing store can be switched off.
class FlakyQueueStore : public InMemoryQueueStore {
public:
    std::atomic<bool> down{false};

    void upsert(const QueueEntry& entry) override { check(); InMemoryQueueStore::upsert(entry); }
    bool remove(PlayerId player) override { check(); return InMemoryQueueStore::remove(player); }
    std::optional<QueueEntry> find(PlayerId player) const override {
        check();
        return InMemoryQueueStore::find(player);
    }
    std::vector<QueueEntry> waitingInRange(int minRating, int maxRating) const override {
        check();
        return InMemoryQueueStore::waitingInRange(minRating, maxRating);
    }
    std::optional<QueueEntry> claim(PlayerId player) override {
        check();
        return InMemoryQueueStore::claim(player);
    }
    bool touch(PlayerId player, TimePoint now) override {
        check();
        return InMemoryQueueStore::touch(player, now);
    }
    std::size_t size() const override { check(); return InMemoryQueueStore::size(); }
    std::optional<std::size_t> positionOf(PlayerId player) const override {
        check();
        return InMemoryQueueStore::positionOf(player);
    }
    std::vector<QueueEntry> expireIdleSince(TimePoint cutoff) override {
        check();
        return InMemoryQueueStore::expireIdleSince(cutoff);
    }
    std::vector<QueueEntry> entries() const override {
        check();
        return InMemoryQueueStore::entries();
    }

private:
    void check() const {
        if (down) {
            throw core::BackingStoreUnavailable("store offline");
        }
    }
};

struct QueueFixture {
    core::InMemoryPlayerRepository players;
    core::InMemoryMatchArchive archive;
    core::MatchRegistry registry{players, archive};
    FlakyQueueStore primary;
    InMemoryQueueStore fallback;
    MatchmakingQueue queue{QueueConfig{}, primary, fallback, registry, 42u};

    const TimePoint t0 = core::Clock::now();
};

} // namespace

TEST_CASE("Range widens with waiting time", "[queue]") {
    QueueConfig config;
    CHECK(rangeExpansion(config, 0s) == 0);
    CHECK(rangeExpansion(config, 9s) == 0);
    CHECK(rangeExpansion(config, 10s) == 10);
    CHECK(rangeExpansion(config, 125s) == 120);
    CHECK(rangeExpansion(config, 3600s) == 500);
    CHECK(rangeExpansion(config, -5s) == 0);
}

TEST_CASE("Distant ratings pair only after the range has widened", "[queue]") {
    QueueFixture f;

    const auto first = f.queue.requestMatch({1, "alice", 1200}, f.t0);
    CHECK(first.state == QueueState::Searching);
    CHECK(first.rangeMin == 1100);
    CHECK(first.rangeMax == 1300);

    const auto second = f.queue.requestMatch({2, "bob", 1400}, f.t0);
    CHECK(second.state == QueueState::Searching);
    CHECK(second.queueSize == 2u);
    CHECK(second.position == 0u);

    const auto waitingA = f.queue.status(1, f.t0 + 50s);
    CHECK(waitingA.state == QueueState::Searching);
    CHECK(waitingA.position == 1u);
    CHECK(waitingA.rangeMax == 1350);

    const auto matchedA = f.queue.status(1, f.t0 + 100s);
    REQUIRE(matchedA.state == QueueState::Matched);
    REQUIRE(matchedA.match.has_value());
    CHECK(matchedA.match->opponent.id == 2u);
    CHECK(matchedA.match->opponent.rating == 1400);

    const auto matchedB = f.queue.status(2, f.t0 + 101s);
    REQUIRE(matchedB.state == QueueState::Matched);
    REQUIRE(matchedB.match.has_value());
    CHECK(matchedB.match->matchId == matchedA.match->matchId);
    CHECK(matchedB.match->symbol == core::opponentOf(matchedA.match->symbol));
    CHECK(matchedB.match->opponent.id == 1u);

    // The notice is delivered once; afterwards the player is simply out of the queue.
    CHECK(f.queue.status(2, f.t0 + 102s).state == QueueState::NotInQueue);

    auto session = f.registry.get(matchedA.match->matchId);
    CHECK(session->mode() == core::MatchMode::Online);
    CHECK(session->status() == core::MatchStatus::InProgress);
    CHECK(session->participants().size() == 2u);
    CHECK(f.queue.stats().currentSize == 0u);
    CHECK(f.queue.stats().totalMatches == 1u);
}

TEST_CASE("Close ratings pair immediately", "[queue]") {
    QueueFixture f;
    f.queue.requestMatch({1, "alice", 1200}, f.t0);
    const auto report = f.queue.requestMatch({2, "bob", 1250}, f.t0 + 1s);
    REQUIRE(report.state == QueueState::Matched);
    CHECK(report.match->opponent.username == "alice");

    const auto session = f.registry.get(report.match->matchId);
    const auto x = session->participant(core::Symbol::X);
    REQUIRE(x.has_value());
    CHECK((x->id == 1u || x->id == 2u));
}

TEST_CASE("Leave is idempotent and clears the entry", "[queue]") {
    QueueFixture f;
    f.queue.join({5, "eve", 1500}, f.t0);
    CHECK(f.queue.leave(5));
    CHECK_FALSE(f.queue.leave(5));
    CHECK(f.queue.status(5, f.t0 + 1s).state == QueueState::NotInQueue);

    const auto stats = f.queue.stats();
    CHECK(stats.totalJoins == 1u);
    CHECK(stats.totalLeaves == 1u);
}

TEST_CASE("Ratings outside the configured bounds are rejected", "[queue]") {
    QueueFixture f;
    CHECK_THROWS_AS(f.queue.join({1, "low", -1}, f.t0), std::invalid_argument);
    CHECK_THROWS_AS(f.queue.join({2, "high", 5001}, f.t0), std::invalid_argument);
    CHECK(f.queue.stats().currentSize == 0u);
}

TEST_CASE("Rejoining replaces the previous entry", "[queue]") {
    QueueFixture f;
    f.queue.join({1, "alice", 1200}, f.t0);
    f.queue.join({1, "alice", 1300}, f.t0 + 5s);

    const auto stats = f.queue.stats();
    CHECK(stats.currentSize == 1u);
    CHECK(f.primary.find(1)->rating == 1300);
    CHECK(f.fallback.find(1)->rating == 1300);
}

TEST_CASE("Idle entries expire and polling keeps them alive", "[queue]") {
    QueueFixture f;
    f.queue.join({1, "idle", 800}, f.t0);
    f.queue.join({2, "active", 2500}, f.t0);

    CHECK(f.queue.status(2, f.t0 + 200s).state == QueueState::Searching);

    CHECK(f.queue.cleanupExpired(f.t0 + 400s) == 1u);
    CHECK(f.queue.status(1, f.t0 + 401s).state == QueueState::NotInQueue);
    CHECK(f.queue.status(2, f.t0 + 401s).state == QueueState::Searching);
    CHECK(f.queue.stats().totalExpired == 1u);
}

TEST_CASE("Stats bucket the waiting ratings", "[queue]") {
    QueueFixture f;
    f.queue.join({1, "a", 950}, f.t0);
    f.queue.join({2, "b", 1250}, f.t0);
    f.queue.join({3, "c", 1399}, f.t0);
    f.queue.join({4, "d", 1850}, f.t0);

    const auto stats = f.queue.stats();
    CHECK(stats.currentSize == 4u);
    CHECK(stats.totalJoins == 4u);
    CHECK(stats.ratingDistribution.at("below_1000") == 1u);
    CHECK(stats.ratingDistribution.at("1200_1399") == 2u);
    CHECK(stats.ratingDistribution.at("1800_plus") == 1u);
    CHECK(stats.ratingDistribution.count("1400_1599") == 0u);
}

TEST_CASE("createMatch refuses self pairing and already claimed entries", "[queue]") {
    QueueFixture f;
    const auto a = f.queue.join({1, "a", 1200}, f.t0);
    const auto b = f.queue.join({2, "b", 1210}, f.t0);
    const auto c = f.queue.join({3, "c", 1220}, f.t0);

    CHECK_THROWS_AS(f.queue.createMatch(a, a), std::invalid_argument);

    auto session = f.queue.createMatch(a, b);
    REQUIRE(session);
    CHECK(session->participants().size() == 2u);

    CHECK_THROWS_AS(f.queue.createMatch(c, b), core::QueueRaceLost);
    CHECK(f.primary.find(3).has_value());
    CHECK(f.queue.stats().currentSize == 1u);
}

TEST_CASE("findOpponent prefers the longest waiting candidate", "[queue]") {
    QueueFixture f;
    f.queue.join({1, "first", 1210}, f.t0);
    f.queue.join({2, "second", 1200}, f.t0 + 1s);
    const auto me = f.queue.join({3, "me", 1205}, f.t0 + 2s);

    const auto opponent = f.queue.findOpponent(3, me, f.t0 + 2s);
    REQUIRE(opponent.has_value());
    CHECK(opponent->playerId == 1u);
}

TEST_CASE("Concurrent requests never place a player in two matches", "[queue][threads]") {
    QueueFixture f;
    constexpr int kPlayers = 20;

    std::vector<QueueStatusReport> reports(kPlayers);
    std::vector<std::thread> threads;
    for (int i = 0; i < kPlayers; ++i) {
        threads.emplace_back([&, i] {
            const PlayerId id = static_cast<PlayerId>(i + 1);
            reports[i] = f.queue.requestMatch({id, "p" + std::to_string(id), 1200}, f.t0);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    // Settle anyone still searching or holding an unread notice.
    for (int round = 0; round < kPlayers; ++round) {
        for (int i = 0; i < kPlayers; ++i) {
            if (reports[i].state != QueueState::Matched) {
                reports[i] = f.queue.status(static_cast<PlayerId>(i + 1), f.t0 + 1s);
            }
        }
    }

    std::map<core::MatchId, std::vector<PlayerId>> byMatch;
    for (int i = 0; i < kPlayers; ++i) {
        REQUIRE(reports[i].state == QueueState::Matched);
        REQUIRE(reports[i].match.has_value());
        byMatch[reports[i].match->matchId].push_back(static_cast<PlayerId>(i + 1));
    }

    CHECK(byMatch.size() == kPlayers / 2);
    std::set<PlayerId> seated;
    for (const auto& [matchId, members] : byMatch) {
        REQUIRE(members.size() == 2u);
        const auto session = f.registry.get(matchId);
        for (const auto& p : session->participants()) {
            CHECK(seated.insert(p.id).second);
        }
    }
    CHECK(seated.size() == static_cast<std::size_t>(kPlayers));
    CHECK(f.queue.stats().totalMatches == static_cast<std::uint64_t>(kPlayers / 2));
}

TEST_CASE("Queue keeps matching on the fallback store during an outage", "[queue]") {
    QueueFixture f;
    f.primary.down = true;

    const auto waiting = f.queue.requestMatch({1, "alice", 1200}, f.t0);
    CHECK(waiting.state == QueueState::Searching);
    CHECK(f.queue.isDegraded());
    CHECK(f.fallback.find(1).has_value());

    const auto matched = f.queue.requestMatch({2, "bob", 1220}, f.t0 + 1s);
    REQUIRE(matched.state == QueueState::Matched);
    CHECK(matched.match->opponent.id == 1u);
    CHECK(f.fallback.size() == 0u);

    f.primary.down = false;
    CHECK(f.queue.stats().currentSize == 0u);
    CHECK_FALSE(f.queue.isDegraded());
}
