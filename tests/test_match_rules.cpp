#include <catch2/catch.hpp>

#include "core/MatchRules.hpp"
#include "core/PlayerRecord.hpp"

#include <stdexcept>

using namespace caro::core;

namespace {

MatchRecord finished(MatchMode mode, MatchResult result,
                     std::optional<Participant> x, std::optional<Participant> o) {
    MatchRecord r;
    r.id = 1;
    r.mode = mode;
    r.playerX = std::move(x);
    r.playerO = std::move(o);
    r.status = MatchStatus::Completed;
    r.result = result;
    return r;
}

} // namespace

TEST_CASE("Online rules move both ratings from the pre-match snapshot", "[rules]") {
    InMemoryPlayerRepository repo;
    repo.findOrCreate(1, "underdog", 1200);
    repo.findOrCreate(2, "favourite", 1400);
    repo.findOrCreate(3, "bystander", 1300);

    OnlineRules rules(repo, RatingCalculator{32});
    const auto changes = rules.onMatchFinished(finished(
        MatchMode::Online, MatchResult::WinX,
        Participant{1, "underdog", Symbol::X, 1200},
        Participant{2, "favourite", Symbol::O, 1400}));

    REQUIRE(changes.size() == 2u);
    const auto& x = changes[0];
    const auto& o = changes[1];

    CHECK(x.userId == 1u);
    CHECK(x.oldElo == 1200);
    CHECK(x.newElo == 1224);
    CHECK(x.change == 24);
    CHECK(x.oldRank == 3);
    CHECK(x.newRank == 3);

    CHECK(o.userId == 2u);
    CHECK(o.newElo == 1376);
    CHECK(o.change == -24);
    CHECK(o.oldRank == 1);
    CHECK(o.newRank == 1);

    const auto winner = repo.find(1);
    const auto loser = repo.find(2);
    CHECK(winner->rating == 1224);
    CHECK(winner->wins == 1);
    CHECK(winner->currentStreak == 1);
    CHECK(loser->rating == 1376);
    CHECK(loser->losses == 1);
    CHECK(loser->currentStreak == 0);
}

TEST_CASE("Online draw resets streaks and counts a draw on both sides", "[rules]") {
    InMemoryPlayerRepository repo;
    PlayerRecord hot = repo.findOrCreate(1, "hot", 1200);
    hot.currentStreak = 4;
    hot.bestStreak = 4;
    repo.save(hot);
    repo.findOrCreate(2, "cold", 1200);

    OnlineRules rules(repo, RatingCalculator{});
    const auto changes = rules.onMatchFinished(finished(
        MatchMode::Online, MatchResult::Draw,
        Participant{1, "hot", Symbol::X, 1200},
        Participant{2, "cold", Symbol::O, 1200}));

    REQUIRE(changes.size() == 2u);
    CHECK(changes[0].change == 0);
    CHECK(repo.find(1)->draws == 1);
    CHECK(repo.find(1)->currentStreak == 0);
    CHECK(repo.find(1)->bestStreak == 4);
    CHECK(repo.find(2)->draws == 1);
}

TEST_CASE("Online rules need both participants", "[rules]") {
    InMemoryPlayerRepository repo;
    OnlineRules rules(repo, RatingCalculator{});
    CHECK_THROWS_AS(rules.onMatchFinished(finished(MatchMode::Online, MatchResult::WinX,
                                                   Participant{1, "a", Symbol::X, 1200},
                                                   std::nullopt)),
                    std::logic_error);
}

TEST_CASE("Ai rules update the human's counters only", "[rules]") {
    InMemoryPlayerRepository repo;
    PlayerRecord human = repo.findOrCreate(7, "human", 1300);
    human.currentStreak = 2;
    repo.save(human);

    AiRules rules(repo);
    const auto changes = rules.onMatchFinished(finished(
        MatchMode::Ai, MatchResult::WinX,
        Participant{7, "human", Symbol::X, 1300}, std::nullopt));

    CHECK(changes.empty());
    const auto after = repo.find(7);
    CHECK(after->wins == 1);
    CHECK(after->rating == 1300);
    CHECK(after->currentStreak == 2);
    CHECK(repo.size() == 1u);
}

TEST_CASE("Local rules persist nothing", "[rules]") {
    LocalRules rules;
    CHECK(rules.mode() == MatchMode::Local);
    CHECK(rules.onMatchFinished(finished(MatchMode::Local, MatchResult::WinO,
                                         std::nullopt, std::nullopt)).empty());
}
