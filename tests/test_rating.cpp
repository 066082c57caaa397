#include <catch2/catch.hpp>

#include "core/PlayerRecord.hpp"
#include "core/RatingCalculator.hpp"

using namespace caro::core;
using Catch::Detail::Approx;

TEST_CASE("Expected score follows the logistic curve", "[rating]") {
    CHECK(RatingCalculator::expectedScore(1200, 1200) == Approx(0.5));
    CHECK(RatingCalculator::expectedScore(1200, 1400) == Approx(0.2402530733).epsilon(1e-6));
    CHECK(RatingCalculator::expectedScore(1400, 1200) == Approx(0.7597469267).epsilon(1e-6));
}

TEST_CASE("Equal ratings move by half of K", "[rating]") {
    RatingCalculator calc;
    const auto win = calc.update(1200, 1200, Outcome::Win);
    CHECK(win.delta == 16);
    CHECK(win.newRating == 1216);

    const auto loss = calc.update(1200, 1200, Outcome::Loss);
    CHECK(loss.delta == -16);
    CHECK(loss.newRating == 1184);

    CHECK(calc.update(1200, 1200, Outcome::Draw).delta == 0);
}

TEST_CASE("Underdog win truncates toward zero", "[rating]") {
    RatingCalculator calc{32};
    const auto [a, b] = calc.updateBoth(1200, 1400, Outcome::Win);

    CHECK(a.oldRating == 1200);
    CHECK(a.delta == 24);
    CHECK(a.newRating == 1224);
    CHECK(b.delta == -24);
    CHECK(b.newRating == 1376);
}

TEST_CASE("Draw against a stronger player gains rating", "[rating]") {
    RatingCalculator calc;
    const auto [a, b] = calc.updateBoth(1200, 1400, Outcome::Draw);
    CHECK(a.delta == 8);
    CHECK(b.delta == -8);
}

TEST_CASE("K factor must be positive", "[rating]") {
    CHECK_THROWS_AS(RatingCalculator{0}, std::invalid_argument);
    CHECK_THROWS_AS(RatingCalculator{-5}, std::invalid_argument);
}

TEST_CASE("Player record counters and streaks", "[rating]") {
    PlayerRecord p;
    CHECK(p.rating == 1200);
    CHECK(p.winRate() == 0.0);

    p.applyResult(Outcome::Win, true);
    p.applyResult(Outcome::Win, true);
    p.applyResult(Outcome::Win, true);
    CHECK(p.currentStreak == 3);
    CHECK(p.bestStreak == 3);

    p.applyResult(Outcome::Draw, true);
    CHECK(p.currentStreak == 0);
    CHECK(p.bestStreak == 3);

    p.applyResult(Outcome::Win, false);
    CHECK(p.currentStreak == 0);
    CHECK(p.wins == 4);
    CHECK(p.totalGames() == 5);
    CHECK(p.winRate() == Approx(80.0));
}

TEST_CASE("Rank counts strictly higher ratings", "[rating]") {
    InMemoryPlayerRepository repo;
    repo.findOrCreate(1, "a", 1500);
    repo.findOrCreate(2, "b", 1200);
    repo.findOrCreate(3, "c", 1200);

    CHECK(repo.rankOf(1) == 1);
    CHECK(repo.rankOf(2) == 2);
    CHECK(repo.rankOf(3) == 2);
    CHECK_FALSE(repo.rankOf(99).has_value());

    // findOrCreate keeps an existing record.
    CHECK(repo.findOrCreate(1, "other", 1000).rating == 1500);
    CHECK(repo.size() == 3u);
}
