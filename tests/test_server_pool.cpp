#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>

#include "core/Errors.hpp"
#include "pool/ServerPool.hpp"

using namespace caro;
using namespace caro::pool;
using namespace std::chrono_literals;

namespace {

void fill(ServerPool& pool, const ServerId& server, int count, TimePoint now,
          const std::string& prefix) {
    for (int i = 0; i < count; ++i) {
        pool.assign(prefix + std::to_string(i), server, std::nullopt, now);
    }
}

} // namespace

TEST_CASE("Least loaded healthy server wins, earliest registered on ties", "[pool]") {
    ServerPool pool;
    const auto t0 = core::Clock::now();
    pool.registerServer("worker-a", "10.0.0.1:5000", 100, "eu", t0);
    pool.registerServer("worker-b", "10.0.0.2:5000", 150, "eu", t0);

    fill(pool, "worker-a", 50, t0, "a");
    fill(pool, "worker-b", 50, t0, "b");

    auto best = pool.selectBestServer(t0);
    REQUIRE(best.has_value());
    CHECK(best->id == "worker-a");
    CHECK(best->freeCapacity() == 50);

    pool.release("a0", "worker-a");
    pool.assign("b50", std::string("worker-b"), std::nullopt, t0);
    CHECK(pool.selectBestServer(t0)->id == "worker-a");

    pool.assign("a0", std::string("worker-a"), std::nullopt, t0);
    pool.assign("a50", std::string("worker-a"), std::nullopt, t0);
    pool.assign("a51", std::string("worker-a"), std::nullopt, t0);
    CHECK(pool.selectBestServer(t0)->id == "worker-b");
}

TEST_CASE("Region filter and free capacity restrict selection", "[pool]") {
    ServerPool pool;
    const auto t0 = core::Clock::now();
    pool.registerServer("eu-1", "eu:1", 2, "eu", t0);
    pool.registerServer("us-1", "us:1", 10, "us", t0);

    CHECK(pool.selectBestServer(std::string("eu"), 1, t0)->id == "eu-1");
    CHECK_FALSE(pool.selectBestServer(std::string("asia"), 1, t0).has_value());
    CHECK_FALSE(pool.selectBestServer(std::string("eu"), 3, t0).has_value());

    const auto placed = pool.assign("s1", std::nullopt, std::string("eu"), t0);
    CHECK(placed.id == "eu-1");
    CHECK(placed.activeSessions == 1);
    pool.assign("s2", std::nullopt, std::string("eu"), t0);

    CHECK_THROWS_AS(pool.assign("s3", std::nullopt, std::string("eu"), t0), core::PoolUnavailable);
    CHECK(pool.assign("s3", std::nullopt, std::nullopt, t0).id == "us-1");
}

TEST_CASE("Assignment is idempotent and explicit targets are checked", "[pool]") {
    ServerPool pool;
    const auto t0 = core::Clock::now();
    pool.registerServer("solo", "h:1", 1, "", t0);

    CHECK(pool.assign("m1", std::nullopt, std::nullopt, t0).id == "solo");
    CHECK(pool.assign("m1", std::nullopt, std::nullopt, t0).activeSessions == 1);
    CHECK(pool.serverFor("m1") == std::optional<ServerId>("solo"));

    CHECK_THROWS_AS(pool.assign("m2", std::string("solo"), std::nullopt, t0), core::PoolUnavailable);
    CHECK_THROWS_AS(pool.assign("m2", std::string("ghost"), std::nullopt, t0), core::PoolUnavailable);
    CHECK_THROWS_AS(pool.assign("m2", std::nullopt, std::nullopt, t0), core::PoolUnavailable);
    CHECK_THROWS_AS(pool.assign("", std::nullopt, std::nullopt, t0), std::invalid_argument);

    CHECK(pool.release("m1"));
    CHECK_FALSE(pool.release("m1"));
    CHECK_FALSE(pool.serverFor("m1").has_value());
    CHECK(pool.assign("m2", std::nullopt, std::nullopt, t0).id == "solo");
}

TEST_CASE("Registration validates input and keeps sessions on re-register", "[pool]") {
    ServerPool pool;
    const auto t0 = core::Clock::now();
    CHECK_THROWS_AS(pool.registerServer("", "h:1", 10, "eu", t0), std::invalid_argument);
    CHECK_THROWS_AS(pool.registerServer("w", "h:1", 0, "eu", t0), std::invalid_argument);

    pool.registerServer("w", "h:1", 10, "eu", t0);
    pool.assign("keep-me", std::string("w"), std::nullopt, t0);
    pool.registerServer("w", "h:2", 20, "us", t0 + 5s);

    const auto info = pool.server("w", t0 + 5s);
    REQUIRE(info.has_value());
    CHECK(info->address == "h:2");
    CHECK(info->capacity == 20);
    CHECK(info->region == "us");
    CHECK(info->activeSessions == 1);
    CHECK(pool.servers(t0).size() == 1u);

    CHECK(pool.unregister("w"));
    CHECK_FALSE(pool.unregister("w"));
    CHECK_FALSE(pool.heartbeat("w", t0));
}

TEST_CASE("Silent servers turn unhealthy and are swept", "[pool]") {
    ServerPool pool(PoolConfig{30s, 1});
    const auto t0 = core::Clock::now();
    pool.registerServer("alive", "h:1", 10, "eu", t0);
    pool.registerServer("silent", "h:2", 10, "eu", t0);

    HeartbeatMetrics metrics;
    metrics.cpuPercent = 12.5;
    CHECK(pool.heartbeat("alive", t0 + 20s, metrics));

    CHECK(pool.server("silent", t0 + 29s)->healthy);
    CHECK_FALSE(pool.server("silent", t0 + 30s)->healthy);
    CHECK(pool.selectBestServer(t0 + 31s)->id == "alive");

    const auto stats = pool.stats(t0 + 31s);
    CHECK(stats.healthyServers == 1u);
    CHECK(stats.unhealthyServers == 1u);

    const auto swept = pool.sweepDead(t0 + 31s);
    REQUIRE(swept.size() == 1u);
    CHECK(swept.front() == "silent");
    CHECK(pool.servers(t0 + 31s).size() == 1u);
    CHECK(pool.server("alive", t0 + 31s)->metrics.cpuPercent == 12.5);
    CHECK_FALSE(pool.heartbeat("silent", t0 + 32s));

    CHECK_THROWS_AS(ServerPool(PoolConfig{0s, 1}), std::invalid_argument);
}

TEST_CASE("Stats aggregate capacity per region", "[pool]") {
    ServerPool pool;
    const auto t0 = core::Clock::now();
    pool.registerServer("eu-1", "h:1", 100, "eu", t0);
    pool.registerServer("eu-2", "h:2", 50, "eu", t0);
    pool.registerServer("anon", "h:3", 150, "", t0);

    fill(pool, "eu-1", 20, t0, "x");
    fill(pool, "anon", 1, t0, "y");

    const auto stats = pool.stats(t0);
    CHECK(stats.totalServers == 3u);
    CHECK(stats.totalCapacity == 300);
    CHECK(stats.totalActive == 21);
    CHECK(stats.utilizationPercent == Catch::Detail::Approx(7.0));
    REQUIRE(stats.regions.count("eu") == 1u);
    CHECK(stats.regions.at("eu").servers == 2u);
    CHECK(stats.regions.at("eu").capacity == 150);
    CHECK(stats.regions.at("eu").activeSessions == 20);
    CHECK(stats.regions.at("unknown").activeSessions == 1);

    CHECK(ServerPool{}.stats(t0).utilizationPercent == 0.0);
}
