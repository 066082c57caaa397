#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "controller/AiController.hpp"
#include "core/MatchRegistry.hpp"
#include "core/PlayerRecord.hpp"
#include "matchmaking/MatchmakingQueue.hpp"
#include "matchmaking/QueueStore.hpp"
#include "network/GameHost.hpp"
#include "network/HostLoop.hpp"
#include "network/ServerConfig.hpp"
#include "network/TcpServer.hpp"
#include "pool/ServerPool.hpp"

using namespace caro;
using namespace std::chrono_literals;

namespace {

volatile std::sig_atomic_t g_stop = 0;

void onSignal(int) { g_stop = 1; }

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [port] [worker_id] [worker_capacity] [region] [easy|medium|hard]\n";
}

// Positional arguments, all optional.
net::ServerConfig parseArgs(int argc, char* argv[]) {
    net::ServerConfig config;
    if (argc > 1) {
        const int port = std::stoi(argv[1]);
        if (port <= 0 || port > 65535) {
            throw std::invalid_argument("port out of range");
        }
        config.port = static_cast<std::uint16_t>(port);
    }
    if (argc > 2) config.workerId = argv[2];
    if (argc > 3) config.workerCapacity = std::stoi(argv[3]);
    if (argc > 4) config.workerRegion = argv[4];
    if (argc > 5) {
        auto difficulty = core::parseDifficulty(argv[5]);
        if (!difficulty) {
            throw std::invalid_argument(std::string("unknown difficulty ") + argv[5]);
        }
        config.defaultDifficulty = *difficulty;
    }
    config.workerAddress = "127.0.0.1:" + std::to_string(config.port);
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    net::ServerConfig config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Invalid arguments: " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    core::InMemoryPlayerRepository players;
    core::InMemoryMatchArchive archive;
    core::MatchRegistry registry(players, archive, core::RatingCalculator(config.rating.kFactor));

    // Both stores are in-process here; a deployment would put the shared
    // pool in front as the primary.
    matchmaking::InMemoryQueueStore sharedStore;
    matchmaking::InMemoryQueueStore authoritativeStore;
    matchmaking::MatchmakingQueue queue(config.queue, sharedStore, authoritativeStore, registry);

    pool::ServerPool serverPool(config.pool);
    controller::AiController ai(config.defaultDifficulty);

    net::GameHost host(config, players, registry, queue, serverPool, ai);
    net::HostLoop loop(config, host, serverPool, queue);
    loop.registerSelf(core::Clock::now());

    net::TcpServer server(config.port, [&host](net::INetworkSessionPtr session, const std::string& peer) {
        const auto id = host.addClient(std::move(session));
        std::cout << "[HOST] " << peer << " is connection " << id << "\n";
    });
    if (!server.start()) {
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    std::cout << "[HOST] Caro server ready on port " << config.port
              << " (worker " << config.workerId << ", capacity " << config.workerCapacity
              << "). Ctrl+C to stop.\n";

    while (!g_stop) {
        loop.step(core::Clock::now());
        std::this_thread::sleep_for(100ms);
    }

    server.stop();
    std::cout << "[HOST] Shutting down with " << registry.activeCount()
              << " live matches and " << host.clientCount() << " connections.\n";
    return 0;
}
