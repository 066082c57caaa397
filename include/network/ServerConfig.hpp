#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "core/MoveSelector.hpp"
#include "core/RatingCalculator.hpp"
#include "matchmaking/QueueTypes.hpp"
#include "pool/ServerPool.hpp"

namespace caro::net {

struct ServerConfig {
    std::uint16_t port{5000};

    // The coordinator also hosts games itself, registered as this worker.
    std::string workerId{"local-1"};
    std::string workerAddress{"127.0.0.1:5000"};
    int workerCapacity{100};
    std::string workerRegion{"local"};

    core::Difficulty defaultDifficulty{core::Difficulty::Medium};
    std::chrono::seconds maintenanceInterval{5};

    core::RatingConfig rating;
    matchmaking::QueueConfig queue;
    pool::PoolConfig pool;
};

} // namespace caro::net
