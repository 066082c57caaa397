#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/Types.hpp"
#include "matchmaking/MatchmakingQueue.hpp"
#include "network/GameHost.hpp"
#include "network/ServerConfig.hpp"
#include "pool/ServerPool.hpp"

namespace caro::net {

/// What one maintenance pass did.
struct MaintenanceReport {
    bool selfReregistered{false};
    std::vector<std::string> sweptServers;
    std::size_t expiredQueueEntries{0};
};

/// Periodic housekeeping for the coordinator process. It does NOT own any
/// of the services; the caller keeps them alive for the loop's lifetime.
class HostLoop {
public:
    HostLoop(const ServerConfig& config,
             GameHost& host,
             pool::ServerPool& pool,
             matchmaking::MatchmakingQueue& queue);

    /// Register the coordinator's own worker in the pool.
    void registerSelf(core::TimePoint now);

    /// One step of the loop:
    /// - polls the host's connections (always)
    /// - every maintenance interval: heartbeats the coordinator's own
    ///   worker (re-registering it if it was swept), sweeps dead servers
    ///   and expires stale queue entries.
    ///
    /// Returns the report when maintenance ran, std::nullopt otherwise.
    std::optional<MaintenanceReport> step(core::TimePoint now);

    /// Run maintenance now regardless of the interval.
    MaintenanceReport maintain(core::TimePoint now);

private:
    ServerConfig m_config;
    GameHost& m_host;
    pool::ServerPool& m_pool;
    matchmaking::MatchmakingQueue& m_queue;

    std::optional<core::TimePoint> m_lastMaintenance;
};

} // namespace caro::net
