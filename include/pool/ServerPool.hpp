#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "core/Types.hpp"

namespace caro::pool {

using core::TimePoint;
using ServerId = std::string;
using SessionId = std::string;

struct PoolConfig {
    std::chrono::seconds heartbeatTtl{60};
    int minFreeCapacity{1};
};

struct HeartbeatMetrics {
    std::optional<double> cpuPercent;
    std::optional<double> memoryPercent;
    std::optional<int> reportedSessions;
};

/// Point-in-time copy of a registered worker.
struct ServerInfo {
    ServerId id;
    std::string address;
    int capacity{0};
    std::string region;
    int activeSessions{0};
    TimePoint lastHeartbeat{};
    HeartbeatMetrics metrics;
    bool healthy{false};

    int freeCapacity() const { return capacity - activeSessions; }
};

struct RegionStats {
    std::size_t servers{0};
    int capacity{0};
    int activeSessions{0};
};

struct PoolStats {
    std::size_t totalServers{0};
    std::size_t healthyServers{0};
    std::size_t unhealthyServers{0};
    int totalCapacity{0};
    int totalActive{0};
    double utilizationPercent{0.0};
    std::map<std::string, RegionStats> regions;
};

/// Registry of game workers and least-loaded session placement.
///
/// The server list is guarded by a shared mutex (writers: register,
/// unregister, sweep); each server's session set and heartbeat have their
/// own mutex so assignments on different servers never contend.
/// Servers are kept in registration order, which breaks selection ties.
class ServerPool {
public:
    explicit ServerPool(PoolConfig config = {});

    const PoolConfig& config() const noexcept { return m_config; }

    /// Re-registering an id refreshes its details and keeps its sessions.
    void registerServer(const ServerId& id, const std::string& address,
                        int capacity, const std::string& region, TimePoint now);

    bool unregister(const ServerId& id);

    /// False if the server is not registered (it may have been swept).
    bool heartbeat(const ServerId& id, TimePoint now, const HeartbeatMetrics& metrics = {});

    std::optional<ServerInfo> selectBestServer(const std::optional<std::string>& region,
                                               int minFreeCapacity,
                                               TimePoint now) const;
    std::optional<ServerInfo> selectBestServer(TimePoint now) const
    {
        return selectBestServer(std::nullopt, m_config.minFreeCapacity, now);
    }

    /// Place a session. Without a server id the least-loaded healthy server
    /// is chosen. Throws core::PoolUnavailable when nothing can take it.
    ServerInfo assign(const SessionId& session,
                      const std::optional<ServerId>& server,
                      const std::optional<std::string>& region,
                      TimePoint now);

    /// False if the session was not assigned to that server.
    bool release(const SessionId& session, const ServerId& server);
    /// Release from whichever server holds it.
    bool release(const SessionId& session);

    std::optional<ServerId> serverFor(const SessionId& session) const;

    /// Unregister every server whose heartbeat is older than the TTL.
    std::vector<ServerId> sweepDead(TimePoint now);

    std::optional<ServerInfo> server(const ServerId& id, TimePoint now) const;
    std::vector<ServerInfo> servers(TimePoint now) const;
    PoolStats stats(TimePoint now) const;

private:
    struct Record {
        mutable std::mutex mutex;
        ServerId id;
        std::string address;
        int capacity{0};
        std::string region;
        TimePoint lastHeartbeat{};
        HeartbeatMetrics metrics;
        std::set<SessionId> sessions;
        int activeSessions{0}; // always sessions.size()
    };
    using RecordPtr = std::shared_ptr<Record>;

    PoolConfig m_config;
    mutable std::shared_mutex m_mutex;
    std::vector<RecordPtr> m_servers;

    RecordPtr findLocked(const ServerId& id) const;
    bool isHealthy(const Record& record, TimePoint now) const;
    ServerInfo infoOf(const Record& record, TimePoint now) const;

    // Adds the session if the record still has room; false otherwise.
    bool tryAdd(Record& record, const SessionId& session, int minFree);
};

} // namespace caro::pool
