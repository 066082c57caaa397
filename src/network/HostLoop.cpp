#include "network/HostLoop.hpp"

#include <iostream>

namespace caro::net {

HostLoop::HostLoop(const ServerConfig& config,
                   GameHost& host,
                   pool::ServerPool& pool,
                   matchmaking::MatchmakingQueue& queue)
    : m_config(config)
    , m_host(host)
    , m_pool(pool)
    , m_queue(queue)
{
}

void HostLoop::registerSelf(core::TimePoint now)
{
    m_pool.registerServer(m_config.workerId, m_config.workerAddress,
                          m_config.workerCapacity, m_config.workerRegion, now);
}

std::optional<MaintenanceReport> HostLoop::step(core::TimePoint now)
{
    m_host.poll();

    if (m_lastMaintenance && now - *m_lastMaintenance < m_config.maintenanceInterval) {
        return std::nullopt;
    }
    return maintain(now);
}

MaintenanceReport HostLoop::maintain(core::TimePoint now)
{
    m_lastMaintenance = now;
    MaintenanceReport report;

    // The coordinator's worker is the fallback placement target, so it
    // must never stay out of the pool.
    if (!m_pool.heartbeat(m_config.workerId, now)) {
        std::cerr << "[HOST] Own worker " << m_config.workerId
                  << " was not registered, registering again\n";
        registerSelf(now);
        report.selfReregistered = true;
    }

    report.sweptServers = m_pool.sweepDead(now);
    report.expiredQueueEntries = m_queue.cleanupExpired(now);

    if (!report.sweptServers.empty() || report.expiredQueueEntries > 0) {
        std::cout << "[HOST] Maintenance: " << report.sweptServers.size()
                  << " dead servers removed, " << report.expiredQueueEntries
                  << " stale queue entries expired\n";
    }
    return report;
}

} // namespace caro::net
