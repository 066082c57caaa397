#include "pool/ServerPool.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "core/Errors.hpp"

namespace caro::pool {

ServerPool::ServerPool(PoolConfig config)
    : m_config(config)
{
    if (m_config.heartbeatTtl.count() <= 0) {
        throw std::invalid_argument("ServerPool: heartbeat TTL must be positive");
    }
}

ServerPool::RecordPtr ServerPool::findLocked(const ServerId& id) const
{
    for (const auto& record : m_servers) {
        if (record->id == id) {
            return record;
        }
    }
    return nullptr;
}

bool ServerPool::isHealthy(const Record& record, TimePoint now) const
{
    return now - record.lastHeartbeat < m_config.heartbeatTtl;
}

ServerInfo ServerPool::infoOf(const Record& record, TimePoint now) const
{
    ServerInfo info;
    info.id             = record.id;
    info.address        = record.address;
    info.capacity       = record.capacity;
    info.region         = record.region;
    info.activeSessions = record.activeSessions;
    info.lastHeartbeat  = record.lastHeartbeat;
    info.metrics        = record.metrics;
    info.healthy        = isHealthy(record, now);
    return info;
}

void ServerPool::registerServer(const ServerId& id, const std::string& address,
                                int capacity, const std::string& region, TimePoint now)
{
    if (id.empty()) {
        throw std::invalid_argument("registerServer: empty server id");
    }
    if (capacity <= 0) {
        throw std::invalid_argument("registerServer: capacity must be positive");
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (auto existing = findLocked(id)) {
        std::lock_guard<std::mutex> recordLock(existing->mutex);
        existing->address = address;
        existing->capacity = capacity;
        existing->region = region;
        existing->lastHeartbeat = now;
        std::cout << "[POOL] Re-registered " << id << " at " << address
                  << " (capacity " << capacity << ", " << existing->activeSessions
                  << " sessions kept)\n";
        return;
    }

    auto record = std::make_shared<Record>();
    record->id = id;
    record->address = address;
    record->capacity = capacity;
    record->region = region;
    record->lastHeartbeat = now;
    m_servers.push_back(std::move(record));
    std::cout << "[POOL] Registered " << id << " at " << address
              << " (capacity " << capacity << ", region " << region << ")\n";
}

bool ServerPool::unregister(const ServerId& id)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    for (auto it = m_servers.begin(); it != m_servers.end(); ++it) {
        if ((*it)->id == id) {
            m_servers.erase(it);
            std::cout << "[POOL] Unregistered " << id << "\n";
            return true;
        }
    }
    return false;
}

bool ServerPool::heartbeat(const ServerId& id, TimePoint now, const HeartbeatMetrics& metrics)
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto record = findLocked(id);
    if (!record) {
        return false;
    }
    std::lock_guard<std::mutex> recordLock(record->mutex);
    record->lastHeartbeat = now;
    if (metrics.cpuPercent) record->metrics.cpuPercent = metrics.cpuPercent;
    if (metrics.memoryPercent) record->metrics.memoryPercent = metrics.memoryPercent;
    if (metrics.reportedSessions) record->metrics.reportedSessions = metrics.reportedSessions;
    return true;
}

std::optional<ServerInfo>
ServerPool::selectBestServer(const std::optional<std::string>& region,
                             int minFreeCapacity,
                             TimePoint now) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    std::optional<ServerInfo> best;
    for (const auto& record : m_servers) {
        std::lock_guard<std::mutex> recordLock(record->mutex);
        if (!isHealthy(*record, now)) continue;
        if (region && record->region != *region) continue;
        if (record->capacity - record->activeSessions < minFreeCapacity) continue;

        // Strict comparison keeps the earliest registered server on ties.
        if (!best || record->activeSessions < best->activeSessions) {
            best = infoOf(*record, now);
        }
    }
    return best;
}

bool ServerPool::tryAdd(Record& record, const SessionId& session, int minFree)
{
    std::lock_guard<std::mutex> recordLock(record.mutex);
    if (record.sessions.count(session) != 0) {
        return true;
    }
    if (record.capacity - record.activeSessions < minFree) {
        return false;
    }
    record.sessions.insert(session);
    record.activeSessions = static_cast<int>(record.sessions.size());
    return true;
}

ServerInfo ServerPool::assign(const SessionId& session,
                              const std::optional<ServerId>& server,
                              const std::optional<std::string>& region,
                              TimePoint now)
{
    if (session.empty()) {
        throw std::invalid_argument("assign: empty session id");
    }

    if (auto current = serverFor(session)) {
        if (!server || *server == *current) {
            if (auto info = this->server(*current, now)) {
                return *info;
            }
        }
    }

    if (server) {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto record = findLocked(*server);
        if (!record) {
            throw core::PoolUnavailable("Server " + *server + " is not registered");
        }
        if (!tryAdd(*record, session, 1)) {
            throw core::PoolUnavailable("Server " + *server + " is full");
        }
        std::lock_guard<std::mutex> recordLock(record->mutex);
        std::cout << "[POOL] Session " << session << " -> " << *server
                  << " (" << record->activeSessions << "/" << record->capacity << ")\n";
        return infoOf(*record, now);
    }

    // Another assignment may fill the chosen server between selection and
    // insertion; pick again in that case.
    for (;;) {
        auto best = selectBestServer(region, std::max(1, m_config.minFreeCapacity), now);
        if (!best) {
            throw core::PoolUnavailable("No servers available");
        }

        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto record = findLocked(best->id);
        if (record && tryAdd(*record, session, 1)) {
            std::lock_guard<std::mutex> recordLock(record->mutex);
            std::cout << "[POOL] Session " << session << " -> " << record->id
                      << " (" << record->activeSessions << "/" << record->capacity << ")\n";
            return infoOf(*record, now);
        }
    }
}

bool ServerPool::release(const SessionId& session, const ServerId& server)
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto record = findLocked(server);
    if (!record) {
        return false;
    }
    std::lock_guard<std::mutex> recordLock(record->mutex);
    if (record->sessions.erase(session) == 0) {
        return false;
    }
    record->activeSessions = static_cast<int>(record->sessions.size());
    return true;
}

bool ServerPool::release(const SessionId& session)
{
    auto holder = serverFor(session);
    return holder && release(session, *holder);
}

std::optional<ServerId> ServerPool::serverFor(const SessionId& session) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    for (const auto& record : m_servers) {
        std::lock_guard<std::mutex> recordLock(record->mutex);
        if (record->sessions.count(session) != 0) {
            return record->id;
        }
    }
    return std::nullopt;
}

std::vector<ServerId> ServerPool::sweepDead(TimePoint now)
{
    std::vector<ServerId> removed;

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    for (auto it = m_servers.begin(); it != m_servers.end();) {
        const Record& record = **it;
        if (isHealthy(record, now)) {
            ++it;
            continue;
        }
        std::cerr << "[POOL] Server " << record.id << " missed its heartbeat, dropping "
                  << record.sessions.size() << " assigned sessions\n";
        removed.push_back(record.id);
        it = m_servers.erase(it);
    }
    return removed;
}

std::optional<ServerInfo> ServerPool::server(const ServerId& id, TimePoint now) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto record = findLocked(id);
    if (!record) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> recordLock(record->mutex);
    return infoOf(*record, now);
}

std::vector<ServerInfo> ServerPool::servers(TimePoint now) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<ServerInfo> out;
    out.reserve(m_servers.size());
    for (const auto& record : m_servers) {
        std::lock_guard<std::mutex> recordLock(record->mutex);
        out.push_back(infoOf(*record, now));
    }
    return out;
}

PoolStats ServerPool::stats(TimePoint now) const
{
    PoolStats out;
    for (const auto& info : servers(now)) {
        ++out.totalServers;
        if (info.healthy) {
            ++out.healthyServers;
        }
        out.totalCapacity += info.capacity;
        out.totalActive += info.activeSessions;

        auto& region = out.regions[info.region.empty() ? "unknown" : info.region];
        ++region.servers;
        region.capacity += info.capacity;
        region.activeSessions += info.activeSessions;
    }
    out.unhealthyServers = out.totalServers - out.healthyServers;
    if (out.totalCapacity > 0) {
        const double raw = 100.0 * out.totalActive / out.totalCapacity;
        out.utilizationPercent = std::round(raw * 100.0) / 100.0;
    }
    return out;
}

} // namespace caro::pool
