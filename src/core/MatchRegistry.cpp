#include "core/MatchRegistry.hpp"

#include "core/Errors.hpp"

#include <string>

namespace caro::core {

void InMemoryMatchArchive::store(const MatchRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.insert_or_assign(record.id, record);
}

std::optional<MatchRecord> InMemoryMatchArchive::load(MatchId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t InMemoryMatchArchive::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

MatchRegistry::MatchRegistry(IPlayerRepository& players,
                             IMatchArchive& archive,
                             RatingCalculator calculator)
    : m_players(players)
    , m_archive(archive)
    , m_calculator(calculator)
{
}

MatchRegistry::SessionPtr
MatchRegistry::insert(MatchMode mode,
                      std::unique_ptr<IMatchRules> rules,
                      std::vector<Participant> participants)
{
    const MatchId id = m_nextId++;
    auto session = std::make_shared<MatchSession>(id, mode, std::move(rules),
                                                  std::move(participants));
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sessions.emplace(id, session);
    return session;
}

MatchRegistry::SessionPtr MatchRegistry::createLocal() {
    return insert(MatchMode::Local, std::make_unique<LocalRules>(), {});
}

MatchRegistry::SessionPtr MatchRegistry::createAi(Participant human) {
    human.symbol = Symbol::X;
    return insert(MatchMode::Ai, std::make_unique<AiRules>(m_players), {human});
}

MatchRegistry::SessionPtr MatchRegistry::createOnline(Participant x, Participant o) {
    x.symbol = Symbol::X;
    o.symbol = Symbol::O;
    return insert(MatchMode::Online,
                  std::make_unique<OnlineRules>(m_players, m_calculator),
                  {x, o});
}

MatchRegistry::SessionPtr MatchRegistry::createWaiting(Participant host) {
    return insert(MatchMode::Online,
                  std::make_unique<OnlineRules>(m_players, m_calculator),
                  {host});
}

MatchRegistry::SessionPtr MatchRegistry::get(MatchId id) const {
    auto session = find(id);
    if (!session) {
        throw SessionNotFound("Match " + std::to_string(id) + " not found");
    }
    return session;
}

MatchRegistry::SessionPtr MatchRegistry::find(MatchId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(id);
    return it == m_sessions.end() ? nullptr : it->second;
}

bool MatchRegistry::remove(MatchId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.erase(id) > 0;
}

MatchRecord MatchRegistry::archive(MatchId id) {
    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(id);
        if (it == m_sessions.end()) {
            throw SessionNotFound("Match " + std::to_string(id) + " not found");
        }
        session = it->second;
        m_sessions.erase(it);
    }
    MatchRecord record = session->snapshot();
    m_archive.store(record);
    return record;
}

std::optional<MatchRecord> MatchRegistry::lookup(MatchId id) const {
    if (auto session = find(id)) {
        return session->snapshot();
    }
    return m_archive.load(id);
}

std::size_t MatchRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

} // namespace caro::core
