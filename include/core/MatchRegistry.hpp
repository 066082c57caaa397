#pragma once

#include "MatchRecord.hpp"
#include "MatchSession.hpp"
#include "PlayerRecord.hpp"
#include "RatingCalculator.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace caro::core {

// Where finished matches go. Storage is an external collaborator.
class IMatchArchive {
public:
    virtual ~IMatchArchive() = default;

    virtual void store(const MatchRecord& record) = 0;
    virtual std::optional<MatchRecord> load(MatchId id) const = 0;
};

class InMemoryMatchArchive : public IMatchArchive {
public:
    void store(const MatchRecord& record) override;
    std::optional<MatchRecord> load(MatchId id) const override;
    std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<MatchId, MatchRecord> m_records;
};

/// Directory of live sessions keyed by match id.
class MatchRegistry {
public:
    using SessionPtr = std::shared_ptr<MatchSession>;

    MatchRegistry(IPlayerRepository& players,
                  IMatchArchive& archive,
                  RatingCalculator calculator = RatingCalculator{});

    SessionPtr createLocal();

    /// The human always plays X and moves first.
    SessionPtr createAi(Participant human);

    SessionPtr createOnline(Participant x, Participant o);

    /// Online session with only the host seated; see MatchSession::join.
    SessionPtr createWaiting(Participant host);

    /// Throws SessionNotFound.
    SessionPtr get(MatchId id) const;

    /// Empty pointer when unknown.
    SessionPtr find(MatchId id) const;

    bool remove(MatchId id);

    /// Store the session's record in the archive and drop it from the
    /// live set. Throws SessionNotFound.
    MatchRecord archive(MatchId id);

    /// Live sessions first, then the archive.
    std::optional<MatchRecord> lookup(MatchId id) const;

    std::size_t activeCount() const;

private:
    IPlayerRepository& m_players;
    IMatchArchive& m_archive;
    RatingCalculator m_calculator;

    mutable std::mutex m_mutex;
    std::unordered_map<MatchId, SessionPtr> m_sessions;
    std::atomic<MatchId> m_nextId{1};

    SessionPtr insert(MatchMode mode,
                      std::unique_ptr<IMatchRules> rules,
                      std::vector<Participant> participants);
};

} // namespace caro::core
