#pragma once

#include "Board.hpp"
#include "MatchRecord.hpp"
#include "MatchRules.hpp"
#include "Types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace caro::core {

struct MoveOutcome {
    Move move;
    bool gameOver{false};
    MatchResult result{MatchResult::None};
    std::vector<Position> winningLine;
    std::vector<EloChange> eloChanges;
};

struct FinishOutcome {
    // False when another caller had already finished the match.
    bool finishedNow{false};
    MatchStatus status{MatchStatus::InProgress};
    MatchResult result{MatchResult::None};
    std::vector<EloChange> eloChanges;
};

/// Authoritative state of one game.
/// Every public operation runs under the session's own mutex, so move
/// application, win detection and completion side effects are one unit.
/// Completion goes through a single claim on the status field: the first
/// caller to move it from InProgress to Completed runs the rules, every
/// later caller observes the finished state.
class MatchSession {
public:
    /// Online sessions with fewer than two participants start Waiting;
    /// everything else starts InProgress.
    MatchSession(MatchId id,
                 MatchMode mode,
                 std::unique_ptr<IMatchRules> rules,
                 std::vector<Participant> participants = {});

    MatchSession(const MatchSession&) = delete;
    MatchSession& operator=(const MatchSession&) = delete;

    MatchId   id()   const noexcept { return m_id; }
    MatchMode mode() const noexcept { return m_mode; }

    MatchStatus status() const;
    MatchResult result() const;
    Symbol currentTurn() const;
    std::vector<Position> winningLine() const;
    std::vector<Move> moves() const;
    std::vector<Participant> participants() const;
    std::optional<Participant> participant(Symbol symbol) const;
    std::optional<Symbol> symbolOf(PlayerId player) const;

    /// Seat the second player of a Waiting online session.
    void join(const Participant& player);

    /// Throws InvalidMove (GameNotInProgress, NotYourTurn, OutOfBounds,
    /// CellOccupied) without touching any state.
    MoveOutcome makeMove(int row, int col, Symbol symbol);
    MoveOutcome makeMove(PlayerId player, int row, int col);

    /// The other side wins. InProgress only, otherwise InvalidTransition.
    FinishOutcome forfeit(Symbol loser);
    FinishOutcome forfeit(PlayerId player);

    /// Same as forfeit while InProgress; a no-op once the match is over.
    /// A host leaving a Waiting session abandons it.
    FinishOutcome disconnect(Symbol leaver);
    FinishOutcome disconnect(PlayerId player);

    /// Copy of the persisted layout.
    MatchRecord snapshot() const;

private:
    const MatchId m_id;
    const MatchMode m_mode;
    std::unique_ptr<IMatchRules> m_rules;

    mutable std::mutex m_mutex;
    MatchRecord m_record;

    bool finishLocked(MatchResult result, std::vector<Position> line,
                      std::vector<EloChange>& eloChanges);
    Symbol requireSymbolLocked(PlayerId player) const;
    FinishOutcome observedLocked() const;
};

} // namespace caro::core
