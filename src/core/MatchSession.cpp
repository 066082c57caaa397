#include "core/MatchSession.hpp"

#include "core/Errors.hpp"
#include "core/WinDetector.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace caro::core {

MatchSession::MatchSession(MatchId id,
                           MatchMode mode,
                           std::unique_ptr<IMatchRules> rules,
                           std::vector<Participant> participants)
    : m_id(id)
    , m_mode(mode)
    , m_rules(std::move(rules))
{
    if (!m_rules) {
        throw std::invalid_argument("MatchSession requires rules");
    }
    if (m_rules->mode() != mode) {
        throw std::invalid_argument("MatchSession: rules do not match mode " + toString(mode));
    }

    m_record.id   = id;
    m_record.mode = mode;

    for (auto& p : participants) {
        auto& seat = (p.symbol == Symbol::X) ? m_record.playerX : m_record.playerO;
        if (seat) {
            throw std::invalid_argument("MatchSession: two participants share a symbol");
        }
        seat = std::move(p);
    }

    const bool seated = m_record.playerX.has_value() && m_record.playerO.has_value();
    m_record.status = (mode == MatchMode::Online && !seated)
                      ? MatchStatus::Waiting
                      : MatchStatus::InProgress;
}

MatchStatus MatchSession::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_record.status;
}

MatchResult MatchSession::result() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_record.result;
}

Symbol MatchSession::currentTurn() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_record.currentTurn;
}

std::vector<Position> MatchSession::winningLine() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_record.winningLine;
}

std::vector<Move> MatchSession::moves() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_record.moves;
}

std::vector<Participant> MatchSession::participants() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Participant> out;
    if (m_record.playerX) out.push_back(*m_record.playerX);
    if (m_record.playerO) out.push_back(*m_record.playerO);
    return out;
}

std::optional<Participant> MatchSession::participant(Symbol symbol) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return symbol == Symbol::X ? m_record.playerX : m_record.playerO;
}

std::optional<Symbol> MatchSession::symbolOf(PlayerId player) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_record.playerX && m_record.playerX->id == player) return Symbol::X;
    if (m_record.playerO && m_record.playerO->id == player) return Symbol::O;
    return std::nullopt;
}

Symbol MatchSession::requireSymbolLocked(PlayerId player) const {
    if (m_record.playerX && m_record.playerX->id == player) return Symbol::X;
    if (m_record.playerO && m_record.playerO->id == player) return Symbol::O;
    throw InvalidTransition("Player " + std::to_string(player)
                            + " is not part of match " + std::to_string(m_id));
}

void MatchSession::join(const Participant& player) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_record.status != MatchStatus::Waiting) {
        throw InvalidTransition("Match " + std::to_string(m_id) + " is not waiting for a player");
    }

    auto& seat = (player.symbol == Symbol::X) ? m_record.playerX : m_record.playerO;
    if (seat) {
        throw InvalidTransition("Seat " + std::string(1, toChar(player.symbol)) + " is taken");
    }
    if ((m_record.playerX && m_record.playerX->id == player.id)
        || (m_record.playerO && m_record.playerO->id == player.id)) {
        throw InvalidTransition("Player cannot play against themselves");
    }

    seat = player;
    if (m_record.playerX && m_record.playerO) {
        m_record.status = MatchStatus::InProgress;
    }
}

MoveOutcome MatchSession::makeMove(int row, int col, Symbol symbol) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_record.status != MatchStatus::InProgress) {
        throw InvalidMove(MoveRejection::GameNotInProgress, "Game is not in progress");
    }
    if (symbol != m_record.currentTurn) {
        throw InvalidMove(MoveRejection::NotYourTurn, "Not your turn");
    }

    m_record.board.applyMove(row, col, symbol); // throws before any mutation

    MoveOutcome outcome;
    outcome.move = Move{row, col, symbol,
                        static_cast<std::uint32_t>(m_record.moves.size() + 1)};
    m_record.moves.push_back(outcome.move);
    m_record.currentTurn = opponentOf(symbol);

    if (auto line = checkWin(m_record.board, row, col, symbol)) {
        finishLocked(winFor(symbol), *line, outcome.eloChanges);
    } else if (m_record.board.isFull()) {
        finishLocked(MatchResult::Draw, {}, outcome.eloChanges);
    }

    outcome.gameOver    = (m_record.status == MatchStatus::Completed);
    outcome.result      = m_record.result;
    outcome.winningLine = m_record.winningLine;
    return outcome;
}

MoveOutcome MatchSession::makeMove(PlayerId player, int row, int col) {
    const auto symbol = symbolOf(player);
    if (!symbol) {
        throw InvalidTransition("Player " + std::to_string(player)
                                + " is not part of match " + std::to_string(m_id));
    }
    return makeMove(row, col, *symbol);
}

FinishOutcome MatchSession::forfeit(Symbol loser) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_record.status != MatchStatus::InProgress) {
        throw InvalidTransition("Cannot forfeit match " + std::to_string(m_id)
                                + " in state " + toString(m_record.status));
    }

    FinishOutcome out;
    out.finishedNow = finishLocked(winFor(opponentOf(loser)), {}, out.eloChanges);
    out.status = m_record.status;
    out.result = m_record.result;
    return out;
}

FinishOutcome MatchSession::forfeit(PlayerId player) {
    Symbol symbol;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        symbol = requireSymbolLocked(player);
    }
    return forfeit(symbol);
}

FinishOutcome MatchSession::disconnect(Symbol leaver) {
    std::lock_guard<std::mutex> lock(m_mutex);

    switch (m_record.status) {
    case MatchStatus::Completed:
    case MatchStatus::Abandoned:
        // Lost the race against the move (or forfeit) that ended the game.
        return observedLocked();
    case MatchStatus::Waiting: {
        m_record.status = MatchStatus::Abandoned;
        std::cout << "[MATCH] " << m_id << " abandoned before the second player arrived\n";
        FinishOutcome out = observedLocked();
        out.finishedNow = true;
        return out;
    }
    case MatchStatus::InProgress:
        break;
    }

    FinishOutcome out;
    out.finishedNow = finishLocked(winFor(opponentOf(leaver)), {}, out.eloChanges);
    out.status = m_record.status;
    out.result = m_record.result;
    return out;
}

FinishOutcome MatchSession::disconnect(PlayerId player) {
    Symbol symbol;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        symbol = requireSymbolLocked(player);
    }
    return disconnect(symbol);
}

MatchRecord MatchSession::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_record;
}

FinishOutcome MatchSession::observedLocked() const {
    FinishOutcome out;
    out.finishedNow = false;
    out.status = m_record.status;
    out.result = m_record.result;
    return out;
}

bool MatchSession::finishLocked(MatchResult result, std::vector<Position> line,
                                std::vector<EloChange>& eloChanges)
{
    // The claim: only the caller that flips InProgress -> Completed proceeds.
    if (m_record.status != MatchStatus::InProgress) {
        return false;
    }
    m_record.status      = MatchStatus::Completed;
    m_record.result      = result;
    m_record.winningLine = std::move(line);

    // The finishing move stays applied even when the results cannot be stored.
    try {
        eloChanges = m_rules->onMatchFinished(m_record);
    } catch (const std::exception& e) {
        eloChanges.clear();
        std::cerr << "[MATCH] " << m_id << " finished but its results were not recorded: "
                  << e.what() << "\n";
    }

    for (const auto& change : eloChanges) {
        const RatingChange rc{change.oldElo, change.newElo, change.change};
        if (m_record.playerX && m_record.playerX->id == change.userId) {
            m_record.ratingX = rc;
        } else if (m_record.playerO && m_record.playerO->id == change.userId) {
            m_record.ratingO = rc;
        }
    }

    std::cout << "[MATCH] " << m_id << " (" << toString(m_mode) << ") completed: "
              << toString(result) << " after " << m_record.moves.size() << " moves\n";
    return true;
}

} // namespace caro::core
