#include "controller/AiController.hpp"

namespace caro::controller {

AiController::AiController(core::Difficulty defaultDifficulty, std::uint32_t seed)
    : defaultDifficulty_{defaultDifficulty}
    , rng_{seed}
{
}

std::optional<core::MoveOutcome>
AiController::respond(core::MatchSession& session, core::Difficulty difficulty)
{
    using core::MatchMode;
    using core::MatchStatus;

    if (session.mode() != MatchMode::Ai) {
        return std::nullopt;
    }

    const auto record = session.snapshot();
    if (record.status != MatchStatus::InProgress) {
        return std::nullopt;
    }

    // The computer owns whichever seat has no participant.
    const core::Symbol aiSymbol = record.playerX ? core::Symbol::O : core::Symbol::X;
    if (record.currentTurn != aiSymbol) {
        return std::nullopt;
    }

    core::Position pick;
    {
        std::lock_guard<std::mutex> lock(rngMutex_);
        pick = selector_.selectMove(record.board, aiSymbol, difficulty, rng_);
    }

    // A human move racing in between surfaces as InvalidMove to the caller.
    return session.makeMove(pick.row, pick.col, aiSymbol);
}

} // namespace caro::controller
