#pragma once

#include "core/MatchSession.hpp"
#include "core/MoveSelector.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>

namespace caro::controller {

/// Plays the computer's side of ai-mode sessions.
/// Controller does not own sessions; callers pass the one to act on.
class AiController {
public:
    explicit AiController(core::Difficulty defaultDifficulty = core::Difficulty::Medium,
                          std::uint32_t seed = std::random_device{}());

    core::Difficulty defaultDifficulty() const noexcept { return defaultDifficulty_; }

    /// If it is the computer's turn in an in-progress ai session, choose and
    /// apply a move. Returns std::nullopt when there is nothing to do.
    std::optional<core::MoveOutcome>
    respond(core::MatchSession& session, core::Difficulty difficulty);

    std::optional<core::MoveOutcome> respond(core::MatchSession& session) {
        return respond(session, defaultDifficulty_);
    }

private:
    core::MoveSelector selector_;
    core::Difficulty defaultDifficulty_;

    std::mutex rngMutex_;
    std::mt19937 rng_;
};

} // namespace caro::controller
