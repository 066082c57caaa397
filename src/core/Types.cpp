#include "core/Types.hpp"

#include <stdexcept>

namespace caro::core {

Outcome outcomeFor(MatchResult result, Symbol side) {
    switch (result) {
    case MatchResult::Draw:
        return Outcome::Draw;
    case MatchResult::WinX:
        return side == Symbol::X ? Outcome::Win : Outcome::Loss;
    case MatchResult::WinO:
        return side == Symbol::O ? Outcome::Win : Outcome::Loss;
    case MatchResult::None:
        break;
    }
    throw std::invalid_argument("outcomeFor: match has no result");
}

std::string toString(MatchMode mode) {
    switch (mode) {
    case MatchMode::Local:  return "local";
    case MatchMode::Online: return "online";
    case MatchMode::Ai:     return "ai";
    }
    return "unknown";
}

std::string toString(MatchStatus status) {
    switch (status) {
    case MatchStatus::Waiting:    return "waiting";
    case MatchStatus::InProgress: return "in_progress";
    case MatchStatus::Completed:  return "completed";
    case MatchStatus::Abandoned:  return "abandoned";
    }
    return "unknown";
}

std::string toString(MatchResult result) {
    switch (result) {
    case MatchResult::None: return "none";
    case MatchResult::WinX: return "black_win";
    case MatchResult::WinO: return "white_win";
    case MatchResult::Draw: return "draw";
    }
    return "unknown";
}

} // namespace caro::core
