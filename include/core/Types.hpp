#pragma once // Include guard

#include <chrono>  // For time points used by queue and pool expiry
#include <cstdint> // For fixed-width integer types
#include <string>

// Namespace for Caro core types
namespace caro::core {

using PlayerId = std::uint64_t;
using MatchId  = std::uint64_t;

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

constexpr int kBoardSize = 15;
constexpr int kWinLength = 5;

// Position structure representing a cell in the board grid
struct Position {
    int row{};
    int col{};
};

inline bool operator==(const Position& a, const Position& b) {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Position& a, const Position& b) {
    return !(a == b);
}

// The two markers. X is the first player ("black"), O the second ("white").
enum class Symbol : std::uint8_t {
    X,
    O
};

inline Symbol opponentOf(Symbol s) {
    return s == Symbol::X ? Symbol::O : Symbol::X;
}

inline char toChar(Symbol s) {
    return s == Symbol::X ? 'X' : 'O';
}

// One recorded placement. `sequence` starts at 1 for the first move.
struct Move {
    int row{};
    int col{};
    Symbol symbol{Symbol::X};
    std::uint32_t sequence{};
};

enum class MatchMode : std::uint8_t {
    Local,
    Online,
    Ai
};

enum class MatchStatus : std::uint8_t {
    Waiting,
    InProgress,
    Completed,
    Abandoned
};

enum class MatchResult : std::uint8_t {
    None,
    WinX,
    WinO,
    Draw
};

// Outcome from the point of view of one participant.
enum class Outcome : std::uint8_t {
    Win,
    Loss,
    Draw
};

inline MatchResult winFor(Symbol s) {
    return s == Symbol::X ? MatchResult::WinX : MatchResult::WinO;
}

Outcome outcomeFor(MatchResult result, Symbol side);

std::string toString(MatchMode mode);
std::string toString(MatchStatus status);
std::string toString(MatchResult result);

} // namespace caro::core
