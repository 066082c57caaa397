#pragma once

#include <stdexcept>
#include <string>

namespace caro::core {

/// Base of every domain error raised by the game core and its services.
class CaroError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class MoveRejection {
    CellOccupied,
    NotYourTurn,
    OutOfBounds,
    GameNotInProgress
};

/// A move was rejected; the board and session are left untouched.
class InvalidMove : public CaroError {
public:
    InvalidMove(MoveRejection reason, const std::string& what)
        : CaroError(what)
        , m_reason(reason)
    {
    }

    MoveRejection reason() const noexcept { return m_reason; }

private:
    MoveRejection m_reason;
};

/// Forfeit / join requested on a session in the wrong state or by a stranger.
class InvalidTransition : public CaroError {
public:
    using CaroError::CaroError;
};

class SessionNotFound : public CaroError {
public:
    using CaroError::CaroError;
};

/// A provisional opponent was claimed by someone else before we committed.
class QueueRaceLost : public CaroError {
public:
    using CaroError::CaroError;
};

/// No healthy server with enough free capacity.
class PoolUnavailable : public CaroError {
public:
    using CaroError::CaroError;
};

/// The shared queue / registry storage cannot be reached.
class BackingStoreUnavailable : public CaroError {
public:
    using CaroError::CaroError;
};

} // namespace caro::core
