#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "network/INetworkSession.hpp"

namespace caro::net {

/// Client-side helper that:
/// - Sends Hello when started and remembers the Welcome.
/// - Sends game, move and queue requests to the host.
/// - Tracks the current match from GameCreated / matched QueueStatus.
/// - Keeps the latest QueueStatus, MoveBroadcast, GameOver,
///   PlayerDisconnected and Error, and forwards every message to an
///   optional handler (e.g. a console printer).
class NetworkClient {
public:
    using MessageHandler = std::function<void(const Message&)>;

    NetworkClient(INetworkSessionPtr session, std::string username);

    /// Send Hello to the host.
    void start();

    void createGame(core::MatchMode mode, core::Difficulty difficulty = core::Difficulty::Medium);
    void joinGame(MatchId match);

    /// Moves, forfeits and leaves apply to the current match.
    /// They are not sent when there is none.
    bool sendMove(int row, int col);
    bool forfeit();
    bool leaveGame();

    void joinQueue();
    void leaveQueue();
    void requestQueueStatus();
    void requestPoolStats();

    bool isConnected() const { return m_session && m_session->isConnected(); }
    bool isJoined() const;
    std::optional<PlayerId> playerId() const;
    std::optional<MatchId> currentMatch() const;

    std::optional<Welcome> lastWelcome() const;
    std::optional<QueueStatus> lastQueueStatus() const;
    std::optional<MoveBroadcast> lastMove() const;
    std::optional<GameOver> lastGameOver() const;
    std::optional<PlayerDisconnected> lastDisconnect() const;
    std::optional<std::string> lastError() const;

    /// Register a callback invoked for every message received.
    void setMessageHandler(MessageHandler handler);

private:
    void handleMessage(const Message& msg);
    void send(const Message& msg);

    INetworkSessionPtr m_session;
    std::string m_username;

    mutable std::mutex m_mutex;
    std::optional<Welcome> m_welcome;
    std::optional<MatchId> m_currentMatch;
    std::optional<QueueStatus> m_lastQueueStatus;
    std::optional<MoveBroadcast> m_lastMove;
    std::optional<GameOver> m_lastGameOver;
    std::optional<PlayerDisconnected> m_lastDisconnect;
    std::optional<std::string> m_lastError;
    MessageHandler m_handler;
};

} // namespace caro::net
