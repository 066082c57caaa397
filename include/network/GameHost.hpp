#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "controller/AiController.hpp"
#include "core/MatchRegistry.hpp"
#include "core/PlayerRecord.hpp"
#include "matchmaking/MatchmakingQueue.hpp"
#include "network/INetworkSession.hpp"
#include "network/MessageTypes.hpp"
#include "network/ServerConfig.hpp"
#include "pool/ServerPool.hpp"

namespace caro::net {

/// Server-side endpoint for player and worker connections.
///
/// Every connection must introduce itself with Hello before it can play.
/// Requests are routed to the match registry, the matchmaking queue and
/// the server pool; results go back to the requester and, for game events,
/// to every participant of the match. Any exception thrown while handling
/// a request is answered with an Error message to the requester only.
class GameHost {
public:
    using ConnectionId = std::uint64_t;

    GameHost(const ServerConfig& config,
             core::IPlayerRepository& players,
             core::MatchRegistry& matches,
             matchmaking::MatchmakingQueue& queue,
             pool::ServerPool& pool,
             controller::AiController& ai);

    /// Take ownership of a new connection and start routing its messages.
    ConnectionId addClient(INetworkSessionPtr session);

    /// Poll live connections and release the ones that went away.
    void poll();

    /// Same cleanup the transport triggers when a peer drops.
    void dropClient(ConnectionId id);

    std::size_t clientCount() const;

    /// Player bound to a connection by its Hello, if any.
    std::optional<PlayerId> playerOf(ConnectionId id) const;

private:
    struct Connection {
        ConnectionId id{};
        INetworkSessionPtr session;
        std::optional<PlayerId> player;
        std::string username;
        std::set<MatchId> matches;
    };

    ServerConfig m_config;
    core::IPlayerRepository& m_players;
    core::MatchRegistry& m_matches;
    matchmaking::MatchmakingQueue& m_queue;
    pool::ServerPool& m_pool;
    controller::AiController& m_ai;

    mutable std::mutex m_mutex;
    std::unordered_map<ConnectionId, Connection> m_connections;
    std::unordered_map<PlayerId, ConnectionId> m_playerConnections;
    std::unordered_map<std::string, PlayerId> m_usernames;
    std::unordered_map<MatchId, core::Difficulty> m_aiDifficulty;
    std::vector<INetworkSessionPtr> m_closed; // released on the next poll()

    ConnectionId m_nextConnectionId{1};
    PlayerId m_nextPlayerId{1};

    void handleIncoming(ConnectionId conn, const Message& msg);

    void handleHello(ConnectionId conn, const Hello& req);
    void handleCreateGame(ConnectionId conn, const CreateGame& req);
    void handleJoinGame(ConnectionId conn, const JoinGame& req);
    void handleMakeMove(ConnectionId conn, const MakeMove& req);
    void handleForfeit(ConnectionId conn, const Forfeit& req);
    void handleLeaveGame(ConnectionId conn, const LeaveGame& req);
    void handleJoinQueue(ConnectionId conn);
    void handleLeaveQueue(ConnectionId conn);
    void handleQueueStatus(ConnectionId conn);
    void handleRegisterServer(ConnectionId conn, const RegisterServer& req);
    void handleUnregisterServer(ConnectionId conn, const UnregisterServer& req);
    void handleServerHeartbeat(ConnectionId conn, const ServerHeartbeat& req);
    void handlePoolStats(ConnectionId conn);

    // Throws core::InvalidTransition when the connection has not said Hello.
    core::Participant requirePlayer(ConnectionId conn, core::Symbol symbol) const;

    void sendTo(ConnectionId conn, const Message& msg);
    void sendToPlayer(PlayerId player, const Message& msg);
    void broadcastToMatch(const core::MatchSession& session, const Message& msg);
    bool isPlayerConnected(PlayerId player) const;
    void notifyDisconnect(const core::MatchSession& session, PlayerId leaver,
                          const core::FinishOutcome& outcome);
    void sendError(ConnectionId conn, const std::string& description);

    void bindMatch(PlayerId player, MatchId match);
    std::string placeMatch(MatchId match);
    void broadcastMove(core::MatchSession& session, const core::MoveOutcome& outcome);
    void finishMatch(MatchId match);

    QueueStatus toWire(const matchmaking::QueueStatusReport& report) const;
};

} // namespace caro::net
