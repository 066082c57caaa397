#include "network/NetworkClient.hpp"

#include <iostream>

namespace caro::net {

NetworkClient::NetworkClient(INetworkSessionPtr session, std::string username)
    : m_session(std::move(session))
    , m_username(std::move(username))
{
    if (m_session) {
        m_session->setMessageHandler(
            [this](const Message& msg) { handleMessage(msg); }
        );
        m_session->setDisconnectHandler(
            [] { std::cerr << "[CLIENT] Connection to host lost\n"; }
        );
    }
}

void NetworkClient::send(const Message& msg)
{
    if (!m_session || !m_session->isConnected()) {
        return;
    }
    m_session->send(msg);
}

void NetworkClient::start()
{
    send(Message{MessageKind::Hello, Hello{m_username}});
}

void NetworkClient::createGame(core::MatchMode mode, core::Difficulty difficulty)
{
    send(Message{MessageKind::CreateGame, CreateGame{mode, difficulty}});
}

void NetworkClient::joinGame(MatchId match)
{
    send(Message{MessageKind::JoinGame, JoinGame{match}});
}

bool NetworkClient::sendMove(int row, int col)
{
    const auto match = currentMatch();
    if (!match) {
        return false;
    }
    send(Message{MessageKind::MakeMove, MakeMove{*match, row, col}});
    return true;
}

bool NetworkClient::forfeit()
{
    const auto match = currentMatch();
    if (!match) {
        return false;
    }
    send(Message{MessageKind::Forfeit, Forfeit{*match}});
    return true;
}

bool NetworkClient::leaveGame()
{
    std::optional<MatchId> match;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        match = m_currentMatch;
        m_currentMatch.reset();
    }
    if (!match) {
        return false;
    }
    send(Message{MessageKind::LeaveGame, LeaveGame{*match}});
    return true;
}

void NetworkClient::joinQueue()
{
    send(Message{MessageKind::JoinQueue, JoinQueue{}});
}

void NetworkClient::leaveQueue()
{
    send(Message{MessageKind::LeaveQueue, LeaveQueue{}});
}

void NetworkClient::requestQueueStatus()
{
    send(Message{MessageKind::QueueStatusRequest, QueueStatusRequest{}});
}

void NetworkClient::requestPoolStats()
{
    send(Message{MessageKind::PoolStatsRequest, PoolStatsRequest{}});
}

bool NetworkClient::isJoined() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_welcome.has_value();
}

std::optional<PlayerId> NetworkClient::playerId() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_welcome) {
        return std::nullopt;
    }
    return m_welcome->playerId;
}

std::optional<MatchId> NetworkClient::currentMatch() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_currentMatch;
}

std::optional<Welcome> NetworkClient::lastWelcome() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_welcome;
}

std::optional<QueueStatus> NetworkClient::lastQueueStatus() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastQueueStatus;
}

std::optional<MoveBroadcast> NetworkClient::lastMove() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastMove;
}

std::optional<GameOver> NetworkClient::lastGameOver() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastGameOver;
}

std::optional<PlayerDisconnected> NetworkClient::lastDisconnect() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastDisconnect;
}

std::optional<std::string> NetworkClient::lastError() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

void NetworkClient::setMessageHandler(MessageHandler handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handler = std::move(handler);
}

void NetworkClient::handleMessage(const Message& msg)
{
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        switch (msg.kind) {
        case MessageKind::Welcome:
            m_welcome = std::get<Welcome>(msg.payload);
            break;
        case MessageKind::GameCreated:
            m_currentMatch = std::get<GameCreated>(msg.payload).matchId;
            m_lastGameOver.reset();
            m_lastDisconnect.reset();
            break;
        case MessageKind::QueueStatus: {
            const auto& m = std::get<QueueStatus>(msg.payload);
            m_lastQueueStatus = m;
            if (m.state == "matched") {
                m_currentMatch = m.matchId;
            }
            break;
        }
        case MessageKind::MoveBroadcast:
            m_lastMove = std::get<MoveBroadcast>(msg.payload);
            if (m_lastMove->gameOver) {
                m_currentMatch.reset();
            }
            break;
        case MessageKind::GameOver:
            m_lastGameOver = std::get<GameOver>(msg.payload);
            m_currentMatch.reset();
            break;
        case MessageKind::PlayerDisconnected:
            m_lastDisconnect = std::get<PlayerDisconnected>(msg.payload);
            m_currentMatch.reset();
            break;
        case MessageKind::Error:
            m_lastError = std::get<ErrorMessage>(msg.payload).description;
            break;
        default:
            break;
        }
        handler = m_handler;
    }

    if (handler) {
        handler(msg);
    }
}

} // namespace caro::net
