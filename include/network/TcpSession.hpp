#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "network/INetworkSession.hpp"

namespace caro::net {

class TcpServer;

/// INetworkSession over one TCP connection, one serialized Message per line.
///
/// A background reader thread splits the byte stream on '\n', parses each
/// line and hands the Message to the message handler. Unparseable lines are
/// counted, logged and skipped. A line longer than kMaxLineLength closes the
/// connection. When the peer hangs up the disconnect handler runs once, on
/// the reader thread; it must not destroy the session.
/// `poll()` does nothing; delivery is driven by the reader thread.
class TcpSession : public INetworkSession {
public:
    static constexpr std::size_t kMaxLineLength = 64 * 1024;

    /// Connect to host:port; `host` may be a name or a dotted address.
    /// Returns nullptr when no address accepts the connection.
    static INetworkSessionPtr createClient(const std::string& host, std::uint16_t port);

    ~TcpSession() override;

    TcpSession(const TcpSession&) = delete;
    TcpSession& operator=(const TcpSession&) = delete;

    void send(const Message& msg) override;
    void poll() override {}
    void setMessageHandler(MessageHandler handler) override;
    void setDisconnectHandler(DisconnectHandler handler) override;
    bool isConnected() const override { return m_connected; }

    std::size_t malformedLines() const { return m_malformedLines; }

private:
    explicit TcpSession(int socketFd);

    friend class TcpServer;

    void readLoop();
    // Dispatches every complete line and erases it; false on an oversized line.
    bool drainLines(std::string& buffer);
    void dispatch(const std::string& line);
    void notifyDisconnect();
    void closeSocket();

    int m_socket{-1};
    std::atomic<bool> m_connected{false};
    std::atomic<std::size_t> m_malformedLines{0};
    std::thread m_reader;

    std::mutex m_handlerMutex;
    MessageHandler m_handler;
    DisconnectHandler m_disconnectHandler;

    std::mutex m_sendMutex;
};

} // namespace caro::net
