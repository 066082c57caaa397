#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

#include "network/INetworkSession.hpp"

namespace caro::net {

/// Accepts player and worker connections for the coordinator.
/// Every accepted socket becomes a TcpSession handed to the callback, on
/// the accept thread, together with the peer's "ip:port".
class TcpServer {
public:
    using NewSessionCallback = std::function<void(INetworkSessionPtr, const std::string& peer)>;

    TcpServer(std::uint16_t port, NewSessionCallback onNewSession,
              std::string bindAddress = "0.0.0.0");
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    /// False if the address or port cannot be used.
    bool start();

    /// Stops accepting. Sessions already handed out stay open.
    void stop();

    bool isRunning() const { return m_running; }
    std::uint16_t port() const { return m_port; }
    std::size_t acceptedCount() const { return m_accepted; }

private:
    void acceptLoop();

    std::uint16_t m_port;
    std::string m_bindAddress;
    NewSessionCallback m_onNewSession;

    int m_listenSocket{-1};
    std::atomic<bool> m_running{false};
    std::atomic<std::size_t> m_accepted{0};
    std::thread m_acceptThread;
};

} // namespace caro::net
