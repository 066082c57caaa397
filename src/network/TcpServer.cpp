#include "network/TcpServer.hpp"

#include <chrono>
#include <iostream>
#include <mutex>

#include "network/TcpSession.hpp"

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    using socket_t = SOCKET;
    static constexpr socket_t kInvalidSocket = INVALID_SOCKET;
    #define CLOSE_SOCKET closesocket
    #define SHUTDOWN_BOTH SD_BOTH
#else
    #include <sys/types.h>
    #include <sys/socket.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <unistd.h>
    using socket_t = int;
    static constexpr socket_t kInvalidSocket = -1;
    #define CLOSE_SOCKET ::close
    #define SHUTDOWN_BOTH SHUT_RDWR
#endif

namespace {

#ifdef _WIN32
void initSockets()
{
    static std::once_flag flag;
    std::call_once(flag, [] {
        WSADATA data;
        const int rc = WSAStartup(MAKEWORD(2, 2), &data);
        if (rc != 0) {
            std::cerr << "[TCP] WSAStartup failed: " << rc << "\n";
        }
    });
}
#else
void initSockets() {}
#endif

std::string peerName(const sockaddr_in& addr)
{
    char text[INET_ADDRSTRLEN] = {};
    if (::inet_ntop(AF_INET, &addr.sin_addr, text, sizeof(text)) == nullptr) {
        return "unknown";
    }
    return std::string(text) + ":" + std::to_string(ntohs(addr.sin_port));
}

// Bound and listening socket, or kInvalidSocket with the reason logged.
socket_t openListener(const std::string& address, std::uint16_t port)
{
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port);
    if (::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "[TCP] Invalid bind address " << address << "\n";
        return kInvalidSocket;
    }

    socket_t sock = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sock == kInvalidSocket) {
        std::cerr << "[TCP] Failed to create listening socket\n";
        return kInvalidSocket;
    }

    int reuse = 1;
    ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR,
                 reinterpret_cast<char*>(&reuse), sizeof(reuse));

    if (::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::cerr << "[TCP] Could not bind " << address << ":" << port << "\n";
        CLOSE_SOCKET(sock);
        return kInvalidSocket;
    }
    if (::listen(sock, SOMAXCONN) < 0) {
        std::cerr << "[TCP] listen() failed on " << address << ":" << port << "\n";
        CLOSE_SOCKET(sock);
        return kInvalidSocket;
    }
    return sock;
}

} // namespace

namespace caro::net {

TcpServer::TcpServer(std::uint16_t port, NewSessionCallback onNewSession, std::string bindAddress)
    : m_port(port)
    , m_bindAddress(std::move(bindAddress))
    , m_onNewSession(std::move(onNewSession))
{
}

TcpServer::~TcpServer()
{
    stop();
}

bool TcpServer::start()
{
    if (m_running) {
        return true;
    }
    initSockets();

    const socket_t sock = openListener(m_bindAddress, m_port);
    if (sock == kInvalidSocket) {
        return false;
    }

    m_listenSocket = static_cast<int>(sock);
    m_running = true;
    m_acceptThread = std::thread(&TcpServer::acceptLoop, this);

    std::cout << "[TCP] Listening on " << m_bindAddress << ":" << m_port << "\n";
    return true;
}

void TcpServer::stop()
{
    if (!m_running.exchange(false)) {
        return;
    }

    // accept() only returns early on shutdown(), not on close().
    ::shutdown(m_listenSocket, SHUTDOWN_BOTH);
    if (m_acceptThread.joinable()) {
        m_acceptThread.join();
    }
    CLOSE_SOCKET(m_listenSocket);
    m_listenSocket = static_cast<int>(kInvalidSocket);

    std::cout << "[TCP] Stopped listening on port " << m_port << " after "
              << m_accepted << " connections\n";
}

void TcpServer::acceptLoop()
{
    while (m_running) {
        sockaddr_in peerAddr{};
        socklen_t peerLen = sizeof(peerAddr);
        const socket_t sock =
            ::accept(m_listenSocket, reinterpret_cast<sockaddr*>(&peerAddr), &peerLen);

        if (sock == kInvalidSocket) {
            if (!m_running) {
                return;
            }
            // Typically out of descriptors; give in-flight sessions time to close.
            std::cerr << "[TCP] accept() failed, retrying\n";
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        ++m_accepted;
        const std::string peer = peerName(peerAddr);
        std::cout << "[TCP] Connection from " << peer << "\n";

        INetworkSessionPtr session(new TcpSession(static_cast<int>(sock)));
        if (m_onNewSession) {
            m_onNewSession(std::move(session), peer);
        }
    }
}

} // namespace caro::net
