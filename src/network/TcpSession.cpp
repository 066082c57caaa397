#include "network/TcpSession.hpp"

#include <iostream>
#include <string>

#include "network/Serialization.hpp"

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
    #include <netdb.h>
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

// First address of `host` that accepts a connection, or kInvalidSocket.
socket_t connectAny(const std::string& host, std::uint16_t port)
{
    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* found = nullptr;
    const std::string service = std::to_string(port);
    const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &found);
    if (rc != 0) {
        std::cerr << "[TCP] Cannot resolve " << host << ": " << gai_strerror(rc) << "\n";
        return kInvalidSocket;
    }

    socket_t sock = kInvalidSocket;
    for (addrinfo* ai = found; ai != nullptr; ai = ai->ai_next) {
        sock = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == kInvalidSocket) {
            continue;
        }
        if (::connect(sock, ai->ai_addr, static_cast<int>(ai->ai_addrlen)) == 0) {
            break;
        }
        CLOSE_SOCKET(sock);
        sock = kInvalidSocket;
    }
    ::freeaddrinfo(found);
    return sock;
}

} // namespace

namespace caro::net {

TcpSession::TcpSession(int socketFd)
    : m_socket(socketFd)
    , m_connected(true)
{
    m_reader = std::thread(&TcpSession::readLoop, this);
}

TcpSession::~TcpSession()
{
    // Unblock recv() so the reader can be joined, then release the fd.
    m_connected = false;
    if (m_socket != static_cast<int>(kInvalidSocket)) {
        ::shutdown(m_socket, SHUTDOWN_BOTH);
    }
    if (m_reader.joinable()) {
        m_reader.join();
    }
    closeSocket();
}

INetworkSessionPtr TcpSession::createClient(const std::string& host, std::uint16_t port)
{
    initSockets();

    const socket_t sock = connectAny(host, port);
    if (sock == kInvalidSocket) {
        std::cerr << "[TCP] Could not connect to " << host << ":" << port << "\n";
        return nullptr;
    }
    return INetworkSessionPtr(new TcpSession(static_cast<int>(sock)));
}

void TcpSession::send(const Message& msg)
{
    if (!m_connected) {
        return;
    }

    const std::string line = serialize(msg) + "\n";

    // Replies to different requests may be sent from different threads.
    std::lock_guard<std::mutex> lock(m_sendMutex);
    std::size_t offset = 0;
    while (offset < line.size() && m_connected) {
        const int n = ::send(m_socket, line.data() + offset,
                             static_cast<int>(line.size() - offset), 0);
        if (n <= 0) {
            std::cerr << "[TCP] Send failed, closing connection\n";
            m_connected = false;
            return;
        }
        offset += static_cast<std::size_t>(n);
    }
}

void TcpSession::setMessageHandler(MessageHandler handler)
{
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_handler = std::move(handler);
}

void TcpSession::setDisconnectHandler(DisconnectHandler handler)
{
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_disconnectHandler = std::move(handler);
}

void TcpSession::readLoop()
{
    std::string pending;
    char chunk[1024];

    while (m_connected) {
        const int n = ::recv(m_socket, chunk, sizeof(chunk), 0);
        if (n <= 0) {
            // exchange() tells a peer hangup apart from our own shutdown.
            if (m_connected.exchange(false)) {
                notifyDisconnect();
            }
            return;
        }

        pending.append(chunk, static_cast<std::size_t>(n));
        if (!drainLines(pending)) {
            std::cerr << "[TCP] Line exceeds " << kMaxLineLength
                      << " bytes, closing connection\n";
            if (m_connected.exchange(false)) {
                notifyDisconnect();
            }
            return;
        }
    }
}

bool TcpSession::drainLines(std::string& buffer)
{
    std::size_t start = 0;
    for (auto eol = buffer.find('\n'); eol != std::string::npos; eol = buffer.find('\n', start)) {
        std::size_t end = eol;
        if (end > start && buffer[end - 1] == '\r') {
            --end;
        }
        if (end > start) {
            dispatch(buffer.substr(start, end - start));
        }
        start = eol + 1;
    }
    buffer.erase(0, start);
    return buffer.size() <= kMaxLineLength;
}

void TcpSession::dispatch(const std::string& line)
{
    auto msg = deserialize(line);
    if (!msg) {
        ++m_malformedLines;
        std::cerr << "[TCP] Dropping malformed line: " << line << "\n";
        return;
    }

    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        handler = m_handler;
    }
    if (handler) {
        handler(*msg);
    }
}

void TcpSession::notifyDisconnect()
{
    DisconnectHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        handler = m_disconnectHandler;
    }
    if (handler) {
        handler();
    }
}

void TcpSession::closeSocket()
{
    if (m_socket != static_cast<int>(kInvalidSocket)) {
        CLOSE_SOCKET(m_socket);
        m_socket = static_cast<int>(kInvalidSocket);
    }
}

} // namespace caro::net
