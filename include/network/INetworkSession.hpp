#pragma once

#include <functional>
#include <memory>

#include "network/MessageTypes.hpp"

namespace caro::net {

/// One player or worker connection as seen by GameHost / NetworkClient.
///
/// Transports may run handlers on their own thread; handlers may call
/// send() on any session but must not destroy the one they run on.
class INetworkSession {
public:
    using MessageHandler    = std::function<void(const Message&)>;
    using DisconnectHandler = std::function<void()>;

    virtual ~INetworkSession() = default;

    virtual void send(const Message& msg) = 0;

    // Drive delivery for transports without their own reader thread.
    virtual void poll() = 0;

    virtual void setMessageHandler(MessageHandler handler) = 0;

    // Runs at most once, when the peer goes away.
    virtual void setDisconnectHandler(DisconnectHandler handler) = 0;

    virtual bool isConnected() const = 0;
};

using INetworkSessionPtr = std::shared_ptr<INetworkSession>;

} // namespace caro::net
