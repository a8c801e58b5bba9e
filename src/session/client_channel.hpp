#pragma once

#include <chrono>
#include <string>

#include "nlohmann/json.hpp"

namespace runbox::session {

enum class ReceiveStatus {
    kMessage,
    kTimeout,
    kClosed
};

struct ReceiveResult {
    ReceiveStatus status = ReceiveStatus::kClosed;
    std::string text;
};

// Bidirectional message channel to one connected client. Send may be called
// from several threads; messages are delivered in call order.
class ClientChannel {
public:
    virtual ~ClientChannel() = default;

    virtual void Send(const nlohmann::json& message) = 0;
    // Waits at most timeout for the next text message.
    virtual ReceiveResult Receive(std::chrono::milliseconds timeout) = 0;
    virtual std::string Origin() const = 0;
    // Flushes queued messages, then closes.
    virtual void Close() = 0;
};

}  // namespace runbox::session
