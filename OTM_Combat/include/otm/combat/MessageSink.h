#pragma once

#include <string>

namespace otm::combat {

/**
 * Delivery of gameplay text to a connected player.
 *
 * Implementations must not block the caller on network I/O; a slow or
 * disconnected client drops the message.
 */
class MessageSink {
public:
    virtual ~MessageSink() = default;
    virtual void sendMessage(const std::string& playerName, const std::string& text) = 0;
};

} // namespace otm::combat
