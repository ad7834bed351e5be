#pragma once

#include "protocol/Message.h"

#include <functional>
#include <string>

namespace deskrelay::relay {

enum class SendResult {
    Queued,   // accepted by the connection's write queue
    Dropped,  // droppable message discarded because the queue is full
    Closed    // no such connection, or it is shutting down
};

// Outbound side of the relay, implemented by the networking layer (or a test double).
struct Transport {
    std::function<SendResult(const std::string& connection_id, const protocol::Message& message)> send;

    // The networking layer reports the resulting close back through RelayService::on_close.
    std::function<void(const std::string& connection_id)> close;
};

} // namespace deskrelay::relay
