#pragma once

#include "protocol/Message.h"
#include "relay/Broker.h"
#include "relay/Transport.h"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace deskrelay::relay {

struct PipelineStats {
    std::uint64_t frames_forwarded = 0;
    std::uint64_t frames_dropped = 0;
    std::uint64_t inputs_forwarded = 0;
    std::uint64_t inputs_dropped = 0;
};

enum class RouteResult {
    Forwarded,
    Dropped,         // backpressure, or the peer went away
    NotPaired,       // sender is not in a bound pair
    WrongDirection   // e.g. a controller sending screen frames
};

/**
 * Moves media one way and input the other once a pair is bound.
 *
 * Frames and audio go controlled -> controller, mouse and keyboard events go
 * controller -> controlled. Payloads are passed through untouched apart from
 * the session id, which never leaves the sender's connection.
 */
class FramePipeline {
public:
    FramePipeline(Broker& broker, Transport transport);

    FramePipeline(const FramePipeline&) = delete;
    FramePipeline& operator=(const FramePipeline&) = delete;

    // Never throws. A send to a closed peer tears the pair down.
    RouteResult forward_frame(const ControlPair& pair, protocol::Message frame);
    RouteResult forward_input(const ControlPair& pair, protocol::Message input);

    // Looks up the sender's pair and forwards in the direction the type allows.
    RouteResult route(const std::string& from, protocol::Message message);

    // Counters keyed by the controlled connection of the pair.
    PipelineStats stats_for(const std::string& controlled_id) const;
    PipelineStats totals() const;
    void forget(const std::string& controlled_id);

private:
    RouteResult send(const ControlPair& pair, const std::string& to, protocol::Message message, bool media);

    Broker& broker_;
    Transport transport_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, PipelineStats> per_pair_;
    PipelineStats totals_;
};

} // namespace deskrelay::relay
