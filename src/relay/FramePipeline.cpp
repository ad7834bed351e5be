#include "relay/FramePipeline.h"

#include "common/Logging.h"

#include <exception>

namespace deskrelay::relay {

using protocol::Message;
using protocol::MessageType;

namespace {
constexpr const char* kLog = "pipeline";

bool is_media(MessageType t) noexcept {
    return t == MessageType::ScreenFrame || t == MessageType::AudioData;
}

bool is_input(MessageType t) noexcept {
    return t == MessageType::MouseEvent || t == MessageType::KeyboardEvent;
}
} // namespace

FramePipeline::FramePipeline(Broker& broker, Transport transport)
    : broker_(broker), transport_(std::move(transport)) {}

RouteResult FramePipeline::forward_frame(const ControlPair& pair, Message frame) {
    return send(pair, pair.controller_id, std::move(frame), true);
}

RouteResult FramePipeline::forward_input(const ControlPair& pair, Message input) {
    return send(pair, pair.controlled_id, std::move(input), false);
}

RouteResult FramePipeline::route(const std::string& from, Message message) {
    auto pair = broker_.bound_pair_of(from);
    if (!pair) {
        DESKRELAY_LOG_DEBUG(kLog, "dropping " << protocol::to_string(message.type) << " from unpaired " << from);
        return RouteResult::NotPaired;
    }

    if (is_media(message.type) && from == pair->controlled_id) {
        return forward_frame(*pair, std::move(message));
    }
    if (is_input(message.type) && from == pair->controller_id) {
        return forward_input(*pair, std::move(message));
    }

    DESKRELAY_LOG_WARN(kLog, from << " sent " << protocol::to_string(message.type) << " in the wrong direction");
    return RouteResult::WrongDirection;
}

PipelineStats FramePipeline::stats_for(const std::string& controlled_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = per_pair_.find(controlled_id);
    return it == per_pair_.end() ? PipelineStats{} : it->second;
}

PipelineStats FramePipeline::totals() const {
    std::lock_guard<std::mutex> lk(mu_);
    return totals_;
}

void FramePipeline::forget(const std::string& controlled_id) {
    std::lock_guard<std::mutex> lk(mu_);
    per_pair_.erase(controlled_id);
}

RouteResult FramePipeline::send(const ControlPair& pair, const std::string& to, Message message, bool media) {
    message.session_id.clear();

    SendResult r = SendResult::Closed;
    try {
        r = transport_.send(to, message);
    } catch (const std::exception& e) {
        DESKRELAY_LOG_ERROR(kLog, "send to " << to << " failed: " << e.what());
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        auto& s = per_pair_[pair.controlled_id];
        if (r == SendResult::Queued) {
            ++(media ? s.frames_forwarded : s.inputs_forwarded);
            ++(media ? totals_.frames_forwarded : totals_.inputs_forwarded);
        } else {
            ++(media ? s.frames_dropped : s.inputs_dropped);
            ++(media ? totals_.frames_dropped : totals_.inputs_dropped);
        }
    }

    if (r == SendResult::Closed) {
        DESKRELAY_LOG_INFO(kLog, "peer " << to << " is gone, ending its pair");
        broker_.drop_pair(to, "peer_lost");
    }
    return r == SendResult::Queued ? RouteResult::Forwarded : RouteResult::Dropped;
}

} // namespace deskrelay::relay
