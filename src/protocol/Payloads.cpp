#include "protocol/Payloads.h"

#include "protocol/ProtocolError.h"

#include <boost/json.hpp>

namespace deskrelay::protocol {

namespace json = boost::json;

namespace {

void expect(const Message& m, MessageType type) {
    if (m.type != type) {
        throw MalformedMessage(std::string("expected ") + to_string(type) + ", got " + to_string(m.type));
    }
}

std::string req_string(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v || !v->is_string()) throw MalformedMessage(std::string("missing string field '") + key + "'");
    return json::value_to<std::string>(*v);
}

std::string opt_string(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return {};
    if (!v->is_string()) throw MalformedMessage(std::string("field '") + key + "' is not a string");
    return json::value_to<std::string>(*v);
}

bool req_bool(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v || !v->is_bool()) throw MalformedMessage(std::string("missing boolean field '") + key + "'");
    return v->as_bool();
}

std::int64_t opt_int(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return 0;
    if (v->is_int64()) return v->as_int64();
    if (v->is_uint64()) return static_cast<std::int64_t>(v->as_uint64());
    if (v->is_double()) return static_cast<std::int64_t>(v->as_double());
    throw MalformedMessage(std::string("field '") + key + "' is not a number");
}

std::vector<std::string> opt_strings(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return {};
    if (!v->is_array()) throw MalformedMessage(std::string("field '") + key + "' is not an array");

    std::vector<std::string> out;
    for (const auto& item : v->as_array()) {
        if (!item.is_string()) throw MalformedMessage(std::string("field '") + key + "' holds a non-string");
        out.push_back(json::value_to<std::string>(item));
    }
    return out;
}

json::array to_array(const std::vector<std::string>& items) {
    json::array out;
    for (const auto& s : items) out.emplace_back(s);
    return out;
}

} // namespace

const char* to_string(Role role) noexcept {
    return role == Role::Controller ? "controller" : "controlled";
}

std::optional<Role> role_from_string(std::string_view name) noexcept {
    if (name == "controller") return Role::Controller;
    if (name == "controlled") return Role::Controlled;
    return std::nullopt;
}

Message ConnectPayload::to_message() const {
    json::object p{
        {"device_id", device_id},
        {"device_name", device_name},
        {"role", to_string(role)},
        {"capabilities", to_array(capabilities)}
    };
    if (!password.empty()) p["password"] = password;
    return Message::make(MessageType::Connect, std::move(p));
}

ConnectPayload ConnectPayload::from_message(const Message& m) {
    expect(m, MessageType::Connect);
    ConnectPayload out;
    out.device_id = req_string(m.payload, "device_id");
    out.device_name = opt_string(m.payload, "device_name");

    auto role = role_from_string(req_string(m.payload, "role"));
    if (!role) throw MalformedMessage("role must be 'controller' or 'controlled'");
    out.role = *role;

    out.capabilities = opt_strings(m.payload, "capabilities");
    out.password = opt_string(m.payload, "password");
    return out;
}

Message AckPayload::to_message() const {
    json::object p{{"status", status}};
    if (!connection_id.empty()) p["connection_id"] = connection_id;
    if (!session_id.empty()) p["session_id"] = session_id;
    if (!permissions.empty()) p["permissions"] = to_array(permissions);
    if (!message.empty()) p["message"] = message;
    return Message::make(MessageType::Ack, std::move(p));
}

AckPayload AckPayload::from_message(const Message& m) {
    expect(m, MessageType::Ack);
    AckPayload out;
    out.status = req_string(m.payload, "status");
    out.connection_id = opt_string(m.payload, "connection_id");
    out.session_id = opt_string(m.payload, "session_id");
    out.permissions = opt_strings(m.payload, "permissions");
    out.message = opt_string(m.payload, "message");
    return out;
}

Message AuthPayload::to_message() const {
    return Message::make(MessageType::Auth, {{"username", username}, {"password", password}});
}

AuthPayload AuthPayload::from_message(const Message& m) {
    expect(m, MessageType::Auth);
    return AuthPayload{req_string(m.payload, "username"), req_string(m.payload, "password")};
}

Message DeviceListPayload::to_message() const {
    json::array list;
    for (const auto& d : devices) {
        list.push_back(json::object{
            {"device_id", d.device_id},
            {"name", d.name},
            {"status", d.status},
            {"capabilities", to_array(d.capabilities)}
        });
    }
    return Message::make(MessageType::DeviceList, {{"devices", std::move(list)}});
}

DeviceListPayload DeviceListPayload::from_message(const Message& m) {
    expect(m, MessageType::DeviceList);
    const json::value* v = m.payload.if_contains("devices");
    if (!v || !v->is_array()) throw MalformedMessage("missing array field 'devices'");

    DeviceListPayload out;
    for (const auto& item : v->as_array()) {
        if (!item.is_object()) throw MalformedMessage("device entry is not an object");
        const auto& o = item.as_object();
        out.devices.push_back(DeviceSummary{
            req_string(o, "device_id"),
            opt_string(o, "name"),
            opt_string(o, "status"),
            opt_strings(o, "capabilities")
        });
    }
    return out;
}

Message ControlRequestPayload::to_message() const {
    json::object p{{"target_id", target_id}};
    if (!password.empty()) p["password"] = password;
    if (!controller_id.empty()) p["controller_id"] = controller_id;
    if (!controller_name.empty()) p["controller_name"] = controller_name;
    if (!request_id.empty()) p["request_id"] = request_id;
    return Message::make(MessageType::ControlRequest, std::move(p));
}

ControlRequestPayload ControlRequestPayload::from_message(const Message& m) {
    expect(m, MessageType::ControlRequest);
    ControlRequestPayload out;
    out.target_id = req_string(m.payload, "target_id");
    out.password = opt_string(m.payload, "password");
    out.controller_id = opt_string(m.payload, "controller_id");
    out.controller_name = opt_string(m.payload, "controller_name");
    out.request_id = opt_string(m.payload, "request_id");
    return out;
}

Message ControlRequestResultPayload::to_message() const {
    return Message::make(MessageType::ControlRequestResult,
                         {{"success", success}, {"reason", reason}, {"target_id", target_id}});
}

ControlRequestResultPayload ControlRequestResultPayload::from_message(const Message& m) {
    expect(m, MessageType::ControlRequestResult);
    return ControlRequestResultPayload{
        req_bool(m.payload, "success"),
        req_string(m.payload, "reason"),
        opt_string(m.payload, "target_id")
    };
}

Message ControlResponsePayload::to_message() const {
    json::object p{{"accepted", accepted}};
    if (!request_id.empty()) p["request_id"] = request_id;
    if (!controlled_id.empty()) p["controlled_id"] = controlled_id;
    return Message::make(MessageType::ControlResponse, std::move(p));
}

ControlResponsePayload ControlResponsePayload::from_message(const Message& m) {
    expect(m, MessageType::ControlResponse);
    return ControlResponsePayload{
        req_bool(m.payload, "accepted"),
        opt_string(m.payload, "request_id"),
        opt_string(m.payload, "controlled_id")
    };
}

Message ScreenFramePayload::to_message() const {
    return Message::make(MessageType::ScreenFrame,
                         {
                             {"width", width},
                             {"height", height},
                             {"original_width", original_width},
                             {"original_height", original_height},
                             {"format", format}
                         },
                         data);
}

ScreenFramePayload ScreenFramePayload::from_message(const Message& m) {
    expect(m, MessageType::ScreenFrame);
    ScreenFramePayload out;
    out.width = opt_int(m.payload, "width");
    out.height = opt_int(m.payload, "height");
    out.original_width = opt_int(m.payload, "original_width");
    out.original_height = opt_int(m.payload, "original_height");
    out.format = opt_string(m.payload, "format");
    out.data = m.binary;
    return out;
}

Message MouseEventPayload::to_message() const {
    json::object p{
        {"event_type", event_type},
        {"x", x},
        {"y", y}
    };
    if (!button.empty()) p["button"] = button;
    if (!modifiers.empty()) p["modifiers"] = to_array(modifiers);
    return Message::make(MessageType::MouseEvent, std::move(p));
}

MouseEventPayload MouseEventPayload::from_message(const Message& m) {
    expect(m, MessageType::MouseEvent);
    MouseEventPayload out;
    out.event_type = req_string(m.payload, "event_type");
    out.x = opt_int(m.payload, "x");
    out.y = opt_int(m.payload, "y");
    out.button = opt_string(m.payload, "button");
    out.modifiers = opt_strings(m.payload, "modifiers");
    return out;
}

Message KeyboardEventPayload::to_message() const {
    json::object p{{"event_type", event_type}};
    if (!key.empty()) p["key"] = key;
    if (!keys.empty()) p["keys"] = to_array(keys);
    return Message::make(MessageType::KeyboardEvent, std::move(p));
}

KeyboardEventPayload KeyboardEventPayload::from_message(const Message& m) {
    expect(m, MessageType::KeyboardEvent);
    KeyboardEventPayload out;
    out.event_type = req_string(m.payload, "event_type");
    out.key = opt_string(m.payload, "key");
    out.keys = opt_strings(m.payload, "keys");
    return out;
}

Message EndControlPayload::to_message() const {
    return Message::make(MessageType::EndControl, {{"reason", reason}});
}

EndControlPayload EndControlPayload::from_message(const Message& m) {
    expect(m, MessageType::EndControl);
    return EndControlPayload{opt_string(m.payload, "reason")};
}

Message ControlEndedPayload::to_message() const {
    return Message::make(MessageType::ControlEnded, {{"reason", reason}});
}

ControlEndedPayload ControlEndedPayload::from_message(const Message& m) {
    expect(m, MessageType::ControlEnded);
    return ControlEndedPayload{opt_string(m.payload, "reason")};
}

Message HeartbeatPayload::to_message() const {
    return Message::make(MessageType::Heartbeat, {{"timestamp", timestamp}});
}

HeartbeatPayload HeartbeatPayload::from_message(const Message& m) {
    expect(m, MessageType::Heartbeat);
    return HeartbeatPayload{opt_int(m.payload, "timestamp")};
}

Message ErrorPayload::to_message() const {
    return Message::make(MessageType::Error, {{"code", code}, {"message", message}});
}

ErrorPayload ErrorPayload::from_message(const Message& m) {
    expect(m, MessageType::Error);
    return ErrorPayload{req_string(m.payload, "code"), opt_string(m.payload, "message")};
}

} // namespace deskrelay::protocol
