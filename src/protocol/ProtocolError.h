#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace deskrelay::protocol {

class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bytes that do not parse as a message, or a payload missing required fields.
class MalformedMessage : public ProtocolError {
public:
    explicit MalformedMessage(const std::string& what)
        : ProtocolError("malformed message: " + what) {}
};

// Well-formed message whose type tag this build does not know.
class UnknownMessageType : public ProtocolError {
public:
    explicit UnknownMessageType(std::string type)
        : ProtocolError("unknown message type '" + type + "'"),
          type_(std::move(type)) {}

    const std::string& type_name() const noexcept { return type_; }

private:
    std::string type_;
};

} // namespace deskrelay::protocol
