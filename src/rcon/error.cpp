#include "mctrl/rcon/error.hpp"

namespace mctrl::rcon {

RconError::RconError(Kind kind, const std::string& message,
                     int32_t expectedId, int32_t actualId)
    : std::runtime_error(message)
    , m_kind(kind)
    , m_expectedId(expectedId)
    , m_actualId(actualId)
{
}

RconError RconError::connect(const std::string& reason) {
    return RconError(Kind::Connect,
        "Failed to connect to the Minecraft server: " + reason);
}

RconError RconError::decode(const std::string& reason) {
    return RconError(Kind::Decode,
        "Failed to decode the message received from the Minecraft server: " + reason);
}

RconError RconError::payloadTooBig(size_t limit, size_t actual) {
    return RconError(Kind::PayloadTooBig,
        "A message payload must be at most " + std::to_string(limit) +
        " bytes, got: " + std::to_string(actual));
}

RconError RconError::write(const std::string& reason) {
    return RconError(Kind::Write,
        "Failed to send a message to the Minecraft server: " + reason);
}

RconError RconError::read(const std::string& reason) {
    return RconError(Kind::Read,
        "Failed to read a message from the Minecraft server: " + reason);
}

RconError RconError::authFail() {
    return RconError(Kind::AuthFail, "Minecraft server authentication failed");
}

RconError RconError::idMismatch(int32_t expected, int32_t actual) {
    return RconError(Kind::IdMismatch,
        "Expected sequence ID " + std::to_string(expected) +
        " from the Minecraft server, got: " + std::to_string(actual),
        expected, actual);
}

RconError RconError::invalidId(int32_t id) {
    return RconError(Kind::InvalidId,
        "Expected ID to be at least 0, got: " + std::to_string(id), 0, id);
}

RconError RconError::invalidPacketType(const std::string& expected, const std::string& actual) {
    return RconError(Kind::InvalidPacketType,
        "Invalid packet type received from the server. Expected " + expected +
        ", got: " + actual);
}

const char* kindName(RconError::Kind kind) {
    switch (kind) {
        case RconError::Kind::Connect:           return "connect";
        case RconError::Kind::Decode:            return "decode";
        case RconError::Kind::PayloadTooBig:     return "payload-too-big";
        case RconError::Kind::Write:             return "write";
        case RconError::Kind::Read:              return "read";
        case RconError::Kind::AuthFail:          return "auth-fail";
        case RconError::Kind::IdMismatch:        return "id-mismatch";
        case RconError::Kind::InvalidId:         return "invalid-id";
        case RconError::Kind::InvalidPacketType: return "invalid-packet-type";
    }
    return "unknown";
}

} // namespace mctrl::rcon
