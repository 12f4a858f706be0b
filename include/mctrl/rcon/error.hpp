#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace mctrl::rcon {

/**
 * RCON protocol error
 *
 * Every failure of the codec, the transport or a connection state is
 * reported as an RconError. The codec and connection layers never recover
 * from one; the connection manager decides what happens to the socket.
 */
class RconError : public std::runtime_error {
public:
    enum class Kind {
        Connect,            // TCP connect/resolve failed
        Decode,             // malformed frame received
        PayloadTooBig,      // outbound payload over the client limit
        Write,              // socket write failed during a session
        Read,               // socket read failed during a session
        AuthFail,           // wrong password
        IdMismatch,         // response id does not correlate with the request
        InvalidId,          // outbound id is negative
        InvalidPacketType,  // unexpected frame type for the exchange
    };

    static RconError connect(const std::string& reason);
    static RconError decode(const std::string& reason);
    static RconError payloadTooBig(size_t limit, size_t actual);
    static RconError write(const std::string& reason);
    static RconError read(const std::string& reason);
    static RconError authFail();
    static RconError idMismatch(int32_t expected, int32_t actual);
    static RconError invalidId(int32_t id);
    static RconError invalidPacketType(const std::string& expected, const std::string& actual);

    Kind kind() const { return m_kind; }

    // Read and Write failures leave the socket in an unknown state
    bool isConnectionBroken() const {
        return m_kind == Kind::Read || m_kind == Kind::Write;
    }

    // Ids carried by IdMismatch / InvalidId, 0 otherwise
    int32_t expectedId() const { return m_expectedId; }
    int32_t actualId() const { return m_actualId; }

private:
    RconError(Kind kind, const std::string& message,
              int32_t expectedId = 0, int32_t actualId = 0);

    Kind m_kind;
    int32_t m_expectedId;
    int32_t m_actualId;
};

const char* kindName(RconError::Kind kind);

} // namespace mctrl::rcon
