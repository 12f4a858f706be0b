#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <utility>

namespace mctrl::rcon {

class Transport;

/**
 * RCON packet types
 *
 * Command doubles as the server's authentication result and Response
 * doubles as the client's fragmentation probe.
 */
enum class PacketType : int32_t {
    Response        = 0,
    Command         = 2,
    Authentication  = 3,
};

const char* toString(PacketType type);

// Size field bounds (the size field counts everything after itself)
constexpr int32_t MIN_PACKET_SIZE = 10;
constexpr int32_t MAX_PACKET_SIZE = 4106;
constexpr int32_t PACKET_PAD_SIZE = 2;

// Largest payload a client may send
constexpr size_t MAX_CLIENT_PAYLOAD_SIZE = 1446;

// Reply to the fragmentation probe that marks the end of a fragmented response
constexpr const char* END_OF_FRAGMENTS = "Unknown request 0";

/**
 * RCON packet
 *
 *   [ i32 size ][ i32 id ][ i32 type ][ payload ][ 0x00 0x00 ]
 *
 * All integers little-endian.
 */
struct Packet {
    int32_t id{0};
    PacketType type{PacketType::Response};
    std::string payload;

    Packet() = default;
    Packet(int32_t i, PacketType t, std::string p)
        : id(i), type(t), payload(std::move(p)) {}

    static Packet authentication(int32_t id, const std::string& password) {
        return Packet(id, PacketType::Authentication, password);
    }

    static Packet command(int32_t id, const std::string& command) {
        return Packet(id, PacketType::Command, command);
    }

    // Empty Response-type packet used to detect the end of a fragmented reply
    static Packet probe(int32_t id) {
        return Packet(id, PacketType::Response, std::string());
    }
};

/**
 * A decoded packet together with the size field it arrived with
 */
struct Frame {
    int32_t size{0};
    Packet packet;

    bool isMaximal() const { return size == MAX_PACKET_SIZE; }
};

/**
 * RCON packet codec
 */
class PacketCodec {
public:
    /**
     * Encode a packet including its size prefix
     * @throws RconError InvalidId if id < 0,
     *         PayloadTooBig if the payload exceeds MAX_CLIENT_PAYLOAD_SIZE
     */
    static std::vector<uint8_t> encode(const Packet& packet);

    /**
     * Decode the bytes that follow the size field
     * @throws RconError Decode
     */
    static Packet decode(const std::vector<uint8_t>& body);

    /**
     * Validate a size field value
     * @throws RconError Decode if outside [MIN_PACKET_SIZE, MAX_PACKET_SIZE]
     */
    static int32_t checkSize(int32_t size);

    /**
     * Read one frame: the size field first, validated before the body is read
     * @throws RconError Read / Decode
     */
    static Frame readFrame(Transport& transport);

    /**
     * Encode and write a packet
     * @throws RconError InvalidId / PayloadTooBig / Write
     */
    static void writePacket(Transport& transport, const Packet& packet);
};

} // namespace mctrl::rcon
