#include "mctrl/rcon/packet.hpp"
#include "mctrl/rcon/error.hpp"
#include "mctrl/rcon/transport.hpp"
#include "mctrl/utils/buffer.hpp"
#include "mctrl/utils/logger.hpp"

namespace mctrl::rcon {

const char* toString(PacketType type) {
    switch (type) {
        case PacketType::Response:       return "response";
        case PacketType::Command:        return "command";
        case PacketType::Authentication: return "authentication";
    }
    return "unknown";
}

std::vector<uint8_t> PacketCodec::encode(const Packet& packet) {
    if (packet.id < 0) {
        throw RconError::invalidId(packet.id);
    }

    if (packet.payload.size() > MAX_CLIENT_PAYLOAD_SIZE) {
        throw RconError::payloadTooBig(MAX_CLIENT_PAYLOAD_SIZE, packet.payload.size());
    }

    utils::BufferWriter writer(4 + MIN_PACKET_SIZE + packet.payload.size());

    // Size placeholder, patched once the body is written
    writer.writeI32(0);
    writer.writeI32(packet.id);
    writer.writeI32(static_cast<int32_t>(packet.type));
    writer.writeRaw(packet.payload);
    writer.pad(PACKET_PAD_SIZE);

    writer.patchI32(0, static_cast<int32_t>(writer.size() - 4));

    return writer.take();
}

Packet PacketCodec::decode(const std::vector<uint8_t>& body) {
    if (body.size() < static_cast<size_t>(MIN_PACKET_SIZE)) {
        throw RconError::decode(
            "Expected packet length to be at least " + std::to_string(MIN_PACKET_SIZE) +
            " bytes, got: " + std::to_string(body.size()));
    }

    utils::BufferReader reader(body);

    Packet packet;
    packet.id = reader.readI32();

    int32_t type = reader.readI32();
    switch (type) {
        case static_cast<int32_t>(PacketType::Response):
            packet.type = PacketType::Response;
            break;
        case static_cast<int32_t>(PacketType::Command):
            packet.type = PacketType::Command;
            break;
        default:
            throw RconError::decode(
                "Expected message type to be 0 or 2, got: " + std::to_string(type));
    }

    size_t payloadSize = reader.remaining() - PACKET_PAD_SIZE;
    if (!utils::isValidUtf8(body.data() + reader.position(), payloadSize)) {
        throw RconError::decode("Message body is not a valid UTF-8 string");
    }
    packet.payload = reader.readString(payloadSize);

    if (reader.readU8() != 0 || reader.readU8() != 0) {
        throw RconError::decode("Missing padding at the end of the message");
    }

    return packet;
}

int32_t PacketCodec::checkSize(int32_t size) {
    if (size < MIN_PACKET_SIZE || size > MAX_PACKET_SIZE) {
        throw RconError::decode(
            "A packet size must be between " + std::to_string(MIN_PACKET_SIZE) +
            " and " + std::to_string(MAX_PACKET_SIZE) +
            " bytes long, server sent: " + std::to_string(size));
    }
    return size;
}

Frame PacketCodec::readFrame(Transport& transport) {
    auto sizeBytes = transport.read(4);
    utils::BufferReader sizeReader(sizeBytes);

    Frame frame;
    frame.size = checkSize(sizeReader.readI32());
    frame.packet = decode(transport.read(static_cast<size_t>(frame.size)));

    LOG_TRACE("Received packet: id={} type={} size={}",
              frame.packet.id, toString(frame.packet.type), frame.size);

    return frame;
}

void PacketCodec::writePacket(Transport& transport, const Packet& packet) {
    auto data = encode(packet);

    LOG_TRACE("Sending packet: id={} type={} size={}",
              packet.id, toString(packet.type), data.size() - 4);

    transport.write(data);
}

} // namespace mctrl::rcon
