#include "mctrl/rcon/fragment.hpp"
#include "mctrl/rcon/error.hpp"
#include "mctrl/rcon/packet.hpp"
#include "mctrl/rcon/transport.hpp"
#include "mctrl/utils/logger.hpp"

namespace mctrl::rcon {

std::string readFragmented(Transport& transport, std::string head,
                           int32_t commandId, int32_t probeId) {
    LOG_DEBUG("Response to request {} filled a whole frame, probing with id {}",
              commandId, probeId);

    PacketCodec::writePacket(transport, Packet::probe(probeId));

    std::string result = std::move(head);
    size_t fragments = 1;

    for (;;) {
        Frame frame = PacketCodec::readFrame(transport);
        const Packet& packet = frame.packet;

        if (packet.id == commandId) {
            result += packet.payload;
            fragments++;
        }
        else if (packet.id == probeId) {
            if (packet.type == PacketType::Response && packet.payload == END_OF_FRAGMENTS) {
                break;
            }
            throw RconError::invalidPacketType(
                std::string(toString(PacketType::Response)) + " \"" + END_OF_FRAGMENTS + "\"",
                std::string(toString(packet.type)) + " \"" + packet.payload + "\"");
        }
        else {
            throw RconError::idMismatch(probeId, packet.id);
        }
    }

    LOG_DEBUG("Reassembled {} fragments ({} bytes) for request {}",
              fragments, result.size(), commandId);

    return result;
}

} // namespace mctrl::rcon
