#pragma once

#include <cstdint>
#include <string>

namespace mctrl::rcon {

class Transport;

/**
 * Drain a fragmented response
 *
 * Called after a response frame of exactly MAX_PACKET_SIZE bytes. The
 * protocol has no continuation flag, so an empty Response-type probe with
 * `probeId` is sent and every frame carrying `commandId` is appended to
 * `head` until the server answers the probe with "Unknown request 0".
 *
 * @param head       payload of the first (maximal) frame
 * @param commandId  id of the command being answered
 * @param probeId    fresh id for the probe packet
 * @return the concatenated payloads in receipt order
 * @throws RconError InvalidPacketType if the probe is answered with anything
 *         but the end marker, IdMismatch for a frame with a foreign id,
 *         Read / Write / Decode
 */
std::string readFragmented(Transport& transport, std::string head,
                           int32_t commandId, int32_t probeId);

} // namespace mctrl::rcon
