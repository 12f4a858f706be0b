#include "mctrl/rcon/client.hpp"
#include "mctrl/rcon/error.hpp"
#include "mctrl/rcon/fragment.hpp"
#include "mctrl/rcon/packet.hpp"
#include "mctrl/utils/logger.hpp"

#include <limits>

namespace mctrl::rcon {

// Request id of the authentication exchange
static constexpr int32_t AUTH_REQUEST_ID = 0;

// Request id the server answers with when the password is wrong
static constexpr int32_t AUTH_DENIED_ID = -1;

int32_t SequenceCounter::next() {
    if (m_current == std::numeric_limits<int32_t>::max()) {
        m_current = 1;
    } else {
        m_current++;
    }
    return m_current;
}

// =============================================================================
// Disconnected
// =============================================================================

Connected Disconnected::connect(Connector& connector) const {
    return Connected(connector.connect());
}

// =============================================================================
// Connected
// =============================================================================

Connected::Connected(std::unique_ptr<Transport> transport)
    : m_transport(std::move(transport))
{
}

Authenticated Connected::authenticate(const utils::SecretString& password) && {
    // Owned locally so the socket is closed on every failure path
    std::unique_ptr<Transport> transport = std::move(m_transport);
    if (!transport) {
        throw RconError::write("connection is closed");
    }

    PacketCodec::writePacket(*transport,
        Packet::authentication(AUTH_REQUEST_ID, password.expose()));

    Frame frame = PacketCodec::readFrame(*transport);
    const Packet& packet = frame.packet;

    if (packet.type != PacketType::Command) {
        throw RconError::invalidPacketType(toString(PacketType::Command),
                                           toString(packet.type));
    }

    if (packet.id == AUTH_DENIED_ID) {
        LOG_WARN("Authentication rejected by {}", transport->remoteAddress());
        throw RconError::authFail();
    }

    if (packet.id != AUTH_REQUEST_ID) {
        throw RconError::idMismatch(AUTH_REQUEST_ID, packet.id);
    }

    LOG_DEBUG("Authenticated with {}", transport->remoteAddress());
    return Authenticated(std::move(transport));
}

bool Connected::disconnect() {
    if (!m_transport) {
        return true;
    }
    bool clean = m_transport->shutdown();
    m_transport.reset();
    return clean;
}

// =============================================================================
// Authenticated
// =============================================================================

Authenticated::Authenticated(std::unique_ptr<Transport> transport)
    : m_transport(std::move(transport))
    , m_sequence(AUTH_REQUEST_ID)
{
}

Transport& Authenticated::transport() {
    if (!m_transport) {
        throw RconError::write("connection is closed");
    }
    return *m_transport;
}

std::string Authenticated::command(const std::string& text) {
    Transport& stream = transport();

    int32_t id = m_sequence.next();
    PacketCodec::writePacket(stream, Packet::command(id, text));

    Frame frame = PacketCodec::readFrame(stream);
    Packet& packet = frame.packet;

    if (packet.id != id) {
        throw RconError::idMismatch(id, packet.id);
    }

    if (packet.type != PacketType::Response) {
        throw RconError::invalidPacketType(toString(PacketType::Response),
                                           toString(packet.type));
    }

    if (frame.isMaximal()) {
        int32_t probeId = m_sequence.next();
        return readFragmented(stream, std::move(packet.payload), id, probeId);
    }

    return std::move(packet.payload);
}

bool Authenticated::disconnect() {
    if (!m_transport) {
        return true;
    }
    bool clean = m_transport->shutdown();
    m_transport.reset();
    return clean;
}

} // namespace mctrl::rcon
