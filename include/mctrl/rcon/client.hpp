#pragma once

#include "mctrl/rcon/transport.hpp"
#include "mctrl/utils/secret_string.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace mctrl::rcon {

/**
 * Per-connection request id generator
 *
 * Starts at 0 (the authentication id) and hands out 1, 2, ... INT32_MAX,
 * then wraps to 1. Never yields 0 or a negative id.
 */
class SequenceCounter {
public:
    explicit SequenceCounter(int32_t start = 0) : m_current(start) {}

    int32_t next();
    int32_t current() const { return m_current; }

private:
    int32_t m_current;
};

class Connected;
class Authenticated;

/*
 * Connection states
 *
 *   Disconnected --connect()--> Connected --authenticate()--> Authenticated
 *
 * Each transition consumes the previous state, so a command can only be
 * sent through an Authenticated value.
 */

/**
 * No socket yet
 */
class Disconnected {
public:
    /**
     * Open a TCP connection
     * @throws RconError Connect
     */
    Connected connect(Connector& connector) const;
};

/**
 * Live socket, not yet authenticated
 */
class Connected {
public:
    explicit Connected(std::unique_ptr<Transport> transport);

    Connected(Connected&&) noexcept = default;
    Connected& operator=(Connected&&) noexcept = default;

    /**
     * Send the password (request id 0) and wait for the verdict.
     * The socket is closed if authentication does not succeed.
     *
     * @throws RconError AuthFail if the server answers with id -1,
     *         IdMismatch for any other id than 0,
     *         InvalidPacketType if the answer is not a Command-type packet,
     *         Read / Write / Decode / PayloadTooBig
     */
    Authenticated authenticate(const utils::SecretString& password) &&;

    // Half-close and drop the socket
    bool disconnect();

private:
    std::unique_ptr<Transport> m_transport;
};

/**
 * Authenticated session with its own sequence counter
 */
class Authenticated {
public:
    Authenticated(Authenticated&&) noexcept = default;
    Authenticated& operator=(Authenticated&&) noexcept = default;

    /**
     * Run a command and return the server's reply. Replies that fill a
     * whole frame are reassembled from continuation frames.
     *
     * @throws RconError IdMismatch / InvalidPacketType / Read / Write /
     *         Decode / PayloadTooBig
     */
    std::string command(const std::string& text);

    // Half-close and drop the socket
    bool disconnect();

    bool isOpen() const { return m_transport != nullptr; }

    // Last id handed out by the sequence counter
    int32_t lastId() const { return m_sequence.current(); }

private:
    friend class Connected;
    explicit Authenticated(std::unique_ptr<Transport> transport);

    Transport& transport();

    std::unique_ptr<Transport> m_transport;
    SequenceCounter m_sequence;
};

} // namespace mctrl::rcon
