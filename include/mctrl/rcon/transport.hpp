#pragma once

#include <asio.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mctrl::rcon {

using asio::ip::tcp;

/**
 * Byte stream to an RCON server
 *
 * Blocking, exact-length reads and writes. Implementations throw
 * RconError (Read / Write) on failure.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * Write the whole buffer
     */
    virtual void write(const std::vector<uint8_t>& data) = 0;

    /**
     * Read exactly `size` bytes
     */
    virtual std::vector<uint8_t> read(size_t size) = 0;

    /**
     * Half-close the stream (no more writes) and release it.
     * @return false if the socket reported an error while closing
     */
    virtual bool shutdown() = 0;

    /**
     * Abort the stream from another thread. A read() or write() blocked on
     * it returns with a Read / Write error; the owner still calls shutdown().
     */
    virtual void cancel() = 0;

    /**
     * Printable peer address for logging
     */
    virtual std::string remoteAddress() const = 0;
};

/**
 * Creates connected transports. The connection manager asks for a new one
 * every time it has to (re)connect.
 */
class Connector {
public:
    virtual ~Connector() = default;

    /**
     * Open a new stream
     * @throws RconError (Connect)
     */
    virtual std::unique_ptr<Transport> connect() = 0;

    virtual std::string describe() const = 0;
};

/**
 * TCP transport over a synchronous asio socket
 */
class TcpTransport : public Transport {
public:
    TcpTransport();
    ~TcpTransport() override;

    // Disable copy
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    /**
     * Resolve and connect
     * @throws RconError (Connect)
     */
    void connect(const std::string& host, uint16_t port);

    void write(const std::vector<uint8_t>& data) override;
    std::vector<uint8_t> read(size_t size) override;
    bool shutdown() override;
    void cancel() override;
    std::string remoteAddress() const override;

private:
    asio::io_context m_io_context;
    tcp::socket m_socket;
};

/**
 * Connector for a fixed host and port
 */
class TcpConnector : public Connector {
public:
    TcpConnector(std::string host, uint16_t port);

    std::unique_ptr<Transport> connect() override;
    std::string describe() const override;

private:
    std::string m_host;
    uint16_t m_port;
};

} // namespace mctrl::rcon
