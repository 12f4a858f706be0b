#include "mctrl/rcon/transport.hpp"
#include "mctrl/rcon/error.hpp"
#include "mctrl/utils/logger.hpp"

namespace mctrl::rcon {

// =============================================================================
// TcpTransport
// =============================================================================

TcpTransport::TcpTransport()
    : m_socket(m_io_context)
{
}

TcpTransport::~TcpTransport() {
    asio::error_code ec;
    m_socket.close(ec);
}

void TcpTransport::connect(const std::string& host, uint16_t port) {
    asio::error_code ec;

    tcp::resolver resolver(m_io_context);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw RconError::connect("failed to resolve " + host + ": " + ec.message());
    }

    asio::connect(m_socket, endpoints, ec);
    if (ec) {
        throw RconError::connect(host + ":" + std::to_string(port) + ": " + ec.message());
    }

    m_socket.set_option(tcp::no_delay(true), ec);
    if (ec) {
        LOG_DEBUG("Failed to set TCP_NODELAY on {}: {}", remoteAddress(), ec.message());
    }
}

void TcpTransport::write(const std::vector<uint8_t>& data) {
    asio::error_code ec;
    asio::write(m_socket, asio::buffer(data), ec);
    if (ec) {
        throw RconError::write(ec.message());
    }
}

std::vector<uint8_t> TcpTransport::read(size_t size) {
    std::vector<uint8_t> buffer(size);
    asio::error_code ec;
    asio::read(m_socket, asio::buffer(buffer), ec);
    if (ec) {
        throw RconError::read(ec.message());
    }
    return buffer;
}

bool TcpTransport::shutdown() {
    if (!m_socket.is_open()) {
        return true;
    }

    std::string address = remoteAddress();

    asio::error_code shutdownError;
    m_socket.shutdown(tcp::socket::shutdown_send, shutdownError);

    asio::error_code closeError;
    m_socket.close(closeError);

    if (shutdownError) {
        LOG_DEBUG("Shutdown of {} reported: {}", address, shutdownError.message());
    }
    return !shutdownError && !closeError;
}

void TcpTransport::cancel() {
    // Shutting down both directions wakes a thread blocked in recv()/send()
    asio::error_code ec;
    m_socket.shutdown(tcp::socket::shutdown_both, ec);
    if (ec) {
        LOG_DEBUG("Cancel of RCON socket reported: {}", ec.message());
    }
}

std::string TcpTransport::remoteAddress() const {
    asio::error_code ec;
    auto endpoint = m_socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

// =============================================================================
// TcpConnector
// =============================================================================

TcpConnector::TcpConnector(std::string host, uint16_t port)
    : m_host(std::move(host))
    , m_port(port)
{
}

std::unique_ptr<Transport> TcpConnector::connect() {
    auto transport = std::make_unique<TcpTransport>();
    transport->connect(m_host, m_port);

    LOG_DEBUG("Connected to {}", transport->remoteAddress());
    return transport;
}

std::string TcpConnector::describe() const {
    return m_host + ":" + std::to_string(m_port);
}

} // namespace mctrl::rcon
