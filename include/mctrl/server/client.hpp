#pragma once

#include "mctrl/rcon/error.hpp"
#include "mctrl/rcon/transport.hpp"
#include "mctrl/utils/secret_string.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mctrl::server {

class ConnectionManager;

/**
 * Error reported by the Client operations
 *
 * Wraps the RconError that caused it, when there is one.
 */
class ClientError : public std::runtime_error {
public:
    enum class Kind {
        Connect,            // could not reach the server
        Authenticate,       // password rejected
        Command,            // protocol failure while running the command
        BrokenConnection,   // read/write failed; re-issuing the command reconnects
        TickStats,          // "tick query" output could not be parsed
        Timeout,            // no reply within the configured request timeout
        WorkerStopped,      // client has been shut down
    };

    ClientError(Kind kind, const std::string& message,
                std::optional<rcon::RconError> cause = std::nullopt);

    // Map a protocol error to the category callers act on
    static ClientError fromRcon(const rcon::RconError& error);

    static ClientError tickStats(const std::string& rawResponse);

    Kind kind() const { return m_kind; }
    const std::optional<rcon::RconError>& cause() const { return m_cause; }

    // Unparsed server output for TickStats errors
    const std::string& rawResponse() const { return m_rawResponse; }

private:
    Kind m_kind;
    std::optional<rcon::RconError> m_cause;
    std::string m_rawResponse;
};

/**
 * Server tick timings, as printed by the server (e.g. "13.2ms")
 */
struct TickStats {
    std::string average;
    std::string target;
    std::string p50;
    std::string p95;
    std::string p99;
};

/**
 * RCON Client
 *
 * Typed operations on a Minecraft server. Cheap to copy; copies share the
 * same connection manager, and every method may be called from any thread.
 * Destroying the last copy aborts the manager.
 */
class Client {
public:
    Client(const std::string& host, uint16_t port, utils::SecretString password);
    Client(std::unique_ptr<rcon::Connector> connector, utils::SecretString password);

    Client(const Client& other);
    Client& operator=(const Client& other);

    /**
     * Limit how long a caller waits for its reply. Zero waits forever.
     * A timed-out request is not cancelled and still runs on the worker;
     * abort() cancels it. Each copy of a Client has its own timeout.
     */
    void setRequestTimeout(std::chrono::milliseconds timeout) { m_timeoutMs = timeout.count(); }
    std::chrono::milliseconds requestTimeout() const {
        return std::chrono::milliseconds(m_timeoutMs.load());
    }

    /**
     * Open and authenticate the session now instead of on the first command
     */
    void connect();

    /**
     * Run an arbitrary command and return the raw reply
     */
    std::string run(const std::string& command);

    // "save-all"
    void saveAll();

    // "stop", then close the session
    void stop();

    // "list"
    std::vector<std::string> list();

    // "tick query"
    TickStats queryTick();

    /**
     * Stop the worker after the queued requests. Further calls fail with
     * WorkerStopped.
     */
    void shutdown();

    /**
     * Stop the worker without waiting for a stalled server: the request in
     * progress fails with BrokenConnection, queued ones with WorkerStopped.
     */
    void abort();

    bool isConnected() const;

    /**
     * Parse "There are N of a max of M players online: a, b"
     */
    static std::vector<std::string> parsePlayerList(const std::string& response);

    /**
     * Pick the five "ms" timings out of the "tick query" output
     * @throws ClientError TickStats
     */
    static TickStats parseTickStats(const std::string& response);

private:
    std::string await(std::future<std::string> reply);

    std::shared_ptr<ConnectionManager> m_manager;
    std::atomic<int64_t> m_timeoutMs{0};
};

} // namespace mctrl::server
