#pragma once

#include "mctrl/rcon/client.hpp"
#include "mctrl/rcon/transport.hpp"
#include "mctrl/utils/secret_string.hpp"

#include <asio.hpp>
#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

namespace mctrl::server {

/**
 * Raised through a request's future when the manager no longer accepts work
 */
class ManagerStopped : public std::runtime_error {
public:
    ManagerStopped() : std::runtime_error("The RCON connection manager has been stopped") {}
};

/**
 * Connection Manager
 *
 * Owns at most one authenticated RCON session and runs every request
 * against it on a single worker thread. Requests are posted through a
 * strand and executed strictly in arrival order, one complete exchange at
 * a time. The session is opened lazily, kept between requests and dropped
 * after any failure so the next request reconnects. Failures are never
 * retried here: they reach the caller through its future.
 */
class ConnectionManager {
public:
    ConnectionManager(std::unique_ptr<rcon::Connector> connector,
                      utils::SecretString password);

    // Calls abort()
    ~ConnectionManager();

    // Disable copy
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * Queue a command.
     * @param disconnectAfter close the session after a successful reply
     *                        (the server is expected to exit)
     * @return future holding the reply, or an RconError / ManagerStopped
     */
    std::future<std::string> submit(std::string command, bool disconnectAfter = false);

    /**
     * Queue a request that only opens the session if none is cached.
     * The future holds an empty string once the session is authenticated.
     */
    std::future<std::string> connect();

    /**
     * Blocking submit().get()
     * @throws RconError, ManagerStopped
     */
    std::string run(const std::string& command);

    /**
     * Stop accepting requests, finish the queued ones, join the worker and
     * close the session. Idempotent.
     */
    void shutdown();

    /**
     * Stop accepting requests and cancel the socket of the request in
     * progress, which fails with a Read / Write error. Queued requests that
     * have not started fail with ManagerStopped. Safe to call while another
     * thread is blocked in shutdown(). Idempotent.
     */
    void abort();

    bool isRunning() const { return m_running; }

    // True while an authenticated session is cached
    bool isConnected() const { return m_connected; }

    const rcon::Connector& connector() const { return *m_connector; }

private:
    class TrackedTransport;
    class TrackingConnector;

    template<typename Job>
    std::future<std::string> post(Job job);

    void stop(bool abortInFlight);

    // Worker thread only
    rcon::Authenticated& session();
    std::string execute(const std::string& command, bool disconnectAfter);
    void teardown(const char* reason);

    // Transport registry, any thread
    void track(rcon::Transport* transport);
    void untrack(rcon::Transport* transport);
    void cancelInFlight();

    std::unique_ptr<rcon::Connector> m_connector;

    // Transport currently handed out by the connector, if any.
    // Declared before the session, which unregisters on destruction.
    std::mutex m_transportMutex;
    rcon::Transport* m_liveTransport = nullptr;

    std::unique_ptr<TrackingConnector> m_tracking;
    utils::SecretString m_password;
    std::optional<rcon::Authenticated> m_session;

    asio::io_context m_io_context;
    asio::strand<asio::io_context::executor_type> m_strand;
    asio::executor_work_guard<asio::io_context::executor_type> m_work;
    std::thread m_worker;

    std::mutex m_submitMutex;
    std::mutex m_stopMutex;
    bool m_stopped = false;
    std::atomic<bool> m_running;
    std::atomic<bool> m_aborted;
    std::atomic<bool> m_connected;
    uint64_t m_nextRequestId = 1;
};

} // namespace mctrl::server
