#include "mctrl/server/connection_manager.hpp"
#include "mctrl/rcon/error.hpp"
#include "mctrl/utils/logger.hpp"

namespace mctrl::server {

// =============================================================================
// Transport tracking
// =============================================================================

/**
 * Forwards to the connector's transport and keeps the manager's registry
 * pointing at it for as long as it lives, so abort() can cancel it.
 */
class ConnectionManager::TrackedTransport : public rcon::Transport {
public:
    TrackedTransport(std::unique_ptr<rcon::Transport> inner, ConnectionManager& manager)
        : m_inner(std::move(inner))
        , m_manager(manager)
    {
        m_manager.track(this);
    }

    ~TrackedTransport() override {
        m_manager.untrack(this);
    }

    void write(const std::vector<uint8_t>& data) override { m_inner->write(data); }
    std::vector<uint8_t> read(size_t size) override { return m_inner->read(size); }
    bool shutdown() override {
        // Not while abort() is cancelling the same socket
        std::lock_guard<std::mutex> lock(m_manager.m_transportMutex);
        return m_inner->shutdown();
    }

    void cancel() override { m_inner->cancel(); }
    std::string remoteAddress() const override { return m_inner->remoteAddress(); }

private:
    std::unique_ptr<rcon::Transport> m_inner;
    ConnectionManager& m_manager;
};

class ConnectionManager::TrackingConnector : public rcon::Connector {
public:
    explicit TrackingConnector(ConnectionManager& manager) : m_manager(manager) {}

    std::unique_ptr<rcon::Transport> connect() override {
        return std::make_unique<TrackedTransport>(m_manager.m_connector->connect(), m_manager);
    }

    std::string describe() const override { return m_manager.m_connector->describe(); }

private:
    ConnectionManager& m_manager;
};

void ConnectionManager::track(rcon::Transport* transport) {
    std::lock_guard<std::mutex> lock(m_transportMutex);
    m_liveTransport = transport;

    // abort() ran while this transport was being connected
    if (m_aborted) {
        transport->cancel();
    }
}

void ConnectionManager::untrack(rcon::Transport* transport) {
    std::lock_guard<std::mutex> lock(m_transportMutex);
    if (m_liveTransport == transport) {
        m_liveTransport = nullptr;
    }
}

void ConnectionManager::cancelInFlight() {
    std::lock_guard<std::mutex> lock(m_transportMutex);
    if (m_liveTransport) {
        LOG_WARN("Cancelling RCON request in progress on {}", m_connector->describe());
        m_liveTransport->cancel();
    }
}

// =============================================================================
// ConnectionManager
// =============================================================================

ConnectionManager::ConnectionManager(std::unique_ptr<rcon::Connector> connector,
                                     utils::SecretString password)
    : m_connector(std::move(connector))
    , m_tracking(std::make_unique<TrackingConnector>(*this))
    , m_password(std::move(password))
    , m_strand(asio::make_strand(m_io_context))
    , m_work(asio::make_work_guard(m_io_context))
    , m_running(true)
    , m_aborted(false)
    , m_connected(false)
{
    m_worker = std::thread([this]() {
        m_io_context.run();
    });

    LOG_DEBUG("Connection manager started for {}", m_connector->describe());
}

ConnectionManager::~ConnectionManager() {
    abort();
}

template<typename Job>
std::future<std::string> ConnectionManager::post(Job job) {
    auto promise = std::make_shared<std::promise<std::string>>();
    auto future = promise->get_future();

    std::lock_guard<std::mutex> lock(m_submitMutex);

    if (!m_running) {
        promise->set_exception(std::make_exception_ptr(ManagerStopped()));
        return future;
    }

    asio::post(m_strand, [this, promise, job = std::move(job)]() mutable {
        if (m_aborted) {
            promise->set_exception(std::make_exception_ptr(ManagerStopped()));
            return;
        }

        try {
            promise->set_value(job());
        }
        catch (...) {
            promise->set_exception(std::current_exception());
        }
    });

    return future;
}

std::future<std::string> ConnectionManager::submit(std::string command, bool disconnectAfter) {
    return post([this, command = std::move(command), disconnectAfter]() {
        return execute(command, disconnectAfter);
    });
}

std::future<std::string> ConnectionManager::connect() {
    return post([this]() {
        session();
        return std::string();
    });
}

std::string ConnectionManager::run(const std::string& command) {
    return submit(command).get();
}

void ConnectionManager::shutdown() {
    stop(false);
}

void ConnectionManager::abort() {
    stop(true);
}

void ConnectionManager::stop(bool abortInFlight) {
    {
        std::lock_guard<std::mutex> lock(m_submitMutex);
        m_running = false;
    }

    if (abortInFlight) {
        m_aborted = true;
        cancelInFlight();
    }

    // A second caller waits here until the first has joined the worker
    std::lock_guard<std::mutex> lock(m_stopMutex);
    if (m_stopped) {
        return;
    }

    // Queued requests still run (or fail fast once aborted); run() returns
    // once the queue is empty
    m_work.reset();
    if (m_worker.joinable()) {
        m_worker.join();
    }

    teardown("connection manager stopped");
    m_stopped = true;
    LOG_DEBUG("Connection manager for {} stopped", m_connector->describe());
}

rcon::Authenticated& ConnectionManager::session() {
    if (!m_session) {
        LOG_INFO("Connecting to RCON server {}", m_connector->describe());

        m_session.emplace(
            rcon::Disconnected().connect(*m_tracking).authenticate(m_password));
        m_connected = true;

        LOG_INFO("RCON session with {} established", m_connector->describe());
    }
    return *m_session;
}

std::string ConnectionManager::execute(const std::string& command, bool disconnectAfter) {
    uint64_t requestId = m_nextRequestId++;

    // Connect/authenticate failures leave nothing cached
    rcon::Authenticated& current = session();

    LOG_DEBUG("[Req:{}] Running command '{}'", requestId, command);

    try {
        std::string reply = current.command(command);

        if (disconnectAfter) {
            teardown("server is expected to exit");
        }

        LOG_DEBUG("[Req:{}] Completed, {} bytes", requestId, reply.size());
        return reply;
    }
    catch (const rcon::RconError& e) {
        LOG_WARN("[Req:{}] Command failed ({}): {}", requestId, rcon::kindName(e.kind()), e.what());
        teardown("command failed");
        throw;
    }
    catch (...) {
        teardown("command failed");
        throw;
    }
}

void ConnectionManager::teardown(const char* reason) {
    if (!m_session) {
        return;
    }

    // Best effort: the connection may already be broken
    if (!m_session->disconnect()) {
        LOG_DEBUG("Ignoring error while closing RCON session");
    }
    m_session.reset();
    m_connected = false;

    LOG_INFO("RCON session with {} closed: {}", m_connector->describe(), reason);
}

} // namespace mctrl::server
