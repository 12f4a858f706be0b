#include "mctrl/server/client.hpp"
#include "mctrl/server/connection_manager.hpp"
#include "mctrl/utils/logger.hpp"

#include <sstream>

namespace mctrl::server {

// =============================================================================
// ClientError
// =============================================================================

ClientError::ClientError(Kind kind, const std::string& message,
                         std::optional<rcon::RconError> cause)
    : std::runtime_error(message)
    , m_kind(kind)
    , m_cause(std::move(cause))
{
}

ClientError ClientError::fromRcon(const rcon::RconError& error) {
    using RK = rcon::RconError::Kind;

    switch (error.kind()) {
        case RK::Read:
        case RK::Write:
            return ClientError(Kind::BrokenConnection,
                std::string("Lost Minecraft server connection: ") + error.what(), error);
        case RK::Connect:
            return ClientError(Kind::Connect, error.what(), error);
        case RK::AuthFail:
            return ClientError(Kind::Authenticate, error.what(), error);
        default:
            return ClientError(Kind::Command,
                std::string("Failed to execute the command: ") + error.what(), error);
    }
}

ClientError ClientError::tickStats(const std::string& rawResponse) {
    ClientError error(Kind::TickStats, "Failed to parse server tick stats: " + rawResponse);
    error.m_rawResponse = rawResponse;
    return error;
}

// =============================================================================
// Client
// =============================================================================

Client::Client(const std::string& host, uint16_t port, utils::SecretString password)
    : Client(std::make_unique<rcon::TcpConnector>(host, port), std::move(password))
{
}

Client::Client(std::unique_ptr<rcon::Connector> connector, utils::SecretString password)
    : m_manager(std::make_shared<ConnectionManager>(std::move(connector), std::move(password)))
{
}

Client::Client(const Client& other)
    : m_manager(other.m_manager)
    , m_timeoutMs(other.m_timeoutMs.load())
{
}

Client& Client::operator=(const Client& other) {
    m_manager = other.m_manager;
    m_timeoutMs = other.m_timeoutMs.load();
    return *this;
}

std::string Client::await(std::future<std::string> reply) {
    auto timeout = requestTimeout();
    if (timeout.count() > 0 &&
        reply.wait_for(timeout) == std::future_status::timeout) {
        LOG_WARN("No reply from {} within {} ms", m_manager->connector().describe(), timeout.count());
        throw ClientError(ClientError::Kind::Timeout,
            "No reply from the Minecraft server within " +
            std::to_string(timeout.count()) + " ms");
    }

    try {
        return reply.get();
    }
    catch (const rcon::RconError& e) {
        throw ClientError::fromRcon(e);
    }
    catch (const ManagerStopped& e) {
        throw ClientError(ClientError::Kind::WorkerStopped, e.what());
    }
}

void Client::connect() {
    await(m_manager->connect());
}

std::string Client::run(const std::string& command) {
    return await(m_manager->submit(command));
}

void Client::saveAll() {
    await(m_manager->submit("save-all"));
}

void Client::stop() {
    await(m_manager->submit("stop", true));
}

std::vector<std::string> Client::list() {
    return parsePlayerList(await(m_manager->submit("list")));
}

TickStats Client::queryTick() {
    return parseTickStats(await(m_manager->submit("tick query")));
}

void Client::shutdown() {
    m_manager->shutdown();
}

void Client::abort() {
    m_manager->abort();
}

bool Client::isConnected() const {
    return m_manager->isConnected();
}

std::vector<std::string> Client::parsePlayerList(const std::string& response) {
    static const std::string HEADER_SEPARATOR = ": ";
    static const std::string NAME_SEPARATOR = ", ";

    std::vector<std::string> players;

    size_t header = response.find(HEADER_SEPARATOR);
    if (header == std::string::npos) {
        return players;
    }

    std::string names = response.substr(header + HEADER_SEPARATOR.size());
    if (names.empty()) {
        return players;
    }

    size_t start = 0;
    for (;;) {
        size_t end = names.find(NAME_SEPARATOR, start);
        if (end == std::string::npos) {
            players.push_back(names.substr(start));
            break;
        }
        players.push_back(names.substr(start, end - start));
        start = end + NAME_SEPARATOR.size();
    }

    return players;
}

TickStats Client::parseTickStats(const std::string& response) {
    // Example server output:
    // Target tick rate: 20.0 per second.
    // Average time per tick: 13.2ms (Target: 50.0ms)
    // Percentiles: P50: 13.0ms P95: 16.0ms P99: 18.6ms, sample: 100
    std::string stripped = response;
    for (char& c : stripped) {
        if (c == ':' || c == ',' || c == '(' || c == ')') {
            c = ' ';
        }
    }

    std::vector<std::string> timings;
    std::istringstream words(stripped);
    std::string word;
    while (words >> word) {
        if (word.size() >= 2 && word.compare(word.size() - 2, 2, "ms") == 0) {
            timings.push_back(word);
        }
    }

    if (timings.size() != 5) {
        throw ClientError::tickStats(response);
    }

    TickStats stats;
    stats.average = timings[0];
    stats.target = timings[1];
    stats.p50 = timings[2];
    stats.p95 = timings[3];
    stats.p99 = timings[4];
    return stats;
}

} // namespace mctrl::server
