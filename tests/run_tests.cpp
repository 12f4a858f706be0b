/**
 * mctrl - Test Runner
 *
 * Runs all unit tests for the RCON client. An optional argument runs only
 * the tests whose name contains it.
 */

#include "test_framework.hpp"

#include <spdlog/spdlog.h>

// Include test files
#include "test_packet.cpp"
#include "test_rcon_client.cpp"
#include "test_fragment.cpp"
#include "test_connection_manager.cpp"
#include "test_client.cpp"
#include "test_config.cpp"
#include "test_tcp_transport.cpp"

int main(int argc, char** argv) {
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║       mctrl - Unit Test Suite                                ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n\n";

    // Failure paths log warnings; keep the report readable
    spdlog::set_level(spdlog::level::err);

    std::string filter = argc > 1 ? argv[1] : "";
    return mctrl::test::TestRunner::getInstance().run(filter);
}
