/*
===============================================================================
 umadb::Client - Public API Tests
===============================================================================

Scope:
------
Validate the public Client / ReadStream surface without a running store.

Covered:
K1 Default client_config matches the core defaults
K2 Zero batch size rejected as Validation
K3 Unsupported URL scheme rejected as Validation
K4 Unreadable CA file reported as Io
K5 head, append and read before connect fail with Transport
K6 Default ReadStream is exhausted and empty

These tests assume:
- No store listening; every case fails before a channel is created

===============================================================================
*/

#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "umadb.hpp"
#include "common/test_check.hpp"

using umadb::Client;
using umadb::ErrorCode;
using umadb::ReadStream;
using umadb::client_config;
namespace config = umadb::core::config;
namespace fs = std::filesystem;


// ----------------------------------------------------------------------------
// K1 Defaults
// ----------------------------------------------------------------------------

void test_default_config() {
    std::cout << "[TEST] K1 Default config\n";

    const client_config cfg;
    TEST_CHECK(cfg.url == config::DEFAULT_URL);
    TEST_CHECK(!cfg.ca_path.has_value());
    TEST_CHECK(cfg.batch_size == config::DEFAULT_BATCH_SIZE);
    TEST_CHECK(cfg.connect_timeout == config::DEFAULT_CONNECT_TIMEOUT);
    TEST_CHECK(cfg.request_timeout == config::DEFAULT_REQUEST_TIMEOUT);

    Client by_url("https://store.example.com:7777");
    TEST_CHECK(by_url.config().url == "https://store.example.com:7777");
    TEST_CHECK(by_url.config().batch_size == config::DEFAULT_BATCH_SIZE);
    TEST_CHECK(!by_url.is_connected());

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// K2 Zero batch size
// ----------------------------------------------------------------------------

void test_zero_batch_size() {
    std::cout << "[TEST] K2 Zero batch size\n";

    client_config cfg;
    cfg.batch_size = 0;
    Client client(cfg);

    TEST_CHECK_CODE(client.connect(), ErrorCode::Validation);
    TEST_CHECK(!client.is_connected());

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// K3 Unsupported scheme
// ----------------------------------------------------------------------------

void test_unsupported_scheme() {
    std::cout << "[TEST] K3 Unsupported scheme\n";

    Client client(std::string("ws://x"));

    TEST_CHECK_CODE(client.connect(), ErrorCode::Validation);
    TEST_CHECK(!client.is_connected());

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// K4 Unreadable CA file
// ----------------------------------------------------------------------------

void test_unreadable_ca_file() {
    std::cout << "[TEST] K4 Unreadable CA file\n";

    const fs::path missing = fs::temp_directory_path() / "umadb_test_client_missing_ca.pem";
    std::error_code ec;
    fs::remove(missing, ec);

    client_config cfg;
    cfg.ca_path = missing.string();
    Client client(cfg);

    TEST_CHECK_CODE(client.connect(), ErrorCode::Io);
    TEST_CHECK(!client.is_connected());

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// K5 Operations before connect
// ----------------------------------------------------------------------------

void test_operations_before_connect() {
    std::cout << "[TEST] K5 Operations before connect\n";

    Client client;

    std::optional<umadb::dcb::Position> head;
    TEST_CHECK_CODE(client.head(head), ErrorCode::Transport);

    std::vector<umadb::dcb::Event> events;
    events.emplace_back("Registered", std::string_view("x"), std::vector<std::string>{"user:1"});
    umadb::dcb::Position position = 0;
    TEST_CHECK_CODE(client.append(std::move(events), std::nullopt, position), ErrorCode::Transport);

    ReadStream stream;
    TEST_CHECK_CODE(client.read(std::nullopt, std::nullopt, false, std::nullopt, false, stream),
                    ErrorCode::Transport);
    TEST_CHECK(stream.done());

    std::vector<umadb::dcb::SequencedEvent> all;
    TEST_CHECK_CODE(client.read_all(std::nullopt, std::nullopt, false, std::nullopt, all),
                    ErrorCode::Transport);
    TEST_CHECK(all.empty());

    // Counters render without a connection
    std::ostringstream os;
    client.dump_telemetry(os);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// K6 Default ReadStream
// ----------------------------------------------------------------------------

void test_default_read_stream() {
    std::cout << "[TEST] K6 Default ReadStream\n";

    ReadStream stream;
    TEST_CHECK(stream.done());
    TEST_CHECK(!stream.cancelled());
    TEST_CHECK(stream.error().ok());
    TEST_CHECK(!stream.head().has_value());
    TEST_CHECK(stream.delivered() == 0);

    umadb::dcb::SequencedEvent e;
    TEST_CHECK(!stream.next(e));

    // No-op on an empty stream
    stream.cancel();
    TEST_CHECK(stream.done());

    ReadStream moved(std::move(stream));
    TEST_CHECK(moved.done());
    TEST_CHECK(!moved.next(e));

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_default_config();
    test_zero_batch_size();
    test_unsupported_scheme();
    test_unreadable_ca_file();
    test_operations_before_connect();
    test_default_read_stream();

    std::cout << "\n[CLIENT API TESTS PASSED]\n";
    return 0;
}
