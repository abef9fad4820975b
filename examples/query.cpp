// ============================================================================
// Query example
//
// Demonstrates:
// - Building a query from tags and event types (one query item)
// - Forward and backward reads, start position and limit
// - Consuming a lazy ReadStream event by event
// ============================================================================
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "umadb.hpp"

#include "common/cli/minimal.hpp"


int main(int argc, char** argv) {
    using namespace umadb;
    namespace cli = examples::cli;

    CLI::App app{"UmaDB query example\nPrints the events matching the given tags and types.\n"};
    cli::minimal::Params params{};
    cli::minimal::add_connection_options(app, params);

    std::vector<std::string> tags;
    std::vector<std::string> types;
    std::uint64_t start = 0;
    std::uint32_t limit = 0;
    bool backwards = false;
    app.add_option("-t,--tag", tags, "Tag every event must carry (repeatable)")->check(cli::tag_validator);
    app.add_option("--type", types, "Accepted event type (repeatable)");
    app.add_option("--start", start, "Inclusive start position (0 = default)");
    app.add_option("--limit", limit, "Maximum number of events (0 = unlimited)");
    app.add_flag("-b,--backwards", backwards, "Newest events first");
    cli::minimal::parse(app, argc, argv, params);
    params.dump("=== Runtime Parameters ===", std::cout);

    // -------------------------------------------------------------------------
    // Client setup
    // -------------------------------------------------------------------------
    Client client{params.to_config()};
    if (Error err = client.connect(); !err.ok()) {
        std::cerr << "[umadb] Failed to connect: " << err << "\n";
        return -1;
    }

    std::optional<Query> query;
    if (!tags.empty() || !types.empty()) {
        query = Query{{QueryItem{types, tags}}};
        std::cout << "[umadb] Query: " << *query << "\n";
    }

    // -------------------------------------------------------------------------
    // Stream the results
    // -------------------------------------------------------------------------
    ReadStream stream;
    const auto start_at = start ? std::optional<Position>(start) : std::nullopt;
    const auto max = limit ? std::optional<std::uint32_t>(limit) : std::nullopt;
    if (Error err = client.read(query, start_at, backwards, max, false, stream); !err.ok()) {
        std::cerr << "[umadb] read failed: " << err << "\n";
        return -1;
    }

    SequencedEvent e;
    while (stream.next(e)) {
        std::cout << " -> " << e << "\n";
    }
    if (!stream.error().ok()) {
        std::cerr << "[umadb] stream failed: " << stream.error() << "\n";
        return -1;
    }

    std::cout << "\n[umadb] " << stream.delivered() << " event(s)";
    if (stream.head()) {
        std::cout << ", store head " << *stream.head();
    }
    std::cout << "\n";
    return 0;
}
