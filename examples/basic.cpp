// ============================================================================
// Basic example
//
// Demonstrates:
// - Connecting to an UmaDB store
// - Reading the head position
// - Appending a batch of events
// - Reading the batch back
// ============================================================================
#include <iostream>
#include <optional>
#include <vector>

#include "umadb.hpp"

#include "common/cli/minimal.hpp"


int main(int argc, char** argv) {
    using namespace umadb;

    const auto params = examples::cli::minimal::configure(argc, argv,
        "UmaDB basic example\n"
        "Appends two events and reads them back.\n"
    );
    params.dump("=== Runtime Parameters ===", std::cout);
    std::cout << "[umadb] Client v" << version_major << "." << version_minor << "." << version_patch << "\n";

    // -------------------------------------------------------------------------
    // Client setup
    // -------------------------------------------------------------------------
    Client client{params.to_config()};
    if (Error err = client.connect(); !err.ok()) {
        std::cerr << "[umadb] Failed to connect: " << err << "\n";
        return -1;
    }

    std::optional<Position> head;
    if (Error err = client.head(head); !err.ok()) {
        std::cerr << "[umadb] head failed: " << err << "\n";
        return -1;
    }
    std::cout << "[umadb] Head before append: ";
    if (head) std::cout << *head << "\n"; else std::cout << "(empty store)\n";

    // -------------------------------------------------------------------------
    // Append
    // -------------------------------------------------------------------------
    std::vector<Event> batch;
    batch.emplace_back("CourseRegistered", std::string_view(R"({"capacity":30})"), std::vector<std::string>{"course:c1"});
    batch.emplace_back("StudentRegistered", std::string_view(R"({"name":"ada"})"), std::vector<std::string>{"student:s1"});

    Position last = 0;
    if (Error err = client.append(std::move(batch), std::nullopt, last); !err.ok()) {
        std::cerr << "[umadb] append failed: " << err << "\n";
        return -1;
    }
    std::cout << "[umadb] Appended, last position = " << last << "\n";

    // -------------------------------------------------------------------------
    // Read back what was just written
    // -------------------------------------------------------------------------
    std::vector<SequencedEvent> events;
    const Position first = last - 1;
    if (Error err = client.read_all(std::nullopt, first, false, 2u, events); !err.ok()) {
        std::cerr << "[umadb] read failed: " << err << "\n";
        return -1;
    }
    for (const auto& e : events) {
        std::cout << " -> " << to_json(e) << "\n";
    }

    client.dump_telemetry(std::cout);
    std::cout << "\n[umadb] Done.\n";
    return 0;
}
