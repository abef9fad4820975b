// ============================================================================
// Consistency example
//
// Demonstrates:
// - Building a decision model from a query
// - Appending under an AppendCondition (optimistic concurrency)
// - A concurrent writer invalidating a stale decision
// ============================================================================
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "umadb.hpp"

#include "common/cli/minimal.hpp"


namespace {

// Counts the enrollments matching `query` and returns the position the
// decision was taken at
umadb::Error load_enrollments(umadb::Client& client, const umadb::Query& query,
                              std::size_t& enrolled, std::optional<umadb::Position>& seen) {
    std::vector<umadb::SequencedEvent> events;
    if (umadb::Error err = client.read_all(query, std::nullopt, false, std::nullopt, events); !err.ok()) {
        return err;
    }
    enrolled = 0;
    seen.reset();
    for (const auto& e : events) {
        if (e.event.event_type() == "StudentEnrolled") {
            ++enrolled;
        }
        seen = e.position;
    }
    if (!seen) {
        return client.head(seen);
    }
    return umadb::Error{};
}

umadb::Event enrollment(const std::string& course, const std::string& student) {
    return umadb::Event{"StudentEnrolled", std::string_view(student), {"course:" + course, "student:" + student}};
}

} // namespace


int main(int argc, char** argv) {
    using namespace umadb;

    const auto params = examples::cli::minimal::configure(argc, argv,
        "UmaDB consistency example\n"
        "Two writers race for the last seat of a course.\n"
    );

    Client client{params.to_config()};
    if (Error err = client.connect(); !err.ok()) {
        std::cerr << "[umadb] Failed to connect: " << err << "\n";
        return -1;
    }

    const std::string course = "c-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    const Query decision{{QueryItem{{}, {"course:" + course}}}};

    // -------------------------------------------------------------------------
    // Both writers take their decision on the same snapshot
    // -------------------------------------------------------------------------
    std::size_t enrolled = 0;
    std::optional<Position> seen;
    if (Error err = load_enrollments(client, decision, enrolled, seen); !err.ok()) {
        std::cerr << "[umadb] read failed: " << err << "\n";
        return -1;
    }
    std::cout << "[umadb] Course " << course << ": " << enrolled << " enrolled, decided at ";
    if (seen) std::cout << *seen << "\n"; else std::cout << "(empty store)\n";

    const AppendCondition condition{decision, seen};

    // -------------------------------------------------------------------------
    // Writer 1 wins
    // -------------------------------------------------------------------------
    Position position = 0;
    if (Error err = client.append({enrollment(course, "alice")}, condition, position); !err.ok()) {
        std::cerr << "[umadb] writer 1 failed: " << err << "\n";
        return -1;
    }
    std::cout << "[umadb] Writer 1 enrolled alice at position " << position << "\n";

    // -------------------------------------------------------------------------
    // Writer 2 uses the stale decision and is rejected
    // -------------------------------------------------------------------------
    const Error err = client.append({enrollment(course, "bob")}, condition, position);
    if (err.code == ErrorCode::Integrity) {
        std::cout << "[umadb] Writer 2 rejected as expected: " << err << "\n";
    } else if (err.ok()) {
        std::cerr << "[umadb] Writer 2 unexpectedly succeeded at " << position << "\n";
        return -1;
    } else {
        std::cerr << "[umadb] Writer 2 failed: " << err << "\n";
        return -1;
    }

    std::cout << "\n[umadb] Done.\n";
    return 0;
}
