/*
===============================================================================
 core::Session - Group B Head & Append Tests
===============================================================================

Scope:
------
Validate head() and append() semantics, including append conditions.

Covered:
B1 Empty store: head absent, first append at position 1, read back
B2 Batch append returns the last position (P + count)
B3 Condition with exclusive `after` on a store at head 5
B4 Condition violated by a concurrent writer leaves the store untouched
B5 Duplicate uuid rejected by the store and propagated as Integrity
B6 Empty batch rejected before any store call
B7 Bogus store position reported as Corruption
B8 Store failures propagated unchanged

These tests assume:
- MockStore transport
- No real network I/O

===============================================================================
*/

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "common/harness/session.hpp"

using Harness = umadb::core::test::harness::Session;
using test::harness::event;
using test::harness::request;


// ----------------------------------------------------------------------------
// B1 Empty store round trip
// ----------------------------------------------------------------------------

void test_empty_store_round_trip() {
    std::cout << "[TEST] B1 Empty store round trip\n";

    Harness h;
    h.connect();

    TEST_CHECK(!h.head().has_value());

    const Event created{"Created", "x", {"order:1"}};
    TEST_CHECK(h.append_ok({created}) == 1);
    TEST_CHECK(h.head() == std::optional<Position>{1});

    std::vector<SequencedEvent> events;
    TEST_CHECK(h.session.read_all(request(test::harness::of_type("Created")), events).ok());
    TEST_CHECK(events.size() == 1);
    TEST_CHECK(events[0].position == 1);
    TEST_CHECK(events[0].event == created);
    TEST_CHECK(events[0].event.data_as_string() == "x");
    TEST_CHECK(events[0].event.tags() == std::vector<std::string>{"order:1"});

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B2 Batch append
// ----------------------------------------------------------------------------

void test_batch_append_position() {
    std::cout << "[TEST] B2 Batch append returns last position\n";

    Harness h;
    h.connect();

    TEST_CHECK(h.append_ok({event("A"), event("B")}) == 2);

    const auto before = h.head();
    TEST_CHECK(before == std::optional<Position>{2});

    const Position last = h.append_ok({event("C"), event("D"), event("E")});
    TEST_CHECK(last == *before + 3);

    // The whole batch is visible, contiguous and in order
    const auto positions = h.positions(request());
    TEST_CHECK((positions == std::vector<Position>{1, 2, 3, 4, 5}));

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B3 Exclusive after on a store at head 5
// ----------------------------------------------------------------------------

void test_condition_exclusive_after() {
    std::cout << "[TEST] B3 Exclusive after\n";

    Harness h;
    h.connect();
    h.store().seed({
        event("Created",   {"order:1"}),
        event("Paid",      {"order:1"}),
        event("Cancelled", {"order:2"}),
        event("Shipped",   {"order:1"}),
        event("Cancelled", {"order:1"}),   // position 5
    });
    TEST_CHECK(h.head() == std::optional<Position>{5});

    const Query cancelled{{QueryItem{{"Cancelled"}, {"order:1"}}}};

    // Matching event sits exactly at `after`: not considered
    TEST_CHECK(h.append_ok({event("Refunded", {"order:1"})}, AppendCondition{cancelled, Position{5}}) == 6);

    // Same query with an earlier boundary sees position 5
    Position position = 0;
    const umadb::Error err = h.session.append({event("Refunded", {"order:1"})},
                                              AppendCondition{cancelled, Position{4}}, position);
    TEST_CHECK_CODE(err, ErrorCode::Integrity);
    TEST_CHECK(h.head() == std::optional<Position>{6});

    // No boundary considers every event
    TEST_CHECK_CODE(h.session.append({event("X")}, AppendCondition{cancelled, std::nullopt}, position),
                    ErrorCode::Integrity);

    // A query nothing matches never fails
    TEST_CHECK(h.append_ok({event("X")}, AppendCondition{test::harness::tagged("order:99"), std::nullopt}) == 7);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B4 Concurrent writer
// ----------------------------------------------------------------------------

void test_condition_violated_by_concurrent_writer() {
    std::cout << "[TEST] B4 Condition violated by concurrent writer\n";

    Harness h;
    h.connect();
    for (int i = 0; i < 5; ++i) {
        (void)h.append_ok({event("Created", {"order:" + std::to_string(i)})});
    }

    // Decision model read at head 5
    const auto decided_at = h.head();
    TEST_CHECK(decided_at == std::optional<Position>{5});
    const Query cancelled{{QueryItem{{"Cancelled"}, {"order:1"}}}};

    // Another writer cancels the order in the meantime
    TEST_CHECK(h.append_ok({event("Cancelled", {"order:1"})}) == 6);

    Position position = 0;
    const umadb::Error err = h.session.append(
        {event("Shipped", {"order:1"}), event("Invoiced", {"order:1"})},
        AppendCondition{cancelled, decided_at}, position);
    TEST_CHECK_CODE(err, ErrorCode::Integrity);
    TEST_CHECK(position == 0);

    // Atomic: nothing of the rejected batch was recorded
    TEST_CHECK(h.head() == std::optional<Position>{6});
    TEST_CHECK(h.positions(request(test::harness::of_type("Shipped"))).empty());

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B5 Duplicate uuid
// ----------------------------------------------------------------------------

void test_duplicate_uuid() {
    std::cout << "[TEST] B5 Duplicate uuid\n";

    Harness h;
    h.connect();

    Event first;
    TEST_CHECK(make_event("Created", "x", {"order:1"}, std::string("67e55044-10b1-426f-9247-bb680e5fe0c8"), first).ok());
    TEST_CHECK(h.append_ok({first}) == 1);

    Event again;
    TEST_CHECK(make_event("Created", "y", {}, std::string("67E55044-10B1-426F-9247-BB680E5FE0C8"), again).ok());

    Position position = 0;
    const umadb::Error err = h.session.append({again}, std::nullopt, position);
    TEST_CHECK_CODE(err, ErrorCode::Integrity);
    TEST_CHECK(err.message.find("67e55044-10b1-426f-9247-bb680e5fe0c8") != std::string::npos);
    TEST_CHECK(h.head() == std::optional<Position>{1});

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B6 Empty batch
// ----------------------------------------------------------------------------

void test_empty_batch() {
    std::cout << "[TEST] B6 Empty batch rejected\n";

    Harness h;
    h.connect();

    Position position = 0;
    TEST_CHECK_CODE(h.session.append({}, std::nullopt, position), ErrorCode::Validation);
    TEST_CHECK(!h.state().last_append.has_value());

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B7 Bogus store position
// ----------------------------------------------------------------------------

void test_bogus_position() {
    std::cout << "[TEST] B7 Bogus position reported as corruption\n";

    Harness h;
    h.connect();
    h.state().forced_append_position = Position{1};

    Position position = 0;
    TEST_CHECK_CODE(h.session.append({event("A"), event("B"), event("C")}, std::nullopt, position),
                    ErrorCode::Corruption);
    TEST_CHECK(position == 0);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B8 Store failures
// ----------------------------------------------------------------------------

void test_store_failures_propagated() {
    std::cout << "[TEST] B8 Store failures propagated\n";

    Harness h;
    h.connect();

    h.state().fail_next_head = umadb::Error{ErrorCode::Transport, "Unavailable: connection reset"};
    std::optional<Position> head{42};
    const umadb::Error head_err = h.session.head(head);
    TEST_CHECK_CODE(head_err, ErrorCode::Transport);
    TEST_CHECK(head_err.message == "Unavailable: connection reset");
    TEST_CHECK(head == std::optional<Position>{42});

    h.state().fail_next_append = umadb::Error{ErrorCode::Io, "disk full"};
    Position position = 0;
    const umadb::Error append_err = h.session.append({event("A")}, std::nullopt, position);
    TEST_CHECK_CODE(append_err, ErrorCode::Io);
    TEST_CHECK(append_err.message == "disk full");

    h.state().fail_next_append = umadb::Error{ErrorCode::Corruption, "segment checksum mismatch"};
    TEST_CHECK_CODE(h.session.append({event("A")}, std::nullopt, position), ErrorCode::Corruption);

    // One-shot failures: the store works again afterwards
    TEST_CHECK(h.append_ok({event("A")}) == 1);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_empty_store_round_trip();
    test_batch_append_position();
    test_condition_exclusive_after();
    test_condition_violated_by_concurrent_writer();
    test_duplicate_uuid();
    test_empty_batch();
    test_bogus_position();
    test_store_failures_propagated();

    std::cout << "\n[GROUP B - SESSION HEAD & APPEND TESTS PASSED]\n";
    return 0;
}
