/*
===============================================================================
 core::Session - Group C Read Tests
===============================================================================

Scope:
------
Validate finite reads: direction, bounds, limits, laziness and batching.

Covered:
C1 Forward read: ascending positions, query filtering
C2 Forward read from `start` (inclusive)
C3 Backward read: descending positions, bounded by `start`
C4 Limit caps delivered events (forward and backward)
C5 Limit 0 yields nothing and opens no call
C6 Limit enforced client-side when the store ignores it
C7 Laziness: one batch fetched per consumed batch
C8 Head reported alongside batches
C9 Policy rejections (subscribe + backwards, read_all + subscribe)
C10 Read on an empty store

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
using test::harness::tagged;

using Positions = std::vector<Position>;

// Store layout shared by most tests:
//   1 A {order:1}   2 B {order:2}   3 A {order:2}   4 C {order:1}
//   5 A {order:1}   6 B {order:1}   7 A {order:3}
static void seed_default(Harness& h) {
    h.store().seed({
        event("A", {"order:1"}),
        event("B", {"order:2"}),
        event("A", {"order:2"}),
        event("C", {"order:1"}),
        event("A", {"order:1"}),
        event("B", {"order:1"}),
        event("A", {"order:3"}),
    });
}


// ----------------------------------------------------------------------------
// C1 Forward read
// ----------------------------------------------------------------------------

void test_forward_read() {
    std::cout << "[TEST] C1 Forward read\n";

    Harness h;
    h.connect();
    seed_default(h);

    TEST_CHECK((h.positions(request()) == Positions{1, 2, 3, 4, 5, 6, 7}));
    TEST_CHECK((h.positions(request(Query::all())) == Positions{1, 2, 3, 4, 5, 6, 7}));
    TEST_CHECK((h.positions(request(test::harness::of_type("A"))) == Positions{1, 3, 5, 7}));
    TEST_CHECK((h.positions(request(tagged("order:1"))) == Positions{1, 4, 5, 6}));

    const Query a_or_b_order1{{QueryItem{{"A"}, {"order:2"}}, QueryItem{{"B"}, {"order:1"}}}};
    TEST_CHECK((h.positions(request(a_or_b_order1)) == Positions{3, 6}));

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// C2 Forward from start
// ----------------------------------------------------------------------------

void test_forward_from_start() {
    std::cout << "[TEST] C2 Forward read from start\n";

    Harness h;
    h.connect();
    seed_default(h);

    TEST_CHECK((h.positions(request(std::nullopt, Position{4})) == Positions{4, 5, 6, 7}));
    TEST_CHECK((h.positions(request(tagged("order:1"), Position{2})) == Positions{4, 5, 6}));
    TEST_CHECK(h.positions(request(std::nullopt, Position{8})).empty());

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// C3 Backward read
// ----------------------------------------------------------------------------

void test_backward_read() {
    std::cout << "[TEST] C3 Backward read\n";

    Harness h;
    h.connect();
    seed_default(h);

    TEST_CHECK((h.positions(request(std::nullopt, std::nullopt, true)) == Positions{7, 6, 5, 4, 3, 2, 1}));
    TEST_CHECK((h.positions(request(test::harness::of_type("A"), Position{5}, true)) == Positions{5, 3, 1}));
    TEST_CHECK((h.positions(request(tagged("order:1"), Position{3}, true)) == Positions{1}));

    // Every event is ≤ start, matches and positions strictly decrease
    std::vector<SequencedEvent> events;
    TEST_CHECK(h.session.read_all(request(tagged("order:1"), Position{6}, true), events).ok());
    TEST_CHECK(events.size() == 4);
    for (std::size_t i = 0; i < events.size(); ++i) {
        TEST_CHECK(events[i].position <= 6);
        TEST_CHECK(events[i].event.has_tag("order:1"));
        if (i > 0) {
            TEST_CHECK(events[i].position < events[i - 1].position);
        }
    }

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// C4 Limit
// ----------------------------------------------------------------------------

void test_limit() {
    std::cout << "[TEST] C4 Limit\n";

    Harness h;
    h.connect(2);
    seed_default(h);

    TEST_CHECK((h.positions(request(std::nullopt, std::nullopt, false, 3u)) == Positions{1, 2, 3}));
    TEST_CHECK((h.positions(request(std::nullopt, std::nullopt, true, 1u)) == Positions{7}));
    TEST_CHECK((h.positions(request(test::harness::of_type("A"), Position{2}, false, 2u)) == Positions{3, 5}));
    TEST_CHECK((h.positions(request(std::nullopt, std::nullopt, false, 100u)) == Positions{1, 2, 3, 4, 5, 6, 7}));

    // The stream terminates as exhausted, not cancelled, once the limit is hit
    StreamUnderTest stream = h.open(request(std::nullopt, std::nullopt, false, 1u));
    SequencedEvent e;
    TEST_CHECK(stream.next(e));
    TEST_CHECK(stream.done());
    TEST_CHECK(!stream.cancelled());
    TEST_CHECK(stream.error().ok());
    TEST_CHECK(!stream.next(e));
    TEST_CHECK(stream.delivered() == 1);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// C5 Limit 0
// ----------------------------------------------------------------------------

void test_limit_zero() {
    std::cout << "[TEST] C5 Limit 0\n";

    Harness h;
    h.connect();
    seed_default(h);

    StreamUnderTest stream = h.open(request(std::nullopt, std::nullopt, false, 0u));
    SequencedEvent e;
    TEST_CHECK(!stream.next(e));
    TEST_CHECK(stream.done());
    TEST_CHECK(stream.error().ok());
    TEST_CHECK(h.store().reads_opened() == 0);

    // Also for subscriptions
    StreamUnderTest live = h.open(request(std::nullopt, std::nullopt, false, 0u, true));
    TEST_CHECK(!live.next(e));
    TEST_CHECK(h.store().reads_opened() == 0);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// C6 Client-side limit
// ----------------------------------------------------------------------------

void test_limit_enforced_locally() {
    std::cout << "[TEST] C6 Limit enforced client-side\n";

    Harness h;
    h.connect(4);
    seed_default(h);
    h.state().ignore_limit = true;

    TEST_CHECK((h.positions(request(std::nullopt, std::nullopt, false, 2u)) == Positions{1, 2}));
    TEST_CHECK((h.positions(request(std::nullopt, std::nullopt, true, 3u)) == Positions{7, 6, 5}));

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// C7 Laziness
// ----------------------------------------------------------------------------

void test_laziness() {
    std::cout << "[TEST] C7 Laziness\n";

    Harness h;
    h.connect(3);
    seed_default(h);

    StreamUnderTest stream = h.open(request());

    // Opening a stream fetches nothing
    TEST_CHECK(h.store().reads_opened() == 1);
    TEST_CHECK(h.store().batches_served() == 0);

    SequencedEvent e;
    TEST_CHECK(stream.next(e) && e.position == 1);
    TEST_CHECK(h.store().batches_served() == 1);
    TEST_CHECK(stream.next(e) && e.position == 2);
    TEST_CHECK(stream.next(e) && e.position == 3);
    TEST_CHECK(h.store().batches_served() == 1);

    // Next batch requested only once the first one is consumed
    TEST_CHECK(stream.next(e) && e.position == 4);
    TEST_CHECK(h.store().batches_served() == 2);

    Positions rest;
    while (stream.next(e)) {
        rest.push_back(e.position);
    }
    TEST_CHECK((rest == Positions{5, 6, 7}));
    TEST_CHECK(h.store().batches_served() == 3);
    TEST_CHECK(stream.done());
    TEST_CHECK(stream.error().ok());
    TEST_CHECK(stream.delivered() == 7);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// C8 Head alongside batches
// ----------------------------------------------------------------------------

void test_head_reported() {
    std::cout << "[TEST] C8 Head reported with batches\n";

    Harness h;
    h.connect(2);
    seed_default(h);

    StreamUnderTest stream = h.open(request(test::harness::of_type("B")));
    TEST_CHECK(!stream.head().has_value());

    SequencedEvent e;
    TEST_CHECK(stream.next(e));
    TEST_CHECK(stream.head() == std::optional<Position>{7});

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// C9 Policy rejections
// ----------------------------------------------------------------------------

void test_policy_rejections() {
    std::cout << "[TEST] C9 Policy rejections\n";

    Harness h;
    h.connect();
    seed_default(h);

    StreamUnderTest stream;
    TEST_CHECK_CODE(h.session.read(request(std::nullopt, std::nullopt, true, std::nullopt, true), stream),
                    ErrorCode::Validation);

    std::vector<SequencedEvent> events;
    TEST_CHECK_CODE(h.session.read_all(request(std::nullopt, std::nullopt, false, std::nullopt, true), events),
                    ErrorCode::Validation);

    TEST_CHECK(h.store().reads_opened() == 0);
    TEST_CHECK(events.empty());

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// C10 Empty store
// ----------------------------------------------------------------------------

void test_empty_store() {
    std::cout << "[TEST] C10 Empty store\n";

    Harness h;
    h.connect();

    TEST_CHECK(h.positions(request()).empty());
    TEST_CHECK(h.positions(request(std::nullopt, std::nullopt, true)).empty());

    // A default-constructed stream is already exhausted
    StreamUnderTest idle;
    SequencedEvent e;
    TEST_CHECK(!idle.next(e));
    TEST_CHECK(idle.done());
    idle.cancel();

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_forward_read();
    test_forward_from_start();
    test_backward_read();
    test_limit();
    test_limit_zero();
    test_limit_enforced_locally();
    test_laziness();
    test_head_reported();
    test_policy_rejections();
    test_empty_store();

    std::cout << "\n[GROUP C - SESSION READ TESTS PASSED]\n";
    return 0;
}
