/*
===============================================================================
 dcb::AppendCondition - Evaluation Tests
===============================================================================

Scope:
------
Validate is_violated_by(), the client-side rendition of the check the store
performs atomically with a conditional append.

Covered:
C1 Absent `after` considers every stored event
C2 `after` is exclusive: an event exactly at `after` never violates
C3 Non-matching events never violate
C4 Universal query with `after` = optimistic lock on the whole log
C5 Equality and rendering

===============================================================================
*/

#include <iostream>
#include <sstream>

#include "umadb/dcb/append_condition.hpp"
#include "common/test_check.hpp"

using namespace umadb::dcb;


static const Query USER_1{{QueryItem{{"UserCreated"}, {"user:1"}}}};

static SequencedEvent user_created(Position p) {
    return SequencedEvent{Event{"UserCreated", "alice", {"user:1"}}, p};
}


void test_absent_after() {
    std::cout << "[TEST] C1 Absent after considers every event\n";

    const AppendCondition c{USER_1, std::nullopt};
    TEST_CHECK(is_violated_by(c, user_created(1)));
    TEST_CHECK(is_violated_by(c, user_created(1000)));

    std::cout << "[TEST] OK\n";
}


void test_after_is_exclusive() {
    std::cout << "[TEST] C2 after is exclusive\n";

    const AppendCondition c{USER_1, Position{5}};
    TEST_CHECK(!is_violated_by(c, user_created(4)));
    TEST_CHECK(!is_violated_by(c, user_created(5)));
    TEST_CHECK(is_violated_by(c, user_created(6)));

    std::cout << "[TEST] OK\n";
}


void test_non_matching() {
    std::cout << "[TEST] C3 Non-matching events never violate\n";

    const AppendCondition c{USER_1, std::nullopt};
    TEST_CHECK(!is_violated_by(c, SequencedEvent{Event{"UserCreated", "bob", {"user:2"}}, 7}));
    TEST_CHECK(!is_violated_by(c, SequencedEvent{Event{"UserDeleted", "", {"user:1"}}, 7}));

    std::cout << "[TEST] OK\n";
}


void test_universal_lock() {
    std::cout << "[TEST] C4 Universal query locks the whole log\n";

    const AppendCondition c{Query::all(), Position{3}};
    TEST_CHECK(!is_violated_by(c, SequencedEvent{Event{"Anything", "x"}, 3}));
    TEST_CHECK(is_violated_by(c, SequencedEvent{Event{"Anything", "x"}, 4}));

    std::cout << "[TEST] OK\n";
}


void test_equality_and_rendering() {
    std::cout << "[TEST] C5 Equality and rendering\n";

    const AppendCondition a{USER_1, Position{2}};
    const AppendCondition b{USER_1, Position{2}};
    const AppendCondition c{USER_1, std::nullopt};
    TEST_CHECK(a == b);
    TEST_CHECK(!(a == c));

    std::ostringstream os;
    os << c;
    TEST_CHECK(os.str() == "AppendCondition(fail_if_events_match=Query(QueryItem(types=[UserCreated], tags=[user:1])), after=none)");

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

int main() {
    test_absent_after();
    test_after_is_exclusive();
    test_non_matching();
    test_universal_lock();
    test_equality_and_rendering();

    std::cout << "\n[APPEND CONDITION TESTS PASSED]\n";
    return 0;
}
