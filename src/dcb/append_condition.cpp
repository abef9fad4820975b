#include "umadb/dcb/append_condition.hpp"

#include <ostream>


namespace umadb::dcb {

std::ostream& operator<<(std::ostream& os, const AppendCondition& c) {
    os << "AppendCondition(fail_if_events_match=" << c.fail_if_events_match << ", after=";
    if (c.after) {
        os << *c.after;
    } else {
        os << "none";
    }
    return os << ")";
}

} // namespace umadb::dcb
