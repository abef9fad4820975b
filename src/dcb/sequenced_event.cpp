#include "umadb/dcb/sequenced_event.hpp"

#include <ostream>


namespace umadb::dcb {

std::ostream& operator<<(std::ostream& os, const SequencedEvent& e) {
    return os << "SequencedEvent(position=" << e.position << ", event=" << e.event << ")";
}

} // namespace umadb::dcb
