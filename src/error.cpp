#include "umadb/error.hpp"

#include <ostream>


namespace umadb {

std::ostream& operator<<(std::ostream& os, const Error& e) {
    os << "[" << to_string(e.code) << "]";
    if (!e.message.empty()) {
        os << " " << e.message;
    }
    return os;
}

} // namespace umadb
