#include "umadb/dcb/query.hpp"

#include <algorithm>
#include <ostream>


namespace umadb::dcb {

bool matches(const Event& event, const QueryItem& item) noexcept {
    if (!item.types.empty()) {
        const auto& type = event.event_type();
        if (std::find(item.types.begin(), item.types.end(), type) == item.types.end()) {
            return false;
        }
    }
    for (const auto& tag : item.tags) {
        if (!event.has_tag(tag)) {
            return false;
        }
    }
    return true;
}

bool matches(const Event& event, const Query& query) noexcept {
    if (query.items.empty()) {
        return true;
    }
    return std::any_of(query.items.begin(), query.items.end(),
                       [&](const QueryItem& item) { return matches(event, item); });
}

namespace {

void print_list(std::ostream& os, const std::vector<std::string>& values) {
    os << "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) os << ", ";
        os << values[i];
    }
    os << "]";
}

} // namespace

std::ostream& operator<<(std::ostream& os, const QueryItem& item) {
    os << "QueryItem(types=";
    print_list(os, item.types);
    os << ", tags=";
    print_list(os, item.tags);
    return os << ")";
}

std::ostream& operator<<(std::ostream& os, const Query& query) {
    if (query.is_universal()) {
        return os << "Query(*)";
    }
    os << "Query(";
    for (std::size_t i = 0; i < query.items.size(); ++i) {
        if (i > 0) os << " | ";
        os << query.items[i];
    }
    return os << ")";
}

} // namespace umadb::dcb
