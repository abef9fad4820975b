#include "umadb/dcb/json.hpp"

#include <algorithm>
#include <string_view>

#include "lcr/json.hpp"


namespace umadb::dcb {

namespace {

bool is_printable_text(const Bytes& data) noexcept {
    return std::all_of(data.begin(), data.end(), [](std::uint8_t b) {
        return (b >= 0x20 && b < 0x7F) || b == '\t' || b == '\r' || b == '\n';
    });
}

void append_event(std::string& out, const Event& e) {
    out += "{\"type\":";
    lcr::json::append_string(out, e.event_type());

    if (is_printable_text(e.data())) {
        out += ",\"data\":";
        const std::string_view text(reinterpret_cast<const char*>(e.data().data()), e.data().size());
        lcr::json::append_string(out, text);
    } else {
        static constexpr char hex[] = "0123456789abcdef";
        out += ",\"data_hex\":\"";
        for (std::uint8_t b : e.data()) {
            out += hex[b >> 4];
            out += hex[b & 0x0F];
        }
        out += '"';
    }

    out += ",\"tags\":[";
    for (std::size_t i = 0; i < e.tags().size(); ++i) {
        if (i > 0) out += ',';
        lcr::json::append_string(out, e.tags()[i]);
    }
    out += ']';

    if (e.uuid()) {
        out += ",\"uuid\":";
        lcr::json::append_string(out, e.uuid()->to_string());
    }
    out += '}';
}

} // namespace

std::string to_json(const Event& e) {
    std::string out;
    append_event(out, e);
    return out;
}

std::string to_json(const SequencedEvent& e) {
    std::string out = "{\"position\":";
    lcr::json::append(out, e.position);
    out += ",\"event\":";
    append_event(out, e.event);
    out += '}';
    return out;
}

} // namespace umadb::dcb
