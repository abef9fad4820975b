#include "umadb/dcb/uuid.hpp"

#include <ostream>


namespace umadb::dcb {

namespace {

constexpr int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Parses exactly 32 hex digits, optionally split by hyphens at the canonical
// 8-4-4-4-12 offsets.
bool parse_body(std::string_view s, Uuid::bytes_type& out) noexcept {
    const bool hyphenated = (s.size() == 36);
    if (!hyphenated && s.size() != 32) {
        return false;
    }
    std::size_t byte = 0;
    for (std::size_t i = 0; i < s.size();) {
        if (hyphenated && (i == 8 || i == 13 || i == 18 || i == 23)) {
            if (s[i] != '-') {
                return false;
            }
            ++i;
            continue;
        }
        if (i + 1 >= s.size()) {
            return false;
        }
        const int hi = hex_value(s[i]);
        const int lo = hex_value(s[i + 1]);
        if (hi < 0 || lo < 0 || byte >= out.size()) {
            return false;
        }
        out[byte++] = static_cast<std::uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return byte == out.size();
}

} // namespace


bool Uuid::parse(std::string_view text, Uuid& out) noexcept {
    constexpr std::string_view urn = "urn:uuid:";
    if (text.size() >= urn.size()) {
        bool has_urn = true;
        for (std::size_t i = 0; i < urn.size(); ++i) {
            const char c = text[i];
            const char lower = (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
            if (lower != urn[i]) {
                has_urn = false;
                break;
            }
        }
        if (has_urn) {
            text.remove_prefix(urn.size());
        }
    }
    if (text.size() == 38 && text.front() == '{' && text.back() == '}') {
        text = text.substr(1, 36);
    }

    bytes_type bytes{};
    if (!parse_body(text, bytes)) {
        return false;
    }
    out = Uuid{bytes};
    return true;
}

std::string Uuid::to_string() const {
    static constexpr char hex[] = "0123456789abcdef";
    std::string s;
    s.reserve(36);
    for (std::size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            s += '-';
        }
        s += hex[bytes_[i] >> 4];
        s += hex[bytes_[i] & 0x0F];
    }
    return s;
}

bool Uuid::is_nil() const noexcept {
    for (auto b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const Uuid& u) {
    return os << u.to_string();
}

} // namespace umadb::dcb
