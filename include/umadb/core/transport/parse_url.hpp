#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "umadb/core/transport/error.hpp"


namespace umadb::core::transport {

    inline constexpr std::string_view DEFAULT_PORT = "50051";

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure = false;  // true = https, false = http
        std::string host;     // IPv6 literals keep their brackets
        std::string port;

        // host:port, as expected by channel factories
        [[nodiscard]] std::string target() const { return host + ":" + port; }
    };


    // ---------------------------------------------------------------------
    // NOTE: Minimal URL parser supporting http:// and https://
    // The store is addressed by scheme, host and optional port; a path,
    // query or fragment is rejected. The port defaults to 50051.
    //
    // Example inputs:
    //   http://localhost:50051
    //   https://store.example.com
    //   http://[::1]:50051
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(const std::string& url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract scheme
        constexpr std::string_view http  = "http://";
        constexpr std::string_view https = "https://";
        std::size_t pos = 0;
        if (url.compare(0, http.size(), http) == 0) {
            out.secure = false;
            pos = http.size();
        }
        else if (url.compare(0, https.size(), https) == 0) {
            out.secure = true;
            pos = https.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // 2) Extract host[:port], allowing a single trailing slash
        std::string_view rest(url);
        rest.remove_prefix(pos);
        if (!rest.empty() && rest.back() == '/') {
            rest.remove_suffix(1);
        }
        if (rest.empty() || rest.find_first_of("/?#@") != std::string_view::npos) {
            return Error::InvalidUrl;
        }
        // 3) Split host and port
        std::size_t colon = std::string_view::npos;
        if (rest.front() == '[') {
            const std::size_t close = rest.find(']');
            if (close == std::string_view::npos || close == 1) {
                return Error::InvalidUrl;
            }
            out.host = std::string(rest.substr(0, close + 1));
            if (close + 1 < rest.size()) {
                if (rest[close + 1] != ':') {
                    return Error::InvalidUrl;
                }
                colon = close + 1;
            }
        } else {
            colon = rest.find(':');
            out.host = std::string(rest.substr(0, colon));
        }
        out.port = (colon == std::string_view::npos) ? std::string(DEFAULT_PORT)
                                                     : std::string(rest.substr(colon + 1));

        // Invariants check --------------------------------

        // Validate host
        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        // Validate port - must be numeric and in range
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace umadb::core::transport
