#pragma once

#include <fstream>
#include <iterator>
#include <string>

#include "umadb/error.hpp"


namespace umadb::core::transport {

// Loads a PEM bundle of trusted CA certificates. Failing to read the file is
// a local I/O failure, an empty file is a configuration mistake.
[[nodiscard]]
inline umadb::Error load_ca_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return umadb::Error{ErrorCode::Io, "cannot open CA certificate file '" + path + "'"};
    }
    std::string pem{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return umadb::Error{ErrorCode::Io, "failed to read CA certificate file '" + path + "'"};
    }
    if (pem.empty()) {
        return umadb::Error{ErrorCode::Validation, "CA certificate file '" + path + "' is empty"};
    }
    out = std::move(pem);
    return umadb::Error{};
}

} // namespace umadb::core::transport
