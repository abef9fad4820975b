#pragma once

#include <cstdint>
#include <vector>

namespace umadb::dcb {

// Store-assigned, strictly increasing log position. The first event of an
// empty store is at position 1.
using Position = std::uint64_t;

// Opaque, binary-safe event payload
using Bytes = std::vector<std::uint8_t>;

} // namespace umadb::dcb
