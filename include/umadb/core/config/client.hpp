#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>


namespace umadb::core::config {

/*
===============================================================================
Client defaults
===============================================================================

  - DEFAULT_URL            local store on the conventional port
  - DEFAULT_BATCH_SIZE     events requested per read round trip
  - DEFAULT_CONNECT_TIMEOUT deadline for the initial channel connection
  - DEFAULT_REQUEST_TIMEOUT deadline for each unary call (head, append)

All defaults are compile-time constants so that no magic numbers are
scattered across the codebase.
===============================================================================
*/

inline constexpr std::string_view DEFAULT_URL = "http://127.0.0.1:50051";

inline constexpr std::uint32_t DEFAULT_BATCH_SIZE = 256;

inline constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{5'000};

// Zero disables the deadline
inline constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{30'000};

} // namespace umadb::core::config
