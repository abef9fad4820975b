#pragma once

#include <cstdlib>
#include <iostream>

// -----------------------------------------------------------------------------
// Minimal test assertion helper
// -----------------------------------------------------------------------------
#define TEST_CHECK(expr)                                                     \
    do {                                                                     \
        if (!(expr)) {                                                       \
            std::cerr << "[TEST FAILED] " << #expr                            \
                      << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::abort();                                                    \
        }                                                                    \
    } while (0)

// Checks an umadb::Error against an expected umadb::ErrorCode
#define TEST_CHECK_CODE(err, expected)                                       \
    do {                                                                     \
        const auto& test_err_ = (err);                                       \
        if (test_err_.code != (expected)) {                                  \
            std::cerr << "[TEST FAILED] " << #err << " is " << test_err_     \
                      << ", expected [" << ::umadb::to_string(expected)      \
                      << "] at " << __FILE__ << ":" << __LINE__ << std::endl;\
            std::abort();                                                    \
        }                                                                    \
    } while (0)
