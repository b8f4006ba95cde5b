#pragma once

#include <cmath>
#include <cstdlib>
#include <iostream>

// -----------------------------------------------------------------------------
// Test assertions
//
// A failed check prints the expression and its location, then aborts so the
// test executable exits non-zero.
// -----------------------------------------------------------------------------
namespace bandlink::test_detail {

[[noreturn]] inline void fail(const char* expr, const char* file, int line) {
    std::cerr << "[TEST FAILED] " << expr << " at " << file << ":" << line << std::endl;
    std::abort();
}

[[noreturn]] inline void fail_near(const char* expr, double actual, double expected, const char* file, int line) {
    std::cerr << "[TEST FAILED] " << expr << " (actual " << actual << ", expected " << expected
              << ") at " << file << ":" << line << std::endl;
    std::abort();
}

} // namespace bandlink::test_detail

#define TEST_CHECK(expr)                                                      \
    do {                                                                      \
        if (!(expr)) {                                                        \
            ::bandlink::test_detail::fail(#expr, __FILE__, __LINE__);         \
        }                                                                     \
    } while (0)

// Floating point equality within `eps`
#define TEST_CHECK_NEAR(actual, expected, eps)                                \
    do {                                                                      \
        const double bl_actual_ = static_cast<double>(actual);                \
        const double bl_expected_ = static_cast<double>(expected);            \
        if (!(std::fabs(bl_actual_ - bl_expected_) <= (eps))) {               \
            ::bandlink::test_detail::fail_near(#actual, bl_actual_,           \
                                               bl_expected_, __FILE__, __LINE__); \
        }                                                                     \
    } while (0)
