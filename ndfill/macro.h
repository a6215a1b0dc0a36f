#pragma once

#include <cassert>
#include <cstdlib>

#ifdef NDEBUG
#define NDFILL_DEBUG false
#else  // NDEBUG
#define NDFILL_DEBUG true
#endif  // NDEBUG

#if NDFILL_DEBUG
#define NDFILL_ASSERT assert
#else  // NDFILL_DEBUG
// This expression suppresses dead code and unused variable warnings of clang-tidy caused by "unused" __VA_ARGS__.
#define NDFILL_ASSERT(...) (void)([] { return false; }() && (__VA_ARGS__))
#endif  // NDFILL_DEBUG

#ifndef NDFILL_NEVER_REACH
#ifdef NDEBUG
#define NDFILL_NEVER_REACH() (std::abort())
#else  // NDEBUG
#define NDFILL_NEVER_REACH()                                          \
    do {                                                              \
        assert(false); /* NOLINT(cert-dcl03-c, misc-static-assert) */ \
        std::abort();                                                 \
    } while (false)
#endif  // NDEBUG
#endif  // NDFILL_NEVER_REACH
