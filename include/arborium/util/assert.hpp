#ifndef ARBORIUM_ASSERT_HPP
#define ARBORIUM_ASSERT_HPP

#include "ulight/impl/assert.hpp"

// Violations are reported through the assertion handler of ulight.
#define ARBORIUM_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define ARBORIUM_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)
#define ARBORIUM_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)

#endif
