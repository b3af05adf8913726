#pragma once

#include "../Platform/Platform.hpp"

// Base macros and definitions that depend on platform detection

#define LANESCAN_NODISCARD [[nodiscard]]
#define LANESCAN_UNLIKELY [[unlikely]]

// Compiler-specific attributes
#if defined(LANESCAN_COMPILER_MSVC)
    #define LANESCAN_FORCEINLINE __forceinline
    #define LANESCAN_RESTRICT __restrict
#elif defined(LANESCAN_COMPILER_GCC) || defined(LANESCAN_COMPILER_CLANG)
    #define LANESCAN_FORCEINLINE inline __attribute__((always_inline))
    #define LANESCAN_RESTRICT __restrict__
#endif

// Runtime assertion macro
// Note: LANESCAN_BUILD_DEBUG is defined by CMake for Debug builds
#ifdef LANESCAN_BUILD_DEBUG
    #include <cassert>
    #define LANESCAN_ASSERT(condition, message) assert((condition) && (message))
#else
    #define LANESCAN_ASSERT(condition, message) ((void)0)
#endif
