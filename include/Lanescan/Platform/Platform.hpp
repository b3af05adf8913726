#pragma once

// Compiler Detection
#if defined(_MSC_VER)
    #define LANESCAN_COMPILER_MSVC 1
#elif defined(__clang__)
    #define LANESCAN_COMPILER_CLANG 1
#elif defined(__GNUC__) || defined(__GNUG__)
    #define LANESCAN_COMPILER_GCC 1
#else
    #error "Unknown compiler"
#endif

// Architecture Detection
#if defined(__x86_64__) || defined(_M_X64) || defined(__amd64__)
    #define LANESCAN_ARCH_X64 1
#elif defined(__i386__) || defined(_M_IX86)
    #define LANESCAN_ARCH_X86 1
#elif defined(__aarch64__) || defined(_M_ARM64)
    #define LANESCAN_ARCH_ARM64 1
#elif defined(__arm__) || defined(_M_ARM)
    #define LANESCAN_ARCH_ARM32 1
#endif

// C++ Standard Detection
#if defined(_MSVC_LANG)
    #define LANESCAN_CPLUSPLUS _MSVC_LANG
#else
    #define LANESCAN_CPLUSPLUS __cplusplus
#endif

#if LANESCAN_CPLUSPLUS < 202002L
    #error "Requires C++20 or later"
#endif

// SIMD Capabilities Detection
#if defined(LANESCAN_ARCH_X64) || defined(LANESCAN_ARCH_X86)
    #if defined(__SSE2__) || defined(_M_X64) || (defined(_M_IX86_FP) && _M_IX86_FP >= 2)
        #define LANESCAN_HAS_SSE2 1
    #endif
    #ifdef __AVX2__
        #define LANESCAN_HAS_AVX2 1
    #endif
    #if defined(__AVX512F__) && defined(__AVX512BW__)
        #define LANESCAN_HAS_AVX512BW 1  // Byte and Word operations
    #endif
#elif defined(LANESCAN_ARCH_ARM64) || (defined(LANESCAN_ARCH_ARM32) && defined(__ARM_NEON))
    #define LANESCAN_HAS_NEON 1
#endif
