#pragma once

/** \file compiler.hpp
 *  \brief Cross-platform compiler attributes and hints used by the scoring kernels.
 *
 * Key features:
 * - Function attributes (inline, hot, cold, per-function ISA targets)
 * - Branch prediction hints
 * - Restrict and prefetch helpers
 * - Architecture detection
 */

// Compiler detection
#if defined(_MSC_VER)
    #define COLSCORE_COMPILER_MSVC 1
#elif defined(__clang__)
    #define COLSCORE_COMPILER_CLANG 1
#elif defined(__GNUC__)
    #define COLSCORE_COMPILER_GCC 1
#else
    #define COLSCORE_COMPILER_UNKNOWN 1
#endif

// Function inlining hints
#ifdef COLSCORE_COMPILER_MSVC
    #define COLSCORE_ALWAYS_INLINE __forceinline
#elif defined(COLSCORE_COMPILER_GCC) || defined(COLSCORE_COMPILER_CLANG)
    #define COLSCORE_ALWAYS_INLINE __attribute__((always_inline)) inline
#else
    #define COLSCORE_ALWAYS_INLINE inline
#endif

// Hot/cold path hints
#if defined(COLSCORE_COMPILER_GCC) || defined(COLSCORE_COMPILER_CLANG)
    #define COLSCORE_HOT __attribute__((hot))
    #define COLSCORE_COLD __attribute__((cold))
#else
    #define COLSCORE_HOT
    #define COLSCORE_COLD
#endif

// Branch prediction hints
#if defined(COLSCORE_COMPILER_GCC) || defined(COLSCORE_COMPILER_CLANG)
    #define COLSCORE_LIKELY(x) __builtin_expect(!!(x), 1)
    #define COLSCORE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define COLSCORE_LIKELY(x) (x)
    #define COLSCORE_UNLIKELY(x) (x)
#endif

// Cache line size (typical)
#ifndef COLSCORE_CACHE_LINE_SIZE
    #define COLSCORE_CACHE_LINE_SIZE 64
#endif

// Restrict pointer aliasing
#ifdef COLSCORE_COMPILER_MSVC
    #define COLSCORE_RESTRICT __restrict
#elif defined(COLSCORE_COMPILER_GCC) || defined(COLSCORE_COMPILER_CLANG)
    #define COLSCORE_RESTRICT __restrict__
#else
    #define COLSCORE_RESTRICT
#endif

// Prefetch for reading, high temporal locality
#ifdef COLSCORE_COMPILER_MSVC
    #include <intrin.h>
    #define COLSCORE_PREFETCH(addr) \
        _mm_prefetch(reinterpret_cast<const char*>(addr), _MM_HINT_T0)
#elif defined(COLSCORE_COMPILER_GCC) || defined(COLSCORE_COMPILER_CLANG)
    #define COLSCORE_PREFETCH(addr) __builtin_prefetch((addr), 0, 3)
#else
    #define COLSCORE_PREFETCH(addr) ((void)0)
#endif

// Architecture detection
#if defined(_M_X64) || defined(__x86_64__) || defined(_M_AMD64)
    #define COLSCORE_ARCH_X64 1
#elif defined(_M_ARM64) || defined(__aarch64__)
    #define COLSCORE_ARCH_ARM64 1
#else
    #define COLSCORE_ARCH_UNKNOWN 1
#endif

// Per-function ISA targets so wide kernels can live in a baseline-compiled binary
// and be chosen at runtime after a CPUID probe.
#if defined(COLSCORE_ARCH_X64) && (defined(COLSCORE_COMPILER_GCC) || defined(COLSCORE_COMPILER_CLANG))
    #define COLSCORE_TARGET_AVX2 __attribute__((target("avx2,fma")))
#else
    #define COLSCORE_TARGET_AVX2
#endif
