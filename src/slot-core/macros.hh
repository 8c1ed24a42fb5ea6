#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: SC_COMPILER_MSVC, SC_COMPILER_CLANG, SC_COMPILER_GCC, SC_COMPILER_POSIX

#if defined(_MSC_VER)
#define SC_COMPILER_MSVC
#elif defined(__clang__)
#define SC_COMPILER_CLANG
#elif defined(__GNUC__)
#define SC_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(SC_COMPILER_CLANG) || defined(SC_COMPILER_GCC)
#define SC_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: SC_OS_WINDOWS, SC_OS_LINUX, SC_OS_APPLE, SC_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define SC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define SC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define SC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define SC_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: SC_DEBUG, SC_RELEASE, SC_RELWITHDEBINFO, SC_ASSERT_ENABLED

#ifndef SC_ASSERT_ENABLED
#define SC_ASSERT_ENABLED 0
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// SC_FORCE_INLINE - Force function to be inlined
#define SC_FORCE_INLINE SC_IMPL_FORCE_INLINE

// SC_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: SC_COLD_FUNC void handle_error() { ... }
#define SC_COLD_FUNC SC_IMPL_COLD_FUNC

// SC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Usage: SC_UNUSED(result);
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define SC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(SC_COMPILER_MSVC)

#define SC_IMPL_FORCE_INLINE __forceinline
#define SC_IMPL_COLD_FUNC

#elif defined(SC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define SC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define SC_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
