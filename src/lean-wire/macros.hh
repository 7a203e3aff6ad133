#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: LW_COMPILER_MSVC, LW_COMPILER_CLANG, LW_COMPILER_GCC, LW_COMPILER_MINGW, LW_COMPILER_POSIX

#if defined(_MSC_VER)
#define LW_COMPILER_MSVC
#elif defined(__clang__)
#define LW_COMPILER_CLANG
#elif defined(__GNUC__)
#define LW_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define LW_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(LW_COMPILER_CLANG) || defined(LW_COMPILER_GCC) || defined(LW_COMPILER_MINGW)
#define LW_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// Conditionally defined: LW_HAS_CPP_EXCEPTIONS
// From CMake: LW_DEBUG, LW_RELEASE, LW_RELWITHDEBINFO
// Always defined: LW_ASSERT_ENABLED (0 or 1)

#ifdef LW_COMPILER_MSVC
#ifdef _CPPUNWIND
#define LW_HAS_CPP_EXCEPTIONS
#endif
#elif defined(LW_COMPILER_CLANG)
#if __EXCEPTIONS && __has_feature(cxx_exceptions)
#define LW_HAS_CPP_EXCEPTIONS
#endif
#elif defined(LW_COMPILER_GCC)
#if __EXCEPTIONS
#define LW_HAS_CPP_EXCEPTIONS
#endif
#endif

// assertions are on unless this is a release build without LW_ENABLE_ASSERT_IN_RELEASE
#ifndef LW_ASSERT_ENABLED
#if defined(LW_RELEASE) && !defined(LW_ENABLE_ASSERT_IN_RELEASE)
#define LW_ASSERT_ENABLED 0
#else
#define LW_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: LW_OS_WINDOWS, LW_OS_LINUX, LW_OS_APPLE, LW_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define LW_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define LW_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define LW_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define LW_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// LW_FORCE_INLINE - Force function to be inlined
#define LW_FORCE_INLINE LW_IMPL_FORCE_INLINE

// LW_DONT_INLINE - Prevent function from being inlined
#define LW_DONT_INLINE LW_IMPL_DONT_INLINE

// LW_COLD_FUNC - Mark function as rarely executed (error paths, assertions, buffer growth)
// Usage: LW_COLD_FUNC void handle_error() { ... }
#define LW_COLD_FUNC LW_IMPL_COLD_FUNC

// LW_BUILTIN_UNREACHABLE - Mark code path as unreachable (UB if reached)
// Usage: default: LW_BUILTIN_UNREACHABLE;
#define LW_BUILTIN_UNREACHABLE LW_IMPL_BUILTIN_UNREACHABLE

// LW_MACRO_JOIN(a, b) - Concatenate two tokens at preprocessing time
// Note: Indirection ensures arguments are expanded before concatenation
#define LW_MACRO_JOIN(arg1, arg2) LW_IMPL_MACRO_JOIN(arg1, arg2)

// LW_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define LW_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(LW_COMPILER_MSVC)

#define LW_IMPL_FORCE_INLINE __forceinline
#define LW_IMPL_DONT_INLINE __declspec(noinline)

#define LW_IMPL_COLD_FUNC

#define LW_IMPL_BUILTIN_UNREACHABLE __assume(0)

#elif defined(LW_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define LW_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define LW_IMPL_DONT_INLINE __attribute__((noinline))

#define LW_IMPL_COLD_FUNC __attribute__((cold))

#define LW_IMPL_BUILTIN_UNREACHABLE __builtin_unreachable()

#else
#error "Unknown compiler"
#endif

#define LW_IMPL_MACRO_JOIN(arg1, arg2) arg1##arg2
