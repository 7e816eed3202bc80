#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: MC_COMPILER_MSVC, MC_COMPILER_CLANG, MC_COMPILER_GCC, MC_COMPILER_POSIX

#if defined(_MSC_VER)
#define MC_COMPILER_MSVC
#elif defined(__clang__)
#define MC_COMPILER_CLANG
#elif defined(__GNUC__)
#define MC_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(MC_COMPILER_CLANG) || defined(MC_COMPILER_GCC)
#define MC_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: MC_ASSERT_ENABLED

// builds that don't go through our CMake get assertions unless NDEBUG says otherwise
#ifndef MC_ASSERT_ENABLED
#ifdef NDEBUG
#define MC_ASSERT_ENABLED 0
#else
#define MC_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// MC_FORCE_INLINE - Force function to be inlined
#define MC_FORCE_INLINE MC_IMPL_FORCE_INLINE

// MC_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: MC_COLD_FUNC void handle_error() { ... }
#define MC_COLD_FUNC MC_IMPL_COLD_FUNC

// MC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define MC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(MC_COMPILER_MSVC)

#define MC_IMPL_FORCE_INLINE __forceinline
#define MC_IMPL_COLD_FUNC

#elif defined(MC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define MC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define MC_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
