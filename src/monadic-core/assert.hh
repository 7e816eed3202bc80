#pragma once

// Lean header, safe to include from every container header.
#include <monadic-core/macros.hh>
#include <monadic-core/source_location.hh>

// =========================================================================================================
// MC_ASSERT - Runtime assertion with string literal message
//
// Checks a precondition or invariant and, on failure, reports it through the assertion handler
// stack (see <monadic-core/assert-handler.hh>) and aborts unless a handler throws.
//
// Active in Debug and RelWithDebInfo builds.
// Stripped in Release builds unless MC_ENABLE_ASSERT_IN_RELEASE is set in CMake.
//
// Error handling strategy of this library:
//   - Assertions      -> programmer errors (value() on an empty optional, error() on a success)
//   - Exceptions      -> only ever raised by caller-supplied callbacks, never by the containers
//   - result<T, E>    -> expected business failures
//   - optional<T>     -> absence, which is not an error at all
//
// Never assert on user input or external conditions.
//
// Usage:
//   MC_ASSERT(has_value(), "attempted to access value of empty optional");
//
#define MC_ASSERT(cond, msg) MC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// MC_ASSERT_ALWAYS - Always-active assertion
//
// Like MC_ASSERT but kept in every build configuration.
//
#define MC_ASSERT_ALWAYS(cond, msg) MC_IMPL_ASSERT_ALWAYS(cond, msg)


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace mc::impl
{
// Reports a failed assertion to the topmost handler, or to stderr if none is installed.
// Returns only if no handler threw, the caller aborts afterwards.
MC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, mc::source_location location);

[[noreturn]] void perform_abort() noexcept;
} // namespace mc::impl

#define MC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::mc::impl::handle_assert_failure(#cond, msg, ::mc::source_location::current()); \
            ::mc::impl::perform_abort();                                                     \
        }                                                                                    \
    } while (false)

#if MC_ASSERT_ENABLED

#define MC_IMPL_ASSERT(cond, msg) MC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the expressions still have to compile
#define MC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        MC_UNUSED(cond);          \
        MC_UNUSED(msg);           \
    } while (false)

#endif
