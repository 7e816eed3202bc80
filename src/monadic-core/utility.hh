#pragma once

#include <monadic-core/fwd.hh>
#include <monadic-core/macros.hh>

#include <type_traits>

// =========================================================================================================
// Utility functions and building blocks shared by the sum types
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//
// In-place construction:
//   placement_new               - tag for our own placement new (no <new> needed)
//   storage_for<T>              - uninitialized, properly aligned storage for a single T
//

namespace mc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   auto opt2 = mc::move(opt1);  // opt1 is empty afterwards
template <class T>
[[nodiscard]] MC_FORCE_INLINE constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

/// Perfect forwarding for template arguments
/// Usage:
///   template <class F>
///   auto call(F&& f) { return mc::forward<F>(f)(); }
template <class T>
[[nodiscard]] MC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] MC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

// =========================================================================================================
// In-place construction
// =========================================================================================================

/// Tag selecting the placement new overload below
/// Usage:
///   new (mc::placement_new, &_storage.value) T(mc::forward<U>(value));
struct placement_new_t
{
};
constexpr placement_new_t placement_new = {};

/// Uninitialized storage with size and alignment of T
/// The value member is neither constructed nor destroyed by the union itself,
/// the owner decides when it is alive.
/// Trivially copyable and destructible whenever T is, so owners can default their special members.
template <class T>
union storage_for
{
    T value;

    storage_for() {}

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

} // namespace mc

// =========================================================================================================
// Implementation
// =========================================================================================================

inline void* operator new(std::size_t, mc::placement_new_t, void* buffer) noexcept { return buffer; }
inline void operator delete(void*, mc::placement_new_t, void*) noexcept {}
