#pragma once

#include <monadic-core/assert.hh>
#include <monadic-core/fwd.hh>
#include <monadic-core/utility.hh>

#include <optional> // only for from_nullable interop
#include <string>   // only for from_nullable on C strings
#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Construct as mc::nullopt to explicitly assign or compare against empty optionals.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct mc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace mc
{
/// The canonical instance of nullopt_t.
/// Usage: optional<int> opt = nullopt; or if (opt == nullopt).
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};

namespace impl
{
template <class T>
constexpr bool is_optional = false;
template <class T>
constexpr bool is_optional<optional<T>> = true;

template <class C>
constexpr bool is_char_type = std::is_same_v<C, char> || std::is_same_v<C, wchar_t> || std::is_same_v<C, char8_t>
                              || std::is_same_v<C, char16_t> || std::is_same_v<C, char32_t>;

// char const* is a C string, not a pointer to a single char
template <class P>
constexpr bool is_c_string = std::is_pointer_v<std::decay_t<P>>
                             && is_char_type<std::remove_cv_t<std::remove_pointer_t<std::decay_t<P>>>>;
} // namespace impl
} // namespace mc

/// Sum type representing either a value of type T or no value (Present | Absent).
/// The container itself is the absence signal, T is never inspected for "null".
///
/// The payload is immutable once constructed: it can be observed via value() const&,
/// moved out of an rvalue optional, or transformed into a new optional.
/// Chaining never needs manual branching:
///
///   auto squared = safe_head(list).map([](int x) { return x * x; }).value_or(0);
///
/// Operations:
///   has_value()          - true if Present
///   map(fn)              - Present(fn(v)) or Absent, fn not invoked on Absent
///   and_then(fn)         - fn(v) (must return an optional) or Absent, fn not invoked on Absent
///   or_else(supplier)    - *this if Present, supplier() otherwise (fallback container)
///   value_or(fallback)   - v if Present, fallback otherwise (fallback value, terminal)
///
/// None of these throw on their own; exceptions from callbacks propagate unchanged.
/// Trivially copyable when T is trivially copyable; otherwise uses T's move/copy semantics.
template <class T>
struct mc::optional
{
    static_assert(!std::is_reference_v<T>, "optional of references is not supported");
    static_assert(!std::is_same_v<std::remove_cv_t<T>, nullopt_t>, "optional<nullopt_t> is ill-formed");

    using value_type = T;

    // construction
public:
    /// Default optional is empty: has_value() == false.
    optional() = default;

    /// Constructs an engaged optional, perfect-forwarding the value into internal storage.
    /// Conditionally explicit, mirrors the convertibility of U to T.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U&&, T>) optional(U&& value) : _has_value(true) // NOLINT
    {
        new (mc::placement_new, &_storage.value) T(mc::forward<U>(value));
    }

    /// Constructs an empty optional from mc::nullopt.
    optional(nullopt_t) {}

    // trivial copy/move/destroy - defaulted when T allows bitwise operations
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy
public:
    /// Move-constructs the value, then destroys it in rhs and marks rhs empty.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (mc::placement_new, &_storage.value) T(mc::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (mc::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Replaces the whole optional.
    /// Leaves rhs engaged with a moved-from value, which keeps self-move and subobject moves safe.
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = mc::move(rhs._storage.value);
            else
                new (mc::placement_new, &_storage.value) T(mc::move(rhs._storage.value));

            _has_value = true;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (mc::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else if (_has_value)
            {
                _storage.value.~T();
                _has_value = false;
            }
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries and access
public:
    /// Returns true if this optional holds a value (Present), false if empty (Absent).
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Read-only access to the held value.
    /// Precondition: has_value() == true.
    [[nodiscard]] T const& value() const&
    {
        MC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }

    /// Moves the held value out of an expiring optional.
    /// Precondition: has_value() == true.
    [[nodiscard]] T&& value() &&
    {
        MC_ASSERT(_has_value, "attempted to access value of empty optional");
        return mc::move(_storage.value);
    }

    // monadic operations
public:
    /// Present(v) -> Present(fn(v)), Absent -> Absent without invoking fn.
    /// fn must not return void.
    template <class F>
    [[nodiscard]] auto map(F&& fn) const& -> optional<std::remove_cvref_t<std::invoke_result_t<F, T const&>>>
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F, T const&>>;
        static_assert(!std::is_void_v<U>, "map: callback must return a value");

        if (!_has_value)
            return nullopt;
        return optional<U>(mc::forward<F>(fn)(_storage.value));
    }
    template <class F>
    [[nodiscard]] auto map(F&& fn) && -> optional<std::remove_cvref_t<std::invoke_result_t<F, T&&>>>
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
        static_assert(!std::is_void_v<U>, "map: callback must return a value");

        if (!_has_value)
            return nullopt;
        return optional<U>(mc::forward<F>(fn)(mc::move(_storage.value)));
    }

    /// Present(v) -> fn(v), Absent -> Absent without invoking fn.
    /// fn must return an mc::optional<U>, which is passed through without nesting.
    template <class F>
    [[nodiscard]] auto and_then(F&& fn) const& -> std::remove_cvref_t<std::invoke_result_t<F, T const&>>
    {
        using R = std::remove_cvref_t<std::invoke_result_t<F, T const&>>;
        static_assert(impl::is_optional<R>, "and_then: callback must return an mc::optional");

        if (!_has_value)
            return R(nullopt);
        return mc::forward<F>(fn)(_storage.value);
    }
    template <class F>
    [[nodiscard]] auto and_then(F&& fn) && -> std::remove_cvref_t<std::invoke_result_t<F, T&&>>
    {
        using R = std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
        static_assert(impl::is_optional<R>, "and_then: callback must return an mc::optional");

        if (!_has_value)
            return R(nullopt);
        return mc::forward<F>(fn)(mc::move(_storage.value));
    }

    /// Present -> *this unchanged without invoking supplier, Absent -> supplier().
    /// Provides a fallback container, in contrast to value_or which provides a fallback value.
    template <class F>
    [[nodiscard]] optional or_else(F&& supplier) const&
    {
        static_assert(std::is_same_v<std::remove_cvref_t<std::invoke_result_t<F>>, optional>,
                      "or_else: supplier must return the same optional type");

        if (_has_value)
            return *this;
        return mc::forward<F>(supplier)();
    }
    template <class F>
    [[nodiscard]] optional or_else(F&& supplier) &&
    {
        static_assert(std::is_same_v<std::remove_cvref_t<std::invoke_result_t<F>>, optional>,
                      "or_else: supplier must return the same optional type");

        if (_has_value)
            return mc::move(*this);
        return mc::forward<F>(supplier)();
    }

    /// Present(v) -> v, Absent -> fallback. Leaves the optional abstraction.
    template <class U = std::remove_cv_t<T>>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        if (_has_value)
            return _storage.value;
        return static_cast<T>(mc::forward<U>(fallback));
    }
    template <class U = std::remove_cv_t<T>>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        if (_has_value)
            return mc::move(_storage.value);
        return static_cast<T>(mc::forward<U>(fallback));
    }

    // comparison
public:
    /// Equal if both empty or both hold equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// Equal if engaged with an equal value, avoids constructing a temporary optional.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Comparing with true/false would silently mean "has_value", so it is only allowed for optional<bool>.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    mc::storage_for<T> _storage;
    bool _has_value = false;
};

namespace mc
{
/// Lifts a pointer-like value into an optional: non-null -> Present(copy of *ptr), null -> Absent.
/// Works with raw pointers, std::unique_ptr and std::shared_ptr.
/// Usage:
///   auto user = mc::from_nullable(repository.find(id)); // find returns User const*
/// C strings are handled by the overload below.
template <class P>
    requires(!impl::is_c_string<P>) && requires(P const& p) {
        bool(p == nullptr);
        *p;
    }
[[nodiscard]] auto from_nullable(P const& ptr) -> optional<std::remove_cvref_t<decltype(*ptr)>>
{
    if (ptr == nullptr)
        return nullopt;
    return optional<std::remove_cvref_t<decltype(*ptr)>>(*ptr);
}

/// C strings: non-null -> Present(whole string), null -> Absent.
/// Usage: auto home = mc::from_nullable(std::getenv("HOME")); // optional<std::string>
template <class C>
    requires impl::is_char_type<C>
[[nodiscard]] optional<std::basic_string<C>> from_nullable(C const* str)
{
    if (str == nullptr)
        return nullopt;
    return optional<std::basic_string<C>>(std::basic_string<C>(str));
}

/// std::optional interop: engaged -> Present, std::nullopt -> Absent.
template <class T>
[[nodiscard]] optional<T> from_nullable(std::optional<T> const& value)
{
    if (!value.has_value())
        return nullopt;
    return optional<T>(*value);
}
template <class T>
[[nodiscard]] optional<T> from_nullable(std::optional<T>&& value)
{
    if (!value.has_value())
        return nullopt;
    return optional<T>(mc::move(*value));
}

/// A literal nullptr is always Absent.
/// Usage: auto none = mc::from_nullable<int>(nullptr);
template <class T>
[[nodiscard]] optional<T> from_nullable(nullptr_t)
{
    return nullopt;
}
} // namespace mc
