#pragma once

#include <monadic-core/assert.hh>
#include <monadic-core/fwd.hh>
#include <monadic-core/utility.hh>

#include <type_traits>

/// Tag wrapper marking a payload as the error of a result.
/// Needed so result<int, int>{42} and result<int, int>{mc::error(42)} stay distinguishable.
/// Created via mc::error(e), rarely spelled out directly.
template <class E>
struct mc::as_error_t
{
    E error;
};

namespace mc
{
/// Wraps a value as an error for constructing or returning a failed result.
/// The payload is decayed, so string literals become char const* and convert into any string-like E.
/// Usage:
///   auto parse(std::string_view s) -> mc::result<int, parse_error>
///   {
///       if (s.empty())
///           return mc::error(parse_error::empty_input);
///       return 42;
///   }
template <class E>
[[nodiscard]] constexpr as_error_t<std::decay_t<E>> error(E&& e)
{
    return as_error_t<std::decay_t<E>>{mc::forward<E>(e)};
}

namespace impl
{
template <class T>
constexpr bool is_error_tag = false;
template <class E>
constexpr bool is_error_tag<as_error_t<E>> = true;

template <class T>
constexpr bool is_result = false;
template <class T, class E>
constexpr bool is_result<result<T, E>> = true;

// storage for exactly one of T or E, lifetime managed by result
template <class T, class E>
union result_storage
{
    T value;
    E error;

    result_storage() {}

    ~result_storage()
        requires(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>)
    = default;
    ~result_storage()
        requires(!std::is_trivially_destructible_v<T> || !std::is_trivially_destructible_v<E>)
    {
    }
};
} // namespace impl
} // namespace mc

/// Sum type representing either a success value T or an error value E (Success | Failure).
/// E is unconstrained: an enum, a struct with details, a string, anything.
///
/// Business failures travel as E, never as exceptions. The container only ever propagates
/// exceptions thrown by caller-supplied callbacks.
///
/// Operations:
///   has_value() / has_error()  - which variant is active (has_value() is false for every failure)
///   map(fn)                    - Success(fn(v)) or the same Failure, fn not invoked on Failure
///   and_then(fn)               - fn(v) (must return result<U, E>) or the same Failure
///   or_else(fn)                - *this on Success, fn(e) on Failure (recover, re-fail or escalate)
///   value_or(fallback)         - v on Success, fallback on Failure (error discarded)
///   error_or(fallback)         - e on Failure, fallback on Success
///
/// The error type stays the same across and_then/or_else chains, there is no implicit error conversion.
/// Payloads are immutable: observe via value()/error() const&, or move out of an rvalue result.
/// Trivially copyable when both T and E are trivially copyable.
template <class T, class E>
struct mc::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result of references is not supported");
    static_assert(!impl::is_error_tag<T> && !impl::is_error_tag<E>, "as_error_t is a construction tag, not a payload");

    using value_type = T;
    using error_type = E;

    // construction
public:
    /// Constructs a success from anything T is constructible from.
    /// Conditionally explicit, mirrors the convertibility of U to T.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, result> && !impl::is_error_tag<std::remove_cvref_t<U>>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U&&, T>) result(U&& value) : _has_value(true) // NOLINT
    {
        new (mc::placement_new, &_storage.value) T(mc::forward<U>(value));
    }

    /// Constructs a failure from mc::error(e).
    template <class G>
        requires std::is_constructible_v<E, G const&>
    explicit(!std::is_convertible_v<G const&, E>) result(as_error_t<G> const& e) // NOLINT
    {
        new (mc::placement_new, &_storage.error) E(e.error);
    }
    template <class G>
        requires std::is_constructible_v<E, G &&>
    explicit(!std::is_convertible_v<G&&, E>) result(as_error_t<G>&& e) // NOLINT
    {
        new (mc::placement_new, &_storage.error) E(mc::move(e.error));
    }

    /// Converts from a result with compatible payloads, preserving the active variant.
    /// Not used when T itself can be built from the other result (then it is a plain success).
    template <class U, class G>
        requires(!std::is_same_v<result<U, G>, result> && std::is_constructible_v<T, U const&>
                 && std::is_constructible_v<E, G const&> && !std::is_constructible_v<T, result<U, G> const&>)
    explicit(!std::is_convertible_v<U const&, T> || !std::is_convertible_v<G const&, E>)
        result(result<U, G> const& rhs) // NOLINT
      : _has_value(rhs.has_value())
    {
        if (_has_value)
            new (mc::placement_new, &_storage.value) T(rhs.value());
        else
            new (mc::placement_new, &_storage.error) E(rhs.error());
    }
    template <class U, class G>
        requires(!std::is_same_v<result<U, G>, result> && std::is_constructible_v<T, U &&>
                 && std::is_constructible_v<E, G &&> && !std::is_constructible_v<T, result<U, G> &&>)
    explicit(!std::is_convertible_v<U&&, T> || !std::is_convertible_v<G&&, E>) result(result<U, G>&& rhs) // NOLINT
      : _has_value(rhs.has_value())
    {
        if (_has_value)
            new (mc::placement_new, &_storage.value) T(mc::move(rhs).value());
        else
            new (mc::placement_new, &_storage.error) E(mc::move(rhs).error());
    }

    // trivial copy/move/destroy - defaulted when T and E allow bitwise operations
public:
    result(result&&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result(result const&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result& operator=(result&&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result& operator=(result const&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;

    ~result()
        requires(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>)
    = default;

    // non-trivial copy/move/destroy
public:
    /// Moves the active payload, rhs keeps its variant with a moved-from payload.
    result(result&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T> || !std::is_trivially_copyable_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (mc::placement_new, &_storage.value) T(mc::move(rhs._storage.value));
        else
            new (mc::placement_new, &_storage.error) E(mc::move(rhs._storage.error));
    }

    result(result const& rhs)
        requires((!std::is_trivially_copyable_v<T> || !std::is_trivially_copyable_v<E>)
                 && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (mc::placement_new, &_storage.value) T(rhs._storage.value);
        else
            new (mc::placement_new, &_storage.error) E(rhs._storage.error);
    }

    /// Same variant: move-assigns the payload. Different variant: destroys ours, then move-constructs.
    /// Self-move is a no-op.
    result& operator=(result&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T> || !std::is_trivially_copyable_v<E>)
    {
        if (this == &rhs)
            return *this;

        if (_has_value && rhs._has_value)
            _storage.value = mc::move(rhs._storage.value);
        else if (!_has_value && !rhs._has_value)
            _storage.error = mc::move(rhs._storage.error);
        else
        {
            impl_destroy();
            if (rhs._has_value)
                new (mc::placement_new, &_storage.value) T(mc::move(rhs._storage.value));
            else
                new (mc::placement_new, &_storage.error) E(mc::move(rhs._storage.error));
            _has_value = rhs._has_value;
        }

        return *this;
    }

    /// Same variant: copy-assigns the payload. Different variant: copies into a temporary, then moves.
    result& operator=(result const& rhs)
        requires((!std::is_trivially_copyable_v<T> || !std::is_trivially_copyable_v<E>)
                 && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>
                 && std::is_copy_constructible_v<E> && std::is_copy_assignable_v<E>)
    {
        if (this == &rhs)
            return *this;

        if (_has_value && rhs._has_value)
            _storage.value = rhs._storage.value;
        else if (!_has_value && !rhs._has_value)
            _storage.error = rhs._storage.error;
        else
        {
            // copy first, a throwing copy must leave our current payload alive
            result tmp(rhs);
            *this = mc::move(tmp);
        }

        return *this;
    }

    ~result()
        requires(!std::is_trivially_destructible_v<T> || !std::is_trivially_destructible_v<E>)
    {
        impl_destroy();
    }

    // queries and access
public:
    /// True for Success, false for every Failure.
    [[nodiscard]] bool has_value() const { return _has_value; }
    [[nodiscard]] bool has_error() const { return !_has_value; }

    /// Precondition: has_value() == true.
    [[nodiscard]] T const& value() const&
    {
        MC_ASSERT(_has_value, "attempted to access value of failed result");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        MC_ASSERT(_has_value, "attempted to access value of failed result");
        return mc::move(_storage.value);
    }

    /// Precondition: has_error() == true.
    [[nodiscard]] E const& error() const&
    {
        MC_ASSERT(!_has_value, "attempted to access error of successful result");
        return _storage.error;
    }
    [[nodiscard]] E&& error() &&
    {
        MC_ASSERT(!_has_value, "attempted to access error of successful result");
        return mc::move(_storage.error);
    }

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

    template <class G = std::remove_cv_t<E>>
    [[nodiscard]] E error_or(G&& fallback) const&
    {
        if (!_has_value)
            return _storage.error;
        return static_cast<E>(mc::forward<G>(fallback));
    }
    template <class G = std::remove_cv_t<E>>
    [[nodiscard]] E error_or(G&& fallback) &&
    {
        if (!_has_value)
            return mc::move(_storage.error);
        return static_cast<E>(mc::forward<G>(fallback));
    }

    // monadic operations
public:
    /// Success(v) -> Success(fn(v)), Failure(e) -> Failure(e) without invoking fn.
    template <class F>
    [[nodiscard]] auto map(F&& fn) const& -> result<std::remove_cvref_t<std::invoke_result_t<F, T const&>>, E>
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F, T const&>>;
        static_assert(!std::is_void_v<U>, "map: callback must return a value");

        if (!_has_value)
            return mc::error(_storage.error);
        return result<U, E>(mc::forward<F>(fn)(_storage.value));
    }
    template <class F>
    [[nodiscard]] auto map(F&& fn) && -> result<std::remove_cvref_t<std::invoke_result_t<F, T&&>>, E>
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
        static_assert(!std::is_void_v<U>, "map: callback must return a value");

        if (!_has_value)
            return mc::error(mc::move(_storage.error));
        return result<U, E>(mc::forward<F>(fn)(mc::move(_storage.value)));
    }

    /// Success(v) -> fn(v), Failure(e) -> Failure(e) without invoking fn.
    /// fn must return a result<U, E> with the same error type.
    template <class F>
    [[nodiscard]] auto and_then(F&& fn) const& -> std::remove_cvref_t<std::invoke_result_t<F, T const&>>
    {
        using R = std::remove_cvref_t<std::invoke_result_t<F, T const&>>;
        static_assert(impl::is_result<R>, "and_then: callback must return an mc::result");
        static_assert(std::is_same_v<typename R::error_type, E>, "and_then: callback must keep the error type");

        if (!_has_value)
            return R(mc::error(_storage.error));
        return mc::forward<F>(fn)(_storage.value);
    }
    template <class F>
    [[nodiscard]] auto and_then(F&& fn) && -> std::remove_cvref_t<std::invoke_result_t<F, T&&>>
    {
        using R = std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
        static_assert(impl::is_result<R>, "and_then: callback must return an mc::result");
        static_assert(std::is_same_v<typename R::error_type, E>, "and_then: callback must keep the error type");

        if (!_has_value)
            return R(mc::error(mc::move(_storage.error)));
        return mc::forward<F>(fn)(mc::move(_storage.value));
    }

    /// Success -> *this unchanged without invoking fn, Failure(e) -> fn(e).
    /// fn decides locally: return a success to recover, the same or a different error to re-fail.
    template <class F>
    [[nodiscard]] result or_else(F&& fn) const&
    {
        static_assert(std::is_same_v<std::remove_cvref_t<std::invoke_result_t<F, E const&>>, result>,
                      "or_else: callback must return the same result type");

        if (_has_value)
            return *this;
        return mc::forward<F>(fn)(_storage.error);
    }
    template <class F>
    [[nodiscard]] result or_else(F&& fn) &&
    {
        static_assert(std::is_same_v<std::remove_cvref_t<std::invoke_result_t<F, E&&>>, result>,
                      "or_else: callback must return the same result type");

        if (_has_value)
            return mc::move(*this);
        return mc::forward<F>(fn)(mc::move(_storage.error));
    }

    // comparison
public:
    /// Equal if the same variant is active and the payloads compare equal.
    [[nodiscard]] friend bool operator==(result const& lhs, result const& rhs)
        requires requires(T v, E e) {
            bool(v == v);
            bool(e == e);
        }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return lhs._storage.error == rhs._storage.error;
    }

    // helper
private:
    void impl_destroy()
    {
        if (_has_value)
            _storage.value.~T();
        else
            _storage.error.~E();
    }

    // members
private:
    impl::result_storage<T, E> _storage;
    bool _has_value = false;
};
