#pragma once

#include <monadic-core/fwd.hh>
#include <monadic-core/result.hh>
#include <monadic-core/utility.hh>

#include <type_traits>
#include <utility> // std::declval

/// Handler record for match_result: one callable per result variant.
/// Both handlers must return the same type.
/// Usage:
///   auto handlers = mc::match_handlers{
///       .on_success = [](user const& u) { return "welcome " + u.name; },
///       .on_failure = [](login_error const& e) { return describe(e); },
///   };
template <class OnSuccess, class OnFailure>
struct mc::match_handlers
{
    OnSuccess on_success;
    OnFailure on_failure;
};

namespace mc
{
/// Reduces a result to a plain value by invoking exactly one of the handlers:
/// on_success(value) for a success, on_failure(error) otherwise.
/// Rvalue results move their payload into the handler.
template <class R, class OnSuccess, class OnFailure>
    requires impl::is_result<std::remove_cvref_t<R>>
auto match(R&& res, OnSuccess&& on_success, OnFailure&& on_failure)
    -> std::invoke_result_t<OnSuccess&, decltype(std::declval<R>().value())>
{
    using success_t = std::invoke_result_t<OnSuccess&, decltype(std::declval<R>().value())>;
    using failure_t = std::invoke_result_t<OnFailure&, decltype(std::declval<R>().error())>;
    static_assert(std::is_same_v<success_t, failure_t>, "match: on_success and on_failure must return the same type");

    if (res.has_value())
        return on_success(mc::forward<R>(res).value());
    return on_failure(mc::forward<R>(res).error());
}

/// Turns a handler record into a reusable function result<T, E> -> R.
/// Handlers are stored by value and invoked as const.
/// Usage:
///   auto to_status = mc::match_result(mc::match_handlers{
///       .on_success = [](int) { return 200; },
///       .on_failure = [](http_error const& e) { return e.status; },
///   });
///   int status = to_status(fetch(url));
template <class OnSuccess, class OnFailure>
[[nodiscard]] auto match_result(match_handlers<OnSuccess, OnFailure> handlers)
{
    return [handlers = mc::move(handlers)]<class R>
        requires(impl::is_result<std::remove_cvref_t<R>>)
    (R&& res) { return mc::match(mc::forward<R>(res), handlers.on_success, handlers.on_failure); };
}
} // namespace mc
