#include "assert.hh"

#include <monadic-core/assert-handler.hh>

#include <cstdlib>
#include <iostream>
#include <utility>
#include <vector>

namespace
{
using handler_fn = std::move_only_function<void(mc::impl::assertion_info const&)>;

// NOTE: not thread-safe, must be externally synchronized
std::vector<handler_fn>& handler_stack()
{
    static std::vector<handler_fn> handlers;
    return handlers;
}

void report_to_stderr(mc::impl::assertion_info const& info)
{
    auto const& loc = info.location;
    std::cerr << loc.file_name() << ':' << loc.line() << ": assertion `" << info.expression << "` failed in "
              << loc.function_name() << "\n    " << info.message << std::endl;
}
} // namespace

void mc::impl::push_assertion_handler(handler_fn handler)
{
    handler_stack().push_back(std::move(handler));
}

void mc::impl::pop_assertion_handler()
{
    auto& handlers = handler_stack();
    if (!handlers.empty())
        handlers.pop_back();
}

mc::impl::scoped_assertion_handler::scoped_assertion_handler(handler_fn handler)
{
    push_assertion_handler(std::move(handler));
}

mc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

MC_COLD_FUNC void mc::impl::handle_assert_failure(char const* expression, char const* message, mc::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto& handlers = handler_stack();
    if (handlers.empty())
        report_to_stderr(info);
    else
        handlers.back()(info); // may throw
}

[[noreturn]] void mc::impl::perform_abort() noexcept
{
    std::abort();
}
