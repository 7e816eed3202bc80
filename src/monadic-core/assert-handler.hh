#pragma once

#include <monadic-core/macros.hh>
#include <monadic-core/source_location.hh>

#include <functional>
#include <string>

namespace mc::impl
{
// Customizable assertion handlers
// NOTE: the handler stack is global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = mc::impl::scoped_assertion_handler([](mc::impl::assertion_info const& info) {
//           my_logger.error("{} ({})", info.message, info.expression);
//           throw precondition_violation{};
//       });
//
//       auto v = maybe_empty.value(); // a failed precondition ends up in the handler above
//   }

struct assertion_info
{
    std::string expression;
    std::string message;
    mc::source_location location;
};

// Pushes a handler that receives all assertion failures until it is popped
// Handlers may throw to unwind to a recovery point instead of aborting
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pops the topmost handler, no-op if the stack is empty
void pop_assertion_handler();

// RAII push/pop, also pops when unwinding out of a throwing handler
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace mc::impl
