#pragma once

#include <slot-core/macros.hh>

#include <functional>
#include <source_location>
#include <string>

namespace sc::impl
{
// Customizable assertion handler system
// A failed SC_ASSERT / SC_ASSERT_ALWAYS aborts the invocation. Hosts that run many invocations in one
// process (test drivers, simulators) push a handler that throws, unwinding to the invocation boundary
// where pending slot writes can be discarded.
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = sc::impl::scoped_assertion_handler([](sc::impl::assertion_info const& info) {
//           throw invocation_reverted{info.message};
//       });
//
//       run_invocation(store);
//   } // handler is automatically popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    std::source_location location;
};

// Multi-line human readable report of a failed check: reason, checked expression, source location.
// This is what the process prints to stderr when no handler is installed.
[[nodiscard]] std::string format_assertion_report(assertion_info const& info);

// Push a custom assertion handler onto the handler stack
// The handler will be called for all assertion failures until it is popped
// Handlers are allowed to throw exceptions to unwind to a recovery point
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// (prefer scoped_assertion_handler, it also pops when the handler throws)
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace sc::impl
