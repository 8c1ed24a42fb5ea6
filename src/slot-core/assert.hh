#pragma once

// Lean header with minimal dependencies, included by every storage header.
#include <slot-core/macros.hh>

#include <source_location>

// =========================================================================================================
// SC_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// When assertions are active:
//   Enabled in SC_DEBUG and SC_RELWITHDEBINFO builds.
//   In SC_RELEASE builds, disabled unless SC_ENABLE_ASSERT_IN_RELEASE is set in CMake.
//
// What assertions are for:
//   Preconditions of the slot-level plumbing that only a programming error can violate
//   (negative slot counts, null buffers, an incomplete slot_store table).
//
// Error handling strategy:
//   - SC_ASSERT         -> internal preconditions, compiled out in release
//   - SC_ASSERT_ALWAYS  -> aborting the invocation (absent value on read(), out-of-bounds vector mutation)
//   - sc::optional<T>   -> expected absence (try_read, get, pop, first, last)
//
// Usage:
//   SC_ASSERT(n >= 0, "slot count must be non-negative");
//
#define SC_ASSERT(cond, msg) SC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// SC_ASSERT_ALWAYS - Always-active assertion
//
// Like SC_ASSERT but active in all build configurations.
// This is how a storage operation aborts the whole invocation: there is no partial-state recovery,
// the topmost assertion handler runs and the process terminates (unless the handler unwinds).
//
// Usage:
//   SC_ASSERT_ALWAYS(index < len, "storage_vec index out of bounds");
//
#define SC_ASSERT_ALWAYS(cond, msg) SC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// SC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define SC_DEBUG_BREAK() SC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// SC_BREAK_AND_ABORT - Debug break followed by program termination
//
#define SC_BREAK_AND_ABORT() (SC_DEBUG_BREAK(), ::sc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace sc::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler or prints to stderr
// Note: does not abort, caller must follow with SC_BREAK_AND_ABORT()
SC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, std::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace sc::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef SC_COMPILER_MSVC

#define SC_IMPL_DEBUG_BREAK() (::sc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(SC_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: declared here to keep posix headers out of every storage header
extern "C" int raise(int) noexcept;
#define SC_IMPL_DEBUG_BREAK() (::sc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define SC_IMPL_DEBUG_BREAK() void(0)

#endif

#define SC_IMPL_ASSERT_ALWAYS(cond, msg)                                                      \
    do                                                                                        \
    {                                                                                         \
        if (!(cond)) [[unlikely]]                                                             \
        {                                                                                     \
            ::sc::impl::handle_assert_failure(#cond, msg, ::std::source_location::current()); \
            SC_BREAK_AND_ABORT();                                                             \
        }                                                                                     \
    } while (false)

#if SC_ASSERT_ENABLED

#define SC_IMPL_ASSERT(cond, msg) SC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the expression still has to compile
#define SC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        SC_UNUSED(cond);          \
        SC_UNUSED(msg);           \
    } while (false)

#endif
