#pragma once

#include <slot-core/assert-handler.hh>

#include <string>
#include <utility>

// Aborting storage operations fail an SC_ASSERT_ALWAYS. Inside a test the abort is turned into an
// exception by a throwing assertion handler, so the test can observe it and keep running.
namespace sc_test
{
struct invocation_aborted
{
    std::string message;
};

/// Runs f, returns true iff it failed an assertion.
/// The message of the failed assertion is stored in *message if given.
template <class F>
bool aborts(F&& f, std::string* message = nullptr)
{
    auto handler = sc::impl::scoped_assertion_handler([](sc::impl::assertion_info const& info)
                                                      { throw invocation_aborted{info.message}; });
    try
    {
        std::forward<F>(f)();
    }
    catch (invocation_aborted const& e)
    {
        if (message)
            *message = e.message;
        return true;
    }
    return false;
}
} // namespace sc_test

#define CHECK_ABORTS(...) CHECK(::sc_test::aborts([&] { static_cast<void>(__VA_ARGS__); }))
#define CHECK_NOT_ABORTS(...) CHECK(!::sc_test::aborts([&] { static_cast<void>(__VA_ARGS__); }))
