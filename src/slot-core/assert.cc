#include "assert.hh"

#include <slot-core/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <vector>

#ifdef SC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef SC_COMPILER_POSIX
#include <unistd.h>

#include <cstring>
#endif

namespace
{
// Global stack of assertion handlers
// NOTE: This is not thread-safe and must be externally synchronized
std::vector<std::move_only_function<void(sc::impl::assertion_info const&)>> g_assertion_handlers;

// without a handler the process dies right after this, so the report goes out in one piece
void default_assert_handler(sc::impl::assertion_info const& info)
{
    std::cerr << sc::impl::format_assertion_report(info) << std::flush;
}
} // namespace

std::string sc::impl::format_assertion_report(assertion_info const& info)
{
    std::ostringstream ss;
    ss << "slot-core: storage invocation aborted\n";
    ss << "  reason: " << info.message << '\n';
    ss << "  check:  " << info.expression << '\n';
    ss << "  at:     " << info.location.file_name() << ':' << info.location.line() << ':' << info.location.column();
    if (auto const fn = info.location.function_name(); fn && *fn)
        ss << " (" << fn << ')';
    ss << '\n';
    ss << "  slot writes issued before this point are not rolled back by slot-core\n";
    return ss.str();
}

void sc::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void sc::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

sc::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

sc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

SC_COLD_FUNC void sc::impl::handle_assert_failure(char const* expression, char const* message, std::source_location location)
{
    assertion_info const info{
        .expression = std::string(expression),
        .message = std::string(message),
        .location = location,
    };

    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

bool sc::impl::is_debugger_connected() noexcept
{
#ifdef SC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(SC_OS_LINUX)
    // TracerPid is non-zero while a debugger is attached
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                if (std::sscanf(buf + 10, "%d", &pid) != 1)
                    pid = 0;
                std::fclose(f);
                return pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void sc::impl::perform_abort() noexcept
{
    std::abort();
}
