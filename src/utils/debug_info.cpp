/**
 * @file debug_info.cpp
 * @brief POSIX stack trace printing for poolhub::debug::print_stack_trace().
 */
#include "ph_base.hpp"

#include <cstdlib>
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols

namespace poolhub::debug
{

namespace
{

std::string demangle(const char *symbol)
{
    if (symbol == nullptr)
    {
        return "??";
    }
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(symbol, nullptr, nullptr, &status), &std::free);
    if (status == 0 && demangled)
    {
        return demangled.get();
    }
    return symbol;
}

} // namespace

void print_stack_trace() noexcept
{
    try
    {
        constexpr int kMaxFrames = 64;
        void *frames[kMaxFrames] = {nullptr};
        const int captured = backtrace(frames, kMaxFrames);
        fmt::print(stderr, "Stack Trace (most recent call first):\n");
        if (captured <= 0)
        {
            fmt::print(stderr, "  <no frames captured>\n");
            return;
        }

        std::unique_ptr<char *, decltype(&std::free)> raw(backtrace_symbols(frames, captured),
                                                           &std::free);
        // Frame 0 is print_stack_trace itself.
        for (int i = 1; i < captured; ++i)
        {
            const auto addr = reinterpret_cast<uintptr_t>(frames[i]);
            Dl_info info{};
            if (dladdr(frames[i], &info) != 0 && info.dli_sname != nullptr)
            {
                const auto offset = addr - reinterpret_cast<uintptr_t>(info.dli_saddr);
                fmt::print(stderr, "  #{:02}  {:#018x}  {} + {:#x}  ({})\n", i - 1, addr,
                           demangle(info.dli_sname), offset,
                           info.dli_fname != nullptr
                               ? format_tools::filename_only(info.dli_fname)
                               : std::string_view("?"));
            }
            else if (raw)
            {
                fmt::print(stderr, "  #{:02}  {}\n", i - 1, raw.get()[i]);
            }
            else
            {
                fmt::print(stderr, "  #{:02}  {:#018x}\n", i - 1, addr);
            }
        }
        std::fflush(stderr);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "print_stack_trace failed: %s\n", e.what());
    }
}

} // namespace poolhub::debug
