#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <format>
#include <limits>
#include <new>
#include <string>
#include <string_view>
#include <utility>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <evntrace.h>

#pragma warning(push)
// TraceLogging: C4625/C4626/C5026/C5027 (deleted special members), C4820 (padding)
#pragma warning(disable : 4625 4626 5026 5027 4820)
#include <TraceLoggingProvider.h>
#pragma warning(pop)

#pragma warning(push)
#pragma warning(disable : 4514) // unreferenced inline function has been removed

namespace OrdinalString
{
// Case-insensitive ordinal comparison (no locale, no linguistic folding).
inline bool EqualsNoCase(std::wstring_view a, std::wstring_view b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }
    if (a.empty())
    {
        return true;
    }
    if (a.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
    {
        return a == b;
    }

    const int length = static_cast<int>(a.size());
    return CompareStringOrdinal(a.data(), length, b.data(), length, TRUE) == CSTR_EQUAL;
}
} // namespace OrdinalString

//////////////////////////////////////////////////////////////////////////////////
// Diagnostics
//
// Everything below is published through the "ShellFileOperator" TraceLogging provider and is
// dropped unless an ETW session enables it:
//   wpr -start ShellFileOperator.wprp   or   tracelog -start shfo -guid #7d3c5a1e-2b9f-4c61-8e0a-5f4b6d2c9a17
//
// Keyword 0x1 carries Debug:: messages and CallTracer, keyword 0x2 carries Perf::Scope.
//
// The provider lives in exactly one translation unit per binary: that file defines
// SHFO_DEFINE_TRACE_PROVIDER before including this header.

#if ! defined(SHFO_DEFINE_TRACE_PROVIDER)
TRACELOGGING_DECLARE_PROVIDER(g_ShellFileOperatorProvider);
#else
TRACELOGGING_DEFINE_PROVIDER(g_ShellFileOperatorProvider,
                             "ShellFileOperator",
                             // {7d3c5a1e-2b9f-4c61-8e0a-5f4b6d2c9a17}
                             (0x7d3c5a1e, 0x2b9f, 0x4c61, 0x8e, 0x0a, 0x5f, 0x4b, 0x6d, 0x2c, 0x9a, 0x17));
#endif

namespace Debug
{
enum class Level : uint8_t
{
    Error,
    Warning,
    Info,
};

namespace detail
{
inline constexpr ULONGLONG kMessageKeyword = 0x1;
inline constexpr ULONGLONG kPerfKeyword    = 0x2;

// Registered on first use, unregistered at process exit.
class ProviderRegistration final
{
public:
    ProviderRegistration() noexcept : _registered(SUCCEEDED(TraceLoggingRegister(g_ShellFileOperatorProvider)))
    {
    }

    ~ProviderRegistration()
    {
        if (_registered)
        {
            TraceLoggingUnregister(g_ShellFileOperatorProvider);
        }
    }

    ProviderRegistration(const ProviderRegistration&)            = delete;
    ProviderRegistration& operator=(const ProviderRegistration&) = delete;

    [[nodiscard]] bool IsRegistered() const noexcept
    {
        return _registered;
    }

private:
    bool _registered = false;
};

inline bool IsListening(ULONGLONG keyword) noexcept
{
    static const ProviderRegistration registration;
    return registration.IsRegistered() && TraceLoggingProviderEnabled(g_ShellFileOperatorProvider, 0, keyword);
}

inline USHORT CountedLength(std::wstring_view text) noexcept
{
    return static_cast<USHORT>(std::min<size_t>(text.size(), std::numeric_limits<USHORT>::max()));
}

// TraceLogging needs the level as a constant, hence one write per level.
inline void Write(Level level, std::wstring_view message, HRESULT hr) noexcept
{
    const USHORT length = CountedLength(message);
    switch (level)
    {
        case Level::Error:
            TraceLoggingWrite(g_ShellFileOperatorProvider,
                              "Error",
                              TraceLoggingLevel(TRACE_LEVEL_ERROR),
                              TraceLoggingKeyword(kMessageKeyword),
                              TraceLoggingCountedWideString(message.data(), length, "Message"),
                              TraceLoggingHResult(hr, "Hr"));
            break;
        case Level::Warning:
            TraceLoggingWrite(g_ShellFileOperatorProvider,
                              "Warning",
                              TraceLoggingLevel(TRACE_LEVEL_WARNING),
                              TraceLoggingKeyword(kMessageKeyword),
                              TraceLoggingCountedWideString(message.data(), length, "Message"),
                              TraceLoggingHResult(hr, "Hr"));
            break;
        case Level::Info:
            TraceLoggingWrite(g_ShellFileOperatorProvider,
                              "Info",
                              TraceLoggingLevel(TRACE_LEVEL_INFORMATION),
                              TraceLoggingKeyword(kMessageKeyword),
                              TraceLoggingCountedWideString(message.data(), length, "Message"));
            break;
    }
}

template <typename... Args> inline void Format(Level level, HRESULT hr, std::wformat_string<Args...> format, Args&&... args) noexcept
{
    if (! IsListening(kMessageKeyword))
    {
        return;
    }

    try
    {
        const std::wstring message = std::format(format, std::forward<Args>(args)...);
        Write(level, message, hr);
    }
    catch (const std::bad_alloc&)
    {
        Write(level, L"<message dropped: out of memory>", hr);
    }
    catch (const std::format_error&)
    {
        Write(level, L"<message dropped: format error>", hr);
    }
}
} // namespace detail

template <typename... Args> inline void Info(std::wformat_string<Args...> format, Args&&... args) noexcept
{
    detail::Format(Level::Info, S_OK, format, std::forward<Args>(args)...);
}

template <typename... Args> inline void Warning(std::wformat_string<Args...> format, Args&&... args) noexcept
{
    detail::Format(Level::Warning, S_OK, format, std::forward<Args>(args)...);
}

template <typename... Args> inline void Error(std::wformat_string<Args...> format, Args&&... args) noexcept
{
    detail::Format(Level::Error, S_OK, format, std::forward<Args>(args)...);
}

// Logs an error event carrying `hr` and hands `hr` back, for `return Debug::ErrorWithHr(hr, ...)`.
template <typename... Args> inline HRESULT ErrorWithHr(HRESULT hr, std::wformat_string<Args...> format, Args&&... args) noexcept
{
    detail::Format(Level::Error, hr, format, std::forward<Args>(args)...);
    return hr;
}

namespace Perf
{
// Emits one "PerfScope" event with the elapsed time when the scope ends.
class Scope final
{
public:
    explicit Scope(std::wstring_view name) noexcept : _name(name), _listening(detail::IsListening(detail::kPerfKeyword))
    {
        if (_listening)
        {
            _started = std::chrono::steady_clock::now();
        }
    }

    Scope(const Scope&)            = delete;
    Scope& operator=(const Scope&) = delete;
    Scope(Scope&&)                 = delete;
    Scope& operator=(Scope&&)      = delete;

    ~Scope()
    {
        if (! _listening)
        {
            return;
        }

        const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - _started);
        TraceLoggingWrite(g_ShellFileOperatorProvider,
                          "PerfScope",
                          TraceLoggingLevel(TRACE_LEVEL_INFORMATION),
                          TraceLoggingKeyword(detail::kPerfKeyword),
                          TraceLoggingCountedWideString(_name.data(), detail::CountedLength(_name), "Name"),
                          TraceLoggingUInt64(static_cast<uint64_t>(micros.count()), "ElapsedUs"),
                          TraceLoggingUInt64(_count, "Count"),
                          TraceLoggingHResult(_hr, "Hr"));
    }

    void SetCount(uint64_t count) noexcept
    {
        _count = count;
    }

    void SetHr(HRESULT hr) noexcept
    {
        _hr = hr;
    }

private:
    std::wstring_view _name;
    bool _listening = false;
    std::chrono::steady_clock::time_point _started;
    uint64_t _count = 0;
    HRESULT _hr     = S_OK;
};
} // namespace Perf
} // namespace Debug

// Logs "enter" and "exit" events around a function body; exit carries the elapsed time.
class CallTracer final
{
public:
    explicit CallTracer(const wchar_t* function, const wchar_t* context = nullptr) noexcept
        : _function(function ? function : L""),
          _context(context ? context : L""),
          _listening(Debug::detail::IsListening(Debug::detail::kMessageKeyword))
    {
        if (! _listening)
        {
            return;
        }

        _started = std::chrono::steady_clock::now();
        TraceLoggingWrite(g_ShellFileOperatorProvider,
                          "Enter",
                          TraceLoggingLevel(TRACE_LEVEL_VERBOSE),
                          TraceLoggingKeyword(Debug::detail::kMessageKeyword),
                          TraceLoggingWideString(_function, "Function"),
                          TraceLoggingWideString(_context, "Context"));
    }

    CallTracer(const CallTracer&)            = delete;
    CallTracer& operator=(const CallTracer&) = delete;

    ~CallTracer()
    {
        if (! _listening)
        {
            return;
        }

        const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - _started);
        TraceLoggingWrite(g_ShellFileOperatorProvider,
                          "Exit",
                          TraceLoggingLevel(TRACE_LEVEL_VERBOSE),
                          TraceLoggingKeyword(Debug::detail::kMessageKeyword),
                          TraceLoggingWideString(_function, "Function"),
                          TraceLoggingWideString(_context, "Context"),
                          TraceLoggingUInt64(static_cast<uint64_t>(micros.count()), "ElapsedUs"));
    }

private:
    const wchar_t* _function = L"";
    const wchar_t* _context  = L"";
    bool _listening          = false;
    std::chrono::steady_clock::time_point _started;
};

#define SHFO_CONCAT_IMPL(a, b) a##b
#define SHFO_CONCAT(a, b) SHFO_CONCAT_IMPL(a, b)
#define SHFO_WIDEN_IMPL(x) L##x
#define SHFO_WIDEN(x) SHFO_WIDEN_IMPL(x)

#define TRACER [[maybe_unused]] const CallTracer SHFO_CONCAT(shfoTracer_, __COUNTER__)(SHFO_WIDEN(__FUNCTION__))
#define TRACER_CTX(ctx) [[maybe_unused]] const CallTracer SHFO_CONCAT(shfoTracer_, __COUNTER__)(SHFO_WIDEN(__FUNCTION__), ctx)

#pragma warning(pop)
