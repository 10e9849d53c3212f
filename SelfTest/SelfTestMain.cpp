#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <objbase.h>

#pragma warning(push)
#pragma warning(disable : 4625 4626 5026 5027)
#include <wil/resource.h>
#pragma warning(pop)

#include "Helpers.h"
#include "ShellFileOperator.Core.SelfTest.h"
#include "ShellFileOperator.FileOperator.SelfTest.h"
#include "SelfTestCommon.h"
#include "Version.h"

namespace
{
// 2026-10-19T08:15:42.123Z
[[nodiscard]] std::wstring GetSelfTestUtcIso8601() noexcept
{
    try
    {
        const auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        return std::format(L"{:%Y-%m-%dT%H:%M:%S}Z", now);
    }
    catch (const std::exception&)
    {
        return {};
    }
}

void PrintUsage() noexcept
{
    fwprintf(stdout,
             L"ShellFileOperatorSelfTest %ls\r\n"
             L"  --fail-fast      Stop after the first failing case of a suite.\r\n"
             L"  --no-json        Do not write results.json files.\r\n"
             L"  --suite=<name>   Run only one suite: core or fileoperator.\r\n",
             VERSINFO_VERSION);
}

void PrintSuite(const SelfTest::SuiteReport& report) noexcept
{
    const std::wstring_view name = SelfTest::GetSuiteName(report.suite);
    for (const SelfTest::CaseRecord& record : report.cases)
    {
        const wchar_t* tag = L"PASS";
        if (record.outcome == SelfTest::CaseOutcome::Failed)
        {
            tag = L"FAIL";
        }
        else if (record.outcome == SelfTest::CaseOutcome::Skipped)
        {
            tag = L"SKIP";
        }

        fwprintf(stdout, L"[%ls] %.*ls/%ls", tag, static_cast<int>(name.size()), name.data(), record.name.c_str());
        if (! record.detail.empty())
        {
            fwprintf(stdout, L": %ls", record.detail.c_str());
        }
        fwprintf(stdout, L"\r\n");
    }

    fwprintf(stdout,
             L"%.*ls: %d passed, %d failed, %d skipped (%llu ms)\r\n",
             static_cast<int>(name.size()),
             name.data(),
             report.Count(SelfTest::CaseOutcome::Passed),
             report.Count(SelfTest::CaseOutcome::Failed),
             report.Count(SelfTest::CaseOutcome::Skipped),
             static_cast<unsigned long long>(report.durationMs));
}
} // namespace

int wmain(int argc, wchar_t** argv)
{
    SelfTest::RunOptions options;
    bool runCore         = true;
    bool runFileOperator = true;

    for (int i = 1; i < argc; ++i)
    {
        const std::wstring_view arg = argv[i] ? std::wstring_view(argv[i]) : std::wstring_view();
        if (OrdinalString::EqualsNoCase(arg, L"--fail-fast"))
        {
            options.failFast = true;
        }
        else if (OrdinalString::EqualsNoCase(arg, L"--no-json"))
        {
            options.writeJson = false;
        }
        else if (OrdinalString::EqualsNoCase(arg, L"--suite=core"))
        {
            runFileOperator = false;
        }
        else if (OrdinalString::EqualsNoCase(arg, L"--suite=fileoperator"))
        {
            runCore = false;
        }
        else
        {
            PrintUsage();
            return OrdinalString::EqualsNoCase(arg, L"--help") ? 0 : 2;
        }
    }

    SelfTest::RunReport run;
    run.startedUtc = GetSelfTestUtcIso8601();
    run.failFast   = options.failFast;
    SelfTest::BeginRun(options, run.startedUtc);

    // The engine and the shell parser both need an STA; sessions balance their own initialization.
    const HRESULT comHr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED | COINIT_DISABLE_OLE1DDE);
    if (FAILED(comHr))
    {
        fwprintf(stderr, L"CoInitializeEx failed: 0x%08lX\r\n", static_cast<unsigned long>(comHr));
        return 1;
    }
    auto uninitialize = wil::scope_exit([]() noexcept { CoUninitialize(); });

    Debug::Info(L"SelfTest: begin (failFast={}, json={})", options.failFast, options.writeJson);
    const auto startedAt = std::chrono::steady_clock::now();

    if (runCore)
    {
        run.suites.push_back(CoreSelfTest::Run(options));
    }
    if (runFileOperator)
    {
        run.suites.push_back(FileOperatorSelfTest::Run(options));
    }

    bool ok = true;
    for (const SelfTest::SuiteReport& report : run.suites)
    {
        PrintSuite(report);
        ok = ok && report.Succeeded();
    }

    run.durationMs = SelfTest::ElapsedMs(startedAt);
    if (const std::filesystem::path& root = SelfTest::GetArtifactRoot(); ! root.empty())
    {
        SelfTest::WriteRunReport(run, root / L"last_run" / L"results.json");
        fwprintf(stdout, L"Artifacts: %ls\r\n", (root / L"last_run").c_str());
    }

    Debug::Info(L"SelfTest: end (ok={}, {} ms)", ok, run.durationMs);
    return ok ? 0 : 1;
}
