#pragma once

// Self-test harness shared by the suites: case bookkeeping, trace files and JSON reports.
//
// A run owns %LOCALAPPDATA%\ShellFileOperator\SelfTest\last_run\. The run before it is moved to
// previous_run\ so the two can be compared.

#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace SelfTest
{
enum class Suite
{
    Core,
    FileOperator,
};

struct RunOptions
{
    // Skip the remaining cases of a suite once one has failed.
    bool failFast  = false;
    bool writeJson = true;
};

enum class CaseOutcome
{
    Passed,
    Failed,
    Skipped,
};

struct CaseRecord
{
    std::wstring name;
    CaseOutcome outcome = CaseOutcome::Passed;
    uint64_t durationMs = 0;
    std::wstring detail;
};

struct SuiteReport
{
    Suite suite         = Suite::Core;
    uint64_t durationMs = 0;
    std::vector<CaseRecord> cases;
    std::wstring firstFailure;

    [[nodiscard]] int Count(CaseOutcome outcome) const noexcept;
    [[nodiscard]] bool Succeeded() const noexcept
    {
        return Count(CaseOutcome::Failed) == 0;
    }
};

struct RunReport
{
    std::wstring startedUtc;
    uint64_t durationMs = 0;
    bool failFast       = false;
    std::vector<SuiteReport> suites;
};

[[nodiscard]] inline uint64_t ElapsedMs(std::chrono::steady_clock::time_point since) noexcept
{
    const auto elapsed = std::chrono::steady_clock::now() - since;
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

// Keeps the first failed expectation of a case; later ones only return false.
class CaseState
{
public:
    bool Require(bool condition, std::wstring_view message) noexcept;
    bool RequireSucceeded(HRESULT hr, std::wstring_view what) noexcept;
    bool RequireResult(HRESULT hr, HRESULT expected, std::wstring_view what) noexcept;

    [[nodiscard]] bool Failed() const noexcept
    {
        return _failed;
    }

    [[nodiscard]] const std::wstring& Failure() const noexcept
    {
        return _failure;
    }

private:
    bool _failed = false;
    std::wstring _failure;
};

[[nodiscard]] std::wstring_view GetSuiteName(Suite suite) noexcept;

// Appends one line to the suite trace and to the run trace.
void Trace(Suite suite, std::wstring_view message) noexcept;

class SuiteRunner
{
public:
    SuiteRunner(Suite suite, const RunOptions& options) noexcept;

    SuiteRunner(const SuiteRunner&)            = delete;
    SuiteRunner(SuiteRunner&&)                 = delete;
    SuiteRunner& operator=(const SuiteRunner&) = delete;
    SuiteRunner& operator=(SuiteRunner&&)      = delete;

    // func: bool(CaseState&) noexcept. Returning false fails the case even without a message.
    template <typename Func>
    void Case(std::wstring_view name, Func&& func) noexcept;

    // Stops the clock and writes results.json into the suite directory.
    [[nodiscard]] SuiteReport Finish() noexcept;

private:
    void Record(CaseRecord&& record) noexcept;

    Suite _suite;
    RunOptions _options;
    SuiteReport _report;
    std::chrono::steady_clock::time_point _startedAt;
};

template <typename Func>
void SuiteRunner::Case(std::wstring_view name, Func&& func) noexcept
{
    CaseRecord record;
    record.name.assign(name);

    if (_options.failFast && ! _report.Succeeded())
    {
        record.outcome = CaseOutcome::Skipped;
        record.detail  = L"skipped after an earlier failure";
        Record(std::move(record));
        return;
    }

    Trace(_suite, std::wstring(L"Case: ").append(name));

    CaseState state;
    const auto startedAt = std::chrono::steady_clock::now();
    const bool returned  = std::forward<Func>(func)(state);
    record.durationMs    = ElapsedMs(startedAt);

    if (! returned || state.Failed())
    {
        record.outcome = CaseOutcome::Failed;
        record.detail  = ! state.Failure().empty() ? state.Failure() : std::wstring(state.Failed() ? L"requirement failed" : L"case returned false");
        Trace(_suite, record.detail);
    }

    Record(std::move(record));
}

// Stores the options and start stamp of the run and rotates last_run\ into previous_run\.
void BeginRun(const RunOptions& options, std::wstring_view startedUtc);

// %LOCALAPPDATA%\ShellFileOperator\SelfTest, or empty when it cannot be resolved.
[[nodiscard]] const std::filesystem::path& GetArtifactRoot() noexcept;
[[nodiscard]] std::filesystem::path GetSuiteDirectory(Suite suite);
[[nodiscard]] std::filesystem::path GetSuiteArtifact(Suite suite, std::wstring_view fileName);

// Empty directory <suite>\work\<caseName>, recreated on every call.
[[nodiscard]] std::filesystem::path MakeScratchDirectory(Suite suite, std::wstring_view caseName);

bool EnsureDirectory(const std::filesystem::path& path) noexcept;
[[nodiscard]] bool PathExists(const std::filesystem::path& path) noexcept;
[[nodiscard]] bool WriteTextFile(const std::filesystem::path& path, std::string_view text) noexcept;
[[nodiscard]] bool ReadTextFile(const std::filesystem::path& path, std::string& text) noexcept;

void WriteRunReport(const RunReport& report, const std::filesystem::path& path) noexcept;
} // namespace SelfTest
