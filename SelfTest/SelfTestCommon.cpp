#include "SelfTestCommon.h"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <limits>
#include <new>
#include <system_error>

#include <shlobj_core.h>

#pragma warning(push)
#pragma warning(disable : 4625 4626 5026 5027)
#include <wil/resource.h>
#pragma warning(pop)

#include <yyjson.h>

namespace SelfTest
{
namespace
{
constexpr std::wstring_view kProductDirectory{L"ShellFileOperator"};
constexpr std::wstring_view kSelfTestDirectory{L"SelfTest"};
constexpr std::wstring_view kLastRunDirectory{L"last_run"};
constexpr std::wstring_view kPreviousRunDirectory{L"previous_run"};
constexpr std::wstring_view kWorkDirectory{L"work"};
constexpr std::wstring_view kTraceFile{L"trace.txt"};
constexpr std::wstring_view kResultsFile{L"results.json"};

struct SuiteEntry
{
    Suite suite;
    std::wstring_view name;
    std::wstring_view directory;
};

constexpr SuiteEntry kSuiteEntries[] = {
    {Suite::Core, L"Core", L"core"},
    {Suite::FileOperator, L"FileOperator", L"fileoperator"},
};

RunOptions g_runOptions;
std::wstring g_runStartedUtc;

using unique_yyjson_mut_doc = wil::unique_any<yyjson_mut_doc*, decltype(&::yyjson_mut_doc_free), &::yyjson_mut_doc_free>;
using unique_yyjson_buffer  = wil::unique_any<char*, decltype(&::free), &::free>;

[[nodiscard]] const SuiteEntry* FindSuiteEntry(Suite suite) noexcept
{
    const auto it = std::find_if(std::begin(kSuiteEntries), std::end(kSuiteEntries), [suite](const SuiteEntry& entry) { return entry.suite == suite; });
    return it != std::end(kSuiteEntries) ? &*it : nullptr;
}

[[nodiscard]] std::wstring_view GetCaseOutcomeName(CaseOutcome outcome) noexcept
{
    switch (outcome)
    {
        case CaseOutcome::Passed: return L"passed";
        case CaseOutcome::Failed: return L"failed";
        case CaseOutcome::Skipped: return L"skipped";
    }
    return L"unknown";
}

[[nodiscard]] std::string ToUtf8(std::wstring_view text) noexcept
{
    if (text.empty() || text.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
    {
        return {};
    }

    const int length = static_cast<int>(text.size());
    const int needed = WideCharToMultiByte(CP_UTF8, 0, text.data(), length, nullptr, 0, nullptr, nullptr);
    if (needed <= 0)
    {
        return {};
    }

    try
    {
        std::string utf8(static_cast<size_t>(needed), '\0');
        if (WideCharToMultiByte(CP_UTF8, 0, text.data(), length, utf8.data(), needed, nullptr, nullptr) != needed)
        {
            return {};
        }
        return utf8;
    }
    catch (const std::bad_alloc&)
    {
        return {};
    }
}

// Trace files are UTF-16 LE; the BOM goes in with the first line.
void AppendTraceLine(const std::filesystem::path& path, std::wstring_view message) noexcept
{
    if (path.empty())
    {
        return;
    }

    wil::unique_hfile file(CreateFileW(path.c_str(), FILE_APPEND_DATA, FILE_SHARE_READ, nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr));
    if (! file)
    {
        return;
    }
    const bool newFile = GetLastError() != ERROR_ALREADY_EXISTS;

    std::wstring line;
    try
    {
        line.reserve(message.size() + 3u);
        if (newFile)
        {
            line.push_back(static_cast<wchar_t>(0xFEFF));
        }
        line.append(message);
        line.append(L"\r\n");
    }
    catch (const std::bad_alloc&)
    {
        return;
    }

    DWORD written = 0;
    static_cast<void>(WriteFile(file.get(), line.data(), static_cast<DWORD>(line.size() * sizeof(wchar_t)), &written, nullptr));
}

[[nodiscard]] bool WriteBytes(const std::filesystem::path& path, const char* data, size_t size) noexcept
{
    if (path.empty() || size > static_cast<size_t>(std::numeric_limits<DWORD>::max()))
    {
        return false;
    }

    wil::unique_hfile file(CreateFileW(path.c_str(), GENERIC_WRITE, FILE_SHARE_READ, nullptr, CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr));
    if (! file)
    {
        return false;
    }

    DWORD written = 0;
    if (size != 0 && ! WriteFile(file.get(), data, static_cast<DWORD>(size), &written, nullptr))
    {
        return false;
    }
    return written == static_cast<DWORD>(size);
}

void AddString(yyjson_mut_doc* doc, yyjson_mut_val* obj, const char* key, std::wstring_view value) noexcept
{
    const std::string utf8 = ToUtf8(value);
    yyjson_mut_obj_add_strncpy(doc, obj, key, utf8.data(), utf8.size());
}

[[nodiscard]] yyjson_mut_val* BuildSuiteObject(yyjson_mut_doc* doc, const SuiteReport& report) noexcept
{
    yyjson_mut_val* suiteObj = yyjson_mut_obj(doc);
    if (! suiteObj)
    {
        return nullptr;
    }

    AddString(doc, suiteObj, "suite", GetSuiteName(report.suite));
    yyjson_mut_obj_add_uint(doc, suiteObj, "duration_ms", report.durationMs);
    yyjson_mut_obj_add_int(doc, suiteObj, "passed", report.Count(CaseOutcome::Passed));
    yyjson_mut_obj_add_int(doc, suiteObj, "failed", report.Count(CaseOutcome::Failed));
    yyjson_mut_obj_add_int(doc, suiteObj, "skipped", report.Count(CaseOutcome::Skipped));
    if (! report.firstFailure.empty())
    {
        AddString(doc, suiteObj, "first_failure", report.firstFailure);
    }

    yyjson_mut_val* cases = yyjson_mut_arr(doc);
    if (! cases)
    {
        return suiteObj;
    }

    for (const CaseRecord& record : report.cases)
    {
        yyjson_mut_val* caseObj = yyjson_mut_obj(doc);
        if (! caseObj)
        {
            continue;
        }

        AddString(doc, caseObj, "name", record.name);
        AddString(doc, caseObj, "outcome", GetCaseOutcomeName(record.outcome));
        yyjson_mut_obj_add_uint(doc, caseObj, "duration_ms", record.durationMs);
        if (! record.detail.empty())
        {
            AddString(doc, caseObj, "detail", record.detail);
        }
        static_cast<void>(yyjson_mut_arr_add_val(cases, caseObj));
    }

    yyjson_mut_obj_add_val(doc, suiteObj, "cases", cases);
    return suiteObj;
}

void WriteDocument(yyjson_mut_doc* doc, const std::filesystem::path& path) noexcept
{
    size_t length = 0;
    unique_yyjson_buffer json(yyjson_mut_write(doc, YYJSON_WRITE_PRETTY, &length));
    if (! json)
    {
        return;
    }

    static_cast<void>(WriteBytes(path, json.get(), length));
}

void WriteSuiteReport(const SuiteReport& report, const std::filesystem::path& path) noexcept
{
    if (! g_runOptions.writeJson || path.empty())
    {
        return;
    }

    unique_yyjson_mut_doc doc(yyjson_mut_doc_new(nullptr));
    if (! doc)
    {
        return;
    }

    yyjson_mut_val* root = BuildSuiteObject(doc.get(), report);
    if (! root)
    {
        return;
    }

    AddString(doc.get(), root, "run_started_utc", g_runStartedUtc);
    yyjson_mut_doc_set_root(doc.get(), root);
    WriteDocument(doc.get(), path);
}
} // namespace

int SuiteReport::Count(CaseOutcome outcome) const noexcept
{
    return static_cast<int>(std::count_if(cases.begin(), cases.end(), [outcome](const CaseRecord& record) { return record.outcome == outcome; }));
}

bool CaseState::Require(bool condition, std::wstring_view message) noexcept
{
    if (condition)
    {
        return true;
    }

    if (! _failed)
    {
        _failed = true;
        try
        {
            _failure.assign(message);
        }
        catch (const std::bad_alloc&)
        {
            _failure.clear();
        }
    }
    return false;
}

bool CaseState::RequireSucceeded(HRESULT hr, std::wstring_view what) noexcept
{
    if (SUCCEEDED(hr))
    {
        return true;
    }

    try
    {
        return Require(false, std::format(L"{} failed: 0x{:08X}", what, static_cast<unsigned long>(hr)));
    }
    catch (const std::exception&)
    {
        return Require(false, what);
    }
}

bool CaseState::RequireResult(HRESULT hr, HRESULT expected, std::wstring_view what) noexcept
{
    if (hr == expected)
    {
        return true;
    }

    try
    {
        return Require(false, std::format(L"{}: expected 0x{:08X}, got 0x{:08X}", what, static_cast<unsigned long>(expected), static_cast<unsigned long>(hr)));
    }
    catch (const std::exception&)
    {
        return Require(false, what);
    }
}

std::wstring_view GetSuiteName(Suite suite) noexcept
{
    const SuiteEntry* entry = FindSuiteEntry(suite);
    return entry ? entry->name : std::wstring_view(L"Unknown");
}

void Trace(Suite suite, std::wstring_view message) noexcept
{
    const std::filesystem::path& root = GetArtifactRoot();
    const SuiteEntry* entry           = FindSuiteEntry(suite);
    if (root.empty() || ! entry)
    {
        return;
    }

    try
    {
        const std::filesystem::path lastRun = root / kLastRunDirectory;
        AppendTraceLine(lastRun / entry->directory / kTraceFile, message);
        AppendTraceLine(lastRun / kTraceFile, message);
    }
    catch (const std::bad_alloc&)
    {
        // Tracing is best effort.
    }
}

SuiteRunner::SuiteRunner(Suite suite, const RunOptions& options) noexcept
    : _suite(suite),
      _options(options),
      _startedAt(std::chrono::steady_clock::now())
{
    _report.suite = suite;
    Trace(_suite, std::wstring(GetSuiteName(_suite)).append(L": begin"));
}

void SuiteRunner::Record(CaseRecord&& record) noexcept
{
    if (record.outcome == CaseOutcome::Failed && _report.firstFailure.empty())
    {
        _report.firstFailure = record.detail;
    }
    _report.cases.push_back(std::move(record));
}

SuiteReport SuiteRunner::Finish() noexcept
{
    _report.durationMs = ElapsedMs(_startedAt);

    Trace(_suite, std::wstring(GetSuiteName(_suite)).append(_report.Succeeded() ? L": PASS" : L": FAIL"));
    try
    {
        WriteSuiteReport(_report, GetSuiteArtifact(_suite, kResultsFile));
    }
    catch (const std::bad_alloc&)
    {
        Trace(_suite, L"results.json not written: out of memory");
    }
    return std::move(_report);
}

void BeginRun(const RunOptions& options, std::wstring_view startedUtc)
{
    g_runOptions = options;
    g_runStartedUtc.assign(startedUtc);

    const std::filesystem::path& root = GetArtifactRoot();
    if (root.empty())
    {
        return;
    }

    const std::filesystem::path lastRun     = root / kLastRunDirectory;
    const std::filesystem::path previousRun = root / kPreviousRunDirectory;

    std::error_code ec;
    std::filesystem::remove_all(previousRun, ec);
    std::filesystem::rename(lastRun, previousRun, ec);
    if (ec)
    {
        std::filesystem::remove_all(lastRun, ec);
    }

    for (const SuiteEntry& entry : kSuiteEntries)
    {
        std::filesystem::create_directories(lastRun / entry.directory, ec);
    }
}

const std::filesystem::path& GetArtifactRoot() noexcept
{
    static const std::filesystem::path root = []() noexcept
    {
        wil::unique_cotaskmem_string localAppData;
        if (FAILED(SHGetKnownFolderPath(FOLDERID_LocalAppData, KF_FLAG_DEFAULT, nullptr, localAppData.put())) || ! localAppData)
        {
            return std::filesystem::path{};
        }

        try
        {
            return std::filesystem::path(localAppData.get()) / kProductDirectory / kSelfTestDirectory;
        }
        catch (const std::bad_alloc&)
        {
            return std::filesystem::path{};
        }
    }();
    return root;
}

std::filesystem::path GetSuiteDirectory(Suite suite)
{
    const std::filesystem::path& root = GetArtifactRoot();
    const SuiteEntry* entry           = FindSuiteEntry(suite);
    if (root.empty() || ! entry)
    {
        return {};
    }
    return root / kLastRunDirectory / entry->directory;
}

std::filesystem::path GetSuiteArtifact(Suite suite, std::wstring_view fileName)
{
    const std::filesystem::path directory = GetSuiteDirectory(suite);
    if (directory.empty() || fileName.empty())
    {
        return {};
    }
    return directory / fileName;
}

std::filesystem::path MakeScratchDirectory(Suite suite, std::wstring_view caseName)
{
    const std::filesystem::path directory = GetSuiteDirectory(suite);
    if (directory.empty() || caseName.empty())
    {
        return {};
    }

    std::filesystem::path scratch = directory / kWorkDirectory / caseName;
    std::error_code ec;
    std::filesystem::remove_all(scratch, ec);
    if (! EnsureDirectory(scratch))
    {
        return {};
    }
    return scratch;
}

bool EnsureDirectory(const std::filesystem::path& path) noexcept
{
    if (path.empty())
    {
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return ! ec && std::filesystem::is_directory(path, ec);
}

bool PathExists(const std::filesystem::path& path) noexcept
{
    std::error_code ec;
    return ! path.empty() && std::filesystem::exists(path, ec) && ! ec;
}

bool WriteTextFile(const std::filesystem::path& path, std::string_view text) noexcept
{
    return WriteBytes(path, text.data(), text.size());
}

bool ReadTextFile(const std::filesystem::path& path, std::string& text) noexcept
{
    text.clear();

    wil::unique_hfile file(CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr));
    if (! file)
    {
        return false;
    }

    LARGE_INTEGER size{};
    if (! GetFileSizeEx(file.get(), &size) || size.QuadPart > 16 * 1024 * 1024)
    {
        return false;
    }

    try
    {
        text.resize(static_cast<size_t>(size.QuadPart));
    }
    catch (const std::bad_alloc&)
    {
        return false;
    }

    DWORD read = 0;
    if (! text.empty() && ! ReadFile(file.get(), text.data(), static_cast<DWORD>(text.size()), &read, nullptr))
    {
        text.clear();
        return false;
    }

    text.resize(static_cast<size_t>(read));
    return true;
}

void WriteRunReport(const RunReport& report, const std::filesystem::path& path) noexcept
{
    if (! g_runOptions.writeJson || path.empty())
    {
        return;
    }

    unique_yyjson_mut_doc doc(yyjson_mut_doc_new(nullptr));
    yyjson_mut_val* root = doc ? yyjson_mut_obj(doc.get()) : nullptr;
    if (! root)
    {
        return;
    }
    yyjson_mut_doc_set_root(doc.get(), root);

    AddString(doc.get(), root, "run_started_utc", report.startedUtc);
    yyjson_mut_obj_add_uint(doc.get(), root, "duration_ms", report.durationMs);
    yyjson_mut_obj_add_bool(doc.get(), root, "fail_fast", report.failFast);

    int failed             = 0;
    yyjson_mut_val* suites = yyjson_mut_arr(doc.get());
    for (const SuiteReport& suite : report.suites)
    {
        failed += suite.Count(CaseOutcome::Failed);
        if (yyjson_mut_val* suiteObj = BuildSuiteObject(doc.get(), suite); suiteObj && suites)
        {
            static_cast<void>(yyjson_mut_arr_add_val(suites, suiteObj));
        }
    }

    if (suites)
    {
        yyjson_mut_obj_add_val(doc.get(), root, "suites", suites);
    }
    yyjson_mut_obj_add_bool(doc.get(), root, "succeeded", failed == 0);

    WriteDocument(doc.get(), path);
}
} // namespace SelfTest
