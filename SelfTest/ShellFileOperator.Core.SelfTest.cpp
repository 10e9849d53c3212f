#include "ShellFileOperator.Core.SelfTest.h"

#include <cstdint>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <vector>

#include "ShellFileOperator.Internal.h"
#include "ShellFileOperator/Configuration.h"
#include "ShellFileOperator/Errors.h"
#include "ShellFileOperator/FileOperator.h"
#include "ShellFileOperator/Flags.h"

using SelfTest::CaseState;
using namespace ShellFileOperator;

namespace
{
static_assert(NormalizeResultCode(int64_t{-2147024894}) == 0x80070002u);
static_assert(NormalizeResultCode(int64_t{0x80070002}) == 0x80070002u);

bool TestFlagValues(CaseState& state) noexcept
{
    state.Require(ToUnderlying(FileOperationFlags::Silent) == 0x4u, L"Silent must be 0x4.");
    state.Require(ToUnderlying(FileOperationFlags::NoConfirmation) == 0x10u, L"NoConfirmation must be 0x10.");
    state.Require(ToUnderlying(FileOperationFlags::RecycleOnDelete) == 0x80000u, L"RecycleOnDelete must be 0x80000.");
    state.Require(ToUnderlying(FileOperationFlags::DontDisplayLocations) == 0x80000000u, L"DontDisplayLocations must be 0x80000000.");

    state.Require(ToUnderlying(kUndoFlags) == 0x20080040u, std::format(L"undo preset: unexpected 0x{:08X}.", ToUnderlying(kUndoFlags)));
    state.Require(ToUnderlying(kSemiSilentFlags) == 0x1204u, std::format(L"semi-silent preset: unexpected 0x{:08X}.", ToUnderlying(kSemiSilentFlags)));
    state.Require(ToUnderlying(kFullSilentFlags) == 0x140614u, std::format(L"full-silent preset: unexpected 0x{:08X}.", ToUnderlying(kFullSilentFlags)));
    state.Require(! kDefaultFlags.has_value(), L"default preset must leave the engine defaults.");

    state.Require(HasFlag(kFullSilentFlags, FileOperationFlags::EarlyFailure), L"full-silent preset must fail early.");
    state.Require(! HasFlag(kSemiSilentFlags, FileOperationFlags::NoConfirmation), L"semi-silent preset must keep confirmations.");

    FileOperationFlags combined = FileOperationFlags::Silent;
    combined |= FileOperationFlags::NoErrorUi;
    state.Require(ToUnderlying(combined) == 0x404u, L"operator|= must combine bits.");
    state.Require((combined & FileOperationFlags::NoErrorUi) == FileOperationFlags::NoErrorUi, L"operator& must keep common bits.");

    state.Require(ToUnderlying(FileAttributeFlags::Directory | FileAttributeFlags::Hidden) == 0x12u, L"attribute flags must combine.");
    state.Require(ToUnderlying(FileOperationResult::Success) == 0x00270008u, L"copy engine success code must be 0x00270008.");
    state.Require(SUCCEEDED(static_cast<HRESULT>(ToUnderlying(FileOperationResult::Success))), L"copy engine success code must be a success HRESULT.");
    return true;
}

bool TestFlagNames(CaseState& state) noexcept
{
    state.Require(GetFileOperationFlagName(FileOperationFlags::AllowUndo) == "AllowUndo", L"AllowUndo name mismatch.");
    state.Require(GetFileOperationFlagName(kUndoFlags).empty(), L"a combination has no single name.");

    FileOperationFlags parsed = FileOperationFlags::None;
    state.Require(TryParseFileOperationFlagName("recycleondelete", parsed) && parsed == FileOperationFlags::RecycleOnDelete,
                  L"flag names must parse case-insensitively.");
    state.Require(! TryParseFileOperationFlagName("MultiDestFiles", parsed), L"unsupported flag name must not parse.");

    std::vector<std::string_view> names;
    ForEachFileOperationFlagName(kUndoFlags, [&](std::string_view name) { names.push_back(name); });
    state.Require(names.size() == 3u, std::format(L"undo preset: expected 3 names, got {}.", names.size()));
    if (names.size() == 3u)
    {
        state.Require(names[0] == "AllowUndo" && names[1] == "RecycleOnDelete" && names[2] == "AddUndoRecord", L"names must be listed lowest bit first.");
    }

    // 0x1 (FOF_MULTIDESTFILES) has no entry and is skipped.
    names.clear();
    ForEachFileOperationFlagName(static_cast<FileOperationFlags>(0x5u), [&](std::string_view name) { names.push_back(name); });
    state.Require(names.size() == 1u && names[0] == "Silent", L"unknown bits must be skipped.");
    return true;
}

bool TestPresets(CaseState& state) noexcept
{
    state.Require(! GetPresetFlags(FlagPreset::Default).has_value(), L"Default preset must map to no flags.");
    state.Require(GetPresetFlags(FlagPreset::Undo) == kUndoFlags, L"Undo preset mismatch.");
    state.Require(GetPresetFlags(FlagPreset::SemiSilent) == kSemiSilentFlags, L"SemiSilent preset mismatch.");
    state.Require(GetPresetFlags(FlagPreset::FullSilent) == kFullSilentFlags, L"FullSilent preset mismatch.");

    FlagPreset preset = FlagPreset::Default;
    state.Require(TryParseFlagPreset("FullSilent", preset) && preset == FlagPreset::FullSilent, L"preset names must parse case-insensitively.");
    state.Require(GetFlagPresetName(FlagPreset::SemiSilent) == "semiSilent", L"SemiSilent name mismatch.");
    state.Require(! TryParseFlagPreset("loud", preset), L"unknown preset must not parse.");
    return true;
}

bool TestResultClassification(CaseState& state) noexcept
{
    state.Require(NormalizeResultCode(HRESULT_FROM_WIN32(ERROR_FILE_NOT_FOUND)) == 0x80070002u, L"HRESULT normalization mismatch.");

    const HRESULT signedNotFound = static_cast<HRESULT>(NormalizeResultCode(int64_t{-2147024894}));
    state.Require(ClassifyResult(signedNotFound) == FileOperatorErrorKind::NotFound, L"-2147024894 must classify as NotFound.");
    state.Require(ClassifyResult(HRESULT_FROM_WIN32(ERROR_PATH_NOT_FOUND)) == FileOperatorErrorKind::NotFound, L"path not found must classify as NotFound.");

    const struct
    {
        uint32_t code;
        FileOperatorErrorKind kind;
    } expectations[] = {
        {0x8027000Bu, FileOperatorErrorKind::TypeMismatch},
        {0x8027000Cu, FileOperatorErrorKind::TypeMismatch},
        {0x80270002u, FileOperatorErrorKind::Permission},
        {0x80270021u, FileOperatorErrorKind::Permission},
        {0x80270022u, FileOperatorErrorKind::Permission},
        {0x80270029u, FileOperatorErrorKind::AlreadyExists},
        {0x8027002Cu, FileOperatorErrorKind::AlreadyExists},
        {0x80270000u, FileOperatorErrorKind::Cancelled},
        {static_cast<uint32_t>(HRESULT_FROM_WIN32(ERROR_CANCELLED)), FileOperatorErrorKind::Cancelled},
        {static_cast<uint32_t>(E_ABORT), FileOperatorErrorKind::Cancelled},
        {static_cast<uint32_t>(E_UNEXPECTED), FileOperatorErrorKind::Unexpected},
        {static_cast<uint32_t>(E_ACCESSDENIED), FileOperatorErrorKind::Permission},
        {static_cast<uint32_t>(HRESULT_FROM_WIN32(ERROR_ELEVATION_REQUIRED)), FileOperatorErrorKind::Permission},
        {static_cast<uint32_t>(E_INVALIDARG), FileOperatorErrorKind::OperationFailed},
        {0x00270008u, FileOperatorErrorKind::None},
        {0x00000000u, FileOperatorErrorKind::None},
    };

    for (const auto& expectation : expectations)
    {
        const FileOperatorErrorKind kind = ClassifyResult(static_cast<HRESULT>(expectation.code));
        state.Require(kind == expectation.kind,
                      std::format(L"0x{:08X}: expected {}, got {}.",
                                  expectation.code,
                                  GetFileOperatorErrorKindName(expectation.kind),
                                  GetFileOperatorErrorKindName(kind)));
    }
    return true;
}

bool TestErrorFormatting(CaseState& state) noexcept
{
    FileOperatorError error = MakeFileOperatorError(FileOperatorErrorKind::TypeMismatch, static_cast<HRESULT>(0x8027000Cu), L"destination is a folder", L"C:\\x");
    state.Require(error.IsError(), L"typed error must report IsError().");
    const std::wstring formatted = FormatFileOperatorError(error);
    state.Require(formatted == L"0x8027000c: destination is a folder (C:\\x)", std::format(L"unexpected format '{}'.", formatted));

    const FileOperatorError bare = MakeFileOperatorError(FileOperatorErrorKind::OperationFailed, E_FAIL, {});
    state.Require(FormatFileOperatorError(bare) == L"0x80004005: OperationFailed", L"empty message must fall back to the kind name.");

    const FileOperatorError system = MakeFileOperatorError(HRESULT_FROM_WIN32(ERROR_FILE_NOT_FOUND), L"C:\\missing");
    state.Require(system.kind == FileOperatorErrorKind::NotFound, L"system error must be classified.");
    state.Require(! system.message.empty() && system.message.back() != L'\n', L"system message must be present and trimmed.");
    state.Require(system.path == L"C:\\missing", L"system error must keep the path.");

    state.Require(! FileOperatorError{}.IsError(), L"default error must not report IsError().");
    return true;
}

bool TestPathHelpers(CaseState& state) noexcept
{
    using namespace ShellFileOperatorInternal;

    state.Require(GetPathLeaf(L"C:\\a\\b\\") == L"b", L"leaf must ignore trailing separators.");
    state.Require(GetPathLeaf(L"name.txt") == L"name.txt", L"leaf of a bare name is the name.");
    state.Require(GetPathDirectory(L"C:\\f.txt") == L"C:\\", L"directory of a root entry must keep the drive root.");
    state.Require(GetPathDirectory(L"C:\\a\\b/f.txt") == L"C:\\a\\b", L"forward slashes must separate too.");
    state.Require(GetPathDirectory(L"f.txt").empty(), L"bare name has no directory.");
    state.Require(PathsEqualNoCase(L"C:\\A\\", L"c:\\a"), L"path comparison must ignore case and trailing separators.");
    state.Require(! ContainsPathSeparator(L"g.txt") && ContainsPathSeparator(L"b/g.txt"), L"separator detection mismatch.");
    state.Require(IsNotFoundResult(HRESULT_FROM_WIN32(ERROR_PATH_NOT_FOUND)) && ! IsNotFoundResult(E_ACCESSDENIED), L"not-found detection mismatch.");
    return true;
}

bool TestPlanRename(CaseState& state) noexcept
{
    RenamePlan plan;
    state.Require(SUCCEEDED(PlanRename(L"C:\\a\\f.txt", L"g.txt", true, plan)), L"plain rename must plan.");
    state.Require(! plan.isMove && plan.newName == L"g.txt", L"plain rename must stay a rename.");

    state.Require(SUCCEEDED(PlanRename(L"C:\\a\\f.txt", L"C:\\b\\g.txt", true, plan)), L"cross-directory rename must plan.");
    state.Require(plan.isMove, L"cross-directory rename must become a move.");
    state.Require(plan.destinationDirectory == L"C:\\b", std::format(L"move destination: got '{}'.", plan.destinationDirectory));
    state.Require(plan.newName == L"g.txt", std::format(L"move name: got '{}'.", plan.newName));

    state.Require(SUCCEEDED(PlanRename(L"C:\\a\\f.txt", L"C:\\A\\g.txt", true, plan)), L"same-directory rename must plan.");
    state.Require(! plan.isMove && plan.newName == L"g.txt", L"same directory (case-insensitive) must stay a rename of the leaf.");

    state.Require(SUCCEEDED(PlanRename(L"C:\\a\\f.txt", L"C:\\b\\g.txt", false, plan)), L"rename without move must plan.");
    state.Require(! plan.isMove && plan.newName == L"C:\\b\\g.txt", L"rename without move must pass the name through.");

    state.RequireResult(PlanRename(L"C:\\a\\f.txt", L"", true, plan), E_INVALIDARG, L"PlanRename with an empty name");
    return true;
}

bool TestConfigurationParse(CaseState& state) noexcept
{
    FileOperatorOptions options;
    HRESULT hr = ParseFileOperatorConfiguration(R"({"preset":"undo","flags":["NoConfirmation"],"commitOnExit":true,"progressMessage":"Archiving"})", options);
    state.RequireSucceeded(hr, L"parse");
    state.Require(options.flags == (kUndoFlags | FileOperationFlags::NoConfirmation), L"flags must be OR-ed onto the preset.");
    state.Require(options.commitOnExit, L"commitOnExit must be read.");
    state.Require(options.progressMessage == L"Archiving", L"progressMessage must be read.");

    hr = ParseFileOperatorConfiguration(R"({"flags":16})", options);
    state.Require(SUCCEEDED(hr) && options.flags == FileOperationFlags::NoConfirmation, L"numeric flags without a preset must replace the flags.");
    state.Require(options.commitOnExit && options.progressMessage == L"Archiving", L"absent keys must leave options unchanged.");

    hr = ParseFileOperatorConfiguration("{ /* engine defaults */ \"preset\": \"default\", }", options);
    state.Require(SUCCEEDED(hr) && ! options.flags.has_value(), L"JSON5 default preset must clear the flags.");

    state.Require(SUCCEEDED(ParseFileOperatorConfiguration({}, options)), L"empty configuration must be accepted.");
    return true;
}

bool TestConfigurationRejects(CaseState& state) noexcept
{
    FileOperatorOptions options;
    options.flags        = kSemiSilentFlags;
    options.commitOnExit = true;

    const struct
    {
        std::string_view json;
        HRESULT expected;
    } cases[] = {
        {"not json", HRESULT_FROM_WIN32(ERROR_INVALID_DATA)},
        {"[1]", HRESULT_FROM_WIN32(ERROR_INVALID_DATA)},
        {R"({"preset":"loud"})", E_INVALIDARG},
        {R"({"flags":["Nope"]})", E_INVALIDARG},
        {R"({"flags":-1})", E_INVALIDARG},
        {R"({"flags":"Silent"})", E_INVALIDARG},
        {R"({"commitOnExit":"yes"})", E_INVALIDARG},
        {R"({"progressMessage":7})", E_INVALIDARG},
    };

    for (const auto& item : cases)
    {
        const HRESULT hr = ParseFileOperatorConfiguration(item.json, options);
        state.Require(hr == item.expected, std::format(L"case {}: expected 0x{:08X}, got 0x{:08X}.", static_cast<size_t>(&item - cases), NormalizeResultCode(item.expected), NormalizeResultCode(hr)));
    }

    state.Require(options.flags == kSemiSilentFlags && options.commitOnExit, L"rejected configuration must leave options unchanged.");
    return true;
}

bool TestConfigurationFormat(CaseState& state) noexcept
{
    FileOperatorOptions options;
    options.flags           = kFullSilentFlags;
    options.commitOnExit    = true;
    options.progressMessage = L"Moving";

    std::string json;
    HRESULT hr = FormatFileOperatorConfiguration(options, json);
    state.RequireSucceeded(hr, L"format");
    state.Require(json.find("\"fullSilent\"") != std::string::npos, L"preset flags must be written as the preset name.");
    state.Require(json.find("\"flags\"") == std::string::npos, L"preset flags must not be written as names.");

    FileOperatorOptions reread;
    hr = ParseFileOperatorConfiguration(json, reread);
    state.Require(SUCCEEDED(hr), L"formatted configuration must parse.");
    state.Require(reread.flags == options.flags && reread.commitOnExit && reread.progressMessage == L"Moving", L"formatted configuration must read back.");

    options.flags = FileOperationFlags::NoConfirmation | FileOperationFlags::Silent;
    options.progressMessage.clear();
    hr = FormatFileOperatorConfiguration(options, json);
    state.RequireSucceeded(hr, L"format of custom flags");
    const size_t silent         = json.find("\"Silent\"");
    const size_t noConfirmation = json.find("\"NoConfirmation\"");
    state.Require(silent != std::string::npos && noConfirmation != std::string::npos && silent < noConfirmation, L"custom flags must be written as names.");
    state.Require(json.find("\"preset\"") == std::string::npos, L"custom flags must not be written as a preset.");
    state.Require(json.find("\"progressMessage\"") == std::string::npos, L"empty progressMessage must be omitted.");

    if (const std::filesystem::path artifact = SelfTest::GetSuiteArtifact(SelfTest::Suite::Core, L"configuration.json"); ! artifact.empty())
    {
        static_cast<void>(SelfTest::WriteTextFile(artifact, json));
    }
    return true;
}
} // namespace

SelfTest::SuiteReport CoreSelfTest::Run(const SelfTest::RunOptions& options) noexcept
{
    SelfTest::SuiteRunner runner(SelfTest::Suite::Core, options);

    runner.Case(L"flag_values", [](CaseState& state) noexcept { return TestFlagValues(state); });
    runner.Case(L"flag_names", [](CaseState& state) noexcept { return TestFlagNames(state); });
    runner.Case(L"flag_presets", [](CaseState& state) noexcept { return TestPresets(state); });
    runner.Case(L"result_classification", [](CaseState& state) noexcept { return TestResultClassification(state); });
    runner.Case(L"error_formatting", [](CaseState& state) noexcept { return TestErrorFormatting(state); });
    runner.Case(L"path_helpers", [](CaseState& state) noexcept { return TestPathHelpers(state); });
    runner.Case(L"plan_rename", [](CaseState& state) noexcept { return TestPlanRename(state); });
    runner.Case(L"configuration_parse", [](CaseState& state) noexcept { return TestConfigurationParse(state); });
    runner.Case(L"configuration_rejects", [](CaseState& state) noexcept { return TestConfigurationRejects(state); });
    runner.Case(L"configuration_format", [](CaseState& state) noexcept { return TestConfigurationFormat(state); });

    return runner.Finish();
}
