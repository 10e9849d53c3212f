#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <shobjidl_core.h>

#pragma warning(push)
// WIL: C4625 (copy ctor deleted), C4626 (copy assign deleted), C5026 (move ctor deleted), C5027 (move assign deleted)
#pragma warning(disable : 4625 4626 5026 5027)
#include <wil/com.h>
#pragma warning(pop)

#include "ShellFileOperator/Errors.h"
#include "ShellFileOperator/Flags.h"
#include "ShellFileOperator/ProgressHandler.h"

namespace ShellFileOperatorInternal
{
class ProgressSinkAdapter;
class OutcomeRecorder;
} // namespace ShellFileOperatorInternal

namespace ShellFileOperator
{
using ItemHandle      = wil::com_ptr<IShellItem>;
using ItemArrayHandle = wil::com_ptr<IShellItemArray>;

// Resolves `path` (made absolute first) to a shell item. When the path does not exist and `force` is
// set, the item is synthesized as a directory through a file-system bind context; nothing is created
// on disk. `error` (optional) receives the classified failure.
[[nodiscard]] HRESULT ResolveItem(std::wstring_view path, bool force, ItemHandle& item, FileOperatorError* error = nullptr) noexcept;

// Resolves every path with force == false and packs them into one shell item array.
[[nodiscard]] HRESULT ResolveItemArray(const std::vector<std::wstring>& paths, ItemArrayHandle& items, FileOperatorError* error = nullptr) noexcept;

struct RenamePlan
{
    // When set, the rename is queued as a move of `source` into `destinationDirectory`.
    bool isMove = false;
    std::wstring destinationDirectory;
    std::wstring newName;
};

// Decides how RenameItem queues a rename. Pure path arithmetic, the file system is not consulted.
// A `newName` without a directory, or whose directory equals the source directory, is a rename of the
// leaf. Any other directory turns into a move when `allowMove` is set; otherwise `newName` is passed
// to the engine as given. Relative directories resolve against the current directory.
[[nodiscard]] HRESULT PlanRename(std::wstring_view source, std::wstring_view newName, bool allowMove, RenamePlan& plan) noexcept;

enum class ItemOutcomeKind : uint8_t
{
    NewPath,
    Recycled,
    Deleted,
};

struct ItemOutcome
{
    ItemOutcomeKind kind = ItemOutcomeKind::NewPath;
    // Set for NewPath only.
    std::wstring newPath;
};

// Keyed by the source item's path as reported by the engine.
using OutcomeMap = std::unordered_map<std::wstring, ItemOutcome>;

struct CommitResult
{
    // FinishOperations result when the engine delivered one, otherwise the PerformOperations result.
    HRESULT resultCode        = S_OK;
    bool anyOperationsAborted = false;
    OutcomeMap outcomes;
};

struct FileOperatorOptions
{
    // std::nullopt keeps the engine defaults (no SetOperationFlags call).
    std::optional<FileOperationFlags> flags;
    HWND ownerWindow  = nullptr;
    bool commitOnExit = false;
    std::wstring progressMessage;
    std::shared_ptr<FileOperationProgressHandler> progressHandler;
};

enum class FileOperatorState : uint8_t
{
    Unopened,
    Open,
    Closed,
};

// One IFileOperation batch. Operations are queued between Open() and Commit(); nothing touches the
// file system before Commit(). Not thread-safe: every call must come from the thread that called Open().
// The instance may be reopened after Close().
class FileOperator final
{
public:
    explicit FileOperator(FileOperatorOptions options = {});
    ~FileOperator();

    FileOperator(const FileOperator&)            = delete;
    FileOperator(FileOperator&&)                 = delete;
    FileOperator& operator=(const FileOperator&) = delete;
    FileOperator& operator=(FileOperator&&)      = delete;

    // Fails with E_ILLEGAL_METHOD_CALL (kind Reentrancy) while already open.
    HRESULT Open() noexcept;
    // Commits first when commitOnExit and allowCommit are both set. Always releases the engine.
    HRESULT Close(bool allowCommit = true) noexcept;

    HRESULT MoveItem(std::wstring_view source, std::wstring_view destinationDirectory, std::optional<std::wstring_view> newName = std::nullopt) noexcept;
    HRESULT MoveItems(const std::vector<std::wstring>& sources, std::wstring_view destinationDirectory) noexcept;
    HRESULT CopyItem(std::wstring_view source, std::wstring_view destinationDirectory, std::optional<std::wstring_view> newName = std::nullopt) noexcept;
    HRESULT CopyItems(const std::vector<std::wstring>& sources, std::wstring_view destinationDirectory) noexcept;
    HRESULT RenameItem(std::wstring_view source, std::wstring_view newName, bool allowMove = true) noexcept;
    HRESULT RenameItems(const std::vector<std::wstring>& sources, std::wstring_view newName) noexcept;
    HRESULT DeleteItem(std::wstring_view source) noexcept;
    HRESULT DeleteItems(const std::vector<std::wstring>& sources) noexcept;
    HRESULT NewItem(std::wstring_view destinationDirectory,
                    FileAttributeFlags attributes,
                    std::wstring_view name,
                    std::optional<std::wstring_view> templateName = std::nullopt) noexcept;

    // Runs every queued operation in one PerformOperations call.
    HRESULT Commit(CommitResult& result) noexcept;

    [[nodiscard]] FileOperatorState GetState() const noexcept;
    [[nodiscard]] bool HasQueuedOperations() const noexcept;
    [[nodiscard]] const FileOperatorOptions& GetOptions() const noexcept;
    [[nodiscard]] const FileOperatorError& LastError() const noexcept;
    // Result of the most recent successful commit, including the one made by Close().
    [[nodiscard]] const CommitResult& LastCommitResult() const noexcept;

    // Rethrows the first exception a progress handler threw during the last commit, if any.
    void RethrowHandlerException() const;

private:
    HRESULT RequireOpen(std::wstring_view operation) noexcept;
    HRESULT Fail(HRESULT hr, std::wstring_view path) noexcept;
    HRESULT Fail(FileOperatorError&& error) noexcept;
    HRESULT Fail(FileOperatorErrorKind kind, HRESULT hr, std::wstring_view message, std::wstring_view path = {}) noexcept;
    void ReleaseEngine() noexcept;

    FileOperatorOptions _options;
    FileOperatorState _state = FileOperatorState::Unopened;

    wil::com_ptr<IFileOperation> _engine;
    wil::com_ptr<IFileOperationProgressSink> _sink;
    ShellFileOperatorInternal::ProgressSinkAdapter* _sinkImpl = nullptr;
    std::shared_ptr<ShellFileOperatorInternal::OutcomeRecorder> _recorder;
    DWORD _adviseCookie    = 0;
    bool _coInitialized    = false;
    bool _operationsQueued = false;

    FileOperatorError _lastError;
    CommitResult _lastCommit;
    std::exception_ptr _handlerException;
};

// Opens `fileOperator` on construction and closes it on destruction. The destructor commits (when the
// options ask for it) only if the scope unwinds normally and Abandon() was not called.
class FileOperatorScope final
{
public:
    explicit FileOperatorScope(FileOperator& fileOperator) noexcept;
    ~FileOperatorScope();

    FileOperatorScope(const FileOperatorScope&)            = delete;
    FileOperatorScope(FileOperatorScope&&)                 = delete;
    FileOperatorScope& operator=(const FileOperatorScope&) = delete;
    FileOperatorScope& operator=(FileOperatorScope&&)      = delete;

    [[nodiscard]] HRESULT GetOpenResult() const noexcept
    {
        return _openHr;
    }

    // Close result from the destructor is not observable; call this to close early and inspect it.
    HRESULT Close() noexcept;

    void Abandon() noexcept
    {
        _abandoned = true;
    }

private:
    FileOperator* _fileOperator = nullptr;
    HRESULT _openHr             = S_OK;
    int _uncaughtExceptions     = 0;
    bool _abandoned             = false;
    bool _closed                = false;
};
} // namespace ShellFileOperator
