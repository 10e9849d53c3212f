#pragma once

#include <optional>
#include <string_view>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include "ShellFileOperator/Flags.h"

namespace ShellFileOperator
{
// Host-side view of IFileOperationProgressSink. Paths are the items' file-system paths, or their
// display names when an item has none. Every handler defaults to a no-op.
//
// Handlers run on the thread that called Commit(), from inside PerformOperations. An exception thrown
// by a handler is captured by the session and reported after PerformOperations returns; the engine
// only sees E_FAIL.
class FileOperationProgressHandler
{
public:
    FileOperationProgressHandler()          = default;
    virtual ~FileOperationProgressHandler() = default;

    FileOperationProgressHandler(const FileOperationProgressHandler&)            = delete;
    FileOperationProgressHandler(FileOperationProgressHandler&&)                 = delete;
    FileOperationProgressHandler& operator=(const FileOperationProgressHandler&) = delete;
    FileOperationProgressHandler& operator=(FileOperationProgressHandler&&)      = delete;

    virtual void StartOperations()
    {
    }

    virtual void FinishOperations([[maybe_unused]] HRESULT result)
    {
    }

    virtual void PreRenameItem([[maybe_unused]] TransferSourceFlags flags, [[maybe_unused]] std::wstring_view source, [[maybe_unused]] std::wstring_view newName)
    {
    }

    virtual void PostRenameItem([[maybe_unused]] TransferSourceFlags flags,
                                [[maybe_unused]] std::wstring_view source,
                                [[maybe_unused]] std::optional<std::wstring_view> newPath,
                                [[maybe_unused]] HRESULT result)
    {
    }

    virtual void PreMoveItem([[maybe_unused]] TransferSourceFlags flags,
                             [[maybe_unused]] std::wstring_view source,
                             [[maybe_unused]] std::wstring_view destinationFolder,
                             [[maybe_unused]] std::optional<std::wstring_view> newName)
    {
    }

    virtual void PostMoveItem([[maybe_unused]] TransferSourceFlags flags,
                              [[maybe_unused]] std::wstring_view source,
                              [[maybe_unused]] std::wstring_view destinationFolder,
                              [[maybe_unused]] std::optional<std::wstring_view> newPath,
                              [[maybe_unused]] HRESULT result)
    {
    }

    virtual void PreCopyItem([[maybe_unused]] TransferSourceFlags flags,
                             [[maybe_unused]] std::wstring_view source,
                             [[maybe_unused]] std::wstring_view destinationFolder,
                             [[maybe_unused]] std::optional<std::wstring_view> newName)
    {
    }

    virtual void PostCopyItem([[maybe_unused]] TransferSourceFlags flags,
                              [[maybe_unused]] std::wstring_view source,
                              [[maybe_unused]] std::wstring_view destinationFolder,
                              [[maybe_unused]] std::optional<std::wstring_view> newPath,
                              [[maybe_unused]] HRESULT result)
    {
    }

    virtual void PreDeleteItem([[maybe_unused]] TransferSourceFlags flags, [[maybe_unused]] std::wstring_view source)
    {
    }

    // `recycled` is true when the engine reports a newly created item, i.e. the recycle-bin entry.
    virtual void PostDeleteItem([[maybe_unused]] TransferSourceFlags flags,
                                [[maybe_unused]] std::wstring_view source,
                                [[maybe_unused]] HRESULT result,
                                [[maybe_unused]] bool recycled)
    {
    }

    virtual void PreNewItem([[maybe_unused]] TransferSourceFlags flags, [[maybe_unused]] std::wstring_view destinationFolder, [[maybe_unused]] std::wstring_view newName)
    {
    }

    virtual void PostNewItem([[maybe_unused]] TransferSourceFlags flags,
                             [[maybe_unused]] std::wstring_view destinationFolder,
                             [[maybe_unused]] std::wstring_view newName,
                             [[maybe_unused]] std::optional<std::wstring_view> templateName,
                             [[maybe_unused]] FileAttributeFlags attributes,
                             [[maybe_unused]] HRESULT result,
                             [[maybe_unused]] std::optional<std::wstring_view> newPath)
    {
    }

    virtual void UpdateProgress([[maybe_unused]] unsigned int workTotal, [[maybe_unused]] unsigned int workSoFar)
    {
    }

    virtual void ResetTimer()
    {
    }

    virtual void PauseTimer()
    {
    }

    virtual void ResumeTimer()
    {
    }
};
} // namespace ShellFileOperator
