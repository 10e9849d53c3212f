#pragma once

#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "Helpers.h"
#include "ShellFileOperator/FileOperator.h"

#include <shobjidl_core.h>

namespace ShellFileOperatorInternal
{
using ShellFileOperator::FileOperationProgressHandler;
using ShellFileOperator::OutcomeMap;

// Path helpers (ShellFileOperator.Path.cpp)
std::wstring MakeAbsolutePath(std::wstring_view path);
std::wstring_view TrimTrailingSeparators(std::wstring_view path) noexcept;
std::wstring_view GetPathLeaf(std::wstring_view path) noexcept;
// Keeps the separator of a drive root ("C:\f.txt" -> "C:\").
std::wstring GetPathDirectory(std::wstring_view path);
[[nodiscard]] bool ContainsPathSeparator(std::wstring_view text) noexcept;
[[nodiscard]] bool PathsEqualNoCase(std::wstring_view a, std::wstring_view b) noexcept;

[[nodiscard]] bool IsNotFoundResult(HRESULT hr) noexcept;

// SIGDN_FILESYSPATH, falling back to SIGDN_NORMALDISPLAY for items outside the file system.
HRESULT GetItemPath(IShellItem* item, std::wstring& path) noexcept;

// Folder bind data (ShellFileOperator.BindData.cpp)
// Process-wide IFileSystemBindData whose find data carries FILE_ATTRIBUTE_DIRECTORY. Never mutated after creation.
HRESULT GetFolderBindData(wil::com_ptr<IFileSystemBindData>& bindData) noexcept;
// New bind context holding the folder bind data under STR_FILE_SYS_BIND_DATA. One per resolution.
HRESULT CreateFolderBindContext(wil::com_ptr<IBindCtx>& bindContext) noexcept;

// Encoding (ShellFileOperator.Configuration.cpp)
[[nodiscard]] std::string Utf8FromUtf16(std::wstring_view text) noexcept;
[[nodiscard]] std::wstring Utf16FromUtf8(std::string_view text) noexcept;

// Session handler: records per-item outcomes and the FinishOperations result, then forwards every
// event to the caller's handler (if any).
class OutcomeRecorder final : public FileOperationProgressHandler
{
public:
    explicit OutcomeRecorder(std::shared_ptr<FileOperationProgressHandler> next) noexcept;

    void Reset() noexcept;
    [[nodiscard]] OutcomeMap TakeOutcomes() noexcept;
    [[nodiscard]] const OutcomeMap& GetOutcomes() const noexcept;
    [[nodiscard]] std::optional<HRESULT> GetFinishResult() const noexcept;

    void StartOperations() override;
    void FinishOperations(HRESULT result) override;
    void PreRenameItem(ShellFileOperator::TransferSourceFlags flags, std::wstring_view source, std::wstring_view newName) override;
    void PostRenameItem(ShellFileOperator::TransferSourceFlags flags,
                        std::wstring_view source,
                        std::optional<std::wstring_view> newPath,
                        HRESULT result) override;
    void PreMoveItem(ShellFileOperator::TransferSourceFlags flags,
                     std::wstring_view source,
                     std::wstring_view destinationFolder,
                     std::optional<std::wstring_view> newName) override;
    void PostMoveItem(ShellFileOperator::TransferSourceFlags flags,
                      std::wstring_view source,
                      std::wstring_view destinationFolder,
                      std::optional<std::wstring_view> newPath,
                      HRESULT result) override;
    void PreCopyItem(ShellFileOperator::TransferSourceFlags flags,
                     std::wstring_view source,
                     std::wstring_view destinationFolder,
                     std::optional<std::wstring_view> newName) override;
    void PostCopyItem(ShellFileOperator::TransferSourceFlags flags,
                      std::wstring_view source,
                      std::wstring_view destinationFolder,
                      std::optional<std::wstring_view> newPath,
                      HRESULT result) override;
    void PreDeleteItem(ShellFileOperator::TransferSourceFlags flags, std::wstring_view source) override;
    void PostDeleteItem(ShellFileOperator::TransferSourceFlags flags, std::wstring_view source, HRESULT result, bool recycled) override;
    void PreNewItem(ShellFileOperator::TransferSourceFlags flags, std::wstring_view destinationFolder, std::wstring_view newName) override;
    void PostNewItem(ShellFileOperator::TransferSourceFlags flags,
                     std::wstring_view destinationFolder,
                     std::wstring_view newName,
                     std::optional<std::wstring_view> templateName,
                     ShellFileOperator::FileAttributeFlags attributes,
                     HRESULT result,
                     std::optional<std::wstring_view> newPath) override;
    void UpdateProgress(unsigned int workTotal, unsigned int workSoFar) override;
    void ResetTimer() override;
    void PauseTimer() override;
    void ResumeTimer() override;

private:
    void RecordNewPath(std::wstring_view source, std::optional<std::wstring_view> newPath);

    std::shared_ptr<FileOperationProgressHandler> _next;
    OutcomeMap _outcomes;
    std::optional<HRESULT> _finishResult;
};

// IFileOperationProgressSink advised on the engine. Converts native arguments to host types and
// forwards them to a FileOperationProgressHandler. Handler exceptions never reach the engine: the
// first one is kept and the callback returns E_FAIL.
class ProgressSinkAdapter final : public IFileOperationProgressSink
{
public:
    explicit ProgressSinkAdapter(std::shared_ptr<FileOperationProgressHandler> handler) noexcept;

    ProgressSinkAdapter(const ProgressSinkAdapter&)            = delete;
    ProgressSinkAdapter(ProgressSinkAdapter&&)                 = delete;
    ProgressSinkAdapter& operator=(const ProgressSinkAdapter&) = delete;
    ProgressSinkAdapter& operator=(ProgressSinkAdapter&&)      = delete;

    HRESULT STDMETHODCALLTYPE QueryInterface(REFIID riid, void** ppvObject) noexcept override;
    ULONG STDMETHODCALLTYPE AddRef() noexcept override;
    ULONG STDMETHODCALLTYPE Release() noexcept override;

    HRESULT STDMETHODCALLTYPE StartOperations() noexcept override;
    HRESULT STDMETHODCALLTYPE FinishOperations(HRESULT hrResult) noexcept override;
    HRESULT STDMETHODCALLTYPE PreRenameItem(DWORD flags, IShellItem* item, LPCWSTR newName) noexcept override;
    HRESULT STDMETHODCALLTYPE PostRenameItem(DWORD flags, IShellItem* item, LPCWSTR newName, HRESULT hrRename, IShellItem* newlyCreated) noexcept override;
    HRESULT STDMETHODCALLTYPE PreMoveItem(DWORD flags, IShellItem* item, IShellItem* destinationFolder, LPCWSTR newName) noexcept override;
    HRESULT STDMETHODCALLTYPE
    PostMoveItem(DWORD flags, IShellItem* item, IShellItem* destinationFolder, LPCWSTR newName, HRESULT hrMove, IShellItem* newlyCreated) noexcept override;
    HRESULT STDMETHODCALLTYPE PreCopyItem(DWORD flags, IShellItem* item, IShellItem* destinationFolder, LPCWSTR newName) noexcept override;
    HRESULT STDMETHODCALLTYPE
    PostCopyItem(DWORD flags, IShellItem* item, IShellItem* destinationFolder, LPCWSTR newName, HRESULT hrCopy, IShellItem* newlyCreated) noexcept override;
    HRESULT STDMETHODCALLTYPE PreDeleteItem(DWORD flags, IShellItem* item) noexcept override;
    HRESULT STDMETHODCALLTYPE PostDeleteItem(DWORD flags, IShellItem* item, HRESULT hrDelete, IShellItem* newlyCreated) noexcept override;
    HRESULT STDMETHODCALLTYPE PreNewItem(DWORD flags, IShellItem* destinationFolder, LPCWSTR newName) noexcept override;
    HRESULT STDMETHODCALLTYPE PostNewItem(DWORD flags,
                                          IShellItem* destinationFolder,
                                          LPCWSTR newName,
                                          LPCWSTR templateName,
                                          DWORD fileAttributes,
                                          HRESULT hrNew,
                                          IShellItem* newItem) noexcept override;
    HRESULT STDMETHODCALLTYPE UpdateProgress(UINT workTotal, UINT workSoFar) noexcept override;
    HRESULT STDMETHODCALLTYPE ResetTimer() noexcept override;
    HRESULT STDMETHODCALLTYPE PauseTimer() noexcept override;
    HRESULT STDMETHODCALLTYPE ResumeTimer() noexcept override;

    [[nodiscard]] bool HasHandlerException() const noexcept;
    [[nodiscard]] const std::wstring& GetHandlerExceptionMessage() const noexcept;
    [[nodiscard]] std::exception_ptr TakeHandlerException() noexcept;
    void ResetHandlerException() noexcept;

private:
    ~ProgressSinkAdapter() = default;

    template <typename TCall> HRESULT Forward(const wchar_t* callbackName, TCall&& call) noexcept;
    void CaptureHandlerException(const wchar_t* callbackName, std::exception_ptr exception, std::string_view what) noexcept;

    std::atomic_ulong _refCount{1};
    std::shared_ptr<FileOperationProgressHandler> _handler;
    std::exception_ptr _handlerException;
    std::wstring _handlerExceptionMessage;
};
} // namespace ShellFileOperatorInternal
