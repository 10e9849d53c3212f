#include "ShellFileOperator.Internal.h"

using namespace ShellFileOperatorInternal;
using ShellFileOperator::FileAttributeFlags;
using ShellFileOperator::TransferSourceFlags;

namespace
{
[[nodiscard]] std::wstring PathOf(IShellItem* item)
{
    std::wstring path;
    static_cast<void>(GetItemPath(item, path));
    return path;
}

// Empty when the engine supplied no item or the item has no usable name.
[[nodiscard]] std::optional<std::wstring> OptionalPathOf(IShellItem* item)
{
    if (item == nullptr)
    {
        return std::nullopt;
    }

    std::wstring path;
    if (FAILED(GetItemPath(item, path)) || path.empty())
    {
        return std::nullopt;
    }

    return path;
}

[[nodiscard]] std::optional<std::wstring_view> AsView(const std::optional<std::wstring>& text) noexcept
{
    if (! text.has_value())
    {
        return std::nullopt;
    }

    return std::wstring_view(text.value());
}

[[nodiscard]] std::optional<std::wstring_view> OptionalName(LPCWSTR name) noexcept
{
    if (name == nullptr || name[0] == L'\0')
    {
        return std::nullopt;
    }

    return std::wstring_view(name);
}

[[nodiscard]] std::wstring_view NameOrEmpty(LPCWSTR name) noexcept
{
    return name ? std::wstring_view(name) : std::wstring_view();
}

[[nodiscard]] TransferSourceFlags ToTransferSourceFlags(DWORD flags) noexcept
{
    return static_cast<TransferSourceFlags>(flags);
}
} // namespace

namespace ShellFileOperatorInternal
{
ProgressSinkAdapter::ProgressSinkAdapter(std::shared_ptr<FileOperationProgressHandler> handler) noexcept : _handler(std::move(handler))
{
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::QueryInterface(REFIID riid, void** ppvObject) noexcept
{
    if (ppvObject == nullptr)
    {
        return E_POINTER;
    }

    if (riid == __uuidof(IUnknown) || riid == __uuidof(IFileOperationProgressSink))
    {
        *ppvObject = static_cast<IFileOperationProgressSink*>(this);
        AddRef();
        return S_OK;
    }

    *ppvObject = nullptr;
    return E_NOINTERFACE;
}

ULONG STDMETHODCALLTYPE ProgressSinkAdapter::AddRef() noexcept
{
    return _refCount.fetch_add(1, std::memory_order_relaxed) + 1;
}

ULONG STDMETHODCALLTYPE ProgressSinkAdapter::Release() noexcept
{
    const ULONG current = _refCount.fetch_sub(1, std::memory_order_acq_rel) - 1;
    if (current == 0)
    {
        delete this;
    }
    return current;
}

template <typename TCall> HRESULT ProgressSinkAdapter::Forward(const wchar_t* callbackName, TCall&& call) noexcept
{
    if (! _handler)
    {
        return S_OK;
    }

    try
    {
        call(*_handler);
        return S_OK;
    }
    catch (const std::exception& ex)
    {
        CaptureHandlerException(callbackName, std::current_exception(), ex.what());
    }
    catch (...)
    {
        // Not swallowed: kept and rethrown by FileOperator::RethrowHandlerException().
        CaptureHandlerException(callbackName, std::current_exception(), {});
    }

    return E_FAIL;
}

void ProgressSinkAdapter::CaptureHandlerException(const wchar_t* callbackName, std::exception_ptr exception, std::string_view what) noexcept
{
    if (_handlerException)
    {
        Debug::Warning(L"ShellFileOperator: progress handler threw again in {}, keeping the first exception", callbackName);
        return;
    }

    _handlerException = std::move(exception);

    try
    {
        _handlerExceptionMessage = what.empty() ? std::wstring(L"progress handler threw a non-standard exception") : Utf16FromUtf8(what);
    }
    catch (const std::bad_alloc&)
    {
        _handlerExceptionMessage.clear();
    }

    Debug::Error(L"ShellFileOperator: progress handler threw in {}: {}", callbackName, _handlerExceptionMessage);
}

bool ProgressSinkAdapter::HasHandlerException() const noexcept
{
    return static_cast<bool>(_handlerException);
}

const std::wstring& ProgressSinkAdapter::GetHandlerExceptionMessage() const noexcept
{
    return _handlerExceptionMessage;
}

std::exception_ptr ProgressSinkAdapter::TakeHandlerException() noexcept
{
    std::exception_ptr exception = std::move(_handlerException);
    _handlerException            = nullptr;
    return exception;
}

void ProgressSinkAdapter::ResetHandlerException() noexcept
{
    _handlerException = nullptr;
    _handlerExceptionMessage.clear();
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::StartOperations() noexcept
{
    return Forward(L"StartOperations", [](FileOperationProgressHandler& handler) { handler.StartOperations(); });
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::FinishOperations(HRESULT hrResult) noexcept
{
    return Forward(L"FinishOperations", [&](FileOperationProgressHandler& handler) { handler.FinishOperations(hrResult); });
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::PreRenameItem(DWORD flags, IShellItem* item, LPCWSTR newName) noexcept
{
    return Forward(L"PreRenameItem",
                   [&](FileOperationProgressHandler& handler) { handler.PreRenameItem(ToTransferSourceFlags(flags), PathOf(item), NameOrEmpty(newName)); });
}

HRESULT STDMETHODCALLTYPE
ProgressSinkAdapter::PostRenameItem(DWORD flags, IShellItem* item, [[maybe_unused]] LPCWSTR newName, HRESULT hrRename, IShellItem* newlyCreated) noexcept
{
    return Forward(L"PostRenameItem",
                   [&](FileOperationProgressHandler& handler)
                   {
                       const std::optional<std::wstring> newPath = OptionalPathOf(newlyCreated);
                       handler.PostRenameItem(ToTransferSourceFlags(flags), PathOf(item), AsView(newPath), hrRename);
                   });
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::PreMoveItem(DWORD flags, IShellItem* item, IShellItem* destinationFolder, LPCWSTR newName) noexcept
{
    return Forward(L"PreMoveItem",
                   [&](FileOperationProgressHandler& handler)
                   { handler.PreMoveItem(ToTransferSourceFlags(flags), PathOf(item), PathOf(destinationFolder), OptionalName(newName)); });
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::PostMoveItem(
    DWORD flags, IShellItem* item, IShellItem* destinationFolder, [[maybe_unused]] LPCWSTR newName, HRESULT hrMove, IShellItem* newlyCreated) noexcept
{
    return Forward(L"PostMoveItem",
                   [&](FileOperationProgressHandler& handler)
                   {
                       const std::optional<std::wstring> newPath = OptionalPathOf(newlyCreated);
                       handler.PostMoveItem(ToTransferSourceFlags(flags), PathOf(item), PathOf(destinationFolder), AsView(newPath), hrMove);
                   });
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::PreCopyItem(DWORD flags, IShellItem* item, IShellItem* destinationFolder, LPCWSTR newName) noexcept
{
    return Forward(L"PreCopyItem",
                   [&](FileOperationProgressHandler& handler)
                   { handler.PreCopyItem(ToTransferSourceFlags(flags), PathOf(item), PathOf(destinationFolder), OptionalName(newName)); });
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::PostCopyItem(
    DWORD flags, IShellItem* item, IShellItem* destinationFolder, [[maybe_unused]] LPCWSTR newName, HRESULT hrCopy, IShellItem* newlyCreated) noexcept
{
    return Forward(L"PostCopyItem",
                   [&](FileOperationProgressHandler& handler)
                   {
                       const std::optional<std::wstring> newPath = OptionalPathOf(newlyCreated);
                       handler.PostCopyItem(ToTransferSourceFlags(flags), PathOf(item), PathOf(destinationFolder), AsView(newPath), hrCopy);
                   });
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::PreDeleteItem(DWORD flags, IShellItem* item) noexcept
{
    return Forward(L"PreDeleteItem", [&](FileOperationProgressHandler& handler) { handler.PreDeleteItem(ToTransferSourceFlags(flags), PathOf(item)); });
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::PostDeleteItem(DWORD flags, IShellItem* item, HRESULT hrDelete, IShellItem* newlyCreated) noexcept
{
    // The engine only reports a newly created item for a delete when the item went to the recycle bin.
    const bool recycled = newlyCreated != nullptr;
    return Forward(L"PostDeleteItem",
                   [&](FileOperationProgressHandler& handler) { handler.PostDeleteItem(ToTransferSourceFlags(flags), PathOf(item), hrDelete, recycled); });
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::PreNewItem(DWORD flags, IShellItem* destinationFolder, LPCWSTR newName) noexcept
{
    return Forward(L"PreNewItem",
                   [&](FileOperationProgressHandler& handler)
                   { handler.PreNewItem(ToTransferSourceFlags(flags), PathOf(destinationFolder), NameOrEmpty(newName)); });
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::PostNewItem(DWORD flags,
                                                           IShellItem* destinationFolder,
                                                           LPCWSTR newName,
                                                           LPCWSTR templateName,
                                                           DWORD fileAttributes,
                                                           HRESULT hrNew,
                                                           IShellItem* newItem) noexcept
{
    return Forward(L"PostNewItem",
                   [&](FileOperationProgressHandler& handler)
                   {
                       const std::optional<std::wstring> newPath = OptionalPathOf(newItem);
                       handler.PostNewItem(ToTransferSourceFlags(flags),
                                           PathOf(destinationFolder),
                                           NameOrEmpty(newName),
                                           OptionalName(templateName),
                                           static_cast<FileAttributeFlags>(fileAttributes),
                                           hrNew,
                                           AsView(newPath));
                   });
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::UpdateProgress(UINT workTotal, UINT workSoFar) noexcept
{
    return Forward(L"UpdateProgress", [&](FileOperationProgressHandler& handler) { handler.UpdateProgress(workTotal, workSoFar); });
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::ResetTimer() noexcept
{
    return Forward(L"ResetTimer", [](FileOperationProgressHandler& handler) { handler.ResetTimer(); });
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::PauseTimer() noexcept
{
    return Forward(L"PauseTimer", [](FileOperationProgressHandler& handler) { handler.PauseTimer(); });
}

HRESULT STDMETHODCALLTYPE ProgressSinkAdapter::ResumeTimer() noexcept
{
    return Forward(L"ResumeTimer", [](FileOperationProgressHandler& handler) { handler.ResumeTimer(); });
}
} // namespace ShellFileOperatorInternal
