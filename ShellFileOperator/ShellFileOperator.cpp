// Defines the TraceLogging provider for the module (see Helpers.h).
#define SHFO_DEFINE_TRACE_PROVIDER
#include "ShellFileOperator.Internal.h"

#include <new>

#include <shlobj_core.h>

using namespace ShellFileOperatorInternal;

namespace ShellFileOperator
{
FileOperator::FileOperator(FileOperatorOptions options) : _options(std::move(options))
{
}

FileOperator::~FileOperator()
{
    // Destruction never commits: a pending batch is dropped.
    static_cast<void>(Close(false));
}

HRESULT FileOperator::Fail(HRESULT hr, std::wstring_view path) noexcept
{
    try
    {
        return Fail(MakeFileOperatorError(hr, path));
    }
    catch (const std::bad_alloc&)
    {
        _lastError      = {};
        _lastError.kind = ClassifyResult(hr);
        _lastError.code = hr;
        return hr;
    }
}

HRESULT FileOperator::Fail(FileOperatorError&& error) noexcept
{
    _lastError = std::move(error);
    if (_lastError.kind == FileOperatorErrorKind::None)
    {
        _lastError.kind = FileOperatorErrorKind::OperationFailed;
    }

    try
    {
        Debug::Error(L"ShellFileOperator: {} [{}]", FormatFileOperatorError(_lastError), GetFileOperatorErrorKindName(_lastError.kind));
    }
    catch (const std::exception&)
    {
        Debug::Error(L"ShellFileOperator: failure 0x{:08X}", NormalizeResultCode(_lastError.code));
    }

    return _lastError.code;
}

HRESULT FileOperator::Fail(FileOperatorErrorKind kind, HRESULT hr, std::wstring_view message, std::wstring_view path) noexcept
{
    try
    {
        return Fail(MakeFileOperatorError(kind, hr, message, path));
    }
    catch (const std::bad_alloc&)
    {
        _lastError      = {};
        _lastError.kind = kind;
        _lastError.code = hr;
        return hr;
    }
}

HRESULT FileOperator::RequireOpen(std::wstring_view operation) noexcept
{
    if (_state == FileOperatorState::Open && _engine)
    {
        return S_OK;
    }

    try
    {
        const std::wstring message = std::format(L"{} called on a FileOperator that is not open", operation);
        return Fail(FileOperatorErrorKind::NotOpen, E_ILLEGAL_METHOD_CALL, message);
    }
    catch (const std::exception&)
    {
        return Fail(FileOperatorErrorKind::NotOpen, E_ILLEGAL_METHOD_CALL, {});
    }
}

void FileOperator::ReleaseEngine() noexcept
{
    if (_engine && _adviseCookie != 0)
    {
        static_cast<void>(_engine->Unadvise(_adviseCookie));
    }
    _adviseCookie = 0;

    _sinkImpl = nullptr;
    _sink.reset();
    _engine.reset();
    _recorder.reset();

    if (_coInitialized)
    {
        CoUninitialize();
        _coInitialized = false;
    }
}

HRESULT FileOperator::Open() noexcept
{
    TRACER;

    if (_state == FileOperatorState::Open)
    {
        return Fail(FileOperatorErrorKind::Reentrancy, E_ILLEGAL_METHOD_CALL, L"FileOperator is already open and is not reentrant");
    }

    _lastError        = {};
    _lastCommit       = {};
    _handlerException = nullptr;
    _operationsQueued = false;

    const HRESULT coInitHr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED | COINIT_DISABLE_OLE1DDE);
    if (FAILED(coInitHr) && coInitHr != RPC_E_CHANGED_MODE)
    {
        return Fail(coInitHr, {});
    }
    // RPC_E_CHANGED_MODE: the thread is already in the MTA. The engine still works, but the balancing
    // CoUninitialize must be skipped.
    _coInitialized = SUCCEEDED(coInitHr);

    auto releaseOnFailure = wil::scope_exit([&]() noexcept { ReleaseEngine(); });

    try
    {
        _recorder = std::make_shared<OutcomeRecorder>(_options.progressHandler);
    }
    catch (const std::bad_alloc&)
    {
        return Fail(E_OUTOFMEMORY, {});
    }

    HRESULT hr = CoCreateInstance(CLSID_FileOperation, nullptr, CLSCTX_INPROC_SERVER, IID_PPV_ARGS(_engine.put()));
    if (FAILED(hr) || ! _engine)
    {
        return Fail(FAILED(hr) ? hr : E_NOINTERFACE, {});
    }

    if (_options.ownerWindow != nullptr)
    {
        hr = _engine->SetOwnerWindow(_options.ownerWindow);
        if (FAILED(hr))
        {
            return Fail(hr, {});
        }
    }

    if (_options.flags.has_value())
    {
        hr = _engine->SetOperationFlags(static_cast<DWORD>(ToUnderlying(_options.flags.value())));
        if (FAILED(hr))
        {
            return Fail(hr, {});
        }
    }

    if (! _options.progressMessage.empty())
    {
        hr = _engine->SetProgressMessage(_options.progressMessage.c_str());
        if (FAILED(hr))
        {
            return Fail(hr, {});
        }
    }

    auto* sinkImpl = new (std::nothrow) ProgressSinkAdapter(_recorder);
    if (! sinkImpl)
    {
        return Fail(E_OUTOFMEMORY, {});
    }
    _sink.attach(sinkImpl);
    _sinkImpl = sinkImpl;

    hr = _engine->Advise(_sink.get(), &_adviseCookie);
    if (FAILED(hr))
    {
        _adviseCookie = 0;
        return Fail(hr, {});
    }

    releaseOnFailure.release();
    _state = FileOperatorState::Open;

    Debug::Info(L"ShellFileOperator: opened (flags=0x{:08X}, engineDefaults={}, commitOnExit={})",
                ToUnderlying(_options.flags.value_or(FileOperationFlags::None)),
                ! _options.flags.has_value(),
                _options.commitOnExit);
    return S_OK;
}

HRESULT FileOperator::Close(bool allowCommit) noexcept
{
    TRACER;

    if (_state != FileOperatorState::Open)
    {
        return S_OK;
    }

    HRESULT hr = S_OK;
    if (_options.commitOnExit && allowCommit)
    {
        CommitResult result;
        hr = Commit(result);
    }

    ReleaseEngine();
    _state            = FileOperatorState::Closed;
    _operationsQueued = false;
    return hr;
}

HRESULT FileOperator::MoveItem(std::wstring_view source, std::wstring_view destinationDirectory, std::optional<std::wstring_view> newName) noexcept
{
    HRESULT hr = RequireOpen(L"MoveItem");
    if (FAILED(hr))
    {
        return hr;
    }

    try
    {
        FileOperatorError error;
        ItemHandle sourceItem;
        hr = ResolveItem(source, false, sourceItem, &error);
        if (FAILED(hr))
        {
            return Fail(std::move(error));
        }

        ItemHandle destinationItem;
        hr = ResolveItem(destinationDirectory, true, destinationItem, &error);
        if (FAILED(hr))
        {
            return Fail(std::move(error));
        }

        const std::optional<std::wstring> name = newName.has_value() ? std::optional<std::wstring>(std::wstring(newName.value())) : std::nullopt;
        hr = _engine->MoveItem(sourceItem.get(), destinationItem.get(), name.has_value() ? name->c_str() : nullptr, nullptr);
        if (FAILED(hr))
        {
            return Fail(hr, source);
        }

        _operationsQueued = true;
        Debug::Info(L"ShellFileOperator: queued move '{}' -> '{}'", source, destinationDirectory);
        return S_OK;
    }
    catch (const std::bad_alloc&)
    {
        return Fail(E_OUTOFMEMORY, {});
    }
}

HRESULT FileOperator::MoveItems(const std::vector<std::wstring>& sources, std::wstring_view destinationDirectory) noexcept
{
    HRESULT hr = RequireOpen(L"MoveItems");
    if (FAILED(hr) || sources.empty())
    {
        return hr;
    }

    try
    {
        FileOperatorError error;
        ItemArrayHandle sourceItems;
        hr = ResolveItemArray(sources, sourceItems, &error);
        if (FAILED(hr))
        {
            return Fail(std::move(error));
        }

        ItemHandle destinationItem;
        hr = ResolveItem(destinationDirectory, true, destinationItem, &error);
        if (FAILED(hr))
        {
            return Fail(std::move(error));
        }

        hr = _engine->MoveItems(sourceItems.get(), destinationItem.get());
        if (FAILED(hr))
        {
            return Fail(hr, destinationDirectory);
        }

        _operationsQueued = true;
        Debug::Info(L"ShellFileOperator: queued move of {} items -> '{}'", sources.size(), destinationDirectory);
        return S_OK;
    }
    catch (const std::bad_alloc&)
    {
        return Fail(E_OUTOFMEMORY, {});
    }
}

HRESULT FileOperator::CopyItem(std::wstring_view source, std::wstring_view destinationDirectory, std::optional<std::wstring_view> newName) noexcept
{
    HRESULT hr = RequireOpen(L"CopyItem");
    if (FAILED(hr))
    {
        return hr;
    }

    try
    {
        FileOperatorError error;
        ItemHandle sourceItem;
        hr = ResolveItem(source, false, sourceItem, &error);
        if (FAILED(hr))
        {
            return Fail(std::move(error));
        }

        ItemHandle destinationItem;
        hr = ResolveItem(destinationDirectory, true, destinationItem, &error);
        if (FAILED(hr))
        {
            return Fail(std::move(error));
        }

        const std::optional<std::wstring> name = newName.has_value() ? std::optional<std::wstring>(std::wstring(newName.value())) : std::nullopt;
        hr = _engine->CopyItem(sourceItem.get(), destinationItem.get(), name.has_value() ? name->c_str() : nullptr, nullptr);
        if (FAILED(hr))
        {
            return Fail(hr, source);
        }

        _operationsQueued = true;
        Debug::Info(L"ShellFileOperator: queued copy '{}' -> '{}'", source, destinationDirectory);
        return S_OK;
    }
    catch (const std::bad_alloc&)
    {
        return Fail(E_OUTOFMEMORY, {});
    }
}

HRESULT FileOperator::CopyItems(const std::vector<std::wstring>& sources, std::wstring_view destinationDirectory) noexcept
{
    HRESULT hr = RequireOpen(L"CopyItems");
    if (FAILED(hr) || sources.empty())
    {
        return hr;
    }

    try
    {
        FileOperatorError error;
        ItemArrayHandle sourceItems;
        hr = ResolveItemArray(sources, sourceItems, &error);
        if (FAILED(hr))
        {
            return Fail(std::move(error));
        }

        ItemHandle destinationItem;
        hr = ResolveItem(destinationDirectory, true, destinationItem, &error);
        if (FAILED(hr))
        {
            return Fail(std::move(error));
        }

        hr = _engine->CopyItems(sourceItems.get(), destinationItem.get());
        if (FAILED(hr))
        {
            return Fail(hr, destinationDirectory);
        }

        _operationsQueued = true;
        Debug::Info(L"ShellFileOperator: queued copy of {} items -> '{}'", sources.size(), destinationDirectory);
        return S_OK;
    }
    catch (const std::bad_alloc&)
    {
        return Fail(E_OUTOFMEMORY, {});
    }
}

HRESULT FileOperator::RenameItem(std::wstring_view source, std::wstring_view newName, bool allowMove) noexcept
{
    HRESULT hr = RequireOpen(L"RenameItem");
    if (FAILED(hr))
    {
        return hr;
    }

    try
    {
        RenamePlan plan;
        hr = PlanRename(source, newName, allowMove, plan);
        if (FAILED(hr))
        {
            return Fail(hr, source);
        }

        if (plan.isMove)
        {
            Debug::Info(L"ShellFileOperator: rename of '{}' to '{}' changes directory, queuing a move", source, newName);
            return MoveItem(source, plan.destinationDirectory, plan.newName);
        }

        FileOperatorError error;
        ItemHandle sourceItem;
        hr = ResolveItem(source, false, sourceItem, &error);
        if (FAILED(hr))
        {
            return Fail(std::move(error));
        }

        hr = _engine->RenameItem(sourceItem.get(), plan.newName.c_str(), nullptr);
        if (FAILED(hr))
        {
            return Fail(hr, source);
        }

        _operationsQueued = true;
        Debug::Info(L"ShellFileOperator: queued rename '{}' -> '{}'", source, plan.newName);
        return S_OK;
    }
    catch (const std::bad_alloc&)
    {
        return Fail(E_OUTOFMEMORY, {});
    }
}

HRESULT FileOperator::RenameItems(const std::vector<std::wstring>& sources, std::wstring_view newName) noexcept
{
    HRESULT hr = RequireOpen(L"RenameItems");
    if (FAILED(hr) || sources.empty())
    {
        return hr;
    }

    try
    {
        FileOperatorError error;
        ItemArrayHandle sourceItems;
        hr = ResolveItemArray(sources, sourceItems, &error);
        if (FAILED(hr))
        {
            return Fail(std::move(error));
        }

        const std::wstring name(newName);
        hr = _engine->RenameItems(sourceItems.get(), name.c_str());
        if (FAILED(hr))
        {
            return Fail(hr, {});
        }

        _operationsQueued = true;
        Debug::Info(L"ShellFileOperator: queued rename of {} items -> '{}'", sources.size(), name);
        return S_OK;
    }
    catch (const std::bad_alloc&)
    {
        return Fail(E_OUTOFMEMORY, {});
    }
}

HRESULT FileOperator::DeleteItem(std::wstring_view source) noexcept
{
    HRESULT hr = RequireOpen(L"DeleteItem");
    if (FAILED(hr))
    {
        return hr;
    }

    try
    {
        FileOperatorError error;
        ItemHandle sourceItem;
        hr = ResolveItem(source, false, sourceItem, &error);
        if (FAILED(hr))
        {
            return Fail(std::move(error));
        }

        hr = _engine->DeleteItem(sourceItem.get(), nullptr);
        if (FAILED(hr))
        {
            return Fail(hr, source);
        }

        _operationsQueued = true;
        Debug::Info(L"ShellFileOperator: queued delete '{}'", source);
        return S_OK;
    }
    catch (const std::bad_alloc&)
    {
        return Fail(E_OUTOFMEMORY, {});
    }
}

HRESULT FileOperator::DeleteItems(const std::vector<std::wstring>& sources) noexcept
{
    HRESULT hr = RequireOpen(L"DeleteItems");
    if (FAILED(hr) || sources.empty())
    {
        return hr;
    }

    try
    {
        FileOperatorError error;
        ItemArrayHandle sourceItems;
        hr = ResolveItemArray(sources, sourceItems, &error);
        if (FAILED(hr))
        {
            return Fail(std::move(error));
        }

        hr = _engine->DeleteItems(sourceItems.get());
        if (FAILED(hr))
        {
            return Fail(hr, {});
        }

        _operationsQueued = true;
        Debug::Info(L"ShellFileOperator: queued delete of {} items", sources.size());
        return S_OK;
    }
    catch (const std::bad_alloc&)
    {
        return Fail(E_OUTOFMEMORY, {});
    }
}

HRESULT FileOperator::NewItem(std::wstring_view destinationDirectory,
                              FileAttributeFlags attributes,
                              std::wstring_view name,
                              std::optional<std::wstring_view> templateName) noexcept
{
    HRESULT hr = RequireOpen(L"NewItem");
    if (FAILED(hr))
    {
        return hr;
    }

    if (name.empty())
    {
        return Fail(E_INVALIDARG, destinationDirectory);
    }

    try
    {
        FileOperatorError error;
        ItemHandle destinationItem;
        hr = ResolveItem(destinationDirectory, true, destinationItem, &error);
        if (FAILED(hr))
        {
            return Fail(std::move(error));
        }

        const std::wstring itemName(name);
        const std::optional<std::wstring> itemTemplate =
            templateName.has_value() ? std::optional<std::wstring>(std::wstring(templateName.value())) : std::nullopt;
        hr = _engine->NewItem(
            destinationItem.get(), static_cast<DWORD>(ToUnderlying(attributes)), itemName.c_str(), itemTemplate.has_value() ? itemTemplate->c_str() : nullptr, nullptr);
        if (FAILED(hr))
        {
            return Fail(hr, destinationDirectory);
        }

        _operationsQueued = true;
        Debug::Info(L"ShellFileOperator: queued new item '{}' in '{}'", itemName, destinationDirectory);
        return S_OK;
    }
    catch (const std::bad_alloc&)
    {
        return Fail(E_OUTOFMEMORY, {});
    }
}

HRESULT FileOperator::Commit(CommitResult& result) noexcept
{
    TRACER;

    HRESULT hr = RequireOpen(L"Commit");
    if (FAILED(hr))
    {
        return hr;
    }

    Debug::Perf::Scope perf(L"ShellFileOperator.Commit");

    try
    {
        result = {};
        _recorder->Reset();
        _sinkImpl->ResetHandlerException();
        _handlerException = nullptr;

        const bool operationsQueued = _operationsQueued;
        _operationsQueued           = false;

        const HRESULT performHr = _engine->PerformOperations();
        perf.SetHr(performHr);

        if (_sinkImpl->HasHandlerException())
        {
            _handlerException = _sinkImpl->TakeHandlerException();

            // Items finished around the throwing callback are already on disk. The engine may
            // fail PerformOperations for the vetoed item, so their outcomes are kept either way.
            BOOL anyAborted = FALSE;
            if (SUCCEEDED(_engine->GetAnyOperationsAborted(&anyAborted)))
            {
                result.anyOperationsAborted = anyAborted != FALSE;
            }
            result.resultCode = _recorder->GetFinishResult().value_or(performHr);
            result.outcomes   = _recorder->TakeOutcomes();
            _lastCommit       = result;
            return Fail(FileOperatorErrorKind::HandlerFailed, E_FAIL, _sinkImpl->GetHandlerExceptionMessage());
        }

        if (FAILED(performHr))
        {
            // The engine reports E_UNEXPECTED for an empty batch; that is not a failure.
            if (performHr == E_UNEXPECTED && ! operationsQueued)
            {
                Debug::Info(L"ShellFileOperator: commit with nothing queued");
                _lastCommit = result;
                return S_OK;
            }

            return Fail(performHr, {});
        }

        BOOL anyAborted = FALSE;
        hr              = _engine->GetAnyOperationsAborted(&anyAborted);
        if (FAILED(hr))
        {
            return Fail(hr, {});
        }

        result.resultCode           = _recorder->GetFinishResult().value_or(performHr);
        result.anyOperationsAborted = anyAborted != FALSE;
        result.outcomes             = _recorder->TakeOutcomes();
        _lastCommit                 = result;

        perf.SetCount(static_cast<uint64_t>(result.outcomes.size()));
        Debug::Info(L"ShellFileOperator: committed (result=0x{:08X}, aborted={}, outcomes={})",
                    NormalizeResultCode(result.resultCode),
                    result.anyOperationsAborted,
                    result.outcomes.size());
        return S_OK;
    }
    catch (const std::bad_alloc&)
    {
        return Fail(E_OUTOFMEMORY, {});
    }
}

FileOperatorState FileOperator::GetState() const noexcept
{
    return _state;
}

bool FileOperator::HasQueuedOperations() const noexcept
{
    return _operationsQueued;
}

const FileOperatorOptions& FileOperator::GetOptions() const noexcept
{
    return _options;
}

const FileOperatorError& FileOperator::LastError() const noexcept
{
    return _lastError;
}

const CommitResult& FileOperator::LastCommitResult() const noexcept
{
    return _lastCommit;
}

void FileOperator::RethrowHandlerException() const
{
    if (_handlerException)
    {
        std::rethrow_exception(_handlerException);
    }
}

FileOperatorScope::FileOperatorScope(FileOperator& fileOperator) noexcept
    : _fileOperator(&fileOperator),
      _uncaughtExceptions(std::uncaught_exceptions())
{
    _openHr = _fileOperator->Open();
}

FileOperatorScope::~FileOperatorScope()
{
    static_cast<void>(Close());
}

HRESULT FileOperatorScope::Close() noexcept
{
    if (_closed)
    {
        return S_OK;
    }
    _closed = true;

    // A failed Open (e.g. the operator was already open) leaves the operator to its owner.
    if (FAILED(_openHr))
    {
        return S_OK;
    }

    const bool unwinding = std::uncaught_exceptions() > _uncaughtExceptions;
    return _fileOperator->Close(! unwinding && ! _abandoned);
}
} // namespace ShellFileOperator
