#include "ShellFileOperator.Internal.h"

#include <new>

#include <shlobj_core.h>

namespace
{
// Find data reported to the shell parser for paths that do not exist yet. The directory attribute makes
// SHCreateItemFromParsingName produce a folder item instead of failing with "not found".
class FolderBindData final : public IFileSystemBindData
{
public:
    FolderBindData() noexcept
    {
        _findData.dwFileAttributes = FILE_ATTRIBUTE_DIRECTORY;
    }

    FolderBindData(const FolderBindData&)            = delete;
    FolderBindData(FolderBindData&&)                 = delete;
    FolderBindData& operator=(const FolderBindData&) = delete;
    FolderBindData& operator=(FolderBindData&&)      = delete;

    HRESULT STDMETHODCALLTYPE QueryInterface(REFIID riid, void** ppvObject) noexcept override
    {
        if (ppvObject == nullptr)
        {
            return E_POINTER;
        }

        if (riid == __uuidof(IUnknown) || riid == __uuidof(IFileSystemBindData))
        {
            *ppvObject = static_cast<IFileSystemBindData*>(this);
            AddRef();
            return S_OK;
        }

        *ppvObject = nullptr;
        return E_NOINTERFACE;
    }

    ULONG STDMETHODCALLTYPE AddRef() noexcept override
    {
        return _refCount.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    ULONG STDMETHODCALLTYPE Release() noexcept override
    {
        const ULONG current = _refCount.fetch_sub(1, std::memory_order_acq_rel) - 1;
        if (current == 0)
        {
            delete this;
        }
        return current;
    }

    // Shared by every thread in the process: the find data is fixed at construction.
    HRESULT STDMETHODCALLTYPE SetFindData([[maybe_unused]] const WIN32_FIND_DATAW* pfd) noexcept override
    {
        return E_ACCESSDENIED;
    }

    HRESULT STDMETHODCALLTYPE GetFindData(WIN32_FIND_DATAW* pfd) noexcept override
    {
        if (pfd == nullptr)
        {
            return E_POINTER;
        }

        *pfd = _findData;
        return S_OK;
    }

private:
    ~FolderBindData() = default;

    std::atomic_ulong _refCount{1};
    WIN32_FIND_DATAW _findData{};
};
} // namespace

namespace ShellFileOperatorInternal
{
HRESULT GetFolderBindData(wil::com_ptr<IFileSystemBindData>& bindData) noexcept
{
    static const wil::com_ptr<IFileSystemBindData> s_folderBindData = []() noexcept
    {
        wil::com_ptr<IFileSystemBindData> created;
        auto* impl = new (std::nothrow) FolderBindData();
        if (impl)
        {
            created.attach(impl);
        }
        return created;
    }();

    bindData = s_folderBindData;
    return bindData ? S_OK : E_OUTOFMEMORY;
}

HRESULT CreateFolderBindContext(wil::com_ptr<IBindCtx>& bindContext) noexcept
{
    bindContext.reset();

    wil::com_ptr<IFileSystemBindData> bindData;
    HRESULT hr = GetFolderBindData(bindData);
    if (FAILED(hr))
    {
        return hr;
    }

    wil::com_ptr<IBindCtx> created;
    hr = CreateBindCtx(0, created.put());
    if (FAILED(hr))
    {
        return Debug::ErrorWithHr(hr, L"ShellFileOperator: CreateBindCtx failed");
    }

    BIND_OPTS options{};
    options.cbStruct = sizeof(options);
    options.grfMode  = STGM_CREATE;
    hr               = created->SetBindOptions(&options);
    if (FAILED(hr))
    {
        return Debug::ErrorWithHr(hr, L"ShellFileOperator: IBindCtx::SetBindOptions failed");
    }

    hr = created->RegisterObjectParam(const_cast<LPOLESTR>(STR_FILE_SYS_BIND_DATA), bindData.get());
    if (FAILED(hr))
    {
        return Debug::ErrorWithHr(hr, L"ShellFileOperator: IBindCtx::RegisterObjectParam failed");
    }

    bindContext = std::move(created);
    return S_OK;
}
} // namespace ShellFileOperatorInternal
