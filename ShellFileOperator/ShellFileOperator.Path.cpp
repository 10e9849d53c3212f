#include "ShellFileOperator.Internal.h"

#include <shlobj_core.h>

using namespace ShellFileOperatorInternal;

namespace ShellFileOperatorInternal
{
std::wstring MakeAbsolutePath(std::wstring_view path)
{
    std::wstring input(path);
    if (input.empty())
    {
        input = L".";
    }

    if (input.rfind(L"\\\\?\\", 0) == 0)
    {
        return input;
    }

    const DWORD required = GetFullPathNameW(input.c_str(), 0, nullptr, nullptr);
    if (required == 0)
    {
        return input;
    }

    std::wstring absolute(static_cast<size_t>(required) + 1, L'\0');
    const DWORD written = GetFullPathNameW(input.c_str(), static_cast<DWORD>(absolute.size()), absolute.data(), nullptr);
    if (written == 0 || written >= absolute.size())
    {
        return input;
    }

    absolute.resize(static_cast<size_t>(written));
    return absolute;
}

std::wstring_view TrimTrailingSeparators(std::wstring_view path) noexcept
{
    while (! path.empty())
    {
        const wchar_t last = path.back();
        if (last != L'\\' && last != L'/')
        {
            break;
        }
        path.remove_suffix(1);
    }
    return path;
}

std::wstring_view GetPathLeaf(std::wstring_view path) noexcept
{
    const std::wstring_view trimmed = TrimTrailingSeparators(path);
    const size_t pos                = trimmed.find_last_of(L"\\/");
    if (pos == std::wstring_view::npos)
    {
        return trimmed;
    }

    return trimmed.substr(pos + 1);
}

std::wstring GetPathDirectory(std::wstring_view path)
{
    const std::wstring_view trimmed = TrimTrailingSeparators(path);
    const size_t pos                = trimmed.find_last_of(L"\\/");
    if (pos == std::wstring_view::npos)
    {
        return {};
    }

    // "C:\name" -> "C:\" rather than the drive-relative "C:".
    if (pos == 2 && trimmed[1] == L':')
    {
        return std::wstring(trimmed.substr(0, 3));
    }

    // "\name" -> "\"
    if (pos == 0)
    {
        return std::wstring(trimmed.substr(0, 1));
    }

    return std::wstring(trimmed.substr(0, pos));
}

[[nodiscard]] bool ContainsPathSeparator(std::wstring_view text) noexcept
{
    return text.find_first_of(L"\\/") != std::wstring_view::npos;
}

[[nodiscard]] bool PathsEqualNoCase(std::wstring_view a, std::wstring_view b) noexcept
{
    return OrdinalString::EqualsNoCase(TrimTrailingSeparators(a), TrimTrailingSeparators(b));
}

[[nodiscard]] bool IsNotFoundResult(HRESULT hr) noexcept
{
    return hr == HRESULT_FROM_WIN32(ERROR_FILE_NOT_FOUND) || hr == HRESULT_FROM_WIN32(ERROR_PATH_NOT_FOUND);
}

HRESULT GetItemPath(IShellItem* item, std::wstring& path) noexcept
{
    path.clear();
    if (item == nullptr)
    {
        return E_POINTER;
    }

    wil::unique_cotaskmem_string name;
    HRESULT hr = item->GetDisplayName(SIGDN_FILESYSPATH, name.put());
    if (FAILED(hr) || ! name || name.get()[0] == L'\0')
    {
        name.reset();
        hr = item->GetDisplayName(SIGDN_NORMALDISPLAY, name.put());
        if (FAILED(hr))
        {
            return hr;
        }
    }

    if (! name)
    {
        return E_UNEXPECTED;
    }

    try
    {
        path.assign(name.get());
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }

    return S_OK;
}
} // namespace ShellFileOperatorInternal

namespace ShellFileOperator
{
HRESULT ResolveItem(std::wstring_view path, bool force, ItemHandle& item, FileOperatorError* error) noexcept
{
    item.reset();

    try
    {
        if (path.empty())
        {
            if (error)
            {
                *error = MakeFileOperatorError(E_INVALIDARG, path);
            }
            return E_INVALIDARG;
        }

        const std::wstring absolute = MakeAbsolutePath(path);

        HRESULT hr = SHCreateItemFromParsingName(absolute.c_str(), nullptr, IID_PPV_ARGS(item.put()));
        if (SUCCEEDED(hr) && item)
        {
            return S_OK;
        }

        if (force && IsNotFoundResult(hr))
        {
            wil::com_ptr<IBindCtx> bindContext;
            hr = CreateFolderBindContext(bindContext);
            if (SUCCEEDED(hr))
            {
                item.reset();
                hr = SHCreateItemFromParsingName(absolute.c_str(), bindContext.get(), IID_PPV_ARGS(item.put()));
                if (SUCCEEDED(hr) && item)
                {
                    Debug::Info(L"ShellFileOperator: resolved missing '{}' as a folder", absolute);
                    return S_OK;
                }
            }
        }

        if (SUCCEEDED(hr))
        {
            hr = E_NOINTERFACE;
        }

        item.reset();
        if (! IsNotFoundResult(hr))
        {
            Debug::ErrorWithHr(hr, L"ShellFileOperator: SHCreateItemFromParsingName failed for '{}'", absolute);
        }
        if (error)
        {
            *error = MakeFileOperatorError(hr, absolute);
        }
        return hr;
    }
    catch (const std::bad_alloc&)
    {
        item.reset();
        return E_OUTOFMEMORY;
    }
}

HRESULT ResolveItemArray(const std::vector<std::wstring>& paths, ItemArrayHandle& items, FileOperatorError* error) noexcept
{
    items.reset();

    try
    {
        std::vector<wil::unique_cotaskmem_ptr<ITEMIDLIST_ABSOLUTE>> idLists;
        std::vector<PCIDLIST_ABSOLUTE> rawIdLists;
        idLists.reserve(paths.size());
        rawIdLists.reserve(paths.size());

        for (const std::wstring& path : paths)
        {
            ItemHandle item;
            HRESULT hr = ResolveItem(path, false, item, error);
            if (FAILED(hr))
            {
                return hr;
            }

            PIDLIST_ABSOLUTE idList = nullptr;
            hr                      = SHGetIDListFromObject(item.get(), &idList);
            if (FAILED(hr) || idList == nullptr)
            {
                hr = FAILED(hr) ? hr : E_UNEXPECTED;
                if (error)
                {
                    *error = MakeFileOperatorError(hr, path);
                }
                return hr;
            }

            // Capacity is reserved, neither push_back reallocates.
            idLists.emplace_back(idList);
            rawIdLists.push_back(idList);
        }

        if (rawIdLists.empty())
        {
            return S_OK;
        }

        const HRESULT hr = SHCreateShellItemArrayFromIDLists(static_cast<UINT>(rawIdLists.size()), rawIdLists.data(), items.put());
        if (FAILED(hr))
        {
            Debug::ErrorWithHr(hr, L"ShellFileOperator: SHCreateShellItemArrayFromIDLists failed for {} items", rawIdLists.size());
            if (error)
            {
                *error = MakeFileOperatorError(hr);
            }
            items.reset();
            return hr;
        }

        return S_OK;
    }
    catch (const std::bad_alloc&)
    {
        items.reset();
        return E_OUTOFMEMORY;
    }
}

HRESULT PlanRename(std::wstring_view source, std::wstring_view newName, bool allowMove, RenamePlan& plan) noexcept
{
    plan = {};
    if (source.empty() || newName.empty())
    {
        return E_INVALIDARG;
    }

    try
    {
        if (! ContainsPathSeparator(newName))
        {
            plan.newName.assign(newName);
            return S_OK;
        }

        if (! allowMove)
        {
            // The engine rejects names carrying a directory; let it report that.
            plan.newName.assign(newName);
            return S_OK;
        }

        const std::wstring_view leaf = GetPathLeaf(newName);
        if (leaf.empty())
        {
            return E_INVALIDARG;
        }

        const std::wstring sourceDirectory      = GetPathDirectory(MakeAbsolutePath(source));
        const std::wstring destinationDirectory = MakeAbsolutePath(GetPathDirectory(newName));

        plan.newName.assign(leaf);
        if (PathsEqualNoCase(sourceDirectory, destinationDirectory))
        {
            return S_OK;
        }

        plan.isMove               = true;
        plan.destinationDirectory = destinationDirectory;
        return S_OK;
    }
    catch (const std::bad_alloc&)
    {
        plan = {};
        return E_OUTOFMEMORY;
    }
}
} // namespace ShellFileOperator
