#include "ShellFileOperator.Internal.h"

#include <limits>

#include <yyjson.h>

#include "ShellFileOperator/Configuration.h"

using namespace ShellFileOperatorInternal;

namespace ShellFileOperatorInternal
{
[[nodiscard]] std::string Utf8FromUtf16(std::wstring_view text) noexcept
{
    if (text.empty() || text.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
    {
        return {};
    }

    const int len = WideCharToMultiByte(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), nullptr, 0, nullptr, nullptr);
    if (len <= 0)
    {
        return {};
    }

    std::string result;
    try
    {
        result.resize(static_cast<size_t>(len));
    }
    catch (const std::bad_alloc&)
    {
        return {};
    }

    const int written = WideCharToMultiByte(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), result.data(), len, nullptr, nullptr);
    if (written != len)
    {
        return {};
    }

    return result;
}

[[nodiscard]] std::wstring Utf16FromUtf8(std::string_view text) noexcept
{
    if (text.empty() || text.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
    {
        return {};
    }

    const int len = MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), nullptr, 0);
    if (len <= 0)
    {
        return {};
    }

    std::wstring result;
    try
    {
        result.resize(static_cast<size_t>(len));
    }
    catch (const std::bad_alloc&)
    {
        return {};
    }

    const int written = MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), result.data(), len);
    if (written != len)
    {
        return {};
    }

    return result;
}
} // namespace ShellFileOperatorInternal

namespace
{
using ShellFileOperator::FileOperationFlags;
using ShellFileOperator::FlagPreset;

[[nodiscard]] std::string_view GetStringView(yyjson_val* value) noexcept
{
    const char* text = yyjson_get_str(value);
    if (text == nullptr)
    {
        return {};
    }

    return std::string_view(text, yyjson_get_len(value));
}

[[nodiscard]] HRESULT ParseFlagsValue(yyjson_val* flagsVal, FileOperationFlags& flags) noexcept
{
    flags = FileOperationFlags::None;

    if (yyjson_is_uint(flagsVal))
    {
        const uint64_t value = yyjson_get_uint(flagsVal);
        if (value > std::numeric_limits<uint32_t>::max())
        {
            return E_INVALIDARG;
        }
        flags = static_cast<FileOperationFlags>(static_cast<uint32_t>(value));
        return S_OK;
    }

    if (yyjson_is_arr(flagsVal))
    {
        size_t index     = 0;
        size_t count     = 0;
        yyjson_val* item = nullptr;
        yyjson_arr_foreach(flagsVal, index, count, item)
        {
            if (! yyjson_is_str(item))
            {
                return E_INVALIDARG;
            }

            const std::string_view name = GetStringView(item);
            FileOperationFlags flag     = FileOperationFlags::None;
            if (! ShellFileOperator::TryParseFileOperationFlagName(name, flag))
            {
                Debug::Warning(L"ShellFileOperator: unknown flag name '{}' in configuration", Utf16FromUtf8(name));
                return E_INVALIDARG;
            }
            flags |= flag;
        }
        return S_OK;
    }

    return E_INVALIDARG;
}

[[nodiscard]] bool TryFindPreset(const std::optional<FileOperationFlags>& flags, FlagPreset& preset) noexcept
{
    constexpr FlagPreset kPresets[] = {FlagPreset::Default, FlagPreset::Undo, FlagPreset::SemiSilent, FlagPreset::FullSilent};
    for (const FlagPreset candidate : kPresets)
    {
        if (ShellFileOperator::GetPresetFlags(candidate) == flags)
        {
            preset = candidate;
            return true;
        }
    }

    return false;
}
} // namespace

namespace ShellFileOperator
{
HRESULT ParseFileOperatorConfiguration(std::string_view configurationJsonUtf8, FileOperatorOptions& options) noexcept
{
    if (configurationJsonUtf8.empty())
    {
        return S_OK;
    }

    yyjson_read_err readError{};
    yyjson_doc* doc = yyjson_read_opts(const_cast<char*>(configurationJsonUtf8.data()),
                                       configurationJsonUtf8.size(),
                                       YYJSON_READ_JSON5 | YYJSON_READ_ALLOW_BOM,
                                       nullptr,
                                       &readError);
    if (! doc)
    {
        Debug::Warning(L"ShellFileOperator: configuration is not valid JSON at byte {} ({})",
                       readError.pos,
                       Utf16FromUtf8(readError.msg ? std::string_view(readError.msg) : std::string_view()));
        return HRESULT_FROM_WIN32(ERROR_INVALID_DATA);
    }
    auto freeDoc = wil::scope_exit([&] { yyjson_doc_free(doc); });

    yyjson_val* root = yyjson_doc_get_root(doc);
    if (! root || ! yyjson_is_obj(root))
    {
        return HRESULT_FROM_WIN32(ERROR_INVALID_DATA);
    }

    std::optional<FileOperationFlags> flags = options.flags;
    bool commitOnExit                       = options.commitOnExit;
    std::wstring progressMessage;
    bool hasProgressMessage = false;

    yyjson_val* presetVal = yyjson_obj_get(root, "preset");
    if (presetVal)
    {
        FlagPreset preset = FlagPreset::Default;
        if (! yyjson_is_str(presetVal) || ! TryParseFlagPreset(GetStringView(presetVal), preset))
        {
            Debug::Warning(L"ShellFileOperator: unknown preset in configuration");
            return E_INVALIDARG;
        }
        flags = GetPresetFlags(preset);
    }

    yyjson_val* flagsVal = yyjson_obj_get(root, "flags");
    if (flagsVal)
    {
        FileOperationFlags parsed = FileOperationFlags::None;
        const HRESULT hr          = ParseFlagsValue(flagsVal, parsed);
        if (FAILED(hr))
        {
            return hr;
        }

        // Without a preset key, "flags" replaces the current flags rather than extending them.
        const FileOperationFlags base = presetVal ? flags.value_or(FileOperationFlags::None) : FileOperationFlags::None;
        flags                         = base | parsed;
    }

    yyjson_val* commitVal = yyjson_obj_get(root, "commitOnExit");
    if (commitVal)
    {
        if (! yyjson_is_bool(commitVal))
        {
            return E_INVALIDARG;
        }
        commitOnExit = yyjson_get_bool(commitVal);
    }

    yyjson_val* messageVal = yyjson_obj_get(root, "progressMessage");
    if (messageVal)
    {
        if (! yyjson_is_str(messageVal))
        {
            return E_INVALIDARG;
        }
        progressMessage    = Utf16FromUtf8(GetStringView(messageVal));
        hasProgressMessage = true;
    }

    options.flags        = flags;
    options.commitOnExit = commitOnExit;
    if (hasProgressMessage)
    {
        options.progressMessage = std::move(progressMessage);
    }

    return S_OK;
}

HRESULT FormatFileOperatorConfiguration(const FileOperatorOptions& options, std::string& configurationJsonUtf8) noexcept
{
    configurationJsonUtf8.clear();

    yyjson_mut_doc* doc = yyjson_mut_doc_new(nullptr);
    if (! doc)
    {
        return E_OUTOFMEMORY;
    }
    auto freeDoc = wil::scope_exit([&] { yyjson_mut_doc_free(doc); });

    yyjson_mut_val* root = yyjson_mut_obj(doc);
    yyjson_mut_doc_set_root(doc, root);

    FlagPreset preset = FlagPreset::Default;
    if (TryFindPreset(options.flags, preset))
    {
        yyjson_mut_obj_add_str(doc, root, "preset", GetFlagPresetName(preset).data());
    }
    else
    {
        yyjson_mut_val* flagNames = yyjson_mut_arr(doc);
        ForEachFileOperationFlagName(options.flags.value_or(FileOperationFlags::None),
                                     [&](std::string_view name) { yyjson_mut_arr_add_strn(doc, flagNames, name.data(), name.size()); });
        yyjson_mut_obj_add_val(doc, root, "flags", flagNames);
    }

    yyjson_mut_obj_add_bool(doc, root, "commitOnExit", options.commitOnExit);

    if (! options.progressMessage.empty())
    {
        const std::string message = Utf8FromUtf16(options.progressMessage);
        yyjson_mut_obj_add_strncpy(doc, root, "progressMessage", message.data(), message.size());
    }

    size_t length       = 0;
    const char* written = yyjson_mut_write(doc, YYJSON_WRITE_PRETTY, &length);
    if (! written)
    {
        return E_OUTOFMEMORY;
    }
    auto freeWritten = wil::scope_exit([&] { free(const_cast<char*>(written)); });

    try
    {
        configurationJsonUtf8.assign(written, length);
    }
    catch (const std::bad_alloc&)
    {
        return E_OUTOFMEMORY;
    }

    return S_OK;
}
} // namespace ShellFileOperator
