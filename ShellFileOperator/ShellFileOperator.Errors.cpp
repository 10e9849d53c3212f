#include "ShellFileOperator.Internal.h"

#include <array>

namespace
{
using ShellFileOperator::FileOperationResult;
using ShellFileOperator::FileOperatorErrorKind;

struct ResultClassification
{
    uint32_t code;
    FileOperatorErrorKind kind;
};

const std::array<ResultClassification, 17> kResultClassifications = {{
    {static_cast<uint32_t>(HRESULT_FROM_WIN32(ERROR_FILE_NOT_FOUND)), FileOperatorErrorKind::NotFound},
    {static_cast<uint32_t>(HRESULT_FROM_WIN32(ERROR_PATH_NOT_FOUND)), FileOperatorErrorKind::NotFound},

    {static_cast<uint32_t>(FileOperationResult::DestinationIsFile), FileOperatorErrorKind::TypeMismatch},
    {static_cast<uint32_t>(FileOperationResult::DestinationIsFolder), FileOperatorErrorKind::TypeMismatch},

    {static_cast<uint32_t>(FileOperationResult::RequiresElevation), FileOperatorErrorKind::Permission},
    {static_cast<uint32_t>(FileOperationResult::AccessDeniedSource), FileOperatorErrorKind::Permission},
    {static_cast<uint32_t>(FileOperationResult::AccessDeniedDestination), FileOperatorErrorKind::Permission},
    {static_cast<uint32_t>(E_ACCESSDENIED), FileOperatorErrorKind::Permission},
    {static_cast<uint32_t>(HRESULT_FROM_WIN32(ERROR_ELEVATION_REQUIRED)), FileOperatorErrorKind::Permission},

    {static_cast<uint32_t>(FileOperationResult::AlreadyExistsNormal), FileOperatorErrorKind::AlreadyExists},
    {static_cast<uint32_t>(FileOperationResult::AlreadyExistsReadOnly), FileOperatorErrorKind::AlreadyExists},
    {static_cast<uint32_t>(FileOperationResult::AlreadyExistsSystem), FileOperatorErrorKind::AlreadyExists},
    {static_cast<uint32_t>(FileOperationResult::AlreadyExistsFolder), FileOperatorErrorKind::AlreadyExists},

    {static_cast<uint32_t>(FileOperationResult::UserCancelled), FileOperatorErrorKind::Cancelled},
    {static_cast<uint32_t>(HRESULT_FROM_WIN32(ERROR_CANCELLED)), FileOperatorErrorKind::Cancelled},
    {static_cast<uint32_t>(E_ABORT), FileOperatorErrorKind::Cancelled},

    {static_cast<uint32_t>(E_UNEXPECTED), FileOperatorErrorKind::Unexpected},
}};
} // namespace

namespace ShellFileOperator
{
FileOperatorErrorKind ClassifyResult(HRESULT hr) noexcept
{
    if (SUCCEEDED(hr))
    {
        return FileOperatorErrorKind::None;
    }

    const uint32_t code = NormalizeResultCode(hr);
    for (const ResultClassification& entry : kResultClassifications)
    {
        if (entry.code == code)
        {
            return entry.kind;
        }
    }

    return FileOperatorErrorKind::OperationFailed;
}

std::wstring_view GetFileOperatorErrorKindName(FileOperatorErrorKind kind) noexcept
{
    switch (kind)
    {
        case FileOperatorErrorKind::None: return L"None";
        case FileOperatorErrorKind::NotFound: return L"NotFound";
        case FileOperatorErrorKind::TypeMismatch: return L"TypeMismatch";
        case FileOperatorErrorKind::Permission: return L"Permission";
        case FileOperatorErrorKind::AlreadyExists: return L"AlreadyExists";
        case FileOperatorErrorKind::Cancelled: return L"Cancelled";
        case FileOperatorErrorKind::Unexpected: return L"Unexpected";
        case FileOperatorErrorKind::OperationFailed: return L"OperationFailed";
        case FileOperatorErrorKind::Reentrancy: return L"Reentrancy";
        case FileOperatorErrorKind::NotOpen: return L"NotOpen";
        case FileOperatorErrorKind::HandlerFailed: return L"HandlerFailed";
    }

    return L"Unknown";
}

std::wstring GetResultMessage(HRESULT hr)
{
    wil::unique_hlocal_string message;
    const DWORD length = ::FormatMessageW(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                                          nullptr,
                                          static_cast<DWORD>(hr),
                                          MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
                                          reinterpret_cast<PWSTR>(message.addressof()),
                                          0,
                                          nullptr);
    if (length == 0 || ! message)
    {
        return {};
    }

    std::wstring_view text(message.get(), length);
    while (! text.empty() && (text.back() == L'\r' || text.back() == L'\n' || text.back() == L' '))
    {
        text.remove_suffix(1);
    }

    return std::wstring(text);
}

FileOperatorError MakeFileOperatorError(HRESULT hr, std::wstring_view path)
{
    FileOperatorError error;
    error.kind    = ClassifyResult(hr);
    error.code    = hr;
    error.message = GetResultMessage(hr);
    error.path.assign(path);
    return error;
}

FileOperatorError MakeFileOperatorError(FileOperatorErrorKind kind, HRESULT hr, std::wstring_view message, std::wstring_view path)
{
    FileOperatorError error;
    error.kind = kind;
    error.code = hr;
    error.message.assign(message);
    error.path.assign(path);
    return error;
}

std::wstring FormatFileOperatorError(const FileOperatorError& error)
{
    std::wstring_view message = error.message;
    if (message.empty())
    {
        message = GetFileOperatorErrorKindName(error.kind);
    }

    if (error.path.empty())
    {
        return std::format(L"0x{:08x}: {}", NormalizeResultCode(error.code), message);
    }

    return std::format(L"0x{:08x}: {} ({})", NormalizeResultCode(error.code), message, error.path);
}
} // namespace ShellFileOperator
