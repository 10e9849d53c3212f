#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

namespace ShellFileOperator
{
enum class FileOperatorErrorKind : uint8_t
{
    None,
    NotFound,
    TypeMismatch,
    Permission,
    AlreadyExists,
    Cancelled,
    Unexpected,
    OperationFailed,

    // Session-level kinds. ClassifyResult never returns these.
    Reentrancy,
    NotOpen,
    HandlerFailed,
};

struct FileOperatorError
{
    FileOperatorErrorKind kind = FileOperatorErrorKind::None;
    HRESULT code               = S_OK;
    std::wstring message;
    std::wstring path;

    [[nodiscard]] bool IsError() const noexcept
    {
        return kind != FileOperatorErrorKind::None;
    }
};

// Signed (negative) codes map to their unsigned 32-bit equivalent so that e.g. -2147024894 and
// 0x80070002 compare equal.
[[nodiscard]] inline constexpr uint32_t NormalizeResultCode(int64_t code) noexcept
{
    return static_cast<uint32_t>(static_cast<uint64_t>(code) & 0xFFFFFFFFull);
}

[[nodiscard]] inline constexpr uint32_t NormalizeResultCode(HRESULT hr) noexcept
{
    return static_cast<uint32_t>(hr);
}

// Failing codes outside the table classify as OperationFailed; successful codes as None.
[[nodiscard]] FileOperatorErrorKind ClassifyResult(HRESULT hr) noexcept;

[[nodiscard]] std::wstring_view GetFileOperatorErrorKindName(FileOperatorErrorKind kind) noexcept;

// System message text for `hr`, without the trailing line break. Empty when the system has none.
[[nodiscard]] std::wstring GetResultMessage(HRESULT hr);

[[nodiscard]] FileOperatorError MakeFileOperatorError(HRESULT hr, std::wstring_view path = {});
[[nodiscard]] FileOperatorError MakeFileOperatorError(FileOperatorErrorKind kind, HRESULT hr, std::wstring_view message, std::wstring_view path = {});

// "0x8027000c: <message> (<path>)". The path part is omitted when empty.
[[nodiscard]] std::wstring FormatFileOperatorError(const FileOperatorError& error);
} // namespace ShellFileOperator
