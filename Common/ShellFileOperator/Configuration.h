#pragma once

#include <string>
#include <string_view>

#include "ShellFileOperator/FileOperator.h"

namespace ShellFileOperator
{
// JSON (JSON5 accepted) configuration of a FileOperator:
// {
//   "preset": "default" | "undo" | "semiSilent" | "fullSilent",
//   "flags": 16 | ["NoConfirmation", "Silent"],
//   "commitOnExit": true,
//   "progressMessage": "Archiving"
// }
// "flags" is OR-ed onto "preset" when both are present, and replaces the current flags otherwise. Keys not present leave `options` unchanged; unknown keys are ignored.
// Returns E_INVALIDARG for an unknown preset or flag name and HRESULT_FROM_WIN32(ERROR_INVALID_DATA) for
// malformed JSON. `options` is only modified on success.
[[nodiscard]] HRESULT ParseFileOperatorConfiguration(std::string_view configurationJsonUtf8, FileOperatorOptions& options) noexcept;

// Writes the keys above. Flags that equal a preset are written as that preset, anything else as a flag
// name array.
[[nodiscard]] HRESULT FormatFileOperatorConfiguration(const FileOperatorOptions& options, std::string& configurationJsonUtf8) noexcept;
} // namespace ShellFileOperator
