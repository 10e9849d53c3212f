#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace ShellFileOperator
{
// FOF_* / FOFX_* operation flags accepted by IFileOperation::SetOperationFlags.
enum class FileOperationFlags : uint32_t
{
    None = 0x0u,

    Silent                   = 0x4u,
    RenameOnCollision        = 0x8u,
    NoConfirmation           = 0x10u,
    AllowUndo                = 0x40u,
    FilesOnly                = 0x80u,
    NoConfirmMkdir           = 0x200u,
    NoErrorUi                = 0x400u,
    NoCopySecurityAttributes = 0x800u,
    WantNukeWarning          = 0x1000u,
    NoConnectedElements      = 0x2000u,
    NoRecursion              = 0x8000u,

    NoSkipJunctions        = 0x10000u,
    PreferHardLink         = 0x20000u,
    ShowElevationPrompt    = 0x40000u,
    RecycleOnDelete        = 0x80000u,
    EarlyFailure           = 0x100000u,
    PreserveFileExtensions = 0x200000u,
    KeepNewerFile          = 0x400000u,
    NoCopyHooks            = 0x800000u,
    NoMinimizeBox          = 0x1000000u,
    MoveAclsAcrossVolumes  = 0x2000000u,
    DontDisplaySourcePath  = 0x4000000u,
    DontDisplayDestPath    = 0x8000000u,
    RequireElevation       = 0x10000000u,
    AddUndoRecord          = 0x20000000u,
    CopyAsDownload         = 0x40000000u,
    DontDisplayLocations   = 0x80000000u,
};

// FILE_ATTRIBUTE_* values, reported for new items.
enum class FileAttributeFlags : uint32_t
{
    None               = 0x0u,
    ReadOnly           = 0x1u,
    Hidden             = 0x2u,
    System             = 0x4u,
    Directory          = 0x10u,
    Archive            = 0x20u,
    Device             = 0x40u,
    Normal             = 0x80u,
    Temporary          = 0x100u,
    SparseFile         = 0x200u,
    ReparsePoint       = 0x400u,
    Compressed         = 0x800u,
    Offline            = 0x1000u,
    NotContentIndexed  = 0x2000u,
    Encrypted          = 0x4000u,
    IntegrityStream    = 0x8000u,
    Virtual            = 0x10000u,
    NoScrubData        = 0x20000u,
    RecallOnOpen       = 0x40000u,
    Pinned             = 0x80000u,
    Unpinned           = 0x100000u,
    RecallOnDataAccess = 0x400000u,
};

// TSF_* flags passed to the pre/post item callbacks.
enum class TransferSourceFlags : uint32_t
{
    Normal                  = 0x0u,
    FailExist               = 0x0u,
    RenameExist             = 0x1u,
    OverwriteExist          = 0x2u,
    AllowDecryption         = 0x4u,
    NoSecurity              = 0x8u,
    CopyCreationTime        = 0x10u,
    CopyWriteTime           = 0x20u,
    UseFullAccess           = 0x40u,
    DeleteRecycleIfPossible = 0x80u,
    CopyHardLink            = 0x100u,
    CopyLocalizedName       = 0x200u,
    MoveAsCopyDelete        = 0x400u,
    SuspendShellEvents      = 0x800u,
};

// COPYENGINE_* result codes reported by the shell copy engine.
enum class FileOperationResult : uint32_t
{
    // Observed on successful deletes. Not documented by the SDK; treated as provisional.
    Success                 = 0x00270008u,
    UserCancelled           = 0x80270000u,
    RequiresElevation       = 0x80270002u,
    DestinationIsFile       = 0x8027000Bu,
    DestinationIsFolder     = 0x8027000Cu,
    AccessDeniedSource      = 0x80270021u,
    AccessDeniedDestination = 0x80270022u,
    AlreadyExistsNormal     = 0x80270029u,
    AlreadyExistsReadOnly   = 0x8027002Au,
    AlreadyExistsSystem     = 0x8027002Bu,
    AlreadyExistsFolder     = 0x8027002Cu,
};

template <typename TFlags> [[nodiscard]] inline constexpr uint32_t ToUnderlying(TFlags value) noexcept
{
    return static_cast<uint32_t>(value);
}

[[nodiscard]] inline constexpr FileOperationFlags operator|(FileOperationFlags a, FileOperationFlags b) noexcept
{
    return static_cast<FileOperationFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

[[nodiscard]] inline constexpr FileOperationFlags operator&(FileOperationFlags a, FileOperationFlags b) noexcept
{
    return static_cast<FileOperationFlags>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline constexpr FileOperationFlags& operator|=(FileOperationFlags& a, FileOperationFlags b) noexcept
{
    a = a | b;
    return a;
}

[[nodiscard]] inline constexpr FileAttributeFlags operator|(FileAttributeFlags a, FileAttributeFlags b) noexcept
{
    return static_cast<FileAttributeFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

[[nodiscard]] inline constexpr TransferSourceFlags operator|(TransferSourceFlags a, TransferSourceFlags b) noexcept
{
    return static_cast<TransferSourceFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

[[nodiscard]] inline constexpr bool HasFlag(FileOperationFlags mask, FileOperationFlags bit) noexcept
{
    return (static_cast<uint32_t>(mask) & static_cast<uint32_t>(bit)) != 0u;
}

[[nodiscard]] inline constexpr bool HasFlag(FileAttributeFlags mask, FileAttributeFlags bit) noexcept
{
    return (static_cast<uint32_t>(mask) & static_cast<uint32_t>(bit)) != 0u;
}

[[nodiscard]] inline constexpr bool HasFlag(TransferSourceFlags mask, TransferSourceFlags bit) noexcept
{
    return (static_cast<uint32_t>(mask) & static_cast<uint32_t>(bit)) != 0u;
}

// Presets. kDefaultFlags means "leave the engine defaults": no SetOperationFlags call is made.
inline constexpr FileOperationFlags kUndoFlags = FileOperationFlags::AddUndoRecord | FileOperationFlags::AllowUndo | FileOperationFlags::RecycleOnDelete;
inline constexpr FileOperationFlags kSemiSilentFlags = FileOperationFlags::WantNukeWarning | FileOperationFlags::Silent | FileOperationFlags::NoConfirmMkdir;
inline constexpr FileOperationFlags kFullSilentFlags = FileOperationFlags::Silent | FileOperationFlags::NoConfirmation | FileOperationFlags::NoErrorUi |
                                                       FileOperationFlags::EarlyFailure | FileOperationFlags::NoConfirmMkdir |
                                                       FileOperationFlags::ShowElevationPrompt;
inline constexpr std::optional<FileOperationFlags> kDefaultFlags{};

enum class FlagPreset : uint8_t
{
    Default,
    Undo,
    SemiSilent,
    FullSilent,
};

[[nodiscard]] std::optional<FileOperationFlags> GetPresetFlags(FlagPreset preset) noexcept;
[[nodiscard]] std::string_view GetFlagPresetName(FlagPreset preset) noexcept;
[[nodiscard]] bool TryParseFlagPreset(std::string_view name, FlagPreset& preset) noexcept;

// Returns an empty view when `flag` is not a single known bit.
[[nodiscard]] std::string_view GetFileOperationFlagName(FileOperationFlags flag) noexcept;
[[nodiscard]] bool TryParseFileOperationFlagName(std::string_view name, FileOperationFlags& flag) noexcept;

// Calls `callback(name)` once per known bit set in `flags`, lowest bit first.
template <typename TCallback> void ForEachFileOperationFlagName(FileOperationFlags flags, TCallback&& callback)
{
    for (uint32_t bit = 1u; bit != 0u; bit <<= 1u)
    {
        if ((static_cast<uint32_t>(flags) & bit) == 0u)
        {
            continue;
        }

        const std::string_view name = GetFileOperationFlagName(static_cast<FileOperationFlags>(bit));
        if (! name.empty())
        {
            callback(name);
        }
    }
}
} // namespace ShellFileOperator
