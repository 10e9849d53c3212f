#include "ShellFileOperator.Internal.h"

#include <array>

#include <shellapi.h>

namespace
{
using ShellFileOperator::FileAttributeFlags;
using ShellFileOperator::FileOperationFlags;
using ShellFileOperator::FlagPreset;
using ShellFileOperator::TransferSourceFlags;

static_assert(static_cast<uint32_t>(FileOperationFlags::Silent) == static_cast<uint32_t>(FOF_SILENT));
static_assert(static_cast<uint32_t>(FileOperationFlags::RenameOnCollision) == static_cast<uint32_t>(FOF_RENAMEONCOLLISION));
static_assert(static_cast<uint32_t>(FileOperationFlags::NoConfirmation) == static_cast<uint32_t>(FOF_NOCONFIRMATION));
static_assert(static_cast<uint32_t>(FileOperationFlags::AllowUndo) == static_cast<uint32_t>(FOF_ALLOWUNDO));
static_assert(static_cast<uint32_t>(FileOperationFlags::FilesOnly) == static_cast<uint32_t>(FOF_FILESONLY));
static_assert(static_cast<uint32_t>(FileOperationFlags::NoConfirmMkdir) == static_cast<uint32_t>(FOF_NOCONFIRMMKDIR));
static_assert(static_cast<uint32_t>(FileOperationFlags::NoErrorUi) == static_cast<uint32_t>(FOF_NOERRORUI));
static_assert(static_cast<uint32_t>(FileOperationFlags::NoCopySecurityAttributes) == static_cast<uint32_t>(FOF_NOCOPYSECURITYATTRIBS));
static_assert(static_cast<uint32_t>(FileOperationFlags::WantNukeWarning) == static_cast<uint32_t>(FOF_WANTNUKEWARNING));
static_assert(static_cast<uint32_t>(FileOperationFlags::NoRecursion) == static_cast<uint32_t>(FOF_NORECURSION));
static_assert(static_cast<uint32_t>(FileOperationFlags::NoConnectedElements) == static_cast<uint32_t>(FOF_NO_CONNECTED_ELEMENTS));
static_assert(static_cast<uint32_t>(FileOperationFlags::NoSkipJunctions) == static_cast<uint32_t>(FOFX_NOSKIPJUNCTIONS));
static_assert(static_cast<uint32_t>(FileOperationFlags::PreferHardLink) == static_cast<uint32_t>(FOFX_PREFERHARDLINK));
static_assert(static_cast<uint32_t>(FileOperationFlags::ShowElevationPrompt) == static_cast<uint32_t>(FOFX_SHOWELEVATIONPROMPT));
static_assert(static_cast<uint32_t>(FileOperationFlags::RecycleOnDelete) == static_cast<uint32_t>(FOFX_RECYCLEONDELETE));
static_assert(static_cast<uint32_t>(FileOperationFlags::EarlyFailure) == static_cast<uint32_t>(FOFX_EARLYFAILURE));
static_assert(static_cast<uint32_t>(FileOperationFlags::PreserveFileExtensions) == static_cast<uint32_t>(FOFX_PRESERVEFILEEXTENSIONS));
static_assert(static_cast<uint32_t>(FileOperationFlags::KeepNewerFile) == static_cast<uint32_t>(FOFX_KEEPNEWERFILE));
static_assert(static_cast<uint32_t>(FileOperationFlags::NoCopyHooks) == static_cast<uint32_t>(FOFX_NOCOPYHOOKS));
static_assert(static_cast<uint32_t>(FileOperationFlags::NoMinimizeBox) == static_cast<uint32_t>(FOFX_NOMINIMIZEBOX));
static_assert(static_cast<uint32_t>(FileOperationFlags::MoveAclsAcrossVolumes) == static_cast<uint32_t>(FOFX_MOVEACLSACROSSVOLUMES));
static_assert(static_cast<uint32_t>(FileOperationFlags::DontDisplaySourcePath) == static_cast<uint32_t>(FOFX_DONTDISPLAYSOURCEPATH));
static_assert(static_cast<uint32_t>(FileOperationFlags::DontDisplayDestPath) == static_cast<uint32_t>(FOFX_DONTDISPLAYDESTPATH));
static_assert(static_cast<uint32_t>(FileOperationFlags::RequireElevation) == static_cast<uint32_t>(FOFX_REQUIREELEVATION));
static_assert(static_cast<uint32_t>(FileOperationFlags::AddUndoRecord) == static_cast<uint32_t>(FOFX_ADDUNDORECORD));
static_assert(static_cast<uint32_t>(FileOperationFlags::CopyAsDownload) == static_cast<uint32_t>(FOFX_COPYASDOWNLOAD));
static_assert(static_cast<uint32_t>(FileOperationFlags::DontDisplayLocations) == static_cast<uint32_t>(FOFX_DONTDISPLAYLOCATIONS));

static_assert(static_cast<uint32_t>(FileAttributeFlags::ReadOnly) == static_cast<uint32_t>(FILE_ATTRIBUTE_READONLY));
static_assert(static_cast<uint32_t>(FileAttributeFlags::Directory) == static_cast<uint32_t>(FILE_ATTRIBUTE_DIRECTORY));
static_assert(static_cast<uint32_t>(FileAttributeFlags::Normal) == static_cast<uint32_t>(FILE_ATTRIBUTE_NORMAL));
static_assert(static_cast<uint32_t>(FileAttributeFlags::ReparsePoint) == static_cast<uint32_t>(FILE_ATTRIBUTE_REPARSE_POINT));
static_assert(static_cast<uint32_t>(FileAttributeFlags::Encrypted) == static_cast<uint32_t>(FILE_ATTRIBUTE_ENCRYPTED));
static_assert(static_cast<uint32_t>(FileAttributeFlags::RecallOnDataAccess) == static_cast<uint32_t>(FILE_ATTRIBUTE_RECALL_ON_DATA_ACCESS));

static_assert(static_cast<uint32_t>(TransferSourceFlags::RenameExist) == static_cast<uint32_t>(TSF_RENAME_EXIST));
static_assert(static_cast<uint32_t>(TransferSourceFlags::OverwriteExist) == static_cast<uint32_t>(TSF_OVERWRITE_EXIST));
static_assert(static_cast<uint32_t>(TransferSourceFlags::DeleteRecycleIfPossible) == static_cast<uint32_t>(TSF_DELETE_RECYCLE_IF_POSSIBLE));
static_assert(static_cast<uint32_t>(TransferSourceFlags::SuspendShellEvents) == static_cast<uint32_t>(TSF_SUSPEND_SHELLEVENTS));

struct FlagName
{
    FileOperationFlags flag;
    std::string_view name;
};

constexpr std::array<FlagName, 27> kFlagNames = {{
    {FileOperationFlags::Silent, "Silent"},
    {FileOperationFlags::RenameOnCollision, "RenameOnCollision"},
    {FileOperationFlags::NoConfirmation, "NoConfirmation"},
    {FileOperationFlags::AllowUndo, "AllowUndo"},
    {FileOperationFlags::FilesOnly, "FilesOnly"},
    {FileOperationFlags::NoConfirmMkdir, "NoConfirmMkdir"},
    {FileOperationFlags::NoErrorUi, "NoErrorUi"},
    {FileOperationFlags::NoCopySecurityAttributes, "NoCopySecurityAttributes"},
    {FileOperationFlags::WantNukeWarning, "WantNukeWarning"},
    {FileOperationFlags::NoConnectedElements, "NoConnectedElements"},
    {FileOperationFlags::NoRecursion, "NoRecursion"},
    {FileOperationFlags::NoSkipJunctions, "NoSkipJunctions"},
    {FileOperationFlags::PreferHardLink, "PreferHardLink"},
    {FileOperationFlags::ShowElevationPrompt, "ShowElevationPrompt"},
    {FileOperationFlags::RecycleOnDelete, "RecycleOnDelete"},
    {FileOperationFlags::EarlyFailure, "EarlyFailure"},
    {FileOperationFlags::PreserveFileExtensions, "PreserveFileExtensions"},
    {FileOperationFlags::KeepNewerFile, "KeepNewerFile"},
    {FileOperationFlags::NoCopyHooks, "NoCopyHooks"},
    {FileOperationFlags::NoMinimizeBox, "NoMinimizeBox"},
    {FileOperationFlags::MoveAclsAcrossVolumes, "MoveAclsAcrossVolumes"},
    {FileOperationFlags::DontDisplaySourcePath, "DontDisplaySourcePath"},
    {FileOperationFlags::DontDisplayDestPath, "DontDisplayDestPath"},
    {FileOperationFlags::RequireElevation, "RequireElevation"},
    {FileOperationFlags::AddUndoRecord, "AddUndoRecord"},
    {FileOperationFlags::CopyAsDownload, "CopyAsDownload"},
    {FileOperationFlags::DontDisplayLocations, "DontDisplayLocations"},
}};

struct PresetName
{
    FlagPreset preset;
    std::string_view name;
};

constexpr std::array<PresetName, 4> kPresetNames = {{
    {FlagPreset::Default, "default"},
    {FlagPreset::Undo, "undo"},
    {FlagPreset::SemiSilent, "semiSilent"},
    {FlagPreset::FullSilent, "fullSilent"},
}};

[[nodiscard]] bool EqualsAsciiNoCase(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    for (size_t i = 0; i < a.size(); ++i)
    {
        char ca = a[i];
        char cb = b[i];
        if (ca >= 'A' && ca <= 'Z')
        {
            ca = static_cast<char>(ca - 'A' + 'a');
        }
        if (cb >= 'A' && cb <= 'Z')
        {
            cb = static_cast<char>(cb - 'A' + 'a');
        }
        if (ca != cb)
        {
            return false;
        }
    }

    return true;
}
} // namespace

namespace ShellFileOperator
{
std::optional<FileOperationFlags> GetPresetFlags(FlagPreset preset) noexcept
{
    switch (preset)
    {
        case FlagPreset::Default: return kDefaultFlags;
        case FlagPreset::Undo: return kUndoFlags;
        case FlagPreset::SemiSilent: return kSemiSilentFlags;
        case FlagPreset::FullSilent: return kFullSilentFlags;
    }

    return kDefaultFlags;
}

std::string_view GetFlagPresetName(FlagPreset preset) noexcept
{
    for (const PresetName& entry : kPresetNames)
    {
        if (entry.preset == preset)
        {
            return entry.name;
        }
    }

    return {};
}

bool TryParseFlagPreset(std::string_view name, FlagPreset& preset) noexcept
{
    for (const PresetName& entry : kPresetNames)
    {
        if (EqualsAsciiNoCase(entry.name, name))
        {
            preset = entry.preset;
            return true;
        }
    }

    return false;
}

std::string_view GetFileOperationFlagName(FileOperationFlags flag) noexcept
{
    for (const FlagName& entry : kFlagNames)
    {
        if (entry.flag == flag)
        {
            return entry.name;
        }
    }

    return {};
}

bool TryParseFileOperationFlagName(std::string_view name, FileOperationFlags& flag) noexcept
{
    for (const FlagName& entry : kFlagNames)
    {
        if (EqualsAsciiNoCase(entry.name, name))
        {
            flag = entry.flag;
            return true;
        }
    }

    return false;
}
} // namespace ShellFileOperator
