#include "ShellFileOperator.Internal.h"

using ShellFileOperator::FileAttributeFlags;
using ShellFileOperator::FileOperationResult;
using ShellFileOperator::ItemOutcome;
using ShellFileOperator::ItemOutcomeKind;
using ShellFileOperator::TransferSourceFlags;

namespace
{
[[nodiscard]] bool IsDeleteSuccess(HRESULT result) noexcept
{
    return result == S_OK || static_cast<uint32_t>(result) == static_cast<uint32_t>(FileOperationResult::Success);
}
} // namespace

namespace ShellFileOperatorInternal
{
OutcomeRecorder::OutcomeRecorder(std::shared_ptr<FileOperationProgressHandler> next) noexcept : _next(std::move(next))
{
}

void OutcomeRecorder::Reset() noexcept
{
    _outcomes.clear();
    _finishResult.reset();
}

OutcomeMap OutcomeRecorder::TakeOutcomes() noexcept
{
    OutcomeMap outcomes = std::move(_outcomes);
    _outcomes.clear();
    return outcomes;
}

const OutcomeMap& OutcomeRecorder::GetOutcomes() const noexcept
{
    return _outcomes;
}

std::optional<HRESULT> OutcomeRecorder::GetFinishResult() const noexcept
{
    return _finishResult;
}

void OutcomeRecorder::RecordNewPath(std::wstring_view source, std::optional<std::wstring_view> newPath)
{
    if (! newPath.has_value() || newPath->empty())
    {
        return;
    }

    ItemOutcome& outcome = _outcomes[std::wstring(source)];
    outcome.kind         = ItemOutcomeKind::NewPath;
    outcome.newPath.assign(newPath.value());
}

void OutcomeRecorder::StartOperations()
{
    if (_next)
    {
        _next->StartOperations();
    }
}

void OutcomeRecorder::FinishOperations(HRESULT result)
{
    _finishResult = result;
    if (_next)
    {
        _next->FinishOperations(result);
    }
}

void OutcomeRecorder::PreRenameItem(TransferSourceFlags flags, std::wstring_view source, std::wstring_view newName)
{
    if (_next)
    {
        _next->PreRenameItem(flags, source, newName);
    }
}

void OutcomeRecorder::PostRenameItem(TransferSourceFlags flags, std::wstring_view source, std::optional<std::wstring_view> newPath, HRESULT result)
{
    RecordNewPath(source, newPath);
    if (_next)
    {
        _next->PostRenameItem(flags, source, newPath, result);
    }
}

void OutcomeRecorder::PreMoveItem(TransferSourceFlags flags,
                                  std::wstring_view source,
                                  std::wstring_view destinationFolder,
                                  std::optional<std::wstring_view> newName)
{
    if (_next)
    {
        _next->PreMoveItem(flags, source, destinationFolder, newName);
    }
}

void OutcomeRecorder::PostMoveItem(
    TransferSourceFlags flags, std::wstring_view source, std::wstring_view destinationFolder, std::optional<std::wstring_view> newPath, HRESULT result)
{
    RecordNewPath(source, newPath);
    if (_next)
    {
        _next->PostMoveItem(flags, source, destinationFolder, newPath, result);
    }
}

void OutcomeRecorder::PreCopyItem(TransferSourceFlags flags,
                                  std::wstring_view source,
                                  std::wstring_view destinationFolder,
                                  std::optional<std::wstring_view> newName)
{
    if (_next)
    {
        _next->PreCopyItem(flags, source, destinationFolder, newName);
    }
}

void OutcomeRecorder::PostCopyItem(
    TransferSourceFlags flags, std::wstring_view source, std::wstring_view destinationFolder, std::optional<std::wstring_view> newPath, HRESULT result)
{
    RecordNewPath(source, newPath);
    if (_next)
    {
        _next->PostCopyItem(flags, source, destinationFolder, newPath, result);
    }
}

void OutcomeRecorder::PreDeleteItem(TransferSourceFlags flags, std::wstring_view source)
{
    if (_next)
    {
        _next->PreDeleteItem(flags, source);
    }
}

void OutcomeRecorder::PostDeleteItem(TransferSourceFlags flags, std::wstring_view source, HRESULT result, bool recycled)
{
    if (IsDeleteSuccess(result))
    {
        ItemOutcome& outcome = _outcomes[std::wstring(source)];
        outcome.kind         = recycled ? ItemOutcomeKind::Recycled : ItemOutcomeKind::Deleted;
        outcome.newPath.clear();
    }

    if (_next)
    {
        _next->PostDeleteItem(flags, source, result, recycled);
    }
}

void OutcomeRecorder::PreNewItem(TransferSourceFlags flags, std::wstring_view destinationFolder, std::wstring_view newName)
{
    if (_next)
    {
        _next->PreNewItem(flags, destinationFolder, newName);
    }
}

void OutcomeRecorder::PostNewItem(TransferSourceFlags flags,
                                  std::wstring_view destinationFolder,
                                  std::wstring_view newName,
                                  std::optional<std::wstring_view> templateName,
                                  FileAttributeFlags attributes,
                                  HRESULT result,
                                  std::optional<std::wstring_view> newPath)
{
    if (_next)
    {
        _next->PostNewItem(flags, destinationFolder, newName, templateName, attributes, result, newPath);
    }
}

void OutcomeRecorder::UpdateProgress(unsigned int workTotal, unsigned int workSoFar)
{
    if (_next)
    {
        _next->UpdateProgress(workTotal, workSoFar);
    }
}

void OutcomeRecorder::ResetTimer()
{
    if (_next)
    {
        _next->ResetTimer();
    }
}

void OutcomeRecorder::PauseTimer()
{
    if (_next)
    {
        _next->PauseTimer();
    }
}

void OutcomeRecorder::ResumeTimer()
{
    if (_next)
    {
        _next->ResumeTimer();
    }
}
} // namespace ShellFileOperatorInternal
