#include "RenamerEngine.h"
#include "AuditLog.h"

#include <wx/log.h>

#include <vector>
#include <string>
#include <filesystem>
#include <cerrno>
#include <cstring>		// For std::strerror
#include <system_error> // For std::error_code
#include <stdexcept>	// For std::exception

#include <fcntl.h> // For AT_FDCWD
#include <unistd.h>
#if defined(__linux__)
#include <sys/syscall.h>
#include <linux/fs.h> // For RENAME_NOREPLACE
#endif

namespace fs = std::filesystem;

namespace
{
// Atomic rename that refuses to replace an existing target. Returns 0 or an errno value
int RenameNoReplace(const fs::path &from, const fs::path &to)
{
#if defined(__linux__) && defined(SYS_renameat2) && defined(RENAME_NOREPLACE)
	if (::syscall(SYS_renameat2, AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0)
	{
		return 0;
	}
	const int err = errno;
	if (err != ENOSYS && err != EINVAL)
	{
		return err;
	}
#endif
	// No kernel support for RENAME_NOREPLACE on this filesystem; fall back to check-then-rename
	std::error_code ec;
	if (fs::exists(fs::symlink_status(to, ec)))
	{
		return EEXIST;
	}
	fs::rename(from, to, ec);
	return ec ? ec.value() : 0;
}

ExecutionOutcome Failed(ExecutionOutcome outcome, FailureCause cause, const std::string &detail)
{
	outcome.Status = OutcomeStatus::Failed;
	outcome.Cause = cause;
	outcome.Detail = detail;
	return outcome;
}
} // namespace

// Applies the plan one operation at a time, in plan order. A failure never stops the run;
// cancellation leaves the remaining operations untouched and completed renames in place
ExecutionReport RenamerEngine::ExecutePlan(const RenamePlan &plan, ExecutionMode mode, AuditLog *audit,
										   const std::function<bool()> &cancelRequested)
{
	ExecutionReport report;
	report.mode = mode;
	report.outcomes.reserve(plan.Operations.size());

	for (const auto &op : plan.Operations)
	{
		if (cancelRequested && cancelRequested())
		{
			report.cancelled = true;
			wxLogWarning("Run cancelled; %d operation(s) left unprocessed",
						 (int)(plan.Operations.size() - report.outcomes.size()));
			break;
		}

		ExecutionOutcome outcome = ApplyOperation(plan.Root, op, mode);
		if (audit)
		{
			audit->Record(outcome);
		}
		report.outcomes.push_back(std::move(outcome));
	}

	report.summary = Summarize(report.outcomes);
	report.summary.discovered = plan.Operations.size();
	report.overallSuccess = !report.cancelled && report.summary.errors == 0;

	if (audit)
	{
		audit->Close(report.summary, report.cancelled);
	}
	return report;
}

ExecutionOutcome RenamerEngine::ApplyOperation(const fs::path &root, const PlannedOperation &op, ExecutionMode mode)
{
	ExecutionOutcome outcome;
	outcome.Operation = op;

	if (op.Kind == OperationKind::ErrorExtraction)
	{
		return Failed(outcome, FailureCause::ExtractionFailed, op.Cause);
	}
	if (op.Kind != OperationKind::Rename)
	{
		outcome.Status = OutcomeStatus::Skipped;
		outcome.Detail = DescribeSkip(op);
		return outcome;
	}

	if (mode == ExecutionMode::DryRun)
	{
		outcome.Status = OutcomeStatus::Applied;
		outcome.Simulated = true;
		return outcome;
	}

	try
	{
		std::error_code ec;

		// The tree may have changed since planning: re-check both ends before renaming
		const fs::file_status source = fs::symlink_status(op.From, ec);
		if (ec || !fs::exists(source))
		{
			return Failed(outcome, FailureCause::SourceVanished, "Source file disappeared (" + op.From.string() + ")");
		}
		if (!fs::is_regular_file(source))
		{
			return Failed(outcome, FailureCause::SourceVanished, "Source is no longer a regular file (" + op.From.string() + ")");
		}

		const fs::path canonicalTarget = CanonicalizeNoFollow(op.To, ec);
		if (ec || !IsWithinRoot(root, canonicalTarget))
		{
			return Failed(outcome, FailureCause::OutsideRoot, "Target resolves outside the target directory (" + op.To.string() + ")");
		}

		const fs::file_status target = fs::symlink_status(op.To, ec);
		if (ec)
		{
			return Failed(outcome, FailureCause::RenameFailed, "Filesystem error checking target path (" + op.To.string() + "): " + ec.message());
		}
		if (fs::exists(target))
		{
			return Failed(outcome, FailureCause::TargetNowExists, "Target path now exists (" + op.To.string() + ")");
		}

		const int err = RenameNoReplace(op.From, op.To);
		if (err == 0)
		{
			outcome.Status = OutcomeStatus::Applied;
			return outcome;
		}
		if (err == EEXIST)
		{
			return Failed(outcome, FailureCause::TargetNowExists, "Target path now exists (" + op.To.string() + ")");
		}
		if (err == ENOENT)
		{
			return Failed(outcome, FailureCause::SourceVanished, "Source file disappeared (" + op.From.string() + ")");
		}
		wxLogWarning("Rename of '%s' failed: %s", op.From.string().c_str(), std::strerror(err));
		return Failed(outcome, FailureCause::RenameFailed, "Rename failed: " + std::string(std::strerror(err)));
	}
	catch (const fs::filesystem_error &ex)
	{
		std::string errMsg = "Filesystem Exception: " + std::string(ex.what());
		errMsg += " (Code: " + ex.code().message() + ")";
		return Failed(outcome, FailureCause::RenameFailed, errMsg);
	}
	catch (const std::exception &ex)
	{
		return Failed(outcome, FailureCause::RenameFailed, "General Exception: " + std::string(ex.what()));
	}
}

RunSummary RenamerEngine::Summarize(const std::vector<ExecutionOutcome> &outcomes)
{
	RunSummary summary;
	summary.discovered = outcomes.size();
	for (const auto &outcome : outcomes)
	{
		switch (outcome.Status)
		{
		case OutcomeStatus::Applied:
			++summary.renamed;
			break;
		case OutcomeStatus::Skipped:
			++summary.skipped;
			break;
		case OutcomeStatus::Failed:
			++summary.errors;
			break;
		}
	}
	return summary;
}

std::string RenamerEngine::DescribeSkip(const PlannedOperation &op)
{
	switch (op.Kind)
	{
	case OperationKind::Rename:
		return std::string();
	case OperationKind::SkipNoLabel:
		return "No title in metadata";
	case OperationKind::SkipSymlink:
		return "Symbolic link";
	case OperationKind::SkipLabelTooLong:
		return "Title too long (" + std::to_string(op.LabelLength) + " characters, limit " +
			   std::to_string(MaxLabelCodePoints) + "), possible metadata corruption";
	case OperationKind::SkipTargetExists:
		return "File already exists with name '" + op.Cause + "'";
	case OperationKind::SkipOutsideRoot:
		return "Path outside base directory";
	case OperationKind::SkipAlreadyNamed:
		return "Already named correctly";
	case OperationKind::SkipEmptyAfterSanitize:
		return "Title contains only invalid characters";
	case OperationKind::ErrorExtraction:
		return op.Cause;
	}
	return "Unknown reason";
}

std::string RenamerEngine::CategoryName(const ExecutionOutcome &outcome)
{
	switch (outcome.Status)
	{
	case OutcomeStatus::Applied:
		return outcome.Simulated ? "WOULD_RENAME" : "RENAMED";
	case OutcomeStatus::Skipped:
		return "SKIPPED";
	case OutcomeStatus::Failed:
		return "FAILED";
	}
	return "UNKNOWN";
}
