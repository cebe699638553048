#include "RenamerEngine.h"

#include <filesystem>
#include <sstream>
#include <string>
#include <system_error> // For std::error_code

namespace fs = std::filesystem;

namespace
{
const char *const Rule = "================================================================================";

// Paths are shown relative to the root where possible
std::string DisplayPath(const fs::path &root, const fs::path &path)
{
	std::error_code ec;
	fs::path relative = fs::relative(path, root, ec);
	if (ec || relative.empty())
	{
		return path.string();
	}
	return relative.string();
}
} // namespace

// Cancellation wins over failures; a dry run never fails because of per-item errors
int RenamerEngine::ExitStatus(const ExecutionReport &report)
{
	if (report.cancelled)
	{
		return ExitCancelled;
	}
	if (report.mode == ExecutionMode::Commit && report.summary.errors > 0)
	{
		return ExitFailure;
	}
	return ExitOk;
}

// One line per item: "Would rename" / "Renamed" / "Skipped: <reason>" / "Error: <cause>"
std::string RenamerEngine::FormatOutcomeLine(const fs::path &root, const ExecutionOutcome &outcome)
{
	const PlannedOperation &op = outcome.Operation;
	const std::string from = DisplayPath(root, op.From);

	switch (outcome.Status)
	{
	case OutcomeStatus::Applied:
		return std::string(outcome.Simulated ? "Would rename" : "Renamed") + ": " + from + " -> " +
			   op.To.filename().string();
	case OutcomeStatus::Skipped:
		return "Skipped: " + outcome.Detail + " (" + from + ")";
	case OutcomeStatus::Failed:
		return "Error: " + outcome.Detail + " (" + from + ")";
	}
	return std::string();
}

std::string RenamerEngine::FormatSummary(const ExecutionReport &report, const fs::path &auditPath)
{
	const RunSummary &summary = report.summary;
	const bool dryRun = report.mode == ExecutionMode::DryRun;

	std::ostringstream out;
	out << "\n" << Rule << "\nSUMMARY\n" << Rule << "\n";
	out << "Total PDF files found: " << summary.discovered << "\n";
	out << (dryRun ? "Would rename: " : "Successfully renamed: ") << summary.renamed << "\n";
	out << "Skipped: " << summary.skipped << "\n";
	out << "Errors: " << summary.errors << "\n";
	if (report.cancelled)
	{
		const std::size_t processed = summary.renamed + summary.skipped + summary.errors;
		out << "Cancelled: " << (summary.discovered - processed) << " item(s) not processed\n";
	}
	out << Rule << "\n";

	if (!auditPath.empty())
	{
		out << "\nLog file: " << auditPath.string() << "\n";
	}

	if (dryRun && summary.renamed > 0)
	{
		out << "\nTip: Run again with --no-dry-run to perform actual renaming\n";
	}
	else if (!dryRun && !report.cancelled && summary.renamed > 0 && summary.errors == 0)
	{
		out << "\nRenaming completed successfully!\n";
	}
	return out.str();
}
