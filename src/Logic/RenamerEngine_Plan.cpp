#include "RenamerEngine.h"
#include "PdfMetadata.h"

#include <wx/log.h>

#include <filesystem>
#include <string>
#include <vector>
#include <set>
#include <algorithm>	// For std::sort, std::all_of
#include <cctype>		// For std::isspace
#include <system_error> // For std::error_code
#include <stdexcept>	// For std::exception

namespace fs = std::filesystem;

namespace
{
bool IsBlank(const std::string &s)
{
	return std::all_of(s.begin(), s.end(), [](unsigned char c)
					   { return std::isspace(c) != 0; });
}

bool ByFilename(const fs::path &a, const fs::path &b)
{
	return a.filename().string() < b.filename().string();
}
} // namespace

// Builds the ordered plan for every candidate under the root without touching the filesystem
RenamePlan RenamerEngine::BuildPlan(const RenamerConfig &config, LabelExtractor &extractor)
{
	RenamePlan plan;
	plan.Policy = config.duplicatePolicy;

	// Root problems abort the run before anything is planned
	RootCheck rootCheck = PrepareRoot(config.root);
	if (!rootCheck.success)
	{
		plan.errorLog.push_back("FATAL: " + rootCheck.errorMessage);
		plan.success = false;
		return plan;
	}
	plan.Root = rootCheck.canonicalRoot;

	WalkDirectory(plan.Root, config, plan.Root, extractor, plan);

	plan.success = plan.errorLog.empty();
	wxLogVerbose("Planned %d operation(s) under '%s'", (int)plan.Operations.size(), plan.Root.string().c_str());
	return plan;
}

// Depth-first walk: the files of a directory in name order, then its subdirectories in name order.
// A fixed order keeps duplicate numbering identical between a dry run and the commit run
void RenamerEngine::WalkDirectory(const fs::path &directory, const RenamerConfig &config, const fs::path &root,
								  LabelExtractor &extractor, RenamePlan &plan)
{
	std::vector<fs::path> files;
	std::vector<fs::path> subdirectories;
	std::set<std::string> directoryEntries; // Names on disk plus names allocated in this run

	std::error_code ec;
	fs::directory_iterator it(directory, ec);
	if (ec)
	{
		plan.warningLog.push_back("Warning: Cannot list directory '" + directory.string() + "': " + ec.message());
		return;
	}

	for (; it != fs::directory_iterator(); it.increment(ec))
	{
		if (ec)
		{
			plan.warningLog.push_back("Warning: Listing of '" + directory.string() + "' stopped early: " + ec.message());
			break;
		}
		const fs::path &entryPath = it->path();
		directoryEntries.insert(entryPath.filename().string());

		std::error_code typeEc;
		const fs::file_status status = it->symlink_status(typeEc);
		if (typeEc)
		{
			plan.warningLog.push_back("Warning: Cannot determine type of '" + entryPath.string() + "': " + typeEc.message());
			continue;
		}

		if (fs::is_directory(status))
		{
			subdirectories.push_back(entryPath);
		}
		else if ((fs::is_regular_file(status) || fs::is_symlink(status)) && MatchesExtension(entryPath, config.extension))
		{
			files.push_back(entryPath);
		}
		else if (fs::is_symlink(status) && fs::is_directory(entryPath, typeEc) && !typeEc)
		{
			subdirectories.push_back(entryPath); // Refused by validation below
		}
	}

	std::sort(files.begin(), files.end(), ByFilename);
	std::sort(subdirectories.begin(), subdirectories.end(), ByFilename);

	for (const auto &filePath : files)
	{
		Candidate candidate;
		candidate.Path = filePath;

		std::error_code statEc;
		candidate.IsSymlink = fs::is_symlink(fs::symlink_status(filePath, statEc));
		if (!candidate.IsSymlink && !statEc)
		{
			std::uintmax_t size = fs::file_size(filePath, statEc);
			candidate.FileSize = statEc ? 0 : size;
		}

		plan.Operations.push_back(PlanCandidate(candidate, root, config.duplicatePolicy, extractor, directoryEntries));
	}

	for (const auto &subdirectory : subdirectories)
	{
		ValidationStatus status = ValidatePath(root, subdirectory);
		if (status != ValidationStatus::Ok)
		{
			wxLogWarning("Not descending into '%s': %s", subdirectory.string().c_str(), DescribeValidation(status).c_str());
			plan.warningLog.push_back("Warning: Not descending into '" + subdirectory.string() + "' (" + DescribeValidation(status) + ")");
			continue;
		}
		WalkDirectory(subdirectory, config, root, extractor, plan);
	}
}

// Runs one candidate through validation, extraction, sanitation and collision resolution.
// Every failure becomes a terminal operation; nothing escapes to the caller
PlannedOperation RenamerEngine::PlanCandidate(const Candidate &candidate, const fs::path &root, DuplicatePolicy policy,
											  LabelExtractor &extractor, std::set<std::string> &directoryEntries)
{
	PlannedOperation op;
	op.From = candidate.Path;

	// 1. Security and access checks
	const ValidationStatus validation = ValidatePath(root, candidate.Path);
	switch (validation)
	{
	case ValidationStatus::Ok:
		break;
	case ValidationStatus::IsSymlink:
		op.Kind = OperationKind::SkipSymlink;
		return op;
	case ValidationStatus::OutsideRoot:
		op.Kind = OperationKind::SkipOutsideRoot;
		return op;
	case ValidationStatus::Unreadable:
	case ValidationStatus::Unwritable:
		op.Kind = OperationKind::ErrorExtraction;
		op.Cause = DescribeValidation(validation);
		return op;
	}

	wxLogVerbose("Reading metadata of '%s' (%llu bytes)", candidate.Path.string().c_str(), (unsigned long long)candidate.FileSize);

	// 2. Label extraction; a throwing or failing extractor only affects this item
	ExtractionResult extracted;
	try
	{
		extracted = extractor.ExtractLabel(candidate.Path);
	}
	catch (const std::exception &ex)
	{
		extracted.success = false;
		extracted.errorMessage = "Exception during metadata extraction: " + std::string(ex.what());
	}
	catch (...)
	{
		extracted.success = false;
		extracted.errorMessage = "Unknown exception during metadata extraction";
	}

	if (!extracted.success)
	{
		op.Kind = OperationKind::ErrorExtraction;
		op.Cause = extracted.errorMessage.empty() ? "Metadata extraction failed" : extracted.errorMessage;
		return op;
	}

	// 3. Missing or blank label
	if (!extracted.label.has_value() || IsBlank(*extracted.label))
	{
		op.Kind = OperationKind::SkipNoLabel;
		return op;
	}
	op.Label = *extracted.label;

	// 4. Sanitation
	const SanitizeResult sanitized = SanitizeLabel(op.Label, candidate.Path.extension().string());
	if (sanitized.status == SanitizeStatus::LabelTooLong)
	{
		op.Kind = OperationKind::SkipLabelTooLong;
		op.LabelLength = sanitized.labelLength;
		return op;
	}
	if (sanitized.status == SanitizeStatus::EmptyLabel)
	{
		op.Kind = OperationKind::SkipEmptyAfterSanitize;
		return op;
	}
	if (sanitized.name == candidate.Path.filename().string())
	{
		op.Kind = OperationKind::SkipAlreadyNamed;
		return op;
	}

	// 5. Collision resolution against the running allocation set of this directory
	const CollisionResult resolved = ResolveCollision(directoryEntries, sanitized.name, policy);
	if (resolved.status == CollisionStatus::Conflict)
	{
		op.Kind = OperationKind::SkipTargetExists;
		op.Cause = sanitized.name;
		return op;
	}

	const fs::path target = candidate.Path.parent_path() / resolved.name;
	std::error_code ec;
	const fs::path canonicalTarget = CanonicalizeNoFollow(target, ec);
	if (ec || !IsWithinRoot(root, canonicalTarget))
	{
		op.Kind = OperationKind::SkipOutsideRoot;
		return op;
	}

	directoryEntries.insert(resolved.name);
	op.Kind = OperationKind::Rename;
	op.To = target;
	return op;
}
