#include "RenamerEngine.h"

#include <wx/log.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <system_error> // For std::error_code

#include <unistd.h> // For access()

namespace fs = std::filesystem;

namespace
{
// Splits a path into its non-empty components ("/a/b/" -> "/", "a", "b")
std::vector<fs::path> PathComponents(const fs::path &p)
{
	std::vector<fs::path> parts;
	for (const auto &part : p)
	{
		if (!part.empty())
		{
			parts.push_back(part);
		}
	}
	return parts;
}

bool HasAccess(const fs::path &p, int mode)
{
	return ::access(p.c_str(), mode) == 0;
}
} // namespace

// Establishes the canonical root for a run. Failure here is run-fatal
RootCheck RenamerEngine::PrepareRoot(const fs::path &directory)
{
	RootCheck result;
	std::error_code ec;

	fs::path absolute = fs::absolute(directory, ec);
	if (ec)
	{
		result.errorMessage = "Cannot resolve directory '" + directory.string() + "': " + ec.message();
		return result;
	}

	bool exists = fs::exists(absolute, ec);
	if (ec || !exists)
	{
		result.errorMessage = "Directory does not exist: " + absolute.string() + (ec ? " (" + ec.message() + ")" : "");
		return result;
	}
	if (!fs::is_directory(absolute, ec) || ec)
	{
		result.errorMessage = "Path is not a directory: " + absolute.string() + (ec ? " (" + ec.message() + ")" : "");
		return result;
	}

	result.canonicalRoot = fs::canonical(absolute, ec);
	if (ec)
	{
		result.errorMessage = "Cannot canonicalize directory '" + absolute.string() + "': " + ec.message();
		return result;
	}

	// The root must at least be listable; a missing write bit only surfaces per file
	if (!HasAccess(result.canonicalRoot, R_OK | X_OK))
	{
		result.errorMessage = "Insufficient permissions for directory: " + result.canonicalRoot.string();
		return result;
	}
	if (!HasAccess(result.canonicalRoot, W_OK))
	{
		wxLogWarning("Directory '%s' is not writable; renames in it will fail validation", result.canonicalRoot.string().c_str());
	}

	result.success = true;
	return result;
}

// Component-wise containment: "/data/root-evil" is not inside "/data/root"
bool RenamerEngine::IsWithinRoot(const fs::path &root, const fs::path &path)
{
	const std::vector<fs::path> rootParts = PathComponents(root);
	const std::vector<fs::path> pathParts = PathComponents(path);

	if (rootParts.empty() || pathParts.size() < rootParts.size())
	{
		return false;
	}
	for (std::size_t i = 0; i < rootParts.size(); ++i)
	{
		if (rootParts[i] != pathParts[i])
		{
			return false;
		}
	}
	return true;
}

// Resolves "." and ".." and the parent chain, but never follows the final entry
fs::path RenamerEngine::CanonicalizeNoFollow(const fs::path &path, std::error_code &ec)
{
	fs::path absolute = fs::absolute(path, ec);
	if (ec)
	{
		return {};
	}

	const fs::path leaf = absolute.filename();
	if (leaf.empty() || leaf == "." || leaf == "..")
	{
		return fs::weakly_canonical(absolute, ec);
	}

	fs::path parent = fs::weakly_canonical(absolute.parent_path(), ec);
	if (ec)
	{
		return {};
	}
	return parent / leaf;
}

// Pure predicate over the filesystem state: containment, link rejection and access probes
ValidationStatus RenamerEngine::ValidatePath(const fs::path &root, const fs::path &candidatePath)
{
	std::error_code ec;
	const fs::file_status status = fs::symlink_status(candidatePath, ec);
	if (ec || !fs::exists(status))
	{
		return ValidationStatus::Unreadable;
	}

	// Links are refused without looking at their target
	if (fs::is_symlink(status))
	{
		return ValidationStatus::IsSymlink;
	}

	const fs::path canonical = CanonicalizeNoFollow(candidatePath, ec);
	if (ec)
	{
		return ValidationStatus::Unreadable;
	}
	if (!IsWithinRoot(root, canonical))
	{
		return ValidationStatus::OutsideRoot;
	}

	if (fs::is_directory(status))
	{
		return HasAccess(canonical, R_OK | X_OK) ? ValidationStatus::Ok : ValidationStatus::Unreadable;
	}
	if (!fs::is_regular_file(status))
	{
		return ValidationStatus::Unreadable;
	}

	{
		std::ifstream probe(canonical, std::ios::in | std::ios::binary);
		if (!probe.is_open())
		{
			return ValidationStatus::Unreadable;
		}
	}

	if (!HasAccess(canonical.parent_path(), W_OK | X_OK))
	{
		return ValidationStatus::Unwritable;
	}
	return ValidationStatus::Ok;
}

std::string RenamerEngine::DescribeValidation(ValidationStatus status)
{
	switch (status)
	{
	case ValidationStatus::Ok:
		return "ok";
	case ValidationStatus::OutsideRoot:
		return "path is outside the target directory";
	case ValidationStatus::IsSymlink:
		return "symbolic link";
	case ValidationStatus::Unreadable:
		return "permission denied: file is not readable";
	case ValidationStatus::Unwritable:
		return "permission denied: directory is not writable";
	}
	return "unknown validation status";
}
