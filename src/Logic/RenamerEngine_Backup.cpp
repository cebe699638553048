#include "RenamerEngine.h"

#include <wx/log.h>

#include <filesystem>
#include <string>
#include <vector>
#include <algorithm>	// For std::sort
#include <system_error> // For std::error_code
#include <stdexcept>	// For std::runtime_error

namespace fs = std::filesystem;

// Copies every regular file matching 'extension' below 'source' into the same relative location
// below 'destination'. Symbolic links are never copied or followed. Per-file failures are
// collected in 'result'; a destination directory that cannot be created throws
void RenamerEngine::CopyMatchingFiles(const fs::path &source, const fs::path &destination, const std::string &extension,
									  BackupResult &result)
{
	std::error_code ec;
	if (!fs::exists(destination, ec) || ec)
	{
		if (!fs::create_directories(destination, ec) || ec)
		{
			throw std::runtime_error("Failed to create backup directory: " + destination.string() + (ec ? " (" + ec.message() + ")" : ""));
		}
	}

	std::vector<fs::path> entries;
	for (const auto &entry : fs::directory_iterator(source))
	{
		entries.push_back(entry.path());
	}
	std::sort(entries.begin(), entries.end());

	for (const auto &srcPath : entries)
	{
		const fs::path dstPath = destination / srcPath.filename();
		std::error_code typeEc;
		const fs::file_status status = fs::symlink_status(srcPath, typeEc);

		if (typeEc)
		{
			result.errorLog.push_back("Error checking type of '" + srcPath.string() + "': " + typeEc.message());
			continue;
		}
		if (fs::is_symlink(status))
		{
			wxLogVerbose("Backup skips symbolic link '%s'", srcPath.string().c_str());
			continue;
		}
		if (fs::is_directory(status))
		{
			CopyMatchingFiles(srcPath, dstPath, extension, result);
			continue;
		}
		if (!fs::is_regular_file(status) || !MatchesExtension(srcPath, extension))
		{
			continue;
		}

		std::error_code copyEc;
		fs::copy_file(srcPath, dstPath, fs::copy_options::none, copyEc);
		if (copyEc)
		{
			result.errorLog.push_back("Failed to copy file '" + srcPath.string() + "' to '" + dstPath.string() + "': " + copyEc.message());
			continue;
		}
		std::error_code sizeEc;
		const std::uintmax_t size = fs::file_size(dstPath, sizeEc);
		result.bytesCopied += sizeEc ? 0 : size;
		++result.filesCopied;
	}
}

// Backups go next to the target directory by default, never inside it
fs::path RenamerEngine::DefaultBackupParent(const fs::path &root)
{
	fs::path parent = root.parent_path();
	return parent.empty() ? root : parent;
}

// Copies the candidate files under 'root' into '<backupParent>/pdf_backup_<timestamp>'
BackupResult RenamerEngine::PerformBackup(const fs::path &root, const fs::path &backupParent, const std::string &extension)
{
	BackupResult result;
	result.success = false;

	const std::string timestamp = FormatTimestamp("%Y%m%d_%H%M%S", false);
	if (timestamp.empty())
	{
		result.errorMessage = "Failed to format timestamp.";
		return result;
	}

	try
	{
		std::error_code ec;
		const fs::path parent = fs::weakly_canonical(fs::absolute(backupParent), ec);
		if (ec)
		{
			throw std::runtime_error("Cannot resolve backup directory '" + backupParent.string() + "': " + ec.message());
		}
		result.backupPath = parent / ("pdf_backup_" + timestamp);

		// A backup inside the tree would be picked up by the next run
		if (IsWithinRoot(root, result.backupPath))
		{
			throw std::runtime_error("Backup directory '" + result.backupPath.string() + "' lies inside the target directory.");
		}

		std::error_code destEc;
		if (fs::exists(result.backupPath, destEc) || destEc)
		{
			throw std::runtime_error("Backup destination path already exists: '" + result.backupPath.string() + "'" + (destEc ? " (" + destEc.message() + ")" : ""));
		}

		CopyMatchingFiles(root, result.backupPath, extension, result);
		result.success = result.errorLog.empty();
		if (!result.success)
		{
			result.errorMessage = std::to_string(result.errorLog.size()) + " file(s) could not be backed up.";
		}
	}
	catch (const fs::filesystem_error &e)
	{
		result.errorMessage = "Backup failed (fs::filesystem_error): '";
		result.errorMessage += (e.path1().empty() ? root.string() : e.path1().string());
		result.errorMessage += "'. Reason: " + std::string(e.what());
	}
	catch (const std::exception &ex)
	{
		result.errorMessage = "Backup failed: " + std::string(ex.what());
	}

	if (result.success)
	{
		wxLogVerbose("Backed up %d file(s) to '%s'", (int)result.filesCopied, result.backupPath.string().c_str());
	}
	return result;
}
