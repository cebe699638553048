#include "RenamerEngine.h"

#include <filesystem>
#include <set>
#include <string>

namespace fs = std::filesystem;

// Picks a basename not present in 'directoryEntries'. The caller's set holds both the names on
// disk and every name already handed out for this directory in the current plan.
// Number policy probes "stem (1).ext", "stem (2).ext", ... in order, so the result only depends
// on the set contents and is the same for a dry run and the commit that follows it
CollisionResult RenamerEngine::ResolveCollision(const std::set<std::string> &directoryEntries, const std::string &desiredName,
												DuplicatePolicy policy)
{
	CollisionResult result;

	if (directoryEntries.count(desiredName) == 0)
	{
		result.status = CollisionStatus::Resolved;
		result.name = desiredName;
		return result;
	}

	if (policy == DuplicatePolicy::Skip)
	{
		result.status = CollisionStatus::Conflict;
		return result;
	}

	const fs::path desired(desiredName);
	const std::string stem = desired.stem().string();
	const std::string ext = desired.extension().string();

	for (int counter = 1; counter <= MaxDuplicateSuffix; ++counter)
	{
		const std::string suffix = " (" + std::to_string(counter) + ")";
		if (ext.size() + suffix.size() >= MaxNameBytes)
		{
			break;
		}

		// Shorten the stem so the numbered name still fits the basename limit; a cut can leave
		// trailing whitespace or dots behind
		const std::string base = TrimName(TruncateUtf8(stem, MaxNameBytes - ext.size() - suffix.size()));
		const std::string candidate = base + suffix + ext;
		if (directoryEntries.count(candidate) == 0)
		{
			result.status = CollisionStatus::Resolved;
			result.name = candidate;
			return result;
		}
	}

	result.status = CollisionStatus::Conflict;
	return result;
}
