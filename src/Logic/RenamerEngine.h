#ifndef RENAMERENGINE_H
#define RENAMERENGINE_H

#include <vector>
#include <string>
#include <set>
#include <filesystem>
#include <functional>
#include <optional>
#include <cstdint>
#include <system_error>

namespace fs = std::filesystem;

class LabelExtractor;
class AuditLog;
class wxString;

enum class DuplicatePolicy
{
	Number,
	Skip
};

enum class ExecutionMode
{
	DryRun,
	Commit
};

enum class ValidationStatus
{
	Ok,
	OutsideRoot,
	IsSymlink,
	Unreadable,
	Unwritable
};

enum class SanitizeStatus
{
	Ok,
	EmptyLabel,
	LabelTooLong
};

enum class CollisionStatus
{
	Resolved,
	Conflict
};

enum class OperationKind
{
	Rename,
	SkipNoLabel,
	SkipSymlink,
	SkipLabelTooLong,
	SkipTargetExists,
	SkipOutsideRoot,
	SkipAlreadyNamed,
	SkipEmptyAfterSanitize,
	ErrorExtraction
};

enum class OutcomeStatus
{
	Applied,
	Skipped,
	Failed
};

enum class FailureCause
{
	None,
	ExtractionFailed,
	SourceVanished,
	TargetNowExists,
	OutsideRoot,
	RenameFailed
};

struct RenamerConfig
{
	fs::path root;
	DuplicatePolicy duplicatePolicy = DuplicatePolicy::Number;
	ExecutionMode mode = ExecutionMode::DryRun;
	std::string extension = ".pdf";
	fs::path auditLogDir; // Empty means the root directory
	std::uintmax_t maxReadBytes = 64ull * 1024 * 1024;
	bool backup = false;
	fs::path backupDir; // Empty means the parent of the root directory
};

// A discovered directory entry, built during traversal and discarded once planned
struct Candidate
{
	fs::path Path;
	std::uintmax_t FileSize = 0;
	bool IsSymlink = false;
};

struct PlannedOperation
{
	OperationKind Kind = OperationKind::SkipNoLabel;
	fs::path From;
	fs::path To;			  // Set for Rename only
	std::string Label;		  // Raw label, kept for the audit trail
	std::size_t LabelLength = 0; // Code points, set for SkipLabelTooLong
	std::string Cause;		  // Error cause, or the wanted name for SkipTargetExists
};

struct RenamePlan
{
	fs::path Root;
	DuplicatePolicy Policy = DuplicatePolicy::Number;
	std::vector<PlannedOperation> Operations;
	std::vector<std::string> warningLog;
	std::vector<std::string> errorLog;
	bool success = false;
};

struct ExecutionOutcome
{
	PlannedOperation Operation;
	OutcomeStatus Status = OutcomeStatus::Skipped;
	FailureCause Cause = FailureCause::None;
	bool Simulated = false;
	std::string Detail;
};

struct RunSummary
{
	std::size_t discovered = 0;
	std::size_t renamed = 0;
	std::size_t skipped = 0;
	std::size_t errors = 0;
};

struct ExecutionReport
{
	ExecutionMode mode = ExecutionMode::DryRun;
	std::vector<ExecutionOutcome> outcomes;
	RunSummary summary;
	bool cancelled = false;
	bool overallSuccess = false;
};

struct SanitizeResult
{
	SanitizeStatus status = SanitizeStatus::EmptyLabel;
	std::string name;
	std::size_t labelLength = 0;
};

struct CollisionResult
{
	CollisionStatus status = CollisionStatus::Conflict;
	std::string name;
};

struct RootCheck
{
	fs::path canonicalRoot;
	std::string errorMessage;
	bool success = false;
};

struct BackupResult
{
	fs::path backupPath;
	std::size_t filesCopied = 0;
	std::uintmax_t bytesCopied = 0;
	std::vector<std::string> errorLog;
	std::string errorMessage;
	bool success = false;
};

class RenamerEngine
{
private:
	static void WalkDirectory(const fs::path &directory, const RenamerConfig &config, const fs::path &root,
							  LabelExtractor &extractor, RenamePlan &plan);
	static PlannedOperation PlanCandidate(const Candidate &candidate, const fs::path &root, DuplicatePolicy policy,
										  LabelExtractor &extractor, std::set<std::string> &directoryEntries);
	static ExecutionOutcome ApplyOperation(const fs::path &root, const PlannedOperation &op, ExecutionMode mode);
	static void CopyMatchingFiles(const fs::path &source, const fs::path &destination, const std::string &extension,
								  BackupResult &result);

public:
	static constexpr std::size_t MaxLabelCodePoints = 1000;
	static constexpr std::size_t MaxNameBytes = 255;
	static constexpr int MaxDuplicateSuffix = 9999;

	// Process exit status of the command line tool
	static constexpr int ExitOk = 0;
	static constexpr int ExitFailure = 1;
	static constexpr int ExitCancelled = 130;

	// Path validation
	static RootCheck PrepareRoot(const fs::path &directory);
	static bool IsWithinRoot(const fs::path &root, const fs::path &path);
	static fs::path CanonicalizeNoFollow(const fs::path &path, std::error_code &ec);
	static ValidationStatus ValidatePath(const fs::path &root, const fs::path &candidatePath);
	static std::string DescribeValidation(ValidationStatus status);

	// Name sanitation
	static std::size_t CountCodePoints(const std::string &utf8);
	static std::string TruncateUtf8(const std::string &utf8, std::size_t maxBytes);
	static std::string TrimName(const std::string &s);
	static SanitizeResult SanitizeLabel(const std::string &rawLabel, const std::string &extension);

	// Collision resolution
	static CollisionResult ResolveCollision(const std::set<std::string> &directoryEntries, const std::string &desiredName,
											DuplicatePolicy policy);

	// Planning and execution
	static bool MatchesExtension(const fs::path &path, const std::string &extension);
	static RenamePlan BuildPlan(const RenamerConfig &config, LabelExtractor &extractor);
	static ExecutionReport ExecutePlan(const RenamePlan &plan, ExecutionMode mode, AuditLog *audit = nullptr,
									   const std::function<bool()> &cancelRequested = {});
	static RunSummary Summarize(const std::vector<ExecutionOutcome> &outcomes);
	static std::string DescribeSkip(const PlannedOperation &op);
	static std::string CategoryName(const ExecutionOutcome &outcome);

	// Run report
	static int ExitStatus(const ExecutionReport &report);
	static std::string FormatOutcomeLine(const fs::path &root, const ExecutionOutcome &outcome);
	static std::string FormatSummary(const ExecutionReport &report, const fs::path &auditPath);

	// Backup
	static fs::path DefaultBackupParent(const fs::path &root);
	static BackupResult PerformBackup(const fs::path &root, const fs::path &backupParent, const std::string &extension);
};

std::string ToLower(std::string s);
std::string FormatTimestamp(const char *format, bool utc);
fs::path PathFromWxString(const wxString &value);
wxString PathToWxString(const fs::path &path);

#endif // RENAMERENGINE_H
