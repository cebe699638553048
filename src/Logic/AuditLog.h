#ifndef AUDITLOG_H
#define AUDITLOG_H

#include "RenamerEngine.h"

#include <fstream>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// Append-only, line-oriented record of a run. Every record is flushed as soon as it is written,
// and the file is closed when the object goes away, so an interrupted run still leaves a
// readable trail of everything completed
class AuditLog
{
public:
	AuditLog() = default;
	~AuditLog();

	AuditLog(const AuditLog &) = delete;
	AuditLog &operator=(const AuditLog &) = delete;

	// Creates "pdf_rename_log_<YYYYMMDD_HHMMSS>.txt" in 'directory' and writes the run header
	bool Open(const fs::path &directory, const fs::path &root, ExecutionMode mode, DuplicatePolicy policy);
	void Record(const ExecutionOutcome &outcome);
	void Close(const RunSummary &summary, bool cancelled);

	bool IsOpen() const { return m_stream.is_open(); }
	const fs::path &GetPath() const { return m_path; }
	const std::string &GetRunId() const { return m_runId; }
	const std::string &GetLastError() const { return m_lastError; }

	static std::string FormatRecord(const std::string &timestamp, const std::string &runId, const ExecutionOutcome &outcome);

	static const char *const NotApplicable;

private:
	void WriteLine(const std::string &line);

	std::ofstream m_stream;
	fs::path m_path;
	std::string m_runId;
	std::string m_lastError;
};

#endif // AUDITLOG_H
