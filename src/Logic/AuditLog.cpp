#include "AuditLog.h"

#include <wx/log.h>
#include <wx/utils.h> // For wxGetProcessId

#include <filesystem>
#include <string>
#include <system_error> // For std::error_code

namespace fs = std::filesystem;

const char *const AuditLog::NotApplicable = "\xE2\x80\x94"; // U+2014

namespace
{
const char *const IsoUtcFormat = "%Y-%m-%dT%H:%M:%SZ";

// Keeps one record per line whatever characters a path contains
std::string EscapeField(const std::string &field)
{
	std::string out;
	out.reserve(field.size());
	for (char c : field)
	{
		switch (c)
		{
		case '\t':
			out += "\\t";
			break;
		case '\n':
			out += "\\n";
			break;
		case '\r':
			out += "\\r";
			break;
		case '\\':
			out += "\\\\";
			break;
		default:
			out += c;
			break;
		}
	}
	return out;
}
} // namespace

AuditLog::~AuditLog()
{
	if (m_stream.is_open())
	{
		WriteLine("# run " + m_runId + " closed at " + FormatTimestamp(IsoUtcFormat, true) + " without a summary");
		m_stream.close();
	}
}

bool AuditLog::Open(const fs::path &directory, const fs::path &root, ExecutionMode mode, DuplicatePolicy policy)
{
	m_lastError.clear();
	if (m_stream.is_open())
	{
		m_lastError = "Audit log is already open: " + m_path.string();
		return false;
	}

	const std::string stamp = FormatTimestamp("%Y%m%d_%H%M%S", false);
	if (stamp.empty())
	{
		m_lastError = "Failed to format timestamp for the audit log name.";
		return false;
	}

	// Never reuse the file of an earlier run
	std::error_code ec;
	fs::path candidate = directory / ("pdf_rename_log_" + stamp + ".txt");
	for (int suffix = 1; fs::exists(fs::symlink_status(candidate, ec)); ++suffix)
	{
		candidate = directory / ("pdf_rename_log_" + stamp + "_" + std::to_string(suffix) + ".txt");
	}

	m_stream.open(candidate, std::ios::out | std::ios::app);
	if (!m_stream.is_open())
	{
		m_lastError = "Cannot create audit log '" + candidate.string() + "'";
		return false;
	}

	m_path = candidate;
	m_runId = FormatTimestamp("%Y%m%dT%H%M%SZ", true) + "-" + std::to_string(wxGetProcessId());

	WriteLine("# PDF rename log, run " + m_runId + " started " + FormatTimestamp(IsoUtcFormat, true));
	WriteLine("# Directory: " + EscapeField(root.string()));
	WriteLine(std::string("# Mode: ") + (mode == ExecutionMode::Commit ? "commit" : "dry-run") +
			  ", duplicates: " + (policy == DuplicatePolicy::Number ? "number" : "skip"));
	WriteLine("# timestamp\trun\tcategory\toriginal\tfinal\tdetail");
	return m_lastError.empty();
}

void AuditLog::Record(const ExecutionOutcome &outcome)
{
	if (!m_stream.is_open())
	{
		return;
	}
	WriteLine(FormatRecord(FormatTimestamp(IsoUtcFormat, true), m_runId, outcome));
}

void AuditLog::Close(const RunSummary &summary, bool cancelled)
{
	if (!m_stream.is_open())
	{
		return;
	}
	WriteLine("# run " + m_runId + " finished " + FormatTimestamp(IsoUtcFormat, true) +
			  ": discovered " + std::to_string(summary.discovered) +
			  ", renamed " + std::to_string(summary.renamed) +
			  ", skipped " + std::to_string(summary.skipped) +
			  ", errors " + std::to_string(summary.errors) +
			  (cancelled ? ", cancelled" : ""));
	m_stream.close();
}

std::string AuditLog::FormatRecord(const std::string &timestamp, const std::string &runId, const ExecutionOutcome &outcome)
{
	const bool hasTarget = outcome.Status == OutcomeStatus::Applied && !outcome.Operation.To.empty();
	std::string detail = outcome.Detail;
	if (detail.empty() && !outcome.Operation.Label.empty())
	{
		detail = "title: " + outcome.Operation.Label;
	}

	return timestamp + "\t" + runId + "\t" + RenamerEngine::CategoryName(outcome) + "\t" +
		   EscapeField(outcome.Operation.From.string()) + "\t" +
		   (hasTarget ? EscapeField(outcome.Operation.To.string()) : std::string(NotApplicable)) + "\t" +
		   EscapeField(detail);
}

// Writes and flushes a single line; a failing write is reported once
void AuditLog::WriteLine(const std::string &line)
{
	m_stream << line << '\n';
	m_stream.flush();
	if (!m_stream && m_lastError.empty())
	{
		m_lastError = "Write to audit log '" + m_path.string() + "' failed";
		wxLogError("%s", m_lastError.c_str());
	}
}
