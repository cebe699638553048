#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/crt.h>
#include <wx/log.h>

#include "App.h"

#include <filesystem>
#include <cstdio>
#include <iostream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace
{
const char *const Rule = "================================================================================";

wxString Utf8(const std::string &s)
{
	return wxString::FromUTF8(s);
}
} // namespace

void RenamerApp::PrintBanner() const
{
	wxPrintf("%s\nPDF BATCH RENAMER - Based on PDF Metadata Titles\n%s\n\n", Rule, Rule);
	if (m_config.mode == ExecutionMode::DryRun)
	{
		wxPrintf("DRY RUN MODE - No files will be renamed\n\n");
	}
	else
	{
		wxPrintf("LIVE MODE - Files will be renamed\n\n");
	}
	wxPrintf("Directory: %s\n", PathToWxString(m_config.root));
	wxPrintf("Duplicate handling: %s\n", m_config.duplicatePolicy == DuplicatePolicy::Number ? "Enabled" : "Disabled");
	wxPrintf("%s\n", wxString('-', 80));
}

void RenamerApp::PrintPlanWarnings(const RenamePlan &plan) const
{
	for (const auto &msg : plan.warningLog)
	{
		wxLogWarning("%s", Utf8(msg));
	}
}

void RenamerApp::PrintOutcome(const fs::path &root, const ExecutionOutcome &outcome) const
{
	wxPrintf("%s\n", Utf8(RenamerEngine::FormatOutcomeLine(root, outcome)));
}

void RenamerApp::PrintBackup(const BackupResult &backup) const
{
	for (const auto &msg : backup.errorLog)
	{
		wxLogWarning("%s", Utf8(msg));
	}
	if (!backup.success)
	{
		return;
	}
	wxPrintf("Backed up %d file(s), %.2f MB, to:\n  %s\n", (int)backup.filesCopied,
			 backup.bytesCopied / (1024.0 * 1024.0), PathToWxString(backup.backupPath));
	wxPrintf("To restore, copy the files from there back to:\n  %s\n%s\n", PathToWxString(m_config.root),
			 wxString('-', 80));
}

void RenamerApp::PrintSummary(const ExecutionReport &report, const fs::path &auditPath) const
{
	wxPrintf("%s", Utf8(RenamerEngine::FormatSummary(report, auditPath)));
}

// Asks before a commit run; anything but "yes" or "y" cancels, as does a closed stdin
bool RenamerApp::ConfirmCommit() const
{
	std::error_code ec;
	const fs::path shown = fs::absolute(m_config.root, ec);

	wxPrintf("\nWARNING: You are about to rename files!\n");
	wxPrintf("Directory: %s\n", PathToWxString(ec ? m_config.root : shown));
	wxPrintf("Are you sure you want to continue? (yes/no): ");
	fflush(stdout);

	std::string response;
	if (!std::getline(std::cin, response))
	{
		wxPrintf("\n");
		return false;
	}

	wxString answer = Utf8(response).Trim().Trim(false).Lower();
	wxPrintf("\n");
	return answer == "yes" || answer == "y";
}
