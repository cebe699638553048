#include <wx/wxprec.h>
#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif
#include <wx/log.h>

#include "App.h"
#include "AuditLog.h"
#include "PdfMetadata.h"

#include <csignal>
#include <cstring>

#include <signal.h>

wxIMPLEMENT_APP_CONSOLE(RenamerApp);

namespace
{
volatile std::sig_atomic_t g_cancelRequested = 0;

void HandleInterrupt(int)
{
	g_cancelRequested = 1;
}

// Routes SIGINT to the cancellation flag for as long as the guard lives
class InterruptGuard
{
public:
	InterruptGuard()
	{
		g_cancelRequested = 0;
		struct sigaction sa;
		std::memset(&sa, 0, sizeof(sa));
		sa.sa_handler = HandleInterrupt;
		sigemptyset(&sa.sa_mask);
		m_installed = sigaction(SIGINT, &sa, &m_previous) == 0;
		if (!m_installed)
		{
			wxLogWarning("Could not install the interrupt handler; Ctrl+C will stop the run immediately.");
		}
	}
	~InterruptGuard()
	{
		if (m_installed)
		{
			sigaction(SIGINT, &m_previous, nullptr);
		}
	}

	InterruptGuard(const InterruptGuard &) = delete;
	InterruptGuard &operator=(const InterruptGuard &) = delete;

private:
	struct sigaction m_previous;
	bool m_installed = false;
};
} // namespace

bool RenamerApp::OnInit()
{
	SetAppName("PdfTitleRenamer");

	// Diagnostics go to stderr, the item report to stdout
	delete wxLog::SetActiveTarget(new wxLogStderr());

	// Parses the command line through OnInitCmdLine/OnCmdLineParsed
	return wxAppConsole::OnInit();
}

void RenamerApp::OnInitCmdLine(wxCmdLineParser &parser)
{
	wxAppConsole::OnInitCmdLine(parser); // --help and --verbose

	parser.SetLogo("Batch rename PDF files based on their metadata titles.\n"
				   "Runs as a dry run unless --no-dry-run is given.");
	parser.AddOption("d", "directory", "Directory containing PDF files (default: current directory)",
					 wxCMD_LINE_VAL_STRING);
	parser.AddSwitch("", "no-dry-run", "Rename files instead of only reporting what would happen");
	parser.AddSwitch("", "no-duplicates", "Don't automatically number duplicate filenames");
	parser.AddSwitch("", "duplicates", "Number duplicate filenames even if the stored default says otherwise");
	parser.AddSwitch("y", "yes", "Don't ask for confirmation before renaming");
	parser.AddSwitch("", "backup", "Copy the PDF files to a timestamped backup directory before renaming");
	parser.AddOption("", "backup-dir", "Directory in which the backup directory is created (default: parent of --directory)",
					 wxCMD_LINE_VAL_STRING);
	parser.AddOption("", "log-dir", "Directory for the rename log (default: --directory)", wxCMD_LINE_VAL_STRING);
	parser.AddOption("", "ext", "File extension to process (default: .pdf)", wxCMD_LINE_VAL_STRING);
	parser.AddOption("", "max-read-mb", "Read at most this many MiB of each file when looking for its title",
					 wxCMD_LINE_VAL_NUMBER);
	parser.AddOption("", "config", "Read stored defaults from this file instead of the user configuration",
					 wxCMD_LINE_VAL_STRING);
	parser.AddSwitch("", "save-defaults", "Store the duplicate policy, extension, log directory, read limit and backup choice");
}

bool RenamerApp::OnCmdLineParsed(wxCmdLineParser &parser)
{
	if (!wxAppConsole::OnCmdLineParsed(parser))
	{
		return false;
	}

	// Stored defaults first, then whatever the command line overrides
	parser.Found("config", &m_configFile);
	InitConfig();
	LoadDefaults();

	wxString value;
	if (parser.Found("directory", &value))
	{
		m_config.root = PathFromWxString(value);
	}
	else
	{
		m_config.root = fs::path(".");
	}

	if (parser.Found("no-duplicates") && parser.Found("duplicates"))
	{
		wxLogError("--duplicates and --no-duplicates cannot be combined.");
		return false;
	}
	if (parser.Found("no-duplicates"))
	{
		m_config.duplicatePolicy = DuplicatePolicy::Skip;
	}
	else if (parser.Found("duplicates"))
	{
		m_config.duplicatePolicy = DuplicatePolicy::Number;
	}

	m_config.mode = parser.Found("no-dry-run") ? ExecutionMode::Commit : ExecutionMode::DryRun;
	m_assumeYes = parser.Found("yes");
	m_saveDefaults = parser.Found("save-defaults");

	if (parser.Found("backup"))
	{
		m_config.backup = true;
	}
	if (parser.Found("backup-dir", &value))
	{
		m_config.backupDir = PathFromWxString(value);
	}
	if (parser.Found("log-dir", &value))
	{
		m_config.auditLogDir = PathFromWxString(value);
	}
	if (parser.Found("ext", &value))
	{
		const wxScopedCharBuffer utf8 = value.Trim().Trim(false).utf8_str();
		std::string extension(utf8.data(), utf8.length());
		if (!extension.empty() && extension[0] != '.')
		{
			extension.insert(0, 1, '.');
		}
		m_config.extension = extension;
	}

	long megabytes = 0;
	if (parser.Found("max-read-mb", &megabytes))
	{
		if (megabytes <= 0)
		{
			wxLogError("--max-read-mb must be a positive number.");
			return false;
		}
		m_config.maxReadBytes = static_cast<std::uintmax_t>(megabytes) * 1024 * 1024;
	}

	if (m_saveDefaults)
	{
		SaveDefaults();
	}
	return true;
}

int RenamerApp::OnRun()
{
	PrintBanner();

	if (m_config.mode == ExecutionMode::Commit && !m_assumeYes && !ConfirmCommit())
	{
		wxPrintf("Operation cancelled.\n");
		return RenamerEngine::ExitOk;
	}

	// 1. Plan
	PdfTitleExtractor extractor(m_config.maxReadBytes);
	RenamePlan plan = RenamerEngine::BuildPlan(m_config, extractor);
	if (!plan.success)
	{
		for (const auto &msg : plan.errorLog)
		{
			wxLogError("%s", wxString::FromUTF8(msg));
		}
		return RenamerEngine::ExitFailure;
	}
	PrintPlanWarnings(plan);

	// 2. Backup (commit only) and audit log; either failing stops the run before any rename
	if (m_config.mode == ExecutionMode::Commit && m_config.backup)
	{
		const fs::path backupParent = m_config.backupDir.empty() ? RenamerEngine::DefaultBackupParent(plan.Root)
																 : m_config.backupDir;
		BackupResult backup = RenamerEngine::PerformBackup(plan.Root, backupParent, m_config.extension);
		PrintBackup(backup);
		if (!backup.success)
		{
			wxLogError("Backup failed, nothing was renamed: %s", wxString::FromUTF8(backup.errorMessage));
			return RenamerEngine::ExitFailure;
		}
	}
	else if (m_config.backup)
	{
		wxLogMessage("Dry run: --backup is ignored.");
	}

	// Dry runs are logged too; the header records the mode
	AuditLog audit;
	const fs::path logDir = m_config.auditLogDir.empty() ? plan.Root : m_config.auditLogDir;
	if (!audit.Open(logDir, plan.Root, m_config.mode, m_config.duplicatePolicy))
	{
		wxLogError("%s (use --log-dir to choose another directory)", wxString::FromUTF8(audit.GetLastError()));
		return RenamerEngine::ExitFailure;
	}

	// 3. Execute
	ExecutionReport report;
	{
		InterruptGuard guard;
		report = RenamerEngine::ExecutePlan(plan, m_config.mode, &audit,
											[]()
											{ return g_cancelRequested != 0; });
	}

	for (const auto &outcome : report.outcomes)
	{
		PrintOutcome(plan.Root, outcome);
	}
	PrintSummary(report, audit.GetPath());

	return RenamerEngine::ExitStatus(report);
}
