#ifndef APP_H
#define APP_H

#include <wx/app.h>
#include <wx/cmdline.h>
#include <wx/string.h>

#include "RenamerEngine.h"

#include <filesystem>

namespace fs = std::filesystem;

// Console front end: parses the command line, plans the renames, optionally backs up and
// commits them, then prints one line per item and a summary
class RenamerApp : public wxAppConsole
{
public:
	bool OnInit() override;
	int OnRun() override;

	void OnInitCmdLine(wxCmdLineParser &parser) override;
	bool OnCmdLineParsed(wxCmdLineParser &parser) override;

private:
	// App_Settings.cpp
	void InitConfig();
	void LoadDefaults();
	void SaveDefaults();

	// App_Report.cpp
	void PrintBanner() const;
	void PrintPlanWarnings(const RenamePlan &plan) const;
	void PrintOutcome(const fs::path &root, const ExecutionOutcome &outcome) const;
	void PrintBackup(const BackupResult &backup) const;
	void PrintSummary(const ExecutionReport &report, const fs::path &auditPath) const;
	bool ConfirmCommit() const;

	RenamerConfig m_config;
	wxString m_configFile;
	bool m_assumeYes = false;
	bool m_saveDefaults = false;
};

wxDECLARE_APP(RenamerApp);

#endif // APP_H
