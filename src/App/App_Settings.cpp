#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/config.h>
#include <wx/fileconf.h>
#include <wx/log.h>

#include "App.h"

#include <filesystem>

namespace fs = std::filesystem;

// Selects the configuration store: an explicit file given with --config, else the per-user one
void RenamerApp::InitConfig()
{
	if (!m_configFile.empty())
	{
		wxConfigBase::Set(new wxFileConfig(GetAppName(), wxEmptyString, m_configFile, wxEmptyString,
										   wxCONFIG_USE_LOCAL_FILE));
	}
	else
	{
		wxConfigBase::Set(new wxConfig(GetAppName()));
	}
}

// Loads the stored defaults into m_config; missing keys keep the built-in values
void RenamerApp::LoadDefaults()
{
	wxConfigBase *cfg = wxConfigBase::Get();
	if (!cfg)
		return;

	const wxString policy = cfg->Read("/Defaults/DuplicatePolicy", "number").Lower();
	if (policy == "skip")
	{
		m_config.duplicatePolicy = DuplicatePolicy::Skip;
	}
	else if (policy == "number")
	{
		m_config.duplicatePolicy = DuplicatePolicy::Number;
	}
	else
	{
		wxLogWarning("Ignoring unknown duplicate policy '%s' in the configuration.", policy);
	}

	m_config.extension = cfg->Read("/Defaults/Extension", wxString::FromUTF8(m_config.extension)).utf8_str().data();

	wxString logDir = cfg->Read("/Defaults/AuditLogDir", wxEmptyString);
	if (!logDir.empty())
	{
		m_config.auditLogDir = PathFromWxString(logDir);
	}

	// A zero or negative value falls back to the built-in limit
	long maxReadBytes = cfg->ReadLong("/Defaults/MaxReadBytes", 0);
	if (maxReadBytes > 0)
	{
		m_config.maxReadBytes = static_cast<std::uintmax_t>(maxReadBytes);
	}

	m_config.backup = cfg->ReadBool("/Defaults/Backup", false);
}

// Writes the effective defaults back. The mode and directory are never stored,
// so every run starts as a dry run of the directory it is given
void RenamerApp::SaveDefaults()
{
	wxConfigBase *cfg = wxConfigBase::Get();
	if (!cfg)
		return;

	cfg->Write("/Defaults/DuplicatePolicy", m_config.duplicatePolicy == DuplicatePolicy::Skip ? "skip" : "number");
	cfg->Write("/Defaults/Extension", wxString::FromUTF8(m_config.extension));
	cfg->Write("/Defaults/AuditLogDir", PathToWxString(m_config.auditLogDir));
	cfg->Write("/Defaults/MaxReadBytes", (long)m_config.maxReadBytes);
	cfg->Write("/Defaults/Backup", m_config.backup);

	if (!cfg->Flush())
	{
		wxLogWarning("Could not write the configuration.");
		return;
	}
	wxLogMessage("Defaults saved.");
}
