#include "pch.h"
#include <wx/app.h>
#include <wx/init.h>
#include <wx/log.h>

class RenamerTestApp : public wxAppConsole
{
public:
    virtual bool OnInit() override
    {
        // No command line parsing for the test runner
        SetAppName("PdfTitleRenamerTests");
        return true;
    }
};

wxIMPLEMENT_APP_NO_MAIN(RenamerTestApp);

class WxConsoleEnvironment : public ::testing::Environment
{
public:
    virtual void SetUp() override
    {
        wxAppConsole::SetInstance(new RenamerTestApp());
        char appname[] = "PdfTitleRenamerTests";
        char *argv_[] = {appname, nullptr};
        int argc_ = 1;

        if (!wxEntryStart(argc_, argv_))
        {
            FAIL() << "wxEntryStart failed. wxWidgets could not be initialized for tests.";
            return;
        }

        if (wxAppConsole::GetInstance())
        {
            if (!wxAppConsole::GetInstance()->CallOnInit())
            {
                FAIL() << "wxAppConsole::GetInstance()->CallOnInit() failed.";
                wxEntryCleanup();
            }
        }
        else
        {
            FAIL() << "The application instance is null after wxEntryStart. wxWidgets initialization incomplete.";
            wxEntryCleanup();
        }
    }

    virtual void TearDown() override
    {
        if (wxAppConsole::GetInstance())
        {
            wxAppConsole::GetInstance()->OnExit();
        }
        wxEntryCleanup();
        wxAppConsole::SetInstance(nullptr);
    }
};

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    // Engine diagnostics would otherwise interleave with the test output
    wxLog::EnableLogging(false);
    ::testing::AddGlobalTestEnvironment(new WxConsoleEnvironment);
    return RUN_ALL_TESTS();
}