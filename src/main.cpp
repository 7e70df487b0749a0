#include "MainFrame.h"

#include <wx/cmdline.h>
#include <wx/log.h>
#include <wx/wx.h>

#include <string>

class SandbarApp final : public wxApp {
public:
  void OnInitCmdLine(wxCmdLineParser& parser) override {
    wxApp::OnInitCmdLine(parser);

    parser.AddParam("ROOT", wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL);

    parser.SetLogo("Usage: sandbar [--verbose] [ROOT]\n\n"
                   "Browses the files below ROOT (or the last opened folder).\n");
  }

  bool OnCmdLineParsed(wxCmdLineParser& parser) override {
    if (!wxApp::OnCmdLineParsed(parser)) return false;

    if (parser.GetParamCount() >= 1) m_root = parser.GetParam(0).utf8_string();
    return true;
  }

  bool OnInit() override {
    // Core messages go to stderr instead of popping up dialogs; the frame
    // reports failures itself.
    delete wxLog::SetActiveTarget(new wxLogStderr());

    if (!wxApp::OnInit()) return false;

    auto* frame = new MainFrame(m_root);
    frame->Show(true);
    return true;
  }

private:
  std::string m_root;
};

wxIMPLEMENT_APP(SandbarApp);
