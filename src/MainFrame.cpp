#include "MainFrame.h"

#include "FileOps.h"

#include <system_error>

#include <wx/button.h>
#include <wx/checkbox.h>
#include <wx/choice.h>
#include <wx/dialog.h>
#include <wx/dirdlg.h>
#include <wx/menu.h>
#include <wx/msgdlg.h>
#include <wx/sizer.h>
#include <wx/stattext.h>
#include <wx/textctrl.h>
#include <wx/textdlg.h>
#include <wx/utils.h>

namespace fs = std::filesystem;

namespace {
enum MenuId : int {
  ID_OpenFolder = wxID_HIGHEST + 1,
  ID_Refresh,
  ID_Rename,
  ID_Move,
  ID_Delete,
  ID_MkDir
};

// Destination folder plus the "create if missing" flag for a move.
class MoveDialog final : public wxDialog {
public:
  MoveDialog(wxWindow* parent, const wxString& what)
      : wxDialog(parent, wxID_ANY, "Move", wxDefaultPosition, wxDefaultSize,
                 wxDEFAULT_DIALOG_STYLE | wxRESIZE_BORDER) {
    auto* sizer = new wxBoxSizer(wxVERTICAL);
    sizer->Add(new wxStaticText(this, wxID_ANY, what), 0, wxALL, 10);
    sizer->Add(new wxStaticText(this, wxID_ANY, "Destination folder (empty for the top level):"), 0,
               wxLEFT | wxRIGHT, 10);
    dirCtrl_ = new wxTextCtrl(this, wxID_ANY, "", wxDefaultPosition, wxSize(360, -1));
    sizer->Add(dirCtrl_, 0, wxEXPAND | wxALL, 10);
    createChk_ = new wxCheckBox(this, wxID_ANY, "Create the folder if it does not exist");
    createChk_->SetValue(true);
    sizer->Add(createChk_, 0, wxLEFT | wxRIGHT | wxBOTTOM, 10);
    sizer->Add(CreateStdDialogButtonSizer(wxOK | wxCANCEL), 0, wxEXPAND | wxALL, 10);
    SetSizerAndFit(sizer);
    dirCtrl_->SetFocus();
  }

  std::string Directory() const { return dirCtrl_->GetValue().Trim().Trim(false).utf8_string(); }
  bool CreateDir() const { return createChk_->GetValue(); }

private:
  wxTextCtrl* dirCtrl_{nullptr};
  wxCheckBox* createChk_{nullptr};
};

std::string ParentRelative(const std::string& rel) {
  const auto slash = rel.find_last_of('/');
  return slash == std::string::npos ? std::string{} : rel.substr(0, slash);
}

std::string BaseName(const std::string& rel) {
  const auto slash = rel.find_last_of('/');
  return slash == std::string::npos ? rel : rel.substr(slash + 1);
}
}  // namespace

MainFrame::MainFrame(std::string initialRoot)
    : wxFrame(nullptr, wxID_ANY, "Sandbar", wxDefaultPosition, wxSize(900, 640)) {
  settings_ = settings::Load();

  BuildMenu();
  BuildLayout();
  BindEvents();
  SetMinSize(wxSize(640, 420));

  showHiddenChk_->SetValue(settings_.showHidden);
  RefreshMounts();

  if (initialRoot.empty()) initialRoot = settings_.lastRoot;
  std::error_code ec;
  if (!initialRoot.empty() && fs::is_directory(initialRoot, ec)) OpenRoot(initialRoot);
}

void MainFrame::BuildMenu() {
  auto* fileMenu = new wxMenu();
  fileMenu->Append(ID_OpenFolder, "Open Folder...\tCtrl+O");
  fileMenu->AppendSeparator();
  fileMenu->Append(wxID_EXIT, "Quit\tCtrl+Q");

  auto* opsMenu = new wxMenu();
  opsMenu->Append(ID_Refresh, "Refresh\tF5");
  opsMenu->AppendSeparator();
  opsMenu->Append(ID_Rename, "Rename\tF2");
  opsMenu->Append(ID_Move, "Move to Folder...\tCtrl+M");
  opsMenu->Append(ID_Delete, "Delete permanently\tDel");
  opsMenu->AppendSeparator();
  opsMenu->Append(ID_MkDir, "New Folder\tF7");

  auto* bar = new wxMenuBar();
  bar->Append(fileMenu, "&File");
  bar->Append(opsMenu, "&Operations");
  SetMenuBar(bar);
}

void MainFrame::BuildLayout() {
  auto* root = new wxPanel(this, wxID_ANY);
  auto* sizer = new wxBoxSizer(wxVERTICAL);

  auto* toolbar = new wxBoxSizer(wxHORIZONTAL);
  toolbar->Add(new wxStaticText(root, wxID_ANY, "Device:"), 0, wxALIGN_CENTER_VERTICAL | wxRIGHT, 6);
  mountChoice_ = new wxChoice(root, wxID_ANY);
  toolbar->Add(mountChoice_, 1, wxEXPAND | wxRIGHT, 4);
  refreshMountsBtn_ = new wxButton(root, wxID_ANY, "Rescan");
  toolbar->Add(refreshMountsBtn_, 0, wxRIGHT, 8);
  openBtn_ = new wxButton(root, wxID_ANY, "Open Folder...");
  toolbar->Add(openBtn_, 0, wxRIGHT, 8);
  showHiddenChk_ = new wxCheckBox(root, wxID_ANY, "Show hidden files");
  toolbar->Add(showHiddenChk_, 0, wxALIGN_CENTER_VERTICAL);
  sizer->Add(toolbar, 0, wxEXPAND | wxLEFT | wxRIGHT | wxTOP, 8);

  rootText_ = new wxStaticText(root, wxID_ANY, "No folder selected");
  sizer->Add(rootText_, 0, wxEXPAND | wxLEFT | wxRIGHT | wxTOP, 8);

  files_ = new FilePanel(root);
  sizer->Add(files_, 1, wxEXPAND);
  root->SetSizer(sizer);

  auto* frameSizer = new wxBoxSizer(wxVERTICAL);
  frameSizer->Add(root, 1, wxEXPAND);
  SetSizer(frameSizer);
}

void MainFrame::BindEvents() {
  Bind(wxEVT_MENU, &MainFrame::OnQuit, this, wxID_EXIT);
  Bind(wxEVT_MENU, &MainFrame::OnOpenFolder, this, ID_OpenFolder);
  Bind(wxEVT_MENU, &MainFrame::OnRefresh, this, ID_Refresh);
  Bind(wxEVT_MENU, &MainFrame::OnRename, this, ID_Rename);
  Bind(wxEVT_MENU, &MainFrame::OnMove, this, ID_Move);
  Bind(wxEVT_MENU, &MainFrame::OnDelete, this, ID_Delete);
  Bind(wxEVT_MENU, &MainFrame::OnMkDir, this, ID_MkDir);

  openBtn_->Bind(wxEVT_BUTTON, [this](wxCommandEvent& e) { OnOpenFolder(e); });
  refreshMountsBtn_->Bind(wxEVT_BUTTON, [this](wxCommandEvent&) { RefreshMounts(); });
  mountChoice_->Bind(wxEVT_CHOICE, [this](wxCommandEvent&) {
    const int sel = mountChoice_->GetSelection();
    if (sel == wxNOT_FOUND || static_cast<size_t>(sel) >= mounts_.size()) return;
    OpenRoot(fs::path(mounts_[static_cast<size_t>(sel)].path));
  });
  showHiddenChk_->Bind(wxEVT_CHECKBOX, [this](wxCommandEvent&) {
    settings_.showHidden = showHiddenChk_->GetValue();
    SaveSettings();
    ReloadListing();
  });
  files_->BindActivated([this](const std::string& rel) {
    if (root_.empty() || rel.empty()) return;
    fs::path target;
    const auto res = fileops::ResolveFile(root_, rel, &target);
    if (!res.ok) {
      ShowFailure("Open", res);
      return;
    }
    wxLaunchDefaultApplication(wxString::FromUTF8(target.string()));
  });

  Bind(wxEVT_CLOSE_WINDOW, [this](wxCloseEvent& e) {
    SaveSettings();
    e.Skip();
  });
}

void MainFrame::RefreshMounts() {
  mounts_ = mounts::ListCandidateMounts(settings_.extraRoots);

  mountChoice_->Clear();
  int selected = wxNOT_FOUND;
  for (size_t i = 0; i < mounts_.size(); i++) {
    const auto& m = mounts_[i];
    mountChoice_->Append(wxString::Format("%s  (%s)", wxString::FromUTF8(m.label),
                                          wxString::FromUTF8(m.path)));
    if (!root_.empty() && fs::path(m.path) == root_) selected = static_cast<int>(i);
  }
  if (selected != wxNOT_FOUND) mountChoice_->SetSelection(selected);
  if (mounts_.empty()) mountChoice_->Append("(no removable devices found)");
}

void MainFrame::OpenRoot(const fs::path& root) {
  root_ = root;
  settings_.lastRoot = root.string();
  SaveSettings();
  rootText_->SetLabel(wxString::Format("Folder: %s", wxString::FromUTF8(root.string())));
  ReloadListing();
}

void MainFrame::ReloadListing() {
  if (root_.empty()) {
    files_->Clear();
    return;
  }

  wxBusyCursor busy;
  auto result = listing::ListFiles(root_, settings_.showHidden);
  if (!result.status.ok) {
    files_->Clear();
    files_->SetStatus(ErrorKindName(result.status.kind));
    ShowFailure("Unable to list folder", result.status);
    return;
  }

  const auto skipped = result.skipped.size();
  files_->SetEntries(std::move(result.entries));
  if (skipped == 0) {
    files_->SetStatus({});
  } else {
    files_->SetStatus(wxString::Format("%d unreadable item(s) skipped", static_cast<int>(skipped)));
  }
}

void MainFrame::ShowFailure(const wxString& title, const OpResult& res) {
  wxMessageBox(wxString::Format("%s\n\n%s", ErrorKindName(res.kind), res.message), title,
               wxOK | wxICON_ERROR, this);
}

void MainFrame::SaveSettings() { settings::Save(settings_); }

void MainFrame::OnQuit(wxCommandEvent&) { Close(true); }

void MainFrame::OnOpenFolder(wxCommandEvent&) {
  wxDirDialog dlg(this, "Choose the folder to browse", wxString::FromUTF8(root_.string()),
                  wxDD_DEFAULT_STYLE | wxDD_DIR_MUST_EXIST);
  if (dlg.ShowModal() != wxID_OK) return;
  OpenRoot(fs::path(dlg.GetPath().utf8_string()));
}

void MainFrame::OnRefresh(wxCommandEvent&) {
  RefreshMounts();
  ReloadListing();
}

void MainFrame::OnRename(wxCommandEvent&) {
  if (root_.empty()) return;
  const auto rel = files_->GetCurrentRelativePath();
  if (rel.empty()) return;

  const auto newName = wxGetTextFromUser("New name:", "Rename", wxString::FromUTF8(BaseName(rel)), this)
                           .utf8_string();
  if (newName.empty() || newName == BaseName(rel)) return;

  const auto res = fileops::Rename(root_, rel, newName);
  if (!res.ok) ShowFailure("Rename", res);
  ReloadListing();
}

void MainFrame::OnMove(wxCommandEvent&) {
  if (root_.empty()) return;
  const auto selected = files_->GetSelectedRelativePaths();
  if (selected.empty()) return;

  const auto what = selected.size() == 1
                        ? wxString::Format("Move \"%s\"", wxString::FromUTF8(selected.front()))
                        : wxString::Format("Move %d files", static_cast<int>(selected.size()));
  MoveDialog dlg(this, what);
  if (dlg.ShowModal() != wxID_OK) return;

  // Each file is an independent operation; stop at the first failure.
  for (const auto& rel : selected) {
    const auto res = fileops::Move(root_, rel, dlg.Directory(), dlg.CreateDir());
    if (!res.ok) {
      ShowFailure("Move", res);
      break;
    }
  }
  ReloadListing();
}

void MainFrame::OnDelete(wxCommandEvent&) {
  if (root_.empty()) return;
  const auto selected = files_->GetSelectedRelativePaths();
  if (selected.empty()) return;

  const auto prompt =
      selected.size() == 1
          ? wxString::Format("Permanently delete \"%s\"?", wxString::FromUTF8(selected.front()))
          : wxString::Format("Permanently delete %d files?", static_cast<int>(selected.size()));
  if (wxMessageBox(prompt, "Delete", wxYES_NO | wxNO_DEFAULT | wxICON_WARNING, this) != wxYES) return;

  for (const auto& rel : selected) {
    const auto res = fileops::Delete(root_, rel);
    if (!res.ok) {
      ShowFailure("Delete", res);
      break;
    }
  }
  ReloadListing();
}

void MainFrame::OnMkDir(wxCommandEvent&) {
  if (root_.empty()) return;
  const auto current = files_->GetCurrentRelativePath();
  const auto base = ParentRelative(current);
  const auto suggested = base.empty() ? std::string{} : base + "/";

  const auto rel = wxGetTextFromUser("Folder path (relative to the top level):", "New Folder",
                                     wxString::FromUTF8(suggested), this)
                       .utf8_string();
  if (rel.empty()) return;

  const auto res = fileops::CreateFolder(root_, rel);
  if (!res.ok) ShowFailure("New Folder", res);
  ReloadListing();
}
