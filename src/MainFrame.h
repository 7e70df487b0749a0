#pragma once

#include "FilePanel.h"
#include "Mounts.h"
#include "Settings.h"
#include "util.h"

#include <wx/frame.h>

#include <filesystem>
#include <string>
#include <vector>

class wxButton;
class wxCheckBox;
class wxChoice;
class wxStaticText;

class MainFrame final : public wxFrame {
public:
  explicit MainFrame(std::string initialRoot = {});

private:
  void BuildMenu();
  void BuildLayout();
  void BindEvents();

  void RefreshMounts();
  void OpenRoot(const std::filesystem::path& root);
  void ReloadListing();
  void ShowFailure(const wxString& title, const OpResult& res);
  void SaveSettings();

  void OnQuit(wxCommandEvent& event);
  void OnOpenFolder(wxCommandEvent& event);
  void OnRefresh(wxCommandEvent& event);
  void OnRename(wxCommandEvent& event);
  void OnMove(wxCommandEvent& event);
  void OnDelete(wxCommandEvent& event);
  void OnMkDir(wxCommandEvent& event);

  wxChoice* mountChoice_{nullptr};
  wxButton* refreshMountsBtn_{nullptr};
  wxButton* openBtn_{nullptr};
  wxCheckBox* showHiddenChk_{nullptr};
  wxStaticText* rootText_{nullptr};
  FilePanel* files_{nullptr};

  settings::Settings settings_{};
  std::vector<mounts::MountPoint> mounts_{};
  // Presentation state only; every core call receives it explicitly.
  std::filesystem::path root_{};
};
