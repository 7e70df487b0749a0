#pragma once

#include "FileLister.h"

#include <functional>
#include <string>
#include <vector>

#include <wx/panel.h>

class wxDataViewListCtrl;
class wxDataViewEvent;
class wxStaticText;
class wxTextCtrl;

// Flat list of the files below the current root, with a filter box and
// column sorting. Holds its own copy of the last listing; never touches disk.
class FilePanel final : public wxPanel {
public:
  explicit FilePanel(wxWindow* parent);

  void SetEntries(std::vector<listing::FileEntry> entries);
  void Clear();
  void SetStatus(const wxString& message);

  // Selected relativePath values, in display order.
  std::vector<std::string> GetSelectedRelativePaths() const;
  // relativePath of the focused row, falling back to the first selected one.
  std::string GetCurrentRelativePath() const;

  void BindActivated(std::function<void(const std::string& relativePath)> onActivated);

private:
  enum class SortColumn { Path, Size };

  void BuildLayout();
  void BindEvents();
  void ApplyFilterAndSort();
  void UpdateSortIndicators();
  void UpdateStatusText();
  std::string RowRelativePath(int row) const;

  wxTextCtrl* filterCtrl_{nullptr};
  wxDataViewListCtrl* list_{nullptr};
  wxStaticText* statusText_{nullptr};

  std::vector<listing::FileEntry> entries_{};
  std::vector<const listing::FileEntry*> shown_{};
  wxString status_{};

  SortColumn sortColumn_{SortColumn::Path};
  bool sortAscending_{true};

  std::function<void(const std::string&)> onActivated_{};
};
