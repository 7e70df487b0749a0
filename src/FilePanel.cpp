#include "FilePanel.h"

#include "util.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include <wx/dataview.h>
#include <wx/sizer.h>
#include <wx/stattext.h>
#include <wx/textctrl.h>

namespace {
constexpr int COL_PATH = 0;
constexpr int COL_SIZE = 1;
constexpr int COL_RELPATH = 2;

std::string icase(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}
}  // namespace

FilePanel::FilePanel(wxWindow* parent) : wxPanel(parent, wxID_ANY) { BuildLayout(); }

void FilePanel::BuildLayout() {
  auto* sizer = new wxBoxSizer(wxVERTICAL);

  filterCtrl_ = new wxTextCtrl(this, wxID_ANY, "", wxDefaultPosition, wxDefaultSize);
  filterCtrl_->SetHint("Filter files");
  sizer->Add(filterCtrl_, 0, wxEXPAND | wxALL, 8);

  list_ = new wxDataViewListCtrl(this, wxID_ANY, wxDefaultPosition, wxDefaultSize,
                                 wxDV_ROW_LINES | wxDV_VERT_RULES | wxDV_MULTIPLE);
  list_->AppendTextColumn("Path", wxDATAVIEW_CELL_INERT, 520, wxALIGN_LEFT);
  list_->AppendTextColumn("Size", wxDATAVIEW_CELL_INERT, 100, wxALIGN_RIGHT);
  list_->AppendTextColumn("RelPath", wxDATAVIEW_CELL_INERT, 0, wxALIGN_LEFT, wxDATAVIEW_COL_HIDDEN);
  // We sort ourselves so sizes compare numerically rather than as text.
  for (unsigned int i = 0; i < list_->GetColumnCount(); i++) {
    if (auto* col = list_->GetColumn(i)) col->SetSortable(false);
  }
  sizer->Add(list_, 1, wxEXPAND | wxLEFT | wxRIGHT, 8);

  statusText_ = new wxStaticText(this, wxID_ANY, "");
  sizer->Add(statusText_, 0, wxEXPAND | wxALL, 8);
  SetSizer(sizer);

  BindEvents();
  UpdateSortIndicators();
  UpdateStatusText();
}

void FilePanel::BindEvents() {
  filterCtrl_->Bind(wxEVT_TEXT, [this](wxCommandEvent&) { ApplyFilterAndSort(); });

  list_->Bind(wxEVT_DATAVIEW_COLUMN_HEADER_CLICK, [this](wxDataViewEvent& e) {
    e.Veto();
    auto* col = e.GetDataViewColumn();
    if (!col) return;

    SortColumn clicked;
    switch (col->GetModelColumn()) {
      case COL_PATH: clicked = SortColumn::Path; break;
      case COL_SIZE: clicked = SortColumn::Size; break;
      default: return;
    }

    if (sortColumn_ == clicked) {
      sortAscending_ = !sortAscending_;
    } else {
      sortColumn_ = clicked;
      sortAscending_ = true;
    }
    ApplyFilterAndSort();
  });
  list_->Bind(wxEVT_DATAVIEW_ITEM_ACTIVATED, [this](wxDataViewEvent& e) {
    const int row = list_->ItemToRow(e.GetItem());
    if (row == wxNOT_FOUND || !onActivated_) return;
    onActivated_(RowRelativePath(row));
  });
  list_->Bind(wxEVT_DATAVIEW_SELECTION_CHANGED, [this](wxDataViewEvent&) { UpdateStatusText(); });
}

void FilePanel::BindActivated(std::function<void(const std::string&)> onActivated) {
  onActivated_ = std::move(onActivated);
}

void FilePanel::SetEntries(std::vector<listing::FileEntry> entries) {
  entries_ = std::move(entries);
  ApplyFilterAndSort();
}

void FilePanel::Clear() {
  entries_.clear();
  ApplyFilterAndSort();
}

void FilePanel::SetStatus(const wxString& message) {
  status_ = message;
  UpdateStatusText();
}

void FilePanel::ApplyFilterAndSort() {
  const auto needle = icase(filterCtrl_->GetValue().utf8_string());

  shown_.clear();
  shown_.reserve(entries_.size());
  for (const auto& e : entries_) {
    if (!needle.empty() && icase(e.relativePath).find(needle) == std::string::npos) continue;
    shown_.push_back(&e);
  }

  const auto cmp = [&](const listing::FileEntry* a, const listing::FileEntry* b) -> bool {
    int rel = 0;
    switch (sortColumn_) {
      case SortColumn::Path: {
        const auto ap = icase(a->relativePath);
        const auto bp = icase(b->relativePath);
        rel = (ap < bp) ? -1 : (ap > bp ? 1 : 0);
        break;
      }
      case SortColumn::Size: {
        if (a->size < b->size) rel = -1;
        else if (a->size > b->size) rel = 1;
        break;
      }
    }
    if (!sortAscending_) rel = -rel;
    if (rel != 0) return rel < 0;
    return a->relativePath < b->relativePath;
  };
  std::stable_sort(shown_.begin(), shown_.end(), cmp);

  list_->Freeze();
  list_->DeleteAllItems();
  for (const auto* e : shown_) {
    wxVector<wxVariant> row;
    row.push_back(wxVariant(wxString::FromUTF8(e->relativePath)));
    row.push_back(wxVariant(wxString::FromUTF8(HumanSize(e->size))));
    row.push_back(wxVariant(wxString::FromUTF8(e->relativePath)));
    list_->AppendItem(row);
  }
  list_->Thaw();

  UpdateSortIndicators();
  UpdateStatusText();
}

void FilePanel::UpdateSortIndicators() {
  for (unsigned int i = 0; i < list_->GetColumnCount(); i++) {
    auto* col = list_->GetColumn(i);
    if (!col) continue;
    const int modelCol = col->GetModelColumn();
    const bool active = (modelCol == COL_PATH && sortColumn_ == SortColumn::Path) ||
                        (modelCol == COL_SIZE && sortColumn_ == SortColumn::Size);
    if (active) {
      col->SetSortOrder(sortAscending_);
    } else {
      col->UnsetAsSortKey();
    }
  }
}

void FilePanel::UpdateStatusText() {
  std::uintmax_t totalBytes = 0;
  for (const auto* e : shown_) totalBytes += e->size;

  wxString text = wxString::Format("%d of %d files, %s", static_cast<int>(shown_.size()),
                                   static_cast<int>(entries_.size()),
                                   wxString::FromUTF8(HumanSize(totalBytes)));
  const int selected = list_ ? list_->GetSelectedItemsCount() : 0;
  if (selected > 0) text += wxString::Format(" | %d selected", selected);
  if (!status_.empty()) text += " | " + status_;
  statusText_->SetLabel(text);
}

std::string FilePanel::RowRelativePath(int row) const {
  wxVariant v;
  list_->GetValue(v, static_cast<unsigned int>(row), COL_RELPATH);
  return v.GetString().utf8_string();
}

std::vector<std::string> FilePanel::GetSelectedRelativePaths() const {
  std::vector<std::string> out;
  const unsigned int count = list_->GetItemCount();
  for (unsigned int row = 0; row < count; row++) {
    if (!list_->IsRowSelected(static_cast<int>(row))) continue;
    out.push_back(RowRelativePath(static_cast<int>(row)));
  }
  return out;
}

std::string FilePanel::GetCurrentRelativePath() const {
  const int row = list_->ItemToRow(list_->GetCurrentItem());
  if (row != wxNOT_FOUND && list_->IsRowSelected(row)) return RowRelativePath(row);
  const auto selected = GetSelectedRelativePaths();
  return selected.empty() ? std::string{} : selected.front();
}
