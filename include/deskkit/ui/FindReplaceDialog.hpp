#pragma once

#include "deskkit/data/GridSearch.hpp"

#include <QDialog>
#include <QPointer>

class QCheckBox;
class QLabel;
class QLineEdit;
class QPushButton;

namespace deskkit::ui {

// Modeless find and replace over the active table. Closing the dialog
// clears the search it drives.
class FindReplaceDialog final : public QDialog {
  Q_OBJECT

 public:
  explicit FindReplaceDialog(QWidget* parent = nullptr);

  // Null disables the dialog until a table becomes active.
  void                            setSearch(data::GridSearch* search);
  [[nodiscard]] data::GridSearch* search() const noexcept;

  void setFindText(const QString& text);
  void setReplaceText(const QString& text);
  void setCaseSensitive(bool enabled);
  void setWholeWord(bool enabled);

  [[nodiscard]] data::SearchOptions options() const;
  [[nodiscard]] QString             statusText() const;

  // Runs a fresh search when the text or options changed since the last one.
  void findNext();
  void findPrevious();
  int  replaceAll();

  // Escape and Close both end here.
  void reject() override;

 private:
  [[nodiscard]] bool searchIsCurrent() const;
  void               updateControls();
  void               updateStatus();

  QPointer<data::GridSearch> m_search;
  QMetaObject::Connection    m_matchesConnection;

  QLineEdit*   m_findText       = nullptr;
  QLineEdit*   m_replaceText    = nullptr;
  QCheckBox*   m_caseSensitive  = nullptr;
  QCheckBox*   m_wholeWord      = nullptr;
  QPushButton* m_findButton     = nullptr;
  QPushButton* m_previousButton = nullptr;
  QPushButton* m_replaceButton  = nullptr;
  QLabel*      m_status         = nullptr;

  data::SearchOptions m_searchedOptions;
};

}  // namespace deskkit::ui
