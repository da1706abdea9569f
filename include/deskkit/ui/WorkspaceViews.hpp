#pragma once

#include "deskkit/data/GridSearch.hpp"

#include <QHash>
#include <QPlainTextEdit>
#include <QString>
#include <QTableWidget>
#include <QWidget>

#include <functional>

class QKeyEvent;

namespace deskkit::workspace {
class Workspace;
class NotesWorkspace;
class TableWorkspace;
}  // namespace deskkit::workspace

namespace deskkit::ui {

class NotesView final : public QPlainTextEdit {
  Q_OBJECT

 public:
  explicit NotesView(workspace::NotesWorkspace& notes, QWidget* parent = nullptr);

 private:
  workspace::NotesWorkspace& m_notes;
};

class TableView final : public QTableWidget {
  Q_OBJECT

 public:
  explicit TableView(workspace::TableWorkspace& table, QWidget* parent = nullptr);

  // Copies the bounding box of the selected cells to the clipboard.
  void copySelection();
  // Pastes clipboard text with its first cell at the current cell. Returns
  // the number of cells written.
  int pasteClipboard();

  // Search over the table; a match moves the current cell to it.
  [[nodiscard]] data::GridSearch& search() noexcept;

 protected:
  void keyPressEvent(QKeyEvent* event) override;

 private:
  void populate();
  void refreshCell(int row, int column);

  workspace::TableWorkspace& m_table;
  data::GridSearch           m_search;
};

// Builds the widget for a workspace from its view type.
class WorkspaceViewFactory final {
 public:
  using Creator = std::function<QWidget*(workspace::Workspace&, QWidget*)>;

  // Registers the notes and table views.
  static WorkspaceViewFactory withDefaultViews();

  void registerView(const QString& viewType, Creator creator);
  // Unknown view types get a placeholder label.
  [[nodiscard]] QWidget* createView(workspace::Workspace& workspace, QWidget* parent) const;

 private:
  static QWidget* createPlaceholder(const workspace::Workspace& workspace, QWidget* parent);

  QHash<QString, Creator> m_creators;
};

}  // namespace deskkit::ui
