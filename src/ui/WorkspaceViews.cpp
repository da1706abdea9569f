#include "deskkit/ui/WorkspaceViews.hpp"

#include "deskkit/workspace/NotesWorkspace.hpp"
#include "deskkit/workspace/TableWorkspace.hpp"

#include "deskkit/data/CellClipboard.hpp"
#include "deskkit/logging/Logger.hpp"

#include <QClipboard>
#include <QGuiApplication>
#include <QHeaderView>
#include <QKeyEvent>
#include <QKeySequence>
#include <QLabel>
#include <QSignalBlocker>
#include <QTableWidgetItem>

#include <algorithm>
#include <utility>

namespace deskkit::ui {

NotesView::NotesView(workspace::NotesWorkspace& notes, QWidget* parent) : QPlainTextEdit(parent), m_notes(notes) {
  setPlainText(m_notes.text());
  connect(this, &QPlainTextEdit::textChanged, this, [this]() { m_notes.setText(toPlainText()); });
}

TableView::TableView(workspace::TableWorkspace& table, QWidget* parent)
    : QTableWidget(parent), m_table(table), m_search(table.gridAccess()) {
  setAlternatingRowColors(true);
  setSelectionMode(QAbstractItemView::ExtendedSelection);
  horizontalHeader()->setStretchLastSection(true);
  populate();

  connect(this, &QTableWidget::itemChanged, this, [this](QTableWidgetItem* item) {
    if (item != nullptr) {
      m_table.setCell(item->row(), item->column(), item->text());
    }
  });
  // Paste and replace write through the workspace.
  connect(&m_table, &workspace::TableWorkspace::cellChanged, this, &TableView::refreshCell);
  connect(&m_search, &data::GridSearch::matchFound, this, [this](int row, int column, const QString&) {
    setCurrentCell(row, column);
    if (QTableWidgetItem* found = item(row, column)) {
      scrollToItem(found);
    }
  });
}

void TableView::copySelection() {
  const QModelIndexList selected = selectedIndexes();
  data::CellRange       range;
  if (selected.isEmpty()) {
    if (currentRow() < 0 || currentColumn() < 0) {
      return;
    }
    range = data::CellRange::singleCell(currentRow(), currentColumn());
  } else {
    range = data::CellRange::singleCell(selected.first().row(), selected.first().column());
    for (const QModelIndex& index : selected) {
      range.startRow    = (std::min)(range.startRow, index.row());
      range.startColumn = (std::min)(range.startColumn, index.column());
      range.endRow      = (std::max)(range.endRow, index.row());
      range.endColumn   = (std::max)(range.endColumn, index.column());
    }
  }

  QGuiApplication::clipboard()->setText(m_table.copyRange(range));
  LOG_CAT(logging::LogLevel::Debug, QStringLiteral("Table"),
          QStringLiteral("Copied %1x%2 cells").arg(range.rowCount()).arg(range.columnCount()));
}

int TableView::pasteClipboard() {
  const int row    = (std::max)(currentRow(), 0);
  const int column = (std::max)(currentColumn(), 0);
  const int pasted = m_table.pasteText(row, column, QGuiApplication::clipboard()->text());
  LOG_CAT(logging::LogLevel::Debug, QStringLiteral("Table"), QStringLiteral("Pasted %1 cells").arg(pasted));
  return pasted;
}

data::GridSearch& TableView::search() noexcept {
  return m_search;
}

void TableView::keyPressEvent(QKeyEvent* event) {
  if (event->matches(QKeySequence::Copy)) {
    copySelection();
    event->accept();
    return;
  }
  if (event->matches(QKeySequence::Paste)) {
    pasteClipboard();
    event->accept();
    return;
  }
  QTableWidget::keyPressEvent(event);
}

void TableView::refreshCell(int row, int column) {
  QTableWidgetItem* cellItem = item(row, column);
  if (cellItem == nullptr || cellItem->text() == m_table.cell(row, column)) {
    return;
  }
  const QSignalBlocker blocker(this);
  cellItem->setText(m_table.cell(row, column));
}

void TableView::populate() {
  const QSignalBlocker blocker(this);

  const data::ImportResult& data = m_table.table();
  setColumnCount(m_table.columnCount());
  setRowCount(m_table.rowCount());

  QStringList headers;
  for (const data::TabularColumn& column : data.columns) {
    headers.push_back(column.name);
  }
  setHorizontalHeaderLabels(headers);

  for (int row = 0; row < m_table.rowCount(); ++row) {
    for (int column = 0; column < m_table.columnCount(); ++column) {
      setItem(row, column, new QTableWidgetItem(m_table.cell(row, column)));
    }
  }
  resizeColumnsToContents();
}

WorkspaceViewFactory WorkspaceViewFactory::withDefaultViews() {
  WorkspaceViewFactory factory;
  factory.registerView(workspace::NotesWorkspace::kViewType, [](workspace::Workspace& ws, QWidget* parent) -> QWidget* {
    if (auto* notes = qobject_cast<workspace::NotesWorkspace*>(&ws)) {
      return new NotesView(*notes, parent);
    }
    return createPlaceholder(ws, parent);
  });
  factory.registerView(workspace::TableWorkspace::kViewType, [](workspace::Workspace& ws, QWidget* parent) -> QWidget* {
    if (auto* table = qobject_cast<workspace::TableWorkspace*>(&ws)) {
      return new TableView(*table, parent);
    }
    return createPlaceholder(ws, parent);
  });
  return factory;
}

void WorkspaceViewFactory::registerView(const QString& viewType, Creator creator) {
  m_creators.insert(viewType, std::move(creator));
}

QWidget* WorkspaceViewFactory::createView(workspace::Workspace& workspace, QWidget* parent) const {
  const auto it = m_creators.constFind(workspace.viewType());
  if (it != m_creators.constEnd()) {
    return it.value()(workspace, parent);
  }

  return createPlaceholder(workspace, parent);
}

QWidget* WorkspaceViewFactory::createPlaceholder(const workspace::Workspace& workspace, QWidget* parent) {
  auto* placeholder = new QLabel(QStringLiteral("No view for '%1'").arg(workspace.viewType()), parent);
  placeholder->setObjectName(QStringLiteral("viewPlaceholder"));
  placeholder->setAlignment(Qt::AlignCenter);
  return placeholder;
}

}  // namespace deskkit::ui
