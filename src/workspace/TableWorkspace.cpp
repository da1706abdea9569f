#include "deskkit/workspace/TableWorkspace.hpp"

#include <QFileInfo>

#include <algorithm>
#include <iterator>
#include <utility>

namespace deskkit::workspace {

TableWorkspace::TableWorkspace(data::ImportResult table, QString sourcePath, QObject* parent)
    : Workspace(kViewType, QFileInfo(sourcePath).fileName(), parent),
      m_table(std::move(table)),
      m_sourcePath(std::move(sourcePath)) {}

const data::ImportResult& TableWorkspace::table() const noexcept {
  return m_table;
}

const QString& TableWorkspace::sourcePath() const noexcept {
  return m_sourcePath;
}

int TableWorkspace::rowCount() const noexcept {
  return static_cast<int>(m_table.rows.size());
}

int TableWorkspace::columnCount() const noexcept {
  return static_cast<int>(m_table.columns.size());
}

QString TableWorkspace::cell(int row, int column) const {
  if (row < 0 || row >= rowCount() || column < 0 || column >= columnCount()) {
    return {};
  }
  return m_table.rows[static_cast<std::size_t>(row)].values.value(column);
}

bool TableWorkspace::setCell(int row, int column, const QString& value) {
  if (row < 0 || row >= rowCount() || column < 0 || column >= columnCount()) {
    return false;
  }

  QStringList& values = m_table.rows[static_cast<std::size_t>(row)].values;
  while (values.size() <= column) {
    values.push_back(QString());
  }
  if (values[column] == value) {
    return true;
  }
  values[column] = value;
  markDirty();
  emit cellChanged(row, column);
  return true;
}

QString TableWorkspace::copyRange(const data::CellRange& range) const {
  const int top    = (std::max)(range.top(), 0);
  const int left   = (std::max)(range.left(), 0);
  const int bottom = (std::min)(range.bottom(), rowCount() - 1);
  const int right  = (std::min)(range.right(), columnCount() - 1);

  data::CellBlock block;
  for (int row = top; row <= bottom; ++row) {
    QStringList values;
    for (int column = left; column <= right; ++column) {
      values.push_back(cell(row, column));
    }
    block.push_back(std::move(values));
  }
  return data::toTabSeparated(block);
}

int TableWorkspace::pasteText(int row, int column, const QString& text) {
  if (row < 0 || column < 0) {
    return 0;
  }

  const data::CellBlock block   = data::fromTabSeparated(text);
  int                   written = 0;
  for (std::size_t r = 0; r < block.size(); ++r) {
    const int targetRow = row + static_cast<int>(r);
    if (targetRow >= rowCount()) {
      break;
    }
    const QStringList& values = block[r];
    for (int c = 0; c < values.size(); ++c) {
      if (setCell(targetRow, column + c, values.at(c))) {
        ++written;
      }
    }
  }
  return written;
}

data::GridAccess TableWorkspace::gridAccess() {
  data::GridAccess access;
  access.rowCount    = [this]() { return rowCount(); };
  access.columnCount = [this]() { return columnCount(); };
  access.cell        = [this](int row, int column) { return cell(row, column); };
  access.setCell     = [this](int row, int column, const QString& value) { return setCell(row, column, value); };
  return access;
}

const QHash<QString, QString>& TableWorkspace::columnRoles() const noexcept {
  return m_columnRoles;
}

void TableWorkspace::setColumnRoles(QHash<QString, QString> roles) {
  if (m_columnRoles == roles) {
    return;
  }
  m_columnRoles = std::move(roles);
  emit columnRolesChanged();
}

QString TableWorkspace::roleValue(int row, const QString& roleKey) const {
  const QString columnId = m_columnRoles.value(roleKey);
  if (columnId.isEmpty()) {
    return {};
  }
  const auto& columns = m_table.columns;
  const auto  it      = std::find_if(columns.begin(), columns.end(), [&columnId](const data::TabularColumn& column) {
    return column.id == columnId;
  });
  if (it == columns.end()) {
    return {};
  }
  return cell(row, static_cast<int>(std::distance(columns.begin(), it)));
}

}  // namespace deskkit::workspace
