#pragma once

#include "deskkit/data/CellClipboard.hpp"
#include "deskkit/data/GridSearch.hpp"
#include "deskkit/data/TabularData.hpp"
#include "deskkit/workspace/Workspace.hpp"

#include <QHash>
#include <QString>

namespace deskkit::workspace {

// Imported tabular data. The view edits cells through setCell().
class TableWorkspace final : public Workspace {
  Q_OBJECT

 public:
  static inline const QString kViewType = QStringLiteral("table");

  TableWorkspace(data::ImportResult table, QString sourcePath, QObject* parent = nullptr);

  [[nodiscard]] const data::ImportResult& table() const noexcept;
  [[nodiscard]] const QString&            sourcePath() const noexcept;
  [[nodiscard]] int                       rowCount() const noexcept;
  [[nodiscard]] int                       columnCount() const noexcept;

  [[nodiscard]] QString cell(int row, int column) const;
  // False when out of range. Marks the workspace dirty on a change.
  bool setCell(int row, int column, const QString& value);

  // Cells of range, clipped to the table, as tab separated text.
  [[nodiscard]] QString copyRange(const data::CellRange& range) const;
  // Writes tab separated text with its first cell at (row, column). Cells
  // past the table edge are dropped. Returns the number of cells written.
  int pasteText(int row, int column, const QString& text);

  // Accessors for a GridSearch over this table. The search must not outlive
  // the workspace.
  [[nodiscard]] data::GridAccess gridAccess();

  // Role key to column id, as chosen in the column role dialog.
  [[nodiscard]] const QHash<QString, QString>& columnRoles() const noexcept;
  void                                         setColumnRoles(QHash<QString, QString> roles);
  // Value of the column mapped to roleKey; empty when the role is unmapped.
  [[nodiscard]] QString roleValue(int row, const QString& roleKey) const;

 signals:
  void cellChanged(int row, int column);
  void columnRolesChanged();

 private:
  data::ImportResult      m_table;
  QString                 m_sourcePath;
  QHash<QString, QString> m_columnRoles;
};

}  // namespace deskkit::workspace
