#pragma once

#include <QString>
#include <QStringList>

#include <algorithm>
#include <vector>

namespace deskkit::data {

// Rectangular block of cells. The corners may be given in either order.
struct CellRange {
  int startRow    = 0;
  int startColumn = 0;
  int endRow      = 0;
  int endColumn   = 0;

  [[nodiscard]] int top() const noexcept { return (std::min)(startRow, endRow); }
  [[nodiscard]] int bottom() const noexcept { return (std::max)(startRow, endRow); }
  [[nodiscard]] int left() const noexcept { return (std::min)(startColumn, endColumn); }
  [[nodiscard]] int right() const noexcept { return (std::max)(startColumn, endColumn); }
  [[nodiscard]] int rowCount() const noexcept { return bottom() - top() + 1; }
  [[nodiscard]] int columnCount() const noexcept { return right() - left() + 1; }

  static CellRange singleCell(int row, int column) { return {row, column, row, column}; }
};

using CellBlock = std::vector<QStringList>;

// Spreadsheet clipboard text: one line per row, cells separated by tabs.
// Cells holding a tab, a line break or a leading quote are quoted.
[[nodiscard]] QString toTabSeparated(const CellBlock& block);

// Blank lines are skipped and short rows padded to the widest one. Text with
// an unbalanced quote is split on tabs and line breaks as is.
[[nodiscard]] CellBlock fromTabSeparated(const QString& text);

}  // namespace deskkit::data
