#include "deskkit/data/XlsxImporter.hpp"

#include <QFileInfo>
#include <QVariant>

#include <utility>

#include "xlsxcellrange.h"
#include "xlsxdocument.h"
#include "xlsxworksheet.h"

namespace deskkit::data {
namespace {

QString columnLetter(int column) {
  QString letters;
  while (column > 0) {
    const int remainder = (column - 1) % 26;
    letters.prepend(QChar(QLatin1Char('A').unicode() + remainder));
    column = (column - 1) / 26;
  }
  return letters;
}

QString cellText(QXlsx::Document& document, int row, int column) {
  const QVariant value = document.read(row, column);
  return value.isValid() ? value.toString() : QString();
}

}  // namespace

QStringList XlsxImporter::supportedExtensions() const {
  return {QStringLiteral(".xlsx")};
}

QString XlsxImporter::displayName() const {
  return QStringLiteral("Excel workbook");
}

ImportResult XlsxImporter::importFile(const QString& path) const {
  if (!QFileInfo::exists(path)) {
    return ImportResult::failure(QStringLiteral("File not found: %1").arg(path));
  }

  QXlsx::Document document(path);
  if (!document.load()) {
    return ImportResult::failure(QStringLiteral("Failed to open workbook (locked or corrupted): %1").arg(path));
  }

  const QStringList sheets = document.sheetNames();
  if (sheets.isEmpty() || !document.selectSheet(sheets.first())) {
    return ImportResult::failure(QStringLiteral("Workbook has no worksheet."));
  }

  ImportResult result;
  result.success = true;

  const QXlsx::CellRange range = document.dimension();
  if (!range.isValid()) {
    return result;
  }

  const int firstRow    = range.firstRow();
  const int lastRow     = range.lastRow();
  const int firstColumn = range.firstColumn();
  const int lastColumn  = range.lastColumn();

  for (int column = firstColumn; column <= lastColumn; ++column) {
    const int index = column - firstColumn;
    QString   name  = cellText(document, firstRow, column).trimmed();
    if (name.isEmpty()) {
      name = columnLetter(column);
    }
    result.columns.push_back(TabularColumn{columnIdFor(index), name, index});
  }

  for (int row = firstRow + 1; row <= lastRow; ++row) {
    TabularRow tabularRow;
    tabularRow.index = row - firstRow - 1;
    for (int column = firstColumn; column <= lastColumn; ++column) {
      tabularRow.values.push_back(cellText(document, row, column));
    }
    result.rows.push_back(std::move(tabularRow));
  }
  return result;
}

}  // namespace deskkit::data
