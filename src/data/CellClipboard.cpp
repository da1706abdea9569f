#include "deskkit/data/CellClipboard.hpp"

#include "deskkit/data/CsvImporter.hpp"

#include <QRegularExpression>

#include <optional>
#include <utility>

namespace deskkit::data {
namespace {

QString quoted(const QString& value) {
  const bool needsQuotes = value.contains(QLatin1Char('\t')) || value.contains(QLatin1Char('\n'))
                           || value.contains(QLatin1Char('\r')) || value.startsWith(QLatin1Char('"'));
  if (!needsQuotes) {
    return value;
  }
  QString escaped = value;
  escaped.replace(QLatin1Char('"'), QStringLiteral("\"\""));
  return QStringLiteral("\"%1\"").arg(escaped);
}

CellBlock splitLiterally(const QString& text) {
  CellBlock block;
  for (const QString& line : text.split(QRegularExpression(QStringLiteral("\r\n|\n|\r")))) {
    if (!line.isEmpty()) {
      block.push_back(line.split(QLatin1Char('\t')));
    }
  }
  return block;
}

}  // namespace

QString toTabSeparated(const CellBlock& block) {
  QString text;
  for (const QStringList& row : block) {
    QStringList cells;
    cells.reserve(row.size());
    for (const QString& value : row) {
      cells.push_back(quoted(value));
    }
    text += cells.join(QLatin1Char('\t'));
    text += QLatin1Char('\n');
  }
  return text;
}

CellBlock fromTabSeparated(const QString& text) {
  std::optional<std::vector<QStringList>> records = CsvImporter::splitRecords(text, QLatin1Char('\t'));
  CellBlock block = records.has_value() ? std::move(*records) : splitLiterally(text);

  qsizetype width = 0;
  for (const QStringList& row : block) {
    width = (std::max)(width, row.size());
  }
  for (QStringList& row : block) {
    while (row.size() < width) {
      row.push_back(QString());
    }
  }
  return block;
}

}  // namespace deskkit::data
