#include "deskkit/data/CsvImporter.hpp"

#include <QFile>
#include <QFileInfo>

#include <array>
#include <utility>

namespace deskkit::data {
namespace {

constexpr std::array<char16_t, 4> kCandidateDelimiters = {u',', u';', u'\t', u'|'};

struct Tokenized {
  std::vector<QStringList> records;
  int                      unterminatedLine = 0;  // 1-based, 0 when all quotes closed
};

Tokenized tokenize(const QString& text, QChar delimiter) {
  Tokenized result;

  QStringList fields;
  QString     field;
  bool        inQuotes       = false;
  bool        recordStarted  = false;
  bool        fieldStarted   = false;
  int         line           = 1;
  int         quoteStartLine = 0;

  auto endField = [&]() {
    fields.push_back(field);
    field.clear();
    fieldStarted = false;
  };
  auto endRecord = [&]() {
    if (recordStarted) {
      endField();
      result.records.push_back(std::move(fields));
    }
    fields = QStringList();
    field.clear();
    fieldStarted  = false;
    recordStarted = false;
  };

  const int length = text.size();
  for (int i = 0; i < length; ++i) {
    const QChar c = text.at(i);

    if (inQuotes) {
      if (c == QLatin1Char('"')) {
        if (i + 1 < length && text.at(i + 1) == QLatin1Char('"')) {
          field.append(QLatin1Char('"'));
          ++i;
        } else {
          inQuotes = false;
        }
      } else {
        if (c == QLatin1Char('\n')) {
          ++line;
        }
        field.append(c);
      }
      continue;
    }

    if (c == QLatin1Char('\r') || c == QLatin1Char('\n')) {
      if (c == QLatin1Char('\r') && i + 1 < length && text.at(i + 1) == QLatin1Char('\n')) {
        ++i;
      }
      endRecord();
      ++line;
      continue;
    }

    recordStarted = true;
    if (c == delimiter) {
      endField();
    } else if (c == QLatin1Char('"') && !fieldStarted) {
      inQuotes       = true;
      fieldStarted   = true;
      quoteStartLine = line;
    } else {
      field.append(c);
      fieldStarted = true;
    }
  }

  if (inQuotes) {
    result.unterminatedLine = quoteStartLine;
    return result;
  }
  endRecord();
  return result;
}

QString firstNonBlankLine(const QString& text) {
  int start = 0;
  while (start < text.size()) {
    int end = start;
    while (end < text.size() && text.at(end) != QLatin1Char('\n') && text.at(end) != QLatin1Char('\r')) {
      ++end;
    }
    if (end > start) {
      return text.mid(start, end - start);
    }
    start = end + 1;
  }
  return {};
}

}  // namespace

QStringList CsvImporter::supportedExtensions() const {
  return {QStringLiteral(".csv"), QStringLiteral(".tsv"), QStringLiteral(".txt")};
}

QString CsvImporter::displayName() const {
  return QStringLiteral("CSV / TSV");
}

QChar CsvImporter::detectDelimiter(const QString& headerLine) {
  QChar best      = QLatin1Char(',');
  int   bestCount = 0;

  for (const char16_t candidate : kCandidateDelimiters) {
    int  count    = 0;
    bool inQuotes = false;
    for (const QChar c : headerLine) {
      if (c == QLatin1Char('"')) {
        inQuotes = !inQuotes;
      } else if (!inQuotes && c == QChar(candidate)) {
        ++count;
      }
    }
    if (count > bestCount) {
      best      = QChar(candidate);
      bestCount = count;
    }
  }
  return best;
}

std::optional<std::vector<QStringList>> CsvImporter::splitRecords(const QString& text, QChar delimiter) {
  Tokenized tokens = tokenize(text, delimiter);
  if (tokens.unterminatedLine > 0) {
    return std::nullopt;
  }
  return std::move(tokens.records);
}

ImportResult CsvImporter::parse(const QString& input, QChar forcedDelimiter) {
  QString text = input;
  if (text.startsWith(QChar(0xFEFF))) {
    text.remove(0, 1);
  }

  const QChar delimiter = forcedDelimiter.isNull() ? detectDelimiter(firstNonBlankLine(text)) : forcedDelimiter;

  const Tokenized tokens = tokenize(text, delimiter);
  if (tokens.unterminatedLine > 0) {
    return ImportResult::failure(
        QStringLiteral("Unterminated quoted field starting on line %1.").arg(tokens.unterminatedLine));
  }

  ImportResult result;
  result.success = true;
  if (tokens.records.empty()) {
    return result;
  }

  const QStringList& header = tokens.records.front();
  result.columns.reserve(static_cast<std::size_t>(header.size()));
  for (int i = 0; i < header.size(); ++i) {
    result.columns.push_back(TabularColumn{columnIdFor(i), header.at(i).trimmed(), i});
  }

  const int columnCount = header.size();
  result.rows.reserve(tokens.records.size() - 1);
  for (std::size_t r = 1; r < tokens.records.size(); ++r) {
    QStringList values = tokens.records[r].mid(0, columnCount);
    while (values.size() < columnCount) {
      values.push_back(QString());
    }
    result.rows.push_back(TabularRow{static_cast<int>(r - 1), std::move(values)});
  }
  return result;
}

ImportResult CsvImporter::importFile(const QString& path) const {
  QFile file(path);
  if (!file.open(QIODevice::ReadOnly)) {
    return ImportResult::failure(QStringLiteral("Cannot open '%1': %2").arg(path, file.errorString()));
  }

  const QString text   = QString::fromUtf8(file.readAll());
  const QString suffix = QFileInfo(path).suffix().toLower();
  return parse(text, suffix == QStringLiteral("tsv") ? QChar(QLatin1Char('\t')) : QChar());
}

}  // namespace deskkit::data
