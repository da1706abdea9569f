#pragma once

#include "deskkit/data/DataImporter.hpp"

#include <QChar>
#include <QStringList>

#include <optional>
#include <vector>

namespace deskkit::data {

class CsvImporter final : public DataImporter {
 public:
  [[nodiscard]] QStringList  supportedExtensions() const override;
  [[nodiscard]] QString      displayName() const override;
  [[nodiscard]] ImportResult importFile(const QString& path) const override;

  // Parses already decoded text. The header line picks the delimiter
  // unless one is forced.
  [[nodiscard]] static ImportResult parse(const QString& text, QChar forcedDelimiter = QChar());
  [[nodiscard]] static QChar        detectDelimiter(const QString& headerLine);

  // Raw records with quotes resolved and blank lines skipped. Empty when a
  // quoted field is never closed.
  [[nodiscard]] static std::optional<std::vector<QStringList>> splitRecords(const QString& text, QChar delimiter);
};

}  // namespace deskkit::data
