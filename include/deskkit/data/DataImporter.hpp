#pragma once

#include "deskkit/data/TabularData.hpp"

#include <QString>
#include <QStringList>

namespace deskkit::data {

// Reads a file into columns and rows of text. Implementations are stateless
// and may be called from a worker thread.
class DataImporter {
 public:
  virtual ~DataImporter() = default;

  // Lower-case, with the leading dot (".csv").
  [[nodiscard]] virtual QStringList supportedExtensions() const = 0;
  [[nodiscard]] virtual QString     displayName() const         = 0;

  [[nodiscard]] bool canImport(const QString& path) const;

  [[nodiscard]] virtual ImportResult importFile(const QString& path) const = 0;
};

}  // namespace deskkit::data
