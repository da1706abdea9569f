#include "deskkit/data/DataImporter.hpp"

#include <QFileInfo>

namespace deskkit::data {

bool DataImporter::canImport(const QString& path) const {
  const QString suffix = QFileInfo(path).suffix().toLower();
  if (suffix.isEmpty()) {
    return false;
  }
  return supportedExtensions().contains(QLatin1Char('.') + suffix);
}

}  // namespace deskkit::data
