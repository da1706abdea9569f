#include "deskkit/data/Importers.hpp"

#include "deskkit/data/CsvImporter.hpp"

#ifdef DESKKIT_WITH_XLSX
#include "deskkit/data/XlsxImporter.hpp"
#endif

namespace deskkit::data {

ImporterList createDefaultImporters() {
  ImporterList importers;
  importers.push_back(std::make_unique<CsvImporter>());
#ifdef DESKKIT_WITH_XLSX
  importers.push_back(std::make_unique<XlsxImporter>());
#endif
  return importers;
}

const DataImporter* importerForPath(const ImporterList& importers, const QString& path) {
  for (const auto& importer : importers) {
    if (importer->canImport(path)) {
      return importer.get();
    }
  }
  return nullptr;
}

}  // namespace deskkit::data
