#pragma once

#include "deskkit/data/DataImporter.hpp"

#include <QString>

#include <memory>
#include <vector>

namespace deskkit::data {

#ifdef DESKKIT_WITH_XLSX
inline constexpr bool kExcelImportAvailable = true;
#else
inline constexpr bool kExcelImportAvailable = false;
#endif

using ImporterList = std::vector<std::unique_ptr<DataImporter>>;

// CSV always; Excel only when the build enabled it.
[[nodiscard]] ImporterList createDefaultImporters();

// nullptr when no importer handles the file's extension.
[[nodiscard]] const DataImporter* importerForPath(const ImporterList& importers, const QString& path);

}  // namespace deskkit::data
