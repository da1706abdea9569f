#pragma once

#include "deskkit/data/DataImporter.hpp"

namespace deskkit::data {

// First worksheet only; the first used row is the header row.
class XlsxImporter final : public DataImporter {
 public:
  [[nodiscard]] QStringList  supportedExtensions() const override;
  [[nodiscard]] QString      displayName() const override;
  [[nodiscard]] ImportResult importFile(const QString& path) const override;
};

}  // namespace deskkit::data
