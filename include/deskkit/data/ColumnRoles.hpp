#pragma once

#include "deskkit/data/TabularData.hpp"

#include <QHash>
#include <QString>
#include <QStringList>

#include <vector>

namespace deskkit::data {

// A column a consumer of the table needs, e.g. "Identifier" or "Amount".
struct ColumnRole {
  QString key;
  QString label;
  bool    required = false;
  QString typeHint;
};

// Assigns table columns to roles. Several roles may share a column; the
// mapping is valid once every required role has one.
class ColumnRoleMapping final {
 public:
  ColumnRoleMapping() = default;
  ColumnRoleMapping(std::vector<ColumnRole> roles, std::vector<TabularColumn> columns);

  [[nodiscard]] const std::vector<ColumnRole>&    roles() const noexcept;
  [[nodiscard]] const std::vector<TabularColumn>& columns() const noexcept;

  // An empty column id clears the role. Unknown roles or columns are
  // refused and lastError() says which.
  [[nodiscard]] bool setMapping(const QString& roleKey, const QString& columnId);
  // Applies every pair it can; false when any pair was refused.
  [[nodiscard]] bool assign(const QHash<QString, QString>& mapping);
  void               clearMapping(const QString& roleKey);

  [[nodiscard]] QString                 columnFor(const QString& roleKey) const;
  [[nodiscard]] QHash<QString, QString> mapping() const;

  // Gives unmapped roles the column named like their key or label, ignoring
  // case. Returns how many roles were filled.
  int autoMap();

  [[nodiscard]] bool        isValid() const;
  [[nodiscard]] QStringList missingRequiredRoles() const;

  [[nodiscard]] const QString& lastError() const noexcept;

 private:
  [[nodiscard]] const ColumnRole* findRole(const QString& key) const;
  [[nodiscard]] bool              hasColumn(const QString& id) const;

  std::vector<ColumnRole>    m_roles;
  std::vector<TabularColumn> m_columns;
  QHash<QString, QString>    m_mapping;
  QString                    m_lastError;
};

}  // namespace deskkit::data
