#include "deskkit/data/ColumnRoles.hpp"

#include <algorithm>
#include <utility>

namespace deskkit::data {

ColumnRoleMapping::ColumnRoleMapping(std::vector<ColumnRole> roles, std::vector<TabularColumn> columns)
    : m_roles(std::move(roles)), m_columns(std::move(columns)) {}

const std::vector<ColumnRole>& ColumnRoleMapping::roles() const noexcept {
  return m_roles;
}

const std::vector<TabularColumn>& ColumnRoleMapping::columns() const noexcept {
  return m_columns;
}

bool ColumnRoleMapping::setMapping(const QString& roleKey, const QString& columnId) {
  m_lastError.clear();
  if (findRole(roleKey) == nullptr) {
    m_lastError = QStringLiteral("Unknown role '%1'.").arg(roleKey);
    return false;
  }
  if (columnId.isEmpty()) {
    m_mapping.remove(roleKey);
    return true;
  }
  if (!hasColumn(columnId)) {
    m_lastError = QStringLiteral("Unknown column '%1'.").arg(columnId);
    return false;
  }
  m_mapping.insert(roleKey, columnId);
  return true;
}

bool ColumnRoleMapping::assign(const QHash<QString, QString>& mapping) {
  bool    allApplied = true;
  QString firstError;
  for (auto it = mapping.cbegin(); it != mapping.cend(); ++it) {
    if (!setMapping(it.key(), it.value())) {
      allApplied = false;
      if (firstError.isEmpty()) {
        firstError = m_lastError;
      }
    }
  }
  m_lastError = firstError;
  return allApplied;
}

void ColumnRoleMapping::clearMapping(const QString& roleKey) {
  m_mapping.remove(roleKey);
}

QString ColumnRoleMapping::columnFor(const QString& roleKey) const {
  return m_mapping.value(roleKey);
}

QHash<QString, QString> ColumnRoleMapping::mapping() const {
  return m_mapping;
}

int ColumnRoleMapping::autoMap() {
  int filled = 0;
  for (const ColumnRole& role : m_roles) {
    if (m_mapping.contains(role.key)) {
      continue;
    }
    const auto column = std::find_if(m_columns.begin(), m_columns.end(), [&role](const TabularColumn& candidate) {
      const QString name = candidate.name.trimmed();
      if (name.isEmpty()) {
        return false;
      }
      return name.compare(role.key, Qt::CaseInsensitive) == 0 || name.compare(role.label, Qt::CaseInsensitive) == 0;
    });
    if (column != m_columns.end()) {
      m_mapping.insert(role.key, column->id);
      ++filled;
    }
  }
  return filled;
}

bool ColumnRoleMapping::isValid() const {
  return missingRequiredRoles().isEmpty();
}

QStringList ColumnRoleMapping::missingRequiredRoles() const {
  QStringList missing;
  for (const ColumnRole& role : m_roles) {
    if (role.required && !m_mapping.contains(role.key)) {
      missing.push_back(role.label.isEmpty() ? role.key : role.label);
    }
  }
  return missing;
}

const QString& ColumnRoleMapping::lastError() const noexcept {
  return m_lastError;
}

const ColumnRole* ColumnRoleMapping::findRole(const QString& key) const {
  const auto it =
      std::find_if(m_roles.begin(), m_roles.end(), [&key](const ColumnRole& role) { return role.key == key; });
  return it == m_roles.end() ? nullptr : &*it;
}

bool ColumnRoleMapping::hasColumn(const QString& id) const {
  return std::any_of(m_columns.begin(), m_columns.end(), [&id](const TabularColumn& column) { return column.id == id; });
}

}  // namespace deskkit::data
