#pragma once

#include "deskkit/data/ColumnRoles.hpp"

#include <QDialog>
#include <QHash>
#include <QString>

#include <optional>
#include <vector>

class QComboBox;
class QLabel;
class QPushButton;

namespace deskkit::ui {

// One combo per role, listing "(none)" and every column. Apply stays
// disabled until each required role has a column.
class ColumnRoleMapperDialog final : public QDialog {
  Q_OBJECT

 public:
  ColumnRoleMapperDialog(std::vector<data::ColumnRole> roles, std::vector<data::TabularColumn> columns,
                         QWidget* parent = nullptr);

  void setDescription(const QString& description);
  // Unknown roles or columns in initial are skipped.
  void setInitialMapping(const QHash<QString, QString>& initial);
  // Selects columnId in the role's combo; an empty id selects "(none)".
  bool setRoleColumn(const QString& roleKey, const QString& columnId);

  [[nodiscard]] const data::ColumnRoleMapping& mapping() const noexcept;
  [[nodiscard]] QComboBox*                     comboFor(const QString& roleKey) const;
  [[nodiscard]] bool                           canApply() const;

  // Role key to column id, or nullopt when the dialog was cancelled.
  static std::optional<QHash<QString, QString>> getMapping(QWidget* parent, std::vector<data::ColumnRole> roles,
                                                           std::vector<data::TabularColumn> columns,
                                                           const QString&                   description = {},
                                                           const QHash<QString, QString>&   initial     = {});

 private:
  void syncCombos();
  void updateValidity();

  data::ColumnRoleMapping    m_mapping;
  QHash<QString, QComboBox*> m_combos;
  QLabel*                    m_description = nullptr;
  QLabel*                    m_missing     = nullptr;
  QPushButton*               m_apply       = nullptr;
};

}  // namespace deskkit::ui
