#include "deskkit/ui/ColumnRoleMapperDialog.hpp"

#include <QComboBox>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QLabel>
#include <QPushButton>
#include <QSignalBlocker>
#include <QVBoxLayout>

#include <algorithm>
#include <utility>

namespace deskkit::ui {

ColumnRoleMapperDialog::ColumnRoleMapperDialog(std::vector<data::ColumnRole>    roles,
                                               std::vector<data::TabularColumn> columns, QWidget* parent)
    : QDialog(parent), m_mapping(std::move(roles), std::move(columns)) {
  setWindowTitle(QStringLiteral("Map Columns"));

  auto* layout = new QVBoxLayout(this);
  layout->setContentsMargins(12, 12, 12, 12);
  layout->setSpacing(8);

  m_description = new QLabel(QStringLiteral("Map your data columns to the required roles."), this);
  m_description->setWordWrap(true);
  layout->addWidget(m_description);

  auto* form = new QFormLayout();
  for (const data::ColumnRole& role : m_mapping.roles()) {
    auto* combo = new QComboBox(this);
    combo->setObjectName(QStringLiteral("role_%1").arg(role.key));
    combo->addItem(QStringLiteral("(none)"), QString());
    for (const data::TabularColumn& column : m_mapping.columns()) {
      combo->addItem(column.name.isEmpty() ? column.id : column.name, column.id);
    }
    if (!role.typeHint.isEmpty()) {
      combo->setToolTip(QStringLiteral("Expects %1").arg(role.typeHint));
    }

    const QString key = role.key;
    connect(combo, &QComboBox::currentIndexChanged, this, [this, key, combo]() {
      if (m_mapping.setMapping(key, combo->currentData().toString())) {
        updateValidity();
      }
    });

    const QString label = role.label.isEmpty() ? role.key : role.label;
    form->addRow(role.required ? QStringLiteral("%1 *").arg(label) : label, combo);
    m_combos.insert(role.key, combo);
  }
  layout->addLayout(form);

  m_missing = new QLabel(this);
  m_missing->setObjectName(QStringLiteral("missingRoles"));
  layout->addWidget(m_missing);

  auto* buttons = new QDialogButtonBox(QDialogButtonBox::Cancel, this);
  m_apply       = buttons->addButton(QStringLiteral("Apply"), QDialogButtonBox::AcceptRole);
  connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
  connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
  layout->addWidget(buttons);

  updateValidity();
}

void ColumnRoleMapperDialog::setDescription(const QString& description) {
  if (!description.isEmpty()) {
    m_description->setText(description);
  }
}

void ColumnRoleMapperDialog::setInitialMapping(const QHash<QString, QString>& initial) {
  for (auto it = initial.cbegin(); it != initial.cend(); ++it) {
    // Stale entries from an older table layout are dropped.
    static_cast<void>(m_mapping.setMapping(it.key(), it.value()));
  }
  syncCombos();
  updateValidity();
}

bool ColumnRoleMapperDialog::setRoleColumn(const QString& roleKey, const QString& columnId) {
  QComboBox* combo = comboFor(roleKey);
  if (combo == nullptr) {
    return false;
  }
  const int index = combo->findData(columnId);
  if (index < 0) {
    return false;
  }
  combo->setCurrentIndex(index);
  return true;
}

const data::ColumnRoleMapping& ColumnRoleMapperDialog::mapping() const noexcept {
  return m_mapping;
}

QComboBox* ColumnRoleMapperDialog::comboFor(const QString& roleKey) const {
  return m_combos.value(roleKey, nullptr);
}

bool ColumnRoleMapperDialog::canApply() const {
  return m_apply->isEnabled();
}

std::optional<QHash<QString, QString>> ColumnRoleMapperDialog::getMapping(QWidget*                         parent,
                                                                          std::vector<data::ColumnRole>    roles,
                                                                          std::vector<data::TabularColumn> columns,
                                                                          const QString&                   description,
                                                                          const QHash<QString, QString>&   initial) {
  ColumnRoleMapperDialog dialog(std::move(roles), std::move(columns), parent);
  dialog.setDescription(description);
  if (initial.isEmpty()) {
    dialog.m_mapping.autoMap();
    dialog.syncCombos();
    dialog.updateValidity();
  } else {
    dialog.setInitialMapping(initial);
  }

  if (dialog.exec() != QDialog::Accepted) {
    return std::nullopt;
  }
  return dialog.mapping().mapping();
}

void ColumnRoleMapperDialog::syncCombos() {
  for (auto it = m_combos.cbegin(); it != m_combos.cend(); ++it) {
    const QSignalBlocker blocker(it.value());
    const int            index = it.value()->findData(m_mapping.columnFor(it.key()));
    it.value()->setCurrentIndex((std::max)(index, 0));
  }
}

void ColumnRoleMapperDialog::updateValidity() {
  const QStringList missing = m_mapping.missingRequiredRoles();
  m_apply->setEnabled(missing.isEmpty());
  m_missing->setText(missing.isEmpty() ? QString()
                                       : QStringLiteral("Required: %1").arg(missing.join(QStringLiteral(", "))));
}

}  // namespace deskkit::ui
