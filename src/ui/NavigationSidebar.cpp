#include "deskkit/ui/NavigationSidebar.hpp"

#include <QHeaderView>
#include <QSignalBlocker>
#include <QTreeWidgetItemIterator>

namespace deskkit::ui {
namespace {

constexpr int kKeyRole = Qt::UserRole + 1;

}  // namespace

NavigationSidebar::NavigationSidebar(QWidget* parent) : QTreeWidget(parent) {
  setHeaderHidden(true);
  setColumnCount(1);
  setRootIsDecorated(true);
  setSelectionMode(QAbstractItemView::SingleSelection);
  setMinimumWidth(180);

  connect(this, &QTreeWidget::currentItemChanged, this, [this](QTreeWidgetItem* current, QTreeWidgetItem*) {
    if (current == nullptr) {
      return;
    }
    const QString key = current->data(0, kKeyRole).toString();
    if (!key.isEmpty()) {
      emit itemActivated(key, current->text(0));
    }
  });
}

void NavigationSidebar::setItems(const std::vector<NavigationItem>& items) {
  const QSignalBlocker blocker(this);
  clear();
  for (const NavigationItem& item : items) {
    addItem(nullptr, item);
  }
  expandAll();
}

void NavigationSidebar::selectKey(const QString& key) {
  const QSignalBlocker blocker(this);
  for (QTreeWidgetItemIterator it(this); *it != nullptr; ++it) {
    if ((*it)->data(0, kKeyRole).toString() == key) {
      setCurrentItem(*it);
      return;
    }
  }
}

void NavigationSidebar::addItem(QTreeWidgetItem* parent, const NavigationItem& item) {
  auto* treeItem = (parent == nullptr) ? new QTreeWidgetItem(this) : new QTreeWidgetItem(parent);
  treeItem->setText(0, item.title);
  treeItem->setData(0, kKeyRole, item.key);
  if (item.key.isEmpty()) {
    treeItem->setFlags(treeItem->flags() & ~Qt::ItemIsSelectable);
  }
  for (const NavigationItem& child : item.children) {
    addItem(treeItem, child);
  }
}

}  // namespace deskkit::ui
