#pragma once

#include <QString>
#include <QTreeWidget>

#include <vector>

namespace deskkit::ui {

struct NavigationItem {
  QString                     title;
  QString                     key;  // empty for pure groups
  std::vector<NavigationItem> children;
};

class NavigationSidebar final : public QTreeWidget {
  Q_OBJECT

 public:
  explicit NavigationSidebar(QWidget* parent = nullptr);

  void setItems(const std::vector<NavigationItem>& items);
  // Selects the item with this key without emitting itemActivated.
  void selectKey(const QString& key);

 signals:
  void itemActivated(const QString& key, const QString& title);

 private:
  void addItem(QTreeWidgetItem* parent, const NavigationItem& item);
};

}  // namespace deskkit::ui
