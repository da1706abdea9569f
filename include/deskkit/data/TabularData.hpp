#pragma once

#include <QString>
#include <QStringList>

#include <vector>

namespace deskkit::data {

struct TabularColumn {
  QString id;  // "col_<index>"
  QString name;
  int     index = 0;
};

struct TabularRow {
  int         index = 0;
  QStringList values;  // one per column, in column order
};

struct ImportResult {
  bool                       success = false;
  std::vector<TabularColumn> columns;
  std::vector<TabularRow>    rows;
  QString                    errorMessage;

  static ImportResult failure(const QString& message) {
    ImportResult result;
    result.errorMessage = message;
    return result;
  }
};

[[nodiscard]] inline QString columnIdFor(int index) {
  return QStringLiteral("col_%1").arg(index);
}

}  // namespace deskkit::data
