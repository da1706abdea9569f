#include "deskkit/ui/AboutWindow.hpp"

#include "deskkit/data/Importers.hpp"

#include <QApplication>
#include <QFrame>
#include <QLabel>
#include <QVBoxLayout>
#include <QWidget>

namespace deskkit::ui {

AboutWindow::AboutWindow(QWidget* parent) : QMainWindow(parent) {
  applyTheme();
  configureWindow();
}

AboutWindow::~AboutWindow() = default;

void AboutWindow::applyTheme() {
  setStyleSheet(QStringLiteral(R"(QMainWindow {
  background-color: #1e1f22;
  color: #eeeeee;
}
QFrame#surface {
  background-color: #1e1f22;
  border: 1px solid #5f6166;
}
QLabel#title {
  color: #f7f7f7;
  font-size: 15px;
  font-weight: 600;
}
QLabel#line {
  color: #dcdcdc;
  font-size: 11px;
})"));
}

void AboutWindow::configureWindow() {
  setWindowTitle(QStringLiteral("About DeskKit"));
  setCentralWidget(buildCentralArea());
  const QSize minSize = minimumSizeHint();
  setMinimumSize(minSize);
  resize(minSize);
}

QWidget* AboutWindow::buildCentralArea() {
  auto* root       = new QWidget(this);
  auto* rootLayout = new QVBoxLayout(root);
  rootLayout->setContentsMargins(8, 8, 8, 8);

  auto* surface = new QFrame(root);
  surface->setObjectName(QStringLiteral("surface"));

  auto* layout = new QVBoxLayout(surface);
  layout->setContentsMargins(14, 10, 14, 10);
  layout->setSpacing(7);

  auto* title = new QLabel(
      QStringLiteral("%1 %2").arg(QApplication::applicationName(), QApplication::applicationVersion()), surface);
  title->setObjectName(QStringLiteral("title"));
  layout->addWidget(title);

  auto* qtVersion = new QLabel(QStringLiteral("Built with Qt %1").arg(QString::fromLatin1(qVersion())), surface);
  qtVersion->setObjectName(QStringLiteral("line"));
  layout->addWidget(qtVersion);

  auto* importers = new QLabel(data::kExcelImportAvailable ? QStringLiteral("Import: CSV, TSV, Excel")
                                                           : QStringLiteral("Import: CSV, TSV"),
                               surface);
  importers->setObjectName(QStringLiteral("line"));
  layout->addWidget(importers);

  layout->addStretch();
  rootLayout->addWidget(surface, 1);
  return root;
}

}  // namespace deskkit::ui
