#include "deskkit/ui/DialogService.hpp"

#include <QFileDialog>
#include <QMessageBox>

namespace deskkit::ui {

QtDialogService::QtDialogService(QWidget* parent) : m_parent(parent) {}

void QtDialogService::showMessage(const QString& message, const QString& title) {
  QMessageBox::information(m_parent, title, message);
}

MessageBoxResult QtDialogService::ask(const QString& message, const QString& title, MessageBoxButtons buttons) {
  QMessageBox::StandardButtons standardButtons = QMessageBox::Ok;
  switch (buttons) {
    case MessageBoxButtons::Ok:
      standardButtons = QMessageBox::Ok;
      break;
    case MessageBoxButtons::OkCancel:
      standardButtons = QMessageBox::Ok | QMessageBox::Cancel;
      break;
    case MessageBoxButtons::YesNo:
      standardButtons = QMessageBox::Yes | QMessageBox::No;
      break;
    case MessageBoxButtons::YesNoCancel:
      standardButtons = QMessageBox::Yes | QMessageBox::No | QMessageBox::Cancel;
      break;
  }

  switch (QMessageBox::question(m_parent, title, message, standardButtons)) {
    case QMessageBox::Ok:
      return MessageBoxResult::Ok;
    case QMessageBox::Cancel:
      return MessageBoxResult::Cancel;
    case QMessageBox::Yes:
      return MessageBoxResult::Yes;
    case QMessageBox::No:
      return MessageBoxResult::No;
    default:
      return MessageBoxResult::None;
  }
}

std::optional<QString> QtDialogService::openFile(const QString& title, const std::vector<FileFilter>& filters) {
  const QString path = QFileDialog::getOpenFileName(m_parent, title, QString(), filterString(filters));
  if (path.isEmpty()) {
    return std::nullopt;
  }
  return path;
}

std::optional<QString> QtDialogService::saveFile(const QString& title, const std::vector<FileFilter>& filters) {
  const QString path = QFileDialog::getSaveFileName(m_parent, title, QString(), filterString(filters));
  if (path.isEmpty()) {
    return std::nullopt;
  }
  return path;
}

bool QtDialogService::confirmClose(const QString& documentName) {
  const MessageBoxResult result =
      ask(QStringLiteral("'%1' has unsaved changes. Close it anyway?").arg(documentName),
          QStringLiteral("Unsaved Changes"),
          MessageBoxButtons::YesNo);
  return result == MessageBoxResult::Yes;
}

QString QtDialogService::filterString(const std::vector<FileFilter>& filters) {
  QStringList parts;
  for (const FileFilter& filter : filters) {
    QStringList patterns;
    for (const QString& extension : filter.extensions) {
      patterns.push_back(QStringLiteral("*.") + extension);
    }
    parts.push_back(QStringLiteral("%1 (%2)").arg(filter.name, patterns.join(QLatin1Char(' '))));
  }
  return parts.join(QStringLiteral(";;"));
}

}  // namespace deskkit::ui
