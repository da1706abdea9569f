#include "deskkit/workspace/NotesWorkspace.hpp"

#include <QFileInfo>
#include <QSaveFile>

#include <utility>

namespace deskkit::workspace {

NotesWorkspace::NotesWorkspace(QString title, QObject* parent) : Workspace(kViewType, std::move(title), parent) {}

const QString& NotesWorkspace::text() const noexcept {
  return m_text;
}

void NotesWorkspace::setText(const QString& text) {
  if (m_text == text) {
    return;
  }
  m_text = text;
  markDirty();
  emit textChanged(m_text);
}

const QString& NotesWorkspace::filePath() const noexcept {
  return m_filePath;
}

void NotesWorkspace::setFilePath(const QString& path) {
  m_filePath = path;
  if (!path.isEmpty()) {
    setTitle(QFileInfo(path).fileName());
  }
}

bool NotesWorkspace::save(const QString& path) {
  m_lastError.clear();

  QSaveFile file(path);
  if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
    m_lastError = QStringLiteral("Cannot write '%1': %2").arg(path, file.errorString());
    return false;
  }
  file.write(m_text.toUtf8());
  if (!file.commit()) {
    m_lastError = QStringLiteral("Cannot write '%1': %2").arg(path, file.errorString());
    return false;
  }

  setFilePath(path);
  markClean();
  return true;
}

const QString& NotesWorkspace::lastError() const noexcept {
  return m_lastError;
}

}  // namespace deskkit::workspace
