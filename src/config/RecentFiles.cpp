#include "deskkit/config/RecentFiles.hpp"

#include "deskkit/config/AppPaths.hpp"
#include "deskkit/logging/Logger.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <algorithm>
#include <utility>

namespace deskkit::config {
namespace {

const QString kCategory = QStringLiteral("RecentFiles");

Qt::CaseSensitivity pathCaseSensitivity() {
#ifdef Q_OS_WIN
  return Qt::CaseInsensitive;
#else
  return Qt::CaseSensitive;
#endif
}

bool samePath(const QString& lhs, const QString& rhs) {
  return QDir::cleanPath(lhs).compare(QDir::cleanPath(rhs), pathCaseSensitivity()) == 0;
}

}  // namespace

RecentFiles::RecentFiles(QString filePath, int maxFiles, QObject* parent)
    : QObject(parent), m_filePath(std::move(filePath)), m_maxFiles((std::max)(1, maxFiles)) {
  if (m_filePath.isEmpty()) {
    m_filePath = appDataFilePath(QStringLiteral("recent_files.json"));
  }
}

const std::vector<RecentFile>& RecentFiles::files() const noexcept {
  return m_files;
}

int RecentFiles::maxFiles() const noexcept {
  return m_maxFiles;
}

void RecentFiles::addFile(const QString& path, const QString& displayName) {
  if (path.isEmpty()) {
    return;
  }

  m_files.erase(std::remove_if(m_files.begin(),
                               m_files.end(),
                               [&path](const RecentFile& file) { return samePath(file.path, path); }),
                m_files.end());

  RecentFile entry;
  entry.path        = path;
  entry.displayName = displayName.isEmpty() ? QFileInfo(path).fileName() : displayName;
  entry.lastOpened  = QDateTime::currentDateTime();
  m_files.insert(m_files.begin(), std::move(entry));
  trim();

  save();
  emit recentFilesChanged();
}

void RecentFiles::removeFile(const QString& path) {
  const auto oldSize = m_files.size();
  m_files.erase(std::remove_if(m_files.begin(),
                               m_files.end(),
                               [&path](const RecentFile& file) { return samePath(file.path, path); }),
                m_files.end());
  if (m_files.size() == oldSize) {
    return;
  }

  save();
  emit recentFilesChanged();
}

void RecentFiles::clear() {
  m_files.clear();
  save();
  emit recentFilesChanged();
}

void RecentFiles::load() {
  m_files.clear();
  if (m_filePath.isEmpty()) {
    return;
  }

  QFile file(m_filePath);
  if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
    return;
  }

  const QByteArray data = file.readAll();
  file.close();

  QJsonParseError     parseError{};
  const QJsonDocument document = QJsonDocument::fromJson(data, &parseError);
  if (parseError.error != QJsonParseError::NoError || !document.isArray()) {
    LOG_CAT(logging::LogLevel::Warning,
            kCategory,
            QStringLiteral("Ignoring corrupt recent files list %1").arg(m_filePath));
    return;
  }

  for (const QJsonValue& value : document.array()) {
    const QJsonObject object = value.toObject();
    RecentFile        entry;
    entry.path = object.value(QStringLiteral("path")).toString();
    if (entry.path.isEmpty()) {
      continue;
    }
    entry.displayName = object.value(QStringLiteral("display_name")).toString();
    if (entry.displayName.isEmpty()) {
      entry.displayName = QFileInfo(entry.path).fileName();
    }
    entry.lastOpened = QDateTime::fromString(object.value(QStringLiteral("last_opened")).toString(), Qt::ISODate);
    m_files.push_back(std::move(entry));
  }
  trim();
}

void RecentFiles::save() const {
  if (m_filePath.isEmpty()) {
    return;
  }

  QJsonArray array;
  for (const RecentFile& entry : m_files) {
    QJsonObject object;
    object.insert(QStringLiteral("path"), entry.path);
    object.insert(QStringLiteral("display_name"), entry.displayName);
    object.insert(QStringLiteral("last_opened"), entry.lastOpened.toString(Qt::ISODate));
    array.append(object);
  }

  QString error;
  if (!writeFileAtomically(m_filePath, QJsonDocument(array).toJson(QJsonDocument::Compact), &error)) {
    LOG_CAT(logging::LogLevel::Warning, kCategory, error);
  }
}

void RecentFiles::trim() {
  if (m_files.size() > static_cast<std::size_t>(m_maxFiles)) {
    m_files.resize(static_cast<std::size_t>(m_maxFiles));
  }
}

}  // namespace deskkit::config
