#include "deskkit/config/AppPaths.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSaveFile>
#include <QStandardPaths>

namespace deskkit::config {

QString appDataFilePath(const QString& fileName) {
  QString localAppData = qEnvironmentVariable("LOCALAPPDATA");
  if (localAppData.isEmpty()) {
    localAppData = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
  }

  if (localAppData.isEmpty()) {
    return {};
  }

  QDir          baseDir(localAppData);
  const QString relativeDir = QStringLiteral("deskkit");
  if (!baseDir.mkpath(relativeDir)) {
    return {};
  }

  return baseDir.filePath(relativeDir + QLatin1Char('/') + fileName);
}

bool writeFileAtomically(const QString& path, const QByteArray& contents, QString* error) {
  auto fail = [&](const QString& reason) {
    if (error != nullptr) {
      *error = QStringLiteral("Cannot write %1: %2").arg(path, reason);
    }
    return false;
  };

  const QString directory = QFileInfo(path).absolutePath();
  if (!QDir().mkpath(directory)) {
    return fail(QStringLiteral("cannot create %1").arg(directory));
  }

  QSaveFile file(path);
  if (!file.open(QIODevice::WriteOnly)) {
    return fail(file.errorString());
  }
  if (file.write(contents) != contents.size()) {
    const QString reason = file.errorString();
    file.cancelWriting();
    return fail(reason);
  }
  if (!file.commit()) {
    return fail(file.errorString());
  }
  return true;
}

}  // namespace deskkit::config
