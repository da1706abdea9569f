#pragma once

#include <QDateTime>
#include <QObject>
#include <QString>

#include <vector>

namespace deskkit::config {

struct RecentFile {
  QString   path;
  QString   displayName;
  QDateTime lastOpened;
};

// Most-recent-first list persisted as a JSON array. Every mutation saves
// and emits recentFilesChanged; storage errors are logged and ignored.
class RecentFiles final : public QObject {
  Q_OBJECT

 public:
  static constexpr int kDefaultMaxFiles = 10;

  // Empty path: appDataFilePath("recent_files.json").
  explicit RecentFiles(QString filePath = {}, int maxFiles = kDefaultMaxFiles, QObject* parent = nullptr);

  [[nodiscard]] const std::vector<RecentFile>& files() const noexcept;
  [[nodiscard]] int                            maxFiles() const noexcept;

  void addFile(const QString& path, const QString& displayName = {});
  void removeFile(const QString& path);
  void clear();

  void load();

 signals:
  void recentFilesChanged();

 private:
  void save() const;
  void trim();

  QString                 m_filePath;
  int                     m_maxFiles;
  std::vector<RecentFile> m_files;
};

}  // namespace deskkit::config
