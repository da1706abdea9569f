#pragma once

#include "deskkit/logging/LogTypes.hpp"

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

namespace deskkit::config {

struct ConsoleSettings {
  static constexpr int kMinEntries = 1;
  static constexpr int kMaxEntries = 1000000;

  int               maxEntries        = 10000;
  logging::LogLevel minLevel          = logging::LogLevel::Debug;
  bool              redactionEnabled  = true;
  bool              captureStdStreams = false;
};

// Keyed JSON settings file. Load and save never throw: a missing or corrupt
// file starts from defaults, a failed write is logged and skipped.
class AppSettings final {
 public:
  static constexpr int kSettingsVersion   = 1;
  static constexpr int kMaxWorkspaceLimit = 100;

  // Empty path: appDataFilePath("settings.json").
  explicit AppSettings(QString filePath = {});

  [[nodiscard]] const QString& filePath() const noexcept;

  bool load();
  bool save() const;

  [[nodiscard]] QJsonValue value(const QString& key, const QJsonValue& fallback = {}) const;
  void                     setValue(const QString& key, const QJsonValue& value);
  [[nodiscard]] bool       contains(const QString& key) const;
  void                     remove(const QString& key);

  [[nodiscard]] QString     stringValue(const QString& key, const QString& fallback = {}) const;
  [[nodiscard]] int         intValue(const QString& key, int fallback = 0) const;
  [[nodiscard]] bool        boolValue(const QString& key, bool fallback = false) const;
  [[nodiscard]] QJsonObject objectValue(const QString& key) const;

  [[nodiscard]] bool isFirstRun() const;
  void               markFirstRunComplete();
  [[nodiscard]] int  settingsVersion() const;

  [[nodiscard]] ConsoleSettings consoleSettings() const;
  void                          setConsoleSettings(const ConsoleSettings& settings);

  [[nodiscard]] int maxWorkspaces() const;
  void              setMaxWorkspaces(int maxWorkspaces);

 private:
  QString     m_filePath;
  QJsonObject m_root;
};

}  // namespace deskkit::config
