#include "deskkit/config/AppSettings.hpp"

#include "deskkit/config/AppPaths.hpp"
#include "deskkit/logging/Logger.hpp"

#include <QDateTime>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>

#include <algorithm>
#include <utility>

namespace deskkit::config {
namespace {

const QString kCategory = QStringLiteral("Settings");

const QString kFirstRunCompleteKey = QStringLiteral("first_run_complete");
const QString kVersionKey          = QStringLiteral("settings_version");
const QString kConsoleKey          = QStringLiteral("console");
const QString kMaxWorkspacesKey    = QStringLiteral("max_workspaces");

constexpr int kDefaultMaxWorkspaces = 10;

}  // namespace

AppSettings::AppSettings(QString filePath) : m_filePath(std::move(filePath)) {
  if (m_filePath.isEmpty()) {
    m_filePath = appDataFilePath(QStringLiteral("settings.json"));
  }
}

const QString& AppSettings::filePath() const noexcept {
  return m_filePath;
}

bool AppSettings::load() {
  m_root = QJsonObject();
  if (m_filePath.isEmpty()) {
    return false;
  }

  QFile file(m_filePath);
  if (!file.exists()) {
    return false;
  }
  if (!file.open(QIODevice::ReadOnly)) {
    LOG_CAT(logging::LogLevel::Warning,
            kCategory,
            QStringLiteral("Cannot read %1: %2").arg(m_filePath, file.errorString()));
    return false;
  }

  const QByteArray data = file.readAll();
  file.close();

  QJsonParseError     parseError{};
  const QJsonDocument document = QJsonDocument::fromJson(data, &parseError);
  if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
    LOG_CAT(logging::LogLevel::Warning,
            kCategory,
            QStringLiteral("Ignoring corrupt settings file %1: %2").arg(m_filePath, parseError.errorString()));
    return false;
  }

  m_root = document.object();
  return true;
}

bool AppSettings::save() const {
  if (m_filePath.isEmpty()) {
    return false;
  }

  QJsonObject root = m_root;
  root.insert(kVersionKey, kSettingsVersion);
  root.insert(QStringLiteral("saved_at_unix"), static_cast<qint64>(QDateTime::currentSecsSinceEpoch()));

  QString error;
  if (!writeFileAtomically(m_filePath, QJsonDocument(root).toJson(QJsonDocument::Indented), &error)) {
    LOG_CAT(logging::LogLevel::Warning, kCategory, error);
    return false;
  }
  return true;
}

QJsonValue AppSettings::value(const QString& key, const QJsonValue& fallback) const {
  const auto it = m_root.constFind(key);
  return it == m_root.constEnd() ? fallback : it.value();
}

void AppSettings::setValue(const QString& key, const QJsonValue& value) {
  m_root.insert(key, value);
}

bool AppSettings::contains(const QString& key) const {
  return m_root.contains(key);
}

void AppSettings::remove(const QString& key) {
  m_root.remove(key);
}

QString AppSettings::stringValue(const QString& key, const QString& fallback) const {
  const QJsonValue found = value(key);
  return found.isString() ? found.toString() : fallback;
}

int AppSettings::intValue(const QString& key, int fallback) const {
  return value(key).toInt(fallback);
}

bool AppSettings::boolValue(const QString& key, bool fallback) const {
  return value(key).toBool(fallback);
}

QJsonObject AppSettings::objectValue(const QString& key) const {
  return value(key).toObject();
}

bool AppSettings::isFirstRun() const {
  return !boolValue(kFirstRunCompleteKey, false);
}

void AppSettings::markFirstRunComplete() {
  setValue(kFirstRunCompleteKey, true);
}

int AppSettings::settingsVersion() const {
  return intValue(kVersionKey, kSettingsVersion);
}

ConsoleSettings AppSettings::consoleSettings() const {
  ConsoleSettings   settings;
  const QJsonObject console = objectValue(kConsoleKey);

  settings.maxEntries = std::clamp(console.value(QStringLiteral("max_entries")).toInt(settings.maxEntries),
                                   ConsoleSettings::kMinEntries,
                                   ConsoleSettings::kMaxEntries);
  if (const auto level = logging::levelFromName(console.value(QStringLiteral("min_level")).toString())) {
    settings.minLevel = *level;
  }
  settings.redactionEnabled  = console.value(QStringLiteral("redaction_enabled")).toBool(settings.redactionEnabled);
  settings.captureStdStreams = console.value(QStringLiteral("capture_std_streams")).toBool(settings.captureStdStreams);
  return settings;
}

void AppSettings::setConsoleSettings(const ConsoleSettings& settings) {
  QJsonObject console;
  console.insert(QStringLiteral("max_entries"),
                 std::clamp(settings.maxEntries, ConsoleSettings::kMinEntries, ConsoleSettings::kMaxEntries));
  console.insert(QStringLiteral("min_level"), logging::levelName(settings.minLevel));
  console.insert(QStringLiteral("redaction_enabled"), settings.redactionEnabled);
  console.insert(QStringLiteral("capture_std_streams"), settings.captureStdStreams);
  setValue(kConsoleKey, console);
}

int AppSettings::maxWorkspaces() const {
  return std::clamp(intValue(kMaxWorkspacesKey, kDefaultMaxWorkspaces), 1, kMaxWorkspaceLimit);
}

void AppSettings::setMaxWorkspaces(int maxWorkspaces) {
  setValue(kMaxWorkspacesKey, std::clamp(maxWorkspaces, 1, kMaxWorkspaceLimit));
}

}  // namespace deskkit::config
