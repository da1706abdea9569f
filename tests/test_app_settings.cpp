#include "deskkit/config/AppSettings.hpp"
#include "deskkit/logging/LogBuffer.hpp"
#include "deskkit/logging/Logger.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QtTest>

#include <memory>

using deskkit::config::AppSettings;
using deskkit::config::ConsoleSettings;
using deskkit::logging::LogBuffer;
using deskkit::logging::LogLevel;
using deskkit::logging::Logger;

class AppSettingsTest : public QObject {
  Q_OBJECT

 private slots:
  void init();
  void cleanup();

  void missingFileGivesDefaults();
  void roundTripsValues();
  void corruptFileIsIgnoredAndLogged();
  void firstRunFlag();
  void consoleSettingsClampAndFallback();
  void maxWorkspacesClamp();
  void unwritablePathFailsAndLogs();
  void saveReplacesFileWithoutLeftovers();

 private:
  QString settingsPath() const { return m_dir->filePath(QStringLiteral("nested/settings.json")); }

  std::unique_ptr<QTemporaryDir> m_dir;
  std::unique_ptr<LogBuffer>     m_buffer;
};

void AppSettingsTest::init() {
  m_dir = std::make_unique<QTemporaryDir>();
  QVERIFY(m_dir->isValid());
  m_buffer = std::make_unique<LogBuffer>();
  Logger::instance().setBuffer(m_buffer.get());
}

void AppSettingsTest::cleanup() {
  Logger::instance().setBuffer(nullptr);
  m_buffer.reset();
  m_dir.reset();
}

void AppSettingsTest::missingFileGivesDefaults() {
  AppSettings settings(settingsPath());
  QVERIFY(!settings.load());
  QVERIFY(settings.isFirstRun());
  QCOMPARE(settings.maxWorkspaces(), 10);
  QCOMPARE(settings.settingsVersion(), AppSettings::kSettingsVersion);
  QCOMPARE(settings.stringValue(QStringLiteral("theme"), QStringLiteral("light")), QStringLiteral("light"));

  const ConsoleSettings console = settings.consoleSettings();
  QCOMPARE(console.maxEntries, 10000);
  QCOMPARE(console.minLevel, LogLevel::Debug);
  QVERIFY(console.redactionEnabled);
  QVERIFY(!console.captureStdStreams);
}

void AppSettingsTest::roundTripsValues() {
  {
    AppSettings settings(settingsPath());
    settings.setValue(QStringLiteral("theme"), QStringLiteral("dark"));
    settings.setValue(QStringLiteral("zoom"), 125);
    settings.setValue(QStringLiteral("temporary"), true);
    settings.remove(QStringLiteral("temporary"));
    settings.setMaxWorkspaces(4);

    ConsoleSettings console;
    console.maxEntries        = 500;
    console.minLevel          = LogLevel::Warning;
    console.redactionEnabled  = false;
    console.captureStdStreams = true;
    settings.setConsoleSettings(console);
    QVERIFY(settings.save());
  }

  QFile raw(settingsPath());
  QVERIFY(raw.open(QIODevice::ReadOnly));
  const QJsonObject root = QJsonDocument::fromJson(raw.readAll()).object();
  QCOMPARE(root.value(QStringLiteral("settings_version")).toInt(), AppSettings::kSettingsVersion);
  QVERIFY(root.contains(QStringLiteral("saved_at_unix")));
  QCOMPARE(root.value(QStringLiteral("console")).toObject().value(QStringLiteral("min_level")).toString(),
           QStringLiteral("Warning"));

  AppSettings reloaded(settingsPath());
  QVERIFY(reloaded.load());
  QCOMPARE(reloaded.stringValue(QStringLiteral("theme")), QStringLiteral("dark"));
  QCOMPARE(reloaded.intValue(QStringLiteral("zoom")), 125);
  QVERIFY(!reloaded.contains(QStringLiteral("temporary")));
  QCOMPARE(reloaded.maxWorkspaces(), 4);

  const ConsoleSettings console = reloaded.consoleSettings();
  QCOMPARE(console.maxEntries, 500);
  QCOMPARE(console.minLevel, LogLevel::Warning);
  QVERIFY(!console.redactionEnabled);
  QVERIFY(console.captureStdStreams);
}

void AppSettingsTest::corruptFileIsIgnoredAndLogged() {
  QVERIFY(QDir().mkpath(QFileInfo(settingsPath()).absolutePath()));
  QFile file(settingsPath());
  QVERIFY(file.open(QIODevice::WriteOnly));
  file.write("{ \"theme\": ");
  file.close();

  AppSettings settings(settingsPath());
  settings.setValue(QStringLiteral("stale"), 1);
  QVERIFY(!settings.load());
  QVERIFY(!settings.contains(QStringLiteral("stale")));
  QVERIFY(settings.isFirstRun());

  const auto entries = m_buffer->entries();
  QVERIFY(!entries.empty());
  QCOMPARE(entries.back().level, LogLevel::Warning);
  QCOMPARE(entries.back().category, QStringLiteral("Settings"));

  // A JSON array is valid JSON but not a settings object.
  QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
  file.write("[1, 2, 3]");
  file.close();
  QVERIFY(!settings.load());
}

void AppSettingsTest::firstRunFlag() {
  {
    AppSettings settings(settingsPath());
    QVERIFY(settings.isFirstRun());
    settings.markFirstRunComplete();
    QVERIFY(!settings.isFirstRun());
    QVERIFY(settings.save());
  }

  AppSettings reloaded(settingsPath());
  QVERIFY(reloaded.load());
  QVERIFY(!reloaded.isFirstRun());
}

void AppSettingsTest::consoleSettingsClampAndFallback() {
  AppSettings settings(settingsPath());

  QJsonObject console;
  console.insert(QStringLiteral("max_entries"), -20);
  console.insert(QStringLiteral("min_level"), QStringLiteral("LOUD"));
  settings.setValue(QStringLiteral("console"), console);

  const ConsoleSettings parsed = settings.consoleSettings();
  QCOMPARE(parsed.maxEntries, 1);
  QCOMPARE(parsed.minLevel, LogLevel::Debug);
  QVERIFY(parsed.redactionEnabled);

  console.insert(QStringLiteral("max_entries"), 5000000);
  settings.setValue(QStringLiteral("console"), console);
  QCOMPARE(settings.consoleSettings().maxEntries, ConsoleSettings::kMaxEntries);
}

void AppSettingsTest::maxWorkspacesClamp() {
  AppSettings settings(settingsPath());
  settings.setMaxWorkspaces(0);
  QCOMPARE(settings.maxWorkspaces(), 1);

  settings.setValue(QStringLiteral("max_workspaces"), -3);
  QCOMPARE(settings.maxWorkspaces(), 1);

  settings.setMaxWorkspaces(500);
  QCOMPARE(settings.maxWorkspaces(), AppSettings::kMaxWorkspaceLimit);
}

void AppSettingsTest::unwritablePathFailsAndLogs() {
  // A regular file where the parent directory should be.
  const QString blocker = m_dir->filePath(QStringLiteral("blocker"));
  QFile         file(blocker);
  QVERIFY(file.open(QIODevice::WriteOnly));
  file.write("x");
  file.close();

  AppSettings settings(blocker + QStringLiteral("/settings.json"));
  settings.setValue(QStringLiteral("theme"), QStringLiteral("dark"));
  QVERIFY(!settings.save());

  const auto entries = m_buffer->entries();
  QVERIFY(!entries.empty());
  QCOMPARE(entries.back().level, LogLevel::Warning);
  QCOMPARE(entries.back().category, QStringLiteral("Settings"));
  QVERIFY(entries.back().message.contains(QStringLiteral("Cannot write")));
}

void AppSettingsTest::saveReplacesFileWithoutLeftovers() {
  AppSettings settings(settingsPath());
  settings.setValue(QStringLiteral("theme"), QStringLiteral("dark"));
  QVERIFY(settings.save());
  settings.setValue(QStringLiteral("theme"), QStringLiteral("light"));
  QVERIFY(settings.save());

  const QDir directory = QFileInfo(settingsPath()).absoluteDir();
  QCOMPARE(directory.entryList(QDir::Files), QStringList{QStringLiteral("settings.json")});

  AppSettings reloaded(settingsPath());
  QVERIFY(reloaded.load());
  QCOMPARE(reloaded.stringValue(QStringLiteral("theme")), QStringLiteral("light"));
}

QTEST_GUILESS_MAIN(AppSettingsTest)
#include "test_app_settings.moc"
