#include "deskkit/config/AppSettings.hpp"
#include "deskkit/ui/SettingsTypes.hpp"

#include <QTemporaryDir>
#include <QtTest>

using deskkit::config::AppSettings;
using deskkit::logging::LogLevel;
using deskkit::ui::KeybindSettings;
using deskkit::ui::ShellSettings;

class SettingsTypesTest : public QObject {
  Q_OBJECT

 private slots:
  void emptyJsonGivesDefaults();
  void badEntriesFallBack();
  void keybindsRoundTrip();
  void shellSettingsPersist();
};

void SettingsTypesTest::emptyJsonGivesDefaults() {
  const KeybindSettings defaults = KeybindSettings::defaults();
  const KeybindSettings parsed   = KeybindSettings::fromJson(QJsonObject());

  QCOMPARE(parsed.newNotes, defaults.newNotes);
  QCOMPARE(parsed.closeAllWorkspaces, QKeySequence(QStringLiteral("Ctrl+Shift+W")));
  QCOMPARE(parsed.toggleConsole, QKeySequence(Qt::Key_F12));
  QCOMPARE(parsed.openSettings, defaults.openSettings);
}

void SettingsTypesTest::badEntriesFallBack() {
  QJsonObject json;
  json.insert(QStringLiteral("new_notes"), 42);
  json.insert(QStringLiteral("open_file"), QStringLiteral("   "));
  json.insert(QStringLiteral("close_tab"), QStringLiteral("Ctrl+NoSuchKey"));
  json.insert(QStringLiteral("debug_console"), QStringLiteral("F11"));

  const KeybindSettings defaults = KeybindSettings::defaults();
  const KeybindSettings parsed   = KeybindSettings::fromJson(json);
  QCOMPARE(parsed.newNotes, defaults.newNotes);
  QCOMPARE(parsed.openFile, defaults.openFile);
  QCOMPARE(parsed.closeWorkspace, defaults.closeWorkspace);
  QCOMPARE(parsed.toggleConsole, QKeySequence(Qt::Key_F11));
}

void SettingsTypesTest::keybindsRoundTrip() {
  KeybindSettings custom = KeybindSettings::defaults();
  custom.openFile        = QKeySequence(QStringLiteral("Ctrl+Alt+O"));
  custom.nextWorkspace   = QKeySequence(QStringLiteral("Ctrl+PgDown"));

  const QJsonObject json = custom.toJson();
  QCOMPARE(json.value(QStringLiteral("open_file")).toString(), QStringLiteral("Ctrl+Alt+O"));
  QCOMPARE(json.size(), 7);

  const KeybindSettings parsed = KeybindSettings::fromJson(json);
  QCOMPARE(parsed.openFile, custom.openFile);
  QCOMPARE(parsed.nextWorkspace, custom.nextWorkspace);
  QCOMPARE(parsed.closeWorkspace, custom.closeWorkspace);
}

void SettingsTypesTest::shellSettingsPersist() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QString path = dir.filePath(QStringLiteral("settings.json"));

  {
    AppSettings   settings(path);
    ShellSettings shell;
    shell.keybinds.toggleConsole = QKeySequence(Qt::Key_F9);
    shell.console.maxEntries     = 250;
    shell.console.minLevel       = LogLevel::Error;
    shell.maxWorkspaces          = 3;
    shell.storeTo(settings);
    QVERIFY(settings.save());
  }

  AppSettings settings(path);
  QVERIFY(settings.load());
  const ShellSettings shell = ShellSettings::fromAppSettings(settings);
  QCOMPARE(shell.keybinds.toggleConsole, QKeySequence(Qt::Key_F9));
  QCOMPARE(shell.keybinds.openFile, KeybindSettings::defaults().openFile);
  QCOMPARE(shell.console.maxEntries, 250);
  QCOMPARE(shell.console.minLevel, LogLevel::Error);
  QCOMPARE(shell.maxWorkspaces, 3);
}

QTEST_GUILESS_MAIN(SettingsTypesTest)
#include "test_settings_types.moc"
