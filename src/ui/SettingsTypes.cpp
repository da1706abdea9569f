#include "deskkit/ui/SettingsTypes.hpp"

namespace deskkit::ui {
namespace {

const QString kKeybindsKey = QStringLiteral("keybinds");

QKeySequence parseOrFallback(const QJsonObject& keybinds, const QString& key, const QKeySequence& fallback) {
  const QString text = keybinds.value(key).toString().trimmed();
  if (text.isEmpty()) {
    return fallback;
  }
  const QKeySequence parsed(text, QKeySequence::PortableText);
  if (parsed.isEmpty() || parsed[0].key() == Qt::Key_unknown) {
    return fallback;
  }
  return parsed;
}

}  // namespace

KeybindSettings KeybindSettings::fromJson(const QJsonObject& keybinds) {
  const KeybindSettings defaults = KeybindSettings::defaults();

  KeybindSettings settings;
  settings.newNotes           = parseOrFallback(keybinds, QStringLiteral("new_notes"), defaults.newNotes);
  settings.openFile           = parseOrFallback(keybinds, QStringLiteral("open_file"), defaults.openFile);
  settings.closeWorkspace     = parseOrFallback(keybinds, QStringLiteral("close_tab"), defaults.closeWorkspace);
  settings.closeAllWorkspaces = parseOrFallback(keybinds, QStringLiteral("close_all_tabs"), defaults.closeAllWorkspaces);
  settings.nextWorkspace      = parseOrFallback(keybinds, QStringLiteral("next_tab"), defaults.nextWorkspace);
  settings.toggleConsole      = parseOrFallback(keybinds, QStringLiteral("debug_console"), defaults.toggleConsole);
  settings.openSettings       = parseOrFallback(keybinds, QStringLiteral("settings"), defaults.openSettings);
  return settings;
}

QJsonObject KeybindSettings::toJson() const {
  QJsonObject keybinds;
  keybinds.insert(QStringLiteral("new_notes"), newNotes.toString(QKeySequence::PortableText));
  keybinds.insert(QStringLiteral("open_file"), openFile.toString(QKeySequence::PortableText));
  keybinds.insert(QStringLiteral("close_tab"), closeWorkspace.toString(QKeySequence::PortableText));
  keybinds.insert(QStringLiteral("close_all_tabs"), closeAllWorkspaces.toString(QKeySequence::PortableText));
  keybinds.insert(QStringLiteral("next_tab"), nextWorkspace.toString(QKeySequence::PortableText));
  keybinds.insert(QStringLiteral("debug_console"), toggleConsole.toString(QKeySequence::PortableText));
  keybinds.insert(QStringLiteral("settings"), openSettings.toString(QKeySequence::PortableText));
  return keybinds;
}

ShellSettings ShellSettings::fromAppSettings(const config::AppSettings& settings) {
  ShellSettings shell;
  shell.keybinds      = KeybindSettings::fromJson(settings.objectValue(kKeybindsKey));
  shell.console       = settings.consoleSettings();
  shell.maxWorkspaces = settings.maxWorkspaces();
  return shell;
}

void ShellSettings::storeTo(config::AppSettings& settings) const {
  settings.setValue(kKeybindsKey, keybinds.toJson());
  settings.setConsoleSettings(console);
  settings.setMaxWorkspaces(maxWorkspaces);
}

}  // namespace deskkit::ui
