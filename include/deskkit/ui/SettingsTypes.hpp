#pragma once

#include "deskkit/config/AppSettings.hpp"

#include <QJsonObject>
#include <QKeySequence>

namespace deskkit::ui {

struct KeybindSettings {
  QKeySequence newNotes;
  QKeySequence openFile;
  QKeySequence closeWorkspace;
  QKeySequence closeAllWorkspaces;
  QKeySequence nextWorkspace;
  QKeySequence toggleConsole;
  QKeySequence openSettings;

  static KeybindSettings defaults() {
    return {
        QKeySequence(QStringLiteral("Ctrl+N")),
        QKeySequence(QStringLiteral("Ctrl+O")),
        QKeySequence(QStringLiteral("Ctrl+W")),
        QKeySequence(QStringLiteral("Ctrl+Shift+W")),
        QKeySequence(QStringLiteral("Ctrl+Tab")),
        QKeySequence(QStringLiteral("F12")),
        QKeySequence(QStringLiteral("Ctrl+,")),
    };
  }

  // Missing or unparsable entries fall back to defaults().
  static KeybindSettings fromJson(const QJsonObject& keybinds);
  [[nodiscard]] QJsonObject toJson() const;
};

// Everything the settings dialog edits.
struct ShellSettings {
  KeybindSettings         keybinds = KeybindSettings::defaults();
  config::ConsoleSettings console;
  int                     maxWorkspaces = 10;

  static ShellSettings fromAppSettings(const config::AppSettings& settings);
  void                 storeTo(config::AppSettings& settings) const;
};

}  // namespace deskkit::ui
