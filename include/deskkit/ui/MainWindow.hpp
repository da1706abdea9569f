#pragma once

#include "deskkit/data/Importers.hpp"
#include "deskkit/ui/SettingsTypes.hpp"

#include <QMainWindow>
#include <QPointer>
#include <QString>

#include <memory>

class QAction;
class QCloseEvent;
class QLabel;
class QMenu;
class QThread;

namespace deskkit::config {
class AppSettings;
class RecentFiles;
}  // namespace deskkit::config

namespace deskkit::logging {
class LogBuffer;
class StreamCapture;
}  // namespace deskkit::logging

namespace deskkit::workspace {
class DirtyTracker;
class Workspace;
class WorkspaceRegistry;
}  // namespace deskkit::workspace

namespace deskkit::ui {

class AboutWindow;
class DebugConsoleWindow;
class DialogService;
class FindReplaceDialog;
class NavigationSidebar;
class SettingsWindow;
class TableView;
class WorkspaceTabs;

// Services owned by the application and shared with the shell.
struct ShellServices {
  config::AppSettings&    settings;
  config::RecentFiles&    recentFiles;
  logging::LogBuffer&     logBuffer;
  logging::StreamCapture& streamCapture;
};

class MainWindow final : public QMainWindow {
  Q_OBJECT

 public:
  explicit MainWindow(ShellServices services, QWidget* parent = nullptr);
  ~MainWindow() override;

  [[nodiscard]] workspace::WorkspaceRegistry& registry() noexcept;

  // Applies the console part of the settings to the buffer and capture.
  void applyConsoleSettings();

 protected:
  void closeEvent(QCloseEvent* event) override;

 private:
  void     applyTheme();
  void     configureWindow();
  void     configureMenuBar();
  QWidget* buildCentralArea();
  void     showDebugConsoleWindow();
  void     showSettingsWindow();
  void     showAboutWindow();
  void     showFindDialog();
  void     applyKeybindSettings();
  void     onSettingsSaved(const ShellSettings& settings);
  void     onNavigationItem(const QString& key);

  void newNotesWorkspace();
  void openFile();
  void importFile(const QString& path);
  void onImportFinished(const QString& path, const data::ImportResult& result);
  void saveActiveWorkspace();
  void closeActiveWorkspace();
  void closeAllWorkspaces();
  bool adoptWorkspace(std::unique_ptr<workspace::Workspace> workspace);
  void rebuildRecentFilesMenu();
  void updateStatus();

  [[nodiscard]] TableView* activeTableView() const;
  void                     findAgain(bool forward);
  void                     mapColumns();

  ShellServices                                 m_services;
  std::unique_ptr<workspace::WorkspaceRegistry> m_registry;
  std::unique_ptr<workspace::DirtyTracker>      m_dirtyTracker;
  std::unique_ptr<DialogService>                m_dialogs;
  data::ImporterList                            m_importers;

  std::unique_ptr<DebugConsoleWindow> m_debugConsoleWindow;
  std::unique_ptr<SettingsWindow>     m_settingsWindow;
  std::unique_ptr<AboutWindow>        m_aboutWindow;
  std::unique_ptr<FindReplaceDialog>  m_findDialog;

  ShellSettings m_shellSettings;

  NavigationSidebar* m_sidebar     = nullptr;
  WorkspaceTabs*     m_tabs        = nullptr;
  QMenu*             m_recentMenu  = nullptr;
  QLabel*            m_statusLabel = nullptr;

  QAction* m_newNotesAction       = nullptr;
  QAction* m_openAction           = nullptr;
  QAction* m_saveAction           = nullptr;
  QAction* m_closeTabAction       = nullptr;
  QAction* m_closeAllTabsAction   = nullptr;
  QAction* m_nextTabAction        = nullptr;
  QAction* m_debugConsoleAction   = nullptr;
  QAction* m_settingsAction       = nullptr;
  QAction* m_findAction           = nullptr;
  QAction* m_findNextAction       = nullptr;
  QAction* m_findPreviousAction   = nullptr;
  QAction* m_copyAction           = nullptr;
  QAction* m_pasteAction          = nullptr;
  QAction* m_mapColumnsAction     = nullptr;

  QThread* m_importThread   = nullptr;
  bool     m_importBusy     = false;
  bool     m_closeConfirmed = false;
  int      m_notesSeed      = 1;
};

}  // namespace deskkit::ui
