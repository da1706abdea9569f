#include "deskkit/ui/MainWindow.hpp"

#include "deskkit/config/AppSettings.hpp"
#include "deskkit/data/ColumnRoles.hpp"
#include "deskkit/config/RecentFiles.hpp"
#include "deskkit/logging/LogBuffer.hpp"
#include "deskkit/logging/Logger.hpp"
#include "deskkit/logging/StreamCapture.hpp"
#include "deskkit/ui/AboutWindow.hpp"
#include "deskkit/ui/ColumnRoleMapperDialog.hpp"
#include "deskkit/ui/DebugConsoleWindow.hpp"
#include "deskkit/ui/DialogService.hpp"
#include "deskkit/ui/FindReplaceDialog.hpp"
#include "deskkit/ui/NavigationSidebar.hpp"
#include "deskkit/ui/SettingsWindow.hpp"
#include "deskkit/ui/WorkspaceTabs.hpp"
#include "deskkit/ui/WorkspaceViews.hpp"
#include "deskkit/workspace/DirtyTracker.hpp"
#include "deskkit/workspace/NotesWorkspace.hpp"
#include "deskkit/workspace/TableWorkspace.hpp"
#include "deskkit/workspace/WorkspaceRegistry.hpp"

#include <QAction>
#include <QCloseEvent>
#include <QFileInfo>
#include <QLabel>
#include <QMenu>
#include <QMenuBar>
#include <QMetaObject>
#include <QSplitter>
#include <QStatusBar>
#include <QThread>
#include <QVBoxLayout>
#include <QWidget>

#include <optional>
#include <utility>
#include <vector>

namespace deskkit::ui {
namespace {

const QString kCategory = QStringLiteral("Shell");

const QString kNavNewNotes = QStringLiteral("new-notes");
const QString kNavImport   = QStringLiteral("import");
const QString kNavConsole  = QStringLiteral("console");
const QString kNavSettings = QStringLiteral("settings");

// Roles offered by Edit > Map Columns for an imported table.
std::vector<data::ColumnRole> defaultColumnRoles() {
  return {
      data::ColumnRole{QStringLiteral("id"), QStringLiteral("Identifier"), true, QStringLiteral("text")},
      data::ColumnRole{QStringLiteral("label"), QStringLiteral("Label"), true, QStringLiteral("text")},
      data::ColumnRole{QStringLiteral("value"), QStringLiteral("Value"), false, QStringLiteral("number")},
  };
}

}  // namespace

MainWindow::MainWindow(ShellServices services, QWidget* parent)
    : QMainWindow(parent),
      m_services(services),
      m_registry(std::make_unique<workspace::WorkspaceRegistry>(m_services.settings.maxWorkspaces())),
      m_dirtyTracker(std::make_unique<workspace::DirtyTracker>()),
      m_dialogs(std::make_unique<QtDialogService>(this)),
      m_importers(data::createDefaultImporters()),
      m_shellSettings(ShellSettings::fromAppSettings(m_services.settings)) {
  m_dirtyTracker->attach(m_registry.get());

  applyTheme();
  configureWindow();

  connect(m_dirtyTracker.get(), &workspace::DirtyTracker::dirtyStateChanged, this, &QWidget::setWindowModified);
  connect(m_registry.get(), &workspace::WorkspaceRegistry::activeWorkspaceChanged, this, [this]() {
    updateStatus();
  });
  connect(m_registry.get(), &workspace::WorkspaceRegistry::workspaceRemoved, this, [this]() { updateStatus(); });
  connect(&m_services.recentFiles, &config::RecentFiles::recentFilesChanged, this, &MainWindow::rebuildRecentFilesMenu);

  rebuildRecentFilesMenu();
  updateStatus();
}

MainWindow::~MainWindow() {
  if (m_importThread != nullptr) {
    m_importThread->quit();
    m_importThread->wait();
    m_importThread = nullptr;
  }
  // Views reference their workspaces; drop them before the registry.
  delete takeCentralWidget();
}

workspace::WorkspaceRegistry& MainWindow::registry() noexcept {
  return *m_registry;
}

void MainWindow::applyConsoleSettings() {
  const config::ConsoleSettings& console = m_shellSettings.console;
  m_services.logBuffer.setMaxEntries(static_cast<std::size_t>(console.maxEntries));
  m_services.logBuffer.setMinLevel(console.minLevel);
  m_services.logBuffer.setRedactionEnabled(console.redactionEnabled);

  if (console.captureStdStreams) {
    m_services.streamCapture.startCapture();
  } else {
    m_services.streamCapture.stopCapture();
  }

  if (m_debugConsoleWindow != nullptr) {
    m_debugConsoleWindow->refresh();
  }
}

void MainWindow::closeEvent(QCloseEvent* event) {
  if (m_closeConfirmed || m_registry->count() == 0) {
    event->accept();
    return;
  }

  // Every workspace gets a say; the window only closes once all agreed.
  event->ignore();
  QPointer<MainWindow> self(this);
  m_registry->closeAll([self](bool allClosed) {
    if (self == nullptr) {
      return;
    }
    if (!allClosed) {
      LOG_CAT(logging::LogLevel::Info, kCategory, QStringLiteral("Exit cancelled"));
      return;
    }
    self->m_closeConfirmed = true;
    QMetaObject::invokeMethod(self.data(), [self]() {
      if (self != nullptr) {
        self->close();
      }
    }, Qt::QueuedConnection);
  });
}

void MainWindow::applyTheme() {
  setStyleSheet(QStringLiteral(R"(QMainWindow {
  background-color: #202328;
  color: #e6e8eb;
}
QMenuBar {
  background-color: #22242b;
  color: #e6e8eb;
  border-bottom: 1px solid #40434c;
}
QMenuBar::item {
  spacing: 8px;
  padding: 5px 10px;
  background: transparent;
}
QMenuBar::item:selected {
  background: #33363f;
}
QMenu {
  background-color: #282a32;
  border: 1px solid #464953;
}
QMenu::item {
  color: #c5cad3;
}
QMenu::item:selected {
  background-color: #3a3e49;
  color: #ffffff;
}
QMenu::item:disabled {
  color: #6c717c;
}
QTreeWidget {
  background-color: #25272e;
  color: #d7dbe2;
  border: none;
  border-right: 1px solid #464953;
}
QTreeWidget::item {
  padding: 4px 2px;
}
QTreeWidget::item:selected {
  background-color: #35598c;
  color: #ffffff;
}
QTabWidget::pane {
  border: 1px solid #464953;
}
QTabBar::tab {
  background-color: #2a2c34;
  color: #c5cad3;
  padding: 6px 12px;
  border: 1px solid #40434c;
}
QTabBar::tab:selected {
  background-color: #35383f;
  color: #ffffff;
}
QPlainTextEdit, QTableWidget {
  background-color: #18191e;
  color: #e6e8eb;
  border: none;
  gridline-color: #33363f;
}
QHeaderView::section {
  background-color: #33353b;
  color: #e6e8eb;
  border: 1px solid #4d515c;
  padding: 5px;
}
QStatusBar {
  background-color: #22242b;
  color: #aab2c0;
}
QSplitter::handle {
  background-color: #51545d;
})"));
}

void MainWindow::configureWindow() {
  setWindowTitle(QStringLiteral("DeskKit[*]"));
  resize(1100, 720);
  configureMenuBar();
  setCentralWidget(buildCentralArea());

  m_statusLabel = new QLabel(this);
  statusBar()->addPermanentWidget(m_statusLabel);
}

void MainWindow::configureMenuBar() {
  auto* topMenu = menuBar();

  auto* fileMenu   = topMenu->addMenu(QStringLiteral("File"));
  m_newNotesAction = fileMenu->addAction(QStringLiteral("New Notes"));
  m_openAction     = fileMenu->addAction(QStringLiteral("Open..."));
  m_recentMenu     = fileMenu->addMenu(QStringLiteral("Recent Files"));
  m_saveAction     = fileMenu->addAction(QStringLiteral("Save"));
  m_saveAction->setShortcut(QKeySequence::Save);
  fileMenu->addSeparator();
  m_closeTabAction     = fileMenu->addAction(QStringLiteral("Close Tab"));
  m_closeAllTabsAction = fileMenu->addAction(QStringLiteral("Close All Tabs"));
  fileMenu->addSeparator();
  m_settingsAction = fileMenu->addAction(QStringLiteral("Settings"));
  fileMenu->addSeparator();
  auto* exitAction = fileMenu->addAction(QStringLiteral("Exit"));

  connect(m_newNotesAction, &QAction::triggered, this, &MainWindow::newNotesWorkspace);
  connect(m_openAction, &QAction::triggered, this, &MainWindow::openFile);
  connect(m_saveAction, &QAction::triggered, this, &MainWindow::saveActiveWorkspace);
  connect(m_closeTabAction, &QAction::triggered, this, &MainWindow::closeActiveWorkspace);
  connect(m_closeAllTabsAction, &QAction::triggered, this, &MainWindow::closeAllWorkspaces);
  connect(m_settingsAction, &QAction::triggered, this, &MainWindow::showSettingsWindow);
  connect(exitAction, &QAction::triggered, this, &QWidget::close);

  auto* editMenu       = topMenu->addMenu(QStringLiteral("Edit"));
  m_copyAction         = editMenu->addAction(QStringLiteral("Copy Cells"));
  m_pasteAction        = editMenu->addAction(QStringLiteral("Paste Cells"));
  editMenu->addSeparator();
  m_findAction         = editMenu->addAction(QStringLiteral("Find and Replace..."));
  m_findNextAction     = editMenu->addAction(QStringLiteral("Find Next"));
  m_findPreviousAction = editMenu->addAction(QStringLiteral("Find Previous"));
  editMenu->addSeparator();
  m_mapColumnsAction = editMenu->addAction(QStringLiteral("Map Columns..."));

  // Text editors take Copy and Paste first through their shortcut override.
  m_copyAction->setShortcut(QKeySequence::Copy);
  m_pasteAction->setShortcut(QKeySequence::Paste);
  m_findAction->setShortcut(QKeySequence::Find);
  m_findNextAction->setShortcut(QKeySequence::FindNext);
  m_findPreviousAction->setShortcut(QKeySequence::FindPrevious);

  connect(m_copyAction, &QAction::triggered, this, [this]() {
    if (TableView* view = activeTableView()) {
      view->copySelection();
    }
  });
  connect(m_pasteAction, &QAction::triggered, this, [this]() {
    if (TableView* view = activeTableView()) {
      view->pasteClipboard();
    }
  });
  connect(m_findAction, &QAction::triggered, this, &MainWindow::showFindDialog);
  connect(m_findNextAction, &QAction::triggered, this, [this]() { findAgain(true); });
  connect(m_findPreviousAction, &QAction::triggered, this, [this]() { findAgain(false); });
  connect(m_mapColumnsAction, &QAction::triggered, this, &MainWindow::mapColumns);

  auto* viewMenu       = topMenu->addMenu(QStringLiteral("View"));
  m_nextTabAction      = viewMenu->addAction(QStringLiteral("Next Tab"));
  m_debugConsoleAction = viewMenu->addAction(QStringLiteral("Debug Console"));
  connect(m_nextTabAction, &QAction::triggered, this, [this]() {
    if (m_tabs != nullptr) {
      m_tabs->activateNext();
    }
  });
  connect(m_debugConsoleAction, &QAction::triggered, this, &MainWindow::showDebugConsoleWindow);

  auto* helpMenu    = topMenu->addMenu(QStringLiteral("Help"));
  auto* aboutAction = helpMenu->addAction(QStringLiteral("About"));
  connect(aboutAction, &QAction::triggered, this, &MainWindow::showAboutWindow);

  applyKeybindSettings();
}

QWidget* MainWindow::buildCentralArea() {
  auto* root       = new QWidget(this);
  auto* rootLayout = new QVBoxLayout(root);
  rootLayout->setContentsMargins(0, 0, 0, 0);
  rootLayout->setSpacing(0);

  auto* splitter = new QSplitter(Qt::Horizontal, root);
  splitter->setChildrenCollapsible(false);
  splitter->setHandleWidth(2);

  m_sidebar = new NavigationSidebar(splitter);
  m_sidebar->setItems({
      {QStringLiteral("Workspaces"),
       {},
       {{QStringLiteral("New Notes"), kNavNewNotes, {}}, {QStringLiteral("Import Data..."), kNavImport, {}}}},
      {QStringLiteral("Tools"),
       {},
       {{QStringLiteral("Debug Console"), kNavConsole, {}}, {QStringLiteral("Settings"), kNavSettings, {}}}},
  });
  connect(m_sidebar, &NavigationSidebar::itemActivated, this, [this](const QString& key, const QString&) {
    onNavigationItem(key);
  });

  m_tabs = new WorkspaceTabs(*m_registry, WorkspaceViewFactory::withDefaultViews(), splitter);

  splitter->addWidget(m_sidebar);
  splitter->addWidget(m_tabs);
  splitter->setStretchFactor(0, 0);
  splitter->setStretchFactor(1, 1);
  splitter->setSizes({220, 880});

  rootLayout->addWidget(splitter, 1);
  return root;
}

void MainWindow::showDebugConsoleWindow() {
  if (m_debugConsoleWindow == nullptr) {
    m_debugConsoleWindow =
        std::make_unique<DebugConsoleWindow>(m_services.logBuffer, &m_services.streamCapture, this);
  }

  m_debugConsoleWindow->show();
  m_debugConsoleWindow->raise();
  m_debugConsoleWindow->activateWindow();
}

void MainWindow::showSettingsWindow() {
  if (m_settingsWindow == nullptr) {
    m_settingsWindow = std::make_unique<SettingsWindow>(this);
    connect(m_settingsWindow.get(), &SettingsWindow::settingsSaved, this, &MainWindow::onSettingsSaved);
  }

  m_settingsWindow->setShellSettings(m_shellSettings);
  m_settingsWindow->show();
  m_settingsWindow->raise();
  m_settingsWindow->activateWindow();
}

void MainWindow::showAboutWindow() {
  if (m_aboutWindow == nullptr) {
    m_aboutWindow = std::make_unique<AboutWindow>(this);
  }

  m_aboutWindow->show();
  m_aboutWindow->raise();
  m_aboutWindow->activateWindow();
}

void MainWindow::showFindDialog() {
  if (m_findDialog == nullptr) {
    m_findDialog = std::make_unique<FindReplaceDialog>(this);
  }

  TableView* view = activeTableView();
  m_findDialog->setSearch(view != nullptr ? &view->search() : nullptr);
  m_findDialog->show();
  m_findDialog->raise();
  m_findDialog->activateWindow();
}

void MainWindow::applyKeybindSettings() {
  auto applyShortcut = [](QAction* action, const QKeySequence& sequence) {
    if (action == nullptr) {
      return;
    }
    action->setShortcut(sequence);
    action->setShortcutContext(Qt::ApplicationShortcut);
  };

  const KeybindSettings& keybinds = m_shellSettings.keybinds;
  applyShortcut(m_newNotesAction, keybinds.newNotes);
  applyShortcut(m_openAction, keybinds.openFile);
  applyShortcut(m_closeTabAction, keybinds.closeWorkspace);
  applyShortcut(m_closeAllTabsAction, keybinds.closeAllWorkspaces);
  applyShortcut(m_nextTabAction, keybinds.nextWorkspace);
  applyShortcut(m_debugConsoleAction, keybinds.toggleConsole);
  applyShortcut(m_settingsAction, keybinds.openSettings);
}

void MainWindow::onSettingsSaved(const ShellSettings& settings) {
  m_shellSettings = settings;
  m_shellSettings.storeTo(m_services.settings);
  if (!m_services.settings.save()) {
    statusBar()->showMessage(QStringLiteral("Settings could not be written"), 5000);
  }

  applyKeybindSettings();
  applyConsoleSettings();
  m_registry->setMaxWorkspaces(m_shellSettings.maxWorkspaces);
  LOG_CAT(logging::LogLevel::Info, kCategory, QStringLiteral("Settings applied"));
}

void MainWindow::onNavigationItem(const QString& key) {
  if (key == kNavNewNotes) {
    newNotesWorkspace();
  } else if (key == kNavImport) {
    openFile();
  } else if (key == kNavConsole) {
    showDebugConsoleWindow();
  } else if (key == kNavSettings) {
    showSettingsWindow();
  }
}

void MainWindow::newNotesWorkspace() {
  auto notes = std::make_unique<workspace::NotesWorkspace>(QStringLiteral("Notes %1").arg(m_notesSeed));
  if (adoptWorkspace(std::move(notes))) {
    ++m_notesSeed;
  }
}

void MainWindow::openFile() {
  std::vector<FileFilter> filters;
  QStringList             allExtensions;
  for (const auto& importer : m_importers) {
    FileFilter filter{importer->displayName(), {}};
    for (const QString& extension : importer->supportedExtensions()) {
      filter.extensions.push_back(extension.mid(1));
    }
    allExtensions += filter.extensions;
    filters.push_back(std::move(filter));
  }
  filters.insert(filters.begin(), FileFilter{QStringLiteral("Supported files"), allExtensions});

  const std::optional<QString> path = m_dialogs->openFile(QStringLiteral("Open Data File"), filters);
  if (path.has_value()) {
    importFile(*path);
  }
}

void MainWindow::importFile(const QString& path) {
  if (m_importBusy) {
    statusBar()->showMessage(QStringLiteral("An import is already running"), 3000);
    return;
  }

  if (!QFileInfo::exists(path)) {
    m_services.recentFiles.removeFile(path);
    m_dialogs->showMessage(QStringLiteral("File not found:\n%1").arg(path), QStringLiteral("Open"));
    return;
  }

  const data::DataImporter* importer = data::importerForPath(m_importers, path);
  if (importer == nullptr) {
    const bool isExcel = QFileInfo(path).suffix().compare(QStringLiteral("xlsx"), Qt::CaseInsensitive) == 0;
    m_dialogs->showMessage(isExcel && !data::kExcelImportAvailable
                               ? QStringLiteral("Excel import is not available in this build.")
                               : QStringLiteral("Unsupported file type:\n%1").arg(path),
                           QStringLiteral("Open"));
    return;
  }

  m_importBusy = true;
  statusBar()->showMessage(QStringLiteral("Importing %1...").arg(QFileInfo(path).fileName()));
  LOG_CAT(logging::LogLevel::Info, QStringLiteral("Import"), QStringLiteral("Importing %1").arg(path));

  QPointer<MainWindow> self(this);
  m_importThread = QThread::create([self, importer, path]() {
    data::ImportResult result = importer->importFile(path);

    if (self != nullptr) {
      QMetaObject::invokeMethod(
          self.data(),
          [self, path, result = std::move(result)]() {
            if (self != nullptr) {
              self->onImportFinished(path, result);
            }
          },
          Qt::QueuedConnection);
    }
  });

  connect(m_importThread, &QThread::finished, this, [this]() { m_importThread = nullptr; });
  connect(m_importThread, &QThread::finished, m_importThread, &QObject::deleteLater);
  m_importThread->start();
}

void MainWindow::onImportFinished(const QString& path, const data::ImportResult& result) {
  m_importBusy = false;
  statusBar()->clearMessage();

  if (!result.success) {
    logging::Logger::instance().logFailure(
        QStringLiteral("Import"), QStringLiteral("Import of %1 failed").arg(path), result.errorMessage);
    m_dialogs->showMessage(result.errorMessage, QStringLiteral("Import Failed"));
    return;
  }

  LOG_CAT(logging::LogLevel::Info,
          QStringLiteral("Import"),
          QStringLiteral("Imported %1 rows, %2 columns from %3")
              .arg(result.rows.size())
              .arg(result.columns.size())
              .arg(path));

  if (adoptWorkspace(std::make_unique<workspace::TableWorkspace>(result, path))) {
    m_services.recentFiles.addFile(path);
  }
}

void MainWindow::saveActiveWorkspace() {
  auto* notes = qobject_cast<workspace::NotesWorkspace*>(m_registry->activeWorkspace());
  if (notes == nullptr) {
    statusBar()->showMessage(QStringLiteral("Only notes can be saved"), 3000);
    return;
  }

  QString path = notes->filePath();
  if (path.isEmpty()) {
    const std::optional<QString> chosen = m_dialogs->saveFile(
        QStringLiteral("Save Notes"), {FileFilter{QStringLiteral("Text files"), {QStringLiteral("txt")}}});
    if (!chosen.has_value()) {
      return;
    }
    path = *chosen;
  }

  if (!notes->save(path)) {
    logging::Logger::instance().logFailure(kCategory, QStringLiteral("Saving notes failed"), notes->lastError());
    m_dialogs->showMessage(notes->lastError(), QStringLiteral("Save Failed"));
    return;
  }
  statusBar()->showMessage(QStringLiteral("Saved %1").arg(path), 3000);
}

void MainWindow::closeActiveWorkspace() {
  if (workspace::Workspace* active = m_registry->activeWorkspace()) {
    m_registry->closeWorkspace(active);
  }
}

void MainWindow::closeAllWorkspaces() {
  m_registry->closeAll();
}

bool MainWindow::adoptWorkspace(std::unique_ptr<workspace::Workspace> workspace) {
  workspace->setCloseGuard([this](workspace::Workspace& target, workspace::Workspace::CloseDecision decide) {
    decide(m_dialogs->confirmClose(target.title()));
  });

  if (!m_registry->addWorkspace(std::move(workspace))) {
    m_dialogs->showMessage(m_registry->lastError(), QStringLiteral("Workspaces"));
    return false;
  }
  updateStatus();
  return true;
}

void MainWindow::rebuildRecentFilesMenu() {
  if (m_recentMenu == nullptr) {
    return;
  }

  m_recentMenu->clear();
  const auto& files = m_services.recentFiles.files();
  if (files.empty()) {
    m_recentMenu->addAction(QStringLiteral("(empty)"))->setEnabled(false);
    return;
  }

  for (const config::RecentFile& file : files) {
    auto*         action = m_recentMenu->addAction(file.displayName);
    const QString path   = file.path;
    action->setToolTip(path);
    connect(action, &QAction::triggered, this, [this, path]() { importFile(path); });
  }
  m_recentMenu->addSeparator();
  connect(m_recentMenu->addAction(QStringLiteral("Clear Recent Files")), &QAction::triggered, this, [this]() {
    m_services.recentFiles.clear();
  });
}

void MainWindow::updateStatus() {
  if (m_statusLabel == nullptr) {
    return;
  }

  workspace::Workspace* active = m_registry->activeWorkspace();
  const QString         text   = QStringLiteral("%1 / %2 workspaces").arg(m_registry->count()).arg(m_registry->maxWorkspaces());
  m_statusLabel->setText(active == nullptr ? text : QStringLiteral("%1 | %2").arg(active->title(), text));

  if (m_saveAction != nullptr) {
    m_saveAction->setEnabled(qobject_cast<workspace::NotesWorkspace*>(active) != nullptr);
  }

  TableView* table = activeTableView();
  for (QAction* action :
       {m_copyAction, m_pasteAction, m_findAction, m_findNextAction, m_findPreviousAction, m_mapColumnsAction}) {
    if (action != nullptr) {
      action->setEnabled(table != nullptr);
    }
  }
  if (m_findDialog != nullptr) {
    m_findDialog->setSearch(table != nullptr ? &table->search() : nullptr);
  }
}

TableView* MainWindow::activeTableView() const {
  if (m_tabs == nullptr) {
    return nullptr;
  }
  return qobject_cast<TableView*>(m_tabs->viewFor(m_registry->activeWorkspace()));
}

void MainWindow::findAgain(bool forward) {
  if (m_findDialog == nullptr || !m_findDialog->isVisible()) {
    showFindDialog();
    return;
  }
  if (forward) {
    m_findDialog->findNext();
  } else {
    m_findDialog->findPrevious();
  }
}

void MainWindow::mapColumns() {
  auto* table = qobject_cast<workspace::TableWorkspace*>(m_registry->activeWorkspace());
  if (table == nullptr) {
    statusBar()->showMessage(QStringLiteral("Column roles apply to tables only"), 3000);
    return;
  }

  const std::optional<QHash<QString, QString>> chosen = ColumnRoleMapperDialog::getMapping(
      this,
      defaultColumnRoles(),
      table->table().columns,
      QStringLiteral("Choose the columns of %1 that hold each role.").arg(table->title()),
      table->columnRoles());
  if (!chosen.has_value()) {
    return;
  }

  table->setColumnRoles(*chosen);
  QStringList pairs;
  for (auto it = chosen->cbegin(); it != chosen->cend(); ++it) {
    pairs.push_back(QStringLiteral("%1=%2").arg(it.key(), it.value()));
  }
  pairs.sort();
  LOG_CAT(logging::LogLevel::Info, kCategory,
          QStringLiteral("Column roles for %1: %2").arg(table->title(), pairs.join(QStringLiteral(", "))));
}

}  // namespace deskkit::ui
