#include "deskkit/ui/SettingsWindow.hpp"

#include <QAbstractItemView>
#include <QCheckBox>
#include <QComboBox>
#include <QFont>
#include <QFrame>
#include <QGridLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QKeySequenceEdit>
#include <QLabel>
#include <QListWidget>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSpinBox>
#include <QStackedWidget>
#include <QVBoxLayout>
#include <QWidget>

namespace deskkit::ui {
namespace {

int keyPartCount(const QKeyCombination combo) {
  int                         partCount = 0;
  const Qt::KeyboardModifiers modifiers = combo.keyboardModifiers();
  for (const Qt::KeyboardModifier modifier :
       {Qt::ControlModifier, Qt::ShiftModifier, Qt::AltModifier, Qt::MetaModifier}) {
    if (modifiers.testFlag(modifier)) {
      ++partCount;
    }
  }
  if (combo.key() != Qt::Key_unknown) {
    ++partCount;
  }
  return partCount;
}

// Single chord, at most three parts; anything longer snaps back.
void configureKeybindEdit(QKeySequenceEdit* edit, QObject* owner) {
  edit->setMaximumSequenceLength(1);
  edit->setProperty("last_valid_sequence", QString());

  QObject::connect(edit, &QKeySequenceEdit::keySequenceChanged, owner, [edit](const QKeySequence& sequence) {
    const QSignalBlocker blocker(edit);

    if (sequence.isEmpty()) {
      edit->setProperty("last_valid_sequence", QString());
      return;
    }

    const QKeyCombination first    = sequence[0];
    const QString         previous = edit->property("last_valid_sequence").toString();

    if (keyPartCount(first) > 3) {
      edit->setKeySequence(previous.isEmpty() ? QKeySequence()
                                              : QKeySequence(previous, QKeySequence::PortableText));
      return;
    }

    const QKeySequence clamped(first);
    if (sequence != clamped) {
      edit->setKeySequence(clamped);
    }
    edit->setProperty("last_valid_sequence", clamped.toString(QKeySequence::PortableText));
  });
}

QKeySequenceEdit* addKeybindRow(QGridLayout* grid, QWidget* group, QObject* owner, const QString& label) {
  const int row = grid->rowCount();
  grid->addWidget(new QLabel(label, group), row, 0);
  auto* edit = new QKeySequenceEdit(group);
  configureKeybindEdit(edit, owner);
  grid->addWidget(edit, row, 1);
  return edit;
}

}  // namespace

SettingsWindow::SettingsWindow(QWidget* parent) : QDialog(parent) {
  setWindowTitle(QStringLiteral("DeskKit Settings"));
  setModal(false);
  setMinimumSize(720, 460);
  resize(800, 500);

  setStyleSheet(QStringLiteral(R"(
QDialog {
  background-color: #202328;
  color: #e6e8eb;
  font-size: 12px;
}
QFrame#settingsBody {
  background-color: #292c33;
  border: 1px solid #474b55;
}
QListWidget {
  background-color: #1a1c21;
  color: #c5cad3;
  border: 1px solid #474b55;
  outline: none;
}
QListWidget::item {
  padding: 6px 9px;
}
QListWidget::item:selected {
  background-color: #35598c;
  color: #ffffff;
}
QGroupBox {
  border: 1px solid #4c525d;
  margin-top: 10px;
  font-weight: 600;
  background-color: #24272f;
}
QGroupBox::title {
  subcontrol-origin: margin;
  left: 8px;
  padding: 0 4px;
}
QKeySequenceEdit, QSpinBox, QComboBox {
  background-color: #16181e;
  color: #eceff5;
  border: 1px solid #4b5364;
  padding: 3px;
  min-height: 22px;
}
QPushButton {
  background-color: #42464f;
  border: 1px solid #626773;
  color: #f0f2f5;
  border-radius: 2px;
  padding: 4px 14px;
  min-height: 24px;
}
QPushButton:hover {
  background-color: #50555f;
}
QPushButton:default {
  border: 1px solid #668ccb;
}
QLabel#sectionSubTitle {
  color: #aab2c0;
}
QLabel#captureWarning {
  color: #e0b15a;
}
QFrame#buttonSeparator {
  background-color: #4a4e58;
  min-height: 1px;
  max-height: 1px;
}
)"));

  auto* rootLayout = new QVBoxLayout(this);
  rootLayout->setContentsMargins(8, 8, 8, 8);
  rootLayout->setSpacing(8);

  auto* body = new QFrame(this);
  body->setObjectName(QStringLiteral("settingsBody"));
  auto* bodyLayout = new QHBoxLayout(body);
  bodyLayout->setContentsMargins(8, 8, 8, 8);
  bodyLayout->setSpacing(8);

  m_categoryList = new QListWidget(body);
  m_categoryList->setFixedWidth(190);
  m_categoryList->addItem(QStringLiteral("Hotkeys"));
  m_categoryList->addItem(QStringLiteral("Debug Console"));
  m_categoryList->addItem(QStringLiteral("Workspaces"));
  m_categoryList->setSelectionMode(QAbstractItemView::SingleSelection);
  bodyLayout->addWidget(m_categoryList);

  m_pages = new QStackedWidget(body);
  m_pages->addWidget(buildKeybindPage());
  m_pages->addWidget(buildConsolePage());
  m_pages->addWidget(buildWorkspacePage());
  bodyLayout->addWidget(m_pages, 1);

  rootLayout->addWidget(body, 1);

  auto* separator = new QFrame(this);
  separator->setObjectName(QStringLiteral("buttonSeparator"));
  rootLayout->addWidget(separator);

  auto* buttonsLayout = new QHBoxLayout();
  buttonsLayout->setContentsMargins(0, 0, 0, 0);
  buttonsLayout->addStretch(1);

  auto* defaultsButton = new QPushButton(QStringLiteral("Defaults"), this);
  auto* applyButton    = new QPushButton(QStringLiteral("Apply"), this);
  auto* cancelButton   = new QPushButton(QStringLiteral("Cancel"), this);
  auto* okButton       = new QPushButton(QStringLiteral("OK"), this);
  okButton->setDefault(true);
  okButton->setAutoDefault(true);

  buttonsLayout->addWidget(defaultsButton);
  buttonsLayout->addWidget(applyButton);
  buttonsLayout->addWidget(cancelButton);
  buttonsLayout->addWidget(okButton);
  rootLayout->addLayout(buttonsLayout);

  connect(m_categoryList, &QListWidget::currentRowChanged, m_pages, &QStackedWidget::setCurrentIndex);
  connect(cancelButton, &QPushButton::clicked, this, &QDialog::reject);
  connect(defaultsButton, &QPushButton::clicked, this, [this]() { setShellSettings(ShellSettings{}); });
  connect(applyButton, &QPushButton::clicked, this, [this]() { emit settingsSaved(shellSettings()); });
  connect(okButton, &QPushButton::clicked, this, [this]() {
    emit settingsSaved(shellSettings());
    accept();
  });

  m_categoryList->setCurrentRow(0);
  setShellSettings(ShellSettings{});
}

void SettingsWindow::setShellSettings(const ShellSettings& settings) {
  m_newNotesKeybind->setKeySequence(settings.keybinds.newNotes);
  m_openFileKeybind->setKeySequence(settings.keybinds.openFile);
  m_closeTabKeybind->setKeySequence(settings.keybinds.closeWorkspace);
  m_closeAllTabsKeybind->setKeySequence(settings.keybinds.closeAllWorkspaces);
  m_nextTabKeybind->setKeySequence(settings.keybinds.nextWorkspace);
  m_toggleConsoleKeybind->setKeySequence(settings.keybinds.toggleConsole);
  m_openSettingsKeybind->setKeySequence(settings.keybinds.openSettings);

  m_maxEntries->setValue(settings.console.maxEntries);
  const int levelIndex = m_minLevel->findData(static_cast<int>(settings.console.minLevel));
  m_minLevel->setCurrentIndex(levelIndex < 0 ? 0 : levelIndex);
  m_redactionEnabled->setChecked(settings.console.redactionEnabled);
  m_captureStdStreams->setChecked(settings.console.captureStdStreams);

  m_maxWorkspaces->setValue(settings.maxWorkspaces);
}

ShellSettings SettingsWindow::shellSettings() const {
  ShellSettings settings;

  settings.keybinds.newNotes           = m_newNotesKeybind->keySequence();
  settings.keybinds.openFile           = m_openFileKeybind->keySequence();
  settings.keybinds.closeWorkspace     = m_closeTabKeybind->keySequence();
  settings.keybinds.closeAllWorkspaces = m_closeAllTabsKeybind->keySequence();
  settings.keybinds.nextWorkspace      = m_nextTabKeybind->keySequence();
  settings.keybinds.toggleConsole      = m_toggleConsoleKeybind->keySequence();
  settings.keybinds.openSettings       = m_openSettingsKeybind->keySequence();

  settings.console.maxEntries        = m_maxEntries->value();
  settings.console.minLevel          = static_cast<logging::LogLevel>(m_minLevel->currentData().toInt());
  settings.console.redactionEnabled  = m_redactionEnabled->isChecked();
  settings.console.captureStdStreams = m_captureStdStreams->isChecked();

  settings.maxWorkspaces = m_maxWorkspaces->value();
  return settings;
}

QWidget* SettingsWindow::buildPageHeader(QWidget* page, const QString& title, const QString& subtitle) {
  auto* header = new QWidget(page);
  auto* layout = new QVBoxLayout(header);
  layout->setContentsMargins(0, 0, 0, 0);
  layout->setSpacing(4);

  auto* titleLabel = new QLabel(title, header);
  QFont titleFont  = titleLabel->font();
  titleFont.setBold(true);
  titleFont.setPointSize(15);
  titleLabel->setFont(titleFont);
  layout->addWidget(titleLabel);

  auto* subtitleLabel = new QLabel(subtitle, header);
  subtitleLabel->setObjectName(QStringLiteral("sectionSubTitle"));
  subtitleLabel->setWordWrap(true);
  layout->addWidget(subtitleLabel);
  return header;
}

QWidget* SettingsWindow::buildKeybindPage() {
  auto* page   = new QWidget(this);
  auto* layout = new QVBoxLayout(page);
  layout->setContentsMargins(8, 8, 8, 8);
  layout->setSpacing(6);
  layout->addWidget(buildPageHeader(page,
                                    QStringLiteral("Hotkeys"),
                                    QStringLiteral("Shortcuts for files, tabs and tool windows.")));

  auto* group = new QGroupBox(QStringLiteral("Keyboard Shortcuts"), page);
  auto* grid  = new QGridLayout(group);
  grid->setContentsMargins(10, 10, 10, 10);
  grid->setHorizontalSpacing(12);
  grid->setVerticalSpacing(8);

  m_newNotesKeybind      = addKeybindRow(grid, group, this, QStringLiteral("New Notes"));
  m_openFileKeybind      = addKeybindRow(grid, group, this, QStringLiteral("Open File"));
  m_closeTabKeybind      = addKeybindRow(grid, group, this, QStringLiteral("Close Tab"));
  m_closeAllTabsKeybind  = addKeybindRow(grid, group, this, QStringLiteral("Close All Tabs"));
  m_nextTabKeybind       = addKeybindRow(grid, group, this, QStringLiteral("Next Tab"));
  m_toggleConsoleKeybind = addKeybindRow(grid, group, this, QStringLiteral("Debug Console"));
  m_openSettingsKeybind  = addKeybindRow(grid, group, this, QStringLiteral("Settings"));

  grid->setColumnStretch(0, 0);
  grid->setColumnStretch(1, 1);

  layout->addWidget(group);
  layout->addStretch(1);
  return page;
}

QWidget* SettingsWindow::buildConsolePage() {
  auto* page   = new QWidget(this);
  auto* layout = new QVBoxLayout(page);
  layout->setContentsMargins(8, 8, 8, 8);
  layout->setSpacing(6);
  layout->addWidget(buildPageHeader(page,
                                    QStringLiteral("Debug Console"),
                                    QStringLiteral("Log buffer size, minimum level and redaction.")));

  auto* group = new QGroupBox(QStringLiteral("Log Buffer"), page);
  auto* grid  = new QGridLayout(group);
  grid->setContentsMargins(10, 10, 10, 10);
  grid->setHorizontalSpacing(12);
  grid->setVerticalSpacing(8);

  grid->addWidget(new QLabel(QStringLiteral("Max entries"), group), 0, 0);
  m_maxEntries = new QSpinBox(group);
  m_maxEntries->setRange(config::ConsoleSettings::kMinEntries, config::ConsoleSettings::kMaxEntries);
  m_maxEntries->setSingleStep(1000);
  grid->addWidget(m_maxEntries, 0, 1);

  grid->addWidget(new QLabel(QStringLiteral("Minimum level"), group), 1, 0);
  m_minLevel = new QComboBox(group);
  for (const logging::LogLevel level : {logging::LogLevel::Trace,
                                        logging::LogLevel::Debug,
                                        logging::LogLevel::Info,
                                        logging::LogLevel::Warning,
                                        logging::LogLevel::Error,
                                        logging::LogLevel::Critical}) {
    m_minLevel->addItem(logging::levelName(level), static_cast<int>(level));
  }
  grid->addWidget(m_minLevel, 1, 1);

  m_redactionEnabled = new QCheckBox(QStringLiteral("Redact passwords, tokens and card numbers"), group);
  grid->addWidget(m_redactionEnabled, 2, 0, 1, 2);

  m_captureStdStreams = new QCheckBox(QStringLiteral("Capture stdout / stderr"), group);
  grid->addWidget(m_captureStdStreams, 3, 0, 1, 2);

  auto* warning = new QLabel(QStringLiteral("Everything the process prints will be recorded in the debug console."), group);
  warning->setObjectName(QStringLiteral("captureWarning"));
  warning->setVisible(false);
  grid->addWidget(warning, 4, 0, 1, 2);
  connect(m_captureStdStreams, &QCheckBox::toggled, warning, &QLabel::setVisible);

  grid->setColumnStretch(1, 1);
  layout->addWidget(group);
  layout->addStretch(1);
  return page;
}

QWidget* SettingsWindow::buildWorkspacePage() {
  auto* page   = new QWidget(this);
  auto* layout = new QVBoxLayout(page);
  layout->setContentsMargins(8, 8, 8, 8);
  layout->setSpacing(6);
  layout->addWidget(
      buildPageHeader(page, QStringLiteral("Workspaces"), QStringLiteral("Limits for open tabs.")));

  auto* group = new QGroupBox(QStringLiteral("Tabs"), page);
  auto* grid  = new QGridLayout(group);
  grid->setContentsMargins(10, 10, 10, 10);
  grid->setHorizontalSpacing(12);

  grid->addWidget(new QLabel(QStringLiteral("Maximum open workspaces"), group), 0, 0);
  m_maxWorkspaces = new QSpinBox(group);
  m_maxWorkspaces->setRange(1, config::AppSettings::kMaxWorkspaceLimit);
  grid->addWidget(m_maxWorkspaces, 0, 1);
  grid->setColumnStretch(1, 1);

  layout->addWidget(group);
  layout->addStretch(1);
  return page;
}

}  // namespace deskkit::ui
