#pragma once

#include "deskkit/ui/SettingsTypes.hpp"

#include <QDialog>

class QCheckBox;
class QComboBox;
class QKeySequenceEdit;
class QListWidget;
class QSpinBox;
class QStackedWidget;

namespace deskkit::ui {

class SettingsWindow final : public QDialog {
  Q_OBJECT

 public:
  explicit SettingsWindow(QWidget* parent = nullptr);

  void                        setShellSettings(const ShellSettings& settings);
  [[nodiscard]] ShellSettings shellSettings() const;

 signals:
  void settingsSaved(const deskkit::ui::ShellSettings& settings);

 private:
  QWidget* buildKeybindPage();
  QWidget* buildConsolePage();
  QWidget* buildWorkspacePage();
  QWidget* buildPageHeader(QWidget* page, const QString& title, const QString& subtitle);

  QListWidget*    m_categoryList = nullptr;
  QStackedWidget* m_pages        = nullptr;

  QKeySequenceEdit* m_newNotesKeybind       = nullptr;
  QKeySequenceEdit* m_openFileKeybind       = nullptr;
  QKeySequenceEdit* m_closeTabKeybind       = nullptr;
  QKeySequenceEdit* m_closeAllTabsKeybind   = nullptr;
  QKeySequenceEdit* m_nextTabKeybind        = nullptr;
  QKeySequenceEdit* m_toggleConsoleKeybind  = nullptr;
  QKeySequenceEdit* m_openSettingsKeybind   = nullptr;

  QSpinBox*  m_maxEntries        = nullptr;
  QComboBox* m_minLevel          = nullptr;
  QCheckBox* m_redactionEnabled  = nullptr;
  QCheckBox* m_captureStdStreams = nullptr;

  QSpinBox* m_maxWorkspaces = nullptr;
};

}  // namespace deskkit::ui
