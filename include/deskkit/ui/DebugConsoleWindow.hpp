#pragma once

#include "deskkit/logging/LogTypes.hpp"

#include <QMainWindow>
#include <QString>

#include <deque>

class QCheckBox;
class QComboBox;
class QLabel;
class QPlainTextEdit;
class QPushButton;

namespace deskkit::logging {
class LogBuffer;
class StreamCapture;
}  // namespace deskkit::logging

namespace deskkit::ui {

// Live view of a LogBuffer. The level filter only affects what is shown;
// the buffer keeps everything at or above its own minimum level.
class DebugConsoleWindow final : public QMainWindow {
  Q_OBJECT

 public:
  DebugConsoleWindow(logging::LogBuffer& buffer, logging::StreamCapture* capture, QWidget* parent = nullptr);
  ~DebugConsoleWindow() override = default;

  // Re-reads the buffer after its limits or redaction changed.
  void refresh();

  [[nodiscard]] int shownCount() const noexcept;

 private:
  void applyTheme();
  void configureWindow();

  void appendEntry(const logging::LogEntry& entry);
  void rebuildView();
  void dropEvictedEntries();
  void updateCounts();
  void updateCaptureState(bool capturing);
  [[nodiscard]] bool isShown(const logging::LogEntry& entry) const;

  logging::LogBuffer&     m_buffer;
  logging::StreamCapture* m_capture = nullptr;

  QPlainTextEdit* m_logText        = nullptr;
  QComboBox*      m_levelFilter    = nullptr;
  QCheckBox*      m_autoScroll     = nullptr;
  QCheckBox*      m_captureToggle  = nullptr;
  QLabel*         m_captureWarning = nullptr;
  QLabel*         m_countLabel     = nullptr;
  QPushButton*    m_clearButton    = nullptr;
  QPushButton*    m_copyRedacted   = nullptr;
  QPushButton*    m_copyFull       = nullptr;
  int             m_shownCount     = 0;

  // Lines each buffered entry occupies in the view, 0 when filtered out.
  std::deque<int> m_entryLines;
};

}  // namespace deskkit::ui
