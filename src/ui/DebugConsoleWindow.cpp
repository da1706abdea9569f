#include "deskkit/ui/DebugConsoleWindow.hpp"

#include "deskkit/logging/LogBuffer.hpp"
#include "deskkit/logging/StreamCapture.hpp"

#include <QCheckBox>
#include <QClipboard>
#include <QComboBox>
#include <QGuiApplication>
#include <QHBoxLayout>
#include <QLabel>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QScrollBar>
#include <QSignalBlocker>
#include <QTextCursor>
#include <QTextDocument>
#include <QVBoxLayout>
#include <QWidget>

namespace deskkit::ui {
namespace {

int lineCount(const QString& text) {
  return static_cast<int>(text.count(QLatin1Char('\n'))) + 1;
}

}  // namespace

DebugConsoleWindow::DebugConsoleWindow(logging::LogBuffer&     buffer,
                                       logging::StreamCapture* capture,
                                       QWidget*                parent)
    : QMainWindow(parent), m_buffer(buffer), m_capture(capture) {
  applyTheme();
  configureWindow();

  connect(&m_buffer, &logging::LogBuffer::entryAdded, this, &DebugConsoleWindow::appendEntry);
  connect(&m_buffer, &logging::LogBuffer::cleared, this, &DebugConsoleWindow::rebuildView);
  if (m_capture != nullptr) {
    connect(m_capture, &logging::StreamCapture::captureStateChanged, this, &DebugConsoleWindow::updateCaptureState);
  }

  rebuildView();
  updateCaptureState(m_capture != nullptr && m_capture->isCapturing());
}

void DebugConsoleWindow::applyTheme() {
  setStyleSheet(QStringLiteral(R"(QMainWindow {
  background-color: #202328;
  color: #e6e8eb;
}
QPlainTextEdit {
  background-color: #181a1f;
  color: #e6e8eb;
  border: 1px solid #474b55;
  font-family: 'Consolas', 'DejaVu Sans Mono', monospace;
  font-size: 9pt;
}
QLabel#captureWarning {
  color: #e0b15a;
}
QPushButton {
  background-color: #42464f;
  border: 1px solid #626773;
  border-radius: 4px;
  color: #f0f2f5;
  padding: 4px 10px;
}
QPushButton:hover {
  background-color: #50555f;
})"));
}

void DebugConsoleWindow::configureWindow() {
  setWindowTitle(QStringLiteral("Debug Console"));
  resize(860, 600);

  auto* central = new QWidget(this);
  auto* layout  = new QVBoxLayout(central);
  layout->setContentsMargins(10, 10, 10, 10);
  layout->setSpacing(8);

  auto* filterRow = new QHBoxLayout();
  filterRow->addWidget(new QLabel(QStringLiteral("Show:"), central));
  m_levelFilter = new QComboBox(central);
  for (const logging::LogLevel level : {logging::LogLevel::Trace,
                                        logging::LogLevel::Debug,
                                        logging::LogLevel::Info,
                                        logging::LogLevel::Warning,
                                        logging::LogLevel::Error,
                                        logging::LogLevel::Critical}) {
    m_levelFilter->addItem(logging::levelName(level), static_cast<int>(level));
  }
  filterRow->addWidget(m_levelFilter);

  m_autoScroll = new QCheckBox(QStringLiteral("Auto-scroll"), central);
  m_autoScroll->setChecked(true);
  filterRow->addWidget(m_autoScroll);

  m_captureToggle = new QCheckBox(QStringLiteral("Capture stdout/stderr"), central);
  m_captureToggle->setEnabled(m_capture != nullptr);
  filterRow->addWidget(m_captureToggle);

  filterRow->addStretch();
  m_countLabel = new QLabel(central);
  filterRow->addWidget(m_countLabel);
  layout->addLayout(filterRow);

  m_captureWarning = new QLabel(
      QStringLiteral("Capturing process output. Anything printed to stdout/stderr is recorded here."), central);
  m_captureWarning->setObjectName(QStringLiteral("captureWarning"));
  m_captureWarning->setVisible(false);
  layout->addWidget(m_captureWarning);

  m_logText = new QPlainTextEdit(central);
  m_logText->setReadOnly(true);
  m_logText->setLineWrapMode(QPlainTextEdit::NoWrap);
  layout->addWidget(m_logText, 1);

  auto* buttonLayout = new QHBoxLayout();
  buttonLayout->addStretch();

  m_copyRedacted = new QPushButton(QStringLiteral("Copy Redacted"), central);
  m_copyFull     = new QPushButton(QStringLiteral("Copy Full"), central);
  m_clearButton  = new QPushButton(QStringLiteral("Clear"), central);
  buttonLayout->addWidget(m_copyRedacted);
  buttonLayout->addWidget(m_copyFull);
  buttonLayout->addWidget(m_clearButton);
  layout->addLayout(buttonLayout);

  setCentralWidget(central);

  connect(m_levelFilter, &QComboBox::currentIndexChanged, this, [this](int) { rebuildView(); });
  connect(m_clearButton, &QPushButton::clicked, this, [this]() { m_buffer.clear(); });
  connect(m_copyRedacted, &QPushButton::clicked, this, [this]() {
    QGuiApplication::clipboard()->setText(m_buffer.logsAsText(true));
  });
  connect(m_copyFull, &QPushButton::clicked, this, [this]() {
    QGuiApplication::clipboard()->setText(m_buffer.logsAsText(false));
  });
  connect(m_captureToggle, &QCheckBox::toggled, this, [this](bool enabled) {
    if (m_capture == nullptr) {
      return;
    }
    if (enabled) {
      m_capture->startCapture();
    } else {
      m_capture->stopCapture();
    }
  });
}

void DebugConsoleWindow::refresh() {
  rebuildView();
}

int DebugConsoleWindow::shownCount() const noexcept {
  return m_shownCount;
}

bool DebugConsoleWindow::isShown(const logging::LogEntry& entry) const {
  return static_cast<int>(entry.level) >= m_levelFilter->currentData().toInt();
}

void DebugConsoleWindow::appendEntry(const logging::LogEntry& entry) {
  if (isShown(entry)) {
    const QString text = logging::formatEntry(entry);
    m_logText->appendPlainText(text);
    m_entryLines.push_back(lineCount(text));
    ++m_shownCount;

    if (m_autoScroll->isChecked()) {
      QScrollBar* bar = m_logText->verticalScrollBar();
      bar->setValue(bar->maximum());
    }
  } else {
    m_entryLines.push_back(0);
  }
  dropEvictedEntries();
  updateCounts();
}

void DebugConsoleWindow::dropEvictedEntries() {
  const std::size_t buffered = m_buffer.size();
  int               lines    = 0;
  while (m_entryLines.size() > buffered) {
    if (m_entryLines.front() > 0) {
      lines += m_entryLines.front();
      --m_shownCount;
    }
    m_entryLines.pop_front();
  }
  if (lines == 0) {
    return;
  }

  // Evicted entries are always the oldest, at the top of the view.
  QTextCursor cursor(m_logText->document());
  cursor.movePosition(QTextCursor::Start);
  if (!cursor.movePosition(QTextCursor::NextBlock, QTextCursor::KeepAnchor, lines)) {
    cursor.movePosition(QTextCursor::End, QTextCursor::KeepAnchor);
  }
  cursor.removeSelectedText();
}

void DebugConsoleWindow::rebuildView() {
  m_logText->clear();
  m_shownCount = 0;
  m_entryLines.clear();

  QStringList lines;
  for (const logging::LogEntry& entry : m_buffer.entries()) {
    if (isShown(entry)) {
      const QString text = logging::formatEntry(entry);
      lines.push_back(text);
      m_entryLines.push_back(lineCount(text));
      ++m_shownCount;
    } else {
      m_entryLines.push_back(0);
    }
  }
  if (!lines.isEmpty()) {
    m_logText->setPlainText(lines.join(QLatin1Char('\n')));
  }
  if (m_autoScroll->isChecked()) {
    QScrollBar* bar = m_logText->verticalScrollBar();
    bar->setValue(bar->maximum());
  }
  updateCounts();
}

void DebugConsoleWindow::updateCounts() {
  QString text = QStringLiteral("%1 shown / %2 buffered").arg(m_shownCount).arg(m_buffer.size());
  if (const std::size_t evicted = m_buffer.evictedCount(); evicted > 0) {
    text += QStringLiteral(" (%1 dropped)").arg(evicted);
  }
  if (!m_buffer.redactionEnabled()) {
    text += QStringLiteral(" - redaction off");
  }
  m_countLabel->setText(text);
}

void DebugConsoleWindow::updateCaptureState(bool capturing) {
  const QSignalBlocker blocker(m_captureToggle);
  m_captureToggle->setChecked(capturing);
  m_captureWarning->setVisible(capturing);
}

}  // namespace deskkit::ui
