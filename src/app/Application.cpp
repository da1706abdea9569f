#include "deskkit/app/Application.hpp"

#include "deskkit/logging/Logger.hpp"
#include "deskkit/ui/MainWindow.hpp"

namespace deskkit::app {

Application::Application(int& argc, char** argv)
    : m_qtApplication(argc, argv), m_logBuffer(&m_redactor) {
  QApplication::setApplicationName(QStringLiteral("DeskKit"));
  QApplication::setApplicationVersion(QStringLiteral("1.0.0"));

  logging::Logger::instance().setBuffer(&m_logBuffer);
  logging::Logger::instance().installQtMessageHandler();
  routeCapturedOutput();

  m_settings.load();
  m_recentFiles.load();
  if (m_settings.isFirstRun()) {
    LOG_INFO(QStringLiteral("First run, settings at %1").arg(m_settings.filePath()));
    m_settings.markFirstRunComplete();
    m_settings.save();
  }

  m_mainWindow = std::make_unique<ui::MainWindow>(
      ui::ShellServices{m_settings, m_recentFiles, m_logBuffer, m_streamCapture});
  m_mainWindow->applyConsoleSettings();
  LOG_INFO(QStringLiteral("DeskKit started"));
}

Application::~Application() {
  m_mainWindow.reset();
  m_streamCapture.stopCapture();
  logging::Logger::instance().uninstallQtMessageHandler();
  logging::Logger::instance().setBuffer(nullptr);
}

int Application::run() {
  m_mainWindow->show();
  return m_qtApplication.exec();
}

// Queued so a line written while the buffer is logging is recorded after it.
void Application::routeCapturedOutput() {
  QObject::connect(&m_streamCapture,
                   &logging::StreamCapture::outputCaptured,
                   &m_logBuffer,
                   [](const QString& text, bool isError) {
                     if (isError) {
                       LOG_CAT(logging::LogLevel::Warning, QStringLiteral("stderr"), text);
                     } else {
                       LOG_CAT(logging::LogLevel::Info, QStringLiteral("stdout"), text);
                     }
                   },
                   Qt::QueuedConnection);
}

}  // namespace deskkit::app
