#pragma once

#include "deskkit/config/AppSettings.hpp"
#include "deskkit/config/RecentFiles.hpp"
#include "deskkit/logging/LogBuffer.hpp"
#include "deskkit/logging/LogRedactor.hpp"
#include "deskkit/logging/StreamCapture.hpp"

#include <QApplication>

#include <memory>

namespace deskkit::ui {
class MainWindow;
}

namespace deskkit::app {

class Application {
 public:
  Application(int& argc, char** argv);
  ~Application();

  int run();

 private:
  void routeCapturedOutput();

  QApplication                    m_qtApplication;
  config::AppSettings             m_settings;
  logging::LogRedactor            m_redactor;
  logging::LogBuffer              m_logBuffer;
  logging::StreamCapture          m_streamCapture;
  config::RecentFiles             m_recentFiles;
  std::unique_ptr<ui::MainWindow> m_mainWindow;
};

}  // namespace deskkit::app
