#pragma once

#include "deskkit/logging/LogTypes.hpp"

#include <QString>
#include <QtGlobal>

#include <atomic>

namespace deskkit::logging {
class LogBuffer;

class Logger {
 public:
  static Logger& instance();

  void       setBuffer(LogBuffer* buffer);
  LogBuffer* buffer() const;

  void log(LogLevel level, const QString& category, const QString& message);
  void logFailure(const QString& category, const QString& message, const QString& detail);

  // Routes qDebug()/qWarning()/... into the buffer and chains to the handler
  // that was installed before.
  void installQtMessageHandler();
  void uninstallQtMessageHandler();

 private:
  Logger()                         = default;
  ~Logger()                        = default;
  Logger(const Logger&)            = delete;
  Logger& operator=(const Logger&) = delete;

  static void handleQtMessage(QtMsgType type, const QMessageLogContext& context, const QString& message);

  std::atomic<LogBuffer*> m_buffer{nullptr};
  QtMessageHandler        m_previousHandler = nullptr;
  bool                    m_handlerInstalled = false;
};

// Convenience macros
#define LOG_CAT(level, category, msg) \
  deskkit::logging::Logger::instance().log(level, category, QString(msg))
#define LOG_TRACE(msg) LOG_CAT(deskkit::logging::LogLevel::Trace, QStringLiteral("App"), msg)
#define LOG_DEBUG(msg) LOG_CAT(deskkit::logging::LogLevel::Debug, QStringLiteral("App"), msg)
#define LOG_INFO(msg) LOG_CAT(deskkit::logging::LogLevel::Info, QStringLiteral("App"), msg)
#define LOG_WARNING(msg) LOG_CAT(deskkit::logging::LogLevel::Warning, QStringLiteral("App"), msg)
#define LOG_ERROR(msg) LOG_CAT(deskkit::logging::LogLevel::Error, QStringLiteral("App"), msg)
#define LOG_CRITICAL(msg) LOG_CAT(deskkit::logging::LogLevel::Critical, QStringLiteral("App"), msg)

}  // namespace deskkit::logging
