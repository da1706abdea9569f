#include "deskkit/logging/Logger.hpp"
#include "deskkit/logging/LogBuffer.hpp"

namespace deskkit::logging {
namespace {

LogLevel levelFromQtType(QtMsgType type) {
  switch (type) {
    case QtDebugMsg:
      return LogLevel::Debug;
    case QtInfoMsg:
      return LogLevel::Info;
    case QtWarningMsg:
      return LogLevel::Warning;
    case QtCriticalMsg:
      return LogLevel::Error;
    case QtFatalMsg:
      return LogLevel::Critical;
  }
  return LogLevel::Info;
}

}  // namespace

Logger& Logger::instance() {
  static Logger instance;
  return instance;
}

void Logger::setBuffer(LogBuffer* buffer) {
  m_buffer.store(buffer);
}

LogBuffer* Logger::buffer() const {
  return m_buffer.load();
}

void Logger::log(LogLevel level, const QString& category, const QString& message) {
  if (auto* buffer = m_buffer.load(); buffer != nullptr) {
    buffer->addEntry(LogEntry::now(level, category, message));
  }
}

void Logger::logFailure(const QString& category, const QString& message, const QString& detail) {
  if (auto* buffer = m_buffer.load(); buffer != nullptr) {
    LogEntry entry = LogEntry::now(LogLevel::Error, category, message);
    entry.failure  = detail;
    buffer->addEntry(entry);
  }
}

void Logger::installQtMessageHandler() {
  if (m_handlerInstalled) {
    return;
  }
  m_previousHandler  = qInstallMessageHandler(&Logger::handleQtMessage);
  m_handlerInstalled = true;
}

void Logger::uninstallQtMessageHandler() {
  if (!m_handlerInstalled) {
    return;
  }
  qInstallMessageHandler(m_previousHandler);
  m_previousHandler  = nullptr;
  m_handlerInstalled = false;
}

void Logger::handleQtMessage(QtMsgType type, const QMessageLogContext& context, const QString& message) {
  Logger& logger = instance();

  const QString category = (context.category == nullptr || qstrcmp(context.category, "default") == 0)
                               ? QStringLiteral("Qt")
                               : QString::fromLatin1(context.category);
  logger.log(levelFromQtType(type), category, message);

  if (logger.m_previousHandler != nullptr) {
    logger.m_previousHandler(type, context, message);
  }
}

}  // namespace deskkit::logging
