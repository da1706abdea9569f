#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QString>

#include <optional>

namespace deskkit::logging {

enum class LogLevel {
  Trace = 0,
  Debug,
  Info,
  Warning,
  Error,
  Critical
};

struct LogEntry {
  QDateTime              timestamp;
  LogLevel               level = LogLevel::Info;
  QString                category;
  QString                message;
  std::optional<QString> failure;

  static LogEntry now(LogLevel level, const QString& category, const QString& message);
};

// Three-letter tag used in formatted output (TRC, DBG, INF, WRN, ERR, CRT).
[[nodiscard]] QString levelTag(LogLevel level);
[[nodiscard]] QString levelName(LogLevel level);
[[nodiscard]] std::optional<LogLevel> levelFromName(const QString& name);

// "[HH:mm:ss] [LEV] Category: Message", failure detail on the following line.
[[nodiscard]] QString formatEntry(const LogEntry& entry);

}  // namespace deskkit::logging

Q_DECLARE_METATYPE(deskkit::logging::LogEntry)
