#include "deskkit/logging/LogTypes.hpp"

#include <array>

namespace deskkit::logging {
namespace {

struct LevelInfo {
  LogLevel    level;
  const char* tag;
  const char* name;
};

constexpr std::array<LevelInfo, 6> kLevels = {{
    {LogLevel::Trace, "TRC", "Trace"},
    {LogLevel::Debug, "DBG", "Debug"},
    {LogLevel::Info, "INF", "Info"},
    {LogLevel::Warning, "WRN", "Warning"},
    {LogLevel::Error, "ERR", "Error"},
    {LogLevel::Critical, "CRT", "Critical"},
}};

}  // namespace

LogEntry LogEntry::now(LogLevel level, const QString& category, const QString& message) {
  LogEntry entry;
  entry.timestamp = QDateTime::currentDateTime();
  entry.level     = level;
  entry.category  = category;
  entry.message   = message;
  return entry;
}

QString levelTag(LogLevel level) {
  for (const auto& info : kLevels) {
    if (info.level == level) {
      return QString::fromLatin1(info.tag);
    }
  }
  return QStringLiteral("???");
}

QString levelName(LogLevel level) {
  for (const auto& info : kLevels) {
    if (info.level == level) {
      return QString::fromLatin1(info.name);
    }
  }
  return {};
}

std::optional<LogLevel> levelFromName(const QString& name) {
  const QString trimmed = name.trimmed();
  for (const auto& info : kLevels) {
    if (trimmed.compare(QLatin1String(info.name), Qt::CaseInsensitive) == 0
        || trimmed.compare(QLatin1String(info.tag), Qt::CaseInsensitive) == 0) {
      return info.level;
    }
  }
  return std::nullopt;
}

QString formatEntry(const LogEntry& entry) {
  QString line = QStringLiteral("[%1] [%2] %3: %4")
                     .arg(entry.timestamp.toString(QStringLiteral("HH:mm:ss")),
                          levelTag(entry.level),
                          entry.category,
                          entry.message);
  if (entry.failure.has_value()) {
    line += QLatin1Char('\n');
    line += *entry.failure;
  }
  return line;
}

}  // namespace deskkit::logging
