#include "deskkit/logging/LogBuffer.hpp"
#include "deskkit/logging/LogRedactor.hpp"

#include <QMutexLocker>
#include <QStringList>

#include <algorithm>

namespace deskkit::logging {

LogBuffer::LogBuffer(LogRedactor* redactor, QObject* parent) : QObject(parent), m_redactor(redactor) {
  qRegisterMetaType<deskkit::logging::LogEntry>();

  if (m_redactor == nullptr) {
    m_ownedRedactor = std::make_unique<LogRedactor>();
    m_redactor      = m_ownedRedactor.get();
  }
}

LogBuffer::~LogBuffer() = default;

void LogBuffer::addEntry(const LogEntry& entry) {
  LogEntry stored = entry;
  {
    QMutexLocker locker(&m_mutex);
    if (stored.level < m_minLevel) {
      return;
    }

    if (m_redactionEnabled) {
      stored.message = m_redactor->redact(stored.message);
    }

    m_entries.push_back(stored);
    trimLocked();
  }

  emit entryAdded(stored);
}

std::vector<LogEntry> LogBuffer::entries(bool redacted) const {
  QMutexLocker locker(&m_mutex);

  std::vector<LogEntry> snapshot(m_entries.begin(), m_entries.end());
  if (redacted || !m_redactionEnabled) {
    return snapshot;
  }

  // Stored text is the ingest-time text; the original is not kept.
  for (auto& entry : snapshot) {
    entry.message = m_redactor->redact(entry.message);
  }
  return snapshot;
}

QString LogBuffer::logsAsText(bool redacted) const {
  const std::vector<LogEntry> snapshot = entries(redacted);

  QStringList lines;
  lines.reserve(static_cast<int>(snapshot.size()));
  for (const auto& entry : snapshot) {
    lines.append(formatEntry(entry));
  }
  return lines.join(QLatin1Char('\n'));
}

void LogBuffer::clear() {
  {
    QMutexLocker locker(&m_mutex);
    m_entries.clear();
  }
  emit cleared();
}

std::size_t LogBuffer::size() const {
  QMutexLocker locker(&m_mutex);
  return m_entries.size();
}

std::size_t LogBuffer::evictedCount() const {
  QMutexLocker locker(&m_mutex);
  return m_evictedCount;
}

void LogBuffer::setMaxEntries(std::size_t maxEntries) {
  QMutexLocker locker(&m_mutex);
  m_maxEntries = (std::max)(maxEntries, std::size_t{1});
  trimLocked();
}

std::size_t LogBuffer::maxEntries() const {
  QMutexLocker locker(&m_mutex);
  return m_maxEntries;
}

void LogBuffer::setMinLevel(LogLevel level) {
  QMutexLocker locker(&m_mutex);
  m_minLevel = level;
}

LogLevel LogBuffer::minLevel() const {
  QMutexLocker locker(&m_mutex);
  return m_minLevel;
}

void LogBuffer::setRedactionEnabled(bool enabled) {
  QMutexLocker locker(&m_mutex);
  m_redactionEnabled = enabled;
}

bool LogBuffer::redactionEnabled() const {
  QMutexLocker locker(&m_mutex);
  return m_redactionEnabled;
}

LogRedactor& LogBuffer::redactor() noexcept {
  return *m_redactor;
}

void LogBuffer::trimLocked() {
  while (m_entries.size() > m_maxEntries) {
    m_entries.pop_front();
    ++m_evictedCount;
  }
}

}  // namespace deskkit::logging
