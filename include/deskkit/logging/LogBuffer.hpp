#pragma once

#include "deskkit/logging/LogTypes.hpp"

#include <QMutex>
#include <QObject>
#include <QString>

#include <cstddef>
#include <deque>
#include <memory>
#include <vector>

namespace deskkit::logging {

class LogRedactor;

// In-memory sink behind the debug console. Any thread may call addEntry();
// entryAdded is emitted on the calling thread and reaches UI receivers through
// a queued connection.
class LogBuffer final : public QObject {
  Q_OBJECT

 public:
  static constexpr std::size_t kDefaultMaxEntries = 10000;

  // A null redactor makes the buffer own one with the default rule set.
  explicit LogBuffer(LogRedactor* redactor = nullptr, QObject* parent = nullptr);
  ~LogBuffer() override;

  void addEntry(const LogEntry& entry);

  [[nodiscard]] std::vector<LogEntry> entries(bool redacted = true) const;
  [[nodiscard]] QString               logsAsText(bool redacted = true) const;
  void                                clear();

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t evictedCount() const;

  void                      setMaxEntries(std::size_t maxEntries);
  [[nodiscard]] std::size_t maxEntries() const;
  void                      setMinLevel(LogLevel level);
  [[nodiscard]] LogLevel    minLevel() const;
  void                      setRedactionEnabled(bool enabled);
  [[nodiscard]] bool        redactionEnabled() const;

  [[nodiscard]] LogRedactor& redactor() noexcept;

 signals:
  void entryAdded(const deskkit::logging::LogEntry& entry);
  void cleared();

 private:
  void trimLocked();

  std::unique_ptr<LogRedactor> m_ownedRedactor;
  LogRedactor*                 m_redactor = nullptr;

  mutable QMutex       m_mutex;
  std::deque<LogEntry> m_entries;
  std::size_t          m_maxEntries       = kDefaultMaxEntries;
  std::size_t          m_evictedCount     = 0;
  LogLevel             m_minLevel         = LogLevel::Debug;
  bool                 m_redactionEnabled = true;
};

}  // namespace deskkit::logging
