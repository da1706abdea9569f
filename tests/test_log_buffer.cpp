#include "deskkit/logging/LogBuffer.hpp"
#include "deskkit/logging/LogRedactor.hpp"

#include <QSignalSpy>
#include <QtTest>

#include <thread>
#include <vector>

using deskkit::logging::LogBuffer;
using deskkit::logging::LogEntry;
using deskkit::logging::LogLevel;
using deskkit::logging::LogRedactor;

namespace {

LogEntry entry(const QString& message, LogLevel level = LogLevel::Info) {
  return LogEntry::now(level, QStringLiteral("Test"), message);
}

QStringList messages(const std::vector<LogEntry>& entries) {
  QStringList result;
  for (const auto& e : entries) {
    result.append(e.message);
  }
  return result;
}

}  // namespace

class LogBufferTest : public QObject {
  Q_OBJECT

 private slots:
  void evictsOldestFirst();
  void loweringMaxEntriesTrims();
  void dropsEntriesBelowMinLevel();
  void redactsOnIngest();
  void unredactedRequestIsReRedacted();
  void redactionCanBeDisabled();
  void signalCarriesStoredEntry();
  void formatsText();
  void clearKeepsConfiguration();
  void concurrentWritersRespectCapacity();
};

void LogBufferTest::evictsOldestFirst() {
  LogBuffer buffer;
  buffer.setMaxEntries(3);

  for (const char* message : {"A", "B", "C", "D"}) {
    buffer.addEntry(entry(QString::fromLatin1(message)));
  }

  QCOMPARE(messages(buffer.entries()), (QStringList{"B", "C", "D"}));
  QCOMPARE(buffer.size(), std::size_t{3});
  QCOMPARE(buffer.evictedCount(), std::size_t{1});
}

void LogBufferTest::loweringMaxEntriesTrims() {
  LogBuffer buffer;
  for (int i = 0; i < 10; ++i) {
    buffer.addEntry(entry(QString::number(i)));
  }

  buffer.setMaxEntries(4);
  QCOMPARE(messages(buffer.entries()), (QStringList{"6", "7", "8", "9"}));

  buffer.setMaxEntries(0);
  QCOMPARE(buffer.maxEntries(), std::size_t{1});
  QCOMPARE(messages(buffer.entries()), QStringList{"9"});
}

void LogBufferTest::dropsEntriesBelowMinLevel() {
  LogBuffer  buffer;
  QSignalSpy spy(&buffer, &LogBuffer::entryAdded);
  buffer.setMinLevel(LogLevel::Warning);

  buffer.addEntry(entry(QStringLiteral("debug"), LogLevel::Debug));
  buffer.addEntry(entry(QStringLiteral("info"), LogLevel::Info));
  buffer.addEntry(entry(QStringLiteral("warn"), LogLevel::Warning));
  buffer.addEntry(entry(QStringLiteral("crit"), LogLevel::Critical));

  QCOMPARE(messages(buffer.entries()), (QStringList{"warn", "crit"}));
  QCOMPARE(spy.count(), 2);
}

void LogBufferTest::redactsOnIngest() {
  LogBuffer buffer;
  buffer.addEntry(entry(QStringLiteral("connecting with password=secret123")));

  const auto stored = buffer.entries();
  QCOMPARE(stored.size(), std::size_t{1});
  QVERIFY(!stored.front().message.contains(QStringLiteral("secret123")));
  QVERIFY(!buffer.logsAsText().contains(QStringLiteral("secret123")));
}

void LogBufferTest::unredactedRequestIsReRedacted() {
  LogBuffer buffer;
  buffer.addEntry(entry(QStringLiteral("password=secret123")));

  // The original text is not retained.
  QVERIFY(!buffer.logsAsText(false).contains(QStringLiteral("secret123")));
  QCOMPARE(buffer.entries(false).front().message, buffer.entries(true).front().message);
}

void LogBufferTest::redactionCanBeDisabled() {
  LogBuffer buffer;
  buffer.setRedactionEnabled(false);
  buffer.addEntry(entry(QStringLiteral("password=secret123")));

  QCOMPARE(buffer.entries().front().message, QStringLiteral("password=secret123"));
  QVERIFY(!buffer.redactionEnabled());
}

void LogBufferTest::signalCarriesStoredEntry() {
  LogRedactor redactor;
  LogBuffer   buffer(&redactor);
  QSignalSpy  spy(&buffer, &LogBuffer::entryAdded);

  buffer.addEntry(entry(QStringLiteral("token=abc123"), LogLevel::Warning));

  QCOMPARE(spy.count(), 1);
  const auto emitted = qvariant_cast<LogEntry>(spy.takeFirst().at(0));
  QCOMPARE(emitted.level, LogLevel::Warning);
  QCOMPARE(emitted.category, QStringLiteral("Test"));
  QVERIFY(!emitted.message.contains(QStringLiteral("abc123")));
  QCOMPARE(&buffer.redactor(), &redactor);
}

void LogBufferTest::formatsText() {
  LogBuffer buffer;

  LogEntry first  = entry(QStringLiteral("Started"));
  first.timestamp = QDateTime(QDate(2024, 5, 1), QTime(9, 5, 7));
  LogEntry second = LogEntry::now(LogLevel::Error, QStringLiteral("Import"), QStringLiteral("Failed"));
  second.timestamp = QDateTime(QDate(2024, 5, 1), QTime(14, 30, 0));
  second.failure   = QStringLiteral("file is locked");

  buffer.addEntry(first);
  buffer.addEntry(second);

  QCOMPARE(buffer.logsAsText(),
           QStringLiteral("[09:05:07] [INF] Test: Started\n"
                          "[14:30:00] [ERR] Import: Failed\n"
                          "file is locked"));
}

void LogBufferTest::clearKeepsConfiguration() {
  LogBuffer buffer;
  buffer.setMaxEntries(5);
  buffer.setMinLevel(LogLevel::Info);
  buffer.setRedactionEnabled(false);
  buffer.addEntry(entry(QStringLiteral("one")));

  QSignalSpy spy(&buffer, &LogBuffer::cleared);
  buffer.clear();

  QCOMPARE(spy.count(), 1);
  QCOMPARE(buffer.size(), std::size_t{0});
  QCOMPARE(buffer.maxEntries(), std::size_t{5});
  QCOMPARE(buffer.minLevel(), LogLevel::Info);
  QVERIFY(!buffer.redactionEnabled());
}

void LogBufferTest::concurrentWritersRespectCapacity() {
  constexpr int kThreads       = 8;
  constexpr int kPerThread     = 500;
  constexpr int kCapacity      = 1000;

  LogBuffer buffer;
  buffer.setMaxEntries(kCapacity);

  std::vector<std::thread> writers;
  writers.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&buffer, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        buffer.addEntry(entry(QStringLiteral("t%1 #%2 password=p%2").arg(t).arg(i)));
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }

  QCOMPARE(buffer.size(), std::size_t{kCapacity});
  QCOMPARE(buffer.evictedCount(), std::size_t{kThreads * kPerThread - kCapacity});
  for (const auto& stored : buffer.entries()) {
    QVERIFY(stored.message.contains(LogRedactor::kRedactedMarker));
  }
}

QTEST_GUILESS_MAIN(LogBufferTest)
#include "test_log_buffer.moc"
