#include "deskkit/logging/LogBuffer.hpp"
#include "deskkit/logging/Logger.hpp"

#include <QLoggingCategory>
#include <QtTest>

using deskkit::logging::LogBuffer;
using deskkit::logging::LogLevel;
using deskkit::logging::Logger;

namespace {

Q_LOGGING_CATEGORY(lcImport, "deskkit.import")

}  // namespace

class LoggerTest : public QObject {
  Q_OBJECT

 private slots:
  void init();
  void cleanup();

  void logsWithoutBufferAreDropped();
  void macrosUseAppCategory();
  void failureDetailIsKept();
  void qtMessagesAreRouted();
  void uninstallStopsRouting();

 private:
  LogBuffer* m_buffer = nullptr;
};

void LoggerTest::init() {
  m_buffer = new LogBuffer(nullptr, this);
  m_buffer->setMinLevel(LogLevel::Trace);
  Logger::instance().setBuffer(m_buffer);
}

void LoggerTest::cleanup() {
  Logger::instance().uninstallQtMessageHandler();
  Logger::instance().setBuffer(nullptr);
  delete m_buffer;
  m_buffer = nullptr;
}

void LoggerTest::logsWithoutBufferAreDropped() {
  Logger::instance().setBuffer(nullptr);
  LOG_INFO(QStringLiteral("nowhere"));
  QCOMPARE(m_buffer->size(), std::size_t{0});
  QVERIFY(Logger::instance().buffer() == nullptr);
}

void LoggerTest::macrosUseAppCategory() {
  LOG_DEBUG(QStringLiteral("one"));
  LOG_WARNING(QStringLiteral("two"));
  LOG_CAT(LogLevel::Error, QStringLiteral("Workspaces"), QStringLiteral("three"));

  const auto entries = m_buffer->entries();
  QCOMPARE(entries.size(), std::size_t{3});
  QCOMPARE(entries[0].category, QStringLiteral("App"));
  QCOMPARE(entries[0].level, LogLevel::Debug);
  QCOMPARE(entries[1].level, LogLevel::Warning);
  QCOMPARE(entries[2].category, QStringLiteral("Workspaces"));
  QCOMPARE(entries[2].level, LogLevel::Error);
}

void LoggerTest::failureDetailIsKept() {
  Logger::instance().logFailure(QStringLiteral("Import"), QStringLiteral("Import failed"), QStringLiteral("locked"));

  const auto entries = m_buffer->entries();
  QCOMPARE(entries.size(), std::size_t{1});
  QCOMPARE(entries[0].level, LogLevel::Error);
  QVERIFY(entries[0].failure.has_value());
  QCOMPARE(*entries[0].failure, QStringLiteral("locked"));
  QVERIFY(m_buffer->logsAsText().endsWith(QStringLiteral("\nlocked")));
}

void LoggerTest::qtMessagesAreRouted() {
  Logger::instance().installQtMessageHandler();

  qWarning("disk almost full");
  qCInfo(lcImport) << "parsed rows";

  const auto entries = m_buffer->entries();
  QCOMPARE(entries.size(), std::size_t{2});
  QCOMPARE(entries[0].level, LogLevel::Warning);
  QCOMPARE(entries[0].category, QStringLiteral("Qt"));
  QCOMPARE(entries[0].message, QStringLiteral("disk almost full"));
  QCOMPARE(entries[1].level, LogLevel::Info);
  QCOMPARE(entries[1].category, QStringLiteral("deskkit.import"));
}

void LoggerTest::uninstallStopsRouting() {
  Logger::instance().installQtMessageHandler();
  Logger::instance().uninstallQtMessageHandler();

  qInfo("not captured");
  QCOMPARE(m_buffer->size(), std::size_t{0});
}

QTEST_GUILESS_MAIN(LoggerTest)
#include "test_logger.moc"
