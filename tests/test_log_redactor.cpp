#include "deskkit/logging/LogRedactor.hpp"

#include <QtTest>

using deskkit::logging::LogRedactor;

class LogRedactorTest : public QObject {
  Q_OBJECT

 private slots:
  void masksDefaultSecrets_data();
  void masksDefaultSecrets();
  void leavesPlainTextAlone();
  void redactionIsIdempotent_data();
  void redactionIsIdempotent();
  void detectsSensitiveData();
  void customPatternIsAppended();
  void invalidPatternIsRefused();
  void clearAndRestoreDefaults();
};

void LogRedactorTest::masksDefaultSecrets_data() {
  QTest::addColumn<QString>("input");
  QTest::addColumn<QString>("secret");

  QTest::newRow("password assignment") << QStringLiteral("login password=secret123 ok") << QStringLiteral("secret123");
  QTest::newRow("pwd colon") << QStringLiteral("pwd: hunter2") << QStringLiteral("hunter2");
  QTest::newRow("quoted password") << QStringLiteral(R"({"password": "p4ss"})") << QStringLiteral("p4ss");
  QTest::newRow("bearer") << QStringLiteral("Authorization: Bearer eyJhbGciOi.abc") << QStringLiteral("eyJhbGciOi");
  QTest::newRow("basic auth") << QStringLiteral("authorization=Basic dXNlcjpwYXNz") << QStringLiteral("dXNlcjpwYXNz");
  QTest::newRow("api key") << QStringLiteral("api_key=AKIA12345") << QStringLiteral("AKIA12345");
  QTest::newRow("apikey dash") << QStringLiteral("API-KEY: k-998877") << QStringLiteral("k-998877");
  QTest::newRow("token") << QStringLiteral("refresh token=abcdef&next=1") << QStringLiteral("abcdef");
  QTest::newRow("secret") << QStringLiteral("client_secret=s3cr3t") << QStringLiteral("s3cr3t");
  QTest::newRow("connection string password")
      << QStringLiteral("Server=db;User Id=sa;Password=two words;Database=x") << QStringLiteral("two words");
  QTest::newRow("card spaces") << QStringLiteral("card 4111 1111 1111 1111 used") << QStringLiteral("4111 1111 1111 1111");
  QTest::newRow("card dashes") << QStringLiteral("pan=5500-0000-0000-0004") << QStringLiteral("5500-0000-0000-0004");
  QTest::newRow("ssn") << QStringLiteral("ssn 123-45-6789 on file") << QStringLiteral("123-45-6789");
}

void LogRedactorTest::masksDefaultSecrets() {
  QFETCH(QString, input);
  QFETCH(QString, secret);

  const LogRedactor redactor;
  const QString     output = redactor.redact(input);
  QVERIFY2(!output.contains(secret), qPrintable(output));
  QVERIFY(output.contains(LogRedactor::kRedactedMarker));
}

void LogRedactorTest::leavesPlainTextAlone() {
  const LogRedactor redactor;
  QCOMPARE(redactor.redact(QString()), QString());
  QCOMPARE(redactor.redact(QStringLiteral("Opened 3 files in 120 ms")),
           QStringLiteral("Opened 3 files in 120 ms"));
}

void LogRedactorTest::redactionIsIdempotent_data() {
  QTest::addColumn<QString>("input");

  QTest::newRow("password") << QStringLiteral("password=secret123");
  QTest::newRow("bearer header") << QStringLiteral("Authorization: Bearer abc.def.ghi");
  QTest::newRow("connection string") << QStringLiteral("Data Source=x;Password=a b c;Encrypt=true");
  QTest::newRow("mixed") << QStringLiteral("token=1 api_key=2 card 4111111111111111 ssn 078-05-1120");
}

void LogRedactorTest::redactionIsIdempotent() {
  QFETCH(QString, input);

  const LogRedactor redactor;
  const QString     once = redactor.redact(input);
  QCOMPARE(redactor.redact(once), once);
}

void LogRedactorTest::detectsSensitiveData() {
  const LogRedactor redactor;
  QVERIFY(redactor.containsSensitiveData(QStringLiteral("password=abc")));
  QVERIFY(!redactor.containsSensitiveData(QStringLiteral("nothing to see")));
  QVERIFY(!redactor.containsSensitiveData(QString()));
}

void LogRedactorTest::customPatternIsAppended() {
  LogRedactor redactor;
  const int   before = redactor.patternCount();

  QVERIFY(redactor.addPattern(QStringLiteral(R"(EMP-\d{5})"), QStringLiteral("EMP-*****")));
  QCOMPARE(redactor.patternCount(), before + 1);
  QCOMPARE(redactor.patterns().last(), QStringLiteral(R"(EMP-\d{5})"));
  QCOMPARE(redactor.redact(QStringLiteral("employee emp-12345 left")), QStringLiteral("employee EMP-***** left"));
}

void LogRedactorTest::invalidPatternIsRefused() {
  LogRedactor redactor;
  const int   before = redactor.patternCount();

  QVERIFY(!redactor.addPattern(QStringLiteral("(unclosed")));
  QCOMPARE(redactor.patternCount(), before);
  QVERIFY(!redactor.lastError().isEmpty());

  QVERIFY(!redactor.addPattern(QString()));
  QCOMPARE(redactor.patternCount(), before);
}

void LogRedactorTest::clearAndRestoreDefaults() {
  LogRedactor redactor;
  redactor.clearPatterns();
  QCOMPARE(redactor.patternCount(), 0);
  QCOMPARE(redactor.redact(QStringLiteral("password=abc")), QStringLiteral("password=abc"));

  redactor.restoreDefaults();
  QCOMPARE(redactor.patterns(), LogRedactor::defaultPatterns());
  QVERIFY(!redactor.redact(QStringLiteral("password=abc")).contains(QStringLiteral("abc")));
}

QTEST_GUILESS_MAIN(LogRedactorTest)
#include "test_log_redactor.moc"
