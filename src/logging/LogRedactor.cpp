#include "deskkit/logging/LogRedactor.hpp"

#include <QReadLocker>
#include <QWriteLocker>

#include <utility>

namespace deskkit::logging {
namespace {

constexpr auto kPatternOptions = QRegularExpression::CaseInsensitiveOption;

QRegularExpression compilePattern(const QString& pattern) {
  QRegularExpression regex(pattern, kPatternOptions);
  regex.optimize();
  return regex;
}

}  // namespace

// Key/value rules keep the key and mask the value so that already redacted
// text maps onto itself.
const std::vector<LogRedactor::DefaultRule>& LogRedactor::defaultRules() {
  static const std::vector<DefaultRule> rules = {
      // Connection-string password field, value may contain spaces.
      {R"((;\s*(?:password|pwd)\s*=\s*)[^;\r\n]*)", R"(\1[REDACTED])"},
      {R"((\bbearer\s+)[^\s;,&"']+)", R"(\1[REDACTED])"},
      {R"((authorization\s*[=:]\s*(?:(?:bearer|basic|digest)\s+)?)[^\s;,&"']+)", R"(\1[REDACTED])"},
      {R"(((?:password|passwd|pwd)["']?\s*[=:]\s*["']?)[^\s;,&"']+)", R"(\1[REDACTED])"},
      {R"((api[_-]?key["']?\s*[=:]\s*["']?)[^\s;,&"']+)", R"(\1[REDACTED])"},
      {R"(((?:secret|token|credential)s?["']?\s*[=:]\s*["']?)[^\s;,&"']+)", R"(\1[REDACTED])"},
      {R"((connection[_-]?string["']?\s*[=:]\s*["']?)[^\s"']+)", R"(\1[REDACTED])"},
      // Credit-card-like runs of 13-19 digits.
      {R"(\b(?:\d[ -]?){12,18}\d\b)", "[REDACTED]"},
      {R"(\b\d{3}-\d{2}-\d{4}\b)", "[REDACTED]"},
  };
  return rules;
}

LogRedactor::LogRedactor() {
  QWriteLocker locker(&m_lock);
  installDefaultsLocked();
}

QStringList LogRedactor::defaultPatterns() {
  QStringList patterns;
  for (const auto& rule : defaultRules()) {
    patterns.append(QString::fromLatin1(rule.pattern));
  }
  return patterns;
}

QString LogRedactor::redact(const QString& text) const {
  if (text.isEmpty()) {
    return text;
  }

  QReadLocker locker(&m_lock);
  QString     result = text;
  for (const auto& rule : m_rules) {
    result.replace(rule.pattern, rule.replacement);
  }
  return result;
}

bool LogRedactor::containsSensitiveData(const QString& text) const {
  if (text.isEmpty()) {
    return false;
  }

  QReadLocker locker(&m_lock);
  for (const auto& rule : m_rules) {
    if (rule.pattern.match(text).hasMatch()) {
      return true;
    }
  }
  return false;
}

bool LogRedactor::addPattern(const QString& pattern, const QString& replacement) {
  QWriteLocker locker(&m_lock);
  m_lastError.clear();

  if (pattern.isEmpty()) {
    m_lastError = QStringLiteral("Redaction pattern is empty.");
    return false;
  }

  QRegularExpression regex = compilePattern(pattern);
  if (!regex.isValid()) {
    m_lastError = QStringLiteral("Invalid redaction pattern '%1': %2 (offset %3)")
                      .arg(pattern, regex.errorString())
                      .arg(regex.patternErrorOffset());
    return false;
  }

  m_rules.push_back({std::move(regex), replacement});
  return true;
}

void LogRedactor::clearPatterns() {
  QWriteLocker locker(&m_lock);
  m_rules.clear();
}

void LogRedactor::restoreDefaults() {
  QWriteLocker locker(&m_lock);
  m_rules.clear();
  installDefaultsLocked();
}

int LogRedactor::patternCount() const {
  QReadLocker locker(&m_lock);
  return static_cast<int>(m_rules.size());
}

QStringList LogRedactor::patterns() const {
  QReadLocker locker(&m_lock);
  QStringList result;
  for (const auto& rule : m_rules) {
    result.append(rule.pattern.pattern());
  }
  return result;
}

QString LogRedactor::lastError() const {
  QReadLocker locker(&m_lock);
  return m_lastError;
}

void LogRedactor::installDefaultsLocked() {
  for (const auto& rule : defaultRules()) {
    m_rules.push_back(
        {compilePattern(QString::fromLatin1(rule.pattern)), QString::fromLatin1(rule.replacement)});
  }
}

}  // namespace deskkit::logging
