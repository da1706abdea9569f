#pragma once

#include <QReadWriteLock>
#include <QRegularExpression>
#include <QString>
#include <QStringList>

#include <vector>

namespace deskkit::logging {

struct RedactionRule {
  QRegularExpression pattern;
  QString            replacement;
};

// Ordered pattern -> replacement rules applied to log text. Each rule is a
// global substitution over the output of the previous one, so rule order
// matters and overlapping rules may both fire.
class LogRedactor final {
 public:
  static inline const QString kRedactedMarker = QStringLiteral("[REDACTED]");

  LogRedactor();

  [[nodiscard]] static QStringList defaultPatterns();

  [[nodiscard]] QString redact(const QString& text) const;
  [[nodiscard]] bool    containsSensitiveData(const QString& text) const;

  // Refuses (returns false, rules untouched) when the pattern does not compile.
  [[nodiscard]] bool addPattern(const QString& pattern, const QString& replacement = kRedactedMarker);
  void               clearPatterns();
  void               restoreDefaults();

  [[nodiscard]] int         patternCount() const;
  [[nodiscard]] QStringList patterns() const;
  [[nodiscard]] QString     lastError() const;

 private:
  struct DefaultRule {
    const char* pattern;
    const char* replacement;
  };

  static const std::vector<DefaultRule>& defaultRules();
  void                                   installDefaultsLocked();

  mutable QReadWriteLock     m_lock;
  std::vector<RedactionRule> m_rules;
  QString                    m_lastError;
};

}  // namespace deskkit::logging
