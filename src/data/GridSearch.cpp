#include "deskkit/data/GridSearch.hpp"

#include "deskkit/logging/Logger.hpp"

#include <QRegularExpression>

#include <utility>

namespace deskkit::data {
namespace {

QRegularExpression patternFor(const QString& text, SearchOptions options) {
  QString pattern = QRegularExpression::escape(text);
  if (options.wholeWord) {
    pattern = QStringLiteral("\\b") + pattern + QStringLiteral("\\b");
  }

  QRegularExpression::PatternOptions flags = QRegularExpression::UseUnicodePropertiesOption;
  if (!options.caseSensitive) {
    flags |= QRegularExpression::CaseInsensitiveOption;
  }
  return QRegularExpression(pattern, flags);
}

QString replaceMatches(const QString& value, const QRegularExpression& pattern, const QString& replacement) {
  QString   result;
  qsizetype last = 0;

  QRegularExpressionMatchIterator it = pattern.globalMatch(value);
  while (it.hasNext()) {
    const QRegularExpressionMatch match = it.next();
    result += value.mid(last, match.capturedStart() - last);
    result += replacement;
    last = match.capturedEnd();
  }
  result += value.mid(last);
  return result;
}

}  // namespace

GridSearch::GridSearch(GridAccess grid, QObject* parent) : QObject(parent), m_grid(std::move(grid)) {}

int GridSearch::findAll(const QString& text, SearchOptions options) {
  m_matches.clear();
  m_current     = -1;
  m_lastText    = text;
  m_lastOptions = options;

  if (!text.isEmpty() && m_grid.rowCount && m_grid.columnCount && m_grid.cell) {
    const QRegularExpression pattern = patternFor(text, options);
    const int                rows    = m_grid.rowCount();
    const int                columns = m_grid.columnCount();
    for (int row = 0; row < rows; ++row) {
      for (int column = 0; column < columns; ++column) {
        QString value = m_grid.cell(row, column);
        if (!value.isEmpty() && pattern.match(value).hasMatch()) {
          m_matches.push_back(SearchMatch{row, column, std::move(value)});
        }
      }
    }
  }

  emit matchesChanged(matchCount());
  if (!m_matches.empty()) {
    m_current = 0;
    selectCurrent();
  }
  return matchCount();
}

bool GridSearch::findNext() {
  if (m_matches.empty()) {
    return false;
  }
  m_current = (m_current + 1) % matchCount();
  selectCurrent();
  return true;
}

bool GridSearch::findPrevious() {
  if (m_matches.empty()) {
    return false;
  }
  m_current = (m_current <= 0) ? matchCount() - 1 : m_current - 1;
  selectCurrent();
  return true;
}

int GridSearch::replaceAll(const QString& text, const QString& replacement, SearchOptions options) {
  if (text.isEmpty()) {
    return 0;
  }
  if (!canReplace()) {
    LOG_CAT(logging::LogLevel::Warning, QStringLiteral("Search"), QStringLiteral("Replace on a read-only grid ignored"));
    return 0;
  }

  const QRegularExpression pattern  = patternFor(text, options);
  const int                rows     = m_grid.rowCount();
  const int                columns  = m_grid.columnCount();
  int                      replaced = 0;
  for (int row = 0; row < rows; ++row) {
    for (int column = 0; column < columns; ++column) {
      const QString value = m_grid.cell(row, column);
      if (value.isEmpty() || !pattern.match(value).hasMatch()) {
        continue;
      }
      if (m_grid.setCell(row, column, replaceMatches(value, pattern, replacement))) {
        ++replaced;
      }
    }
  }

  if (replaced > 0 && !m_lastText.isEmpty()) {
    findAll(m_lastText, m_lastOptions);
  }
  return replaced;
}

void GridSearch::clear() {
  m_matches.clear();
  m_current = -1;
  m_lastText.clear();
  emit matchesChanged(0);
}

bool GridSearch::canReplace() const {
  return m_grid.rowCount && m_grid.columnCount && m_grid.cell && m_grid.setCell;
}

int GridSearch::currentIndex() const noexcept {
  return m_current;
}

int GridSearch::matchCount() const noexcept {
  return static_cast<int>(m_matches.size());
}

std::optional<SearchMatch> GridSearch::currentMatch() const {
  if (m_current < 0 || m_current >= matchCount()) {
    return std::nullopt;
  }
  return m_matches[static_cast<std::size_t>(m_current)];
}

const std::vector<SearchMatch>& GridSearch::matches() const noexcept {
  return m_matches;
}

const QString& GridSearch::searchText() const noexcept {
  return m_lastText;
}

QString GridSearch::statusText() const {
  if (m_matches.empty()) {
    return QStringLiteral("No matches");
  }
  return QStringLiteral("%1 of %2").arg(m_current + 1).arg(matchCount());
}

void GridSearch::selectCurrent() {
  const SearchMatch& match = m_matches[static_cast<std::size_t>(m_current)];
  emit matchFound(match.row, match.column, match.value);
}

}  // namespace deskkit::data
