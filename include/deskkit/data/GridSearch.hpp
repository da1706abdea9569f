#pragma once

#include <QObject>
#include <QString>

#include <functional>
#include <optional>
#include <vector>

namespace deskkit::data {

// Accessors a search runs over. setCell may be left empty for a read-only
// grid; replaceAll() then does nothing.
struct GridAccess {
  std::function<int()>                          rowCount;
  std::function<int()>                          columnCount;
  std::function<QString(int, int)>              cell;
  std::function<bool(int, int, const QString&)> setCell;
};

struct SearchOptions {
  bool caseSensitive = false;
  bool wholeWord     = false;
};

struct SearchMatch {
  int     row    = 0;
  int     column = 0;
  QString value;
};

// Find and replace over a grid of strings. Matches are collected row by row,
// left to right; next and previous wrap around.
class GridSearch final : public QObject {
  Q_OBJECT

 public:
  explicit GridSearch(GridAccess grid, QObject* parent = nullptr);

  // Selects the first match, if any, and returns the match count.
  int  findAll(const QString& text, SearchOptions options = {});
  bool findNext();
  bool findPrevious();
  // Returns the number of cells changed and refreshes the last search.
  int  replaceAll(const QString& text, const QString& replacement, SearchOptions options = {});
  void clear();

  [[nodiscard]] bool                            canReplace() const;
  [[nodiscard]] int                             currentIndex() const noexcept;
  [[nodiscard]] int                             matchCount() const noexcept;
  [[nodiscard]] std::optional<SearchMatch>      currentMatch() const;
  [[nodiscard]] const std::vector<SearchMatch>& matches() const noexcept;
  [[nodiscard]] const QString&                  searchText() const noexcept;
  // "No matches" or "<current> of <total>", 1-based.
  [[nodiscard]] QString statusText() const;

 signals:
  void matchFound(int row, int column, const QString& value);
  void matchesChanged(int count);

 private:
  void selectCurrent();

  GridAccess               m_grid;
  std::vector<SearchMatch> m_matches;
  int                      m_current = -1;
  QString                  m_lastText;
  SearchOptions            m_lastOptions;
};

}  // namespace deskkit::data
