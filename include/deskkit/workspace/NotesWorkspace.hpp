#pragma once

#include "deskkit/workspace/Workspace.hpp"

#include <QString>

namespace deskkit::workspace {

class NotesWorkspace final : public Workspace {
  Q_OBJECT

 public:
  static inline const QString kViewType = QStringLiteral("notes");

  explicit NotesWorkspace(QString title = QStringLiteral("Untitled"), QObject* parent = nullptr);

  [[nodiscard]] const QString& text() const noexcept;
  // Marks the workspace dirty when the text actually changes.
  void setText(const QString& text);

  [[nodiscard]] const QString& filePath() const noexcept;
  void                         setFilePath(const QString& path);

  // Writes the text as UTF-8 and marks the workspace clean.
  [[nodiscard]] bool           save(const QString& path);
  [[nodiscard]] const QString& lastError() const noexcept;

 signals:
  void textChanged(const QString& text);

 private:
  QString m_text;
  QString m_filePath;
  QString m_lastError;
};

}  // namespace deskkit::workspace
