#pragma once

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

class QWidget;

namespace deskkit::ui {

enum class MessageBoxResult {
  None,
  Ok,
  Cancel,
  Yes,
  No
};

enum class MessageBoxButtons {
  Ok,
  OkCancel,
  YesNo,
  YesNoCancel
};

struct FileFilter {
  QString     name;
  QStringList extensions;  // without wildcard: "csv", "tsv"
};

// Modal prompts used by the shell. Kept behind an interface so workspace
// close guards can be driven without real dialogs.
class DialogService {
 public:
  virtual ~DialogService() = default;

  virtual void             showMessage(const QString& message, const QString& title)                    = 0;
  virtual MessageBoxResult ask(const QString& message, const QString& title, MessageBoxButtons buttons) = 0;

  // std::nullopt when the user cancels.
  virtual std::optional<QString> openFile(const QString& title, const std::vector<FileFilter>& filters) = 0;
  virtual std::optional<QString> saveFile(const QString& title, const std::vector<FileFilter>& filters) = 0;

  // True when the user agrees to discard unsaved changes in documentName.
  virtual bool confirmClose(const QString& documentName) = 0;
};

class QtDialogService final : public DialogService {
 public:
  explicit QtDialogService(QWidget* parent);

  void             showMessage(const QString& message, const QString& title) override;
  MessageBoxResult ask(const QString& message, const QString& title, MessageBoxButtons buttons) override;

  std::optional<QString> openFile(const QString& title, const std::vector<FileFilter>& filters) override;
  std::optional<QString> saveFile(const QString& title, const std::vector<FileFilter>& filters) override;

  bool confirmClose(const QString& documentName) override;

  // "Name (*.a *.b);;..." as QFileDialog expects it.
  [[nodiscard]] static QString filterString(const std::vector<FileFilter>& filters);

 private:
  QWidget* m_parent = nullptr;
};

}  // namespace deskkit::ui
