#pragma once

#include <QObject>
#include <QString>
#include <QUuid>

#include <functional>

namespace deskkit::workspace {

enum class WorkspaceState {
  Inactive = 0,
  Active,
  Closing,
  Removed
};

// A document/tab owned by WorkspaceRegistry. Lifecycle hooks are
// continuation based: an override may finish synchronously or call the
// continuation later (after a dialog, a save, ...). Every hook must call its
// continuation exactly once.
class Workspace : public QObject {
  Q_OBJECT

 public:
  using CloseDecision = std::function<void(bool)>;
  using Continuation  = std::function<void()>;
  using CloseGuard    = std::function<void(Workspace&, CloseDecision)>;

  explicit Workspace(QString viewType, QString title = QStringLiteral("Untitled"), QObject* parent = nullptr);
  ~Workspace() override;

  [[nodiscard]] const QUuid&   id() const noexcept;
  [[nodiscard]] const QString& viewType() const noexcept;
  [[nodiscard]] const QString& title() const noexcept;
  [[nodiscard]] QString        displayTitle() const;
  [[nodiscard]] bool           isDirty() const noexcept;
  [[nodiscard]] WorkspaceState state() const noexcept;
  [[nodiscard]] bool           isActive() const noexcept;

  void setTitle(const QString& title);
  void markDirty();
  void markClean();

  // Consulted by the default canClose() when the workspace is dirty.
  void setCloseGuard(CloseGuard guard);

  virtual void canClose(CloseDecision decision);
  virtual void onClosing(Continuation done);
  virtual void onActivated(Continuation done);
  virtual void onDeactivated(Continuation done);

 signals:
  void titleChanged(const QString& title);
  void dirtyChanged(bool dirty);
  void stateChanged(deskkit::workspace::WorkspaceState state);

 private:
  friend class WorkspaceRegistry;

  void setDirty(bool dirty);
  void setState(WorkspaceState state);

  QUuid          m_id;
  QString        m_viewType;
  QString        m_title;
  bool           m_dirty = false;
  WorkspaceState m_state = WorkspaceState::Inactive;
  CloseGuard     m_closeGuard;
};

}  // namespace deskkit::workspace

Q_DECLARE_METATYPE(deskkit::workspace::WorkspaceState)
