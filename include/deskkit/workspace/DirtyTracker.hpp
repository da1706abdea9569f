#pragma once

#include <QHash>
#include <QObject>
#include <QUuid>

namespace deskkit::workspace {

class Workspace;
class WorkspaceRegistry;

// Project-wide unsaved-changes flag: a global flag plus one flag per
// workspace. dirtyStateChanged fires only when the aggregate flips.
class DirtyTracker final : public QObject {
  Q_OBJECT

 public:
  explicit DirtyTracker(QObject* parent = nullptr);

  [[nodiscard]] bool isDirty() const;
  [[nodiscard]] bool isWorkspaceDirty(const QUuid& workspaceId) const;

  void markDirty();
  void markClean();
  void markWorkspaceDirty(const QUuid& workspaceId);
  void markWorkspaceClean(const QUuid& workspaceId);
  void removeWorkspace(const QUuid& workspaceId);

  // Follows the registry's workspaces and their dirty flags.
  void attach(WorkspaceRegistry* registry);

 signals:
  void dirtyStateChanged(bool dirty);

 private:
  void track(Workspace* workspace);
  void notifyIfChanged(bool wasDirty);

  QHash<QUuid, bool> m_workspaceStates;
  bool               m_globalDirty = false;
};

}  // namespace deskkit::workspace
