#include "deskkit/workspace/DirtyTracker.hpp"

#include "deskkit/workspace/Workspace.hpp"
#include "deskkit/workspace/WorkspaceRegistry.hpp"

#include <algorithm>

namespace deskkit::workspace {

DirtyTracker::DirtyTracker(QObject* parent) : QObject(parent) {}

bool DirtyTracker::isDirty() const {
  if (m_globalDirty) {
    return true;
  }
  return std::any_of(m_workspaceStates.cbegin(), m_workspaceStates.cend(), [](bool dirty) { return dirty; });
}

bool DirtyTracker::isWorkspaceDirty(const QUuid& workspaceId) const {
  return m_workspaceStates.value(workspaceId, false);
}

void DirtyTracker::markDirty() {
  const bool wasDirty = isDirty();
  m_globalDirty       = true;
  notifyIfChanged(wasDirty);
}

void DirtyTracker::markClean() {
  const bool wasDirty = isDirty();
  m_globalDirty       = false;
  m_workspaceStates.clear();
  notifyIfChanged(wasDirty);
}

void DirtyTracker::markWorkspaceDirty(const QUuid& workspaceId) {
  const bool wasDirty            = isDirty();
  m_workspaceStates[workspaceId] = true;
  notifyIfChanged(wasDirty);
}

void DirtyTracker::markWorkspaceClean(const QUuid& workspaceId) {
  const bool wasDirty = isDirty();
  if (m_workspaceStates.contains(workspaceId)) {
    m_workspaceStates[workspaceId] = false;
  }
  notifyIfChanged(wasDirty);
}

void DirtyTracker::removeWorkspace(const QUuid& workspaceId) {
  const bool wasDirty = isDirty();
  m_workspaceStates.remove(workspaceId);
  notifyIfChanged(wasDirty);
}

void DirtyTracker::attach(WorkspaceRegistry* registry) {
  if (registry == nullptr) {
    return;
  }

  for (Workspace* workspace : registry->workspaces()) {
    track(workspace);
  }

  connect(registry, &WorkspaceRegistry::workspaceAdded, this, &DirtyTracker::track);
  connect(registry, &WorkspaceRegistry::workspaceRemoved, this, [this](Workspace* workspace) {
    disconnect(workspace, nullptr, this, nullptr);
    removeWorkspace(workspace->id());
  });
}

void DirtyTracker::track(Workspace* workspace) {
  if (workspace == nullptr) {
    return;
  }

  const QUuid id = workspace->id();
  if (workspace->isDirty()) {
    markWorkspaceDirty(id);
  }

  connect(workspace, &Workspace::dirtyChanged, this, [this, id](bool dirty) {
    if (dirty) {
      markWorkspaceDirty(id);
    } else {
      markWorkspaceClean(id);
    }
  });
}

void DirtyTracker::notifyIfChanged(bool wasDirty) {
  const bool dirty = isDirty();
  if (dirty != wasDirty) {
    emit dirtyStateChanged(dirty);
  }
}

}  // namespace deskkit::workspace
