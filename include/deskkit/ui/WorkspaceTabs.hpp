#pragma once

#include "deskkit/ui/WorkspaceViews.hpp"

#include <QHash>
#include <QTabWidget>

namespace deskkit::workspace {
class Workspace;
class WorkspaceRegistry;
}  // namespace deskkit::workspace

namespace deskkit::ui {

// Tab strip mirroring a WorkspaceRegistry. The registry stays the source of
// truth: tab clicks and close buttons are requests, the tabs change only
// when the registry reports the change.
class WorkspaceTabs final : public QTabWidget {
  Q_OBJECT

 public:
  WorkspaceTabs(workspace::WorkspaceRegistry& registry, WorkspaceViewFactory factory, QWidget* parent = nullptr);

  [[nodiscard]] workspace::Workspace* workspaceAt(int index) const;
  [[nodiscard]] QWidget*              viewFor(workspace::Workspace* workspace) const;
  void                                activateNext();

 private:
  void onWorkspaceAdded(workspace::Workspace* workspace);
  void onWorkspaceRemoved(workspace::Workspace* workspace);
  void onActiveWorkspaceChanged(workspace::Workspace* current);
  void refreshTitle(workspace::Workspace* workspace);

  workspace::WorkspaceRegistry&          m_registry;
  WorkspaceViewFactory                   m_factory;
  QHash<workspace::Workspace*, QWidget*> m_views;
};

}  // namespace deskkit::ui
