#include "deskkit/ui/WorkspaceTabs.hpp"

#include "deskkit/workspace/Workspace.hpp"
#include "deskkit/workspace/WorkspaceRegistry.hpp"

#include <QSignalBlocker>

#include <utility>

namespace deskkit::ui {

WorkspaceTabs::WorkspaceTabs(workspace::WorkspaceRegistry& registry, WorkspaceViewFactory factory, QWidget* parent)
    : QTabWidget(parent), m_registry(registry), m_factory(std::move(factory)) {
  setTabsClosable(true);
  setMovable(false);
  setDocumentMode(true);

  using workspace::WorkspaceRegistry;
  connect(&m_registry, &WorkspaceRegistry::workspaceAdded, this, &WorkspaceTabs::onWorkspaceAdded);
  connect(&m_registry, &WorkspaceRegistry::workspaceRemoved, this, &WorkspaceTabs::onWorkspaceRemoved);
  connect(&m_registry,
          &WorkspaceRegistry::activeWorkspaceChanged,
          this,
          [this](workspace::Workspace*, workspace::Workspace* current) { onActiveWorkspaceChanged(current); });

  connect(this, &QTabWidget::currentChanged, this, [this](int index) {
    if (workspace::Workspace* selected = workspaceAt(index)) {
      m_registry.activateWorkspace(selected);
    }
    // A refused or pending activation leaves the registry where it was.
    onActiveWorkspaceChanged(m_registry.activeWorkspace());
  });
  connect(this, &QTabWidget::tabCloseRequested, this, [this](int index) {
    if (workspace::Workspace* target = workspaceAt(index)) {
      m_registry.closeWorkspace(target);
    }
  });

  for (workspace::Workspace* existing : m_registry.workspaces()) {
    onWorkspaceAdded(existing);
  }
  onActiveWorkspaceChanged(m_registry.activeWorkspace());
}

workspace::Workspace* WorkspaceTabs::workspaceAt(int index) const {
  QWidget* view = widget(index);
  if (view == nullptr) {
    return nullptr;
  }
  for (auto it = m_views.cbegin(); it != m_views.cend(); ++it) {
    if (it.value() == view) {
      return it.key();
    }
  }
  return nullptr;
}

QWidget* WorkspaceTabs::viewFor(workspace::Workspace* workspace) const {
  return m_views.value(workspace, nullptr);
}

void WorkspaceTabs::activateNext() {
  if (count() < 2) {
    return;
  }
  if (workspace::Workspace* next = workspaceAt((currentIndex() + 1) % count())) {
    m_registry.activateWorkspace(next);
  }
}

void WorkspaceTabs::onWorkspaceAdded(workspace::Workspace* workspace) {
  if (workspace == nullptr || m_views.contains(workspace)) {
    return;
  }

  QWidget* view = m_factory.createView(*workspace, this);
  m_views.insert(workspace, view);

  {
    const QSignalBlocker blocker(this);
    addTab(view, workspace->displayTitle());
  }

  connect(workspace, &workspace::Workspace::titleChanged, this, [this, workspace]() { refreshTitle(workspace); });
  connect(workspace, &workspace::Workspace::dirtyChanged, this, [this, workspace]() { refreshTitle(workspace); });
}

void WorkspaceTabs::onWorkspaceRemoved(workspace::Workspace* workspace) {
  QWidget* view = m_views.take(workspace);
  if (view == nullptr) {
    return;
  }

  disconnect(workspace, nullptr, this, nullptr);
  {
    const QSignalBlocker blocker(this);
    removeTab(indexOf(view));
  }
  view->deleteLater();
}

void WorkspaceTabs::onActiveWorkspaceChanged(workspace::Workspace* current) {
  QWidget* view = m_views.value(current, nullptr);
  if (view == nullptr) {
    return;
  }
  const QSignalBlocker blocker(this);
  setCurrentWidget(view);
}

void WorkspaceTabs::refreshTitle(workspace::Workspace* workspace) {
  QWidget* view = m_views.value(workspace, nullptr);
  if (view == nullptr) {
    return;
  }
  const int index = indexOf(view);
  setTabText(index, workspace->displayTitle());
  setTabToolTip(index, workspace->title());
}

}  // namespace deskkit::ui
