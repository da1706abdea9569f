#pragma once

#include "deskkit/workspace/Workspace.hpp"

#include <QObject>
#include <QPointer>
#include <QString>
#include <QUuid>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace deskkit::workspace {

// Ordered set of open workspaces with a single active selection. All calls
// are expected on the owning (UI) thread.
class WorkspaceRegistry final : public QObject {
  Q_OBJECT

 public:
  using CloseCallback = std::function<void(bool)>;

  static constexpr int kDefaultMaxWorkspaces = 10;

  explicit WorkspaceRegistry(int maxWorkspaces = kDefaultMaxWorkspaces, QObject* parent = nullptr);
  ~WorkspaceRegistry() override;

  // Fails when the registry is full; the refused workspace is destroyed and
  // lastError() says why.
  [[nodiscard]] bool addWorkspace(std::unique_ptr<Workspace> workspace);

  void activateWorkspace(Workspace* workspace);
  void closeWorkspace(Workspace* workspace, CloseCallback done = {});
  // Most recently added first; stops at the first declined close.
  void closeAll(CloseCallback done = {});

  [[nodiscard]] std::vector<Workspace*> workspaces() const;
  [[nodiscard]] Workspace*              workspaceAt(int index) const;
  [[nodiscard]] int                     indexOf(const Workspace* workspace) const;
  [[nodiscard]] Workspace*              findById(const QUuid& id) const;
  [[nodiscard]] Workspace*              activeWorkspace() const noexcept;
  [[nodiscard]] int                     count() const noexcept;
  [[nodiscard]] bool                    hasUnsavedChanges() const;

  [[nodiscard]] int maxWorkspaces() const noexcept;
  void              setMaxWorkspaces(int maxWorkspaces);

  [[nodiscard]] const QString& lastError() const noexcept;

 signals:
  void workspaceAdded(deskkit::workspace::Workspace* workspace);
  void workspaceRemoved(deskkit::workspace::Workspace* workspace);
  void activeWorkspaceChanged(deskkit::workspace::Workspace* previous,
                              deskkit::workspace::Workspace* current);

 private:
  using PendingQueue = std::vector<QPointer<Workspace>>;

  void removeClosedWorkspace(Workspace* workspace);
  void closeNextPending(std::shared_ptr<PendingQueue> queue, std::size_t position, CloseCallback done);

  std::vector<std::unique_ptr<Workspace>> m_workspaces;
  Workspace*                              m_active = nullptr;
  int                                     m_maxWorkspaces;
  std::uint64_t                           m_activationSerial = 0;
  QString                                 m_lastError;
};

}  // namespace deskkit::workspace
