#include "deskkit/workspace/WorkspaceRegistry.hpp"

#include "deskkit/logging/Logger.hpp"

#include <algorithm>
#include <utility>

namespace deskkit::workspace {
namespace {

const QString kCategory = QStringLiteral("Workspaces");

}  // namespace

WorkspaceRegistry::WorkspaceRegistry(int maxWorkspaces, QObject* parent)
    : QObject(parent), m_maxWorkspaces((std::max)(1, maxWorkspaces)) {}

WorkspaceRegistry::~WorkspaceRegistry() = default;

bool WorkspaceRegistry::addWorkspace(std::unique_ptr<Workspace> workspace) {
  m_lastError.clear();
  if (workspace == nullptr) {
    m_lastError = QStringLiteral("Cannot add an empty workspace.");
    return false;
  }

  if (count() >= m_maxWorkspaces) {
    m_lastError = QStringLiteral("Maximum workspace limit (%1) reached.").arg(m_maxWorkspaces);
    LOG_CAT(logging::LogLevel::Warning, kCategory, m_lastError);
    return false;
  }

  Workspace* added = workspace.get();
  added->setState(WorkspaceState::Inactive);
  m_workspaces.push_back(std::move(workspace));
  LOG_CAT(logging::LogLevel::Debug,
          kCategory,
          QStringLiteral("Added '%1' (%2)").arg(added->title(), added->viewType()));
  emit workspaceAdded(added);

  activateWorkspace(added);
  return true;
}

void WorkspaceRegistry::activateWorkspace(Workspace* workspace) {
  if (workspace == nullptr || indexOf(workspace) < 0) {
    return;
  }
  if (workspace == m_active || workspace->state() == WorkspaceState::Closing) {
    return;
  }

  const std::uint64_t         serial = ++m_activationSerial;
  QPointer<WorkspaceRegistry> self(this);
  QPointer<Workspace>         target(workspace);
  QPointer<Workspace>         previous(m_active);

  auto finish = [self, serial, target, previous]() {
    if (self.isNull() || serial != self->m_activationSerial) {
      return;
    }
    if (target.isNull() || self->indexOf(target) < 0 || target->state() == WorkspaceState::Closing) {
      return;
    }

    if (self->m_active != nullptr && self->m_active != target
        && self->m_active->state() == WorkspaceState::Active) {
      self->m_active->setState(WorkspaceState::Inactive);
    }
    self->m_active = target;
    target->setState(WorkspaceState::Active);

    target->onActivated([self, serial, target, previous]() {
      if (self.isNull() || serial != self->m_activationSerial || target.isNull()) {
        return;
      }
      Workspace* prior = (!previous.isNull() && self->indexOf(previous) >= 0) ? previous.data() : nullptr;
      emit self->activeWorkspaceChanged(prior, target);
    });
  };

  if (previous.isNull()) {
    finish();
    return;
  }

  // Deactivation is awaited but cannot veto the switch. The previous
  // workspace stays Active until finish() commits it.
  previous->onDeactivated(finish);
}

void WorkspaceRegistry::closeWorkspace(Workspace* workspace, CloseCallback done) {
  if (workspace == nullptr || indexOf(workspace) < 0
      || workspace->state() == WorkspaceState::Closing) {
    if (done) {
      done(false);
    }
    return;
  }

  workspace->setState(WorkspaceState::Closing);

  QPointer<WorkspaceRegistry> self(this);
  QPointer<Workspace>         target(workspace);
  workspace->canClose([self, target, done](bool allowed) {
    if (self.isNull() || target.isNull() || self->indexOf(target) < 0) {
      if (done) {
        done(false);
      }
      return;
    }

    if (!allowed) {
      target->setState(self->m_active == target ? WorkspaceState::Active : WorkspaceState::Inactive);
      LOG_CAT(logging::LogLevel::Debug,
              kCategory,
              QStringLiteral("Close of '%1' cancelled").arg(target->title()));
      if (done) {
        done(false);
      }
      return;
    }

    target->onClosing([self, target, done]() {
      if (self.isNull() || target.isNull() || self->indexOf(target) < 0) {
        if (done) {
          done(false);
        }
        return;
      }
      self->removeClosedWorkspace(target);
      if (done) {
        done(true);
      }
    });
  });
}

void WorkspaceRegistry::closeAll(CloseCallback done) {
  auto queue = std::make_shared<PendingQueue>();
  queue->reserve(m_workspaces.size());
  for (auto it = m_workspaces.rbegin(); it != m_workspaces.rend(); ++it) {
    queue->emplace_back(it->get());
  }
  closeNextPending(std::move(queue), 0, std::move(done));
}

void WorkspaceRegistry::closeNextPending(std::shared_ptr<PendingQueue> queue,
                                         std::size_t                   position,
                                         CloseCallback                 done) {
  while (position < queue->size()
         && ((*queue)[position].isNull() || indexOf((*queue)[position]) < 0)) {
    ++position;
  }

  if (position >= queue->size()) {
    if (done) {
      done(true);
    }
    return;
  }

  QPointer<WorkspaceRegistry> self(this);
  Workspace*                  next = (*queue)[position];
  closeWorkspace(next, [self, queue, position, done](bool closed) {
    if (self.isNull()) {
      return;
    }
    if (!closed) {
      if (done) {
        done(false);
      }
      return;
    }
    self->closeNextPending(queue, position + 1, done);
  });
}

std::vector<Workspace*> WorkspaceRegistry::workspaces() const {
  std::vector<Workspace*> result;
  result.reserve(m_workspaces.size());
  for (const auto& workspace : m_workspaces) {
    result.push_back(workspace.get());
  }
  return result;
}

Workspace* WorkspaceRegistry::workspaceAt(int index) const {
  if (index < 0 || index >= count()) {
    return nullptr;
  }
  return m_workspaces[static_cast<std::size_t>(index)].get();
}

int WorkspaceRegistry::indexOf(const Workspace* workspace) const {
  if (workspace == nullptr) {
    return -1;
  }
  const auto it = std::find_if(m_workspaces.begin(), m_workspaces.end(), [workspace](const auto& entry) {
    return entry.get() == workspace;
  });
  return (it == m_workspaces.end()) ? -1 : static_cast<int>(std::distance(m_workspaces.begin(), it));
}

Workspace* WorkspaceRegistry::findById(const QUuid& id) const {
  for (const auto& workspace : m_workspaces) {
    if (workspace->id() == id) {
      return workspace.get();
    }
  }
  return nullptr;
}

Workspace* WorkspaceRegistry::activeWorkspace() const noexcept {
  return m_active;
}

int WorkspaceRegistry::count() const noexcept {
  return static_cast<int>(m_workspaces.size());
}

bool WorkspaceRegistry::hasUnsavedChanges() const {
  return std::any_of(m_workspaces.begin(), m_workspaces.end(), [](const auto& workspace) {
    return workspace->isDirty();
  });
}

int WorkspaceRegistry::maxWorkspaces() const noexcept {
  return m_maxWorkspaces;
}

void WorkspaceRegistry::setMaxWorkspaces(int maxWorkspaces) {
  m_maxWorkspaces = (std::max)(1, maxWorkspaces);
}

const QString& WorkspaceRegistry::lastError() const noexcept {
  return m_lastError;
}

void WorkspaceRegistry::removeClosedWorkspace(Workspace* workspace) {
  const int index = indexOf(workspace);
  if (index < 0) {
    return;
  }

  const bool wasActive = (m_active == workspace);
  std::unique_ptr<Workspace> removed = std::move(m_workspaces[static_cast<std::size_t>(index)]);
  m_workspaces.erase(m_workspaces.begin() + index);
  if (wasActive) {
    m_active = nullptr;
  }

  removed->setState(WorkspaceState::Removed);
  LOG_CAT(logging::LogLevel::Debug, kCategory, QStringLiteral("Closed '%1'").arg(removed->title()));
  emit workspaceRemoved(removed.get());

  if (wasActive) {
    if (!m_workspaces.empty()) {
      const int nextIndex = (std::min)(index, count() - 1);
      activateWorkspace(m_workspaces[static_cast<std::size_t>(nextIndex)].get());
    } else {
      ++m_activationSerial;
      emit activeWorkspaceChanged(nullptr, nullptr);
    }
  }

  // A hook of the removed workspace may still be on the stack.
  removed.release()->deleteLater();
}

}  // namespace deskkit::workspace
