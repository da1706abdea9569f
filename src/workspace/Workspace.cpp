#include "deskkit/workspace/Workspace.hpp"

#include <utility>

namespace deskkit::workspace {

Workspace::Workspace(QString viewType, QString title, QObject* parent)
    : QObject(parent),
      m_id(QUuid::createUuid()),
      m_viewType(std::move(viewType)),
      m_title(std::move(title)) {}

Workspace::~Workspace() = default;

const QUuid& Workspace::id() const noexcept {
  return m_id;
}

const QString& Workspace::viewType() const noexcept {
  return m_viewType;
}

const QString& Workspace::title() const noexcept {
  return m_title;
}

QString Workspace::displayTitle() const {
  return m_dirty ? m_title + QStringLiteral(" *") : m_title;
}

bool Workspace::isDirty() const noexcept {
  return m_dirty;
}

WorkspaceState Workspace::state() const noexcept {
  return m_state;
}

bool Workspace::isActive() const noexcept {
  return m_state == WorkspaceState::Active;
}

void Workspace::setTitle(const QString& title) {
  if (m_title == title) {
    return;
  }
  m_title = title;
  emit titleChanged(m_title);
}

void Workspace::markDirty() {
  setDirty(true);
}

void Workspace::markClean() {
  setDirty(false);
}

void Workspace::setCloseGuard(CloseGuard guard) {
  m_closeGuard = std::move(guard);
}

void Workspace::canClose(CloseDecision decision) {
  if (!m_dirty || !m_closeGuard) {
    decision(true);
    return;
  }
  m_closeGuard(*this, std::move(decision));
}

void Workspace::onClosing(Continuation done) {
  done();
}

void Workspace::onActivated(Continuation done) {
  done();
}

void Workspace::onDeactivated(Continuation done) {
  done();
}

void Workspace::setDirty(bool dirty) {
  if (m_dirty == dirty) {
    return;
  }
  m_dirty = dirty;
  emit dirtyChanged(m_dirty);
}

void Workspace::setState(WorkspaceState state) {
  if (m_state == state) {
    return;
  }
  m_state = state;
  emit stateChanged(m_state);
}

}  // namespace deskkit::workspace
