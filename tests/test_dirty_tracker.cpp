#include "deskkit/workspace/DirtyTracker.hpp"
#include "deskkit/workspace/Workspace.hpp"
#include "deskkit/workspace/WorkspaceRegistry.hpp"

#include <QSignalSpy>
#include <QtTest>

#include <memory>

using deskkit::workspace::DirtyTracker;
using deskkit::workspace::Workspace;
using deskkit::workspace::WorkspaceRegistry;

class DirtyTrackerTest : public QObject {
  Q_OBJECT

 private slots:
  void globalFlag();
  void perWorkspaceFlags();
  void markCleanClearsEverything();
  void followsRegistry();
};

void DirtyTrackerTest::globalFlag() {
  DirtyTracker tracker;
  QSignalSpy   spy(&tracker, &DirtyTracker::dirtyStateChanged);
  QVERIFY(!tracker.isDirty());

  tracker.markDirty();
  tracker.markDirty();
  QVERIFY(tracker.isDirty());
  QCOMPARE(spy.count(), 1);
  QCOMPARE(spy.at(0).at(0).toBool(), true);

  tracker.markClean();
  QVERIFY(!tracker.isDirty());
  QCOMPARE(spy.count(), 2);
  QCOMPARE(spy.at(1).at(0).toBool(), false);
}

void DirtyTrackerTest::perWorkspaceFlags() {
  DirtyTracker tracker;
  QSignalSpy   spy(&tracker, &DirtyTracker::dirtyStateChanged);
  const QUuid  a = QUuid::createUuid();
  const QUuid  b = QUuid::createUuid();

  tracker.markWorkspaceDirty(a);
  tracker.markWorkspaceDirty(b);
  QCOMPARE(spy.count(), 1);
  QVERIFY(tracker.isWorkspaceDirty(a));

  tracker.markWorkspaceClean(a);
  QVERIFY(!tracker.isWorkspaceDirty(a));
  QVERIFY(tracker.isDirty());
  QCOMPARE(spy.count(), 1);

  tracker.removeWorkspace(b);
  QVERIFY(!tracker.isDirty());
  QCOMPARE(spy.count(), 2);

  tracker.markWorkspaceClean(QUuid::createUuid());
  QCOMPARE(spy.count(), 2);
}

void DirtyTrackerTest::markCleanClearsEverything() {
  DirtyTracker tracker;
  tracker.markDirty();
  tracker.markWorkspaceDirty(QUuid::createUuid());

  QSignalSpy spy(&tracker, &DirtyTracker::dirtyStateChanged);
  tracker.markClean();
  QVERIFY(!tracker.isDirty());
  QCOMPARE(spy.count(), 1);
}

void DirtyTrackerTest::followsRegistry() {
  WorkspaceRegistry registry;

  auto       existing = std::make_unique<Workspace>(QStringLiteral("plain"), QStringLiteral("Existing"));
  Workspace* first    = existing.get();
  first->markDirty();
  QVERIFY(registry.addWorkspace(std::move(existing)));

  DirtyTracker tracker;
  tracker.attach(&registry);
  QVERIFY(tracker.isDirty());
  QVERIFY(tracker.isWorkspaceDirty(first->id()));

  QSignalSpy spy(&tracker, &DirtyTracker::dirtyStateChanged);
  first->markClean();
  QVERIFY(!tracker.isDirty());
  QCOMPARE(spy.count(), 1);

  auto       added  = std::make_unique<Workspace>(QStringLiteral("plain"), QStringLiteral("Added"));
  Workspace* second = added.get();
  QVERIFY(registry.addWorkspace(std::move(added)));
  second->markDirty();
  QVERIFY(tracker.isDirty());
  QCOMPARE(spy.count(), 2);

  // Removing the only dirty workspace clears the aggregate.
  const QUuid secondId = second->id();
  registry.closeWorkspace(second);
  QVERIFY(!tracker.isWorkspaceDirty(secondId));
  QVERIFY(!tracker.isDirty());
  QCOMPARE(spy.count(), 3);
}

QTEST_GUILESS_MAIN(DirtyTrackerTest)
#include "test_dirty_tracker.moc"
