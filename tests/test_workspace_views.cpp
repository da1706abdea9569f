#include "deskkit/data/TabularData.hpp"
#include "deskkit/ui/WorkspaceTabs.hpp"
#include "deskkit/ui/WorkspaceViews.hpp"
#include "deskkit/workspace/NotesWorkspace.hpp"
#include "deskkit/workspace/TableWorkspace.hpp"
#include "deskkit/workspace/Workspace.hpp"
#include "deskkit/workspace/WorkspaceRegistry.hpp"

#include <QClipboard>
#include <QGuiApplication>
#include <QLabel>
#include <QTableWidget>
#include <QtTest>

#include <memory>
#include <utility>

using deskkit::data::ImportResult;
using deskkit::data::TabularColumn;
using deskkit::data::TabularRow;
using deskkit::ui::NotesView;
using deskkit::ui::TableView;
using deskkit::ui::WorkspaceTabs;
using deskkit::ui::WorkspaceViewFactory;
using deskkit::workspace::NotesWorkspace;
using deskkit::workspace::TableWorkspace;
using deskkit::workspace::Workspace;
using deskkit::workspace::WorkspaceRegistry;
using deskkit::workspace::WorkspaceState;

namespace {

ImportResult grid3x3() {
  ImportResult result;
  result.success = true;
  for (int c = 0; c < 3; ++c) {
    result.columns.push_back(TabularColumn{deskkit::data::columnIdFor(c), QStringLiteral("C%1").arg(c), c});
  }
  for (int r = 0; r < 3; ++r) {
    QStringList values;
    for (int c = 0; c < 3; ++c) {
      values.push_back(QStringLiteral("r%1c%2").arg(r).arg(c));
    }
    result.rows.push_back(TabularRow{r, values});
  }
  return result;
}

}  // namespace

class WorkspaceViewsTest : public QObject {
  Q_OBJECT

 private slots:
  void buildsViewsForKnownTypes();
  void mismatchedWorkspaceGetsPlaceholder();
  void tabsStayOnActiveWhenSwitchIsRefused();
  void tableCopiesSelectionAsText();
  void tablePastesAtCurrentCell();
  void tableFollowsSearchAndReplace();
};

void WorkspaceViewsTest::buildsViewsForKnownTypes() {
  const WorkspaceViewFactory factory = WorkspaceViewFactory::withDefaultViews();
  NotesWorkspace             notes;
  TableWorkspace             table(grid3x3(), QStringLiteral("grid.csv"));
  Workspace                  other(QStringLiteral("chart"));

  std::unique_ptr<QWidget> notesView(factory.createView(notes, nullptr));
  std::unique_ptr<QWidget> tableView(factory.createView(table, nullptr));
  std::unique_ptr<QWidget> otherView(factory.createView(other, nullptr));

  QVERIFY(qobject_cast<NotesView*>(notesView.get()) != nullptr);
  QVERIFY(qobject_cast<TableView*>(tableView.get()) != nullptr);
  QCOMPARE(otherView->objectName(), QStringLiteral("viewPlaceholder"));
}

void WorkspaceViewsTest::mismatchedWorkspaceGetsPlaceholder() {
  const WorkspaceViewFactory factory = WorkspaceViewFactory::withDefaultViews();
  Workspace                  fakeNotes(NotesWorkspace::kViewType);
  Workspace                  fakeTable(TableWorkspace::kViewType);

  std::unique_ptr<QWidget> notesView(factory.createView(fakeNotes, nullptr));
  std::unique_ptr<QWidget> tableView(factory.createView(fakeTable, nullptr));

  auto* notesLabel = qobject_cast<QLabel*>(notesView.get());
  QVERIFY(notesLabel != nullptr);
  QCOMPARE(notesLabel->objectName(), QStringLiteral("viewPlaceholder"));
  QCOMPARE(notesLabel->text(), QStringLiteral("No view for 'notes'"));
  QVERIFY(qobject_cast<QLabel*>(tableView.get()) != nullptr);
}

void WorkspaceViewsTest::tabsStayOnActiveWhenSwitchIsRefused() {
  WorkspaceRegistry registry(5);
  WorkspaceTabs     tabs(registry, WorkspaceViewFactory::withDefaultViews());

  auto       first     = std::make_unique<NotesWorkspace>(QStringLiteral("first"));
  Workspace* firstPtr  = first.get();
  auto       second    = std::make_unique<NotesWorkspace>(QStringLiteral("second"));
  Workspace* secondPtr = second.get();
  QVERIFY(registry.addWorkspace(std::move(first)));
  QVERIFY(registry.addWorkspace(std::move(second)));
  QCOMPARE(registry.activeWorkspace(), secondPtr);
  QCOMPARE(tabs.currentWidget(), tabs.viewFor(secondPtr));

  // A dirty workspace waiting on its close prompt cannot be activated.
  Workspace::CloseDecision pendingDecision;
  firstPtr->markDirty();
  firstPtr->setCloseGuard([&pendingDecision](Workspace&, Workspace::CloseDecision decide) {
    pendingDecision = std::move(decide);
  });
  registry.closeWorkspace(firstPtr);
  QCOMPARE(firstPtr->state(), WorkspaceState::Closing);

  tabs.setCurrentIndex(tabs.indexOf(tabs.viewFor(firstPtr)));
  QCOMPARE(registry.activeWorkspace(), secondPtr);
  QCOMPARE(tabs.currentWidget(), tabs.viewFor(secondPtr));

  QVERIFY(static_cast<bool>(pendingDecision));
  pendingDecision(false);
  QCOMPARE(firstPtr->state(), WorkspaceState::Inactive);

  tabs.setCurrentIndex(tabs.indexOf(tabs.viewFor(firstPtr)));
  QCOMPARE(registry.activeWorkspace(), firstPtr);
  QCOMPARE(tabs.currentWidget(), tabs.viewFor(firstPtr));
}

void WorkspaceViewsTest::tableCopiesSelectionAsText() {
  TableWorkspace table(grid3x3(), QStringLiteral("grid.csv"));
  TableView      view(table);

  view.setRangeSelected(QTableWidgetSelectionRange(1, 0, 2, 1), true);
  view.copySelection();
  QCOMPARE(QGuiApplication::clipboard()->text(), QStringLiteral("r1c0\tr1c1\nr2c0\tr2c1\n"));

  view.clearSelection();
  view.setCurrentCell(0, 2);
  view.copySelection();
  QCOMPARE(QGuiApplication::clipboard()->text(), QStringLiteral("r0c2\n"));
}

void WorkspaceViewsTest::tablePastesAtCurrentCell() {
  TableWorkspace table(grid3x3(), QStringLiteral("grid.csv"));
  TableView      view(table);

  QGuiApplication::clipboard()->setText(QStringLiteral("x\ty\tz\n"));
  view.setCurrentCell(1, 1);
  QCOMPARE(view.pasteClipboard(), 2);
  QCOMPARE(table.cell(1, 1), QStringLiteral("x"));
  QCOMPARE(table.cell(1, 2), QStringLiteral("y"));
  QCOMPARE(view.item(1, 1)->text(), QStringLiteral("x"));
  QCOMPARE(view.item(1, 2)->text(), QStringLiteral("y"));
  QCOMPARE(view.rowCount(), 3);
  QCOMPARE(view.columnCount(), 3);
  QVERIFY(table.isDirty());
}

void WorkspaceViewsTest::tableFollowsSearchAndReplace() {
  TableWorkspace table(grid3x3(), QStringLiteral("grid.csv"));
  TableView      view(table);

  QCOMPARE(view.search().findAll(QStringLiteral("R2C1")), 1);
  QCOMPARE(view.currentRow(), 2);
  QCOMPARE(view.currentColumn(), 1);

  QCOMPARE(view.search().replaceAll(QStringLiteral("r0"), QStringLiteral("top")), 3);
  QCOMPARE(view.item(0, 0)->text(), QStringLiteral("topc0"));
  QCOMPARE(view.item(0, 2)->text(), QStringLiteral("topc2"));
  QCOMPARE(view.item(1, 0)->text(), QStringLiteral("r1c0"));
}

QTEST_MAIN(WorkspaceViewsTest)
#include "test_workspace_views.moc"
