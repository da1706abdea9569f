#include "deskkit/data/CellClipboard.hpp"
#include "deskkit/data/TabularData.hpp"
#include "deskkit/workspace/TableWorkspace.hpp"

#include <QSignalSpy>
#include <QtTest>

using deskkit::data::CellBlock;
using deskkit::data::CellRange;
using deskkit::data::ImportResult;
using deskkit::data::TabularColumn;
using deskkit::data::TabularRow;
using deskkit::workspace::TableWorkspace;

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

class CellClipboardTest : public QObject {
  Q_OBJECT

 private slots:
  void rangeNormalizesCorners();
  void writesOneLinePerRow();
  void quotesCellsThatNeedIt();
  void readsSpreadsheetText();
  void unbalancedQuoteIsTakenLiterally();
  void copiesClippedRange();
  void pastesFromAnchorAndClips();
  void pasteOutsideTableWritesNothing();
};

void CellClipboardTest::rangeNormalizesCorners() {
  const CellRange range{4, 3, 1, 0};
  QCOMPARE(range.top(), 1);
  QCOMPARE(range.bottom(), 4);
  QCOMPARE(range.left(), 0);
  QCOMPARE(range.right(), 3);
  QCOMPARE(range.rowCount(), 4);
  QCOMPARE(range.columnCount(), 4);

  const CellRange single = CellRange::singleCell(2, 5);
  QCOMPARE(single.rowCount(), 1);
  QCOMPARE(single.columnCount(), 1);
  QCOMPARE(single.left(), 5);
}

void CellClipboardTest::writesOneLinePerRow() {
  const CellBlock block = {
      {QStringLiteral("a"), QStringLiteral("b")},
      {QString(), QStringLiteral("d")},
  };
  QCOMPARE(deskkit::data::toTabSeparated(block), QStringLiteral("a\tb\n\td\n"));
  QVERIFY(deskkit::data::toTabSeparated(CellBlock()).isEmpty());
}

void CellClipboardTest::quotesCellsThatNeedIt() {
  const CellBlock block = {
      {QStringLiteral("two\nlines"), QStringLiteral("say \"hi\""), QStringLiteral("\"quoted")},
      {QStringLiteral("tab\there"), QStringLiteral("plain"), QString()},
  };
  const QString text = deskkit::data::toTabSeparated(block);
  QCOMPARE(text,
           QStringLiteral("\"two\nlines\"\tsay \"hi\"\t\"\"\"quoted\"\n"
                          "\"tab\there\"\tplain\t\n"));
  QVERIFY(deskkit::data::fromTabSeparated(text) == block);
}

void CellClipboardTest::readsSpreadsheetText() {
  const CellBlock block = deskkit::data::fromTabSeparated(QStringLiteral("1\t2\t3\r\n\r\n4\r\n5\t6\r\n"));
  QCOMPARE(block.size(), std::size_t(3));
  QCOMPARE(block[0], (QStringList{QStringLiteral("1"), QStringLiteral("2"), QStringLiteral("3")}));
  QCOMPARE(block[1], (QStringList{QStringLiteral("4"), QString(), QString()}));
  QCOMPARE(block[2], (QStringList{QStringLiteral("5"), QStringLiteral("6"), QString()}));

  QVERIFY(deskkit::data::fromTabSeparated(QString()).empty());
  QCOMPARE(deskkit::data::fromTabSeparated(QStringLiteral("solo")).size(), std::size_t(1));
}

void CellClipboardTest::unbalancedQuoteIsTakenLiterally() {
  const CellBlock block = deskkit::data::fromTabSeparated(QStringLiteral("\"open\tx\ny\tz"));
  QCOMPARE(block.size(), std::size_t(2));
  QCOMPARE(block[0], (QStringList{QStringLiteral("\"open"), QStringLiteral("x")}));
  QCOMPARE(block[1], (QStringList{QStringLiteral("y"), QStringLiteral("z")}));
}

void CellClipboardTest::copiesClippedRange() {
  TableWorkspace table(grid3x3(), QStringLiteral("grid.csv"));

  QCOMPARE(table.copyRange(CellRange{2, 1, 1, 2}), QStringLiteral("r1c1\tr1c2\nr2c1\tr2c2\n"));
  QCOMPARE(table.copyRange(CellRange::singleCell(0, 0)), QStringLiteral("r0c0\n"));
  QCOMPARE(table.copyRange(CellRange{1, 2, 7, 9}), QStringLiteral("r1c2\nr2c2\n"));
  QVERIFY(table.copyRange(CellRange::singleCell(5, 5)).isEmpty());
}

void CellClipboardTest::pastesFromAnchorAndClips() {
  TableWorkspace table(grid3x3(), QStringLiteral("grid.csv"));
  QSignalSpy     changed(&table, &TableWorkspace::cellChanged);

  QCOMPARE(table.pasteText(1, 1, QStringLiteral("a\tb\tc\nd\te\tf\ng\th\ti\n")), 4);
  QCOMPARE(table.cell(1, 1), QStringLiteral("a"));
  QCOMPARE(table.cell(1, 2), QStringLiteral("b"));
  QCOMPARE(table.cell(2, 1), QStringLiteral("d"));
  QCOMPARE(table.cell(2, 2), QStringLiteral("e"));
  QCOMPARE(table.cell(0, 0), QStringLiteral("r0c0"));
  QCOMPARE(table.rowCount(), 3);
  QCOMPARE(table.columnCount(), 3);
  QCOMPARE(changed.count(), 4);
  QVERIFY(table.isDirty());

  // Copy then paste elsewhere moves the block unchanged.
  const QString copied = table.copyRange(CellRange{1, 1, 2, 2});
  QCOMPARE(table.pasteText(0, 0, copied), 4);
  QCOMPARE(table.cell(0, 0), QStringLiteral("a"));
  QCOMPARE(table.cell(1, 1), QStringLiteral("e"));
}

void CellClipboardTest::pasteOutsideTableWritesNothing() {
  TableWorkspace table(grid3x3(), QStringLiteral("grid.csv"));

  QCOMPARE(table.pasteText(3, 0, QStringLiteral("x")), 0);
  QCOMPARE(table.pasteText(0, 3, QStringLiteral("x")), 0);
  QCOMPARE(table.pasteText(-1, 0, QStringLiteral("x")), 0);
  QCOMPARE(table.pasteText(0, 0, QString()), 0);
  QVERIFY(!table.isDirty());
}

QTEST_GUILESS_MAIN(CellClipboardTest)
#include "test_cell_clipboard.moc"
