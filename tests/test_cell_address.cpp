#include <QtTest>
#include "core/CellAddress.h"
#include <climits>

using namespace SheetCalc;

class TestCellAddress : public QObject {
    Q_OBJECT

private slots:
    void testParseSimple();
    void testParseCaseInsensitive();
    void testParseAbsoluteMarkers();
    void testParseMultiLetterColumns();
    void testParseMalformed_data();
    void testParseMalformed();
    void testOutOfBounds();
    void testFormat();
    void testRoundTrip();
    void testColumnLettersBijective();
    void testLetterLimit();
    void testParseRange();
    void testRangeNormalizes();
    void testRangeContains();
    void testOrdering();
};

void TestCellAddress::testParseSimple() {
    auto a = CellAddressing::parse("B14");
    QVERIFY(a.has_value());
    QCOMPARE(a->column, 2);
    QCOMPARE(a->row, 14);
}

void TestCellAddress::testParseCaseInsensitive() {
    auto lower = CellAddressing::parse("ab7");
    auto upper = CellAddressing::parse("AB7");
    QVERIFY(lower && upper);
    QVERIFY(*lower == *upper);
    QCOMPARE(lower->column, 28);
}

void TestCellAddress::testParseAbsoluteMarkers() {
    auto a = CellAddressing::parse("$B$4");
    QVERIFY(a.has_value());
    QCOMPARE(a->toString(), QString("B4"));
    QVERIFY(CellAddressing::parse("$B4").has_value());
    QVERIFY(CellAddressing::parse("B$4").has_value());
}

void TestCellAddress::testParseMultiLetterColumns() {
    QCOMPARE(CellAddressing::parse("Z1")->column, 26);
    QCOMPARE(CellAddressing::parse("AA1")->column, 27);
    QCOMPARE(CellAddressing::parse("AZ1")->column, 52);
    QCOMPARE(CellAddressing::parse("BA1")->column, 53);
    QCOMPARE(CellAddressing::parse("ZZ1")->column, 702);
    QCOMPARE(CellAddressing::parse("AAA1")->column, 703);
}

void TestCellAddress::testParseMalformed_data() {
    QTest::addColumn<QString>("text");
    QTest::newRow("empty") << "";
    QTest::newRow("blank") << "   ";
    QTest::newRow("dash") << "B-4";
    QTest::newRow("digits first") << "4B";
    QTest::newRow("no row") << "B";
    QTest::newRow("no column") << "14";
    QTest::newRow("row zero") << "A0";
    QTest::newRow("trailing junk") << "B4x";
    QTest::newRow("inner space") << "B 4";
    QTest::newRow("double dollar") << "$$B4";
    QTest::newRow("too many letters") << "ABCDEFGH1";
    QTest::newRow("row overflow") << "A99999999999";
}

void TestCellAddress::testParseMalformed() {
    QFETCH(QString, text);
    CalcError err;
    auto a = CellAddressing::parse(text, &err);
    QVERIFY(!a.has_value());
    QCOMPARE(err.code, ErrorCode::AddressMalformed);
}

void TestCellAddress::testOutOfBounds() {
    SheetBounds bounds;
    bounds.maxColumns = 4;
    bounds.maxRows = 10;

    CalcError err;
    QVERIFY(CellAddressing::parse("D10", bounds, &err).has_value());
    QVERIFY(!err.isSet());

    QVERIFY(!CellAddressing::parse("E1", bounds, &err).has_value());
    QCOMPARE(err.code, ErrorCode::AddressOutOfBounds);

    err = CalcError();
    QVERIFY(!CellAddressing::parse("A11", bounds, &err).has_value());
    QCOMPARE(err.code, ErrorCode::AddressOutOfBounds);

    // Malformed wins over bounds
    err = CalcError();
    QVERIFY(!CellAddressing::parse("A-1", bounds, &err).has_value());
    QCOMPARE(err.code, ErrorCode::AddressMalformed);

    // Unbounded sheet accepts anything well-formed
    QVERIFY(CellAddressing::parse("XFD1048576", SheetBounds()).has_value());
}

void TestCellAddress::testFormat() {
    QCOMPARE(CellAddressing::format(CellAddress(2, 14)), QString("B14"));
    QCOMPARE(CellAddressing::format(CellAddress(27, 1)), QString("AA1"));
    QCOMPARE(CellAddressing::format(CellAddress(16384, 3)), QString("XFD3"));
    QVERIFY(CellAddressing::format(CellAddress(0, 1)).isEmpty());
}

void TestCellAddress::testRoundTrip() {
    const QVector<int> columns = {1, 2, 25, 26, 27, 51, 52, 53, 701, 702, 703, 16384, 18278, 18279,
                                  475254, 475255, 12356630, INT_MAX};
    const QVector<int> rows = {1, 2, 9, 10, 99, 1048576, 999999999, INT_MAX};
    for (int column : columns) {
        for (int row : rows) {
            const CellAddress address(column, row);
            auto parsed = CellAddressing::parse(CellAddressing::format(address));
            QVERIFY2(parsed.has_value(), qPrintable(CellAddressing::format(address)));
            QVERIFY(*parsed == address);
        }
    }
}

void TestCellAddress::testColumnLettersBijective() {
    for (int column = 1; column <= 20000; ++column)
        QCOMPARE(CellAddressing::lettersToColumn(CellAddressing::columnToLetters(column)), column);
}

void TestCellAddress::testLetterLimit() {
    QCOMPARE(int(CellAddressing::columnToLetters(INT_MAX).size()), CellAddressing::kMaxColumnLetters);
    QCOMPARE(CellAddressing::lettersToColumn("ZZZZZZZ"), 0);  // exceeds INT_MAX
    QCOMPARE(CellAddressing::lettersToColumn("A1"), 0);
}

void TestCellAddress::testParseRange() {
    auto r = CellAddressing::parseRange("A1:C3");
    QVERIFY(r.has_value());
    QVERIFY(r->topLeft == CellAddress(1, 1));
    QVERIFY(r->bottomRight == CellAddress(3, 3));
    QCOMPARE(r->cellCount(), qint64(9));
    QCOMPARE(r->toString(), QString("A1:C3"));

    auto single = CellAddressing::parseRange("B4");
    QVERIFY(single.has_value());
    QCOMPARE(single->cellCount(), qint64(1));
    QCOMPARE(single->toString(), QString("B4"));

    CalcError err;
    QVERIFY(!CellAddressing::parseRange("A1:B2:C3", &err).has_value());
    QCOMPARE(err.code, ErrorCode::AddressMalformed);
    QVERIFY(!CellAddressing::parseRange("A1:", &err).has_value());
}

void TestCellAddress::testRangeNormalizes() {
    auto r = CellAddressing::parseRange("C3:A1");
    QVERIFY(r.has_value());
    QCOMPARE(r->toString(), QString("A1:C3"));

    auto mixed = CellAddressing::parseRange("A3:C1");
    QVERIFY(mixed.has_value());
    QVERIFY(mixed->topLeft.column <= mixed->bottomRight.column);
    QVERIFY(mixed->topLeft.row <= mixed->bottomRight.row);
}

void TestCellAddress::testRangeContains() {
    const CellRange r(CellAddress(2, 2), CellAddress(4, 5));
    QVERIFY(CellAddressing::rangeContains(r, CellAddress(2, 2)));
    QVERIFY(CellAddressing::rangeContains(r, CellAddress(4, 5)));
    QVERIFY(CellAddressing::rangeContains(r, CellAddress(3, 3)));
    QVERIFY(!CellAddressing::rangeContains(r, CellAddress(1, 3)));
    QVERIFY(!CellAddressing::rangeContains(r, CellAddress(3, 6)));
}

void TestCellAddress::testOrdering() {
    QVERIFY(CellAddress(2, 1) < CellAddress(1, 2));  // row-major
    QVERIFY(CellAddress(1, 1) < CellAddress(2, 1));
    QVERIFY(!(CellAddress(1, 1) < CellAddress(1, 1)));
}

QTEST_APPLESS_MAIN(TestCellAddress)
#include "test_cell_address.moc"
