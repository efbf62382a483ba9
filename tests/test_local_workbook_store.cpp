#include <QtTest>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include "workbook/LocalWorkbookStore.h"

using namespace SheetCalc;

namespace {

CellAddress at(const char *a1) { return *CellAddressing::parse(a1); }

const char *kBeamWorkbook = R"({
    "owner": "structures",
    "sheets": {
        "Sheet1": {
            "bounds": { "columns": 6, "rows": 20 },
            "cells": {
                "A1": "Span",
                "B4": 8,
                "B5": 50,
                "B6": "'=not a formula",
                "D4": "=B5*B4/8"
            },
            "computed": { "D4": { "value": 40, "version": 2 }, "B4": { "value": 1, "version": 1 } }
        }
    }
})";

} // namespace

class TestLocalWorkbookStore : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testPathFor();
    void testSpellingsOfOneWorkbookShareState();
    void testReadLiteralsAndFormulas();
    void testComputedValuesOnlyForFormulaCells();
    void testWriteAndFlush();
    void testWriteEmptyRemovesCell();
    void testWriteFormulaCellIsImmutable();
    void testEscapedTextSurvivesRoundTrip();
    void testOutOfBounds();
    void testHandleBoundsWhenSheetUnbounded();
    void testReadRange();
    void testStoreComputedValuesPersist();
    void testRevisionCountsWrites();
    void testExternalChangeDetected();
    void testExternalChangeWithUnflushedWrites();
    void testFlushRefusesToOverwriteExternalChange();
    void testMissingWorkbook();
    void testMissingSheet();
    void testCorruptFile();
    void testUnknownRootKeysPreserved();

private:
    QScopedPointer<QTemporaryDir> m_dir;
    WorkbookHandle m_handle;

    void writeWorkbook(const QString &id, const QByteArray &content) {
        QFile file(QDir(m_dir->path()).filePath(id + ".json"));
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        file.write(content);
    }

    QJsonObject readWorkbook(const QString &id) {
        QFile file(QDir(m_dir->path()).filePath(id + ".json"));
        if (!file.open(QIODevice::ReadOnly))
            return QJsonObject();
        return QJsonDocument::fromJson(file.readAll()).object();
    }

    void touchForward(const QString &id, int seconds = 60) {
        QFile file(QDir(m_dir->path()).filePath(id + ".json"));
        QVERIFY(file.open(QIODevice::ReadWrite));
        QVERIFY(file.setFileTime(QDateTime::currentDateTime().addSecs(seconds),
                                 QFileDevice::FileModificationTime));
    }
};

void TestLocalWorkbookStore::init() {
    m_dir.reset(new QTemporaryDir());
    QVERIFY(m_dir->isValid());
    writeWorkbook("beam", kBeamWorkbook);
    m_handle = WorkbookHandle();
    m_handle.workbookId = "beam";
}

void TestLocalWorkbookStore::cleanup() {
    m_dir.reset();
}

// ═══════════════════════════════════════════════════════════
// Reading
// ═══════════════════════════════════════════════════════════

void TestLocalWorkbookStore::testPathFor() {
    LocalWorkbookStore store("/data/workbooks");
    QCOMPARE(store.pathFor("beam"), QString("/data/workbooks/beam.json"));
    QCOMPARE(store.pathFor("beam.json"), QString("/data/workbooks/beam.json"));
    QCOMPARE(store.pathFor("/srv/wb/other.json"), QString("/srv/wb/other.json"));
}

void TestLocalWorkbookStore::testSpellingsOfOneWorkbookShareState() {
    LocalWorkbookStore store(m_dir->path());
    const QString canonical = store.canonicalId("beam");
    QCOMPARE(store.canonicalId("beam.json"), canonical);
    QCOMPARE(store.canonicalId(QDir(m_dir->path()).filePath("beam.json")), canonical);
    QCOMPARE(store.canonicalId(m_dir->path() + "/./beam.json"), canonical);
    QVERIFY(store.canonicalId("column") != canonical);

    WorkbookHandle withSuffix = m_handle;
    withSuffix.workbookId = "beam.json";

    // An unflushed write through one spelling is visible through the other
    QVERIFY(store.writeCell(m_handle, at("B4"), CellValue::number(11)));
    CellValue value;
    QVERIFY(store.readCell(withSuffix, at("B4"), &value));
    QCOMPARE(value.asNumber(), 11.0);
    QVERIFY(store.revision(withSuffix) == store.revision(m_handle));

    // Flushing either spelling writes the one file
    QVERIFY(store.flush(withSuffix));
    QCOMPARE(readWorkbook("beam").value("sheets").toObject()
                 .value("Sheet1").toObject()
                 .value("cells").toObject()
                 .value("B4").toDouble(), 11.0);
}

void TestLocalWorkbookStore::testReadLiteralsAndFormulas() {
    LocalWorkbookStore store(m_dir->path());
    CalcError err;

    CellValue value;
    QVERIFY2(store.readCell(m_handle, at("B4"), &value, &err), qPrintable(err.toString()));
    QCOMPARE(value.asNumber(), 8.0);

    QVERIFY(store.readCell(m_handle, at("A1"), &value));
    QCOMPARE(value.asText(), QString("Span"));

    QVERIFY(store.readCell(m_handle, at("C9"), &value));
    QVERIFY(value.isEmpty());

    std::optional<QString> formula;
    QVERIFY(store.readFormula(m_handle, at("D4"), &formula));
    QCOMPARE(formula.value_or(QString()), QString("=B5*B4/8"));

    QVERIFY(store.readFormula(m_handle, at("B4"), &formula));
    QVERIFY(!formula.has_value());

    // Computed value of a formula cell
    QVERIFY(store.readCell(m_handle, at("D4"), &value));
    QCOMPARE(value.asNumber(), 40.0);
}

void TestLocalWorkbookStore::testComputedValuesOnlyForFormulaCells() {
    LocalWorkbookStore store(m_dir->path());
    auto d4 = store.cell(m_handle, at("D4"));
    QVERIFY(d4.has_value());
    QVERIFY(d4->isFormula());
    QCOMPARE(d4->lastEvaluatedVersion, quint64(2));

    // "computed" entry for a literal cell is ignored
    auto b4 = store.cell(m_handle, at("B4"));
    QVERIFY(b4.has_value());
    QCOMPARE(b4->literal.asNumber(), 8.0);
    QCOMPARE(b4->lastEvaluatedVersion, quint64(0));
}

// ═══════════════════════════════════════════════════════════
// Writing
// ═══════════════════════════════════════════════════════════

void TestLocalWorkbookStore::testWriteAndFlush() {
    LocalWorkbookStore store(m_dir->path());
    CalcError err;
    QVERIFY(store.writeCell(m_handle, at("B4"), CellValue::number(10), &err));

    // Not durable before flush
    QCOMPARE(readWorkbook("beam").value("sheets").toObject().value("Sheet1").toObject()
                 .value("cells").toObject().value("B4").toDouble(), 8.0);

    QVERIFY2(store.flush(m_handle, &err), qPrintable(err.toString()));
    const QJsonObject cells = readWorkbook("beam").value("sheets").toObject()
                                  .value("Sheet1").toObject().value("cells").toObject();
    QCOMPARE(cells.value("B4").toDouble(), 10.0);
    QCOMPARE(cells.value("D4").toString(), QString("=B5*B4/8"));

    // A second store sees the flushed value
    LocalWorkbookStore other(m_dir->path());
    CellValue value;
    QVERIFY(other.readCell(m_handle, at("B4"), &value));
    QCOMPARE(value.asNumber(), 10.0);
}

void TestLocalWorkbookStore::testWriteEmptyRemovesCell() {
    LocalWorkbookStore store(m_dir->path());
    QVERIFY(store.writeCell(m_handle, at("B5"), CellValue()));
    QVERIFY(store.flush(m_handle));
    QVERIFY(!store.cell(m_handle, at("B5")).has_value());
    QVERIFY(!readWorkbook("beam").value("sheets").toObject().value("Sheet1").toObject()
                 .value("cells").toObject().contains("B5"));
}

void TestLocalWorkbookStore::testWriteFormulaCellIsImmutable() {
    LocalWorkbookStore store(m_dir->path());
    CalcError err;
    QVERIFY(!store.writeCell(m_handle, at("D4"), CellValue::number(1), &err));
    QCOMPARE(err.code, ErrorCode::ImmutableCell);
    QCOMPARE(err.subjects, QStringList{"D4"});

    std::optional<QString> formula;
    QVERIFY(store.readFormula(m_handle, at("D4"), &formula));
    QVERIFY(formula.has_value());
}

void TestLocalWorkbookStore::testEscapedTextSurvivesRoundTrip() {
    LocalWorkbookStore store(m_dir->path());
    CellValue value;
    QVERIFY(store.readCell(m_handle, at("B6"), &value));
    QVERIFY(value.isText());
    QCOMPARE(value.asText(), QString("=not a formula"));

    QVERIFY(store.writeCell(m_handle, at("C1"), CellValue::text("#DIV/0!")));
    QVERIFY(store.writeCell(m_handle, at("C2"), CellValue::text("=B4")));
    QVERIFY(store.flush(m_handle));

    LocalWorkbookStore reopened(m_dir->path());
    QVERIFY(reopened.readCell(m_handle, at("C1"), &value));
    QVERIFY(value.isText());
    QCOMPARE(value.asText(), QString("#DIV/0!"));

    std::optional<QString> formula;
    QVERIFY(reopened.readFormula(m_handle, at("C2"), &formula));
    QVERIFY(!formula.has_value());
    QVERIFY(reopened.readFormula(m_handle, at("B6"), &formula));
    QVERIFY(!formula.has_value());
}

void TestLocalWorkbookStore::testOutOfBounds() {
    LocalWorkbookStore store(m_dir->path());
    CalcError err;
    CellValue value;
    QVERIFY(!store.readCell(m_handle, at("G1"), &value, &err));
    QCOMPARE(err.code, ErrorCode::AddressOutOfBounds);

    err = CalcError();
    QVERIFY(!store.writeCell(m_handle, at("A21"), CellValue::number(1), &err));
    QCOMPARE(err.code, ErrorCode::AddressOutOfBounds);
}

void TestLocalWorkbookStore::testHandleBoundsWhenSheetUnbounded() {
    writeWorkbook("open", R"({ "sheets": { "Sheet1": { "cells": { "A1": 1 } } } })");
    LocalWorkbookStore store(m_dir->path());

    WorkbookHandle handle;
    handle.workbookId = "open";
    CellValue value;
    QVERIFY(store.readCell(handle, at("ZZ999"), &value));

    handle.bounds.maxColumns = 3;
    CalcError err;
    QVERIFY(!store.readCell(handle, at("D1"), &value, &err));
    QCOMPARE(err.code, ErrorCode::AddressOutOfBounds);
}

void TestLocalWorkbookStore::testReadRange() {
    LocalWorkbookStore store(m_dir->path());
    CellMatrix matrix;
    QVERIFY(store.readRange(m_handle, *CellAddressing::parseRange("B4:D5"), &matrix));
    QCOMPARE(int(matrix.size()), 2);
    QCOMPARE(int(matrix[0].size()), 3);
    QCOMPARE(matrix[0][0].asNumber(), 8.0);
    QVERIFY(matrix[0][1].isEmpty());
    QCOMPARE(matrix[0][2].asNumber(), 40.0);
    QCOMPARE(matrix[1][0].asNumber(), 50.0);

    CalcError err;
    QVERIFY(!store.readRange(m_handle, *CellAddressing::parseRange("A1:Z1"), &matrix, &err));
    QCOMPARE(err.code, ErrorCode::AddressOutOfBounds);
}

void TestLocalWorkbookStore::testStoreComputedValuesPersist() {
    LocalWorkbookStore store(m_dir->path());
    QHash<CellAddress, CellValue> computed;
    computed.insert(at("D4"), CellValue::error(CellErrorKind::DivisionByZero));
    computed.insert(at("B4"), CellValue::number(99));  // literal: ignored
    QVERIFY(store.storeComputedValues(m_handle, computed, 7));
    QVERIFY(store.flush(m_handle));

    LocalWorkbookStore reopened(m_dir->path());
    auto d4 = reopened.cell(m_handle, at("D4"));
    QVERIFY(d4.has_value());
    QCOMPARE(d4->formula, QString("=B5*B4/8"));
    QVERIFY(d4->cachedValue.isError());
    QCOMPARE(d4->cachedValue.errorKind(), CellErrorKind::DivisionByZero);
    QCOMPARE(d4->lastEvaluatedVersion, quint64(7));

    CellValue b4;
    QVERIFY(reopened.readCell(m_handle, at("B4"), &b4));
    QCOMPARE(b4.asNumber(), 8.0);
}

// ═══════════════════════════════════════════════════════════
// Revisions
// ═══════════════════════════════════════════════════════════

void TestLocalWorkbookStore::testRevisionCountsWrites() {
    LocalWorkbookStore store(m_dir->path());
    CellValue value;
    QVERIFY(store.readCell(m_handle, at("B4"), &value));
    const std::optional<quint64> before = store.revision(m_handle);
    QVERIFY(before.has_value());
    auto formulasBefore = store.formulaRevision(m_handle);
    QVERIFY(formulasBefore.has_value());

    QVERIFY(store.writeCell(m_handle, at("B4"), CellValue::number(12)));
    QVERIFY(store.writeCell(m_handle, at("B5"), CellValue::number(13)));
    QVERIFY(store.revision(m_handle) == *before + 2);
    QVERIFY(store.formulaRevision(m_handle) == formulasBefore);

    // A rejected write does not count
    QVERIFY(!store.writeCell(m_handle, at("D4"), CellValue::number(1)));
    QVERIFY(store.revision(m_handle) == *before + 2);

    QVERIFY(store.flush(m_handle));
    QVERIFY(store.revision(m_handle) == *before + 2);
}

void TestLocalWorkbookStore::testExternalChangeDetected() {
    LocalWorkbookStore store(m_dir->path());
    CellValue value;
    QVERIFY(store.readCell(m_handle, at("B4"), &value));
    const std::optional<quint64> before = store.revision(m_handle);
    const auto formulasBefore = store.formulaRevision(m_handle);
    QVERIFY(before.has_value());

    writeWorkbook("beam", R"({ "sheets": { "Sheet1": { "cells": { "B4": 3, "D4": "=B4*2" } } } })");
    touchForward("beam");

    const std::optional<quint64> after = store.revision(m_handle);
    QVERIFY(after.has_value());
    QVERIFY(*after > *before);
    QVERIFY(store.readCell(m_handle, at("B4"), &value));
    QCOMPARE(value.asNumber(), 3.0);

    std::optional<QString> formula;
    QVERIFY(store.readFormula(m_handle, at("D4"), &formula));
    QCOMPARE(formula.value_or(QString()), QString("=B4*2"));
    QVERIFY(store.formulaRevision(m_handle) != formulasBefore);
}

void TestLocalWorkbookStore::testExternalChangeWithUnflushedWrites() {
    LocalWorkbookStore store(m_dir->path());
    QVERIFY(store.writeCell(m_handle, at("B4"), CellValue::number(12)));

    writeWorkbook("beam", R"({ "sheets": { "Sheet1": { "cells": { "B4": 3, "B5": 4 } } } })");
    touchForward("beam");

    // Nothing can vouch for the revision while the conflict is pending
    QVERIFY(!store.revision(m_handle).has_value());
    QVERIFY(!store.formulaRevision(m_handle).has_value());

    // The access that notices the conflict fails instead of serving stale data
    CalcError err;
    CellValue value;
    QVERIFY(!store.readCell(m_handle, at("B5"), &value, &err));
    QCOMPARE(err.code, ErrorCode::BackendUnavailable);
    QVERIFY(err.message.contains("unflushed"));

    // Then the external content is served; the lost write stays lost
    QVERIFY(store.readCell(m_handle, at("B4"), &value));
    QCOMPARE(value.asNumber(), 3.0);
    QVERIFY(store.revision(m_handle).has_value());

    // Later writes work normally
    QVERIFY(store.writeCell(m_handle, at("B5"), CellValue::number(6)));
    QVERIFY(store.flush(m_handle));
    const QJsonObject cells = readWorkbook("beam").value("sheets").toObject()
                                  .value("Sheet1").toObject()
                                  .value("cells").toObject();
    QCOMPARE(cells.value("B4").toDouble(), 3.0);
    QCOMPARE(cells.value("B5").toDouble(), 6.0);
}

void TestLocalWorkbookStore::testFlushRefusesToOverwriteExternalChange() {
    LocalWorkbookStore store(m_dir->path());
    QVERIFY(store.writeCell(m_handle, at("B4"), CellValue::number(12)));

    writeWorkbook("beam", R"({ "edited": "elsewhere", "sheets": { "Sheet1": { "cells": { "B4": 3 } } } })");
    touchForward("beam");

    CalcError err;
    QVERIFY(!store.flush(m_handle, &err));
    QCOMPARE(err.code, ErrorCode::BackendUnavailable);

    const QJsonObject onDisk = readWorkbook("beam");
    QCOMPARE(onDisk.value("edited").toString(), QString("elsewhere"));
    QCOMPARE(onDisk.value("sheets").toObject()
                 .value("Sheet1").toObject()
                 .value("cells").toObject()
                 .value("B4").toDouble(), 3.0);

    // Nothing left to write
    QVERIFY(store.flush(m_handle));
    QCOMPARE(readWorkbook("beam").value("edited").toString(), QString("elsewhere"));
}

// ═══════════════════════════════════════════════════════════
// Failures
// ═══════════════════════════════════════════════════════════

void TestLocalWorkbookStore::testMissingWorkbook() {
    LocalWorkbookStore store(m_dir->path());
    WorkbookHandle handle;
    handle.workbookId = "absent";
    CalcError err;
    CellValue value;
    QVERIFY(!store.readCell(handle, at("A1"), &value, &err));
    QCOMPARE(err.code, ErrorCode::BackendUnavailable);
    QVERIFY(!store.formulaRevision(handle).has_value());
}

void TestLocalWorkbookStore::testMissingSheet() {
    LocalWorkbookStore store(m_dir->path());
    WorkbookHandle handle = m_handle;
    handle.sheet = "Design";
    CalcError err;
    CellValue value;
    QVERIFY(!store.readCell(handle, at("A1"), &value, &err));
    QCOMPARE(err.code, ErrorCode::BackendUnavailable);
    QCOMPARE(err.subjects, QStringList{"beam/Design"});
}

void TestLocalWorkbookStore::testCorruptFile() {
    writeWorkbook("broken", "{ \"sheets\": ");
    LocalWorkbookStore store(m_dir->path());
    WorkbookHandle handle;
    handle.workbookId = "broken";
    CalcError err;
    CellValue value;
    QVERIFY(!store.readCell(handle, at("A1"), &value, &err));
    QCOMPARE(err.code, ErrorCode::BackendUnavailable);

    writeWorkbook("badkey", R"({ "sheets": { "Sheet1": { "cells": { "B-4": 1 } } } })");
    handle.workbookId = "badkey";
    err = CalcError();
    QVERIFY(!store.readCell(handle, at("A1"), &value, &err));
    QCOMPARE(err.code, ErrorCode::AddressMalformed);
}

void TestLocalWorkbookStore::testUnknownRootKeysPreserved() {
    LocalWorkbookStore store(m_dir->path());
    QVERIFY(store.writeCell(m_handle, at("B4"), CellValue::number(1)));
    QVERIFY(store.flush(m_handle));
    const QJsonObject root = readWorkbook("beam");
    QCOMPARE(root.value("owner").toString(), QString("structures"));
    QCOMPARE(root.value("sheets").toObject().value("Sheet1").toObject()
                 .value("bounds").toObject().value("columns").toInt(), 6);
}

QTEST_APPLESS_MAIN(TestLocalWorkbookStore)
#include "test_local_workbook_store.moc"
