#ifndef WORKBOOK_STORE_H
#define WORKBOOK_STORE_H

/**
 * @file WorkbookStore.h
 * @brief Uniform cell access over a backing workbook
 *
 * Two backends implement this capability set: a local JSON workbook file
 * (durable on flush) and the remote spreadsheet API (durable per write).
 * The orchestrator only ever talks to this interface.
 *
 * A WorkbookHandle names the workbook and sheet explicitly on every call;
 * there is no ambient "current workbook".
 */

#include "core/CalcError.h"
#include "core/CellAddress.h"
#include "core/CellValue.h"
#include <QHash>
#include <QString>
#include <QVector>
#include <optional>

namespace SheetCalc {

struct WorkbookHandle {
    QString workbookId;
    QString sheet = "Sheet1";
    SheetBounds bounds;

    QString toString() const { return workbookId + "/" + sheet; }
};

/**
 * @brief Raw cell state: either a literal or a formula plus its last
 *        computed value.
 */
struct Cell {
    CellAddress address;
    QString formula;                 // non-empty for formula cells ("=B5*B4/8")
    CellValue literal;               // literal cells
    CellValue cachedValue;           // formula cells: last computed value
    quint64 lastEvaluatedVersion = 0;

    bool isFormula() const { return !formula.isEmpty(); }
    CellValue value() const { return isFormula() ? cachedValue : literal; }
};

using CellMatrix = QVector<QVector<CellValue>>;

class WorkbookStore {
public:
    virtual ~WorkbookStore() = default;

    virtual QString backendName() const = 0;

    // Stable key for the workbook a given id refers to. Different spellings of
    // the same workbook (e.g. "beam" and "beam.json") map to one key, which is
    // what locks and caches are keyed by.
    virtual QString canonicalId(const QString &workbookId) const { return workbookId; }

    // Current value of a cell (computed value for formula cells)
    virtual bool readCell(const WorkbookHandle &workbook, const CellAddress &address,
                          CellValue *value, CalcError *error = nullptr) = 0;

    // Formula text of a cell; *formula is std::nullopt for literal/blank cells
    virtual bool readFormula(const WorkbookHandle &workbook, const CellAddress &address,
                             std::optional<QString> *formula, CalcError *error = nullptr) = 0;

    // Write a literal. Formula cells reject writes with ImmutableCell.
    virtual bool writeCell(const WorkbookHandle &workbook, const CellAddress &address,
                           const CellValue &value, CalcError *error = nullptr) = 0;

    // Row-major matrix of values covering the range
    virtual bool readRange(const WorkbookHandle &workbook, const CellRange &range,
                           CellMatrix *values, CalcError *error = nullptr) = 0;

    // Make pending writes durable
    virtual bool flush(const WorkbookHandle &workbook, CalcError *error = nullptr) = 0;

    // Record evaluated values of formula cells without touching their formulas
    virtual bool storeComputedValues(const WorkbookHandle &workbook,
                                     const QHash<CellAddress, CellValue> &values,
                                     quint64 evaluationVersion,
                                     CalcError *error = nullptr) = 0;

    // Monotonic count of literal writes seen for the workbook, including
    // detected out-of-process modification. std::nullopt when the backend
    // cannot observe writes made by others; callers must then assume the
    // workbook may have changed at any time.
    virtual std::optional<quint64> revision(const WorkbookHandle &workbook) = 0;

    // Revision of formula content, when the backend can prove it; std::nullopt
    // means "unknown, assume it may have changed"
    virtual std::optional<quint64> formulaRevision(const WorkbookHandle &workbook) = 0;
};

} // namespace SheetCalc

#endif // WORKBOOK_STORE_H
