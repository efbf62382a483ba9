#ifndef LOCAL_WORKBOOK_STORE_H
#define LOCAL_WORKBOOK_STORE_H

#include "workbook/WorkbookStore.h"
#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QString>
#include <memory>
#include <mutex>

namespace SheetCalc {

/**
 * @brief Workbook store backed by JSON workbook files on disk
 *
 * A workbook id resolves to `<directory>/<id>.json` (an absolute path or a
 * name ending in .json is used as-is). File layout:
 *
 *   {
 *     "sheets": {
 *       "Sheet1": {
 *         "bounds":   { "columns": 26, "rows": 200 },     (optional)
 *         "cells":    { "B4": 8, "B6": "'=literal", "D4": "=B5*B4/8" },
 *         "computed": { "D4": { "value": 50, "version": 3 } }
 *       }
 *     }
 *   }
 *
 * Strings starting with '=' are formulas; a leading apostrophe escapes
 * literal text. Writes stay in memory until flush(), which replaces the
 * file atomically. A file changed on disk by someone else is reloaded on
 * next access and counted as a new revision. If that happens while writes
 * are still unflushed, the access that notices it fails with
 * BackendUnavailable and the writes are dropped; they are never silently
 * lost and never written over the newer file.
 *
 * Ids that resolve to the same file ("beam", "beam.json", the absolute
 * path) share one in-memory copy.
 */
class LocalWorkbookStore : public WorkbookStore {
public:
    explicit LocalWorkbookStore(const QString &directory);
    ~LocalWorkbookStore() override = default;

    QString backendName() const override { return "local"; }
    QString pathFor(const QString &workbookId) const;
    QString canonicalId(const QString &workbookId) const override;

    bool readCell(const WorkbookHandle &workbook, const CellAddress &address,
                  CellValue *value, CalcError *error = nullptr) override;
    bool readFormula(const WorkbookHandle &workbook, const CellAddress &address,
                     std::optional<QString> *formula, CalcError *error = nullptr) override;
    bool writeCell(const WorkbookHandle &workbook, const CellAddress &address,
                   const CellValue &value, CalcError *error = nullptr) override;
    bool readRange(const WorkbookHandle &workbook, const CellRange &range,
                   CellMatrix *values, CalcError *error = nullptr) override;
    bool flush(const WorkbookHandle &workbook, CalcError *error = nullptr) override;
    bool storeComputedValues(const WorkbookHandle &workbook,
                             const QHash<CellAddress, CellValue> &values,
                             quint64 evaluationVersion,
                             CalcError *error = nullptr) override;
    std::optional<quint64> revision(const WorkbookHandle &workbook) override;
    std::optional<quint64> formulaRevision(const WorkbookHandle &workbook) override;

    // Raw cell state, for inspection
    std::optional<Cell> cell(const WorkbookHandle &workbook, const CellAddress &address,
                             CalcError *error = nullptr);

private:
    struct SheetData {
        SheetBounds bounds;
        QHash<CellAddress, Cell> cells;
    };

    struct WorkbookData {
        std::mutex mutex;
        QString path;
        bool loaded = false;
        bool dirty = false;
        QDateTime lastModified;
        quint64 revision = 0;
        quint64 formulaRevision = 0;
        QJsonObject root;  // unknown top-level keys survive a flush
        QHash<QString, SheetData> sheets;
    };

    std::shared_ptr<WorkbookData> dataFor(const QString &workbookId);

    // Caller holds data.mutex
    bool ensureLoaded(WorkbookData &data, CalcError *error);
    bool detectExternalChange(WorkbookData &data);
    bool loadFile(WorkbookData &data, CalcError *error);
    bool saveFile(WorkbookData &data, CalcError *error);
    SheetData *sheetFor(WorkbookData &data, const WorkbookHandle &workbook,
                        const CellAddress &address, CalcError *error);

    static bool parseRawContent(const QJsonValue &raw, Cell *cell);
    static QJsonValue rawContent(const Cell &cell);

    QString m_directory;
    std::mutex m_mapMutex;
    QHash<QString, std::shared_ptr<WorkbookData>> m_workbooks;
};

} // namespace SheetCalc

#endif // LOCAL_WORKBOOK_STORE_H
