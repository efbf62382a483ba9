#include "workbook/LocalWorkbookStore.h"
#include "formula/FormulaEngine.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

namespace SheetCalc {

LocalWorkbookStore::LocalWorkbookStore(const QString &directory)
    : m_directory(directory) {}

QString LocalWorkbookStore::pathFor(const QString &workbookId) const {
    if (QDir::isAbsolutePath(workbookId) || workbookId.endsWith(".json", Qt::CaseInsensitive))
        return QDir(m_directory).filePath(workbookId);
    return QDir(m_directory).filePath(workbookId + ".json");
}

QString LocalWorkbookStore::canonicalId(const QString &workbookId) const {
    return QDir::cleanPath(QFileInfo(pathFor(workbookId)).absoluteFilePath());
}

std::shared_ptr<LocalWorkbookStore::WorkbookData>
LocalWorkbookStore::dataFor(const QString &workbookId) {
    const QString path = canonicalId(workbookId);
    std::lock_guard<std::mutex> lock(m_mapMutex);
    auto it = m_workbooks.find(path);
    if (it != m_workbooks.end())
        return it.value();
    auto data = std::make_shared<WorkbookData>();
    data->path = path;
    m_workbooks.insert(path, data);
    return data;
}

// ═══════════════════════════════════════════════════════════════════
// LOAD / SAVE
// ═══════════════════════════════════════════════════════════════════

bool LocalWorkbookStore::detectExternalChange(WorkbookData &data) {
    QFileInfo info(data.path);
    if (!info.exists())
        return false;
    return info.lastModified() != data.lastModified;
}

bool LocalWorkbookStore::ensureLoaded(WorkbookData &data, CalcError *error) {
    if (data.loaded && !detectExternalChange(data))
        return true;
    if (!data.loaded || !data.dirty)
        return loadFile(data, error);

    // Our unflushed writes were made against content that no longer exists
    qWarning() << "[LocalStore]" << data.path
               << "changed on disk; discarding unflushed writes";
    CalcError reloadError;
    if (!loadFile(data, &reloadError)) {
        qWarning() << "[LocalStore] Reload failed:" << reloadError.toString();
        data.loaded = false;
        data.dirty = false;
        ++data.revision;
        ++data.formulaRevision;
    }
    return fail(error, ErrorCode::BackendUnavailable,
                QString("Workbook file '%1' changed on disk; unflushed writes were discarded")
                    .arg(data.path),
                {data.path});
}

bool LocalWorkbookStore::parseRawContent(const QJsonValue &raw, Cell *cell) {
    if (raw.isString()) {
        const QString s = raw.toString();
        if (FormulaEngine::isFormulaText(s)) {
            cell->formula = s.trimmed();
            return true;
        }
        if (s.startsWith('\'')) {
            cell->literal = CellValue::text(s.mid(1));
            return true;
        }
    }
    cell->literal = CellValue::fromJson(raw);
    return true;
}

QJsonValue LocalWorkbookStore::rawContent(const Cell &cell) {
    if (cell.isFormula())
        return cell.formula;
    if (cell.literal.isText()) {
        const QString &s = cell.literal.asText();
        if (s.startsWith('=') || s.startsWith('\'') || cellErrorFromMarker(s))
            return QString("'") + s;
    }
    return cell.literal.toJson();
}

bool LocalWorkbookStore::loadFile(WorkbookData &data, CalcError *error) {
    QFile file(data.path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[LocalStore] Failed to open workbook:" << data.path;
        return fail(error, ErrorCode::BackendUnavailable,
                    QString("Cannot open workbook file '%1': %2").arg(data.path, file.errorString()),
                    {data.path});
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return fail(error, ErrorCode::BackendUnavailable,
                    QString("Workbook file '%1' is not valid JSON: %2")
                        .arg(data.path, parseError.errorString()),
                    {data.path});
    }

    QHash<QString, SheetData> sheets;
    const QJsonObject root = doc.object();
    const QJsonObject sheetsObj = root.value("sheets").toObject();
    for (auto sit = sheetsObj.begin(); sit != sheetsObj.end(); ++sit) {
        const QJsonObject sheetObj = sit.value().toObject();
        SheetData sheet;

        const QJsonObject boundsObj = sheetObj.value("bounds").toObject();
        sheet.bounds.maxColumns = boundsObj.value("columns").toInt(0);
        sheet.bounds.maxRows = boundsObj.value("rows").toInt(0);

        const QJsonObject cellsObj = sheetObj.value("cells").toObject();
        for (auto cit = cellsObj.begin(); cit != cellsObj.end(); ++cit) {
            CalcError addrErr;
            auto address = CellAddressing::parse(cit.key(), &addrErr);
            if (!address) {
                if (error)
                    *error = addrErr;
                qWarning() << "[LocalStore] Bad cell key" << cit.key() << "in" << data.path;
                return false;
            }
            Cell cell;
            cell.address = *address;
            parseRawContent(cit.value(), &cell);
            sheet.cells.insert(*address, cell);
        }

        const QJsonObject computedObj = sheetObj.value("computed").toObject();
        for (auto cit = computedObj.begin(); cit != computedObj.end(); ++cit) {
            auto address = CellAddressing::parse(cit.key());
            if (!address || !sheet.cells.contains(*address))
                continue;
            Cell &cell = sheet.cells[*address];
            if (!cell.isFormula())
                continue;
            const QJsonObject entry = cit.value().toObject();
            cell.cachedValue = CellValue::fromJson(entry.value("value"));
            cell.lastEvaluatedVersion = quint64(entry.value("version").toDouble(0));
        }

        sheets.insert(sit.key(), sheet);
    }

    data.root = root;
    data.sheets = sheets;
    data.loaded = true;
    data.dirty = false;
    data.lastModified = QFileInfo(data.path).lastModified();
    ++data.revision;
    ++data.formulaRevision;
    qDebug() << "[LocalStore] Loaded workbook" << data.path << "sheets:" << sheets.keys();
    return true;
}

bool LocalWorkbookStore::saveFile(WorkbookData &data, CalcError *error) {
    QJsonObject sheetsObj;
    for (auto sit = data.sheets.begin(); sit != data.sheets.end(); ++sit) {
        const SheetData &sheet = sit.value();
        QJsonObject sheetObj;
        if (sheet.bounds.isBounded()) {
            QJsonObject bounds;
            bounds["columns"] = sheet.bounds.maxColumns;
            bounds["rows"] = sheet.bounds.maxRows;
            sheetObj["bounds"] = bounds;
        }

        QJsonObject cellsObj;
        QJsonObject computedObj;
        for (auto cit = sheet.cells.begin(); cit != sheet.cells.end(); ++cit) {
            const Cell &cell = cit.value();
            const QString key = cell.address.toString();
            cellsObj[key] = rawContent(cell);
            if (cell.isFormula() && cell.lastEvaluatedVersion > 0) {
                QJsonObject entry;
                entry["value"] = cell.cachedValue.toJson();
                entry["version"] = double(cell.lastEvaluatedVersion);
                computedObj[key] = entry;
            }
        }
        sheetObj["cells"] = cellsObj;
        if (!computedObj.isEmpty())
            sheetObj["computed"] = computedObj;
        sheetsObj[sit.key()] = sheetObj;
    }

    QJsonObject root = data.root;
    root["sheets"] = sheetsObj;

    QSaveFile file(data.path);
    if (!file.open(QIODevice::WriteOnly)) {
        return fail(error, ErrorCode::BackendUnavailable,
                    QString("Cannot write workbook file '%1': %2").arg(data.path, file.errorString()),
                    {data.path});
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        return fail(error, ErrorCode::BackendUnavailable,
                    QString("Failed to commit workbook file '%1': %2").arg(data.path, file.errorString()),
                    {data.path});
    }

    data.root = root;
    data.dirty = false;
    data.lastModified = QFileInfo(data.path).lastModified();
    return true;
}

LocalWorkbookStore::SheetData *LocalWorkbookStore::sheetFor(WorkbookData &data,
                                                            const WorkbookHandle &workbook,
                                                            const CellAddress &address,
                                                            CalcError *error) {
    auto it = data.sheets.find(workbook.sheet);
    if (it == data.sheets.end()) {
        fail(error, ErrorCode::BackendUnavailable,
             QString("Sheet '%1' not found in workbook '%2'").arg(workbook.sheet, workbook.workbookId),
             {workbook.toString()});
        return nullptr;
    }
    const SheetBounds bounds = it->bounds.isBounded() ? it->bounds : workbook.bounds;
    if (!bounds.allows(address)) {
        fail(error, ErrorCode::AddressOutOfBounds,
             QString("Cell %1 lies outside sheet '%2'").arg(address.toString(), workbook.sheet),
             {address.toString()});
        return nullptr;
    }
    return &it.value();
}

// ═══════════════════════════════════════════════════════════════════
// CELL ACCESS
// ═══════════════════════════════════════════════════════════════════

bool LocalWorkbookStore::readCell(const WorkbookHandle &workbook, const CellAddress &address,
                                  CellValue *value, CalcError *error) {
    auto data = dataFor(workbook.workbookId);
    std::lock_guard<std::mutex> lock(data->mutex);
    if (!ensureLoaded(*data, error))
        return false;
    SheetData *sheet = sheetFor(*data, workbook, address, error);
    if (!sheet)
        return false;
    if (value)
        *value = sheet->cells.value(address).value();
    return true;
}

bool LocalWorkbookStore::readFormula(const WorkbookHandle &workbook, const CellAddress &address,
                                     std::optional<QString> *formula, CalcError *error) {
    auto data = dataFor(workbook.workbookId);
    std::lock_guard<std::mutex> lock(data->mutex);
    if (!ensureLoaded(*data, error))
        return false;
    SheetData *sheet = sheetFor(*data, workbook, address, error);
    if (!sheet)
        return false;
    if (formula) {
        auto it = sheet->cells.constFind(address);
        if (it != sheet->cells.constEnd() && it->isFormula())
            *formula = it->formula;
        else
            *formula = std::nullopt;
    }
    return true;
}

bool LocalWorkbookStore::writeCell(const WorkbookHandle &workbook, const CellAddress &address,
                                   const CellValue &value, CalcError *error) {
    auto data = dataFor(workbook.workbookId);
    std::lock_guard<std::mutex> lock(data->mutex);
    if (!ensureLoaded(*data, error))
        return false;
    SheetData *sheet = sheetFor(*data, workbook, address, error);
    if (!sheet)
        return false;

    auto it = sheet->cells.find(address);
    if (it != sheet->cells.end() && it->isFormula()) {
        return fail(error, ErrorCode::ImmutableCell,
                    QString("Cell %1 holds a formula and cannot be written").arg(address.toString()),
                    {address.toString()});
    }

    if (value.isEmpty()) {
        sheet->cells.remove(address);
    } else {
        Cell cell;
        cell.address = address;
        cell.literal = value;
        sheet->cells.insert(address, cell);
    }
    data->dirty = true;
    ++data->revision;
    return true;
}

bool LocalWorkbookStore::readRange(const WorkbookHandle &workbook, const CellRange &range,
                                   CellMatrix *values, CalcError *error) {
    auto data = dataFor(workbook.workbookId);
    std::lock_guard<std::mutex> lock(data->mutex);
    if (!ensureLoaded(*data, error))
        return false;
    SheetData *sheet = sheetFor(*data, workbook, range.topLeft, error);
    if (!sheet || !sheetFor(*data, workbook, range.bottomRight, error))
        return false;

    CellMatrix matrix;
    matrix.reserve(range.rowCount());
    for (int row = range.topLeft.row; row <= range.bottomRight.row; ++row) {
        QVector<CellValue> line;
        line.reserve(range.columnCount());
        for (int col = range.topLeft.column; col <= range.bottomRight.column; ++col)
            line.append(sheet->cells.value(CellAddress(col, row)).value());
        matrix.append(line);
    }
    if (values)
        *values = matrix;
    return true;
}

bool LocalWorkbookStore::flush(const WorkbookHandle &workbook, CalcError *error) {
    auto data = dataFor(workbook.workbookId);
    std::lock_guard<std::mutex> lock(data->mutex);
    if (!data->loaded || !data->dirty)
        return true;
    // Refuses to overwrite a file someone else changed since we loaded it
    if (!ensureLoaded(*data, error))
        return false;
    return saveFile(*data, error);
}

bool LocalWorkbookStore::storeComputedValues(const WorkbookHandle &workbook,
                                             const QHash<CellAddress, CellValue> &values,
                                             quint64 evaluationVersion,
                                             CalcError *error) {
    auto data = dataFor(workbook.workbookId);
    std::lock_guard<std::mutex> lock(data->mutex);
    if (!ensureLoaded(*data, error))
        return false;
    auto sit = data->sheets.find(workbook.sheet);
    if (sit == data->sheets.end()) {
        return fail(error, ErrorCode::BackendUnavailable,
                    QString("Sheet '%1' not found in workbook '%2'").arg(workbook.sheet, workbook.workbookId),
                    {workbook.toString()});
    }

    for (auto it = values.begin(); it != values.end(); ++it) {
        auto cit = sit->cells.find(it.key());
        if (cit == sit->cells.end() || !cit->isFormula())
            continue;
        cit->cachedValue = it.value();
        cit->lastEvaluatedVersion = evaluationVersion;
    }
    data->dirty = true;
    return true;
}

std::optional<quint64> LocalWorkbookStore::revision(const WorkbookHandle &workbook) {
    auto data = dataFor(workbook.workbookId);
    std::lock_guard<std::mutex> lock(data->mutex);
    if (data->loaded && detectExternalChange(*data)) {
        // Pending writes collided with the external change; the next access reports it
        if (data->dirty)
            return std::nullopt;
        // Reloaded on next access
        data->loaded = false;
        ++data->revision;
        ++data->formulaRevision;
    }
    return data->revision;
}

std::optional<quint64> LocalWorkbookStore::formulaRevision(const WorkbookHandle &workbook) {
    auto data = dataFor(workbook.workbookId);
    std::lock_guard<std::mutex> lock(data->mutex);
    if (data->loaded && data->dirty && detectExternalChange(*data))
        return std::nullopt;
    CalcError err;
    if (!ensureLoaded(*data, &err))
        return std::nullopt;
    return data->formulaRevision;
}

std::optional<Cell> LocalWorkbookStore::cell(const WorkbookHandle &workbook,
                                             const CellAddress &address, CalcError *error) {
    auto data = dataFor(workbook.workbookId);
    std::lock_guard<std::mutex> lock(data->mutex);
    if (!ensureLoaded(*data, error))
        return std::nullopt;
    SheetData *sheet = sheetFor(*data, workbook, address, error);
    if (!sheet)
        return std::nullopt;
    auto it = sheet->cells.constFind(address);
    if (it == sheet->cells.constEnd())
        return std::nullopt;
    return *it;
}

} // namespace SheetCalc
