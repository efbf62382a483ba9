#include "workbook/SheetsApiWorkbookStore.h"
#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>
#include <chrono>
#include <thread>

namespace SheetCalc {

namespace {

bool isRetryable(int statusCode)
{
    return statusCode == 0 || statusCode == 429 || statusCode >= 500;
}

QJsonValue rawJson(const CellValue &value)
{
    switch (value.type()) {
    case CellValue::Type::Empty:
        return QString();  // "" clears the cell; null would leave it unchanged
    case CellValue::Type::Number:
    case CellValue::Type::Text:
    case CellValue::Type::Boolean:
    case CellValue::Type::Error:
        return value.toJson();
    }
    return QJsonValue();
}

} // namespace

SheetsApiWorkbookStore::SheetsApiWorkbookStore(const SheetsApiSettings &settings,
                                               std::shared_ptr<NativeHTTPClient> client)
    : m_settings(settings)
    , m_client(client ? std::move(client) : std::make_shared<NativeHTTPClient>())
{
    m_client->setTimeout(m_settings.timeoutSeconds);
    while (m_settings.baseUrl.endsWith('/'))
        m_settings.baseUrl.chop(1);
}

QString SheetsApiWorkbookStore::qualifiedRange(const QString &sheet, const QString &a1)
{
    QString quoted = sheet;
    quoted.replace("'", "''");
    return QString("'%1'!%2").arg(quoted, a1);
}

QString SheetsApiWorkbookStore::valuesUrl(const WorkbookHandle &workbook, const QString &a1,
                                          const QString &query) const
{
    const QByteArray id = QUrl::toPercentEncoding(workbook.workbookId);
    const QByteArray range = QUrl::toPercentEncoding(qualifiedRange(workbook.sheet, a1));
    QString url = QString("%1/%2/values/%3")
                      .arg(m_settings.baseUrl, QString::fromLatin1(id), QString::fromLatin1(range));
    if (!query.isEmpty())
        url += "?" + query;
    return url;
}

bool SheetsApiWorkbookStore::checkAddress(const WorkbookHandle &workbook,
                                          const CellAddress &address,
                                          CalcError *error) const
{
    if (!address.isValid()) {
        return fail(error, ErrorCode::AddressMalformed,
                    QString("Invalid cell address (%1, %2)").arg(address.column).arg(address.row));
    }
    if (!workbook.bounds.allows(address)) {
        return fail(error, ErrorCode::AddressOutOfBounds,
                    QString("Cell %1 lies outside sheet '%2'").arg(address.toString(), workbook.sheet),
                    {address.toString()});
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// TRANSPORT
// ═══════════════════════════════════════════════════════════════════

bool SheetsApiWorkbookStore::send(const std::string &method, const QString &url,
                                  const std::string &body,
                                  NativeHTTPClient::Response *response,
                                  CalcError *error)
{
    if (m_settings.accessToken.isEmpty()) {
        return fail(error, ErrorCode::BackendUnavailable,
                    "No access token configured for the Sheets backend");
    }

    std::map<std::string, std::string> headers;
    headers["Authorization"] = "Bearer " + m_settings.accessToken.toStdString();
    headers["Accept"] = "application/json";
    if (method == "PUT")
        headers["Content-Type"] = "application/json";

    const std::string target = url.toStdString();
    const int attempts = qMax(1, m_settings.maxAttempts);
    NativeHTTPClient::Response last;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        last = (method == "PUT") ? m_client->put(target, body, headers)
                                 : m_client->get(target, headers);
        if (last.success) {
            if (response)
                *response = last;
            return true;
        }

        if (!isRetryable(last.statusCode))
            break;

        qWarning() << "[SheetsStore]" << QString::fromStdString(method) << "attempt" << attempt
                   << "of" << attempts << "failed, status" << last.statusCode
                   << QString::fromStdString(last.error);

        if (attempt < attempts && m_settings.retryBackoffMs > 0) {
            const int delay = m_settings.retryBackoffMs * (1 << qMin(attempt - 1, 10));
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
    }

    QString detail = QString::fromStdString(last.error);
    if (detail.isEmpty()) {
        const QJsonObject body = QJsonDocument::fromJson(QByteArray::fromStdString(last.body)).object();
        detail = body.value("error").toObject().value("message").toString();
    }
    qWarning() << "[SheetsStore] Request failed:" << QString::fromStdString(method)
               << "status" << last.statusCode << detail;
    return fail(error, ErrorCode::BackendUnavailable,
                QString("Sheets API %1 failed (HTTP %2): %3")
                    .arg(QString::fromStdString(method))
                    .arg(last.statusCode)
                    .arg(detail.isEmpty() ? QString("no response") : detail));
}

bool SheetsApiWorkbookStore::fetchValues(const WorkbookHandle &workbook, const QString &a1,
                                         const char *renderOption, QJsonArray *rows,
                                         CalcError *error)
{
    const QString url = valuesUrl(workbook, a1,
                                  QString("majorDimension=ROWS&valueRenderOption=%1")
                                      .arg(QLatin1String(renderOption)));
    NativeHTTPClient::Response response;
    if (!send("GET", url, std::string(), &response, error))
        return false;

    QJsonParseError parseError;
    const QJsonDocument doc =
        QJsonDocument::fromJson(QByteArray::fromStdString(response.body), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return fail(error, ErrorCode::BackendUnavailable,
                    QString("Malformed Sheets API response: %1").arg(parseError.errorString()));
    }
    if (rows)
        *rows = doc.object().value("values").toArray();  // absent for blank ranges
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// CELL ACCESS
// ═══════════════════════════════════════════════════════════════════

bool SheetsApiWorkbookStore::readCell(const WorkbookHandle &workbook, const CellAddress &address,
                                      CellValue *value, CalcError *error)
{
    if (!checkAddress(workbook, address, error))
        return false;

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        auto it = m_computed.constFind(workbook.toString());
        if (it != m_computed.constEnd() && it->contains(address)) {
            if (value)
                *value = it->value(address);
            return true;
        }
    }

    QJsonArray rows;
    if (!fetchValues(workbook, address.toString(), "UNFORMATTED_VALUE", &rows, error))
        return false;
    if (value) {
        const QJsonArray row = rows.isEmpty() ? QJsonArray() : rows.at(0).toArray();
        *value = row.isEmpty() ? CellValue() : CellValue::fromJson(row.at(0));
    }
    return true;
}

bool SheetsApiWorkbookStore::readFormula(const WorkbookHandle &workbook, const CellAddress &address,
                                         std::optional<QString> *formula, CalcError *error)
{
    if (!checkAddress(workbook, address, error))
        return false;

    QJsonArray rows;
    if (!fetchValues(workbook, address.toString(), "FORMULA", &rows, error))
        return false;

    std::optional<QString> result;
    const QJsonArray row = rows.isEmpty() ? QJsonArray() : rows.at(0).toArray();
    if (!row.isEmpty() && row.at(0).isString()) {
        const QString text = row.at(0).toString();
        if (text.startsWith('='))
            result = text;
    }
    if (formula)
        *formula = result;
    return true;
}

bool SheetsApiWorkbookStore::writeCell(const WorkbookHandle &workbook, const CellAddress &address,
                                       const CellValue &value, CalcError *error)
{
    std::optional<QString> existing;
    if (!readFormula(workbook, address, &existing, error))
        return false;
    if (existing) {
        return fail(error, ErrorCode::ImmutableCell,
                    QString("Cell %1 holds a formula and cannot be written").arg(address.toString()),
                    {address.toString()});
    }

    const QString a1 = qualifiedRange(workbook.sheet, address.toString());
    QJsonObject payload;
    payload["range"] = a1;
    payload["majorDimension"] = "ROWS";
    QJsonArray row;
    row.append(rawJson(value));
    QJsonArray rows;
    rows.append(row);
    payload["values"] = rows;

    const QString url = valuesUrl(workbook, address.toString(), "valueInputOption=RAW");
    const std::string body =
        QJsonDocument(payload).toJson(QJsonDocument::Compact).toStdString();
    if (!send("PUT", url, body, nullptr, error))
        return false;

    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_computed[workbook.toString()].remove(address);
    return true;
}

bool SheetsApiWorkbookStore::readRange(const WorkbookHandle &workbook, const CellRange &range,
                                       CellMatrix *values, CalcError *error)
{
    if (!checkAddress(workbook, range.topLeft, error) ||
        !checkAddress(workbook, range.bottomRight, error))
        return false;

    QJsonArray rows;
    if (!fetchValues(workbook, range.toString(), "UNFORMATTED_VALUE", &rows, error))
        return false;

    QHash<CellAddress, CellValue> computed;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        computed = m_computed.value(workbook.toString());
    }

    CellMatrix matrix;
    matrix.reserve(range.rowCount());
    for (int r = 0; r < range.rowCount(); ++r) {
        const QJsonArray row = r < rows.size() ? rows.at(r).toArray() : QJsonArray();
        QVector<CellValue> line;
        line.reserve(range.columnCount());
        for (int c = 0; c < range.columnCount(); ++c) {
            const CellAddress address(range.topLeft.column + c, range.topLeft.row + r);
            if (computed.contains(address))
                line.append(computed.value(address));
            else
                line.append(c < row.size() ? CellValue::fromJson(row.at(c)) : CellValue());
        }
        matrix.append(line);
    }
    if (values)
        *values = matrix;
    return true;
}

bool SheetsApiWorkbookStore::flush(const WorkbookHandle &workbook, CalcError *error)
{
    Q_UNUSED(workbook);
    Q_UNUSED(error);
    return true;
}

bool SheetsApiWorkbookStore::storeComputedValues(const WorkbookHandle &workbook,
                                                 const QHash<CellAddress, CellValue> &values,
                                                 quint64 evaluationVersion,
                                                 CalcError *error)
{
    Q_UNUSED(evaluationVersion);
    Q_UNUSED(error);
    std::lock_guard<std::mutex> lock(m_stateMutex);
    QHash<CellAddress, CellValue> &computed = m_computed[workbook.toString()];
    for (auto it = values.begin(); it != values.end(); ++it)
        computed.insert(it.key(), it.value());
    return true;
}

std::optional<quint64> SheetsApiWorkbookStore::revision(const WorkbookHandle &workbook)
{
    Q_UNUSED(workbook);
    // Other collaborators write without telling us
    return std::nullopt;
}

std::optional<quint64> SheetsApiWorkbookStore::formulaRevision(const WorkbookHandle &workbook)
{
    Q_UNUSED(workbook);
    // Anyone with edit access may change formulas; nothing here can prove otherwise
    return std::nullopt;
}

} // namespace SheetCalc
