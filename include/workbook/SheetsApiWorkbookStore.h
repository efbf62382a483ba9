#ifndef SHEETS_API_WORKBOOK_STORE_H
#define SHEETS_API_WORKBOOK_STORE_H

#include "api/NativeHTTPClient.h"
#include "workbook/WorkbookStore.h"
#include <QHash>
#include <QJsonArray>
#include <QString>
#include <memory>
#include <mutex>

namespace SheetCalc {

struct SheetsApiSettings {
    QString baseUrl = "https://sheets.googleapis.com/v4/spreadsheets";
    QString accessToken;     // OAuth2 bearer token obtained by the host
    int timeoutSeconds = 30;
    int maxAttempts = 3;     // total tries per request, including the first
    int retryBackoffMs = 500;
};

/**
 * @brief Workbook store backed by the Google Sheets v4 values API
 *
 * The workbook id is the spreadsheet id. Every write is a single PUT and is
 * durable once it returns, so flush() has nothing to do. Transport errors,
 * HTTP 429 and 5xx responses are retried with exponential backoff; any other
 * non-2xx status fails at once. Exhausted or rejected requests surface as
 * BackendUnavailable.
 *
 * Values computed by the engine are not written back to the spreadsheet
 * (formula cells stay formulas); they are remembered in memory and returned
 * by readCell() for those cells.
 *
 * Other editors of the spreadsheet are invisible to this store, so it reports
 * no revisions: nothing read from it may be assumed unchanged later.
 */
class SheetsApiWorkbookStore : public WorkbookStore {
public:
    explicit SheetsApiWorkbookStore(const SheetsApiSettings &settings,
                                    std::shared_ptr<NativeHTTPClient> client = nullptr);
    ~SheetsApiWorkbookStore() override = default;

    QString backendName() const override { return "sheets"; }

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

    // "'Sheet 1'!B4" style A1 notation with the sheet name quoted
    static QString qualifiedRange(const QString &sheet, const QString &a1);

private:
    QString valuesUrl(const WorkbookHandle &workbook, const QString &a1,
                      const QString &query) const;
    bool checkAddress(const WorkbookHandle &workbook, const CellAddress &address,
                      CalcError *error) const;

    // GET values of a range; rows stay ragged as returned by the API
    bool fetchValues(const WorkbookHandle &workbook, const QString &a1,
                     const char *renderOption, QJsonArray *rows, CalcError *error);

    bool send(const std::string &method, const QString &url, const std::string &body,
              NativeHTTPClient::Response *response, CalcError *error);

    SheetsApiSettings m_settings;
    std::shared_ptr<NativeHTTPClient> m_client;

    std::mutex m_stateMutex;
    QHash<QString, QHash<CellAddress, CellValue>> m_computed;    // by handle
};

} // namespace SheetCalc

#endif // SHEETS_API_WORKBOOK_STORE_H
