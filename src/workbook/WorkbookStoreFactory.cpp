#include "workbook/WorkbookStoreFactory.h"
#include "utils/ConfigLoader.h"
#include "workbook/LocalWorkbookStore.h"
#include "workbook/SheetsApiWorkbookStore.h"
#include <QDebug>

namespace SheetCalc {

std::shared_ptr<WorkbookStore> WorkbookStoreFactory::create(const ConfigLoader &config,
                                                           CalcError *error)
{
    const QString backend = config.getWorkbookBackend();

    if (backend == "local") {
        const QString directory = config.getWorkbookDirectory();
        qInfo() << "[WorkbookStore] Local workbooks in" << directory;
        return std::make_shared<LocalWorkbookStore>(directory);
    }

    if (backend == "sheets") {
        SheetsApiSettings settings;
        settings.baseUrl = config.getSheetsBaseUrl();
        settings.accessToken = config.getSheetsAccessToken();
        settings.timeoutSeconds = config.getSheetsTimeoutSeconds();
        settings.maxAttempts = config.getSheetsMaxAttempts();
        settings.retryBackoffMs = config.getSheetsRetryBackoffMs();
        if (settings.accessToken.isEmpty())
            qWarning() << "[WorkbookStore] No Sheets access token configured; calls will fail";
        qInfo() << "[WorkbookStore] Google Sheets backend at" << settings.baseUrl;
        return std::make_shared<SheetsApiWorkbookStore>(settings);
    }

    fail(error, ErrorCode::ConfigInvalid,
         QString("Unknown workbook backend '%1' (expected local or sheets)").arg(backend),
         {backend});
    return nullptr;
}

} // namespace SheetCalc
