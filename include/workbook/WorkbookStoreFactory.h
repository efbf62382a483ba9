#ifndef WORKBOOK_STORE_FACTORY_H
#define WORKBOOK_STORE_FACTORY_H

#include "core/CalcError.h"
#include "workbook/WorkbookStore.h"
#include <memory>

namespace SheetCalc {

class ConfigLoader;

/**
 * @brief Selects the workbook backend once, from [WORKBOOK] backend
 *
 *   local   JSON workbook files under [WORKBOOK] directory
 *   sheets  Google Sheets API with the [SHEETS] settings
 */
class WorkbookStoreFactory {
public:
    static std::shared_ptr<WorkbookStore> create(const ConfigLoader &config,
                                                 CalcError *error = nullptr);
};

} // namespace SheetCalc

#endif // WORKBOOK_STORE_FACTORY_H
