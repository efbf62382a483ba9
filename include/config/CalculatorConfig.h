#ifndef CALCULATOR_CONFIG_H
#define CALCULATOR_CONFIG_H

#include "core/CalcError.h"
#include "core/CellAddress.h"
#include "core/CellValue.h"
#include "workbook/WorkbookStore.h"
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <optional>

namespace SheetCalc {

struct FieldMetadata {
    QString description;
    QString unit;
    bool required = true;                 // inputs only
    std::optional<CellValue> defaultValue;  // inputs only; written when omitted

    QJsonObject toJson() const;
};

enum class CalculatorStatus {
    Executable,
    TemplateOnly  // registered, but no backing workbook yet
};

const char *calculatorStatusName(CalculatorStatus status);

/**
 * @brief A named mapping from logical input/output names to cells of one
 *        backing workbook sheet. Immutable once loaded.
 *
 * Accepted record shapes:
 *
 *   { "sheet_id": "...", "inputs": { "beam_length": "B4" }, "outputs": {...},
 *     "title": "...", "description": "...", "standard": "..." }
 *
 *   { "name": "...", "backing_workbook_id": "...", "sheet": "Sheet1",
 *     "version": "1.0", "bounds": { "columns": 26, "rows": 200 },
 *     "inputs": { "beam_length": { "cell": "B4", "unit": "m",
 *                                  "description": "...", "required": true,
 *                                  "default": 6 } },
 *     "outputs": { ... } }
 */
struct CalculatorConfig {
    QString name;
    QString title;
    QString description;
    QString standard;
    QString version;
    QString workbookId;
    QString sheet = "Sheet1";
    SheetBounds bounds;

    QMap<QString, CellAddress> inputs;
    QMap<QString, CellAddress> outputs;
    QMap<QString, FieldMetadata> inputMetadata;
    QMap<QString, FieldMetadata> outputMetadata;

    CalculatorStatus status = CalculatorStatus::TemplateOnly;

    bool isExecutable() const { return status == CalculatorStatus::Executable; }
    WorkbookHandle handle() const;

    // Inputs a caller must supply
    QStringList requiredInputs() const;

    // Listing entry: name, title, standard, status, fields with metadata
    QJsonObject summary() const;

    /**
     * @brief Parse and validate one record
     *
     * Fails with ConfigInvalid on a missing name, a malformed or
     * out-of-bounds cell, two outputs (or two inputs) sharing a cell, or an
     * input mapped onto an output cell. A missing workbook id is not an
     * error; the calculator is TemplateOnly.
     */
    static std::optional<CalculatorConfig> fromJson(const QJsonObject &record,
                                                    CalcError *error = nullptr);
};

} // namespace SheetCalc

#endif // CALCULATOR_CONFIG_H
