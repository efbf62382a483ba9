#ifndef CALCULATION_RESULT_H
#define CALCULATION_RESULT_H

#include "core/CalcError.h"
#include "core/CellAddress.h"
#include "core/CellValue.h"
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QVector>
#include <optional>

namespace SheetCalc {

enum class CalculationStatus {
    Success,  // every output computed
    Partial,  // some outputs carry an error, others computed
    Failure   // no usable output, or the run itself failed
};

const char *calculationStatusName(CalculationStatus status);

/**
 * @brief Per-cell evaluation note. `origin` is set when the error marker was
 *        read from a referenced cell rather than produced by this cell.
 */
struct Diagnostic {
    CellAddress cell;
    QString output;                   // declared output name, if the cell is one
    ErrorCode code = ErrorCode::FormulaEvaluation;
    QString message;
    std::optional<CellAddress> origin;

    bool isPropagated() const { return origin.has_value(); }
    QJsonObject toJson() const;
};

struct CalculationResult {
    QString calculatorName;
    QMap<QString, CellValue> inputsUsed;
    QMap<QString, CellValue> outputs;
    QMap<QString, CalcError> outputErrors;  // outputs that carry an error marker
    CalculationStatus status = CalculationStatus::Failure;
    QVector<Diagnostic> diagnostics;
    QVector<CalcError> errors;              // run-level failures
    quint64 evaluationVersion = 0;
    bool fromCache = false;

    bool isSuccess() const { return status == CalculationStatus::Success; }
    bool hasError(ErrorCode code) const;

    QJsonObject toJson() const;
};

} // namespace SheetCalc

#endif // CALCULATION_RESULT_H
