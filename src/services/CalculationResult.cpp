#include "services/CalculationResult.h"
#include <QJsonArray>

namespace SheetCalc {

namespace {

QJsonObject errorJson(const CalcError &error)
{
    QJsonObject obj;
    obj["type"] = errorCodeToString(error.code);
    obj["message"] = error.message;
    if (!error.subjects.isEmpty())
        obj["subjects"] = QJsonArray::fromStringList(error.subjects);
    return obj;
}

} // namespace

const char *calculationStatusName(CalculationStatus status)
{
    switch (status) {
    case CalculationStatus::Success: return "success";
    case CalculationStatus::Partial: return "partial";
    case CalculationStatus::Failure: return "failure";
    }
    return "failure";
}

QJsonObject Diagnostic::toJson() const
{
    QJsonObject obj;
    obj["cell"] = cell.toString();
    if (!output.isEmpty())
        obj["output"] = output;
    obj["type"] = errorCodeToString(code);
    obj["message"] = message;
    if (origin)
        obj["origin"] = origin->toString();
    return obj;
}

bool CalculationResult::hasError(ErrorCode code) const
{
    for (const CalcError &error : errors) {
        if (error.code == code)
            return true;
    }
    return false;
}

QJsonObject CalculationResult::toJson() const
{
    QJsonObject obj;
    obj["calculator"] = calculatorName;
    obj["status"] = calculationStatusName(status);
    obj["from_cache"] = fromCache;
    obj["evaluation_version"] = double(evaluationVersion);

    QJsonObject inputs;
    for (auto it = inputsUsed.begin(); it != inputsUsed.end(); ++it)
        inputs[it.key()] = it.value().toJson();
    obj["inputs"] = inputs;

    QJsonObject outputObj;
    for (auto it = outputs.begin(); it != outputs.end(); ++it)
        outputObj[it.key()] = it.value().toJson();
    obj["outputs"] = outputObj;

    if (!outputErrors.isEmpty()) {
        QJsonObject failed;
        for (auto it = outputErrors.begin(); it != outputErrors.end(); ++it)
            failed[it.key()] = errorJson(it.value());
        obj["output_errors"] = failed;
    }

    QJsonArray diags;
    for (const Diagnostic &diagnostic : diagnostics)
        diags.append(diagnostic.toJson());
    obj["diagnostics"] = diags;

    if (!errors.isEmpty()) {
        QJsonArray errs;
        for (const CalcError &error : errors)
            errs.append(errorJson(error));
        obj["errors"] = errs;
    }
    return obj;
}

} // namespace SheetCalc
