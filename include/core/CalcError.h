#ifndef CALC_ERROR_H
#define CALC_ERROR_H

/**
 * @file CalcError.h
 * @brief Error taxonomy shared by every SheetCalc component
 *
 * Fallible operations return bool / std::optional and describe the failure
 * through an optional `CalcError *error` out-parameter. Nothing in the engine
 * aborts the host process.
 */

#include <QString>
#include <QStringList>

namespace SheetCalc {

enum class ErrorCode {
    None,
    AddressMalformed,    // "B-4", "", "4B"
    AddressOutOfBounds,  // outside the sheet's declared bounds
    ConfigInvalid,       // bad calculator definition
    NotFound,            // unknown calculator name
    NotExecutable,       // calculator has no backing workbook yet
    UnknownInput,        // caller supplied a key the calculator does not map
    MissingInput,        // caller omitted a required key
    InvalidInputValue,   // value cannot be written to a cell
    ImmutableCell,       // write targeted a formula cell
    CircularReference,   // formula graph has a cycle
    FormulaParse,        // syntax error
    FormulaUnsupported,  // unknown function / wrong argument count
    DivisionByZero,
    FormulaEvaluation,   // any other per-cell evaluation failure
    LockTimeout,
    Cancelled,
    BackendUnavailable   // transport / auth failure of the workbook backend
};

inline const char *errorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::None:               return "None";
    case ErrorCode::AddressMalformed:   return "AddressError.Malformed";
    case ErrorCode::AddressOutOfBounds: return "AddressError.OutOfBounds";
    case ErrorCode::ConfigInvalid:      return "ConfigError";
    case ErrorCode::NotFound:           return "NotFoundError";
    case ErrorCode::NotExecutable:      return "NotExecutableError";
    case ErrorCode::UnknownInput:       return "UnknownInputError";
    case ErrorCode::MissingInput:       return "MissingInputError";
    case ErrorCode::InvalidInputValue:  return "InvalidInputValueError";
    case ErrorCode::ImmutableCell:      return "ImmutableCellError";
    case ErrorCode::CircularReference:  return "CircularReferenceError";
    case ErrorCode::FormulaParse:       return "FormulaError.Parse";
    case ErrorCode::FormulaUnsupported: return "FormulaError.Unsupported";
    case ErrorCode::DivisionByZero:     return "FormulaError.DivisionByZero";
    case ErrorCode::FormulaEvaluation:  return "FormulaError.Evaluation";
    case ErrorCode::LockTimeout:        return "LockTimeoutError";
    case ErrorCode::Cancelled:          return "CancelledError";
    case ErrorCode::BackendUnavailable: return "BackendUnavailableError";
    }
    return "UnknownError";
}

/**
 * @brief A reported failure: what kind, a readable message, and the names
 *        (input keys, cell addresses, calculator names) it concerns.
 */
struct CalcError {
    ErrorCode code = ErrorCode::None;
    QString message;
    QStringList subjects;

    CalcError() = default;
    CalcError(ErrorCode c, const QString &msg, const QStringList &subj = {})
        : code(c), message(msg), subjects(subj) {}

    bool isSet() const { return code != ErrorCode::None; }

    QString toString() const {
        QString text = QString("%1: %2").arg(errorCodeToString(code), message);
        if (!subjects.isEmpty())
            text += QString(" [%1]").arg(subjects.join(", "));
        return text;
    }
};

// Fill an optional out-parameter; always returns false so callers can write
// `return fail(error, ...);`
inline bool fail(CalcError *error, ErrorCode code, const QString &message,
                 const QStringList &subjects = {}) {
    if (error)
        *error = CalcError(code, message, subjects);
    return false;
}

} // namespace SheetCalc

#endif // CALC_ERROR_H
