#ifndef CELL_VALUE_H
#define CELL_VALUE_H

/**
 * @file CellValue.h
 * @brief Tagged value held by (or computed for) a spreadsheet cell
 *
 * Cells are schema-less in the source workbook: a cell may hold nothing, a
 * number, text, a boolean, or an error marker such as #DIV/0!. Every consumer
 * switches on CellValue::Type so a new case is caught by -Wswitch.
 */

#include <QJsonValue>
#include <QString>
#include <QVariant>
#include <optional>

namespace SheetCalc {

enum class CellErrorKind {
    DivisionByZero,  // #DIV/0!
    Value,           // #VALUE!  wrong operand type
    Num,             // #NUM!    invalid numeric argument
    Name,            // #NAME?   unparsable / unsupported formula
    Reference        // #REF!    reference outside the sheet
};

const char *cellErrorMarker(CellErrorKind kind);
std::optional<CellErrorKind> cellErrorFromMarker(const QString &marker);

class CellValue {
public:
    enum class Type { Empty, Number, Text, Boolean, Error };

    CellValue() = default;

    static CellValue number(double value);
    static CellValue text(const QString &value);
    static CellValue boolean(bool value);
    static CellValue error(CellErrorKind kind);

    // JSON scalar -> value. Strings equal to an error marker become errors.
    static CellValue fromJson(const QJsonValue &json);
    static CellValue fromVariant(const QVariant &variant);
    // Typed interpretation of free text: number, TRUE/FALSE, otherwise text
    static CellValue fromUserText(const QString &text);

    Type type() const { return m_type; }
    bool isEmpty() const { return m_type == Type::Empty; }
    bool isNumber() const { return m_type == Type::Number; }
    bool isText() const { return m_type == Type::Text; }
    bool isBoolean() const { return m_type == Type::Boolean; }
    bool isError() const { return m_type == Type::Error; }

    double asNumber() const { return m_number; }
    const QString &asText() const { return m_text; }
    bool asBoolean() const { return m_boolean; }
    CellErrorKind errorKind() const { return m_error; }

    // Spreadsheet coercion: empty -> 0, boolean -> 1/0, numeric text -> value.
    // std::nullopt for non-numeric text and error markers.
    std::optional<double> toNumber() const;

    QString toDisplayString() const;
    QJsonValue toJson() const;

    // Stable text form used for cache keys (full double precision)
    QString canonicalString() const;

    bool operator==(const CellValue &other) const;
    bool operator!=(const CellValue &other) const { return !(*this == other); }

private:
    Type m_type = Type::Empty;
    double m_number = 0.0;
    bool m_boolean = false;
    QString m_text;
    CellErrorKind m_error = CellErrorKind::Value;
};

const char *cellValueTypeName(CellValue::Type type);

} // namespace SheetCalc

Q_DECLARE_METATYPE(SheetCalc::CellValue)

#endif // CELL_VALUE_H
