#include "core/CellValue.h"
#include <cmath>

namespace SheetCalc {

const char *cellErrorMarker(CellErrorKind kind) {
    switch (kind) {
    case CellErrorKind::DivisionByZero: return "#DIV/0!";
    case CellErrorKind::Value:          return "#VALUE!";
    case CellErrorKind::Num:            return "#NUM!";
    case CellErrorKind::Name:           return "#NAME?";
    case CellErrorKind::Reference:      return "#REF!";
    }
    return "#VALUE!";
}

std::optional<CellErrorKind> cellErrorFromMarker(const QString &marker) {
    const QString m = marker.trimmed().toUpper();
    if (m == "#DIV/0!") return CellErrorKind::DivisionByZero;
    if (m == "#VALUE!") return CellErrorKind::Value;
    if (m == "#NUM!")   return CellErrorKind::Num;
    if (m == "#NAME?")  return CellErrorKind::Name;
    if (m == "#REF!")   return CellErrorKind::Reference;
    return std::nullopt;
}

const char *cellValueTypeName(CellValue::Type type) {
    switch (type) {
    case CellValue::Type::Empty:   return "empty";
    case CellValue::Type::Number:  return "number";
    case CellValue::Type::Text:    return "text";
    case CellValue::Type::Boolean: return "boolean";
    case CellValue::Type::Error:   return "error";
    }
    return "empty";
}

// ═══════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════

CellValue CellValue::number(double value) {
    CellValue v;
    v.m_type = Type::Number;
    v.m_number = value;
    return v;
}

CellValue CellValue::text(const QString &value) {
    CellValue v;
    v.m_type = Type::Text;
    v.m_text = value;
    return v;
}

CellValue CellValue::boolean(bool value) {
    CellValue v;
    v.m_type = Type::Boolean;
    v.m_boolean = value;
    return v;
}

CellValue CellValue::error(CellErrorKind kind) {
    CellValue v;
    v.m_type = Type::Error;
    v.m_error = kind;
    return v;
}

CellValue CellValue::fromJson(const QJsonValue &json) {
    switch (json.type()) {
    case QJsonValue::Double:
        return number(json.toDouble());
    case QJsonValue::Bool:
        return boolean(json.toBool());
    case QJsonValue::String: {
        const QString s = json.toString();
        if (s.isEmpty())
            return CellValue();
        if (auto kind = cellErrorFromMarker(s))
            return error(*kind);
        return text(s);
    }
    case QJsonValue::Null:
    case QJsonValue::Undefined:
    case QJsonValue::Array:
    case QJsonValue::Object:
        break;
    }
    return CellValue();
}

CellValue CellValue::fromVariant(const QVariant &variant) {
    if (!variant.isValid() || variant.isNull())
        return CellValue();
    if (variant.userType() == qMetaTypeId<CellValue>())
        return variant.value<CellValue>();
    return fromJson(QJsonValue::fromVariant(variant));
}

CellValue CellValue::fromUserText(const QString &text) {
    const QString t = text.trimmed();
    if (t.isEmpty())
        return CellValue();
    bool ok = false;
    double d = t.toDouble(&ok);
    if (ok && std::isfinite(d))
        return number(d);
    if (t.compare("TRUE", Qt::CaseInsensitive) == 0)
        return boolean(true);
    if (t.compare("FALSE", Qt::CaseInsensitive) == 0)
        return boolean(false);
    if (auto kind = cellErrorFromMarker(t))
        return error(*kind);
    return CellValue::text(text);
}

// ═══════════════════════════════════════════════════════════════════
// Conversion
// ═══════════════════════════════════════════════════════════════════

std::optional<double> CellValue::toNumber() const {
    switch (m_type) {
    case Type::Empty:
        return 0.0;
    case Type::Number:
        return m_number;
    case Type::Boolean:
        return m_boolean ? 1.0 : 0.0;
    case Type::Text: {
        bool ok = false;
        double d = m_text.trimmed().toDouble(&ok);
        if (ok)
            return d;
        return std::nullopt;
    }
    case Type::Error:
        return std::nullopt;
    }
    return std::nullopt;
}

QString CellValue::toDisplayString() const {
    switch (m_type) {
    case Type::Empty:   return QString();
    case Type::Number:  return QString::number(m_number, 'g', 15);
    case Type::Text:    return m_text;
    case Type::Boolean: return m_boolean ? "TRUE" : "FALSE";
    case Type::Error:   return cellErrorMarker(m_error);
    }
    return QString();
}

QJsonValue CellValue::toJson() const {
    switch (m_type) {
    case Type::Empty:   return QJsonValue(QJsonValue::Null);
    case Type::Number:  return QJsonValue(m_number);
    case Type::Text:    return QJsonValue(m_text);
    case Type::Boolean: return QJsonValue(m_boolean);
    case Type::Error:   return QJsonValue(QString(cellErrorMarker(m_error)));
    }
    return QJsonValue(QJsonValue::Null);
}

QString CellValue::canonicalString() const {
    switch (m_type) {
    case Type::Empty:   return "e:";
    case Type::Number:  return "n:" + QString::number(m_number, 'g', 17);
    case Type::Text:    return "t:" + m_text;
    case Type::Boolean: return m_boolean ? "b:1" : "b:0";
    case Type::Error:   return QString("x:") + cellErrorMarker(m_error);
    }
    return "e:";
}

bool CellValue::operator==(const CellValue &other) const {
    if (m_type != other.m_type)
        return false;
    switch (m_type) {
    case Type::Empty:   return true;
    case Type::Number:  return m_number == other.m_number;
    case Type::Text:    return m_text == other.m_text;
    case Type::Boolean: return m_boolean == other.m_boolean;
    case Type::Error:   return m_error == other.m_error;
    }
    return false;
}

} // namespace SheetCalc
