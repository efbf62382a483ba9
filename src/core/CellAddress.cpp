#include "core/CellAddress.h"
#include <climits>

namespace SheetCalc {

QString CellAddress::toString() const { return CellAddressing::format(*this); }

CellRange::CellRange(const CellAddress &a, const CellAddress &b)
    : topLeft(qMin(a.column, b.column), qMin(a.row, b.row))
    , bottomRight(qMax(a.column, b.column), qMax(a.row, b.row)) {}

bool CellRange::contains(const CellAddress &address) const {
    return CellAddressing::rangeContains(*this, address);
}

QString CellRange::toString() const {
    if (topLeft == bottomRight)
        return topLeft.toString();
    return topLeft.toString() + ":" + bottomRight.toString();
}

namespace CellAddressing {

QString columnToLetters(int column) {
    QString letters;
    while (column > 0) {
        int rem = (column - 1) % 26;
        letters.prepend(QChar('A' + rem));
        column = (column - 1) / 26;
    }
    return letters;
}

int lettersToColumn(const QString &letters) {
    if (letters.isEmpty() || letters.size() > kMaxColumnLetters)
        return 0;
    qint64 column = 0;
    for (QChar ch : letters) {
        QChar up = ch.toUpper();
        if (up < QChar('A') || up > QChar('Z'))
            return 0;
        column = column * 26 + (up.unicode() - 'A' + 1);
    }
    return column > INT_MAX ? 0 : int(column);
}

std::optional<CellAddress> parse(const QString &text, CalcError *error) {
    const QString s = text.trimmed();
    if (s.isEmpty()) {
        fail(error, ErrorCode::AddressMalformed, "Empty cell address", {text});
        return std::nullopt;
    }

    int i = 0;
    const int len = s.length();
    if (s[i] == '$')
        ++i;

    int letterStart = i;
    while (i < len && s[i].isLetter() && s[i].unicode() < 128)
        ++i;
    const QString letters = s.mid(letterStart, i - letterStart);

    if (i < len && s[i] == '$')
        ++i;

    int digitStart = i;
    while (i < len && s[i].isDigit() && s[i].unicode() < 128)
        ++i;
    const QString digits = s.mid(digitStart, i - digitStart);

    if (i != len || letters.isEmpty() || digits.isEmpty() ||
        letters.size() > kMaxColumnLetters || digits.size() > kMaxRowDigits) {
        fail(error, ErrorCode::AddressMalformed,
             QString("Malformed cell address '%1'").arg(text), {text});
        return std::nullopt;
    }

    bool ok = false;
    int row = digits.toInt(&ok);
    int column = lettersToColumn(letters);
    if (!ok || row < 1 || column < 1) {
        fail(error, ErrorCode::AddressMalformed,
             QString("Malformed cell address '%1'").arg(text), {text});
        return std::nullopt;
    }
    return CellAddress(column, row);
}

std::optional<CellAddress> parse(const QString &text, const SheetBounds &bounds,
                                 CalcError *error) {
    auto address = parse(text, error);
    if (!address)
        return std::nullopt;
    if (!bounds.allows(*address)) {
        fail(error, ErrorCode::AddressOutOfBounds,
             QString("Cell %1 lies outside the sheet bounds (%2 columns x %3 rows)")
                 .arg(address->toString())
                 .arg(bounds.maxColumns)
                 .arg(bounds.maxRows),
             {address->toString()});
        return std::nullopt;
    }
    return address;
}

QString format(const CellAddress &address) {
    if (!address.isValid())
        return QString();
    return columnToLetters(address.column) + QString::number(address.row);
}

std::optional<CellRange> parseRange(const QString &text, CalcError *error) {
    const QStringList parts = text.trimmed().split(':');
    if (parts.size() == 1) {
        auto single = parse(parts[0], error);
        if (!single)
            return std::nullopt;
        return CellRange(*single, *single);
    }
    if (parts.size() != 2) {
        fail(error, ErrorCode::AddressMalformed,
             QString("Malformed cell range '%1'").arg(text), {text});
        return std::nullopt;
    }
    auto first = parse(parts[0], error);
    if (!first)
        return std::nullopt;
    auto second = parse(parts[1], error);
    if (!second)
        return std::nullopt;
    return CellRange(*first, *second);
}

bool rangeContains(const CellRange &range, const CellAddress &address) {
    return address.column >= range.topLeft.column &&
           address.column <= range.bottomRight.column &&
           address.row >= range.topLeft.row &&
           address.row <= range.bottomRight.row;
}

} // namespace CellAddressing

} // namespace SheetCalc
