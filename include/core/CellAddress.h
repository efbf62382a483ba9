#ifndef CELL_ADDRESS_H
#define CELL_ADDRESS_H

/**
 * @file CellAddress.h
 * @brief A1-style spreadsheet coordinates
 *
 * Columns use bijective base-26 letters (A=1 ... Z=26, AA=27 ...). Parsing is
 * case-insensitive, accepts optional absolute markers ($B$4), and rejects
 * anything else with AddressError.Malformed.
 */

#include "core/CalcError.h"
#include <QHash>
#include <QString>
#include <QtGlobal>
#include <optional>

namespace SheetCalc {

struct CellAddress {
    int column = 0;  // 1-based
    int row = 0;     // 1-based

    CellAddress() = default;
    CellAddress(int col, int r) : column(col), row(r) {}

    bool isValid() const { return column >= 1 && row >= 1; }
    QString toString() const;

    bool operator==(const CellAddress &o) const { return column == o.column && row == o.row; }
    bool operator!=(const CellAddress &o) const { return !(*this == o); }
    // Row-major ordering (A1, B1, ..., A2)
    bool operator<(const CellAddress &o) const {
        return row != o.row ? row < o.row : column < o.column;
    }
};

struct CellRange {
    CellAddress topLeft;
    CellAddress bottomRight;

    CellRange() = default;
    CellRange(const CellAddress &a, const CellAddress &b);  // normalizes corners

    int columnCount() const { return bottomRight.column - topLeft.column + 1; }
    int rowCount() const { return bottomRight.row - topLeft.row + 1; }
    qint64 cellCount() const { return qint64(columnCount()) * rowCount(); }
    bool contains(const CellAddress &address) const;
    QString toString() const;

    bool operator==(const CellRange &o) const {
        return topLeft == o.topLeft && bottomRight == o.bottomRight;
    }
};

/**
 * @brief Declared size of a sheet. Zero in either field means unbounded.
 */
struct SheetBounds {
    int maxColumns = 0;
    int maxRows = 0;

    bool isBounded() const { return maxColumns > 0 || maxRows > 0; }
    bool allows(const CellAddress &address) const {
        return (maxColumns <= 0 || address.column <= maxColumns) &&
               (maxRows <= 0 || address.row <= maxRows);
    }
};

namespace CellAddressing {

constexpr int kMaxColumnLetters = 7;
constexpr int kMaxRowDigits = 10;

QString columnToLetters(int column);
int lettersToColumn(const QString &letters);  // 0 on invalid input

std::optional<CellAddress> parse(const QString &text, CalcError *error = nullptr);
std::optional<CellAddress> parse(const QString &text, const SheetBounds &bounds,
                                 CalcError *error = nullptr);
QString format(const CellAddress &address);

// "A1:C3" or a single address (1x1 range)
std::optional<CellRange> parseRange(const QString &text, CalcError *error = nullptr);
bool rangeContains(const CellRange &range, const CellAddress &address);

} // namespace CellAddressing

#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
inline size_t qHash(const CellAddress &address, size_t seed = 0) noexcept {
    return ::qHash((quint64(quint32(address.column)) << 32) | quint32(address.row), seed);
}
#else
inline uint qHash(const CellAddress &address, uint seed = 0) noexcept {
    return ::qHash((quint64(quint32(address.column)) << 32) | quint32(address.row), seed);
}
#endif

} // namespace SheetCalc

#endif // CELL_ADDRESS_H
