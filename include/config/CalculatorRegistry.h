#ifndef CALCULATOR_REGISTRY_H
#define CALCULATOR_REGISTRY_H

#include "config/CalculatorConfig.h"
#include <QJsonArray>
#include <QJsonObject>
#include <QMap>
#include <QStringList>
#include <QVector>
#include <memory>
#include <shared_mutex>

namespace SheetCalc {

using CalculatorConfigPtr = std::shared_ptr<const CalculatorConfig>;

/**
 * @brief Outcome of one load: what made it in, and why the rest did not
 */
struct LoadReport {
    QStringList loaded;        // every accepted calculator, executable or not
    QStringList templateOnly;  // subset of `loaded` without a backing workbook
    QVector<CalcError> errors; // one per rejected record

    bool ok() const { return errors.isEmpty(); }
};

/**
 * @brief Named calculator definitions, validated on load
 *
 * A bad record is rejected on its own; the rest of the set still loads.
 * Each load replaces the whole registry in one step, so readers see either
 * the old set or the new one. Configs are handed out as shared pointers and
 * stay valid across reloads.
 */
class CalculatorRegistry {
public:
    CalculatorRegistry() = default;

    LoadReport loadAll(const QVector<QJsonObject> &records);

    // Every *.json file in the directory; a record without "name" takes the file stem
    LoadReport loadDirectory(const QString &directory);

    CalculatorConfigPtr get(const QString &name, CalcError *error = nullptr) const;

    QStringList names() const;
    QJsonArray list() const;
    int size() const;

private:
    LoadReport install(const QVector<QJsonObject> &records, LoadReport report);

    mutable std::shared_mutex m_mutex;
    QMap<QString, CalculatorConfigPtr> m_configs;
};

} // namespace SheetCalc

#endif // CALCULATOR_REGISTRY_H
