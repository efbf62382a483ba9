#ifndef DEPENDENCY_GRAPH_H
#define DEPENDENCY_GRAPH_H

/**
 * @file DependencyGraph.h
 * @brief Evaluation order for the formula cells a set of outputs needs
 *
 * Starting from the declared output cells, formulas are followed
 * transitively through their references. Only reachable cells enter the
 * plan, so work is bounded by what the outputs need rather than the size of
 * the workbook. A cell met again while still on the traversal path is a
 * cycle, which aborts the build with CircularReferenceError naming every
 * cell of the cycle.
 */

#include "core/CalcError.h"
#include "core/CellAddress.h"
#include "formula/FormulaEngine.h"
#include <QHash>
#include <QSet>
#include <QVector>
#include <functional>
#include <optional>

namespace SheetCalc {

/**
 * @brief Everything needed to evaluate one calculator's outputs
 */
struct EvaluationPlan {
    // Formula cells, each after every formula cell it reads
    QVector<CellAddress> order;
    // Compiled formula per entry of `order` (absent when compilation failed)
    QHash<CellAddress, FormulaPtr> formulas;
    // Formula cells whose formula did not compile
    QHash<CellAddress, CalcError> compileErrors;
    // Non-formula cells read by some formula in the plan
    QVector<CellAddress> literalCells;
    // Direct references per formula cell (for error origin reporting)
    QHash<CellAddress, QVector<CellAddress>> dependencies;

    bool isFormulaCell(const CellAddress &address) const {
        return formulas.contains(address) || compileErrors.contains(address);
    }
};

class DependencyGraphBuilder {
public:
    /**
     * @brief Formula text of a cell, std::nullopt for a literal/blank cell.
     *        A lookup failure (e.g. backend unavailable) is reported through
     *        *error and aborts the build.
     */
    using FormulaLookup =
        std::function<std::optional<QString>(const CellAddress &, CalcError *error)>;

    explicit DependencyGraphBuilder(const FormulaEngine &engine);

    bool build(const QVector<CellAddress> &roots,
               const FormulaLookup &lookup,
               EvaluationPlan *plan,
               CalcError *error = nullptr) const;

private:
    const FormulaEngine &m_engine;
};

} // namespace SheetCalc

#endif // DEPENDENCY_GRAPH_H
