#include "formula/DependencyGraph.h"
#include <QDebug>

namespace SheetCalc {

DependencyGraphBuilder::DependencyGraphBuilder(const FormulaEngine &engine)
    : m_engine(engine) {}

bool DependencyGraphBuilder::build(const QVector<CellAddress> &roots,
                                   const FormulaLookup &lookup,
                                   EvaluationPlan *plan,
                                   CalcError *error) const {
    enum VisitState { Unvisited = 0, OnPath = 1, Done = 2 };

    struct Frame {
        CellAddress cell;
        QVector<CellAddress> deps;
        int next = 0;
    };

    EvaluationPlan result;
    QHash<CellAddress, int> state;
    QSet<CellAddress> literals;

    // Classify a cell; compiles its formula and records direct references
    auto expand = [&](const CellAddress &cell, bool *isFormula,
                      QVector<CellAddress> *deps) -> bool {
        CalcError lookupErr;
        std::optional<QString> text = lookup(cell, &lookupErr);
        if (lookupErr.isSet()) {
            if (error)
                *error = lookupErr;
            return false;
        }
        if (!text) {
            *isFormula = false;
            return true;
        }

        *isFormula = true;
        CalcError compileErr;
        FormulaPtr formula = m_engine.compile(*text, &compileErr);
        if (!formula) {
            // Compile failures stay leaves: the cell evaluates to #NAME?
            result.compileErrors.insert(cell, compileErr);
            deps->clear();
        } else {
            result.formulas.insert(cell, formula);
            *deps = formula->references.expanded();
        }
        result.dependencies.insert(cell, *deps);
        return true;
    };

    auto addLiteral = [&](const CellAddress &cell) {
        if (!literals.contains(cell)) {
            literals.insert(cell);
            result.literalCells.append(cell);
        }
    };

    for (const CellAddress &root : roots) {
        if (state.value(root, Unvisited) == Done || literals.contains(root))
            continue;

        bool isFormula = false;
        QVector<CellAddress> rootDeps;
        if (!expand(root, &isFormula, &rootDeps))
            return false;
        if (!isFormula) {
            addLiteral(root);
            continue;
        }

        QVector<Frame> stack;
        state.insert(root, OnPath);
        stack.append(Frame{root, rootDeps, 0});

        while (!stack.isEmpty()) {
            Frame &top = stack.last();
            if (top.next >= top.deps.size()) {
                state.insert(top.cell, Done);
                result.order.append(top.cell);
                stack.removeLast();
                continue;
            }

            const CellAddress dep = top.deps[top.next++];
            const int depState = state.value(dep, Unvisited);
            if (depState == Done)
                continue;

            if (depState == OnPath) {
                QStringList cycle;
                bool inCycle = false;
                for (const Frame &frame : stack) {
                    if (frame.cell == dep)
                        inCycle = true;
                    if (inCycle)
                        cycle << frame.cell.toString();
                }
                QStringList path = cycle;
                path << dep.toString();
                qWarning() << "[DependencyGraph] Circular reference:" << path.join(" -> ");
                return fail(error, ErrorCode::CircularReference,
                            QString("Circular reference: %1").arg(path.join(" -> ")),
                            cycle);
            }

            if (literals.contains(dep))
                continue;

            bool depIsFormula = false;
            QVector<CellAddress> depDeps;
            if (!expand(dep, &depIsFormula, &depDeps))
                return false;
            if (!depIsFormula) {
                addLiteral(dep);
                continue;
            }

            state.insert(dep, OnPath);
            stack.append(Frame{dep, depDeps, 0});  // invalidates `top`
        }
    }

    if (plan)
        *plan = result;
    return true;
}

} // namespace SheetCalc
