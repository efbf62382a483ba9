#ifndef CALCULATION_ORCHESTRATOR_H
#define CALCULATION_ORCHESTRATOR_H

/**
 * @file CalculationOrchestrator.h
 * @brief The public "execute calculation" operation
 *
 * execute(name, inputs):
 *   1. resolve the calculator; reject unknown/missing inputs before any I/O
 *   2. serve from the result cache when possible (no lock, no store access
 *      beyond a revision check)
 *   3. take the workbook's exclusive lock
 *   4. write inputs, build (or reuse) the evaluation plan for the outputs,
 *      evaluate formula cells in dependency order, read outputs
 *   5. persist computed values, cache a clean result, release the lock
 *
 * A cached result stays valid only while every cell it read holds what it
 * held when the result was computed. Cells the inputs set are part of the
 * key; for the rest (an optional input the caller left untouched, literals
 * another calculator writes) the entry is dropped when the engine writes
 * them, and the whole workbook's entries go when the store's revision moves
 * without us or cannot be known.
 *
 * Locks, versions and cache entries are keyed by the store's canonical id,
 * so every spelling of one workbook shares them.
 *
 * Per-cell formula errors never abort a run; they become diagnostics and,
 * when they reach a declared output, per-output errors.
 */

#include "config/CalculatorRegistry.h"
#include "formula/DependencyGraph.h"
#include "formula/FormulaEngine.h"
#include "services/CalculationResult.h"
#include "services/ResultCache.h"
#include "services/WorkbookLockManager.h"
#include "workbook/WorkbookStore.h"
#include <QHash>
#include <QJsonArray>
#include <QMap>
#include <QSet>
#include <QString>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

namespace SheetCalc {

struct OrchestratorSettings {
    std::chrono::milliseconds cacheTtl{std::chrono::seconds(300)};
    std::chrono::milliseconds lockTimeout{std::chrono::seconds(30)};  // negative = no limit
    bool persistComputedValues = true;
};

struct ExecuteOptions {
    std::optional<std::chrono::milliseconds> lockTimeout;  // overrides the default
    CancellationTokenPtr cancellation;
    bool bypassCache = false;
};

class CalculationOrchestrator {
public:
    CalculationOrchestrator(std::shared_ptr<CalculatorRegistry> registry,
                            std::shared_ptr<WorkbookStore> store,
                            const OrchestratorSettings &settings = OrchestratorSettings());

    CalculationResult execute(const QString &calculatorName,
                              const QMap<QString, CellValue> &inputs,
                              const ExecuteOptions &options = ExecuteOptions());

    QJsonArray listCalculators() const;

    // Drop every cached result and evaluation plan
    void invalidateCache();
    ResultCache::Stats cacheStats() const;

    const OrchestratorSettings &settings() const { return m_settings; }

private:
    struct PlanEntry {
        QVector<CellAddress> roots;
        quint64 formulaRevision = 0;
        std::shared_ptr<const EvaluationPlan> plan;
    };

    // Resolved, validated call: config plus effective inputs
    bool prepareInputs(const CalculatorConfig &config, const QMap<QString, CellValue> &inputs,
                       QMap<QString, CellValue> *effective, QVector<CalcError> *errors) const;

    // What a cycle did to the workbook, for cache bookkeeping
    struct CycleEffects {
        quint64 writes = 0;
        QSet<CellAddress> written;
        QSet<CellAddress> literalsRead;
    };

    // Drops cached results of a workbook changed by someone else. Returns
    // false when the store cannot tell, in which case nothing cached for the
    // workbook may be served.
    bool checkForeignWrites(const WorkbookHandle &workbook, const QString &workbookKey);

    // Runs with the workbook lock held
    void runCycle(const CalculatorConfig &config, const QMap<QString, CellValue> &inputs,
                  CalculationResult *result, CycleEffects *effects);

    // Runs with the workbook lock held, after the cycle
    void updateCache(const QString &workbookKey, std::optional<quint64> before,
                     std::optional<quint64> after, const CycleEffects &effects,
                     const QString &cacheKey, const CalculationResult &result);

    std::shared_ptr<const EvaluationPlan> planFor(const CalculatorConfig &config,
                                                  const WorkbookHandle &workbook,
                                                  CalcError *error);

    void evaluatePlan(const CalculatorConfig &config, const EvaluationPlan &plan,
                      CellSnapshot *snapshot, QHash<CellAddress, CellValue> *computed,
                      CalculationResult *result) const;

    static CalculationStatus statusFor(const CalculationResult &result);

    std::shared_ptr<CalculatorRegistry> m_registry;
    std::shared_ptr<WorkbookStore> m_store;
    OrchestratorSettings m_settings;

    FormulaEngine m_engine;
    ResultCache m_cache;
    WorkbookLockManager m_locks;

    std::mutex m_stateMutex;
    QHash<QString, quint64> m_expectedRevisions;  // by canonical id, after our last cycle
    QSet<QString> m_inFlight;                     // canonical ids mid-cycle
    QHash<QString, quint64> m_versions;           // evaluation version per canonical id
    QHash<QString, PlanEntry> m_plans;            // by calculator name
};

} // namespace SheetCalc

#endif // CALCULATION_ORCHESTRATOR_H
