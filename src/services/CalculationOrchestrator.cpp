#include "services/CalculationOrchestrator.h"
#include <QDebug>
#include <QElapsedTimer>
#include <QStringList>

namespace SheetCalc {

namespace {

ErrorCode codeForMarker(CellErrorKind kind)
{
    switch (kind) {
    case CellErrorKind::DivisionByZero: return ErrorCode::DivisionByZero;
    case CellErrorKind::Name:           return ErrorCode::FormulaUnsupported;
    case CellErrorKind::Reference:      return ErrorCode::AddressOutOfBounds;
    case CellErrorKind::Value:
    case CellErrorKind::Num:            return ErrorCode::FormulaEvaluation;
    }
    return ErrorCode::FormulaEvaluation;
}

// Marks a workbook as mid-cycle for as long as the scope lives
class InFlightScope {
public:
    InFlightScope(std::mutex &mutex, QSet<QString> &inFlight, const QString &workbookId)
        : m_mutex(mutex), m_inFlight(inFlight), m_workbookId(workbookId)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inFlight.insert(m_workbookId);
    }
    ~InFlightScope()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inFlight.remove(m_workbookId);
    }

private:
    std::mutex &m_mutex;
    QSet<QString> &m_inFlight;
    QString m_workbookId;
};

} // namespace

CalculationOrchestrator::CalculationOrchestrator(std::shared_ptr<CalculatorRegistry> registry,
                                                 std::shared_ptr<WorkbookStore> store,
                                                 const OrchestratorSettings &settings)
    : m_registry(std::move(registry))
    , m_store(std::move(store))
    , m_settings(settings)
    , m_cache(settings.cacheTtl)
{
    qDebug() << "[Orchestrator] Using" << m_store->backendName() << "workbook backend,"
             << "cache TTL" << qint64(m_settings.cacheTtl.count()) << "ms";
}

QJsonArray CalculationOrchestrator::listCalculators() const
{
    return m_registry->list();
}

void CalculationOrchestrator::invalidateCache()
{
    m_cache.clear();
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_plans.clear();
}

ResultCache::Stats CalculationOrchestrator::cacheStats() const
{
    return m_cache.stats();
}

// ═══════════════════════════════════════════════════════════════════
// EXECUTE
// ═══════════════════════════════════════════════════════════════════

CalculationResult CalculationOrchestrator::execute(const QString &calculatorName,
                                                   const QMap<QString, CellValue> &inputs,
                                                   const ExecuteOptions &options)
{
    CalculationResult result;
    result.calculatorName = calculatorName;
    result.inputsUsed = inputs;
    result.status = CalculationStatus::Failure;

    if (options.cancellation && options.cancellation->isCancelled()) {
        result.errors.append(CalcError(ErrorCode::Cancelled,
                                       QString("Execution of '%1' was cancelled").arg(calculatorName)));
        return result;
    }

    CalcError error;
    CalculatorConfigPtr config = m_registry->get(calculatorName, &error);
    if (!config) {
        result.errors.append(error);
        return result;
    }
    if (!config->isExecutable()) {
        result.errors.append(CalcError(ErrorCode::NotExecutable,
                                       QString("Calculator '%1' has no backing workbook").arg(calculatorName),
                                       {calculatorName}));
        return result;
    }

    QMap<QString, CellValue> effective;
    if (!prepareInputs(*config, inputs, &effective, &result.errors))
        return result;
    result.inputsUsed = effective;

    const WorkbookHandle workbook = config->handle();
    const QString workbookKey = m_store->canonicalId(workbook.workbookId);
    const QString cacheKey = ResultCache::makeKey(calculatorName, effective);

    const bool cacheTrusted = checkForeignWrites(workbook, workbookKey);
    if (cacheTrusted && !options.bypassCache) {
        if (auto cached = m_cache.lookup(cacheKey)) {
            qDebug() << "[Orchestrator]" << calculatorName << "served from cache";
            return *cached;
        }
    }

    WorkbookLockManager::Guard guard;
    const auto timeout = options.lockTimeout.value_or(m_settings.lockTimeout);
    if (!m_locks.acquire(workbookKey, timeout, options.cancellation.get(), &guard, &error)) {
        result.errors.append(error);
        return result;
    }

    QElapsedTimer timer;
    timer.start();
    {
        InFlightScope inFlight(m_stateMutex, m_inFlight, workbookKey);
        const std::optional<quint64> before = m_store->revision(workbook);
        CycleEffects effects;
        runCycle(*config, effective, &result, &effects);
        result.status = statusFor(result);
        const std::optional<quint64> after = m_store->revision(workbook);
        updateCache(workbookKey, before, after, effects, cacheKey, result);
    }
    guard.release();

    qInfo() << "[Orchestrator]" << calculatorName << "->" << calculationStatusName(result.status)
            << "in" << timer.elapsed() << "ms" << "(version" << result.evaluationVersion << ")";
    return result;
}

bool CalculationOrchestrator::prepareInputs(const CalculatorConfig &config,
                                            const QMap<QString, CellValue> &inputs,
                                            QMap<QString, CellValue> *effective,
                                            QVector<CalcError> *errors) const
{
    QStringList unknown;
    QStringList invalid;
    for (auto it = inputs.begin(); it != inputs.end(); ++it) {
        if (!config.inputs.contains(it.key()))
            unknown << it.key();
        else if (it.value().isError())
            invalid << it.key();
    }

    QStringList missing;
    for (auto it = config.inputs.begin(); it != config.inputs.end(); ++it) {
        if (inputs.contains(it.key()))
            continue;
        const FieldMetadata meta = config.inputMetadata.value(it.key());
        if (meta.required && !meta.defaultValue)
            missing << it.key();
    }

    if (!unknown.isEmpty()) {
        errors->append(CalcError(ErrorCode::UnknownInput,
                                 QString("Unknown input(s) for '%1': %2")
                                     .arg(config.name, unknown.join(", ")),
                                 unknown));
    }
    if (!missing.isEmpty()) {
        errors->append(CalcError(ErrorCode::MissingInput,
                                 QString("Missing required input(s) for '%1': %2")
                                     .arg(config.name, missing.join(", ")),
                                 missing));
    }
    if (!invalid.isEmpty()) {
        errors->append(CalcError(ErrorCode::InvalidInputValue,
                                 QString("Error markers cannot be used as input values: %1")
                                     .arg(invalid.join(", ")),
                                 invalid));
    }
    if (!errors->isEmpty())
        return false;

    *effective = inputs;
    for (auto it = config.inputs.begin(); it != config.inputs.end(); ++it) {
        const FieldMetadata meta = config.inputMetadata.value(it.key());
        if (!inputs.contains(it.key()) && meta.defaultValue)
            effective->insert(it.key(), *meta.defaultValue);
    }
    return true;
}

bool CalculationOrchestrator::checkForeignWrites(const WorkbookHandle &workbook,
                                                 const QString &workbookKey)
{
    std::optional<quint64> expected;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_inFlight.contains(workbookKey))
            return true;
        auto it = m_expectedRevisions.constFind(workbookKey);
        if (it != m_expectedRevisions.constEnd())
            expected = it.value();
    }

    const std::optional<quint64> current = m_store->revision(workbook);
    if (!current) {
        // Nothing proves the workbook unchanged since any result was computed
        m_cache.invalidateWorkbook(workbookKey);
        return false;
    }
    if (!expected || *current == *expected)
        return true;

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        // A cycle of our own may have started meanwhile
        if (m_inFlight.contains(workbookKey) ||
            m_expectedRevisions.value(workbookKey) != *expected)
            return true;
        m_expectedRevisions.insert(workbookKey, *current);
    }
    qInfo() << "[Orchestrator] Workbook" << workbookKey << "changed outside the engine"
            << "(revision" << *expected << "->" << *current << "); dropping cached results";
    m_cache.invalidateWorkbook(workbookKey);
    return true;
}

void CalculationOrchestrator::updateCache(const QString &workbookKey,
                                          std::optional<quint64> before,
                                          std::optional<quint64> after,
                                          const CycleEffects &effects,
                                          const QString &cacheKey,
                                          const CalculationResult &result)
{
    // Each successful write bumps the revision once; anything beyond that
    // was somebody else
    bool foreign = !before || !after || *after != *before + effects.writes;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        auto it = m_expectedRevisions.constFind(workbookKey);
        if (before && it != m_expectedRevisions.constEnd() && it.value() != *before)
            foreign = true;
        if (after)
            m_expectedRevisions.insert(workbookKey, *after);
        else
            m_expectedRevisions.remove(workbookKey);
    }

    if (foreign)
        m_cache.invalidateWorkbook(workbookKey);
    else
        m_cache.invalidateCells(workbookKey, effects.written);

    if (result.status != CalculationStatus::Success || !after)
        return;
    QSet<CellAddress> dependsOn = effects.literalsRead;
    dependsOn.subtract(effects.written);
    m_cache.store(cacheKey, workbookKey, result, dependsOn);
}

// ═══════════════════════════════════════════════════════════════════
// WRITE / EVALUATE / READ CYCLE (workbook lock held)
// ═══════════════════════════════════════════════════════════════════

void CalculationOrchestrator::runCycle(const CalculatorConfig &config,
                                       const QMap<QString, CellValue> &inputs,
                                       CalculationResult *result,
                                       CycleEffects *effects)
{
    const WorkbookHandle workbook = config.handle();
    CalcError error;

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        result->evaluationVersion = ++m_versions[m_store->canonicalId(workbook.workbookId)];
    }

    // Every input cell is checked before the first write
    QStringList immutable;
    for (auto it = inputs.begin(); it != inputs.end(); ++it) {
        const CellAddress cell = config.inputs.value(it.key());
        std::optional<QString> formula;
        if (!m_store->readFormula(workbook, cell, &formula, &error)) {
            result->errors.append(error);
            return;
        }
        if (formula)
            immutable << cell.toString();
    }
    if (!immutable.isEmpty()) {
        result->errors.append(CalcError(ErrorCode::ImmutableCell,
                                        QString("Input cell(s) hold formulas: %1").arg(immutable.join(", ")),
                                        immutable));
        return;
    }

    for (auto it = inputs.begin(); it != inputs.end(); ++it) {
        const CellAddress cell = config.inputs.value(it.key());
        if (!m_store->writeCell(workbook, cell, it.value(), &error)) {
            result->errors.append(error);
            return;
        }
        ++effects->writes;
        effects->written.insert(cell);
    }

    std::shared_ptr<const EvaluationPlan> plan = planFor(config, workbook, &error);
    if (!plan) {
        result->errors.append(error);
        // Inputs are written; keep them durable
        CalcError flushError;
        if (!m_store->flush(workbook, &flushError))
            result->errors.append(flushError);
        return;
    }

    CellSnapshot snapshot;
    for (const CellAddress &cell : plan->literalCells) {
        effects->literalsRead.insert(cell);
        CellValue value;
        if (m_store->readCell(workbook, cell, &value, &error)) {
            snapshot.insert(cell, value);
        } else if (error.code == ErrorCode::AddressOutOfBounds) {
            snapshot.insert(cell, CellValue::error(CellErrorKind::Reference));
            error = CalcError();
        } else {
            result->errors.append(error);
            return;
        }
    }

    QHash<CellAddress, CellValue> computed;
    evaluatePlan(config, *plan, &snapshot, &computed, result);

    if (m_settings.persistComputedValues && !computed.isEmpty()) {
        if (!m_store->storeComputedValues(workbook, computed, result->evaluationVersion, &error)) {
            result->errors.append(error);
            return;
        }
    }
    if (!m_store->flush(workbook, &error))
        result->errors.append(error);
}

std::shared_ptr<const EvaluationPlan> CalculationOrchestrator::planFor(const CalculatorConfig &config,
                                                                       const WorkbookHandle &workbook,
                                                                       CalcError *error)
{
    QVector<CellAddress> roots;
    for (const CellAddress &cell : config.outputs)
        roots.append(cell);

    const std::optional<quint64> formulaRevision = m_store->formulaRevision(workbook);
    if (formulaRevision) {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        auto it = m_plans.constFind(config.name);
        if (it != m_plans.constEnd() && it->formulaRevision == *formulaRevision &&
            it->roots == roots) {
            return it->plan;
        }
    }

    DependencyGraphBuilder builder(m_engine);
    auto lookup = [this, &workbook](const CellAddress &cell, CalcError *lookupError)
        -> std::optional<QString> {
        std::optional<QString> formula;
        CalcError readError;
        if (m_store->readFormula(workbook, cell, &formula, &readError))
            return formula;
        // Out-of-sheet references read as #REF! rather than failing the plan
        if (readError.code != ErrorCode::AddressOutOfBounds && lookupError)
            *lookupError = readError;
        return std::nullopt;
    };

    auto plan = std::make_shared<EvaluationPlan>();
    if (!builder.build(roots, lookup, plan.get(), error))
        return nullptr;

    qDebug() << "[Orchestrator] Built plan for" << config.name << ":" << plan->order.size()
             << "formula cells," << plan->literalCells.size() << "literal cells";

    if (formulaRevision) {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        PlanEntry entry;
        entry.roots = roots;
        entry.formulaRevision = *formulaRevision;
        entry.plan = plan;
        m_plans.insert(config.name, entry);
    }
    return plan;
}

void CalculationOrchestrator::evaluatePlan(const CalculatorConfig &config,
                                           const EvaluationPlan &plan,
                                           CellSnapshot *snapshot,
                                           QHash<CellAddress, CellValue> *computed,
                                           CalculationResult *result) const
{
    QHash<CellAddress, QString> outputNames;
    for (auto it = config.outputs.begin(); it != config.outputs.end(); ++it)
        outputNames.insert(it.value(), it.key());

    // Cell whose own formula first produced the marker a cell carries
    QHash<CellAddress, CellAddress> origins;

    for (const CellAddress &cell : plan.order) {
        CellValue value;
        Diagnostic diagnostic;
        diagnostic.cell = cell;
        diagnostic.output = outputNames.value(cell);

        auto compileError = plan.compileErrors.constFind(cell);
        if (compileError != plan.compileErrors.constEnd()) {
            value = CellValue::error(CellErrorKind::Name);
            diagnostic.code = compileError->code;
            diagnostic.message = QString("%1: %2").arg(cell.toString(), compileError->message);
        } else {
            value = m_engine.evaluate(*plan.formulas.value(cell), *snapshot);
            if (value.isError()) {
                diagnostic.code = codeForMarker(value.errorKind());
                for (const CellAddress &dep : plan.dependencies.value(cell)) {
                    const CellValue depValue = snapshot->value(dep);
                    if (depValue.isError() && depValue.errorKind() == value.errorKind()) {
                        diagnostic.origin = origins.value(dep, dep);
                        break;
                    }
                }
                const char *marker = cellErrorMarker(value.errorKind());
                if (diagnostic.origin) {
                    origins.insert(cell, *diagnostic.origin);
                    auto originError = plan.compileErrors.constFind(*diagnostic.origin);
                    if (originError != plan.compileErrors.constEnd())
                        diagnostic.code = originError->code;
                    diagnostic.message = QString("%1 is %2, propagated from %3")
                                             .arg(cell.toString(), QLatin1String(marker),
                                                  diagnostic.origin->toString());
                } else {
                    diagnostic.message = QString("%1 evaluates to %2")
                                             .arg(cell.toString(), QLatin1String(marker));
                }
            }
        }

        snapshot->insert(cell, value);
        computed->insert(cell, value);
        if (value.isError())
            result->diagnostics.append(diagnostic);
    }

    for (auto it = config.outputs.begin(); it != config.outputs.end(); ++it) {
        const CellValue value = snapshot->value(it.value());
        result->outputs.insert(it.key(), value);
        if (!value.isError())
            continue;

        ErrorCode code = codeForMarker(value.errorKind());
        QString message = QString("Output '%1' (%2) is %3")
                              .arg(it.key(), it.value().toString(),
                                   QLatin1String(cellErrorMarker(value.errorKind())));
        for (const Diagnostic &diagnostic : result->diagnostics) {
            if (diagnostic.cell == it.value()) {
                code = diagnostic.code;
                message = diagnostic.message;
                break;
            }
        }
        result->outputErrors.insert(it.key(), CalcError(code, message, {it.key(), it.value().toString()}));
    }
}

CalculationStatus CalculationOrchestrator::statusFor(const CalculationResult &result)
{
    if (!result.errors.isEmpty())
        return CalculationStatus::Failure;
    if (result.outputErrors.isEmpty())
        return CalculationStatus::Success;
    if (result.outputErrors.size() < result.outputs.size())
        return CalculationStatus::Partial;
    return CalculationStatus::Failure;
}

} // namespace SheetCalc
