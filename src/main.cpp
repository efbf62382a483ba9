#include "config/CalculatorRegistry.h"
#include "services/CalculationOrchestrator.h"
#include "utils/ConfigLoader.h"
#include "utils/Logger.h"
#include "workbook/WorkbookStoreFactory.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStandardPaths>
#include <cstdio>

using namespace SheetCalc;

namespace {

enum ExitCode { ExitSuccess = 0, ExitFailure = 1, ExitPartial = 2 };

// First existing config.ini across user, development and install locations
QString findConfigFile()
{
    const QString appDir = QCoreApplication::applicationDirPath();

    QStringList candidates;
    const QString appConfigDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (!appConfigDir.isEmpty())
        candidates << QDir(appConfigDir).filePath("config.ini");
    candidates << QDir::home().filePath(".config/sheetcalc/config.ini");
    candidates << QDir::current().filePath("configs/config.ini");
    candidates << QDir(appDir).filePath("../configs/config.ini");
    candidates << QDir(appDir).filePath("configs/config.ini");

    for (const QString &path : candidates) {
        if (QFileInfo::exists(path))
            return QFileInfo(path).absoluteFilePath();
    }
    return QString();
}

void printJson(const QJsonDocument &doc)
{
    fprintf(stdout, "%s\n", doc.toJson(QJsonDocument::Indented).constData());
    fflush(stdout);
}

bool parseInputs(const QStringList &pairs, const QString &inputsJson,
                 QMap<QString, CellValue> *inputs, QString *errorMsg)
{
    if (!inputsJson.isEmpty()) {
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(inputsJson.toUtf8(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            *errorMsg = QString("--inputs must be a JSON object: %1").arg(parseError.errorString());
            return false;
        }
        const QJsonObject obj = doc.object();
        for (auto it = obj.begin(); it != obj.end(); ++it)
            inputs->insert(it.key(), CellValue::fromJson(it.value()));
    }

    for (const QString &pair : pairs) {
        const int eq = pair.indexOf('=');
        if (eq <= 0) {
            *errorMsg = QString("Expected key=value, got '%1'").arg(pair);
            return false;
        }
        inputs->insert(pair.left(eq).trimmed(), CellValue::fromUserText(pair.mid(eq + 1)));
    }
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("sheetcalc");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Run spreadsheet-backed engineering calculators");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "Configuration file (INI).", "file");
    QCommandLineOption inputsOption("inputs", "Inputs as a JSON object.", "json");
    QCommandLineOption noCacheOption("no-cache", "Ignore cached results.");
    parser.addOption(configOption);
    parser.addOption(inputsOption);
    parser.addOption(noCacheOption);
    parser.addPositionalArgument("command", "list | execute");
    parser.addPositionalArgument("args", "execute: NAME [key=value ...]", "[args...]");
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        fprintf(stderr, "%s\n", qPrintable(parser.helpText()));
        return ExitFailure;
    }

    QString configPath = parser.value(configOption);
    if (configPath.isEmpty())
        configPath = findConfigFile();

    ConfigLoader config;
    if (configPath.isEmpty() || !config.load(configPath)) {
        fprintf(stderr, "No usable configuration file (tried %s)\n",
                configPath.isEmpty() ? "default locations" : qPrintable(configPath));
        return ExitFailure;
    }

    if (!Logging::install(config.getLogLevel(), config.getLogFile()))
        qWarning() << "[Main] Logging to stderr only; cannot open" << config.getLogFile();

    auto registry = std::make_shared<CalculatorRegistry>();
    const LoadReport report = registry->loadDirectory(config.getCalculatorDirectory());
    for (const CalcError &error : report.errors)
        qWarning() << "[Main]" << error.toString();

    CalcError storeError;
    std::shared_ptr<WorkbookStore> store = WorkbookStoreFactory::create(config, &storeError);
    if (!store) {
        qCritical() << "[Main]" << storeError.toString();
        Logging::shutdown();
        return ExitFailure;
    }

    OrchestratorSettings settings;
    settings.cacheTtl = std::chrono::seconds(config.getCacheTtlSeconds());
    settings.lockTimeout = std::chrono::seconds(config.getLockTimeoutSeconds());
    settings.persistComputedValues = config.getPersistComputedValues();
    CalculationOrchestrator orchestrator(registry, store, settings);

    int exitCode = ExitSuccess;
    const QString command = args.first();

    if (command == "list") {
        printJson(QJsonDocument(orchestrator.listCalculators()));
    } else if (command == "execute") {
        if (args.size() < 2) {
            fprintf(stderr, "execute needs a calculator name\n");
            Logging::shutdown();
            return ExitFailure;
        }

        QMap<QString, CellValue> inputs;
        QString errorMsg;
        if (!parseInputs(args.mid(2), parser.value(inputsOption), &inputs, &errorMsg)) {
            fprintf(stderr, "%s\n", qPrintable(errorMsg));
            Logging::shutdown();
            return ExitFailure;
        }

        ExecuteOptions options;
        options.bypassCache = parser.isSet(noCacheOption);
        const CalculationResult result = orchestrator.execute(args.at(1), inputs, options);
        printJson(QJsonDocument(result.toJson()));

        switch (result.status) {
        case CalculationStatus::Success: exitCode = ExitSuccess; break;
        case CalculationStatus::Partial: exitCode = ExitPartial; break;
        case CalculationStatus::Failure: exitCode = ExitFailure; break;
        }
    } else {
        fprintf(stderr, "Unknown command '%s'\n", qPrintable(command));
        exitCode = ExitFailure;
    }

    Logging::shutdown();
    return exitCode;
}
