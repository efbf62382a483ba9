#include "config/CalculatorRegistry.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <mutex>

namespace SheetCalc {

LoadReport CalculatorRegistry::loadAll(const QVector<QJsonObject> &records) {
    return install(records, LoadReport());
}

LoadReport CalculatorRegistry::loadDirectory(const QString &directory) {
    LoadReport report;
    QVector<QJsonObject> records;

    QDir dir(directory);
    if (!dir.exists()) {
        qWarning() << "[Registry] Calculator directory not found:" << directory;
        report.errors.append(CalcError(ErrorCode::ConfigInvalid,
                                       QString("Calculator directory '%1' does not exist").arg(directory),
                                       {directory}));
        return install(records, report);
    }

    const QFileInfoList files = dir.entryInfoList({"*.json"}, QDir::Files, QDir::Name);
    for (const QFileInfo &info : files) {
        QFile file(info.absoluteFilePath());
        if (!file.open(QIODevice::ReadOnly)) {
            report.errors.append(CalcError(ErrorCode::ConfigInvalid,
                                           QString("Cannot read %1: %2").arg(info.fileName(), file.errorString()),
                                           {info.completeBaseName()}));
            continue;
        }

        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            report.errors.append(CalcError(ErrorCode::ConfigInvalid,
                                           QString("%1 is not a JSON object: %2")
                                               .arg(info.fileName(), parseError.errorString()),
                                           {info.completeBaseName()}));
            continue;
        }

        QJsonObject record = doc.object();
        if (record.value("name").toString().trimmed().isEmpty())
            record["name"] = info.completeBaseName();
        records.append(record);
    }

    return install(records, report);
}

LoadReport CalculatorRegistry::install(const QVector<QJsonObject> &records, LoadReport report) {
    QMap<QString, CalculatorConfigPtr> configs;

    for (const QJsonObject &record : records) {
        CalcError error;
        auto config = CalculatorConfig::fromJson(record, &error);
        if (!config) {
            report.errors.append(error);
            continue;
        }
        if (configs.contains(config->name)) {
            report.errors.append(CalcError(ErrorCode::ConfigInvalid,
                                           QString("Duplicate calculator name '%1'").arg(config->name),
                                           {config->name}));
            continue;
        }

        report.loaded << config->name;
        if (!config->isExecutable())
            report.templateOnly << config->name;
        configs.insert(config->name, std::make_shared<const CalculatorConfig>(*config));
    }

    for (const CalcError &error : report.errors)
        qWarning() << "[Registry] Rejected:" << error.toString();

    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_configs = configs;
    }

    qInfo() << "[Registry] Loaded" << report.loaded.size() << "calculators"
            << "(" << report.templateOnly.size() << "template-only,"
            << report.errors.size() << "rejected)";
    return report;
}

CalculatorConfigPtr CalculatorRegistry::get(const QString &name, CalcError *error) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_configs.constFind(name);
    if (it == m_configs.constEnd()) {
        fail(error, ErrorCode::NotFound, QString("Unknown calculator '%1'").arg(name), {name});
        return nullptr;
    }
    return it.value();
}

QStringList CalculatorRegistry::names() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_configs.keys();
}

QJsonArray CalculatorRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    QJsonArray array;
    for (const CalculatorConfigPtr &config : m_configs)
        array.append(config->summary());
    return array;
}

int CalculatorRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_configs.size();
}

} // namespace SheetCalc
