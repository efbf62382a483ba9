#include "config/CalculatorConfig.h"
#include <QVariant>

namespace SheetCalc {

namespace {

// One entry of "inputs"/"outputs": either "B4" or { "cell": "B4", ... }
bool parseField(const QString &calculator, const QString &kind, const QString &field,
                const QJsonValue &value, const SheetBounds &bounds, bool isInput,
                CellAddress *cell, FieldMetadata *meta, CalcError *error)
{
    QString cellText;
    if (value.isString()) {
        cellText = value.toString();
    } else if (value.isObject()) {
        const QJsonObject obj = value.toObject();
        cellText = obj.value("cell").toString();
        meta->description = obj.value("description").toString();
        meta->unit = obj.value("unit").toString();
        if (isInput) {
            const QJsonValue required = obj.value("required");
            if (!required.isUndefined() && !required.isBool()) {
                return fail(error, ErrorCode::ConfigInvalid,
                            QString("%1: %2 '%3' has a non-boolean 'required'")
                                .arg(calculator, kind, field),
                            {field});
            }
            meta->required = required.toBool(true);
            const QJsonValue def = obj.value("default");
            if (!def.isUndefined() && !def.isNull())
                meta->defaultValue = CellValue::fromJson(def);
        }
    } else {
        return fail(error, ErrorCode::ConfigInvalid,
                    QString("%1: %2 '%3' must be a cell address or an object")
                        .arg(calculator, kind, field),
                    {field});
    }

    CalcError addrErr;
    auto address = CellAddressing::parse(cellText, bounds, &addrErr);
    if (!address) {
        return fail(error, ErrorCode::ConfigInvalid,
                    QString("%1: %2 '%3': %4").arg(calculator, kind, field, addrErr.message),
                    {field});
    }
    *cell = *address;
    return true;
}

bool parseFields(const QString &calculator, const QString &kind, const QJsonValue &value,
                 const SheetBounds &bounds, bool isInput,
                 QMap<QString, CellAddress> *cells, QMap<QString, FieldMetadata> *metadata,
                 CalcError *error)
{
    if (value.isUndefined() || value.isNull())
        return true;
    if (!value.isObject()) {
        return fail(error, ErrorCode::ConfigInvalid,
                    QString("%1: '%2' must be an object").arg(calculator, kind));
    }

    const QJsonObject obj = value.toObject();
    QHash<CellAddress, QString> owners;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const QString field = it.key().trimmed();
        if (field.isEmpty()) {
            return fail(error, ErrorCode::ConfigInvalid,
                        QString("%1: empty %2 name").arg(calculator, kind));
        }
        CellAddress cell;
        FieldMetadata meta;
        if (!parseField(calculator, kind, field, it.value(), bounds, isInput, &cell, &meta, error))
            return false;

        auto owner = owners.constFind(cell);
        if (owner != owners.constEnd()) {
            return fail(error, ErrorCode::ConfigInvalid,
                        QString("%1: %2 '%3' and '%4' both map to %5")
                            .arg(calculator, kind, owner.value(), field, cell.toString()),
                        {owner.value(), field});
        }
        owners.insert(cell, field);
        cells->insert(field, cell);
        metadata->insert(field, meta);
    }
    return true;
}

} // namespace

QJsonObject FieldMetadata::toJson() const {
    QJsonObject obj;
    obj["description"] = description;
    obj["unit"] = unit;
    return obj;
}

const char *calculatorStatusName(CalculatorStatus status) {
    switch (status) {
    case CalculatorStatus::Executable:   return "executable";
    case CalculatorStatus::TemplateOnly: return "template_only";
    }
    return "unknown";
}

WorkbookHandle CalculatorConfig::handle() const {
    WorkbookHandle h;
    h.workbookId = workbookId;
    h.sheet = sheet;
    h.bounds = bounds;
    return h;
}

QStringList CalculatorConfig::requiredInputs() const {
    QStringList names;
    for (auto it = inputs.begin(); it != inputs.end(); ++it) {
        if (inputMetadata.value(it.key()).required)
            names << it.key();
    }
    return names;
}

QJsonObject CalculatorConfig::summary() const {
    QJsonObject obj;
    obj["name"] = name;
    obj["title"] = title;
    obj["description"] = description;
    obj["standard"] = standard;
    obj["version"] = version;
    obj["workbook_id"] = workbookId;
    obj["sheet"] = sheet;
    obj["status"] = calculatorStatusName(status);

    QJsonObject inputObj;
    for (auto it = inputs.begin(); it != inputs.end(); ++it) {
        const FieldMetadata meta = inputMetadata.value(it.key());
        QJsonObject field = meta.toJson();
        field["cell"] = it.value().toString();
        field["required"] = meta.required;
        if (meta.defaultValue)
            field["default"] = meta.defaultValue->toJson();
        inputObj[it.key()] = field;
    }
    obj["inputs"] = inputObj;

    QJsonObject outputObj;
    for (auto it = outputs.begin(); it != outputs.end(); ++it) {
        QJsonObject field = outputMetadata.value(it.key()).toJson();
        field["cell"] = it.value().toString();
        outputObj[it.key()] = field;
    }
    obj["outputs"] = outputObj;
    return obj;
}

std::optional<CalculatorConfig> CalculatorConfig::fromJson(const QJsonObject &record,
                                                           CalcError *error) {
    CalculatorConfig config;
    config.name = record.value("name").toString().trimmed();
    if (config.name.isEmpty()) {
        fail(error, ErrorCode::ConfigInvalid, "Calculator record has no name");
        return std::nullopt;
    }

    config.title = record.value("title").toString(config.name);
    config.description = record.value("description").toString();
    config.standard = record.value("standard").toString();
    config.version = record.value("version").toVariant().toString();
    config.workbookId = record.value("backing_workbook_id").toString(
        record.value("sheet_id").toString()).trimmed();
    config.sheet = record.value("sheet").toString("Sheet1");
    if (config.sheet.trimmed().isEmpty()) {
        fail(error, ErrorCode::ConfigInvalid,
             QString("%1: empty sheet name").arg(config.name), {config.name});
        return std::nullopt;
    }

    const QJsonObject bounds = record.value("bounds").toObject();
    config.bounds.maxColumns = bounds.value("columns").toInt(0);
    config.bounds.maxRows = bounds.value("rows").toInt(0);
    if (config.bounds.maxColumns < 0 || config.bounds.maxRows < 0) {
        fail(error, ErrorCode::ConfigInvalid,
             QString("%1: negative sheet bounds").arg(config.name), {config.name});
        return std::nullopt;
    }

    if (!parseFields(config.name, "input", record.value("inputs"), config.bounds, true,
                     &config.inputs, &config.inputMetadata, error))
        return std::nullopt;
    if (!parseFields(config.name, "output", record.value("outputs"), config.bounds, false,
                     &config.outputs, &config.outputMetadata, error))
        return std::nullopt;

    for (auto in = config.inputs.begin(); in != config.inputs.end(); ++in) {
        for (auto out = config.outputs.begin(); out != config.outputs.end(); ++out) {
            if (in.value() == out.value()) {
                fail(error, ErrorCode::ConfigInvalid,
                     QString("%1: input '%2' maps to output cell %3 ('%4')")
                         .arg(config.name, in.key(), in.value().toString(), out.key()),
                     {in.key(), out.key()});
                return std::nullopt;
            }
        }
    }

    config.status = config.workbookId.isEmpty() ? CalculatorStatus::TemplateOnly
                                                : CalculatorStatus::Executable;
    return config;
}

} // namespace SheetCalc
