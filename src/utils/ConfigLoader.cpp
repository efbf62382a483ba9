#include "utils/ConfigLoader.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <QDebug>

namespace SheetCalc {

ConfigLoader::ConfigLoader()
    : m_loaded(false)
{
}

ConfigLoader::~ConfigLoader()
{
}

bool ConfigLoader::load(const QString &filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "[Config] Failed to open config file:" << filePath;
        return false;
    }

    m_config.clear();
    m_baseDir = QFileInfo(filePath).absolutePath();

    QTextStream in(&file);
    QString currentSection;

    while (!in.atEnd()) {
        QString line = in.readLine().trimmed();

        // Skip empty lines and comments
        if (line.isEmpty() || line.startsWith('#') || line.startsWith(';')) {
            continue;
        }

        // Check for section header [SECTION]
        if (line.startsWith('[') && line.endsWith(']')) {
            currentSection = line.mid(1, line.length() - 2).trimmed();
            if (!m_config.contains(currentSection)) {
                m_config[currentSection] = QMap<QString, QString>();
            }
            continue;
        }

        // Parse key = value pairs
        int equalPos = line.indexOf('=');
        if (equalPos > 0) {
            QString key = line.left(equalPos).trimmed();
            QString value = line.mid(equalPos + 1).trimmed();

            // Store in default section if no section defined yet
            if (currentSection.isEmpty()) {
                currentSection = "DEFAULT";
            }

            m_config[currentSection][key] = value;
        }
    }

    file.close();
    m_loaded = true;

    qDebug() << "[Config] Loaded from:" << filePath << "sections:" << m_config.keys();

    return true;
}

QString ConfigLoader::getValue(const QString &section, const QString &key, const QString &defaultValue) const
{
    if (m_config.contains(section) && m_config[section].contains(key)) {
        return m_config[section][key];
    }
    return defaultValue;
}

int ConfigLoader::getInt(const QString &section, const QString &key, int defaultValue) const
{
    QString value = getValue(section, key);
    if (!value.isEmpty()) {
        bool ok;
        int result = value.toInt(&ok);
        if (ok) return result;
        qWarning() << "[Config] Not an integer:" << section << key << value;
    }
    return defaultValue;
}

bool ConfigLoader::getBool(const QString &section, const QString &key, bool defaultValue) const
{
    QString value = getValue(section, key).toLower();
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    } else if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    return defaultValue;
}

QString ConfigLoader::resolvePath(const QString &path) const
{
    if (path.isEmpty() || QDir::isAbsolutePath(path) || m_baseDir.isEmpty())
        return path;
    return QDir(m_baseDir).filePath(path);
}

int ConfigLoader::getCacheTtlSeconds() const
{
    return getInt("ENGINE", "cache_ttl_seconds", 300);
}

int ConfigLoader::getLockTimeoutSeconds() const
{
    return getInt("ENGINE", "lock_timeout_seconds", 30);
}

bool ConfigLoader::getPersistComputedValues() const
{
    return getBool("ENGINE", "persist_computed_values", true);
}

QString ConfigLoader::getCalculatorDirectory() const
{
    return resolvePath(getValue("CALCULATORS", "directory", "calculators"));
}

QString ConfigLoader::getWorkbookBackend() const
{
    return getValue("WORKBOOK", "backend", "local").toLower();
}

QString ConfigLoader::getWorkbookDirectory() const
{
    return resolvePath(getValue("WORKBOOK", "directory", "workbooks"));
}

QString ConfigLoader::getSheetsBaseUrl() const
{
    return getValue("SHEETS", "base_url", "https://sheets.googleapis.com/v4/spreadsheets");
}

QString ConfigLoader::getSheetsAccessToken() const
{
    QString token = getValue("SHEETS", "access_token");
    if (!token.isEmpty())
        return token;

    const QString tokenFile = resolvePath(getValue("SHEETS", "access_token_file"));
    if (tokenFile.isEmpty())
        return QString();

    QFile file(tokenFile);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "[Config] Cannot read access token file:" << tokenFile;
        return QString();
    }
    return QString::fromUtf8(file.readAll()).trimmed();
}

int ConfigLoader::getSheetsTimeoutSeconds() const
{
    return getInt("SHEETS", "timeout_seconds", 30);
}

int ConfigLoader::getSheetsMaxAttempts() const
{
    return getInt("SHEETS", "max_attempts", 3);
}

int ConfigLoader::getSheetsRetryBackoffMs() const
{
    return getInt("SHEETS", "retry_backoff_ms", 500);
}

QString ConfigLoader::getLogLevel() const
{
    return getValue("LOGGING", "level", "info").toLower();
}

QString ConfigLoader::getLogFile() const
{
    return resolvePath(getValue("LOGGING", "file"));
}

} // namespace SheetCalc
