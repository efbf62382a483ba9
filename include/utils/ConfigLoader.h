#ifndef CONFIGLOADER_H
#define CONFIGLOADER_H

#include <QString>
#include <QMap>

namespace SheetCalc {

/**
 * @brief INI-style host configuration ([SECTION] / key = value)
 *
 * Keys before the first section header land in DEFAULT. Relative paths are
 * resolved against the directory holding the loaded file.
 */
class ConfigLoader
{
public:
    ConfigLoader();
    ~ConfigLoader();

    // Load configuration from file
    bool load(const QString &filePath);

    // Get configuration values
    QString getValue(const QString &section, const QString &key, const QString &defaultValue = "") const;
    int getInt(const QString &section, const QString &key, int defaultValue = 0) const;
    bool getBool(const QString &section, const QString &key, bool defaultValue = false) const;

    // Check if configuration is loaded
    bool isLoaded() const { return m_loaded; }

    QString resolvePath(const QString &path) const;

    // Engine
    int getCacheTtlSeconds() const;
    int getLockTimeoutSeconds() const;   // -1 = wait forever
    bool getPersistComputedValues() const;

    // Calculators
    QString getCalculatorDirectory() const;

    // Workbook backend
    QString getWorkbookBackend() const;  // "local" or "sheets"
    QString getWorkbookDirectory() const;

    // Sheets API
    QString getSheetsBaseUrl() const;
    QString getSheetsAccessToken() const;  // access_token, else contents of access_token_file
    int getSheetsTimeoutSeconds() const;
    int getSheetsMaxAttempts() const;
    int getSheetsRetryBackoffMs() const;

    // Logging
    QString getLogLevel() const;
    QString getLogFile() const;

private:
    bool m_loaded;
    QString m_baseDir;
    QMap<QString, QMap<QString, QString>> m_config;
};

} // namespace SheetCalc

#endif // CONFIGLOADER_H
