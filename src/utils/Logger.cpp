#include "utils/Logger.h"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QTextStream>
#include <cstdio>

namespace SheetCalc {
namespace Logging {

namespace {

QFile *logFile = nullptr;
QMutex logMutex;
int minimumSeverity = 1;
bool installed = false;

// QtMsgType values are not ordered by severity (QtInfoMsg == 4)
int severity(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:    return 0;
    case QtInfoMsg:     return 1;
    case QtWarningMsg:  return 2;
    case QtCriticalMsg: return 3;
    case QtFatalMsg:    return 4;
    }
    return 1;
}

void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    Q_UNUSED(context);
    QMutexLocker locker(&logMutex);

    if (severity(type) < minimumSeverity)
        return;

    QString level;
    switch (type) {
        case QtDebugMsg:    level = "DEBUG"; break;
        case QtInfoMsg:     level = "INFO "; break;
        case QtWarningMsg:  level = "WARN "; break;
        case QtCriticalMsg: level = "ERROR"; break;
        case QtFatalMsg:    level = "FATAL"; break;
    }

    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    QString logMessage = QString("[%1] [%2] %3\n").arg(timestamp, level, msg);

    fprintf(stderr, "%s", logMessage.toLocal8Bit().constData());

    if (logFile && logFile->isOpen()) {
        QTextStream stream(logFile);
        stream << logMessage;
        stream.flush();
    }
}

void closeFile()
{
    if (logFile) {
        logFile->close();
        delete logFile;
        logFile = nullptr;
    }
}

} // namespace

QtMsgType levelFromString(const QString &level)
{
    const QString l = level.trimmed().toLower();
    if (l == "debug") return QtDebugMsg;
    if (l == "warning" || l == "warn") return QtWarningMsg;
    if (l == "error" || l == "critical") return QtCriticalMsg;
    return QtInfoMsg;
}

bool install(const QString &level, const QString &filePath)
{
    bool ok = true;
    {
        QMutexLocker locker(&logMutex);
        minimumSeverity = severity(levelFromString(level));
        closeFile();

        if (!filePath.isEmpty()) {
            QDir().mkpath(QFileInfo(filePath).absolutePath());
            logFile = new QFile(filePath);
            if (!logFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                fprintf(stderr, "Failed to open log file: %s\n", filePath.toLocal8Bit().constData());
                closeFile();
                ok = false;
            }
        }

        if (!installed) {
            qInstallMessageHandler(messageHandler);
            installed = true;
        }
    }
    return ok;
}

void shutdown()
{
    QMutexLocker locker(&logMutex);
    if (installed) {
        qInstallMessageHandler(nullptr);
        installed = false;
    }
    closeFile();
}

} // namespace Logging
} // namespace SheetCalc
