#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QtGlobal>

namespace SheetCalc {
namespace Logging {

/**
 * @brief Install the process-wide Qt message handler
 *
 * Lines are formatted "[yyyy-MM-dd HH:mm:ss.zzz] [LEVEL] message" and go to
 * stderr, plus the given file when non-empty. Messages below `level`
 * (debug|info|warning|error) are dropped. Calling again replaces the level
 * and file.
 *
 * @return false if the log file could not be opened (stderr still works)
 */
bool install(const QString &level = "info", const QString &filePath = QString());

// Restore Qt's default handler and close the log file
void shutdown();

// "debug" -> QtDebugMsg ... unknown text -> QtInfoMsg
QtMsgType levelFromString(const QString &level);

} // namespace Logging
} // namespace SheetCalc

#endif // LOGGER_H
