/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LOGGER_H
#define LOGGER_H

#include <QFile>
#include <QMutex>
#include <QString>
#include <QStringList>

#include "cipherdrivelib.h"

namespace CDC {

/**
 * @brief Process wide sink for the engine's logging categories
 *
 * Installs a Qt message handler on first use. Without a log file every
 * line goes to stderr. With a log directory the lines go to
 * cipherdrive_<timestamp>_<n>.log files there; a file that grows past a
 * few megabytes is closed, gzipped and replaced by the next one.
 */
class CIPHERDRIVESYNC_EXPORT Logger
{
public:
    static Logger *instance();

    QString logDir() const;
    void setLogDir(const QString &dir);

    /** Flush after every line instead of after warnings and batches */
    void setLogFlush(bool flush);

    bool logDebug() const;
    /** Turns on the debug output of every cipherdrive.* category */
    void setLogDebug(bool debug);
    QStringList logRules() const;

    bool isLoggingToFile() const;
    QString logFile() const;
    /** Writes to \a name from now on, an empty name stops file logging */
    void setLogFile(const QString &name);

    /** Closes the current file and starts a new one inside logDir() */
    void startNewLogFile();

private:
    Logger();
    ~Logger();
    Q_DISABLE_COPY(Logger)

    void write(QtMsgType type, const QString &line);
    void openNoLock(const QString &name);
    void rotateNoLock();
    QString nextLogFileNameNoLock() const;

    mutable QMutex _mutex;
    QFile _file;
    qint64 _bytesWritten = 0;
    int _unflushedLines = 0;
    bool _flushEveryLine = false;
    bool _logDebug = false;
    QString _logDir;
};

} // namespace CDC

#endif // LOGGER_H
