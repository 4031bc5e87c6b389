/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "logger.h"

#include <QDateTime>
#include <QDir>
#include <QLocale>
#include <QLoggingCategory>
#include <QMutexLocker>

#include <cstdio>

#ifdef ZLIB_FOUND
#include <zlib.h>
#endif

namespace {

constexpr qint64 MaxLogFileSize = 8 * 1024 * 1024;
constexpr int MaxLinesBeforeFlush = 20;
const char LogFilePrefix[] = "cipherdrive_";
const char DebugRule[] = "cipherdrive.*.debug=true";

bool gzipFile(const QString &sourceName, const QString &targetName)
{
#ifdef ZLIB_FOUND
    QFile source(sourceName);
    if (!source.open(QIODevice::ReadOnly)) {
        return false;
    }
    gzFile target = gzopen(QFile::encodeName(targetName).constData(), "wb");
    if (!target) {
        return false;
    }
    bool ok = true;
    while (ok && !source.atEnd()) {
        const auto block = source.read(64 * 1024);
        ok = !block.isEmpty() && gzwrite(target, block.constData(), static_cast<unsigned>(block.size())) == block.size();
    }
    return gzclose(target) == Z_OK && ok;
#else
    Q_UNUSED(sourceName)
    Q_UNUSED(targetName)
    return false;
#endif
}

}

namespace CDC {

Logger *Logger::instance()
{
    static Logger logger;
    return &logger;
}

Logger::Logger()
{
    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss.zzz} %{threadid} %{type} %{category}: "
                                      "%{message}%{if-warning} (%{file}:%{line})%{endif}"));
    qInstallMessageHandler([](QtMsgType type, const QMessageLogContext &context, const QString &message) {
        Logger::instance()->write(type, qFormatLogMessage(type, context, message));
    });
}

Logger::~Logger()
{
    qInstallMessageHandler(nullptr);
    QMutexLocker locker(&_mutex);
    if (_file.isOpen()) {
        _file.flush();
    }
}

void Logger::write(QtMsgType type, const QString &line)
{
    const auto bytes = line.toUtf8() + '\n';

    QMutexLocker locker(&_mutex);
    if (!_file.isOpen()) {
        fputs(bytes.constData(), stderr);
        return;
    }

    if (_bytesWritten + bytes.size() > MaxLogFileSize && !_logDir.isEmpty()) {
        rotateNoLock();
    }
    _bytesWritten += _file.write(bytes);

    const bool important = type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg;
    if (_flushEveryLine || important || ++_unflushedLines >= MaxLinesBeforeFlush) {
        _file.flush();
        _unflushedLines = 0;
    }
}

QString Logger::logDir() const
{
    QMutexLocker locker(&_mutex);
    return _logDir;
}

void Logger::setLogDir(const QString &dir)
{
    QMutexLocker locker(&_mutex);
    _logDir = dir;
}

void Logger::setLogFlush(bool flush)
{
    QMutexLocker locker(&_mutex);
    _flushEveryLine = flush;
}

bool Logger::logDebug() const
{
    QMutexLocker locker(&_mutex);
    return _logDebug;
}

void Logger::setLogDebug(bool debug)
{
    {
        QMutexLocker locker(&_mutex);
        _logDebug = debug;
    }
    // outside the lock, the filter change may log on its own
    QLoggingCategory::setFilterRules(debug ? QString::fromLatin1(DebugRule) : QString());
}

QStringList Logger::logRules() const
{
    if (!logDebug()) {
        return {};
    }
    return {QString::fromLatin1(DebugRule)};
}

bool Logger::isLoggingToFile() const
{
    QMutexLocker locker(&_mutex);
    return _file.isOpen();
}

QString Logger::logFile() const
{
    QMutexLocker locker(&_mutex);
    return _file.fileName();
}

void Logger::setLogFile(const QString &name)
{
    QMutexLocker locker(&_mutex);
    openNoLock(name);
}

void Logger::startNewLogFile()
{
    QMutexLocker locker(&_mutex);
    if (_logDir.isEmpty()) {
        return;
    }
    if (_file.isOpen()) {
        rotateNoLock();
    } else {
        openNoLock(nextLogFileNameNoLock());
    }
}

void Logger::openNoLock(const QString &name)
{
    if (_file.isOpen()) {
        _file.flush();
        _file.close();
    }
    _bytesWritten = 0;
    _unflushedLines = 0;
    if (name.isEmpty()) {
        return;
    }

    _file.setFileName(name);
    if (!_file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        fprintf(stderr, "Cannot open log file \"%s\" for writing, logging to stderr\n", qPrintable(name));
        return;
    }
    _bytesWritten = _file.size();
}

void Logger::rotateNoLock()
{
    const auto finished = _file.fileName();
    openNoLock(nextLogFileNameNoLock());
    if (finished.isEmpty() || finished == _file.fileName()) {
        return;
    }

    const auto compressed = finished + QStringLiteral(".gz");
    if (gzipFile(finished, compressed)) {
        QFile::remove(finished);
    } else {
        QFile::remove(compressed);
    }
}

QString Logger::nextLogFileNameNoLock() const
{
    QDir dir(_logDir);
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    // the C locale keeps the timestamp free of characters file systems reject
    const auto stamp = QLocale::c().toString(QDateTime::currentDateTime(), QStringLiteral("yyyyMMdd_HHmmss"));
    for (int number = 0;; ++number) {
        const auto name = dir.filePath(QStringLiteral("%1%2_%3.log").arg(QLatin1String(LogFilePrefix), stamp).arg(number));
        if (!QFile::exists(name) && !QFile::exists(name + QStringLiteral(".gz"))) {
            return name;
        }
    }
}

} // namespace CDC
