/*
 * SPDX-FileCopyrightText: 2018 Nextcloud GmbH and Nextcloud contributors
 * SPDX-FileCopyrightText: 2014 ownCloud GmbH
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "configfile.h"

#include "engineoptions.h"
#include "logger.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QStandardPaths>

namespace CDC {

Q_LOGGING_CATEGORY(lcConfigFile, "cipherdrive.sync.configfile", QtInfoMsg)

namespace {
constexpr char configFileNameC[] = "cipherdrive.cfg";

constexpr char logDirC[] = "logDir";
constexpr char logDebugC[] = "logDebug";
constexpr char logFlushC[] = "logFlush";

constexpr char parallelChunkUploadsC[] = "Engine/parallelChunkUploads";
constexpr char maxPropagationJobsC[] = "Engine/maxPropagationJobs";
}

QString ConfigFile::_confDir = {};

ConfigFile::ConfigFile()
{
    QSettings::setDefaultFormat(QSettings::IniFormat);
}

bool ConfigFile::setConfDir(const QString &value)
{
    QString dirPath = value;
    if (dirPath.isEmpty())
        return false;

    QFileInfo fi(dirPath);
    if (!fi.exists()) {
        QDir().mkpath(dirPath);
        fi.setFile(dirPath);
    }
    if (fi.exists() && fi.isDir()) {
        dirPath = fi.absoluteFilePath();
        qCInfo(lcConfigFile) << "Using custom config dir " << dirPath;
        _confDir = dirPath;
        return true;
    }
    return false;
}

QString ConfigFile::configPath() const
{
    if (_confDir.isEmpty()) {
        // XDG_CONFIG_HOME on Unix
        _confDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    }
    QString path = _confDir;
    if (!path.endsWith(QLatin1Char('/'))) {
        path.append(QLatin1Char('/'));
    }
    return path;
}

QString ConfigFile::configFile() const
{
    return configPath() + QLatin1String(configFileNameC);
}

bool ConfigFile::exists()
{
    QFile file(configFile());
    return file.exists();
}

QString ConfigFile::logDir() const
{
    const auto defaultLogDir = QString(configPath() + QStringLiteral("logs"));
    QSettings settings(configFile(), QSettings::IniFormat);
    return settings.value(QLatin1String(logDirC), defaultLogDir).toString();
}

void ConfigFile::setLogDir(const QString &dir)
{
    QSettings settings(configFile(), QSettings::IniFormat);
    settings.setValue(QLatin1String(logDirC), dir);
}

bool ConfigFile::logDebug() const
{
    QSettings settings(configFile(), QSettings::IniFormat);
    return settings.value(QLatin1String(logDebugC), false).toBool();
}

void ConfigFile::setLogDebug(bool enabled)
{
    QSettings settings(configFile(), QSettings::IniFormat);
    settings.setValue(QLatin1String(logDebugC), enabled);
}

bool ConfigFile::logFlush() const
{
    QSettings settings(configFile(), QSettings::IniFormat);
    return settings.value(QLatin1String(logFlushC), false).toBool();
}

void ConfigFile::setLogFlush(bool enabled)
{
    QSettings settings(configFile(), QSettings::IniFormat);
    settings.setValue(QLatin1String(logFlushC), enabled);
}

int ConfigFile::parallelChunkUploads() const
{
    QSettings settings(configFile(), QSettings::IniFormat);
    return settings.value(QLatin1String(parallelChunkUploadsC), EngineOptions()._parallelChunkUploads).toInt();
}

void ConfigFile::setParallelChunkUploads(int count)
{
    QSettings settings(configFile(), QSettings::IniFormat);
    settings.setValue(QLatin1String(parallelChunkUploadsC), count);
}

int ConfigFile::maxPropagationJobs() const
{
    QSettings settings(configFile(), QSettings::IniFormat);
    return settings.value(QLatin1String(maxPropagationJobsC), EngineOptions()._maxPropagationJobs).toInt();
}

void ConfigFile::setMaxPropagationJobs(int count)
{
    QSettings settings(configFile(), QSettings::IniFormat);
    settings.setValue(QLatin1String(maxPropagationJobsC), count);
}

void ConfigFile::applyTo(EngineOptions &options) const
{
    options._parallelChunkUploads = parallelChunkUploads();
    options._maxPropagationJobs = maxPropagationJobs();
    options.verify();
}

void ConfigFile::applyTo(Logger *logger) const
{
    logger->setLogDir(logDir());
    logger->setLogFlush(logFlush());
    logger->setLogDebug(logDebug());
    logger->startNewLogFile();
}

}
