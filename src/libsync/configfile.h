/*
 * SPDX-FileCopyrightText: 2018 Nextcloud GmbH and Nextcloud contributors
 * SPDX-FileCopyrightText: 2014 ownCloud GmbH
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CONFIGFILE_H
#define CONFIGFILE_H

#include "cipherdrivelib.h"

#include <QString>

namespace CDC {

class EngineOptions;
class Logger;

/**
 * @brief The ConfigFile class
 *
 * INI file with the user's engine and logging settings. Every accessor
 * opens the file, so instances are cheap and may be created on the fly.
 */
class CIPHERDRIVESYNC_EXPORT ConfigFile
{
public:
    ConfigFile();

    [[nodiscard]] QString configPath() const;
    [[nodiscard]] QString configFile() const;

    bool exists();

    static bool setConfDir(const QString &value);

    [[nodiscard]] QString logDir() const;
    void setLogDir(const QString &dir);

    [[nodiscard]] bool logDebug() const;
    void setLogDebug(bool enabled);

    [[nodiscard]] bool logFlush() const;
    void setLogFlush(bool enabled);

    [[nodiscard]] int parallelChunkUploads() const;
    void setParallelChunkUploads(int count);

    [[nodiscard]] int maxPropagationJobs() const;
    void setMaxPropagationJobs(int count);

    /** Copies the stored engine settings into \a options */
    void applyTo(EngineOptions &options) const;

    /** Configures \a logger from the stored log settings and opens a fresh log file */
    void applyTo(Logger *logger) const;

private:
    static QString _confDir;
};

}
#endif // CONFIGFILE_H
