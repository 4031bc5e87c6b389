/*
 * SPDX-FileCopyrightText: 2021 Nextcloud GmbH and Nextcloud contributors
 * SPDX-FileCopyrightText: 2017 ownCloud GmbH
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "engineoptions.h"

#include <QLoggingCategory>

using namespace CDC;

Q_LOGGING_CATEGORY(lcEngineOptions, "cipherdrive.sync.engineoptions", QtInfoMsg)

void EngineOptions::fillFromEnvironmentVariables()
{
    int parallelChunks = qgetenv("CIPHERDRIVE_PARALLEL_CHUNK_UPLOADS").toInt();
    if (parallelChunks > 0)
        _parallelChunkUploads = parallelChunks;

    int maxJobs = qgetenv("CIPHERDRIVE_MAX_PROPAGATION_JOBS").toInt();
    if (maxJobs > 0)
        _maxPropagationJobs = maxJobs;
}

void EngineOptions::verify()
{
    const EngineOptions defaults;
    if (_parallelChunkUploads <= 0) {
        qCWarning(lcEngineOptions) << "Invalid chunk upload parallelism" << _parallelChunkUploads;
        _parallelChunkUploads = defaults._parallelChunkUploads;
    }
    if (_maxPropagationJobs <= 0) {
        qCWarning(lcEngineOptions) << "Invalid propagation job limit" << _maxPropagationJobs;
        _maxPropagationJobs = defaults._maxPropagationJobs;
    }
    if (_finalizePollInterval.count() <= 0) {
        _finalizePollInterval = defaults._finalizePollInterval;
    }
    if (_lockAcquireAttempts <= 0) {
        _lockAcquireAttempts = defaults._lockAcquireAttempts;
    }
    if (_lockRetryInterval.count() < 0) {
        _lockRetryInterval = defaults._lockRetryInterval;
    }
    if (_lockRefreshInterval.count() <= 0) {
        _lockRefreshInterval = defaults._lockRefreshInterval;
    }
}
