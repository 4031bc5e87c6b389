/*
 * Copyright (C) by Olivier Goffart <ogoffart@woboq.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY
 * or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License
 * for more details.
 */

#pragma once

#include "cipherdrivelib.h"
#include "common/constants.h"

#include <chrono>

namespace CDC {

/**
 * Value class containing the options given to the engine
 */
class CIPHERDRIVESYNC_EXPORT EngineOptions
{
public:
    /** The maximum number of chunks of one upload in flight at once */
    int _parallelChunkUploads = 4;

    /** The maximum number of requests in flight for one share or link fan-out */
    int _maxPropagationJobs = Constants::maxSmallCallers;

    /** How often Finalize re-checks for cancellation while it waits for the storage location */
    std::chrono::milliseconds _finalizePollInterval = std::chrono::milliseconds(100);

    /** How often the account write lock is requested before giving up */
    int _lockAcquireAttempts = 100;

    /** Pause between two requests for a write lock another client holds */
    std::chrono::milliseconds _lockRetryInterval = std::chrono::seconds(1);

    /** The server drops a write lock that is not refreshed within about half a minute */
    std::chrono::milliseconds _lockRefreshInterval = std::chrono::seconds(20);

    /** Reads settings from env vars where available.
     *
     * Currently reads _parallelChunkUploads and _maxPropagationJobs.
     */
    void fillFromEnvironmentVariables();

    /** Reset values that make no sense back to their defaults */
    void verify();
};

}
