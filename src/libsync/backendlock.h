/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "abstractapiclient.h"
#include "cipherdrivelib.h"
#include "engineoptions.h"

#include <QMutex>
#include <QThreadPool>
#include <QWaitCondition>

namespace CDC {

/**
 * @brief The account wide write lock
 *
 * Metadata updates and moves run under this lock so that two clients of
 * the same account never interleave the propagation of one tree.
 *
 * Holders are counted: the first one acquires the lock on the server, the
 * last one releases it. While held, a background thread refreshes the lock
 * every EngineOptions::_lockRefreshInterval. A failed refresh marks the
 * lock as lost and new holders are refused until it was released.
 */
class CIPHERDRIVESYNC_EXPORT BackendLock
{
public:
    BackendLock(AbstractApiClient *api, const EngineOptions &options);
    ~BackendLock();

    /**
     * Takes one reference on the lock.
     *
     * Fails with LockUnavailable when another client kept the lock for all
     * attempts or when the held lock was lost, with Cancelled when \a context
     * got cancelled while waiting.
     */
    DriveResult<void> lock(const OperationContextPtr &context);

    /// Drops one reference, the last one releases the lock on the server
    void unlock();

    [[nodiscard]] int holders() const;
    [[nodiscard]] bool isLost() const;

    /// Name of the lock on the server, empty while nobody holds it
    [[nodiscard]] QString lockUuid() const;

private:
    Q_DISABLE_COPY(BackendLock)

    DriveResult<void> acquire(const OperationContextPtr &context);
    void release();
    void keepRefreshed(const QString &lockUuid);

    AbstractApiClient *_api;
    EngineOptions _options;

    // serialises lock() and unlock(), held across the server round trips
    mutable QMutex _holdMutex;
    int _holders = 0;

    mutable QMutex _stateMutex;
    QWaitCondition _stopRequested;
    QString _lockUuid;
    bool _stopRefreshing = false;
    bool _lost = false;
    QThreadPool _refresher;
};

}
