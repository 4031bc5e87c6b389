/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "backendlock.h"

#include <QLoggingCategory>
#include <QMutexLocker>
#include <QThread>
#include <QUuid>

#include <algorithm>

namespace CDC {

Q_LOGGING_CATEGORY(lcBackendLock, "cipherdrive.sync.backendlock", QtInfoMsg)

namespace {
const char lockResource[] = "drive-write";
constexpr qint64 cancelCheckSliceMs = 100;

UserLockRequest lockRequest(const QString &uuid, const char *type)
{
    return UserLockRequest{uuid, QString::fromLatin1(type), QString::fromLatin1(lockResource)};
}
}

BackendLock::BackendLock(AbstractApiClient *api, const EngineOptions &options)
    : _api(api)
    , _options(options)
{
    _options.verify();
    _refresher.setMaxThreadCount(1);
}

BackendLock::~BackendLock()
{
    QMutexLocker locker(&_holdMutex);
    if (_holders > 0) {
        qCWarning(lcBackendLock) << "Destroyed with" << _holders << "holders, releasing";
        _holders = 0;
        release();
    }
    _refresher.waitForDone();
}

DriveResult<void> BackendLock::lock(const OperationContextPtr &context)
{
    QMutexLocker locker(&_holdMutex);
    if (_holders == 0) {
        const auto acquired = acquire(context);
        if (!acquired) {
            return acquired.error();
        }
    } else if (isLost()) {
        return DriveError(DriveErrorCode::LockUnavailable, QStringLiteral("the drive lock was lost, a refresh failed"));
    }
    ++_holders;
    return {};
}

void BackendLock::unlock()
{
    QMutexLocker locker(&_holdMutex);
    if (_holders == 0) {
        qCWarning(lcBackendLock) << "Unlock without a holder";
        return;
    }
    if (--_holders == 0) {
        release();
    }
}

int BackendLock::holders() const
{
    QMutexLocker locker(&_holdMutex);
    return _holders;
}

bool BackendLock::isLost() const
{
    QMutexLocker locker(&_stateMutex);
    return _lost;
}

QString BackendLock::lockUuid() const
{
    QMutexLocker locker(&_stateMutex);
    return _lockUuid;
}

DriveResult<void> BackendLock::acquire(const OperationContextPtr &context)
{
    const auto request = lockRequest(QUuid::createUuid().toString(QUuid::WithoutBraces), "acquire");

    for (int attempt = 1; attempt <= _options._lockAcquireAttempts; ++attempt) {
        if (context && context->isCancelled()) {
            return DriveError(DriveErrorCode::Cancelled, QStringLiteral("cancelled while waiting for the drive lock"));
        }

        const auto response = _api->userLock(context, request);
        if (!response) {
            return response.error().wrapped(QStringLiteral("acquire drive lock"));
        }
        if (response->acquired) {
            {
                QMutexLocker locker(&_stateMutex);
                _lockUuid = request.uuid;
                _stopRefreshing = false;
                _lost = false;
            }
            _refresher.start([this, uuid = request.uuid] {
                keepRefreshed(uuid);
            });
            qCInfo(lcBackendLock) << "Drive lock" << request.uuid << "acquired, attempt" << attempt;
            return {};
        }

        qCDebug(lcBackendLock) << "Drive lock held by another client, attempt" << attempt;
        auto remaining = static_cast<qint64>(_options._lockRetryInterval.count());
        while (remaining > 0 && !(context && context->isCancelled())) {
            const auto slice = std::min(remaining, cancelCheckSliceMs);
            QThread::msleep(static_cast<unsigned long>(slice));
            remaining -= slice;
        }
    }

    return DriveError(DriveErrorCode::LockUnavailable,
        QStringLiteral("drive lock still held elsewhere after %1 attempts").arg(_options._lockAcquireAttempts));
}

void BackendLock::release()
{
    QString uuid;
    {
        QMutexLocker locker(&_stateMutex);
        uuid = _lockUuid;
        _stopRefreshing = true;
        _stopRequested.wakeAll();
    }
    _refresher.waitForDone();

    // released even when the caller's operation was cancelled
    const auto response = _api->userLock(OperationContext::create(), lockRequest(uuid, "release"));

    QMutexLocker locker(&_stateMutex);
    _lockUuid.clear();
    if (!response) {
        qCWarning(lcBackendLock) << "Could not release drive lock" << uuid << response.error();
        _lost = true;
    } else if (!response->released) {
        qCWarning(lcBackendLock) << "Server did not release drive lock" << uuid;
        _lost = true;
    } else {
        qCInfo(lcBackendLock) << "Drive lock" << uuid << "released";
    }
}

void BackendLock::keepRefreshed(const QString &lockUuid)
{
    const auto interval = static_cast<unsigned long>(_options._lockRefreshInterval.count());

    QMutexLocker locker(&_stateMutex);
    while (!_stopRefreshing) {
        const bool woken = _stopRequested.wait(&_stateMutex, interval);
        if (_stopRefreshing) {
            break;
        }
        if (woken) {
            continue;
        }

        locker.unlock();
        const auto response = _api->userLock(OperationContext::create(), lockRequest(lockUuid, "refresh"));
        locker.relock();

        if (!response || !response->refreshed) {
            if (!response) {
                qCWarning(lcBackendLock) << "Refreshing drive lock" << lockUuid << "failed:" << response.error();
            } else {
                qCWarning(lcBackendLock) << "Server refused to refresh drive lock" << lockUuid;
            }
            _lost = true;
            return;
        }
        qCDebug(lcBackendLock) << "Drive lock" << lockUuid << "refreshed";
    }
}

}
