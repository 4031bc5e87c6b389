/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "taskgroup.h"

#include <QLoggingCategory>
#include <QMutexLocker>

namespace CDC {

Q_LOGGING_CATEGORY(lcTaskGroup, "cipherdrive.sync.taskgroup", QtInfoMsg)

TaskGroup::TaskGroup(const OperationContextPtr &parent, int limit)
    : _parent(parent ? parent : OperationContext::create())
    , _context(_parent->createChild())
{
    _pool.setMaxThreadCount(qMax(1, limit));
}

TaskGroup::~TaskGroup()
{
    _pool.waitForDone();
}

void TaskGroup::run(Task task)
{
    if (_context->isCancelled()) {
        return;
    }
    _pool.start([this, task = std::move(task)]() {
        if (_context->isCancelled()) {
            return;
        }
        const auto result = task(_context);
        if (!result) {
            reportError(result.error());
        }
    });
}

DriveResult<void> TaskGroup::wait()
{
    _pool.waitForDone();

    QMutexLocker locker(&_mutex);
    if (_firstError) {
        return *_firstError;
    }
    if (_parent->isCancelled()) {
        return DriveError(DriveErrorCode::Cancelled, QStringLiteral("operation cancelled"));
    }
    return {};
}

void TaskGroup::reportError(const DriveError &error)
{
    QMutexLocker locker(&_mutex);
    if (_firstError) {
        qCDebug(lcTaskGroup) << "Ignoring error after the first one:" << error;
        return;
    }
    qCInfo(lcTaskGroup) << "Task failed, cancelling the remaining ones:" << error;
    _firstError = error;
    _context->cancel();
}

}
