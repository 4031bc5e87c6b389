/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "cipherdrivelib.h"
#include "driveerror.h"
#include "operationcontext.h"

#include <QMutex>
#include <QThreadPool>

#include <functional>
#include <optional>

namespace CDC {

/**
 * @brief Runs tasks with at most a fixed number in flight
 *
 * Tasks run on a private thread pool and receive a child context of the
 * one the group was created with. The first task to fail cancels that
 * child context: queued tasks are skipped and running ones are expected
 * to notice the cancellation and return early.
 *
 * The destructor waits for all tasks.
 */
class CIPHERDRIVESYNC_EXPORT TaskGroup
{
public:
    using Task = std::function<DriveResult<void>(const OperationContextPtr &)>;

    TaskGroup(const OperationContextPtr &parent, int limit);
    ~TaskGroup();

    void run(Task task);

    /**
     * Blocks until every started task has returned.
     * Returns the first error, Cancelled if the parent context was cancelled.
     */
    DriveResult<void> wait();

    [[nodiscard]] const OperationContextPtr &context() const { return _context; }

private:
    Q_DISABLE_COPY(TaskGroup)

    void reportError(const DriveError &error);

    OperationContextPtr _parent;
    OperationContextPtr _context;
    QThreadPool _pool;
    QMutex _mutex;
    std::optional<DriveError> _firstError;
};

}
