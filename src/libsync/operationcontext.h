/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "cipherdrivelib.h"

#include <QEnableSharedFromThis>
#include <QSharedPointer>

#include <atomic>

namespace CDC {

class OperationContext;
using OperationContextPtr = QSharedPointer<OperationContext>;

/**
 * @brief Cancellation scope of a running operation
 *
 * Cancelling a context cancels every child created from it. A child can
 * be cancelled on its own without affecting its parent.
 */
class CIPHERDRIVESYNC_EXPORT OperationContext : public QEnableSharedFromThis<OperationContext>
{
public:
    static OperationContextPtr create();

    [[nodiscard]] OperationContextPtr createChild();

    void cancel();

    [[nodiscard]] bool isCancelled() const;

private:
    explicit OperationContext(const OperationContextPtr &parent);
    Q_DISABLE_COPY(OperationContext)

    OperationContextPtr _parent;
    std::atomic<bool> _cancelled{false};
};

}
