/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "operationcontext.h"

namespace CDC {

OperationContext::OperationContext(const OperationContextPtr &parent)
    : _parent(parent)
{
}

OperationContextPtr OperationContext::create()
{
    return OperationContextPtr(new OperationContext(OperationContextPtr()));
}

OperationContextPtr OperationContext::createChild()
{
    return OperationContextPtr(new OperationContext(sharedFromThis()));
}

void OperationContext::cancel()
{
    _cancelled.store(true);
}

bool OperationContext::isCancelled() const
{
    if (_cancelled.load()) {
        return true;
    }
    return _parent && _parent->isCancelled();
}

}
