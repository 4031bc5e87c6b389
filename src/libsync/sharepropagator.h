/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "abstractapiclient.h"
#include "cipherdrivelib.h"
#include "driveerror.h"
#include "engineoptions.h"
#include "filesystemobject.h"
#include "keyhierarchy.h"
#include "operationcontext.h"

#include <QVector>

namespace CDC {

/// Decrypted content of a directory subtree, the directory itself excluded
struct RecursiveListing
{
    QVector<File> files;
    QVector<Directory> directories;
};

/**
 * @brief Keeps the per-recipient and per-link copies of item metadata in sync
 *
 * Every share holds the item's metadata encrypted for the recipient's RSA
 * public key, every public link holds it encrypted with the link key. The
 * propagator re-creates those copies after the owner's view changed.
 *
 * All fan-outs keep at most EngineOptions::_maxPropagationJobs requests in
 * flight. The first failing request cancels the rest of its fan-out and is
 * returned as PropagationPartialFailure. Requests that already went through
 * are not rolled back: every operation here can simply be run again.
 */
class CIPHERDRIVESYNC_EXPORT SharePropagator
{
public:
    SharePropagator(AbstractApiClient *api, const KeyHierarchy &hierarchy, const EngineOptions &options);

    /**
     * Re-encrypts the current metadata of \a item for every user it is
     * shared with and every link it is part of, and sends one update per
     * target. Used after rename, move or content replacement.
     */
    DriveResult<void> updateSharedItem(const OperationContextPtr &context, const FileSystemObject &item) const;

    /**
     * Adds \a item, and for a directory its whole subtree, to every share
     * and link of its parent. Does nothing if the parent is neither shared
     * nor linked. Must run after every create and move.
     */
    DriveResult<void> updateItemWithMaybeSharedParent(const OperationContextPtr &context, const FileSystemObject &item) const;

    /// Shares \a item, recursively for a directory, with the account registered under \a email
    DriveResult<void> shareItemToUser(const OperationContextPtr &context, const FileSystemObject &item, const QString &email) const;

    /// Creates a public link and returns its UUID
    DriveResult<QString> publicLinkItem(const OperationContextPtr &context, const FileSystemObject &item) const;

    DriveResult<bool> isItemShared(const OperationContextPtr &context, const FileSystemObject &item) const;
    DriveResult<bool> isItemLinked(const OperationContextPtr &context, const FileSystemObject &item) const;

    DriveResult<RecursiveListing> listRecursive(const OperationContextPtr &context, const Directory &directory) const;

private:
    DriveResult<QString> publicLinkFile(const OperationContextPtr &context, const File &file) const;
    DriveResult<QString> publicLinkDirectory(const OperationContextPtr &context, const Directory &directory) const;

    AbstractApiClient *_api;
    KeyHierarchy _hierarchy;
    EngineOptions _options;
};

}
