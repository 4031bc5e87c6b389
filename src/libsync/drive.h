/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "abstractapiclient.h"
#include "backendlock.h"
#include "cipherdrivelib.h"
#include "driveerror.h"
#include "engineoptions.h"
#include "filesystemobject.h"
#include "keyhierarchy.h"
#include "operationcontext.h"
#include "sharepropagator.h"
#include "uploadpipeline.h"

#include <QSharedPointer>

#include <optional>

class QIODevice;

namespace CDC {

/**
 * Result of Drive::uploadFile
 *
 * The upload itself succeeded. fanOutError is set when adding the file to
 * its parent's shares and links or to the search index failed afterwards;
 * both can be redone with Drive::updateMeta.
 */
struct UploadOutcome
{
    File file;
    std::optional<DriveError> fanOutError;
};

/**
 * @brief Entry points that combine upload, propagation and search indexing
 *
 * Every mutation of the owner's view is followed by the fan-outs that keep
 * shares, links and the search index consistent with it. Metadata updates
 * and moves hold the account write lock until their fan-outs are done;
 * copies of a Drive share that lock.
 */
class CIPHERDRIVESYNC_EXPORT Drive
{
public:
    Drive(AbstractApiClient *api, const KeyHierarchy &hierarchy, const EngineOptions &options = EngineOptions());

    /**
     * Fetches and decrypts the account keys.
     *
     * \a loginKey is the master key derived at login for auth versions 1
     * and 2, the hex key encryption key for version 3.
     */
    static DriveResult<KeyHierarchy> unlockKeyHierarchy(AbstractApiClient *api, const OperationContextPtr &context, int authVersion, const QByteArray &loginKey);

    DriveResult<UploadOutcome> uploadFile(const OperationContextPtr &context, const IncompleteFile &file, QIODevice *device) const;

    /// Sends the re-encrypted metadata of \a item, then updates its shares, links and search entries
    DriveResult<void> updateMeta(const OperationContextPtr &context, const FileSystemObject &item) const;

    /// \a item keeps its old name unless the update went through
    DriveResult<void> rename(const OperationContextPtr &context, FileSystemObject &item, const QString &newName) const;

    /**
     * Moves \a item below \a newParentUuid and adds it to the shares and links
     * of its new parent.
     *
     * An item of the same kind and name in the target fails the move with
     * ItemExists, unless \a overwrite is set: then that item is trashed first.
     */
    DriveResult<void> moveItem(const OperationContextPtr &context, FileSystemObject &item, const QString &newParentUuid, bool overwrite = false) const;

    DriveResult<void> submitSearchIndex(const OperationContextPtr &context, const FileSystemObject &item) const;

    [[nodiscard]] const KeyHierarchy &keyHierarchy() const { return _hierarchy; }
    [[nodiscard]] const UploadPipeline &uploadPipeline() const { return _uploadPipeline; }
    [[nodiscard]] const SharePropagator &sharePropagator() const { return _sharePropagator; }
    [[nodiscard]] BackendLock *backendLock() const { return _lock.data(); }

private:
    AbstractApiClient *_api;
    KeyHierarchy _hierarchy;
    EngineOptions _options;
    UploadPipeline _uploadPipeline;
    SharePropagator _sharePropagator;
    QSharedPointer<BackendLock> _lock;
};

}
