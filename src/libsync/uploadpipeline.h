/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "abstractapiclient.h"
#include "cipherdrivelib.h"
#include "driveerror.h"
#include "engineoptions.h"
#include "fileupload.h"
#include "filesystemobject.h"
#include "keyhierarchy.h"
#include "operationcontext.h"

class QIODevice;

namespace CDC {

/**
 * @brief Encrypts and uploads file content in fixed size chunks
 *
 * The sequence for one file is newUpload(), any number of uploadChunk()
 * calls (or one uploadChunks() over a device) and finalize(). The
 * pipeline itself holds no per-upload state, everything lives in the
 * FileUpload session, so one pipeline serves any number of uploads.
 */
class CIPHERDRIVESYNC_EXPORT UploadPipeline
{
public:
    UploadPipeline(AbstractApiClient *api, const KeyHierarchy &hierarchy, const EngineOptions &options);

    /// Starts a session with a fresh upload key
    [[nodiscard]] DriveResult<FileUpload> newUpload(const IncompleteFile &file) const;

    /**
     * Encrypts \a plaintext with the file key and sends it as chunk \a index.
     *
     * Does not touch the content hash, so a failed index can be re-sent.
     * Returns the storage location of this response; the session keeps
     * only the first one.
     */
    DriveResult<StorageLocation> uploadChunk(const OperationContextPtr &context, FileUpload &upload, qint64 index, const QByteArray &plaintext) const;

    /**
     * Reads \a device to the end, hashing every chunk in read order and
     * sending up to EngineOptions::_parallelChunkUploads chunks at once.
     * Returns the number of bytes read.
     */
    DriveResult<qint64> uploadChunks(const OperationContextPtr &context, FileUpload &upload, QIODevice *device) const;

    /**
     * Sends the completion request and turns the session into a File.
     *
     * For a non-empty file this waits until a chunk response supplied the
     * storage location. Cancelling \a context meanwhile fails with
     * UploadAborted. Any failure here is terminal for the session.
     */
    DriveResult<File> finalize(const OperationContextPtr &context, FileUpload &upload, qint64 totalSize) const;

    /// newUpload, uploadChunks and finalize in one go
    DriveResult<File> upload(const OperationContextPtr &context, const IncompleteFile &file, QIODevice *device) const;

private:
    DriveResult<UploadCompletionRequest> completionRequest(const File &file) const;
    DriveResult<StorageLocation> waitForLocation(const OperationContextPtr &context, FileUpload &upload) const;
    void fail(FileUpload &upload) const;

    AbstractApiClient *_api;
    KeyHierarchy _hierarchy;
    EngineOptions _options;
};

}
