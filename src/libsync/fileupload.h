/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "abstractapiclient.h"
#include "cipherdrivelib.h"
#include "filesystemobject.h"

#include <QMutex>
#include <QWaitCondition>

#include <blake3.h>

#include <memory>
#include <optional>

namespace CDC {

class UploadPipeline;

/**
 * @brief One upload of one IncompleteFile
 *
 * Holds the upload key that authorises chunk writes for the file's UUID,
 * the running content hash and the storage location handed out by the
 * first successful chunk. Lives on the caller's stack for the duration of
 * the upload and is never persisted.
 *
 * Chunks may be sent from several threads at once; everything else is
 * expected to happen on the thread that owns the session.
 */
class CIPHERDRIVESYNC_EXPORT FileUpload
{
public:
    enum class State {
        Created,
        Streaming,
        AwaitingCompletion,
        Completed,
        Failed,
    };

    FileUpload(const IncompleteFile &file, const QString &uploadKey);
    FileUpload(FileUpload &&other) noexcept;
    FileUpload &operator=(FileUpload &&other) noexcept;
    ~FileUpload();

    [[nodiscard]] const IncompleteFile &file() const { return _file; }
    [[nodiscard]] const QString &uploadKey() const { return _uploadKey; }

    [[nodiscard]] State state() const;
    [[nodiscard]] std::optional<StorageLocation> location() const;

    /// Number of chunk requests that succeeded so far
    [[nodiscard]] qint64 uploadedChunks() const;

    /// Bytes fed into the content hash so far
    [[nodiscard]] qint64 bytesHashed() const;

private:
    friend class UploadPipeline;

    struct Session {
        Session() { blake3_hasher_init(&hasher); }

        mutable QMutex mutex;
        QWaitCondition locationChanged;
        State state = State::Created;
        std::optional<StorageLocation> location;
        int chunksInFlight = 0;
        qint64 uploadedChunks = 0;
        blake3_hasher hasher;
        qint64 bytesHashed = 0;
    };

    IncompleteFile _file;
    QString _uploadKey;
    std::unique_ptr<Session> _d;
};

CIPHERDRIVESYNC_EXPORT QString fileUploadStateName(FileUpload::State state);

}
