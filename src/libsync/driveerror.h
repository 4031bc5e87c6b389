/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "cipherdrivelib.h"
#include "common/result.h"

#include <QDebug>
#include <QString>

namespace CDC {

enum class DriveErrorCode {
    /// No hierarchy key could decrypt a blob
    KeyMismatch,
    /// Transport failure while sending one chunk, see DriveError::chunkIndex
    ChunkUploadFailed,
    /// Cancelled while waiting for the storage assignment
    UploadAborted,
    /// Server rejected the completion request
    UploadFinalizeFailed,
    /// Finalize of a non-empty file without any successful chunk
    NoChunksUploaded,
    /// One operation of a share/link fan-out failed
    PropagationPartialFailure,
    /// Object is neither a file nor a directory where that matters
    UnsupportedObjectVariant,
    /// The account write lock could not be taken or was lost while held
    LockUnavailable,
    /// The move target already holds an item of the same name
    ItemExists,

    InvalidArgument,
    InvalidState,
    CryptoFailure,
    ParseError,
    TransportError,
    Cancelled,
};

CIPHERDRIVESYNC_EXPORT QString driveErrorCodeName(DriveErrorCode code);

/**
 * @brief Error reported by every fallible engine operation
 *
 * httpCode is filled by the transport when the failure came from a
 * server response. chunkIndex is only meaningful for ChunkUploadFailed.
 */
struct CIPHERDRIVESYNC_EXPORT DriveError
{
    DriveErrorCode code = DriveErrorCode::TransportError;
    QString message;
    int chunkIndex = -1;
    int httpCode = 0;

    DriveError() = default;
    DriveError(DriveErrorCode c, const QString &msg)
        : code(c)
        , message(msg)
    {
    }

    static DriveError transport(const QString &msg, int httpCode = 0);
    static DriveError chunkUploadFailed(int index, const QString &msg);

    /// Copy of this error with its message prefixed by \a context
    [[nodiscard]] DriveError wrapped(const QString &context) const;

    /// Copy of this error re-coded as \a newCode, keeping the message and details
    [[nodiscard]] DriveError recoded(DriveErrorCode newCode) const;

    [[nodiscard]] QString toString() const;
};

template <typename T>
using DriveResult = Result<T, DriveError>;

CIPHERDRIVESYNC_EXPORT QDebug operator<<(QDebug debug, const DriveError &error);

}
