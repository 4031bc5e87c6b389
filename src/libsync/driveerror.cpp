/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "driveerror.h"

namespace CDC {

QString driveErrorCodeName(DriveErrorCode code)
{
    switch (code) {
    case DriveErrorCode::KeyMismatch:
        return QStringLiteral("KeyMismatch");
    case DriveErrorCode::ChunkUploadFailed:
        return QStringLiteral("ChunkUploadFailed");
    case DriveErrorCode::UploadAborted:
        return QStringLiteral("UploadAborted");
    case DriveErrorCode::UploadFinalizeFailed:
        return QStringLiteral("UploadFinalizeFailed");
    case DriveErrorCode::NoChunksUploaded:
        return QStringLiteral("NoChunksUploaded");
    case DriveErrorCode::PropagationPartialFailure:
        return QStringLiteral("PropagationPartialFailure");
    case DriveErrorCode::UnsupportedObjectVariant:
        return QStringLiteral("UnsupportedObjectVariant");
    case DriveErrorCode::LockUnavailable:
        return QStringLiteral("LockUnavailable");
    case DriveErrorCode::ItemExists:
        return QStringLiteral("ItemExists");
    case DriveErrorCode::InvalidArgument:
        return QStringLiteral("InvalidArgument");
    case DriveErrorCode::InvalidState:
        return QStringLiteral("InvalidState");
    case DriveErrorCode::CryptoFailure:
        return QStringLiteral("CryptoFailure");
    case DriveErrorCode::ParseError:
        return QStringLiteral("ParseError");
    case DriveErrorCode::TransportError:
        return QStringLiteral("TransportError");
    case DriveErrorCode::Cancelled:
        return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Unknown");
}

DriveError DriveError::transport(const QString &msg, int httpCode)
{
    DriveError error(DriveErrorCode::TransportError, msg);
    error.httpCode = httpCode;
    return error;
}

DriveError DriveError::chunkUploadFailed(int index, const QString &msg)
{
    DriveError error(DriveErrorCode::ChunkUploadFailed, msg);
    error.chunkIndex = index;
    return error;
}

DriveError DriveError::wrapped(const QString &context) const
{
    auto copy = *this;
    copy.message = message.isEmpty() ? context : QStringLiteral("%1: %2").arg(context, message);
    return copy;
}

DriveError DriveError::recoded(DriveErrorCode newCode) const
{
    auto copy = *this;
    copy.code = newCode;
    return copy;
}

QString DriveError::toString() const
{
    auto result = driveErrorCodeName(code);
    if (code == DriveErrorCode::ChunkUploadFailed) {
        result += QStringLiteral("{%1}").arg(chunkIndex);
    }
    if (httpCode != 0) {
        result += QStringLiteral(" (HTTP %1)").arg(httpCode);
    }
    if (!message.isEmpty()) {
        result += QStringLiteral(": ") + message;
    }
    return result;
}

QDebug operator<<(QDebug debug, const DriveError &error)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "DriveError(" << error.toString() << ")";
    return debug;
}

}
