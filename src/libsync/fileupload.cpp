/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fileupload.h"

#include <QMutexLocker>

namespace CDC {

FileUpload::FileUpload(const IncompleteFile &file, const QString &uploadKey)
    : _file(file)
    , _uploadKey(uploadKey)
    , _d(std::make_unique<Session>())
{
}

FileUpload::FileUpload(FileUpload &&other) noexcept = default;
FileUpload &FileUpload::operator=(FileUpload &&other) noexcept = default;
FileUpload::~FileUpload() = default;

FileUpload::State FileUpload::state() const
{
    QMutexLocker locker(&_d->mutex);
    return _d->state;
}

std::optional<StorageLocation> FileUpload::location() const
{
    QMutexLocker locker(&_d->mutex);
    return _d->location;
}

qint64 FileUpload::uploadedChunks() const
{
    QMutexLocker locker(&_d->mutex);
    return _d->uploadedChunks;
}

qint64 FileUpload::bytesHashed() const
{
    QMutexLocker locker(&_d->mutex);
    return _d->bytesHashed;
}

QString fileUploadStateName(FileUpload::State state)
{
    switch (state) {
    case FileUpload::State::Created:
        return QStringLiteral("Created");
    case FileUpload::State::Streaming:
        return QStringLiteral("Streaming");
    case FileUpload::State::AwaitingCompletion:
        return QStringLiteral("AwaitingCompletion");
    case FileUpload::State::Completed:
        return QStringLiteral("Completed");
    case FileUpload::State::Failed:
        return QStringLiteral("Failed");
    }
    return QString();
}

}
