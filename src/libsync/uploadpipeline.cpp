/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "uploadpipeline.h"

#include "clientsideencryption.h"
#include "common/constants.h"
#include "taskgroup.h"

#include <QIODevice>
#include <QLoggingCategory>
#include <QMutexLocker>
#include <QSemaphore>

namespace CDC {

Q_LOGGING_CATEGORY(lcUploadPipeline, "cipherdrive.sync.uploadpipeline", QtInfoMsg)

namespace {
// Fills a whole chunk unless the device runs dry first
DriveResult<QByteArray> readChunk(QIODevice *device)
{
    constexpr qint64 chunkSize = Constants::chunkSize;
    QByteArray chunk(static_cast<int>(chunkSize), Qt::Uninitialized);
    qint64 filled = 0;
    while (filled < chunkSize) {
        const auto read = device->read(chunk.data() + filled, chunkSize - filled);
        if (read < 0) {
            return DriveError(DriveErrorCode::InvalidArgument, QStringLiteral("reading the source failed: %1").arg(device->errorString()));
        }
        if (read == 0 && (device->atEnd() || !device->waitForReadyRead(-1))) {
            break;
        }
        filled += read;
    }
    chunk.truncate(static_cast<int>(filled));
    return chunk;
}

bool isFinished(FileUpload::State state)
{
    return state == FileUpload::State::Completed || state == FileUpload::State::Failed;
}
}

UploadPipeline::UploadPipeline(AbstractApiClient *api, const KeyHierarchy &hierarchy, const EngineOptions &options)
    : _api(api)
    , _hierarchy(hierarchy)
    , _options(options)
{
    _options.verify();
}

DriveResult<FileUpload> UploadPipeline::newUpload(const IncompleteFile &file) const
{
    if (!file.encryptionKey.isValid()) {
        return DriveError(DriveErrorCode::InvalidArgument, QStringLiteral("file %1 has no encryption key").arg(file.uuid));
    }
    const auto uploadKey = EncryptionHelper::generateRandomString(Constants::uploadKeyLength);
    if (uploadKey.isEmpty()) {
        return DriveError(DriveErrorCode::CryptoFailure, QStringLiteral("could not generate an upload key"));
    }
    qCDebug(lcUploadPipeline) << "New upload for" << file.uuid;
    return DriveResult<FileUpload>(FileUpload(file, QString::fromLatin1(uploadKey)));
}

DriveResult<StorageLocation> UploadPipeline::uploadChunk(const OperationContextPtr &context, FileUpload &upload, qint64 index, const QByteArray &plaintext) const
{
    auto *d = upload._d.get();
    {
        QMutexLocker locker(&d->mutex);
        if (isFinished(d->state) || d->state == FileUpload::State::AwaitingCompletion) {
            return DriveError(DriveErrorCode::InvalidState,
                QStringLiteral("chunk %1 sent to an upload in state %2").arg(index).arg(fileUploadStateName(d->state)));
        }
        d->state = FileUpload::State::Streaming;
        ++d->chunksInFlight;
    }

    const auto finishChunk = [d](const std::optional<StorageLocation> &location) {
        QMutexLocker locker(&d->mutex);
        --d->chunksInFlight;
        if (location) {
            ++d->uploadedChunks;
            if (!d->location) {
                d->location = location;
            }
        }
        d->locationChanged.wakeAll();
    };

    if (context && context->isCancelled()) {
        finishChunk(std::nullopt);
        return DriveError(DriveErrorCode::Cancelled, QStringLiteral("chunk %1 not sent, upload cancelled").arg(index));
    }

    const auto encrypted = upload._file.encryptionKey.encryptData(plaintext);
    if (!encrypted) {
        finishChunk(std::nullopt);
        return encrypted.error().wrapped(QStringLiteral("encrypt chunk %1").arg(index));
    }

    ChunkUploadRequest request;
    request.uuid = upload._file.uuid;
    request.index = index;
    request.parentUuid = upload._file.parentUuid;
    request.uploadKey = upload._uploadKey;
    request.data = *encrypted;

    const auto response = _api->uploadChunk(context, request);
    if (!response) {
        finishChunk(std::nullopt);
        qCWarning(lcUploadPipeline) << "Chunk" << index << "of" << upload._file.uuid << "failed:" << response.error();
        auto error = DriveError::chunkUploadFailed(static_cast<int>(index), response.error().message);
        error.httpCode = response.error().httpCode;
        return error;
    }

    finishChunk(*response);
    qCDebug(lcUploadPipeline) << "Chunk" << index << "of" << upload._file.uuid << "stored in" << response->bucket << response->region;
    return response;
}

DriveResult<qint64> UploadPipeline::uploadChunks(const OperationContextPtr &context, FileUpload &upload, QIODevice *device) const
{
    if (!device || !device->isReadable()) {
        return DriveError(DriveErrorCode::InvalidArgument, QStringLiteral("source of %1 is not readable").arg(upload._file.uuid));
    }
    if (isFinished(upload.state())) {
        return DriveError(DriveErrorCode::InvalidState, QStringLiteral("upload %1 already finished").arg(upload._file.uuid));
    }

    auto *d = upload._d.get();
    const int parallel = _options._parallelChunkUploads;
    // bounds the plaintext held in memory by queued chunks
    QSemaphore readAhead(parallel);
    TaskGroup group(context, parallel);
    const auto pollInterval = static_cast<int>(_options._finalizePollInterval.count());

    qint64 index = 0;
    qint64 total = 0;
    std::optional<DriveError> readError;
    while (!group.context()->isCancelled()) {
        bool acquired = false;
        while (!(acquired = readAhead.tryAcquire(1, pollInterval))) {
            if (group.context()->isCancelled()) {
                break;
            }
        }
        if (!acquired) {
            break;
        }

        auto chunk = readChunk(device);
        if (!chunk) {
            readAhead.release();
            readError = chunk.error();
            group.context()->cancel();
            break;
        }
        if (chunk->isEmpty()) {
            readAhead.release();
            break;
        }

        {
            QMutexLocker locker(&d->mutex);
            blake3_hasher_update(&d->hasher, chunk->constData(), static_cast<size_t>(chunk->size()));
            d->bytesHashed += chunk->size();
        }
        total += chunk->size();

        group.run([this, &upload, &readAhead, index, data = *chunk](const OperationContextPtr &taskContext) -> DriveResult<void> {
            const auto result = uploadChunk(taskContext, upload, index, data);
            readAhead.release();
            if (!result) {
                return result.error();
            }
            return {};
        });
        ++index;
    }

    const auto result = group.wait();
    if (readError) {
        return *readError;
    }
    if (!result) {
        return result.error();
    }
    qCInfo(lcUploadPipeline) << "Sent" << index << "chunks," << total << "bytes of" << upload._file.uuid;
    return total;
}

DriveResult<File> UploadPipeline::finalize(const OperationContextPtr &context, FileUpload &upload, qint64 totalSize) const
{
    auto *d = upload._d.get();
    QByteArray hash;
    {
        QMutexLocker locker(&d->mutex);
        if (isFinished(d->state) || d->state == FileUpload::State::AwaitingCompletion) {
            return DriveError(DriveErrorCode::InvalidState,
                QStringLiteral("finalize of an upload in state %1").arg(fileUploadStateName(d->state)));
        }
        d->state = FileUpload::State::AwaitingCompletion;
        QByteArray digest(BLAKE3_OUT_LEN, Qt::Uninitialized);
        blake3_hasher_finalize(&d->hasher, reinterpret_cast<uint8_t *>(digest.data()), BLAKE3_OUT_LEN);
        hash = digest.toHex();
    }

    File file;
    static_cast<IncompleteFile &>(file) = upload._file;
    file.size = totalSize;
    file.hash = hash;
    file.version = _hierarchy.fileEncryptionVersion();

    if (totalSize > 0) {
        const auto location = waitForLocation(context, upload);
        if (!location) {
            fail(upload);
            return location.error();
        }
        file.bucket = location->bucket;
        file.region = location->region;
        file.chunks = (totalSize + Constants::chunkSize - 1) / Constants::chunkSize;
    }

    const auto completion = completionRequest(file);
    if (!completion) {
        fail(upload);
        return completion.error();
    }
    auto request = *completion;

    DriveResult<UploadCompletionResponse> response = DriveError(DriveErrorCode::InvalidState, QString());
    if (totalSize > 0) {
        request.chunks = file.chunks;
        request.uploadKey = upload._uploadKey;
        request.rm = EncryptionHelper::generateRandomString(Constants::removalTokenLength);
        response = _api->uploadDone(context, request);
    } else {
        response = _api->uploadEmpty(context, request);
    }

    if (!response) {
        fail(upload);
        qCWarning(lcUploadPipeline) << "Completion of" << file.uuid << "rejected:" << response.error();
        return response.error().recoded(DriveErrorCode::UploadFinalizeFailed).wrapped(QStringLiteral("complete upload %1").arg(file.uuid));
    }

    {
        QMutexLocker locker(&d->mutex);
        d->state = FileUpload::State::Completed;
    }
    qCInfo(lcUploadPipeline) << "Upload of" << file.uuid << "completed," << file.chunks << "chunks";
    return file;
}

DriveResult<File> UploadPipeline::upload(const OperationContextPtr &context, const IncompleteFile &file, QIODevice *device) const
{
    auto upload = newUpload(file);
    if (!upload) {
        return upload.error();
    }
    const auto size = uploadChunks(context, *upload, device);
    if (!size) {
        fail(*upload);
        return size.error();
    }
    return finalize(context, *upload, *size);
}

DriveResult<UploadCompletionRequest> UploadPipeline::completionRequest(const File &file) const
{
    const auto metadata = file.metadata(file.version);
    const auto fileCrypter = file.encryptionKey.toMasterKey();

    UploadCompletionRequest request;
    request.uuid = file.uuid;
    request.name = fileCrypter.encryptMeta(file.name.toUtf8());
    request.nameHashed = _hierarchy.hashFileName(file.name);
    request.size = fileCrypter.encryptMeta(QByteArray::number(file.size));
    request.parentUuid = file.parentUuid;
    request.mimeType = fileCrypter.encryptMeta(file.mimeType.toUtf8());
    request.metadata = _hierarchy.encryptMeta(metadata);
    request.version = file.version;

    if (request.name.isEmpty() || request.size.isEmpty() || request.mimeType.isEmpty() || request.metadata.isEmpty()) {
        return DriveError(DriveErrorCode::CryptoFailure, QStringLiteral("could not encrypt the metadata of %1").arg(file.uuid));
    }
    return request;
}

DriveResult<StorageLocation> UploadPipeline::waitForLocation(const OperationContextPtr &context, FileUpload &upload) const
{
    auto *d = upload._d.get();
    const auto pollInterval = static_cast<unsigned long>(_options._finalizePollInterval.count());

    QMutexLocker locker(&d->mutex);
    while (!d->location) {
        if (context && context->isCancelled()) {
            return DriveError(DriveErrorCode::UploadAborted, QStringLiteral("upload %1 cancelled while waiting for its storage location").arg(upload._file.uuid));
        }
        if (d->chunksInFlight == 0) {
            return DriveError(DriveErrorCode::NoChunksUploaded, QStringLiteral("no chunk of %1 was uploaded").arg(upload._file.uuid));
        }
        d->locationChanged.wait(&d->mutex, pollInterval);
    }
    return *d->location;
}

void UploadPipeline::fail(FileUpload &upload) const
{
    QMutexLocker locker(&upload._d->mutex);
    upload._d->state = FileUpload::State::Failed;
}

}
