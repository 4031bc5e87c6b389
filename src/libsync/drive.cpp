/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "drive.h"

#include "searchindexer.h"
#include "taskgroup.h"

#include <QLoggingCategory>
#include <QScopeGuard>

namespace CDC {

Q_LOGGING_CATEGORY(lcDrive, "cipherdrive.sync.drive", QtInfoMsg)

namespace {
constexpr int currentAuthVersion = 3;

void setName(FileSystemObject &item, const QString &name)
{
    std::visit(detail::overloaded{
                   [&name](File &file) { file.name = name; },
                   [&name](Directory &dir) { dir.name = name; },
                   [](RootDirectory &) {},
               },
        item);
}

void setParent(FileSystemObject &item, const QString &parentUuid)
{
    std::visit(detail::overloaded{
                   [&parentUuid](File &file) { file.parentUuid = parentUuid; },
                   [&parentUuid](Directory &dir) { dir.parentUuid = parentUuid; },
                   [](RootDirectory &) {},
               },
        item);
}
}

Drive::Drive(AbstractApiClient *api, const KeyHierarchy &hierarchy, const EngineOptions &options)
    : _api(api)
    , _hierarchy(hierarchy)
    , _options(options)
    , _uploadPipeline(api, hierarchy, options)
    , _sharePropagator(api, hierarchy, options)
    , _lock(QSharedPointer<BackendLock>::create(api, options))
{
    _options.verify();
}

DriveResult<KeyHierarchy> Drive::unlockKeyHierarchy(AbstractApiClient *api, const OperationContextPtr &context, int authVersion, const QByteArray &loginKey)
{
    auto hierarchy = [&]() -> DriveResult<KeyHierarchy> {
        if (authVersion >= currentAuthVersion) {
            const auto kek = EncryptionKey::fromHexString(loginKey);
            if (!kek) {
                return kek.error().wrapped(QStringLiteral("parse key encryption key"));
            }
            const auto encryptedDek = api->userDek(context);
            if (!encryptedDek) {
                return encryptedDek.error().wrapped(QStringLiteral("get DEK"));
            }
            return KeyHierarchy::unlockDataEncryptionKey(*kek, *encryptedDek);
        }
        const MasterKey masterKey(loginKey);
        const auto serverKeys = api->userMasterKeys(context, masterKey.encryptMeta(loginKey));
        if (!serverKeys) {
            return serverKeys.error().wrapped(QStringLiteral("get master keys"));
        }
        return KeyHierarchy::unlockMasterKeys(authVersion, masterKey, *serverKeys);
    }();
    if (!hierarchy) {
        return hierarchy;
    }

    const auto keyPair = api->userKeyPair(context);
    if (!keyPair) {
        return keyPair.error().wrapped(QStringLiteral("get key pair"));
    }
    const auto installed = (*hierarchy).setKeyPair(keyPair->publicKey, keyPair->encryptedPrivateKey);
    if (!installed) {
        return installed.error();
    }
    qCInfo(lcDrive) << "Unlocked keys for auth version" << authVersion;
    return hierarchy;
}

DriveResult<UploadOutcome> Drive::uploadFile(const OperationContextPtr &context, const IncompleteFile &file, QIODevice *device) const
{
    auto completed = _uploadPipeline.upload(context, file, device);
    if (!completed) {
        return completed.error();
    }

    UploadOutcome outcome{*completed, std::nullopt};
    const FileSystemObject item(outcome.file);

    TaskGroup fanOut(context, 2);
    fanOut.run([this, &item](const OperationContextPtr &ctx) {
        return _sharePropagator.updateItemWithMaybeSharedParent(ctx, item);
    });
    fanOut.run([this, &item](const OperationContextPtr &ctx) {
        return submitSearchIndex(ctx, item);
    });
    const auto result = fanOut.wait();
    if (!result) {
        qCWarning(lcDrive) << "Upload of" << outcome.file.uuid << "completed but the fan-out failed:" << result.error();
        outcome.fanOutError = result.error();
    }
    return outcome;
}

DriveResult<void> Drive::updateMeta(const OperationContextPtr &context, const FileSystemObject &item) const
{
    if (std::holds_alternative<RootDirectory>(item)) {
        return DriveError(DriveErrorCode::UnsupportedObjectVariant, QStringLiteral("the root directory has no metadata"));
    }
    const auto metadata = itemMetadata(item, _hierarchy.fileEncryptionVersion());
    if (!metadata) {
        return metadata.error();
    }
    const auto encrypted = _hierarchy.encryptMeta(*metadata);
    const auto nameHashed = _hierarchy.hashFileName(itemName(item));

    const auto locked = _lock->lock(context);
    if (!locked) {
        return locked.error().wrapped(QStringLiteral("update metadata of %1").arg(itemUuid(item)));
    }
    const auto unlock = qScopeGuard([this] {
        _lock->unlock();
    });

    const auto sent = std::visit(detail::overloaded{
                                     [&](const File &file) {
                                         const FileMetadataRequest request{file.uuid, file.encryptionKey.toMasterKey().encryptMeta(file.name.toUtf8()), nameHashed, encrypted};
                                         return _api->fileMetadata(context, request);
                                     },
                                     [&](const Directory &dir) {
                                         return _api->dirMetadata(context, DirMetadataRequest{dir.uuid, nameHashed, encrypted});
                                     },
                                     [](const RootDirectory &) {
                                         return DriveResult<void>(DriveError(DriveErrorCode::UnsupportedObjectVariant, QStringLiteral("the root directory has no metadata")));
                                     },
                                 },
        item);
    if (!sent) {
        return sent.error().wrapped(QStringLiteral("update metadata of %1").arg(itemUuid(item)));
    }

    TaskGroup fanOut(context, 2);
    fanOut.run([this, &item](const OperationContextPtr &ctx) {
        return _sharePropagator.updateSharedItem(ctx, item);
    });
    fanOut.run([this, &item](const OperationContextPtr &ctx) {
        return submitSearchIndex(ctx, item);
    });
    return fanOut.wait();
}

DriveResult<void> Drive::rename(const OperationContextPtr &context, FileSystemObject &item, const QString &newName) const
{
    if (newName.isEmpty() || newName.contains(QLatin1Char('/'))) {
        return DriveError(DriveErrorCode::InvalidArgument, QStringLiteral("invalid name \"%1\"").arg(newName));
    }
    const auto oldName = itemName(item);
    setName(item, newName);
    const auto result = updateMeta(context, item);
    if (!result) {
        setName(item, oldName);
        return result.error().wrapped(QStringLiteral("rename"));
    }
    return {};
}

DriveResult<void> Drive::moveItem(const OperationContextPtr &context, FileSystemObject &item, const QString &newParentUuid, bool overwrite) const
{
    if (std::holds_alternative<RootDirectory>(item)) {
        return DriveError(DriveErrorCode::UnsupportedObjectVariant, QStringLiteral("the root directory cannot be moved"));
    }
    const bool isDirectory = std::holds_alternative<Directory>(item);
    const auto uuid = itemUuid(item);

    const auto locked = _lock->lock(context);
    if (!locked) {
        return locked.error().wrapped(QStringLiteral("move %1").arg(uuid));
    }
    const auto unlock = qScopeGuard([this] {
        _lock->unlock();
    });

    const auto nameHashed = _hierarchy.hashFileName(itemName(item));
    const auto existing = isDirectory ? _api->dirExists(context, nameHashed, newParentUuid)
                                      : _api->fileExists(context, nameHashed, newParentUuid);
    if (!existing) {
        return existing.error().wrapped(QStringLiteral("check the target of %1").arg(uuid));
    }
    if (existing->exists && existing->uuid != uuid) {
        if (!overwrite) {
            return DriveError(DriveErrorCode::ItemExists, QStringLiteral("%1 already holds %2 named like %3").arg(newParentUuid, existing->uuid, uuid));
        }
        const auto trashed = isDirectory ? _api->dirTrash(context, existing->uuid) : _api->fileTrash(context, existing->uuid);
        if (!trashed) {
            return trashed.error().wrapped(QStringLiteral("trash %1 to make room for %2").arg(existing->uuid, uuid));
        }
        qCInfo(lcDrive) << "Trashed" << existing->uuid << "to make room for" << uuid;
    }

    const auto moved = isDirectory ? _api->dirMove(context, uuid, newParentUuid) : _api->fileMove(context, uuid, newParentUuid);
    if (!moved) {
        return moved.error().wrapped(QStringLiteral("move %1").arg(uuid));
    }
    setParent(item, newParentUuid);
    qCInfo(lcDrive) << "Moved" << uuid << "to" << newParentUuid;
    return _sharePropagator.updateItemWithMaybeSharedParent(context, item);
}

DriveResult<void> Drive::submitSearchIndex(const OperationContextPtr &context, const FileSystemObject &item) const
{
    const auto entries = SearchIndexer::indexEntries(item, _hierarchy.hmacKey());
    if (!entries) {
        return entries.error();
    }
    if (entries->isEmpty()) {
        return {};
    }
    return _api->searchAdd(context, *entries);
}

}
