/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sharepropagator.h"

#include "clientsideencryption.h"
#include "common/constants.h"
#include "taskgroup.h"

#include <QLoggingCategory>
#include <QUuid>

#include <memory>
#include <utility>

namespace CDC {

Q_LOGGING_CATEGORY(lcSharePropagator, "cipherdrive.sync.sharepropagator", QtInfoMsg)

namespace {
// parent of the top item of a share
const char noParent[] = "none";
// parent of the top directory of a link, also how listings mark the listed directory
const char baseParent[] = "base";
const char neverExpires[] = "never";

/// One object of a fan-out, metadata still in plaintext
struct ShareItem
{
    QString uuid;
    QString parentUuid;
    QString type;
    QByteArray metadata;
};

// Any single target that fails makes the whole fan-out a partial one
DriveError propagationFailure(const DriveError &error, const QString &what)
{
    if (error.code == DriveErrorCode::Cancelled || error.code == DriveErrorCode::PropagationPartialFailure) {
        return error.wrapped(what);
    }
    return error.recoded(DriveErrorCode::PropagationPartialFailure).wrapped(what);
}

DriveResult<ShareItem> makeShareItem(const FileSystemObject &item, const QString &parentUuid, int fileEncryptionVersion)
{
    const auto type = shareItemType(item);
    if (!type) {
        return type.error();
    }
    const auto metadata = itemMetadata(item, fileEncryptionVersion);
    if (!metadata) {
        return metadata.error();
    }
    return ShareItem{itemUuid(item), parentUuid, *type, *metadata};
}

DriveResult<QSharedPointer<PKey>> parsePublicKey(const QByteArray &base64)
{
    auto key = EncryptionHelper::publicKeyFromBase64(base64);
    if (!key) {
        return key.error();
    }
    return QSharedPointer<PKey>::create(std::move(*key));
}

DriveResult<QByteArray> encryptForRecipient(const QSharedPointer<PKey> &publicKey, const QByteArray &metadata)
{
    const auto encrypted = EncryptionHelper::encryptStringAsymmetric(*publicKey, metadata);
    if (!encrypted) {
        return encrypted.error();
    }
    return encrypted->toBase64();
}
}

SharePropagator::SharePropagator(AbstractApiClient *api, const KeyHierarchy &hierarchy, const EngineOptions &options)
    : _api(api)
    , _hierarchy(hierarchy)
    , _options(options)
{
    _options.verify();
}

namespace {
/**
 * The item itself with \a rootParent as parent, followed for a directory
 * by every file and directory below it with their own parents.
 */
DriveResult<QVector<ShareItem>> collectShareItems(const SharePropagator &propagator,
    const OperationContextPtr &context,
    const FileSystemObject &item,
    const QString &rootParent,
    int fileEncryptionVersion)
{
    const auto root = makeShareItem(item, rootParent, fileEncryptionVersion);
    if (!root) {
        return root.error();
    }

    const auto listing = std::visit(detail::overloaded{
                                        [&propagator, &context](const Directory &dir) { return propagator.listRecursive(context, dir); },
                                        [](const File &) { return DriveResult<RecursiveListing>(RecursiveListing()); },
                                        [](const RootDirectory &) {
                                            return DriveResult<RecursiveListing>(DriveError(DriveErrorCode::UnsupportedObjectVariant, QStringLiteral("the root directory cannot be shared")));
                                        },
                                    },
        item);
    if (!listing) {
        return listing.error();
    }

    QVector<ShareItem> items;
    items.reserve(1 + listing->files.size() + listing->directories.size());
    items.append(*root);
    for (const auto &file : listing->files) {
        const auto shareItem = makeShareItem(FileSystemObject(file), file.parentUuid, fileEncryptionVersion);
        if (!shareItem) {
            return shareItem.error();
        }
        items.append(*shareItem);
    }
    for (const auto &dir : listing->directories) {
        const auto shareItem = makeShareItem(FileSystemObject(dir), dir.parentUuid, fileEncryptionVersion);
        if (!shareItem) {
            return shareItem.error();
        }
        items.append(*shareItem);
    }
    return items;
}
}

DriveResult<void> SharePropagator::updateSharedItem(const OperationContextPtr &context, const FileSystemObject &item) const
{
    const auto uuid = itemUuid(item);
    const auto metadata = itemMetadata(item, _hierarchy.fileEncryptionVersion());
    if (!metadata) {
        return metadata.error();
    }

    std::optional<ItemSharedResponse> shared;
    std::optional<ItemLinkedResponse> linked;
    {
        TaskGroup status(context, 2);
        status.run([this, &uuid, &shared](const OperationContextPtr &ctx) -> DriveResult<void> {
            auto result = _api->itemShared(ctx, uuid);
            if (!result) {
                return result.error();
            }
            shared = *result;
            return {};
        });
        status.run([this, &uuid, &linked](const OperationContextPtr &ctx) -> DriveResult<void> {
            auto result = _api->itemLinked(ctx, uuid);
            if (!result) {
                return result.error();
            }
            linked = *result;
            return {};
        });
        const auto result = status.wait();
        if (!result) {
            return result.error().wrapped(QStringLiteral("get shared or linked status of %1").arg(uuid));
        }
    }

    qCInfo(lcSharePropagator) << "Updating" << uuid << "for" << shared->users.size() << "users and" << linked->links.size() << "links";

    TaskGroup group(context, _options._maxPropagationJobs);
    for (const auto &user : std::as_const(shared->users)) {
        group.run([this, &uuid, &metadata, user](const OperationContextPtr &ctx) -> DriveResult<void> {
            const auto publicKey = parsePublicKey(user.publicKey);
            if (!publicKey) {
                return propagationFailure(publicKey.error(), QStringLiteral("public key of user %1").arg(user.id));
            }
            const auto encrypted = encryptForRecipient(*publicKey, *metadata);
            if (!encrypted) {
                return propagationFailure(encrypted.error(), QStringLiteral("encrypt %1 for user %2").arg(uuid).arg(user.id));
            }
            const auto sent = _api->itemSharedRename(ctx, ItemSharedRenameRequest{uuid, user.id, *encrypted});
            if (!sent) {
                return propagationFailure(sent.error(), QStringLiteral("update share of %1 for user %2").arg(uuid).arg(user.id));
            }
            return {};
        });
    }
    for (const auto &link : std::as_const(linked->links)) {
        group.run([this, &uuid, &metadata, link](const OperationContextPtr &ctx) -> DriveResult<void> {
            const auto linkKey = _hierarchy.decryptMeta(link.linkKey);
            if (!linkKey) {
                return propagationFailure(linkKey.error(), QStringLiteral("decrypt key of link %1").arg(link.linkUuid));
            }
            const auto crypter = metaCrypterFromKeyString(*linkKey);
            const auto linkMetadata = crypter->encryptMeta(*metadata);
            if (linkMetadata.isEmpty()) {
                return DriveError(DriveErrorCode::PropagationPartialFailure, QStringLiteral("could not encrypt %1 for link %2").arg(uuid, link.linkUuid));
            }
            const auto sent = _api->itemLinkedRename(ctx, ItemLinkedRenameRequest{uuid, link.linkUuid, linkMetadata});
            if (!sent) {
                return propagationFailure(sent.error(), QStringLiteral("update link %1 of %2").arg(link.linkUuid, uuid));
            }
            return {};
        });
    }
    return group.wait();
}

DriveResult<void> SharePropagator::updateItemWithMaybeSharedParent(const OperationContextPtr &context, const FileSystemObject &item) const
{
    const auto parentUuid = itemParentUuid(item);
    if (parentUuid.isEmpty()) {
        return DriveError(DriveErrorCode::UnsupportedObjectVariant, QStringLiteral("%1 has no parent").arg(itemUuid(item)));
    }

    std::optional<ItemSharedResponse> shared;
    std::optional<ItemLinkedResponse> linked;
    {
        TaskGroup status(context, 2);
        status.run([this, &parentUuid, &shared](const OperationContextPtr &ctx) -> DriveResult<void> {
            auto result = _api->itemShared(ctx, parentUuid);
            if (!result) {
                return result.error();
            }
            shared = *result;
            return {};
        });
        status.run([this, &parentUuid, &linked](const OperationContextPtr &ctx) -> DriveResult<void> {
            auto result = _api->dirLinked(ctx, parentUuid);
            if (!result) {
                return result.error();
            }
            linked = *result;
            return {};
        });
        const auto result = status.wait();
        if (!result) {
            return result.error().wrapped(QStringLiteral("get shared or linked status of parent %1").arg(parentUuid));
        }
    }

    if (!shared->shared && !linked->linked) {
        return {};
    }

    const auto items = collectShareItems(*this, context, item, parentUuid, _hierarchy.fileEncryptionVersion());
    if (!items) {
        return items.error();
    }

    qCInfo(lcSharePropagator) << "Adding" << items->size() << "items below" << parentUuid << "to"
                              << shared->users.size() << "users and" << linked->links.size() << "links";

    // Keys are parsed up front so a broken recipient fails before anything is sent
    QVector<QPair<ShareRecipient, QSharedPointer<PKey>>> recipients;
    for (const auto &user : std::as_const(shared->users)) {
        const auto publicKey = parsePublicKey(user.publicKey);
        if (!publicKey) {
            return propagationFailure(publicKey.error(), QStringLiteral("public key of user %1").arg(user.id));
        }
        recipients.append(qMakePair(user, *publicKey));
    }
    QVector<QPair<PublicLink, std::shared_ptr<MetaCrypter>>> links;
    for (const auto &link : std::as_const(linked->links)) {
        const auto linkKey = _hierarchy.decryptMeta(link.linkKey);
        if (!linkKey) {
            return propagationFailure(linkKey.error(), QStringLiteral("decrypt key of link %1").arg(link.linkUuid));
        }
        links.append(qMakePair(link, std::shared_ptr<MetaCrypter>(metaCrypterFromKeyString(*linkKey))));
    }

    const auto &shareItems = *items;
    TaskGroup group(context, _options._maxPropagationJobs);
    for (const auto &recipient : std::as_const(recipients)) {
        for (const auto &shareItem : shareItems) {
            group.run([this, recipient, shareItem](const OperationContextPtr &ctx) -> DriveResult<void> {
                const auto encrypted = encryptForRecipient(recipient.second, shareItem.metadata);
                if (!encrypted) {
                    return propagationFailure(encrypted.error(), QStringLiteral("encrypt %1 for %2").arg(shareItem.uuid, recipient.first.email));
                }
                const auto sent = _api->itemShare(ctx, ItemShareRequest{shareItem.uuid, shareItem.parentUuid, recipient.first.email, shareItem.type, *encrypted});
                if (!sent) {
                    return propagationFailure(sent.error(), QStringLiteral("share %1 with %2").arg(shareItem.uuid, recipient.first.email));
                }
                return {};
            });
        }
    }
    for (const auto &link : std::as_const(links)) {
        for (const auto &shareItem : shareItems) {
            group.run([this, link, shareItem](const OperationContextPtr &ctx) -> DriveResult<void> {
                DirLinkAddRequest request;
                request.uuid = shareItem.uuid;
                request.parentUuid = shareItem.parentUuid;
                request.linkUuid = link.first.linkUuid;
                request.type = shareItem.type;
                request.metadata = link.second->encryptMeta(shareItem.metadata);
                if (request.metadata.isEmpty()) {
                    return DriveError(DriveErrorCode::PropagationPartialFailure, QStringLiteral("could not encrypt %1 for link %2").arg(shareItem.uuid, link.first.linkUuid));
                }
                request.key = link.first.linkKey;
                request.expiration = QString::fromLatin1(neverExpires);
                const auto sent = _api->dirLinkAdd(ctx, request);
                if (!sent) {
                    return propagationFailure(sent.error(), QStringLiteral("add %1 to link %2").arg(shareItem.uuid, link.first.linkUuid));
                }
                return {};
            });
        }
    }
    return group.wait();
}

DriveResult<void> SharePropagator::shareItemToUser(const OperationContextPtr &context, const FileSystemObject &item, const QString &email) const
{
    const auto publicKeyString = _api->userPublicKey(context, email);
    if (!publicKeyString) {
        return publicKeyString.error().wrapped(QStringLiteral("get public key of %1").arg(email));
    }
    const auto publicKey = parsePublicKey(*publicKeyString);
    if (!publicKey) {
        return publicKey.error().wrapped(QStringLiteral("public key of %1").arg(email));
    }

    const auto items = collectShareItems(*this, context, item, QString::fromLatin1(noParent), _hierarchy.fileEncryptionVersion());
    if (!items) {
        return items.error();
    }

    qCInfo(lcSharePropagator) << "Sharing" << items->size() << "items of" << itemUuid(item) << "with a new user";

    const auto recipientKey = *publicKey;
    TaskGroup group(context, _options._maxPropagationJobs);
    for (const auto &shareItem : *items) {
        group.run([this, &email, recipientKey, shareItem](const OperationContextPtr &ctx) -> DriveResult<void> {
            const auto encrypted = encryptForRecipient(recipientKey, shareItem.metadata);
            if (!encrypted) {
                return propagationFailure(encrypted.error(), QStringLiteral("encrypt %1").arg(shareItem.uuid));
            }
            const auto sent = _api->itemShare(ctx, ItemShareRequest{shareItem.uuid, shareItem.parentUuid, email, shareItem.type, *encrypted});
            if (!sent) {
                return propagationFailure(sent.error(), QStringLiteral("share %1").arg(shareItem.uuid));
            }
            return {};
        });
    }
    return group.wait();
}

DriveResult<QString> SharePropagator::publicLinkItem(const OperationContextPtr &context, const FileSystemObject &item) const
{
    return std::visit(detail::overloaded{
                          [this, &context](const File &file) { return publicLinkFile(context, file); },
                          [this, &context](const Directory &dir) { return publicLinkDirectory(context, dir); },
                          [](const RootDirectory &) {
                              return DriveResult<QString>(DriveError(DriveErrorCode::UnsupportedObjectVariant, QStringLiteral("the root directory cannot be linked")));
                          },
                      },
        item);
}

DriveResult<QString> SharePropagator::publicLinkFile(const OperationContextPtr &context, const File &file) const
{
    const auto salt = EncryptionHelper::generateRandom(128);
    if (salt.isEmpty()) {
        return DriveError(DriveErrorCode::CryptoFailure, QStringLiteral("could not generate a link salt"));
    }

    FileLinkEditRequest request;
    request.uuid = QUuid::createUuid().toString(QUuid::WithoutBraces);
    request.fileUuid = file.uuid;
    request.expiration = QString::fromLatin1(neverExpires);
    request.password = QStringLiteral("empty");
    request.passwordHashed = EncryptionHelper::v2Hash(QByteArrayLiteral("empty"));
    request.salt = salt.toHex();
    request.downloadButton = false;
    request.type = QStringLiteral("enable");

    const auto sent = _api->fileLinkEditEnable(context, request);
    if (!sent) {
        return sent.error().wrapped(QStringLiteral("enable link of %1").arg(file.uuid));
    }
    qCInfo(lcSharePropagator) << "Created link" << request.uuid << "for file" << file.uuid;
    return request.uuid;
}

DriveResult<QString> SharePropagator::publicLinkDirectory(const OperationContextPtr &context, const Directory &directory) const
{
    const auto linkUuid = QUuid::createUuid().toString(QUuid::WithoutBraces);
    const auto linkKey = EncryptionHelper::generateRandomString(Constants::linkKeyLength);
    if (linkKey.isEmpty()) {
        return DriveError(DriveErrorCode::CryptoFailure, QStringLiteral("could not generate a link key"));
    }
    const auto linkKeyEncrypted = _hierarchy.encryptMeta(linkKey);
    const std::shared_ptr<MetaCrypter> crypter = metaCrypterFromKeyString(linkKey);

    const auto items = collectShareItems(*this, context, FileSystemObject(directory), QString::fromLatin1(baseParent), _hierarchy.fileEncryptionVersion());
    if (!items) {
        return items.error();
    }

    qCInfo(lcSharePropagator) << "Creating link" << linkUuid << "over" << items->size() << "items of" << directory.uuid;

    TaskGroup group(context, _options._maxPropagationJobs);
    for (const auto &shareItem : *items) {
        group.run([this, &linkUuid, &linkKeyEncrypted, crypter, shareItem](const OperationContextPtr &ctx) -> DriveResult<void> {
            DirLinkAddRequest request;
            request.uuid = shareItem.uuid;
            request.parentUuid = shareItem.parentUuid;
            request.linkUuid = linkUuid;
            request.type = shareItem.type;
            request.metadata = crypter->encryptMeta(shareItem.metadata);
            if (request.metadata.isEmpty()) {
                return DriveError(DriveErrorCode::PropagationPartialFailure, QStringLiteral("could not encrypt %1 for link %2").arg(shareItem.uuid, linkUuid));
            }
            request.key = linkKeyEncrypted;
            request.expiration = QString::fromLatin1(neverExpires);
            const auto sent = _api->dirLinkAdd(ctx, request);
            if (!sent) {
                return propagationFailure(sent.error(), QStringLiteral("add %1 to link %2").arg(shareItem.uuid, linkUuid));
            }
            return {};
        });
    }
    const auto result = group.wait();
    if (!result) {
        return result.error();
    }
    return linkUuid;
}

DriveResult<bool> SharePropagator::isItemShared(const OperationContextPtr &context, const FileSystemObject &item) const
{
    const auto result = _api->itemShared(context, itemUuid(item));
    if (!result) {
        return result.error().wrapped(QStringLiteral("get shared status"));
    }
    return result->shared;
}

DriveResult<bool> SharePropagator::isItemLinked(const OperationContextPtr &context, const FileSystemObject &item) const
{
    const auto result = _api->itemLinked(context, itemUuid(item));
    if (!result) {
        return result.error().wrapped(QStringLiteral("get linked status"));
    }
    return result->linked;
}

DriveResult<RecursiveListing> SharePropagator::listRecursive(const OperationContextPtr &context, const Directory &directory) const
{
    const auto response = _api->dirDownload(context, directory.uuid);
    if (!response) {
        return response.error().wrapped(QStringLiteral("list %1").arg(directory.uuid));
    }

    RecursiveListing listing;
    listing.files.reserve(response->files.size());
    for (const auto &entry : response->files) {
        const auto metadata = _hierarchy.decryptMeta(entry.metadata);
        if (!metadata) {
            return metadata.error().wrapped(QStringLiteral("decrypt metadata of file %1").arg(entry.uuid));
        }
        auto file = fileFromMetadata(entry.uuid, entry.parentUuid, *metadata, entry.bucket, entry.region, entry.chunks, entry.version);
        if (!file) {
            return file.error();
        }
        listing.files.append(*file);
    }

    for (const auto &entry : response->folders) {
        if (entry.parentUuid == QLatin1String(baseParent)) {
            // the listed directory itself
            continue;
        }
        const auto metadata = _hierarchy.decryptMeta(entry.metadata);
        if (!metadata) {
            return metadata.error().wrapped(QStringLiteral("decrypt metadata of directory %1").arg(entry.uuid));
        }
        auto dir = directoryFromMetadata(entry.uuid, entry.parentUuid, *metadata, entry.timestamp);
        if (!dir) {
            return dir.error();
        }
        (*dir).color = directoryColorFromName(entry.color);
        listing.directories.append(*dir);
    }

    qCDebug(lcSharePropagator) << "Listed" << listing.files.size() << "files and" << listing.directories.size() << "directories below" << directory.uuid;
    return listing;
}

}
