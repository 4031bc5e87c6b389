/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "cipherdrivelib.h"
#include "driveerror.h"
#include "operationcontext.h"

#include <QByteArray>
#include <QString>
#include <QVector>

namespace CDC {

/// Where the server stored the chunks of an upload
struct StorageLocation
{
    QString bucket;
    QString region;
};

struct ChunkUploadRequest
{
    QString uuid;
    qint64 index = 0;
    QString parentUuid;
    QString uploadKey;
    /// Encrypted chunk, nonce and tag included
    QByteArray data;
};

/**
 * Completion handshake of an upload. Name, size and mime type are
 * encrypted with the file key, the metadata with the owner's hierarchy.
 * chunks, rm and uploadKey are only sent for non-empty files.
 */
struct UploadCompletionRequest
{
    QString uuid;
    QByteArray name;
    QByteArray nameHashed;
    QByteArray size;
    QString parentUuid;
    QByteArray mimeType;
    QByteArray metadata;
    int version = 0;

    qint64 chunks = 0;
    QByteArray rm;
    QString uploadKey;
};

struct UploadCompletionResponse
{
    qint64 chunks = 0;
    qint64 size = 0;
};

struct ShareRecipient
{
    qint64 id = 0;
    QString email;
    /// base64 DER, SubjectPublicKeyInfo
    QByteArray publicKey;
};

struct ItemSharedResponse
{
    bool shared = false;
    QVector<ShareRecipient> users;
};

struct PublicLink
{
    QString linkUuid;
    /// The link key, encrypted with the owner's hierarchy
    QByteArray linkKey;
};

struct ItemLinkedResponse
{
    bool linked = false;
    QVector<PublicLink> links;
};

struct ItemSharedRenameRequest
{
    QString uuid;
    qint64 receiverId = 0;
    QByteArray metadata;
};

struct ItemLinkedRenameRequest
{
    QString uuid;
    QString linkUuid;
    QByteArray metadata;
};

struct ItemShareRequest
{
    QString uuid;
    QString parentUuid;
    QString email;
    QString type;
    QByteArray metadata;
};

struct DirLinkAddRequest
{
    QString uuid;
    QString parentUuid;
    QString linkUuid;
    QString type;
    QByteArray metadata;
    QByteArray key;
    QString expiration;
};

struct FileLinkEditRequest
{
    QString uuid;
    QString fileUuid;
    QString expiration;
    QString password;
    QByteArray passwordHashed;
    QByteArray salt;
    bool downloadButton = false;
    QString type;
};

struct ListedFile
{
    QString uuid;
    QString parentUuid;
    QByteArray metadata;
    QString bucket;
    QString region;
    qint64 chunks = 0;
    int version = 0;
    qint64 timestamp = 0;
};

struct ListedFolder
{
    QString uuid;
    QString parentUuid;
    QByteArray metadata;
    QString color;
    qint64 timestamp = 0;
};

/// Recursive listing of a directory, the directory itself included
struct DirDownloadResponse
{
    QVector<ListedFile> files;
    QVector<ListedFolder> folders;
};

struct SearchIndexEntry
{
    QString uuid;
    QByteArray hash;
    QString type;
};

struct FileMetadataRequest
{
    QString uuid;
    QByteArray name;
    QByteArray nameHashed;
    QByteArray metadata;
};

struct DirMetadataRequest
{
    QString uuid;
    QByteArray nameHashed;
    QByteArray metadata;
};

/// Answer of the name conflict checks, uuid names the conflicting item
struct ItemExistsResponse
{
    bool exists = false;
    QString uuid;
};

struct UserLockRequest
{
    QString uuid;
    /// "acquire", "refresh" or "release"
    QString type;
    QString resource;
};

struct UserLockResponse
{
    bool acquired = false;
    bool refreshed = false;
    bool released = false;
};

struct KeyPairInfo
{
    QByteArray publicKey;
    QByteArray encryptedPrivateKey;
};

/**
 * @brief The server API as seen by the engine
 *
 * Every call blocks until the response arrives and must be safe to call
 * from several threads at once. Implementations should give up early
 * when \a context is cancelled and report TransportError for failed
 * requests, with DriveError::httpCode set where there was a response.
 */
class CIPHERDRIVESYNC_EXPORT AbstractApiClient
{
public:
    virtual ~AbstractApiClient();

    virtual DriveResult<StorageLocation> uploadChunk(const OperationContextPtr &context, const ChunkUploadRequest &request) = 0;
    virtual DriveResult<UploadCompletionResponse> uploadDone(const OperationContextPtr &context, const UploadCompletionRequest &request) = 0;
    virtual DriveResult<UploadCompletionResponse> uploadEmpty(const OperationContextPtr &context, const UploadCompletionRequest &request) = 0;

    virtual DriveResult<ItemSharedResponse> itemShared(const OperationContextPtr &context, const QString &uuid) = 0;
    virtual DriveResult<ItemLinkedResponse> itemLinked(const OperationContextPtr &context, const QString &uuid) = 0;
    virtual DriveResult<ItemLinkedResponse> dirLinked(const OperationContextPtr &context, const QString &uuid) = 0;

    virtual DriveResult<void> itemSharedRename(const OperationContextPtr &context, const ItemSharedRenameRequest &request) = 0;
    virtual DriveResult<void> itemLinkedRename(const OperationContextPtr &context, const ItemLinkedRenameRequest &request) = 0;
    virtual DriveResult<void> itemShare(const OperationContextPtr &context, const ItemShareRequest &request) = 0;
    virtual DriveResult<void> dirLinkAdd(const OperationContextPtr &context, const DirLinkAddRequest &request) = 0;
    virtual DriveResult<void> fileLinkEditEnable(const OperationContextPtr &context, const FileLinkEditRequest &request) = 0;

    /// base64 DER public key of the account registered under \a email
    virtual DriveResult<QByteArray> userPublicKey(const OperationContextPtr &context, const QString &email) = 0;
    virtual DriveResult<DirDownloadResponse> dirDownload(const OperationContextPtr &context, const QString &uuid) = 0;

    virtual DriveResult<void> searchAdd(const OperationContextPtr &context, const QVector<SearchIndexEntry> &items) = 0;

    virtual DriveResult<void> fileMetadata(const OperationContextPtr &context, const FileMetadataRequest &request) = 0;
    virtual DriveResult<void> dirMetadata(const OperationContextPtr &context, const DirMetadataRequest &request) = 0;
    virtual DriveResult<void> fileMove(const OperationContextPtr &context, const QString &uuid, const QString &newParentUuid) = 0;
    virtual DriveResult<void> dirMove(const OperationContextPtr &context, const QString &uuid, const QString &newParentUuid) = 0;

    virtual DriveResult<ItemExistsResponse> fileExists(const OperationContextPtr &context, const QByteArray &nameHashed, const QString &parentUuid) = 0;
    virtual DriveResult<ItemExistsResponse> dirExists(const OperationContextPtr &context, const QByteArray &nameHashed, const QString &parentUuid) = 0;
    virtual DriveResult<void> fileTrash(const OperationContextPtr &context, const QString &uuid) = 0;
    virtual DriveResult<void> dirTrash(const OperationContextPtr &context, const QString &uuid) = 0;

    /// Acquires, refreshes or releases the account wide lock named in \a request
    virtual DriveResult<UserLockResponse> userLock(const OperationContextPtr &context, const UserLockRequest &request) = 0;

    /**
     * Registers the login key and returns the account's master key list,
     * '|' separated and encrypted with the login key.
     */
    virtual DriveResult<QByteArray> userMasterKeys(const OperationContextPtr &context, const QByteArray &encryptedLoginKey) = 0;
    /// The DEK encrypted with the key encryption key
    virtual DriveResult<QByteArray> userDek(const OperationContextPtr &context) = 0;
    virtual DriveResult<KeyPairInfo> userKeyPair(const OperationContextPtr &context) = 0;
};

}
