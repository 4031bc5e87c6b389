/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "cipherdrivelib.h"
#include "driveerror.h"
#include "encryptionkey.h"

#include <QByteArray>
#include <QDateTime>
#include <QDebug>
#include <QString>

#include <variant>

namespace CDC {

/**
 * @brief A file whose content has not been uploaded yet
 *
 * Carries the identity and the per-object key. Size, hash and storage
 * location only exist on File, after the completion handshake.
 */
struct CIPHERDRIVESYNC_EXPORT IncompleteFile
{
    QString uuid;
    QString name;
    QString mimeType;
    EncryptionKey encryptionKey;
    QDateTime created;
    QDateTime lastModified;
    QString parentUuid;

    /**
     * New stub under \a parentUuid with a fresh UUID and key.
     *
     * Without a mime type one is guessed from the extension of \a name.
     * Names containing '/' are rejected.
     */
    static DriveResult<IncompleteFile> create(int fileEncryptionVersion,
        const QString &name,
        const QString &mimeType,
        const QDateTime &created,
        const QDateTime &lastModified,
        const QString &parentUuid);

    /// Same attributes with a new UUID and key, for retrying an upload
    [[nodiscard]] DriveResult<IncompleteFile> newFromBase(int fileEncryptionVersion) const;

    void setMimeType(const QString &mime);
};

struct CIPHERDRIVESYNC_EXPORT File : public IncompleteFile
{
    qint64 size = 0;
    QString region;
    QString bucket;
    qint64 chunks = 0;
    QByteArray hash;
    int version = 0;

    /// Plaintext metadata JSON, the key serialised for \a fileEncryptionVersion
    [[nodiscard]] QByteArray metadata(int fileEncryptionVersion) const;
};

enum class DirectoryColor {
    Default,
    Blue,
    Green,
    Purple,
    Red,
    Gray,
};

struct CIPHERDRIVESYNC_EXPORT Directory
{
    QString uuid;
    QString name;
    QString parentUuid;
    DirectoryColor color = DirectoryColor::Default;
    QDateTime created;

    [[nodiscard]] QByteArray metadata() const;
};

struct CIPHERDRIVESYNC_EXPORT RootDirectory
{
    QString uuid;
};

/**
 * Closed set of objects the engine deals with. Every dispatch goes through
 * std::visit so a missing case is a compile error.
 */
using FileSystemObject = std::variant<File, Directory, RootDirectory>;

namespace detail {
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
}

CIPHERDRIVESYNC_EXPORT QString itemUuid(const FileSystemObject &item);
CIPHERDRIVESYNC_EXPORT QString itemName(const FileSystemObject &item);
CIPHERDRIVESYNC_EXPORT QString itemParentUuid(const FileSystemObject &item);

/// Plaintext metadata of a file or directory, UnsupportedObjectVariant for the root
CIPHERDRIVESYNC_EXPORT DriveResult<QByteArray> itemMetadata(const FileSystemObject &item, int fileEncryptionVersion);

/// "file" or "folder" as used by share and link requests
CIPHERDRIVESYNC_EXPORT DriveResult<QString> shareItemType(const FileSystemObject &item);

/// "file" or "directory" as used by the search index
CIPHERDRIVESYNC_EXPORT DriveResult<QString> searchItemType(const FileSystemObject &item);

/**
 * Rebuilds a File from its decrypted metadata JSON and the unencrypted
 * fields of a listing entry.
 */
CIPHERDRIVESYNC_EXPORT DriveResult<File> fileFromMetadata(const QString &uuid,
    const QString &parentUuid,
    const QByteArray &metadata,
    const QString &bucket,
    const QString &region,
    qint64 chunks,
    int version);

CIPHERDRIVESYNC_EXPORT DriveResult<Directory> directoryFromMetadata(const QString &uuid,
    const QString &parentUuid,
    const QByteArray &metadata,
    qint64 fallbackTimestamp);

CIPHERDRIVESYNC_EXPORT DirectoryColor directoryColorFromName(const QString &name);

CIPHERDRIVESYNC_EXPORT QDebug operator<<(QDebug debug, const FileSystemObject &item);

}
